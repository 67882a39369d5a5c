#include <catch2/catch_test_macros.hpp>

#include <mcp_chat/chat/message.hpp>

#include <chrono>

using namespace mcp_chat;
using namespace std::chrono_literals;

namespace {

ToolCallRequest ResolvedCall(const std::string& id) {
    ToolCallRequest call;
    call.id = id;
    call.server_name = "weather";
    call.tool_name = "forecast";
    call.function_name = "weather__forecast";
    call.arguments = {{"city", "Oslo"}};
    return call;
}

} // anonymous namespace

// ===========================================================================
// Roles
// ===========================================================================

TEST_CASE("Role names round trip", "[chat][message]") {
    for (auto role : {Role::System, Role::User, Role::Assistant, Role::Tool}) {
        auto parsed = ParseRole(RoleName(role));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == role);
    }
    CHECK_FALSE(ParseRole("function").has_value());
    CHECK_FALSE(ParseRole("User").has_value());
}

TEST_CASE("ToolCallRequest: FullName", "[chat][message]") {
    auto call = ResolvedCall("c1");
    CHECK(call.IsResolved());
    CHECK(call.FullName() == "weather__forecast");

    ToolCallRequest unresolved;
    unresolved.tool_name = "forecast";
    unresolved.function_name = "forecast";
    CHECK_FALSE(unresolved.IsResolved());
    CHECK(unresolved.FullName() == "forecast");
}

// ===========================================================================
// ToModelFormat
// ===========================================================================

TEST_CASE("ToModelFormat: plain messages", "[chat][message]") {
    auto system = ConversationMessage::System("be brief").ToModelFormat();
    CHECK(system == nlohmann::json{{"role", "system"}, {"content", "be brief"}});

    auto user = ConversationMessage::User("hello").ToModelFormat();
    CHECK(user == nlohmann::json{{"role", "user"}, {"content", "hello"}});
}

TEST_CASE("ToModelFormat: assistant with tool calls", "[chat][message]") {
    auto m = ConversationMessage::Assistant(std::nullopt, {ResolvedCall("c1")});
    auto j = m.ToModelFormat();

    CHECK(j["role"] == "assistant");
    CHECK_FALSE(j.contains("content"));
    REQUIRE(j["tool_calls"].size() == 1);
    const auto& call = j["tool_calls"][0];
    CHECK(call["id"] == "c1");
    CHECK(call["type"] == "function");
    CHECK(call["function"]["name"] == "weather__forecast");
    // Arguments travel as JSON text.
    REQUIRE(call["function"]["arguments"].is_string());
    CHECK(nlohmann::json::parse(call["function"]["arguments"].get<std::string>()) ==
          nlohmann::json{{"city", "Oslo"}});
    CHECK_FALSE(j.contains("tool_call_id"));
    CHECK_FALSE(j.contains("name"));
}

TEST_CASE("ToModelFormat: tool message", "[chat][message]") {
    auto j = ConversationMessage::Tool("c1", "weather__forecast", "sunny").ToModelFormat();
    CHECK(j == nlohmann::json{
        {"role", "tool"},
        {"content", "sunny"},
        {"tool_call_id", "c1"},
        {"name", "weather__forecast"},
    });
}

TEST_CASE("ToModelFormat: unresolved call keeps the model's name", "[chat][message]") {
    ToolCallRequest call;
    call.id = "c9";
    call.tool_name = "mystery";
    call.function_name = "mystery";
    auto j = ConversationMessage::Assistant(std::string("thinking"), {call}).ToModelFormat();
    CHECK(j["content"] == "thinking");
    CHECK(j["tool_calls"][0]["function"]["name"] == "mystery");
    CHECK(j["tool_calls"][0]["function"]["arguments"] == "{}");
}

// ===========================================================================
// Persistence
// ===========================================================================

TEST_CASE("ToJson/FromJson preserve every field", "[chat][message]") {
    auto original = ConversationMessage::Assistant(std::string("checking"), {ResolvedCall("c1")});
    original.timestamp = std::chrono::system_clock::from_time_t(1714555800) + 250ms;

    auto j = original.ToJson();
    CHECK(j["timestamp"] == "2024-05-01T09:30:00.250Z");
    CHECK(j["tool_call_id"].is_null());
    CHECK(j["tool_calls"][0]["server_name"] == "weather");
    CHECK_FALSE(j["tool_calls"][0].contains("function_name"));

    auto restored = ConversationMessage::FromJson(j);
    REQUIRE(restored.IsOk());
    const auto& m = restored.Value();
    CHECK(m.role == Role::Assistant);
    CHECK(m.content == std::optional<std::string>("checking"));
    REQUIRE(m.tool_calls.size() == 1);
    CHECK(m.tool_calls[0].FullName() == "weather__forecast");
    CHECK(m.tool_calls[0].function_name == "weather__forecast");
    CHECK(m.tool_calls[0].arguments == nlohmann::json{{"city", "Oslo"}});
    CHECK(m.timestamp == original.timestamp);
}

TEST_CASE("ToJson keeps a model name that differs from the resolution", "[chat][message]") {
    auto call = ResolvedCall("c2");
    call.function_name = "forecast";
    auto j = ConversationMessage::Assistant(std::nullopt, {call}).ToJson();
    CHECK(j["tool_calls"][0]["function_name"] == "forecast");

    auto restored = ConversationMessage::FromJson(j);
    REQUIRE(restored.IsOk());
    CHECK(restored.Value().tool_calls[0].function_name == "forecast");
}

TEST_CASE("FromJson rejects malformed messages", "[chat][message]") {
    CHECK(ConversationMessage::FromJson(nlohmann::json::array()).IsErr());
    CHECK(ConversationMessage::FromJson({{"content", "x"}}).IsErr());

    auto bad_role = ConversationMessage::FromJson({{"role", "robot"}});
    REQUIRE(bad_role.IsErr());
    CHECK(bad_role.Error().category == ErrorCategory::Storage);
    CHECK(bad_role.Error().message.find("robot") != std::string::npos);

    CHECK(ConversationMessage::FromJson(
              {{"role", "assistant"}, {"tool_calls", {"not-an-object"}}}).IsErr());
    CHECK(ConversationMessage::FromJson(
              {{"role", "user"}, {"timestamp", "yesterday"}}).IsErr());
}

TEST_CASE("FromJson fills defaults for missing fields", "[chat][message]") {
    auto r = ConversationMessage::FromJson({{"role", "user"}, {"content", "hi"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().content == std::optional<std::string>("hi"));
    CHECK(r.Value().tool_calls.empty());
    CHECK_FALSE(r.Value().tool_call_id.has_value());
}

// ===========================================================================
// Timestamps
// ===========================================================================

TEST_CASE("ParseTimestamp accepts common ISO-8601 forms", "[chat][message]") {
    const auto base = std::chrono::system_clock::from_time_t(1714555800);

    auto plain = ParseTimestamp("2024-05-01T09:30:00");
    REQUIRE(plain.IsOk());
    CHECK(plain.Value() == base);

    auto zulu = ParseTimestamp("2024-05-01T09:30:00Z");
    REQUIRE(zulu.IsOk());
    CHECK(zulu.Value() == base);

    auto micro = ParseTimestamp("2024-05-01T09:30:00.123456+00:00");
    REQUIRE(micro.IsOk());
    CHECK(micro.Value() == base + 123ms);

    CHECK(ParseTimestamp("2024-05-01").IsErr());
    CHECK(ParseTimestamp("2024-05-01T09:30:00.").IsErr());
}

TEST_CASE("FormatTimestamp pads milliseconds", "[chat][message]") {
    const auto tp = std::chrono::system_clock::from_time_t(0) + 7ms;
    CHECK(FormatTimestamp(tp) == "1970-01-01T00:00:00.007Z");
}
