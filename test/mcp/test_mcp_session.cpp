#include <catch2/catch_test_macros.hpp>

#include <mcp_chat/mcp/mcp_session.hpp>

#include "../../test/mocks/mock_transport.hpp"

#include <chrono>
#include <memory>

using namespace mcp_chat;
using namespace mcp_chat::testing;
using namespace std::chrono_literals;

namespace {

using JsonResult = Result<nlohmann::json, Error>;

Error ProtocolError(const std::string& message) {
    return Error{"tools/call", "mock", std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol};
}

// Session with a transport that answers initialize; raw pointer for scripting.
std::pair<std::unique_ptr<McpSession>, MockTransport*> MakeSession() {
    auto transport = std::make_unique<MockTransport>();
    auto* raw = transport.get();
    raw->Enqueue("initialize", JsonResult::Ok(InitializeResult("weather")));
    return {std::make_unique<McpSession>("weather", std::move(transport)), raw};
}

} // anonymous namespace

// ===========================================================================
// Initialize
// ===========================================================================

TEST_CASE("McpSession: Initialize sends handshake and notification", "[mcp][session]") {
    auto [session, transport] = MakeSession();

    auto caps = session->Initialize(1s);
    REQUIRE(caps.IsOk());
    CHECK(caps.Value().server_name == "weather");
    CHECK(caps.Value().server_version == "1.0.0");
    CHECK(caps.Value().protocol_version == kMcpProtocolVersion);
    CHECK(caps.Value().capabilities.contains("tools"));

    auto requests = transport->Requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "initialize");
    CHECK(requests[0].params["protocolVersion"] == kMcpProtocolVersion);
    CHECK(requests[0].params["clientInfo"]["name"] == "mcp-chat");
    REQUIRE(requests[0].timeout.has_value());
    CHECK(*requests[0].timeout == 1s);

    auto notes = transport->Notifications();
    REQUIRE(notes.size() == 1);
    CHECK(notes[0].method == "notifications/initialized");
}

TEST_CASE("McpSession: Initialize propagates transport errors", "[mcp][session]") {
    auto transport = std::make_unique<MockTransport>();
    transport->Enqueue("initialize", JsonResult::Err(Error{
        "initialize", "mock", std::nullopt, "No response within 1000 ms",
        std::nullopt, ErrorCategory::Timeout}));
    McpSession session("slow", std::move(transport));

    auto caps = session.Initialize(1s);
    REQUIRE(caps.IsErr());
    CHECK(caps.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("McpSession: Initialize rejects a non-object result", "[mcp][session]") {
    auto transport = std::make_unique<MockTransport>();
    transport->Enqueue("initialize", JsonResult::Ok(nlohmann::json("hello")));
    McpSession session("odd", std::move(transport));

    auto caps = session.Initialize(1s);
    REQUIRE(caps.IsErr());
    CHECK(caps.Error().category == ErrorCategory::Protocol);
}

TEST_CASE("McpSession: Initialize fails when the notification cannot be sent", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->FailNotifications(Error{"Notify", "mock", std::nullopt, "broken pipe",
                                       std::nullopt, ErrorCategory::Closed});
    auto caps = session->Initialize(1s);
    REQUIRE(caps.IsErr());
    CHECK(caps.Error().category == ErrorCategory::Closed);
}

TEST_CASE("McpSession: calls before Initialize are refused", "[mcp][session]") {
    auto [session, transport] = MakeSession();

    auto tools = session->ListTools(1s);
    REQUIRE(tools.IsErr());
    CHECK(tools.Error().category == ErrorCategory::Internal);

    auto call = session->CallTool("forecast", nlohmann::json::object(), std::nullopt);
    REQUIRE(call.IsErr());
    CHECK(transport->RequestCount("tools/call") == 0);
}

// ===========================================================================
// ListTools
// ===========================================================================

TEST_CASE("McpSession: ListTools follows nextCursor", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->Enqueue("tools/list", JsonResult::Ok(nlohmann::json{
        {"tools", {{{"name", "forecast"}, {"description", "Forecast"}}}},
        {"nextCursor", "page-2"},
    }));
    transport->Enqueue("tools/list", JsonResult::Ok(nlohmann::json{
        {"tools", {{{"name", "alerts"}}, {{"description", "nameless"}}}},
    }));
    REQUIRE(session->Initialize(1s).IsOk());

    auto tools = session->ListTools(1s);
    REQUIRE(tools.IsOk());
    REQUIRE(tools.Value().size() == 2);
    CHECK(tools.Value()[0].name == "forecast");
    CHECK(tools.Value()[1].name == "alerts");

    auto requests = transport->Requests();
    REQUIRE(requests.size() == 3);
    CHECK_FALSE(requests[1].params.contains("cursor"));
    CHECK(requests[2].params["cursor"] == "page-2");
}

TEST_CASE("McpSession: ListTools stops on a repeated cursor", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->SetHandler("tools/list", [](const nlohmann::json&) {
        return JsonResult::Ok(nlohmann::json{
            {"tools", {{{"name", "loop"}}}},
            {"nextCursor", "same"},
        });
    });
    REQUIRE(session->Initialize(1s).IsOk());

    auto tools = session->ListTools(1s);
    REQUIRE(tools.IsOk());
    CHECK(transport->RequestCount("tools/list") == 2);
}

TEST_CASE("McpSession: ListTools rejects a malformed answer", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->Enqueue("tools/list", JsonResult::Ok(nlohmann::json{{"items", nlohmann::json::array()}}));
    REQUIRE(session->Initialize(1s).IsOk());

    auto tools = session->ListTools(1s);
    REQUIRE(tools.IsErr());
    CHECK(tools.Error().category == ErrorCategory::Protocol);
}

// ===========================================================================
// CallTool
// ===========================================================================

TEST_CASE("McpSession: CallTool sends name and arguments", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->SetHandler("tools/call", [](const nlohmann::json& params) {
        return JsonResult::Ok(TextResult("sunny in " + params["arguments"].value("city", "?")));
    });
    REQUIRE(session->Initialize(1s).IsOk());

    auto result = session->CallTool("forecast", {{"city", "Oslo"}}, 5s);
    REQUIRE(result.IsOk());
    REQUIRE(std::holds_alternative<StructuredContent>(result.Value()));
    const auto& sc = std::get<StructuredContent>(result.Value());
    REQUIRE(sc.blocks.size() == 1);
    CHECK(std::get<TextContent>(sc.blocks[0]).text == "sunny in Oslo");

    auto requests = transport->Requests();
    CHECK(requests.back().params["name"] == "forecast");
    REQUIRE(requests.back().timeout.has_value());
    CHECK(*requests.back().timeout == 5s);
}

TEST_CASE("McpSession: CallTool replaces non-object arguments", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->Enqueue("tools/call", JsonResult::Ok(TextResult("ok")));
    REQUIRE(session->Initialize(1s).IsOk());

    REQUIRE(session->CallTool("t", nlohmann::json::array({1, 2}), std::nullopt).IsOk());
    CHECK(transport->Requests().back().params["arguments"] == nlohmann::json::object());
}

TEST_CASE("McpSession: isError result is still Ok", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->Enqueue("tools/call", JsonResult::Ok(TextResult("city unknown", true)));
    REQUIRE(session->Initialize(1s).IsOk());

    auto result = session->CallTool("forecast", nlohmann::json::object(), std::nullopt);
    REQUIRE(result.IsOk());
    CHECK(std::get<StructuredContent>(result.Value()).is_error);
}

TEST_CASE("McpSession: CallTool error names server and tool", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    transport->Enqueue("tools/call", JsonResult::Err(ProtocolError("JSON-RPC error -32602: bad")));
    REQUIRE(session->Initialize(1s).IsOk());

    auto result = session->CallTool("forecast", nlohmann::json::object(), std::nullopt);
    REQUIRE(result.IsErr());
    CHECK(result.Error().target == "weather/forecast");
    CHECK(result.Error().category == ErrorCategory::Protocol);
}

TEST_CASE("McpSession: Close closes the transport once", "[mcp][session]") {
    auto [session, transport] = MakeSession();
    CHECK(session->IsOpen());
    session->Close();
    session->Close();
    CHECK_FALSE(session->IsOpen());
    CHECK(transport->CloseCount() == 1);
}
