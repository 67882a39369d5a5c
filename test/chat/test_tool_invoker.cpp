#include <catch2/catch_test_macros.hpp>

#include <mcp_chat/chat/tool_invoker.hpp>
#include <mcp_chat/core/log.hpp>
#include <mcp_chat/mcp/session_registry.hpp>

#include "../../test/mocks/mock_connector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcp_chat;
using namespace mcp_chat::testing;
using namespace std::chrono_literals;

namespace {

using JsonResult = Result<nlohmann::json, Error>;

ToolCallRequest Request(const std::string& id, const std::string& server,
                        const std::string& tool, nlohmann::json args = nlohmann::json::object()) {
    ToolCallRequest r;
    r.id = id;
    r.server_name = server;
    r.tool_name = tool;
    r.function_name = server + "__" + tool;
    r.arguments = std::move(args);
    return r;
}

struct LogLine {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<LogLine>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<LogLine>& out_;
    std::mutex mutex_;
};

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

// Routes the global logger into `lines` for the lifetime of the guard.
struct CapturedGlobalLog {
    CapturedGlobalLog(std::vector<LogLine>& lines, LogLevel level) {
        InitGlobalLogger(std::make_unique<CaptureSink>(lines), level);
    }
    ~CapturedGlobalLog() {
        InitGlobalLogger(std::make_unique<DiscardSink>(), LogLevel::Error);
    }
};

bool Contains(const std::vector<LogLine>& lines, LogLevel level,
              const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const LogLine& l) {
        return l.level == level && l.component == "invoker" &&
               l.message.find(needle) != std::string::npos;
    });
}

} // anonymous namespace

// ===========================================================================
// Serialize
// ===========================================================================

TEST_CASE("ToolInvoker::Serialize", "[chat][invoker]") {
    SECTION("plain text passes through") {
        CHECK(ToolInvoker::Serialize(ToolResult{std::string("sunny")}) == "sunny");
    }
    SECTION("structured content") {
        StructuredContent sc;
        sc.blocks.push_back(TextContent{"a"});
        sc.blocks.push_back(ImageContent{"aGk=", "image/png"});
        sc.is_error = true;
        auto j = nlohmann::json::parse(ToolInvoker::Serialize(ToolResult{sc}));
        REQUIRE(j["content"].size() == 2);
        CHECK(j["content"][0] == nlohmann::json{{"type", "text"}, {"text", "a"}});
        CHECK(j["content"][1]["mimeType"] == "image/png");
        CHECK(j["isError"] == true);
    }
    SECTION("other JSON") {
        auto text = ToolInvoker::Serialize(ToolResult{nlohmann::json{{"temp", 21}}});
        CHECK(nlohmann::json::parse(text) == nlohmann::json{{"temp", 21}});
    }
    SECTION("opaque result") {
        auto text = ToolInvoker::Serialize(ToolResult{OpaqueResult{"<binary>"}});
        CHECK(nlohmann::json::parse(text) == nlohmann::json{{"result", "<binary>"}});
    }
    SECTION("unserializable payload yields an error document") {
        auto text = ToolInvoker::Serialize(ToolResult{nlohmann::json(std::string("bad \xff byte"))});
        auto j = nlohmann::json::parse(text);
        CHECK(j["error"] == "Serialization failed");
        CHECK(j["result_type"] == "json");
        CHECK(j.contains("message"));
    }
}

TEST_CASE("ToolInvoker::ToToolMessage", "[chat][invoker]") {
    ToolCallOutcome ok;
    ok.id = "c1";
    ok.tool_name = "forecast";
    ok.full_name = "weather__forecast";
    ok.success = true;
    ok.payload = "sunny";
    auto m = ToolInvoker::ToToolMessage(ok);
    CHECK(m.role == Role::Tool);
    CHECK(m.tool_call_id == std::optional<std::string>("c1"));
    CHECK(m.name == std::optional<std::string>("weather__forecast"));
    CHECK(m.content == std::optional<std::string>("sunny"));

    ToolCallOutcome failed = ok;
    failed.success = false;
    failed.payload.reset();
    failed.error = "Server unavailable";
    auto f = ToolInvoker::ToToolMessage(failed);
    auto body = nlohmann::json::parse(*f.content);
    CHECK(body["error"] == "Server unavailable");
    CHECK(body["message"] == "Tool forecast failed");
}

// ===========================================================================
// Execute
// ===========================================================================

TEST_CASE("ToolInvoker: successful call", "[chat][invoker]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "", nullptr}});
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());

    ToolInvoker invoker(registry, 2s);
    auto outcome = invoker.Execute(Request("c1", "weather", "forecast", {{"city", "Oslo"}}));
    CHECK(outcome.success);
    CHECK(outcome.id == "c1");
    CHECK(outcome.full_name == "weather__forecast");
    REQUIRE(outcome.payload.has_value());
    CHECK_FALSE(outcome.error.has_value());

    // Echo handler: the arguments come back as one text block.
    auto payload = nlohmann::json::parse(*outcome.payload);
    CHECK(payload["isError"] == false);
    CHECK(nlohmann::json::parse(payload["content"][0]["text"].get<std::string>()) ==
          nlohmann::json{{"city", "Oslo"}});

    // The call timeout reaches the transport.
    auto requests = connector.LastTransport("weather")->Requests();
    REQUIRE(requests.back().timeout.has_value());
    CHECK(*requests.back().timeout == 2s);
}

TEST_CASE("ToolInvoker: failures become outcomes", "[chat][invoker]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "", nullptr}},
                        [](const std::string&, const nlohmann::json&) {
                            return JsonResult::Err(Error{
                                "tools/call", "weather", std::nullopt, "Server unavailable",
                                std::nullopt, ErrorCategory::Connection});
                        });
    connector.AddServer("files", {{"read", "", nullptr}});
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("files", "unused", {"-"})).IsOk());
    ToolInvoker invoker(registry);

    SECTION("registry error") {
        auto outcome = invoker.Execute(Request("c1", "weather", "forecast"));
        CHECK_FALSE(outcome.success);
        CHECK_FALSE(outcome.payload.has_value());
        CHECK(outcome.error == std::optional<std::string>("Server unavailable"));
    }
    SECTION("unknown server") {
        auto outcome = invoker.Execute(Request("c2", "ghost", "boo"));
        CHECK_FALSE(outcome.success);
        REQUIRE(outcome.error.has_value());
        CHECK(outcome.error->find("ghost") != std::string::npos);
    }
    SECTION("unresolved name lists the servers") {
        ToolCallRequest r;
        r.id = "c3";
        r.tool_name = "teleport";
        r.function_name = "teleport";
        auto outcome = invoker.Execute(r);
        CHECK_FALSE(outcome.success);
        CHECK(outcome.error ==
              std::optional<std::string>("Unknown tool 'teleport'. Available servers: files, weather"));
        CHECK(outcome.full_name == "teleport");
    }
}

TEST_CASE("ToolInvoker: isError results still succeed", "[chat][invoker]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "", nullptr}},
                        [](const std::string&, const nlohmann::json&) {
                            return JsonResult::Ok(TextResult("city unknown", true));
                        });
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());

    auto outcome = ToolInvoker(registry).Execute(Request("c1", "weather", "forecast"));
    CHECK(outcome.success);
    CHECK(nlohmann::json::parse(*outcome.payload)["isError"] == true);
}

TEST_CASE("ToolInvoker: isError results are logged as tool invocation errors",
          "[chat][invoker]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "", nullptr}},
                        [](const std::string&, const nlohmann::json&) {
                            return JsonResult::Ok(TextResult("city unknown", true));
                        });
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());

    std::vector<LogLine> lines;
    {
        CapturedGlobalLog guard(lines, LogLevel::Warn);
        auto outcome = ToolInvoker(registry).Execute(Request("c1", "weather", "forecast"));
        CHECK(outcome.success);
    }
    CHECK(Contains(lines, LogLevel::Warn,
                   "tool_invocation: CallTool [weather__forecast]: city unknown"));
}

TEST_CASE("ToolInvoker: call arguments are logged only at info level",
          "[chat][invoker]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "", nullptr}});
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());
    const auto request = Request("c1", "weather", "forecast", {{"city", "Oslo"}});

    SECTION("info") {
        std::vector<LogLine> lines;
        {
            CapturedGlobalLog guard(lines, LogLevel::Info);
            CHECK(ToolInvoker(registry).Execute(request).success);
        }
        CHECK(Contains(lines, LogLevel::Info,
                       "Calling weather__forecast {\"city\":\"Oslo\"}"));
    }
    SECTION("warn") {
        std::vector<LogLine> lines;
        {
            CapturedGlobalLog guard(lines, LogLevel::Warn);
            CHECK(ToolInvoker(registry).Execute(request).success);
        }
        CHECK(lines.empty());
    }
}

// ===========================================================================
// ExecuteAll
// ===========================================================================

TEST_CASE("ToolInvoker: ExecuteAll runs concurrently and keeps order", "[chat][invoker]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    MockConnector connector;
    connector.AddServer("slow", {{"wait", "", nullptr}},
                        [&](const std::string&, const nlohmann::json& args) {
                            const int now = ++active;
                            int seen = peak.load();
                            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                            }
                            std::this_thread::sleep_for(
                                std::chrono::milliseconds(args.value("ms", 0)));
                            --active;
                            return JsonResult::Ok(TextResult(args.dump()));
                        });
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("slow", "unused", {"-"})).IsOk());
    ToolInvoker invoker(registry);

    std::vector<ToolCallRequest> requests = {
        Request("a", "slow", "wait", {{"ms", 150}}),
        Request("b", "slow", "wait", {{"ms", 10}}),
        Request("c", "missing", "wait"),
    };

    std::vector<std::string> seen_order;
    const auto started = std::chrono::steady_clock::now();
    auto outcomes = invoker.ExecuteAll(requests, [&](const ToolCallOutcome& o) {
        seen_order.push_back(o.id);
    });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcomes.size() == 3);
    CHECK(outcomes[0].id == "a");
    CHECK(outcomes[1].id == "b");
    CHECK(outcomes[2].id == "c");
    CHECK(outcomes[0].success);
    CHECK(outcomes[1].success);
    CHECK_FALSE(outcomes[2].success);
    CHECK(seen_order == std::vector<std::string>{"a", "b", "c"});
    CHECK(peak.load() == 2);
    CHECK(elapsed < 300ms);
}

TEST_CASE("ToolInvoker: ExecuteAll with one or no requests", "[chat][invoker]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "", nullptr}});
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());
    ToolInvoker invoker(registry);

    CHECK(invoker.ExecuteAll({}).empty());

    int callbacks = 0;
    auto one = invoker.ExecuteAll({Request("c1", "weather", "forecast")},
                                  [&](const ToolCallOutcome&) { ++callbacks; });
    REQUIRE(one.size() == 1);
    CHECK(one[0].success);
    CHECK(callbacks == 1);
}
