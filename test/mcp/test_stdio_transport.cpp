#include <catch2/catch_test_macros.hpp>

#include <mcp_chat/mcp/session_registry.hpp>
#include <mcp_chat/mcp/stdio_transport.hpp>
#include <mcp_chat/mcp/transport_connector.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

using namespace mcp_chat;
using namespace std::chrono_literals;

// Tests spawn the fake_mcp_server helper built next to this binary.

namespace {

ServerDescriptor FakeServer(const std::string& name,
                            std::vector<std::string> args = {"--stdio"}) {
    return ServerDescriptor::Stdio(name, FAKE_MCP_SERVER_PATH, std::move(args));
}

std::unique_ptr<StdioTransport> SpawnOrFail(const ServerDescriptor& d) {
    auto spawned = StdioTransport::Spawn(d);
    REQUIRE(spawned.IsOk());
    return std::move(spawned).Value();
}

std::string FirstText(const ToolResult& result) {
    const auto& sc = std::get<StructuredContent>(result);
    return std::get<TextContent>(sc.blocks.at(0)).text;
}

} // anonymous namespace

// ===========================================================================
// StdioTransport
// ===========================================================================

TEST_CASE("StdioTransport: request/response round trip", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    CHECK(transport->IsOpen());
    CHECK(transport->Kind() == TransportKind::Stdio);
    CHECK(transport->Pid() > 0);

    auto init = transport->Request("initialize", {{"protocolVersion", kMcpProtocolVersion}}, 5s);
    REQUIRE(init.IsOk());
    CHECK(init.Value()["serverInfo"]["name"] == "fake-mcp-server");

    auto ping = transport->Request("ping", nullptr, 5s);
    REQUIRE(ping.IsOk());
    CHECK(ping.Value() == nlohmann::json::object());
}

TEST_CASE("StdioTransport: JSON-RPC error becomes Protocol error", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    auto r = transport->Request("resources/list", nlohmann::json::object(), 5s);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Protocol);
    CHECK(r.Error().message.find("-32601") != std::string::npos);
}

TEST_CASE("StdioTransport: notifications get no answer", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    REQUIRE(transport->Notify("notifications/initialized", nlohmann::json::object()).IsOk());
    // The channel stays usable.
    CHECK(transport->Request("ping", nullptr, 5s).IsOk());
}

TEST_CASE("StdioTransport: non-JSON output lines are skipped", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("noisy", {"--noise"}));
    auto r = transport->Request("ping", nullptr, 5s);
    CHECK(r.IsOk());
}

TEST_CASE("StdioTransport: concurrent requests are correlated by id", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    REQUIRE(transport->Request("initialize", nlohmann::json::object(), 5s).IsOk());

    constexpr int kCallers = 6;
    std::vector<std::string> answers(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&transport, &answers, i]() {
            nlohmann::json params = {
                {"name", "echo"},
                {"arguments", {{"text", "caller-" + std::to_string(i)}}},
            };
            auto r = transport->Request("tools/call", params, 5s);
            if (r.IsOk()) {
                answers[i] = r.Value()["content"][0]["text"].get<std::string>();
            }
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kCallers; ++i) {
        CHECK(answers[i] == "caller-" + std::to_string(i));
    }
}

TEST_CASE("StdioTransport: server-initiated ping is answered", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    auto r = transport->Request("tools/call", {{"name", "ping_back"}}, 5s);
    REQUIRE(r.IsOk());
    CHECK(r.Value()["content"][0]["text"] == "pong ok");
}

TEST_CASE("StdioTransport: timeout leaves the channel usable", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    auto slow = transport->Request(
        "tools/call", {{"name", "sleep"}, {"arguments", {{"ms", 300}}}}, 50ms);
    REQUIRE(slow.IsErr());
    CHECK(slow.Error().category == ErrorCategory::Timeout);

    // The late answer to the timed-out request is discarded.
    auto next = transport->Request("ping", nullptr, 5s);
    REQUIRE(next.IsOk());
    CHECK(next.Value() == nlohmann::json::object());
}

TEST_CASE("StdioTransport: env and cwd reach the child", "[mcp][stdio]") {
    auto d = FakeServer("fake");
    d.env["MCP_CHAT_TEST_VALUE"] = "forty-two";
    d.cwd = "/tmp";
    auto transport = SpawnOrFail(d);

    auto env = transport->Request(
        "tools/call", {{"name", "getenv"}, {"arguments", {{"name", "MCP_CHAT_TEST_VALUE"}}}}, 5s);
    REQUIRE(env.IsOk());
    CHECK(env.Value()["content"][0]["text"] == "forty-two");

    // The parent environment is inherited too.
    auto path = transport->Request(
        "tools/call", {{"name", "getenv"}, {"arguments", {{"name", "PATH"}}}}, 5s);
    REQUIRE(path.IsOk());
    CHECK_FALSE(path.Value()["content"][0]["text"].get<std::string>().empty());

    auto cwd = transport->Request("tools/call", {{"name", "cwd"}}, 5s);
    REQUIRE(cwd.IsOk());
    CHECK(cwd.Value()["content"][0]["text"] == "/tmp");
}

TEST_CASE("StdioTransport: missing program fails to spawn", "[mcp][stdio]") {
    auto r = StdioTransport::Spawn(
        ServerDescriptor::Stdio("ghost", "/nonexistent/mcp-server-binary", {"--stdio"}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Connection);
    CHECK(r.Error().message.find("/nonexistent/mcp-server-binary") != std::string::npos);
}

TEST_CASE("StdioTransport: bad working directory fails to spawn", "[mcp][stdio]") {
    auto d = FakeServer("fake");
    d.cwd = "/nonexistent-dir-for-mcp-chat";
    auto r = StdioTransport::Spawn(d);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Connection);
}

TEST_CASE("StdioTransport: child exit fails pending and later requests", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    auto crashed = transport->Request("tools/call", {{"name", "crash"}}, 5s);
    REQUIRE(crashed.IsErr());
    CHECK(crashed.Error().category == ErrorCategory::Connection);

    auto after = transport->Request("ping", nullptr, 5s);
    REQUIRE(after.IsErr());
    CHECK_FALSE(transport->IsOpen());
}

TEST_CASE("StdioTransport: Close reaps the child and is idempotent", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    const int pid = transport->Pid();
    REQUIRE(pid > 0);

    transport->Close();
    transport->Close();
    CHECK_FALSE(transport->IsOpen());
    // Reaped: the pid no longer names our child.
    CHECK(::kill(pid, 0) != 0);

    auto r = transport->Request("ping", nullptr, 1s);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Closed);
}

TEST_CASE("StdioTransport: Close wakes a blocked request", "[mcp][stdio]") {
    auto transport = SpawnOrFail(FakeServer("fake"));
    Result<nlohmann::json, Error> outcome = Result<nlohmann::json, Error>::Ok(nullptr);
    std::thread caller([&]() {
        outcome = transport->Request(
            "tools/call", {{"name", "sleep"}, {"arguments", {{"ms", 5000}}}}, std::nullopt);
    });
    std::this_thread::sleep_for(100ms);
    transport->Close();
    caller.join();

    REQUIRE(outcome.IsErr());
    CHECK(outcome.Error().category == ErrorCategory::Closed);
}

// ===========================================================================
// End to end: TransportConnector + SessionRegistry over stdio
// ===========================================================================

TEST_CASE("Stdio end to end: connect, list and call", "[mcp][stdio][registry]") {
    TransportConnector connector(ConnectorOptions{5s});
    SessionRegistry registry(connector);

    auto info = registry.AddOne(FakeServer("fake"));
    REQUIRE(info.IsOk());
    CHECK(info.Value().tools.size() == 8);

    auto echo = registry.Call("fake", "echo", {{"text", "hello"}}, 5s);
    REQUIRE(echo.IsOk());
    CHECK(FirstText(echo.Value()) == "hello");

    auto add = registry.Call("fake", "add", {{"a", 2}, {"b", 40}}, 5s);
    REQUIRE(add.IsOk());
    CHECK(FirstText(add.Value()) == "42");

    auto fail = registry.Call("fake", "fail", nlohmann::json::object(), 5s);
    REQUIRE(fail.IsOk());
    CHECK(std::get<StructuredContent>(fail.Value()).is_error);

    registry.CloseAll();
    auto closed = registry.Call("fake", "echo", nlohmann::json::object());
    REQUIRE(closed.IsErr());
    CHECK(closed.Error().category == ErrorCategory::Closed);
}

TEST_CASE("Stdio end to end: failed handshakes are reported", "[mcp][stdio][registry]") {
    TransportConnector connector(ConnectorOptions{2s});
    SessionRegistry registry(connector);

    SECTION("server exits immediately") {
        auto info = registry.AddOne(FakeServer("quitter", {"--exit-immediately"}));
        REQUIRE(info.IsErr());
        CHECK(info.Error().category == ErrorCategory::Connection);
    }
    SECTION("server refuses initialize") {
        auto info = registry.AddOne(FakeServer("grumpy", {"--fail-initialize"}));
        REQUIRE(info.IsErr());
        CHECK(info.Error().message.find("initialize refused") != std::string::npos);
    }
    CHECK(registry.Size() == 0);
}
