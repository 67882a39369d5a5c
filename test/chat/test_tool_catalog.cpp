#include <catch2/catch_test_macros.hpp>

#include <mcp_chat/chat/tool_catalog.hpp>
#include <mcp_chat/mcp/session_registry.hpp>

#include "../../test/mocks/mock_connector.hpp"

#include <chrono>

using namespace mcp_chat;
using namespace mcp_chat::testing;
using namespace std::chrono_literals;

namespace {

std::map<std::string, std::vector<RemoteTool>> SampleTools() {
    nlohmann::json forecast_schema = {
        {"type", "object"},
        {"properties", {{"city", {{"type", "string"}}}}},
        {"required", {"city"}},
    };
    return {
        {"weather", {{"forecast", "Get a forecast", forecast_schema},
                     {"alerts", "", nullptr}}},
        {"files", {{"read", "Read a file", nullptr}}},
    };
}

} // anonymous namespace

// ===========================================================================
// Build
// ===========================================================================

TEST_CASE("ToolCatalog: entries are keyed by server__tool", "[chat][catalog]") {
    auto catalog = ToolCatalog::FromTools(SampleTools());
    REQUIRE(catalog.Size() == 3);

    const auto* forecast = catalog.Find("weather__forecast");
    REQUIRE(forecast != nullptr);
    CHECK(forecast->server_name == "weather");
    CHECK(forecast->tool_name == "forecast");
    CHECK(forecast->description == "Get a forecast");
    CHECK(forecast->input_schema["required"][0] == "city");

    CHECK(catalog.Find("forecast") == nullptr);
    CHECK(catalog.Find("weather__missing") == nullptr);
}

TEST_CASE("ToolCatalog: missing description and schema get defaults", "[chat][catalog]") {
    auto catalog = ToolCatalog::FromTools(SampleTools());
    const auto* alerts = catalog.Find("weather__alerts");
    REQUIRE(alerts != nullptr);
    CHECK(alerts->description == "Tool alerts from weather");
    CHECK(alerts->input_schema == DefaultInputSchema());
    CHECK(DefaultInputSchema()["type"] == "object");
}

TEST_CASE("ToolCatalog: empty registry gives an empty schema list", "[chat][catalog]") {
    MockConnector connector;
    SessionRegistry registry(connector);
    auto catalog = ToolCatalog::Build(registry);
    CHECK(catalog.Empty());
    CHECK(catalog.ToModelSchema() == nlohmann::json::array());
}

TEST_CASE("ToolCatalog: Build reflects the current registry", "[chat][catalog]") {
    MockConnector connector;
    connector.AddServer("weather", {{"forecast", "Get a forecast", nullptr}});
    connector.AddServer("files", {{"read", "Read a file", nullptr}});
    SessionRegistry registry(connector);
    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"})).IsOk());

    CHECK(ToolCatalog::Build(registry).Size() == 1);

    REQUIRE(registry.AddOne(ServerDescriptor::Stdio("files", "unused", {"-"})).IsOk());
    auto catalog = ToolCatalog::Build(registry);
    CHECK(catalog.Size() == 2);
    CHECK(catalog.Find("files__read") != nullptr);

    CHECK(registry.Remove("weather"));
    CHECK(ToolCatalog::Build(registry).Find("weather__forecast") == nullptr);
}

// ===========================================================================
// ToModelSchema
// ===========================================================================

TEST_CASE("ToolCatalog: model schema", "[chat][catalog]") {
    auto schema = ToolCatalog::FromTools(SampleTools()).ToModelSchema();
    REQUIRE(schema.is_array());
    REQUIRE(schema.size() == 3);

    // Sorted by full name.
    CHECK(schema[0]["function"]["name"] == "files__read");
    CHECK(schema[1]["function"]["name"] == "weather__alerts");
    CHECK(schema[2]["function"]["name"] == "weather__forecast");

    for (const auto& entry : schema) {
        CHECK(entry["type"] == "function");
        CHECK(entry["function"].contains("description"));
        CHECK(entry["function"]["parameters"].is_object());
    }
    CHECK(schema[2]["function"]["parameters"]["properties"].contains("city"));
}

// ===========================================================================
// ResolveFunctionCall
// ===========================================================================

TEST_CASE("ToolCatalog: qualified names split at the first separator", "[chat][catalog]") {
    auto catalog = ToolCatalog::FromTools(SampleTools());

    auto r = catalog.ResolveFunctionCall("c1", "weather__forecast", R"({"city":"Oslo"})");
    CHECK(r.id == "c1");
    CHECK(r.IsResolved());
    CHECK(r.server_name == "weather");
    CHECK(r.tool_name == "forecast");
    CHECK(r.function_name == "weather__forecast");
    CHECK(r.arguments == nlohmann::json{{"city", "Oslo"}});

    // Tool names may contain the separator themselves.
    auto nested = catalog.ResolveFunctionCall("c2", "files__read__v2", "{}");
    CHECK(nested.server_name == "files");
    CHECK(nested.tool_name == "read__v2");
}

TEST_CASE("ToolCatalog: bare names resolve when unambiguous", "[chat][catalog]") {
    auto tools = SampleTools();
    tools["backup"] = {{"read", "Read a backup", nullptr}};
    auto catalog = ToolCatalog::FromTools(tools);

    auto unique = catalog.ResolveFunctionCall("c1", "forecast", "{}");
    CHECK(unique.IsResolved());
    CHECK(unique.FullName() == "weather__forecast");
    CHECK(unique.function_name == "forecast");

    auto ambiguous = catalog.ResolveFunctionCall("c2", "read", "{}");
    CHECK_FALSE(ambiguous.IsResolved());
    CHECK(ambiguous.FullName() == "read");

    auto unknown = catalog.ResolveFunctionCall("c3", "teleport", "{}");
    CHECK_FALSE(unknown.IsResolved());
    CHECK(unknown.tool_name == "teleport");
}

TEST_CASE("ParseToolArguments tolerates bad input", "[chat][catalog]") {
    CHECK(ParseToolArguments("") == nlohmann::json::object());
    CHECK(ParseToolArguments("{not json") == nlohmann::json::object());
    CHECK(ParseToolArguments("[1,2]") == nlohmann::json::object());
    CHECK(ParseToolArguments("42") == nlohmann::json::object());
    CHECK(ParseToolArguments(R"({"a":{"b":[1]}})") == nlohmann::json{{"a", {{"b", {1}}}}});
}
