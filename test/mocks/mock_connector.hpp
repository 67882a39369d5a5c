#pragma once

#include <mcp_chat/mcp/connection.hpp>
#include <mcp_chat/mcp/mcp_session.hpp>
#include <mcp_chat/mcp/transport_connector.hpp>

#include "mock_transport.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcp_chat {
namespace testing {

// ---------------------------------------------------------------------------
// MockConnector — IConnector that builds Connections over MockTransports.
//
// Usage:
//   MockConnector connector;
//   connector.AddServer("weather", {{"forecast", "Get a forecast", {}}});
//   connector.FailTimes("weather", 2);     // first two attempts fail
//   SessionRegistry registry(connector);
//   registry.AddOne(ServerDescriptor::Stdio("weather", "unused", {"-"}), {3, 0ms});
//   CHECK(connector.ConnectCount("weather") == 3);
//   registry.CloseAll();
//   CHECK(connector.CloseCount("weather") == 1);
//
// tools/call is answered by the server's CallHandler (default: echo the
// arguments as one text block). Names without a scripted server fail with a
// Connection error.
// ---------------------------------------------------------------------------
class MockConnector : public IConnector {
public:
    using CallHandler = std::function<Result<nlohmann::json, Error>(
        const std::string& tool, const nlohmann::json& arguments)>;

    static Result<nlohmann::json, Error> Echo(const std::string& /*tool*/,
                                              const nlohmann::json& arguments) {
        return Result<nlohmann::json, Error>::Ok(TextResult(arguments.dump()));
    }

    void AddServer(const std::string& name, std::vector<RemoteTool> tools,
                   CallHandler handler = &MockConnector::Echo) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& s = servers_[name];
        s.tools = std::move(tools);
        s.handler = std::move(handler);
    }

    void FailTimes(const std::string& name, int times,
                   ErrorCategory category = ErrorCategory::Connection) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& s = servers_[name];
        s.failures_left = times;
        s.failure_category = category;
    }

    void SetConnectDelay(const std::string& name, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        servers_[name].delay = delay;
    }

    int ConnectCount(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        return it == servers_.end() ? 0 : it->second.connects;
    }

    // Transports of `name` that have been closed.
    int CloseCount(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        return it == servers_.end() ? 0 : it->second.closes;
    }

    // Transport of the most recent successful connection to `name`. Only
    // valid while that connection is registered.
    MockTransport* LastTransport(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        return it == servers_.end() ? nullptr : it->second.last_transport;
    }

    Result<std::unique_ptr<Connection>, Error> Connect(
        const ServerDescriptor& descriptor) override {
        using R = Result<std::unique_ptr<Connection>, Error>;

        std::vector<RemoteTool> tools;
        CallHandler handler;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = servers_.find(descriptor.name);
            if (it == servers_.end()) {
                return R::Err(Error{"Connect", descriptor.name, std::nullopt,
                                    "No scripted server '" + descriptor.name + "'",
                                    std::nullopt, ErrorCategory::Connection});
            }
            auto& s = it->second;
            ++s.connects;
            delay = s.delay;
            if (s.failures_left > 0) {
                --s.failures_left;
                return R::Err(Error{"Connect", descriptor.name, std::nullopt,
                                    "Scripted failure #" + std::to_string(s.connects),
                                    std::nullopt, s.failure_category});
            }
            tools = s.tools;
            handler = s.handler;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        auto transport = std::make_unique<MockTransport>(descriptor.transport);
        auto* raw = transport.get();
        raw->Enqueue("initialize",
                     Result<nlohmann::json, Error>::Ok(InitializeResult(descriptor.name)));
        auto listed = nlohmann::json::array();
        for (const auto& t : tools) {
            nlohmann::json entry = {{"name", t.name}, {"description", t.description}};
            if (!t.input_schema.is_null()) entry["inputSchema"] = t.input_schema;
            listed.push_back(std::move(entry));
        }
        raw->Enqueue("tools/list",
                     Result<nlohmann::json, Error>::Ok(nlohmann::json{{"tools", listed}}));
        raw->SetHandler("tools/call", [handler](const nlohmann::json& params) {
            return handler(params.value("name", ""),
                           params.value("arguments", nlohmann::json::object()));
        });
        raw->OnClose([this, name = descriptor.name]() {
            std::lock_guard<std::mutex> lock(mutex_);
            ++servers_[name].closes;
        });

        auto session = std::make_unique<McpSession>(descriptor.name, std::move(transport));
        auto caps = session->Initialize(std::chrono::seconds(1));
        if (caps.IsErr()) {
            return R::Err(std::move(caps).Error());
        }
        auto listed_tools = session->ListTools(std::chrono::seconds(1));
        if (listed_tools.IsErr()) {
            return R::Err(std::move(listed_tools).Error());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            servers_[descriptor.name].last_transport = raw;
        }
        return R::Ok(std::make_unique<Connection>(descriptor.name, std::move(session),
                                                  std::move(listed_tools).Value(),
                                                  std::move(caps).Value()));
    }

private:
    struct Script {
        std::vector<RemoteTool> tools;
        CallHandler handler = &MockConnector::Echo;
        int failures_left = 0;
        ErrorCategory failure_category = ErrorCategory::Connection;
        std::chrono::milliseconds delay{0};
        int connects = 0;
        int closes = 0;
        MockTransport* last_transport = nullptr;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Script> servers_;
};

} // namespace testing
} // namespace mcp_chat
