#include <mcp_chat/mcp/session_registry.hpp>

#include <mcp_chat/core/log.hpp>

#include <algorithm>
#include <future>
#include <thread>

namespace mcp_chat {

namespace {

Error MakeRegistryError(const std::string& operation, const std::string& target,
                        const std::string& message, ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

Error ClosedRegistryError(const std::string& operation, const std::string& name) {
    return MakeRegistryError(operation, name, "Session registry is closed",
                             ErrorCategory::Closed);
}

std::string JoinNames(const std::vector<std::string>& names) {
    if (names.empty()) return "(none)";
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // anonymous namespace

ServerInfo MakeServerInfo(const Connection& connection) {
    ServerInfo info;
    info.name = connection.Name();
    info.transport = connection.Kind();
    for (const auto& tool : connection.Tools()) {
        info.tools.push_back(tool.name);
    }
    info.connected_at = connection.ConnectedAt();
    info.uptime = connection.Uptime();
    info.attempts = connection.Attempts();
    return info;
}

SessionRegistry::SessionRegistry(IConnector& connector)
    : connector_(connector) {}

SessionRegistry::~SessionRegistry() {
    CloseAll();
}

// ---------------------------------------------------------------------------
// AddOne
// ---------------------------------------------------------------------------
Result<ServerInfo, Error> SessionRegistry::AddOne(const ServerDescriptor& descriptor,
                                                  RetryPolicy retry) {
    using R = Result<ServerInfo, Error>;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return R::Err(ClosedRegistryError("AddOne", descriptor.name));
        }
        auto valid = descriptor.Validate();
        if (valid.IsErr()) {
            return R::Err(valid.Error());
        }
        if (connections_.count(descriptor.name) != 0 ||
            pending_names_.count(descriptor.name) != 0) {
            return R::Err(MakeRegistryError(
                "AddOne", descriptor.name,
                "Server '" + descriptor.name + "' is already registered",
                ErrorCategory::DuplicateName));
        }
        pending_names_.insert(descriptor.name);
    }

    auto result = ConnectWithRetry(descriptor, retry);

    std::lock_guard<std::mutex> lock(mutex_);
    pending_names_.erase(descriptor.name);
    return result;
}

Result<ServerInfo, Error> SessionRegistry::ConnectWithRetry(
    const ServerDescriptor& descriptor, const RetryPolicy& retry) {
    using R = Result<ServerInfo, Error>;

    const int max_attempts = std::max(0, retry.attempts) + 1;
    std::optional<Error> last_error;
    int attempt = 0;

    while (attempt < max_attempts) {
        ++attempt;
        if (attempt > 1) {
            LogInfo("registry", "Retrying '" + descriptor.name + "' (attempt " +
                                    std::to_string(attempt) + "/" +
                                    std::to_string(max_attempts) + ")");
            std::this_thread::sleep_for(retry.delay);
            if (IsClosed()) {
                return R::Err(ClosedRegistryError("AddOne", descriptor.name));
            }
        }

        auto connected = connector_.Connect(descriptor);
        if (connected.IsOk()) {
            std::shared_ptr<Connection> connection = std::move(connected).Value();
            connection->SetAttempts(attempt);

            std::unique_lock<std::mutex> lock(mutex_);
            if (closed_) {
                lock.unlock();
                connection->Close();
                return R::Err(ClosedRegistryError("AddOne", descriptor.name));
            }
            connections_[descriptor.name] = connection;
            evicted_names_.erase(descriptor.name);
            lock.unlock();

            LogInfo("registry", "Registered '" + descriptor.name + "' after " +
                                    std::to_string(attempt) + " attempt(s)");
            return R::Ok(MakeServerInfo(*connection));
        }

        last_error = std::move(connected).Error();
        LogWarn("registry", "Attempt " + std::to_string(attempt) + " for '" +
                                descriptor.name + "' failed: " + last_error->message);
        if (last_error->category == ErrorCategory::Configuration) {
            break;
        }
    }

    Error error;
    error.operation = "AddOne";
    error.target = descriptor.name;
    error.http_status = last_error->http_status;
    error.message = "Failed to connect to '" + descriptor.name + "' after " +
                    std::to_string(attempt) + " attempt(s): " + last_error->message;
    error.cause = last_error->ToString();
    error.category = last_error->category == ErrorCategory::Configuration
                         ? ErrorCategory::Configuration
                         : ErrorCategory::Connection;
    LogError("registry", error.message);
    return R::Err(std::move(error));
}

// ---------------------------------------------------------------------------
// AddMany
// ---------------------------------------------------------------------------
std::vector<AddOutcome> SessionRegistry::AddMany(
    const std::vector<ServerDescriptor>& descriptors,
    bool fail_fast,
    RetryPolicy retry) {
    std::vector<AddOutcome> outcomes;
    outcomes.reserve(descriptors.size());

    if (fail_fast) {
        for (const auto& descriptor : descriptors) {
            auto result = AddOne(descriptor, retry);
            const bool failed = result.IsErr();
            outcomes.push_back(AddOutcome{descriptor.name, std::move(result)});
            if (failed) {
                LogWarn("registry", "Stopping batch after failure of '" +
                                        descriptor.name + "'");
                break;
            }
        }
        return outcomes;
    }

    std::vector<std::future<Result<ServerInfo, Error>>> futures;
    futures.reserve(descriptors.size());
    for (const auto& descriptor : descriptors) {
        futures.push_back(std::async(std::launch::async, [this, &descriptor, retry] {
            return AddOne(descriptor, retry);
        }));
    }
    for (std::size_t i = 0; i < futures.size(); ++i) {
        outcomes.push_back(AddOutcome{descriptors[i].name, futures[i].get()});
    }

    std::size_t ok = 0;
    for (const auto& o : outcomes) {
        if (o.result.IsOk()) ++ok;
    }
    LogInfo("registry", "Connected " + std::to_string(ok) + "/" +
                            std::to_string(outcomes.size()) + " servers");
    return outcomes;
}

// ---------------------------------------------------------------------------
// Call
// ---------------------------------------------------------------------------
Result<ToolResult, Error> SessionRegistry::Call(
    const std::string& server,
    const std::string& tool,
    const nlohmann::json& arguments,
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<ToolResult, Error>;

    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return R::Err(ClosedRegistryError("Call", server));
        }
        auto it = connections_.find(server);
        if (it == connections_.end()) {
            if (evicted_names_.count(server) != 0) {
                return R::Err(MakeRegistryError(
                    "Call", server, "Connection to server '" + server + "' is closed",
                    ErrorCategory::Closed));
            }
            return R::Err(MakeRegistryError(
                "Call", server,
                "Server '" + server + "' not found. Available servers: " +
                    ServerListLocked(),
                ErrorCategory::NotFound));
        }
        connection = it->second;
    }

    if (connection->IsClosed()) {
        return R::Err(MakeRegistryError(
            "Call", server, "Connection to server '" + server + "' is closed",
            ErrorCategory::Closed));
    }
    if (connection->FindTool(tool) == nullptr) {
        std::vector<std::string> names;
        for (const auto& t : connection->Tools()) names.push_back(t.name);
        return R::Err(MakeRegistryError(
            "Call", server + "/" + tool,
            "Tool '" + tool + "' not found on server '" + server +
                "'. Available tools: " + JoinNames(names),
            ErrorCategory::NotFound));
    }

    LogDebug("registry", "Calling " + server + "/" + tool);
    return connection->CallTool(tool, arguments, timeout);
}

// ---------------------------------------------------------------------------
// Remove / CloseAll
// ---------------------------------------------------------------------------
bool SessionRegistry::Remove(const std::string& name) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) {
            return false;
        }
        connection = std::move(it->second);
        connections_.erase(it);
        evicted_names_.insert(name);
    }
    connection->Close();
    LogInfo("registry", "Removed '" + name + "'");
    return true;
}

void SessionRegistry::CloseAll() {
    std::map<std::string, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ && connections_.empty()) return;
        closed_ = true;
        connections.swap(connections_);
        for (const auto& [name, _] : connections) {
            evicted_names_.insert(name);
        }
    }
    for (auto& [name, connection] : connections) {
        connection->Close();
    }
    if (!connections.empty()) {
        LogInfo("registry", "Closed " + std::to_string(connections.size()) +
                                " connection(s)");
    }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::vector<std::string> SessionRegistry::ListServers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(connections_.size());
    for (const auto& [name, _] : connections_) {
        names.push_back(name);
    }
    return names;
}

std::map<std::string, std::vector<RemoteTool>> SessionRegistry::ListTools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<RemoteTool>> out;
    for (const auto& [name, connection] : connections_) {
        out[name] = connection->Tools();
    }
    return out;
}

Result<std::vector<RemoteTool>, Error> SessionRegistry::ListTools(
    const std::string& server) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(server);
    if (it == connections_.end()) {
        return Result<std::vector<RemoteTool>, Error>::Err(MakeRegistryError(
            "ListTools", server,
            "Server '" + server + "' not found. Available servers: " +
                ServerListLocked(),
            ErrorCategory::NotFound));
    }
    return Result<std::vector<RemoteTool>, Error>::Ok(it->second->Tools());
}

Result<ServerInfo, Error> SessionRegistry::GetServerInfo(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it == connections_.end()) {
        return Result<ServerInfo, Error>::Err(MakeRegistryError(
            "GetServerInfo", name,
            "Server '" + name + "' not found. Available servers: " +
                ServerListLocked(),
            ErrorCategory::NotFound));
    }
    return Result<ServerInfo, Error>::Ok(MakeServerInfo(*it->second));
}

bool SessionRegistry::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::string SessionRegistry::ServerListLocked() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : connections_) {
        names.push_back(name);
    }
    return JoinNames(names);
}

} // namespace mcp_chat
