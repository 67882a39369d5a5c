#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/i_transport.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>

#include <memory>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// StdioTransport — JSON-RPC over the standard pipes of a child process.
//
// Messages are newline-delimited JSON. The child's stderr is inherited so
// server diagnostics reach the user's terminal. A reader thread owns the
// child's stdout; requests from any thread block on PendingRequests until
// the reader routes the matching response. Lines that are not JSON are
// logged and skipped.
//
// Close() ends the child's stdin, gives it a grace period to exit, then
// escalates to SIGTERM and SIGKILL, and always reaps it.
// ---------------------------------------------------------------------------
class StdioTransport : public ITransport {
public:
    /// Start `descriptor.command` with `args`, the parent environment merged
    /// with `env`, and working directory `cwd`. Fails with
    /// ErrorCategory::Connection if the program cannot be executed.
    static Result<std::unique_ptr<StdioTransport>, Error> Spawn(
        const ServerDescriptor& descriptor);

    ~StdioTransport() override;

    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout) override;

    [[nodiscard]] Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) override;

    void Close() override;

    [[nodiscard]] bool IsOpen() const override;
    [[nodiscard]] TransportKind Kind() const override {
        return TransportKind::Stdio;
    }

    /// Process id of the child (for diagnostics).
    [[nodiscard]] int Pid() const;

private:
    struct Impl;
    explicit StdioTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_chat
