#include <mcp_chat/mcp/stdio_transport.hpp>

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/mcp/json_rpc.hpp>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_chat {

namespace {

constexpr std::chrono::milliseconds kExitGrace{2'000};
constexpr std::chrono::milliseconds kReapPoll{20};

Error MakeStdioError(const std::string& operation, const std::string& target,
                     const std::string& message,
                     ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Build "KEY=VALUE" entries: the parent's environment with overrides applied.
std::vector<std::string> MergedEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        const auto eq = entry.find('=');
        const auto key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            entries.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

// Wait up to `grace` for the child to exit. Returns true once reaped.
bool ReapWithin(pid_t pid, std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kReapPoll);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct StdioTransport::Impl {
    std::string name;
    std::string command;
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int wake_read = -1;
    int wake_write = -1;

    PendingRequests pending;
    std::mutex write_mutex;
    std::mutex close_mutex;
    std::atomic<bool> open{true};
    std::atomic<bool> closing{false};
    bool closed = false;
    std::thread reader;

    explicit Impl(std::string server_name)
        : name(std::move(server_name)), pending(name) {}

    Result<void, Error> WriteLine(const std::string& line) {
        std::lock_guard<std::mutex> lock(write_mutex);
        if (stdin_fd < 0) {
            return Result<void, Error>::Err(MakeStdioError(
                "StdioWrite", name, "Transport is closed", ErrorCategory::Closed));
        }
        const char* data = line.data();
        std::size_t remaining = line.size();
        while (remaining > 0) {
            const ssize_t n = ::write(stdin_fd, data, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Result<void, Error>::Err(MakeStdioError(
                    "StdioWrite", name,
                    "Write to server stdin failed: " + std::string(std::strerror(errno))));
            }
            data += n;
            remaining -= static_cast<std::size_t>(n);
        }
        return Result<void, Error>::Ok();
    }

    void HandleLine(const std::string& line) {
        if (line.empty()) return;
        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            LogDebug("stdio", name + ": ignoring non-JSON output: " + line);
            return;
        }
        switch (jsonrpc::Classify(message)) {
            case jsonrpc::MessageKind::Response:
                if (!pending.ResolveResponse(message)) {
                    LogDebug("stdio", name + ": response for unknown id " +
                                          message["id"].dump());
                }
                break;
            case jsonrpc::MessageKind::Request: {
                auto reply = jsonrpc::AnswerServerRequest(message);
                auto written = WriteLine(reply.dump(-1, ' ', false,
                    nlohmann::json::error_handler_t::replace) + "\n");
                if (written.IsErr()) {
                    LogWarn("stdio", written.Error().ToString());
                }
                break;
            }
            case jsonrpc::MessageKind::Notification:
                LogDebug("stdio", name + ": notification " +
                                      message["method"].get<std::string>());
                break;
            case jsonrpc::MessageKind::Invalid:
                LogDebug("stdio", name + ": ignoring invalid message: " + line);
                break;
        }
    }

    void ReaderLoop() {
        std::string buffer;
        char chunk[4096];
        while (true) {
            pollfd fds[2] = {
                {stdout_fd, POLLIN, 0},
                {wake_read, POLLIN, 0},
            };
            const int ready = ::poll(fds, 2, -1);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (fds[1].revents != 0) {
                break;  // Close() asked us to stop.
            }
            if (fds[0].revents == 0) continue;

            const ssize_t n = ::read(stdout_fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) {
                break;  // EOF: the child closed stdout or exited.
            }
            buffer.append(chunk, static_cast<std::size_t>(n));

            std::size_t start = 0;
            while (true) {
                const auto nl = buffer.find('\n', start);
                if (nl == std::string::npos) break;
                auto line = buffer.substr(start, nl - start);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                HandleLine(line);
                start = nl + 1;
            }
            buffer.erase(0, start);
        }

        open.store(false);
        if (closing.load()) {
            pending.FailAll(MakeStdioError("StdioRead", name, "Transport is closed",
                                           ErrorCategory::Closed));
            return;
        }
        LogWarn("stdio", name + ": server process closed its output");
        pending.FailAll(MakeStdioError("StdioRead", name,
                                       "Server process '" + command + "' exited"));
    }
};

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<StdioTransport>, Error> StdioTransport::Spawn(
    const ServerDescriptor& descriptor) {
    using R = Result<std::unique_ptr<StdioTransport>, Error>;
    IgnoreSigpipeOnce();

    // Everything the child needs is allocated before fork().
    std::vector<std::string> argv_storage;
    argv_storage.push_back(descriptor.command);
    argv_storage.insert(argv_storage.end(), descriptor.args.begin(),
                        descriptor.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    auto env_storage = MergedEnvironment(descriptor.env);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    const std::string cwd = descriptor.cwd.value_or("");

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    int wake_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, status_pipe, wake_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0 || ::pipe2(wake_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_all();
        return R::Err(MakeStdioError("StdioSpawn", descriptor.name,
                                     "pipe() failed: " + reason));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_all();
        return R::Err(MakeStdioError("StdioSpawn", descriptor.name,
                                     "fork() failed: " + reason));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        int err = 0;
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            err = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent.
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(status_pipe[1]);

    // The status pipe is close-on-exec: EOF means exec succeeded, an int
    // means it failed with that errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        std::string what = !cwd.empty() && child_errno == ENOENT
            ? "Failed to start '" + descriptor.command + "' in '" + cwd + "'"
            : "Failed to start '" + descriptor.command + "'";
        return R::Err(MakeStdioError("StdioSpawn", descriptor.name,
                                     what + ": " + std::strerror(child_errno)));
    }

    auto impl = std::make_unique<Impl>(descriptor.name);
    impl->command = descriptor.command;
    impl->pid = pid;
    impl->stdin_fd = in_pipe[1];
    impl->stdout_fd = out_pipe[0];
    impl->wake_read = wake_pipe[0];
    impl->wake_write = wake_pipe[1];

    Impl* raw = impl.get();
    impl->reader = std::thread([raw] { raw->ReaderLoop(); });

    LogDebug("stdio", descriptor.name + ": started '" + descriptor.command +
                          "' (pid " + std::to_string(pid) + ")");
    return R::Ok(std::unique_ptr<StdioTransport>(new StdioTransport(std::move(impl))));
}

StdioTransport::StdioTransport(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

StdioTransport::~StdioTransport() {
    Close();
}

Result<nlohmann::json, Error> StdioTransport::Request(
    const std::string& method,
    const nlohmann::json& params,
    std::optional<std::chrono::milliseconds> timeout) {
    if (!impl_->open.load()) {
        return Result<nlohmann::json, Error>::Err(MakeStdioError(
            method, impl_->name, "Transport is closed", ErrorCategory::Closed));
    }

    auto ticket = impl_->pending.Register();
    const auto line = jsonrpc::MakeRequest(ticket.id, method, params)
                          .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
                      "\n";
    auto written = impl_->WriteLine(line);
    if (written.IsErr()) {
        impl_->pending.Cancel(ticket.id);
        auto error = std::move(written).Error();
        error.operation = method;
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }
    return impl_->pending.Await(ticket, method, timeout);
}

Result<void, Error> StdioTransport::Notify(const std::string& method,
                                           const nlohmann::json& params) {
    if (!impl_->open.load()) {
        return Result<void, Error>::Err(MakeStdioError(
            method, impl_->name, "Transport is closed", ErrorCategory::Closed));
    }
    return impl_->WriteLine(jsonrpc::MakeNotification(method, params)
                                .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
                            "\n");
}

void StdioTransport::Close() {
    std::lock_guard<std::mutex> lock(impl_->close_mutex);
    if (impl_->closed) return;
    impl_->closed = true;
    impl_->closing.store(true);
    impl_->open.store(false);

    // EOF on stdin is the polite shutdown request for stdio servers.
    {
        std::lock_guard<std::mutex> write_lock(impl_->write_mutex);
        CloseFd(impl_->stdin_fd);
    }

    if (impl_->pid > 0) {
        if (!ReapWithin(impl_->pid, kExitGrace)) {
            LogDebug("stdio", impl_->name + ": sending SIGTERM");
            ::kill(impl_->pid, SIGTERM);
            if (!ReapWithin(impl_->pid, kExitGrace)) {
                LogWarn("stdio", impl_->name + ": server ignored SIGTERM, killing");
                ::kill(impl_->pid, SIGKILL);
                int status = 0;
                ::waitpid(impl_->pid, &status, 0);
            }
        }
        impl_->pid = -1;
    }

    if (impl_->wake_write >= 0) {
        const char byte = 'x';
        ssize_t ignored = ::write(impl_->wake_write, &byte, 1);
        (void)ignored;
    }
    if (impl_->reader.joinable()) {
        impl_->reader.join();
    }
    CloseFd(impl_->stdout_fd);
    CloseFd(impl_->wake_read);
    CloseFd(impl_->wake_write);

    impl_->pending.FailAll(MakeStdioError("Close", impl_->name,
                                          "Transport is closed", ErrorCategory::Closed));
    LogDebug("stdio", impl_->name + ": closed");
}

bool StdioTransport::IsOpen() const {
    return impl_->open.load();
}

int StdioTransport::Pid() const {
    return static_cast<int>(impl_->pid);
}

} // namespace mcp_chat
