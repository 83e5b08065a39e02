#include "ProcessSearchBackend.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string_view>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace grok_mcp {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kReapSlice{10};

/**
 * @brief Owns a file descriptor, closing it on destruction
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

void open_pipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw InvocationError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    p.read_end = UniqueFd(fds[0]);
    p.write_end = UniqueFd(fds[1]);
}

/**
 * @brief RAII holder for posix_spawn attribute and file-action objects
 */
struct SpawnSetup {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;

    SpawnSetup() {
        posix_spawn_file_actions_init(&actions);
        posix_spawnattr_init(&attr);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }

    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

std::vector<char*> to_pointer_array(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

/**
 * @brief Read everything currently available from a non-blocking fd
 *
 * Bytes beyond `limit` are read and discarded so the writer never blocks
 * on a full pipe.
 * @return false on EOF or a read error, true if the pipe is still open
 */
bool drain(int fd, std::string& sink, size_t limit, bool& truncated) {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            const size_t room = limit > sink.size() ? limit - sink.size() : 0;
            const size_t take = std::min(room, static_cast<size_t>(n));
            sink.append(chunk, take);
            if (take < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;  // EOF
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::warn("Read from search process failed: {}", std::strerror(errno));
        return false;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool child_exited(pid_t pid) {
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (rc != 0 && errno == EINTR);
    return rc == 0 && info.si_pid == pid;
}

int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid, std::strerror(errno));
            return -1;
        }
    }
    return status;
}

} // namespace

ProcessSearchBackend::ProcessSearchBackend(std::vector<std::string> command,
                                           size_t max_capture_bytes)
    : command_(std::move(command))
    , max_capture_bytes_(max_capture_bytes) {
    if (command_.empty() || command_.front().empty()) {
        throw std::invalid_argument("Search command cannot be empty");
    }
    spdlog::info("Search backend command: {}", command_.front());
}

ProcessSearchBackend::~ProcessSearchBackend() {
    cancel_all();
}

std::vector<std::string> ProcessSearchBackend::build_environment(const EffectiveConfig& config) const {
    const auto& managed = ConfigResolver::environment_names();

    std::vector<std::string> env;
    bool has_python_utf8 = false;
    bool has_python_encoding = false;

    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view item(*entry);
        auto eq = item.find('=');
        std::string_view name = item.substr(0, eq);
        if (std::find(managed.begin(), managed.end(), name) != managed.end()) {
            continue;
        }
        has_python_utf8 = has_python_utf8 || name == "PYTHONUTF8";
        has_python_encoding = has_python_encoding || name == "PYTHONIOENCODING";
        env.emplace_back(item);
    }

    if (!has_python_utf8) env.emplace_back("PYTHONUTF8=1");
    if (!has_python_encoding) env.emplace_back("PYTHONIOENCODING=utf-8");

    env.push_back("GROK_BASE_URL=" + config.base_url);
    env.push_back("GROK_API_KEY=" + config.api_key);
    env.push_back("GROK_MODEL=" + config.model);
    env.push_back("GROK_TIMEOUT_SECONDS=" + std::to_string(config.timeout_seconds));
    if (config.system_prompt) {
        env.push_back("GROK_SYSTEM_PROMPT=" + *config.system_prompt);
    }
    if (!config.extra_body.empty()) {
        env.push_back("GROK_EXTRA_BODY_JSON=" + config.extra_body.dump());
    }
    if (!config.extra_headers.empty()) {
        env.push_back("GROK_EXTRA_HEADERS_JSON=" + config.extra_headers.dump());
    }
    return env;
}

void ProcessSearchBackend::terminate_group(pid_t pid, int& status) {
    ::kill(-pid, SIGTERM);

    const auto grace_deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (!child_exited(pid) && std::chrono::steady_clock::now() < grace_deadline) {
        std::this_thread::sleep_for(kReapSlice);
    }

    // The leader is not reaped yet, so its pid still names this group.
    ::kill(-pid, SIGKILL);
    forget_child(pid);
    status = reap(pid);
}

void ProcessSearchBackend::forget_child(pid_t pid) {
    std::lock_guard<std::mutex> lock(children_mutex_);
    children_.erase(pid);
}

size_t ProcessSearchBackend::active_children() const {
    std::lock_guard<std::mutex> lock(children_mutex_);
    return children_.size();
}

SearchInvocationResult ProcessSearchBackend::invoke(const std::string& query,
                                                    const EffectiveConfig& config) {
    if (cancelled_) {
        throw InvocationError("Search cancelled: backend is shutting down");
    }
    if (config.timeout_seconds <= 0) {
        throw InvocationError("Invalid timeout: " + std::to_string(config.timeout_seconds));
    }

    Pipe out_pipe;
    Pipe err_pipe;
    open_pipe(out_pipe);
    open_pipe(err_pipe);

    SpawnSetup setup;
    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, out_pipe.write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&setup.actions, err_pipe.write_end.get(), STDERR_FILENO);

    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigdefault(&setup.attr, &default_signals);
    posix_spawnattr_setsigmask(&setup.attr, &empty_mask);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    posix_spawnattr_setflags(&setup.attr,
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<std::string> argv_strings = command_;
    argv_strings.push_back("--query");
    argv_strings.push_back(query);
    std::vector<std::string> env_strings = build_environment(config);
    auto argv = to_pointer_array(argv_strings);
    auto envp = to_pointer_array(env_strings);

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::seconds(config.timeout_seconds);

    pid_t pid = 0;
    const bool search_path = command_.front().find('/') == std::string::npos;
    int rc = search_path
        ? posix_spawnp(&pid, command_.front().c_str(), &setup.actions, &setup.attr, argv.data(), envp.data())
        : posix_spawn(&pid, command_.front().c_str(), &setup.actions, &setup.attr, argv.data(), envp.data());

    if (rc != 0) {
        spdlog::error("Failed to launch search command {}: {}", command_.front(), std::strerror(rc));
        throw InvocationError("Failed to launch search command '" + command_.front() +
                              "': " + std::strerror(rc));
    }

    {
        std::lock_guard<std::mutex> lock(children_mutex_);
        children_.insert(pid);
    }
    spdlog::debug("Spawned search process pid={} (timeout {}s)", pid, config.timeout_seconds);

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    for (int fd : {out_pipe.read_end.get(), err_pipe.read_end.get()}) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    }

    SearchInvocationResult result;
    bool timed_out = false;
    bool cancelled = false;
    int status = 0;

    try {
        bool out_open = true;
        bool err_open = true;

        while (out_open || err_open) {
            if (cancelled_) {
                cancelled = true;
                break;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                timed_out = true;
                break;
            }
            auto wait = std::min(
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now), kPollSlice);

            struct pollfd fds[2];
            fds[0].fd = out_open ? out_pipe.read_end.get() : -1;
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            fds[1].fd = err_open ? err_pipe.read_end.get() : -1;
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            int ready = ::poll(fds, 2, static_cast<int>(std::max<long long>(wait.count(), 1)));
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw InvocationError(std::string("poll failed: ") + std::strerror(errno));
            }

            if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
                out_open = drain(out_pipe.read_end.get(), result.stdout_text,
                                 max_capture_bytes_, result.truncated);
            }
            if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                err_open = drain(err_pipe.read_end.get(), result.stderr_text,
                                 max_capture_bytes_, result.truncated);
            }

            // The child is gone but a descendant still holds a pipe open:
            // collect what it wrote and stop waiting for EOF.
            if ((out_open || err_open) && child_exited(pid)) {
                if (out_open) {
                    out_open = drain(out_pipe.read_end.get(), result.stdout_text,
                                     max_capture_bytes_, result.truncated);
                }
                if (err_open) {
                    err_open = drain(err_pipe.read_end.get(), result.stderr_text,
                                     max_capture_bytes_, result.truncated);
                }
                spdlog::debug("Search process pid={} exited with pipes still open, "
                              "killing leftover process group", pid);
                ::kill(-pid, SIGKILL);
                break;
            }
        }

        // Both pipes closed: wait for the exit status within the same deadline.
        while (!timed_out && !cancelled && !child_exited(pid)) {
            if (cancelled_) {
                cancelled = true;
            } else if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
            } else {
                std::this_thread::sleep_for(kReapSlice);
            }
        }

        if (timed_out || cancelled) {
            terminate_group(pid, status);
        } else {
            forget_child(pid);
            status = reap(pid);
        }
    } catch (const std::exception& e) {
        spdlog::error("Search process pid={} aborted: {}", pid, e.what());
        terminate_group(pid, status);
        throw;
    }

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (timed_out) {
        spdlog::warn("Search process pid={} timed out after {}s, terminated", pid, config.timeout_seconds);
        throw InvocationTimeout("Search timed out after " + std::to_string(config.timeout_seconds) + "s");
    }
    if (cancelled) {
        spdlog::warn("Search process pid={} cancelled", pid);
        throw InvocationError("Search cancelled: backend is shutting down");
    }

    result.exit_code = decode_status(status);
    spdlog::info("Search process pid={} exited with code {} in {} ms",
                 pid, result.exit_code, result.duration_ms);
    if (result.truncated) {
        spdlog::warn("Search process pid={} output truncated at {} bytes per stream",
                     pid, max_capture_bytes_);
    }
    return result;
}

void ProcessSearchBackend::cancel_all() {
    cancelled_ = true;

    std::lock_guard<std::mutex> lock(children_mutex_);
    for (pid_t pid : children_) {
        spdlog::info("Cancelling search process pid={}", pid);
        ::kill(-pid, SIGTERM);
    }
}

} // namespace grok_mcp
