#pragma once

#include "core/SearchBackend.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <sys/types.h>

namespace grok_mcp {

/**
 * @brief SearchBackend that runs an external executable per call
 *
 * Each invoke() spawns exactly one child in its own process group:
 *   argv: <command...> --query <query>
 *   env:  inherited environment plus GROK_* from the effective config
 *
 * The API key is passed only through the environment. stdout and stderr
 * are captured on separate pipes, each up to max_capture_bytes. When the
 * timeout elapses the process group gets SIGTERM, then SIGKILL after
 * kTerminateGrace. Capture ends when the child exits, even if a
 * descendant still holds the pipes open.
 */
class ProcessSearchBackend : public SearchBackend {
public:
    static constexpr std::chrono::milliseconds kTerminateGrace{250};
    static constexpr size_t kMaxCaptureBytes = 4 * 1024 * 1024;

    /**
     * @param command Executable followed by fixed leading arguments.
     *                A name without '/' is looked up in PATH.
     * @param max_capture_bytes Per-stream limit; the rest is discarded
     * @throws std::invalid_argument if command is empty
     */
    explicit ProcessSearchBackend(std::vector<std::string> command,
                                  size_t max_capture_bytes = kMaxCaptureBytes);
    ~ProcessSearchBackend() override;

    ProcessSearchBackend(const ProcessSearchBackend&) = delete;
    ProcessSearchBackend& operator=(const ProcessSearchBackend&) = delete;

    SearchInvocationResult invoke(const std::string& query,
                                  const EffectiveConfig& config) override;

    /**
     * @brief Terminate every in-flight child and refuse new invocations
     *
     * Interrupted calls throw InvocationError.
     */
    void cancel_all();

    const std::vector<std::string>& command() const { return command_; }

    /// Children spawned and not yet reaped
    size_t active_children() const;

private:
    std::vector<std::string> build_environment(const EffectiveConfig& config) const;
    void terminate_group(pid_t pid, int& status);
    void forget_child(pid_t pid);

    std::vector<std::string> command_;
    size_t max_capture_bytes_;

    std::atomic<bool> cancelled_{false};
    mutable std::mutex children_mutex_;
    std::set<pid_t> children_;
};

} // namespace grok_mcp
