#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <thread>

namespace grok_mcp {

/**
 * @brief Turns SIGINT/SIGTERM into a shutdown callback on a normal thread
 *
 * The signal handler only sets an atomic flag. A watcher thread polls the
 * flag and runs the callback, so the callback may take locks, log and stop
 * servers without restrictions on async-signal safety.
 */
class ShutdownWatcher {
public:
    using Callback = std::function<void()>;

    static constexpr std::chrono::milliseconds kPollInterval{50};

    /**
     * @brief Route the given signals to request()
     */
    static void install(std::initializer_list<int> signals);

    /// Async-signal-safe
    static void request() noexcept;
    static bool requested() noexcept;
    static void reset() noexcept;

    /**
     * @brief Start watching
     * @param on_shutdown Runs at most once, on the watcher thread
     */
    explicit ShutdownWatcher(Callback on_shutdown);

    /// Stops watching without running the callback if no shutdown was requested
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

private:
    void run();

    Callback on_shutdown_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace grok_mcp
