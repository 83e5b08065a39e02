#include "ShutdownWatcher.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <stdexcept>

namespace grok_mcp {

namespace {

std::atomic<bool> shutdown_requested{false};
std::atomic<int> last_signal{0};

void signal_handler(int signal) {
    last_signal = signal;
    shutdown_requested = true;
}

} // namespace

void ShutdownWatcher::install(std::initializer_list<int> signals) {
    for (int signal : signals) {
        std::signal(signal, signal_handler);
    }
}

void ShutdownWatcher::request() noexcept {
    shutdown_requested = true;
}

bool ShutdownWatcher::requested() noexcept {
    return shutdown_requested;
}

void ShutdownWatcher::reset() noexcept {
    shutdown_requested = false;
    last_signal = 0;
}

ShutdownWatcher::ShutdownWatcher(Callback on_shutdown)
    : on_shutdown_(std::move(on_shutdown)) {
    if (!on_shutdown_) {
        throw std::invalid_argument("Shutdown callback cannot be null");
    }
    thread_ = std::thread([this] { run(); });
}

ShutdownWatcher::~ShutdownWatcher() {
    done_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ShutdownWatcher::run() {
    while (!done_) {
        if (shutdown_requested) {
            if (int signal = last_signal.load(); signal != 0) {
                spdlog::info("Received signal {}, shutting down gracefully", signal);
            } else {
                spdlog::info("Shutdown requested");
            }
            try {
                on_shutdown_();
            } catch (const std::exception& e) {
                spdlog::error("Shutdown callback failed: {}", e.what());
            }
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

} // namespace grok_mcp
