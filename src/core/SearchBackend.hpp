#pragma once

#include "core/ConfigResolver.hpp"
#include <stdexcept>
#include <string>

namespace grok_mcp {

/**
 * @brief Raised when the search operation cannot be carried out
 *
 * Launch failures (missing executable, permission denied) and cancellation.
 */
class InvocationError : public std::runtime_error {
public:
    explicit InvocationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when the search did not finish within the configured timeout
 */
class InvocationTimeout : public InvocationError {
public:
    explicit InvocationTimeout(const std::string& message)
        : InvocationError(message) {}
};

/**
 * @brief Raw outcome of one search invocation
 */
struct SearchInvocationResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    long long duration_ms = 0;
    bool truncated = false;  // output exceeded the capture limit
};

/**
 * @brief Abstract search operation
 *
 * The default implementation shells out (ProcessSearchBackend); an
 * in-process implementation can be swapped in without touching the
 * dispatcher. Implementations must be safe to call from several threads.
 */
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    /**
     * @brief Run one search
     * @param query Non-empty search query
     * @param config Effective configuration for this call
     * @return Captured output and exit status
     * @throws InvocationTimeout if config.timeout_seconds elapses first
     * @throws InvocationError on launch failure or cancellation
     */
    virtual SearchInvocationResult invoke(const std::string& query,
                                          const EffectiveConfig& config) = 0;
};

} // namespace grok_mcp
