#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

// Forward declaration to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace grok_mcp {

class MCPServer;

/**
 * @brief JSON-RPC over HTTP POST, served by cpp-httplib
 *
 * POST /, /mcp and /mcp/ carry JSON-RPC bodies; GET / is a health check.
 * Requests run on httplib's worker pool and are dispatched concurrently.
 */
class HttpTransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 5678;
        size_t worker_threads = 8;
        size_t max_body_bytes = 1024 * 1024;
    };

    /**
     * @param server Dispatcher; must outlive the transport
     * @param opts Bind address and limits
     */
    HttpTransport(const MCPServer& server, Options opts);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /**
     * @brief Bind to opts.host:opts.port and serve until stop()
     * @throws std::runtime_error if the address cannot be bound
     */
    void listen();

    /**
     * @brief Bind to an ephemeral port on opts.host
     * @return The bound port
     * @throws std::runtime_error on failure
     */
    uint16_t bind_any_port();

    /**
     * @brief Serve on a socket bound by bind_any_port() until stop()
     */
    void listen_after_bind();

    /**
     * @brief Stop serving; safe to call from another thread
     */
    void stop();

    bool is_running() const;
    uint16_t port() const { return opts_.port; }

private:
    void setup_routes();

    const MCPServer& server_;
    Options opts_;
    std::unique_ptr<httplib::Server> http_;
    std::atomic<bool> routes_ready_{false};
};

} // namespace grok_mcp
