#include "HttpTransport.hpp"
#include "MCPServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace grok_mcp {

HttpTransport::HttpTransport(const MCPServer& server, Options opts)
    : server_(server)
    , opts_(std::move(opts))
    , http_(std::make_unique<httplib::Server>()) {
    const size_t workers = opts_.worker_threads == 0 ? 1 : opts_.worker_threads;
    http_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    http_->set_payload_max_length(opts_.max_body_bytes);
}

HttpTransport::~HttpTransport() {
    stop();
}

void HttpTransport::setup_routes() {
    if (routes_ready_.exchange(true)) return;

    // POST: handle JSON-RPC requests
    auto rpc_entry = [this](const httplib::Request& req, httplib::Response& res) {
        spdlog::debug("POST {} from {} ({} bytes)", req.path, req.remote_addr, req.body.size());
        try {
            auto response = server_.handle_body(req.body);
            if (!response) {
                // Only notifications: nothing to return
                res.status = 202;
                return;
            }
            res.status = 200;
            res.set_content(*response, "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error serving {}: {}", req.path, e.what());
            res.status = 500;
            res.set_content(serialize(make_error(nullptr, rpc_error::kInternalError, "Internal error")),
                            "application/json");
        }
    };
    http_->Post("/", rpc_entry);
    http_->Post("/mcp", rpc_entry);
    http_->Post("/mcp/", rpc_entry);

    // GET: health check
    http_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        json health = {
            {"ok", true},
            {"server", {
                {"name", server_.info().name},
                {"version", server_.info().version}
            }}
        };
        res.set_content(serialize(health), "application/json");
    });
}

void HttpTransport::listen() {
    setup_routes();
    spdlog::info("HTTP transport listening on {}:{}", opts_.host, opts_.port);
    if (!http_->listen(opts_.host, opts_.port)) {
        throw std::runtime_error("Failed to start HTTP server on " + opts_.host + ":" +
                                 std::to_string(opts_.port));
    }
    spdlog::info("HTTP transport stopped");
}

uint16_t HttpTransport::bind_any_port() {
    setup_routes();
    int port = http_->bind_to_any_port(opts_.host);
    if (port <= 0) {
        throw std::runtime_error("Failed to bind HTTP server on " + opts_.host);
    }
    opts_.port = static_cast<uint16_t>(port);
    spdlog::info("HTTP transport bound to {}:{}", opts_.host, opts_.port);
    return opts_.port;
}

void HttpTransport::listen_after_bind() {
    if (!http_->listen_after_bind()) {
        throw std::runtime_error("HTTP server on " + opts_.host + ":" +
                                 std::to_string(opts_.port) + " failed");
    }
    spdlog::info("HTTP transport stopped");
}

void HttpTransport::stop() {
    if (http_->is_running()) {
        spdlog::info("Stopping HTTP transport");
    }
    http_->stop();
}

bool HttpTransport::is_running() const {
    return http_->is_running();
}

} // namespace grok_mcp
