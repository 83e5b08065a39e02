#pragma once

#include "ITransport.hpp"
#include "mcp/Protocol.hpp"
#include "tools/ToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace grok_mcp {

using json = nlohmann::json;

/**
 * @brief Identity reported in the initialize handshake
 */
struct ServerInfo {
    std::string name = "grok-search-mcp";
    std::string version = "0.1.0";
};

/**
 * @brief MCP dispatcher implementing JSON-RPC 2.0
 *
 * Supports methods: initialize, tools/list, tools/call and notifications.
 * Holds no per-request state, so handle_message() and handle_body() may be
 * called concurrently from transport worker threads.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server over a populated tool registry
     * @param registry Tools to expose (read-only from here on)
     * @param info Server identity
     */
    explicit MCPServer(std::shared_ptr<const ToolRegistry> registry, ServerInfo info = {});

    /**
     * @brief Handle one decoded JSON-RPC message
     * @return Response envelope, or nullopt for notifications
     */
    std::optional<json> handle_message(const json& message) const;

    /**
     * @brief Handle a raw request body (single message or batch)
     *
     * Invalid JSON yields a -32700 error. A batch yields an array of the
     * non-notification responses.
     * @return Serialized response, or nullopt if nothing needs sending
     */
    std::optional<std::string> handle_body(const std::string& body) const;

    /**
     * @brief Serve a stream transport until EOF or stop()
     *
     * Reads messages, dispatches them, writes responses.
     */
    void run(ITransport& transport);

    /**
     * @brief Signal the run() loop to stop gracefully
     */
    void stop();

    const ServerInfo& info() const { return info_; }

private:
    json dispatch(const ParsedRequest& request) const;

    json handle_initialize(const InitializeRequest& request) const;
    json handle_tools_list() const;
    json handle_tools_call(const ToolsCallRequest& request) const;

    std::shared_ptr<const ToolRegistry> registry_;
    ServerInfo info_;
    std::atomic<bool> running_{false};
};

} // namespace grok_mcp
