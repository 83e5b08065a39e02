#pragma once

#include <optional>
#include <string>

namespace grok_mcp {

/**
 * @brief Abstract interface for stream-oriented MCP transports
 *
 * Implementations carry raw JSON-RPC bodies; decoding and error shaping
 * happen in MCPServer so malformed input still gets a response.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message body from transport
     * @return Raw body, or nullopt on EOF/error
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write a serialized JSON-RPC response
     */
    virtual void write_message(const std::string& message) = 0;

    /**
     * @brief Check if transport is still open
     */
    virtual bool is_open() const = 0;
};

} // namespace grok_mcp
