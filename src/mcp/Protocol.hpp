#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace grok_mcp {

using json = nlohmann::json;

/// JSON-RPC 2.0 error codes
namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
} // namespace rpc_error

/// Protocol version reported when the client does not name one
constexpr const char* kDefaultProtocolVersion = "2024-11-05";

/**
 * @brief Protocol-level failure, reported as a JSON-RPC error object
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, json data = nullptr)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const { return code_; }
    const json& data() const { return data_; }

private:
    int code_;
    json data_;
};

struct InitializeRequest {
    std::optional<std::string> protocol_version;
    std::string client_name;
    std::string client_version;
};

struct ToolsListRequest {};

struct ToolsCallRequest {
    std::string name;
    json arguments = json::object();  // always an object
};

/// Any "notifications/..." method
struct Notification {
    std::string method;
};

using RequestVariant = std::variant<InitializeRequest, ToolsListRequest,
                                    ToolsCallRequest, Notification>;

/**
 * @brief A JSON-RPC message validated at the boundary
 */
struct ParsedRequest {
    json id;              // null when absent
    bool has_id = false;  // false for notifications
    std::string method;
    RequestVariant body;
};

/**
 * @brief Extract the request id if it is a valid JSON-RPC id
 *
 * Returns null for a missing id and for ids that are not a string,
 * integer or null.
 */
json extract_id(const json& message);

/**
 * @brief Validate a JSON-RPC message and convert it to a typed request
 * @throws ProtocolError with kInvalidRequest, kMethodNotFound or kInvalidParams
 */
ParsedRequest parse_request(const json& message);

/**
 * @brief Build a JSON-RPC success envelope
 */
json make_result(const json& id, json result);

/**
 * @brief Build a JSON-RPC error envelope
 */
json make_error(const json& id, int code, const std::string& message, const json& data = nullptr);

/**
 * @brief Serialize a message for the wire
 *
 * Invalid UTF-8 in string values (raw subprocess output) is replaced
 * with U+FFFD instead of throwing.
 */
std::string serialize(const json& message);

} // namespace grok_mcp
