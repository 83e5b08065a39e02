#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace grok_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments

    json to_json() const;
};

/**
 * @brief Outcome of a tool call, serialized as one text content block
 */
struct ToolResult {
    std::string text;
    bool is_error = false;

    json to_json() const;
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return Tool result; tool failures set is_error
 * @throws ProtocolError when the arguments are invalid
 */
using ToolHandler = std::function<ToolResult(const json& args)>;

/**
 * @brief Static set of tools exposed through tools/list and tools/call
 *
 * Populated once at startup, read-only afterwards; concurrent reads need
 * no locking.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     * @throws std::invalid_argument on empty name, null handler or duplicate name
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief All tool descriptors, ordered by name
     */
    std::vector<ToolInfo> list() const;

    /**
     * @brief Look up a handler
     * @return nullptr if no tool with that name exists
     */
    const ToolHandler* find(const std::string& name) const;

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace grok_mcp
