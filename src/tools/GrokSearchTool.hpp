#pragma once

#include "core/ConfigResolver.hpp"
#include "core/SearchBackend.hpp"
#include "tools/ToolRegistry.hpp"
#include <memory>

namespace grok_mcp {

/**
 * @brief MCP tool "grok_search": web / X search through the search backend
 *
 * Resolves the effective configuration on every call, runs the backend
 * and maps its output to a single text result. Configuration and
 * invocation failures become is_error results, never protocol errors.
 */
class GrokSearchTool {
public:
    static constexpr const char* kName = "grok_search";
    static constexpr const char* kTruncatedMarker = "\n[output truncated]";

    /**
     * @brief Construct tool with its collaborators
     * @param resolver Configuration sources captured at startup
     * @param backend Search operation to run
     */
    GrokSearchTool(std::shared_ptr<const ConfigResolver> resolver,
                   std::shared_ptr<SearchBackend> backend);

    /**
     * @brief Get tool metadata and JSON schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "query" parameter
     * @throws ProtocolError (invalid params) if query is missing or blank
     */
    ToolResult execute(const json& args);

    /**
     * @brief Translate raw backend output into a tool result
     *
     * Exit 0 with output: stdout is the result, unless it is a JSON object
     * with "ok": false. Non-zero exit: stderr, falling back to stdout.
     * Truncated output ends with kTruncatedMarker.
     */
    static ToolResult map_result(const SearchInvocationResult& result);

private:
    static ToolResult map_output(const SearchInvocationResult& result);
    static std::string validate_query(const json& args);

    std::shared_ptr<const ConfigResolver> resolver_;
    std::shared_ptr<SearchBackend> backend_;
};

} // namespace grok_mcp
