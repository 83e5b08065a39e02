#include "GrokSearchTool.hpp"
#include "core/StringUtils.hpp"
#include "mcp/Protocol.hpp"
#include <spdlog/spdlog.h>

namespace grok_mcp {

GrokSearchTool::GrokSearchTool(std::shared_ptr<const ConfigResolver> resolver,
                               std::shared_ptr<SearchBackend> backend)
    : resolver_(std::move(resolver))
    , backend_(std::move(backend)) {
    if (!resolver_) {
        throw std::invalid_argument("Config resolver cannot be null");
    }
    if (!backend_) {
        throw std::invalid_argument("Search backend cannot be null");
    }
}

ToolInfo GrokSearchTool::get_info() {
    return {
        kName,
        "Search the web or X using Grok's real-time search capability.",
        {
            {"type", "object"},
            {"properties", {
                {"query", {
                    {"type", "string"},
                    {"description", "Search query / research task."}
                }}
            }},
            {"required", json::array({"query"})},
            {"additionalProperties", false}
        }
    };
}

std::string GrokSearchTool::validate_query(const json& args) {
    auto it = args.find("query");
    if (it == args.end() || !it->is_string()) {
        throw ProtocolError(rpc_error::kInvalidParams, "Missing required argument: query");
    }

    std::string query = trim(it->get<std::string>());
    if (query.empty()) {
        throw ProtocolError(rpc_error::kInvalidParams, "Missing required argument: query");
    }
    return query;
}

ToolResult GrokSearchTool::map_result(const SearchInvocationResult& result) {
    ToolResult mapped = map_output(result);
    if (result.truncated) {
        mapped.text += kTruncatedMarker;
    }
    return mapped;
}

ToolResult GrokSearchTool::map_output(const SearchInvocationResult& result) {
    const std::string out = trim(result.stdout_text);
    const std::string err = trim(result.stderr_text);

    if (result.exit_code != 0) {
        if (!err.empty()) return {err, true};
        if (!out.empty()) return {out, true};
        return {"search backend exited with code " + std::to_string(result.exit_code), true};
    }

    if (out.empty()) {
        return {err.empty() ? "search backend produced no output" : err, true};
    }

    // Backends that report failures as {"ok": false, ...} on stdout.
    bool reported_failure = false;
    if (out.front() == '{') {
        json parsed = json::parse(out, nullptr, false);
        if (parsed.is_object()) {
            auto ok = parsed.find("ok");
            reported_failure = ok != parsed.end() && ok->is_boolean() && !ok->get<bool>();
        }
    }
    return {out, reported_failure};
}

ToolResult GrokSearchTool::execute(const json& args) {
    const std::string query = validate_query(args);
    spdlog::debug("GrokSearchTool: query of {} bytes", query.size());

    EffectiveConfig config;
    try {
        config = resolver_->resolve();
    } catch (const ConfigError& e) {
        spdlog::error("GrokSearchTool config error: {}", e.what());
        return {std::string("Configuration error: ") + e.what(), true};
    }

    try {
        auto result = backend_->invoke(query, config);
        ToolResult tool_result = map_result(result);
        tool_result.text = redact(std::move(tool_result.text), config.api_key);
        if (tool_result.is_error) {
            spdlog::warn("GrokSearchTool: search failed (exit code {}, {} ms)",
                         result.exit_code, result.duration_ms);
        }
        return tool_result;
    } catch (const InvocationTimeout& e) {
        spdlog::error("GrokSearchTool timeout: {}", e.what());
        return {redact(e.what(), config.api_key), true};
    } catch (const InvocationError& e) {
        spdlog::error("GrokSearchTool invocation error: {}", redact(e.what(), config.api_key));
        return {redact(e.what(), config.api_key), true};
    }
}

} // namespace grok_mcp
