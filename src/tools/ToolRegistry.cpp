#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace grok_mcp {

json ToolInfo::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

json ToolResult::to_json() const {
    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", text}
            }
        })},
        {"isError", is_error}
    };
}

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (tools_.count(info.name) != 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

std::vector<ToolInfo> ToolRegistry::list() const {
    std::vector<ToolInfo> result;
    result.reserve(tools_.size());
    for (const auto& [name, info] : tools_) {
        result.push_back(info);
    }
    return result;
}

const ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

} // namespace grok_mcp
