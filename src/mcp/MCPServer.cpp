#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace grok_mcp {

MCPServer::MCPServer(std::shared_ptr<const ToolRegistry> registry, ServerInfo info)
    : registry_(std::move(registry))
    , info_(std::move(info)) {
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }
    spdlog::info("MCPServer initialized with {} tool(s)", registry_->size());
}

std::optional<json> MCPServer::handle_message(const json& message) const {
    const json id = extract_id(message);

    ParsedRequest request;
    try {
        request = parse_request(message);
    } catch (const ProtocolError& e) {
        spdlog::warn("Rejected request: {}", e.what());
        return make_error(id, e.code(), e.what(), e.data());
    }

    spdlog::debug("Handling request: method={}, id={}", request.method, request.id.dump());

    if (std::holds_alternative<Notification>(request.body)) {
        spdlog::debug("Notification received: {}", request.method);
        if (!request.has_id) {
            return std::nullopt;
        }
        return make_result(request.id, json::object());
    }

    try {
        return make_result(request.id, dispatch(request));
    } catch (const ProtocolError& e) {
        spdlog::warn("Error handling method {}: {}", request.method, e.what());
        return make_error(request.id, e.code(), e.what(), e.data());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", request.method, e.what());
        return make_error(request.id, rpc_error::kInternalError,
                          std::string("Internal error: ") + e.what());
    }
}

std::optional<std::string> MCPServer::handle_body(const std::string& body) const {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::parse_error& e) {
        spdlog::warn("JSON parse error: {}", e.what());
        return serialize(make_error(nullptr, rpc_error::kParseError, "Parse error"));
    }

    if (!payload.is_array()) {
        auto response = handle_message(payload);
        if (!response) {
            return std::nullopt;
        }
        return serialize(*response);
    }

    if (payload.empty()) {
        return serialize(make_error(nullptr, rpc_error::kInvalidRequest, "Invalid Request: empty batch"));
    }

    json responses = json::array();
    for (const auto& message : payload) {
        if (auto response = handle_message(message)) {
            responses.push_back(std::move(*response));
        }
    }
    spdlog::debug("Batch of {} message(s) produced {} response(s)", payload.size(), responses.size());

    if (responses.empty()) {
        return std::nullopt;
    }
    return serialize(responses);
}

json MCPServer::dispatch(const ParsedRequest& request) const {
    return std::visit([this](const auto& body) -> json {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, InitializeRequest>) {
            return handle_initialize(body);
        } else if constexpr (std::is_same_v<T, ToolsListRequest>) {
            return handle_tools_list();
        } else if constexpr (std::is_same_v<T, ToolsCallRequest>) {
            return handle_tools_call(body);
        } else {
            return json::object();
        }
    }, request.body);
}

void MCPServer::run(ITransport& transport) {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport.is_open()) {
        auto body = transport.read_message();

        // No message indicates EOF or closed transport
        if (!body) {
            spdlog::info("Input closed, stopping server");
            break;
        }

        if (auto response = handle_body(*body)) {
            transport.write_message(*response);
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

json MCPServer::handle_initialize(const InitializeRequest& request) const {
    spdlog::info("Handling initialize request");

    if (!request.client_name.empty()) {
        spdlog::info("Client: {} version {}", request.client_name,
                     request.client_version.empty() ? "unknown" : request.client_version);
    }

    return {
        {"protocolVersion", request.protocol_version.value_or(kDefaultProtocolVersion)},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
}

json MCPServer::handle_tools_list() const {
    json tools_array = json::array();
    for (const auto& info : registry_->list()) {
        tools_array.push_back(info.to_json());
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const ToolsCallRequest& request) const {
    const ToolHandler* handler = registry_->find(request.name);
    if (!handler) {
        throw ProtocolError(rpc_error::kInvalidParams, "Unknown tool: " + request.name);
    }

    spdlog::info("Calling tool: {}", request.name);
    ToolResult result = (*handler)(request.arguments);
    spdlog::info("Tool {} finished (isError={})", request.name, result.is_error);
    return result.to_json();
}

} // namespace grok_mcp
