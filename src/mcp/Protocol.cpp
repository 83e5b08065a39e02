#include "Protocol.hpp"

namespace grok_mcp {

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number_integer() || id.is_null();
}

json params_of(const json& message) {
    auto it = message.find("params");
    if (it == message.end() || it->is_null()) {
        return json::object();
    }
    return *it;
}

ToolsCallRequest parse_tools_call(const json& params) {
    if (!params.is_object()) {
        throw ProtocolError(rpc_error::kInvalidParams, "Invalid params: expected object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
        throw ProtocolError(rpc_error::kInvalidParams, "Missing required parameter: name");
    }

    ToolsCallRequest request;
    request.name = name_it->get<std::string>();

    auto args_it = params.find("arguments");
    if (args_it == params.end() || args_it->is_null()) {
        return request;
    }

    json arguments = *args_it;
    // Some clients send arguments as a JSON-encoded string.
    if (arguments.is_string()) {
        try {
            arguments = json::parse(arguments.get<std::string>());
        } catch (const json::parse_error&) {
            throw ProtocolError(rpc_error::kInvalidParams,
                                "Invalid arguments: string payload is not valid JSON",
                                {{"arguments", *args_it}});
        }
    }

    if (!arguments.is_object()) {
        throw ProtocolError(rpc_error::kInvalidParams,
                            "Invalid arguments: expected object",
                            {{"arguments_type", arguments.type_name()}});
    }

    request.arguments = std::move(arguments);
    return request;
}

InitializeRequest parse_initialize(const json& params) {
    InitializeRequest request;
    if (!params.is_object()) {
        return request;
    }

    auto version_it = params.find("protocolVersion");
    if (version_it != params.end() && version_it->is_string() &&
        !version_it->get<std::string>().empty()) {
        request.protocol_version = version_it->get<std::string>();
    }

    auto client_it = params.find("clientInfo");
    if (client_it != params.end() && client_it->is_object()) {
        const json& info = *client_it;
        if (info.contains("name") && info["name"].is_string()) {
            request.client_name = info["name"].get<std::string>();
        }
        if (info.contains("version") && info["version"].is_string()) {
            request.client_version = info["version"].get<std::string>();
        }
    }
    return request;
}

} // namespace

json extract_id(const json& message) {
    if (!message.is_object()) {
        return nullptr;
    }
    auto it = message.find("id");
    if (it == message.end() || !is_valid_id(*it)) {
        return nullptr;
    }
    return *it;
}

ParsedRequest parse_request(const json& message) {
    if (!message.is_object()) {
        throw ProtocolError(rpc_error::kInvalidRequest, "Invalid Request: expected object");
    }

    auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || *version_it != "2.0") {
        throw ProtocolError(rpc_error::kInvalidRequest,
                            "Invalid Request: missing or invalid jsonrpc field");
    }

    ParsedRequest parsed;
    auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!is_valid_id(*id_it)) {
            throw ProtocolError(rpc_error::kInvalidRequest, "Invalid Request: invalid id");
        }
        parsed.id = *id_it;
        parsed.has_id = true;
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string() ||
        method_it->get<std::string>().empty()) {
        throw ProtocolError(rpc_error::kInvalidRequest,
                            "Invalid Request: missing method field");
    }
    parsed.method = method_it->get<std::string>();

    const json params = params_of(message);

    if (parsed.method == "initialize") {
        parsed.body = parse_initialize(params);
    } else if (parsed.method == "tools/list") {
        parsed.body = ToolsListRequest{};
    } else if (parsed.method == "tools/call") {
        parsed.body = parse_tools_call(params);
    } else if (parsed.method.rfind("notifications/", 0) == 0) {
        parsed.body = Notification{parsed.method};
    } else {
        throw ProtocolError(rpc_error::kMethodNotFound, "Method not found: " + parsed.method);
    }

    return parsed;
}

json make_result(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json make_error(const json& id, int code, const std::string& message, const json& data) {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

std::string serialize(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace grok_mcp
