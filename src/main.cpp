#include "core/ConfigResolver.hpp"
#include "core/ProcessSearchBackend.hpp"
#include "core/ShutdownWatcher.hpp"
#include "mcp/HttpTransport.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/GrokSearchTool.hpp"
#include "tools/ToolRegistry.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sink.h>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {
    void add_override(CLI::App& app, const std::string& flags,
                      std::optional<std::string>& target, const std::string& help) {
        app.add_option_function<std::string>(flags,
            [&target](const std::string& value) { target = value; }, help);
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"Grok Search MCP Server - JSON-RPC adapter for a Grok search backend"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string host = "127.0.0.1";
    app.add_option("--host", host, "Address to bind the HTTP endpoint to")->default_val("127.0.0.1");

    uint16_t port = 5678;
    app.add_option("-p,--port", port, "Port for the HTTP endpoint")->default_val(5678);

    bool use_stdio = false;
    app.add_flag("--stdio", use_stdio, "Serve newline-delimited JSON-RPC on stdin/stdout instead of HTTP");

    std::string config_path = "config.json";
    app.add_option("-c,--config", config_path, "Path to config.json (config.local.json is read beside it)")
        ->default_val("config.json");

    std::vector<std::string> search_command{"grok-search"};
    app.add_option("--search-command", search_command,
                   "Search executable and leading arguments (looked up in PATH without a '/')")
        ->expected(1, -1);

    grok_mcp::ConfigOverrides overrides;
    add_override(app, "--base-url", overrides.base_url, "Override Grok base URL");
    add_override(app, "--api-key", overrides.api_key, "Override Grok API key");
    add_override(app, "--model", overrides.model, "Override model name");
    add_override(app, "--timeout", overrides.timeout_seconds, "Search timeout in seconds (positive integer)");
    add_override(app, "--system-prompt", overrides.system_prompt, "Custom system prompt");
    add_override(app, "--extra-body-json", overrides.extra_body_json, "Additional JSON body fields");
    add_override(app, "--extra-headers-json", overrides.extra_headers_json, "Additional HTTP headers");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    grok_mcp::ServerInfo server_info;
    if (version) {
        std::cout << server_info.name << " version " << server_info.version << std::endl;
        return 0;
    }

    // Logs go to stderr so stdout stays a clean protocol channel
    spdlog::set_default_logger(spdlog::stderr_color_mt("grok-mcp"));

    // Configure logging
    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    spdlog::info("Starting {} {}", server_info.name, server_info.version);
    spdlog::info("Log level: {}", log_level);

    try {
        // Signal handlers only set a flag; ShutdownWatcher acts on it
        grok_mcp::ShutdownWatcher::install({SIGINT, SIGTERM});
        std::signal(SIGPIPE, SIG_IGN);

        // Configuration sources are captured once; files are re-read per call
        auto resolver = std::make_shared<const grok_mcp::ConfigResolver>(
            config_path, grok_mcp::ConfigResolver::capture_environment(), overrides);

        // Validate eagerly so operators see problems at startup
        try {
            auto config = resolver->resolve();
            spdlog::info("Search backend: {} (model {}, timeout {}s)",
                         config.base_url, config.model, config.timeout_seconds);
        } catch (const grok_mcp::ConfigError& e) {
            spdlog::warn("Configuration incomplete, tools/call will fail until fixed: {}", e.what());
        }

        auto backend = std::make_shared<grok_mcp::ProcessSearchBackend>(search_command);

        auto registry = std::make_shared<grok_mcp::ToolRegistry>();
        auto search_tool = std::make_shared<grok_mcp::GrokSearchTool>(resolver, backend);
        registry->register_tool(
            grok_mcp::GrokSearchTool::get_info(),
            [search_tool](const nlohmann::json& args) {
                return search_tool->execute(args);
            }
        );

        grok_mcp::MCPServer server(registry, server_info);

        std::unique_ptr<grok_mcp::HttpTransport> http;
        if (!use_stdio) {
            grok_mcp::HttpTransport::Options http_opts;
            http_opts.host = host;
            http_opts.port = port;
            http = std::make_unique<grok_mcp::HttpTransport>(server, http_opts);
        }

        // Declared after everything it touches, so it is joined first
        grok_mcp::ShutdownWatcher watcher([&] {
            backend->cancel_all();
            if (http) {
                http->stop();
            }
            server.stop();
        });

        if (use_stdio) {
            spdlog::info("Serving MCP over stdio");
            grok_mcp::StdioTransport transport;
            server.run(transport);
        } else if (!grok_mcp::ShutdownWatcher::requested()) {
            http->listen();
        }

        backend->cancel_all();
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
