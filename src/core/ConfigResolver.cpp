#include "ConfigResolver.hpp"
#include "core/StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace grok_mcp {

namespace {

// File keys, with the snake_case spelling older config files used.
struct FileKey {
    const char* name;
    const char* alias;
};

constexpr FileKey kStringKeys[] = {
    {"baseUrl", "base_url"},
    {"apiKey", "api_key"},
    {"model", "model"},
    {"systemPrompt", "system_prompt"},
};

constexpr FileKey kTimeoutKey{"timeoutSeconds", "timeout_seconds"};
constexpr FileKey kObjectKeys[] = {
    {"extraBody", "extra_body"},
    {"extraHeaders", "extra_headers"},
};

const json* find_key(const json& layer, const FileKey& key) {
    auto it = layer.find(key.name);
    if (it == layer.end()) {
        it = layer.find(key.alias);
    }
    if (it == layer.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

void merge_object(json& merged, const char* key, const json& override_value) {
    json& target = merged[key];
    if (!target.is_object()) {
        target = json::object();
    }
    for (const auto& [name, value] : override_value.items()) {
        target[name] = value;
    }
}

std::string read_string(const json& merged, const char* key) {
    auto it = merged.find(key);
    if (it == merged.end() || !it->is_string()) {
        return {};
    }
    return trim(it->get<std::string>());
}

} // namespace

ConfigResolver::ConfigResolver(std::filesystem::path config_path,
                               Environment environment,
                               ConfigOverrides overrides)
    : config_path_(std::move(config_path))
    , environment_(std::move(environment))
    , overrides_(std::move(overrides)) {
    spdlog::debug("ConfigResolver using {} (local: {})",
                  config_path_.string(), local_config_path().string());
}

const std::vector<std::string>& ConfigResolver::environment_names() {
    static const std::vector<std::string> names = {
        "GROK_BASE_URL",
        "GROK_API_KEY",
        "GROK_MODEL",
        "GROK_TIMEOUT_SECONDS",
        "GROK_SYSTEM_PROMPT",
        "GROK_EXTRA_BODY_JSON",
        "GROK_EXTRA_HEADERS_JSON",
    };
    return names;
}

Environment ConfigResolver::capture_environment() {
    Environment env;
    for (const auto& name : environment_names()) {
        if (const char* value = std::getenv(name.c_str())) {
            env[name] = value;
        }
    }
    return env;
}

std::filesystem::path ConfigResolver::local_config_path() const {
    return config_path_.parent_path() / "config.local.json";
}

json ConfigResolver::load_json_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("Config file {} not present, skipping", path.string());
        return json::object();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json data;
    try {
        data = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed JSON in " + path.string() + ": " + e.what());
    }

    if (!data.is_object()) {
        throw ConfigError("Config file " + path.string() + " must contain a JSON object");
    }
    return data;
}

json ConfigResolver::parse_json_mapping(const std::string& raw, const std::string& source) {
    json data;
    try {
        data = json::parse(raw);
    } catch (const json::parse_error& e) {
        throw ConfigError(source + " is not valid JSON: " + e.what());
    }
    if (!data.is_object()) {
        throw ConfigError(source + " must be a JSON object");
    }
    return data;
}

int ConfigResolver::parse_timeout(const json& value, const std::string& source) {
    const std::string invalid = "timeoutSeconds from " + source +
        " must be a positive integer, got: " + value.dump();

    if (value.is_number_integer()) {
        auto seconds = value.get<long long>();
        if (seconds <= 0 || seconds > std::numeric_limits<int>::max()) {
            throw ConfigError(invalid);
        }
        return static_cast<int>(seconds);
    }

    if (value.is_string()) {
        std::string text = trim(value.get<std::string>());
        if (text.empty() || text.size() > 9) {
            throw ConfigError(invalid);
        }
        for (char c : text) {
            if (c < '0' || c > '9') {
                throw ConfigError(invalid);
            }
        }
        int seconds = std::stoi(text);
        if (seconds <= 0) {
            throw ConfigError(invalid);
        }
        return seconds;
    }

    throw ConfigError(invalid);
}

void ConfigResolver::apply_file_layer(json& merged, const json& layer, const std::string& source) const {
    for (const auto& key : kStringKeys) {
        if (const json* value = find_key(layer, key)) {
            if (!value->is_string()) {
                throw ConfigError(std::string(key.name) + " in " + source + " must be a string");
            }
            merged[key.name] = *value;
        }
    }

    if (const json* value = find_key(layer, kTimeoutKey)) {
        merged[kTimeoutKey.name] = parse_timeout(*value, source);
    }

    for (const auto& key : kObjectKeys) {
        if (const json* value = find_key(layer, key)) {
            if (!value->is_object()) {
                throw ConfigError(std::string(key.name) + " in " + source + " must be a JSON object");
            }
            merge_object(merged, key.name, *value);
        }
    }
}

void ConfigResolver::apply_string(json& merged, const char* key, const std::string& value) const {
    if (!value.empty()) {
        merged[key] = value;
    }
}

EffectiveConfig ConfigResolver::resolve() const {
    json merged = json::object();

    // 1 + 2: config files
    apply_file_layer(merged, load_json_file(config_path_), config_path_.string());
    const auto local_path = local_config_path();
    apply_file_layer(merged, load_json_file(local_path), local_path.string());

    // 3: environment (empty values count as unset)
    auto env = [this](const char* name) -> std::string {
        auto it = environment_.find(name);
        return it == environment_.end() ? std::string() : it->second;
    };
    apply_string(merged, "baseUrl", env("GROK_BASE_URL"));
    apply_string(merged, "apiKey", env("GROK_API_KEY"));
    apply_string(merged, "model", env("GROK_MODEL"));
    apply_string(merged, "systemPrompt", env("GROK_SYSTEM_PROMPT"));
    if (auto timeout = env("GROK_TIMEOUT_SECONDS"); !timeout.empty()) {
        merged["timeoutSeconds"] = parse_timeout(timeout, "GROK_TIMEOUT_SECONDS");
    }
    if (auto body = env("GROK_EXTRA_BODY_JSON"); !body.empty()) {
        merge_object(merged, "extraBody", parse_json_mapping(body, "GROK_EXTRA_BODY_JSON"));
    }
    if (auto headers = env("GROK_EXTRA_HEADERS_JSON"); !headers.empty()) {
        merge_object(merged, "extraHeaders", parse_json_mapping(headers, "GROK_EXTRA_HEADERS_JSON"));
    }

    // 4: command line
    if (overrides_.base_url) apply_string(merged, "baseUrl", *overrides_.base_url);
    if (overrides_.api_key) apply_string(merged, "apiKey", *overrides_.api_key);
    if (overrides_.model) apply_string(merged, "model", *overrides_.model);
    if (overrides_.system_prompt) apply_string(merged, "systemPrompt", *overrides_.system_prompt);
    if (overrides_.timeout_seconds) {
        merged["timeoutSeconds"] = parse_timeout(*overrides_.timeout_seconds, "--timeout");
    }
    if (overrides_.extra_body_json) {
        merge_object(merged, "extraBody",
                     parse_json_mapping(*overrides_.extra_body_json, "--extra-body-json"));
    }
    if (overrides_.extra_headers_json) {
        merge_object(merged, "extraHeaders",
                     parse_json_mapping(*overrides_.extra_headers_json, "--extra-headers-json"));
    }

    EffectiveConfig config;
    config.base_url = read_string(merged, "baseUrl");
    config.api_key = read_string(merged, "apiKey");

    if (config.base_url.empty()) {
        throw ConfigError("Missing baseUrl: set it in config.json or GROK_BASE_URL");
    }
    if (config.api_key.empty()) {
        throw ConfigError("Missing apiKey: set it in config.local.json or GROK_API_KEY");
    }

    config.model = read_string(merged, "model");
    if (config.model.empty()) {
        config.model = kDefaultModel;
    }

    config.timeout_seconds = merged.value("timeoutSeconds", kDefaultTimeoutSeconds);

    if (auto prompt = read_string(merged, "systemPrompt"); !prompt.empty()) {
        config.system_prompt = std::move(prompt);
    }

    config.extra_body = merged.value("extraBody", json::object());
    config.extra_headers = merged.value("extraHeaders", json::object());

    spdlog::debug("Resolved config: baseUrl={}, model={}, timeout={}s",
                  config.base_url, config.model, config.timeout_seconds);
    return config;
}

} // namespace grok_mcp
