#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace grok_mcp {

using json = nlohmann::json;

/**
 * @brief Raised when the effective configuration cannot be built
 *
 * Covers missing required fields, malformed config files and invalid
 * timeout values.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Final merged configuration for one search invocation
 */
struct EffectiveConfig {
    std::string base_url;
    std::string api_key;  // secret, never logged
    std::string model;
    int timeout_seconds = 0;
    std::optional<std::string> system_prompt;
    json extra_body = json::object();
    json extra_headers = json::object();
};

/**
 * @brief Explicit overrides supplied on the command line at startup
 *
 * Unset members leave lower-precedence values untouched.
 */
struct ConfigOverrides {
    std::optional<std::string> base_url;
    std::optional<std::string> api_key;
    std::optional<std::string> model;
    std::optional<std::string> timeout_seconds;
    std::optional<std::string> system_prompt;
    std::optional<std::string> extra_body_json;
    std::optional<std::string> extra_headers_json;
};

using Environment = std::map<std::string, std::string>;

/**
 * @brief Merges configuration from four layered sources
 *
 * Precedence (lowest to highest): config.json, config.local.json beside it,
 * GROK_* environment variables, command-line overrides. The environment and
 * the overrides are captured at construction; config files are re-read on
 * every resolve() so an operator can fix a file without a restart.
 */
class ConfigResolver {
public:
    static constexpr const char* kDefaultModel = "grok-2-latest";
    static constexpr int kDefaultTimeoutSeconds = 60;

    /**
     * @param config_path Path to config.json (need not exist)
     * @param environment Snapshot of relevant environment variables
     * @param overrides Command-line overrides
     */
    ConfigResolver(std::filesystem::path config_path,
                   Environment environment,
                   ConfigOverrides overrides = {});

    /**
     * @brief Snapshot the GROK_* variables of the current process
     */
    static Environment capture_environment();

    /**
     * @brief Names of the GROK_* variables this resolver reads
     */
    static const std::vector<std::string>& environment_names();

    /**
     * @brief Build the effective configuration
     * @throws ConfigError on missing required fields or invalid values
     */
    EffectiveConfig resolve() const;

    const std::filesystem::path& config_path() const { return config_path_; }
    std::filesystem::path local_config_path() const;

private:
    static json load_json_file(const std::filesystem::path& path);
    static json parse_json_mapping(const std::string& raw, const std::string& source);
    static int parse_timeout(const json& value, const std::string& source);

    void apply_file_layer(json& merged, const json& layer, const std::string& source) const;
    void apply_string(json& merged, const char* key, const std::string& value) const;

    std::filesystem::path config_path_;
    Environment environment_;
    ConfigOverrides overrides_;
};

} // namespace grok_mcp
