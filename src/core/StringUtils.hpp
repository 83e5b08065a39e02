#pragma once

#include <string>
#include <string_view>

namespace grok_mcp {

/**
 * @brief Strip leading and trailing whitespace (space, tab, CR, LF)
 */
std::string trim(std::string_view text);

/**
 * @brief Replace every occurrence of secret in text with "***"
 *
 * An empty secret leaves text unchanged.
 */
std::string redact(std::string text, std::string_view secret);

} // namespace grok_mcp
