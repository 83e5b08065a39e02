#include "StringUtils.hpp"

namespace grok_mcp {

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::string redact(std::string text, std::string_view secret) {
    if (secret.empty()) {
        return text;
    }

    static constexpr std::string_view kMask = "***";
    size_t pos = 0;
    while ((pos = text.find(secret, pos)) != std::string::npos) {
        text.replace(pos, secret.size(), kMask);
        pos += kMask.size();
    }
    return text;
}

} // namespace grok_mcp
