#include "StdioTransport.hpp"
#include "core/StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace grok_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        // Blank lines between messages are skipped
        if (!trim(line).empty()) {
            spdlog::debug("Read message of {} bytes", line.size());
            return line;
        }
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return std::nullopt;
}

void StdioTransport::write_message(const std::string& message) {
    out_ << message << std::endl;  // std::endl flushes automatically
    spdlog::debug("Wrote message of {} bytes", message.size());
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace grok_mcp
