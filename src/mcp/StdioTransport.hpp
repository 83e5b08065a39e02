#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace grok_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads newline-delimited JSON messages from stdin and writes one response
 * per line to stdout with flush. Logs must go to stderr in this mode.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_message() override;
    void write_message(const std::string& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace grok_mcp
