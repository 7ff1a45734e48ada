#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace dg_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads newline-delimited messages from stdin and writes them to stdout,
 * flushing after every line. A trailing "\r" is stripped from input lines.
 * Once a shutdown signal has been received, reads (including one that the
 * signal interrupted) report end-of-stream.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    ReadResult read_line() override;
    bool write_line(const std::string& line) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace dg_mcp
