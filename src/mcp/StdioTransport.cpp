#include "StdioTransport.hpp"
#include "ShutdownSignal.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace dg_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

ReadResult StdioTransport::read_line() {
    std::string line;

    if (ShutdownSignal::requested()) {
        return {ReadStatus::END_OF_STREAM, {}};
    }

    if (!std::getline(in_, line)) {
        if (ShutdownSignal::requested()) {
            in_.clear();
            spdlog::debug("Input read interrupted by shutdown signal");
            return {ReadStatus::END_OF_STREAM, {}};
        }
        if (in_.bad()) {
            spdlog::error("Error reading from input stream");
            return {ReadStatus::ERROR, {}};
        }
        spdlog::debug("Reached end of input stream");
        return {ReadStatus::END_OF_STREAM, {}};
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    spdlog::trace("Read line: {}", line);
    return {ReadStatus::LINE, std::move(line)};
}

bool StdioTransport::write_line(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        spdlog::error("Error writing to output stream");
        return false;
    }
    spdlog::trace("Wrote line: {}", line);
    return true;
}

bool StdioTransport::is_open() const {
    return !in_.bad() && out_.good();
}

} // namespace dg_mcp
