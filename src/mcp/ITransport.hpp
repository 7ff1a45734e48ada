#pragma once

#include <string>

namespace dg_mcp {

/**
 * @brief Outcome of reading one line from a transport
 */
enum class ReadStatus {
    LINE,           // A line was read (possibly blank)
    END_OF_STREAM,  // Input is exhausted
    ERROR           // The underlying stream failed
};

struct ReadResult {
    ReadStatus status;
    std::string line;  // Line without terminator when status == LINE
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations frame the byte stream into lines. Interpreting the lines
 * as JSON-RPC is left to the caller.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next line from the transport
     * @return Line, end-of-stream or error indication
     */
    virtual ReadResult read_line() = 0;

    /**
     * @brief Write one line followed by a terminator and flush
     * @param line Serialized message without newline
     * @return false if the write failed
     */
    virtual bool write_line(const std::string& line) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace dg_mcp
