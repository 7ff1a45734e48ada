#pragma once

#include "ToolError.hpp"
#include <string>

namespace dg_mcp {

/**
 * @brief Abstract interface for text-to-speech backends
 *
 * Implementations turn text into an encoded audio payload. Failures are
 * returned as TOOL_EXECUTION_FAILED errors carrying the backend diagnostic.
 */
class ISpeechSynthesizer {
public:
    virtual ~ISpeechSynthesizer() = default;

    /**
     * @brief Synthesize speech for the given text
     * @param text Text to speak
     * @return Raw audio bytes or an error
     */
    virtual Result<std::string> synthesize(const std::string& text) = 0;
};

} // namespace dg_mcp
