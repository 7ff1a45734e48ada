#pragma once

#include "core/IAudioSink.hpp"
#include "core/ISpeechSynthesizer.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace dg_mcp {

/**
 * @brief MCP tool that turns text into an audio file
 *
 * Sends the text to the speech synthesizer and stores the returned audio
 * under the requested filename (output.mp3 by default).
 */
class TextToSpeechTool {
public:
    static constexpr const char* NAME = "deepgram_text_to_speech";
    static constexpr const char* DEFAULT_FILENAME = "output.mp3";

    /**
     * @brief Construct tool with its collaborators
     * @param synthesizer Speech backend
     * @param sink Destination for the generated audio
     * @throws std::invalid_argument if either is null
     */
    TextToSpeechTool(std::shared_ptr<ISpeechSynthesizer> synthesizer,
                     std::shared_ptr<IAudioSink> sink);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args Arguments with required "text" and optional "filename"
     * @return MCP content result or error
     */
    Result<json> execute(const ToolArguments& args);

private:
    std::shared_ptr<ISpeechSynthesizer> synthesizer_;
    std::shared_ptr<IAudioSink> sink_;
};

} // namespace dg_mcp
