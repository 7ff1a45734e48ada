#include "TextToSpeechTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dg_mcp {

TextToSpeechTool::TextToSpeechTool(std::shared_ptr<ISpeechSynthesizer> synthesizer,
                                   std::shared_ptr<IAudioSink> sink)
    : synthesizer_(std::move(synthesizer)), sink_(std::move(sink)) {
    if (!synthesizer_) {
        throw std::invalid_argument("Speech synthesizer cannot be null");
    }
    if (!sink_) {
        throw std::invalid_argument("Audio sink cannot be null");
    }
}

ToolInfo TextToSpeechTool::get_info() {
    return {
        NAME,
        "Generate an audio file from text using Deepgram's text-to-speech API. "
        "The audio will be saved as an MP3 file.",
        {
            {"type", "object"},
            {"properties", {
                {"text", {
                    {"type", "string"},
                    {"description", "The text to convert to speech"}
                }},
                {"filename", {
                    {"type", "string"},
                    {"description", "The filename for the output audio file (optional, defaults to 'output.mp3')"}
                }}
            }},
            {"required", json::array({"text"})}
        }
    };
}

Result<json> TextToSpeechTool::execute(const ToolArguments& args) {
    auto text = args.require_string("text");
    if (auto* err = std::get_if<ToolError>(&text)) {
        return *err;
    }

    std::string filename_value = args.optional_string("filename", DEFAULT_FILENAME);
    const std::string& text_value = std::get<std::string>(text);

    auto audio = synthesizer_->synthesize(text_value);
    if (auto* err = std::get_if<ToolError>(&audio)) {
        spdlog::error("TextToSpeechTool: synthesis failed: {}", err->message);
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED, err->message};
    }

    if (auto err = sink_->write(filename_value, std::get<std::string>(audio))) {
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED, err->message};
    }

    return json{
        {"content", json::array({
            {
                {"type", "text"},
                {"text", "Successfully generated audio file '" + filename_value
                    + "' from text: \"" + text_value + "\""}
            }
        })}
    };
}

} // namespace dg_mcp
