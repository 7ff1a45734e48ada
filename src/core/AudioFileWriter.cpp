#include "AudioFileWriter.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace dg_mcp {

std::optional<ToolError> AudioFileWriter::write(const std::string& filename, const std::string& audio) {
    if (filename.empty()) {
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED, "Output filename cannot be empty"};
    }

    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::string reason = std::strerror(errno);
        spdlog::error("Cannot open {} for writing: {}", filename, reason);
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED,
            "Failed to write audio file '" + filename + "': " + reason};
    }

    file.write(audio.data(), static_cast<std::streamsize>(audio.size()));
    file.close();
    if (!file) {
        spdlog::error("Write to {} failed", filename);
        return ToolError{ErrorKind::TOOL_EXECUTION_FAILED,
            "Failed to write audio file '" + filename + "'"};
    }

    spdlog::info("Wrote {} bytes of audio to {}", audio.size(), filename);
    return std::nullopt;
}

} // namespace dg_mcp
