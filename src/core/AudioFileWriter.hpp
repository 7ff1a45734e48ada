#pragma once

#include "IAudioSink.hpp"

namespace dg_mcp {

/**
 * @brief Writes audio to the local filesystem
 *
 * Relative filenames resolve against the process working directory.
 * Existing files are overwritten.
 */
class AudioFileWriter : public IAudioSink {
public:
    std::optional<ToolError> write(const std::string& filename, const std::string& audio) override;
};

} // namespace dg_mcp
