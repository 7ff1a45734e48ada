#pragma once

#include "ToolError.hpp"
#include <optional>
#include <string>

namespace dg_mcp {

/**
 * @brief Destination for generated audio
 */
class IAudioSink {
public:
    virtual ~IAudioSink() = default;

    /**
     * @brief Store audio bytes under the given name
     * @param filename Target path as supplied by the caller
     * @param audio Raw audio bytes
     * @return std::nullopt on success, otherwise the failure
     */
    virtual std::optional<ToolError> write(const std::string& filename, const std::string& audio) = 0;
};

} // namespace dg_mcp
