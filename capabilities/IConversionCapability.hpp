/**
 * @file capabilities/IConversionCapability.hpp
 * @brief Interface for the pluggable conversion step of a worker.
 */
#pragma once

#include "ConversionResult.hpp"

#include <filesystem>

namespace CortexWorker::Capabilities {

/**
 * @brief A conversion a worker type performs on each task's input.
 *
 * One instance is shared by every thread of a pool, so convert() must be
 * safe to call concurrently. It may block for as long as the conversion
 * takes; any time limit is the implementation's own business.
 */
class IConversionCapability {
public:
    virtual ~IConversionCapability() = default;

    /**
     * @brief Human-readable capability name for logging.
     */
    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /**
     * @brief Convert the staged input file into a single output artifact.
     *
     * @param input Path of the staged input (a zip archive for CorTeX services).
     * @return The output artifact, or a failure carrying the diagnostic.
     */
    [[nodiscard]] virtual ConversionResult convert(const std::filesystem::path& input) const = 0;
};

} // namespace CortexWorker::Capabilities
