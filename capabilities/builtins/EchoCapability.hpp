/**
 * @file capabilities/builtins/EchoCapability.hpp
 * @brief Identity conversion used to exercise the dispatcher round trip.
 */
#pragma once

#include "capabilities/IConversionCapability.hpp"

#include <memory>

class Logger;

namespace CortexWorker::Capabilities {

/**
 * @brief Returns the staged input itself as the output artifact.
 */
class EchoCapability : public IConversionCapability {
public:
    explicit EchoCapability(std::shared_ptr<Logger> logger = nullptr) : logger_(std::move(logger)) {}

    [[nodiscard]] const char* name() const noexcept override { return "echo"; }

    [[nodiscard]] ConversionResult convert(const std::filesystem::path& input) const override;

private:
    std::shared_ptr<Logger> logger_;
};

} // namespace CortexWorker::Capabilities
