/**
 * @file capabilities/builtins/EchoCapability.cpp
 * @brief Echo capability with auto-registration.
 */
#include "EchoCapability.hpp"
#include "capabilities/registry/CapabilityRegistration.hpp"
#include "worker/WorkerOptions.hpp"
#include "logger.hpp"

#include <fstream>

namespace CortexWorker::Capabilities {

ConversionResult EchoCapability::convert(const std::filesystem::path& input) const {
    std::ifstream probe(input, std::ios::binary);
    if (!probe) {
        return ConversionResult::failure("echo: cannot open input " + input.string());
    }
    // The staged input is owned by the task engine; hand it back as borrowed.
    return ConversionResult::success(input, ConversionResult::Ownership::Borrowed);
}

namespace {

REGISTER_CAPABILITY(
    "echo",
    "Returns the input archive unchanged",
    "echo_service",
    [](const WorkerConfiguration&, std::shared_ptr<Logger> logger) -> std::unique_ptr<IConversionCapability> {
        return std::make_unique<EchoCapability>(std::move(logger));
    }
);

} // namespace
} // namespace CortexWorker::Capabilities
