/**
 * @file capabilities/registry/CapabilityRegistration.hpp
 * @brief Self-registration helper for capabilities.
 */
#pragma once

#include "CapabilityRegistry.hpp"
#include "CapabilityDescriptor.hpp"

namespace CortexWorker::Capabilities {

/**
 * @brief Registers a capability with the global registry from a static instance.
 */
class CapabilityRegistration {
public:
    explicit CapabilityRegistration(CapabilityDescriptor descriptor) {
        CapabilityRegistry::instance().register_capability(std::move(descriptor));
    }
};

} // namespace CortexWorker::Capabilities

/**
 * @def REGISTER_CAPABILITY
 * @brief Register a capability from its implementation file.
 *
 * Usage:
 * @code
 * REGISTER_CAPABILITY(
 *     "echo",
 *     "Returns the input unchanged",
 *     "echo_service",
 *     [](const WorkerConfiguration&, std::shared_ptr<Logger> logger) {
 *         return std::make_unique<EchoCapability>(std::move(logger));
 *     }
 * );
 * @endcode
 */
#define CAPABILITY_REG_CONCAT_IMPL(a, b) a##b
#define CAPABILITY_REG_CONCAT(a, b) CAPABILITY_REG_CONCAT_IMPL(a, b)

#define REGISTER_CAPABILITY(name, description, default_service, factory) \
    static ::CortexWorker::Capabilities::CapabilityRegistration \
        CAPABILITY_REG_CONCAT(_capability_registration_, __COUNTER__)( \
            ::CortexWorker::Capabilities::CapabilityDescriptor::create( \
                name, description, default_service, factory \
            ) \
        )
