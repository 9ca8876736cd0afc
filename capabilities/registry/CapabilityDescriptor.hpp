/**
 * @file capabilities/registry/CapabilityDescriptor.hpp
 * @brief Complete capability definition: metadata + factory.
 */
#pragma once

#include "capabilities/IConversionCapability.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

class Logger;

namespace CortexWorker {
struct WorkerConfiguration;
}

namespace CortexWorker::Capabilities {

/**
 * @brief Builds a capability instance from the worker configuration.
 *
 * Capabilities read their own parameters (image, memory, ...) from
 * WorkerConfiguration::capability_params.
 */
using CapabilityFactory = std::function<std::unique_ptr<IConversionCapability>(
    const WorkerConfiguration& config, std::shared_ptr<Logger> logger)>;

/**
 * @brief Capability metadata and the factory that instantiates it.
 */
struct CapabilityDescriptor {
    std::string name;             ///< Selection key (e.g. "echo")
    std::string description;      ///< Brief description of the conversion
    std::string default_service;  ///< Service name used when none is configured
    CapabilityFactory factory;    ///< Creates one shared instance per process

    static CapabilityDescriptor create(std::string name,
                                       std::string description,
                                       std::string default_service,
                                       CapabilityFactory factory) {
        CapabilityDescriptor desc;
        desc.name = std::move(name);
        desc.description = std::move(description);
        desc.default_service = std::move(default_service);
        desc.factory = std::move(factory);
        return desc;
    }
};

} // namespace CortexWorker::Capabilities
