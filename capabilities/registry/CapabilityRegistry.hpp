/**
 * @file capabilities/registry/CapabilityRegistry.hpp
 * @brief Central registry of conversion capabilities, keyed by name.
 */
#pragma once

#include "CapabilityDescriptor.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Logger;

namespace CortexWorker::Capabilities {

/**
 * @brief Central registry of conversion capabilities.
 *
 * Capabilities self-register during static initialization with the
 * REGISTER_CAPABILITY macro (see CapabilityRegistration.hpp). The worker's
 * entrypoint looks the configured one up by name.
 *
 * Can be used as a singleton via instance() or instantiated directly for testing.
 */
class CapabilityRegistry {
public:
    explicit CapabilityRegistry(std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Get the global singleton instance.
     */
    static CapabilityRegistry& instance();

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /**
     * @brief Register a capability.
     * @note A capability with the same name is replaced.
     */
    void register_capability(CapabilityDescriptor descriptor);

    [[nodiscard]] bool has_capability(const std::string& name) const;

    /**
     * @brief Default service name of a capability, if registered.
     */
    [[nodiscard]] std::optional<std::string> default_service(const std::string& name) const;

    /**
     * @brief Registered capability names, sorted.
     */
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t capability_count() const;

    /**
     * @brief Instantiate a registered capability.
     * @return The capability, or nullptr if `name` is not registered.
     */
    [[nodiscard]] std::unique_ptr<IConversionCapability> create(const std::string& name,
                                                                const WorkerConfiguration& config,
                                                                std::shared_ptr<Logger> logger) const;

    /**
     * @brief Clear all registered capabilities (primarily for testing).
     */
    void clear();

    void set_logger(std::shared_ptr<Logger> logger);

private:
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::map<std::string, CapabilityDescriptor> capabilities_;
};

} // namespace CortexWorker::Capabilities
