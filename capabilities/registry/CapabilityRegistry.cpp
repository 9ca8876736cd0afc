/**
 * @file capabilities/registry/CapabilityRegistry.cpp
 * @brief Implementation of the CapabilityRegistry.
 */
#include "CapabilityRegistry.hpp"
#include "logger.hpp"

namespace CortexWorker::Capabilities {

CapabilityRegistry& CapabilityRegistry::instance() {
    static CapabilityRegistry instance;
    return instance;
}

CapabilityRegistry::CapabilityRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

void CapabilityRegistry::register_capability(CapabilityDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto name = descriptor.name;
    capabilities_.insert_or_assign(std::move(name), std::move(descriptor));
}

bool CapabilityRegistry::has_capability(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_.find(name) != capabilities_.end();
}

std::optional<std::string> CapabilityRegistry::default_service(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = capabilities_.find(name);
    if (it == capabilities_.end()) return std::nullopt;
    return it->second.default_service;
}

std::vector<std::string> CapabilityRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(capabilities_.size());
    for (const auto& [name, desc] : capabilities_) {
        result.push_back(name);
    }
    return result;
}

size_t CapabilityRegistry::capability_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_.size();
}

std::unique_ptr<IConversionCapability> CapabilityRegistry::create(const std::string& name,
                                                                  const WorkerConfiguration& config,
                                                                  std::shared_ptr<Logger> logger) const {
    CapabilityFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = capabilities_.find(name);
        if (it == capabilities_.end() || !it->second.factory) {
            if (logger_) logger_->debug("[CapabilityRegistry] unknown capability '" + name + "'");
            return nullptr;
        }
        factory = it->second.factory;
    }
    return factory(config, std::move(logger));
}

void CapabilityRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_.clear();
}

void CapabilityRegistry::set_logger(std::shared_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(logger);
}

} // namespace CortexWorker::Capabilities
