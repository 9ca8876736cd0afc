/**
 * \file worker/WorkerOptions.hpp
 * \brief Worker configuration and accessors for the worker's CLI and config options.
 */
#pragma once

#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace CortexWorker {

/**
 * \brief Immutable settings of one worker type, shared read-only by every pool thread.
 *
 * Built once at startup and never modified afterwards; pass it by const reference.
 */
struct WorkerConfiguration {
    static constexpr std::size_t kMaxMessageSize = 64 * 1024 * 1024;
    static constexpr std::size_t kMaxPoolSize = 1024;
    static constexpr std::chrono::milliseconds kMaxCooldown{std::chrono::hours(24)};

    std::string capability{"echo"};                       ///< Registered capability name.
    std::string service{"echo_service"};                  ///< Service name as registered with the dispatcher.
    std::string source_address{"tcp://127.0.0.1:51695"}; ///< Dispatcher (request channel) endpoint.
    std::string sink_address{"tcp://127.0.0.1:51696"};   ///< Sink (delivery channel) endpoint.
    std::size_t message_size{100000};                     ///< Bytes per output frame.
    std::size_t pool_size{1};                             ///< Number of worker threads.
    std::optional<std::size_t> limit;                     ///< Task lifecycles per thread; unset runs forever.
    std::chrono::milliseconds cooldown{std::chrono::seconds(60)}; ///< Sleep after an empty or failed task.
    std::chrono::milliseconds grace{std::chrono::seconds(1)};     ///< Sleep before exiting at the limit.
    int linger_ms{5000};                                  ///< Channel linger on close.
    std::filesystem::path staging_dir;                    ///< Where inputs are staged; empty means the temp directory.
    std::map<std::string, std::string> capability_params; ///< Capability-specific settings (image, memory, ...).

    /** \brief Reject unusable settings. \throws std::invalid_argument naming the offending setting. */
    void validate() const;

    /** \brief Staging directory to use, resolving the empty default to the system temp directory. */
    std::filesystem::path staging_directory() const;

    /** \brief Capability parameter `key`, or `fallback` when unset. */
    std::string capability_param(const std::string& key, const std::string& fallback) const;
};

/** \brief "tcp://host:port" endpoint string. */
std::string make_tcp_endpoint(const std::string& host, int port);

/** \brief Helper API for accessing worker-specific CLI and config options. */
namespace worker_opts {
    /** \brief Register the worker option provider with shared_opts::Options (idempotent). */
    void register_options();
    /** \brief Log level chosen with --log-level, if it parsed. */
    std::optional<LogLevel> get_log_level();
    /**
     * \brief Assemble the configuration from parsed options.
     * \details `service` is left empty when neither CLI nor config named one,
     * so the caller can fill in the capability's default service.
     * \throws std::invalid_argument for malformed values (e.g. unknown log level).
     */
    WorkerConfiguration build_configuration();
}

} // namespace CortexWorker
