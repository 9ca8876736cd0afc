/**
 * \file worker/WorkerOptions.cpp
 * \brief Worker configuration validation and CLI/config option helpers.
 */

#include "WorkerOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace CortexWorker {

void WorkerConfiguration::validate() const {
    if (capability.empty()) throw std::invalid_argument("configuration: capability name is empty");
    if (service.empty()) throw std::invalid_argument("configuration: service name is empty");
    if (source_address.empty()) throw std::invalid_argument("configuration: source (dispatcher) address is empty");
    if (sink_address.empty()) throw std::invalid_argument("configuration: sink address is empty");
    if (message_size == 0 || message_size > kMaxMessageSize) {
        throw std::invalid_argument("configuration: message size must be between 1 and " +
                                    std::to_string(kMaxMessageSize) + " bytes");
    }
    if (pool_size == 0 || pool_size > kMaxPoolSize) {
        throw std::invalid_argument("configuration: pool size must be between 1 and " + std::to_string(kMaxPoolSize));
    }
    if (limit && *limit == 0) throw std::invalid_argument("configuration: iteration limit must be positive when set");
    if (cooldown.count() < 0 || cooldown > kMaxCooldown) {
        throw std::invalid_argument("configuration: cooldown must be between 0 and 86400 seconds");
    }
    if (grace.count() < 0 || grace > kMaxCooldown) {
        throw std::invalid_argument("configuration: grace interval must be between 0 and 86400 seconds");
    }
    if (!staging_dir.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(staging_dir, ec)) {
            throw std::invalid_argument("configuration: staging directory '" + staging_dir.string() + "' does not exist");
        }
    }
}

std::filesystem::path WorkerConfiguration::staging_directory() const {
    return staging_dir.empty() ? std::filesystem::temp_directory_path() : staging_dir;
}

std::string WorkerConfiguration::capability_param(const std::string& key, const std::string& fallback) const {
    auto it = capability_params.find(key);
    return it == capability_params.end() ? fallback : it->second;
}

std::string make_tcp_endpoint(const std::string& host, int port) {
    return "tcp://" + host + ":" + std::to_string(port);
}

namespace worker_opts {

/// Cached option values from CLI or config.
static std::string g_capability{"echo"};
static std::string g_service;
static std::string g_dispatcher_host{"127.0.0.1"};
static int g_source_port{51695};
static int g_sink_port{51696};
static std::string g_source_address;
static std::string g_sink_address;
static std::size_t g_message_size{100000};
static std::size_t g_pool_size{1};
static std::size_t g_limit{0};
static double g_cooldown_seconds{60.0};
static std::string g_staging_dir;
static std::string g_log_level{"info"};
static std::string g_image{"arxivvanity/engrafo:2.0.0"};
static std::string g_memory{"4g"};
static int g_latexml_timeout{300};

static std::atomic<bool> g_registered{false};

std::optional<LogLevel> get_log_level() { return parse_log_level(g_log_level); }

WorkerConfiguration build_configuration() {
    WorkerConfiguration config;
    config.capability = g_capability;
    config.service = g_service;
    config.source_address = g_source_address.empty() ? make_tcp_endpoint(g_dispatcher_host, g_source_port)
                                                     : g_source_address;
    config.sink_address = g_sink_address.empty() ? make_tcp_endpoint(g_dispatcher_host, g_sink_port)
                                                 : g_sink_address;
    config.message_size = g_message_size;
    config.pool_size = g_pool_size;
    if (config.pool_size == 0) {
        config.pool_size = std::max(1u, std::thread::hardware_concurrency());
    }
    if (g_limit > 0) config.limit = g_limit;
    const double max_cooldown_seconds = WorkerConfiguration::kMaxCooldown.count() / 1000.0;
    // Also rejects NaN, which fails every comparison.
    if (!(g_cooldown_seconds >= 0.0 && g_cooldown_seconds <= max_cooldown_seconds)) {
        throw std::invalid_argument("--cooldown must be between 0 and " +
                                    std::to_string(static_cast<long long>(max_cooldown_seconds)) + " seconds");
    }
    config.cooldown = std::chrono::milliseconds(static_cast<long long>(g_cooldown_seconds * 1000.0));
    config.staging_dir = g_staging_dir;
    if (!parse_log_level(g_log_level)) throw std::invalid_argument("unknown log level '" + g_log_level + "'");
    config.capability_params["image"] = g_image;
    config.capability_params["memory"] = g_memory;
    config.capability_params["latexml_timeout"] = std::to_string(g_latexml_timeout);
    return config;
}

void register_options() {
    bool expected = false;
    if (!g_registered.compare_exchange_strong(expected, true)) return;

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        using shared_opts::Options;
        g_capability = Options::config_value<std::string>(j, "worker", "capability").value_or(g_capability);
        g_service = Options::config_value<std::string>(j, "worker", "service").value_or(g_service);
        g_dispatcher_host = Options::config_value<std::string>(j, "worker", "dispatcher_host").value_or(g_dispatcher_host);
        g_source_port = Options::config_value<int>(j, "worker", "source_port").value_or(g_source_port);
        g_sink_port = Options::config_value<int>(j, "worker", "sink_port").value_or(g_sink_port);
        g_source_address = Options::config_value<std::string>(j, "worker", "source").value_or(g_source_address);
        g_sink_address = Options::config_value<std::string>(j, "worker", "sink").value_or(g_sink_address);
        g_message_size = Options::config_value<std::size_t>(j, "worker", "message_size").value_or(g_message_size);
        g_pool_size = Options::config_value<std::size_t>(j, "worker", "pool_size").value_or(g_pool_size);
        g_limit = Options::config_value<std::size_t>(j, "worker", "limit").value_or(g_limit);
        g_cooldown_seconds = Options::config_value<double>(j, "worker", "cooldown_seconds").value_or(g_cooldown_seconds);
        g_staging_dir = Options::config_value<std::string>(j, "worker", "staging_dir").value_or(g_staging_dir);
        g_log_level = Options::config_value<std::string>(j, "worker", "log_level").value_or(g_log_level);
        g_image = Options::config_value<std::string>(j, "engrafo", "image").value_or(g_image);
        g_memory = Options::config_value<std::string>(j, "engrafo", "memory").value_or(g_memory);
        g_latexml_timeout = Options::config_value<int>(j, "tex_to_html", "timeout").value_or(g_latexml_timeout);

        app.add_option("--capability", g_capability, "Conversion capability: echo|tex_to_html|engrafo")
            ->group("Worker");
        app.add_option("--service", g_service, "Service name registered with the dispatcher (default: capability's)")
            ->group("Worker");
        app.add_option("--message-size", g_message_size, "Bytes per output frame")
            ->check(CLI::PositiveNumber)
            ->group("Worker");
        app.add_option("--pool-size", g_pool_size, "Worker threads (0: one per CPU)")
            ->group("Worker");
        app.add_option("--limit", g_limit, "Tasks per thread before exiting (0: run forever)")
            ->group("Worker");
        app.add_option("--cooldown", g_cooldown_seconds, "Seconds to wait after an empty or failed task")
            ->group("Worker");
        app.add_option("--staging-dir", g_staging_dir, "Directory for staged task inputs (default: temp dir)")
            ->group("Worker");
        app.add_option("--log-level", g_log_level, "debug|info|warning|error|critical")
            ->group("Worker");

        app.add_option("--dispatcher-host", g_dispatcher_host, "CorTeX dispatcher host")
            ->group("Endpoints");
        app.add_option("--source-port", g_source_port, "Dispatcher (task source) port")
            ->group("Endpoints");
        app.add_option("--sink-port", g_sink_port, "Sink port")
            ->group("Endpoints");
        app.add_option("--source", g_source_address, "Full dispatcher endpoint, overrides host/port")
            ->group("Endpoints");
        app.add_option("--sink", g_sink_address, "Full sink endpoint, overrides host/port")
            ->group("Endpoints");

        app.add_option("--image", g_image, "Docker image for the engrafo capability")
            ->group("Capabilities");
        app.add_option("--memory", g_memory, "Docker memory limit for the engrafo capability")
            ->group("Capabilities");
        app.add_option("--latexml-timeout", g_latexml_timeout, "latexmlc --timeout for the tex_to_html capability")
            ->group("Capabilities");
    });
}

} // namespace worker_opts
} // namespace CortexWorker

namespace {
    struct WorkerOptsAutoReg {
        WorkerOptsAutoReg() { CortexWorker::worker_opts::register_options(); }
    } worker_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
