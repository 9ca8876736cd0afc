/**
 * \file worker/pool/WorkerPool.cpp
 * \brief Implementation of the worker thread pool.
 */
#include "WorkerPool.hpp"
#include "capabilities/IConversionCapability.hpp"
#include "worker/session/TransportSession.hpp"
#include "logger.hpp"
#include <processUtils.hpp>

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace CortexWorker {

WorkerPool::WorkerPool(WorkerConfiguration config,
                       std::shared_ptr<const Capabilities::IConversionCapability> capability,
                       std::string host_name,
                       std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , capability_(std::move(capability))
    , host_name_(std::move(host_name))
    , logger_(std::move(logger)) {
    if (!capability_) throw std::invalid_argument("WorkerPool: capability is null");
    spawn_ = [](std::function<void()> body) { return std::thread(std::move(body)); };
}

void WorkerPool::set_session_factory(SessionFactory factory) {
    if (!factory) throw std::invalid_argument("WorkerPool: session factory is empty");
    session_factory_ = std::move(factory);
}

void WorkerPool::set_sleep_function(SleepFunction sleep) {
    sleep_ = std::move(sleep);
}

void WorkerPool::set_thread_spawner(ThreadSpawner spawn) {
    if (!spawn) throw std::invalid_argument("WorkerPool: thread spawner is empty");
    spawn_ = std::move(spawn);
}

std::string WorkerPool::make_identity(const std::string& host, const std::string& service, std::size_t ordinal) {
    char number[24];
    std::snprintf(number, sizeof(number), "%02zu", ordinal);
    return host + ":" + service + ":" + number;
}

PoolReport WorkerPool::run() {
    PoolReport report;
    for (std::size_t i = 0; i < config_.pool_size; ++i) {
        report.identities.push_back(make_identity(host_name_, config_.service, i));
    }
    std::vector<ThreadResult> results(config_.pool_size);

    if (logger_) {
        logger_->info("starting " + std::to_string(config_.pool_size) + " worker(s) for service " + config_.service +
                      ": source=" + config_.source_address + " sink=" + config_.sink_address);
    }

    if (config_.pool_size == 1) {
        run_worker(report.identities.front(), results.front());
    } else {
        std::vector<std::thread> threads;
        threads.reserve(config_.pool_size);
        for (std::size_t i = 0; i < config_.pool_size; ++i) {
            try {
                threads.emplace_back(spawn_(
                    [this, &report, &results, i] { run_worker(report.identities[i], results[i]); }));
            } catch (const std::system_error& e) {
                // The slot never ran; the threads already started are still joined below.
                results[i].failed = true;
                results[i].message = std::string{"cannot start worker thread: "} + e.what();
                if (logger_) logger_->error(report.identities[i] + ": " + results[i].message);
            }
        }
        for (auto& t : threads) t.join();
    }

    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        report.totals.delivered += r.stats.delivered;
        report.totals.empty += r.stats.empty;
        report.totals.failed += r.stats.failed;
        report.totals.aborted += r.stats.aborted;
        report.totals.bytes_received += r.stats.bytes_received;
        report.totals.bytes_sent += r.stats.bytes_sent;
        if (r.failed) report.failures.push_back(WorkerFailure{report.identities[i], r.message});
    }

    if (logger_) {
        const auto& t = report.totals;
        logger_->info("pool finished: delivered=" + std::to_string(t.delivered) + " empty=" + std::to_string(t.empty) +
                      " failed=" + std::to_string(t.failed) + " aborted=" + std::to_string(t.aborted) +
                      " received=" + format_bytes(t.bytes_received) + " sent=" + format_bytes(t.bytes_sent));
    }
    return report;
}

void WorkerPool::run_worker(const std::string& identity, ThreadResult& result) const {
    auto logger = logger_ ? logger_->child(identity) : nullptr;
    if (config_.pool_size > 1) ProcessUtils::set_current_thread_name(identity);

    // Each thread reports into its own slot; nothing escapes the thread.
    std::unique_ptr<TransportSession> session;
    std::unique_ptr<TaskEngine> engine;
    try {
        session = session_factory_ ? session_factory_(identity) : TransportSession::open(config_, identity, logger);
        if (!session) throw std::runtime_error("no transport session for " + identity);
        engine = std::make_unique<TaskEngine>(config_, *capability_, *session, logger, sleep_);
        engine->run(config_.limit);
        result.stats = engine->stats();
        return;
    } catch (const std::exception& e) {
        result.message = e.what();
    } catch (...) {
        result.message = "unknown exception";
    }
    result.failed = true;
    if (engine) result.stats = engine->stats();
    if (logger) logger->error("worker thread terminated: " + result.message);
}

std::string WorkerPool::format_bytes(std::uint64_t bytes) {
    // Powers of 1024 so log output stays legible
    constexpr std::size_t unit_count = 5;
    static constexpr const char* units[unit_count] = {"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < unit_count) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    if (value >= 100.0 || unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(1);
    }
    oss << value << units[unit_index];
    return oss.str();
}

} // namespace CortexWorker
