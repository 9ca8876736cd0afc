/**
 * \file worker/pool/WorkerPool.hpp
 * \brief Runs N independent task engines, one per thread, for one worker type.
 */
#pragma once

#include "worker/WorkerOptions.hpp"
#include "worker/engine/TaskEngine.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class Logger;

namespace CortexWorker {

namespace Capabilities { class IConversionCapability; }
class TransportSession;

/** \brief A pool thread that terminated with an error. */
struct WorkerFailure {
    std::string identity;
    std::string message;
};

/** \brief What a finished pool run looked like. */
struct PoolReport {
    std::vector<std::string> identities;   ///< One per thread, in ordinal order.
    std::vector<WorkerFailure> failures;   ///< Threads that ended with an error.
    EngineStats totals;                    ///< Summed over every thread.

    bool ok() const { return failures.empty(); }
};

/**
 * \brief Thread pool of identical workers sharing one configuration and capability.
 *
 * Each thread owns its own TransportSession and TaskEngine; nothing but the
 * read-only configuration and the capability is shared. A thread that fails is
 * recorded in the report and does not stop the others.
 */
class WorkerPool {
public:
    using SessionFactory = std::function<std::unique_ptr<TransportSession>(const std::string& identity)>;
    /// Starts one pool thread; throws std::system_error when no thread can be created.
    using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

    WorkerPool(WorkerConfiguration config,
               std::shared_ptr<const Capabilities::IConversionCapability> capability,
               std::string host_name,
               std::shared_ptr<Logger> logger);

    /** \brief Replace how sessions are opened (defaults to TransportSession::open). */
    void set_session_factory(SessionFactory factory);
    /** \brief Replace the sleep used for cooldown and grace periods. */
    void set_sleep_function(SleepFunction sleep);
    /** \brief Replace how pool threads are started (defaults to constructing a std::thread). */
    void set_thread_spawner(ThreadSpawner spawn);

    /** \brief "<host>:<service>:<ordinal>", ordinal zero-padded to two digits. */
    static std::string make_identity(const std::string& host, const std::string& service, std::size_t ordinal);

    /**
     * \brief Start every thread and wait for all of them to finish.
     *
     * With a pool size of 1 the engine runs on the calling thread. Without an
     * iteration limit this only returns once every thread has failed.
     */
    PoolReport run();

    const WorkerConfiguration& configuration() const noexcept { return config_; }

    /** \brief Human-readable byte count (B, KB, MB, ...). */
    static std::string format_bytes(std::uint64_t bytes);

private:
    struct ThreadResult {
        bool failed{false};
        std::string message;
        EngineStats stats;
    };

    void run_worker(const std::string& identity, ThreadResult& result) const;

    WorkerConfiguration config_;
    std::shared_ptr<const Capabilities::IConversionCapability> capability_;
    std::string host_name_;
    std::shared_ptr<Logger> logger_;
    SessionFactory session_factory_;
    SleepFunction sleep_;
    ThreadSpawner spawn_;
};

} // namespace CortexWorker
