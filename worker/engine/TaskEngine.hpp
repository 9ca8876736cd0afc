/**
 * \file worker/engine/TaskEngine.hpp
 * \brief Per-thread task lifecycle: request, stage, convert, deliver, cool down.
 */
#pragma once

#include "Task.hpp"
#include "capabilities/ConversionResult.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

class Logger;

namespace CortexWorker {

struct WorkerConfiguration;
class TransportSession;

namespace Capabilities {
class IConversionCapability;
}

/** \brief Counters accumulated by one engine. */
struct EngineStats {
    std::uint64_t delivered{0};
    std::uint64_t empty{0};
    std::uint64_t failed{0};
    std::uint64_t aborted{0};
    std::uint64_t bytes_received{0};
    std::uint64_t bytes_sent{0};

    std::uint64_t lifecycles() const noexcept { return delivered + empty + failed + aborted; }
};

/** \brief Blocking sleep used for cooldown and the final grace period. */
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * \brief Runs the task lifecycle for one worker thread.
 *
 * Exactly one task is in flight at a time. Every task id received from the
 * dispatcher gets a report on the delivery channel: the streamed output on
 * success, or `[identity, service, task id, <empty>]` when the input was
 * empty or the conversion failed. Empty and failed tasks are followed by the
 * configured cooldown.
 *
 * A transport failure in the middle of a task aborts only that task: its
 * staged input is dropped, the failed channel is reconnected, and the loop
 * goes back to requesting work. If reconnecting fails, the error escapes
 * run() and ends the thread.
 */
class TaskEngine {
public:
    /**
     * \param config Shared, read-only worker configuration.
     * \param capability Conversion step; must outlive the engine.
     * \param session Channels of this thread; must outlive the engine.
     * \param logger Logger named after the worker identity.
     * \param sleep Sleep implementation; defaults to std::this_thread::sleep_for.
     */
    TaskEngine(const WorkerConfiguration& config,
               const Capabilities::IConversionCapability& capability,
               TransportSession& session,
               std::shared_ptr<Logger> logger,
               SleepFunction sleep = {});

    TaskEngine(const TaskEngine&) = delete;
    TaskEngine& operator=(const TaskEngine&) = delete;

    /**
     * \brief Run task lifecycles until `limit` of them have completed, or forever.
     * \return Number of lifecycles performed.
     * \throws std::system_error if a channel cannot be recovered after a failure.
     */
    std::size_t run(std::optional<std::size_t> limit);

    /** \brief Perform exactly one task lifecycle, including any cooldown. */
    TaskOutcome run_once();

    /**
     * \brief Ask for work and stage the reply.
     * \param assigned_id Set as soon as the task id frame arrives.
     * \throws std::system_error on transport or staging failure.
     */
    Task request_task(std::optional<std::string>& assigned_id);

    TaskState state() const noexcept { return state_.load(std::memory_order_relaxed); }
    EngineStats stats() const noexcept;
    const std::string& identity() const noexcept;

private:
    TaskOutcome process_task(std::optional<std::string>& assigned_id);
    Capabilities::ConversionResult convert(const Task& task);
    bool deliver_output(const Task& task, const std::filesystem::path& output);
    void deliver_empty(const std::string& task_id);
    void send_headers(const std::string& task_id);
    TaskOutcome abort_task(const std::optional<std::string>& assigned_id, const std::system_error& error);
    void report_aborted(const std::optional<std::string>& assigned_id);
    void cool_down();
    void set_state(TaskState state) noexcept;
    std::filesystem::path staging_path_for(const std::string& task_id) const;

    const WorkerConfiguration& config_;
    const Capabilities::IConversionCapability& capability_;
    TransportSession& session_;
    std::shared_ptr<Logger> logger_;
    SleepFunction sleep_;

    std::atomic<TaskState> state_{TaskState::AwaitingTask};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> empty_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> aborted_{0};
    std::atomic<std::uint64_t> bytes_received_{0};
    std::atomic<std::uint64_t> bytes_sent_{0};
};

} // namespace CortexWorker
