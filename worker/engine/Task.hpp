/**
 * \file worker/engine/Task.hpp
 * \brief One unit of work in flight on a worker thread, and its lifecycle states.
 */
#pragma once

#include "StagingFile.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace CortexWorker {

/** \brief How a task lifecycle ended. */
enum class TaskOutcome {
    Delivered,         ///< Output streamed to the sink.
    EmptyInput,        ///< Dispatcher had no work; empty marker sent.
    ConversionFailed,  ///< Capability failed; empty marker sent.
    Aborted            ///< Transport failed mid-task; state discarded.
};

/** \brief Where a worker thread is in the task lifecycle. */
enum class TaskState {
    AwaitingTask,
    ReceivingInput,
    EmptyInput,
    Converting,
    DeliveringOutput,
    ReportingEmpty,
    CoolingDown,
    Stopped
};

inline const char* to_string(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::Delivered:        return "delivered";
        case TaskOutcome::EmptyInput:       return "empty-input";
        case TaskOutcome::ConversionFailed: return "conversion-failed";
        case TaskOutcome::Aborted:          return "aborted";
    }
    return "unknown";
}

inline const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::AwaitingTask:     return "awaiting-task";
        case TaskState::ReceivingInput:   return "receiving-input";
        case TaskState::EmptyInput:       return "empty-input";
        case TaskState::Converting:       return "converting";
        case TaskState::DeliveringOutput: return "delivering-output";
        case TaskState::ReportingEmpty:   return "reporting-empty";
        case TaskState::CoolingDown:      return "cooling-down";
        case TaskState::Stopped:          return "stopped";
    }
    return "unknown";
}

/**
 * \brief A task from the moment its id arrives until its outcome is reported.
 *
 * Move-only; destroying it deletes the staged input.
 */
struct Task {
    std::string task_id;                ///< Opaque id assigned by the dispatcher.
    std::uint64_t input_size{0};        ///< Bytes received after the id frame.
    std::unique_ptr<StagingFile> input; ///< Staged input bytes.

    bool has_input() const noexcept { return input_size > 0; }
};

} // namespace CortexWorker
