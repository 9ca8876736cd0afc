/**
 * \file worker/engine/TaskEngine.cpp
 * \brief Task lifecycle implementation on top of a TransportSession.
 */
#include "TaskEngine.hpp"
#include "capabilities/IConversionCapability.hpp"
#include "worker/WorkerOptions.hpp"
#include "worker/session/TransportSession.hpp"
#include "logger.hpp"

#include <cctype>
#include <fstream>
#include <string_view>
#include <thread>
#include <vector>

namespace CortexWorker {

using Capabilities::ConversionResult;

namespace {

// Removes an output artifact the capability created, once the task is done with it.
class OutputCleanup {
public:
    OutputCleanup(const ConversionResult& result, Logger* logger)
        : logger_(logger) {
        if (result.owns_output()) path_ = result.output();
    }
    ~OutputCleanup() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec && logger_) logger_->warning("cannot remove output " + path_.string() + ": " + ec.message());
    }
    OutputCleanup(const OutputCleanup&) = delete;
    OutputCleanup& operator=(const OutputCleanup&) = delete;

private:
    std::filesystem::path path_;
    Logger* logger_;
};

std::string sanitize_for_filename(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        out.push_back((std::isalnum(uc) || c == '-' || c == '.') ? c : '_');
    }
    return out;
}

void default_sleep(std::chrono::milliseconds duration) {
    if (duration.count() > 0) std::this_thread::sleep_for(duration);
}

} // namespace

TaskEngine::TaskEngine(const WorkerConfiguration& config,
                       const Capabilities::IConversionCapability& capability,
                       TransportSession& session,
                       std::shared_ptr<Logger> logger,
                       SleepFunction sleep)
    : config_(config)
    , capability_(capability)
    , session_(session)
    , logger_(std::move(logger))
    , sleep_(sleep ? std::move(sleep) : SleepFunction(default_sleep)) {}

const std::string& TaskEngine::identity() const noexcept {
    return session_.identity();
}

std::size_t TaskEngine::run(std::optional<std::size_t> limit) {
    if (logger_) {
        logger_->info("task loop started: service=" + config_.service + " capability=" + capability_.name() +
                      (limit ? " limit=" + std::to_string(*limit) : std::string{}));
    }
    std::size_t completed = 0;
    while (!limit || completed < *limit) {
        run_once();
        ++completed;
    }
    // Let the last delivery flush before the session closes the channels.
    sleep_(config_.grace);
    set_state(TaskState::Stopped);
    if (logger_) logger_->info("task loop finished after " + std::to_string(completed) + " tasks");
    return completed;
}

TaskOutcome TaskEngine::run_once() {
    std::optional<std::string> assigned_id;
    TaskOutcome outcome;
    try {
        outcome = process_task(assigned_id);
    } catch (const std::system_error& e) {
        outcome = abort_task(assigned_id, e);
    }
    // The task and its temporary files are gone by now.
    if (outcome != TaskOutcome::Delivered) cool_down();
    set_state(TaskState::AwaitingTask);
    return outcome;
}

TaskOutcome TaskEngine::process_task(std::optional<std::string>& assigned_id) {
    Task task = request_task(assigned_id);

    if (!task.has_input()) {
        set_state(TaskState::EmptyInput);
        if (logger_) logger_->debug("task " + task.task_id + ": no input, reporting empty");
        set_state(TaskState::ReportingEmpty);
        deliver_empty(task.task_id);
        empty_.fetch_add(1, std::memory_order_relaxed);
        return TaskOutcome::EmptyInput;
    }

    set_state(TaskState::Converting);
    const auto result = convert(task);
    OutputCleanup cleanup(result, logger_.get());

    if (result.ok()) {
        set_state(TaskState::DeliveringOutput);
        if (deliver_output(task, result.output())) {
            const auto n = delivered_.fetch_add(1, std::memory_order_relaxed) + 1;
            if (logger_) {
                logger_->debug("task " + task.task_id + ": delivered");
                if ((n % 10) == 0) logger_->info("completed " + std::to_string(n) + " tasks");
            }
            return TaskOutcome::Delivered;
        }
    } else if (logger_) {
        logger_->warning("task " + task.task_id + ": conversion failed: " + result.message());
    }

    set_state(TaskState::ReportingEmpty);
    deliver_empty(task.task_id);
    failed_.fetch_add(1, std::memory_order_relaxed);
    return TaskOutcome::ConversionFailed;
}

Task TaskEngine::request_task(std::optional<std::string>& assigned_id) {
    set_state(TaskState::AwaitingTask);
    session_.send_request(config_.service);

    Task task;
    // Blocks until the dispatcher answers; there is no timeout in the protocol.
    bool more = session_.receive_reply(task.task_id);
    assigned_id = task.task_id;

    set_state(TaskState::ReceivingInput);
    task.input = std::make_unique<StagingFile>(staging_path_for(task.task_id));
    std::string frame;
    while (more) {
        more = session_.receive_reply(frame);
        task.input->append(frame);
    }
    task.input_size = task.input->size();
    bytes_received_.fetch_add(task.input_size, std::memory_order_relaxed);
    if (task.has_input()) task.input->rewind();
    return task;
}

ConversionResult TaskEngine::convert(const Task& task) {
    try {
        return capability_.convert(task.input->path());
    } catch (const std::exception& e) {
        return ConversionResult::failure(std::string{capability_.name()} + " threw: " + e.what());
    }
}

bool TaskEngine::deliver_output(const Task& task, const std::filesystem::path& output) {
    std::ifstream in(output, std::ios::binary);
    if (!in) {
        if (logger_) logger_->warning("task " + task.task_id + ": cannot open output " + output.string());
        return false;
    }

    // Every chunk but the last is exactly message_size bytes; the last one may be empty.
    std::vector<char> chunk(config_.message_size);
    send_headers(task.task_id);
    for (;;) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (in.bad()) {
            // Abort before the final frame so the sink never sees a truncated artifact.
            throw std::system_error(std::make_error_code(std::errc::io_error), "reading output " + output.string());
        }
        const bool last = got < chunk.size();
        session_.send_delivery(std::string_view(chunk.data(), got), !last);
        bytes_sent_.fetch_add(got, std::memory_order_relaxed);
        if (last) break;
    }
    return true;
}

void TaskEngine::deliver_empty(const std::string& task_id) {
    send_headers(task_id);
    session_.send_delivery(std::string_view{}, false);
}

void TaskEngine::send_headers(const std::string& task_id) {
    session_.send_delivery(session_.identity(), true);
    session_.send_delivery(config_.service, true);
    session_.send_delivery(task_id, true);
}

TaskOutcome TaskEngine::abort_task(const std::optional<std::string>& assigned_id, const std::system_error& error) {
    const TaskState failed_in = state();
    aborted_.fetch_add(1, std::memory_order_relaxed);
    if (logger_) {
        logger_->error(std::string{"task "} + assigned_id.value_or("<unassigned>") + " aborted while " +
                       to_string(failed_in) + ": " + error.what());
    }

    // Reconnecting drops whatever is half received or half sent. A failure
    // here escapes to the pool: the thread cannot make progress any more.
    const bool delivering = failed_in == TaskState::DeliveringOutput || failed_in == TaskState::ReportingEmpty;
    if (delivering) {
        session_.reset_delivery_channel();
        report_aborted(assigned_id);
    } else {
        // The delivery channel is intact: report before touching the request side.
        report_aborted(assigned_id);
        session_.reset_request_channel();
    }
    return TaskOutcome::Aborted;
}

void TaskEngine::report_aborted(const std::optional<std::string>& assigned_id) {
    if (!assigned_id) return;
    try {
        set_state(TaskState::ReportingEmpty);
        deliver_empty(*assigned_id);
    } catch (const std::system_error& e) {
        if (logger_) logger_->warning("task " + *assigned_id + ": could not report abort: " + e.what());
        session_.reset_delivery_channel();
    }
}

void TaskEngine::cool_down() {
    set_state(TaskState::CoolingDown);
    if (logger_ && config_.cooldown.count() > 0) {
        logger_->debug("cooling down for " + std::to_string(config_.cooldown.count()) + " ms");
    }
    sleep_(config_.cooldown);
}

void TaskEngine::set_state(TaskState state) noexcept {
    state_.store(state, std::memory_order_relaxed);
}

EngineStats TaskEngine::stats() const noexcept {
    EngineStats s;
    s.delivered = delivered_.load(std::memory_order_relaxed);
    s.empty = empty_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.aborted = aborted_.load(std::memory_order_relaxed);
    s.bytes_received = bytes_received_.load(std::memory_order_relaxed);
    s.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
    return s;
}

std::filesystem::path TaskEngine::staging_path_for(const std::string& task_id) const {
    return config_.staging_directory() /
           ("cortex_" + sanitize_for_filename(session_.identity()) + "_" + sanitize_for_filename(task_id) + ".zip");
}

} // namespace CortexWorker
