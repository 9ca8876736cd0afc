/**
 * @file tests/support/InMemoryChannels.hpp
 * @brief In-process dispatcher/sink doubles implementing the channel interfaces.
 */
#pragma once

#include "transport/channel/IRequestChannel.hpp"
#include "transport/channel/IDeliveryChannel.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cortex_test {

using Frames = std::vector<std::string>;

/// Hands out scripted replies to whichever request channel asks next.
class InMemoryDispatcher {
public:
    void add_task(std::string task_id, Frames input = {}) {
        Frames reply;
        reply.push_back(std::move(task_id));
        for (auto& f : input) reply.push_back(std::move(f));
        std::lock_guard<std::mutex> lk(mutex_);
        replies_.push_back(std::move(reply));
    }

    std::optional<Frames> take(const std::string& identity, const std::string& request) {
        std::lock_guard<std::mutex> lk(mutex_);
        requests_.emplace_back(identity, request);
        if (replies_.empty()) return std::nullopt;
        Frames reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    std::vector<std::pair<std::string, std::string>> requests() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Frames> replies_;
    std::vector<std::pair<std::string, std::string>> requests_;
};

/// Collects complete multi-part messages; partial ones never show up here.
class InMemorySink {
public:
    void accept(Frames message) {
        std::lock_guard<std::mutex> lk(mutex_);
        messages_.push_back(std::move(message));
    }

    std::vector<Frames> messages() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return messages_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Frames> messages_;
};

class InMemoryRequestChannel : public IRequestChannel {
public:
    InMemoryRequestChannel(std::shared_ptr<InMemoryDispatcher> dispatcher, std::string identity)
        : dispatcher_(std::move(dispatcher)), identity_(std::move(identity)) {}

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    std::string endpoint() const override { return "inproc://dispatcher"; }
    std::string channel_type() const override { return "in-memory"; }

    void send(std::string_view frame, std::error_code& error) override {
        if (!open_) { error = std::make_error_code(std::errc::not_connected); return; }
        auto reply = dispatcher_->take(identity_, std::string(frame));
        if (reply) pending_.assign(reply->begin(), reply->end());
    }

    void receive(std::string& frame, bool& more, std::error_code& error) override {
        ++receive_calls_;
        if (fail_receive_call_ && *fail_receive_call_ == receive_calls_) {
            error = std::make_error_code(std::errc::connection_reset);
            return;
        }
        if (!open_ || pending_.empty()) {
            // Nothing was scripted: behave like a dispatcher that went away.
            error = std::make_error_code(std::errc::connection_aborted);
            return;
        }
        frame = std::move(pending_.front());
        pending_.pop_front();
        more = !pending_.empty();
    }

    void reset(std::error_code& error) override {
        if (fail_reset_) { error = std::make_error_code(std::errc::host_unreachable); return; }
        pending_.clear();
        ++resets_;
    }

    /// The n-th receive call (1-based) fails with connection_reset.
    void fail_receive_call(std::size_t n) { fail_receive_call_ = n; }
    void fail_reset() { fail_reset_ = true; }
    std::size_t resets() const { return resets_; }

private:
    std::shared_ptr<InMemoryDispatcher> dispatcher_;
    std::string identity_;
    std::deque<std::string> pending_;
    bool open_{true};
    bool fail_reset_{false};
    std::size_t receive_calls_{0};
    std::optional<std::size_t> fail_receive_call_;
    std::size_t resets_{0};
};

class InMemoryDeliveryChannel : public IDeliveryChannel {
public:
    explicit InMemoryDeliveryChannel(std::shared_ptr<InMemorySink> sink) : sink_(std::move(sink)) {}

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    std::string endpoint() const override { return "inproc://sink"; }
    std::string channel_type() const override { return "in-memory"; }

    void send(std::string_view frame, bool more, std::error_code& error) override {
        ++send_calls_;
        if (fail_send_call_ && *fail_send_call_ == send_calls_) {
            error = std::make_error_code(std::errc::connection_reset);
            return;
        }
        if (!open_) { error = std::make_error_code(std::errc::not_connected); return; }
        partial_.emplace_back(frame);
        more_flags_.push_back(more);
        if (!more) {
            sink_->accept(std::move(partial_));
            partial_.clear();
        }
    }

    void reset(std::error_code&) override {
        partial_.clear();
        ++resets_;
    }

    /// The n-th send call (1-based) fails with connection_reset.
    void fail_send_call(std::size_t n) { fail_send_call_ = n; }
    std::size_t resets() const { return resets_; }
    /// "more" flag of every frame accepted so far, in send order.
    const std::vector<bool>& more_flags() const { return more_flags_; }

private:
    std::shared_ptr<InMemorySink> sink_;
    Frames partial_;
    std::vector<bool> more_flags_;
    bool open_{true};
    std::size_t send_calls_{0};
    std::optional<std::size_t> fail_send_call_;
    std::size_t resets_{0};
};

} // namespace cortex_test
