/**
 * \file ZmqRequestChannel.cpp
 * \brief DEALER request channel to the CorTeX dispatcher.
 * \ingroup channel_backend
 */
#include "ZmqRequestChannel.hpp"
#include "ZmqErrors.hpp"
#include "logger.hpp"

#include <cerrno>
#include <utility>

using transport::zmq_error_code;
using transport::is_terminal_zmq_error;

ZmqRequestChannel::ZmqRequestChannel(std::string address, std::string identity, int linger_ms,
                                     std::shared_ptr<Logger> logger)
    : address_(std::move(address))
    , identity_(std::move(identity))
    , linger_ms_(linger_ms)
    , logger_(std::move(logger)) {
    try {
        connect_socket();
    } catch (const zmq::error_t& e) {
        throw std::system_error(zmq_error_code(e.num()), "request channel: cannot connect to " + address_);
    }
    if (logger_) logger_->debug("request channel connected to " + address_);
}

ZmqRequestChannel::~ZmqRequestChannel() {
    close();
}

void ZmqRequestChannel::connect_socket() {
    socket_ = zmq::socket_t(context_, zmq::socket_type::dealer);
    socket_.set(zmq::sockopt::routing_id, identity_);
    socket_.set(zmq::sockopt::linger, linger_ms_);
    socket_.connect(address_);
    open_ = true;
}

void ZmqRequestChannel::send(std::string_view frame, std::error_code& error) {
    error.clear();
    if (!open_) {
        error = std::make_error_code(std::errc::not_connected);
        return;
    }
    for (;;) {
        try {
            const auto sent = socket_.send(zmq::buffer(frame.data(), frame.size()), zmq::send_flags::none);
            if (!sent) error = std::make_error_code(std::errc::resource_unavailable_try_again);
            return;
        } catch (const zmq::error_t& e) {
            if (e.num() == EINTR) continue;
            if (is_terminal_zmq_error(e.num())) open_ = false;
            error = zmq_error_code(e.num());
            return;
        }
    }
}

void ZmqRequestChannel::receive(std::string& frame, bool& more, std::error_code& error) {
    error.clear();
    frame.clear();
    more = false;
    if (!open_) {
        error = std::make_error_code(std::errc::not_connected);
        return;
    }
    zmq::message_t message;
    for (;;) {
        try {
            const auto received = socket_.recv(message, zmq::recv_flags::none);
            if (!received) {
                error = std::make_error_code(std::errc::resource_unavailable_try_again);
                return;
            }
            break;
        } catch (const zmq::error_t& e) {
            if (e.num() == EINTR) continue;
            if (is_terminal_zmq_error(e.num())) open_ = false;
            error = zmq_error_code(e.num());
            return;
        }
    }
    frame.assign(static_cast<const char*>(message.data()), message.size());
    more = message.more();
}

void ZmqRequestChannel::reset(std::error_code& error) {
    error.clear();
    close();
    try {
        connect_socket();
    } catch (const zmq::error_t& e) {
        error = zmq_error_code(e.num());
        return;
    }
    if (logger_) logger_->info("request channel reconnected to " + address_);
}

void ZmqRequestChannel::close() {
    if (!open_) return;
    open_ = false;
    socket_.close();
}
