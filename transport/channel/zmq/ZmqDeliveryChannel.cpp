/**
 * \file ZmqDeliveryChannel.cpp
 * \brief PUSH delivery channel to the CorTeX sink.
 * \ingroup channel_backend
 */
#include "ZmqDeliveryChannel.hpp"
#include "ZmqErrors.hpp"
#include "logger.hpp"

#include <cerrno>
#include <utility>

using transport::zmq_error_code;
using transport::is_terminal_zmq_error;

ZmqDeliveryChannel::ZmqDeliveryChannel(std::string address, int linger_ms, std::shared_ptr<Logger> logger)
    : address_(std::move(address))
    , linger_ms_(linger_ms)
    , logger_(std::move(logger)) {
    try {
        connect_socket();
    } catch (const zmq::error_t& e) {
        throw std::system_error(zmq_error_code(e.num()), "delivery channel: cannot connect to " + address_);
    }
    if (logger_) logger_->debug("delivery channel connected to " + address_);
}

ZmqDeliveryChannel::~ZmqDeliveryChannel() {
    close();
}

void ZmqDeliveryChannel::connect_socket() {
    socket_ = zmq::socket_t(context_, zmq::socket_type::push);
    socket_.set(zmq::sockopt::linger, linger_ms_);
    socket_.connect(address_);
    open_ = true;
}

void ZmqDeliveryChannel::send(std::string_view frame, bool more, std::error_code& error) {
    error.clear();
    if (!open_) {
        error = std::make_error_code(std::errc::not_connected);
        return;
    }
    const auto flags = more ? zmq::send_flags::sndmore : zmq::send_flags::none;
    for (;;) {
        try {
            const auto sent = socket_.send(zmq::buffer(frame.data(), frame.size()), flags);
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

void ZmqDeliveryChannel::reset(std::error_code& error) {
    error.clear();
    if (open_) {
        // An unfinished multi-part message is never delivered; drop it with the socket.
        try {
            socket_.set(zmq::sockopt::linger, 0);
        } catch (const zmq::error_t& e) {
            if (logger_) logger_->debug(std::string{"delivery channel: linger reset failed: "} + e.what());
        }
    }
    close();
    try {
        connect_socket();
    } catch (const zmq::error_t& e) {
        error = zmq_error_code(e.num());
        return;
    }
    if (logger_) logger_->info("delivery channel reconnected to " + address_);
}

void ZmqDeliveryChannel::close() {
    if (!open_) return;
    open_ = false;
    socket_.close();
}
