/**
 * \file worker/session/TransportSession.cpp
 * \brief Channel ownership and error-code-to-exception plumbing for one worker thread.
 */
#include "TransportSession.hpp"
#include "transport/channel/ChannelFactory.hpp"
#include "transport/channel/IRequestChannel.hpp"
#include "transport/channel/IDeliveryChannel.hpp"
#include "worker/WorkerOptions.hpp"
#include "logger.hpp"

#include <stdexcept>
#include <system_error>

namespace CortexWorker {

TransportSession::TransportSession(std::string identity,
                                   std::unique_ptr<IRequestChannel> request,
                                   std::unique_ptr<IDeliveryChannel> delivery)
    : identity_(std::move(identity))
    , request_(std::move(request))
    , delivery_(std::move(delivery)) {
    if (!request_ || !delivery_) {
        throw std::invalid_argument("TransportSession: both channels are required");
    }
}

TransportSession::~TransportSession() {
    close();
}

std::unique_ptr<TransportSession> TransportSession::open(const WorkerConfiguration& config,
                                                         const std::string& identity,
                                                         std::shared_ptr<Logger> logger) {
    transport::ChannelOptions options;
    options.linger_ms = config.linger_ms;
    auto request = transport::ChannelFactory::open_request_channel(config.source_address, identity, options, logger);
    auto delivery = transport::ChannelFactory::open_delivery_channel(config.sink_address, options, logger);
    if (logger) {
        logger->info("session open: source=" + request->endpoint() + " sink=" + delivery->endpoint());
    }
    return std::make_unique<TransportSession>(identity, std::move(request), std::move(delivery));
}

bool TransportSession::is_open() const {
    return request_->is_open() && delivery_->is_open();
}

void TransportSession::close() {
    request_->close();
    delivery_->close();
}

void TransportSession::send_request(std::string_view frame) {
    std::error_code ec;
    request_->send(frame, ec);
    if (ec) throw std::system_error(ec, "request channel: send failed");
}

bool TransportSession::receive_reply(std::string& frame) {
    std::error_code ec;
    bool more = false;
    request_->receive(frame, more, ec);
    if (ec) throw std::system_error(ec, "request channel: receive failed");
    return more;
}

void TransportSession::send_delivery(std::string_view frame, bool more) {
    std::error_code ec;
    delivery_->send(frame, more, ec);
    if (ec) throw std::system_error(ec, "delivery channel: send failed");
}

void TransportSession::reset_request_channel() {
    std::error_code ec;
    request_->reset(ec);
    if (ec) throw std::system_error(ec, "request channel: reconnect failed");
}

void TransportSession::reset_delivery_channel() {
    std::error_code ec;
    delivery_->reset(ec);
    if (ec) throw std::system_error(ec, "delivery channel: reconnect failed");
}

} // namespace CortexWorker
