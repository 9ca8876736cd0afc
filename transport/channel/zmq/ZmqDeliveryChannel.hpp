/**
 * \file ZmqDeliveryChannel.hpp
 * \brief ZeroMQ PUSH implementation of IDeliveryChannel.
 * \ingroup channel_backend
 */
#pragma once

#include "transport/channel/IDeliveryChannel.hpp"
#include <zmq.hpp>
#include <memory>
#include <string>

class Logger;

/** \brief PUSH-backed delivery channel owning its own ZeroMQ context. */
class ZmqDeliveryChannel : public virtual IDeliveryChannel {
public:
    /**
     * \brief Connect a PUSH socket to `address`.
     * \throws std::system_error if the socket cannot be configured or connected.
     */
    ZmqDeliveryChannel(std::string address, int linger_ms, std::shared_ptr<Logger> logger);
    ~ZmqDeliveryChannel() override;

    ZmqDeliveryChannel(const ZmqDeliveryChannel&) = delete;
    ZmqDeliveryChannel& operator=(const ZmqDeliveryChannel&) = delete;

    void send(std::string_view frame, bool more, std::error_code& error) override;
    void reset(std::error_code& error) override;

    void close() override;
    bool is_open() const override { return open_; }
    std::string endpoint() const override { return address_; }
    std::string channel_type() const override { return "zeromq"; }

private:
    void connect_socket();

    std::string address_;
    int linger_ms_;
    std::shared_ptr<Logger> logger_;

    zmq::context_t context_;
    zmq::socket_t socket_;
    bool open_{false};
};
