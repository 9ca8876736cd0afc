/**
 * \file ZmqRequestChannel.hpp
 * \brief ZeroMQ DEALER implementation of IRequestChannel.
 * \ingroup channel_backend
 * \details The DEALER's routing id is the worker identity, so the dispatcher's
 * ROUTER can address replies to this worker thread.
 */
#pragma once

#include "transport/channel/IRequestChannel.hpp"
#include <zmq.hpp>
#include <memory>
#include <string>

class Logger;

/** \brief DEALER-backed request channel owning its own ZeroMQ context. */
class ZmqRequestChannel : public virtual IRequestChannel {
public:
    /**
     * \brief Connect a DEALER socket tagged with `identity` to `address`.
     * \throws std::system_error if the socket cannot be configured or connected.
     */
    ZmqRequestChannel(std::string address, std::string identity, int linger_ms, std::shared_ptr<Logger> logger);
    ~ZmqRequestChannel() override;

    ZmqRequestChannel(const ZmqRequestChannel&) = delete;
    ZmqRequestChannel& operator=(const ZmqRequestChannel&) = delete;

    void send(std::string_view frame, std::error_code& error) override;
    void receive(std::string& frame, bool& more, std::error_code& error) override;
    void reset(std::error_code& error) override;

    void close() override;
    bool is_open() const override { return open_; }
    std::string endpoint() const override { return address_; }
    std::string channel_type() const override { return "zeromq"; }

private:
    void connect_socket();

    std::string address_;
    std::string identity_;
    int linger_ms_;
    std::shared_ptr<Logger> logger_;

    zmq::context_t context_;
    zmq::socket_t socket_;
    bool open_{false};
};
