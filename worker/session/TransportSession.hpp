/**
 * \file worker/session/TransportSession.hpp
 * \brief The pair of channels one worker thread holds for its whole lifetime.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

class Logger;
struct IRequestChannel;
struct IDeliveryChannel;

namespace CortexWorker {

struct WorkerConfiguration;

/**
 * \brief Request channel to the dispatcher plus delivery channel to the sink.
 *
 * Opened once per worker thread before its task loop starts and closed when
 * the session is destroyed. The throwing helpers turn channel error codes into
 * std::system_error so the task engine can treat every transport failure alike.
 */
class TransportSession {
public:
    /**
     * \brief Take ownership of two already opened channels.
     * \param identity Worker identity the request channel was opened with.
     */
    TransportSession(std::string identity,
                     std::unique_ptr<IRequestChannel> request,
                     std::unique_ptr<IDeliveryChannel> delivery);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    /**
     * \brief Open both channels for `identity` against the configured endpoints.
     * \throws std::invalid_argument / std::system_error on a bad or unreachable address.
     */
    static std::unique_ptr<TransportSession> open(const WorkerConfiguration& config,
                                                  const std::string& identity,
                                                  std::shared_ptr<Logger> logger);

    const std::string& identity() const noexcept { return identity_; }
    IRequestChannel& request_channel() noexcept { return *request_; }
    IDeliveryChannel& delivery_channel() noexcept { return *delivery_; }

    /** \brief Both channels still usable. */
    bool is_open() const;
    /** \brief Close both channels; idempotent. */
    void close();

    /** \brief Send one request frame. \throws std::system_error */
    void send_request(std::string_view frame);
    /** \brief Receive one reply frame; returns true when more parts follow. \throws std::system_error */
    bool receive_reply(std::string& frame);
    /** \brief Send one delivery frame. \throws std::system_error */
    void send_delivery(std::string_view frame, bool more);

    /** \brief Reconnect the request channel, dropping unread reply parts. \throws std::system_error */
    void reset_request_channel();
    /** \brief Reconnect the delivery channel, dropping an unfinished message. \throws std::system_error */
    void reset_delivery_channel();

private:
    std::string identity_;
    std::unique_ptr<IRequestChannel> request_;
    std::unique_ptr<IDeliveryChannel> delivery_;
};

} // namespace CortexWorker
