/**
 * \file ChannelFactory.hpp
 * \brief Factory helpers for opening request and delivery channels.
 * \ingroup channel_backend
 * \details Centralizes construction of the ZeroMQ backend. Opening a channel
 * is a startup step: any failure is a configuration error and is thrown.
 * \see IRequestChannel \see IDeliveryChannel
 */
#pragma once

#include <memory>
#include <string>

struct IRequestChannel;
struct IDeliveryChannel;

#include "logger.hpp"

namespace transport {

/** \brief Tunables applied to every channel the factory opens. */
struct ChannelOptions {
    /// Milliseconds a closing channel keeps trying to flush unsent frames (-1 waits forever).
    int linger_ms{5000};
};

/** \brief Static factory for creating role-based channel implementations.
 *  \ingroup channel_backend
 */
class ChannelFactory {
public:
    /**
     * \brief Open the identity-tagged request channel to the dispatcher.
     * \throws std::invalid_argument for an empty address or identity.
     * \throws std::system_error if the address cannot be resolved or connected.
     */
    static std::unique_ptr<IRequestChannel> open_request_channel(const std::string& address,
                                                                 const std::string& identity,
                                                                 const ChannelOptions& options,
                                                                 std::shared_ptr<Logger> logger);
    /**
     * \brief Open the push channel to the sink.
     * \throws std::invalid_argument for an empty address.
     * \throws std::system_error if the address cannot be resolved or connected.
     */
    static std::unique_ptr<IDeliveryChannel> open_delivery_channel(const std::string& address,
                                                                   const ChannelOptions& options,
                                                                   std::shared_ptr<Logger> logger);

private:
    // Static-only: prevent instantiation
    ChannelFactory() = delete;
};

} // namespace transport
