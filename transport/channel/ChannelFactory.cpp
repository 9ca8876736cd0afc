/**
 * \file ChannelFactory.cpp
 * \brief Construction of the ZeroMQ worker channels.
 * \ingroup channel_backend
 */
#include "ChannelFactory.hpp"
#include "IRequestChannel.hpp"
#include "IDeliveryChannel.hpp"
#include "zmq/ZmqRequestChannel.hpp" // kept private to implementation
#include "zmq/ZmqDeliveryChannel.hpp"

#include <stdexcept>

namespace transport {

std::unique_ptr<IRequestChannel> ChannelFactory::open_request_channel(const std::string& address,
                                                                      const std::string& identity,
                                                                      const ChannelOptions& options,
                                                                      std::shared_ptr<Logger> logger) {
    if (address.empty()) throw std::invalid_argument("request channel: empty address");
    if (identity.empty()) throw std::invalid_argument("request channel: empty identity");
    return std::make_unique<ZmqRequestChannel>(address, identity, options.linger_ms, std::move(logger));
}

std::unique_ptr<IDeliveryChannel> ChannelFactory::open_delivery_channel(const std::string& address,
                                                                        const ChannelOptions& options,
                                                                        std::shared_ptr<Logger> logger) {
    if (address.empty()) throw std::invalid_argument("delivery channel: empty address");
    return std::make_unique<ZmqDeliveryChannel>(address, options.linger_ms, std::move(logger));
}

} // namespace transport
