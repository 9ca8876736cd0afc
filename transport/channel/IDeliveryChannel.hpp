/**
 * \file IDeliveryChannel.hpp
 * \brief Fire-and-forget push channel towards the sink.
 * \ingroup channel_backend
 */
#pragma once

#include <string_view>
#include <system_error>
#include "IChannelLifecycle.hpp"

/** \brief Delivery channel role interface (worker -> sink).
 *  \ingroup channel_backend
 */
struct IDeliveryChannel : public virtual IChannelLifecycle {
    /**
     * \brief Blocking send of one frame of a multi-part message.
     * \param more True when further frames of the same message follow.
     */
    virtual void send(std::string_view frame, bool more, std::error_code& error) = 0;
    /**
     * \brief Drop the connection and reconnect.
     * \details Discards a partially sent multi-part message.
     */
    virtual void reset(std::error_code& error) = 0;
};
