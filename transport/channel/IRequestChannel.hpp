/**
 * \file IRequestChannel.hpp
 * \brief Identity-tagged request/response channel towards the dispatcher.
 * \ingroup channel_backend
 * \details The worker sends single frames and receives multi-part replies.
 * Each received frame reports whether further parts of the same reply follow.
 */
#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include "IChannelLifecycle.hpp"

/** \brief Request channel role interface (worker -> dispatcher).
 *  \ingroup channel_backend
 */
struct IRequestChannel : public virtual IChannelLifecycle {
    /** \brief Blocking send of one complete request frame; sets `error` on failure. */
    virtual void send(std::string_view frame, std::error_code& error) = 0;
    /** \brief Blocking receive of one reply frame; `more` is true when further parts follow. */
    virtual void receive(std::string& frame, bool& more, std::error_code& error) = 0;
    /**
     * \brief Drop the connection and reconnect with the same identity.
     * \details Discards any queued parts of a partially received reply.
     */
    virtual void reset(std::error_code& error) = 0;
};
