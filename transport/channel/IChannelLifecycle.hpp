/**
 * \file IChannelLifecycle.hpp
 * \brief Lifecycle and endpoint queries shared by all channel roles.
 * \ingroup channel_backend
 */
#pragma once

#include <string>

/** \brief Base interface for common channel lifecycle methods.
 *  \ingroup channel_backend
 */
struct IChannelLifecycle {
    virtual ~IChannelLifecycle() = default;

    /** \brief Close the underlying connection; subsequent operations fail. */
    virtual void close() = 0;
    /** \brief True while the connection is usable. */
    virtual bool is_open() const = 0;
    /** \brief Remote endpoint the channel was opened against. */
    virtual std::string endpoint() const = 0;
    /** \brief Backend type identifier (e.g. zeromq). */
    virtual std::string channel_type() const = 0;
};
