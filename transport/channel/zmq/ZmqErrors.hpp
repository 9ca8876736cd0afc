/**
 * \file ZmqErrors.hpp
 * \brief Mapping of libzmq error numbers onto std::error_code.
 * \ingroup channel_backend
 */
#pragma once

#include <system_error>
#include <zmq.hpp>

namespace transport {

/** \brief libzmq reports POSIX errno values, plus a few of its own (e.g. ETERM) above ZMQ_HAUSNUMERO. */
inline std::error_code zmq_error_code(int num) {
    return std::error_code(num, std::generic_category());
}

/** \brief True when the error means the socket or its context is gone for good. */
inline bool is_terminal_zmq_error(int num) {
    return num == ETERM || num == ENOTSOCK;
}

} // namespace transport
