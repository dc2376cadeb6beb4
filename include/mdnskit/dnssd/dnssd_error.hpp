/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "mdnskit/core/assert.hpp"

// tl::expected reports bad accesses through MDK_ASSERT. This header must be included before <tl/expected.hpp>.
#ifdef TL_ASSERT
    #error "TL_ASSERT is already defined. Please include this header before including <tl/expected.hpp>."
#else
    #define TL_ASSERT(condition) MDK_ASSERT(condition, "tl::expected assertion failed: " #condition)
#endif

#include <tl/expected.hpp>

namespace mdk::dnssd {

enum class Error {
    /// The multicast group could not be joined (no socket, no interface, permission denied).
    network_unavailable,
    /// A datagram could not be sent.
    send_failed,
    /// A received datagram could not be decoded.
    malformed_packet,
    /// No answer arrived within the resolve window.
    resolution_timeout,
    /// The instance is not (or no longer) known.
    instance_not_found,
    /// listen() was called while already listening.
    already_listening,
    /// The operation requires an active session.
    not_listening,
    /// The given service type string is not a valid DNS-SD service type.
    invalid_service_type,
    /// The transport failed while a session was active.
    transport_failure,
    /// The operation was cancelled because the session stopped.
    cancelled,
};

inline const char* to_string(const Error error) {
    switch (error) {
        case Error::network_unavailable:
            return "network unavailable";
        case Error::send_failed:
            return "send failed";
        case Error::malformed_packet:
            return "malformed packet";
        case Error::resolution_timeout:
            return "resolution timeout";
        case Error::instance_not_found:
            return "instance not found";
        case Error::already_listening:
            return "already listening";
        case Error::not_listening:
            return "not listening";
        case Error::invalid_service_type:
            return "invalid service type";
        case Error::transport_failure:
            return "transport failure";
        case Error::cancelled:
            return "cancelled";
        default:
            return "unknown error";
    }
}

}  // namespace mdk::dnssd
