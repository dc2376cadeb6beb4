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

#include "dnssd_error.hpp"
#include "dnssd_service_instance.hpp"

#include <memory>
#include <string>
#include <variant>

namespace mdk::dnssd {

/// An instance appeared.
struct ServiceFound {
    ServiceInstance instance;
};

/// The endpoint of a known instance changed or was withdrawn.
struct ServiceUpdated {
    ServiceInstance instance;
};

/// An instance disappeared, either withdrawn or expired.
struct ServiceLost {
    InstanceKey key;
};

/// An instance got an endpoint, either from a resolve or from data which came along with an advertisement.
struct ServiceResolved {
    InstanceKey key;
    std::shared_ptr<const ResolvedEndpoint> endpoint;
};

/// The session failed and went back to idle.
struct SessionError {
    Error kind;
    std::string detail;
};

using Event = std::variant<ServiceFound, ServiceUpdated, ServiceLost, ServiceResolved, SessionError>;

/**
 * @return A description of the event, which might be handy for debugging or logging purposes.
 */
std::string to_string(const Event& event);

/**
 * Receives the events of a session. Called from the thread running the io_context of the session, so implementations
 * should return quickly.
 */
class Listener {
  public:
    virtual ~Listener() = default;
    virtual void on_event(const Event& event) = 0;
};

}  // namespace mdk::dnssd
