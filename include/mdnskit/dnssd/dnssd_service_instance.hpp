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

#include <boost/asio/ip/address.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

namespace mdk::dnssd {

using Clock = std::chrono::steady_clock;

/// Text attributes of a service (keys are unique).
using TxtRecord = std::map<std::string, std::string>;

/**
 * Identity of a service instance. Never changes once an instance has been created.
 */
struct InstanceKey {
    /// The instance name, i.e. "Printer A". May contain spaces and dots.
    std::string name;
    /// The registration type in lower case, i.e. "_ipp._tcp".
    std::string reg_type;
    /// The domain in lower case without trailing dot, i.e. "local".
    std::string domain;

    /**
     * @return The instance full name, i.e. "Printer A._ipp._tcp.local". Dots inside the instance name are not escaped.
     */
    [[nodiscard]] std::string fullname() const;

    [[nodiscard]] std::string to_string() const {
        return fullname();
    }

    [[nodiscard]] auto tie() const {
        return std::tie(name, reg_type, domain);
    }

    friend bool operator==(const InstanceKey& lhs, const InstanceKey& rhs) {
        return lhs.tie() == rhs.tie();
    }

    friend bool operator!=(const InstanceKey& lhs, const InstanceKey& rhs) {
        return lhs.tie() != rhs.tie();
    }

    friend bool operator<(const InstanceKey& lhs, const InstanceKey& rhs) {
        return lhs.tie() < rhs.tie();
    }
};

/**
 * A connectable endpoint of a service instance. Immutable once created: re-resolution produces a new object which
 * replaces the old one wholesale.
 */
struct ResolvedEndpoint {
    /// The host target of the service (i.e. "printer.local").
    std::string host_target;
    /// The address of the host target, if it was part of the same response.
    std::optional<boost::asio::ip::address> address;
    /// The port of the service (in native endian).
    uint16_t port {};
    /// The TXT record of the service.
    TxtRecord txt;

    /**
     * @return The address as string if known, otherwise the host target.
     */
    [[nodiscard]] std::string host() const;

    /// Returns a description of this struct, which might be handy for debugging or logging purposes.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ResolvedEndpoint& lhs, const ResolvedEndpoint& rhs) {
        return std::tie(lhs.host_target, lhs.address, lhs.port, lhs.txt)
            == std::tie(rhs.host_target, rhs.address, rhs.port, rhs.txt);
    }

    friend bool operator!=(const ResolvedEndpoint& lhs, const ResolvedEndpoint& rhs) {
        return !(lhs == rhs);
    }
};

enum class ResolutionState { unresolved, resolving, resolved, expired };

inline const char* to_string(const ResolutionState state) {
    switch (state) {
        case ResolutionState::unresolved:
            return "unresolved";
        case ResolutionState::resolving:
            return "resolving";
        case ResolutionState::resolved:
            return "resolved";
        case ResolutionState::expired:
            return "expired";
        default:
            return "unknown";
    }
}

/**
 * One discovered service instance. Instances are owned by the ServiceCache which maintains the invariant that an
 * endpoint is present if and only if the state is ResolutionState::resolved.
 */
struct ServiceInstance {
    InstanceKey key;
    Clock::time_point discovered_at {};
    Clock::time_point refreshed_at {};
    uint32_t ttl_seconds {};
    ResolutionState state {ResolutionState::unresolved};
    std::shared_ptr<const ResolvedEndpoint> endpoint;

    /**
     * @return The point in time after which the instance is considered gone, unless refreshed before.
     */
    [[nodiscard]] Clock::time_point deadline() const {
        return refreshed_at + std::chrono::seconds(ttl_seconds);
    }

    /// Returns a description of this struct, which might be handy for debugging or logging purposes.
    [[nodiscard]] std::string to_string() const;
};

}  // namespace mdk::dnssd
