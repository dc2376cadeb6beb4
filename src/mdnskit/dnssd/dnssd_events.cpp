/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_events.hpp"

#include <fmt/format.h>

namespace {

template<class... Ts>
struct Overloaded: Ts... {
    using Ts::operator()...;
};

template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string mdk::dnssd::to_string(const Event& event) {
    return std::visit(
        Overloaded {
            [](const ServiceFound& e) {
                return fmt::format("ServiceFound: {}", e.instance.to_string());
            },
            [](const ServiceUpdated& e) {
                return fmt::format("ServiceUpdated: {}", e.instance.to_string());
            },
            [](const ServiceLost& e) {
                return fmt::format("ServiceLost: {}", e.key.to_string());
            },
            [](const ServiceResolved& e) {
                return fmt::format(
                    "ServiceResolved: {} ({})", e.key.to_string(), e.endpoint ? e.endpoint->to_string() : "no endpoint"
                );
            },
            [](const SessionError& e) {
                return fmt::format("SessionError: {} ({})", dnssd::to_string(e.kind), e.detail);
            },
        },
        event
    );
}
