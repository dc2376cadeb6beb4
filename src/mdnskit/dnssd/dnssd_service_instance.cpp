/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_service_instance.hpp"

#include <fmt/format.h>

std::string mdk::dnssd::InstanceKey::fullname() const {
    return fmt::format("{}.{}.{}", name, reg_type, domain);
}

std::string mdk::dnssd::ResolvedEndpoint::host() const {
    if (address) {
        return address->to_string();
    }
    return host_target;
}

std::string mdk::dnssd::ResolvedEndpoint::to_string() const {
    std::string txt_description;
    for (auto& [key, value] : txt) {
        if (!txt_description.empty()) {
            txt_description += ", ";
        }
        txt_description += key;
        txt_description += "=";
        txt_description += value;
    }

    return fmt::format(
        "host_target: {}, address: {}, port: {}, txt: [{}]", host_target,
        address ? address->to_string() : std::string("unknown"), port, txt_description
    );
}

std::string mdk::dnssd::ServiceInstance::to_string() const {
    return fmt::format(
        "name: {}, type: {}, domain: {}, ttl: {}, state: {}{}", key.name, key.reg_type, key.domain, ttl_seconds,
        dnssd::to_string(state), endpoint ? ", " + endpoint->to_string() : std::string()
    );
}
