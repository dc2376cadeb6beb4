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

#include "dnssd_service_instance.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace mdk::dnssd {

/**
 * One service instance as asserted by a received message.
 */
struct ServiceAdvertisement {
    InstanceKey key;
    /// The advertised TTL in seconds. A TTL of 0 signals withdrawal of the instance, unless endpoint_withdrawn is set.
    uint32_t ttl {};
    /// Resolution data, present when the message carried a live SRV record of the instance.
    std::optional<ResolvedEndpoint> endpoint;
    /// True if the message carried only a goodbye for the SRV record while the instance itself stays. An
    /// advertisement built from such a SRV record alone has a TTL of 0 and doesn't refresh the instance.
    bool endpoint_withdrawn {};

    [[nodiscard]] bool is_withdrawal() const {
        return ttl == 0 && !endpoint_withdrawn;
    }
};

/**
 * The result of decoding a single datagram.
 */
struct DecodedResponse {
    uint16_t transaction_id {};
    bool is_response {};
    std::vector<ServiceAdvertisement> advertisements;
};

}  // namespace mdk::dnssd
