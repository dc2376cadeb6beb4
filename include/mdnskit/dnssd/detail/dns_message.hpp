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

#include "dns_record.hpp"

#include <cstdint>
#include <vector>

namespace mdk::dnssd::detail {

/**
 * A DNS message as used by multicast DNS.
 */
struct DnsMessage {
    static constexpr size_t k_header_size = 12;
    static constexpr uint16_t k_flag_response = 0x8000;
    static constexpr uint16_t k_flag_authoritative = 0x0400;

    uint16_t id {};
    uint16_t flags {};
    std::vector<DnsQuestion> questions;
    std::vector<DnsResourceRecord> answers;
    std::vector<DnsResourceRecord> authorities;
    std::vector<DnsResourceRecord> additionals;

    /**
     * Parses a message.
     * @param data The message data.
     * @return The parsed message, or Error::malformed_packet if the data is truncated or inconsistent.
     */
    static tl::expected<DnsMessage, Error> from_data(BufferView<const uint8_t> data);

    /**
     * Encodes the message without name compression.
     * @return False if any part of the message could not be encoded.
     */
    [[nodiscard]] bool write_to(ByteBuffer& buffer) const;

    [[nodiscard]] bool is_response() const {
        return (flags & k_flag_response) != 0;
    }

    [[nodiscard]] uint8_t opcode() const {
        return static_cast<uint8_t>((flags >> 11) & 0x0f);
    }

    [[nodiscard]] uint8_t rcode() const {
        return static_cast<uint8_t>(flags & 0x0f);
    }
};

}  // namespace mdk::dnssd::detail
