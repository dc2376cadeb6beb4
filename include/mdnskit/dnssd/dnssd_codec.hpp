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

#include "dnssd_advertisement.hpp"
#include "dnssd_error.hpp"
#include "dnssd_service_type.hpp"
#include "mdnskit/core/containers/buffer_view.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mdk::dnssd {

/**
 * @return A random transaction id, never 0.
 */
uint16_t make_transaction_id();

/**
 * Builds a multicast DNS query with a single PTR question for the given service type.
 * @param service_type The service type to browse for.
 * @param transaction_id The id to put in the message header.
 * @return The encoded query, or an empty vector if the name of the service type cannot be encoded.
 */
std::vector<uint8_t> encode_query(const ServiceType& service_type, uint16_t transaction_id);

/**
 * Builds a multicast DNS query with SRV and TXT questions for the given instance.
 * @param key The instance to resolve.
 * @param transaction_id The id to put in the message header.
 * @return The encoded query, or an empty vector if the instance name cannot be encoded.
 */
std::vector<uint8_t> encode_resolve_query(const InstanceKey& key, uint16_t transaction_id);

/**
 * Decodes a datagram. Every PTR record pointing at a service instance produces one advertisement which is combined
 * with the SRV, TXT and address records found for the same instance anywhere in the message. SRV records of
 * instances without PTR record produce an advertisement as well. Records of unknown type are ignored. Queries and
 * messages with a non-zero opcode or response code decode to an empty list.
 * @param data The datagram.
 * @return The decoded response, or Error::malformed_packet.
 */
tl::expected<DecodedResponse, Error> decode_response(BufferView<const uint8_t> data);

/**
 * Parses the strings of a TXT record into attributes. Strings without '=' are boolean attributes with an empty value.
 * Keys compare case-insensitively and the first occurrence of a key wins. Strings starting with '=' are ignored.
 * @param strings The strings of the TXT record.
 * @return The attributes.
 */
TxtRecord parse_txt_strings(const std::vector<std::string>& strings);

}  // namespace mdk::dnssd
