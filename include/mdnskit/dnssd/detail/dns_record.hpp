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

#include "dns_name.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace mdk::dnssd::detail {

namespace record_type {
    constexpr uint16_t a = 1;
    constexpr uint16_t ptr = 12;
    constexpr uint16_t txt = 16;
    constexpr uint16_t aaaa = 28;
    constexpr uint16_t srv = 33;
}  // namespace record_type

constexpr uint16_t k_class_in = 1;
constexpr uint16_t k_class_mask = 0x7fff;
/// Top bit of the class field. Cache-flush for records, unicast-response for questions.
constexpr uint16_t k_class_top_bit = 0x8000;

const char* record_type_to_string(uint16_t type);

struct DnsQuestion {
    DnsName name;
    uint16_t type {};
    uint16_t klass {k_class_in};
    bool unicast_response {};

    static tl::expected<DnsQuestion, Error> read(BufferView<const uint8_t> message, size_t& offset);
    [[nodiscard]] bool write_to(ByteBuffer& buffer) const;
};

struct PtrData {
    DnsName target;
};

struct SrvData {
    uint16_t priority {};
    uint16_t weight {};
    uint16_t port {};
    DnsName target;
};

struct TxtData {
    std::vector<std::string> strings;
};

/// Data of an A or AAAA record.
struct AddressData {
    boost::asio::ip::address address;
};

/// Data of a record of a type which is not interpreted.
struct RawData {
    std::vector<uint8_t> bytes;
};

using RecordData = std::variant<RawData, PtrData, SrvData, TxtData, AddressData>;

struct DnsResourceRecord {
    DnsName name;
    uint16_t type {};
    uint16_t klass {k_class_in};
    bool cache_flush {};
    uint32_t ttl {};
    RecordData data;

    /**
     * Reads a resource record. Records of unknown type are consumed using their rdlength and returned as RawData.
     * Known records whose data doesn't fit rdlength are malformed.
     * @param message The complete message.
     * @param offset The offset of the record, advanced past the record on success.
     * @return The record, or Error::malformed_packet.
     */
    static tl::expected<DnsResourceRecord, Error> read(BufferView<const uint8_t> message, size_t& offset);

    /**
     * Writes the record.
     * @return False if the record could not be written.
     */
    [[nodiscard]] bool write_to(ByteBuffer& buffer) const;
};

}  // namespace mdk::dnssd::detail
