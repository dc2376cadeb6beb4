/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/detail/dns_record.hpp"

#include <algorithm>

namespace {

constexpr size_t k_question_fixed_size = 4;  // type + class
constexpr size_t k_record_fixed_size = 10;   // type + class + ttl + rdlength

template<class T>
struct always_false: std::false_type {};

tl::expected<mdk::dnssd::detail::RecordData, mdk::dnssd::Error> read_record_data(
    const uint16_t type, const mdk::BufferView<const uint8_t> message, const size_t offset, const size_t length
) {
    using namespace mdk::dnssd;
    using namespace mdk::dnssd::detail;

    const size_t end = offset + length;

    switch (type) {
        case record_type::ptr: {
            size_t cursor = offset;
            auto target = DnsName::read(message.subview(0, end), cursor);
            if (!target || cursor != end) {
                return tl::unexpected(Error::malformed_packet);
            }
            return PtrData {std::move(*target)};
        }
        case record_type::srv: {
            if (length < 7) {
                return tl::unexpected(Error::malformed_packet);
            }
            SrvData srv;
            srv.priority = message.read_be<uint16_t>(offset);
            srv.weight = message.read_be<uint16_t>(offset + 2);
            srv.port = message.read_be<uint16_t>(offset + 4);
            size_t cursor = offset + 6;
            auto target = DnsName::read(message.subview(0, end), cursor);
            if (!target || cursor != end) {
                return tl::unexpected(Error::malformed_packet);
            }
            srv.target = std::move(*target);
            return srv;
        }
        case record_type::txt: {
            TxtData txt;
            size_t cursor = offset;
            while (cursor < end) {
                const size_t string_length = message[cursor];
                if (cursor + 1 + string_length > end) {
                    return tl::unexpected(Error::malformed_packet);
                }
                if (string_length > 0) {
                    txt.strings.emplace_back(reinterpret_cast<const char*>(message.data() + cursor + 1), string_length);
                }
                cursor += 1 + string_length;
            }
            return txt;
        }
        case record_type::a: {
            if (length != 4) {
                return tl::unexpected(Error::malformed_packet);
            }
            return AddressData {boost::asio::ip::address_v4(message.read_be<uint32_t>(offset))};
        }
        case record_type::aaaa: {
            if (length != 16) {
                return tl::unexpected(Error::malformed_packet);
            }
            boost::asio::ip::address_v6::bytes_type bytes {};
            std::copy_n(message.data() + offset, bytes.size(), bytes.begin());
            return AddressData {boost::asio::ip::address_v6(bytes)};
        }
        default:
            return RawData {std::vector<uint8_t>(message.data() + offset, message.data() + end)};
    }
}

}  // namespace

const char* mdk::dnssd::detail::record_type_to_string(const uint16_t type) {
    switch (type) {
        case record_type::a:
            return "A";
        case record_type::ptr:
            return "PTR";
        case record_type::txt:
            return "TXT";
        case record_type::aaaa:
            return "AAAA";
        case record_type::srv:
            return "SRV";
        default:
            return "unknown";
    }
}

tl::expected<mdk::dnssd::detail::DnsQuestion, mdk::dnssd::Error>
mdk::dnssd::detail::DnsQuestion::read(const BufferView<const uint8_t> message, size_t& offset) {
    size_t cursor = offset;
    auto name = DnsName::read(message, cursor);
    if (!name) {
        return tl::unexpected(name.error());
    }

    if (cursor + k_question_fixed_size > message.size()) {
        return tl::unexpected(Error::malformed_packet);
    }

    DnsQuestion question;
    question.name = std::move(*name);
    question.type = message.read_be<uint16_t>(cursor);
    const auto klass = message.read_be<uint16_t>(cursor + 2);
    question.klass = klass & k_class_mask;
    question.unicast_response = (klass & k_class_top_bit) != 0;

    offset = cursor + k_question_fixed_size;
    return question;
}

bool mdk::dnssd::detail::DnsQuestion::write_to(ByteBuffer& buffer) const {
    if (!name.write_to(buffer)) {
        return false;
    }
    buffer.write_be(type);
    buffer.write_be(static_cast<uint16_t>(klass | (unicast_response ? k_class_top_bit : 0)));
    return true;
}

tl::expected<mdk::dnssd::detail::DnsResourceRecord, mdk::dnssd::Error>
mdk::dnssd::detail::DnsResourceRecord::read(const BufferView<const uint8_t> message, size_t& offset) {
    size_t cursor = offset;
    auto name = DnsName::read(message, cursor);
    if (!name) {
        return tl::unexpected(name.error());
    }

    if (cursor + k_record_fixed_size > message.size()) {
        return tl::unexpected(Error::malformed_packet);
    }

    DnsResourceRecord record;
    record.name = std::move(*name);
    record.type = message.read_be<uint16_t>(cursor);
    const auto klass = message.read_be<uint16_t>(cursor + 2);
    record.klass = klass & k_class_mask;
    record.cache_flush = (klass & k_class_top_bit) != 0;
    record.ttl = message.read_be<uint32_t>(cursor + 4);
    const size_t rdlength = message.read_be<uint16_t>(cursor + 8);
    cursor += k_record_fixed_size;

    if (cursor + rdlength > message.size()) {
        return tl::unexpected(Error::malformed_packet);
    }

    auto data = read_record_data(record.type, message, cursor, rdlength);
    if (!data) {
        return tl::unexpected(data.error());
    }
    record.data = std::move(*data);

    offset = cursor + rdlength;
    return record;
}

bool mdk::dnssd::detail::DnsResourceRecord::write_to(ByteBuffer& buffer) const {
    ByteBuffer rdata;

    const auto ok = std::visit(
        [&rdata](auto&& arg) -> bool {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, RawData>) {
                rdata.write(arg.bytes.data(), arg.bytes.size());
                return true;
            } else if constexpr (std::is_same_v<T, PtrData>) {
                return arg.target.write_to(rdata);
            } else if constexpr (std::is_same_v<T, SrvData>) {
                rdata.write_be(arg.priority);
                rdata.write_be(arg.weight);
                rdata.write_be(arg.port);
                return arg.target.write_to(rdata);
            } else if constexpr (std::is_same_v<T, TxtData>) {
                if (arg.strings.empty()) {
                    rdata.write_be<uint8_t>(0);
                    return true;
                }
                for (auto& string : arg.strings) {
                    if (string.size() > 255) {
                        return false;
                    }
                    rdata.write_be(static_cast<uint8_t>(string.size()));
                    rdata.write(reinterpret_cast<const uint8_t*>(string.data()), string.size());
                }
                return true;
            } else if constexpr (std::is_same_v<T, AddressData>) {
                if (arg.address.is_v4()) {
                    const auto bytes = arg.address.to_v4().to_bytes();
                    rdata.write(bytes.data(), bytes.size());
                } else {
                    const auto bytes = arg.address.to_v6().to_bytes();
                    rdata.write(bytes.data(), bytes.size());
                }
                return true;
            } else {
                static_assert(always_false<T>::value, "Unhandled record data type");
                return false;
            }
        },
        data
    );

    if (!ok || rdata.size() > 0xffff) {
        return false;
    }

    if (!name.write_to(buffer)) {
        return false;
    }
    buffer.write_be(type);
    buffer.write_be(static_cast<uint16_t>(klass | (cache_flush ? k_class_top_bit : 0)));
    buffer.write_be(ttl);
    buffer.write_be(static_cast<uint16_t>(rdata.size()));
    buffer.write(rdata.data(), rdata.size());
    return true;
}
