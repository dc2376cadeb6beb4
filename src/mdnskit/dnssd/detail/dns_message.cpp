/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/detail/dns_message.hpp"

namespace {

// Smallest encodings: root name + type + class for a question, plus ttl and rdlength for a record.
constexpr size_t k_min_question_size = 5;
constexpr size_t k_min_record_size = 11;

tl::expected<void, mdk::dnssd::Error> read_records(
    const mdk::BufferView<const uint8_t> data, size_t& offset, const uint16_t count,
    std::vector<mdk::dnssd::detail::DnsResourceRecord>& records
) {
    records.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        auto record = mdk::dnssd::detail::DnsResourceRecord::read(data, offset);
        if (!record) {
            return tl::unexpected(record.error());
        }
        records.push_back(std::move(*record));
    }
    return {};
}

bool write_records(const std::vector<mdk::dnssd::detail::DnsResourceRecord>& records, mdk::ByteBuffer& buffer) {
    for (auto& record : records) {
        if (!record.write_to(buffer)) {
            return false;
        }
    }
    return true;
}

}  // namespace

tl::expected<mdk::dnssd::detail::DnsMessage, mdk::dnssd::Error>
mdk::dnssd::detail::DnsMessage::from_data(const BufferView<const uint8_t> data) {
    if (data.size() < k_header_size) {
        return tl::unexpected(Error::malformed_packet);
    }

    DnsMessage message;
    message.id = data.read_be<uint16_t>(0);
    message.flags = data.read_be<uint16_t>(2);
    const auto qdcount = data.read_be<uint16_t>(4);
    const auto ancount = data.read_be<uint16_t>(6);
    const auto nscount = data.read_be<uint16_t>(8);
    const auto arcount = data.read_be<uint16_t>(10);

    const size_t min_size = k_header_size + qdcount * k_min_question_size
        + (static_cast<size_t>(ancount) + nscount + arcount) * k_min_record_size;
    if (min_size > data.size()) {
        return tl::unexpected(Error::malformed_packet);
    }

    size_t offset = k_header_size;

    message.questions.reserve(qdcount);
    for (uint16_t i = 0; i < qdcount; ++i) {
        auto question = DnsQuestion::read(data, offset);
        if (!question) {
            return tl::unexpected(question.error());
        }
        message.questions.push_back(std::move(*question));
    }

    if (auto result = read_records(data, offset, ancount, message.answers); !result) {
        return tl::unexpected(result.error());
    }
    if (auto result = read_records(data, offset, nscount, message.authorities); !result) {
        return tl::unexpected(result.error());
    }
    if (auto result = read_records(data, offset, arcount, message.additionals); !result) {
        return tl::unexpected(result.error());
    }

    return message;
}

bool mdk::dnssd::detail::DnsMessage::write_to(ByteBuffer& buffer) const {
    if (questions.size() > 0xffff || answers.size() > 0xffff || authorities.size() > 0xffff
        || additionals.size() > 0xffff) {
        return false;
    }

    ByteBuffer out;
    out.write_be(id);
    out.write_be(flags);
    out.write_be(static_cast<uint16_t>(questions.size()));
    out.write_be(static_cast<uint16_t>(answers.size()));
    out.write_be(static_cast<uint16_t>(authorities.size()));
    out.write_be(static_cast<uint16_t>(additionals.size()));

    for (auto& question : questions) {
        if (!question.write_to(out)) {
            return false;
        }
    }

    if (!write_records(answers, out) || !write_records(authorities, out) || !write_records(additionals, out)) {
        return false;
    }

    buffer.write(out.data(), out.size());
    return true;
}
