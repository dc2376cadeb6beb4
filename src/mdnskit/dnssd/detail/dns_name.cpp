/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/detail/dns_name.hpp"

#include "mdnskit/core/string.hpp"

#include <optional>

namespace {

constexpr uint8_t k_label_type_mask = 0xc0;
constexpr uint8_t k_label_type_pointer = 0xc0;
constexpr uint8_t k_label_type_normal = 0x00;

}  // namespace

mdk::dnssd::detail::DnsName::DnsName(std::vector<std::string> labels) : labels_(std::move(labels)) {}

tl::expected<mdk::dnssd::detail::DnsName, mdk::dnssd::Error>
mdk::dnssd::detail::DnsName::read(const BufferView<const uint8_t> message, size_t& offset) {
    std::vector<std::string> labels;
    size_t cursor = offset;
    size_t segment_start = offset;
    size_t name_length = 1;  // Terminating zero
    std::optional<size_t> end_of_name;
    int jumps = 0;

    while (true) {
        if (cursor >= message.size()) {
            return tl::unexpected(Error::malformed_packet);
        }

        const auto length = message[cursor];

        if ((length & k_label_type_mask) == k_label_type_pointer) {
            if (cursor + 2 > message.size()) {
                return tl::unexpected(Error::malformed_packet);
            }
            const size_t target = message.read_be<uint16_t>(cursor) & 0x3fff;
            if (target >= segment_start) {
                return tl::unexpected(Error::malformed_packet);
            }
            if (++jumps > k_max_pointer_jumps) {
                return tl::unexpected(Error::malformed_packet);
            }
            if (!end_of_name) {
                end_of_name = cursor + 2;
            }
            cursor = target;
            segment_start = target;
            continue;
        }

        if ((length & k_label_type_mask) != k_label_type_normal) {
            return tl::unexpected(Error::malformed_packet);
        }

        if (length == 0) {
            if (!end_of_name) {
                end_of_name = cursor + 1;
            }
            break;
        }

        if (cursor + 1 + length > message.size()) {
            return tl::unexpected(Error::malformed_packet);
        }

        name_length += length + 1u;
        if (name_length > k_max_name_length) {
            return tl::unexpected(Error::malformed_packet);
        }

        labels.emplace_back(reinterpret_cast<const char*>(message.data() + cursor + 1), length);
        cursor += 1 + length;
    }

    offset = *end_of_name;
    return DnsName(std::move(labels));
}

bool mdk::dnssd::detail::DnsName::write_to(ByteBuffer& buffer) const {
    size_t name_length = 1;
    for (auto& label : labels_) {
        if (label.empty() || label.size() > k_max_label_length) {
            return false;
        }
        name_length += label.size() + 1;
    }
    if (name_length > k_max_name_length) {
        return false;
    }

    for (auto& label : labels_) {
        buffer.write_be(static_cast<uint8_t>(label.size()));
        buffer.write(reinterpret_cast<const uint8_t*>(label.data()), label.size());
    }
    buffer.write_be<uint8_t>(0);
    return true;
}

mdk::dnssd::detail::DnsName mdk::dnssd::detail::DnsName::suffix(const size_t count) const {
    if (count >= labels_.size()) {
        return {};
    }
    return DnsName(std::vector<std::string>(labels_.begin() + static_cast<std::ptrdiff_t>(count), labels_.end()));
}

std::string mdk::dnssd::detail::DnsName::to_string() const {
    std::string result;
    for (auto& label : labels_) {
        if (!result.empty()) {
            result += '.';
        }
        result += label;
    }
    return result;
}

std::string mdk::dnssd::detail::DnsName::to_key() const {
    return string_to_lower(to_string());
}

namespace mdk::dnssd::detail {

bool operator==(const DnsName& lhs, const DnsName& rhs) {
    if (lhs.labels_.size() != rhs.labels_.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.labels_.size(); ++i) {
        if (!string_compare_case_insensitive(lhs.labels_[i], rhs.labels_[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace mdk::dnssd::detail
