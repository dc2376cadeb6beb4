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

#include "mdnskit/core/containers/buffer_view.hpp"
#include "mdnskit/core/containers/byte_buffer.hpp"
#include "mdnskit/dnssd/dnssd_error.hpp"

#include <string>
#include <vector>

namespace mdk::dnssd::detail {

/**
 * A domain name as a sequence of labels. Labels are stored as received (raw bytes, no escaping) which means that a
 * label may contain dots and spaces.
 */
class DnsName {
  public:
    static constexpr size_t k_max_label_length = 63;
    static constexpr size_t k_max_name_length = 255;
    static constexpr int k_max_pointer_jumps = 16;

    DnsName() = default;
    explicit DnsName(std::vector<std::string> labels);

    /**
     * Reads a name from a message, following compression pointers. A pointer must point strictly before the start of
     * the label sequence containing it, which rules out loops.
     * @param message The complete message, pointers are relative to its start.
     * @param offset The offset of the name. Will be advanced to the first byte after the name (after the first
     * pointer if the name is compressed).
     * @return The name, or Error::malformed_packet.
     */
    static tl::expected<DnsName, Error> read(BufferView<const uint8_t> message, size_t& offset);

    /**
     * Writes the name to the buffer in uncompressed form.
     * @param buffer The buffer to write to.
     * @return False if a label or the name exceeds the maximum length, in which case nothing was written.
     */
    [[nodiscard]] bool write_to(ByteBuffer& buffer) const;

    [[nodiscard]] const std::vector<std::string>& labels() const {
        return labels_;
    }

    [[nodiscard]] bool empty() const {
        return labels_.empty();
    }

    /**
     * @param count The number of leading labels to drop.
     * @return A name made of the labels after the first count labels.
     */
    [[nodiscard]] DnsName suffix(size_t count) const;

    /**
     * @return The name with labels joined by dots and without trailing dot, i.e. "_http._tcp.local".
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @return The name in lower case, suitable as lookup key.
     */
    [[nodiscard]] std::string to_key() const;

    /**
     * Compares two names, ignoring case.
     */
    friend bool operator==(const DnsName& lhs, const DnsName& rhs);

    friend bool operator!=(const DnsName& lhs, const DnsName& rhs) {
        return !(lhs == rhs);
    }

  private:
    std::vector<std::string> labels_;
};

}  // namespace mdk::dnssd::detail
