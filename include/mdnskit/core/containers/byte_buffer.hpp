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

#include "mdnskit/core/byte_order.hpp"

#include <utility>
#include <vector>

namespace mdk {

/**
 * Growable output buffer for encoding DNS messages. Integers are written in network byte order.
 */
class ByteBuffer {
  public:
    /**
     * @return A pointer to the data in the buffer.
     */
    [[nodiscard]] const uint8_t* data() const {
        return data_.data();
    }

    /**
     * @return The current size of the buffer.
     */
    [[nodiscard]] size_t size() const {
        return data_.size();
    }

    /**
     * Appends given data to the buffer.
     * @param data The data to append.
     * @param size The size of the data.
     */
    void write(const uint8_t* data, const size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    /**
     * Writes a big-endian value to the buffer.
     * @tparam Type The type of the value to write.
     * @param value The value to write.
     */
    template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
    void write_be(const Type value) {
        uint8_t bytes[sizeof(Type)];
        mdk::write_be(bytes, value);
        write(bytes, sizeof(Type));
    }

    /**
     * @return The contents of the buffer, moved out. The buffer is empty afterwards.
     */
    [[nodiscard]] std::vector<uint8_t> release() {
        return std::exchange(data_, {});
    }

  private:
    std::vector<uint8_t> data_;
};

}  // namespace mdk
