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

#include "mdnskit/core/assert.hpp"
#include "mdnskit/core/byte_order.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace mdk {

/**
 * Non-owning view over a datagram or part of one, similar to std::string_view.
 * @tparam Type The element type, usually const uint8_t.
 */
template<class Type>
class BufferView {
  public:
    BufferView() = default;

    /**
     * Construct a view pointing to given data.
     * @param data The data to refer to.
     * @param size The number of elements in the buffer.
     */
    BufferView(Type* data, const size_t size) : data_(data), size_(size) {
        if (data_ == nullptr) {
            size_ = 0;
        }
    }

    /**
     * Construct a view from a std::vector.
     * @param vector The vector to refer to.
     */
    explicit BufferView(const std::vector<std::remove_const_t<Type>>& vector) :
        BufferView(vector.data(), vector.size()) {}

    /**
     * @param index The index to access.
     * @returns Value for given index, without bounds checking.
     */
    Type& operator[](size_t index) const {
        return data_[index];
    }

    /**
     * @returns A pointer to the data, or nullptr if this view is not pointing at any data.
     */
    [[nodiscard]] Type* data() const {
        return data_;
    }

    /**
     * @returns The number of elements in the buffer.
     */
    [[nodiscard]] size_t size() const {
        return size_;
    }

    /**
     * @returns True if the buffer is empty.
     */
    [[nodiscard]] bool empty() const {
        return size_ == 0;
    }

    /**
     * Reads a big-endian value from the given data.
     * Bounds are asserted, and behaviour depends on the MDK_ASSERT configuration. Callers parsing untrusted data must
     * check the size first.
     * @tparam ValueType The type of the value to read.
     * @param offset The offset to read from.
     * @return The decoded value.
     */
    template<typename ValueType, std::enable_if_t<std::is_integral_v<ValueType>, bool> = true>
    ValueType read_be(const size_t offset) const {
        MDK_ASSERT(offset + sizeof(ValueType) <= size_ * sizeof(Type), "Buffer view out of bounds");
        return mdk::read_be<ValueType>(reinterpret_cast<const uint8_t*>(data_) + offset);
    }

    /**
     * @returns A new buffer_view pointing to a sub-range of this buffer.
     * @param offset The offset of the sub-range. Will be limited to the available size.
     * @param size The number of elements in the sub-range. The size will be limited to the available size.
     */
    [[nodiscard]] BufferView subview(size_t offset, const size_t size) const {
        offset = std::min(offset, size_);
        return BufferView(data_ + offset, std::min(size_ - offset, size));
    }

  private:
    Type* data_ {nullptr};
    size_t size_ {0};
};

}  // namespace mdk
