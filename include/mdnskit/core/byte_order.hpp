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

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace mdk {

/**
 * Reads a big-endian (network order) integer.
 * @tparam Type The type of the value to read.
 * @param data The data which holds the encoded value, at least sizeof(Type) bytes.
 * @return The decoded value.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
Type read_be(const uint8_t* data) {
    std::make_unsigned_t<Type> value {};
    for (size_t i = 0; i < sizeof(Type); ++i) {
        value = static_cast<std::make_unsigned_t<Type>>((value << 8) | data[i]);
    }
    return static_cast<Type>(value);
}

/**
 * Writes a big-endian (network order) integer.
 * @tparam Type The type of the value to write.
 * @param dst The destination, at least sizeof(Type) bytes.
 * @param value The value to write.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
void write_be(uint8_t* dst, const Type value) {
    auto remaining = static_cast<std::make_unsigned_t<Type>>(value);
    for (size_t i = sizeof(Type); i > 0; --i) {
        dst[i - 1] = static_cast<uint8_t>(remaining & 0xff);
        remaining = static_cast<std::make_unsigned_t<Type>>(remaining >> 8);
    }
}

}  // namespace mdk
