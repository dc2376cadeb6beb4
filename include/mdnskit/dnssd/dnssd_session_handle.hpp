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

#include <cstdint>
#include <string>
#include <type_traits>

namespace mdk::dnssd {

/**
 * Identifies a session of a DiscoveryEngine. A default constructed handle is invalid.
 */
class SessionHandle {
  public:
    /**
     * Hands out increasing handles, starting at 1. Not thread safe.
     */
    class Generator {
      public:
        [[nodiscard]] SessionHandle next() {
            return SessionHandle(next_value_++);
        }

      private:
        uint64_t next_value_ {1};
    };

    SessionHandle() = default;

    explicit SessionHandle(const uint64_t value) : value_(value) {}

    [[nodiscard]] bool is_valid() const {
        return value_ != 0;
    }

    [[nodiscard]] uint64_t value() const {
        return value_;
    }

    [[nodiscard]] std::string to_string() const {
        return "session-" + std::to_string(value_);
    }

    friend bool operator==(const SessionHandle& lhs, const SessionHandle& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const SessionHandle& lhs, const SessionHandle& rhs) {
        return !(lhs == rhs);
    }

  private:
    uint64_t value_ {};
};

static_assert(std::is_trivially_copyable_v<SessionHandle>);

}  // namespace mdk::dnssd
