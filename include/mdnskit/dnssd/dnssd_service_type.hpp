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

#include "dnssd_error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mdk::dnssd {

/**
 * Identifies a DNS-SD service category, like "_http._tcp" in domain "local". Immutable after construction. All parts
 * are stored in lower case since DNS names compare case-insensitively.
 */
class ServiceType {
  public:
    static constexpr auto k_default_domain = "local";

    /**
     * Parses a service type string. Accepted forms: "_http._tcp", "_http._tcp.", "_http._tcp.local" and
     * "_http._tcp.local.". The service label must be 1 to 15 characters (letters, digits, hyphens) after the
     * underscore and the protocol label must be _tcp or _udp.
     * @param service_type The string to parse.
     * @return The parsed service type, or Error::invalid_service_type.
     */
    static tl::expected<ServiceType, Error> from_string(std::string_view service_type);

    /**
     * @return The service label including underscore, i.e. "_http".
     */
    [[nodiscard]] const std::string& service() const {
        return service_;
    }

    /**
     * @return The protocol label including underscore, i.e. "_tcp".
     */
    [[nodiscard]] const std::string& protocol() const {
        return protocol_;
    }

    /**
     * @return The domain without trailing dot, i.e. "local".
     */
    [[nodiscard]] const std::string& domain() const {
        return domain_;
    }

    /**
     * @return The service and protocol labels, i.e. "_http._tcp".
     */
    [[nodiscard]] std::string reg_type() const;

    /**
     * @return The full name used as PTR query name, i.e. "_http._tcp.local".
     */
    [[nodiscard]] std::string fullname() const;

    /**
     * @return The DNS labels of the full name, i.e. {"_http", "_tcp", "local"}.
     */
    [[nodiscard]] std::vector<std::string> labels() const;

    /**
     * Tests whether given registration type and domain denote this service type, ignoring case.
     * @param reg_type The registration type, i.e. "_http._tcp".
     * @param domain The domain, i.e. "local".
     */
    [[nodiscard]] bool matches(std::string_view reg_type, std::string_view domain) const;

    [[nodiscard]] std::string to_string() const {
        return fullname();
    }

    friend bool operator==(const ServiceType& lhs, const ServiceType& rhs) {
        return lhs.service_ == rhs.service_ && lhs.protocol_ == rhs.protocol_ && lhs.domain_ == rhs.domain_;
    }

    friend bool operator!=(const ServiceType& lhs, const ServiceType& rhs) {
        return !(lhs == rhs);
    }

  private:
    std::string service_;
    std::string protocol_;
    std::string domain_;

    ServiceType(std::string service, std::string protocol, std::string domain);
};

}  // namespace mdk::dnssd
