/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_service_type.hpp"

#include "mdnskit/core/string.hpp"

#include <cctype>

namespace {

constexpr size_t k_max_service_label_length = 15;
constexpr size_t k_max_label_length = 63;

bool is_valid_service_label(const std::string& label) {
    if (label.size() < 2 || label.size() > k_max_service_label_length + 1 || label.front() != '_') {
        return false;
    }
    if (label[1] == '-' || label.back() == '-') {
        return false;
    }
    for (size_t i = 1; i < label.size(); ++i) {
        const auto c = static_cast<unsigned char>(label[i]);
        if (!std::isalnum(c) && c != '-') {
            return false;
        }
    }
    return true;
}

}  // namespace

mdk::dnssd::ServiceType::ServiceType(std::string service, std::string protocol, std::string domain) :
    service_(std::move(service)), protocol_(std::move(protocol)), domain_(std::move(domain)) {}

tl::expected<mdk::dnssd::ServiceType, mdk::dnssd::Error>
mdk::dnssd::ServiceType::from_string(std::string_view service_type) {
    if (string_ends_with(service_type, ".")) {
        service_type.remove_suffix(1);
    }

    const auto labels = string_split(string_to_lower(service_type), '.');
    if (labels.size() < 2) {
        return tl::unexpected(Error::invalid_service_type);
    }

    if (!is_valid_service_label(labels[0])) {
        return tl::unexpected(Error::invalid_service_type);
    }

    if (labels[1] != "_tcp" && labels[1] != "_udp") {
        return tl::unexpected(Error::invalid_service_type);
    }

    std::string domain;
    for (size_t i = 2; i < labels.size(); ++i) {
        if (labels[i].empty() || labels[i].size() > k_max_label_length) {
            return tl::unexpected(Error::invalid_service_type);
        }
        if (!domain.empty()) {
            domain += '.';
        }
        domain += labels[i];
    }

    if (domain.empty()) {
        domain = k_default_domain;
    }

    return ServiceType(labels[0], labels[1], std::move(domain));
}

std::string mdk::dnssd::ServiceType::reg_type() const {
    return service_ + "." + protocol_;
}

std::string mdk::dnssd::ServiceType::fullname() const {
    return reg_type() + "." + domain_;
}

std::vector<std::string> mdk::dnssd::ServiceType::labels() const {
    std::vector<std::string> result {service_, protocol_};
    for (auto& label : string_split(domain_, '.')) {
        result.push_back(std::move(label));
    }
    return result;
}

bool mdk::dnssd::ServiceType::matches(const std::string_view reg_type, const std::string_view domain) const {
    return string_compare_case_insensitive(reg_type, this->reg_type())
        && string_compare_case_insensitive(domain, domain_);
}
