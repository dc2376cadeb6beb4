/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_codec.hpp"

#include "mdnskit/core/log.hpp"
#include "mdnskit/core/string.hpp"
#include "mdnskit/dnssd/detail/dns_message.hpp"

#include <map>
#include <random>
#include <set>

namespace {

using mdk::dnssd::detail::AddressData;
using mdk::dnssd::detail::DnsMessage;
using mdk::dnssd::detail::DnsName;
using mdk::dnssd::detail::DnsQuestion;
using mdk::dnssd::detail::DnsResourceRecord;
using mdk::dnssd::detail::PtrData;
using mdk::dnssd::detail::SrvData;
using mdk::dnssd::detail::TxtData;
namespace record_type = mdk::dnssd::detail::record_type;

DnsName service_name(const mdk::dnssd::InstanceKey& key) {
    auto labels = mdk::string_split(key.reg_type, '.');
    for (auto& label : mdk::string_split(key.domain, '.')) {
        labels.push_back(std::move(label));
    }
    return DnsName(std::move(labels));
}

DnsName instance_name(const mdk::dnssd::InstanceKey& key) {
    std::vector<std::string> labels {key.name};
    for (auto& label : service_name(key).labels()) {
        labels.push_back(label);
    }
    return DnsName(std::move(labels));
}

std::vector<uint8_t> encode_message(const DnsMessage& message) {
    mdk::ByteBuffer buffer;
    if (!message.write_to(buffer)) {
        return {};
    }
    return buffer.release();
}

bool is_protocol_label(const std::string& label) {
    return mdk::string_compare_case_insensitive(label, "_tcp") || mdk::string_compare_case_insensitive(label, "_udp");
}

/**
 * @return True if the name has the form <instance>.<_service>.<_tcp|_udp>.<domain...>.
 */
bool is_instance_name(const DnsName& name) {
    const auto& labels = name.labels();
    return labels.size() >= 4 && mdk::string_starts_with(labels[1], "_") && is_protocol_label(labels[2]);
}

mdk::dnssd::InstanceKey to_instance_key(const DnsName& name) {
    const auto& labels = name.labels();
    mdk::dnssd::InstanceKey key;
    key.name = labels[0];
    key.reg_type = mdk::string_to_lower(labels[1] + "." + labels[2]);
    key.domain = name.suffix(3).to_key();
    return key;
}

struct Instance {
    DnsName name;
    uint32_t ttl {};
    /// False if the instance is only known from its SRV record.
    bool from_ptr {};
};

}  // namespace

uint16_t mdk::dnssd::make_transaction_id() {
    thread_local std::mt19937 generator {std::random_device {}()};
    std::uniform_int_distribution<uint32_t> distribution(1, 0xffff);
    return static_cast<uint16_t>(distribution(generator));
}

std::vector<uint8_t> mdk::dnssd::encode_query(const ServiceType& service_type, const uint16_t transaction_id) {
    DnsMessage message;
    message.id = transaction_id;

    DnsQuestion question;
    question.name = DnsName(service_type.labels());
    question.type = record_type::ptr;
    message.questions.push_back(std::move(question));

    return encode_message(message);
}

std::vector<uint8_t> mdk::dnssd::encode_resolve_query(const InstanceKey& key, const uint16_t transaction_id) {
    DnsMessage message;
    message.id = transaction_id;

    const auto name = instance_name(key);
    for (const auto type : {record_type::srv, record_type::txt}) {
        DnsQuestion question;
        question.name = name;
        question.type = type;
        message.questions.push_back(std::move(question));
    }

    return encode_message(message);
}

tl::expected<mdk::dnssd::DecodedResponse, mdk::dnssd::Error>
mdk::dnssd::decode_response(const BufferView<const uint8_t> data) {
    auto message = DnsMessage::from_data(data);
    if (!message) {
        return tl::unexpected(message.error());
    }

    DecodedResponse response;
    response.transaction_id = message->id;
    response.is_response = message->is_response();

    if (!message->is_response() || message->opcode() != 0 || message->rcode() != 0) {
        return response;
    }

    std::vector<Instance> instances;
    std::set<std::string> seen;
    std::map<std::string, const DnsResourceRecord*> srv_records;
    std::map<std::string, const DnsResourceRecord*> txt_records;
    std::map<std::string, const DnsResourceRecord*> address_records;

    // A live record replaces a goodbye (TTL 0) for the same name, so a goodbye followed by its replacement in one
    // message yields the replacement.
    auto keep = [](std::map<std::string, const DnsResourceRecord*>& records, const std::string& key,
                   const DnsResourceRecord& record) {
        const auto result = records.emplace(key, &record);
        if (!result.second && result.first->second->ttl == 0 && record.ttl > 0) {
            result.first->second = &record;
        }
    };

    auto collect = [&](const std::vector<DnsResourceRecord>& records) {
        for (auto& record : records) {
            const auto key = record.name.to_key();
            if (record.type == record_type::ptr) {
                const auto* ptr = std::get_if<PtrData>(&record.data);
                if (ptr == nullptr || !is_instance_name(ptr->target) || ptr->target.suffix(1) != record.name) {
                    continue;
                }
                if (seen.insert(ptr->target.to_key()).second) {
                    instances.push_back({ptr->target, record.ttl, true});
                }
            } else if (record.type == record_type::srv) {
                keep(srv_records, key, record);
            } else if (record.type == record_type::txt) {
                keep(txt_records, key, record);
            } else if (record.type == record_type::a || record.type == record_type::aaaa) {
                if (std::holds_alternative<AddressData>(record.data)) {
                    keep(address_records, key, record);
                }
            }
        }
    };

    collect(message->answers);
    collect(message->authorities);
    collect(message->additionals);

    // Instances for which only SRV records were received, like answers to a resolve query.
    for (auto& [key, record] : srv_records) {
        if (is_instance_name(record->name) && seen.insert(key).second) {
            instances.push_back({record->name, record->ttl, false});
        }
    }

    for (auto& instance : instances) {
        ServiceAdvertisement advertisement;
        advertisement.key = to_instance_key(instance.name);
        advertisement.ttl = instance.ttl;

        const auto name_key = instance.name.to_key();
        const auto srv_it = srv_records.find(name_key);
        if (srv_it != srv_records.end() && srv_it->second->ttl == 0) {
            // Only a goodbye for the SRV record. Unless the instance itself is withdrawn, its endpoint is.
            advertisement.endpoint_withdrawn = !instance.from_ptr || instance.ttl > 0;
        } else if (srv_it != srv_records.end()) {
            const auto& srv = std::get<SrvData>(srv_it->second->data);
            ResolvedEndpoint endpoint;
            endpoint.host_target = srv.target.to_string();
            endpoint.port = srv.port;

            if (const auto txt_it = txt_records.find(name_key);
                txt_it != txt_records.end() && txt_it->second->ttl > 0) {
                endpoint.txt = parse_txt_strings(std::get<TxtData>(txt_it->second->data).strings);
            }

            if (const auto address_it = address_records.find(srv.target.to_key());
                address_it != address_records.end() && address_it->second->ttl > 0) {
                endpoint.address = std::get<AddressData>(address_it->second->data).address;
            }

            advertisement.endpoint = std::move(endpoint);
        }

        response.advertisements.push_back(std::move(advertisement));
    }

    return response;
}

mdk::dnssd::TxtRecord mdk::dnssd::parse_txt_strings(const std::vector<std::string>& strings) {
    TxtRecord txt;
    std::set<std::string> keys;

    for (auto& string : strings) {
        const auto separator = string.find('=');
        auto key = string.substr(0, separator);
        if (key.empty()) {
            continue;
        }
        if (!keys.insert(string_to_lower(key)).second) {
            MDK_TRACE("Ignoring duplicate TXT key: {}", key);
            continue;
        }
        txt.emplace(std::move(key), separator == std::string::npos ? std::string() : string.substr(separator + 1));
    }

    return txt;
}
