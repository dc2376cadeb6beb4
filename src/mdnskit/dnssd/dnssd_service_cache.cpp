/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_service_cache.hpp"

#include "mdnskit/core/log.hpp"

#include <algorithm>

const char* mdk::dnssd::to_string(const CacheDelta::Kind kind) {
    switch (kind) {
        case CacheDelta::Kind::found:
            return "found";
        case CacheDelta::Kind::updated:
            return "updated";
        case CacheDelta::Kind::no_change:
            return "no_change";
        case CacheDelta::Kind::lost:
            return "lost";
        default:
            return "unknown";
    }
}

mdk::dnssd::ServiceCache::Sweep::Sweep(std::map<InstanceKey, ServiceInstance>& instances, const Clock::time_point now) :
    instances_(instances), it_(instances.begin()), now_(now) {}

std::optional<mdk::dnssd::CacheDelta> mdk::dnssd::ServiceCache::Sweep::next() {
    while (it_ != instances_.end()) {
        if (it_->second.deadline() < now_) {
            auto instance = std::move(it_->second);
            it_ = instances_.erase(it_);
            MDK_TRACE("Instance expired: {}", instance.key.to_string());
            return make_lost_delta(std::move(instance));
        }
        ++it_;
    }
    return std::nullopt;
}

mdk::dnssd::CacheDelta
mdk::dnssd::ServiceCache::merge(const ServiceAdvertisement& advertisement, const Clock::time_point now) {
    auto it = instances_.find(advertisement.key);

    // An entry past its deadline is gone even if no sweep removed it yet. It must not be revived silently.
    bool expired = false;
    if (it != instances_.end() && it->second.deadline() < now) {
        MDK_TRACE("Instance expired before refresh: {}", advertisement.key.to_string());
        if (advertisement.ttl == 0) {
            auto instance = std::move(it->second);
            instances_.erase(it);
            return make_lost_delta(std::move(instance));
        }
        instances_.erase(it);
        it = instances_.end();
        expired = true;
    }

    if (advertisement.is_withdrawal()) {
        if (it == instances_.end()) {
            return {CacheDelta::Kind::no_change, advertisement.key, {}, false, false};
        }
        auto instance = std::move(it->second);
        instances_.erase(it);
        return make_lost_delta(std::move(instance));
    }

    if (it == instances_.end()) {
        if (advertisement.ttl == 0) {
            // Goodbye for the SRV record of an instance which isn't known.
            return {CacheDelta::Kind::no_change, advertisement.key, {}, false, false};
        }
        ServiceInstance instance;
        instance.key = advertisement.key;
        instance.discovered_at = now;
        instance.refreshed_at = now;
        instance.ttl_seconds = advertisement.ttl;
        if (advertisement.endpoint) {
            instance.endpoint = std::make_shared<const ResolvedEndpoint>(*advertisement.endpoint);
            instance.state = ResolutionState::resolved;
        }
        const auto result = instances_.emplace(advertisement.key, std::move(instance));
        CacheDelta delta {CacheDelta::Kind::found, advertisement.key, result.first->second};
        delta.endpoint_changed = advertisement.endpoint.has_value();
        delta.expired_before = expired;
        return delta;
    }

    auto& instance = it->second;

    if (advertisement.ttl > 0) {
        // Never move the deadline back in time because of a late packet.
        instance.refreshed_at = std::max(instance.refreshed_at, now);
        instance.ttl_seconds = advertisement.ttl;
    }

    if (advertisement.endpoint_withdrawn) {
        if (!instance.endpoint) {
            return {CacheDelta::Kind::no_change, advertisement.key, instance, false, false};
        }
        instance.endpoint.reset();
        instance.state = ResolutionState::unresolved;
        CacheDelta delta {CacheDelta::Kind::updated, advertisement.key, instance};
        delta.endpoint_removed = true;
        return delta;
    }

    if (advertisement.endpoint && (!instance.endpoint || *instance.endpoint != *advertisement.endpoint)) {
        const bool replaced = instance.endpoint != nullptr;
        instance.endpoint = std::make_shared<const ResolvedEndpoint>(*advertisement.endpoint);
        instance.state = ResolutionState::resolved;
        return {CacheDelta::Kind::updated, advertisement.key, instance, true, replaced};
    }

    return {CacheDelta::Kind::no_change, advertisement.key, instance, false, false};
}

mdk::dnssd::ServiceCache::Sweep mdk::dnssd::ServiceCache::sweep(const Clock::time_point now) {
    return Sweep(instances_, now);
}

std::optional<mdk::dnssd::CacheDelta> mdk::dnssd::ServiceCache::withdraw(const InstanceKey& key) {
    const auto it = instances_.find(key);
    if (it == instances_.end()) {
        return std::nullopt;
    }
    auto instance = std::move(it->second);
    instances_.erase(it);
    return make_lost_delta(std::move(instance));
}

const mdk::dnssd::ServiceInstance* mdk::dnssd::ServiceCache::lookup(const InstanceKey& key) const {
    const auto it = instances_.find(key);
    if (it == instances_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool mdk::dnssd::ServiceCache::mark_resolving(const InstanceKey& key) {
    const auto it = instances_.find(key);
    if (it == instances_.end() || it->second.state != ResolutionState::unresolved) {
        return false;
    }
    it->second.state = ResolutionState::resolving;
    return true;
}

bool mdk::dnssd::ServiceCache::mark_unresolved(const InstanceKey& key) {
    const auto it = instances_.find(key);
    if (it == instances_.end() || it->second.state != ResolutionState::resolving) {
        return false;
    }
    it->second.state = ResolutionState::unresolved;
    return true;
}

std::vector<mdk::dnssd::ServiceInstance> mdk::dnssd::ServiceCache::instances() const {
    std::vector<ServiceInstance> result;
    result.reserve(instances_.size());
    for (auto& [key, instance] : instances_) {
        result.push_back(instance);
    }
    return result;
}

void mdk::dnssd::ServiceCache::clear() {
    instances_.clear();
}

size_t mdk::dnssd::ServiceCache::size() const {
    return instances_.size();
}

bool mdk::dnssd::ServiceCache::empty() const {
    return instances_.empty();
}

mdk::dnssd::CacheDelta mdk::dnssd::ServiceCache::make_lost_delta(ServiceInstance instance) {
    instance.state = ResolutionState::expired;
    instance.endpoint.reset();
    auto key = instance.key;
    return {CacheDelta::Kind::lost, std::move(key), std::move(instance), false, false};
}
