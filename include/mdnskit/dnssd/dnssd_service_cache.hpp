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

#include "dnssd_advertisement.hpp"
#include "dnssd_service_instance.hpp"

#include <map>
#include <optional>
#include <vector>

namespace mdk::dnssd {

/**
 * Describes the effect of a change to the cache.
 */
struct CacheDelta {
    enum class Kind { found, updated, no_change, lost };

    Kind kind {Kind::no_change};
    InstanceKey key;
    /// Snapshot of the instance after the change. For Kind::lost the state is ResolutionState::expired and the
    /// endpoint is cleared.
    ServiceInstance instance;
    /// True if the change attached a new endpoint to the instance.
    bool endpoint_changed {};
    /// True if the new endpoint replaced an earlier one.
    bool endpoint_replaced {};
    /// True if the endpoint was withdrawn. The instance is unresolved again.
    bool endpoint_removed {};
    /// For Kind::found: an entry for the same key had expired and was removed first. It counts as lost before the
    /// instance is found again.
    bool expired_before {};
};

const char* to_string(CacheDelta::Kind kind);

/**
 * Authoritative store of the discovered service instances. All other components read instance state through the
 * cache. Not thread safe.
 */
class ServiceCache {
  public:
    /**
     * Lazy sequence of the instances which expired as of a point in time. Each call to next() removes one expired
     * instance from the cache and returns its lost delta. The cache must not be modified otherwise while a sweep is in
     * progress.
     */
    class Sweep {
      public:
        /**
         * @return The next expired instance, or an empty optional when there are no more.
         */
        std::optional<CacheDelta> next();

      private:
        friend class ServiceCache;

        std::map<InstanceKey, ServiceInstance>& instances_;
        std::map<InstanceKey, ServiceInstance>::iterator it_;
        Clock::time_point now_;

        Sweep(std::map<InstanceKey, ServiceInstance>& instances, Clock::time_point now);
    };

    ServiceCache() = default;

    /**
     * Merges an advertisement into the cache.
     *  - A new instance is inserted and reported as found.
     *  - An instance whose deadline passed before `now` is removed first. A refresh of it is reported as found with
     *    CacheDelta::expired_before set, a withdrawal as lost.
     *  - An advertisement with TTL 0 removes the instance and reports it as lost.
     *  - An advertisement carrying an endpoint different from the cached one replaces the endpoint and is reported as
     *    updated.
     *  - An advertisement withdrawing the endpoint clears it and is reported as updated with
     *    CacheDelta::endpoint_removed set.
     *  - Otherwise the instance is refreshed and the change is reported as no_change.
     * @param advertisement The advertisement to merge.
     * @param now The time the advertisement was received.
     * @return The delta describing the change.
     */
    CacheDelta merge(const ServiceAdvertisement& advertisement, Clock::time_point now);

    /**
     * Starts a sweep for instances whose deadline has passed. Restartable: every call starts a new sweep.
     * @param now The reference time.
     * @return The sweep, which yields the lost deltas.
     */
    [[nodiscard]] Sweep sweep(Clock::time_point now);

    /**
     * Removes the instance.
     * @param key The instance to remove.
     * @return The lost delta, or an empty optional if the instance is not in the cache.
     */
    std::optional<CacheDelta> withdraw(const InstanceKey& key);

    /**
     * @param key The instance to look up.
     * @return The instance, or nullptr if not found. The pointer is invalidated by the next modification.
     */
    [[nodiscard]] const ServiceInstance* lookup(const InstanceKey& key) const;

    /**
     * Marks an unresolved instance as resolving.
     * @return True if the state changed.
     */
    bool mark_resolving(const InstanceKey& key);

    /**
     * Marks a resolving instance as unresolved again, for example after a resolve timed out.
     * @return True if the state changed.
     */
    bool mark_unresolved(const InstanceKey& key);

    /**
     * @return A copy of all instances, ordered by key.
     */
    [[nodiscard]] std::vector<ServiceInstance> instances() const;

    void clear();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool empty() const;

  private:
    std::map<InstanceKey, ServiceInstance> instances_;

    static CacheDelta make_lost_delta(ServiceInstance instance);
};

}  // namespace mdk::dnssd
