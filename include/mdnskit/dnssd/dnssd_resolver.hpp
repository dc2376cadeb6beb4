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

#include "dnssd_service_cache.hpp"
#include "dnssd_transport.hpp"
#include "mdnskit/dnssd/dnssd_error.hpp"
#include "mdnskit/core/net/timer/asio_timer.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace mdk::dnssd {

/**
 * Turns instances into endpoints. Answers from the cache when possible, otherwise sends a targeted query and waits for
 * the answer to be merged into the cache. Concurrent requests for the same instance share one query and one outcome.
 * Not thread safe: all calls must happen on the io_context thread.
 */
class Resolver {
  public:
    struct Configuration {
        /// How long to wait for an answer to a resolve query.
        std::chrono::milliseconds timeout {3000};
        /// Where resolve queries are sent to.
        boost::asio::ip::udp::endpoint multicast_endpoint {boost::asio::ip::make_address_v4("224.0.0.251"), 5353};
    };

    using Result = tl::expected<std::shared_ptr<const ResolvedEndpoint>, Error>;
    using ResolveCallback = std::function<void(const Result& result)>;

    Resolver(boost::asio::io_context& io_context, Transport& transport, ServiceCache& cache, Configuration config);
    ~Resolver();

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    Resolver(Resolver&&) = delete;
    Resolver& operator=(Resolver&&) = delete;

    /**
     * Resolves the given instance. The callback is always invoked asynchronously, exactly once, with one of:
     *  - the endpoint, when the instance is or becomes resolved;
     *  - Error::instance_not_found, when the instance is not in the cache or gets removed while resolving;
     *  - Error::resolution_timeout, when no answer arrived in time;
     *  - Error::send_failed, when the query could not be sent;
     *  - Error::cancelled, when cancel_all() is called.
     * @param key The instance to resolve.
     * @param callback The callback receiving the outcome.
     */
    void resolve(const InstanceKey& key, ResolveCallback callback);

    /**
     * Must be called when the cache attached a new endpoint to an instance. Completes a pending resolve.
     * @param key The instance which was updated.
     */
    void on_instance_updated(const InstanceKey& key);

    /**
     * Must be called when an instance was removed from the cache. Fails a pending resolve with
     * Error::instance_not_found.
     * @param key The instance which was removed.
     */
    void on_instance_removed(const InstanceKey& key);

    /**
     * Fails all pending resolves with Error::cancelled.
     */
    void cancel_all();

    /**
     * @return True if a query for the instance is in flight.
     */
    [[nodiscard]] bool is_pending(const InstanceKey& key) const;

    /**
     * @return The number of instances with a query in flight.
     */
    [[nodiscard]] size_t pending_count() const;

  private:
    struct PendingResolve {
        uint16_t transaction_id {};
        std::vector<ResolveCallback> callbacks;
        std::shared_ptr<AsioTimer> timeout_timer;
    };

    boost::asio::io_context& io_context_;
    Transport& transport_;
    ServiceCache& cache_;
    Configuration config_;
    std::map<InstanceKey, PendingResolve> pending_;

    void complete(const InstanceKey& key, const Result& result);
    void post_result(ResolveCallback callback, Result result);
};

}  // namespace mdk::dnssd
