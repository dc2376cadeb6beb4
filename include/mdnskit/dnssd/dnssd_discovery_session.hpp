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

#include "dnssd_events.hpp"
#include "dnssd_resolver.hpp"
#include "dnssd_service_cache.hpp"
#include "dnssd_service_type.hpp"
#include "dnssd_transport.hpp"
#include "mdnskit/core/net/timer/asio_timer.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace mdk::dnssd {

/**
 * Browses for one service type: joins the multicast group, queries periodically, feeds received advertisements into
 * the cache, expires instances and reports all changes to a listener.
 *
 * Lifecycle: idle -> listening -> stopping -> idle. A session can be reused after it went back to idle.
 *
 * Not thread safe: all calls must happen on the thread running the io_context, and the listener is called on that
 * thread. Use an EventQueue as listener to hand events over to another thread.
 */
class DiscoverySession: public Transport::Subscriber {
  public:
    enum class State { idle, listening, stopping };

    struct Configuration {
        /// The multicast group and port to join, query and listen on.
        boost::asio::ip::udp::endpoint multicast_endpoint {boost::asio::ip::make_address_v4("224.0.0.251"), 5353};
        /// Interval between queries. The first query is sent right after listen().
        std::chrono::milliseconds query_interval {4000};
        /// Interval between checks for expired instances.
        std::chrono::milliseconds sweep_interval {1000};
        /// How long a resolve waits for an answer.
        std::chrono::milliseconds resolve_timeout {3000};
        /// When false no queries are sent and only unsolicited announcements are picked up.
        bool send_queries {true};
        /// When true every found instance without endpoint is resolved right away.
        bool resolve_on_discovery {false};
    };

    struct Statistics {
        uint64_t packets_received {};
        uint64_t malformed_packets {};
        uint64_t queries_sent {};
        uint64_t send_failures {};
        uint64_t advertisements_merged {};

        /// Returns a description of this struct, which might be handy for debugging or logging purposes.
        [[nodiscard]] std::string to_string() const;
    };

    DiscoverySession(boost::asio::io_context& io_context, Transport& transport);
    DiscoverySession(boost::asio::io_context& io_context, Transport& transport, Configuration config);
    ~DiscoverySession() override;

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    DiscoverySession(DiscoverySession&&) = delete;
    DiscoverySession& operator=(DiscoverySession&&) = delete;

    /**
     * Starts browsing. Valid from idle only. The cache is cleared, so every instance present on the network gets
     * reported as found again.
     * @param service_type The service type to browse for.
     * @param listener The listener receiving the events. Must stay valid until the session is stopped.
     * @return Nothing on success, Error::already_listening if not idle, or Error::network_unavailable if the multicast
     * group could not be joined (the session stays idle).
     */
    [[nodiscard]] tl::expected<void, Error> listen(const ServiceType& service_type, Listener* listener);

    /**
     * Stops browsing: cancels timers and pending resolves and leaves the multicast group. No events are emitted after
     * this function returns. Calling stop() while idle is a no-op.
     */
    void stop();

    /**
     * Resolves an instance, see Resolver::resolve.
     * @param key The instance to resolve.
     * @param callback The callback receiving the outcome.
     * @return Nothing if the resolve was started, Error::not_listening if the session isn't listening (the callback
     * will not be called in that case).
     */
    [[nodiscard]] tl::expected<void, Error> resolve(const InstanceKey& key, Resolver::ResolveCallback callback);

    /**
     * Resolves an instance of the service type this session is browsing for.
     * @param instance_name The instance name, i.e. "Printer A".
     * @param callback The callback receiving the outcome.
     * @return Nothing if the resolve was started, Error::not_listening if the session isn't listening.
     */
    [[nodiscard]] tl::expected<void, Error>
    resolve(const std::string& instance_name, Resolver::ResolveCallback callback);

    /**
     * @return The key of an instance of the service type this session is browsing for, or an empty optional if the
     * session was never started.
     */
    [[nodiscard]] std::optional<InstanceKey> make_key(const std::string& instance_name) const;

    [[nodiscard]] State state() const;

    /**
     * @return The service type of the current or last listen.
     */
    [[nodiscard]] const std::optional<ServiceType>& service_type() const;

    [[nodiscard]] const ServiceCache& cache() const;

    [[nodiscard]] const Statistics& statistics() const;

    // Transport::Subscriber overrides
    void on_receive(const Transport::Datagram& datagram) override;
    void on_transport_error(Error error, const std::string& detail) override;

  private:
    boost::asio::io_context& io_context_;
    Transport& transport_;
    Configuration config_;
    ServiceCache cache_;
    Resolver resolver_;
    AsioTimer query_timer_;
    AsioTimer sweep_timer_;
    State state_ {State::idle};
    std::optional<ServiceType> service_type_;
    Listener* listener_ {};
    Statistics statistics_;
    uint64_t generation_ {};

    [[nodiscard]] bool is_active(uint64_t generation) const;
    void send_query();
    void sweep();
    void handle_delta(const CacheDelta& delta);
    void emit(const Event& event) const;
};

const char* to_string(DiscoverySession::State state);

}  // namespace mdk::dnssd
