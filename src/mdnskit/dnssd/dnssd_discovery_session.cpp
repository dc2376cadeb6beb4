/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_discovery_session.hpp"

#include "mdnskit/core/log.hpp"
#include "mdnskit/dnssd/dnssd_codec.hpp"

#include <fmt/format.h>

std::string mdk::dnssd::DiscoverySession::Statistics::to_string() const {
    return fmt::format(
        "packets_received: {}, malformed_packets: {}, queries_sent: {}, send_failures: {}, advertisements_merged: {}",
        packets_received, malformed_packets, queries_sent, send_failures, advertisements_merged
    );
}

mdk::dnssd::DiscoverySession::DiscoverySession(boost::asio::io_context& io_context, Transport& transport) :
    DiscoverySession(io_context, transport, Configuration {}) {}

mdk::dnssd::DiscoverySession::DiscoverySession(
    boost::asio::io_context& io_context, Transport& transport, Configuration config
) :
    io_context_(io_context),
    transport_(transport),
    config_(std::move(config)),
    resolver_(io_context, transport, cache_, {config_.resolve_timeout, config_.multicast_endpoint}),
    query_timer_(io_context),
    sweep_timer_(io_context) {}

mdk::dnssd::DiscoverySession::~DiscoverySession() {
    stop();
}

tl::expected<void, mdk::dnssd::Error>
mdk::dnssd::DiscoverySession::listen(const ServiceType& service_type, Listener* listener) {
    if (state_ != State::idle) {
        return tl::unexpected(Error::already_listening);
    }

    MDK_ASSERT_RETURN_WITH(listener != nullptr, "Listener should not be nullptr", tl::unexpected(Error::not_listening));

    if (auto result = transport_.join(this, config_.multicast_endpoint); !result) {
        MDK_ERROR("Failed to listen for {}: {}", service_type.to_string(), dnssd::to_string(result.error()));
        return tl::unexpected(result.error());
    }

    service_type_ = service_type;
    listener_ = listener;
    statistics_ = {};
    cache_.clear();
    ++generation_;
    state_ = State::listening;

    sweep_timer_.start(config_.sweep_interval, [this] {
        sweep();
    });

    if (config_.send_queries) {
        query_timer_.once(std::chrono::milliseconds(0), [this] {
            send_query();
            if (state_ == State::listening) {
                query_timer_.start(config_.query_interval, [this] {
                    send_query();
                });
            }
        });
    }

    MDK_DEBUG("Listening for {}", service_type.to_string());
    return {};
}

void mdk::dnssd::DiscoverySession::stop() {
    if (state_ != State::listening) {
        return;
    }

    state_ = State::stopping;
    query_timer_.stop();
    sweep_timer_.stop();
    resolver_.cancel_all();
    transport_.leave(this);
    listener_ = nullptr;
    ++generation_;
    state_ = State::idle;

    MDK_DEBUG("Stopped listening for {} ({})", service_type_->to_string(), statistics_.to_string());
}

tl::expected<void, mdk::dnssd::Error>
mdk::dnssd::DiscoverySession::resolve(const InstanceKey& key, Resolver::ResolveCallback callback) {
    if (state_ != State::listening) {
        return tl::unexpected(Error::not_listening);
    }
    resolver_.resolve(key, std::move(callback));
    return {};
}

tl::expected<void, mdk::dnssd::Error>
mdk::dnssd::DiscoverySession::resolve(const std::string& instance_name, Resolver::ResolveCallback callback) {
    const auto key = make_key(instance_name);
    if (!key) {
        return tl::unexpected(Error::not_listening);
    }
    return resolve(*key, std::move(callback));
}

std::optional<mdk::dnssd::InstanceKey>
mdk::dnssd::DiscoverySession::make_key(const std::string& instance_name) const {
    if (!service_type_) {
        return std::nullopt;
    }
    return InstanceKey {instance_name, service_type_->reg_type(), service_type_->domain()};
}

mdk::dnssd::DiscoverySession::State mdk::dnssd::DiscoverySession::state() const {
    return state_;
}

const std::optional<mdk::dnssd::ServiceType>& mdk::dnssd::DiscoverySession::service_type() const {
    return service_type_;
}

const mdk::dnssd::ServiceCache& mdk::dnssd::DiscoverySession::cache() const {
    return cache_;
}

const mdk::dnssd::DiscoverySession::Statistics& mdk::dnssd::DiscoverySession::statistics() const {
    return statistics_;
}

void mdk::dnssd::DiscoverySession::on_receive(const Transport::Datagram& datagram) {
    if (state_ != State::listening) {
        return;
    }

    ++statistics_.packets_received;

    auto response = decode_response(datagram.data);
    if (!response) {
        ++statistics_.malformed_packets;
        MDK_TRACE(
            "Dropping malformed packet from {}:{} ({} bytes)", datagram.source.address().to_string(),
            datagram.source.port(), datagram.data.size()
        );
        return;
    }

    const auto now = Clock::now();
    const auto generation = generation_;

    for (auto& advertisement : response->advertisements) {
        if (!service_type_->matches(advertisement.key.reg_type, advertisement.key.domain)) {
            continue;
        }
        ++statistics_.advertisements_merged;
        handle_delta(cache_.merge(advertisement, now));
        if (!is_active(generation)) {
            return;  // Stopped or restarted by the listener
        }
    }
}

void mdk::dnssd::DiscoverySession::on_transport_error(const Error error, const std::string& detail) {
    if (state_ != State::listening) {
        return;
    }

    MDK_ERROR("Transport failure while listening for {}: {}", service_type_->to_string(), detail);

    const auto generation = generation_;
    emit(SessionError {error, detail});
    if (is_active(generation)) {
        stop();
    }
}

bool mdk::dnssd::DiscoverySession::is_active(const uint64_t generation) const {
    return state_ == State::listening && generation == generation_;
}

void mdk::dnssd::DiscoverySession::send_query() {
    if (state_ != State::listening) {
        return;
    }

    const auto transaction_id = make_transaction_id();
    const auto query = encode_query(*service_type_, transaction_id);

    if (auto result = transport_.send(BufferView<const uint8_t>(query), config_.multicast_endpoint); !result) {
        ++statistics_.send_failures;
        MDK_ERROR("Failed to send query for {}: {}", service_type_->to_string(), dnssd::to_string(result.error()));
        return;
    }

    ++statistics_.queries_sent;
    MDK_TRACE("Sent query for {} (transaction {})", service_type_->to_string(), transaction_id);
}

void mdk::dnssd::DiscoverySession::sweep() {
    if (state_ != State::listening) {
        return;
    }

    const auto generation = generation_;
    auto expired = cache_.sweep(Clock::now());
    while (auto delta = expired.next()) {
        handle_delta(*delta);
        if (!is_active(generation)) {
            return;
        }
    }
}

void mdk::dnssd::DiscoverySession::handle_delta(const CacheDelta& delta) {
    const auto generation = generation_;

    switch (delta.kind) {
        case CacheDelta::Kind::found: {
            if (delta.expired_before) {
                emit(ServiceLost {delta.key});
                if (!is_active(generation)) {
                    return;
                }
                resolver_.on_instance_removed(delta.key);
            }
            emit(ServiceFound {delta.instance});
            if (!is_active(generation)) {
                return;
            }
            if (delta.endpoint_changed) {
                emit(ServiceResolved {delta.key, delta.instance.endpoint});
            } else if (config_.resolve_on_discovery) {
                resolver_.resolve(delta.key, [key = delta.key](const Resolver::Result& result) {
                    if (!result) {
                        MDK_DEBUG("Failed to resolve {}: {}", key.to_string(), dnssd::to_string(result.error()));
                    }
                });
            }
            return;
        }
        case CacheDelta::Kind::updated: {
            if (delta.endpoint_replaced || delta.endpoint_removed) {
                emit(ServiceUpdated {delta.instance});
                if (!is_active(generation)) {
                    return;
                }
            }
            if (delta.endpoint_changed) {
                emit(ServiceResolved {delta.key, delta.instance.endpoint});
                if (!is_active(generation)) {
                    return;
                }
                resolver_.on_instance_updated(delta.key);
            }
            return;
        }
        case CacheDelta::Kind::lost: {
            emit(ServiceLost {delta.key});
            if (!is_active(generation)) {
                return;
            }
            resolver_.on_instance_removed(delta.key);
            return;
        }
        case CacheDelta::Kind::no_change:
        default:
            return;
    }
}

void mdk::dnssd::DiscoverySession::emit(const Event& event) const {
    if (state_ != State::listening || listener_ == nullptr) {
        return;
    }
    MDK_TRACE("{}", dnssd::to_string(event));
    listener_->on_event(event);
}

const char* mdk::dnssd::to_string(const DiscoverySession::State state) {
    switch (state) {
        case DiscoverySession::State::idle:
            return "idle";
        case DiscoverySession::State::listening:
            return "listening";
        case DiscoverySession::State::stopping:
            return "stopping";
        default:
            return "unknown";
    }
}
