/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_resolver.hpp"

#include "mdnskit/core/log.hpp"
#include "mdnskit/dnssd/dnssd_codec.hpp"

#include <tuple>

mdk::dnssd::Resolver::Resolver(
    boost::asio::io_context& io_context, Transport& transport, ServiceCache& cache, Configuration config
) :
    io_context_(io_context), transport_(transport), cache_(cache), config_(std::move(config)) {}

mdk::dnssd::Resolver::~Resolver() {
    for (auto& [key, pending] : pending_) {
        pending.timeout_timer->stop();
    }
}

void mdk::dnssd::Resolver::resolve(const InstanceKey& key, ResolveCallback callback) {
    MDK_ASSERT_RETURN(callback != nullptr, "Callback should not be nullptr");

    const auto* instance = cache_.lookup(key);
    if (instance == nullptr) {
        post_result(std::move(callback), tl::unexpected(Error::instance_not_found));
        return;
    }

    if (instance->endpoint) {
        post_result(std::move(callback), instance->endpoint);
        return;
    }

    if (const auto it = pending_.find(key); it != pending_.end()) {
        it->second.callbacks.push_back(std::move(callback));
        return;
    }

    const auto transaction_id = make_transaction_id();
    const auto query = encode_resolve_query(key, transaction_id);
    if (query.empty()) {
        MDK_ERROR("Failed to encode resolve query for {}", key.to_string());
        post_result(std::move(callback), tl::unexpected(Error::send_failed));
        return;
    }

    if (auto result = transport_.send(BufferView<const uint8_t>(query), config_.multicast_endpoint); !result) {
        post_result(std::move(callback), tl::unexpected(result.error()));
        return;
    }

    std::ignore = cache_.mark_resolving(key);

    PendingResolve pending;
    pending.transaction_id = transaction_id;
    pending.callbacks.push_back(std::move(callback));
    pending.timeout_timer = std::make_shared<AsioTimer>(io_context_);
    pending.timeout_timer->once(config_.timeout, [this, key] {
        MDK_DEBUG("Resolve timed out for {}", key.to_string());
        std::ignore = cache_.mark_unresolved(key);
        complete(key, tl::unexpected(Error::resolution_timeout));
    });
    pending_.emplace(key, std::move(pending));

    MDK_TRACE("Resolving {} (transaction {})", key.to_string(), transaction_id);
}

void mdk::dnssd::Resolver::on_instance_updated(const InstanceKey& key) {
    if (pending_.find(key) == pending_.end()) {
        return;
    }
    const auto* instance = cache_.lookup(key);
    if (instance == nullptr || !instance->endpoint) {
        return;
    }
    complete(key, instance->endpoint);
}

void mdk::dnssd::Resolver::on_instance_removed(const InstanceKey& key) {
    if (pending_.find(key) == pending_.end()) {
        return;
    }
    complete(key, tl::unexpected(Error::instance_not_found));
}

void mdk::dnssd::Resolver::cancel_all() {
    while (!pending_.empty()) {
        const auto key = pending_.begin()->first;
        std::ignore = cache_.mark_unresolved(key);
        complete(key, tl::unexpected(Error::cancelled));
    }
}

bool mdk::dnssd::Resolver::is_pending(const InstanceKey& key) const {
    return pending_.find(key) != pending_.end();
}

size_t mdk::dnssd::Resolver::pending_count() const {
    return pending_.size();
}

void mdk::dnssd::Resolver::complete(const InstanceKey& key, const Result& result) {
    const auto it = pending_.find(key);
    if (it == pending_.end()) {
        return;
    }

    auto pending = std::move(it->second);
    pending_.erase(it);

    // This function may run inside the callback of the timer, which therefore can't be destroyed here.
    pending.timeout_timer->stop();
    boost::asio::post(io_context_, [timer = std::move(pending.timeout_timer)] {});

    for (auto& callback : pending.callbacks) {
        post_result(std::move(callback), result);
    }
}

void mdk::dnssd::Resolver::post_result(ResolveCallback callback, Result result) {
    boost::asio::post(io_context_, [callback = std::move(callback), result = std::move(result)] {
        callback(result);
    });
}
