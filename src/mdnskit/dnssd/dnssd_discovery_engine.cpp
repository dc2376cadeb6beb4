/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_discovery_engine.hpp"

#include "mdnskit/core/log.hpp"

#include <algorithm>
#include <utility>

mdk::dnssd::DiscoveryEngine::DiscoveryEngine(boost::asio::io_context& io_context, Transport& transport) :
    DiscoveryEngine(io_context, transport, DiscoverySession::Configuration {}) {}

mdk::dnssd::DiscoveryEngine::DiscoveryEngine(
    boost::asio::io_context& io_context, Transport& transport, DiscoverySession::Configuration config
) :
    io_context_(io_context), transport_(transport), config_(std::move(config)) {}

mdk::dnssd::DiscoveryEngine::~DiscoveryEngine() {
    for (auto& entry : sessions_) {
        entry.session->stop();
    }
}

tl::expected<mdk::dnssd::SessionHandle, mdk::dnssd::Error>
mdk::dnssd::DiscoveryEngine::listen(const std::string& service_type, Listener* listener) {
    auto type = ServiceType::from_string(service_type);
    if (!type) {
        MDK_WARNING("Invalid service type: {}", service_type);
        return tl::unexpected(type.error());
    }

    for (auto& entry : sessions_) {
        if (entry.session->state() == DiscoverySession::State::listening && entry.session->service_type() == *type) {
            return tl::unexpected(Error::already_listening);
        }
    }

    auto session = std::make_shared<DiscoverySession>(io_context_, transport_, config_);
    if (auto result = session->listen(*type, listener); !result) {
        return tl::unexpected(result.error());
    }

    const auto handle = handle_generator_.next();
    sessions_.push_back({handle, std::move(session)});
    MDK_DEBUG("Session {} browses for {}", handle.to_string(), type->to_string());
    return handle;
}

tl::expected<void, mdk::dnssd::Error> mdk::dnssd::DiscoveryEngine::stop(const SessionHandle handle) {
    const auto it = std::find_if(sessions_.begin(), sessions_.end(), [handle](const Entry& entry) {
        return entry.handle == handle;
    });
    if (it == sessions_.end()) {
        return tl::unexpected(Error::not_listening);
    }

    auto session = std::move(it->session);
    sessions_.erase(it);
    session->stop();
    release(std::move(session));
    MDK_DEBUG("Session {} removed", handle.to_string());
    return {};
}

void mdk::dnssd::DiscoveryEngine::stop_all() {
    auto sessions = std::exchange(sessions_, {});
    for (auto& entry : sessions) {
        entry.session->stop();
        release(std::move(entry.session));
    }
}

mdk::dnssd::DiscoverySession* mdk::dnssd::DiscoveryEngine::find_session(const SessionHandle handle) const {
    for (auto& entry : sessions_) {
        if (entry.handle == handle) {
            return entry.session.get();
        }
    }
    return nullptr;
}

size_t mdk::dnssd::DiscoveryEngine::session_count() const {
    return sessions_.size();
}

void mdk::dnssd::DiscoveryEngine::release(std::shared_ptr<DiscoverySession> session) {
    // The session might be on the call stack (stop() called from one of its events), so destroy it later.
    boost::asio::post(io_context_, [session = std::move(session)] {});
}
