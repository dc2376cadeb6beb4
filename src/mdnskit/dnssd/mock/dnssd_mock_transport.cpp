/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include "mdnskit/core/log.hpp"

#include <tuple>

mdk::dnssd::MockTransport::MockTransport(boost::asio::io_context& io_context) : io_context_(io_context) {}

mdk::dnssd::MockTransport::~MockTransport() {
    *alive_ = false;
    for (auto& [group, subscribers] : groups_) {
        subscribers.clear();
    }
}

void mdk::dnssd::MockTransport::mock_receive(std::vector<uint8_t> data, const boost::asio::ip::udp::endpoint& source) {
    boost::asio::post(io_context_, [this, alive = alive_, data = std::move(data), source] {
        if (!*alive) {
            return;
        }
        const Datagram datagram {BufferView<const uint8_t>(data), source};
        for (auto& [group, subscribers] : groups_) {
            subscribers.foreach ([&datagram](Subscriber* subscriber) {
                subscriber->on_receive(datagram);
            });
        }
    });
}

void mdk::dnssd::MockTransport::mock_transport_failure(const std::string& detail) {
    boost::asio::post(io_context_, [this, alive = alive_, detail] {
        if (!*alive) {
            return;
        }
        for (auto& [group, subscribers] : groups_) {
            subscribers.foreach ([&detail](Subscriber* subscriber) {
                subscriber->on_transport_error(Error::transport_failure, detail);
            });
        }
    });
}

void mdk::dnssd::MockTransport::set_fail_join(const bool fail) {
    fail_join_ = fail;
}

void mdk::dnssd::MockTransport::set_fail_send(const bool fail) {
    fail_send_ = fail;
}

const std::vector<mdk::dnssd::MockTransport::SentDatagram>& mdk::dnssd::MockTransport::sent_datagrams() const {
    return sent_datagrams_;
}

void mdk::dnssd::MockTransport::clear_sent_datagrams() {
    sent_datagrams_.clear();
}

size_t mdk::dnssd::MockTransport::subscriber_count() const {
    size_t count = 0;
    for (auto& [group, subscribers] : groups_) {
        count += subscribers.size();
    }
    return count;
}

bool mdk::dnssd::MockTransport::is_joined(const boost::asio::ip::udp::endpoint& group) const {
    const auto it = groups_.find(group);
    return it != groups_.end() && !it->second.empty();
}

tl::expected<void, mdk::dnssd::Error>
mdk::dnssd::MockTransport::join(Subscriber* subscriber, const boost::asio::ip::udp::endpoint& group) {
    MDK_ASSERT(subscriber != nullptr, "Subscriber should not be nullptr");
    if (fail_join_) {
        return tl::unexpected(Error::network_unavailable);
    }
    if (!groups_[group].add(subscriber)) {
        MDK_WARNING("Subscriber already joined group {}:{}", group.address().to_string(), group.port());
    }
    return {};
}

tl::expected<void, mdk::dnssd::Error> mdk::dnssd::MockTransport::send(
    const BufferView<const uint8_t> data, const boost::asio::ip::udp::endpoint& destination
) {
    if (fail_send_ || data.empty()) {
        return tl::unexpected(Error::send_failed);
    }
    sent_datagrams_.push_back({std::vector<uint8_t>(data.data(), data.data() + data.size()), destination});
    return {};
}

void mdk::dnssd::MockTransport::leave(const Subscriber* subscriber) {
    // Empty groups are kept since leave() may be called while iterating the subscribers of a group.
    for (auto& [group, subscribers] : groups_) {
        std::ignore = subscribers.remove(subscriber);
    }
}
