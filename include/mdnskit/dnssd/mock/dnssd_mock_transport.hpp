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

#include "mdnskit/dnssd/dnssd_transport.hpp"
#include "mdnskit/core/util/subscriber_list.hpp"

#include <boost/asio.hpp>

#include <map>
#include <vector>

namespace mdk::dnssd {

/**
 * Transport which doesn't touch the network. Sent datagrams are recorded and received datagrams are injected by
 * calling the mock_* functions. Notifications are posted to the io_context, so they are delivered when the io_context
 * runs.
 */
class MockTransport: public Transport {
  public:
    struct SentDatagram {
        std::vector<uint8_t> data;
        boost::asio::ip::udp::endpoint destination;
    };

    explicit MockTransport(boost::asio::io_context& io_context);
    ~MockTransport() override;

    /**
     * Mocks receiving a datagram. The datagram is delivered to every subscriber of every group.
     * @param data The datagram.
     * @param source The endpoint the datagram originates from.
     */
    void mock_receive(std::vector<uint8_t> data, const boost::asio::ip::udp::endpoint& source);

    /**
     * Mocks a failure of the underlying socket. Every subscriber gets notified with Error::transport_failure.
     * @param detail The description passed to the subscribers.
     */
    void mock_transport_failure(const std::string& detail);

    /**
     * When set, subsequent join() calls fail with Error::network_unavailable.
     */
    void set_fail_join(bool fail);

    /**
     * When set, subsequent send() calls fail with Error::send_failed.
     */
    void set_fail_send(bool fail);

    /**
     * @return The datagrams sent so far, oldest first.
     */
    [[nodiscard]] const std::vector<SentDatagram>& sent_datagrams() const;

    /**
     * Forgets the datagrams sent so far.
     */
    void clear_sent_datagrams();

    /**
     * @return The number of subscribers over all groups.
     */
    [[nodiscard]] size_t subscriber_count() const;

    /**
     * @return True if at least one subscriber joined the given group.
     */
    [[nodiscard]] bool is_joined(const boost::asio::ip::udp::endpoint& group) const;

    // Transport overrides
    [[nodiscard]] tl::expected<void, Error>
    join(Subscriber* subscriber, const boost::asio::ip::udp::endpoint& group) override;
    [[nodiscard]] tl::expected<void, Error>
    send(BufferView<const uint8_t> data, const boost::asio::ip::udp::endpoint& destination) override;
    void leave(const Subscriber* subscriber) override;

  private:
    boost::asio::io_context& io_context_;
    std::map<boost::asio::ip::udp::endpoint, SubscriberList<Subscriber>> groups_;
    std::vector<SentDatagram> sent_datagrams_;
    bool fail_join_ {false};
    bool fail_send_ {false};
    std::shared_ptr<bool> alive_ {std::make_shared<bool>(true)};
};

}  // namespace mdk::dnssd
