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

#include "dnssd_transport.hpp"
#include "mdnskit/core/util/subscriber_list.hpp"

#include <boost/asio.hpp>

#include <memory>
#include <vector>

namespace mdk::dnssd {

/**
 * Transport which uses one UDP socket per multicast group. Sockets are opened on the first join for a group and closed
 * when the last subscriber of that group leaves.
 */
class UdpTransport: public Transport {
  public:
    struct Configuration {
        /// The interface to join groups on and send from. The 'any' address lets the OS pick.
        boost::asio::ip::address_v4 interface_address {boost::asio::ip::address_v4::any()};
        /// The multicast hop limit (IP TTL) of outgoing datagrams.
        int multicast_hops {255};
        /// Whether outgoing datagrams are looped back to this host.
        bool multicast_loopback {true};
    };

    explicit UdpTransport(boost::asio::io_context& io_context);
    UdpTransport(boost::asio::io_context& io_context, Configuration config);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    UdpTransport(UdpTransport&&) = delete;
    UdpTransport& operator=(UdpTransport&&) = delete;

    /**
     * @return The number of open sockets.
     */
    [[nodiscard]] size_t socket_count() const;

    // Transport overrides
    [[nodiscard]] tl::expected<void, Error>
    join(Subscriber* subscriber, const boost::asio::ip::udp::endpoint& group) override;
    [[nodiscard]] tl::expected<void, Error>
    send(BufferView<const uint8_t> data, const boost::asio::ip::udp::endpoint& destination) override;
    void leave(const Subscriber* subscriber) override;

  private:
    class SocketContext;

    boost::asio::io_context& io_context_;
    Configuration config_;
    std::vector<std::shared_ptr<SocketContext>> sockets_;

    [[nodiscard]] SocketContext* find_socket_context(const boost::asio::ip::udp::endpoint& group) const;
};

}  // namespace mdk::dnssd
