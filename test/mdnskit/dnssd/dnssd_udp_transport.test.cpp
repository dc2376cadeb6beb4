/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "dnssd_test_util.test.hpp"
#include "mdnskit/dnssd/dnssd_udp_transport.hpp"

#include <catch2/catch_all.hpp>

namespace {

class NullSubscriber: public mdk::dnssd::Transport::Subscriber {
  public:
    void on_receive(const mdk::dnssd::Transport::Datagram&) override {}
    void on_transport_error(mdk::dnssd::Error, const std::string&) override {}
};

}  // namespace

TEST_CASE("mdk::dnssd::UdpTransport") {
    boost::asio::io_context io_context;
    mdk::dnssd::UdpTransport transport(io_context);
    NullSubscriber subscriber;

    SECTION("Joining a unicast address fails") {
        const auto result = transport.join(&subscriber, mdk::dnssd::test::k_advertiser_endpoint);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == mdk::dnssd::Error::network_unavailable);
        REQUIRE(transport.socket_count() == 0);
    }

    SECTION("Joining an IPv6 group fails") {
        const boost::asio::ip::udp::endpoint group {boost::asio::ip::make_address("ff02::fb"), 5353};
        const auto result = transport.join(&subscriber, group);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == mdk::dnssd::Error::network_unavailable);
    }

    SECTION("Sending to a group which wasn't joined fails") {
        const std::vector<uint8_t> data {1, 2, 3};
        const auto result = transport.send(mdk::BufferView<const uint8_t>(data), mdk::dnssd::test::k_mdns_endpoint);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == mdk::dnssd::Error::send_failed);
    }

    SECTION("Leaving without joining is a no-op") {
        transport.leave(&subscriber);
        REQUIRE(transport.socket_count() == 0);
    }
}
