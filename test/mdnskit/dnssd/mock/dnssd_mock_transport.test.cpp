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
#include "../dnssd_test_util.test.hpp"

#include <catch2/catch_all.hpp>

namespace {

class RecordingSubscriber: public mdk::dnssd::Transport::Subscriber {
  public:
    std::vector<std::vector<uint8_t>> datagrams;
    std::vector<std::string> errors;

    void on_receive(const mdk::dnssd::Transport::Datagram& datagram) override {
        datagrams.emplace_back(datagram.data.data(), datagram.data.data() + datagram.data.size());
    }

    void on_transport_error(mdk::dnssd::Error, const std::string& detail) override {
        errors.push_back(detail);
    }
};

}  // namespace

TEST_CASE("mdk::dnssd::MockTransport") {
    using mdk::dnssd::test::k_advertiser_endpoint;
    using mdk::dnssd::test::k_mdns_endpoint;

    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport(io_context);
    RecordingSubscriber subscriber;

    SECTION("Received datagrams are delivered when the io_context runs") {
        REQUIRE(transport.join(&subscriber, k_mdns_endpoint));
        REQUIRE(transport.is_joined(k_mdns_endpoint));

        transport.mock_receive({1, 2, 3}, k_advertiser_endpoint);
        REQUIRE(subscriber.datagrams.empty());
        io_context.run();
        REQUIRE(subscriber.datagrams.size() == 1);
        REQUIRE(subscriber.datagrams[0] == std::vector<uint8_t> {1, 2, 3});

        transport.leave(&subscriber);
        REQUIRE_FALSE(transport.is_joined(k_mdns_endpoint));
        transport.mock_receive({4}, k_advertiser_endpoint);
        io_context.restart();
        io_context.run();
        REQUIRE(subscriber.datagrams.size() == 1);
    }

    SECTION("Sent datagrams are recorded") {
        const std::vector<uint8_t> data {1, 2, 3};
        REQUIRE(transport.send(mdk::BufferView<const uint8_t>(data), k_mdns_endpoint));
        REQUIRE(transport.sent_datagrams().size() == 1);
        REQUIRE(transport.sent_datagrams()[0].data == data);
        REQUIRE(transport.sent_datagrams()[0].destination == k_mdns_endpoint);

        transport.clear_sent_datagrams();
        REQUIRE(transport.sent_datagrams().empty());

        transport.set_fail_send(true);
        const auto result = transport.send(mdk::BufferView<const uint8_t>(data), k_mdns_endpoint);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == mdk::dnssd::Error::send_failed);
        REQUIRE(transport.sent_datagrams().empty());
    }

    SECTION("Join failure") {
        transport.set_fail_join(true);
        const auto result = transport.join(&subscriber, k_mdns_endpoint);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == mdk::dnssd::Error::network_unavailable);
        REQUIRE(transport.subscriber_count() == 0);
    }

    SECTION("Transport failure") {
        REQUIRE(transport.join(&subscriber, k_mdns_endpoint));
        transport.mock_transport_failure("Network down");
        io_context.run();
        REQUIRE(subscriber.errors == std::vector<std::string> {"Network down"});
    }

    SECTION("Nothing is delivered after the transport is destroyed") {
        auto owned = std::make_unique<mdk::dnssd::MockTransport>(io_context);
        REQUIRE(owned->join(&subscriber, k_mdns_endpoint));
        owned->mock_receive({1}, k_advertiser_endpoint);
        owned.reset();
        io_context.run();
        REQUIRE(subscriber.datagrams.empty());
    }
}
