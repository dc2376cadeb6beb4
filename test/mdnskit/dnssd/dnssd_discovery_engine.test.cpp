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
#include "mdnskit/dnssd/dnssd_discovery_engine.hpp"
#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include <catch2/catch_all.hpp>

using namespace std::chrono_literals;

TEST_CASE("mdk::dnssd::DiscoveryEngine") {
    using mdk::dnssd::Error;
    using mdk::dnssd::ServiceFound;
    using mdk::dnssd::test::k_advertiser_endpoint;
    using mdk::dnssd::test::make_advertisement;
    using mdk::dnssd::test::make_response;

    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport(io_context);

    mdk::dnssd::DiscoverySession::Configuration config;
    config.send_queries = false;
    mdk::dnssd::DiscoveryEngine engine(io_context, transport, config);

    mdk::dnssd::test::RecordingListener listener;

    SECTION("Invalid service type") {
        const auto result = engine.listen("http._tcp", &listener);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Error::invalid_service_type);
        REQUIRE(engine.session_count() == 0);
    }

    SECTION("Same service type twice") {
        const auto handle = engine.listen("_test._tcp", &listener);
        REQUIRE(handle);
        REQUIRE(handle->is_valid());

        const auto result = engine.listen("_TEST._tcp.local.", &listener);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Error::already_listening);
        REQUIRE(engine.session_count() == 1);

        SECTION("Listen again after stop") {
            REQUIRE(engine.stop(*handle));
            const auto second = engine.listen("_test._tcp", &listener);
            REQUIRE(second);
            REQUIRE(*second != *handle);
        }
    }

    SECTION("Stop unknown handle") {
        const auto result = engine.stop(mdk::dnssd::SessionHandle(42));
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Error::not_listening);
    }

    SECTION("Join failure") {
        transport.set_fail_join(true);
        const auto result = engine.listen("_test._tcp", &listener);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Error::network_unavailable);
        REQUIRE(engine.session_count() == 0);
    }

    SECTION("Sessions for different types share the transport") {
        mdk::dnssd::test::RecordingListener other_listener;
        const auto test_handle = engine.listen("_test._tcp", &listener);
        const auto ipp_handle = engine.listen("_ipp._tcp", &other_listener);
        REQUIRE(test_handle);
        REQUIRE(ipp_handle);
        REQUIRE(engine.session_count() == 2);
        REQUIRE(transport.subscriber_count() == 2);

        transport.mock_receive(
            make_response({
                make_advertisement("Printer A", 120, std::nullopt, "_test._tcp"),
                make_advertisement("Printer B", 120, std::nullopt, "_ipp._tcp"),
            }),
            k_advertiser_endpoint
        );
        io_context.run_for(20ms);

        REQUIRE(listener.count<ServiceFound>() == 1);
        REQUIRE(listener.last<ServiceFound>()->instance.key.name == "Printer A");
        REQUIRE(other_listener.count<ServiceFound>() == 1);
        REQUIRE(other_listener.last<ServiceFound>()->instance.key.name == "Printer B");

        auto* session = engine.find_session(*test_handle);
        REQUIRE(session != nullptr);
        REQUIRE(session->cache().size() == 1);

        REQUIRE(engine.stop(*test_handle));
        REQUIRE(engine.find_session(*test_handle) == nullptr);
        REQUIRE(transport.subscriber_count() == 1);

        engine.stop_all();
        REQUIRE(engine.session_count() == 0);
        REQUIRE(transport.subscriber_count() == 0);
    }

    SECTION("Stopping from within an event") {
        const auto handle = engine.listen("_test._tcp", &listener);
        REQUIRE(handle);
        listener.on_event_callback = [&engine, &handle](const mdk::dnssd::Event&) {
            REQUIRE(engine.stop(*handle));
        };

        transport.mock_receive(
            make_response({make_advertisement("Printer A", 120), make_advertisement("Printer B", 120)}),
            k_advertiser_endpoint
        );
        io_context.run_for(20ms);

        REQUIRE(listener.events.size() == 1);
        REQUIRE(engine.session_count() == 0);
    }
}
