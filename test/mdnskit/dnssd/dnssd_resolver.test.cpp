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
#include "mdnskit/dnssd/detail/dns_message.hpp"
#include "mdnskit/dnssd/dnssd_resolver.hpp"
#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include <catch2/catch_all.hpp>

using namespace std::chrono_literals;

TEST_CASE("mdk::dnssd::Resolver") {
    using mdk::dnssd::Error;
    using mdk::dnssd::Resolver;
    using mdk::dnssd::test::make_advertisement;
    using mdk::dnssd::test::make_endpoint;
    using mdk::dnssd::test::make_key;

    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport(io_context);
    mdk::dnssd::ServiceCache cache;

    Resolver::Configuration config;
    config.timeout = 50ms;
    Resolver resolver(io_context, transport, cache, config);

    const auto key = make_key("Printer A");
    std::vector<Resolver::Result> results;
    auto record_result = [&results](const Resolver::Result& result) {
        results.push_back(result);
    };

    SECTION("Unknown instance") {
        resolver.resolve(key, record_result);
        REQUIRE(results.empty());  // Always asynchronous
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0]);
        REQUIRE(results[0].error() == Error::instance_not_found);
        REQUIRE(transport.sent_datagrams().empty());
    }

    SECTION("Cached endpoint is returned without query") {
        cache.merge(make_advertisement("Printer A", 120, make_endpoint("192.168.1.10", 515)), mdk::dnssd::Clock::now());
        resolver.resolve(key, record_result);
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0]);
        REQUIRE(results[0].value() == cache.lookup(key)->endpoint);
        REQUIRE(transport.sent_datagrams().empty());
    }

    SECTION("Concurrent resolves share one query and one endpoint") {
        cache.merge(make_advertisement("Printer A", 120), mdk::dnssd::Clock::now());
        resolver.resolve(key, record_result);
        resolver.resolve(key, record_result);
        io_context.poll();

        REQUIRE(results.empty());
        REQUIRE(resolver.is_pending(key));
        REQUIRE(resolver.pending_count() == 1);
        REQUIRE(cache.lookup(key)->state == mdk::dnssd::ResolutionState::resolving);

        REQUIRE(transport.sent_datagrams().size() == 1);
        const auto& sent = transport.sent_datagrams().front();
        REQUIRE(sent.destination == mdk::dnssd::test::k_mdns_endpoint);
        const auto query = mdk::dnssd::detail::DnsMessage::from_data(mdk::BufferView<const uint8_t>(sent.data));
        REQUIRE(query);
        REQUIRE(query->id != 0);
        REQUIRE(query->questions.size() == 2);
        REQUIRE(query->questions[0].name.to_string() == "Printer A._test._tcp.local");

        cache.merge(make_advertisement("Printer A", 120, make_endpoint("192.168.1.10", 515)), mdk::dnssd::Clock::now());
        resolver.on_instance_updated(key);
        REQUIRE_FALSE(resolver.is_pending(key));
        io_context.run();

        REQUIRE(results.size() == 2);
        REQUIRE(results[0]);
        REQUIRE(results[1]);
        REQUIRE(results[0].value() == results[1].value());
        REQUIRE(results[0].value()->port == 515);
    }

    SECTION("Timeout") {
        cache.merge(make_advertisement("Printer A", 120), mdk::dnssd::Clock::now());
        resolver.resolve(key, record_result);
        resolver.resolve(key, record_result);
        io_context.run();

        REQUIRE(results.size() == 2);
        for (auto& result : results) {
            REQUIRE_FALSE(result);
            REQUIRE(result.error() == Error::resolution_timeout);
        }
        REQUIRE(resolver.pending_count() == 0);
        REQUIRE(cache.lookup(key)->state == mdk::dnssd::ResolutionState::unresolved);

        SECTION("A new resolve sends a new query") {
            results.clear();
            resolver.resolve(key, record_result);
            REQUIRE(transport.sent_datagrams().size() == 2);
            io_context.restart();
            io_context.run();
            REQUIRE(results.size() == 1);
            REQUIRE(results[0].error() == Error::resolution_timeout);
        }
    }

    SECTION("Update without endpoint keeps waiting") {
        cache.merge(make_advertisement("Printer A", 120), mdk::dnssd::Clock::now());
        resolver.resolve(key, record_result);
        resolver.on_instance_updated(key);
        REQUIRE(resolver.is_pending(key));
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].error() == Error::resolution_timeout);
    }

    SECTION("Instance removed while resolving") {
        cache.merge(make_advertisement("Printer A", 120), mdk::dnssd::Clock::now());
        resolver.resolve(key, record_result);
        std::ignore = cache.withdraw(key);
        resolver.on_instance_removed(key);
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].error() == Error::instance_not_found);
    }

    SECTION("Send failure") {
        cache.merge(make_advertisement("Printer A", 120), mdk::dnssd::Clock::now());
        transport.set_fail_send(true);
        resolver.resolve(key, record_result);
        REQUIRE_FALSE(resolver.is_pending(key));
        io_context.run();
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].error() == Error::send_failed);
        REQUIRE(cache.lookup(key)->state == mdk::dnssd::ResolutionState::unresolved);
    }

    SECTION("Cancel all") {
        cache.merge(make_advertisement("Printer A", 120), mdk::dnssd::Clock::now());
        cache.merge(make_advertisement("Printer B", 120), mdk::dnssd::Clock::now());
        resolver.resolve(key, record_result);
        resolver.resolve(make_key("Printer B"), record_result);
        REQUIRE(resolver.pending_count() == 2);

        resolver.cancel_all();
        REQUIRE(resolver.pending_count() == 0);
        io_context.run();

        REQUIRE(results.size() == 2);
        REQUIRE(results[0].error() == Error::cancelled);
        REQUIRE(results[1].error() == Error::cancelled);
        REQUIRE(cache.lookup(key)->state == mdk::dnssd::ResolutionState::unresolved);
    }
}
