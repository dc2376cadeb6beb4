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
#include "mdnskit/dnssd/dnssd_discovery_session.hpp"
#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include <catch2/catch_all.hpp>

using namespace std::chrono_literals;

namespace {

void run_for(boost::asio::io_context& io_context, const std::chrono::milliseconds duration) {
    io_context.restart();
    io_context.run_for(duration);
}

mdk::dnssd::DiscoverySession::Configuration make_config() {
    mdk::dnssd::DiscoverySession::Configuration config;
    config.query_interval = 20ms;
    config.sweep_interval = 10ms;
    config.resolve_timeout = 100ms;
    return config;
}

}  // namespace

TEST_CASE("mdk::dnssd::DiscoverySession") {
    using mdk::dnssd::DiscoverySession;
    using mdk::dnssd::Error;
    using mdk::dnssd::ServiceFound;
    using mdk::dnssd::ServiceLost;
    using mdk::dnssd::ServiceResolved;
    using mdk::dnssd::ServiceUpdated;
    using mdk::dnssd::SessionError;
    using mdk::dnssd::test::k_advertiser_endpoint;
    using mdk::dnssd::test::k_mdns_endpoint;
    using mdk::dnssd::test::make_advertisement;
    using mdk::dnssd::test::make_endpoint;
    using mdk::dnssd::test::make_key;
    using mdk::dnssd::test::make_response;

    boost::asio::io_context io_context;
    mdk::dnssd::MockTransport transport(io_context);
    mdk::dnssd::test::RecordingListener listener;
    const auto type = mdk::dnssd::ServiceType::from_string("_test._tcp");
    REQUIRE(type);

    SECTION("Stop right after listen emits nothing and leaves the group") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        REQUIRE(session.state() == DiscoverySession::State::listening);
        REQUIRE(transport.is_joined(k_mdns_endpoint));

        transport.mock_receive(make_response({make_advertisement("Printer A", 120)}), k_advertiser_endpoint);
        session.stop();
        run_for(io_context, 50ms);

        REQUIRE(session.state() == DiscoverySession::State::idle);
        REQUIRE(listener.events.empty());
        REQUIRE(transport.sent_datagrams().empty());
        REQUIRE(transport.subscriber_count() == 0);
        REQUIRE_FALSE(transport.is_joined(k_mdns_endpoint));

        SECTION("Stop while idle is a no-op") {
            session.stop();
            REQUIRE(session.state() == DiscoverySession::State::idle);
        }
    }

    SECTION("Listen twice") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        const auto result = session.listen(*type, &listener);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Error::already_listening);
        REQUIRE(transport.subscriber_count() == 1);
    }

    SECTION("Join failure leaves the session idle") {
        transport.set_fail_join(true);
        DiscoverySession session(io_context, transport, make_config());
        const auto result = session.listen(*type, &listener);
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == Error::network_unavailable);
        REQUIRE(session.state() == DiscoverySession::State::idle);
        run_for(io_context, 30ms);
        REQUIRE(transport.sent_datagrams().empty());
        REQUIRE(listener.events.empty());
    }

    SECTION("Queries are sent periodically") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        run_for(io_context, 70ms);

        const auto& sent = transport.sent_datagrams();
        REQUIRE(sent.size() >= 2);
        REQUIRE(session.statistics().queries_sent == sent.size());

        const auto query = mdk::dnssd::detail::DnsMessage::from_data(mdk::BufferView<const uint8_t>(sent[0].data));
        REQUIRE(query);
        REQUIRE_FALSE(query->is_response());
        REQUIRE(query->questions.size() == 1);
        REQUIRE(query->questions[0].name.to_string() == "_test._tcp.local");
        REQUIRE(query->questions[0].type == mdk::dnssd::detail::record_type::ptr);
        REQUIRE(sent[0].destination == k_mdns_endpoint);
    }

    SECTION("Passive mode sends no queries") {
        auto config = make_config();
        config.send_queries = false;
        DiscoverySession session(io_context, transport, config);
        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive(make_response({make_advertisement("Printer A", 120)}), k_advertiser_endpoint);
        run_for(io_context, 50ms);
        REQUIRE(transport.sent_datagrams().empty());
        REQUIRE(listener.count<ServiceFound>() == 1);
    }

    SECTION("Send failures are counted and don't stop the session") {
        transport.set_fail_send(true);
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        run_for(io_context, 30ms);
        REQUIRE(session.statistics().send_failures >= 1);
        REQUIRE(session.statistics().queries_sent == 0);
        REQUIRE(session.state() == DiscoverySession::State::listening);
        REQUIRE(listener.events.empty());
    }

    SECTION("Found, resolved and lost") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));

        transport.mock_receive(
            make_response({make_advertisement("Printer A", 120, make_endpoint("192.168.1.10", 515))}),
            k_advertiser_endpoint
        );
        run_for(io_context, 20ms);

        REQUIRE(listener.events.size() == 2);
        const auto* found = std::get_if<ServiceFound>(&listener.events[0]);
        REQUIRE(found != nullptr);
        REQUIRE(found->instance.key == make_key("Printer A"));
        const auto* resolved = std::get_if<ServiceResolved>(&listener.events[1]);
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->endpoint->port == 515);
        REQUIRE(session.cache().size() == 1);

        // Repeated announcement doesn't produce events
        transport.mock_receive(
            make_response({make_advertisement("Printer A", 120, make_endpoint("192.168.1.10", 515))}),
            k_advertiser_endpoint
        );
        run_for(io_context, 20ms);
        REQUIRE(listener.events.size() == 2);

        SECTION("Changed endpoint") {
            transport.mock_receive(
                make_response({make_advertisement("Printer A", 120, make_endpoint("192.168.1.11", 515))}),
                k_advertiser_endpoint
            );
            run_for(io_context, 20ms);
            REQUIRE(listener.events.size() == 4);
            REQUIRE(std::holds_alternative<ServiceUpdated>(listener.events[2]));
            REQUIRE(listener.last<ServiceResolved>()->endpoint->host() == "192.168.1.11");
        }

        SECTION("Goodbye for the SRV record only") {
            auto message = mdk::dnssd::test::make_response_message(
                {make_advertisement("Printer A", 120, make_endpoint("192.168.1.10", 515))}
            );
            for (auto& record : message.additionals) {
                if (record.type == mdk::dnssd::detail::record_type::srv) {
                    record.ttl = 0;
                }
            }
            transport.mock_receive(mdk::dnssd::test::encode_message(message), k_advertiser_endpoint);
            run_for(io_context, 20ms);

            REQUIRE(listener.events.size() == 3);
            const auto* updated = std::get_if<ServiceUpdated>(&listener.events[2]);
            REQUIRE(updated != nullptr);
            REQUIRE(updated->instance.endpoint == nullptr);
            REQUIRE(updated->instance.state == mdk::dnssd::ResolutionState::unresolved);

            const auto* instance = session.cache().lookup(make_key("Printer A"));
            REQUIRE(instance != nullptr);
            REQUIRE(instance->endpoint == nullptr);
        }

        SECTION("Goodbye") {
            transport.mock_receive(make_response({make_advertisement("Printer A", 0)}), k_advertiser_endpoint);
            run_for(io_context, 20ms);
            REQUIRE(listener.events.size() == 3);
            const auto* lost = listener.last<ServiceLost>();
            REQUIRE(lost != nullptr);
            REQUIRE(lost->key == make_key("Printer A"));
            REQUIRE(session.cache().empty());
        }
    }

    SECTION("Instances expire when not refreshed") {
        auto config = make_config();
        config.send_queries = false;
        DiscoverySession session(io_context, transport, config);
        REQUIRE(session.listen(*type, &listener));

        transport.mock_receive(make_response({make_advertisement("Printer A", 1)}), k_advertiser_endpoint);
        run_for(io_context, 500ms);
        REQUIRE(listener.count<ServiceFound>() == 1);
        REQUIRE(listener.count<ServiceLost>() == 0);

        run_for(io_context, 1000ms);
        REQUIRE(listener.count<ServiceLost>() == 1);
        REQUIRE(session.cache().empty());
    }

    SECTION("Refresh after the deadline but before the sweep is lost and found again") {
        auto config = make_config();
        config.send_queries = false;
        config.sweep_interval = 10s;
        DiscoverySession session(io_context, transport, config);
        REQUIRE(session.listen(*type, &listener));

        transport.mock_receive(make_response({make_advertisement("Printer A", 1)}), k_advertiser_endpoint);
        run_for(io_context, 1200ms);
        REQUIRE(listener.events.size() == 1);

        transport.mock_receive(make_response({make_advertisement("Printer A", 1)}), k_advertiser_endpoint);
        run_for(io_context, 20ms);

        REQUIRE(listener.events.size() == 3);
        REQUIRE(std::holds_alternative<ServiceFound>(listener.events[0]));
        const auto* lost = std::get_if<ServiceLost>(&listener.events[1]);
        REQUIRE(lost != nullptr);
        REQUIRE(lost->key == make_key("Printer A"));
        REQUIRE(std::holds_alternative<ServiceFound>(listener.events[2]));
        REQUIRE(session.cache().size() == 1);
    }

    SECTION("Malformed packets are dropped") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive({0x00, 0x01, 0x02}, k_advertiser_endpoint);

        auto truncated = make_response({make_advertisement("Printer A", 120)});
        truncated.resize(truncated.size() - 3);
        transport.mock_receive(truncated, k_advertiser_endpoint);
        run_for(io_context, 20ms);

        REQUIRE(listener.events.empty());
        REQUIRE(session.statistics().packets_received == 2);
        REQUIRE(session.statistics().malformed_packets == 2);
        REQUIRE(session.state() == DiscoverySession::State::listening);
    }

    SECTION("Advertisements for other service types are ignored") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive(
            make_response({make_advertisement("Printer A", 120, std::nullopt, "_ipp._tcp")}), k_advertiser_endpoint
        );
        run_for(io_context, 20ms);
        REQUIRE(listener.events.empty());
        REQUIRE(session.cache().empty());
        REQUIRE(session.statistics().advertisements_merged == 0);
    }

    SECTION("Transport failure") {
        DiscoverySession session(io_context, transport, make_config());
        REQUIRE(session.listen(*type, &listener));
        transport.mock_transport_failure("Socket closed");
        run_for(io_context, 20ms);

        REQUIRE(listener.events.size() == 1);
        const auto* error = listener.last<SessionError>();
        REQUIRE(error != nullptr);
        REQUIRE(error->kind == Error::transport_failure);
        REQUIRE(error->detail == "Socket closed");
        REQUIRE(session.state() == DiscoverySession::State::idle);
        REQUIRE(transport.subscriber_count() == 0);

        SECTION("Session can be restarted") {
            REQUIRE(session.listen(*type, &listener));
            REQUIRE(session.state() == DiscoverySession::State::listening);
        }
    }

    SECTION("Listener stops the session from within an event") {
        DiscoverySession session(io_context, transport, make_config());
        listener.on_event_callback = [&session](const mdk::dnssd::Event&) {
            session.stop();
        };
        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive(
            make_response({make_advertisement("Printer A", 120), make_advertisement("Printer B", 120)}),
            k_advertiser_endpoint
        );
        run_for(io_context, 20ms);

        REQUIRE(listener.events.size() == 1);
        REQUIRE(session.state() == DiscoverySession::State::idle);
    }

    SECTION("Restart reports instances as found again") {
        auto config = make_config();
        config.send_queries = false;
        DiscoverySession session(io_context, transport, config);
        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive(make_response({make_advertisement("Printer A", 120)}), k_advertiser_endpoint);
        run_for(io_context, 20ms);
        REQUIRE(listener.count<ServiceFound>() == 1);

        session.stop();
        REQUIRE(session.listen(*type, &listener));
        REQUIRE(session.cache().empty());
        transport.mock_receive(make_response({make_advertisement("Printer A", 120)}), k_advertiser_endpoint);
        run_for(io_context, 20ms);
        REQUIRE(listener.count<ServiceFound>() == 2);
    }

    SECTION("Resolve") {
        DiscoverySession session(io_context, transport, make_config());

        SECTION("Not listening") {
            const auto result = session.resolve("Printer A", [](const mdk::dnssd::Resolver::Result&) {});
            REQUIRE_FALSE(result);
            REQUIRE(result.error() == Error::not_listening);
        }

        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive(make_response({make_advertisement("Printer A", 120)}), k_advertiser_endpoint);
        run_for(io_context, 20ms);
        REQUIRE(listener.count<ServiceFound>() == 1);
        REQUIRE(listener.count<ServiceResolved>() == 0);

        std::vector<mdk::dnssd::Resolver::Result> results;
        REQUIRE(session.resolve("Printer A", [&results](const mdk::dnssd::Resolver::Result& result) {
            results.push_back(result);
        }));

        SECTION("Answer arrives") {
            bool resolve_query_sent = false;
            for (auto& datagram : transport.sent_datagrams()) {
                const auto message =
                    mdk::dnssd::detail::DnsMessage::from_data(mdk::BufferView<const uint8_t>(datagram.data));
                REQUIRE(message);
                if (!message->questions.empty()
                    && message->questions[0].type == mdk::dnssd::detail::record_type::srv) {
                    REQUIRE(message->questions[0].name.to_string() == "Printer A._test._tcp.local");
                    resolve_query_sent = true;
                }
            }
            REQUIRE(resolve_query_sent);

            transport.mock_receive(
                make_response({make_advertisement("Printer A", 120, make_endpoint("192.168.1.10", 515))}),
                k_advertiser_endpoint
            );
            run_for(io_context, 20ms);

            REQUIRE(results.size() == 1);
            REQUIRE(results[0]);
            REQUIRE(results[0].value()->port == 515);
            REQUIRE(listener.count<ServiceResolved>() == 1);
            REQUIRE(listener.count<ServiceUpdated>() == 0);
            REQUIRE(listener.last<ServiceResolved>()->endpoint == results[0].value());
        }

        SECTION("Instance lost while resolving") {
            transport.mock_receive(make_response({make_advertisement("Printer A", 0)}), k_advertiser_endpoint);
            run_for(io_context, 20ms);
            REQUIRE(results.size() == 1);
            REQUIRE(results[0].error() == Error::instance_not_found);
        }

        SECTION("Stop cancels pending resolves") {
            session.stop();
            run_for(io_context, 20ms);
            REQUIRE(results.size() == 1);
            REQUIRE(results[0].error() == Error::cancelled);
        }

        SECTION("No answer") {
            run_for(io_context, 150ms);
            REQUIRE(results.size() == 1);
            REQUIRE(results[0].error() == Error::resolution_timeout);
        }
    }

    SECTION("Resolve on discovery") {
        auto config = make_config();
        config.send_queries = false;
        config.resolve_on_discovery = true;
        DiscoverySession session(io_context, transport, config);
        REQUIRE(session.listen(*type, &listener));
        transport.mock_receive(make_response({make_advertisement("Printer A", 120)}), k_advertiser_endpoint);
        run_for(io_context, 20ms);

        REQUIRE(transport.sent_datagrams().size() == 1);
        REQUIRE(session.cache().lookup(make_key("Printer A"))->state == mdk::dnssd::ResolutionState::resolving);
    }
}
