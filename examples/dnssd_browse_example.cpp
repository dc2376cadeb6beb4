/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/log.hpp"
#include "mdnskit/dnssd/dnssd_discovery_engine.hpp"
#include "mdnskit/dnssd/dnssd_event_queue.hpp"
#include "mdnskit/dnssd/dnssd_udp_transport.hpp"

#include <CLI/CLI.hpp>
#include <boost/asio.hpp>

#include <atomic>
#include <csignal>
#include <string>
#include <thread>
#include <tuple>
#include <variant>

/**
 * This example browses for a service type and prints the discovered instances until interrupted. Events are handed
 * from the io_context thread to the main thread through an EventQueue.
 */

int main(int const argc, char* argv[]) {
    mdk::set_log_level_from_env();

    CLI::App app {"DNS-SD browse example"};
    argv = app.ensure_utf8(argv);

    std::string service_type;
    app.add_option("service_type", service_type, "The service type to browse for (example: _http._tcp)")->required();

    std::string interface_address = "0.0.0.0";
    app.add_option("--interface-addr", interface_address, "The interface address");

    int query_interval_ms = 4000;
    app.add_option("--query-interval", query_interval_ms, "The interval between queries in milliseconds");

    int multicast_ttl = 255;
    app.add_option("--ttl", multicast_ttl, "The multicast TTL of outgoing queries");

    bool passive = false;
    app.add_flag("--passive", passive, "Don't send queries, only listen for announcements");

    bool resolve = false;
    app.add_flag("--resolve", resolve, "Resolve every discovered instance");

    CLI11_PARSE(app, argc, argv);

    boost::system::error_code ec;
    const auto interface = boost::asio::ip::make_address_v4(interface_address, ec);
    if (ec) {
        MDK_ERROR("Invalid interface address: {}", interface_address);
        return 1;
    }

    boost::asio::io_context io_context;

    mdk::dnssd::UdpTransport::Configuration transport_config;
    transport_config.interface_address = interface;
    transport_config.multicast_hops = multicast_ttl;
    mdk::dnssd::UdpTransport transport(io_context, transport_config);

    mdk::dnssd::DiscoverySession::Configuration session_config;
    session_config.query_interval = std::chrono::milliseconds(query_interval_ms);
    session_config.send_queries = !passive;
    session_config.resolve_on_discovery = resolve;
    mdk::dnssd::DiscoveryEngine engine(io_context, transport, session_config);

    mdk::dnssd::EventQueue events;

    auto handle = engine.listen(service_type, &events);
    if (!handle) {
        MDK_ERROR("Failed to browse for {}: {}", service_type, mdk::dnssd::to_string(handle.error()));
        return 1;
    }

    std::atomic_bool keep_going {true};

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& error, int) {
        if (error) {
            return;
        }
        std::ignore = engine.stop(*handle);
        keep_going = false;
    });

    std::thread io_context_thread([&io_context] {
        io_context.run();
    });

    MDK_INFO("Browsing for {}, press ctrl+c to exit...", service_type);

    while (keep_going) {
        for (auto& event : events.pop_all()) {
            MDK_INFO("{}", mdk::dnssd::to_string(event));
            if (std::holds_alternative<mdk::dnssd::SessionError>(event)) {
                keep_going = false;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Once everything is stopped the io_context runs out of work and the thread returns.
    boost::asio::post(io_context, [&] {
        engine.stop_all();
        signals.cancel();
    });
    io_context_thread.join();

    MDK_INFO("Exit");

    return 0;
}
