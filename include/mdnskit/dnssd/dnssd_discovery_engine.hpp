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

#include "dnssd_discovery_session.hpp"
#include "dnssd_session_handle.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mdk::dnssd {

/**
 * Entry point for hosts which browse by service type string. Runs one DiscoverySession per service type, all sharing
 * the same transport. Sessions are identified by a handle returned from listen().
 * Not thread safe: all calls must happen on the thread running the io_context.
 */
class DiscoveryEngine {
  public:
    DiscoveryEngine(boost::asio::io_context& io_context, Transport& transport);
    DiscoveryEngine(boost::asio::io_context& io_context, Transport& transport, DiscoverySession::Configuration config);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    DiscoveryEngine(DiscoveryEngine&&) = delete;
    DiscoveryEngine& operator=(DiscoveryEngine&&) = delete;

    /**
     * Starts browsing for the given service type.
     * @param service_type The service type, i.e. "_http._tcp" or "_http._tcp.local.".
     * @param listener The listener receiving the events of the session. Must stay valid until the session is stopped.
     * @return The handle of the new session, or Error::invalid_service_type, Error::already_listening (a session for
     * the same service type is listening) or Error::network_unavailable.
     */
    [[nodiscard]] tl::expected<SessionHandle, Error> listen(const std::string& service_type, Listener* listener);

    /**
     * Stops and removes a session. A session which already went idle because of an error is removed as well.
     * @param handle The handle returned by listen().
     * @return Nothing on success, or Error::not_listening if the handle is unknown.
     */
    tl::expected<void, Error> stop(SessionHandle handle);

    /**
     * Stops and removes all sessions.
     */
    void stop_all();

    /**
     * @param handle The handle returned by listen().
     * @return The session, or nullptr if the handle is unknown.
     */
    [[nodiscard]] DiscoverySession* find_session(SessionHandle handle) const;

    /**
     * @return The number of sessions, including sessions which went idle because of an error.
     */
    [[nodiscard]] size_t session_count() const;

  private:
    struct Entry {
        SessionHandle handle;
        std::shared_ptr<DiscoverySession> session;
    };

    boost::asio::io_context& io_context_;
    Transport& transport_;
    DiscoverySession::Configuration config_;
    SessionHandle::Generator handle_generator_;
    std::vector<Entry> sessions_;

    void release(std::shared_ptr<DiscoverySession> session);
};

}  // namespace mdk::dnssd
