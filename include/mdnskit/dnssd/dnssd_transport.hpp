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

#include "dnssd_error.hpp"
#include "mdnskit/core/containers/buffer_view.hpp"

#include <boost/asio/ip/udp.hpp>

#include <string>

namespace mdk::dnssd {

/**
 * Interface class for the multicast capability used by the discovery engine. Implementations must reference-count
 * group membership: the group is joined for the first subscriber and left when the last subscriber leaves, so that
 * several sessions can share one transport.
 * All functions must be called from the thread which runs the io_context of the transport, and subscribers are
 * notified on that same thread.
 */
class Transport {
  public:
    struct Datagram {
        BufferView<const uint8_t> data;
        const boost::asio::ip::udp::endpoint& source;
    };

    class Subscriber {
      public:
        virtual ~Subscriber() = default;

        /**
         * Called for every datagram received on a group the subscriber joined.
         * @param datagram The received datagram. Only valid for the duration of the call.
         */
        virtual void on_receive(const Datagram& datagram) = 0;

        /**
         * Called when the transport can no longer deliver datagrams for the group (socket closed underneath,
         * membership lost). The subscriber should leave the transport.
         * @param error The kind of failure.
         * @param detail A description of what went wrong.
         */
        virtual void on_transport_error(Error error, const std::string& detail) = 0;
    };

    virtual ~Transport() = default;

    /**
     * Subscribes to datagrams sent to the given multicast group.
     * @param subscriber The subscriber, must stay valid until leave() is called.
     * @param group The multicast group and port.
     * @return Nothing on success, Error::network_unavailable if the group could not be joined.
     */
    [[nodiscard]] virtual tl::expected<void, Error>
    join(Subscriber* subscriber, const boost::asio::ip::udp::endpoint& group) = 0;

    /**
     * Sends a datagram to a group which was joined before.
     * @param data The datagram.
     * @param destination The multicast group and port.
     * @return Nothing on success, Error::send_failed otherwise.
     */
    [[nodiscard]] virtual tl::expected<void, Error>
    send(BufferView<const uint8_t> data, const boost::asio::ip::udp::endpoint& destination) = 0;

    /**
     * Removes the subscriber from all groups. After this call returns the subscriber receives no more calls. Leaving
     * without having joined is a no-op.
     * @param subscriber The subscriber to remove.
     */
    virtual void leave(const Subscriber* subscriber) = 0;
};

}  // namespace mdk::dnssd
