/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_udp_transport.hpp"

#include "mdnskit/core/log.hpp"

#include <array>

namespace {

// Largest datagram a multicast DNS packet may be, see RFC 6762 section 17.
constexpr size_t k_max_datagram_size = 9000;

}  // namespace

class mdk::dnssd::UdpTransport::SocketContext: public std::enable_shared_from_this<SocketContext> {
  public:
    SocketContext(boost::asio::io_context& io_context, boost::asio::ip::udp::endpoint group) :
        group_(std::move(group)), socket_(io_context) {}

    ~SocketContext() {
        subscribers_.clear();
    }

    boost::system::error_code open(const Configuration& config) {
        boost::system::error_code ec;

        socket_.open(boost::asio::ip::udp::v4(), ec);
        if (ec) {
            return ec;
        }

        socket_.set_option(boost::asio::ip::udp::socket::reuse_address(true), ec);
        if (ec) {
            return ec;
        }

        socket_.bind({boost::asio::ip::address_v4::any(), group_.port()}, ec);
        if (ec) {
            return ec;
        }

        const auto group_address = group_.address().to_v4();
        socket_.set_option(boost::asio::ip::multicast::join_group(group_address, config.interface_address), ec);
        if (ec) {
            return ec;
        }

        if (!config.interface_address.is_unspecified()) {
            socket_.set_option(boost::asio::ip::multicast::outbound_interface(config.interface_address), ec);
            if (ec) {
                return ec;
            }
        }

        socket_.set_option(boost::asio::ip::multicast::hops(config.multicast_hops), ec);
        if (ec) {
            return ec;
        }

        socket_.set_option(boost::asio::ip::multicast::enable_loopback(config.multicast_loopback), ec);
        if (ec) {
            return ec;
        }

        interface_address_ = config.interface_address;
        return {};
    }

    void start() {
        async_receive();
        MDK_TRACE("Started receiving on {}:{}", group_.address().to_string(), group_.port());
    }

    void close() {
        subscribers_.clear();

        if (!socket_.is_open()) {
            return;
        }

        boost::system::error_code ec;
        socket_.set_option(
            boost::asio::ip::multicast::leave_group(group_.address().to_v4(), interface_address_), ec
        );
        if (ec) {
            MDK_ERROR("Failed to leave multicast group: {}", ec.message());
        }

        socket_.close(ec);
        if (ec) {
            MDK_ERROR("Failed to close socket: {}", ec.message());
        }

        MDK_TRACE("Closed socket for {}:{}", group_.address().to_string(), group_.port());
    }

    boost::system::error_code send(const BufferView<const uint8_t> data, const boost::asio::ip::udp::endpoint& endpoint) {
        boost::system::error_code ec;
        const auto sent = socket_.send_to(boost::asio::buffer(data.data(), data.size()), endpoint, 0, ec);
        if (!ec && sent != data.size()) {
            return boost::asio::error::message_size;
        }
        return ec;
    }

    [[nodiscard]] bool add_subscriber(Subscriber* subscriber) {
        return subscribers_.add(subscriber);
    }

    [[nodiscard]] bool remove_subscriber(const Subscriber* subscriber) {
        return subscribers_.remove(subscriber);
    }

    [[nodiscard]] const boost::asio::ip::udp::endpoint& group() const {
        return group_;
    }

    [[nodiscard]] bool empty() const {
        return subscribers_.empty();
    }

  private:
    boost::asio::ip::udp::endpoint group_;
    boost::asio::ip::address_v4 interface_address_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint sender_endpoint_;
    std::array<uint8_t, k_max_datagram_size> recv_data_ {};
    SubscriberList<Subscriber> subscribers_;

    void async_receive() {
        auto self = shared_from_this();
        socket_.async_receive_from(
            boost::asio::buffer(recv_data_), sender_endpoint_,
            [self](const boost::system::error_code& ec, const std::size_t bytes_received) {
                if (ec == boost::asio::error::operation_aborted) {
                    MDK_TRACE("Operation aborted");
                    return;
                }

                if (ec) {
                    MDK_ERROR("Read error: {}. Closing socket.", ec.message());
                    const auto message = ec.message();
                    self->subscribers_.foreach ([&message](Subscriber* subscriber) {
                        subscriber->on_transport_error(Error::transport_failure, message);
                    });
                    return;
                }

                if (!self->socket_.is_open()) {
                    return;
                }

                const Datagram datagram {
                    BufferView<const uint8_t>(self->recv_data_.data(), bytes_received), self->sender_endpoint_
                };
                self->subscribers_.foreach ([&datagram](Subscriber* subscriber) {
                    subscriber->on_receive(datagram);
                });

                if (self->socket_.is_open()) {
                    self->async_receive();
                }
            }
        );
    }
};

mdk::dnssd::UdpTransport::UdpTransport(boost::asio::io_context& io_context) :
    UdpTransport(io_context, Configuration {}) {}

mdk::dnssd::UdpTransport::UdpTransport(boost::asio::io_context& io_context, Configuration config) :
    io_context_(io_context), config_(std::move(config)) {}

mdk::dnssd::UdpTransport::~UdpTransport() {
    for (auto& socket : sockets_) {
        socket->close();
    }
}

size_t mdk::dnssd::UdpTransport::socket_count() const {
    return sockets_.size();
}

tl::expected<void, mdk::dnssd::Error>
mdk::dnssd::UdpTransport::join(Subscriber* subscriber, const boost::asio::ip::udp::endpoint& group) {
    MDK_ASSERT(subscriber != nullptr, "Subscriber should not be nullptr");

    if (!group.address().is_v4() || !group.address().is_multicast()) {
        MDK_ERROR("Group address is not an IPv4 multicast address: {}", group.address().to_string());
        return tl::unexpected(Error::network_unavailable);
    }

    auto* context = find_socket_context(group);
    if (context == nullptr) {
        auto new_context = std::make_shared<SocketContext>(io_context_, group);
        if (const auto ec = new_context->open(config_)) {
            MDK_ERROR("Failed to join multicast group {}:{}: {}", group.address().to_string(), group.port(), ec.message());
            new_context->close();
            return tl::unexpected(Error::network_unavailable);
        }
        new_context->start();
        context = sockets_.emplace_back(std::move(new_context)).get();
        MDK_DEBUG("Joined multicast group {}:{}", group.address().to_string(), group.port());
    }

    if (!context->add_subscriber(subscriber)) {
        MDK_WARNING("Subscriber already joined group {}:{}", group.address().to_string(), group.port());
    }

    return {};
}

tl::expected<void, mdk::dnssd::Error> mdk::dnssd::UdpTransport::send(
    const BufferView<const uint8_t> data, const boost::asio::ip::udp::endpoint& destination
) {
    if (data.empty()) {
        MDK_ERROR("Refusing to send an empty datagram");
        return tl::unexpected(Error::send_failed);
    }

    auto* context = find_socket_context(destination);
    if (context == nullptr) {
        MDK_ERROR("Group {}:{} was not joined", destination.address().to_string(), destination.port());
        return tl::unexpected(Error::send_failed);
    }

    if (const auto ec = context->send(data, destination)) {
        MDK_ERROR("Failed to send data: {}", ec.message());
        return tl::unexpected(Error::send_failed);
    }

    return {};
}

void mdk::dnssd::UdpTransport::leave(const Subscriber* subscriber) {
    for (auto it = sockets_.begin(); it != sockets_.end();) {
        if ((*it)->remove_subscriber(subscriber) && (*it)->empty()) {
            MDK_DEBUG("Leaving multicast group {}:{}", (*it)->group().address().to_string(), (*it)->group().port());
            (*it)->close();
            it = sockets_.erase(it);
        } else {
            ++it;
        }
    }
}

mdk::dnssd::UdpTransport::SocketContext*
mdk::dnssd::UdpTransport::find_socket_context(const boost::asio::ip::udp::endpoint& group) const {
    for (auto& context : sockets_) {
        if (context->group() == group) {
            return context.get();
        }
    }
    return nullptr;
}
