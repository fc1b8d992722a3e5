#pragma once
#ifndef DISCOVERY_UDP_TRANSPORT_HPP
#define DISCOVERY_UDP_TRANSPORT_HPP

#include "Transport.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <mutex>

namespace discovery {

    using udp = boost::asio::ip::udp;

    struct UdpOptions {
        std::string group;                         // multicast group or broadcast/unicast address
        uint16_t port = 0;                         // 0 binds an ephemeral port (tests)
        std::string interfaceAddress = "0.0.0.0";  // local interface for multicast
        int ttl = 1;
        bool loopback = true;
        std::vector<std::string> unicastHosts;     // static peers, reached on the same port
    };

    /**
     * UDP implementation of the Transport.
     *
     * Uses one socket for sending and one for receiving so the timer thread and the
     * listener thread never share a socket object. The receive socket is bound with
     * SO_REUSEADDR: several daemons on one host all receive multicast and broadcast
     * heartbeats, but a unicast datagram to a shared port reaches only one of them.
     *
     * receive() drives a private io_context so interrupt() can cancel it by posting the
     * close onto that context.
     */
    class UdpTransport : public Transport {
        public:
            explicit UdpTransport(UdpOptions options);
            ~UdpTransport() override;

            UdpTransport(const UdpTransport&) = delete;
            UdpTransport& operator=(const UdpTransport&) = delete;

            void open() override;
            boost::system::error_code send(const std::vector<uint8_t>& payload) override;
            boost::system::error_code receive(Datagram& out) override;
            void interrupt() override;
            void release() override;

            /** Port the receive socket is bound to (after open()) */
            uint16_t localPort() const;

            bool isMulticast() const { return multicast; }

        private:
            void closeSockets();

            UdpOptions options;
            boost::asio::io_context io;
            udp::socket recvSocket;
            udp::socket sendSocket;
            std::vector<udp::endpoint> destinations;
            std::vector<uint8_t> recvBuf;
            std::mutex sendMtx;
            std::atomic<bool> interrupted{false};
            bool multicast = false;
            uint16_t boundPort = 0;
    };

} // namespace discovery

#endif // DISCOVERY_UDP_TRANSPORT_HPP
