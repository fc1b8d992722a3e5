#include "UdpTransport.hpp"
#include "Errors.hpp"
#include "Types.hpp"
#include <cstddef>

namespace discovery {

    UdpTransport::UdpTransport(UdpOptions transportOptions)
        : options(std::move(transportOptions)),
        io(),
        recvSocket(io),
        sendSocket(io) {}

    UdpTransport::~UdpTransport() {
        closeSockets();
    }

    void UdpTransport::open() {
        boost::system::error_code errorCode;
        const auto groupAddress = boost::asio::ip::make_address(options.group, errorCode);
        if (errorCode || !groupAddress.is_v4()) {
            throw BindError("Invalid discovery group address: " + options.group);
        }
        multicast = groupAddress.is_multicast();

        try {
            const auto interfaceAddress = boost::asio::ip::make_address_v4(options.interfaceAddress);

            recvSocket.open(udp::v4());
            recvSocket.set_option(udp::socket::reuse_address(true));
            recvSocket.bind(udp::endpoint(udp::v4(), options.port));
            boundPort = recvSocket.local_endpoint().port();

            if (multicast) {
                recvSocket.set_option(boost::asio::ip::multicast::join_group(groupAddress.to_v4(), interfaceAddress));
            }

            sendSocket.open(udp::v4());
            if (multicast) {
                sendSocket.set_option(boost::asio::ip::multicast::hops(options.ttl));
                sendSocket.set_option(boost::asio::ip::multicast::enable_loopback(options.loopback));
                if (!interfaceAddress.is_unspecified()) {
                    sendSocket.set_option(boost::asio::ip::multicast::outbound_interface(interfaceAddress));
                }
            } else {
                sendSocket.set_option(boost::asio::socket_base::broadcast(true));
            }

            // An ephemeral bind sends to itself, which is what the loopback tests rely on
            const uint16_t destinationPort = options.port != 0 ? options.port : boundPort;
            destinations.clear();
            destinations.emplace_back(groupAddress, destinationPort);

            udp::resolver resolver(io);
            for (const auto& host : options.unicastHosts) {
                auto results = resolver.resolve(udp::v4(), host, std::to_string(destinationPort));
                if (results.empty()) {
                    throw BindError("Cannot resolve static host: " + host);
                }
                destinations.push_back(results.begin()->endpoint());
            }
        } catch (const boost::system::system_error& e) {
            closeSockets();
            throw BindError(std::string("Cannot bind discovery endpoint on port ") +
                std::to_string(options.port) + ": " + e.what());
        }

        recvBuf.resize(MAX_DATAGRAM_SIZE);
        interrupted.store(false);
    }

    boost::system::error_code UdpTransport::send(const std::vector<uint8_t>& payload) {
        std::lock_guard<std::mutex> lock(sendMtx);

        boost::system::error_code firstError;
        for (const auto& destination : destinations) {
            boost::system::error_code errorCode;
            sendSocket.send_to(boost::asio::buffer(payload), destination, 0, errorCode);
            if (errorCode && !firstError) {
                firstError = errorCode;
            }
        }

        if (destinations.empty()) {
            return boost::asio::error::not_connected;
        }
        return firstError;
    }

    boost::system::error_code UdpTransport::receive(Datagram& out) {
        if (interrupted.load()) {
            return boost::asio::error::operation_aborted;
        }

        boost::system::error_code result = boost::asio::error::would_block;
        std::size_t length = 0;
        udp::endpoint sender;

        recvSocket.async_receive_from(boost::asio::buffer(recvBuf), sender,
            [&result, &length](const boost::system::error_code& errorCode, std::size_t received) {
                result = errorCode;
                length = received;
            });

        io.restart();
        while (result == boost::asio::error::would_block) {
            if (io.run_one() == 0) {
                result = boost::asio::error::operation_aborted;
            }
        }

        if (result) {
            return interrupted.load() ? boost::asio::error::operation_aborted : result;
        }

        out.payload.assign(recvBuf.begin(), recvBuf.begin() + static_cast<std::ptrdiff_t>(length));
        out.sourceAddress = sender.address().to_string();
        out.sourcePort = sender.port();
        return {};
    }

    void UdpTransport::interrupt() {
        interrupted.store(true);
        boost::asio::post(io, [this] {
            boost::system::error_code errorCode;
            recvSocket.close(errorCode);
        });
    }

    void UdpTransport::release() {
        interrupted.store(true);
        closeSockets();
    }

    uint16_t UdpTransport::localPort() const {
        return boundPort;
    }

    void UdpTransport::closeSockets() {
        boost::system::error_code errorCode;
        if (recvSocket.is_open()) {
            recvSocket.close(errorCode);
        }
        if (sendSocket.is_open()) {
            sendSocket.close(errorCode);
        }
    }

} // namespace discovery
