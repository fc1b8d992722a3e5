#pragma once
#ifndef DISCOVERY_TRANSPORT_HPP
#define DISCOVERY_TRANSPORT_HPP

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace discovery {

    struct Datagram {
        std::vector<uint8_t> payload;
        std::string sourceAddress;
        uint16_t sourcePort = 0;
    };

    /**
     * Datagram channel used by the engine. Implementations must let send() and receive()
     * run concurrently from different threads.
     */
    class Transport {
        public:
            using Ptr = std::unique_ptr<Transport>;

            virtual ~Transport() = default;

            /**
             * Binds the shared endpoint. Throws BindError on failure.
             */
            virtual void open() = 0;

            /**
             * Sends one datagram to every configured destination. Errors are returned,
             * the caller decides whether to retry.
             */
            virtual boost::system::error_code send(const std::vector<uint8_t>& payload) = 0;

            /**
             * Blocks until a datagram arrives. Returns operation_aborted once interrupt()
             * has been called; any other error is a listener failure.
             */
            virtual boost::system::error_code receive(Datagram& out) = 0;

            /**
             * Wakes a blocked receive(). Safe to call from any thread, idempotent.
             */
            virtual void interrupt() = 0;

            /**
             * Closes every socket. Called once nobody is inside receive().
             */
            virtual void release() = 0;
    };

} // namespace discovery

#endif // DISCOVERY_TRANSPORT_HPP
