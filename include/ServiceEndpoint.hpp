#pragma once
#ifndef DISCOVERY_SERVICE_ENDPOINT_HPP
#define DISCOVERY_SERVICE_ENDPOINT_HPP

#include "ServiceSession.hpp"
#include <atomic>
#include <set>
#include <thread>

namespace discovery {

    /**
     * Local TCP endpoint exposing the query service to other processes on the host.
     * Runs its own io_context on one thread.
     */
    class ServiceEndpoint {
        public:
            ServiceEndpoint(const QueryService& query, std::string address, uint16_t port);
            ~ServiceEndpoint();

            ServiceEndpoint(const ServiceEndpoint&) = delete;
            ServiceEndpoint& operator=(const ServiceEndpoint&) = delete;

            /**
             * Binds and starts accepting. Port 0 picks an ephemeral port.
             * Throws BindError.
             */
            void start();

            /**
             * Stops accepting and finishes every session: subscribers get their pending
             * events and a "closed" line before the socket is closed. Sessions still
             * flushing after a short grace period are aborted.
             */
            void stop();

            /** Bound port, valid after start() */
            uint16_t port() const { return boundPort; }

        private:
            void doAccept();

            const QueryService& query;
            std::string address;
            uint16_t requestedPort;
            uint16_t boundPort = 0;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            tcp::acceptor acceptor;
            boost::asio::steady_timer stopTimer;
            std::set<ServiceSession::Ptr> sessions;
            std::thread ioThread;
            std::atomic<bool> running{false};
    };

} // namespace discovery

#endif // DISCOVERY_SERVICE_ENDPOINT_HPP
