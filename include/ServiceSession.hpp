#pragma once
#ifndef DISCOVERY_SERVICE_SESSION_HPP
#define DISCOVERY_SERVICE_SESSION_HPP

#include "QueryService.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace discovery {

    using tcp = boost::asio::ip::tcp;

    // Line formats of the local service protocol. Free text (uri, name) goes last.
    std::string formatPeerLine(const std::string& prefix, const PeerRecord& record);
    std::string formatEventLine(const ChangeEvent& event);
    std::string formatStatusLine(const SelfStatus& status);

    /**
     * One client of the local query service. Reads newline-terminated commands and answers
     * with newline-terminated lines:
     *
     *   list       -> "peer ..." per known peer, then "end"
     *   status     -> one "status ..." line
     *   subscribe  -> snapshot "peer ..." lines, "end", then one line per change
     *                 ("added|updated|removed ..." or "overflow <n>"), "closed" on shutdown
     *   quit       -> closes the session
     *
     * Every handler runs on the endpoint's io_context thread, so the session needs no lock.
     */
    class ServiceSession : public std::enable_shared_from_this<ServiceSession> {
        public:
            using Ptr = std::shared_ptr<ServiceSession>;
            using CloseCallback = std::function<void(const Ptr&)>;

            ServiceSession(boost::asio::io_context& ctx, const QueryService& query);
            ~ServiceSession();

            tcp::socket& socket() { return sock; }

            /** Starts the read loop */
            void start();

            void setCloseHandler(CloseCallback cb) { onClosed = std::move(cb); }

            /**
             * Flushes pending subscription events, writes "closed" to subscribers and closes
             * once everything queued has been written.
             */
            void finish();

            /** Closes at once, dropping whatever is still queued */
            void abort();

            bool isSubscribed() const { return subscription != nullptr; }

        private:
            void readLine();
            void handleLine(std::string line);
            void pollSubscription();
            void drainSubscription(size_t maxPending);
            void sendLine(const std::string& line);
            void doWrite();
            void closeWhenFlushed();
            void close();

            const QueryService& query;
            tcp::socket sock;
            boost::asio::steady_timer pollTimer;
            boost::asio::streambuf input;
            std::deque<std::string> outbox;
            Subscription::Ptr subscription;
            CloseCallback onClosed;
            bool closing = false;
            bool closed = false;
    };

} // namespace discovery

#endif // DISCOVERY_SERVICE_SESSION_HPP
