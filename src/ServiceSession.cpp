#include "ServiceSession.hpp"
#include <istream>
#include <limits>
#include <sstream>

namespace discovery {

    namespace {

        constexpr size_t MAX_COMMAND_LENGTH = 1024;
        // events stay in the bounded Subscription (and overflow there) while this many lines wait
        constexpr size_t MAX_PENDING_LINES = 64;
        constexpr auto SUBSCRIPTION_POLL = std::chrono::milliseconds(100);

        // one line per record: control characters would split it
        std::string sanitize(const std::string& text) {
            std::string out = text;
            for (auto& c : out) {
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) c = ' ';
            }
            return out;
        }

        std::string sanitizeToken(const std::string& text) {
            std::string out;
            out.reserve(text.size());
            for (char c : sanitize(text)) {
                if (c == ' ') out += "%20";
                else out += c;
            }
            return out.empty() ? "-" : out;
        }

        std::string trim(const std::string& text) {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

    } // namespace

    std::string formatPeerLine(const std::string& prefix, const PeerRecord& record) {
        std::ostringstream line;
        line << prefix << " "
             << record.id.address << " "
             << record.id.port << " "
             << instanceIdToHex(record.id.instanceId) << " "
             << record.sequence << " "
             << capabilitiesToString(record.capabilities) << " "
             << sanitizeToken(record.masterUri) << " "
             << sanitize(record.name);
        return line.str();
    }

    std::string formatEventLine(const ChangeEvent& event) {
        if (event.kind == ChangeKind::OVERFLOWED) {
            return "overflow " + std::to_string(event.dropped);
        }
        return formatPeerLine(changeKindToString(event.kind), event.record);
    }

    std::string formatStatusLine(const SelfStatus& status) {
        std::ostringstream line;
        line << "status "
             << status.id.address << " "
             << status.id.port << " "
             << instanceIdToHex(status.id.instanceId) << " "
             << "seq=" << status.sequence << " "
             << "state=" << engineStateToString(status.state) << " "
             << "peers=" << status.peerCount << " "
             << "sent=" << status.stats.sent << " "
             << "send_failures=" << status.stats.sendFailures << " "
             << "received=" << status.stats.received << " "
             << "decode_errors=" << status.stats.decodeErrors << " "
             << "stale=" << status.stats.staleDrops << " "
             << "own=" << status.stats.ownDrops << " "
             << "version_mismatches=" << status.stats.versionMismatches << " "
             << sanitizeToken(status.masterUri) << " "
             << sanitize(status.name);
        return line.str();
    }

    ServiceSession::ServiceSession(boost::asio::io_context& ctx, const QueryService& query)
        : query(query), sock(ctx), pollTimer(ctx), input(MAX_COMMAND_LENGTH) {}

    ServiceSession::~ServiceSession() {
        boost::system::error_code ec;
        sock.close(ec);
    }

    void ServiceSession::start() {
        readLine();
    }

    void ServiceSession::readLine() {
        auto self = shared_from_this();
        boost::asio::async_read_until(sock, input, '\n',
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    // disconnect, or a command longer than MAX_COMMAND_LENGTH
                    close();
                    return;
                }
                std::istream stream(&input);
                std::string line;
                std::getline(stream, line);
                handleLine(line);
                if (!closing && !closed) readLine();
            });
    }

    void ServiceSession::handleLine(std::string line) {
        line = trim(line);
        if (line.empty()) return;

        if (line == "list") {
            for (const auto& record : query.currentPeers()) {
                sendLine(formatPeerLine("peer", record));
            }
            sendLine("end");
        } else if (line == "status") {
            sendLine(formatStatusLine(query.selfStatus()));
        } else if (line == "subscribe") {
            if (subscription) {
                sendLine("error already subscribed");
                return;
            }
            std::vector<PeerRecord> snapshot;
            subscription = query.subscribe(snapshot);
            for (const auto& record : snapshot) {
                sendLine(formatPeerLine("peer", record));
            }
            sendLine("end");
            pollSubscription();
        } else if (line == "quit") {
            closeWhenFlushed();
        } else {
            sendLine("error unknown command");
        }
    }

    void ServiceSession::drainSubscription(size_t maxPending) {
        ChangeEvent event;
        while (outbox.size() < maxPending && subscription->tryNext(event)) {
            sendLine(formatEventLine(event));
        }
    }

    void ServiceSession::pollSubscription() {
        if (closing || closed || !subscription) return;

        drainSubscription(MAX_PENDING_LINES);
        if (subscription->finished()) {
            sendLine("closed");
            closeWhenFlushed();
            return;
        }

        auto self = shared_from_this();
        pollTimer.expires_after(SUBSCRIPTION_POLL);
        pollTimer.async_wait([this, self](const boost::system::error_code& ec) {
            if (ec) return;
            pollSubscription();
        });
    }

    void ServiceSession::finish() {
        if (closing || closed) return;
        if (subscription) {
            // the subscription is bounded, so the last flush is too
            drainSubscription(std::numeric_limits<size_t>::max());
            sendLine("closed");
        }
        closeWhenFlushed();
    }

    void ServiceSession::sendLine(const std::string& line) {
        if (closed) return;
        const bool idle = outbox.empty();
        outbox.push_back(line + "\n");
        if (idle) doWrite();
    }

    void ServiceSession::doWrite() {
        auto self = shared_from_this();
        boost::asio::async_write(sock, boost::asio::buffer(outbox.front()),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    close();
                    return;
                }
                outbox.pop_front();
                if (closed) return;
                if (!outbox.empty()) {
                    doWrite();
                } else if (closing) {
                    close();
                } else if (subscription) {
                    drainSubscription(MAX_PENDING_LINES);
                }
            });
    }

    void ServiceSession::closeWhenFlushed() {
        closing = true;
        if (outbox.empty()) close();
    }

    void ServiceSession::abort() {
        close();
    }

    void ServiceSession::close() {
        if (closed) return;
        closed = true;
        pollTimer.cancel();
        subscription.reset();

        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);

        if (onClosed) {
            auto cb = std::move(onClosed);
            cb(shared_from_this());
        }
    }

} // namespace discovery
