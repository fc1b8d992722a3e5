#include "ServiceEndpoint.hpp"
#include "Errors.hpp"
#include <iostream>

namespace discovery {

    namespace {
        // clients that stopped reading are cut off after this
        constexpr auto STOP_GRACE = std::chrono::seconds(2);
    }

    ServiceEndpoint::ServiceEndpoint(const QueryService& query, std::string address, uint16_t port)
        : query(query),
          address(std::move(address)),
          requestedPort(port),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          acceptor(io),
          stopTimer(io) {}

    ServiceEndpoint::~ServiceEndpoint() {
        stop();
    }

    void ServiceEndpoint::start() {
        if (running) return;

        boost::system::error_code ec;
        const auto bindAddress = boost::asio::ip::make_address_v4(address, ec);
        if (ec) {
            throw BindError("invalid service address: " + address);
        }

        try {
            tcp::endpoint endpoint(bindAddress, requestedPort);
            acceptor.open(endpoint.protocol());
            acceptor.set_option(tcp::acceptor::reuse_address(true));
            acceptor.bind(endpoint);
            acceptor.listen();
            boundPort = acceptor.local_endpoint().port();
        } catch (const boost::system::system_error& e) {
            boost::system::error_code ignored;
            acceptor.close(ignored);
            throw BindError("cannot bind service endpoint " + address + ":" +
                std::to_string(requestedPort) + ": " + e.what());
        }

        running = true;
        doAccept();
        ioThread = std::thread([this]{ io.run(); });

        std::cout << "Query service listening on " << address << ":" << boundPort << std::endl;
    }

    void ServiceEndpoint::stop() {
        if (!running.exchange(false)) return;

        boost::asio::post(io, [this] {
            boost::system::error_code ec;
            acceptor.close(ec);
            // finish() may erase from sessions through the close handler
            const auto open = sessions;
            for (const auto& session : open) {
                session->finish();
            }
            if (sessions.empty()) return;

            stopTimer.expires_after(STOP_GRACE);
            stopTimer.async_wait([this](const boost::system::error_code& ec) {
                if (ec) return;
                const auto stalled = sessions;
                std::cerr << "Warning: closing " << stalled.size()
                          << " query client(s) still flushing" << std::endl;
                for (const auto& session : stalled) {
                    session->abort();
                }
            });
        });
        workGuard.reset();
        if (ioThread.joinable()) ioThread.join();
        sessions.clear();
    }

    void ServiceEndpoint::doAccept() {
        auto session = std::make_shared<ServiceSession>(io, query);
        acceptor.async_accept(session->socket(), [this, session](const boost::system::error_code& ec) {
            if (!ec) {
                sessions.insert(session);
                session->setCloseHandler([this](const ServiceSession::Ptr& closed) {
                    sessions.erase(closed);
                    if (!running && sessions.empty()) {
                        stopTimer.cancel();
                    }
                });
                session->start();
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cerr << "Warning: query service accept failed: " << ec.message() << std::endl;
            }
            if (running) doAccept();
        });
    }

} // namespace discovery
