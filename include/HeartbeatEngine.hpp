#pragma once
#ifndef DISCOVERY_HEARTBEAT_ENGINE_HPP
#define DISCOVERY_HEARTBEAT_ENGINE_HPP

#include "ChangeNotifier.hpp"
#include "Codec.hpp"
#include "Config.hpp"
#include "PeerTable.hpp"
#include "Transport.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace discovery {

    enum class EngineState {
        CREATED,
        RUNNING,
        FAILED,
        STOPPED
    };

    std::string engineStateToString(EngineState state);

    struct EngineStats {
        uint64_t sent = 0;
        uint64_t sendFailures = 0;
        uint64_t received = 0;
        uint64_t decodeErrors = 0;
        uint64_t staleDrops = 0;
        uint64_t ownDrops = 0;
        uint64_t versionMismatches = 0;
    };

    /**
     * Discovery engine for one local master.
     *
     * Three activities feed it: the timer thread runs tick() every period and sweep() every
     * sweep interval, the listener thread blocks in Transport::receive() and hands every
     * datagram to onDatagramReceived(). All table writes and event publication happen under
     * one write mutex which is never held across network I/O.
     *
     * tick(), onDatagramReceived() and sweep() are public so tests can drive the state
     * machine without threads.
     */
    class HeartbeatEngine {
        public:
            HeartbeatEngine(const Config& config, Transport::Ptr transport, Codec::Ptr codec,
                            TimeSource clock = &Clock::now);
            ~HeartbeatEngine();

            HeartbeatEngine(const HeartbeatEngine&) = delete;
            HeartbeatEngine& operator=(const HeartbeatEngine&) = delete;

            /**
             * Opens the transport and starts the listener and timer threads.
             * Throws BindError when the endpoint cannot be bound.
             */
            void start();

            /**
             * Stops listening, cancels the timers, announces departure, emits REMOVED for
             * every tracked peer, closes the subscriptions and releases the transport.
             * Idempotent; also valid on an engine that was never started.
             */
            void shutdown();

            /**
             * Sends one advertisement with the next sequence number. Send errors are
             * counted and left to the next tick.
             */
            void tick();

            /**
             * Applies one inbound datagram. Throws SchemaError on a version mismatch unless
             * the engine tolerates them.
             */
            void onDatagramReceived(const Datagram& datagram);

            /**
             * Removes every peer silent for longer than the timeout at `now`.
             * Returns the number of peers removed.
             */
            size_t sweep(Clock::time_point now);

            Subscription::Ptr subscribe();

            /**
             * Subscribes and copies the table under the write lock, so the snapshot plus
             * the following events describe the table exactly.
             */
            Subscription::Ptr subscribe(std::vector<PeerRecord>& snapshotOut);

            /**
             * Blocks until the engine fails, is shut down or the timeout passes.
             * Returns true when the engine has failed.
             */
            bool waitForFailure(std::chrono::milliseconds timeout);

            /** The stored fatal error, null while healthy */
            std::exception_ptr failure() const;

            const PeerTable& table() const { return peers; }
            const PeerIdentity& selfIdentity() const { return self; }
            const Config& config() const { return settings; }
            uint64_t sequence() const { return localSequence.load(); }
            EngineState state() const { return currentState.load(); }
            EngineStats stats() const;

        private:
            void listenLoop();
            void fail(std::exception_ptr error, const std::string& message);
            void scheduleTick();
            void scheduleSweep();
            void sendAdvertisement(bool departing);
            PeerIdentity resolveIdentity(const Advertisement& advertisement, const Datagram& datagram) const;
            void applyDeparture(const PeerRecord& record);
            void replaceRestartedInstances(const PeerIdentity& id);
            void logDiscard(const char* reason, const Datagram& datagram) const;

            Config settings;
            PeerIdentity self;
            Transport::Ptr transport;
            Codec::Ptr codec;
            TimeSource clock;

            PeerTable peers;
            ChangeNotifier notifier;
            std::mutex writeMtx;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            boost::asio::steady_timer tickTimer;
            boost::asio::steady_timer sweepTimer;
            Clock::time_point nextTick;
            Clock::time_point nextSweep;
            std::thread ioThread;
            std::thread listenerThread;

            std::atomic<bool> running{false};
            std::atomic<EngineState> currentState{EngineState::CREATED};
            std::atomic<uint64_t> localSequence{0};

            mutable std::mutex stateMtx;
            std::condition_variable stateCv;
            std::exception_ptr fatalError;
            std::mutex shutdownMtx;
            bool shutDown = false;

            std::atomic<uint64_t> sentCount{0};
            std::atomic<uint64_t> sendFailureCount{0};
            std::atomic<uint64_t> receivedCount{0};
            std::atomic<uint64_t> decodeErrorCount{0};
            std::atomic<uint64_t> staleCount{0};
            std::atomic<uint64_t> ownCount{0};
            std::atomic<uint64_t> versionMismatchCount{0};
    };

} // namespace discovery

#endif // DISCOVERY_HEARTBEAT_ENGINE_HPP
