#include "HeartbeatEngine.hpp"
#include "Errors.hpp"
#include <iostream>
#include <stdexcept>

namespace discovery {

    std::string engineStateToString(EngineState state) {
        switch (state) {
            case EngineState::CREATED: return "created";
            case EngineState::RUNNING: return "running";
            case EngineState::FAILED:  return "failed";
            case EngineState::STOPPED: return "stopped";
            default:                   return "unknown";
        }
    }

    HeartbeatEngine::HeartbeatEngine(const Config& config, Transport::Ptr transportPtr, Codec::Ptr codecPtr, TimeSource clockSource)
        : settings(config),
          self(config.selfIdentity()),
          transport(std::move(transportPtr)),
          codec(std::move(codecPtr)),
          clock(std::move(clockSource)),
          notifier(config.subscriberQueue),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          tickTimer(io),
          sweepTimer(io) {
        if (!transport || !codec) {
            throw std::invalid_argument("HeartbeatEngine needs a transport and a codec");
        }
        if (!clock) {
            clock = &Clock::now;
        }
    }

    HeartbeatEngine::~HeartbeatEngine() {
        shutdown();
    }

    // ============================================================
    //  LIFECYCLE
    // ============================================================
    void HeartbeatEngine::start() {
        std::lock_guard<std::mutex> guard(shutdownMtx);
        if (shutDown || currentState.load() != EngineState::CREATED) return;

        // BindError goes straight to the caller, nothing to undo yet
        transport->open();

        running = true;
        currentState = EngineState::RUNNING;

        listenerThread = std::thread([this]{ listenLoop(); });

        nextTick = Clock::now();
        nextSweep = nextTick + settings.effectiveSweepInterval();
        scheduleTick();
        scheduleSweep();
        ioThread = std::thread([this]{ io.run(); });

        std::cout << "Discovery engine started: " << self.key()
                  << " name=" << settings.name
                  << " backend=" << codec->name() << std::endl;
    }

    void HeartbeatEngine::shutdown() {
        std::lock_guard<std::mutex> guard(shutdownMtx);
        if (shutDown) return;
        shutDown = true;

        const bool wasStarted = running.exchange(false);

        // 1. listener
        if (wasStarted) {
            transport->interrupt();
        }
        if (listenerThread.joinable()) listenerThread.join();

        // 2. timers
        workGuard.reset();
        io.stop();
        if (ioThread.joinable()) ioThread.join();
        tickTimer.cancel();
        sweepTimer.cancel();

        // 3. departure
        if (wasStarted && settings.announceDeparture) {
            localSequence++;
            sendAdvertisement(true);
        }

        // 4. flush the table
        {
            std::lock_guard<std::mutex> lock(writeMtx);
            for (const auto& record : peers.snapshot()) {
                if (auto removed = peers.remove(record.id)) {
                    notifier.publish(ChangeEvent::removed(*removed));
                }
            }
        }

        // 5. subscriptions, then the socket
        notifier.close();
        transport->release();

        {
            std::lock_guard<std::mutex> lock(stateMtx);
            if (currentState.load() != EngineState::FAILED) {
                currentState = EngineState::STOPPED;
            }
        }
        stateCv.notify_all();

        if (wasStarted) {
            std::cout << "Discovery engine stopped: " << self.key() << std::endl;
        }
    }

    // ============================================================
    //  TIMERS
    // ============================================================
    void HeartbeatEngine::scheduleTick() {
        tickTimer.expires_at(nextTick);
        tickTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running) return;
            tick();
            nextTick += settings.period;
            // fell more than a period behind (suspended host): realign instead of bursting
            const auto now = Clock::now();
            if (nextTick < now) {
                nextTick = now + settings.period;
            }
            scheduleTick();
        });
    }

    void HeartbeatEngine::scheduleSweep() {
        sweepTimer.expires_at(nextSweep);
        sweepTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running) return;
            sweep(clock());
            nextSweep += settings.effectiveSweepInterval();
            const auto now = Clock::now();
            if (nextSweep < now) {
                nextSweep = now + settings.effectiveSweepInterval();
            }
            scheduleSweep();
        });
    }

    // ============================================================
    //  SENDING
    // ============================================================
    void HeartbeatEngine::tick() {
        localSequence++;
        sendAdvertisement(false);
    }

    void HeartbeatEngine::sendAdvertisement(bool departing) {
        Advertisement advertisement;
        advertisement.id = self;
        advertisement.sequence = localSequence.load();
        advertisement.name = settings.name;
        advertisement.masterUri = settings.masterUri;
        advertisement.capabilities = static_cast<uint8_t>(codec->capability() |
            (settings.robotHosts.empty() ? CAP_NONE : CAP_STATIC_HOST));
        advertisement.departing = departing;

        std::vector<uint8_t> bytes;
        try {
            bytes = codec->encode(advertisement);
        } catch (const std::invalid_argument& e) {
            sendFailureCount++;
            std::cerr << "Error: cannot encode own advertisement: " << e.what() << std::endl;
            return;
        }

        const auto ec = transport->send(bytes);
        if (ec) {
            sendFailureCount++;
            std::cerr << "Warning: advertisement " << advertisement.sequence
                      << " not sent: " << ec.message() << std::endl;
            return;
        }
        sentCount++;
    }

    // ============================================================
    //  RECEIVING
    // ============================================================
    void HeartbeatEngine::listenLoop() {
        while (running) {
            Datagram datagram;
            const auto ec = transport->receive(datagram);
            if (ec) {
                if (ec == boost::asio::error::operation_aborted || !running) {
                    return;
                }
                const std::string message = "receive failed: " + ec.message();
                fail(std::make_exception_ptr(ListenerError(message)), message);
                return;
            }

            try {
                onDatagramReceived(datagram);
            } catch (const SchemaError& e) {
                fail(std::current_exception(), e.what());
                return;
            }
        }
    }

    void HeartbeatEngine::fail(std::exception_ptr error, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(stateMtx);
            if (!fatalError) {
                fatalError = error;
            }
            currentState = EngineState::FAILED;
        }
        stateCv.notify_all();
        std::cerr << "Error: discovery listener stopped: " << message << std::endl;
    }

    PeerIdentity HeartbeatEngine::resolveIdentity(const Advertisement& advertisement, const Datagram& datagram) const {
        PeerIdentity id = advertisement.id;
        if (settings.identitySource == IdentitySource::SOURCE || id.address.empty()) {
            id.address = datagram.sourceAddress;
        }
        return id;
    }

    void HeartbeatEngine::onDatagramReceived(const Datagram& datagram) {
        receivedCount++;

        Advertisement advertisement;
        const DecodeStatus status = codec->decode(datagram.payload, advertisement);
        if (status == DecodeStatus::VERSION_MISMATCH) {
            versionMismatchCount++;
            if (!settings.tolerateVersionMismatch) {
                throw SchemaError("protocol version mismatch in datagram from " +
                    datagram.sourceAddress + ":" + std::to_string(datagram.sourcePort));
            }
            logDiscard("version mismatch", datagram);
            return;
        }
        if (status != DecodeStatus::OK) {
            decodeErrorCount++;
            logDiscard(decodeStatusToString(status).c_str(), datagram);
            return;
        }

        const PeerIdentity id = resolveIdentity(advertisement, datagram);
        if (!id.isValid()) {
            decodeErrorCount++;
            logDiscard("no usable address", datagram);
            return;
        }
        if (id == self || advertisement.id == self) {
            ownCount++;
            return;
        }

        PeerRecord record;
        record.id = id;
        record.name = advertisement.name;
        record.masterUri = advertisement.masterUri;
        record.sequence = advertisement.sequence;
        record.lastSeen = clock();
        record.capabilities = static_cast<uint8_t>(advertisement.capabilities | codec->capability());

        std::lock_guard<std::mutex> lock(writeMtx);

        if (advertisement.departing) {
            applyDeparture(record);
            return;
        }

        replaceRestartedInstances(id);

        switch (peers.upsert(record)) {
            case Transition::ADDED:
                notifier.publish(ChangeEvent::added(record));
                std::cout << "New master: " << record.name << " " << record.masterUri
                          << " [" << id.key() << "]" << std::endl;
                break;
            case Transition::UPDATED:
                notifier.publish(ChangeEvent::updated(peers.get(id).value_or(record)));
                std::cout << "Master updated: " << record.name << " " << record.masterUri
                          << " [" << id.key() << "]" << std::endl;
                break;
            case Transition::REFRESHED:
                if (settings.emitRefresh) {
                    notifier.publish(ChangeEvent::updated(peers.get(id).value_or(record)));
                }
                break;
            case Transition::STALE:
                staleCount++;
                logDiscard("stale sequence", datagram);
                break;
        }
    }

    void HeartbeatEngine::applyDeparture(const PeerRecord& record) {
        const auto existing = peers.get(record.id);
        if (!existing) return;
        if (record.sequence <= existing->sequence) {
            staleCount++;
            return;
        }
        if (auto removed = peers.remove(record.id)) {
            notifier.publish(ChangeEvent::removed(*removed));
            std::cout << "Master left: " << removed->name << " [" << record.id.key() << "]" << std::endl;
        }
    }

    void HeartbeatEngine::replaceRestartedInstances(const PeerIdentity& id) {
        for (const auto& previous : peers.findByEndpoint(id.address, id.port)) {
            if (previous.id.instanceId == id.instanceId) continue;
            if (auto removed = peers.remove(previous.id)) {
                notifier.publish(ChangeEvent::removed(*removed));
                std::cout << "Master restarted: " << removed->name << " [" << previous.id.key()
                          << " -> " << instanceIdToHex(id.instanceId) << "]" << std::endl;
            }
        }
    }

    void HeartbeatEngine::logDiscard(const char* reason, const Datagram& datagram) const {
        if (!settings.verbose) return;
        std::cerr << "Warning: discarded datagram from " << datagram.sourceAddress << ":"
                  << datagram.sourcePort << " (" << reason << ")" << std::endl;
    }

    // ============================================================
    //  SWEEP
    // ============================================================
    size_t HeartbeatEngine::sweep(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(writeMtx);

        size_t count = 0;
        for (const auto& id : peers.expired(now, settings.timeout)) {
            if (auto removed = peers.remove(id)) {
                notifier.publish(ChangeEvent::removed(*removed));
                std::cout << "Master timed out: " << removed->name << " [" << id.key() << "]" << std::endl;
                count++;
            }
        }
        return count;
    }

    // ============================================================
    //  OBSERVERS
    // ============================================================
    Subscription::Ptr HeartbeatEngine::subscribe() {
        std::lock_guard<std::mutex> lock(writeMtx);
        return notifier.subscribe();
    }

    Subscription::Ptr HeartbeatEngine::subscribe(std::vector<PeerRecord>& snapshotOut) {
        std::lock_guard<std::mutex> lock(writeMtx);
        auto subscription = notifier.subscribe();
        snapshotOut = peers.snapshot();
        return subscription;
    }

    bool HeartbeatEngine::waitForFailure(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(stateMtx);
        stateCv.wait_for(lock, timeout, [this] {
            const EngineState state = currentState.load();
            return state == EngineState::FAILED || state == EngineState::STOPPED;
        });
        return fatalError != nullptr;
    }

    std::exception_ptr HeartbeatEngine::failure() const {
        std::lock_guard<std::mutex> lock(stateMtx);
        return fatalError;
    }

    EngineStats HeartbeatEngine::stats() const {
        EngineStats s;
        s.sent = sentCount.load();
        s.sendFailures = sendFailureCount.load();
        s.received = receivedCount.load();
        s.decodeErrors = decodeErrorCount.load();
        s.staleDrops = staleCount.load();
        s.ownDrops = ownCount.load();
        s.versionMismatches = versionMismatchCount.load();
        return s;
    }

} // namespace discovery
