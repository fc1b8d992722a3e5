#include <gtest/gtest.h>
#include "HeartbeatEngine.hpp"
#include "Errors.hpp"
#include "FakeTransport.hpp"
#include "TestHelpers.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace discovery;

// -----------------------
// FIXTURE
// -----------------------
class HeartbeatEngineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config = makeTestConfig();
            network = std::make_shared<FakeNetwork>();
        }

        std::unique_ptr<HeartbeatEngine> makeEngine() {
            return std::make_unique<HeartbeatEngine>(config,
                std::make_unique<FakeTransport>(network),
                std::make_unique<HeartbeatCodec>(),
                clock.source());
        }

        static std::vector<ChangeEvent> drain(const Subscription::Ptr& subscription) {
            std::vector<ChangeEvent> events;
            ChangeEvent event;
            while (subscription->tryNext(event)) {
                events.push_back(event);
            }
            return events;
        }

        Config config;
        std::shared_ptr<FakeNetwork> network;
        ManualClock clock;
};

// -----------------------
// INBOUND HEARTBEATS
// -----------------------
TEST_F(HeartbeatEngineTest, FirstHeartbeatAddsPeer) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();

    engine->onDatagramReceived(heartbeat(1));

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ChangeKind::ADDED);
    EXPECT_EQ(events[0].id(), (PeerIdentity{"10.0.0.2", 11311, 0xA1}));
    EXPECT_EQ(events[0].record.lastSeen, clock.now);
    EXPECT_EQ(events[0].record.capabilities & CAP_HEARTBEAT, CAP_HEARTBEAT);
    EXPECT_EQ(engine->table().size(), 1u);
}

TEST_F(HeartbeatEngineTest, IncreasingSequencesConvergeToLastFields) {
    auto engine = makeEngine();

    for (uint64_t seq = 1; seq <= 5; ++seq) {
        engine->onDatagramReceived(heartbeat(seq, "robot-v" + std::to_string(seq)));
        clock.advance(std::chrono::seconds(1));
    }

    auto peers = engine->table().snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].sequence, 5u);
    EXPECT_EQ(peers[0].name, "robot-v5");
    EXPECT_EQ(peers[0].lastSeen, clock.now - std::chrono::seconds(1));
}

TEST_F(HeartbeatEngineTest, StaleSequenceNeverMutates) {
    auto engine = makeEngine();
    engine->onDatagramReceived(heartbeat(5, "current"));
    auto subscription = engine->subscribe();

    clock.advance(std::chrono::seconds(2));
    engine->onDatagramReceived(heartbeat(3, "replayed"));
    engine->onDatagramReceived(heartbeat(5, "duplicate"));

    auto record = engine->table().get(PeerIdentity{"10.0.0.2", 11311, 0xA1});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "current");
    EXPECT_EQ(record->lastSeen, clock.now - std::chrono::seconds(2));
    EXPECT_TRUE(drain(subscription).empty());
    EXPECT_EQ(engine->stats().staleDrops, 2u);
}

TEST_F(HeartbeatEngineTest, RefreshIsSilentByDefault) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();

    engine->onDatagramReceived(heartbeat(1));
    engine->onDatagramReceived(heartbeat(2));
    engine->onDatagramReceived(heartbeat(3));

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, ChangeKind::ADDED);
    EXPECT_EQ(engine->table().get(events[0].id())->sequence, 3u);
}

TEST_F(HeartbeatEngineTest, EmitRefreshPublishesEveryHeartbeat) {
    config.emitRefresh = true;
    auto engine = makeEngine();
    auto subscription = engine->subscribe();

    engine->onDatagramReceived(heartbeat(1));
    engine->onDatagramReceived(heartbeat(2));

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ChangeKind::UPDATED);
    EXPECT_EQ(events[1].record.sequence, 2u);
}

TEST_F(HeartbeatEngineTest, ChangedFieldsPublishUpdated) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();

    engine->onDatagramReceived(heartbeat(1, "before"));
    engine->onDatagramReceived(heartbeat(2, "after"));

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ChangeKind::UPDATED);
    EXPECT_EQ(events[1].record.name, "after");
}

TEST_F(HeartbeatEngineTest, OwnAdvertisementIsDropped) {
    auto engine = makeEngine();
    Advertisement own = makeAdvertisement(1, "local", config.instanceId, config.address, config.port);

    engine->onDatagramReceived(makeDatagram(own, config.address));

    EXPECT_TRUE(engine->table().empty());
    EXPECT_EQ(engine->stats().ownDrops, 1u);
}

// -----------------------
// IDENTITY RESOLUTION
// -----------------------
TEST_F(HeartbeatEngineTest, PayloadAddressWinsByDefault) {
    auto engine = makeEngine();
    engine->onDatagramReceived(makeDatagram(makeAdvertisement(1), "192.168.7.7"));

    auto peers = engine->table().snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id.address, "10.0.0.2");
}

TEST_F(HeartbeatEngineTest, EmptyPayloadAddressFallsBackToSource) {
    auto engine = makeEngine();
    engine->onDatagramReceived(makeDatagram(makeAdvertisement(1, "robot", 0xA1, ""), "192.168.7.7"));

    auto peers = engine->table().snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id.address, "192.168.7.7");
}

TEST_F(HeartbeatEngineTest, SourceIdentityUsesDatagramSender) {
    config.identitySource = IdentitySource::SOURCE;
    auto engine = makeEngine();
    engine->onDatagramReceived(makeDatagram(makeAdvertisement(1), "192.168.7.7"));

    auto peers = engine->table().snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id, (PeerIdentity{"192.168.7.7", 11311, 0xA1}));
}

// -----------------------
// INVALID INPUT
// -----------------------
TEST_F(HeartbeatEngineTest, InvalidPayloadBetweenValidOnesChangesNothing) {
    auto reference = makeEngine();
    reference->onDatagramReceived(heartbeat(1, "first"));
    reference->onDatagramReceived(heartbeat(2, "second"));

    auto engine = makeEngine();
    auto subscription = engine->subscribe();
    engine->onDatagramReceived(heartbeat(1, "first"));

    Datagram garbage;
    garbage.payload = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01};
    garbage.sourceAddress = "10.0.0.9";
    engine->onDatagramReceived(garbage);

    Datagram corrupted = heartbeat(9, "evil");
    corrupted.payload[HEADER_SIZE + 3] ^= 0x01;
    engine->onDatagramReceived(corrupted);

    Datagram truncated = heartbeat(10, "short");
    truncated.payload.resize(truncated.payload.size() / 2);
    engine->onDatagramReceived(truncated);

    engine->onDatagramReceived(heartbeat(2, "second"));

    auto expected = reference->table().snapshot();
    auto actual = engine->table().snapshot();
    ASSERT_EQ(actual.size(), expected.size());
    EXPECT_EQ(actual[0].id, expected[0].id);
    EXPECT_EQ(actual[0].name, expected[0].name);
    EXPECT_EQ(actual[0].sequence, expected[0].sequence);

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, ChangeKind::ADDED);
    EXPECT_EQ(events[1].kind, ChangeKind::UPDATED);
    EXPECT_EQ(engine->stats().decodeErrors, 3u);
    EXPECT_EQ(engine->stats().received, 5u);
}

TEST_F(HeartbeatEngineTest, VersionMismatchIsFatalByDefault) {
    auto engine = makeEngine();
    Datagram future = heartbeat(1);
    future.payload[4] = PROTOCOL_VERSION + 1;

    EXPECT_THROW(engine->onDatagramReceived(future), SchemaError);
    EXPECT_TRUE(engine->table().empty());
}

TEST_F(HeartbeatEngineTest, VersionMismatchCanBeTolerated) {
    config.tolerateVersionMismatch = true;
    auto engine = makeEngine();
    Datagram future = heartbeat(1);
    future.payload[4] = PROTOCOL_VERSION + 1;

    EXPECT_NO_THROW(engine->onDatagramReceived(future));
    EXPECT_EQ(engine->stats().versionMismatches, 1u);
    EXPECT_TRUE(engine->table().empty());
}

// -----------------------
// RESTART AND DEPARTURE
// -----------------------
TEST_F(HeartbeatEngineTest, RestartYieldsDistinctLifecycles) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();

    engine->onDatagramReceived(heartbeat(1, "robot", 0xA1));
    engine->onDatagramReceived(heartbeat(2, "robot", 0xA1));
    // same address and port, new process: its sequence starts over
    engine->onDatagramReceived(heartbeat(1, "robot", 0xB2));

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].kind, ChangeKind::ADDED);
    EXPECT_EQ(events[0].id().instanceId, 0xA1u);
    EXPECT_EQ(events[1].kind, ChangeKind::REMOVED);
    EXPECT_EQ(events[1].id().instanceId, 0xA1u);
    EXPECT_EQ(events[2].kind, ChangeKind::ADDED);
    EXPECT_EQ(events[2].id().instanceId, 0xB2u);

    auto peers = engine->table().snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id.instanceId, 0xB2u);
    EXPECT_EQ(peers[0].sequence, 1u);
}

TEST_F(HeartbeatEngineTest, DepartureRemovesImmediately) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();
    engine->onDatagramReceived(heartbeat(1));

    Advertisement leaving = makeAdvertisement(2);
    leaving.departing = true;
    engine->onDatagramReceived(makeDatagram(leaving));

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ChangeKind::REMOVED);
    EXPECT_TRUE(engine->table().empty());
}

TEST_F(HeartbeatEngineTest, OldDepartureIsIgnored) {
    auto engine = makeEngine();
    engine->onDatagramReceived(heartbeat(5));

    Advertisement leaving = makeAdvertisement(4);
    leaving.departing = true;
    engine->onDatagramReceived(makeDatagram(leaving));

    Advertisement unknown = makeAdvertisement(9, "ghost", 0xC3);
    unknown.departing = true;
    engine->onDatagramReceived(makeDatagram(unknown));

    EXPECT_EQ(engine->table().size(), 1u);
    EXPECT_EQ(engine->stats().staleDrops, 1u);
}

// -----------------------
// TIMEOUT SWEEP
// -----------------------
TEST_F(HeartbeatEngineTest, SilentPeerRemovedOnceAfterTimeout) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();
    const auto seen = clock.now;
    engine->onDatagramReceived(heartbeat(1));

    EXPECT_EQ(engine->sweep(seen + config.timeout), 0u);
    EXPECT_EQ(engine->sweep(seen + config.timeout + std::chrono::milliseconds(1)), 1u);
    EXPECT_EQ(engine->sweep(seen + config.timeout + std::chrono::seconds(10)), 0u);

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, ChangeKind::REMOVED);
    EXPECT_EQ(events[1].record.sequence, 1u);
    EXPECT_TRUE(engine->table().empty());
}

TEST_F(HeartbeatEngineTest, SweepIsDeterministicForFixedTime) {
    auto engine = makeEngine();
    engine->onDatagramReceived(heartbeat(1, "old", 0xA1));
    clock.advance(std::chrono::seconds(3));
    engine->onDatagramReceived(makeDatagram(makeAdvertisement(1, "young", 0xA2, "10.0.0.3")));

    EXPECT_EQ(engine->sweep(clock.now + std::chrono::milliseconds(2500)), 1u);
    auto peers = engine->table().snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].name, "young");
}

TEST_F(HeartbeatEngineTest, PeriodOneTimeoutFiveScenario) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();
    const auto start = clock.now;

    struct Observed {
        ChangeKind kind;
        std::chrono::milliseconds at;
    };
    std::vector<Observed> observed;

    // A advertises at t = 0, 1, 2, 3; sweeps run every 500 ms up to t = 10
    for (int step = 0; step <= 20; ++step) {
        const auto at = std::chrono::milliseconds(step * 500);
        clock.now = start + at;
        if (step % 2 == 0 && step <= 6) {
            engine->onDatagramReceived(heartbeat(static_cast<uint64_t>(step / 2 + 1)));
        }
        engine->sweep(clock.now);

        ChangeEvent event;
        while (subscription->tryNext(event)) {
            observed.push_back({event.kind, at});
        }
    }

    ASSERT_EQ(observed.size(), 2u);
    EXPECT_EQ(observed[0].kind, ChangeKind::ADDED);
    EXPECT_EQ(observed[0].at, std::chrono::milliseconds(0));
    EXPECT_EQ(observed[1].kind, ChangeKind::REMOVED);
    // last seen at t = 3, so the first sweep strictly after t = 8
    EXPECT_EQ(observed[1].at, std::chrono::milliseconds(8500));
}

// -----------------------
// SENDING
// -----------------------
TEST_F(HeartbeatEngineTest, TickSendsIncreasingSequences) {
    auto engine = makeEngine();
    engine->tick();
    engine->tick();

    ASSERT_EQ(network->sentCount(), 2u);
    Advertisement sent;
    ASSERT_EQ(parseAdvertisement(network->lastSent(), sent), DecodeStatus::OK);
    EXPECT_EQ(sent.sequence, 2u);
    EXPECT_EQ(sent.id, config.selfIdentity());
    EXPECT_EQ(sent.name, "local");
    EXPECT_EQ(sent.masterUri, config.masterUri);
    EXPECT_FALSE(sent.departing);
    EXPECT_EQ(engine->sequence(), 2u);
    EXPECT_EQ(engine->stats().sent, 2u);
}

TEST_F(HeartbeatEngineTest, StaticHostsAreAdvertisedAsCapability) {
    config.robotHosts = {"10.0.0.50"};
    auto engine = makeEngine();
    engine->tick();

    Advertisement sent;
    ASSERT_EQ(parseAdvertisement(network->lastSent(), sent), DecodeStatus::OK);
    EXPECT_EQ(sent.capabilities, CAP_HEARTBEAT | CAP_STATIC_HOST);
}

TEST_F(HeartbeatEngineTest, SendFailureIsRetriedNextTick) {
    auto engine = makeEngine();
    network->failSends = true;
    engine->tick();
    EXPECT_EQ(engine->stats().sendFailures, 1u);
    EXPECT_EQ(network->sentCount(), 0u);

    network->failSends = false;
    engine->tick();
    EXPECT_EQ(network->sentCount(), 1u);

    Advertisement sent;
    ASSERT_EQ(parseAdvertisement(network->lastSent(), sent), DecodeStatus::OK);
    EXPECT_EQ(sent.sequence, 2u);
}

// -----------------------
// SUBSCRIPTIONS
// -----------------------
TEST_F(HeartbeatEngineTest, SnapshotSubscriptionHasNoGap) {
    auto engine = makeEngine();
    engine->onDatagramReceived(heartbeat(1, "first", 0xA1));

    std::vector<PeerRecord> snapshot;
    auto subscription = engine->subscribe(snapshot);
    engine->onDatagramReceived(makeDatagram(makeAdvertisement(1, "second", 0xA2, "10.0.0.3")));

    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].name, "first");
    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].record.name, "second");
}

TEST_F(HeartbeatEngineTest, SubscribersSeeTransitionsInOrder) {
    auto engine = makeEngine();
    auto subscription = engine->subscribe();

    for (uint64_t seq = 1; seq <= 20; ++seq) {
        engine->onDatagramReceived(heartbeat(seq, "name-" + std::to_string(seq)));
    }

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 20u);
    EXPECT_EQ(events[0].kind, ChangeKind::ADDED);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_EQ(events[i].kind, ChangeKind::UPDATED);
        EXPECT_EQ(events[i].record.sequence, events[i - 1].record.sequence + 1);
    }
}

// -----------------------
// LIFECYCLE
// -----------------------
TEST_F(HeartbeatEngineTest, StartShutdownFlushesAndAnnouncesDeparture) {
    auto engine = makeEngine();
    engine->start();
    EXPECT_EQ(engine->state(), EngineState::RUNNING);
    auto subscription = engine->subscribe();

    network->deliver(heartbeat(1));
    ASSERT_TRUE(eventually([&] { return engine->table().size() == 1; }));
    ASSERT_TRUE(eventually([&] { return network->sentCount() >= 1; }));

    engine->shutdown();

    EXPECT_EQ(engine->state(), EngineState::STOPPED);
    EXPECT_TRUE(engine->table().empty());

    auto events = drain(subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, ChangeKind::ADDED);
    EXPECT_EQ(events[1].kind, ChangeKind::REMOVED);
    EXPECT_TRUE(subscription->finished());

    Advertisement last;
    ASSERT_EQ(parseAdvertisement(network->lastSent(), last), DecodeStatus::OK);
    EXPECT_TRUE(last.departing);
    EXPECT_TRUE(network->released);

    // idempotent
    engine->shutdown();
    EXPECT_FALSE(engine->waitForFailure(std::chrono::milliseconds(10)));
}

TEST_F(HeartbeatEngineTest, NoDepartureWhenDisabled) {
    config.announceDeparture = false;
    auto engine = makeEngine();
    engine->start();
    ASSERT_TRUE(eventually([&] { return network->sentCount() >= 1; }));
    engine->shutdown();

    Advertisement last;
    ASSERT_EQ(parseAdvertisement(network->lastSent(), last), DecodeStatus::OK);
    EXPECT_FALSE(last.departing);
}

TEST_F(HeartbeatEngineTest, TicksFollowAbsoluteDeadlines) {
    config.period = std::chrono::milliseconds(50);
    config.announceDeparture = false;
    auto engine = makeEngine();

    const auto begin = std::chrono::steady_clock::now();
    engine->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    const auto sent = engine->stats().sent;
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    engine->shutdown();

    // one tick at start, then one per full period
    const auto expected = static_cast<double>(elapsed / config.period) + 1.0;
    EXPECT_NEAR(static_cast<double>(sent), expected, 1.0);
}

TEST_F(HeartbeatEngineTest, BindFailurePropagates) {
    network->openThrows = true;
    auto engine = makeEngine();

    EXPECT_THROW(engine->start(), BindError);
    EXPECT_EQ(engine->state(), EngineState::CREATED);
    EXPECT_EQ(network->sentCount(), 0u);
}

TEST_F(HeartbeatEngineTest, ListenerErrorFailsEngine) {
    auto engine = makeEngine();
    engine->start();

    network->breakListener(boost::asio::error::network_down);

    ASSERT_TRUE(engine->waitForFailure(std::chrono::seconds(5)));
    EXPECT_EQ(engine->state(), EngineState::FAILED);
    EXPECT_THROW(std::rethrow_exception(engine->failure()), ListenerError);

    engine->shutdown();
    EXPECT_EQ(engine->state(), EngineState::FAILED);
}

TEST_F(HeartbeatEngineTest, VersionMismatchOnWireFailsEngine) {
    auto engine = makeEngine();
    engine->start();

    Datagram future = heartbeat(1);
    future.payload[4] = PROTOCOL_VERSION + 1;
    network->deliver(future);

    ASSERT_TRUE(engine->waitForFailure(std::chrono::seconds(5)));
    try {
        std::rethrow_exception(engine->failure());
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.exitCode(), ExitCode::SCHEMA_MISMATCH);
    }
    engine->shutdown();
}

TEST_F(HeartbeatEngineTest, ShutdownWithoutStartIsSafe) {
    auto engine = makeEngine();
    engine->onDatagramReceived(heartbeat(1));
    auto subscription = engine->subscribe();

    engine->shutdown();

    ChangeEvent event;
    ASSERT_TRUE(subscription->tryNext(event));
    EXPECT_EQ(event.kind, ChangeKind::REMOVED);
    EXPECT_EQ(network->sentCount(), 0u);
    EXPECT_EQ(engine->state(), EngineState::STOPPED);
    EXPECT_EQ(engineStateToString(EngineState::STOPPED), "stopped");
}
