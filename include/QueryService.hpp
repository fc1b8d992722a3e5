#pragma once
#ifndef DISCOVERY_QUERY_SERVICE_HPP
#define DISCOVERY_QUERY_SERVICE_HPP

#include "HeartbeatEngine.hpp"
#include <optional>
#include <vector>

namespace discovery {

    struct SelfStatus {
        PeerIdentity id;
        std::string name;
        std::string masterUri;
        uint64_t sequence = 0;
        EngineState state = EngineState::CREATED;
        EngineStats stats;
        size_t peerCount = 0;
    };

    /**
     * Read-only view over a running engine. Never touches the network.
     */
    class QueryService {
        public:
            explicit QueryService(HeartbeatEngine& engine) : engine(engine) {}

            /** Every known peer, ordered by identity. Empty is a valid answer. */
            std::vector<PeerRecord> currentPeers() const;

            SelfStatus selfStatus() const;

            std::optional<PeerRecord> peer(const PeerIdentity& id) const;

            Subscription::Ptr subscribe(std::vector<PeerRecord>& snapshotOut) const {
                return engine.subscribe(snapshotOut);
            }

        private:
            HeartbeatEngine& engine;
    };

} // namespace discovery

#endif // DISCOVERY_QUERY_SERVICE_HPP
