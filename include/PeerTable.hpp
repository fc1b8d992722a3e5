#pragma once
#ifndef DISCOVERY_PEER_TABLE_HPP
#define DISCOVERY_PEER_TABLE_HPP

#include "Peer.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace discovery {

    enum class Transition {
        ADDED,      // identity was unknown
        UPDATED,    // newer sequence and a declared field changed
        REFRESHED,  // newer sequence, only sequence/lastSeen moved
        STALE       // sequence did not advance, table untouched
    };

    std::string transitionToString(Transition transition);

    /**
     * Authoritative map of known peers keyed by PeerIdentity.
     *
     * Every method takes the internal lock, so readers always copy a consistent state.
     * Ordering of mutations across several calls is the caller's job (HeartbeatEngine
     * is the only writer).
     */
    class PeerTable {
        public:
            PeerTable() = default;
            ~PeerTable() = default;

            /**
             * Returns the record for an identity, if present.
             */
            std::optional<PeerRecord> get(const PeerIdentity& id) const;

            /**
             * Copy of every record, ordered by identity.
             */
            std::vector<PeerRecord> snapshot() const;

            /**
             * Inserts or refreshes a record. A sequence that does not advance leaves the
             * table untouched and reports STALE. lastSeen never moves backwards.
             */
            Transition upsert(const PeerRecord& record);

            /**
             * Removes a record and returns it.
             */
            std::optional<PeerRecord> remove(const PeerIdentity& id);

            /**
             * Records sharing address and port, whatever their instance id.
             */
            std::vector<PeerRecord> findByEndpoint(const std::string& address, uint16_t port) const;

            /**
             * Identities whose last heartbeat is strictly older than timeout at `now`.
             */
            std::vector<PeerIdentity> expired(Clock::time_point now, Clock::duration timeout) const;

            size_t size() const;

            bool empty() const;

            void clear();

        private:
            mutable std::mutex mtx;
            std::map<PeerIdentity, PeerRecord> peers;
    };

} // namespace discovery

#endif // DISCOVERY_PEER_TABLE_HPP
