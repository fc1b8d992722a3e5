#pragma once
#ifndef DISCOVERY_PEER_HPP
#define DISCOVERY_PEER_HPP

#include "Types.hpp"
#include <string>
#include <cstdint>

namespace discovery {

    struct PeerIdentity {
        std::string address;     // ip of the master host
        uint16_t port = 0;       // master port
        uint64_t instanceId = 0; // changes on every restart of the daemon

        std::string key() const;

        bool sameEndpoint(const PeerIdentity& other) const {
            return address == other.address && port == other.port;
        }

        bool isValid() const {
            return !address.empty() && port > 0;
        }

        bool operator==(const PeerIdentity& other) const;
        bool operator!=(const PeerIdentity& other) const { return !(*this == other); }
        bool operator<(const PeerIdentity& other) const;
    };

    struct PeerRecord {
        PeerIdentity id;
        std::string name;
        std::string masterUri;
        uint64_t sequence = 0;
        Clock::time_point lastSeen{};
        uint8_t capabilities = CAP_NONE;

        /**
         * True when the fields a peer declares (name, master uri, capabilities) are equal.
         * Sequence and lastSeen are excluded: they change on every heartbeat.
         */
        bool sameDeclaredFields(const PeerRecord& other) const {
            return name == other.name &&
                masterUri == other.masterUri &&
                capabilities == other.capabilities;
        }
    };

    /** Random 64-bit instance identifier (libsodium). Never returns zero. */
    uint64_t generateInstanceId();

    /** Fixed-width lowercase hex of an instance id */
    std::string instanceIdToHex(uint64_t instanceId);

    /** Inverse of instanceIdToHex. Returns false on anything but 1..16 hex digits. */
    bool parseInstanceId(const std::string& text, uint64_t& out);

    /** Renders the capability bits as "heartbeat|zeroconf|static" */
    std::string capabilitiesToString(uint8_t capabilities);

} // namespace discovery

#endif // DISCOVERY_PEER_HPP
