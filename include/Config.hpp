#pragma once
#ifndef DISCOVERY_CONFIG_HPP
#define DISCOVERY_CONFIG_HPP

#include "Peer.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace discovery {

    /** Where a peer's address comes from when building its PeerIdentity */
    enum class IdentitySource {
        PAYLOAD,  // address embedded in the advertisement, source address only if it is empty
        SOURCE    // source address of the datagram; port and instance from the payload
    };

    enum class BackendKind {
        HEARTBEAT,
        ZEROCONF
    };

    struct Config {
        // own master
        std::string name;
        std::string masterUri;
        std::string address;           // advertised address, detected when empty
        uint16_t port = DEFAULT_MASTER_PORT;
        uint64_t instanceId = 0;       // generated when zero

        // network scope
        BackendKind backend = BackendKind::HEARTBEAT;
        std::string group = DEFAULT_GROUP;
        uint16_t heartbeatPort = DEFAULT_HEARTBEAT_PORT;
        std::string interfaceAddress = "0.0.0.0";
        int ttl = 1;
        bool loopback = true;
        std::vector<std::string> robotHosts;

        // timing
        std::chrono::milliseconds period{static_cast<long>(DEFAULT_PERIOD_SECONDS * 1000)};
        std::chrono::milliseconds timeout{static_cast<long>(DEFAULT_TIMEOUT_SECONDS * 1000)};
        std::chrono::milliseconds sweepInterval{0}; // timeout / 2 when zero

        // behaviour
        IdentitySource identitySource = IdentitySource::PAYLOAD;
        bool emitRefresh = false;
        bool announceDeparture = true;
        bool tolerateVersionMismatch = false;
        size_t subscriberQueue = DEFAULT_SUBSCRIBER_QUEUE;

        // local service endpoint, port 0 disables it
        std::string serviceAddress = "127.0.0.1";
        uint16_t servicePort = DEFAULT_SERVICE_PORT;

        bool verbose = false;
        bool showHelp = false;
        std::string helpText;

        /** Own identity as advertised (address, port, instance id) */
        PeerIdentity selfIdentity() const {
            return PeerIdentity{address, port, instanceId};
        }

        std::chrono::milliseconds effectiveSweepInterval() const {
            return sweepInterval.count() > 0 ? sweepInterval : timeout / 2;
        }
    };

    /**
     * Parses command line options, then the INI file named by --config (command line wins).
     * Fills defaults that depend on the host (address, name, master uri, instance id) and
     * validates the result. Throws ConfigError.
     */
    Config parseCommandLine(int argc, const char* const argv[], BackendKind defaultBackend = BackendKind::HEARTBEAT);

    /**
     * Checks ranges and addresses. Throws ConfigError naming the offending option.
     */
    void validateConfig(const Config& config);

    /**
     * First non-loopback IPv4 address of this host, 127.0.0.1 if there is none.
     */
    std::string detectLocalAddress();

    std::string identitySourceToString(IdentitySource source);

} // namespace discovery

#endif // DISCOVERY_CONFIG_HPP
