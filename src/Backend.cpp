#include "Backend.hpp"
#include "MdnsCodec.hpp"
#include "UdpTransport.hpp"

namespace discovery {

    Backend createBackend(const Config& config) {
        UdpOptions options;
        options.group = config.group;
        options.port = config.heartbeatPort;
        options.interfaceAddress = config.interfaceAddress;
        options.ttl = config.ttl;
        options.loopback = config.loopback;

        Backend backend;
        if (config.backend == BackendKind::ZEROCONF) {
            backend.codec = std::make_unique<MdnsCodec>();
        } else {
            options.unicastHosts = config.robotHosts;
            backend.codec = std::make_unique<HeartbeatCodec>();
        }
        backend.transport = std::make_unique<UdpTransport>(std::move(options));
        return backend;
    }

} // namespace discovery
