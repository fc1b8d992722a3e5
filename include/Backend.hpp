#pragma once
#ifndef DISCOVERY_BACKEND_HPP
#define DISCOVERY_BACKEND_HPP

#include "Codec.hpp"
#include "Config.hpp"
#include "Transport.hpp"

namespace discovery {

    /** A discovery backend is a transport plus the codec spoken over it */
    struct Backend {
        Transport::Ptr transport;
        Codec::Ptr codec;
    };

    /**
     * Heartbeat: UDP on the configured group and port, robot hosts added as unicast
     * destinations. Zeroconf: UDP on the mDNS group with the DNS-SD codec.
     */
    Backend createBackend(const Config& config);

} // namespace discovery

#endif // DISCOVERY_BACKEND_HPP
