#pragma once
#ifndef DISCOVERY_APPLICATION_HPP
#define DISCOVERY_APPLICATION_HPP

#include "Config.hpp"

namespace discovery {

    /**
     * Runs one discovery daemon until SIGINT/SIGTERM or a fatal error and returns the
     * process exit code (see ExitCode).
     */
    int runDiscoveryNode(int argc, const char* const argv[], BackendKind defaultBackend);

} // namespace discovery

#endif // DISCOVERY_APPLICATION_HPP
