#include "Application.hpp"
#include "Backend.hpp"
#include "Errors.hpp"
#include "HeartbeatEngine.hpp"
#include "QueryService.hpp"
#include "ServiceEndpoint.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

namespace discovery {

    namespace {

        std::atomic<bool> g_running(true);

        void signal_handler(int signum) {
            (void)signum;
            g_running = false;
        }

        int exitCodeOf(const DiscoveryError& e) {
            return static_cast<int>(e.exitCode());
        }

    } // namespace

    int runDiscoveryNode(int argc, const char* const argv[], BackendKind defaultBackend) {
        Config config;
        try {
            config = parseCommandLine(argc, argv, defaultBackend);
        } catch (const ConfigError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << "Try --help" << std::endl;
            return exitCodeOf(e);
        }
        if (config.showHelp) {
            std::cout << config.helpText << std::endl;
            return static_cast<int>(ExitCode::OK);
        }

        std::cout << "Master discovery starting. name=" << config.name
                  << " uri=" << config.masterUri
                  << " id=" << config.selfIdentity().key()
                  << " group=" << config.group << ":" << config.heartbeatPort
                  << " period=" << config.period.count() << "ms"
                  << " timeout=" << config.timeout.count() << "ms" << std::endl;

        Backend backend = createBackend(config);
        HeartbeatEngine engine(config, std::move(backend.transport), std::move(backend.codec));
        QueryService query(engine);
        std::unique_ptr<ServiceEndpoint> endpoint;

        int code = static_cast<int>(ExitCode::OK);
        try {
            engine.start();
            if (config.servicePort != 0) {
                endpoint = std::make_unique<ServiceEndpoint>(query, config.serviceAddress, config.servicePort);
                endpoint->start();
            }

            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            std::cout << "Discovery running. Press Ctrl+C to exit." << std::endl;
            const auto aloneAfter = Clock::now() + config.timeout;
            bool aloneReported = false;
            while (g_running) {
                if (engine.waitForFailure(std::chrono::milliseconds(200))) {
                    std::rethrow_exception(engine.failure());
                }
                if (!aloneReported && Clock::now() >= aloneAfter) {
                    aloneReported = true;
                    if (engine.table().size() == 0) {
                        std::cout << "No other masters found, running alone" << std::endl;
                    }
                }
            }
            std::cout << "Shutting down..." << std::endl;
        } catch (const DiscoveryError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            code = exitCodeOf(e);
        }

        engine.shutdown();
        if (endpoint) {
            endpoint->stop();
        }
        return code;
    }

} // namespace discovery
