#pragma once
#ifndef DISCOVERY_ERRORS_HPP
#define DISCOVERY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace discovery {

    /**
     * Process exit codes. Zero is a clean shutdown, every fatal error class has its own value
     * so the supervising process can tell a misconfiguration from a network failure.
     */
    enum class ExitCode : int {
        OK                = 0,
        CONFIG_ERROR      = 2,
        BIND_FAILURE      = 3,
        LISTENER_FAILURE  = 4,
        SCHEMA_MISMATCH   = 5
    };

    class DiscoveryError : public std::runtime_error {
        public:
            DiscoveryError(const std::string& what, ExitCode code)
                : std::runtime_error(what), code(code) {}

            ExitCode exitCode() const { return code; }

        private:
            ExitCode code;
    };

    class ConfigError : public DiscoveryError {
        public:
            explicit ConfigError(const std::string& what)
                : DiscoveryError(what, ExitCode::CONFIG_ERROR) {}
    };

    /** The discovery endpoint could not be bound at startup. Never retried. */
    class BindError : public DiscoveryError {
        public:
            explicit BindError(const std::string& what)
                : DiscoveryError(what, ExitCode::BIND_FAILURE) {}
    };

    /** The listener socket failed while running; peer loss would go undetected. */
    class ListenerError : public DiscoveryError {
        public:
            explicit ListenerError(const std::string& what)
                : DiscoveryError(what, ExitCode::LISTENER_FAILURE) {}
    };

    class SchemaError : public DiscoveryError {
        public:
            explicit SchemaError(const std::string& what)
                : DiscoveryError(what, ExitCode::SCHEMA_MISMATCH) {}
    };

} // namespace discovery

#endif // DISCOVERY_ERRORS_HPP
