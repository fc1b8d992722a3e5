#include "Config.hpp"
#include "Errors.hpp"
#include "MdnsCodec.hpp"
#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace discovery {

    namespace {

        std::chrono::milliseconds secondsOption(double seconds, const char* option) {
            if (!(seconds > 0.0) || seconds > 86400.0) {
                throw ConfigError(std::string("--") + option + " must be within (0, 86400] seconds");
            }
            return std::chrono::milliseconds(static_cast<long>(seconds * 1000.0 + 0.5));
        }

        uint16_t portOption(int value, const char* option, bool allowZero) {
            if (value < (allowZero ? 0 : 1) || value > 65535) {
                throw ConfigError(std::string("--") + option + " out of range: " + std::to_string(value));
            }
            return static_cast<uint16_t>(value);
        }

        bool isIpv4(const std::string& text) {
            boost::system::error_code errorCode;
            boost::asio::ip::make_address_v4(text, errorCode);
            return !errorCode;
        }

        bool isPrintableLabel(const std::string& text) {
            if (text.empty() || text.size() > MAX_LABEL_LENGTH) return false;
            for (unsigned char c : text) {
                if (c < 0x20 || c == 0x7F) return false;
            }
            return true;
        }

    } // namespace

    std::string identitySourceToString(IdentitySource source) {
        return source == IdentitySource::SOURCE ? "source" : "payload";
    }

    std::string detectLocalAddress() {
        try {
            boost::asio::io_context io;
            boost::asio::ip::udp::resolver resolver(io);
            auto results = resolver.resolve(boost::asio::ip::udp::v4(), boost::asio::ip::host_name(), "");
            for (const auto& entry : results) {
                const auto address = entry.endpoint().address();
                if (!address.is_loopback()) {
                    return address.to_string();
                }
            }
        } catch (const boost::system::system_error& e) {
            std::cerr << "Warning: cannot resolve own host name: " << e.what() << std::endl;
        }
        return "127.0.0.1";
    }

    Config parseCommandLine(int argc, const char* const argv[], BackendKind defaultBackend) {
        Config config;
        config.backend = defaultBackend;

        std::string configFile;
        std::string instanceHex;
        std::string identitySource;
        double period = DEFAULT_PERIOD_SECONDS;
        double timeout = DEFAULT_TIMEOUT_SECONDS;
        double sweepInterval = 0.0;
        int port = DEFAULT_MASTER_PORT;
        int heartbeatPort = DEFAULT_HEARTBEAT_PORT;
        int servicePort = DEFAULT_SERVICE_PORT;
        long long subscriberQueue = static_cast<long long>(DEFAULT_SUBSCRIBER_QUEUE);

        po::options_description options("master discovery options");
        options.add_options()
            ("help,h", "show this help")
            ("config,c", po::value<std::string>(&configFile), "INI file using the long option names")
            ("name", po::value<std::string>(&config.name), "label advertised for this master (default: host name)")
            ("master-uri", po::value<std::string>(&config.masterUri),
                "uri of the local master (default: $ROS_MASTER_URI or http://<address>:<port>/)")
            ("address", po::value<std::string>(&config.address), "advertised IPv4 address (default: detected)")
            ("port", po::value<int>(&port)->default_value(DEFAULT_MASTER_PORT), "advertised master port")
            ("instance-id", po::value<std::string>(&instanceHex), "fixed instance id, hex (default: random)")
            ("group", po::value<std::string>(&config.group)->default_value(DEFAULT_GROUP),
                "multicast group or broadcast address")
            ("heartbeat-port", po::value<int>(&heartbeatPort)->default_value(DEFAULT_HEARTBEAT_PORT),
                "UDP port of the discovery traffic")
            ("interface", po::value<std::string>(&config.interfaceAddress)->default_value("0.0.0.0"),
                "local interface address for multicast")
            ("ttl", po::value<int>(&config.ttl)->default_value(1), "multicast TTL")
            ("no-loopback", po::bool_switch(), "do not loop multicast back to this host")
            ("robot-hosts", po::value<std::vector<std::string>>(&config.robotHosts)->multitoken()->composing(),
                "static hosts that also get every heartbeat by unicast")
            ("period", po::value<double>(&period)->default_value(DEFAULT_PERIOD_SECONDS),
                "heartbeat period, seconds")
            ("timeout", po::value<double>(&timeout)->default_value(DEFAULT_TIMEOUT_SECONDS),
                "seconds without heartbeat before a peer is removed")
            ("sweep-interval", po::value<double>(&sweepInterval)->default_value(0.0),
                "seconds between timeout sweeps (default: timeout / 2)")
            ("zeroconf", po::bool_switch(), "use the multicast DNS backend instead of heartbeats")
            ("identity-source", po::value<std::string>(&identitySource)->default_value("payload"),
                "payload|source: where a peer's address is taken from")
            ("emit-refresh", po::bool_switch(&config.emitRefresh), "emit UPDATED on every accepted heartbeat")
            ("no-departure", po::bool_switch(), "do not announce departure on shutdown")
            ("tolerate-version-mismatch", po::bool_switch(&config.tolerateVersionMismatch),
                "discard datagrams of another protocol version instead of failing")
            ("subscriber-queue", po::value<long long>(&subscriberQueue)->default_value(static_cast<long long>(DEFAULT_SUBSCRIBER_QUEUE)),
                "events buffered per subscriber before overflow")
            ("service-address", po::value<std::string>(&config.serviceAddress)->default_value("127.0.0.1"),
                "address of the local query service")
            ("service-port", po::value<int>(&servicePort)->default_value(DEFAULT_SERVICE_PORT),
                "port of the local query service, 0 disables it")
            ("verbose,v", po::bool_switch(&config.verbose), "log every discarded datagram");

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, options), vm);
            if (vm.count("config")) {
                const std::string path = vm["config"].as<std::string>();
                std::ifstream file(path);
                if (!file.is_open()) {
                    throw ConfigError("Cannot open config file: " + path);
                }
                po::store(po::parse_config_file(file, options), vm);
            }
            po::notify(vm);
        } catch (const po::error& e) {
            throw ConfigError(e.what());
        }

        if (vm.count("help")) {
            std::ostringstream help;
            help << options;
            config.showHelp = true;
            config.helpText = help.str();
            return config;
        }

        if (vm["zeroconf"].as<bool>()) {
            config.backend = BackendKind::ZEROCONF;
        }
        config.loopback = !vm["no-loopback"].as<bool>();
        config.announceDeparture = !vm["no-departure"].as<bool>();

        config.port = portOption(port, "port", false);
        config.heartbeatPort = portOption(heartbeatPort, "heartbeat-port", false);
        config.servicePort = portOption(servicePort, "service-port", true);

        if (subscriberQueue < 1 || subscriberQueue > static_cast<long long>(MAX_SUBSCRIBER_QUEUE)) {
            throw ConfigError("--subscriber-queue out of range: " + std::to_string(subscriberQueue));
        }
        config.subscriberQueue = static_cast<size_t>(subscriberQueue);

        if (config.backend == BackendKind::ZEROCONF) {
            // mDNS lives on a fixed group and port unless explicitly overridden
            if (vm["group"].defaulted()) config.group = MDNS_GROUP;
            if (vm["heartbeat-port"].defaulted()) config.heartbeatPort = MDNS_PORT;
        }

        if (identitySource == "payload") {
            config.identitySource = IdentitySource::PAYLOAD;
        } else if (identitySource == "source") {
            config.identitySource = IdentitySource::SOURCE;
        } else {
            throw ConfigError("--identity-source must be 'payload' or 'source', got: " + identitySource);
        }

        if (!instanceHex.empty() && !parseInstanceId(instanceHex, config.instanceId)) {
            throw ConfigError("--instance-id is not a hex number: " + instanceHex);
        }

        config.period = secondsOption(period, "period");
        config.timeout = secondsOption(timeout, "timeout");
        config.sweepInterval = sweepInterval == 0.0
            ? std::chrono::milliseconds(0)
            : secondsOption(sweepInterval, "sweep-interval");

        if (config.address.empty()) {
            config.address = detectLocalAddress();
        }
        if (config.name.empty()) {
            config.name = boost::asio::ip::host_name();
        }
        if (config.masterUri.empty()) {
            const char* fromEnvironment = std::getenv("ROS_MASTER_URI");
            config.masterUri = (fromEnvironment != nullptr && *fromEnvironment != '\0')
                ? std::string(fromEnvironment)
                : "http://" + config.address + ":" + std::to_string(config.port) + "/";
        }
        if (config.instanceId == 0) {
            config.instanceId = generateInstanceId();
        }

        validateConfig(config);
        return config;
    }

    void validateConfig(const Config& config) {
        if (config.period.count() <= 0) {
            throw ConfigError("--period must be positive");
        }
        if (config.timeout <= config.period) {
            throw ConfigError("--timeout must be longer than --period");
        }
        const auto sweep = config.effectiveSweepInterval();
        if (sweep.count() <= 0 || sweep > config.timeout) {
            throw ConfigError("--sweep-interval must be within (0, timeout]");
        }
        if (!isPrintableLabel(config.name)) {
            throw ConfigError("--name must be 1.." + std::to_string(MAX_LABEL_LENGTH) + " printable characters");
        }
        if (!isPrintableLabel(config.masterUri)) {
            throw ConfigError("--master-uri must be 1.." + std::to_string(MAX_LABEL_LENGTH) + " printable characters");
        }
        if (!isIpv4(config.address)) {
            throw ConfigError("--address is not an IPv4 address: " + config.address);
        }
        if (!isIpv4(config.group)) {
            throw ConfigError("--group is not an IPv4 address: " + config.group);
        }
        if (!isIpv4(config.interfaceAddress)) {
            throw ConfigError("--interface is not an IPv4 address: " + config.interfaceAddress);
        }
        if (config.servicePort != 0 && !isIpv4(config.serviceAddress)) {
            throw ConfigError("--service-address is not an IPv4 address: " + config.serviceAddress);
        }
        if (config.port == 0 || config.heartbeatPort == 0) {
            throw ConfigError("--port and --heartbeat-port must be non-zero");
        }
        if (config.ttl < 0 || config.ttl > 255) {
            throw ConfigError("--ttl must be within 0..255");
        }
        if (config.subscriberQueue == 0 || config.subscriberQueue > MAX_SUBSCRIBER_QUEUE) {
            throw ConfigError("--subscriber-queue must be between 1 and " + std::to_string(MAX_SUBSCRIBER_QUEUE));
        }
        if (config.instanceId == 0) {
            throw ConfigError("instance id must be non-zero");
        }
    }

} // namespace discovery
