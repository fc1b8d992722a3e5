#include "Peer.hpp"
#include <sodium.h>
#include <cstdio>
#include <stdexcept>
#include <tuple>

namespace discovery {

    std::string PeerIdentity::key() const {
        return address + ":" + std::to_string(port) + "/" + instanceIdToHex(instanceId);
    }

    bool PeerIdentity::operator==(const PeerIdentity& other) const {
        return address == other.address && port == other.port && instanceId == other.instanceId;
    }

    bool PeerIdentity::operator<(const PeerIdentity& other) const {
        return std::tie(address, port, instanceId) <
            std::tie(other.address, other.port, other.instanceId);
    }

    uint64_t generateInstanceId() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }

        uint64_t instanceId = 0;
        while (instanceId == 0) {
            randombytes_buf(&instanceId, sizeof(instanceId));
        }
        return instanceId;
    }

    std::string instanceIdToHex(uint64_t instanceId) {
        char buffer[17];
        std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(instanceId));
        return std::string(buffer);
    }

    bool parseInstanceId(const std::string& text, uint64_t& out) {
        if (text.empty() || text.size() > 16) {
            return false;
        }

        uint64_t value = 0;
        for (char c : text) {
            uint64_t digit;
            if (c >= '0' && c <= '9') digit = static_cast<uint64_t>(c - '0');
            else if (c >= 'a' && c <= 'f') digit = static_cast<uint64_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') digit = static_cast<uint64_t>(c - 'A' + 10);
            else return false;
            value = (value << 4) | digit;
        }

        out = value;
        return true;
    }

    std::string capabilitiesToString(uint8_t capabilities) {
        std::string result;
        auto append = [&result](const char* flag) {
            if (!result.empty()) result += "|";
            result += flag;
        };

        if (capabilities & CAP_HEARTBEAT)   append("heartbeat");
        if (capabilities & CAP_ZEROCONF)    append("zeroconf");
        if (capabilities & CAP_STATIC_HOST) append("static");

        return result.empty() ? "none" : result;
    }

} // namespace discovery
