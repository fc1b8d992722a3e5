#pragma once
#ifndef DISCOVERY_TYPES_HPP
#define DISCOVERY_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <functional>

namespace discovery {

    // ============================================================
    //  PROTOCOL CONFIGURATION
    // ============================================================
    inline constexpr uint32_t DISCOVERY_MAGIC = 0x4D445343; // "MDSC"
    inline constexpr uint8_t  PROTOCOL_VERSION = 1;
    inline constexpr size_t   HEADER_SIZE = 4 + 1 + 1 + 2; // magic + version + type + payload_len
    inline constexpr size_t   CHECKSUM_SIZE = 4; // CRC32
    inline constexpr size_t   MAX_DATAGRAM_SIZE = 65507;
    inline constexpr size_t   MAX_FIELD_LENGTH = 255;  // length prefixes are one byte
    inline constexpr size_t   MAX_LABEL_LENGTH = 200;  // name / master uri accepted from config

    // ============================================================
    //  DEFAULTS
    // ============================================================
    inline constexpr uint16_t DEFAULT_HEARTBEAT_PORT = 11511;
    inline constexpr uint16_t DEFAULT_MASTER_PORT = 11311;
    inline constexpr uint16_t DEFAULT_SERVICE_PORT = 11611;
    inline constexpr const char* DEFAULT_GROUP = "226.0.0.0";
    inline constexpr double   DEFAULT_PERIOD_SECONDS = 1.0;
    inline constexpr double   DEFAULT_TIMEOUT_SECONDS = 5.0;
    inline constexpr size_t   DEFAULT_SUBSCRIBER_QUEUE = 256;
    inline constexpr size_t   MAX_SUBSCRIBER_QUEUE = 1 << 20;

    // ============================================================
    //  CAPABILITY FLAGS
    // ============================================================
    enum Capability : uint8_t {
        CAP_NONE        = 0x00,
        CAP_HEARTBEAT   = 0x01,
        CAP_ZEROCONF    = 0x02,
        CAP_STATIC_HOST = 0x04
    };

    // Local clock used for lastSeen and the sweep
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

} // namespace discovery

#endif // DISCOVERY_TYPES_HPP
