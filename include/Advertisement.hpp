#pragma once
#ifndef DISCOVERY_ADVERTISEMENT_HPP
#define DISCOVERY_ADVERTISEMENT_HPP

#include "Peer.hpp"
#include <cstdint>
#include <vector>
#include <string>

namespace discovery {

    // ============================================================
    //  MESSAGE TYPES
    // ============================================================
    enum class MessageType : uint8_t {
        HEARTBEAT = 1
    };

    inline constexpr uint8_t FLAG_DEPARTING = 0x01;

    // ============================================================
    //  ADVERTISEMENT
    // ============================================================
    struct Advertisement {
        PeerIdentity id;
        uint64_t sequence = 0;
        std::string name;
        std::string masterUri;
        uint8_t capabilities = CAP_NONE;
        bool departing = false;
    };

    enum class DecodeStatus {
        OK,
        MALFORMED,        // truncated, bad lengths, trailing bytes
        BAD_CHECKSUM,
        FOREIGN,          // not a discovery datagram at all
        VERSION_MISMATCH  // ours, but a schema we cannot decode
    };

    /** Serializes an advertisement in network format:
     * [magic(4)] [version(1)] [type(1)] [payload_len(2)] [payload] [crc32(4)]
     * payload = [flags(1)] [capabilities(1)] [port(2)] [instance(8)] [sequence(8)]
     *           [address(1+n)] [name(1+n)] [masterUri(1+n)]
     * Throws std::invalid_argument when a string field exceeds MAX_FIELD_LENGTH.
     */
    std::vector<uint8_t> serializeAdvertisement(const Advertisement& advertisement);

    /** Parses and validates a complete datagram. Never throws. */
    DecodeStatus parseAdvertisement(const std::vector<uint8_t>& buffer, Advertisement& out);

    /** CRC32 of a buffer (zlib) */
    uint32_t crc32_buf(const void* data, size_t length);

    std::string decodeStatusToString(DecodeStatus status);

} // namespace discovery

#endif // DISCOVERY_ADVERTISEMENT_HPP
