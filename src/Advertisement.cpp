#include "Advertisement.hpp"
#include <zlib.h>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <stdexcept>

namespace discovery {

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    namespace {

        // callers convert multi-byte values to big-endian first
        template <typename T>
        void appendRaw(std::vector<uint8_t>& buffer, T value) {
            buffer.insert(buffer.end(),
                reinterpret_cast<uint8_t*>(&value),
                reinterpret_cast<uint8_t*>(&value) + sizeof(T));
        }

        void appendString(std::vector<uint8_t>& buffer, const std::string& value, const char* field) {
            if (value.size() > MAX_FIELD_LENGTH) {
                throw std::invalid_argument(std::string("Advertisement field too long: ") + field);
            }
            buffer.push_back(static_cast<uint8_t>(value.size()));
            buffer.insert(buffer.end(), value.begin(), value.end());
        }

        class Reader {
            public:
                Reader(const std::vector<uint8_t>& buffer, size_t begin, size_t end)
                    : buffer(buffer), position(begin), end(end) {}

                template <typename T>
                bool read(T& out) {
                    if (end - position < sizeof(T)) return false;
                    std::memcpy(&out, &buffer[position], sizeof(T));
                    position += sizeof(T);
                    return true;
                }

                bool readString(std::string& out) {
                    uint8_t length = 0;
                    if (!read(length)) return false;
                    if (end - position < length) return false;
                    out.assign(buffer.begin() + position, buffer.begin() + position + length);
                    position += length;
                    return true;
                }

                bool exhausted() const { return position == end; }

            private:
                const std::vector<uint8_t>& buffer;
                size_t position;
                size_t end;
        };

    } // namespace

    // ------------------------------------------------------------
    // SERIALIZATION
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeAdvertisement(const Advertisement& advertisement) {
        std::vector<uint8_t> payload;
        payload.reserve(22 + advertisement.id.address.size() +
            advertisement.name.size() + advertisement.masterUri.size() + 3);

        payload.push_back(advertisement.departing ? FLAG_DEPARTING : 0);
        payload.push_back(advertisement.capabilities);
        appendRaw(payload, boost::endian::native_to_big(advertisement.id.port));
        appendRaw(payload, boost::endian::native_to_big(advertisement.id.instanceId));
        appendRaw(payload, boost::endian::native_to_big(advertisement.sequence));
        appendString(payload, advertisement.id.address, "address");
        appendString(payload, advertisement.name, "name");
        appendString(payload, advertisement.masterUri, "masterUri");

        std::vector<uint8_t> buffer;
        buffer.reserve(HEADER_SIZE + payload.size() + CHECKSUM_SIZE);

        appendRaw(buffer, boost::endian::native_to_big(DISCOVERY_MAGIC));
        buffer.push_back(PROTOCOL_VERSION);
        buffer.push_back(static_cast<uint8_t>(MessageType::HEARTBEAT));
        appendRaw(buffer, boost::endian::native_to_big(static_cast<uint16_t>(payload.size())));
        buffer.insert(buffer.end(), payload.begin(), payload.end());

        // CRC32 over everything before it
        appendRaw(buffer, boost::endian::native_to_big(crc32_buf(buffer.data(), buffer.size())));

        return buffer;
    }

    // ------------------------------------------------------------
    // PARSING (header + payload + checksum)
    // ------------------------------------------------------------
    DecodeStatus parseAdvertisement(const std::vector<uint8_t>& buffer, Advertisement& out) {
        if (buffer.size() < 4) return DecodeStatus::FOREIGN;

        uint32_t magicBigEndian;
        std::memcpy(&magicBigEndian, buffer.data(), 4);
        if (boost::endian::big_to_native(magicBigEndian) != DISCOVERY_MAGIC) return DecodeStatus::FOREIGN;

        if (buffer.size() < HEADER_SIZE + CHECKSUM_SIZE) return DecodeStatus::MALFORMED;

        const uint8_t version = buffer[4];
        if (version != PROTOCOL_VERSION) return DecodeStatus::VERSION_MISMATCH;
        if (buffer[5] != static_cast<uint8_t>(MessageType::HEARTBEAT)) return DecodeStatus::MALFORMED;

        uint16_t lengthBigEndian;
        std::memcpy(&lengthBigEndian, &buffer[6], 2);
        const size_t payloadLength = boost::endian::big_to_native(lengthBigEndian);

        if (buffer.size() != HEADER_SIZE + payloadLength + CHECKSUM_SIZE) return DecodeStatus::MALFORMED;

        uint32_t receivedBigEndian;
        std::memcpy(&receivedBigEndian, &buffer[HEADER_SIZE + payloadLength], 4);
        if (crc32_buf(buffer.data(), HEADER_SIZE + payloadLength) != boost::endian::big_to_native(receivedBigEndian)) {
            return DecodeStatus::BAD_CHECKSUM;
        }

        Reader reader(buffer, HEADER_SIZE, HEADER_SIZE + payloadLength);
        Advertisement parsed;
        uint8_t flags = 0;
        uint16_t port = 0;
        uint64_t instanceId = 0;
        uint64_t sequence = 0;

        if (!reader.read(flags) ||
            !reader.read(parsed.capabilities) ||
            !reader.read(port) ||
            !reader.read(instanceId) ||
            !reader.read(sequence) ||
            !reader.readString(parsed.id.address) ||
            !reader.readString(parsed.name) ||
            !reader.readString(parsed.masterUri) ||
            !reader.exhausted()) {
            return DecodeStatus::MALFORMED;
        }

        parsed.id.port = boost::endian::big_to_native(port);
        parsed.id.instanceId = boost::endian::big_to_native(instanceId);
        parsed.sequence = boost::endian::big_to_native(sequence);
        parsed.departing = (flags & FLAG_DEPARTING) != 0;

        if (parsed.id.port == 0 || parsed.id.instanceId == 0) return DecodeStatus::MALFORMED;

        out = std::move(parsed);
        return DecodeStatus::OK;
    }

    std::string decodeStatusToString(DecodeStatus status) {
        switch (status) {
            case DecodeStatus::OK:               return "OK";
            case DecodeStatus::MALFORMED:        return "MALFORMED";
            case DecodeStatus::BAD_CHECKSUM:     return "BAD_CHECKSUM";
            case DecodeStatus::FOREIGN:          return "FOREIGN";
            case DecodeStatus::VERSION_MISMATCH: return "VERSION_MISMATCH";
            default:                             return "UNKNOWN";
        }
    }

} // namespace discovery
