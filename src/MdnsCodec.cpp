#include "MdnsCodec.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace discovery {

    namespace {

        inline constexpr size_t DNS_HEADER_SIZE = 12;
        inline constexpr size_t MAX_NAME_LENGTH = 255;
        inline constexpr size_t MAX_LABEL_SIZE = 63;
        inline constexpr int    MAX_POINTER_JUMPS = 16;

        void put16(std::vector<uint8_t>& buffer, uint16_t value) {
            buffer.push_back(static_cast<uint8_t>(value >> 8));
            buffer.push_back(static_cast<uint8_t>(value & 0xFF));
        }

        void put32(std::vector<uint8_t>& buffer, uint32_t value) {
            put16(buffer, static_cast<uint16_t>(value >> 16));
            put16(buffer, static_cast<uint16_t>(value & 0xFFFF));
        }

        void putName(std::vector<uint8_t>& buffer, const std::string& dotted) {
            size_t start = 0;
            while (start < dotted.size()) {
                size_t dot = dotted.find('.', start);
                if (dot == std::string::npos) dot = dotted.size();

                const size_t length = dot - start;
                if (length == 0 || length > MAX_LABEL_SIZE) {
                    throw std::invalid_argument("Invalid DNS label in: " + dotted);
                }
                buffer.push_back(static_cast<uint8_t>(length));
                buffer.insert(buffer.end(), dotted.begin() + start, dotted.begin() + dot);
                start = dot + 1;
            }
            buffer.push_back(0);
        }

        void putRecord(std::vector<uint8_t>& buffer, const std::string& name, uint16_t type,
                       uint16_t recordClass, uint32_t ttl, const std::vector<uint8_t>& rdata) {
            putName(buffer, name);
            put16(buffer, type);
            put16(buffer, recordClass);
            put32(buffer, ttl);
            put16(buffer, static_cast<uint16_t>(rdata.size()));
            buffer.insert(buffer.end(), rdata.begin(), rdata.end());
        }

        void putTxtString(std::vector<uint8_t>& rdata, const std::string& key, const std::string& value) {
            const std::string entry = key + "=" + value;
            if (entry.size() > MAX_FIELD_LENGTH) {
                throw std::invalid_argument("TXT entry too long: " + key);
            }
            rdata.push_back(static_cast<uint8_t>(entry.size()));
            rdata.insert(rdata.end(), entry.begin(), entry.end());
        }

        std::string hostTarget(const std::string& address) {
            if (address.empty()) return "unknown.local";
            std::string label = address;
            std::replace(label.begin(), label.end(), '.', '-');
            std::replace(label.begin(), label.end(), ':', '-');
            return label + ".local";
        }

        bool get16(const std::vector<uint8_t>& buffer, size_t& position, uint16_t& out) {
            if (buffer.size() - position < 2) return false;
            out = static_cast<uint16_t>((buffer[position] << 8) | buffer[position + 1]);
            position += 2;
            return true;
        }

        bool get32(const std::vector<uint8_t>& buffer, size_t& position, uint32_t& out) {
            uint16_t high = 0;
            uint16_t low = 0;
            if (!get16(buffer, position, high) || !get16(buffer, position, low)) return false;
            out = (static_cast<uint32_t>(high) << 16) | low;
            return true;
        }

        // Reads a possibly compressed name; position ends after the name as stored in place.
        bool getName(const std::vector<uint8_t>& buffer, size_t& position, std::string& out) {
            out.clear();
            size_t cursor = position;
            bool jumped = false;
            int jumps = 0;

            while (true) {
                if (cursor >= buffer.size()) return false;
                const uint8_t length = buffer[cursor];

                if ((length & 0xC0) == 0xC0) {
                    if (cursor + 1 >= buffer.size()) return false;
                    const size_t target = (static_cast<size_t>(length & 0x3F) << 8) | buffer[cursor + 1];
                    if (!jumped) position = cursor + 2;
                    jumped = true;
                    if (++jumps > MAX_POINTER_JUMPS || target >= buffer.size()) return false;
                    cursor = target;
                    continue;
                }
                if (length & 0xC0) return false;

                if (length == 0) {
                    if (!jumped) position = cursor + 1;
                    return true;
                }

                if (cursor + 1 + length > buffer.size()) return false;
                if (!out.empty()) out += '.';
                out.append(buffer.begin() + cursor + 1, buffer.begin() + cursor + 1 + length);
                if (out.size() > MAX_NAME_LENGTH) return false;
                cursor += 1 + length;
            }
        }

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool endsWith(const std::string& value, const std::string& suffix) {
            return value.size() >= suffix.size() &&
                value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool parseUnsigned(const std::string& text, uint64_t maxValue, uint64_t& out) {
            if (text.empty() || text.size() > 20) return false;
            uint64_t value = 0;
            for (char c : text) {
                if (c < '0' || c > '9') return false;
                const uint64_t digit = static_cast<uint64_t>(c - '0');
                if (value > (maxValue - digit) / 10) return false;
                value = value * 10 + digit;
            }
            out = value;
            return true;
        }

    } // namespace

    std::string MdnsCodec::instanceName(const PeerIdentity& id) {
        return instanceIdToHex(id.instanceId) + "." + MDNS_SERVICE_TYPE;
    }

    std::vector<uint8_t> MdnsCodec::encode(const Advertisement& advertisement) const {
        const uint32_t ttl = advertisement.departing ? 0 : MDNS_RECORD_TTL;
        const std::string instance = instanceName(advertisement.id);

        std::vector<uint8_t> buffer;
        put16(buffer, 0);                                           // id
        put16(buffer, DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE);  // flags
        put16(buffer, 0);                                           // questions
        put16(buffer, 3);                                           // answers
        put16(buffer, 0);                                           // authority
        put16(buffer, 0);                                           // additional

        std::vector<uint8_t> ptr;
        putName(ptr, instance);
        putRecord(buffer, MDNS_SERVICE_TYPE, DNS_TYPE_PTR, DNS_CLASS_IN, ttl, ptr);

        std::vector<uint8_t> srv;
        put16(srv, 0); // priority
        put16(srv, 0); // weight
        put16(srv, advertisement.id.port);
        putName(srv, hostTarget(advertisement.id.address));
        putRecord(buffer, instance, DNS_TYPE_SRV, DNS_CLASS_IN | DNS_CACHE_FLUSH, ttl, srv);

        std::vector<uint8_t> txt;
        putTxtString(txt, "txtvers", MDNS_TXT_VERSION);
        putTxtString(txt, "addr", advertisement.id.address);
        putTxtString(txt, "port", std::to_string(advertisement.id.port));
        putTxtString(txt, "iid", instanceIdToHex(advertisement.id.instanceId));
        putTxtString(txt, "seq", std::to_string(advertisement.sequence));
        putTxtString(txt, "name", advertisement.name);
        putTxtString(txt, "uri", advertisement.masterUri);
        putTxtString(txt, "caps", std::to_string(advertisement.capabilities));
        putRecord(buffer, instance, DNS_TYPE_TXT, DNS_CLASS_IN | DNS_CACHE_FLUSH, ttl, txt);

        return buffer;
    }

    bool MdnsCodec::parseTxt(const std::vector<uint8_t>& rdata, std::map<std::string, std::string>& out) {
        size_t position = 0;
        while (position < rdata.size()) {
            const size_t length = rdata[position++];
            if (rdata.size() - position < length) return false;

            const std::string entry(rdata.begin() + position, rdata.begin() + position + length);
            position += length;
            if (entry.empty()) continue;

            const size_t equals = entry.find('=');
            if (equals == std::string::npos || equals == 0) {
                out[toLower(entry)] = "";
            } else {
                out[toLower(entry.substr(0, equals))] = entry.substr(equals + 1);
            }
        }
        return true;
    }

    DecodeStatus MdnsCodec::decode(const std::vector<uint8_t>& payload, Advertisement& out) const {
        if (payload.size() < DNS_HEADER_SIZE) return DecodeStatus::MALFORMED;

        size_t position = 2; // skip id
        uint16_t flags = 0, questions = 0, answers = 0, authority = 0, additional = 0;
        get16(payload, position, flags);
        get16(payload, position, questions);
        get16(payload, position, answers);
        get16(payload, position, authority);
        get16(payload, position, additional);

        // Queries from other responders share the port
        if (!(flags & DNS_FLAG_RESPONSE)) return DecodeStatus::FOREIGN;

        std::string name;
        for (uint16_t i = 0; i < questions; ++i) {
            uint16_t type = 0, questionClass = 0;
            if (!getName(payload, position, name) ||
                !get16(payload, position, type) ||
                !get16(payload, position, questionClass)) {
                return DecodeStatus::MALFORMED;
            }
        }

        const std::string suffix = std::string(".") + MDNS_SERVICE_TYPE;
        const size_t records = static_cast<size_t>(answers) + authority + additional;
        std::map<std::string, std::string> txt;
        bool found = false;
        uint32_t txtTtl = 0;

        for (size_t i = 0; i < records && !found; ++i) {
            uint16_t type = 0, recordClass = 0, length = 0;
            uint32_t ttl = 0;
            if (!getName(payload, position, name) ||
                !get16(payload, position, type) ||
                !get16(payload, position, recordClass) ||
                !get32(payload, position, ttl) ||
                !get16(payload, position, length) ||
                payload.size() - position < length) {
                return DecodeStatus::MALFORMED;
            }

            if (type == DNS_TYPE_TXT && endsWith(toLower(name), suffix)) {
                const std::vector<uint8_t> rdata(payload.begin() + position, payload.begin() + position + length);
                if (!parseTxt(rdata, txt)) return DecodeStatus::MALFORMED;
                found = true;
                txtTtl = ttl;
            }
            position += length;
        }

        if (!found) return DecodeStatus::FOREIGN;

        auto txtvers = txt.find("txtvers");
        if (txtvers == txt.end()) return DecodeStatus::MALFORMED;
        if (txtvers->second != MDNS_TXT_VERSION) return DecodeStatus::VERSION_MISMATCH;

        auto addr = txt.find("addr");
        auto port = txt.find("port");
        auto iid = txt.find("iid");
        auto seq = txt.find("seq");
        if (addr == txt.end() || port == txt.end() || iid == txt.end() || seq == txt.end()) {
            return DecodeStatus::MALFORMED;
        }

        Advertisement parsed;
        uint64_t number = 0;

        parsed.id.address = addr->second;
        if (!parseUnsigned(port->second, std::numeric_limits<uint16_t>::max(), number) || number == 0) {
            return DecodeStatus::MALFORMED;
        }
        parsed.id.port = static_cast<uint16_t>(number);

        if (!parseInstanceId(iid->second, parsed.id.instanceId) || parsed.id.instanceId == 0) {
            return DecodeStatus::MALFORMED;
        }
        if (!parseUnsigned(seq->second, std::numeric_limits<uint64_t>::max(), parsed.sequence)) {
            return DecodeStatus::MALFORMED;
        }

        auto caps = txt.find("caps");
        if (caps != txt.end()) {
            if (!parseUnsigned(caps->second, std::numeric_limits<uint8_t>::max(), number)) {
                return DecodeStatus::MALFORMED;
            }
            parsed.capabilities = static_cast<uint8_t>(number);
        }

        auto peerName = txt.find("name");
        if (peerName != txt.end()) parsed.name = peerName->second;
        auto uri = txt.find("uri");
        if (uri != txt.end()) parsed.masterUri = uri->second;

        parsed.departing = (txtTtl == 0);

        out = std::move(parsed);
        return DecodeStatus::OK;
    }

} // namespace discovery
