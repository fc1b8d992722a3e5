#pragma once
#ifndef DISCOVERY_MDNS_CODEC_HPP
#define DISCOVERY_MDNS_CODEC_HPP

#include "Codec.hpp"
#include <map>

namespace discovery {

    inline constexpr const char* MDNS_GROUP = "224.0.0.251";
    inline constexpr uint16_t    MDNS_PORT = 5353;
    inline constexpr const char* MDNS_SERVICE_TYPE = "_master-discovery._udp.local";
    inline constexpr uint32_t    MDNS_RECORD_TTL = 120;
    inline constexpr const char* MDNS_TXT_VERSION = "1";

    // DNS constants
    inline constexpr uint16_t DNS_TYPE_PTR = 12;
    inline constexpr uint16_t DNS_TYPE_TXT = 16;
    inline constexpr uint16_t DNS_TYPE_SRV = 33;
    inline constexpr uint16_t DNS_CLASS_IN = 1;
    inline constexpr uint16_t DNS_CACHE_FLUSH = 0x8000;
    inline constexpr uint16_t DNS_FLAG_RESPONSE = 0x8000;
    inline constexpr uint16_t DNS_FLAG_AUTHORITATIVE = 0x0400;

    /**
     * Zero-configuration backend codec: advertisements travel as unsolicited multicast DNS
     * responses (DNS-SD PTR + SRV + TXT). A goodbye packet (TTL 0) is a departure.
     *
     * Only the TXT record is needed to rebuild an Advertisement; PTR and SRV are emitted so
     * generic mDNS browsers list the service too.
     */
    class MdnsCodec : public Codec {
        public:
            std::vector<uint8_t> encode(const Advertisement& advertisement) const override;
            DecodeStatus decode(const std::vector<uint8_t>& payload, Advertisement& out) const override;

            uint8_t capability() const override { return CAP_ZEROCONF; }
            std::string name() const override { return "zeroconf"; }

            /** "<instance-hex>._master-discovery._udp.local" */
            static std::string instanceName(const PeerIdentity& id);

            /** Splits TXT character-strings of the form key=value. Returns false on a bad layout. */
            static bool parseTxt(const std::vector<uint8_t>& rdata, std::map<std::string, std::string>& out);
    };

} // namespace discovery

#endif // DISCOVERY_MDNS_CODEC_HPP
