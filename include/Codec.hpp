#pragma once
#ifndef DISCOVERY_CODEC_HPP
#define DISCOVERY_CODEC_HPP

#include "Advertisement.hpp"
#include <memory>
#include <string>
#include <vector>

namespace discovery {

    /**
     * Encode/decode contract shared by every discovery backend. The engine never looks at
     * bytes itself, so a backend is a Transport plus one of these.
     */
    class Codec {
        public:
            using Ptr = std::unique_ptr<Codec>;

            virtual ~Codec() = default;

            virtual std::vector<uint8_t> encode(const Advertisement& advertisement) const = 0;

            /** Must reject, never crash on, arbitrary input. */
            virtual DecodeStatus decode(const std::vector<uint8_t>& payload, Advertisement& out) const = 0;

            /** Capability flag OR-ed into every record this codec produces */
            virtual uint8_t capability() const = 0;

            virtual std::string name() const = 0;
    };

    class HeartbeatCodec : public Codec {
        public:
            std::vector<uint8_t> encode(const Advertisement& advertisement) const override {
                return serializeAdvertisement(advertisement);
            }

            DecodeStatus decode(const std::vector<uint8_t>& payload, Advertisement& out) const override {
                return parseAdvertisement(payload, out);
            }

            uint8_t capability() const override { return CAP_HEARTBEAT; }

            std::string name() const override { return "heartbeat"; }
    };

} // namespace discovery

#endif // DISCOVERY_CODEC_HPP
