#include <gtest/gtest.h>
#include "MdnsCodec.hpp"
#include "TestHelpers.hpp"
#include <algorithm>

using namespace discovery;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
namespace {

    // Replaces the first occurrence of `from` with `to` (same length) inside a packet
    bool patch(std::vector<uint8_t>& packet, const std::string& from, const std::string& to) {
        auto it = std::search(packet.begin(), packet.end(), from.begin(), from.end());
        if (it == packet.end() || from.size() != to.size()) return false;
        std::copy(to.begin(), to.end(), it);
        return true;
    }

    std::vector<uint8_t> header(uint16_t flags, uint16_t questions, uint16_t answers) {
        return {0, 0,
                static_cast<uint8_t>(flags >> 8), static_cast<uint8_t>(flags & 0xFF),
                0, static_cast<uint8_t>(questions),
                0, static_cast<uint8_t>(answers),
                0, 0, 0, 0};
    }

} // namespace

// -----------------------
// ENCODE / DECODE
// -----------------------
TEST(MdnsCodecTest, DecodesItsOwnAnnouncement) {
    MdnsCodec codec;
    Advertisement original = makeAdvertisement(17, "turtle", 0xBEEF, "192.168.1.20", 11311);

    Advertisement parsed;
    ASSERT_EQ(codec.decode(codec.encode(original), parsed), DecodeStatus::OK);
    EXPECT_EQ(parsed.id, original.id);
    EXPECT_EQ(parsed.sequence, 17u);
    EXPECT_EQ(parsed.name, "turtle");
    EXPECT_EQ(parsed.masterUri, original.masterUri);
    EXPECT_EQ(parsed.capabilities, CAP_HEARTBEAT);
    EXPECT_FALSE(parsed.departing);
}

TEST(MdnsCodecTest, GoodbyeIsDeparture) {
    MdnsCodec codec;
    Advertisement original = makeAdvertisement(18);
    original.departing = true;

    Advertisement parsed;
    ASSERT_EQ(codec.decode(codec.encode(original), parsed), DecodeStatus::OK);
    EXPECT_TRUE(parsed.departing);
}

TEST(MdnsCodecTest, AnnouncementIsAuthoritativeResponse) {
    MdnsCodec codec;
    const auto packet = codec.encode(makeAdvertisement(1));

    ASSERT_GE(packet.size(), 12u);
    const uint16_t flags = static_cast<uint16_t>((packet[2] << 8) | packet[3]);
    EXPECT_TRUE(flags & DNS_FLAG_RESPONSE);
    EXPECT_TRUE(flags & DNS_FLAG_AUTHORITATIVE);
    EXPECT_EQ(packet[7], 3); // PTR + SRV + TXT
}

TEST(MdnsCodecTest, InstanceNameUsesServiceType) {
    PeerIdentity id{"10.0.0.2", 11311, 0x2A};
    EXPECT_EQ(MdnsCodec::instanceName(id), "000000000000002a._master-discovery._udp.local");
}

// -----------------------
// REJECTION
// -----------------------
TEST(MdnsCodecTest, ShortPacketIsMalformed) {
    MdnsCodec codec;
    Advertisement out;
    EXPECT_EQ(codec.decode({0, 1, 2}, out), DecodeStatus::MALFORMED);
}

TEST(MdnsCodecTest, QueriesAreForeign) {
    MdnsCodec codec;
    Advertisement out;
    EXPECT_EQ(codec.decode(header(0x0000, 0, 0), out), DecodeStatus::FOREIGN);
}

TEST(MdnsCodecTest, ResponseWithoutOurServiceIsForeign) {
    MdnsCodec codec;
    Advertisement out;
    EXPECT_EQ(codec.decode(header(DNS_FLAG_RESPONSE, 0, 0), out), DecodeStatus::FOREIGN);
}

TEST(MdnsCodecTest, CompressionLoopIsMalformed) {
    MdnsCodec codec;
    auto packet = header(DNS_FLAG_RESPONSE, 0, 1);
    // name is a pointer to itself
    packet.push_back(0xC0);
    packet.push_back(0x0C);

    Advertisement out;
    EXPECT_EQ(codec.decode(packet, out), DecodeStatus::MALFORMED);
}

TEST(MdnsCodecTest, OtherTxtVersionIsMismatch) {
    MdnsCodec codec;
    auto packet = codec.encode(makeAdvertisement(1));
    ASSERT_TRUE(patch(packet, "txtvers=1", "txtvers=2"));

    Advertisement out;
    EXPECT_EQ(codec.decode(packet, out), DecodeStatus::VERSION_MISMATCH);
}

TEST(MdnsCodecTest, MissingSequenceIsMalformed) {
    MdnsCodec codec;
    auto packet = codec.encode(makeAdvertisement(1));
    ASSERT_TRUE(patch(packet, "seq=", "sxq="));

    Advertisement out;
    EXPECT_EQ(codec.decode(packet, out), DecodeStatus::MALFORMED);
}

TEST(MdnsCodecTest, NonNumericPortIsMalformed) {
    MdnsCodec codec;
    auto packet = codec.encode(makeAdvertisement(1));
    ASSERT_TRUE(patch(packet, "port=11311", "port=1x311"));

    Advertisement out;
    EXPECT_EQ(codec.decode(packet, out), DecodeStatus::MALFORMED);
}

TEST(MdnsCodecTest, TruncatedAnnouncementIsMalformed) {
    MdnsCodec codec;
    auto packet = codec.encode(makeAdvertisement(1));
    packet.resize(packet.size() - 10);

    Advertisement out;
    EXPECT_EQ(codec.decode(packet, out), DecodeStatus::MALFORMED);
}

// -----------------------
// TXT PARSING
// -----------------------
TEST(MdnsCodecTest, ParseTxtSplitsKeyValuePairs) {
    std::vector<uint8_t> rdata;
    for (const std::string entry : {"Name=robot one", "flag", "uri=http://a:1/?x=y"}) {
        rdata.push_back(static_cast<uint8_t>(entry.size()));
        rdata.insert(rdata.end(), entry.begin(), entry.end());
    }

    std::map<std::string, std::string> txt;
    ASSERT_TRUE(MdnsCodec::parseTxt(rdata, txt));
    EXPECT_EQ(txt["name"], "robot one");
    EXPECT_EQ(txt["uri"], "http://a:1/?x=y");
    EXPECT_EQ(txt.count("flag"), 1u);
}

TEST(MdnsCodecTest, ParseTxtRejectsOverlongString) {
    std::vector<uint8_t> rdata = {10, 'a', '=', 'b'};
    std::map<std::string, std::string> txt;
    EXPECT_FALSE(MdnsCodec::parseTxt(rdata, txt));
}
