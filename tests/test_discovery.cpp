#include <gtest/gtest.h>

#include <midea/discovery.hpp>
#include <midea/packet.hpp>

#include "test_helpers.hpp"

using midea::Bytes;
using midea::DeviceInfo;
using midea::Error;
using midea::Security;
namespace defs = midea::defs;
namespace discovery = midea::discovery;

namespace {

const uint64_t DEVICE_ID = 0x0000123456789ABCull;
const std::string SERIAL = "000000P0" "0" "Q1B88C02" "000000000000000";
const std::string SSID = "net_ac_1A2B";

Bytes reply_payload() {
    Bytes plain = {20, 1, 168, 192, 0x2C, 0x19, 0x00, 0x00};
    plain.insert(plain.end(), SERIAL.begin(), SERIAL.end());
    plain.push_back(static_cast<uint8_t>(SSID.size()));
    plain.insert(plain.end(), SSID.begin(), SSID.end());
    plain.resize(plain.size() + 12, 0x00);
    return plain;
}

Bytes v2_reply(const Security& security) {
    return midea::packet::build(security, DEVICE_ID, reply_payload());
}

} // namespace

TEST(Discovery, ProbeMessages) {
    const Bytes probe = discovery::discovery_message();
    ASSERT_EQ(probe.size(), 72u);
    EXPECT_EQ(probe[0], 0x5A);
    EXPECT_EQ(probe[1], 0x5A);
    EXPECT_EQ(probe[4], 72);

    const Bytes info = discovery::device_info_message();
    ASSERT_EQ(info.size(), 56u);
    EXPECT_EQ(info[0], 0x5A);
    EXPECT_EQ(info[5], 56);
}

TEST(Discovery, ParseV2Reply) {
    ASSERT_EQ(SERIAL.size(), 32u);
    Security security;
    const Bytes reply = v2_reply(security);

    DeviceInfo info;
    ASSERT_EQ(discovery::parse_reply(security, reply.data(), reply.size(), info), Error::Ok);
    EXPECT_EQ(info.ip, "192.168.1.20");
    EXPECT_EQ(info.port, 6444);
    EXPECT_EQ(info.id, DEVICE_ID);
    EXPECT_EQ(info.sn, SERIAL);
    EXPECT_EQ(info.model, "Q1B88C02");
    EXPECT_EQ(info.name, SSID);
    EXPECT_EQ(info.type, 0xAC);
    EXPECT_EQ(info.version, defs::ProtocolVersion::V2);
}

TEST(Discovery, ParseV3Reply) {
    Security security;
    Bytes reply = {0x83, 0x70, 0x00, 0x00, 0x20, 0x00, 0x00, 0x00};
    const Bytes inner = v2_reply(security);
    reply.insert(reply.end(), inner.begin(), inner.end());
    reply.resize(reply.size() + 16, 0xEE);

    DeviceInfo info;
    ASSERT_EQ(discovery::parse_reply(security, reply.data(), reply.size(), info), Error::Ok);
    EXPECT_EQ(info.version, defs::ProtocolVersion::V3);
    EXPECT_EQ(info.id, DEVICE_ID);
    EXPECT_EQ(info.name, SSID);
}

TEST(Discovery, RejectsForeignAndTruncatedReplies) {
    Security security;
    DeviceInfo info;

    const Bytes foreign = {0x12, 0x34, 0x56};
    EXPECT_EQ(discovery::parse_reply(security, foreign.data(), foreign.size(), info), Error::MalformedFrame);

    const Bytes reply = v2_reply(security);
    EXPECT_EQ(discovery::parse_reply(security, reply.data(), 30, info), Error::MalformedFrame);

    Bytes misaligned = reply;
    misaligned.erase(misaligned.begin() + 40);
    EXPECT_EQ(discovery::parse_reply(security, misaligned.data(), misaligned.size(), info), Error::Integrity);
    EXPECT_TRUE(info.ip.empty());
}

TEST(Discovery, SsidWithoutTypeToken) {
    Security security;
    Bytes plain = reply_payload();
    const std::string odd = "midea";
    plain[40] = static_cast<uint8_t>(odd.size());
    std::copy(odd.begin(), odd.end(), plain.begin() + 41);
    const Bytes reply = midea::packet::build(security, DEVICE_ID, plain);

    DeviceInfo info;
    ASSERT_EQ(discovery::parse_reply(security, reply.data(), reply.size(), info), Error::Ok);
    EXPECT_EQ(info.name, odd);
    EXPECT_EQ(info.type, 0);
}
