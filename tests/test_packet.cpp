#include <gtest/gtest.h>

#include <ctime>

#include <midea/config.hpp>
#include <midea/endian.hpp>
#include <midea/message.hpp>
#include <midea/packet.hpp>

#include "test_helpers.hpp"

using midea::Bytes;
using midea::Error;
using midea::Security;
namespace packet = midea::packet;

namespace {

const uint64_t DEVICE_ID = 0x0000A1B2C3D4E5F6ull;

packet::clock::time_point local_time(int year, int mon, int day, int hour, int min, int sec, int millis) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = -1;
    return packet::clock::from_time_t(std::mktime(&tm)) + std::chrono::milliseconds(millis);
}

} // namespace

TEST(Packet, TimestampLeastSignificantFirst) {
    uint8_t out[8];
    packet::encode_time(local_time(2024, 3, 5, 6, 7, 8, 120), out);
    const uint8_t expected[8] = {12, 8, 7, 6, 5, 3, 24, 20};
    EXPECT_EQ(0, memcmp(out, expected, sizeof(out)));
}

TEST(Packet, BuildLayout) {
    Security security;
    const Bytes frame = midea::messages::encode(midea::messages::Query{}, 0, 1);
    const Bytes pkt = packet::build(security, DEVICE_ID, frame);

    const size_t cipher_len = (frame.size() / 16 + 1) * 16;
    ASSERT_EQ(pkt.size(), 40 + cipher_len + 16);
    EXPECT_EQ(pkt[0], 0x5A);
    EXPECT_EQ(pkt[1], 0x5A);
    EXPECT_EQ(pkt[2], 0x01);
    EXPECT_EQ(pkt[3], 0x11);
    EXPECT_EQ(midea::load_le16(&pkt[4]), pkt.size());
    EXPECT_EQ(pkt[6], 0x20);
    EXPECT_EQ(midea::load_le64(&pkt[20]), DEVICE_ID);
    EXPECT_TRUE(Security::verify_packet(pkt.data(), pkt.size()));
}

TEST(Packet, ParseRecoversFrame) {
    Security security;
    const Bytes frame = midea::messages::encode(midea::messages::PowerQuery{}, 3, 0);
    const Bytes pkt = packet::build(security, DEVICE_ID, frame);

    Bytes out;
    bool heartbeat = true;
    ASSERT_EQ(packet::parse(security, pkt.data(), pkt.size(), out, heartbeat), Error::Ok);
    EXPECT_FALSE(heartbeat);
    EXPECT_EQ(out, frame);
}

TEST(Packet, TamperedPacketFailsSignature) {
    Security security;
    Bytes pkt = packet::build(security, DEVICE_ID, test::response_frame(test::status_body(true, 2, 24, 102)));
    pkt[45] ^= 0x01;

    Bytes out;
    bool heartbeat = false;
    EXPECT_EQ(packet::parse(security, pkt.data(), pkt.size(), out, heartbeat), Error::Integrity);
    EXPECT_TRUE(out.empty());
}

TEST(Packet, SignatureCheckCanBeDisabled) {
    const bool saved = midea::packet_sign_verified();
    midea::set_packet_sign_verified(false);

    Security security;
    const Bytes frame = test::response_frame(test::status_body(true, 2, 24, 102));
    Bytes pkt = packet::build(security, DEVICE_ID, frame);
    pkt.back() ^= 0x01;

    Bytes out;
    bool heartbeat = false;
    EXPECT_EQ(packet::parse(security, pkt.data(), pkt.size(), out, heartbeat), Error::Ok);
    EXPECT_EQ(out, frame);

    midea::set_packet_sign_verified(saved);
}

TEST(Packet, Heartbeat) {
    Security security;
    const Bytes pkt = packet::build_heartbeat(DEVICE_ID);
    ASSERT_EQ(pkt.size(), 56u);
    EXPECT_EQ(pkt[3], 0x10);
    EXPECT_EQ(pkt[6], 0x7B);

    Bytes out;
    bool heartbeat = false;
    ASSERT_EQ(packet::parse(security, pkt.data(), pkt.size(), out, heartbeat), Error::Ok);
    EXPECT_TRUE(heartbeat);
    EXPECT_TRUE(out.empty());
}

TEST(Packet, DeclaredLengthMustMatch) {
    Security security;
    const Bytes pkt = packet::build(security, DEVICE_ID, test::response_frame(test::status_body(true, 2, 24, 102)));

    Bytes out;
    bool heartbeat = false;
    EXPECT_EQ(packet::parse(security, pkt.data(), pkt.size() - 1, out, heartbeat), Error::MalformedFrame);

    const Bytes bad_magic = {0x5A, 0x5B, 0x01, 0x11};
    EXPECT_EQ(packet::parse(security, bad_magic.data(), bad_magic.size(), out, heartbeat), Error::MalformedFrame);
}

TEST(Packet, PendingLength) {
    const Bytes header = {0x5A, 0x5A, 0x01, 0x11, 0x68, 0x00};
    EXPECT_EQ(packet::pending_length(header.data(), 5), 0u);
    EXPECT_EQ(packet::pending_length(header.data(), header.size()), 0x68u);
}
