#ifndef MIDEA_DEFS_HPP
#define MIDEA_DEFS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace midea {

using Bytes = std::vector<uint8_t>;

namespace defs {

const uint8_t DEVICE_TYPE_AIR_CONDITIONER = 0xAC;

// inner appliance frame
const uint8_t FRAME_START = 0xAA;
const size_t FRAME_HEADER_LEN = 10;
const size_t FRAME_MIN_LEN = FRAME_HEADER_LEN + 1;

enum class FrameType : uint8_t {
    Unknown = 0x00,
    Set = 0x02,
    Request = 0x03,
    Response = 0x04,
    AbnormalReport = 0x06,
};

// lan packet ("5A5A") wrapping the encrypted inner frame
const uint8_t PACKET_MAGIC_0 = 0x5A;
const uint8_t PACKET_MAGIC_1 = 0x5A;
const size_t PACKET_HEADER_LEN = 40;
const size_t PACKET_SIGN_LEN = 16;
const size_t PACKET_MIN_LEN = PACKET_HEADER_LEN + PACKET_SIGN_LEN;
const uint16_t PACKET_TYPE_HEARTBEAT = 0x1001;
const uint16_t PACKET_TYPE_HEARTBEAT_ACK = 0x0001;

// V3 transport ("8370")
const uint8_t V3_MAGIC_0 = 0x83;
const uint8_t V3_MAGIC_1 = 0x70;
const uint8_t V3_FIXED_BYTE = 0x20;
const size_t V3_HEADER_LEN = 6;
const size_t V3_COUNTER_LEN = 2;
const size_t V3_SIGN_LEN = 32;
const size_t TOKEN_LEN = 64;
const size_t KEY_LEN = 32;
const size_t HANDSHAKE_PAYLOAD_LEN = 64;
const size_t HANDSHAKE_MIN_REPLY_LEN = 20;

enum class TcpMessageType : uint8_t {
    HandshakeRequest = 0x0,
    HandshakeResponse = 0x1,
    EncryptedResponse = 0x3,
    EncryptedRequest = 0x6,
};

enum class ProtocolVersion : uint8_t {
    Unknown = 0,
    V1 = 1,
    V2 = 2,
    V3 = 3,
};

// key material shared by every appliance for the lan packet layer
const char SIGN_KEY[] = "xhdiwjnchekd4d512chdjx5d8e4c394D2D7S";
const size_t SIGN_KEY_LEN = sizeof(SIGN_KEY) - 1;

// message body types
const uint8_t BODY_GENERAL_SET = 0x40;
const uint8_t BODY_QUERY = 0x41;
const uint8_t BODY_STATUS_NOTIFY = 0xA0;
const uint8_t BODY_SENSOR_NOTIFY = 0xA1;
const uint8_t BODY_NEW_PROTOCOL_SET = 0xB0;
const uint8_t BODY_NEW_PROTOCOL_QUERY = 0xB1;
const uint8_t BODY_CAPABILITIES = 0xB5;
const uint8_t BODY_SUB_PROTOCOL = 0xAA;
const uint8_t BODY_SUB_PROTOCOL_RESPONSE = 0xBB;
const uint8_t BODY_STATUS = 0xC0;
const uint8_t BODY_POWER = 0xC1;

const size_t SUB_PROTOCOL_MIN_BODY_LEN = 21;
const size_t SUB_PROTOCOL_HEAD_LEN = 6;

const uint8_t SUB_PROTOCOL_QUERY_STATUS = 0x10;
const uint8_t SUB_PROTOCOL_QUERY_SETTINGS = 0x11;
const uint8_t SUB_PROTOCOL_QUERY_OUTDOOR = 0x30;
const uint8_t SUB_PROTOCOL_SET = 0x20;

const uint8_t SUB_PROTOCOL_MODES[] = {0, 1, 3, 2, 4, 5};

namespace tags {
const uint16_t INDOOR_HUMIDITY = 0x0015;
const uint16_t SCREEN_DISPLAY = 0x0017;
const uint16_t BREEZELESS = 0x0018;
const uint16_t PROMPT_TONE = 0x001A;
const uint16_t INDIRECT_WIND = 0x0042;
const uint16_t FRESH_AIR_2 = 0x004B;
const uint16_t FRESH_AIR_1 = 0x0233;
} // namespace tags

const uint8_t MESSAGE_ID_MAX = 254;

const size_t DISCOVERY_MESSAGE_LEN = 72;
const size_t DEVICE_INFO_MESSAGE_LEN = 56;

extern const uint8_t DISCOVERY_MESSAGE[DISCOVERY_MESSAGE_LEN];
extern const uint8_t DEVICE_INFO_MESSAGE[DEVICE_INFO_MESSAGE_LEN];

const uint16_t DISCOVERY_PORT_V2 = 6445;
const uint16_t DISCOVERY_PORT_V3 = 20086;
const uint16_t DEVICE_PORT = 6444;

} // namespace defs
} // namespace midea

#endif // MIDEA_DEFS_HPP
