#include <midea/discovery.hpp>

#include <cstdio>
#include <cstdlib>
#include <utility>

#include <midea/endian.hpp>
#include <midea/log.hpp>

namespace midea {

namespace defs {

const uint8_t DISCOVERY_MESSAGE[DISCOVERY_MESSAGE_LEN] = {
    0x5a, 0x5a, 0x01, 0x11, 0x48, 0x00, 0x92, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x7f, 0x75, 0xbd, 0x6b, 0x3e, 0x4f, 0x8b, 0x76,
    0x2e, 0x84, 0x9c, 0x6e, 0x57, 0x8d, 0x65, 0x90, 0x03, 0x6e, 0x9d, 0x43, 0x42, 0xa5, 0x0f, 0x1f,
    0x56, 0x9e, 0xb8, 0xec, 0x91, 0x8e, 0x92, 0xe5,
};

const uint8_t DEVICE_INFO_MESSAGE[DEVICE_INFO_MESSAGE_LEN] = {
    0x5a, 0x5a, 0x15, 0x00, 0x00, 0x38, 0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x27, 0x33, 0x05,
    0x13, 0x06, 0x14, 0x14, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0xe8, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xca, 0x8d, 0x9b, 0xf9, 0xa0, 0x30, 0x1a, 0xe3,
    0xb7, 0xe4, 0x2d, 0x53, 0x49, 0x47, 0x62, 0xbe,
};

} // namespace defs

namespace discovery {

namespace {

const size_t REPLY_SN_START = 8;
const size_t REPLY_SN_END = 40;
const size_t REPLY_SSID_LEN_AT = 40;
const size_t MODEL_START = 9;
const size_t MODEL_END = 17;

// ssid looks like "net_ac_1A2B"; the second token is the device class in hex
uint8_t type_from_ssid(const std::string& ssid) {
    const auto first = ssid.find('_');
    if (first == std::string::npos)
        return 0;
    const auto second = ssid.find('_', first + 1);
    const std::string token = ssid.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    char* end = nullptr;
    const unsigned long value = strtoul(token.c_str(), &end, 16);
    if (token.empty() || *end != '\0' || value > 0xFF)
        return 0;
    return static_cast<uint8_t>(value);
}

} // namespace

Bytes discovery_message() {
    return Bytes(defs::DISCOVERY_MESSAGE, defs::DISCOVERY_MESSAGE + defs::DISCOVERY_MESSAGE_LEN);
}

Bytes device_info_message() {
    return Bytes(defs::DEVICE_INFO_MESSAGE, defs::DEVICE_INFO_MESSAGE + defs::DEVICE_INFO_MESSAGE_LEN);
}

Error parse_reply(const Security& security, const uint8_t* data, size_t len, DeviceInfo& out) {
    defs::ProtocolVersion version;
    if (len >= 2 && data[0] == defs::PACKET_MAGIC_0 && data[1] == defs::PACKET_MAGIC_1) {
        version = defs::ProtocolVersion::V2;
    } else if (len >= 2 && data[0] == defs::V3_MAGIC_0 && data[1] == defs::V3_MAGIC_1) {
        version = defs::ProtocolVersion::V3;
        // strip the plain 8370 header and its trailer
        const size_t skip = defs::V3_HEADER_LEN + defs::V3_COUNTER_LEN;
        if (len < skip + defs::PACKET_SIGN_LEN)
            return Error::MalformedFrame;
        data += skip;
        len -= skip + defs::PACKET_SIGN_LEN;
    } else {
        return Error::MalformedFrame;
    }

    if (len < defs::PACKET_MIN_LEN)
        return Error::MalformedFrame;

    Bytes cipher(data + defs::PACKET_HEADER_LEN, data + len - defs::PACKET_SIGN_LEN);
    Bytes reply;
    if (security.aes_decrypt(cipher, reply) != Error::Ok)
        return Error::Integrity;
    if (reply.size() <= REPLY_SSID_LEN_AT)
        return Error::MalformedFrame;

    const size_t ssid_len = reply[REPLY_SSID_LEN_AT];
    if (reply.size() < REPLY_SSID_LEN_AT + 1 + ssid_len)
        return Error::MalformedFrame;

    char ip[16];
    snprintf(ip, sizeof(ip), "%u.%u.%u.%u", reply[3], reply[2], reply[1], reply[0]);

    DeviceInfo info;
    info.ip = ip;
    info.port = static_cast<uint16_t>(load_le64(reply.data() + 4, 4));
    info.id = load_le64(data + 20, 6);
    info.sn.assign(reply.begin() + REPLY_SN_START, reply.begin() + REPLY_SN_END);
    info.name.assign(reply.begin() + REPLY_SSID_LEN_AT + 1, reply.begin() + REPLY_SSID_LEN_AT + 1 + ssid_len);
    info.model = info.sn.substr(MODEL_START, MODEL_END - MODEL_START);
    info.type = type_from_ssid(info.name);
    info.version = version;

    MIDEA_LOGI(MIDEA_LOG_TAG, "discovered %s type 0x%02x at %s:%u (v%u)", info.name.c_str(), info.type,
               info.ip.c_str(), info.port, static_cast<unsigned>(info.version));
    out = std::move(info);
    return Error::Ok;
}

} // namespace discovery
} // namespace midea
