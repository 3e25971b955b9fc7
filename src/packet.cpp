#include <midea/packet.hpp>

#include <cstring>
#include <ctime>

#include <midea/config.hpp>
#include <midea/endian.hpp>

namespace midea {
namespace packet {

namespace {

Bytes header(uint64_t device_id, clock::time_point now) {
    Bytes pkt(defs::PACKET_HEADER_LEN, 0x00);
    pkt[0] = defs::PACKET_MAGIC_0;
    pkt[1] = defs::PACKET_MAGIC_1;
    pkt[2] = 0x01;
    pkt[3] = 0x11;
    pkt[6] = 0x20;
    encode_time(now, &pkt[12]);
    store_le64(&pkt[20], device_id);
    return pkt;
}

void finalize(Bytes& pkt) {
    store_le16(&pkt[4], static_cast<uint16_t>(pkt.size() + defs::PACKET_SIGN_LEN));
    uint8_t sign[defs::PACKET_SIGN_LEN];
    Security::sign_packet(pkt.data(), pkt.size(), sign);
    pkt.insert(pkt.end(), sign, sign + sizeof(sign));
}

} // namespace

// yyyy mm dd HH MM SS cc as two-digit values, least significant first
void encode_time(clock::time_point tp, uint8_t out[8]) {
    const std::time_t t = clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;

    const int year = tm.tm_year + 1900;
    out[0] = static_cast<uint8_t>(micros / 10000);
    out[1] = static_cast<uint8_t>(tm.tm_sec);
    out[2] = static_cast<uint8_t>(tm.tm_min);
    out[3] = static_cast<uint8_t>(tm.tm_hour);
    out[4] = static_cast<uint8_t>(tm.tm_mday);
    out[5] = static_cast<uint8_t>(tm.tm_mon + 1);
    out[6] = static_cast<uint8_t>(year % 100);
    out[7] = static_cast<uint8_t>(year / 100);
}

Bytes build(const Security& security, uint64_t device_id, const Bytes& frame, clock::time_point now) {
    Bytes cipher = security.aes_encrypt(frame);
    if (cipher.empty())
        return {};
    Bytes pkt = header(device_id, now);
    pkt.insert(pkt.end(), cipher.begin(), cipher.end());
    finalize(pkt);
    return pkt;
}

Bytes build_heartbeat(uint64_t device_id, clock::time_point now) {
    Bytes pkt = header(device_id, now);
    pkt[3] = 0x10;
    pkt[6] = 0x7B;
    finalize(pkt);
    return pkt;
}

size_t pending_length(const uint8_t* data, size_t len) {
    if (len < 6)
        return 0;
    return load_le16(data + 4);
}

Error parse(const Security& security, const uint8_t* data, size_t len, Bytes& frame, bool& heartbeat) {
    frame.clear();
    heartbeat = false;

    if (len < defs::PACKET_MIN_LEN || data[0] != defs::PACKET_MAGIC_0 || data[1] != defs::PACKET_MAGIC_1)
        return Error::MalformedFrame;
    if (load_le16(data + 4) != len)
        return Error::MalformedFrame;
    if (packet_sign_verified() && !Security::verify_packet(data, len))
        return Error::Integrity;

    const uint16_t type = load_le16(data + 2);
    if (type == defs::PACKET_TYPE_HEARTBEAT || type == defs::PACKET_TYPE_HEARTBEAT_ACK) {
        heartbeat = true;
        return Error::Ok;
    }

    const size_t payload_len = len - defs::PACKET_MIN_LEN;
    if (payload_len == 0 || payload_len % 16 != 0)
        return Error::MalformedFrame;

    Bytes cipher(data + defs::PACKET_HEADER_LEN, data + defs::PACKET_HEADER_LEN + payload_len);
    return security.aes_decrypt(cipher, frame);
}

} // namespace packet
} // namespace midea
