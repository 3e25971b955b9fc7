#ifndef MIDEA_ENDIAN_HPP
#define MIDEA_ENDIAN_HPP

#include <cstdint>

// Byte order helpers for the appliance wire formats. The lan packet layer is
// little endian, the V3 transport header and counter are big endian.

namespace midea {

static inline constexpr uint16_t load_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static inline constexpr uint16_t load_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static inline uint64_t load_le64(const uint8_t* p, int len = 8) {
    uint64_t v = 0;
    for (int i = len - 1; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

static inline void store_le16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>(v >> 8);
}

static inline void store_be16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

static inline void store_le64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

} // namespace midea

#endif // MIDEA_ENDIAN_HPP
