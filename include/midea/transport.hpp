#ifndef MIDEA_TRANSPORT_HPP
#define MIDEA_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>

namespace midea::transport {

enum class LinkError {
    Ok,
    Timeout,
    Transport,
};

/// Byte stream towards one appliance.
class Link {
public:
    virtual bool open(uint32_t timeout_ms) = 0;
    virtual bool write(const uint8_t* buf, size_t len, uint32_t timeout_ms) = 0;
    virtual LinkError read(uint8_t* buf, size_t len, size_t* out_len, uint32_t timeout_ms) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual ~Link() = default;
};
} // namespace midea::transport

#endif // MIDEA_TRANSPORT_HPP
