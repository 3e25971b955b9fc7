#ifndef MIDEA_PACKET_HPP
#define MIDEA_PACKET_HPP

#include <chrono>

#include <midea/defs.hpp>
#include <midea/error.hpp>
#include <midea/security.hpp>

namespace midea {
namespace packet {

using clock = std::chrono::system_clock;

void encode_time(clock::time_point tp, uint8_t out[8]);

/// Wrap an inner appliance frame into a signed lan packet.  Empty when the
/// frame could not be encrypted.
Bytes build(const Security& security, uint64_t device_id, const Bytes& frame, clock::time_point now = clock::now());

/// Keep-alive packet without payload.
Bytes build_heartbeat(uint64_t device_id, clock::time_point now = clock::now());

/// Total length of the packet at the front of @p data, 0 while the header is
/// still incomplete.
size_t pending_length(const uint8_t* data, size_t len);

/// Validate and decrypt one complete lan packet.  Heartbeat replies yield Ok
/// with @p heartbeat set and an empty @p frame.
Error parse(const Security& security, const uint8_t* data, size_t len, Bytes& frame, bool& heartbeat);

} // namespace packet
} // namespace midea

#endif // MIDEA_PACKET_HPP
