#ifndef MIDEA_DISCOVERY_HPP
#define MIDEA_DISCOVERY_HPP

#include <string>

#include <midea/defs.hpp>
#include <midea/error.hpp>
#include <midea/security.hpp>

namespace midea {

/// Identity of one appliance as announced in its discovery reply.
struct DeviceInfo {
    std::string ip;
    uint16_t port{defs::DEVICE_PORT};
    uint64_t id{0};
    std::string model;
    std::string sn;
    std::string name;
    uint8_t type{0};
    defs::ProtocolVersion version{defs::ProtocolVersion::Unknown};
};

namespace discovery {

/// Broadcast probe every appliance answers on the discovery ports.
Bytes discovery_message();

/// Direct probe asking a single appliance for its device info.
Bytes device_info_message();

/**
 * Decode the reply to a discovery probe.  V3 appliances wrap the lan
 * packet in an unencrypted 8370 frame.  Returns MalformedFrame for replies
 * that are too short or carry neither magic, Integrity when the payload
 * does not decrypt.
 */
Error parse_reply(const Security& security, const uint8_t* data, size_t len, DeviceInfo& out);

} // namespace discovery
} // namespace midea

#endif // MIDEA_DISCOVERY_HPP
