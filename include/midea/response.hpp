#ifndef MIDEA_RESPONSE_HPP
#define MIDEA_RESPONSE_HPP

#include <array>
#include <optional>

#include <midea/attributes.hpp>
#include <midea/message.hpp>

namespace midea {
namespace messages {

/// Decoded view over one appliance response.  Only the fields carried by the
/// body type (and firmware) that produced it are present.
class Response {
public:
    std::optional<AttributeValue> get(Attr attr) const {
        return fields[static_cast<size_t>(attr)];
    }

    bool has(Attr attr) const {
        return fields[static_cast<size_t>(attr)].has_value();
    }

    void set(Attr attr, AttributeValue value) {
        fields[static_cast<size_t>(attr)] = std::move(value);
    }

    defs::FrameType frame_type{defs::FrameType::Unknown};
    uint8_t protocol_version{0};
    uint8_t body_type{0};

    bool used_sub_protocol{false};
    std::optional<bool> sn8_flag;
    std::optional<bool> timer;

private:
    std::array<std::optional<AttributeValue>, ATTR_COUNT> fields{};
};

/// Decode a complete inner frame.  @p power_analysis_method selects how
/// energy counters in power reports are encoded (1 BCD, 2 and 3 binary).
Error decode(const uint8_t* data, size_t len, Response& out, uint8_t power_analysis_method);

/// Decode a message body (body type first) into @p out.
Error decode_body(const Bytes& body, Response& out, uint8_t power_analysis_method);

} // namespace messages
} // namespace midea

#endif // MIDEA_RESPONSE_HPP
