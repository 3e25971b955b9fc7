#ifndef MIDEA_MESSAGE_HPP
#define MIDEA_MESSAGE_HPP

#include <optional>
#include <variant>

#include <midea/defs.hpp>
#include <midea/error.hpp>

namespace midea {
namespace messages {

uint8_t frame_checksum(const uint8_t* data, size_t len);
uint8_t crc8(const uint8_t* data, size_t len);

struct Frame {
    defs::FrameType type{defs::FrameType::Unknown};
    uint8_t device_type{0};
    uint8_t protocol_version{0};
    Bytes body;
};

/// Validate header, declared length and checksum of an inner appliance frame.
Error decode_frame(const uint8_t* data, size_t len, Frame& out);

struct Query {};

struct PowerQuery {};

struct NewProtocolQuery {};

struct SubProtocolQuery {
    uint8_t query_type{defs::SUB_PROTOCOL_QUERY_STATUS};
};

struct SwitchDisplay {};

struct FreshAirSetting {
    bool power{false};
    int fan_speed{0};
};

struct GeneralSet {
    bool power{false};
    bool prompt_tone{false};
    int mode{0};
    double target_temperature{24.0};
    int fan_speed{102};
    bool swing_vertical{false};
    bool swing_horizontal{false};
    bool boost_mode{false};
    bool smart_eye{false};
    bool dry{false};
    bool eco_mode{false};
    bool aux_heating{false};
    bool sleep_mode{false};
    bool frost_protect{false};
    bool comfort_mode{false};
    bool natural_wind{false};
    bool temp_fahrenheit{false};
};

struct SubProtocolSet {
    bool power{false};
    bool prompt_tone{false};
    bool aux_heating{false};
    int mode{0};
    double target_temperature{24.0};
    int fan_speed{102};
    bool boost_mode{false};
    bool dry{false};
    bool eco_mode{false};
    bool sleep_mode{false};
    bool sn8_flag{false};
    bool timer{false};
};

/// Tag keyed extension frame; only the engaged fields are packed.
struct NewProtocolSet {
    std::optional<bool> indirect_wind;
    std::optional<bool> breezeless;
    std::optional<bool> screen_display;
    std::optional<FreshAirSetting> fresh_air_1;
    std::optional<FreshAirSetting> fresh_air_2;
    bool prompt_tone{false};
};

using StatusSet = std::variant<GeneralSet, SubProtocolSet>;

using Command = std::variant<Query, PowerQuery, NewProtocolQuery, SubProtocolQuery, SwitchDisplay, GeneralSet,
                             SubProtocolSet, NewProtocolSet>;

Command to_command(const StatusSet& set);

defs::FrameType frame_type(const Command& cmd);
const char* command_name(const Command& cmd);

/// Message body without the frame header: body type, payload and trailer.
Bytes command_body(const Command& cmd, uint8_t message_id);

/// Complete inner frame ready for the lan packet layer.
Bytes encode(const Command& cmd, uint8_t protocol_version, uint8_t message_id);

} // namespace messages
} // namespace midea

#endif // MIDEA_MESSAGE_HPP
