#include <midea/message.hpp>

#include <cmath>

namespace midea {
namespace messages {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void append_tail(Bytes& body, uint8_t message_id) {
    body.push_back(message_id);
    body.push_back(crc8(body.data(), body.size()));
}

void pack(Bytes& payload, uint16_t tag, const Bytes& value) {
    payload.push_back(static_cast<uint8_t>(tag & 0xFF));
    payload.push_back(static_cast<uint8_t>(tag >> 8));
    payload.push_back(0x00);
    payload.push_back(static_cast<uint8_t>(value.size()));
    payload.insert(payload.end(), value.begin(), value.end());
}

Bytes query_body(uint8_t message_id) {
    Bytes body = {defs::BODY_QUERY, 0x81, 0x00, 0xFF, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                  0x00,             0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    append_tail(body, message_id);
    return body;
}

Bytes power_query_body() {
    Bytes body = {defs::BODY_QUERY, 0x21, 0x01, 0x44, 0x00, 0x01};
    body.push_back(crc8(body.data(), body.size()));
    return body;
}

Bytes switch_display_body(uint8_t message_id) {
    Bytes body = {defs::BODY_QUERY, 0x00, 0x00, 0xFF, 0x02, 0x00, 0x02, 0x00, 0x00, 0x00,
                  0x00,             0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    append_tail(body, message_id);
    return body;
}

Bytes new_protocol_query_body(uint8_t message_id) {
    const uint16_t params[] = {defs::tags::INDIRECT_WIND, defs::tags::BREEZELESS,  defs::tags::INDOOR_HUMIDITY,
                               defs::tags::SCREEN_DISPLAY, defs::tags::FRESH_AIR_1, defs::tags::FRESH_AIR_2};
    Bytes body = {defs::BODY_NEW_PROTOCOL_QUERY, static_cast<uint8_t>(sizeof(params) / sizeof(params[0]))};
    for (auto param : params) {
        body.push_back(static_cast<uint8_t>(param & 0xFF));
        body.push_back(static_cast<uint8_t>(param >> 8));
    }
    append_tail(body, message_id);
    return body;
}

Bytes new_protocol_set_body(const NewProtocolSet& set, uint8_t message_id) {
    Bytes body = {defs::BODY_NEW_PROTOCOL_SET, 0x00};
    uint8_t count = 0;

    if (set.breezeless) {
        ++count;
        pack(body, defs::tags::BREEZELESS, {static_cast<uint8_t>(*set.breezeless ? 0x01 : 0x00)});
    }
    if (set.indirect_wind) {
        ++count;
        pack(body, defs::tags::INDIRECT_WIND, {static_cast<uint8_t>(*set.indirect_wind ? 0x02 : 0x01)});
    }
    if (set.screen_display) {
        ++count;
        pack(body, defs::tags::SCREEN_DISPLAY, {static_cast<uint8_t>(*set.screen_display ? 0x64 : 0x00)});
    }
    // the two fresh air generations disagree on the power encoding
    if (set.fresh_air_1) {
        ++count;
        pack(body, defs::tags::FRESH_AIR_1,
             {static_cast<uint8_t>(set.fresh_air_1->power ? 0x02 : 0x01),
              static_cast<uint8_t>(set.fresh_air_1->fan_speed), 0xFF});
    }
    if (set.fresh_air_2) {
        ++count;
        pack(body, defs::tags::FRESH_AIR_2,
             {static_cast<uint8_t>(set.fresh_air_2->power ? 0x01 : 0x00),
              static_cast<uint8_t>(set.fresh_air_2->fan_speed), 0xFF});
    }

    ++count;
    pack(body, defs::tags::PROMPT_TONE, {static_cast<uint8_t>(set.prompt_tone ? 0x01 : 0x00)});

    body[1] = count;
    append_tail(body, message_id);
    return body;
}

Bytes general_set_body(const GeneralSet& set, uint8_t message_id) {
    // byte 1: power, prompt tone
    const uint8_t power = set.power ? 0x01 : 0x00;
    const uint8_t prompt_tone = set.prompt_tone ? 0x40 : 0x00;
    // byte 2: mode, target temperature (16..31 in the low nibble, 0x10 for the half degree)
    const uint8_t mode = static_cast<uint8_t>((set.mode << 5) & 0xE0);
    const int whole = static_cast<int>(set.target_temperature);
    const uint8_t temperature = static_cast<uint8_t>(
        (whole & 0x0F) | ((static_cast<int>(std::lround(set.target_temperature * 2)) % 2 != 0) ? 0x10 : 0x00));
    // byte 3
    const uint8_t fan_speed = static_cast<uint8_t>(set.fan_speed & 0x7F);
    // byte 7
    const uint8_t swing = 0x30 | (set.swing_vertical ? 0x0C : 0x00) | (set.swing_horizontal ? 0x03 : 0x00);
    // byte 8
    const uint8_t boost_mode = set.boost_mode ? 0x20 : 0x00;
    // byte 9
    const uint8_t smart_eye = set.smart_eye ? 0x01 : 0x00;
    const uint8_t dry = set.dry ? 0x04 : 0x00;
    const uint8_t aux_heating = set.aux_heating ? 0x08 : 0x00;
    const uint8_t eco_mode = set.eco_mode ? 0x80 : 0x00;
    // byte 10
    const uint8_t temp_fahrenheit = set.temp_fahrenheit ? 0x04 : 0x00;
    const uint8_t sleep_mode = set.sleep_mode ? 0x01 : 0x00;
    const uint8_t boost_mode_1 = set.boost_mode ? 0x02 : 0x00;
    // byte 17
    const uint8_t natural_wind = set.natural_wind ? 0x40 : 0x00;
    // byte 21, 22
    const uint8_t frost_protect = set.frost_protect ? 0x80 : 0x00;
    const uint8_t comfort_mode = set.comfort_mode ? 0x01 : 0x00;

    Bytes body = {defs::BODY_GENERAL_SET,
                  static_cast<uint8_t>(power | prompt_tone),
                  static_cast<uint8_t>(mode | temperature),
                  fan_speed,
                  0x00,
                  0x00,
                  0x00,
                  swing,
                  boost_mode,
                  static_cast<uint8_t>(smart_eye | dry | aux_heating | eco_mode),
                  static_cast<uint8_t>(temp_fahrenheit | sleep_mode | boost_mode_1),
                  0x00,
                  0x00,
                  0x00,
                  0x00,
                  0x00,
                  0x00,
                  natural_wind,
                  0x00,
                  0x00,
                  0x00,
                  frost_protect,
                  comfort_mode};
    append_tail(body, message_id);
    return body;
}

Bytes sub_protocol_body(uint8_t query_type, const Bytes& payload) {
    Bytes body = {defs::BODY_SUB_PROTOCOL, static_cast<uint8_t>(6 + 2 + payload.size()), 0x00, 0xFF, 0xFF,
                  query_type};
    body.insert(body.end(), payload.begin(), payload.end());
    body.push_back(frame_checksum(body.data() + 1, body.size() - 1));
    body.push_back(crc8(body.data(), body.size()));
    return body;
}

Bytes sub_protocol_set_payload(const SubProtocolSet& set) {
    const uint8_t power = set.power ? 0x01 : 0x00;
    const uint8_t dry = (set.power && set.dry) ? 0x10 : 0x00;
    const uint8_t boost_mode = set.boost_mode ? 0x20 : 0x00;
    const uint8_t aux_heating = set.aux_heating ? 0x40 : 0x80;
    const uint8_t sleep_mode = set.sleep_mode ? 0x80 : 0x00;

    uint8_t mode = 2;
    if (set.mode == 0) {
        mode = 0;
    } else if (set.mode > 0 && set.mode < static_cast<int>(sizeof(defs::SUB_PROTOCOL_MODES))) {
        mode = static_cast<uint8_t>(defs::SUB_PROTOCOL_MODES[set.mode] - 1);
    }

    const uint8_t target_temperature = static_cast<uint8_t>(set.target_temperature * 2 + 30);
    const uint8_t water_model_temperature = static_cast<uint8_t>((set.target_temperature - 1) * 2 + 50);
    const uint8_t fan_speed = static_cast<uint8_t>(set.fan_speed);
    const uint8_t eco = set.eco_mode ? 0x40 : 0x00;
    const uint8_t prompt_tone = set.prompt_tone ? 0x01 : 0x00;
    const uint8_t timer = (set.sn8_flag && set.timer) ? 0x04 : 0x00;

    return {0x00,
            power,
            static_cast<uint8_t>(dry | boost_mode),
            aux_heating,
            sleep_mode,
            0x00,
            0x00,
            mode,
            target_temperature,
            fan_speed,
            0x32,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x01,
            0x01,
            0x00,
            0x01,
            water_model_temperature,
            prompt_tone,
            target_temperature,
            0x32,
            0x66,
            0x00,
            static_cast<uint8_t>(eco | timer),
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x00,
            0x08};
}

} // namespace

uint8_t frame_checksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i)
        sum += data[i];
    return static_cast<uint8_t>((~sum + 1) & 0xFF);
}

// CRC-8/MAXIM, reflected polynomial 0x8C
uint8_t crc8(const uint8_t* data, size_t len) {
    uint8_t crc = 0;
    for (size_t i = 0; i < len; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit)
            crc = (crc & 0x01) ? static_cast<uint8_t>((crc >> 1) ^ 0x8C) : static_cast<uint8_t>(crc >> 1);
    }
    return crc;
}

Error decode_frame(const uint8_t* data, size_t len, Frame& out) {
    if (len < defs::FRAME_MIN_LEN || data[0] != defs::FRAME_START)
        return Error::MalformedFrame;
    if (data[1] != len - 1)
        return Error::MalformedFrame;
    if (frame_checksum(data + 1, len - 2) != data[len - 1])
        return Error::MalformedFrame;

    const auto type = static_cast<defs::FrameType>(data[9]);
    switch (type) {
    case defs::FrameType::Set:
    case defs::FrameType::Request:
    case defs::FrameType::Response:
    case defs::FrameType::AbnormalReport:
        break;
    default:
        return Error::UnknownFrameType;
    }

    out.type = type;
    out.device_type = data[2];
    out.protocol_version = data[8];
    out.body.assign(data + defs::FRAME_HEADER_LEN, data + len - 1);
    return Error::Ok;
}

Command to_command(const StatusSet& set) {
    return std::visit([](const auto& s) -> Command { return s; }, set);
}

defs::FrameType frame_type(const Command& cmd) {
    return std::visit(overloaded{
                          [](const GeneralSet&) { return defs::FrameType::Set; },
                          [](const SubProtocolSet&) { return defs::FrameType::Set; },
                          [](const NewProtocolSet&) { return defs::FrameType::Set; },
                          [](const auto&) { return defs::FrameType::Request; },
                      },
                      cmd);
}

const char* command_name(const Command& cmd) {
    return std::visit(overloaded{
                          [](const Query&) { return "Query"; },
                          [](const PowerQuery&) { return "PowerQuery"; },
                          [](const NewProtocolQuery&) { return "NewProtocolQuery"; },
                          [](const SubProtocolQuery&) { return "SubProtocolQuery"; },
                          [](const SwitchDisplay&) { return "SwitchDisplay"; },
                          [](const GeneralSet&) { return "GeneralSet"; },
                          [](const SubProtocolSet&) { return "SubProtocolSet"; },
                          [](const NewProtocolSet&) { return "NewProtocolSet"; },
                      },
                      cmd);
}

Bytes command_body(const Command& cmd, uint8_t message_id) {
    return std::visit(overloaded{
                          [&](const Query&) { return query_body(message_id); },
                          [](const PowerQuery&) { return power_query_body(); },
                          [&](const NewProtocolQuery&) { return new_protocol_query_body(message_id); },
                          [](const SubProtocolQuery& q) { return sub_protocol_body(q.query_type, {}); },
                          [&](const SwitchDisplay&) { return switch_display_body(message_id); },
                          [&](const GeneralSet& s) { return general_set_body(s, message_id); },
                          [](const SubProtocolSet& s) {
                              return sub_protocol_body(defs::SUB_PROTOCOL_SET, sub_protocol_set_payload(s));
                          },
                          [&](const NewProtocolSet& s) { return new_protocol_set_body(s, message_id); },
                      },
                      cmd);
}

Bytes encode(const Command& cmd, uint8_t protocol_version, uint8_t message_id) {
    const Bytes body = command_body(cmd, message_id);

    Bytes frame = {defs::FRAME_START,
                   static_cast<uint8_t>(defs::FRAME_HEADER_LEN + body.size()),
                   defs::DEVICE_TYPE_AIR_CONDITIONER,
                   0x00,
                   0x00,
                   0x00,
                   0x00,
                   0x00,
                   protocol_version,
                   static_cast<uint8_t>(frame_type(cmd))};
    frame.insert(frame.end(), body.begin(), body.end());
    frame.push_back(frame_checksum(frame.data() + 1, frame.size() - 1));
    return frame;
}

} // namespace messages
} // namespace midea
