#include <midea/response.hpp>

#include <midea/endian.hpp>
#include <midea/log.hpp>

namespace midea {
namespace messages {

namespace {

const size_t STATUS_MIN_LEN = 15;
const size_t NOTIFY_MIN_LEN = 14;
const size_t SENSOR_MIN_LEN = 18;
const size_t POWER_MIN_LEN = 19;
const uint8_t POWER_REPORT_MARKER = 0x44;
const uint8_t NO_READING = 0xFF;

// Sensor byte is (t * 2 + 50); the tenths digit arrives separately.
std::optional<double> temperature(uint8_t raw, int decimal) {
    if (raw == NO_READING)
        return std::nullopt;
    const int whole = static_cast<int>((raw - 50) / 2.0);
    const double tenths = decimal * 0.1;
    return raw > 49 ? whole + tenths : whole - tenths;
}

void set_sensor(Response& out, Attr attr, std::optional<double> value) {
    if (value)
        out.set(attr, *value);
}

int bcd(uint8_t b) {
    return (b >> 4) * 10 + (b & 0x0F);
}

double consumption(uint8_t method, const uint8_t* p) {
    if (method == 1)
        return (bcd(p[0]) * 1000000.0 + bcd(p[1]) * 10000.0 + bcd(p[2]) * 100.0 + bcd(p[3])) / 100.0;
    const uint32_t raw = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                         (static_cast<uint32_t>(p[2]) << 8) | p[3];
    return method == 2 ? raw / 1000.0 : raw / 100.0;
}

double power(uint8_t method, const uint8_t* p) {
    if (method == 1)
        return (bcd(p[0]) * 10000.0 + bcd(p[1]) * 100.0 + bcd(p[2])) / 10.0;
    const uint32_t raw = (static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 8) | p[2];
    return raw / 10.0;
}

void parse_common_controls(const Bytes& b, Response& out) {
    out.set(Attr::Mode, (b[2] & 0xE0) >> 5);
    out.set(Attr::FanSpeed, b[3] & 0x7F);
    out.set(Attr::SwingVertical, (b[7] & 0x0C) > 0);
    out.set(Attr::SwingHorizontal, (b[7] & 0x03) > 0);
}

Error parse_status(const Bytes& b, Response& out) {
    if (b.size() < STATUS_MIN_LEN)
        return Error::MalformedFrame;

    const bool power_on = (b[1] & 0x01) > 0;
    out.set(Attr::Power, power_on);
    parse_common_controls(b, out);

    double target = (b[2] & 0x0F) + 16.0;
    if (b[2] & 0x10)
        target += 0.5;
    out.set(Attr::TargetTemperature, target);

    out.set(Attr::BoostMode, (b[8] & 0x20) > 0 || (b[10] & 0x02) > 0);
    out.set(Attr::SmartEye, (b[8] & 0x40) > 0);
    out.set(Attr::NaturalWind, (b[9] & 0x02) > 0);
    out.set(Attr::Dry, (b[9] & 0x04) > 0);
    out.set(Attr::EcoMode, (b[9] & 0x10) > 0);
    out.set(Attr::AuxHeating, (b[9] & 0x08) > 0);
    out.set(Attr::TempFahrenheit, (b[10] & 0x04) > 0);
    out.set(Attr::SleepMode, (b[10] & 0x01) > 0);

    const bool tenths = b.size() > 20;
    set_sensor(out, Attr::IndoorTemperature, temperature(b[11], tenths ? (b[15] & 0x0F) : 0));
    set_sensor(out, Attr::OutdoorTemperature, temperature(b[12], tenths ? ((b[15] & 0xF0) >> 4) : 0));

    out.set(Attr::FullDust, (b[13] & 0x20) > 0);
    out.set(Attr::ScreenDisplay, ((b[14] >> 4) & 0x07) != 0x07 && power_on);

    if (b.size() >= 22)
        out.set(Attr::FrostProtect, (b[21] & 0x80) > 0);
    if (b.size() >= 23)
        out.set(Attr::ComfortMode, (b[22] & 0x01) > 0);
    return Error::Ok;
}

Error parse_status_notify(const Bytes& b, Response& out) {
    if (b.size() < NOTIFY_MIN_LEN)
        return Error::MalformedFrame;

    out.set(Attr::Power, (b[1] & 0x01) > 0);
    double target = ((b[1] & 0x3E) >> 1) - 4 + 16.0;
    if (b[1] & 0x40)
        target += 0.5;
    out.set(Attr::TargetTemperature, target);
    parse_common_controls(b, out);

    out.set(Attr::BoostMode, (b[8] & 0x20) > 0 || (b[10] & 0x02) > 0);
    out.set(Attr::SmartEye, (b[9] & 0x01) > 0);
    out.set(Attr::NaturalWind, (b[9] & 0x40) > 0);
    out.set(Attr::Dry, (b[9] & 0x04) > 0);
    out.set(Attr::EcoMode, (b[9] & 0x10) > 0);
    out.set(Attr::AuxHeating, (b[9] & 0x08) > 0);
    out.set(Attr::SleepMode, (b[10] & 0x01) > 0);
    out.set(Attr::TempFahrenheit, (b[10] & 0x04) > 0);
    out.set(Attr::FullDust, (b[13] & 0x20) > 0);
    if (b.size() > 16)
        out.set(Attr::ComfortMode, (b[14] & 0x01) > 0);
    return Error::Ok;
}

Error parse_sensor_notify(const Bytes& b, Response& out) {
    if (b.size() < SENSOR_MIN_LEN)
        return Error::MalformedFrame;

    const bool tenths = b.size() > 18;
    set_sensor(out, Attr::IndoorTemperature, temperature(b[13], tenths ? (b[18] & 0x0F) : 0));
    set_sensor(out, Attr::OutdoorTemperature, temperature(b[14], tenths ? ((b[18] & 0xF0) >> 4) : 0));
    if (b[17] != 0)
        out.set(Attr::IndoorHumidity, static_cast<double>(b[17]));
    return Error::Ok;
}

// B0/B1/B5: count followed by (tag LE16, [result], length, value...) packs
Error parse_new_protocol(const Bytes& b, Response& out) {
    if (b.size() < 2)
        return Error::MalformedFrame;

    const size_t pack_len = b[0] == defs::BODY_CAPABILITIES ? 4 : 5;
    const uint8_t count = b[1];
    size_t pos = 2;

    for (uint8_t i = 0; i < count; ++i) {
        if (pos + pack_len > b.size())
            break;
        const uint16_t tag = load_le16(&b[pos]);
        if (pack_len == 5)
            ++pos;
        const uint8_t length = b[pos + 2];
        const size_t value_at = pos + 3;
        pos = value_at + length;
        if (length == 0 || value_at + length > b.size())
            continue;

        const uint8_t v0 = b[value_at];
        switch (tag) {
        case defs::tags::INDIRECT_WIND:
            out.set(Attr::IndirectWind, v0 == 0x02);
            break;
        case defs::tags::INDOOR_HUMIDITY:
            out.set(Attr::IndoorHumidity, static_cast<double>(v0));
            break;
        case defs::tags::BREEZELESS:
            out.set(Attr::Breezeless, v0 == 0x01);
            break;
        case defs::tags::SCREEN_DISPLAY:
            out.set(Attr::ScreenDisplayNew, true);
            out.set(Attr::ScreenDisplay, v0 > 0);
            break;
        case defs::tags::FRESH_AIR_1:
            out.set(Attr::FreshAir1, true);
            out.set(Attr::FreshAirPower, v0 == 0x02);
            if (length > 1)
                out.set(Attr::FreshAirFanSpeed, static_cast<int>(b[value_at + 1]));
            break;
        case defs::tags::FRESH_AIR_2:
            out.set(Attr::FreshAir2, true);
            out.set(Attr::FreshAirPower, v0 > 0);
            if (length > 1)
                out.set(Attr::FreshAirFanSpeed, static_cast<int>(b[value_at + 1]));
            break;
        default:
            break;
        }
    }
    return Error::Ok;
}

Error parse_power(const Bytes& b, Response& out, uint8_t method) {
    if (b.size() < POWER_MIN_LEN)
        return Error::MalformedFrame;
    if (b[3] != POWER_REPORT_MARKER)
        return Error::Ok;

    out.set(Attr::TotalEnergyConsumption, consumption(method, &b[4]));
    out.set(Attr::CurrentEnergyConsumption, consumption(method, &b[12]));
    out.set(Attr::RealtimePower, power(method, &b[16]));
    return Error::Ok;
}

double centi_degrees(const uint8_t* p) {
    return static_cast<int16_t>(load_le16(p)) / 100.0;
}

Error parse_sub_protocol(const Bytes& b, Response& out) {
    if (b.size() < defs::SUB_PROTOCOL_MIN_BODY_LEN)
        return Error::Ok;

    out.used_sub_protocol = true;
    const uint8_t data_type = b[defs::SUB_PROTOCOL_HEAD_LEN - 1];
    const uint8_t* sb = b.data() + defs::SUB_PROTOCOL_HEAD_LEN;
    const size_t sb_len = b.size() - defs::SUB_PROTOCOL_HEAD_LEN;

    switch (data_type) {
    case defs::SUB_PROTOCOL_SET:
    case defs::SUB_PROTOCOL_QUERY_SETTINGS: {
        out.set(Attr::Power, (sb[0] & 0x01) > 0);
        out.set(Attr::Dry, (sb[0] & 0x10) > 0);
        out.set(Attr::BoostMode, (sb[0] & 0x20) > 0);
        out.set(Attr::AuxHeating, (sb[1] & 0x40) > 0);
        out.set(Attr::SleepMode, (sb[2] & 0x80) > 0);

        int mode = 0;
        for (size_t i = 0; i < sizeof(defs::SUB_PROTOCOL_MODES); ++i) {
            if (defs::SUB_PROTOCOL_MODES[i] == sb[5] + 1) {
                mode = static_cast<int>(i);
                break;
            }
        }
        out.set(Attr::Mode, mode);
        out.set(Attr::TargetTemperature, (sb[6] - 30) / 2.0);
        out.set(Attr::FanSpeed, static_cast<int>(sb[7]));
        if (sb_len > 27) {
            out.timer = (sb[25] & 0x04) > 0;
            out.set(Attr::EcoMode, (sb[25] & 0x40) > 0);
        }
        break;
    }
    case defs::SUB_PROTOCOL_QUERY_STATUS:
        out.set(Attr::IndoorTemperature, centi_degrees(&sb[7]));
        if (sb_len > 30 && sb[30] != 0)
            out.set(Attr::IndoorHumidity, static_cast<double>(sb[30]));
        if (sb_len > 91)
            out.sn8_flag = sb[80] == 0x31;
        break;
    case defs::SUB_PROTOCOL_QUERY_OUTDOOR:
        out.set(Attr::OutdoorTemperature, centi_degrees(&sb[5]));
        break;
    default:
        MIDEA_LOGD(MIDEA_LOG_TAG, "sub-protocol data type 0x%02x ignored", data_type);
        break;
    }
    return Error::Ok;
}

} // namespace

Error decode_body(const Bytes& body, Response& out, uint8_t power_analysis_method) {
    if (body.empty())
        return Error::MalformedFrame;

    out.body_type = body[0];
    switch (body[0]) {
    case defs::BODY_STATUS:
        return parse_status(body, out);
    case defs::BODY_STATUS_NOTIFY:
        return parse_status_notify(body, out);
    case defs::BODY_SENSOR_NOTIFY:
        return parse_sensor_notify(body, out);
    case defs::BODY_NEW_PROTOCOL_SET:
    case defs::BODY_NEW_PROTOCOL_QUERY:
    case defs::BODY_CAPABILITIES:
        return parse_new_protocol(body, out);
    case defs::BODY_POWER:
        return parse_power(body, out, power_analysis_method);
    case defs::BODY_SUB_PROTOCOL_RESPONSE:
        return parse_sub_protocol(body, out);
    default:
        MIDEA_LOGD(MIDEA_LOG_TAG, "body type 0x%02x carries no attributes", body[0]);
        return Error::Ok;
    }
}

Error decode(const uint8_t* data, size_t len, Response& out, uint8_t power_analysis_method) {
    Frame frame;
    Error err = decode_frame(data, len, frame);
    if (err != Error::Ok)
        return err;

    out.frame_type = frame.type;
    out.protocol_version = frame.protocol_version;
    // abnormal reports only announce a fault; there is nothing to merge
    if (frame.type == defs::FrameType::AbnormalReport)
        return Error::Ok;
    return decode_body(frame.body, out, power_analysis_method);
}

} // namespace messages
} // namespace midea
