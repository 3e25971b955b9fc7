#include <midea/air_conditioner.hpp>

#include <cmath>

#include <midea/config.hpp>
#include <midea/log.hpp>

namespace midea {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

struct FreshAirTier {
    int speed;
    const char* name;
};

// ascending thresholds
constexpr FreshAirTier FRESH_AIR_TIERS[] = {
    {0, "Off"}, {20, "Silent"}, {40, "Low"}, {60, "Medium"}, {80, "High"}, {100, "Full"},
};

const char* const FRESH_AIR_OFF = "Off";

bool is_exclusive(Attr attr) {
    switch (attr) {
    case Attr::BoostMode:
    case Attr::SleepMode:
    case Attr::EcoMode:
    case Attr::FrostProtect:
    case Attr::ComfortMode:
        return true;
    default:
        return false;
    }
}

} // namespace

const char* AirConditioner::fresh_air_mode_name(int speed) {
    const char* name = FRESH_AIR_OFF;
    for (const auto& tier : FRESH_AIR_TIERS) {
        if (speed < tier.speed)
            break;
        name = tier.name;
    }
    return name;
}

bool AirConditioner::fresh_air_speed(const std::string& mode, int& speed) {
    for (const auto& tier : FRESH_AIR_TIERS) {
        if (mode == tier.name) {
            speed = tier.speed;
            return true;
        }
    }
    return false;
}

std::vector<messages::Command> AirConditioner::build_query() const {
    if (protocol_family == ProtocolFamily::SubProtocol) {
        return {messages::SubProtocolQuery{defs::SUB_PROTOCOL_QUERY_STATUS},
                messages::SubProtocolQuery{defs::SUB_PROTOCOL_QUERY_SETTINGS},
                messages::SubProtocolQuery{defs::SUB_PROTOCOL_QUERY_OUTDOOR}};
    }
    return {messages::Query{}, messages::NewProtocolQuery{}, messages::PowerQuery{}};
}

ChangeSet AirConditioner::process_incoming(const messages::Response& response) {
    ChangeSet changes;

    if (response.used_sub_protocol) {
        if (protocol_family != ProtocolFamily::SubProtocol)
            MIDEA_LOGI(MIDEA_LOG_TAG, "appliance uses the sub-protocol command family");
        protocol_family = ProtocolFamily::SubProtocol;
        if (response.sn8_flag)
            bb_sn8_flag = *response.sn8_flag;
        if (response.timer)
            bb_timer = *response.timer;
    }

    for (size_t i = 0; i < ATTR_COUNT; ++i) {
        const auto attr = static_cast<Attr>(i);
        auto value = response.get(attr);
        if (!value)
            continue;
        if (attrs.set(attr, *value))
            changes[attr] = *value;
    }

    if (response.has(Attr::FreshAirPower)) {
        const std::string mode = attrs.get_bool(Attr::FreshAirPower)
                                     ? fresh_air_mode_name(attrs.get_int(Attr::FreshAirFanSpeed))
                                     : FRESH_AIR_OFF;
        const bool mode_changed = attrs.set(Attr::FreshAirMode, mode);
        if (mode_changed || changes.count(Attr::FreshAirPower))
            changes[Attr::FreshAirMode] = mode;
    }

    const bool power = attrs.get_bool(Attr::Power);
    const auto swing_vertical = response.get(Attr::SwingVertical);
    if (!power || (swing_vertical && is_truthy(*swing_vertical))) {
        attrs.set(Attr::IndirectWind, false);
        changes[Attr::IndirectWind] = false;
    }
    if (!power) {
        attrs.set(Attr::ScreenDisplay, false);
        changes[Attr::ScreenDisplay] = false;
    }

    if (fresh_air == FreshAirVersion::Unknown) {
        if (attrs.get_bool(Attr::FreshAir1))
            fresh_air = FreshAirVersion::V1;
        else if (attrs.get_bool(Attr::FreshAir2))
            fresh_air = FreshAirVersion::V2;
        if (fresh_air != FreshAirVersion::Unknown)
            MIDEA_LOGI(MIDEA_LOG_TAG, "fresh air version %u", static_cast<unsigned>(fresh_air));
    }

    return changes;
}

messages::GeneralSet AirConditioner::make_general_set() const {
    messages::GeneralSet set;
    set.power = attrs.get_bool(Attr::Power);
    set.prompt_tone = attrs.get_bool(Attr::PromptTone);
    set.mode = attrs.get_int(Attr::Mode);
    set.target_temperature = attrs.get_number(Attr::TargetTemperature);
    set.fan_speed = attrs.get_int(Attr::FanSpeed);
    set.swing_vertical = attrs.get_bool(Attr::SwingVertical);
    set.swing_horizontal = attrs.get_bool(Attr::SwingHorizontal);
    set.boost_mode = attrs.get_bool(Attr::BoostMode);
    set.smart_eye = attrs.get_bool(Attr::SmartEye);
    set.dry = attrs.get_bool(Attr::Dry);
    set.eco_mode = attrs.get_bool(Attr::EcoMode);
    set.aux_heating = attrs.get_bool(Attr::AuxHeating);
    set.sleep_mode = attrs.get_bool(Attr::SleepMode);
    set.frost_protect = attrs.get_bool(Attr::FrostProtect);
    set.comfort_mode = attrs.get_bool(Attr::ComfortMode);
    set.natural_wind = attrs.get_bool(Attr::NaturalWind);
    set.temp_fahrenheit = attrs.get_bool(Attr::TempFahrenheit);
    return set;
}

messages::SubProtocolSet AirConditioner::make_sub_protocol_set() const {
    messages::SubProtocolSet set;
    set.power = attrs.get_bool(Attr::Power);
    set.prompt_tone = attrs.get_bool(Attr::PromptTone);
    set.aux_heating = attrs.get_bool(Attr::AuxHeating);
    set.mode = attrs.get_int(Attr::Mode);
    set.target_temperature = attrs.get_number(Attr::TargetTemperature);
    set.fan_speed = attrs.get_int(Attr::FanSpeed);
    set.boost_mode = attrs.get_bool(Attr::BoostMode);
    set.dry = attrs.get_bool(Attr::Dry);
    set.eco_mode = attrs.get_bool(Attr::EcoMode);
    set.sleep_mode = attrs.get_bool(Attr::SleepMode);
    set.sn8_flag = bb_sn8_flag;
    set.timer = bb_timer;
    return set;
}

messages::StatusSet AirConditioner::make_status_set() const {
    if (protocol_family == ProtocolFamily::SubProtocol)
        return make_sub_protocol_set();
    return make_general_set();
}

Error AirConditioner::apply_status(messages::StatusSet& set, Attr attr, const AttributeValue& value,
                                   ChangeSet& optimistic) const {
    const bool flag = is_truthy(value);

    // fields both families carry
    auto apply_common = [&](auto& s) -> bool {
        switch (attr) {
        case Attr::Power:
            s.power = flag;
            break;
        case Attr::Mode:
            s.mode = std::get<int>(value);
            s.power = s.mode != 0;
            optimistic[Attr::Power] = s.power;
            break;
        case Attr::TargetTemperature:
            s.target_temperature = std::get<double>(value);
            break;
        case Attr::FanSpeed:
            s.fan_speed = std::get<int>(value);
            break;
        case Attr::Dry:
            s.dry = flag;
            break;
        case Attr::AuxHeating:
            s.aux_heating = flag;
            break;
        case Attr::BoostMode:
        case Attr::SleepMode:
        case Attr::EcoMode:
            s.boost_mode = false;
            s.sleep_mode = false;
            s.eco_mode = false;
            optimistic[Attr::BoostMode] = false;
            optimistic[Attr::SleepMode] = false;
            optimistic[Attr::EcoMode] = false;
            if (attr == Attr::BoostMode)
                s.boost_mode = flag;
            else if (attr == Attr::SleepMode)
                s.sleep_mode = flag;
            else
                s.eco_mode = flag;
            break;
        default:
            return false;
        }
        return true;
    };

    return std::visit(overloaded{
                          [&](messages::GeneralSet& s) {
                              // frost and comfort share the exclusive group only here
                              if (is_exclusive(attr)) {
                                  s.frost_protect = false;
                                  s.comfort_mode = false;
                                  optimistic[Attr::FrostProtect] = false;
                                  optimistic[Attr::ComfortMode] = false;
                              }
                              if (apply_common(s)) {
                                  optimistic[attr] = value;
                                  return Error::Ok;
                              }
                              switch (attr) {
                              case Attr::FrostProtect:
                                  s.boost_mode = s.sleep_mode = s.eco_mode = false;
                                  optimistic[Attr::BoostMode] = optimistic[Attr::SleepMode] =
                                      optimistic[Attr::EcoMode] = false;
                                  s.frost_protect = flag;
                                  break;
                              case Attr::ComfortMode:
                                  s.boost_mode = s.sleep_mode = s.eco_mode = false;
                                  optimistic[Attr::BoostMode] = optimistic[Attr::SleepMode] =
                                      optimistic[Attr::EcoMode] = false;
                                  s.comfort_mode = flag;
                                  break;
                              case Attr::SwingVertical:
                                  s.swing_vertical = flag;
                                  break;
                              case Attr::SwingHorizontal:
                                  s.swing_horizontal = flag;
                                  break;
                              case Attr::SmartEye:
                                  s.smart_eye = flag;
                                  break;
                              case Attr::NaturalWind:
                                  s.natural_wind = flag;
                                  break;
                              case Attr::TempFahrenheit:
                                  s.temp_fahrenheit = flag;
                                  break;
                              default:
                                  return Error::UnsupportedFeature;
                              }
                              optimistic[attr] = value;
                              return Error::Ok;
                          },
                          [&](messages::SubProtocolSet& s) {
                              if (!apply_common(s))
                                  return Error::UnsupportedFeature;
                              optimistic[attr] = value;
                              return Error::Ok;
                          },
                      },
                      set);
}

std::optional<OutboundCommand> AirConditioner::build_fresh_air(bool power, int speed) const {
    messages::NewProtocolSet set;
    set.prompt_tone = attrs.get_bool(Attr::PromptTone);

    const messages::FreshAirSetting setting{power, speed};
    switch (fresh_air) {
    case FreshAirVersion::V1:
        set.fresh_air_1 = setting;
        break;
    case FreshAirVersion::V2:
        set.fresh_air_2 = setting;
        break;
    case FreshAirVersion::Unknown:
        MIDEA_LOGD(MIDEA_LOG_TAG, "fresh air version not known yet, command dropped");
        return std::nullopt;
    }

    OutboundCommand out{set, {}};
    out.optimistic[Attr::FreshAirPower] = power;
    out.optimistic[Attr::FreshAirFanSpeed] = speed;
    out.optimistic[Attr::FreshAirMode] = std::string(power ? fresh_air_mode_name(speed) : FRESH_AIR_OFF);
    return out;
}

std::optional<OutboundCommand> AirConditioner::build_one(Attr attr, const AttributeValue& requested) const {
    if (is_read_only(attr)) {
        MIDEA_LOGD(MIDEA_LOG_TAG, "%s is read-only, ignored", attribute_name(attr));
        return std::nullopt;
    }

    AttributeValue value;
    if (!coerce(attr, requested, value)) {
        MIDEA_LOGW(MIDEA_LOG_TAG, "%s: unusable value %s", attribute_name(attr), to_string(requested).c_str());
        return std::nullopt;
    }

    const bool prompt_tone = attrs.get_bool(Attr::PromptTone);
    const int fan_speed = attrs.get_int(Attr::FreshAirFanSpeed);

    switch (attr) {
    case Attr::ScreenDisplay: {
        OutboundCommand out;
        if (attrs.get_bool(Attr::ScreenDisplayNew)) {
            messages::NewProtocolSet set;
            set.screen_display = is_truthy(value);
            set.prompt_tone = prompt_tone;
            out.command = set;
        } else {
            out.command = messages::SwitchDisplay{};
        }
        out.optimistic[attr] = value;
        return out;
    }
    case Attr::IndirectWind:
    case Attr::Breezeless: {
        messages::NewProtocolSet set;
        if (attr == Attr::IndirectWind)
            set.indirect_wind = is_truthy(value);
        else
            set.breezeless = is_truthy(value);
        set.prompt_tone = prompt_tone;
        OutboundCommand out{set, {}};
        out.optimistic[attr] = value;
        return out;
    }
    case Attr::FreshAirPower:
        return build_fresh_air(is_truthy(value), fan_speed);
    case Attr::FreshAirMode: {
        int speed = 0;
        if (const auto* name = std::get_if<std::string>(&value)) {
            if (fresh_air_speed(*name, speed))
                return speed > 0 ? build_fresh_air(true, speed) : build_fresh_air(false, fan_speed);
        }
        if (!is_truthy(value))
            return build_fresh_air(false, fan_speed);
        MIDEA_LOGW(MIDEA_LOG_TAG, "unknown fresh air mode %s", to_string(value).c_str());
        return std::nullopt;
    }
    case Attr::FreshAirFanSpeed: {
        const int speed = std::get<int>(value);
        return speed > 0 ? build_fresh_air(true, speed) : build_fresh_air(false, fan_speed);
    }
    default:
        break;
    }

    messages::StatusSet set = make_status_set();
    OutboundCommand out;
    const Error err = apply_status(set, attr, value, out.optimistic);
    if (err != Error::Ok) {
        MIDEA_LOGD(MIDEA_LOG_TAG, "%s not available in this command family (%s)", attribute_name(attr),
                   to_string(err));
        return std::nullopt;
    }
    out.command = messages::to_command(set);
    return out;
}

std::vector<OutboundCommand> AirConditioner::build_command(const DesiredAttributes& desired) {
    // the tone preference rides along with every other command of this call
    for (const auto& entry : desired) {
        if (entry.first == Attr::PromptTone)
            attrs.set(Attr::PromptTone, is_truthy(entry.second));
    }

    std::vector<OutboundCommand> commands;
    for (const auto& entry : desired) {
        if (entry.first == Attr::PromptTone)
            continue;
        auto command = build_one(entry.first, entry.second);
        if (command)
            commands.push_back(std::move(*command));
    }
    return commands;
}

OutboundCommand AirConditioner::set_target_temperature(double value, int mode) {
    const double step = temperature_step();
    if (step > 0)
        value = std::round(value / step) * step;

    messages::StatusSet set = make_status_set();
    OutboundCommand out;
    std::visit(
        [&](auto& s) {
            s.target_temperature = value;
            if (mode != 0) {
                s.mode = mode;
                s.power = true;
            }
        },
        set);

    out.optimistic[Attr::TargetTemperature] = value;
    if (mode != 0) {
        out.optimistic[Attr::Mode] = mode;
        out.optimistic[Attr::Power] = true;
    }
    out.command = messages::to_command(set);
    return out;
}

OutboundCommand AirConditioner::set_swing(bool horizontal, bool vertical) {
    messages::GeneralSet set = make_general_set();
    set.swing_horizontal = horizontal;
    set.swing_vertical = vertical;

    OutboundCommand out{set, {}};
    out.optimistic[Attr::SwingHorizontal] = horizontal;
    out.optimistic[Attr::SwingVertical] = vertical;
    return out;
}

ChangeSet AirConditioner::commit(const ChangeSet& optimistic) {
    ChangeSet changes;
    for (const auto& entry : optimistic) {
        if (attrs.set(entry.first, entry.second))
            changes[entry.first] = entry.second;
    }
    return changes;
}

} // namespace midea
