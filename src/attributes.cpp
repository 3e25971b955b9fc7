#include <midea/attributes.hpp>

#include <cmath>
#include <cstdio>

namespace midea {

namespace {

constexpr AttrInfo ATTRIBUTES[] = {
    {Attr::PromptTone, "PROMPT_TONE", AttrKind::Bool, false},
    {Attr::Power, "POWER", AttrKind::Bool, false},
    {Attr::Mode, "MODE", AttrKind::Int, false},
    {Attr::TargetTemperature, "TARGET_TEMPERATURE", AttrKind::Number, false},
    {Attr::FanSpeed, "FAN_SPEED", AttrKind::Int, false},
    {Attr::SwingVertical, "SWING_VERTICAL", AttrKind::Bool, false},
    {Attr::SwingHorizontal, "SWING_HORIZONTAL", AttrKind::Bool, false},
    {Attr::SmartEye, "SMART_EYE", AttrKind::Bool, false},
    {Attr::Dry, "DRY", AttrKind::Bool, false},
    {Attr::AuxHeating, "AUX_HEATING", AttrKind::Bool, false},
    {Attr::BoostMode, "BOOST_MODE", AttrKind::Bool, false},
    {Attr::SleepMode, "SLEEP_MODE", AttrKind::Bool, false},
    {Attr::FrostProtect, "FROST_PROTECT", AttrKind::Bool, false},
    {Attr::ComfortMode, "COMFORT_MODE", AttrKind::Bool, false},
    {Attr::EcoMode, "ECO_MODE", AttrKind::Bool, false},
    {Attr::NaturalWind, "NATURAL_WIND", AttrKind::Bool, false},
    {Attr::TempFahrenheit, "TEMP_FAHRENHEIT", AttrKind::Bool, false},
    {Attr::ScreenDisplay, "SCREEN_DISPLAY", AttrKind::Bool, false},
    {Attr::ScreenDisplayNew, "SCREEN_DISPLAY_NEW", AttrKind::Bool, true},
    {Attr::FullDust, "FULL_DUST", AttrKind::Bool, true},
    {Attr::IndoorTemperature, "INDOOR_TEMPERATURE", AttrKind::Sensor, true},
    {Attr::OutdoorTemperature, "OUTDOOR_TEMPERATURE", AttrKind::Sensor, true},
    {Attr::IndirectWind, "INDIRECT_WIND", AttrKind::Bool, false},
    {Attr::IndoorHumidity, "INDOOR_HUMIDITY", AttrKind::Sensor, true},
    {Attr::Breezeless, "BREEZELESS", AttrKind::Bool, false},
    {Attr::TotalEnergyConsumption, "TOTAL_ENERGY_CONSUMPTION", AttrKind::Sensor, true},
    {Attr::CurrentEnergyConsumption, "CURRENT_ENERGY_CONSUMPTION", AttrKind::Sensor, true},
    {Attr::RealtimePower, "REALTIME_POWER", AttrKind::Number, true},
    {Attr::FreshAirPower, "FRESH_AIR_POWER", AttrKind::Bool, false},
    {Attr::FreshAirFanSpeed, "FRESH_AIR_FAN_SPEED", AttrKind::Int, false},
    {Attr::FreshAirMode, "FRESH_AIR_MODE", AttrKind::Text, false},
    {Attr::FreshAir1, "FRESH_AIR_1", AttrKind::Bool, true},
    {Attr::FreshAir2, "FRESH_AIR_2", AttrKind::Bool, true},
};

constexpr bool table_in_order() {
    for (size_t i = 0; i < ATTR_COUNT; ++i) {
        if (static_cast<size_t>(ATTRIBUTES[i].id) != i)
            return false;
    }
    return true;
}

static_assert(sizeof(ATTRIBUTES) / sizeof(ATTRIBUTES[0]) == ATTR_COUNT, "attribute table incomplete");
static_assert(table_in_order(), "attribute table out of order");

// persisted configurations still carry the misspelled display key
const char LEGACY_SCREEN_DISPLAY_KEY[] = "SCREEN_DISPAY";

} // namespace

const AttrInfo& attribute_info(Attr attr) {
    return ATTRIBUTES[static_cast<size_t>(attr)];
}

const char* attribute_name(Attr attr) {
    if (attr >= Attr::Count)
        return "UNKNOWN";
    return ATTRIBUTES[static_cast<size_t>(attr)].name;
}

bool attribute_from_name(const std::string& name, Attr& out) {
    if (name == LEGACY_SCREEN_DISPLAY_KEY) {
        out = Attr::ScreenDisplay;
        return true;
    }
    for (const auto& info : ATTRIBUTES) {
        if (name == info.name) {
            out = info.id;
            return true;
        }
    }
    return false;
}

bool is_truthy(const AttributeValue& value) {
    if (auto b = std::get_if<bool>(&value))
        return *b;
    if (auto i = std::get_if<int>(&value))
        return *i != 0;
    if (auto d = std::get_if<double>(&value))
        return *d != 0.0;
    if (auto s = std::get_if<std::string>(&value))
        return !s->empty();
    return false;
}

bool coerce(Attr attr, const AttributeValue& in, AttributeValue& out) {
    switch (attribute_info(attr).kind) {
    case AttrKind::Bool:
        if (std::holds_alternative<bool>(in) || std::holds_alternative<int>(in) || std::holds_alternative<double>(in)) {
            out = is_truthy(in);
            return true;
        }
        return false;
    case AttrKind::Int:
        if (auto b = std::get_if<bool>(&in)) {
            out = *b ? 1 : 0;
            return true;
        }
        if (auto i = std::get_if<int>(&in)) {
            out = *i;
            return true;
        }
        if (auto d = std::get_if<double>(&in)) {
            out = static_cast<int>(std::lround(*d));
            return true;
        }
        return false;
    case AttrKind::Number:
    case AttrKind::Sensor:
        if (auto i = std::get_if<int>(&in)) {
            out = static_cast<double>(*i);
            return true;
        }
        if (auto d = std::get_if<double>(&in)) {
            out = *d;
            return true;
        }
        if (attribute_info(attr).kind == AttrKind::Sensor && std::holds_alternative<std::monostate>(in)) {
            out = std::monostate{};
            return true;
        }
        return false;
    case AttrKind::Text:
        if (std::holds_alternative<std::string>(in) || std::holds_alternative<std::monostate>(in)) {
            out = in;
            return true;
        }
        // false or 0 clears the text
        if (!is_truthy(in)) {
            out = std::monostate{};
            return true;
        }
        return false;
    }
    return false;
}

std::string to_string(const AttributeValue& value) {
    if (auto b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    if (auto i = std::get_if<int>(&value))
        return std::to_string(*i);
    if (auto d = std::get_if<double>(&value)) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%g", *d);
        return buf;
    }
    if (auto s = std::get_if<std::string>(&value))
        return *s;
    return "none";
}

AttributeSet::AttributeSet() {
    set(Attr::PromptTone, false);
    set(Attr::Power, false);
    set(Attr::Mode, 0);
    set(Attr::TargetTemperature, 24.0);
    set(Attr::FanSpeed, 102);
    set(Attr::SwingVertical, false);
    set(Attr::SwingHorizontal, false);
    set(Attr::SmartEye, false);
    set(Attr::Dry, false);
    set(Attr::AuxHeating, false);
    set(Attr::BoostMode, false);
    set(Attr::SleepMode, false);
    set(Attr::FrostProtect, false);
    set(Attr::ComfortMode, false);
    set(Attr::EcoMode, false);
    set(Attr::NaturalWind, false);
    set(Attr::TempFahrenheit, false);
    set(Attr::ScreenDisplay, false);
    set(Attr::ScreenDisplayNew, false);
    set(Attr::FullDust, false);
    set(Attr::IndirectWind, false);
    set(Attr::Breezeless, false);
    set(Attr::RealtimePower, 0.0);
    set(Attr::FreshAirPower, false);
    set(Attr::FreshAirFanSpeed, 0);
    set(Attr::FreshAir1, false);
    set(Attr::FreshAir2, false);
    // sensors and FRESH_AIR_MODE stay empty until the appliance reports them
}

bool AttributeSet::set(Attr attr, const AttributeValue& value) {
    auto& slot = values[static_cast<size_t>(attr)];
    if (slot == value)
        return false;
    slot = value;
    return true;
}

bool AttributeSet::get_bool(Attr attr) const {
    return is_truthy(get(attr));
}

int AttributeSet::get_int(Attr attr) const {
    const auto& v = get(attr);
    if (auto i = std::get_if<int>(&v))
        return *i;
    if (auto d = std::get_if<double>(&v))
        return static_cast<int>(std::lround(*d));
    if (auto b = std::get_if<bool>(&v))
        return *b ? 1 : 0;
    return 0;
}

double AttributeSet::get_number(Attr attr) const {
    const auto& v = get(attr);
    if (auto d = std::get_if<double>(&v))
        return *d;
    if (auto i = std::get_if<int>(&v))
        return *i;
    return 0.0;
}

std::optional<double> AttributeSet::get_sensor(Attr attr) const {
    const auto& v = get(attr);
    if (auto d = std::get_if<double>(&v))
        return *d;
    if (auto i = std::get_if<int>(&v))
        return static_cast<double>(*i);
    return std::nullopt;
}

std::string AttributeSet::get_text(Attr attr) const {
    const auto& v = get(attr);
    if (auto s = std::get_if<std::string>(&v))
        return *s;
    return {};
}

} // namespace midea
