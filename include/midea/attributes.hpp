#ifndef MIDEA_ATTRIBUTES_HPP
#define MIDEA_ATTRIBUTES_HPP

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace midea {

enum class Attr : uint8_t {
    PromptTone,
    Power,
    Mode,
    TargetTemperature,
    FanSpeed,
    SwingVertical,
    SwingHorizontal,
    SmartEye,
    Dry,
    AuxHeating,
    BoostMode,
    SleepMode,
    FrostProtect,
    ComfortMode,
    EcoMode,
    NaturalWind,
    TempFahrenheit,
    ScreenDisplay,
    ScreenDisplayNew,
    FullDust,
    IndoorTemperature,
    OutdoorTemperature,
    IndirectWind,
    IndoorHumidity,
    Breezeless,
    TotalEnergyConsumption,
    CurrentEnergyConsumption,
    RealtimePower,
    FreshAirPower,
    FreshAirFanSpeed,
    FreshAirMode,
    FreshAir1,
    FreshAir2,
    Count
};

constexpr size_t ATTR_COUNT = static_cast<size_t>(Attr::Count);

enum class AttrKind : uint8_t {
    Bool,
    Int,
    Number,
    Sensor, // optional number, empty while the appliance reports none
    Text,
};

/// std::monostate marks a sensor without a reading (or an unset text).
using AttributeValue = std::variant<std::monostate, bool, int, double, std::string>;

struct AttrInfo {
    Attr id;
    const char* name;
    AttrKind kind;
    bool read_only;
};

const AttrInfo& attribute_info(Attr attr);
const char* attribute_name(Attr attr);
bool attribute_from_name(const std::string& name, Attr& out);

inline bool is_read_only(Attr attr) {
    return attribute_info(attr).read_only;
}

bool is_truthy(const AttributeValue& value);

/// Convert @p in to the representation used for @p attr.  Returns false when
/// the value cannot represent that attribute (e.g. text for POWER).
bool coerce(Attr attr, const AttributeValue& in, AttributeValue& out);

std::string to_string(const AttributeValue& value);

/// Changed attributes of one merge or command, ordered by attribute id.
using ChangeSet = std::map<Attr, AttributeValue>;

/// Requested attribute updates in caller order.
using DesiredAttributes = std::vector<std::pair<Attr, AttributeValue>>;

class AttributeSet {
public:
    AttributeSet();

    const AttributeValue& get(Attr attr) const {
        return values[static_cast<size_t>(attr)];
    }

    /// Store @p value; returns true when the stored value changed.
    bool set(Attr attr, const AttributeValue& value);

    bool get_bool(Attr attr) const;
    int get_int(Attr attr) const;
    double get_number(Attr attr) const;
    std::optional<double> get_sensor(Attr attr) const;
    std::string get_text(Attr attr) const;

private:
    std::array<AttributeValue, ATTR_COUNT> values;
};

} // namespace midea

#endif // MIDEA_ATTRIBUTES_HPP
