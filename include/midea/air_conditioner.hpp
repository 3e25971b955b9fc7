#ifndef MIDEA_AIR_CONDITIONER_HPP
#define MIDEA_AIR_CONDITIONER_HPP

#include <optional>
#include <string>
#include <vector>

#include <midea/attributes.hpp>
#include <midea/message.hpp>
#include <midea/response.hpp>

namespace midea {

/// Fresh air wire encoding; learned once from a status update, never reset.
enum class FreshAirVersion : uint8_t {
    Unknown = 0,
    V1 = 1,
    V2 = 2,
};

enum class ProtocolFamily : uint8_t {
    General,
    SubProtocol,
};

/// One command ready for transmission and the attribute values it implies.
/// The optimistic set is merged only after the command went out.
struct OutboundCommand {
    messages::Command command;
    ChangeSet optimistic;
};

/**
 * \brief Attribute model of one air conditioner.
 *
 * Merges decoded responses into the attribute set, applies the derived and
 * corrective rules, and turns desired attribute updates into commands of the
 * protocol family the appliance speaks.  Single writer: owned by exactly one
 * DeviceSession.
 */
class AirConditioner {
public:
    AirConditioner() = default;

    std::vector<messages::Command> build_query() const;

    ChangeSet process_incoming(const messages::Response& response);

    /// One command per desired attribute, in input order.  PROMPT_TONE only
    /// updates the stored tone preference.
    std::vector<OutboundCommand> build_command(const DesiredAttributes& desired);

    OutboundCommand set_target_temperature(double value, int mode = 0);
    OutboundCommand set_swing(bool horizontal, bool vertical);

    /// Merge the optimistic values of a transmitted command.
    ChangeSet commit(const ChangeSet& optimistic);

    const AttributeSet& attributes() const {
        return attrs;
    }

    FreshAirVersion fresh_air_version() const {
        return fresh_air;
    }

    ProtocolFamily family() const {
        return protocol_family;
    }

    bool sn8_flag() const {
        return bb_sn8_flag;
    }

    bool timer() const {
        return bb_timer;
    }

    /// Named tier for a fresh air fan speed (largest threshold not above it).
    static const char* fresh_air_mode_name(int speed);
    static bool fresh_air_speed(const std::string& mode, int& speed);

private:
    messages::StatusSet make_status_set() const;
    messages::GeneralSet make_general_set() const;
    messages::SubProtocolSet make_sub_protocol_set() const;

    Error apply_status(messages::StatusSet& set, Attr attr, const AttributeValue& value, ChangeSet& optimistic) const;
    std::optional<OutboundCommand> build_fresh_air(bool power, int speed) const;
    std::optional<OutboundCommand> build_one(Attr attr, const AttributeValue& value) const;

    AttributeSet attrs;
    FreshAirVersion fresh_air{FreshAirVersion::Unknown};
    ProtocolFamily protocol_family{ProtocolFamily::General};
    bool bb_sn8_flag{false};
    bool bb_timer{false};
};

} // namespace midea

#endif // MIDEA_AIR_CONDITIONER_HPP
