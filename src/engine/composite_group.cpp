///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file composite_group.cpp
 * @brief Initial-position / world-velocity accumulation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "engine/composite_group.h"
#include "codec/value_codec.h"
#include "engine/configuration_item.h"
#include "util/string_util.h"

#include <cmath>
#include <limits>
#include <unordered_map>

namespace SimPreset {

namespace {

const std::unordered_map<std::string, CompositeMember>& MemberTable() {
    static const std::unordered_map<std::string, CompositeMember> table = {
        {"PLANE LATITUDE",             CompositeMember::Latitude},
        {"PLANE LONGITUDE",            CompositeMember::Longitude},
        {"PLANE ALTITUDE",             CompositeMember::Altitude},
        {"PLANE PITCH DEGREES",        CompositeMember::Pitch},
        {"PLANE BANK DEGREES",         CompositeMember::Bank},
        {"PLANE HEADING DEGREES TRUE", CompositeMember::Heading},
        {"SIM ON GROUND",              CompositeMember::OnGround},
        {"AIRSPEED TRUE",              CompositeMember::Airspeed},
        {"VELOCITY WORLD X",           CompositeMember::VelocityX},
        {"VELOCITY WORLD Y",           CompositeMember::VelocityY},
        {"VELOCITY WORLD Z",           CompositeMember::VelocityZ},
    };
    return table;
}

// Boolean token, unsigned word, or any signed integer (non-zero -> 1)
bool ParseOnGround(const std::string& text, uint32_t& out) {
    bool flag = false;
    if (ValueCodec::TryParseBoolean(text, flag)) {
        out = flag ? 1u : 0u;
        return true;
    }
    uint32_t word = 0;
    if (ValueCodec::TryParseUInt32(text, word)) {
        out = word;
        return true;
    }
    int32_t signed_value = 0;
    if (ValueCodec::TryParseInt32(text, signed_value)) {
        out = signed_value != 0 ? 1u : 0u;
        return true;
    }
    return false;
}

// Whole knots; negative values clamp to 0, fractional values round to nearest
bool ParseAirspeed(const std::string& text, uint32_t& out) {
    uint32_t word = 0;
    if (ValueCodec::TryParseUInt32(text, word)) {
        out = word;
        return true;
    }
    int32_t signed_value = 0;
    if (ValueCodec::TryParseInt32(text, signed_value)) {
        out = signed_value > 0 ? static_cast<uint32_t>(signed_value) : 0u;
        return true;
    }
    double real = 0.0;
    if (ValueCodec::TryParseDouble(text, real) && !std::isnan(real)) {
        const double rounded = std::round(real);
        if (rounded <= 0.0) {
            out = 0;
        } else if (rounded >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            out = std::numeric_limits<uint32_t>::max();
        } else {
            out = static_cast<uint32_t>(rounded);
        }
        return true;
    }
    return false;
}

} // namespace

CompositeGroupBuilder::CompositeGroupBuilder()
    : has_velocity_x(false), has_velocity_y(false), has_velocity_z(false), finalized(false) {}

CompositeMember CompositeGroupBuilder::Classify(const std::string& name) {
    const auto& table = MemberTable();
    auto it = table.find(str_util::FoldKey(name));
    return it == table.end() ? CompositeMember::None : it->second;
}

bool CompositeGroupBuilder::IsInitPositionMember(const std::string& name) {
    switch (Classify(name)) {
        case CompositeMember::Latitude:
        case CompositeMember::Longitude:
        case CompositeMember::Altitude:
        case CompositeMember::Pitch:
        case CompositeMember::Bank:
        case CompositeMember::Heading:
        case CompositeMember::OnGround:
        case CompositeMember::Airspeed:
            return true;
        default:
            return false;
    }
}

bool CompositeGroupBuilder::IsVelocityWorldMember(const std::string& name) {
    switch (Classify(name)) {
        case CompositeMember::VelocityX:
        case CompositeMember::VelocityY:
        case CompositeMember::VelocityZ:
            return true;
        default:
            return false;
    }
}

bool CompositeGroupBuilder::IsCompositeMember(const std::string& name) {
    return Classify(name) != CompositeMember::None;
}

bool CompositeGroupBuilder::Accept(const ConfigurationItem& item, std::vector<std::string>& warnings) {
    const CompositeMember member = Classify(item.name);
    if (member == CompositeMember::None) {
        return false;
    }

    const std::string text = str_util::Trim(item.value);
    double real = 0.0;
    bool parsed = false;

    switch (member) {
        case CompositeMember::Latitude:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) position.latitude = real;
            break;
        case CompositeMember::Longitude:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) position.longitude = real;
            break;
        case CompositeMember::Altitude:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) position.altitude = real;
            break;
        case CompositeMember::Pitch:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) position.pitch = real;
            break;
        case CompositeMember::Bank:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) position.bank = real;
            break;
        case CompositeMember::Heading:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) position.heading = real;
            break;
        case CompositeMember::OnGround:
            parsed = ParseOnGround(text, position.on_ground);
            break;
        case CompositeMember::Airspeed:
            parsed = ParseAirspeed(text, position.airspeed);
            break;
        case CompositeMember::VelocityX:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) {
                velocity.x = real;
                has_velocity_x = true;
            }
            break;
        case CompositeMember::VelocityY:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) {
                velocity.y = real;
                has_velocity_y = true;
            }
            break;
        case CompositeMember::VelocityZ:
            if ((parsed = ValueCodec::TryParseDouble(text, real))) {
                velocity.z = real;
                has_velocity_z = true;
            }
            break;
        case CompositeMember::None:
            break;
    }

    if (!parsed) {
        warnings.push_back("Invalid value for '" + item.name + "': '" + item.value + "'.");
    }
    return true;
}

void CompositeGroupBuilder::Finalize() {
    if (position.on_ground != 0) {
        position.airspeed = 0;
        velocity = VelocityWorld();
    }
    finalized = true;
}

bool CompositeGroupBuilder::HasInitPosition() const {
    return !position.IsDefault();
}

bool CompositeGroupBuilder::HasVelocityWorld() const {
    return has_velocity_x && has_velocity_y && has_velocity_z;
}

} // namespace SimPreset
