///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file variable_registry.cpp
 * @brief Built-in variable table and case-insensitive lookup
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "registry/variable_registry.h"
#include "util/string_util.h"

namespace SimPreset {

VariableRegistry::VariableRegistry() {
    RegisterBuiltIns();
}

VariableRegistry VariableRegistry::Empty() {
    return VariableRegistry(EmptyTag{});
}

std::optional<VariableDefinition> VariableRegistry::Lookup(const std::string& name) const {
    auto it = definitions.find(str_util::FoldKey(name));
    if (it == definitions.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VariableRegistry::Contains(const std::string& name) const {
    return definitions.find(str_util::FoldKey(name)) != definitions.end();
}

bool VariableRegistry::Register(const VariableDefinition& definition) {
    const std::string key = str_util::FoldKey(definition.name);
    if (key.empty()) {
        return false;
    }

    VariableDefinition stored = definition;
    stored.name = str_util::Trim(definition.name);
    stored.unit = str_util::Trim(definition.unit);

    auto it = definitions.find(key);
    if (it == definitions.end()) {
        insertion_order.push_back(stored.name);
    } else {
        for (std::string& existing : insertion_order) {
            if (str_util::FoldKey(existing) == key) {
                existing = stored.name;
                break;
            }
        }
    }
    definitions[key] = stored;
    return true;
}

void VariableRegistry::RegisterBuiltIns() {
    // === POSITION & ATTITUDE (initial position group) ===
    Register({"PLANE LATITUDE", "degrees", DataType::FloatDouble, true});
    Register({"PLANE LONGITUDE", "degrees", DataType::FloatDouble, true});
    Register({"PLANE ALTITUDE", "feet", DataType::FloatDouble, true});
    Register({"PLANE PITCH DEGREES", "degrees", DataType::FloatDouble, true});
    Register({"PLANE BANK DEGREES", "degrees", DataType::FloatDouble, true});
    Register({"PLANE HEADING DEGREES TRUE", "degrees", DataType::FloatDouble, true});
    Register({"SIM ON GROUND", "Bool", DataType::Integer32, false});
    Register({"AIRSPEED TRUE", "knots", DataType::FloatDouble, true});

    // === VELOCITY (world velocity group) ===
    Register({"VELOCITY WORLD X", "feet per second", DataType::FloatDouble, true});
    Register({"VELOCITY WORLD Y", "feet per second", DataType::FloatDouble, true});
    Register({"VELOCITY WORLD Z", "feet per second", DataType::FloatDouble, true});

    // === STRUCTURED READOUTS ===
    Register({"STRUCT LATLONALT", "SIMCONNECT_DATA_LATLONALT", DataType::LatLonAlt, false});
    Register({"STRUCT WORLDVELOCITY", "SIMCONNECT_DATA_XYZ", DataType::Xyz, false});
    Register({"PLANE ALT ABOVE GROUND", "feet", DataType::FloatDouble, false});
    Register({"GROUND VELOCITY", "knots", DataType::FloatDouble, false});
    Register({"TITLE", "", DataType::String256, false});
    Register({"ATC ID", "", DataType::String64, true});

    // === ENGINE LEVERS ===
    Register({"GENERAL ENG THROTTLE LEVER POSITION:1", "percent", DataType::FloatDouble, true});
    Register({"GENERAL ENG THROTTLE LEVER POSITION:2", "percent", DataType::FloatDouble, true});
    Register({"GENERAL ENG MIXTURE LEVER POSITION:1", "percent", DataType::FloatDouble, true});
    Register({"GENERAL ENG PROPELLER LEVER POSITION:1", "percent", DataType::FloatDouble, true});

    // === FLIGHT CONTROLS ===
    Register({"FLAPS HANDLE INDEX", "number", DataType::Integer32, true});
    Register({"FLAPS HANDLE PERCENT", "percent", DataType::FloatDouble, false});
    Register({"SPOILERS HANDLE POSITION", "percent", DataType::FloatDouble, true});
    Register({"ELEVATOR TRIM POSITION", "radians", DataType::FloatDouble, true});
    Register({"GEAR HANDLE POSITION", "Bool", DataType::Integer32, true});
    Register({"BRAKE PARKING POSITION", "Bool", DataType::Integer32, false});

    // === LIGHTS ===
    Register({"LIGHT LANDING", "Bool", DataType::Integer32, false});
    Register({"LIGHT TAXI", "Bool", DataType::Integer32, false});
    Register({"LIGHT BEACON", "Bool", DataType::Integer32, false});
    Register({"LIGHT NAV", "Bool", DataType::Integer32, false});
    Register({"LIGHT STROBE", "Bool", DataType::Integer32, false});

    // === ELECTRICAL ===
    Register({"ELECTRICAL MASTER BATTERY", "Bool", DataType::Integer32, true});
    Register({"AVIONICS MASTER SWITCH", "Bool", DataType::Integer32, false});

    // === FUEL & INSTRUMENTS ===
    Register({"FUEL TANK LEFT MAIN QUANTITY", "gallons", DataType::FloatDouble, true});
    Register({"FUEL TANK RIGHT MAIN QUANTITY", "gallons", DataType::FloatDouble, true});
    Register({"FUEL TOTAL QUANTITY", "gallons", DataType::FloatDouble, false});
    Register({"KOHLSMAN SETTING MB", "millibars", DataType::FloatDouble, true});
    Register({"TRANSPONDER CODE:1", "number", DataType::Integer64, true});
}

} // namespace SimPreset
