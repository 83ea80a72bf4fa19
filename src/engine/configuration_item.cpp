///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file configuration_item.cpp
 * @brief Row normalization and mapping helpers
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "engine/configuration_item.h"
#include "registry/variable_registry.h"
#include "util/string_util.h"

#include <algorithm>

namespace SimPreset {

bool ConfigurationItem::HasValue() const {
    return !str_util::IsBlank(value);
}

ConfigurationItem NormalizeItem(const ConfigurationItem& raw, const VariableRegistry& registry) {
    ConfigurationItem item = raw;

    auto definition = registry.Lookup(raw.name);
    if (definition) {
        item.name = definition->name;
        item.unit = definition->unit;
        item.data_type = definition->data_type;
        item.settable = definition->settable;
        return item;
    }

    item.name = str_util::Trim(raw.name);
    item.unit = str_util::Trim(raw.unit);
    item.data_type = DataType::FloatDouble;
    item.settable = true;
    return item;
}

std::vector<EventMapping> CleanEventMappings(const std::vector<EventMapping>& mappings) {
    std::vector<EventMapping> cleaned;
    for (const auto& mapping : mappings) {
        if (!str_util::IsBlank(mapping.event_name)) {
            cleaned.push_back(mapping);
        }
    }
    return cleaned;
}

const EventMapping* FindMatchingMapping(const ConfigurationItem& item) {
    const std::string wanted = str_util::Trim(item.value);
    for (const auto& mapping : item.event_mappings) {
        if (str_util::EqualsIgnoreCase(str_util::Trim(mapping.match_value), wanted)) {
            return &mapping;
        }
    }
    return nullptr;
}

const std::vector<std::string>& RequiredInitPositionVariables() {
    static const std::vector<std::string> names = {
        "PLANE LATITUDE",
        "PLANE LONGITUDE",
        "PLANE ALTITUDE",
        "PLANE PITCH DEGREES",
        "PLANE BANK DEGREES",
        "PLANE HEADING DEGREES TRUE",
        "SIM ON GROUND",
        "AIRSPEED TRUE"
    };
    return names;
}

size_t EnsureRequiredVariables(std::vector<ConfigurationItem>& items, const VariableRegistry& registry) {
    size_t added = 0;
    for (const auto& required : RequiredInitPositionVariables()) {
        const bool present = std::any_of(items.begin(), items.end(), [&](const ConfigurationItem& item) {
            return str_util::EqualsIgnoreCase(str_util::Trim(item.name), required);
        });
        if (present) {
            continue;
        }

        ConfigurationItem row;
        row.name = required;
        items.push_back(NormalizeItem(row, registry));
        added++;
    }
    return added;
}

} // namespace SimPreset
