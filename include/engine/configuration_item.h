///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file configuration_item.h
 * @brief One row of desired simulator state and its event mappings
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "sim/data_types.h"

#include <string>
#include <vector>

namespace SimPreset {

class VariableRegistry;

/// Rule: when the variable holds @c match_value, send @c event_name with @c parameter
struct EventMapping {
    std::string match_value;
    std::string event_name;
    double parameter = 0.0;
};

struct ConfigurationItem {
    std::string name;
    std::string unit;
    DataType data_type = DataType::FloatDouble;
    bool settable = true;
    std::string value;
    std::vector<EventMapping> event_mappings;

    bool HasValue() const;
    bool HasEventMappings() const { return !event_mappings.empty(); }
};

/**
 * @brief Canonicalize one row against the registry.
 *
 * Known variables take the registry's name, unit, type and settability.
 * Unknown ones keep the trimmed name and unit, become FloatDouble and settable.
 * Value and mappings are carried over unchanged.
 */
ConfigurationItem NormalizeItem(const ConfigurationItem& raw, const VariableRegistry& registry);

/// Drops mappings whose event name is blank
std::vector<EventMapping> CleanEventMappings(const std::vector<EventMapping>& mappings);

/**
 * @brief First mapping whose trimmed match value equals the trimmed item value,
 *        ignoring case; nullptr when none does.
 */
const EventMapping* FindMatchingMapping(const ConfigurationItem& item);

/// The eight initial-position variables, in canonical order
const std::vector<std::string>& RequiredInitPositionVariables();

/**
 * @brief Appends any missing initial-position variable with an empty value.
 * @return number of rows added
 */
size_t EnsureRequiredVariables(std::vector<ConfigurationItem>& items, const VariableRegistry& registry);

} // namespace SimPreset
