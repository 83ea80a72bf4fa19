///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file variable_registry.h
 * @brief Canonical definitions of simulation variables
 *
 * Resolves a user-typed variable name to its canonical spelling, unit, data
 * type and settability. Lookups trim the name and ignore case, so
 * " plane latitude" and "PLANE LATITUDE" resolve to the same definition.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "sim/data_types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SimPreset {

struct VariableDefinition {
    std::string name;
    std::string unit;
    DataType data_type = DataType::FloatDouble;
    bool settable = true;
};

class VariableRegistry {
private:
    std::unordered_map<std::string, VariableDefinition> definitions;  ///< keyed by folded name
    std::vector<std::string> insertion_order;

public:
    /**
     * @brief Builds the registry with the built-in table of well-known variables.
     */
    VariableRegistry();

    /// Creates a registry without the built-in table
    static VariableRegistry Empty();

    std::optional<VariableDefinition> Lookup(const std::string& name) const;

    bool Contains(const std::string& name) const;

    /**
     * @brief Adds or replaces a definition.
     * @return false if the definition name is blank
     */
    bool Register(const VariableDefinition& definition);

    size_t Size() const { return definitions.size(); }

    /// Canonical names in registration order
    const std::vector<std::string>& Names() const { return insertion_order; }

private:
    struct EmptyTag {};
    explicit VariableRegistry(EmptyTag) {}

    void RegisterBuiltIns();
};

} // namespace SimPreset
