///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file interpolation.h
 * @brief Linear parameter interpolation for percent-valued levers
 *
 * A percent item with exactly two mappings onto the same native input event
 * describes a calibration line: (match value 0, parameter 0) and
 * (match value 1, parameter 1). Any value in between is sent as the linearly
 * interpolated parameter; values outside are clamped to the nearest end.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "sim/data_types.h"

#include <string>

namespace SimPreset {

struct ConfigurationItem;
class InputEventSnapshot;

struct CalibrationPoint {
    double value = 0.0;
    double parameter = 0.0;
};

/// A resolved interpolation, ready to be dispatched natively
struct InterpolatedDispatch {
    InputEventDescriptor descriptor;
    std::string event_name;
    double parameter = 0.0;
};

class InterpolationResolver {
public:
    /// Unit text contains "percent", case-insensitive
    static bool IsPercentUnit(const std::string& unit);

    /// Invariant float with an optional trailing '%'
    static bool TryParsePercentNumber(const std::string& text, double& out);

    /**
     * @brief Parameter for @p value on the line through @p a and @p b.
     *
     * Order-independent: the points are sorted by value first. A degenerate
     * range (equal values) yields the lower point's parameter.
     */
    static double Interpolate(CalibrationPoint a, CalibrationPoint b, double value);

    /**
     * @brief Check every precondition and compute the dispatch for @p item.
     * @return false when the item does not qualify for interpolation
     */
    static bool TryResolve(const ConfigurationItem& item, const InputEventSnapshot& snapshot,
                           InterpolatedDispatch& out);
};

} // namespace SimPreset
