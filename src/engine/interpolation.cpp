///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file interpolation.cpp
 * @brief Percent-range interpolation between two calibration mappings
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "engine/interpolation.h"
#include "codec/value_codec.h"
#include "engine/configuration_item.h"
#include "events/event_dispatcher.h"
#include "util/string_util.h"

#include <algorithm>
#include <utility>

namespace SimPreset {

bool InterpolationResolver::IsPercentUnit(const std::string& unit) {
    return !str_util::IsBlank(unit) && str_util::ContainsIgnoreCase(unit, "percent");
}

bool InterpolationResolver::TryParsePercentNumber(const std::string& text, double& out) {
    std::string t = str_util::Trim(text);
    if (t.empty()) {
        return false;
    }
    if (t.back() == '%') {
        t.pop_back();
    }
    return ValueCodec::TryParseDouble(t, out);
}

double InterpolationResolver::Interpolate(CalibrationPoint a, CalibrationPoint b, double value) {
    if (a.value > b.value) {
        std::swap(a, b);
    }

    const double clamped = std::max(a.value, std::min(b.value, value));
    const double span = b.value - a.value;
    const double ratio = (span == 0.0) ? 0.0 : (clamped - a.value) / span;
    return a.parameter + (b.parameter - a.parameter) * ratio;
}

bool InterpolationResolver::TryResolve(const ConfigurationItem& item, const InputEventSnapshot& snapshot,
                                       InterpolatedDispatch& out) {
    if (!snapshot.IsAvailable() || item.event_mappings.size() != 2 || !IsPercentUnit(item.unit)) {
        return false;
    }

    const EventMapping& m0 = item.event_mappings[0];
    const EventMapping& m1 = item.event_mappings[1];

    // Both calibration points must drive the same input event
    const std::string ev0 = str_util::Trim(m0.event_name);
    const std::string ev1 = str_util::Trim(m1.event_name);
    if (ev0.empty() || !str_util::EqualsIgnoreCase(ev0, ev1)) {
        return false;
    }

    const InputEventDescriptor* descriptor = snapshot.Find(ev0);
    if (!descriptor) {
        return false;
    }

    double v0 = 0.0, v1 = 0.0, v = 0.0;
    if (!TryParsePercentNumber(m0.match_value, v0) ||
        !TryParsePercentNumber(m1.match_value, v1) ||
        !TryParsePercentNumber(item.value, v)) {
        return false;
    }

    out.descriptor = *descriptor;
    out.event_name = ev0;
    out.parameter = Interpolate({v0, m0.parameter}, {v1, m1.parameter}, v);
    return true;
}

} // namespace SimPreset
