///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file value_codec.cpp
 * @brief Locale-invariant parsing and formatting of configuration values
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "codec/value_codec.h"
#include "util/string_util.h"

#include "spdlog/fmt/fmt.h"

#include <cctype>
#include <cmath>
#include <limits>
#include <locale>
#include <sstream>
#include <vector>

namespace SimPreset {

namespace {

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Parses an optionally signed run of decimal digits into a magnitude.
// Fails on anything else, including embedded whitespace.
bool ParseSignedMagnitude(const std::string& text, bool& negative, uint64_t& magnitude) {
    const std::string t = str_util::Trim(text);
    size_t i = 0;
    negative = false;
    if (i < t.size() && (t[i] == '+' || t[i] == '-')) {
        negative = (t[i] == '-');
        i++;
    }
    if (i == t.size()) {
        return false;
    }

    uint64_t value = 0;
    for (; i < t.size(); ++i) {
        if (!IsDigit(t[i])) {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(t[i] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    magnitude = value;
    return true;
}

std::vector<std::string> SplitSegments(const std::string& text) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : text) {
        if (c == ',') {
            segments.push_back(str_util::Trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(str_util::Trim(current));

    // Blank segments are dropped, so "1,,2,3" counts as three values
    std::vector<std::string> result;
    for (const auto& s : segments) {
        if (!s.empty()) result.push_back(s);
    }
    return result;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// Scalar building blocks
///////////////////////////////////////////////////////////////////////////////////////////////////

bool ValueCodec::TryParseDouble(const std::string& text, double& out) {
    const std::string t = str_util::Trim(text);
    if (t.empty()) {
        return false;
    }

    size_t i = 0;
    std::string cleaned;
    bool negative = false;
    if (t[i] == '+' || t[i] == '-') {
        negative = (t[i] == '-');
        cleaned += t[i];
        i++;
    }

    const std::string rest = t.substr(i);
    if (str_util::EqualsIgnoreCase(rest, "infinity") || str_util::EqualsIgnoreCase(rest, "inf")) {
        out = negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        return true;
    }
    if (str_util::EqualsIgnoreCase(rest, "nan")) {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }

    size_t int_digits = 0;
    while (i < t.size()) {
        if (IsDigit(t[i])) {
            cleaned += t[i];
            int_digits++;
        } else if (t[i] == ',' && int_digits > 0) {
            // thousands separator
        } else {
            break;
        }
        i++;
    }

    size_t frac_digits = 0;
    if (i < t.size() && t[i] == '.') {
        cleaned += '.';
        i++;
        while (i < t.size() && IsDigit(t[i])) {
            cleaned += t[i];
            frac_digits++;
            i++;
        }
    }

    if (int_digits + frac_digits == 0) {
        return false;
    }

    if (i < t.size() && (t[i] == 'e' || t[i] == 'E')) {
        cleaned += 'e';
        i++;
        if (i < t.size() && (t[i] == '+' || t[i] == '-')) {
            cleaned += t[i];
            i++;
        }
        size_t exp_digits = 0;
        while (i < t.size() && IsDigit(t[i])) {
            cleaned += t[i];
            exp_digits++;
            i++;
        }
        if (exp_digits == 0) {
            return false;
        }
    }

    if (i != t.size()) {
        return false;
    }

    std::istringstream iss(cleaned);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    iss >> value;
    if (iss.fail()) {
        return false;
    }
    out = value;
    return true;
}

bool ValueCodec::TryParseBoolean(const std::string& text, bool& out) {
    const std::string t = str_util::Trim(text);
    if (str_util::EqualsIgnoreCase(t, "true")) {
        out = true;
        return true;
    }
    if (str_util::EqualsIgnoreCase(t, "false")) {
        out = false;
        return true;
    }
    return false;
}

bool ValueCodec::TryParseInt64(const std::string& text, int64_t& out) {
    bool negative = false;
    uint64_t magnitude = 0;
    if (!ParseSignedMagnitude(text, negative, magnitude)) {
        return false;
    }

    const uint64_t max_positive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (negative) {
        if (magnitude > max_positive + 1) return false;
        out = (magnitude == max_positive + 1) ? std::numeric_limits<int64_t>::min()
                                              : -static_cast<int64_t>(magnitude);
    } else {
        if (magnitude > max_positive) return false;
        out = static_cast<int64_t>(magnitude);
    }
    return true;
}

bool ValueCodec::TryParseInt32(const std::string& text, int32_t& out) {
    int64_t wide = 0;
    if (!TryParseInt64(text, wide)) {
        return false;
    }
    if (wide < std::numeric_limits<int32_t>::min() || wide > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    out = static_cast<int32_t>(wide);
    return true;
}

bool ValueCodec::TryParseUInt32(const std::string& text, uint32_t& out) {
    bool negative = false;
    uint64_t magnitude = 0;
    if (!ParseSignedMagnitude(text, negative, magnitude)) {
        return false;
    }
    // "-0" is the only negative spelling an unsigned parse accepts
    if (negative && magnitude != 0) {
        return false;
    }
    if (magnitude > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    out = static_cast<uint32_t>(magnitude);
    return true;
}

std::string ValueCodec::FormatDouble(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";
    return fmt::format("{}", value);
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Parse / Format
///////////////////////////////////////////////////////////////////////////////////////////////////

ParseResult ValueCodec::Parse(const std::string& text, DataType type) {
    if (str_util::IsBlank(text)) {
        return ParseResult::Fail("Value must not be empty.");
    }

    const std::string trimmed = str_util::Trim(text);

    switch (type) {
        case DataType::Integer32: {
            int32_t int_value = 0;
            if (TryParseInt32(trimmed, int_value)) {
                return ParseResult::Ok(TypedValue::FromInt32(int_value));
            }
            bool bool_value = false;
            if (TryParseBoolean(trimmed, bool_value)) {
                return ParseResult::Ok(TypedValue::FromInt32(bool_value ? 1 : 0));
            }
            return ParseResult::Fail("Expected an integer or boolean value.");
        }

        case DataType::Integer64: {
            int64_t long_value = 0;
            if (TryParseInt64(trimmed, long_value)) {
                return ParseResult::Ok(TypedValue::FromInt64(long_value));
            }
            return ParseResult::Fail("Expected a 64-bit integer value.");
        }

        case DataType::FloatSingle: {
            double wide = 0.0;
            if (TryParseDouble(trimmed, wide)) {
                return ParseResult::Ok(TypedValue::FromFloat(static_cast<float>(wide)));
            }
            return ParseResult::Fail("Expected a floating point value.");
        }

        case DataType::FloatDouble: {
            double double_value = 0.0;
            if (TryParseDouble(trimmed, double_value)) {
                return ParseResult::Ok(TypedValue::FromDouble(double_value));
            }
            return ParseResult::Fail("Expected a floating point value.");
        }

        case DataType::String8:
        case DataType::String32:
        case DataType::String64:
        case DataType::String128:
        case DataType::String256:
        case DataType::String260:
        case DataType::StringV:
            return ParseResult::Ok(TypedValue::FromString(type, trimmed));

        case DataType::LatLonAlt:
        case DataType::Xyz:
            return ParseTriple(trimmed, type);

        case DataType::InitPosition:
            break;
    }

    return ParseResult::Fail(fmt::format("Data type '{}' is not supported.", DataTypeToString(type)));
}

ParseResult ValueCodec::ParseTriple(const std::string& text, DataType type) {
    const bool is_lla = (type == DataType::LatLonAlt);
    const std::vector<std::string> segments = SplitSegments(text);

    if (segments.size() != 3) {
        return ParseResult::Fail(is_lla ? "Expected format 'latitude,longitude,altitude'."
                                        : "Expected format 'x,y,z'.");
    }

    double a = 0.0, b = 0.0, c = 0.0;
    if (!TryParseDouble(segments[0], a) || !TryParseDouble(segments[1], b) || !TryParseDouble(segments[2], c)) {
        return ParseResult::Fail(is_lla ? "Could not parse latitude, longitude, or altitude."
                                        : "Could not parse x, y, or z.");
    }

    if (is_lla) {
        LatLonAlt lla;
        lla.latitude = a;
        lla.longitude = b;
        lla.altitude = c;
        return ParseResult::Ok(TypedValue::FromLatLonAlt(lla));
    }

    Xyz xyz;
    xyz.x = a;
    xyz.y = b;
    xyz.z = c;
    return ParseResult::Ok(TypedValue::FromXyz(xyz));
}

std::string ValueCodec::Format(const TypedValue& value) {
    switch (value.GetDataType()) {
        case DataType::Integer32:
            return std::to_string(value.GetInt32());
        case DataType::Integer64:
            return std::to_string(value.GetInt64());
        case DataType::FloatSingle: {
            const float f = value.GetFloat();
            if (std::isnan(f) || std::isinf(f)) return FormatDouble(f);
            return fmt::format("{}", f);
        }
        case DataType::FloatDouble:
            return FormatDouble(value.GetDouble());
        case DataType::String8:
        case DataType::String32:
        case DataType::String64:
        case DataType::String128:
        case DataType::String256:
        case DataType::String260:
        case DataType::StringV:
            return value.GetString();
        case DataType::LatLonAlt: {
            const LatLonAlt& lla = value.GetLatLonAlt();
            return FormatDouble(lla.latitude) + "," + FormatDouble(lla.longitude) + "," + FormatDouble(lla.altitude);
        }
        case DataType::Xyz: {
            const Xyz& xyz = value.GetXyz();
            return FormatDouble(xyz.x) + "," + FormatDouble(xyz.y) + "," + FormatDouble(xyz.z);
        }
        case DataType::InitPosition: {
            const InitPosition& p = value.GetInitPosition();
            return FormatDouble(p.latitude) + "," + FormatDouble(p.longitude) + "," +
                   FormatDouble(p.altitude) + "," + FormatDouble(p.pitch) + "," +
                   FormatDouble(p.bank) + "," + FormatDouble(p.heading) + "," +
                   std::to_string(p.on_ground) + "," + std::to_string(p.airspeed);
        }
    }
    return std::string();
}

} // namespace SimPreset
