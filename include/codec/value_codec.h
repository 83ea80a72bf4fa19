///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file value_codec.h
 * @brief Text <-> TypedValue conversion for configuration values
 *
 * Values are stored and edited as free text. The codec turns that text into
 * the TypedValue a session write expects, and formats values read back from
 * the simulator into the same text form. Number handling is locale-invariant:
 * '.' is the decimal point and ',' may group thousands in the integer part.
 *
 * Parse never throws; failures come back as a ParseResult with a message
 * suitable for showing to the operator.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "sim/data_types.h"

#include <cstdint>
#include <string>

namespace SimPreset {

struct ParseResult {
    bool success = false;
    TypedValue value;
    std::string error;

    static ParseResult Ok(const TypedValue& value) {
        ParseResult r;
        r.success = true;
        r.value = value;
        return r;
    }

    static ParseResult Fail(const std::string& message) {
        ParseResult r;
        r.error = message;
        return r;
    }
};

class ValueCodec {
public:
    static ParseResult Parse(const std::string& text, DataType type);

    static std::string Format(const TypedValue& value);

    // ---- building blocks shared with the composite and interpolation code ----

    /// Invariant float grammar with optional thousands separators, NaN and Infinity
    static bool TryParseDouble(const std::string& text, double& out);

    /// "true" / "false", case-insensitive, surrounding whitespace ignored
    static bool TryParseBoolean(const std::string& text, bool& out);

    static bool TryParseInt32(const std::string& text, int32_t& out);
    static bool TryParseInt64(const std::string& text, int64_t& out);
    static bool TryParseUInt32(const std::string& text, uint32_t& out);

    /// Shortest text that parses back to the same double
    static std::string FormatDouble(double value);

private:
    static ParseResult ParseTriple(const std::string& text, DataType type);
};

} // namespace SimPreset
