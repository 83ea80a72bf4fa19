///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file data_types.cpp
 * @brief DataType names and TypedValue factories
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "sim/data_types.h"
#include "util/string_util.h"

namespace SimPreset {

const char* DataTypeToString(DataType type) {
    switch (type) {
        case DataType::Integer32:    return "Integer32";
        case DataType::Integer64:    return "Integer64";
        case DataType::FloatSingle:  return "FloatSingle";
        case DataType::FloatDouble:  return "FloatDouble";
        case DataType::String8:      return "String8";
        case DataType::String32:     return "String32";
        case DataType::String64:     return "String64";
        case DataType::String128:    return "String128";
        case DataType::String256:    return "String256";
        case DataType::String260:    return "String260";
        case DataType::StringV:      return "StringV";
        case DataType::LatLonAlt:    return "LatLonAlt";
        case DataType::Xyz:          return "Xyz";
        case DataType::InitPosition: return "InitPosition";
    }
    return "Unknown";
}

bool DataTypeFromString(const std::string& text, DataType& out) {
    static const DataType all_types[] = {
        DataType::Integer32, DataType::Integer64, DataType::FloatSingle, DataType::FloatDouble,
        DataType::String8, DataType::String32, DataType::String64, DataType::String128,
        DataType::String256, DataType::String260, DataType::StringV,
        DataType::LatLonAlt, DataType::Xyz, DataType::InitPosition
    };

    const std::string trimmed = str_util::Trim(text);
    for (DataType candidate : all_types) {
        if (str_util::EqualsIgnoreCase(trimmed, DataTypeToString(candidate))) {
            out = candidate;
            return true;
        }
    }
    return false;
}

bool IsStringType(DataType type) {
    switch (type) {
        case DataType::String8:
        case DataType::String32:
        case DataType::String64:
        case DataType::String128:
        case DataType::String256:
        case DataType::String260:
        case DataType::StringV:
            return true;
        default:
            return false;
    }
}

TypedValue TypedValue::FromInt32(int32_t value) {
    TypedValue v;
    v.data_type = DataType::Integer32;
    v.int_value = value;
    return v;
}

TypedValue TypedValue::FromInt64(int64_t value) {
    TypedValue v;
    v.data_type = DataType::Integer64;
    v.int_value = value;
    return v;
}

TypedValue TypedValue::FromFloat(float value) {
    TypedValue v;
    v.data_type = DataType::FloatSingle;
    v.float_value = value;
    return v;
}

TypedValue TypedValue::FromDouble(double value) {
    TypedValue v;
    v.data_type = DataType::FloatDouble;
    v.float_value = value;
    return v;
}

TypedValue TypedValue::FromString(DataType string_type, const std::string& value) {
    TypedValue v;
    v.data_type = IsStringType(string_type) ? string_type : DataType::StringV;
    v.string_value = value;
    return v;
}

TypedValue TypedValue::FromLatLonAlt(const LatLonAlt& value) {
    TypedValue v;
    v.data_type = DataType::LatLonAlt;
    v.lat_lon_alt = value;
    return v;
}

TypedValue TypedValue::FromXyz(const Xyz& value) {
    TypedValue v;
    v.data_type = DataType::Xyz;
    v.xyz = value;
    return v;
}

TypedValue TypedValue::FromInitPosition(const InitPosition& value) {
    TypedValue v;
    v.data_type = DataType::InitPosition;
    v.init_position = value;
    return v;
}

} // namespace SimPreset
