///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file data_types.h
 * @brief Simulation variable data types and the tagged TypedValue
 *
 * DataType mirrors the data types a simulation session accepts when a
 * variable is read or written. TypedValue carries exactly one payload,
 * selected by its DataType tag; every consumer switches over the tag.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <string>

namespace SimPreset {

enum class DataType : int {
    Integer32,
    Integer64,
    FloatSingle,
    FloatDouble,
    String8,
    String32,
    String64,
    String128,
    String256,
    String260,
    StringV,
    LatLonAlt,
    Xyz,
    InitPosition
};

const char* DataTypeToString(DataType type);

/**
 * @brief Parses a data type name as produced by DataTypeToString (case-insensitive).
 * @return true on success; @p out is untouched otherwise
 */
bool DataTypeFromString(const std::string& text, DataType& out);

bool IsStringType(DataType type);

///////////////////////////////////////////////////////////////////////////////////////////////////
// Composite payloads
///////////////////////////////////////////////////////////////////////////////////////////////////

struct LatLonAlt {
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = 0.0;
};

struct Xyz {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * @brief Teleport payload written as one atomic "Initial Position" transaction.
 *
 * Field order and widths follow the simulator's init-position structure:
 * six doubles followed by two unsigned 32-bit words.
 */
struct InitPosition {
    double latitude = 0.0;      ///< degrees
    double longitude = 0.0;     ///< degrees
    double altitude = 0.0;      ///< feet
    double pitch = 0.0;         ///< degrees
    double bank = 0.0;          ///< degrees
    double heading = 0.0;       ///< degrees true
    uint32_t on_ground = 0;     ///< 1 = on ground, 0 = airborne
    uint32_t airspeed = 0;      ///< knots

    bool operator==(const InitPosition& other) const {
        return latitude == other.latitude && longitude == other.longitude &&
               altitude == other.altitude && pitch == other.pitch &&
               bank == other.bank && heading == other.heading &&
               on_ground == other.on_ground && airspeed == other.airspeed;
    }
    bool operator!=(const InitPosition& other) const { return !(*this == other); }

    bool IsDefault() const { return *this == InitPosition(); }
};

/// World-frame velocity, feet per second
struct VelocityWorld {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

///////////////////////////////////////////////////////////////////////////////////////////////////
// TypedValue
///////////////////////////////////////////////////////////////////////////////////////////////////

class TypedValue {
public:
    TypedValue() = default;

    static TypedValue FromInt32(int32_t value);
    static TypedValue FromInt64(int64_t value);
    static TypedValue FromFloat(float value);
    static TypedValue FromDouble(double value);
    static TypedValue FromString(DataType string_type, const std::string& value);
    static TypedValue FromLatLonAlt(const LatLonAlt& value);
    static TypedValue FromXyz(const Xyz& value);
    static TypedValue FromInitPosition(const InitPosition& value);

    DataType GetDataType() const { return data_type; }

    int32_t GetInt32() const { return static_cast<int32_t>(int_value); }
    int64_t GetInt64() const { return int_value; }
    float GetFloat() const { return static_cast<float>(float_value); }
    double GetDouble() const { return float_value; }
    const std::string& GetString() const { return string_value; }
    const LatLonAlt& GetLatLonAlt() const { return lat_lon_alt; }
    const Xyz& GetXyz() const { return xyz; }
    const InitPosition& GetInitPosition() const { return init_position; }

private:
    DataType data_type = DataType::FloatDouble;
    int64_t int_value = 0;
    double float_value = 0.0;
    std::string string_value;
    LatLonAlt lat_lon_alt;
    Xyz xyz;
    InitPosition init_position;
};

///////////////////////////////////////////////////////////////////////////////////////////////////
// Input events
///////////////////////////////////////////////////////////////////////////////////////////////////

/// One natively enumerable input event; @c hash is the opaque dispatch handle
struct InputEventDescriptor {
    std::string name;
    uint64_t hash = 0;
};

} // namespace SimPreset
