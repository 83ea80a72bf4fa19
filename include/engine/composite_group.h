///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file composite_group.h
 * @brief Accumulates the initial-position and world-velocity composites
 *
 * Members of the two composites are never written one by one. During a pass
 * every member row is folded into its composite, and the composites are then
 * written as single transactions: the position first, the velocity after the
 * settle delay.
 *
 * Rules applied by Finalize():
 * - on-ground set     -> airspeed forced to 0
 * - on-ground set     -> world velocity forced to (0, 0, 0)
 * - velocity is only eligible when X, Y and Z were all supplied
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "sim/data_types.h"

#include <string>
#include <vector>

namespace SimPreset {

struct ConfigurationItem;

enum class CompositeMember {
    None,
    Latitude,
    Longitude,
    Altitude,
    Pitch,
    Bank,
    Heading,
    OnGround,
    Airspeed,
    VelocityX,
    VelocityY,
    VelocityZ
};

class CompositeGroupBuilder {
private:
    InitPosition position;
    VelocityWorld velocity;
    bool has_velocity_x;
    bool has_velocity_y;
    bool has_velocity_z;
    bool finalized;

public:
    CompositeGroupBuilder();

    /// Member for a canonical variable name (case-insensitive)
    static CompositeMember Classify(const std::string& name);

    static bool IsInitPositionMember(const std::string& name);
    static bool IsVelocityWorldMember(const std::string& name);
    static bool IsCompositeMember(const std::string& name);

    /**
     * @brief Fold @p item into its composite.
     *
     * An unparsable value records "Invalid value for ..." and leaves the
     * field untouched; the item still counts as consumed.
     *
     * @return true if the item belongs to a composite
     */
    bool Accept(const ConfigurationItem& item, std::vector<std::string>& warnings);

    void Finalize();

    /// Position differs from the all-zero default (after Finalize)
    bool HasInitPosition() const;

    /// All three velocity components were supplied
    bool HasVelocityWorld() const;

    const InitPosition& GetInitPosition() const { return position; }
    const VelocityWorld& GetVelocityWorld() const { return velocity; }
    bool IsFinalized() const { return finalized; }
};

} // namespace SimPreset
