///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file sim_session.h
 * @brief Abstract connection to a running simulator
 *
 * The engine never talks to a simulator wire protocol directly. Everything it
 * needs from the simulator goes through this interface:
 *
 * - Connect / Disconnect a named client
 * - Read and write a named variable + unit as a typed scalar or composite
 * - Write the atomic "Initial Position" and world-velocity composites
 * - Enumerate native input events and dispatch one by handle
 * - Map a numeric client event id to a simulator-named event, then transmit it
 *
 * Implementations report failures by throwing SessionError.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "sim/data_types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace SimPreset {

/// Object id addressing the user-controlled aircraft
constexpr uint32_t USER_OBJECT_ID = 0;

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message, int32_t code = 0)
        : std::runtime_error(message), code(code) {}

    int32_t Code() const { return code; }

private:
    int32_t code;
};

class SimSession {
public:
    virtual ~SimSession() = default;

    virtual void Connect(const std::string& client_name) = 0;
    virtual void Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    virtual TypedValue GetVariable(const std::string& name, const std::string& unit, DataType type) = 0;
    virtual void SetVariable(const std::string& name, const std::string& unit, const TypedValue& value) = 0;

    virtual void SetInitPosition(const InitPosition& position) = 0;
    virtual void SetVelocityWorld(const VelocityWorld& velocity) = 0;

    virtual std::vector<InputEventDescriptor> EnumerateInputEvents() = 0;
    virtual void SetInputEvent(uint64_t hash, double value) = 0;

    /**
     * @brief Associate a client event id with a simulator-named event.
     * @return 0 on success, otherwise the simulator's failure code
     */
    virtual int32_t MapClientEventToSimEvent(uint32_t event_id, const std::string& event_name) = 0;

    /// Transmit a previously mapped client event to @p object_id without payload
    virtual void TransmitClientEvent(uint32_t object_id, uint32_t event_id) = 0;
};

/// Produces a fresh, unconnected session for one pass
using SessionFactory = std::function<std::unique_ptr<SimSession>()>;

} // namespace SimPreset
