///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file event_dispatcher.h
 * @brief Two-tier event resolution: native input events, then legacy client events
 *
 * An event name is first looked up in the input-event snapshot taken for the
 * current pass. A hit is dispatched natively by handle with the caller's
 * parameter. A miss falls back to a legacy client event, which is associated
 * through the ClientEventRegistry and transmitted to the user aircraft
 * without payload.
 *
 * Failures are reported as warnings; nothing thrown by the session escapes
 * EventDispatcher.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "events/client_event_registry.h"
#include "sim/data_types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace SimPreset {

class SimSession;

///////////////////////////////////////////////////////////////////////////////////////////////////
// InputEventSnapshot
///////////////////////////////////////////////////////////////////////////////////////////////////

/**
 * @brief Case-insensitive name -> descriptor map built from one enumeration.
 *
 * Blank names are discarded and the first descriptor seen for a name wins.
 * A default-constructed snapshot is "unavailable": nothing resolves in it.
 */
class InputEventSnapshot {
private:
    std::unordered_map<std::string, InputEventDescriptor> by_name;
    bool available;

public:
    InputEventSnapshot() : available(false) {}

    explicit InputEventSnapshot(const std::vector<InputEventDescriptor>& descriptors);

    /// @return the descriptor for @p name, or nullptr when not present
    const InputEventDescriptor* Find(const std::string& name) const;

    bool IsAvailable() const { return available; }
    size_t Size() const { return by_name.size(); }
};

///////////////////////////////////////////////////////////////////////////////////////////////////
// EventDispatcher
///////////////////////////////////////////////////////////////////////////////////////////////////

class EventDispatcher {
private:
    SimSession& session;
    const InputEventSnapshot& snapshot;
    ClientEventRegistry& client_events;

public:
    EventDispatcher(SimSession& session, const InputEventSnapshot& snapshot, ClientEventRegistry& client_events)
        : session(session), snapshot(snapshot), client_events(client_events) {}

    /**
     * @brief Resolve @p event_name and send it.
     *
     * Native input events receive @p parameter; legacy events are sent
     * without payload.
     *
     * @return true if the event was sent
     */
    bool Dispatch(const std::string& event_name, double parameter, std::vector<std::string>& warnings);

    /// Dispatch a known native descriptor; @p label prefixes the failure warning
    bool DispatchNative(const InputEventDescriptor& descriptor, double parameter,
                        const std::string& label, std::vector<std::string>& warnings);

    /// Associate (once) and transmit a legacy client event to the user aircraft
    bool TransmitLegacy(const std::string& event_name, std::vector<std::string>& warnings);
};

} // namespace SimPreset
