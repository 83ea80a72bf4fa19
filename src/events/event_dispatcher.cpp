///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file event_dispatcher.cpp
 * @brief Native input-event dispatch with legacy client-event fallback
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "events/event_dispatcher.h"
#include "logging/logger.h"
#include "sim/sim_session.h"
#include "util/string_util.h"

#include "spdlog/spdlog.h"

namespace SimPreset {

InputEventSnapshot::InputEventSnapshot(const std::vector<InputEventDescriptor>& descriptors)
    : available(true) {
    for (const auto& descriptor : descriptors) {
        const std::string key = str_util::FoldKey(descriptor.name);
        if (key.empty()) {
            continue;
        }
        // Ignore duplicates by keeping the first descriptor encountered for each key
        by_name.emplace(key, descriptor);
    }
}

const InputEventDescriptor* InputEventSnapshot::Find(const std::string& name) const {
    if (!available) {
        return nullptr;
    }
    auto it = by_name.find(str_util::FoldKey(name));
    return it == by_name.end() ? nullptr : &it->second;
}

bool EventDispatcher::Dispatch(const std::string& event_name, double parameter,
                               std::vector<std::string>& warnings) {
    const std::string name = str_util::Trim(event_name);
    if (name.empty()) {
        return false;
    }

    const InputEventDescriptor* descriptor = snapshot.Find(name);
    if (descriptor) {
        return DispatchNative(*descriptor, parameter, "Failed to send input event '" + name + "'", warnings);
    }

    LOG_DEBUG("Input event '{}' not enumerated, falling back to standard event", name);
    return TransmitLegacy(name, warnings);
}

bool EventDispatcher::DispatchNative(const InputEventDescriptor& descriptor, double parameter,
                                     const std::string& label, std::vector<std::string>& warnings) {
    try {
        session.SetInputEvent(descriptor.hash, parameter);
        LOG_DEBUG("Input event '{}' (hash {}) set to {}", descriptor.name, descriptor.hash, parameter);
        return true;
    }
    catch (const std::exception& e) {
        warnings.push_back(label + ": " + e.what());
        return false;
    }
}

bool EventDispatcher::TransmitLegacy(const std::string& event_name, std::vector<std::string>& warnings) {
    const std::string name = str_util::Trim(event_name);
    if (name.empty()) {
        return false;
    }

    try {
        auto resolution = client_events.ResolveOrAllocate(name,
            [this](uint32_t event_id, const std::string& sim_event_name) {
                return session.MapClientEventToSimEvent(event_id, sim_event_name);
            });

        if (!resolution.success) {
            warnings.push_back(fmt::format("Failed to map standard event '{}': HRESULT=0x{:08X}",
                                           name, static_cast<uint32_t>(resolution.failure_code)));
            return false;
        }

        session.TransmitClientEvent(USER_OBJECT_ID, resolution.event_id);
        LOG_DEBUG("Standard event '{}' transmitted as client event {}", name, resolution.event_id);
        return true;
    }
    catch (const std::exception& e) {
        warnings.push_back("Failed to transmit standard event '" + name + "': " + e.what());
        return false;
    }
}

} // namespace SimPreset
