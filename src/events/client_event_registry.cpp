///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file client_event_registry.cpp
 * @brief Append-only name -> client event id allocation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "events/client_event_registry.h"
#include "logging/logger.h"
#include "util/string_util.h"

#include "spdlog/spdlog.h"

namespace SimPreset {

ClientEventRegistry::ClientEventRegistry(uint32_t first_id) : next_id(first_id) {}

ClientEventRegistry& ClientEventRegistry::Global() {
    static ClientEventRegistry instance;
    return instance;
}

ClientEventRegistry::Resolution ClientEventRegistry::ResolveOrAllocate(const std::string& event_name,
                                                                       const Associator& associate) {
    const std::string key = str_util::FoldKey(event_name);
    Resolution resolution;

    uint32_t event_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = ids.find(key);
        if (it != ids.end()) {
            resolution.success = true;
            resolution.event_id = it->second;
            return resolution;
        }
        event_id = next_id++;
    }
    resolution.event_id = event_id;

    // The association talks to the simulator; the lock is not held across it
    const int32_t result = associate(event_id, str_util::Trim(event_name));
    if (result != 0) {
        resolution.failure_code = result;
        LOG_DEBUG("Client event {} could not be associated with '{}' (code {})", event_id, key, result);
        return resolution;
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto inserted = ids.emplace(key, event_id);
    resolution.success = true;
    if (!inserted.second) {
        // Another caller mapped the name meanwhile; its id stays authoritative
        resolution.event_id = inserted.first->second;
        LOG_DEBUG("Client event {} for '{}' superseded by {}", event_id, key, inserted.first->second);
        return resolution;
    }
    resolution.newly_mapped = true;
    LOG_DEBUG("Mapped client event {} to '{}'", event_id, key);
    return resolution;
}

bool ClientEventRegistry::TryGet(const std::string& event_name, uint32_t& event_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = ids.find(str_util::FoldKey(event_name));
    if (it == ids.end()) {
        return false;
    }
    event_id = it->second;
    return true;
}

size_t ClientEventRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return ids.size();
}

uint32_t ClientEventRegistry::NextId() const {
    std::lock_guard<std::mutex> lock(mutex);
    return next_id;
}

} // namespace SimPreset
