///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file client_event_registry.h
 * @brief Process-wide cache of legacy client event ids
 *
 * Legacy (named) simulator events can only be transmitted through a numeric
 * client event id that was first associated with the event name. Ids are
 * allocated monotonically from FIRST_CLIENT_EVENT_ID and an association is
 * made at most once per name for the lifetime of the process.
 *
 * The registry is append-only: entries never expire and the counter never
 * goes back. A failed association still consumes its id; the name stays
 * unmapped and the next attempt allocates a fresh id.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace SimPreset {

constexpr uint32_t FIRST_CLIENT_EVENT_ID = 1000;

class ClientEventRegistry {
public:
    /// Performs the association; returns 0 on success or the simulator failure code
    using Associator = std::function<int32_t(uint32_t event_id, const std::string& event_name)>;

    struct Resolution {
        bool success = false;
        uint32_t event_id = 0;
        bool newly_mapped = false;   ///< true when this call performed the association
        int32_t failure_code = 0;    ///< associator result when success is false
    };

    explicit ClientEventRegistry(uint32_t first_id = FIRST_CLIENT_EVENT_ID);

    ClientEventRegistry(const ClientEventRegistry&) = delete;
    ClientEventRegistry& operator=(const ClientEventRegistry&) = delete;

    /// Registry shared by every engine in the process
    static ClientEventRegistry& Global();

    /**
     * @brief Returns the cached id for @p event_name, allocating and associating
     *        a new one on first use.
     *
     * @p associate is only invoked on a cache miss and runs without the registry
     * lock held, so it may call back into the registry. Exceptions thrown by it
     * propagate to the caller; the allocated id is consumed either way. If the
     * name was mapped by another caller while associating, the earlier id is
     * returned.
     */
    Resolution ResolveOrAllocate(const std::string& event_name, const Associator& associate);

    bool TryGet(const std::string& event_name, uint32_t& event_id) const;

    size_t Size() const;

    uint32_t NextId() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, uint32_t> ids;   ///< folded event name -> client event id
    uint32_t next_id;
};

} // namespace SimPreset
