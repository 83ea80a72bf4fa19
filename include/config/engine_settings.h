///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file engine_settings.h
 * @brief Tunables of the apply engine
 *
 * Environment overrides (read by FromEnvironment):
 * - SIMPRESET_CLIENT_NAME     - client name announced to the simulator
 * - SIMPRESET_SETTLE_DELAY_MS - pause between position and velocity writes (0-60000)
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <string>

namespace SimPreset {

constexpr const char* DEFAULT_CLIENT_NAME = "SimPreset Config";
constexpr int DEFAULT_SETTLE_DELAY_MS = 500;
constexpr int MAX_SETTLE_DELAY_MS = 60000;

struct EngineSettings {
    std::string client_name = DEFAULT_CLIENT_NAME;
    std::chrono::milliseconds settle_delay{DEFAULT_SETTLE_DELAY_MS};

    /// Defaults overridden by any well-formed SIMPRESET_* variable
    static EngineSettings FromEnvironment();
};

} // namespace SimPreset
