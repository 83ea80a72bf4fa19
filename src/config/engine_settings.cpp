///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file engine_settings.cpp
 * @brief Environment overrides for EngineSettings
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "config/engine_settings.h"
#include "logging/logger.h"
#include "util/string_util.h"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstdlib>

namespace SimPreset {

namespace {

// Whole decimal number; anything else (empty, trailing junk, overflow) is rejected
bool ReadIntEnv(const char* name, long& out) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return false;
    }
    const std::string text = str_util::Trim(raw);
    if (text.empty()) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        LOG_WARN("Ignoring malformed {}='{}'", name, text);
        return false;
    }
    out = value;
    return true;
}

} // namespace

EngineSettings EngineSettings::FromEnvironment() {
    EngineSettings settings;

    const char* client_name = std::getenv("SIMPRESET_CLIENT_NAME");
    if (client_name && !str_util::IsBlank(client_name)) {
        settings.client_name = str_util::Trim(client_name);
    }

    long delay_ms = 0;
    if (ReadIntEnv("SIMPRESET_SETTLE_DELAY_MS", delay_ms)) {
        if (delay_ms >= 0 && delay_ms <= MAX_SETTLE_DELAY_MS) {
            settings.settle_delay = std::chrono::milliseconds(delay_ms);
        } else {
            LOG_WARN("SIMPRESET_SETTLE_DELAY_MS={} out of range [0, {}], keeping {} ms",
                     delay_ms, MAX_SETTLE_DELAY_MS, DEFAULT_SETTLE_DELAY_MS);
        }
    }

    LOG_DEBUG("Engine settings: client='{}', settle_delay={} ms",
              settings.client_name, settings.settle_delay.count());
    return settings;
}

} // namespace SimPreset
