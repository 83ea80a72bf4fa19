///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file logger.cpp
 * @brief Implementation of the logging system for SimPreset
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "logging/logger.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace SimPreset {

// Static member initialization
std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

///////////////////////////////////////////////////////////////////////////////////////////////////
// Helper Functions
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string Logger::GetLogFilePath() {
    std::filesystem::path log_dir;

    const char* configured = std::getenv("SIMPRESET_LOG_DIR");
    if (configured && *configured) {
        log_dir = configured;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || !*home) {
            // Fallback to current directory
            return "simpreset.log";
        }
        log_dir = std::filesystem::path(home) / ".local" / "state" / "simpreset" / "logs";
    }

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        return "simpreset.log";
    }

    // Generate filename with current date: simpreset_YYYYMMDD.log
    std::time_t now = std::time(nullptr);
    std::tm timeInfo;
    localtime_r(&now, &timeInfo);

    std::ostringstream filename;
    filename << "simpreset_" << std::put_time(&timeInfo, "%Y%m%d") << ".log";

    return (log_dir / filename.str()).string();
}

int Logger::GetLogLevelFromEnv() {
    const char* value = std::getenv("SIMPRESET_LOG_LEVEL");

    if (value && *value) {
        std::string level(value);

        // Convert to lowercase for comparison
        for (char& c : level) {
            c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        }

        if (level == "trace")    return SPDLOG_LEVEL_TRACE;
        if (level == "debug")    return SPDLOG_LEVEL_DEBUG;
        if (level == "info")     return SPDLOG_LEVEL_INFO;
        if (level == "warn")     return SPDLOG_LEVEL_WARN;
        if (level == "error")    return SPDLOG_LEVEL_ERROR;
        if (level == "critical") return SPDLOG_LEVEL_CRITICAL;
    }

    // Default level: INFO in release, DEBUG in debug builds
    #if defined(NDEBUG)
        return SPDLOG_LEVEL_INFO;
    #else
        return SPDLOG_LEVEL_DEBUG;
    #endif
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Public Interface
///////////////////////////////////////////////////////////////////////////////////////////////////

bool Logger::Initialize() {
    if (s_initialized) {
        return true;  // Already initialized
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        const char* enableFile = std::getenv("SIMPRESET_LOG_FILE");
        const char* enableConsole = std::getenv("SIMPRESET_LOG_CONSOLE");

        bool useFile = (!enableFile || strlen(enableFile) == 0) || (atoi(enableFile) != 0);  // Default: enabled
        bool useConsole = (!enableConsole || strlen(enableConsole) == 0) || (atoi(enableConsole) != 0);  // Default: enabled

        if (useConsole) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [thread %t] %v");
            sinks.push_back(console_sink);
        }

        // Add rotating file sink (5MB max, 3 files kept)
        if (useFile) {
            std::string logFile = GetLogFilePath();
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile,
                1024 * 1024 * 5,  // 5 MB max size
                3                 // Keep 3 rotated files
            );
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");
            sinks.push_back(file_sink);
        }

        s_logger = std::make_shared<spdlog::logger>("SimPreset", sinks.begin(), sinks.end());
        s_logger->set_level(static_cast<spdlog::level::level_enum>(GetLogLevelFromEnv()));

        s_logger->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        spdlog::set_default_logger(s_logger);

        s_initialized = true;

        LOG_INFO("Logging system initialized successfully");
        LOG_DEBUG("Log level: {}", spdlog::level::to_string_view(s_logger->level()));

        return true;
    }
    catch (const std::exception& ex) {
        // Fallback to stderr if logger initialization fails
        std::cerr << "Failed to initialize logging system: " << ex.what() << std::endl;
        s_logger = nullptr;
        return false;
    }
}

void Logger::Shutdown() {
    if (s_initialized && s_logger) {
        LOG_INFO("Shutting down logging system");
        s_logger->flush();
        spdlog::shutdown();
        s_logger = nullptr;
        s_initialized = false;
    }
}

std::shared_ptr<spdlog::logger> Logger::GetLogger() {
    return s_logger;
}

void Logger::Flush() {
    if (s_initialized && s_logger) {
        s_logger->flush();
    }
}

bool Logger::IsInitialized() {
    return s_initialized;
}

} // namespace SimPreset
