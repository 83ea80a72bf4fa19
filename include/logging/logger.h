///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file logger.h
 * @brief Logging system wrapper for SimPreset
 *
 * Provides a structured logging interface with multiple log levels and outputs.
 * Based on spdlog (header-only mode).
 *
 * Features:
 * - Multiple log levels (TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL)
 * - Colored console output on stdout
 * - File output with automatic rotation
 * - Configurable via environment variables
 *
 * Environment Variables:
 * - SIMPRESET_LOG_LEVEL   : Set minimum log level (trace|debug|info|warn|error|critical)
 * - SIMPRESET_LOG_FILE    : Enable file logging (0|1, default: 1)
 * - SIMPRESET_LOG_CONSOLE : Enable console logging (0|1, default: 1)
 * - SIMPRESET_LOG_DIR     : Directory for log files (default: ~/.local/state/simpreset/logs)
 *
 * Usage:
 * @code
 *   #include "logging/logger.h"
 *
 *   SimPreset::Logger::Initialize();
 *
 *   LOG_INFO("Applied {} variables", count);
 *   LOG_WARN("Failed to map standard event '{}'", name);
 *
 *   SimPreset::Logger::Shutdown();
 * @endcode
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>
#include <memory>

// Forward declare spdlog types to avoid including heavy headers
namespace spdlog {
    class logger;
}

namespace SimPreset {

///////////////////////////////////////////////////////////////////////////////////////////////////
// Logger Class - Main logging interface
///////////////////////////////////////////////////////////////////////////////////////////////////

class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Sets up console and file sinks based on environment variables.
     * Safe to call more than once; later calls are no-ops.
     *
     * @return true if initialization succeeded, false otherwise
     */
    static bool Initialize();

    /**
     * @brief Flush pending messages and release all sinks.
     */
    static void Shutdown();

    /**
     * @brief Get the internal logger instance
     */
    static std::shared_ptr<spdlog::logger> GetLogger();

    /**
     * @brief Force immediate write of all buffered log messages.
     */
    static void Flush();

    static bool IsInitialized();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;

    // Helper to get log file path
    static std::string GetLogFilePath();

    // Helper to parse log level from environment variable
    static int GetLogLevelFromEnv();
};

} // namespace SimPreset

///////////////////////////////////////////////////////////////////////////////////////////////////
// Convenience Macros for Logging
///////////////////////////////////////////////////////////////////////////////////////////////////

#if defined(NDEBUG)
    // In Release builds, TRACE and DEBUG are disabled
    #define LOG_TRACE(...)    ((void)0)
    #define LOG_DEBUG(...)    ((void)0)
#else
    #define LOG_TRACE(...)    if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::GetLogger()->trace(__VA_ARGS__)
    #define LOG_DEBUG(...)    if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::GetLogger()->debug(__VA_ARGS__)
#endif

#define LOG_INFO(...)         if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)         if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)        if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)     if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::GetLogger()->critical(__VA_ARGS__)

#define LOG_FLUSH()           if(::SimPreset::Logger::IsInitialized()) ::SimPreset::Logger::Flush()
