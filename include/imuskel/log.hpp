#pragma once

#include <iostream>

// ============================================================================
// Log Level Control System
// ============================================================================
// Define log levels (higher number = more verbose)
#define LOG_LEVEL_SILENT  0  // No logs
#define LOG_LEVEL_ERROR   1  // Errors only
#define LOG_LEVEL_WARN    2  // Warnings + errors
#define LOG_LEVEL_INFO    3  // Info + warnings + errors (default)
#define LOG_LEVEL_VERBOSE 4  // Per-sample details (delivery, corrections, joint updates)

// Override from the build with -DLOG_LEVEL=LOG_LEVEL_WARN
#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

// Logging macros - automatically filtered by log level
#define LOG_VERBOSE(msg) do { if(LOG_LEVEL >= LOG_LEVEL_VERBOSE) { std::cout << msg << std::endl; } } while(0)
#define LOG_INFO(msg)    do { if(LOG_LEVEL >= LOG_LEVEL_INFO)    { std::cout << msg << std::endl; } } while(0)
#define LOG_WARN(msg)    do { if(LOG_LEVEL >= LOG_LEVEL_WARN)    { std::cerr << msg << std::endl; } } while(0)
#define LOG_ERROR(msg)   do { if(LOG_LEVEL >= LOG_LEVEL_ERROR)   { std::cerr << "[ERROR] " << msg << std::endl; } } while(0)

namespace imuskel {

inline const char* getLogLevelName() {
    #if LOG_LEVEL == LOG_LEVEL_SILENT
        return "SILENT";
    #elif LOG_LEVEL == LOG_LEVEL_ERROR
        return "ERROR";
    #elif LOG_LEVEL == LOG_LEVEL_WARN
        return "WARN";
    #elif LOG_LEVEL == LOG_LEVEL_INFO
        return "INFO";
    #elif LOG_LEVEL == LOG_LEVEL_VERBOSE
        return "VERBOSE";
    #else
        return "UNKNOWN";
    #endif
}

} // namespace imuskel

// Print current log level (call once at startup)
#define LOG_PRINT_LEVEL() do { std::cout << "[Log] Level: " << imuskel::getLogLevelName() << " (" << LOG_LEVEL << ")" << std::endl; } while(0)

// Usage:
// - LOG_LEVEL_SILENT suppresses everything, including malformed-payload warnings
// - LOG_LEVEL_WARN keeps dropped payloads, degenerate samples and failed sends
// - LOG_LEVEL_INFO adds calibration progress, references and sensor connects (default)
// - LOG_LEVEL_VERBOSE adds per-sample delivery, sequence gaps and joint updates
//
// Messages carry a component tag: [Calibration], [Session], [Retargeter],
// [Timer], [Config], [Link:<label>], [Hub], [Capture], [Replay].
//
//   LOG_INFO("[Session] Sensor connected: " << label);
//   LOG_WARN("[Link:" << label << "] Dropped malformed payload (" << reason << ")");
//
// Override per target from the build:
//   target_compile_definitions(imuskel_replay PRIVATE LOG_LEVEL=LOG_LEVEL_WARN)
// ============================================================================
