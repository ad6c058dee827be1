#pragma once

#include "imuskel/calibration.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace imuskel {

enum class TimerMode {
    Realtime,  // worker thread fires the calibration deadline
    Manual     // owner drives the clock through CaptureSession::advance()
};

const char* to_string(TimerMode mode);
TimerMode parse_timer_mode(const std::string& name);

struct SessionOptions {
    CalibrationOptions calibration;
    TimerMode timer = TimerMode::Realtime;
    // Keep correcting and retargeting with the current reference table
    // while a new collection runs
    bool live_during_collection = false;
    // Countdown log period in realtime mode, 0 disables it
    std::chrono::milliseconds countdown_period{1000};
};

// Session config file
//
//   skeleton: skeleton/ybot.yaml      # relative to this file
//   calibration:
//     duration_ms: 30000
//     averaging: aligned_mean         # aligned_mean | eigenvector
//     degenerate_norm: 1.0e-6
//     live_during_collection: false
//     countdown_ms: 1000              # realtime countdown log, 0 disables
//   timer: realtime                   # realtime | manual
//   sensors:                          # label -> host, consumed by the transport
//     RA: 10.46.97.85
struct SessionConfig {
    SessionOptions options;
    std::filesystem::path skeleton_path;   // empty: built-in biped
    std::map<std::string, std::string> sensors;

    // Throws Error(ConfigError) on malformed input, Error(IOError) when missing
    static SessionConfig load(const std::string& config_path);
    static SessionConfig from_yaml_string(const std::string& yaml, const std::filesystem::path& base_dir = ".");
};

} // namespace imuskel
