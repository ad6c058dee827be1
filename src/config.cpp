#include "imuskel/config.hpp"
#include "imuskel/error.hpp"
#include "imuskel/log.hpp"
#include <yaml-cpp/yaml.h>

namespace imuskel {

const char* to_string(TimerMode mode) {
    switch (mode) {
        case TimerMode::Realtime: return "realtime";
        case TimerMode::Manual:   return "manual";
        default:                  return "unknown";
    }
}

TimerMode parse_timer_mode(const std::string& name) {
    if (name == "realtime") return TimerMode::Realtime;
    if (name == "manual") return TimerMode::Manual;
    throw Error(ErrorCode::ConfigError, "Unknown timer mode '" + name + "' (expected realtime or manual)");
}

namespace {

SessionConfig parse_config(const YAML::Node& config, const std::filesystem::path& base_dir) {
    SessionConfig out;

    if (config["skeleton"]) {
        std::filesystem::path skel(config["skeleton"].as<std::string>());
        if (skel.is_relative()) {
            skel = base_dir / skel;
        }
        out.skeleton_path = skel.lexically_normal();
    }

    if (const auto calib = config["calibration"]) {
        auto& opts = out.options.calibration;
        if (calib["duration_ms"]) {
            long long ms = calib["duration_ms"].as<long long>();
            if (ms <= 0) {
                throw Error(ErrorCode::ConfigError, "calibration.duration_ms must be positive");
            }
            opts.duration = std::chrono::milliseconds(ms);
        }
        if (calib["averaging"]) {
            opts.averaging = parse_averaging_method(calib["averaging"].as<std::string>());
        }
        if (calib["degenerate_norm"]) {
            opts.degenerate_norm = calib["degenerate_norm"].as<double>();
            if (!(opts.degenerate_norm > 0.0)) {
                throw Error(ErrorCode::ConfigError, "calibration.degenerate_norm must be positive");
            }
        }
        if (calib["live_during_collection"]) {
            out.options.live_during_collection = calib["live_during_collection"].as<bool>();
        }
        if (calib["countdown_ms"]) {
            out.options.countdown_period = std::chrono::milliseconds(calib["countdown_ms"].as<long long>());
        }
    }

    if (config["timer"]) {
        out.options.timer = parse_timer_mode(config["timer"].as<std::string>());
    }

    if (const auto sensors = config["sensors"]) {
        for (const auto& item : sensors) {
            out.sensors[item.first.as<std::string>()] = item.second.as<std::string>();
        }
    }
    return out;
}

} // namespace

SessionConfig SessionConfig::load(const std::string& config_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path);
    } catch (const YAML::BadFile& e) {
        throw Error(ErrorCode::IOError, config_path, std::string("Failed to open config: ") + e.what());
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::ConfigError, config_path, std::string("Failed to load config: ") + e.what());
    }

    std::filesystem::path base_dir = std::filesystem::path(config_path).parent_path();
    if (base_dir.empty()) {
        base_dir = ".";
    }

    SessionConfig out;
    try {
        out = parse_config(config, base_dir);
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::ConfigError, config_path, std::string("Invalid config value: ") + e.what());
    }

    LOG_INFO("[Config] " << config_path << ": duration " << out.options.calibration.duration.count()
             << "ms, averaging " << to_string(out.options.calibration.averaging)
             << ", timer " << to_string(out.options.timer)
             << ", " << out.sensors.size() << " sensors");
    if (!out.skeleton_path.empty()) {
        LOG_INFO("[Config] Skeleton: " << out.skeleton_path);
    }
    return out;
}

SessionConfig SessionConfig::from_yaml_string(const std::string& yaml, const std::filesystem::path& base_dir) {
    try {
        return parse_config(YAML::Load(yaml), base_dir);
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::ConfigError, std::string("Invalid config: ") + e.what());
    }
}

} // namespace imuskel
