#pragma once

#include "imuskel/quaternion.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <string>

namespace imuskel {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Limb labels of the reference deployment. Sensors only exist on the
// arm and leg segments; HIPS/SP/SP2/H are skeleton-only joints.
namespace limb {
constexpr const char* HIPS = "HIPS";
constexpr const char* SP   = "SP";
constexpr const char* SP2  = "SP2";
constexpr const char* H    = "H";
constexpr const char* RA   = "RA";
constexpr const char* RFA  = "RFA";
constexpr const char* LA   = "LA";
constexpr const char* LFA  = "LFA";
constexpr const char* RUL  = "RUL";
constexpr const char* RL   = "RL";
constexpr const char* LUL  = "LUL";
constexpr const char* LL   = "LL";

extern const std::array<const char*, 12> kAll;
extern const std::array<const char*, 8> kSensored;

bool is_known(const std::string& label);
} // namespace limb

// One orientation reading from a sensor stream
struct Sample {
    std::string label;
    Quaternion quaternion = Quaternion::Identity();
    uint64_t sequence = 0;   // firmware "count", monotonic per sensor
    TimePoint arrival{};
};

// Milliseconds since the session clock epoch, used for exported records
inline int64_t to_millis(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline TimePoint from_millis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

} // namespace imuskel
