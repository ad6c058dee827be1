#pragma once

#include "imuskel/quaternion.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace imuskel {
namespace link {

// Tokens sent to a sensor stream
enum class ControlCommand {
    Start,      // begin streaming
    Calibrate,  // sensor-side calibration hint, sent with a session calibration
    Stop
};

const char* to_token(ControlCommand command);
std::optional<ControlCommand> parse_command(const std::string& token);

// Ingress payload: {"count": 12, "label": "RA", "quaternion": [w, x, y, z]}
struct SensorMessage {
    std::optional<uint64_t> count;
    std::string label;
    Quaternion quaternion = Quaternion::Identity();
};

enum class DecodeStatus {
    Sample,     // usable orientation sample
    Control,    // well-formed JSON without a quaternion (status chatter)
    Malformed   // not JSON, or a broken quaternion/label/count field
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Malformed;
    SensorMessage message;
    std::string error;      // reason, for Malformed/Control
};

// Never throws. default_label is used when the payload carries no label
DecodeResult decode_message(const std::string& payload, const std::string& default_label);

std::string encode_message(const SensorMessage& message);

} // namespace link
} // namespace imuskel
