#include "imuskel/link/message.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace imuskel {
namespace link {

const char* to_token(ControlCommand command) {
    switch (command) {
        case ControlCommand::Start:     return "start";
        case ControlCommand::Calibrate: return "calibrate";
        case ControlCommand::Stop:      return "stop";
        default:                        return "";
    }
}

std::optional<ControlCommand> parse_command(const std::string& token) {
    if (token == "start") return ControlCommand::Start;
    if (token == "calibrate") return ControlCommand::Calibrate;
    if (token == "stop") return ControlCommand::Stop;
    return std::nullopt;
}

namespace {

DecodeResult malformed(const std::string& reason) {
    DecodeResult result;
    result.status = DecodeStatus::Malformed;
    result.error = reason;
    return result;
}

} // namespace

DecodeResult decode_message(const std::string& payload, const std::string& default_label) {
    json j = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return malformed("invalid JSON");
    }
    if (!j.is_object()) {
        return malformed("payload is not a JSON object");
    }

    if (!j.contains("quaternion")) {
        DecodeResult result;
        result.status = DecodeStatus::Control;
        result.error = "no quaternion field";
        return result;
    }

    const json& quat = j["quaternion"];
    if (!quat.is_array() || quat.size() != 4) {
        return malformed("quaternion must be an array of 4 numbers");
    }
    double v[4];
    for (size_t i = 0; i < 4; ++i) {
        if (!quat[i].is_number()) {
            return malformed("quaternion element " + std::to_string(i) + " is not a number");
        }
        v[i] = quat[i].get<double>();
        if (!std::isfinite(v[i])) {
            return malformed("quaternion element " + std::to_string(i) + " is not finite");
        }
    }

    DecodeResult result;
    result.message.quaternion = Quaternion(v[0], v[1], v[2], v[3]);

    if (j.contains("label") && !j["label"].is_null()) {
        if (!j["label"].is_string()) {
            return malformed("label is not a string");
        }
        result.message.label = j["label"].get<std::string>();
    }
    if (result.message.label.empty()) {
        result.message.label = default_label;
    }
    if (result.message.label.empty()) {
        return malformed("no label in payload or channel");
    }

    if (j.contains("count") && !j["count"].is_null()) {
        const json& count = j["count"];
        if (count.is_number_unsigned()) {
            result.message.count = count.get<uint64_t>();
        } else if (count.is_number_integer() && count.get<int64_t>() >= 0) {
            result.message.count = static_cast<uint64_t>(count.get<int64_t>());
        } else {
            return malformed("count is not a non-negative integer");
        }
    }

    result.status = DecodeStatus::Sample;
    return result;
}

std::string encode_message(const SensorMessage& message) {
    json j;
    if (message.count) {
        j["count"] = *message.count;
    }
    j["label"] = message.label;
    const Quaternion& q = message.quaternion;
    j["quaternion"] = {q.w(), q.x(), q.y(), q.z()};
    return j.dump();
}

} // namespace link
} // namespace imuskel
