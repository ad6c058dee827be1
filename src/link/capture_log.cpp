#include "imuskel/link/capture_log.hpp"
#include "imuskel/error.hpp"
#include "imuskel/log.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace imuskel {
namespace link {

CaptureReader::CaptureReader(const std::string& path)
    : file_(std::make_unique<std::ifstream>(path)), in_(nullptr), source_(path) {
    if (!file_->is_open()) {
        throw Error(ErrorCode::IOError, path, "Failed to open capture log");
    }
    in_ = file_.get();
}

CaptureReader::CaptureReader(std::istream& in, std::string source)
    : in_(&in), source_(std::move(source)) {}

bool CaptureReader::next(CaptureEvent& event) {
    std::string text;
    while (std::getline(*in_, text)) {
        ++line_;
        if (text.empty() || text[0] == '#') continue;

        json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object() || !j.contains("t_ms") || !j["t_ms"].is_number()) {
            ++skipped_;
            LOG_WARN("[Capture] " << source_ << ":" << line_ << ": no usable t_ms, line skipped");
            continue;
        }

        event = CaptureEvent();
        event.line = line_;
        event.t_ms = j["t_ms"].get<int64_t>();

        if (j.contains("command")) {
            auto command = j["command"].is_string() ? parse_command(j["command"].get<std::string>())
                                                    : std::nullopt;
            if (!command) {
                ++skipped_;
                LOG_WARN("[Capture] " << source_ << ":" << line_ << ": unknown command, line skipped");
                continue;
            }
            event.kind = CaptureEvent::Kind::Command;
            event.command = *command;
            return true;
        }

        event.kind = CaptureEvent::Kind::Payload;
        if (j.contains("channel") && j["channel"].is_string()) {
            event.channel = j["channel"].get<std::string>();
        } else if (j.contains("label") && j["label"].is_string()) {
            event.channel = j["label"].get<std::string>();
        }
        event.payload = text;
        return true;
    }
    return false;
}

} // namespace link
} // namespace imuskel
