#pragma once

#include "imuskel/link/message.hpp"
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace imuskel {
namespace link {

// One line of a recorded capture (JSON lines):
//   {"t_ms": 120, "channel": "RA", "count": 4, "label": "RA", "quaternion": [1, 0, 0, 0]}
//   {"t_ms": 500, "command": "calibrate"}
// Sample lines keep their raw text so replay goes through the same decoder
// as a live stream. "channel" defaults to the payload label.
struct CaptureEvent {
    enum class Kind { Payload, Command };

    Kind kind = Kind::Payload;
    int64_t t_ms = 0;
    std::string channel;
    std::string payload;
    ControlCommand command = ControlCommand::Start;
    size_t line = 0;
};

class CaptureReader {
public:
    // Throws Error(IOError) when the file cannot be opened
    explicit CaptureReader(const std::string& path);
    explicit CaptureReader(std::istream& in, std::string source = "<stream>");

    // Next event; false at end of input. Lines without a usable t_ms (or
    // with an unknown command) are skipped and counted.
    bool next(CaptureEvent& event);

    size_t lines() const { return line_; }
    size_t skipped() const { return skipped_; }

private:
    std::unique_ptr<std::ifstream> file_;
    std::istream* in_;
    std::string source_;
    size_t line_ = 0;
    size_t skipped_ = 0;
};

} // namespace link
} // namespace imuskel
