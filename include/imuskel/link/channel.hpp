#pragma once

#include "imuskel/link/message.hpp"
#include "imuskel/sample.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace imuskel {

class CaptureSession;

namespace link {

struct ChannelStats {
    size_t received = 0;
    size_t samples = 0;
    size_t malformed = 0;
    size_t control_messages = 0;
    size_t sequence_gaps = 0;     // count jumped forward
    size_t missed_samples = 0;    // total size of those jumps
    size_t out_of_order = 0;      // count did not increase
    size_t errors = 0;            // transport errors reported by the collaborator

    // Dropped payloads (malformed or without a quaternion)
    size_t anomalies() const { return malformed + control_messages; }
};

// One sensor connection. Decodes raw payloads, tracks the firmware count
// for gap detection and delivers samples to the session. Faults stay
// local: a bad payload or a closed socket only touches this channel's
// counters and this label's session state.
class SensorChannel {
public:
    SensorChannel(std::string label, CaptureSession& session);

    // Returns true when the payload produced a sample. Never throws.
    bool on_message(const std::string& payload, TimePoint now = Clock::now());

    void on_open();
    void on_close();
    void on_error(const std::string& what);

    // Detached from its hub: later open/message events are ignored
    void retire();
    bool retired() const;

    const std::string& label() const { return label_; }
    bool connected() const;
    ChannelStats stats() const;
    std::optional<uint64_t> last_count() const;

private:
    void track_sequence(uint64_t count);

    std::string label_;
    CaptureSession& session_;
    mutable std::mutex mutex_;
    ChannelStats stats_;
    std::optional<uint64_t> last_count_;
    bool connected_ = false;
    bool retired_ = false;
};

// Transport collaborator that can push control tokens to a sensor
class CommandSender {
public:
    virtual ~CommandSender() = default;

    // Returns false when the token could not be sent (socket not open, ...)
    virtual bool send(const std::string& label, const std::string& token) = 0;
};

// Set of sensor channels feeding one session
class SensorHub {
public:
    explicit SensorHub(CaptureSession& session, CommandSender* sender = nullptr);

    // Channels are shared with the transport threads feeding them. A channel
    // removed from the hub stays valid for holders but drops further payloads.
    std::shared_ptr<SensorChannel> add_channel(const std::string& label);
    std::shared_ptr<SensorChannel> channel(const std::string& label) const;
    // Retires the channel and removes the label's live state from the session
    void remove_channel(const std::string& label);

    std::vector<std::string> labels() const;
    std::vector<std::string> connected_labels() const;

    // Sends the token to every connected channel; returns how many accepted it
    size_t broadcast(ControlCommand command);

    // "calibrate" to every connected sensor, then start the session's collection
    uint64_t calibrate_all(TimePoint now = Clock::now());

    void set_sender(CommandSender* sender);

private:
    CaptureSession& session_;
    CommandSender* sender_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SensorChannel>> channels_;
};

} // namespace link
} // namespace imuskel
