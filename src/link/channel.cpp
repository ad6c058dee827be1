#include "imuskel/link/channel.hpp"
#include "imuskel/log.hpp"
#include "imuskel/session.hpp"
#include <exception>
#include <utility>

namespace imuskel {
namespace link {

SensorChannel::SensorChannel(std::string label, CaptureSession& session)
    : label_(std::move(label)), session_(session) {}

bool SensorChannel::on_message(const std::string& payload, TimePoint now) {
    DecodeResult decoded = decode_message(payload, label_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (retired_) {
            LOG_VERBOSE("[Link:" << label_ << "] Payload after removal dropped");
            return false;
        }
        ++stats_.received;
        switch (decoded.status) {
            case DecodeStatus::Malformed:
                ++stats_.malformed;
                LOG_WARN("[Link:" << label_ << "] Dropped malformed payload (" << decoded.error
                         << "): " << payload.substr(0, 120));
                return false;
            case DecodeStatus::Control:
                ++stats_.control_messages;
                LOG_VERBOSE("[Link:" << label_ << "] Control message: " << payload.substr(0, 120));
                return false;
            case DecodeStatus::Sample:
                ++stats_.samples;
                if (decoded.message.count) {
                    track_sequence(*decoded.message.count);
                }
                break;
        }
    }

    Sample sample;
    sample.label = decoded.message.label;
    sample.quaternion = decoded.message.quaternion;
    sample.sequence = decoded.message.count.value_or(0);
    sample.arrival = now;

    try {
        session_.deliver_sample(sample);
    } catch (const std::exception& e) {
        // A listener failure must not take the stream down
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.errors;
        LOG_ERROR("[Link:" << label_ << "] Delivery failed: " << e.what());
        return false;
    }
    return true;
}

void SensorChannel::track_sequence(uint64_t count) {
    if (last_count_) {
        if (count > *last_count_ + 1) {
            ++stats_.sequence_gaps;
            stats_.missed_samples += count - *last_count_ - 1;
            LOG_VERBOSE("[Link:" << label_ << "] Sequence gap " << *last_count_ << " -> " << count);
        } else if (count <= *last_count_) {
            ++stats_.out_of_order;
        }
    }
    last_count_ = count;
}

void SensorChannel::on_open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (retired_) return;
        connected_ = true;
        last_count_.reset();
    }
    session_.connect_sensor(label_);
}

void SensorChannel::on_close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (retired_) return;
        connected_ = false;
    }
    session_.disconnect_sensor(label_);
}

void SensorChannel::on_error(const std::string& what) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.errors;
    LOG_ERROR("[Link:" << label_ << "] Transport error: " << what);
}

void SensorChannel::retire() {
    std::lock_guard<std::mutex> lock(mutex_);
    retired_ = true;
    connected_ = false;
}

bool SensorChannel::retired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_;
}

bool SensorChannel::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

ChannelStats SensorChannel::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::optional<uint64_t> SensorChannel::last_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_count_;
}

SensorHub::SensorHub(CaptureSession& session, CommandSender* sender)
    : session_(session), sender_(sender) {}

std::shared_ptr<SensorChannel> SensorHub::add_channel(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = channels_[label];
    if (!slot) {
        slot = std::make_shared<SensorChannel>(label, session_);
    }
    return slot;
}

std::shared_ptr<SensorChannel> SensorHub::channel(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(label);
    return it == channels_.end() ? nullptr : it->second;
}

void SensorHub::remove_channel(const std::string& label) {
    std::shared_ptr<SensorChannel> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(label);
        if (it == channels_.end()) return;
        removed = std::move(it->second);
        channels_.erase(it);
    }
    // Retire first so payloads from transports still holding it are dropped
    removed->retire();
    session_.remove_sensor(label);
}

std::vector<std::string> SensorHub::labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [label, ch] : channels_) {
        out.push_back(label);
    }
    return out;
}

std::vector<std::string> SensorHub::connected_labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [label, ch] : channels_) {
        if (ch->connected()) out.push_back(label);
    }
    return out;
}

size_t SensorHub::broadcast(ControlCommand command) {
    CommandSender* sender = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sender = sender_;
    }
    if (!sender) {
        LOG_WARN("[Hub] No command sender, '" << to_token(command) << "' not sent");
        return 0;
    }

    size_t sent = 0;
    for (const auto& label : connected_labels()) {
        if (sender->send(label, to_token(command))) {
            ++sent;
        } else {
            LOG_WARN("[Hub] Failed to send '" << to_token(command) << "' to " << label);
        }
    }
    LOG_INFO("[Hub] Sent '" << to_token(command) << "' to " << sent << " sensors");
    return sent;
}

uint64_t SensorHub::calibrate_all(TimePoint now) {
    broadcast(ControlCommand::Calibrate);
    return session_.start_calibration(now);
}

void SensorHub::set_sender(CommandSender* sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    sender_ = sender;
}

} // namespace link
} // namespace imuskel
