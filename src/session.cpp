#include "imuskel/session.hpp"
#include "imuskel/log.hpp"
#include <exception>
#include <utility>

namespace imuskel {

CaptureSession::CaptureSession(std::shared_ptr<const SkeletonModel> model, SessionOptions options)
    : model_(std::move(model)),
      options_(options),
      controller_(options.calibration),
      retargeter_(model_) {
    if (options_.timer == TimerMode::Realtime) {
        timer_ = std::make_unique<OneShotTimer>();
    }
    LOG_INFO("[Session] Skeleton '" << model_->name() << "' (" << model_->size() << " joints), timer "
             << to_string(options_.timer));
}

CaptureSession::~CaptureSession() {
    if (timer_) {
        timer_->cancel();
    }
}

DeliveryResult CaptureSession::deliver_sample(const Sample& sample) {
    DeliveryResult result;
    std::optional<CorrectedRecord> record;
    RecordListener listener;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.samples_delivered;

        const size_t anomalies_before = normalizer_.anomaly_count();
        Quaternion q = normalizer_.normalize(sample.quaternion, sample.label);
        result.degenerate = normalizer_.anomaly_count() != anomalies_before;
        if (result.degenerate) {
            ++stats_.degenerate_samples;
        }

        result.collected = controller_.on_sample(sample.label, q);
        if (result.collected) {
            ++stats_.samples_collected;
            if (!options_.live_during_collection) {
                return result;
            }
        }

        Quaternion corrected = corrector_.correct(references_, sample.label, q);
        global_pose_.set(sample.label, corrected);
        result.applied = true;
        ++stats_.samples_live;

        const bool mapped = model_->contains(sample.label);
        if (mapped) {
            result.joints_written = retargeter_.update(global_pose_);
        } else {
            ++stats_.unmapped_samples;
            LOG_VERBOSE("[Session] Unmapped label " << sample.label << ", no joint update");
        }

        if (record_listener_) {
            CorrectedRecord rec;
            rec.label = sample.label;
            rec.quaternion = corrected;
            rec.timestamp = sample.arrival;
            rec.sequence = sample.sequence;
            rec.calibrated = references_.contains(sample.label);
            rec.mapped = mapped;
            record = rec;
            listener = record_listener_;
        }
    }

    // Listeners run unlocked so they may query the session
    if (record && listener) {
        listener(*record);
    }
    return result;
}

uint64_t CaptureSession::start_calibration(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> known(connected_.begin(), connected_.end());
    const uint64_t id = controller_.start(now, known);
    ++stats_.calibrations_started;

    // Armed under the session lock so the timer always holds the newest id.
    // The worker fires unlocked, so session -> timer is the only lock order.
    if (timer_) {
        auto tick = [](std::chrono::milliseconds left) {
            LOG_INFO("[Calibration] " << (left.count() + 999) / 1000 << "s remaining...");
        };
        timer_->arm(options_.calibration.duration,
                    [this, id] { on_timer_expire(id); },
                    options_.countdown_period,
                    options_.countdown_period.count() > 0 ? OneShotTimer::TickCallback(tick) : nullptr);
    }
    return id;
}

bool CaptureSession::advance(TimePoint now) {
    std::optional<CalibrationResult> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!controller_.due(now)) {
            return false;
        }
        result = complete_locked(controller_.collection_id());
    }
    notify_calibration(result);
    return result.has_value();
}

void CaptureSession::on_timer_expire(uint64_t collection_id) {
    std::optional<CalibrationResult> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = complete_locked(collection_id);
    }
    notify_calibration(result);
}

std::optional<CalibrationResult> CaptureSession::complete_locked(uint64_t collection_id) {
    auto result = controller_.expire(collection_id);
    if (!result) {
        return std::nullopt;
    }
    // The new table replaces the old one as a whole
    references_ = result->references;
    stats_.degenerate_references += result->degenerate_labels.size();
    ++stats_.calibrations_completed;
    if (references_.empty()) {
        LOG_WARN("[Session] Calibration finished without references, all labels pass through");
    }
    return result;
}

void CaptureSession::notify_calibration(const std::optional<CalibrationResult>& result) {
    if (!result) return;
    CalibrationListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = calibration_listener_;
    }
    if (!listener) return;
    // May run on the timer thread: a throwing listener must not end the process
    try {
        listener(*result);
    } catch (const std::exception& e) {
        LOG_ERROR("[Session] Calibration listener failed for collection #"
                  << result->collection_id << ": " << e.what());
    }
}

void CaptureSession::connect_sensor(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_.insert(label).second) {
        LOG_INFO("[Session] Sensor connected: " << label);
    }
}

void CaptureSession::disconnect_sensor(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_.erase(label)) {
        LOG_INFO("[Session] Sensor disconnected: " << label);
    }
}

void CaptureSession::remove_sensor(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.erase(label);
    controller_.drop_label(label);
    global_pose_.erase(label);
    LOG_INFO("[Session] Sensor removed: " << label);
}

std::vector<std::string> CaptureSession::connected_sensors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(connected_.begin(), connected_.end());
}

void CaptureSession::set_record_listener(RecordListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_listener_ = std::move(listener);
}

void CaptureSession::set_calibration_listener(CalibrationListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    calibration_listener_ = std::move(listener);
}

void CaptureSession::set_local_offset(const std::string& label, const Quaternion& offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    retargeter_.set_local_offset(label, offset);
}

CalibrationState CaptureSession::calibration_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return controller_.state();
}

std::chrono::milliseconds CaptureSession::calibration_remaining(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return controller_.remaining(now);
}

size_t CaptureSession::calibration_buffer_size(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return controller_.buffer_size(label);
}

std::optional<Quaternion> CaptureSession::reference(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return references_.get(label);
}

ReferenceTable CaptureSession::references() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return references_;
}

std::optional<Quaternion> CaptureSession::global_orientation(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_pose_.get(label);
}

std::optional<Quaternion> CaptureSession::local_rotation(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retargeter_.local_rotation(label);
}

std::optional<Quaternion> CaptureSession::parent_local(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retargeter_.parent_local(global_pose_, label);
}

std::vector<JointRotation> CaptureSession::pose_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retargeter_.snapshot();
}

SessionStats CaptureSession::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace imuskel
