#pragma once

#include "imuskel/calibration.hpp"
#include "imuskel/config.hpp"
#include "imuskel/corrector.hpp"
#include "imuskel/quaternion.hpp"
#include "imuskel/retargeter.hpp"
#include "imuskel/sample.hpp"
#include "imuskel/skeleton.hpp"
#include "imuskel/timer.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace imuskel {

// One corrected sample, as handed to loggers and exporters
struct CorrectedRecord {
    std::string label;
    Quaternion quaternion = Quaternion::Identity();
    TimePoint timestamp{};
    uint64_t sequence = 0;
    bool calibrated = false;  // a reference was applied
    bool mapped = false;      // the label drives a skeleton joint
};

struct DeliveryResult {
    bool collected = false;    // buffered by an active calibration
    bool applied = false;      // went through correction and retargeting
    bool degenerate = false;   // zero-norm input, passed through raw
    size_t joints_written = 0;
};

struct SessionStats {
    size_t samples_delivered = 0;
    size_t samples_collected = 0;
    size_t samples_live = 0;
    size_t unmapped_samples = 0;
    size_t degenerate_samples = 0;
    size_t degenerate_references = 0;
    size_t calibrations_started = 0;
    size_t calibrations_completed = 0;
};

using RecordListener = std::function<void(const CorrectedRecord&)>;
using CalibrationListener = std::function<void(const CalibrationResult&)>;

// A capture session: the calibration buffers, reference table, global pose
// and joint rotations of one subject. Every mutation goes through one mutex,
// so a retargeting pass never sees a half-applied sample.
//
// Non-copyable, non-moveable (mutex and timer thread are not moveable)
class CaptureSession {
public:
    CaptureSession(std::shared_ptr<const SkeletonModel> model, SessionOptions options = {});
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;
    CaptureSession(CaptureSession&&) = delete;
    CaptureSession& operator=(CaptureSession&&) = delete;

    // Single ingestion entry point
    DeliveryResult deliver_sample(const Sample& sample);

    // Starts (or restarts) the timed T-pose collection. The current
    // reference table stays in effect until the new collection completes.
    uint64_t start_calibration(TimePoint now = Clock::now());

    // Manual clock: completes the running collection once now reaches its
    // deadline. Returns true when a collection completed.
    bool advance(TimePoint now);

    // Sensor bookkeeping. Connected labels get an empty buffer at
    // calibration start; remove_sensor also drops the label's buffer and
    // global pose entry. Other labels are never touched.
    void connect_sensor(const std::string& label);
    void disconnect_sensor(const std::string& label);
    void remove_sensor(const std::string& label);
    std::vector<std::string> connected_sensors() const;

    void set_record_listener(RecordListener listener);
    void set_calibration_listener(CalibrationListener listener);
    void set_local_offset(const std::string& label, const Quaternion& offset);

    CalibrationState calibration_state() const;
    std::chrono::milliseconds calibration_remaining(TimePoint now = Clock::now()) const;
    size_t calibration_buffer_size(const std::string& label) const;

    std::optional<Quaternion> reference(const std::string& label) const;
    ReferenceTable references() const;
    std::optional<Quaternion> global_orientation(const std::string& label) const;
    std::optional<Quaternion> local_rotation(const std::string& label) const;
    std::optional<Quaternion> parent_local(const std::string& label) const;
    std::vector<JointRotation> pose_snapshot() const;

    SessionStats stats() const;
    const SessionOptions& options() const { return options_; }
    const SkeletonModel& model() const { return *model_; }

private:
    // Caller holds mutex_
    std::optional<CalibrationResult> complete_locked(uint64_t collection_id);
    void notify_calibration(const std::optional<CalibrationResult>& result);
    void on_timer_expire(uint64_t collection_id);

    std::shared_ptr<const SkeletonModel> model_;
    SessionOptions options_;

    mutable std::mutex mutex_;
    OrientationNormalizer normalizer_;
    CalibrationController controller_;
    CalibrationCorrector corrector_;
    ReferenceTable references_;
    GlobalPose global_pose_;
    PoseRetargeter retargeter_;
    std::set<std::string> connected_;
    SessionStats stats_;
    RecordListener record_listener_;
    CalibrationListener calibration_listener_;

    // Realtime mode only. Declared last: joined before the state it calls into
    std::unique_ptr<OneShotTimer> timer_;
};

} // namespace imuskel
