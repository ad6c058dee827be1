#pragma once

#include "imuskel/corrector.hpp"
#include "imuskel/quaternion.hpp"
#include "imuskel/sample.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace imuskel {

enum class CalibrationState {
    Idle,
    Collecting,
    Computing,
    Calibrated
};

const char* to_string(CalibrationState state);

enum class AveragingMethod {
    AlignedMean,  // sign-align to the first sample, then component-wise mean
    Eigenvector   // principal eigenvector of sum(q q^T)
};

const char* to_string(AveragingMethod method);
// Accepts "aligned_mean" / "eigenvector"; throws Error(ConfigError) otherwise
AveragingMethod parse_averaging_method(const std::string& name);

struct CalibrationOptions {
    std::chrono::milliseconds duration{30000};
    AveragingMethod averaging = AveragingMethod::AlignedMean;
    // An average whose norm is below this is rejected instead of normalized
    double degenerate_norm = 1e-6;
};

// Average of a cluster of unit quaternions. Returns nullopt when the
// buffer is empty or the average collapses below degenerate_norm.
std::optional<Quaternion> average_orientation(const std::vector<Quaternion>& samples,
                                              AveragingMethod method,
                                              double degenerate_norm = 1e-6);

// Outcome of one completed collection window
struct CalibrationResult {
    uint64_t collection_id = 0;
    ReferenceTable references;
    std::map<std::string, size_t> sample_counts;
    std::vector<std::string> degenerate_labels;  // had samples, no usable average
};

// Timed collection state machine.
//
//   Idle -> Collecting -> Computing -> Calibrated
//                ^                         |
//                +-------------------------+  (recalibration)
//
// Collecting -> Collecting is a restart: the in-flight buffers are dropped.
// Every start() gets a fresh collection id; expire() with an older id is a
// no-op so a timer from an aborted collection can never complete the new one.
class CalibrationController {
public:
    explicit CalibrationController(CalibrationOptions options = {});

    // Begin (or restart) a collection window. known_labels get an empty
    // buffer up front so they report zero samples; others are created lazily.
    uint64_t start(TimePoint now, const std::vector<std::string>& known_labels = {});

    // Buffers q while collecting and returns true. Returns false otherwise.
    bool on_sample(const std::string& label, const Quaternion& q);

    // Completes collection collection_id. Returns nullopt for a stale id or
    // when not collecting.
    std::optional<CalibrationResult> expire(uint64_t collection_id);

    // Collecting and the window has elapsed at now
    bool due(TimePoint now) const;
    std::chrono::milliseconds remaining(TimePoint now) const;

    // Drops a label's in-flight buffer (sensor removed mid-collection)
    void drop_label(const std::string& label);

    CalibrationState state() const { return state_; }
    bool collecting() const { return state_ == CalibrationState::Collecting; }
    uint64_t collection_id() const { return collection_id_; }
    TimePoint start_time() const { return start_time_; }
    const CalibrationOptions& options() const { return options_; }

    size_t buffer_size(const std::string& label) const;
    std::vector<std::string> buffered_labels() const;

private:
    CalibrationOptions options_;
    CalibrationState state_ = CalibrationState::Idle;
    uint64_t collection_id_ = 0;
    TimePoint start_time_{};
    std::map<std::string, std::vector<Quaternion>> buffers_;
};

} // namespace imuskel
