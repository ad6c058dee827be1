#include "imuskel/calibration.hpp"
#include "imuskel/error.hpp"
#include "imuskel/log.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>

namespace imuskel {

const char* to_string(CalibrationState state) {
    switch (state) {
        case CalibrationState::Idle:       return "Idle";
        case CalibrationState::Collecting: return "Collecting";
        case CalibrationState::Computing:  return "Computing";
        case CalibrationState::Calibrated: return "Calibrated";
        default:                           return "Unknown";
    }
}

const char* to_string(AveragingMethod method) {
    switch (method) {
        case AveragingMethod::AlignedMean: return "aligned_mean";
        case AveragingMethod::Eigenvector: return "eigenvector";
        default:                           return "unknown";
    }
}

AveragingMethod parse_averaging_method(const std::string& name) {
    if (name == "aligned_mean") return AveragingMethod::AlignedMean;
    if (name == "eigenvector") return AveragingMethod::Eigenvector;
    throw Error(ErrorCode::ConfigError, "Unknown averaging method '" + name +
                "' (expected aligned_mean or eigenvector)");
}

namespace {

Eigen::Vector4d wxyz(const Quaternion& q) {
    return Eigen::Vector4d(q.w(), q.x(), q.y(), q.z());
}

std::optional<Quaternion> aligned_mean(const std::vector<Quaternion>& samples, double degenerate_norm) {
    // q and -q are the same rotation; summing opposite signs cancels them out.
    // Flip every sample into the hemisphere of the first one before summing.
    const Eigen::Vector4d pivot = wxyz(samples.front());
    Eigen::Vector4d sum = Eigen::Vector4d::Zero();
    for (const auto& q : samples) {
        Eigen::Vector4d v = wxyz(q);
        if (v.dot(pivot) < 0.0) {
            v = -v;
        }
        sum += v;
    }
    Eigen::Vector4d avg = sum / static_cast<double>(samples.size());

    // A zero or non-finite average is never a reference, whatever the threshold
    const double norm = avg.norm();
    if (!std::isfinite(norm) || norm <= std::max(degenerate_norm, 0.0)) {
        return std::nullopt;
    }
    avg.normalize();
    return Quaternion(avg(0), avg(1), avg(2), avg(3));
}

std::optional<Quaternion> eigenvector_mean(const std::vector<Quaternion>& samples, double degenerate_norm) {
    // Markley et al.: the average is the eigenvector of M = sum(q q^T)
    // with the largest eigenvalue
    Eigen::Matrix4d m = Eigen::Matrix4d::Zero();
    for (const auto& q : samples) {
        Eigen::Vector4d v = wxyz(q);
        m += v * v.transpose();
    }
    m /= static_cast<double>(samples.size());

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix4d> solver(m);
    if (solver.info() != Eigen::Success) {
        return std::nullopt;
    }
    // Eigenvalues are sorted ascending
    const double largest = solver.eigenvalues()(3);
    if (!std::isfinite(largest) || largest <= std::max(degenerate_norm, 0.0)) {
        return std::nullopt;
    }
    Eigen::Vector4d avg = solver.eigenvectors().col(3).normalized();
    if (avg.dot(wxyz(samples.front())) < 0.0) {
        avg = -avg;
    }
    return Quaternion(avg(0), avg(1), avg(2), avg(3));
}

} // namespace

std::optional<Quaternion> average_orientation(const std::vector<Quaternion>& samples,
                                              AveragingMethod method,
                                              double degenerate_norm) {
    if (samples.empty()) {
        return std::nullopt;
    }
    switch (method) {
        case AveragingMethod::Eigenvector:
            return eigenvector_mean(samples, degenerate_norm);
        case AveragingMethod::AlignedMean:
        default:
            return aligned_mean(samples, degenerate_norm);
    }
}

CalibrationController::CalibrationController(CalibrationOptions options)
    : options_(options) {}

uint64_t CalibrationController::start(TimePoint now, const std::vector<std::string>& known_labels) {
    if (state_ == CalibrationState::Collecting) {
        LOG_INFO("[Calibration] Restart: discarding collection #" << collection_id_);
    }

    buffers_.clear();
    for (const auto& label : known_labels) {
        buffers_[label];
    }

    start_time_ = now;
    ++collection_id_;
    state_ = CalibrationState::Collecting;

    LOG_INFO("[Calibration] Collecting T-pose samples for "
             << options_.duration.count() / 1000.0 << "s (collection #" << collection_id_
             << ", " << known_labels.size() << " known sensors, averaging="
             << to_string(options_.averaging) << ")");
    return collection_id_;
}

bool CalibrationController::on_sample(const std::string& label, const Quaternion& q) {
    if (state_ != CalibrationState::Collecting) {
        return false;
    }
    auto& buffer = buffers_[label];
    if (buffer.empty()) {
        LOG_VERBOSE("[Calibration] First sample from " << label);
    }
    buffer.push_back(q);
    return true;
}

std::optional<CalibrationResult> CalibrationController::expire(uint64_t collection_id) {
    if (state_ != CalibrationState::Collecting || collection_id != collection_id_) {
        LOG_VERBOSE("[Calibration] Ignoring stale expiry for collection #" << collection_id
                    << " (current #" << collection_id_ << ", state " << to_string(state_) << ")");
        return std::nullopt;
    }

    state_ = CalibrationState::Computing;

    CalibrationResult result;
    result.collection_id = collection_id_;
    for (const auto& [label, samples] : buffers_) {
        result.sample_counts[label] = samples.size();
        if (samples.empty()) {
            LOG_WARN("[Calibration] No samples from " << label << ", left uncalibrated");
            continue;
        }

        auto avg = average_orientation(samples, options_.averaging, options_.degenerate_norm);
        if (!avg) {
            result.degenerate_labels.push_back(label);
            LOG_WARN("[Calibration] Degenerate average for " << label << " over "
                     << samples.size() << " samples, left uncalibrated");
            continue;
        }
        result.references.set(label, *avg);
        LOG_INFO("[Calibration] Reference for " << label << ": " << *avg
                 << " (" << samples.size() << " samples)");
    }

    buffers_.clear();
    state_ = CalibrationState::Calibrated;

    LOG_INFO("[Calibration] Collection #" << collection_id_ << " complete: "
             << result.references.size() << " references");
    return result;
}

bool CalibrationController::due(TimePoint now) const {
    return state_ == CalibrationState::Collecting && now - start_time_ >= options_.duration;
}

std::chrono::milliseconds CalibrationController::remaining(TimePoint now) const {
    if (state_ != CalibrationState::Collecting) {
        return std::chrono::milliseconds(0);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    return std::max(std::chrono::milliseconds(0), options_.duration - elapsed);
}

void CalibrationController::drop_label(const std::string& label) {
    buffers_.erase(label);
}

size_t CalibrationController::buffer_size(const std::string& label) const {
    auto it = buffers_.find(label);
    return it == buffers_.end() ? 0 : it->second.size();
}

std::vector<std::string> CalibrationController::buffered_labels() const {
    std::vector<std::string> out;
    for (const auto& [label, samples] : buffers_) {
        out.push_back(label);
    }
    return out;
}

} // namespace imuskel
