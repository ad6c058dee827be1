#pragma once

#include "imuskel/quaternion.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace imuskel {

// Per-label calibration reference (qRef). Produced whole by a completed
// calibration; a label without an entry is uncalibrated.
class ReferenceTable {
public:
    ReferenceTable() = default;

    void set(const std::string& label, const Quaternion& q_ref);
    std::optional<Quaternion> get(const std::string& label) const;
    bool contains(const std::string& label) const { return refs_.count(label) > 0; }
    void erase(const std::string& label) { refs_.erase(label); }

    size_t size() const { return refs_.size(); }
    bool empty() const { return refs_.empty(); }
    std::vector<std::string> labels() const;

    const std::map<std::string, Quaternion>& entries() const { return refs_; }

private:
    std::map<std::string, Quaternion> refs_;
};

// Removes the calibration-time bias from a live sample:
//   q_corrected = normalize(conj(q_ref) * q_now)
// Labels without a reference pass through unchanged.
class CalibrationCorrector {
public:
    CalibrationCorrector() = default;

    Quaternion correct(const ReferenceTable& refs, const std::string& label,
                       const Quaternion& q_now) const;
};

} // namespace imuskel
