#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <cmath>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace imuskel {

using Quaternion = Eigen::Quaterniond;

// Unit-norm tolerance for every stored or emitted quaternion
constexpr double kUnitTolerance = 1e-6;

// Returns q / |q|. A zero-norm (or non-finite) q is returned unchanged and
// *degenerate is set; callers decide how to report it.
Quaternion normalized(const Quaternion& q, bool* degenerate = nullptr);

// Component-wise comparison, (w,x,y,z) within tol
bool approx_equal(const Quaternion& a, const Quaternion& b, double tol = 1e-9);

// Same rotation: equal up to sign (q and -q)
bool same_rotation(const Quaternion& a, const Quaternion& b, double tol = 1e-9);

// 4D dot product over (w,x,y,z)
inline double dot4(const Quaternion& a, const Quaternion& b) {
    return a.coeffs().dot(b.coeffs());
}

inline bool is_unit(const Quaternion& q, double tol = kUnitTolerance) {
    return std::abs(q.norm() - 1.0) <= tol;
}

// "[w, x, y, z]" for logs
std::string to_string(const Quaternion& q);
std::ostream& operator<<(std::ostream& os, const Quaternion& q);

// Enforces the unit-quaternion invariant on incoming samples.
// Degenerate samples are passed through and counted, never fatal.
class OrientationNormalizer {
public:
    OrientationNormalizer() = default;

    // context is used for the anomaly log line (usually the sensor label)
    Quaternion normalize(const Quaternion& q, const std::string& context = "");

    size_t anomaly_count() const { return anomalies_; }
    void reset_anomalies() { anomalies_ = 0; }

private:
    size_t anomalies_ = 0;
};

} // namespace imuskel
