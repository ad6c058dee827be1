#include "imuskel/quaternion.hpp"
#include "imuskel/log.hpp"
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace imuskel {

Quaternion normalized(const Quaternion& q, bool* degenerate) {
    const double len = q.norm();
    const bool bad = !(len > 0.0) || !std::isfinite(len);
    if (degenerate) {
        *degenerate = bad;
    }
    if (bad) {
        return q;
    }
    return Quaternion(q.w() / len, q.x() / len, q.y() / len, q.z() / len);
}

bool approx_equal(const Quaternion& a, const Quaternion& b, double tol) {
    return std::abs(a.w() - b.w()) <= tol &&
           std::abs(a.x() - b.x()) <= tol &&
           std::abs(a.y() - b.y()) <= tol &&
           std::abs(a.z() - b.z()) <= tol;
}

bool same_rotation(const Quaternion& a, const Quaternion& b, double tol) {
    if (approx_equal(a, b, tol)) return true;
    Quaternion neg(-b.w(), -b.x(), -b.y(), -b.z());
    return approx_equal(a, neg, tol);
}

std::string to_string(const Quaternion& q) {
    std::ostringstream ss;
    ss << q;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Quaternion& q) {
    std::ios::fmtflags flags = os.flags();
    os << std::fixed << std::setprecision(4)
       << "[" << q.w() << ", " << q.x() << ", " << q.y() << ", " << q.z() << "]";
    os.flags(flags);
    return os;
}

Quaternion OrientationNormalizer::normalize(const Quaternion& q, const std::string& context) {
    bool degenerate = false;
    Quaternion out = normalized(q, &degenerate);
    if (degenerate) {
        ++anomalies_;
        LOG_WARN("[Normalizer] Degenerate quaternion" << (context.empty() ? "" : " from " + context)
                 << ": " << q << " (anomaly #" << anomalies_ << ")");
    }
    return out;
}

} // namespace imuskel
