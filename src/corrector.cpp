#include "imuskel/corrector.hpp"
#include "imuskel/log.hpp"

namespace imuskel {

void ReferenceTable::set(const std::string& label, const Quaternion& q_ref) {
    refs_[label] = q_ref;
}

std::optional<Quaternion> ReferenceTable::get(const std::string& label) const {
    auto it = refs_.find(label);
    if (it == refs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ReferenceTable::labels() const {
    std::vector<std::string> out;
    out.reserve(refs_.size());
    for (const auto& [label, q] : refs_) {
        out.push_back(label);
    }
    return out;
}

Quaternion CalibrationCorrector::correct(const ReferenceTable& refs, const std::string& label,
                                         const Quaternion& q_now) const {
    auto it = refs.entries().find(label);
    if (it == refs.entries().end()) {
        return q_now;
    }

    // conjugate == inverse for the unit reference
    Quaternion relative = it->second.conjugate() * q_now;

    bool degenerate = false;
    Quaternion out = normalized(relative, &degenerate);
    if (degenerate) {
        LOG_WARN("[Corrector] Degenerate corrected orientation for " << label << ", passing through");
    }
    return out;
}

} // namespace imuskel
