#include "imuskel/retargeter.hpp"
#include "imuskel/error.hpp"
#include "imuskel/log.hpp"
#include <utility>

namespace imuskel {

std::optional<Quaternion> GlobalPose::get(const std::string& label) const {
    auto it = pose_.find(label);
    if (it == pose_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PoseRetargeter::PoseRetargeter(std::shared_ptr<const SkeletonModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw Error(ErrorCode::InvalidState, "PoseRetargeter requires a skeleton model");
    }
    offsets_.reserve(model_->size());
    for (const auto& joint : model_->joints()) {
        offsets_.push_back(joint.local_offset);
    }
    reset();
}

void PoseRetargeter::reset() {
    rotations_.clear();
    rotations_.reserve(model_->size());
    for (const auto& joint : model_->joints()) {
        rotations_.push_back(joint.bind_orientation);
    }
}

std::optional<Quaternion> PoseRetargeter::parent_local(const GlobalPose& pose, const std::string& label) const {
    const Joint* joint = model_->find(label);
    if (!joint) {
        return std::nullopt;
    }
    auto global = pose.get(label);
    if (!global) {
        return std::nullopt;
    }
    if (!joint->is_root()) {
        auto parent = pose.get(joint->parent_label);
        if (parent) {
            return Quaternion(parent->inverse() * (*global));
        }
    }
    // Root, or the parent reading is missing: treat the reading as already parent-local
    return *global;
}

Quaternion PoseRetargeter::compose(const Joint& joint, const Quaternion& parent_local) const {
    const Quaternion& offset = offsets_[joint.index];
    if (joint.is_root()) {
        return joint.bind_orientation * parent_local * offset;
    }
    return joint.inverse_bind_orientation * parent_local * offset;
}

size_t PoseRetargeter::update(const GlobalPose& pose) {
    size_t written = 0;
    for (int idx : model_->topological_order()) {
        const Joint& joint = model_->joint(idx);
        auto local = parent_local(pose, joint.label);
        if (!local) {
            continue;
        }

        bool degenerate = false;
        Quaternion final_q = normalized(compose(joint, *local), &degenerate);
        if (degenerate) {
            LOG_WARN("[Retargeter] Degenerate rotation for joint " << joint.label << ", keeping previous");
            continue;
        }
        rotations_[idx] = final_q;
        ++written;
        LOG_VERBOSE("[Retargeter] " << joint.label << " -> " << final_q);
    }
    return written;
}

std::optional<Quaternion> PoseRetargeter::local_rotation(const std::string& label) const {
    int idx = model_->index_of(label);
    if (idx < 0) {
        return std::nullopt;
    }
    return rotations_[idx];
}

void PoseRetargeter::set_local_offset(const std::string& label, const Quaternion& offset) {
    int idx = model_->index_of(label);
    if (idx < 0) {
        throw Error(ErrorCode::InvalidState, label, "No joint mapped to label");
    }
    bool degenerate = false;
    Quaternion q = normalized(offset, &degenerate);
    if (degenerate) {
        throw Error(ErrorCode::InvalidState, label, "Local offset has zero norm");
    }
    offsets_[idx] = q;
}

std::vector<JointRotation> PoseRetargeter::snapshot() const {
    std::vector<JointRotation> out;
    out.reserve(rotations_.size());
    for (int idx : model_->topological_order()) {
        const Joint& joint = model_->joint(idx);
        out.push_back({joint.label, joint.bone, rotations_[idx]});
    }
    return out;
}

} // namespace imuskel
