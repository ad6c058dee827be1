#pragma once

#include "imuskel/quaternion.hpp"
#include "imuskel/skeleton.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace imuskel {

// Latest corrected global orientation per label. Entries persist until
// overwritten or explicitly erased.
class GlobalPose {
public:
    void set(const std::string& label, const Quaternion& q) { pose_[label] = q; }
    std::optional<Quaternion> get(const std::string& label) const;
    bool contains(const std::string& label) const { return pose_.count(label) > 0; }
    void erase(const std::string& label) { pose_.erase(label); }
    void clear() { pose_.clear(); }
    size_t size() const { return pose_.size(); }

    const std::map<std::string, Quaternion>& entries() const { return pose_; }

private:
    std::map<std::string, Quaternion> pose_;
};

// Per-joint output of a retargeting pass
struct JointRotation {
    std::string label;
    std::string bone;
    Quaternion rotation = Quaternion::Identity();
};

// Composes global sensor orientations into parent-relative, bind-corrected
// joint rotations. Joint rotations start at the bind pose and are only
// written here.
class PoseRetargeter {
public:
    explicit PoseRetargeter(std::shared_ptr<const SkeletonModel> model);

    // One pass over the skeleton in topological order:
    //   parent_local = inverse(G[parent]) * G[joint]   (G[joint] if no parent reading)
    //   root:      final = bind * parent_local * offset
    //   non-root:  final = inverse_bind * parent_local * offset
    // Joints without a global reading keep their previous rotation.
    // Returns the number of joints written.
    size_t update(const GlobalPose& pose);

    // parent_local for one joint, nullopt when the joint has no global
    // reading or the label is unmapped
    std::optional<Quaternion> parent_local(const GlobalPose& pose, const std::string& label) const;

    const Quaternion& local_rotation(int joint_index) const { return rotations_.at(joint_index); }
    std::optional<Quaternion> local_rotation(const std::string& label) const;

    // Manual mounting correction, applied on the right of parent_local
    void set_local_offset(const std::string& label, const Quaternion& offset);
    const Quaternion& local_offset(int joint_index) const { return offsets_.at(joint_index); }

    // Back to the bind pose
    void reset();

    // Rotations in topological order
    std::vector<JointRotation> snapshot() const;

    const SkeletonModel& model() const { return *model_; }

private:
    Quaternion compose(const Joint& joint, const Quaternion& parent_local) const;

    std::shared_ptr<const SkeletonModel> model_;
    std::vector<Quaternion> rotations_;
    std::vector<Quaternion> offsets_;
};

} // namespace imuskel
