#pragma once

#include "imuskel/quaternion.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace imuskel {

// Input record for building a skeleton (from YAML or code)
struct JointDefinition {
    std::string label;
    std::string parent;                               // empty for the root
    std::string bone;                                 // asset bone name, informational
    Quaternion bind = Quaternion::Identity();         // rest orientation from the asset
    Quaternion offset = Quaternion::Identity();       // static mounting correction
};

// Immutable joint record. The live rotation is owned by PoseRetargeter.
struct Joint {
    std::string label;
    std::string parent_label;
    std::string bone;
    int index = -1;
    int parent_index = -1;                            // -1 for the root
    Quaternion bind_orientation = Quaternion::Identity();
    Quaternion inverse_bind_orientation = Quaternion::Identity();
    Quaternion local_offset = Quaternion::Identity();
    std::vector<int> children;

    bool is_root() const { return parent_index < 0; }
};

// Static joint hierarchy: an arena of joints with label lookup and a
// precomputed topological order (root first, every joint after its parent).
// The tree invariants are checked once in the constructor; violations throw
// Error(SkeletonError).
class SkeletonModel {
public:
    explicit SkeletonModel(const std::vector<JointDefinition>& joints, const std::string& name = "skeleton");

    // Load from YAML:
    //   skeleton:
    //     name: ybot
    //     nodes:
    //       - name: HIPS
    //         bone: mixamorigHips
    //         bind: [1, 0, 0, 0]     # w, x, y, z
    //       - name: SP
    //         parent: HIPS
    //         offset: [1, 0, 0, 0]
    static std::shared_ptr<SkeletonModel> load(const std::string& path);
    static std::shared_ptr<SkeletonModel> from_yaml_string(const std::string& yaml, const std::string& source = "<string>");

    // The 12-joint biped of the reference deployment with identity bind data
    static std::shared_ptr<SkeletonModel> standard_biped();
    static std::vector<JointDefinition> standard_biped_definitions();

    const std::string& name() const { return name_; }
    size_t size() const { return joints_.size(); }
    const std::vector<Joint>& joints() const { return joints_; }
    const Joint& joint(int index) const { return joints_.at(index); }
    const Joint& root() const { return joints_.at(root_index_); }

    // -1 when the label is not mapped to a joint
    int index_of(const std::string& label) const;
    bool contains(const std::string& label) const { return index_of(label) >= 0; }
    const Joint* find(const std::string& label) const;

    const std::vector<int>& topological_order() const { return order_; }
    std::vector<std::string> topological_labels() const;

private:
    void build(const std::vector<JointDefinition>& defs);
    void compute_order();

    std::string name_;
    std::vector<Joint> joints_;
    std::unordered_map<std::string, int> index_;
    std::vector<int> order_;
    int root_index_ = -1;
};

} // namespace imuskel
