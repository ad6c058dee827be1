#include "imuskel/skeleton.hpp"
#include "imuskel/error.hpp"
#include "imuskel/log.hpp"
#include "imuskel/sample.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>
#include <sstream>

namespace imuskel {

namespace {

Quaternion parse_quaternion(const YAML::Node& node, const std::string& source, const std::string& what) {
    if (!node.IsSequence() || node.size() != 4) {
        throw Error(ErrorCode::SkeletonError, source, what + " must be a [w, x, y, z] sequence");
    }
    Quaternion q(node[0].as<double>(), node[1].as<double>(), node[2].as<double>(), node[3].as<double>());
    bool degenerate = false;
    Quaternion out = normalized(q, &degenerate);
    if (degenerate) {
        throw Error(ErrorCode::SkeletonError, source, what + " has zero norm");
    }
    return out;
}

std::vector<JointDefinition> parse_nodes(const YAML::Node& root, const std::string& source, std::string& name) {
    YAML::Node skel = root["skeleton"];
    if (!skel || !skel["nodes"] || !skel["nodes"].IsSequence()) {
        throw Error(ErrorCode::SkeletonError, source, "Missing 'skeleton.nodes' sequence");
    }
    name = skel["name"] ? skel["name"].as<std::string>() : "skeleton";

    std::vector<JointDefinition> defs;
    for (const auto& node : skel["nodes"]) {
        if (!node["name"]) {
            throw Error(ErrorCode::SkeletonError, source, "Skeleton node without 'name'");
        }
        JointDefinition def;
        def.label = node["name"].as<std::string>();
        if (node["parent"] && !node["parent"].IsNull()) {
            def.parent = node["parent"].as<std::string>();
        }
        def.bone = node["bone"] ? node["bone"].as<std::string>() : def.label;
        if (node["bind"]) {
            def.bind = parse_quaternion(node["bind"], source, "bind of '" + def.label + "'");
        }
        if (node["offset"]) {
            def.offset = parse_quaternion(node["offset"], source, "offset of '" + def.label + "'");
        }
        defs.push_back(def);
    }
    return defs;
}

} // namespace

SkeletonModel::SkeletonModel(const std::vector<JointDefinition>& joints, const std::string& name)
    : name_(name) {
    build(joints);
    compute_order();
    LOG_VERBOSE("[Skeleton] Built '" << name_ << "' with " << joints_.size() << " joints, root "
                << root().label);
}

std::shared_ptr<SkeletonModel> SkeletonModel::load(const std::string& path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        throw Error(ErrorCode::IOError, path, std::string("Failed to open skeleton: ") + e.what());
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::SkeletonError, path, std::string("Failed to parse skeleton: ") + e.what());
    }

    std::string name;
    std::vector<JointDefinition> defs;
    try {
        defs = parse_nodes(config, path, name);
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::SkeletonError, path, std::string("Invalid skeleton node: ") + e.what());
    }

    auto model = std::make_shared<SkeletonModel>(defs, name);
    LOG_INFO("[Skeleton] Loaded '" << model->name() << "' from " << path
             << " (" << model->size() << " joints)");
    return model;
}

std::shared_ptr<SkeletonModel> SkeletonModel::from_yaml_string(const std::string& yaml, const std::string& source) {
    std::string name;
    std::vector<JointDefinition> defs;
    try {
        defs = parse_nodes(YAML::Load(yaml), source, name);
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::SkeletonError, source, std::string("Failed to parse skeleton: ") + e.what());
    }
    return std::make_shared<SkeletonModel>(defs, name);
}

std::vector<JointDefinition> SkeletonModel::standard_biped_definitions() {
    // label, parent, Mixamo bone
    const std::vector<std::array<const char*, 3>> table = {
        {limb::HIPS, "",         "mixamorigHips"},
        {limb::SP,   limb::HIPS, "mixamorigSpine"},
        {limb::SP2,  limb::SP,   "mixamorigSpine2"},
        {limb::H,    limb::SP2,  "mixamorigHead"},
        {limb::RA,   limb::SP2,  "mixamorigRightArm"},
        {limb::RFA,  limb::RA,   "mixamorigRightForeArm"},
        {limb::LA,   limb::SP2,  "mixamorigLeftArm"},
        {limb::LFA,  limb::LA,   "mixamorigLeftForeArm"},
        {limb::RUL,  limb::HIPS, "mixamorigRightUpLeg"},
        {limb::RL,   limb::RUL,  "mixamorigRightLeg"},
        {limb::LUL,  limb::HIPS, "mixamorigLeftUpLeg"},
        {limb::LL,   limb::LUL,  "mixamorigLeftLeg"},
    };

    std::vector<JointDefinition> defs;
    for (const auto& row : table) {
        JointDefinition def;
        def.label = row[0];
        def.parent = row[1];
        def.bone = row[2];
        defs.push_back(def);
    }
    return defs;
}

std::shared_ptr<SkeletonModel> SkeletonModel::standard_biped() {
    return std::make_shared<SkeletonModel>(standard_biped_definitions(), "biped");
}

void SkeletonModel::build(const std::vector<JointDefinition>& defs) {
    if (defs.empty()) {
        throw Error(ErrorCode::SkeletonError, name_, "Skeleton has no joints");
    }

    joints_.reserve(defs.size());
    for (const auto& def : defs) {
        if (def.label.empty()) {
            throw Error(ErrorCode::SkeletonError, name_, "Joint with empty label");
        }
        if (index_.count(def.label)) {
            throw Error(ErrorCode::SkeletonError, name_, "Duplicate joint label '" + def.label + "'");
        }
        if (def.parent == def.label) {
            throw Error(ErrorCode::SkeletonError, name_, "Joint '" + def.label + "' is its own parent");
        }

        bool degenerate = false;
        Quaternion bind = normalized(def.bind, &degenerate);
        if (degenerate) {
            throw Error(ErrorCode::SkeletonError, name_, "Joint '" + def.label + "' has a zero bind orientation");
        }
        Quaternion offset = normalized(def.offset, &degenerate);
        if (degenerate) {
            throw Error(ErrorCode::SkeletonError, name_, "Joint '" + def.label + "' has a zero local offset");
        }

        Joint joint;
        joint.label = def.label;
        joint.parent_label = def.parent;
        joint.bone = def.bone.empty() ? def.label : def.bone;
        joint.index = static_cast<int>(joints_.size());
        joint.bind_orientation = bind;
        joint.inverse_bind_orientation = bind.inverse();
        joint.local_offset = offset;

        index_[joint.label] = joint.index;
        joints_.push_back(joint);
    }

    std::vector<std::string> roots;
    for (auto& joint : joints_) {
        if (joint.parent_label.empty()) {
            roots.push_back(joint.label);
            continue;
        }
        auto it = index_.find(joint.parent_label);
        if (it == index_.end()) {
            throw Error(ErrorCode::SkeletonError, name_,
                        "Joint '" + joint.label + "' references unknown parent '" + joint.parent_label + "'");
        }
        joint.parent_index = it->second;
        joints_[joint.parent_index].children.push_back(joint.index);
    }

    if (roots.size() != 1) {
        std::ostringstream ss;
        ss << "Skeleton must have exactly one root, found " << roots.size();
        for (size_t i = 0; i < roots.size(); ++i) {
            ss << (i == 0 ? ": " : ", ") << roots[i];
        }
        throw Error(ErrorCode::SkeletonError, name_, ss.str());
    }
    root_index_ = index_.at(roots.front());
}

void SkeletonModel::compute_order() {
    // Pre-order DFS from the root, siblings in declaration order
    order_.clear();
    order_.reserve(joints_.size());
    std::vector<bool> visited(joints_.size(), false);
    std::vector<int> stack = {root_index_};

    while (!stack.empty()) {
        int idx = stack.back();
        stack.pop_back();
        if (visited[idx]) continue;
        visited[idx] = true;
        order_.push_back(idx);

        const auto& children = joints_[idx].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }

    // Joints not reachable from the single root can only sit on a parent cycle
    if (order_.size() != joints_.size()) {
        std::ostringstream ss;
        ss << "Parent cycle detected among:";
        for (const auto& joint : joints_) {
            if (!visited[joint.index]) ss << " " << joint.label;
        }
        throw Error(ErrorCode::SkeletonError, name_, ss.str());
    }
}

int SkeletonModel::index_of(const std::string& label) const {
    auto it = index_.find(label);
    return it == index_.end() ? -1 : it->second;
}

const Joint* SkeletonModel::find(const std::string& label) const {
    int idx = index_of(label);
    return idx < 0 ? nullptr : &joints_[idx];
}

std::vector<std::string> SkeletonModel::topological_labels() const {
    std::vector<std::string> labels;
    labels.reserve(order_.size());
    for (int idx : order_) {
        labels.push_back(joints_[idx].label);
    }
    return labels;
}

} // namespace imuskel
