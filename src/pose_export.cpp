#include "imuskel/pose_export.hpp"
#include "imuskel/error.hpp"
#include "imuskel/session.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <fstream>

namespace imuskel {

namespace {

std::vector<double> wxyz(const Quaternion& q) {
    return {q.w(), q.x(), q.y(), q.z()};
}

} // namespace

std::string pose_to_yaml(const SkeletonModel& model,
                         const std::vector<JointRotation>& rotations,
                         const ReferenceTable& references,
                         const std::string& source) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "skeleton" << YAML::Value << model.name();
    if (!source.empty()) {
        out << YAML::Key << "source" << YAML::Value << source;
    }
    out << YAML::Key << "num_joints" << YAML::Value << static_cast<int>(model.size());
    out << YAML::Key << "num_references" << YAML::Value << static_cast<int>(references.size());

    out << YAML::Key << "joints" << YAML::Value << YAML::BeginSeq;
    for (const auto& jr : rotations) {
        const Joint* joint = model.find(jr.label);
        Eigen::AngleAxisd aa(jr.rotation);

        out << YAML::BeginMap;
        out << YAML::Key << "label" << YAML::Value << jr.label;
        out << YAML::Key << "bone" << YAML::Value << jr.bone;
        if (joint && !joint->is_root()) {
            out << YAML::Key << "parent" << YAML::Value << joint->parent_label;
        }
        out << YAML::Key << "rotation" << YAML::Flow << wxyz(jr.rotation);
        out << YAML::Key << "angle_deg" << YAML::Value << (aa.angle() * 180.0 / M_PI);
        if (auto ref = references.get(jr.label)) {
            out << YAML::Key << "reference" << YAML::Flow << wxyz(*ref);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    // References for labels that drive no joint
    std::vector<std::string> unmapped;
    for (const auto& label : references.labels()) {
        if (!model.contains(label)) unmapped.push_back(label);
    }
    if (!unmapped.empty()) {
        out << YAML::Key << "unmapped_references" << YAML::Value << YAML::BeginMap;
        for (const auto& label : unmapped) {
            out << YAML::Key << label << YAML::Flow << wxyz(*references.get(label));
        }
        out << YAML::EndMap;
    }

    out << YAML::EndMap;
    return out.c_str();
}

std::string session_pose_to_yaml(const CaptureSession& session, const std::string& source) {
    return pose_to_yaml(session.model(), session.pose_snapshot(), session.references(), source);
}

void write_pose_yaml(const std::string& path, const std::string& yaml) {
    std::ofstream fout(path);
    if (!fout.is_open()) {
        throw Error(ErrorCode::IOError, path, "Failed to open pose file for writing");
    }
    fout << yaml << "\n";
}

} // namespace imuskel
