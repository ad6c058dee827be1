#pragma once

#include "imuskel/corrector.hpp"
#include "imuskel/retargeter.hpp"
#include "imuskel/skeleton.hpp"
#include <string>
#include <vector>

namespace imuskel {

class CaptureSession;

// Pose dump for offline inspection:
//   skeleton: ybot
//   source: capture.jsonl
//   joints:
//     - label: RA
//       bone: mixamorigRightArm
//       parent: SP2
//       rotation: [w, x, y, z]
//       angle_deg: 90.0
//       reference: [w, x, y, z]     # only when calibrated
std::string pose_to_yaml(const SkeletonModel& model,
                         const std::vector<JointRotation>& rotations,
                         const ReferenceTable& references,
                         const std::string& source = "");

std::string session_pose_to_yaml(const CaptureSession& session, const std::string& source = "");

// Throws Error(IOError) when the file cannot be written
void write_pose_yaml(const std::string& path, const std::string& yaml);

} // namespace imuskel
