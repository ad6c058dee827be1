/**
 * @file imuskel_skeleton_inspect_main.cpp
 * @brief Validate a skeleton definition and print its joint hierarchy
 *
 * Usage:
 *   imuskel_skeleton_inspect -i data/skeleton/ybot.yaml
 *   imuskel_skeleton_inspect --builtin
 */

#include "imuskel/imuskel.hpp"

#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

int depthOf(const imuskel::SkeletonModel& model, const imuskel::Joint& joint) {
    int depth = 0;
    for (int idx = joint.parent_index; idx >= 0; idx = model.joint(idx).parent_index) {
        ++depth;
    }
    return depth;
}

} // namespace

int main(int argc, char** argv) {
    po::options_description desc("Skeleton Inspector");
    desc.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>(), "Skeleton YAML")
        ("builtin,b", po::bool_switch(), "Inspect the built-in 12-joint biped");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    const bool builtin = vm["builtin"].as<bool>();
    if (vm.count("help") || (!vm.count("input") && !builtin)) {
        std::cout << "Usage: " << argv[0] << " -i <skeleton.yaml> | --builtin\n\n";
        std::cout << desc << std::endl;
        return vm.count("help") ? 0 : 1;
    }

    std::shared_ptr<imuskel::SkeletonModel> model;
    try {
        model = builtin ? imuskel::SkeletonModel::standard_biped()
                        : imuskel::SkeletonModel::load(vm["input"].as<std::string>());
    } catch (const imuskel::Error& e) {
        std::cerr << "Invalid skeleton: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Skeleton: " << model->name() << std::endl;
    std::cout << "Joints: " << model->size() << ", root: " << model->root().label << std::endl;
    std::cout << "Topological order:" << std::endl;
    for (int idx : model->topological_order()) {
        const auto& joint = model->joint(idx);
        Eigen::AngleAxisd bind(joint.bind_orientation);
        std::cout << "  " << std::string(2 * depthOf(*model, joint), ' ')
                  << std::left << std::setw(6) << joint.label
                  << " bone=" << joint.bone
                  << " bind=" << imuskel::to_string(joint.bind_orientation)
                  << std::fixed << std::setprecision(1)
                  << " (" << bind.angle() * 180.0 / M_PI << " deg)";
        if (!joint.local_offset.isApprox(imuskel::Quaternion::Identity())) {
            std::cout << " offset=" << imuskel::to_string(joint.local_offset);
        }
        std::cout << std::endl;
    }
    return 0;
}
