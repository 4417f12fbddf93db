#pragma once
// Contains information about a specific rig configuration e.g. for ARKit body
// tracking or the Azure Kinect
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <rig/Topology.hpp>

using json = nlohmann::json;

struct RigConfiguration {
    std::string name = "arkit";
    JointPairs joint_pairs = arkit_body_joint_pairs();
    // Joints kept in the registry for drawing although no bone uses them
    std::vector<std::string> extra_joints;
    // Canonical names of the tracking source, empty skips the check
    std::vector<std::string> vocabulary = arkit_body_joint_names();
    bool require_single_root = false;
    bool log_unknown_joints = true;
    double bone_diameter = 0.04;

    // Throws InvalidTopologyError
    SkeletonTopology build_topology() const;

    static RigConfiguration arkit_body();
    static RigConfiguration azure_kinect();
};

void to_json(json& _json, const RigConfiguration& configuration);
void from_json(const json& _json, RigConfiguration& configuration);

RigConfiguration load_configuration(const std::string& path);
