#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <rig/Errors.hpp>

struct BoneDefinition {
    std::string name;
    std::string from;
    std::string to;
};

bool operator==(const BoneDefinition& lhs, const BoneDefinition& rhs);

typedef std::vector<std::pair<std::string, std::string>> JointPairs;

/**
 * Immutable table of bones, each connecting a parent-side joint (from) to a
 * child-side joint (to). The table is indexed once at construction, after
 * that all lookups are read only.
 *
 * Throws InvalidTopologyError if a bone connects a joint to itself, a bone is
 * listed twice, a joint has two parents or the bones form a cycle.
 */
class SkeletonTopology {
    std::vector<BoneDefinition> m_bones;
    std::vector<std::string> m_joint_names;
    std::vector<std::string> m_root_joints;
    std::unordered_map<std::string, size_t> m_bone_index;
    std::unordered_set<std::string> m_joints;

public:
    SkeletonTopology(const JointPairs& joint_pairs, bool require_single_root = false);

    static std::string bone_name(const std::string& from, const std::string& to);

    const std::vector<BoneDefinition>& bones() const { return m_bones; }
    const BoneDefinition& bone(const std::string& name) const;
    std::optional<size_t> bone_index(const std::string& name) const;

    // Joints in order of first appearance, from before to
    const std::vector<std::string>& joint_names() const { return m_joint_names; }
    const std::vector<std::string>& root_joints() const { return m_root_joints; }
    const std::string& root_joint() const { return m_root_joints.front(); }
    bool contains_joint(const std::string& name) const;

    size_t size() const { return m_bones.size(); }
    size_t joint_count() const { return m_joint_names.size(); }

    void validate_against(const std::vector<std::string>& vocabulary) const;
};

// Bones drawn for ARKit body tracking, in table order
enum BONE {
    LEFT_SHOULDER_TO_LEFT_ARM,
    LEFT_ARM_TO_LEFT_FOREARM,
    LEFT_FOREARM_TO_LEFT_HAND,
    RIGHT_SHOULDER_TO_RIGHT_ARM,
    RIGHT_ARM_TO_RIGHT_FOREARM,
    RIGHT_FOREARM_TO_RIGHT_HAND,
    SPINE_7_TO_LEFT_SHOULDER,
    SPINE_7_TO_RIGHT_SHOULDER,
    NECK_1_TO_SPINE_7,
    SPINE_7_TO_SPINE_6,
    SPINE_6_TO_SPINE_5,
    HIPS_TO_LEFT_UP_LEG,
    LEFT_UP_LEG_TO_LEFT_LEG,
    LEFT_LEG_TO_LEFT_FOOT,
    HIPS_TO_RIGHT_UP_LEG,
    RIGHT_UP_LEG_TO_RIGHT_LEG,
    RIGHT_LEG_TO_RIGHT_FOOT,
    BONE_COUNT,
};

JointPairs arkit_body_joint_pairs();
const std::vector<std::string>& arkit_body_joint_names();
const SkeletonTopology& default_body_topology();

// Azure Kinect body tracking, 32 joints, single root at the pelvis
JointPairs azure_kinect_joint_pairs();
const std::vector<std::string>& azure_kinect_joint_names();
