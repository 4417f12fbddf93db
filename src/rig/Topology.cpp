#include <algorithm>
#include <rig/Topology.hpp>

bool operator==(const BoneDefinition& lhs, const BoneDefinition& rhs)
{
    return lhs.name == rhs.name && lhs.from == rhs.from && lhs.to == rhs.to;
}

SkeletonTopology::SkeletonTopology(const JointPairs& joint_pairs, bool require_single_root)
{
    std::unordered_map<std::string, std::string> parent_of;

    auto add_joint = [this](const std::string& joint) {
        if (m_joints.insert(joint).second) {
            m_joint_names.push_back(joint);
        }
    };

    for (auto& [from, to] : joint_pairs) {
        if (from.empty() || to.empty()) {
            throw InvalidTopologyError("bone with empty joint name");
        }
        if (from == to) {
            throw InvalidTopologyError("bone connects joint '" + from + "' to itself");
        }
        auto name = bone_name(from, to);
        if (m_bone_index.find(name) != m_bone_index.end()) {
            throw InvalidTopologyError("bone '" + name + "' is listed twice");
        }
        auto [it, inserted] = parent_of.emplace(to, from);
        if (!inserted) {
            throw InvalidTopologyError("joint '" + to + "' has two parents: '" + it->second + "' and '" + from + "'");
        }

        m_bone_index.emplace(name, m_bones.size());
        m_bones.push_back(BoneDefinition { name, from, to });
        add_joint(from);
        add_joint(to);
    }

    // With at most one parent per joint, walking up from any joint either
    // reaches a root or revisits a joint.
    for (auto& joint : m_joint_names) {
        if (parent_of.find(joint) == parent_of.end()) {
            m_root_joints.push_back(joint);
            continue;
        }
        std::string current = joint;
        size_t steps = 0;
        for (auto it = parent_of.find(current); it != parent_of.end(); it = parent_of.find(current)) {
            current = it->second;
            if (++steps > m_joint_names.size()) {
                throw InvalidTopologyError("bones form a cycle through joint '" + joint + "'");
            }
        }
    }

    if (m_bones.empty()) {
        throw InvalidTopologyError("topology has no bones");
    }
    if (require_single_root && m_root_joints.size() != 1) {
        throw InvalidTopologyError("topology needs exactly one root joint, found " + std::to_string(m_root_joints.size()));
    }
}

std::string SkeletonTopology::bone_name(const std::string& from, const std::string& to)
{
    return from + "-" + to;
}

const BoneDefinition& SkeletonTopology::bone(const std::string& name) const
{
    auto it = m_bone_index.find(name);
    if (it == m_bone_index.end()) {
        throw std::out_of_range("unknown bone '" + name + "'");
    }
    return m_bones[it->second];
}

std::optional<size_t> SkeletonTopology::bone_index(const std::string& name) const
{
    auto it = m_bone_index.find(name);
    if (it == m_bone_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SkeletonTopology::contains_joint(const std::string& name) const
{
    return m_joints.find(name) != m_joints.end();
}

void SkeletonTopology::validate_against(const std::vector<std::string>& vocabulary) const
{
    std::unordered_set<std::string> known(vocabulary.begin(), vocabulary.end());
    for (auto& joint : m_joint_names) {
        if (known.find(joint) == known.end()) {
            throw InvalidTopologyError("joint '" + joint + "' is not part of the tracking vocabulary");
        }
    }
}

JointPairs arkit_body_joint_pairs()
{
    return {
        { "left_shoulder_1_joint", "left_arm_joint" },
        { "left_arm_joint", "left_forearm_joint" },
        { "left_forearm_joint", "left_hand_joint" },

        { "right_shoulder_1_joint", "right_arm_joint" },
        { "right_arm_joint", "right_forearm_joint" },
        { "right_forearm_joint", "right_hand_joint" },

        { "spine_7_joint", "left_shoulder_1_joint" },
        { "spine_7_joint", "right_shoulder_1_joint" },

        { "neck_1_joint", "spine_7_joint" },
        { "spine_7_joint", "spine_6_joint" },
        { "spine_6_joint", "spine_5_joint" },

        { "hips_joint", "left_upLeg_joint" },
        { "left_upLeg_joint", "left_leg_joint" },
        { "left_leg_joint", "left_foot_joint" },

        { "hips_joint", "right_upLeg_joint" },
        { "right_upLeg_joint", "right_leg_joint" },
        { "right_leg_joint", "right_foot_joint" },
    };
}

static std::vector<std::string> arkit_hand_joints(const std::string& side)
{
    std::vector<std::string> joints;
    for (std::string finger : { "Index", "Mid", "Pinky", "Ring" }) {
        joints.push_back(side + "_hand" + finger + "Start_joint");
        for (int i = 1; i <= 3; ++i) {
            joints.push_back(side + "_hand" + finger + "_" + std::to_string(i) + "_joint");
        }
        joints.push_back(side + "_hand" + finger + "End_joint");
    }
    joints.push_back(side + "_handThumbStart_joint");
    joints.push_back(side + "_handThumb_1_joint");
    joints.push_back(side + "_handThumb_2_joint");
    joints.push_back(side + "_handThumbEnd_joint");
    return joints;
}

const std::vector<std::string>& arkit_body_joint_names()
{
    static const std::vector<std::string> names = [] {
        std::vector<std::string> names = {
            "root",
            "hips_joint",
            "left_upLeg_joint",
            "left_leg_joint",
            "left_foot_joint",
            "left_toes_joint",
            "left_toesEnd_joint",
            "right_upLeg_joint",
            "right_leg_joint",
            "right_foot_joint",
            "right_toes_joint",
            "right_toesEnd_joint",
            "spine_1_joint",
            "spine_2_joint",
            "spine_3_joint",
            "spine_4_joint",
            "spine_5_joint",
            "spine_6_joint",
            "spine_7_joint",
            "left_shoulder_1_joint",
            "left_arm_joint",
            "left_forearm_joint",
            "left_hand_joint",
        };
        auto left_hand = arkit_hand_joints("left");
        names.insert(names.end(), left_hand.begin(), left_hand.end());

        for (auto joint : { "neck_1_joint", "neck_2_joint", "neck_3_joint", "neck_4_joint",
                 "head_joint", "jaw_joint", "chin_joint",
                 "left_eye_joint", "left_eyeLowerLid_joint", "left_eyeUpperLid_joint", "left_eyeball_joint",
                 "nose_joint",
                 "right_eye_joint", "right_eyeLowerLid_joint", "right_eyeUpperLid_joint", "right_eyeball_joint",
                 "right_shoulder_1_joint", "right_arm_joint", "right_forearm_joint", "right_hand_joint" }) {
            names.push_back(joint);
        }
        auto right_hand = arkit_hand_joints("right");
        names.insert(names.end(), right_hand.begin(), right_hand.end());
        return names;
    }();
    return names;
}

const SkeletonTopology& default_body_topology()
{
    static const SkeletonTopology topology = [] {
        SkeletonTopology topology(arkit_body_joint_pairs());
        topology.validate_against(arkit_body_joint_names());
        return topology;
    }();
    return topology;
}

JointPairs azure_kinect_joint_pairs()
{
    return {
        { "pelvis", "spine_navel" },
        { "spine_navel", "spine_chest" },
        { "spine_chest", "neck" },
        { "spine_chest", "clavicle_left" },
        { "clavicle_left", "shoulder_left" },
        { "shoulder_left", "elbow_left" },
        { "elbow_left", "wrist_left" },
        { "wrist_left", "hand_left" },
        { "hand_left", "handtip_left" },
        { "wrist_left", "thumb_left" },
        { "spine_chest", "clavicle_right" },
        { "clavicle_right", "shoulder_right" },
        { "shoulder_right", "elbow_right" },
        { "elbow_right", "wrist_right" },
        { "wrist_right", "hand_right" },
        { "hand_right", "handtip_right" },
        { "wrist_right", "thumb_right" },
        { "pelvis", "hip_left" },
        { "hip_left", "knee_left" },
        { "knee_left", "ankle_left" },
        { "ankle_left", "foot_left" },
        { "pelvis", "hip_right" },
        { "hip_right", "knee_right" },
        { "knee_right", "ankle_right" },
        { "ankle_right", "foot_right" },
        { "neck", "head" },
        { "head", "nose" },
        { "head", "eye_left" },
        { "head", "ear_left" },
        { "head", "eye_right" },
        { "head", "ear_right" },
    };
}

const std::vector<std::string>& azure_kinect_joint_names()
{
    // Same order as the sensor's joint indices
    static const std::vector<std::string> names = {
        "pelvis",
        "spine_navel",
        "spine_chest",
        "neck",
        "clavicle_left",
        "shoulder_left",
        "elbow_left",
        "wrist_left",
        "hand_left",
        "handtip_left",
        "thumb_left",
        "clavicle_right",
        "shoulder_right",
        "elbow_right",
        "wrist_right",
        "hand_right",
        "handtip_right",
        "thumb_right",
        "hip_left",
        "knee_left",
        "ankle_left",
        "foot_left",
        "hip_right",
        "knee_right",
        "ankle_right",
        "foot_right",
        "head",
        "nose",
        "eye_left",
        "ear_left",
        "eye_right",
        "ear_right",
    };
    return names;
}
