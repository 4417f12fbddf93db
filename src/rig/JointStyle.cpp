#include <set>

#include <rig/JointStyle.hpp>
#include <rig/Topology.hpp>

Point<double> marker_rgb(MARKER_COLOR color)
{
    switch (color) {
    case GREEN:
        return Point<double>(0.0, 1.0, 0.0);
    case YELLOW:
        return Point<double>(1.0, 1.0, 0.0);
    case WHITE:
    default:
        return Point<double>(1.0, 1.0, 1.0);
    }
}

bool operator==(const JointStyle& lhs, const JointStyle& rhs)
{
    return lhs.radius == rhs.radius && lhs.color == rhs.color;
}

void JointStyleTable::set(const std::string& joint_name, JointStyle style)
{
    m_styles[joint_name] = style;
}

const JointStyle& JointStyleTable::style(const std::string& joint_name) const
{
    auto it = m_styles.find(joint_name);
    if (it == m_styles.end()) {
        return m_default;
    }
    return it->second;
}

static bool starts_with(const std::string& value, const std::string& prefix)
{
    return value.compare(0, prefix.size(), prefix) == 0;
}

JointStyleTable JointStyleTable::arkit_body(double base_radius)
{
    const std::set<std::string> neck_and_shoulders = {
        "neck_1_joint", "neck_2_joint", "neck_3_joint", "neck_4_joint", "head_joint",
        "left_shoulder_1_joint", "right_shoulder_1_joint"
    };
    const std::set<std::string> face = {
        "jaw_joint", "chin_joint", "left_eye_joint", "left_eyeLowerLid_joint",
        "left_eyeUpperLid_joint", "left_eyeball_joint", "nose_joint",
        "right_eye_joint", "right_eyeLowerLid_joint", "right_eyeUpperLid_joint",
        "right_eyeball_joint"
    };

    JointStyleTable table(JointStyle { base_radius, GREEN });
    for (auto& joint : arkit_body_joint_names()) {
        JointStyle style { base_radius, GREEN };
        if (neck_and_shoulders.count(joint)) {
            style.radius = base_radius * 0.5;
        } else if (face.count(joint)) {
            style = { base_radius * 0.2, YELLOW };
        } else if (starts_with(joint, "spine_")) {
            style.radius = base_radius * 0.75;
        } else if (joint == "left_hand_joint" || joint == "right_hand_joint") {
            // wrists keep the full marker
        } else if (starts_with(joint, "left_hand") || starts_with(joint, "right_hand")) {
            style = { base_radius * 0.25, YELLOW };
        } else if (starts_with(joint, "left_toes") || starts_with(joint, "right_toes")) {
            style = { base_radius * 0.5, YELLOW };
        }
        table.set(joint, style);
    }
    return table;
}
