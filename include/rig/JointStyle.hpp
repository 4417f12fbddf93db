#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <rig/Point.hpp>

enum MARKER_COLOR {
    WHITE,
    GREEN,
    YELLOW,
};

Point<double> marker_rgb(MARKER_COLOR color);

struct JointStyle {
    double radius = 0.05;
    MARKER_COLOR color = GREEN;
};

bool operator==(const JointStyle& lhs, const JointStyle& rhs);

/**
 * How the renderer draws joint markers. Kept apart from the topology so that
 * drawing style never decides which joints or bones exist.
 */
class JointStyleTable {
    std::unordered_map<std::string, JointStyle> m_styles;
    JointStyle m_default;

public:
    JointStyleTable(JointStyle default_style = JointStyle())
        : m_default(default_style)
    {
    }

    void set(const std::string& joint_name, JointStyle style);
    const JointStyle& style(const std::string& joint_name) const;
    const JointStyle& default_style() const { return m_default; }
    size_t size() const { return m_styles.size(); }

    // Smaller markers for neck, face, fingers and toes of the ARKit body
    static JointStyleTable arkit_body(double base_radius = 0.05);
};
