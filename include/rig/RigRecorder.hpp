#pragma once
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <nlohmann/json.hpp>

#include <rig/Point.hpp>
#include <rig/SkeletonRig.hpp>

using json = nlohmann::json;

/**
 * Collects the rig output of every frame for later analysis. Joint and bone
 * values are relative to the skeleton root, roots holds the root position per
 * frame.
 */
template <typename Value>
class RigRecorder {

    typedef std::vector<std::vector<Point<Value>>> vvp;
    typedef std::vector<Point<Value>> vp;
    typedef std::vector<Value> vV;

    vV m_timestamps;
    vp m_roots;
    std::vector<std::string> m_joint_names;
    std::vector<std::string> m_bone_names;
    vvp m_joint_positions;
    vvp m_centers;
    // box size of the drawn bone, [d, d, length]
    vvp m_scales;
    std::vector<vV> m_lengths;
    // w, x, y, z per bone
    std::vector<std::vector<vV>> m_orientations;
    Value m_bone_diameter = 0.04;
    bool m_enabled;

    std::string m_rig_name = "Unset";

public:
    RigRecorder(bool enabled = true)
        : m_enabled(enabled)
    {
    }

    void save_step(const SkeletonRig<Value>& rig)
    {
        if (!m_enabled) {
            return;
        }
        if (m_bone_names.empty()) {
            m_joint_names = rig.joints().names();
            for (auto& bone : rig.topology().bones()) {
                m_bone_names.push_back(bone.name);
            }
        }

        m_timestamps.push_back(rig.last_timestamp());
        m_roots.push_back(rig.root_transform().position);

        vp joint_positions;
        for (size_t i = 0; i < rig.joints().size(); ++i) {
            joint_positions.push_back(rig.joints().transform_at(i).position);
        }
        m_joint_positions.push_back(joint_positions);

        vp centers;
        vp scales;
        vV lengths;
        std::vector<vV> orientations;
        for (auto& bone : rig.bones()) {
            centers.push_back(bone.center);
            scales.push_back(bone.scale(m_bone_diameter));
            lengths.push_back(bone.length);
            orientations.push_back(vV { bone.orientation.w(), bone.orientation.x(), bone.orientation.y(), bone.orientation.z() });
        }
        m_centers.push_back(centers);
        m_scales.push_back(scales);
        m_lengths.push_back(lengths);
        m_orientations.push_back(orientations);
    }

    bool recorder_enabled() const
    {
        return m_enabled;
    }

    void enable_recorder()
    {
        m_enabled = true;
    }

    void disable_recorder()
    {
        m_enabled = false;
    }

    size_t frame_count() const
    {
        return m_timestamps.size();
    }

    const vV& get_timestamps() const
    {
        return m_timestamps;
    }

    const vvp& get_centers() const
    {
        return m_centers;
    }

    const std::vector<vV>& get_lengths() const
    {
        return m_lengths;
    }

    const std::vector<std::string>& get_bone_names() const
    {
        return m_bone_names;
    }

    void set_bone_diameter(Value diameter)
    {
        m_bone_diameter = diameter;
    }

    const vvp& get_scales() const
    {
        return m_scales;
    }

    void set_rig_name(std::string name)
    {
        this->m_rig_name = name;
    }

    json to_json() const
    {
        json _json;
        _json["rig"] = m_rig_name;
        _json["frame_count"] = m_timestamps.size();
        _json["timestamps"] = m_timestamps;
        _json["roots"] = m_roots;
        _json["joint_names"] = m_joint_names;
        _json["bone_names"] = m_bone_names;
        _json["joint_positions"] = m_joint_positions;
        _json["centers"] = m_centers;
        _json["bone_diameter"] = m_bone_diameter;
        _json["scales"] = m_scales;
        _json["lengths"] = m_lengths;
        _json["orientations"] = m_orientations;
        return _json;
    }

    void write_to_json_file(std::string path) const
    {
        std::ofstream outfile(path);
        if (!outfile) {
            throw std::runtime_error("cannot write '" + path + "'");
        }
        outfile << to_json();
    }

    friend class boost::serialization::access;
    template <class Archive>
    void serialize(Archive& ar, const unsigned int version)
    {
        ar& m_timestamps;
        ar& m_roots;
        ar& m_joint_names;
        ar& m_bone_names;
        ar& m_joint_positions;
        ar& m_centers;
        ar& m_scales;
        ar& m_bone_diameter;
        ar& m_lengths;
        ar& m_orientations;
        ar& m_rig_name;
    }
};

template <typename Value>
void to_json(json& _json, const RigRecorder<Value>& recorder)
{
    _json = recorder.to_json();
}
