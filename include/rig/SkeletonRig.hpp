#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <rig/BoneGeometry.hpp>
#include <rig/Errors.hpp>
#include <rig/Frame.hpp>
#include <rig/JointRegistry.hpp>
#include <rig/RigSnapshot.hpp>
#include <rig/Topology.hpp>
#include <rig/Transform.hpp>

/**
 * One tracked subject: the joint registry and the bone cache derived from it.
 *
 * Construction needs a transform for every joint of the topology and throws
 * MissingJointError naming the first one that is missing. After that, update
 * overwrites the joints present in a frame and recomputes every bone from the
 * registry, joints absent from the frame keep their previous transform and
 * a frame without a root keeps the previous root.
 *
 * Not thread safe, update and reads are expected on the same frame loop. Use
 * SnapshotBuffer to hand frames to another thread.
 */
template <typename Value>
class SkeletonRig {
    SkeletonTopology m_topology;
    JointRegistry<Value> m_joints;
    // (from, to) registry indices per bone, topology order
    std::vector<std::pair<size_t, size_t>> m_bone_joints;
    std::vector<BoneGeometry<Value>> m_bones;
    Transform<Value> m_root;
    Value m_last_timestamp = 0;
    size_t m_frame_count = 0;
    // bone indices follow the BONE enum
    bool m_default_layout = false;

    static std::vector<std::string> vocabulary(const SkeletonTopology& topology, const std::vector<std::string>& extra_joints)
    {
        std::vector<std::string> names = topology.joint_names();
        names.insert(names.end(), extra_joints.begin(), extra_joints.end());
        return names;
    }

    void derive_bones()
    {
        for (size_t i = 0; i < m_bone_joints.size(); ++i) {
            auto [from, to] = m_bone_joints[i];
            m_bones[i] = derive_bone_geometry(m_joints.transform_at(from), m_joints.transform_at(to));
        }
    }

    void write_joints(const Frame<Value>& frame)
    {
        for (auto& [name, transform] : frame.joints) {
            m_joints.set_transform(name, transform);
        }
        if (frame.root) {
            m_root = *frame.root;
        }
        m_last_timestamp = frame.timestamp;
    }

public:
    SkeletonRig(const SkeletonTopology& topology, const Frame<Value>& initial_frame,
        const std::vector<std::string>& extra_joints = {}, bool log_unknown_joints = true)
        : m_topology(topology)
        , m_joints(vocabulary(topology, extra_joints))
    {
        m_joints.set_log_unknown(log_unknown_joints);
        for (auto& joint : m_topology.joint_names()) {
            if (!initial_frame.contains(joint)) {
                throw MissingJointError(joint);
            }
        }

        m_bone_joints.reserve(m_topology.size());
        for (auto& bone : m_topology.bones()) {
            m_bone_joints.emplace_back(*m_joints.index_of(bone.from), *m_joints.index_of(bone.to));
        }
        m_bones.resize(m_topology.size());
        m_default_layout = m_topology.bones() == default_body_topology().bones();

        write_joints(initial_frame);
        derive_bones();
        m_frame_count = 1;
    }

    void update(const Frame<Value>& frame)
    {
        write_joints(frame);
        derive_bones();
        ++m_frame_count;
    }

    const SkeletonTopology& topology() const { return m_topology; }
    const JointRegistry<Value>& joints() const { return m_joints; }

    // Bone geometry in topology order, relative to the skeleton root
    const std::vector<BoneGeometry<Value>>& bones() const { return m_bones; }
    const BoneGeometry<Value>& bone_at(size_t index) const { return m_bones.at(index); }

    std::optional<BoneGeometry<Value>> bone(const std::string& name) const
    {
        auto index = m_topology.bone_index(name);
        if (!index) {
            return std::nullopt;
        }
        return m_bones[*index];
    }

    // Empty unless the rig uses the default body table
    std::optional<BoneGeometry<Value>> bone(BONE bone) const
    {
        auto index = static_cast<size_t>(bone);
        if (!m_default_layout || index >= m_bones.size()) {
            return std::nullopt;
        }
        return m_bones[index];
    }

    std::optional<Transform<Value>> joint_transform(const std::string& name) const
    {
        return m_joints.get_transform(name);
    }

    std::optional<Transform<Value>> joint_world_transform(const std::string& name) const
    {
        auto transform = m_joints.get_transform(name);
        if (!transform) {
            return std::nullopt;
        }
        return m_root * *transform;
    }

    // Bone placement in world space, derived from the world joint positions
    BoneGeometry<Value> world_bone_at(size_t index) const
    {
        auto [from, to] = m_bone_joints.at(index);
        return derive_bone_geometry(
            m_root.apply(m_joints.transform_at(from).position),
            m_root.apply(m_joints.transform_at(to).position));
    }

    const Transform<Value>& root_transform() const { return m_root; }
    Point<Value> world_position(const Point<Value>& point) const { return m_root.apply(point); }

    size_t frame_count() const { return m_frame_count; }
    Value last_timestamp() const { return m_last_timestamp; }

    RigSnapshot<Value> snapshot() const
    {
        RigSnapshot<Value> snapshot;
        snapshot.timestamp = m_last_timestamp;
        snapshot.frame = m_frame_count;
        snapshot.root = m_root;
        snapshot.joints.reserve(m_joints.size());
        m_joints.for_each([&snapshot](const std::string& name, const Transform<Value>& transform) {
            snapshot.joints.emplace_back(name, transform);
        });
        snapshot.bones.reserve(m_bones.size());
        for (size_t i = 0; i < m_bones.size(); ++i) {
            snapshot.bones.emplace_back(m_topology.bones()[i], m_bones[i]);
        }
        return snapshot;
    }
};
