#pragma once
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <rig/Configuration.hpp>
#include <rig/Errors.hpp>
#include <rig/Frame.hpp>
#include <rig/SkeletonRig.hpp>
#include <rig/Topology.hpp>

enum TRACKING_STATE {
    UNINITIALIZED,
    TRACKING,
};

/**
 * Owns the rig of one tracked subject. The first complete frame builds the
 * rig, later frames update it and tracking loss discards it. Reacquisition
 * builds a new rig, nothing is carried over.
 */
template <typename Value>
class SkeletonTracker {
    SkeletonTopology m_topology;
    std::vector<std::string> m_extra_joints;
    bool m_log_unknown_joints = true;

    std::optional<SkeletonRig<Value>> m_rig;
    size_t m_acquisitions = 0;
    size_t m_failed_constructions = 0;

    std::function<void(const SkeletonRig<Value>&)> m_on_acquired;
    std::function<void()> m_on_lost;

public:
    SkeletonTracker(const SkeletonTopology& topology, std::vector<std::string> extra_joints = {})
        : m_topology(topology)
        , m_extra_joints(extra_joints)
    {
    }

    SkeletonTracker(const RigConfiguration& configuration)
        : m_topology(configuration.build_topology())
        , m_extra_joints(configuration.extra_joints)
        , m_log_unknown_joints(configuration.log_unknown_joints)
    {
    }

    TRACKING_STATE state() const { return m_rig ? TRACKING : UNINITIALIZED; }
    bool is_tracking() const { return m_rig.has_value(); }

    // nullptr while no subject is tracked
    const SkeletonRig<Value>* rig() const { return m_rig ? &*m_rig : nullptr; }
    const SkeletonTopology& topology() const { return m_topology; }

    size_t acquisitions() const { return m_acquisitions; }
    size_t failed_constructions() const { return m_failed_constructions; }

    void set_on_acquired(std::function<void(const SkeletonRig<Value>&)> callback) { m_on_acquired = callback; }
    void set_on_lost(std::function<void()> callback) { m_on_lost = callback; }

    /**
     * Returns true if the frame reached a rig. An incomplete first frame
     * leaves the tracker uninitialized until a complete one arrives.
     */
    bool on_frame(const Frame<Value>& frame)
    {
        if (m_rig) {
            m_rig->update(frame);
            return true;
        }

        try {
            m_rig.emplace(m_topology, frame, m_extra_joints, m_log_unknown_joints);
        } catch (const MissingJointError& error) {
            ++m_failed_constructions;
            std::cerr << "Cannot build rig at " << frame.timestamp << "s: " << error.what() << std::endl;
            return false;
        }

        ++m_acquisitions;
        std::cout << "Tracking acquired at " << frame.timestamp << "s" << std::endl;
        if (m_on_acquired) {
            m_on_acquired(*m_rig);
        }
        return true;
    }

    void on_tracking_lost()
    {
        if (!m_rig) {
            return;
        }
        m_rig.reset();
        std::cout << "Tracking lost" << std::endl;
        if (m_on_lost) {
            m_on_lost();
        }
    }
};
