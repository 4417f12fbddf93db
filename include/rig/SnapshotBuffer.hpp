#pragma once
#include <memory>
#include <mutex>
#include <utility>

#include <rig/RigSnapshot.hpp>
#include <rig/SkeletonRig.hpp>

/**
 * Hands complete rig frames from the tracking thread to readers on other
 * threads. Published snapshots are immutable, the lock only guards the
 * pointer swap.
 */
template <typename Value>
class SnapshotBuffer {
    mutable std::mutex m_mutex;
    std::shared_ptr<const RigSnapshot<Value>> m_current;

public:
    void publish(RigSnapshot<Value> snapshot)
    {
        auto next = std::make_shared<const RigSnapshot<Value>>(std::move(snapshot));
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current.swap(next);
    }

    void publish(const SkeletonRig<Value>& rig)
    {
        publish(rig.snapshot());
    }

    // Empty after clear() or before the first publish
    std::shared_ptr<const RigSnapshot<Value>> current() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

    void clear()
    {
        std::shared_ptr<const RigSnapshot<Value>> previous;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current.swap(previous);
    }
};
