#pragma once
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <rig/Transform.hpp>

/**
 * Current transform of every joint in a fixed vocabulary.
 *
 * Writes for names outside the vocabulary are ignored, tracking sources
 * usually report more joints than a rig draws. Each unknown name is logged
 * once.
 */
template <typename Value>
class JointRegistry {
    std::vector<std::string> m_names;
    std::unordered_map<std::string, size_t> m_index;
    std::vector<Transform<Value>> m_transforms;
    std::vector<bool> m_is_set;
    std::unordered_set<std::string> m_reported_unknown;
    bool m_log_unknown = true;

public:
    JointRegistry(const std::vector<std::string>& names)
    {
        for (auto& name : names) {
            if (m_index.emplace(name, m_names.size()).second) {
                m_names.push_back(name);
            }
        }
        m_transforms.resize(m_names.size());
        m_is_set.resize(m_names.size(), false);
    }

    bool set_transform(const std::string& name, const Transform<Value>& transform)
    {
        auto it = m_index.find(name);
        if (it == m_index.end()) {
            if (m_log_unknown && m_reported_unknown.insert(name).second) {
                std::cerr << "Ignoring transform for unknown joint '" << name << "'" << std::endl;
            }
            return false;
        }
        m_transforms[it->second] = transform;
        m_is_set[it->second] = true;
        return true;
    }

    std::optional<Transform<Value>> get_transform(const std::string& name) const
    {
        auto it = m_index.find(name);
        if (it == m_index.end() || !m_is_set[it->second]) {
            return std::nullopt;
        }
        return m_transforms[it->second];
    }

    std::optional<size_t> index_of(const std::string& name) const
    {
        auto it = m_index.find(name);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const Transform<Value>& transform_at(size_t index) const { return m_transforms.at(index); }
    bool is_set(size_t index) const { return m_is_set.at(index); }
    bool contains(const std::string& name) const { return m_index.find(name) != m_index.end(); }

    const std::vector<std::string>& names() const { return m_names; }
    size_t size() const { return m_names.size(); }

    size_t set_count() const
    {
        size_t count = 0;
        for (bool is_set : m_is_set) {
            count += is_set ? 1 : 0;
        }
        return count;
    }

    void set_log_unknown(bool enabled) { m_log_unknown = enabled; }

    // Calls function(name, transform) for every joint that has a transform
    template <typename Function>
    void for_each(Function function) const
    {
        for (size_t i = 0; i < m_names.size(); ++i) {
            if (m_is_set[i]) {
                function(m_names[i], m_transforms[i]);
            }
        }
    }
};
