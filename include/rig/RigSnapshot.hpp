#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <rig/BoneGeometry.hpp>
#include <rig/Topology.hpp>
#include <rig/Transform.hpp>

using json = nlohmann::json;

// Immutable copy of one complete rig frame
template <typename Value>
struct RigSnapshot {
    Value timestamp = 0;
    size_t frame = 0;
    Transform<Value> root;
    std::vector<std::pair<std::string, Transform<Value>>> joints;
    std::vector<std::pair<BoneDefinition, BoneGeometry<Value>>> bones;

    std::optional<BoneGeometry<Value>> bone(const std::string& name) const
    {
        for (auto& [definition, geometry] : bones) {
            if (definition.name == name) {
                return geometry;
            }
        }
        return std::nullopt;
    }
};

template <typename Value>
void to_json(json& _json, const RigSnapshot<Value>& snapshot)
{
    _json = json::object();
    _json["timestamp"] = snapshot.timestamp;
    _json["frame"] = snapshot.frame;
    _json["root"] = snapshot.root;
    _json["joints"] = json::object();
    for (auto& [name, transform] : snapshot.joints) {
        _json["joints"][name] = transform;
    }
    _json["bones"] = json::object();
    for (auto& [definition, geometry] : snapshot.bones) {
        _json["bones"][definition.name] = geometry;
    }
}
