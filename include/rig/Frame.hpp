#pragma once
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include <rig/Transform.hpp>

using json = nlohmann::json;

/**
 * One update from the tracking source. Joint transforms are relative to the
 * skeleton root, root places the whole skeleton in world space. A frame
 * without a root keeps the root of the previous frame.
 */
template <typename Value>
struct Frame {
    Value timestamp = 0;
    std::optional<Transform<Value>> root;
    std::unordered_map<std::string, Transform<Value>> joints;

    Frame() = default;
    Frame(Value m_timestamp, std::optional<Transform<Value>> m_root = std::nullopt)
        : timestamp(m_timestamp)
        , root(m_root)
    {
    }

    void set(const std::string& name, const Transform<Value>& transform)
    {
        joints[name] = transform;
    }

    void set(const std::string& name, const Point<Value>& position)
    {
        joints[name] = Transform<Value>(position);
    }

    bool contains(const std::string& name) const
    {
        return joints.find(name) != joints.end();
    }
};

// Body part of a recorded frame, the timestamp lives next to it
template <typename Value>
void to_json(json& _json, const Frame<Value>& frame)
{
    _json = json::object();
    if (frame.root) {
        _json["root"] = *frame.root;
    }
    _json["joints"] = json::object();
    for (auto& [name, transform] : frame.joints) {
        _json["joints"][name] = transform;
    }
}

template <typename Value>
void from_json(const json& _json, Frame<Value>& frame)
{
    frame.root = std::nullopt;
    if (_json.contains("root")) {
        frame.root = _json["root"].get<Transform<Value>>();
    }
    frame.joints.clear();
    for (auto& [name, transform] : _json.at("joints").items()) {
        frame.joints[name] = transform.template get<Transform<Value>>();
    }
}
