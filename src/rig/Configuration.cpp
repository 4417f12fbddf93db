#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <rig/Configuration.hpp>

SkeletonTopology RigConfiguration::build_topology() const
{
    SkeletonTopology topology(joint_pairs, require_single_root);
    if (!vocabulary.empty()) {
        topology.validate_against(vocabulary);
        for (auto& joint : extra_joints) {
            if (std::find(vocabulary.begin(), vocabulary.end(), joint) == vocabulary.end()) {
                throw InvalidTopologyError("extra joint '" + joint + "' is not part of the tracking vocabulary");
            }
        }
    }
    return topology;
}

RigConfiguration RigConfiguration::arkit_body()
{
    return RigConfiguration();
}

RigConfiguration RigConfiguration::azure_kinect()
{
    RigConfiguration configuration;
    configuration.name = "azure_kinect";
    configuration.joint_pairs = azure_kinect_joint_pairs();
    configuration.vocabulary = azure_kinect_joint_names();
    configuration.require_single_root = true;
    return configuration;
}

void to_json(json& _json, const RigConfiguration& configuration)
{
    _json = json::object();
    _json["name"] = configuration.name;
    _json["bones"] = json::array();
    for (auto& [from, to] : configuration.joint_pairs) {
        _json["bones"].push_back({ from, to });
    }
    _json["extra_joints"] = configuration.extra_joints;
    _json["vocabulary"] = configuration.vocabulary;
    _json["require_single_root"] = configuration.require_single_root;
    _json["log_unknown_joints"] = configuration.log_unknown_joints;
    _json["bone_diameter"] = configuration.bone_diameter;
}

/**
 * Starts from the preset named by "preset" (arkit or azure_kinect, default
 * arkit) and overrides every field present in the document.
 */
void from_json(const json& _json, RigConfiguration& configuration)
{
    auto preset = _json.value("preset", std::string("arkit"));
    if (preset == "arkit") {
        configuration = RigConfiguration::arkit_body();
    } else if (preset == "azure_kinect") {
        configuration = RigConfiguration::azure_kinect();
    } else {
        throw std::invalid_argument("unknown rig preset '" + preset + "'");
    }

    configuration.name = _json.value("name", configuration.name);
    if (_json.contains("bones")) {
        configuration.joint_pairs.clear();
        for (auto& bone : _json["bones"]) {
            configuration.joint_pairs.emplace_back(bone.at(0).get<std::string>(), bone.at(1).get<std::string>());
        }
    }
    if (_json.contains("extra_joints")) {
        configuration.extra_joints = _json["extra_joints"].get<std::vector<std::string>>();
    }
    if (_json.contains("vocabulary")) {
        configuration.vocabulary = _json["vocabulary"].get<std::vector<std::string>>();
    }
    configuration.require_single_root = _json.value("require_single_root", configuration.require_single_root);
    configuration.log_unknown_joints = _json.value("log_unknown_joints", configuration.log_unknown_joints);
    configuration.bone_diameter = _json.value("bone_diameter", configuration.bone_diameter);
}

RigConfiguration load_configuration(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open rig configuration '" + path + "'");
    }
    json data = json::parse(file);
    return data.get<RigConfiguration>();
}
