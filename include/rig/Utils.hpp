#pragma once
#include <string>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

#include <rig/Frame.hpp>

using json = nlohmann::json;

/**
 * Recorded session in the rig's own format:
 *   {"frames": [{"timestamp_usec": n, "body": null | {"root": .., "joints": {..}}}]}
 *
 * Returns frames, frame count and a flag per frame marking frames without a
 * body (tracking lost). Positions are multiplied by scale.
 */
std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
parse_recording(const json& data, int max_frames = -1, double scale = 1.0);

std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
load_recording(std::string path, int max_frames = -1, double scale = 1.0);

/**
 * Azure Kinect body tracking output, the first body of every frame with
 * joint_positions in millimeters, converted into meters. Joint names follow
 * azure_kinect_joint_names().
 */
std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
parse_azure_kinect_recording(const json& data, int max_frames = -1);

std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
load_azure_kinect_recording(std::string path, int max_frames = -1);

json read_json_file(const std::string& path);
