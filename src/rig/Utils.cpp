#include <fstream>
#include <iostream>
#include <stdexcept>

#include <rig/Topology.hpp>
#include <rig/Utils.hpp>

json read_json_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open '" + path + "'");
    }
    return json::parse(file);
}

std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
parse_recording(const json& data, int max_frames, double scale)
{
    auto& json_frames = data.at("frames");
    int n_frames = json_frames.size();

    // Only load until max_frames if sensible
    if (max_frames != -1 && max_frames <= n_frames) {
        n_frames = max_frames;
    }

    std::vector<Frame<double>> frames(n_frames);
    auto is_null = std::vector<bool>(n_frames, false);

    for (int i = 0; i < n_frames; ++i) {
        auto& json_frame = json_frames[i];
        frames[i].timestamp = json_frame.at("timestamp_usec").get<double>() * 1e-6;

        if (!json_frame.contains("body") || json_frame["body"].is_null()) {
            is_null[i] = true;
            continue;
        }

        double timestamp = frames[i].timestamp;
        frames[i] = json_frame["body"].get<Frame<double>>();
        frames[i].timestamp = timestamp;
        if (scale != 1.0) {
            if (frames[i].root) {
                frames[i].root->position = frames[i].root->position * scale;
            }
            for (auto& [_, transform] : frames[i].joints) {
                transform.position = transform.position * scale;
            }
        }
    }

    return { frames, n_frames, is_null };
}

std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
load_recording(std::string path, int max_frames, double scale)
{
    return parse_recording(read_json_file(path), max_frames, scale);
}

std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
parse_azure_kinect_recording(const json& data, int max_frames)
{
    auto& joint_names = azure_kinect_joint_names();
    int joint_count = joint_names.size();

    auto& json_frames = data.at("frames");
    int n_frames = json_frames.size();
    if (max_frames != -1 && max_frames <= n_frames) {
        n_frames = max_frames;
    }

    std::vector<Frame<double>> frames(n_frames);
    auto is_null = std::vector<bool>(n_frames, false);

    for (int i = 0; i < n_frames; ++i) {
        auto& json_frame = json_frames[i];
        frames[i].timestamp = json_frame.at("timestamp_usec").get<double>() * 1e-6;

        auto& bodies = json_frame.at("bodies");
        if (bodies.empty() || bodies[0].is_null()) {
            is_null[i] = true;
            std::cout << "Did find null, continue." << std::endl;
            continue;
        }

        auto& joint_positions = bodies[0].at("joint_positions");
        bool has_orientations = bodies[0].contains("joint_orientations");
        for (int j = 0; j < joint_count; ++j) {
            Transform<double> transform;
            transform.position = Point<double>(
                joint_positions.at(j).at(0).get<double>(),
                joint_positions.at(j).at(1).get<double>(),
                joint_positions.at(j).at(2).get<double>())
                / 1000.0;
            if (has_orientations) {
                auto& orientation = bodies[0]["joint_orientations"].at(j);
                transform.rotation = Eigen::Quaterniond(
                    orientation.at(0).get<double>(), orientation.at(1).get<double>(),
                    orientation.at(2).get<double>(), orientation.at(3).get<double>());
                transform.rotation.normalize();
            }
            frames[i].joints[joint_names[j]] = transform;
        }
    }

    return { frames, n_frames, is_null };
}

std::tuple<std::vector<Frame<double>>, int, std::vector<bool>>
load_azure_kinect_recording(std::string path, int max_frames)
{
    return parse_azure_kinect_recording(read_json_file(path), max_frames);
}
