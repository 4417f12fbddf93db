#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <tclap/CmdLine.h>

#include <boost/archive/text_oarchive.hpp>

#include <rig/Configuration.hpp>
#include <rig/RigRecorder.hpp>
#include <rig/SkeletonTracker.hpp>
#include <rig/Utils.hpp>

int replay(const std::vector<Frame<double>>& frames, const std::vector<bool>& is_null,
    const RigConfiguration& configuration, RigRecorder<double>& recorder)
{
    SkeletonTracker<double> tracker(configuration);
    std::chrono::duration<double, std::milli> total(0);
    size_t updates = 0;

    for (size_t frame_idx = 0; frame_idx < frames.size(); ++frame_idx) {
        if (is_null[frame_idx]) {
            tracker.on_tracking_lost();
            continue;
        }

        auto start = std::chrono::high_resolution_clock::now();
        bool updated = tracker.on_frame(frames[frame_idx]);
        auto stop = std::chrono::high_resolution_clock::now();
        if (!updated) {
            continue;
        }
        total += stop - start;
        ++updates;
        recorder.save_step(*tracker.rig());
    }

    std::cout << "Frames: " << frames.size() << ", updates: " << updates
              << ", acquisitions: " << tracker.acquisitions()
              << ", incomplete frames: " << tracker.failed_constructions() << std::endl;
    if (updates > 0) {
        std::cout << "Mean update time: " << total.count() / updates << "ms" << std::endl;
    }
    return updates > 0 ? 0 : 1;
}

int main(int argc, char** argv)
{
    TCLAP::CmdLine cmd("Replay a recorded body tracking session through the skeleton rig.");

    TCLAP::ValueArg<std::string> in_file("i", "infile",
        "Recorded session (JSON)", true, "",
        "string");
    TCLAP::ValueArg<std::string> out_file("o", "outfile",
        "Rig output (JSON)", false, "rig_out.json",
        "string");
    TCLAP::ValueArg<std::string> archive_file("a", "archive",
        "Additionally write a boost text archive of the rig output", false, "",
        "string");
    TCLAP::ValueArg<std::string> config_file("c", "config",
        "Rig configuration (JSON), defaults to the ARKit body rig", false, "",
        "string");
    TCLAP::ValueArg<int> max_frames("m", "max-frames",
        "Only replay the first n frames", false, -1,
        "int");
    TCLAP::SwitchArg azure_kinect("k", "azure-kinect",
        "Input is Azure Kinect body tracking output", false);

    cmd.add(in_file);
    cmd.add(out_file);
    cmd.add(archive_file);
    cmd.add(config_file);
    cmd.add(max_frames);
    cmd.add(azure_kinect);
    cmd.parse(argc, argv);

    try {
        RigConfiguration configuration = azure_kinect.getValue()
            ? RigConfiguration::azure_kinect()
            : RigConfiguration::arkit_body();
        if (!config_file.getValue().empty()) {
            configuration = load_configuration(config_file.getValue());
        }

        auto [frames, n_frames, is_null] = azure_kinect.getValue()
            ? load_azure_kinect_recording(in_file.getValue(), max_frames.getValue())
            : load_recording(in_file.getValue(), max_frames.getValue());

        RigRecorder<double> recorder;
        recorder.set_rig_name(configuration.name);
        recorder.set_bone_diameter(configuration.bone_diameter);
        int result = replay(frames, is_null, configuration, recorder);

        recorder.write_to_json_file(out_file.getValue());
        std::cout << "Wrote " << recorder.frame_count() << " frames to " << out_file.getValue() << std::endl;

        if (!archive_file.getValue().empty()) {
            std::ofstream ofs(archive_file.getValue());
            boost::archive::text_oarchive oa(ofs);
            oa << recorder;
        }
        return result;
    } catch (const std::exception& error) {
        std::cerr << "replay_recording: " << error.what() << std::endl;
        return 2;
    }
}
