#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>

#include <rig/Configuration.hpp>
#include <rig/RigRecorder.hpp>
#include <rig/SkeletonTracker.hpp>
#include <rig/Utils.hpp>

#include "test_frames.hpp"

static json two_bone_recording()
{
    return json::parse(R"({
        "frames": [
            { "timestamp_usec": 0,
              "body": { "root": { "position": [1, 0, 0] },
                        "joints": { "a": { "position": [0, 0, 0] },
                                    "b": { "position": [0, 2, 0] },
                                    "c": [1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, 0, 2, 2, 1] } } },
            { "timestamp_usec": 33333, "body": null },
            { "timestamp_usec": 66666,
              "body": { "joints": { "a": { "position": [0, 0, 0], "rotation": [1, 0, 0, 0] },
                                    "b": { "position": [0, 0, 4] },
                                    "c": { "position": [0, 0, 6], "scale": [1, 1, 1] } } } }
        ]
    })");
}

TEST(ParseRecording, BasicAssertions)
{
    auto [frames, n_frames, is_null] = parse_recording(two_bone_recording());
    EXPECT_EQ(n_frames, 3);
    ASSERT_EQ(frames.size(), 3);
    std::vector<bool> expected_null = { false, true, false };
    EXPECT_EQ(is_null, expected_null);

    EXPECT_EQ(frames[0].timestamp, 0.0);
    EXPECT_NEAR(frames[1].timestamp, 0.033333, 1e-9);
    ASSERT_TRUE(frames[0].root.has_value());
    EXPECT_EQ(frames[0].root->position, Point<double>(1, 0, 0));
    EXPECT_EQ(frames[0].joints.at("b").position, Point<double>(0, 2, 0));
    EXPECT_EQ(frames[0].joints.at("c").position, Point<double>(0, 2, 2));
    EXPECT_EQ(frames[2].joints.at("b").position, Point<double>(0, 0, 4));
    // no root in the body, the rig keeps its previous one
    EXPECT_FALSE(frames[2].root.has_value());
}

TEST(ParseRecordingMaxFramesAndScale, BasicAssertions)
{
    auto [frames, n_frames, is_null] = parse_recording(two_bone_recording(), 1, 0.5);
    EXPECT_EQ(n_frames, 1);
    ASSERT_EQ(frames.size(), 1);
    EXPECT_EQ(frames[0].joints.at("b").position, Point<double>(0, 1, 0));
    EXPECT_EQ(frames[0].root->position, Point<double>(0.5, 0, 0));
}

TEST(ReplayRecordingThroughTracker, BasicAssertions)
{
    auto [frames, n_frames, is_null] = parse_recording(two_bone_recording());
    SkeletonTracker<double> tracker(SkeletonTopology(JointPairs { { "a", "b" }, { "b", "c" } }));
    RigRecorder<double> recorder;

    for (int i = 0; i < n_frames; ++i) {
        if (is_null[i]) {
            tracker.on_tracking_lost();
            continue;
        }
        ASSERT_TRUE(tracker.on_frame(frames[i]));
        recorder.save_step(*tracker.rig());
    }

    EXPECT_EQ(tracker.acquisitions(), 2);
    ASSERT_EQ(recorder.frame_count(), 2);
    EXPECT_EQ(recorder.get_lengths()[0][0], 2.0);
    EXPECT_EQ(recorder.get_lengths()[1][0], 4.0);
    EXPECT_EQ(recorder.get_centers()[1][1], Point<double>(0, 0, 5));

    auto _json = recorder.to_json();
    EXPECT_EQ(_json["frame_count"], 2);
    EXPECT_EQ(_json["timestamps"].size(), 2);
    EXPECT_EQ(_json["centers"].size(), 2);
    EXPECT_EQ(_json["orientations"][0].size(), 2);
    EXPECT_EQ(_json["bone_names"][1], "b-c");

    json auto_json = recorder;
    EXPECT_EQ(auto_json, _json);
}

TEST(RecorderDisabled, BasicAssertions)
{
    auto& topology = default_body_topology();
    SkeletonRig<double> rig(topology, complete_frame(topology));
    RigRecorder<double> recorder(false);
    EXPECT_FALSE(recorder.recorder_enabled());
    recorder.save_step(rig);
    EXPECT_EQ(recorder.frame_count(), 0);
    recorder.enable_recorder();
    recorder.save_step(rig);
    EXPECT_EQ(recorder.frame_count(), 1);

    recorder.disable_recorder();
    rig.update(complete_frame(topology, 1.0));
    recorder.save_step(rig);
    EXPECT_EQ(recorder.frame_count(), 1);
    EXPECT_EQ(recorder.get_timestamps(), std::vector<double> { 0.0 });
}

TEST(RecorderBoneScales, BasicAssertions)
{
    SkeletonTopology topology(JointPairs { { "a", "b" } });
    Frame<double> frame(0.0);
    frame.set("a", Point<double>(0, 0, 0));
    frame.set("b", Point<double>(0, 3, 0));
    SkeletonRig<double> rig(topology, frame);

    RigRecorder<double> recorder;
    recorder.set_bone_diameter(RigConfiguration::arkit_body().bone_diameter);
    recorder.save_step(rig);
    EXPECT_EQ(recorder.get_scales()[0][0], Point<double>(0.04, 0.04, 3));

    auto _json = recorder.to_json();
    EXPECT_EQ(_json["bone_diameter"], 0.04);
    EXPECT_EQ(_json["scales"][0][0][2], 3.0);
}

TEST(RecorderBoostArchive, BasicAssertions)
{
    auto& topology = default_body_topology();
    SkeletonRig<double> rig(topology, complete_frame(topology, 0.0));
    RigRecorder<double> recorder;
    recorder.set_rig_name("arkit");
    recorder.save_step(rig);
    rig.update(complete_frame(topology, 0.5, 1.0));
    recorder.save_step(rig);

    std::stringstream stream;
    {
        boost::archive::text_oarchive oa(stream);
        oa << recorder;
    }
    RigRecorder<double> restored;
    {
        boost::archive::text_iarchive ia(stream);
        ia >> restored;
    }
    EXPECT_EQ(restored.frame_count(), 2);
    EXPECT_EQ(restored.get_bone_names(), recorder.get_bone_names());
    EXPECT_EQ(restored.to_json()["rig"], "arkit");
}

TEST(ParseAzureKinectRecording, BasicAssertions)
{
    json body;
    body["body_id"] = 1;
    body["joint_positions"] = json::array();
    body["joint_orientations"] = json::array();
    for (int j = 0; j < 32; ++j) {
        body["joint_positions"].push_back({ 1000.0 * j, 2000.0, -500.0 });
        body["joint_orientations"].push_back({ 1.0, 0.0, 0.0, 0.0 });
    }
    json data;
    data["frames"] = json::array();
    data["frames"].push_back({ { "timestamp_usec", 1000000 }, { "bodies", json::array({ body }) } });
    data["frames"].push_back({ { "timestamp_usec", 1033333 }, { "bodies", json::array() } });

    auto [frames, n_frames, is_null] = parse_azure_kinect_recording(data);
    EXPECT_EQ(n_frames, 2);
    EXPECT_FALSE(is_null[0]);
    EXPECT_TRUE(is_null[1]);
    EXPECT_DOUBLE_EQ(frames[0].timestamp, 1.0);
    EXPECT_EQ(frames[0].joints.size(), 32);
    // millimeters into meters
    EXPECT_EQ(frames[0].joints.at("pelvis").position, Point<double>(0, 2, -0.5));
    EXPECT_EQ(frames[0].joints.at("spine_navel").position, Point<double>(1, 2, -0.5));

    SkeletonTracker<double> tracker(RigConfiguration::azure_kinect());
    EXPECT_TRUE(tracker.on_frame(frames[0]));
    EXPECT_EQ(tracker.rig()->bone("pelvis-spine_navel")->length, 1.0);
}

TEST(ParseAzureKinectRecordingMalformedRows, BasicAssertions)
{
    json body;
    body["joint_positions"] = json::array();
    for (int j = 0; j < 32; ++j) {
        body["joint_positions"].push_back({ 1.0, 2.0 });
    }
    json data;
    data["frames"] = json::array();
    data["frames"].push_back({ { "timestamp_usec", 0 }, { "bodies", json::array({ body }) } });
    EXPECT_THROW(parse_azure_kinect_recording(data), json::out_of_range);

    for (auto& position : body["joint_positions"]) {
        position.push_back(3.0);
    }
    body["joint_orientations"] = json::array();
    for (int j = 0; j < 32; ++j) {
        body["joint_orientations"].push_back({ 1.0, 0.0, 0.0 });
    }
    data["frames"][0]["bodies"][0] = body;
    EXPECT_THROW(parse_azure_kinect_recording(data), json::out_of_range);

    // fewer joints than the sensor reports
    body["joint_positions"].erase(31);
    body.erase("joint_orientations");
    data["frames"][0]["bodies"][0] = body;
    EXPECT_THROW(parse_azure_kinect_recording(data), json::out_of_range);
}

TEST(ConfigurationJson, BasicAssertions)
{
    auto configuration = json::parse(R"({
        "preset": "arkit",
        "name": "arms",
        "bones": [["left_shoulder_1_joint", "left_arm_joint"], ["left_arm_joint", "left_forearm_joint"]],
        "extra_joints": ["head_joint"],
        "bone_diameter": 0.02
    })").get<RigConfiguration>();

    EXPECT_EQ(configuration.name, "arms");
    EXPECT_EQ(configuration.joint_pairs.size(), 2);
    EXPECT_EQ(configuration.vocabulary.size(), 91);
    EXPECT_EQ(configuration.bone_diameter, 0.02);
    EXPECT_FALSE(configuration.require_single_root);

    auto topology = configuration.build_topology();
    EXPECT_EQ(topology.root_joint(), "left_shoulder_1_joint");

    json _json = configuration;
    auto restored = _json.get<RigConfiguration>();
    EXPECT_EQ(restored.joint_pairs, configuration.joint_pairs);
    EXPECT_EQ(restored.extra_joints, configuration.extra_joints);
}

TEST(ConfigurationRejectsUnknownJoints, BasicAssertions)
{
    RigConfiguration configuration;
    configuration.joint_pairs = JointPairs { { "hips_joint", "tail_joint" } };
    EXPECT_THROW(configuration.build_topology(), InvalidTopologyError);

    configuration.joint_pairs = arkit_body_joint_pairs();
    configuration.extra_joints = { "antenna_joint" };
    EXPECT_THROW(configuration.build_topology(), InvalidTopologyError);

    // without a vocabulary any names are accepted
    configuration.vocabulary.clear();
    EXPECT_NO_THROW(configuration.build_topology());

    EXPECT_THROW(json::parse(R"({"preset": "mocap"})").get<RigConfiguration>(), std::invalid_argument);
    EXPECT_THROW(load_configuration("/nonexistent/rig.json"), std::runtime_error);
}
