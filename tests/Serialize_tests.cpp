// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include "Errors.hpp"
#include "serializers/GLMSerialize.hpp"
#include "serializers/SkeletonSerialize.hpp"
#include "serializers/TimelineSerialize.hpp"
#include "skeleton/Skeleton.hpp"
#include "timeline/Timeline.hpp"

using namespace rigtime;
using namespace rigtime::serializers;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace
{
    Timeline make_timeline()
    {
        ChannelPtr weight = std::make_shared<const TimelineChannel<float>>(
            "", std::vector<Keyframe<float>>{ { 0ms, 0.0f }, { 250ms, 1.5f } }, InterpolationMethod::Cubic);
        ChannelPtr rotation = std::make_shared<const TimelineChannel<glm::quat>>(
            "rotation", std::vector<Keyframe<glm::quat>>{ { 100ms, glm::quat(1.0f, 0.0f, 0.0f, 0.0f) } },
            InterpolationMethod::None);
        ChannelPtr transform = std::make_shared<const TimelineChannel<glm::mat4>>(
            "", std::vector<Keyframe<glm::mat4>>{ { 1s, glm::translate(glm::mat4{ 1.0f }, glm::vec3(1.0f, 2.0f, 3.0f)) } });

        return Timeline(
            { TimelineLayer("weight", { weight }), TimelineLayer("arm", { rotation }), TimelineLayer("leg", { transform }) },
            { { "cue", 500ms } });
    }
}

TEST(GLMSerialize, Layouts)
{
    EXPECT_EQ(serialize_vec3(glm::vec3(1.0f, 2.0f, 3.0f)), json::array({ 1.0f, 2.0f, 3.0f }));
    EXPECT_EQ(serialize_quat(glm::quat(4.0f, 1.0f, 2.0f, 3.0f)), json::array({ 1.0f, 2.0f, 3.0f, 4.0f }));

    const json m = serialize_mat4(glm::translate(glm::mat4{ 1.0f }, glm::vec3(5.0f, 6.0f, 7.0f)));
    ASSERT_EQ(m.size(), 16u);
    EXPECT_EQ(m[12], 5.0f);
    EXPECT_EQ(m[13], 6.0f);
    EXPECT_EQ(m[14], 7.0f);
}

TEST(GLMSerialize, ReadsBack)
{
    const glm::quat q = glm::angleAxis(0.3f, glm::normalize(glm::vec3(1.0f, 1.0f, 0.0f)));
    EXPECT_EQ(deserialize_quat(serialize_quat(q)), q);
    EXPECT_EQ(deserialize_vec2(json::array({ 1, 2 })), glm::vec2(1.0f, 2.0f));
}

TEST(GLMSerialize, RejectsMalformed)
{
    EXPECT_THROW(deserialize_vec3(json::array({ 1.0f, 2.0f })), FormatError);
    EXPECT_THROW(deserialize_vec3(json::array({ 1.0f, "two", 3.0f })), FormatError);
    EXPECT_THROW(deserialize_mat4(json::object()), FormatError);
}

TEST(TimelineSerialize, DocumentLayout)
{
    const json j = serialize_timeline(make_timeline());

    ASSERT_EQ(j["markers"].size(), 1u);
    EXPECT_EQ(j["markers"][0]["name"], "cue");
    EXPECT_EQ(j["markers"][0]["position_us"], 500000);

    ASSERT_EQ(j["layers"].size(), 3u);
    const json& weight = j["layers"][0];
    EXPECT_EQ(weight["identifier"], "weight");
    EXPECT_EQ(weight["channels"][0]["type"], "float");
    EXPECT_EQ(weight["channels"][0]["interpolation"], "cubic");
    EXPECT_EQ(weight["channels"][0]["keyframes"][1]["position_us"], 250000);
    EXPECT_EQ(weight["channels"][0]["keyframes"][1]["value"], 1.5f);
}

TEST(TimelineSerialize, RoundTrip)
{
    const Timeline original = make_timeline();
    auto restored = deserialize_timeline(serialize_timeline(original));

    EXPECT_EQ(restored->layer_count(), 3u);
    EXPECT_EQ(restored->start(), original.start());
    EXPECT_EQ(restored->end(), original.end());
    EXPECT_EQ(restored->get_marker("cue").position, 500ms);

    const auto& weight = restored->get_layer("weight").get_channel<float>("");
    EXPECT_EQ(weight.interpolation(), InterpolationMethod::Cubic);
    EXPECT_EQ(weight.count(), 2u);
    EXPECT_EQ(weight.sample(125ms), original.get_layer("weight").get_channel<float>("").sample(125ms));

    EXPECT_EQ(restored->get_layer("arm").get_channel<glm::quat>("rotation").interpolation(), InterpolationMethod::None);
    EXPECT_EQ(restored->get_layer("leg").get_channel<glm::mat4>("").sample(1s),
        glm::translate(glm::mat4{ 1.0f }, glm::vec3(1.0f, 2.0f, 3.0f)));
}

TEST(TimelineSerialize, OptionalSections)
{
    auto timeline = deserialize_timeline(json::object());
    EXPECT_EQ(timeline->layer_count(), 0u);
    EXPECT_EQ(timeline->marker_count(), 0u);

    // Interpolation defaults to linear
    auto linear = deserialize_timeline(json::parse(R"({
        "layers": [ { "identifier": "x", "channels": [
            { "name": "", "type": "vec2", "keyframes": [ { "position_us": 0, "value": [0, 0] } ] } ] } ] })"));
    EXPECT_EQ(linear->get_layer("x").get_channel("")->interpolation(), InterpolationMethod::Linear);
}

TEST(TimelineSerialize, RejectsMalformed)
{
    EXPECT_THROW(deserialize_timeline(json::array()), FormatError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": 3 })")), FormatError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": [ { "channels": [] } ] })")), FormatError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": [ { "identifier": "x", "channels": [
        { "type": "vec5", "keyframes": [] } ] } ] })")), FormatError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": [ { "identifier": "x", "channels": [
        { "type": "float", "interpolation": "spline", "keyframes": [] } ] } ] })")), FormatError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": [ { "identifier": "x", "channels": [
        { "type": "vec3", "keyframes": [ { "position_us": 0, "value": 1.0 } ] } ] } ] })")), FormatError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "markers": [ { "name": "m", "position_us": 1.5 } ] })")), FormatError);
}

TEST(TimelineSerialize, DuplicatesAreReportedAsDuplicates)
{
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": [ { "identifier": "x", "channels": [
        { "type": "float", "keyframes": [ { "position_us": 0, "value": 1 }, { "position_us": 0, "value": 2 } ] } ] } ] })")),
        DuplicateKeyframeError);
    EXPECT_THROW(deserialize_timeline(json::parse(R"({ "layers": [
        { "identifier": "x", "channels": [] }, { "identifier": "x", "channels": [] } ] })")),
        DuplicateKeyError);
}

TEST(SkeletonSerialize, RoundTrip)
{
    Skeleton skeleton(glm::translate(glm::mat4{ 1.0f }, glm::vec3(0.0f, 1.0f, 0.0f)));
    const size_t hip = skeleton.add_bone(Bone{ "hip", 0 });
    skeleton.add_bone(Bone{ "spine", 1, glm::scale(glm::mat4{ 1.0f }, glm::vec3(2.0f)) }, hip);
    skeleton.add_bone(Bone{ std::nullopt, std::nullopt }, hip);
    skeleton.add_bone(Bone{ "tail", 9 });

    const json j = serialize_skeleton(skeleton);
    ASSERT_EQ(j.size(), 5u);
    EXPECT_EQ(j[0]["parent_index"], -1);
    EXPECT_EQ(j[0]["identifier"], Skeleton::root_bone_name);
    EXPECT_EQ(j[2]["parent_index"], 1);
    EXPECT_TRUE(j[3]["identifier"].is_null());
    EXPECT_EQ(j[4]["parent_index"], 0);

    Skeleton restored = deserialize_skeleton(j);
    EXPECT_FALSE(restored.is_read_only());
    EXPECT_EQ(restored.size(), 5u);
    EXPECT_EQ(restored.root_bone(), skeleton.root_bone());
    EXPECT_EQ(serialize_skeleton(restored), j);

    const auto spine = restored.find_bone("spine");
    ASSERT_TRUE(spine.has_value());
    EXPECT_EQ(restored.get_bone(*spine), skeleton.get_bone(*skeleton.find_bone("spine")));
    EXPECT_EQ(restored.parent_of(*spine), restored.find_bone("hip"));
}

TEST(SkeletonSerialize, RejectsMalformed)
{
    EXPECT_THROW(deserialize_skeleton(json::array()), FormatError);
    EXPECT_THROW(deserialize_skeleton(json::object()), FormatError);
    EXPECT_THROW(deserialize_skeleton(json::parse(R"([ { "parent_index": 0 } ])")), FormatError);
    EXPECT_THROW(deserialize_skeleton(json::parse(R"([ {}, { "identifier": "a", "parent_index": 1 } ])")), FormatError);
    EXPECT_THROW(deserialize_skeleton(json::parse(R"([ {}, { "identifier": "a", "index": 300, "parent_index": 0 } ])")), FormatError);
    EXPECT_THROW(deserialize_skeleton(json::parse(R"([ {}, { "identifier": 4, "parent_index": 0 } ])")), FormatError);
}
