/**
 * Unit tests for reference loading and fallback
 */

#include <gtest/gtest.h>
#include "exercise/ReferenceStore.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using exercise::FileReferenceStore;
using exercise::ReferenceProfile;

class ReferenceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("repcoach_ref_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream out(dir / name);
        out << content;
    }

    fs::path dir;
};

TEST_F(ReferenceStoreTest, ParsesPhaseMapWithAnglesKey) {
    auto profile = FileReferenceStore::parse(YAML::Load(R"({
        "top": {"angles": {"avg_knee": 170, "avg_hip": 172}},
        "bottom": {"angles": {"avg_knee": 60}}
    })"), "squat");

    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->label, "squat");
    EXPECT_FALSE(profile->fallback);
    ASSERT_EQ(profile->phases.size(), 2u);
    EXPECT_FLOAT_EQ(profile->phases.at("top").at("avg_knee"), 170.0f);
    EXPECT_FLOAT_EQ(profile->phases.at("bottom").at("avg_knee"), 60.0f);
}

TEST_F(ReferenceStoreTest, ParsesFlatPhaseMap) {
    auto profile = FileReferenceStore::parse(YAML::Load(R"({"up": {"avg_arm": 88, "avg_elbow": 172}})"),
                                             "arm_raise");
    ASSERT_TRUE(profile.has_value());
    EXPECT_FLOAT_EQ(profile->phases.at("up").at("avg_arm"), 88.0f);
}

TEST_F(ReferenceStoreTest, BucketsRecordingByKneeAngle) {
    auto profile = FileReferenceStore::parse(YAML::Load(R"([
        {"frame": 0, "angles": {"left_knee": 170, "right_knee": 170, "avg_hip": 174}},
        {"frame": 1, "angles": {"left_knee": 176, "right_knee": 174, "avg_hip": 176}},
        {"frame": 2, "angles": {"left_knee": 120, "right_knee": 122}},
        {"frame": 3, "angles": {"left_knee": 60, "right_knee": 64}},
        {"frame": 4, "keypoints": []}
    ])"), "squat");

    ASSERT_TRUE(profile.has_value());
    ASSERT_EQ(profile->phases.size(), 3u);

    const auto& top = profile->phases.at("top");
    EXPECT_FLOAT_EQ(top.at("left_knee"), 173.0f);
    EXPECT_FLOAT_EQ(top.at("avg_knee"), 172.5f);
    EXPECT_FLOAT_EQ(top.at("avg_hip"), 175.0f);

    EXPECT_FLOAT_EQ(profile->phases.at("mid").at("avg_knee"), 121.0f);
    EXPECT_FLOAT_EQ(profile->phases.at("bottom").at("avg_knee"), 62.0f);
}

TEST_F(ReferenceStoreTest, IgnoresNonNumericAngles) {
    auto profile = FileReferenceStore::parse(YAML::Load(R"({"top": {"avg_knee": "tall", "avg_hip": 170}})"),
                                             "squat");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->phases.at("top").count("avg_knee"), 0u);
    EXPECT_FLOAT_EQ(profile->phases.at("top").at("avg_hip"), 170.0f);
}

TEST_F(ReferenceStoreTest, LoadsFileFromDirectory) {
    writeFile("squat.json", R"({"top": {"angles": {"avg_knee": 168}}})");
    FileReferenceStore store(dir.string());

    auto profile = store.load("squat");
    ASSERT_TRUE(profile.has_value());
    EXPECT_FLOAT_EQ(profile->phases.at("top").at("avg_knee"), 168.0f);
    EXPECT_FALSE(store.load("lunge").has_value());
}

TEST_F(ReferenceStoreTest, LoadsPerPositionFiles) {
    writeFile("squat_down.json", R"({"position": "down", "image_path": "down.jpg",
        "angles": {"left_knee": 58, "right_knee": 54, "avg_knee": 56, "torso_lean": 29}})");
    writeFile("squat_up.json", R"({"position": "up", "angles": {"avg_knee": 166}})");
    FileReferenceStore store(dir.string());

    auto profile = store.load("squat");
    ASSERT_TRUE(profile.has_value());
    ASSERT_NE(profile->findPhase("bottom"), nullptr);
    EXPECT_FLOAT_EQ(profile->findPhase("bottom")->at("avg_knee"), 56.0f);
    ASSERT_NE(profile->findPhase("top"), nullptr);
    EXPECT_FLOAT_EQ(profile->findPhase("top")->at("avg_knee"), 166.0f);
    EXPECT_EQ(profile->findPhase("mid"), nullptr);
}

TEST_F(ReferenceStoreTest, MalformedFileIsNotFatal) {
    writeFile("squat.json", "{ this is : [ not json");
    FileReferenceStore store(dir.string());
    EXPECT_FALSE(store.load("squat").has_value());

    auto profile = exercise::loadReferenceOrFallback(&store, "squat", exercise::getSquatProfile().phaseBands);
    EXPECT_TRUE(profile.fallback);
    EXPECT_FLOAT_EQ(profile.findPhase("top")->at("avg_knee"), 166.0f);
}

TEST_F(ReferenceStoreTest, MissingDirectoryFallsBack) {
    FileReferenceStore store((dir / "does_not_exist").string());
    auto profile = exercise::loadReferenceOrFallback(&store, "squat", exercise::getSquatProfile().phaseBands);

    EXPECT_TRUE(profile.fallback);
    EXPECT_FLOAT_EQ(profile.findPhase("mid")->at("avg_hip"), 113.5f);
    EXPECT_FLOAT_EQ(profile.findPhase("bottom")->at("torso_lean"), 29.0f);
}

TEST_F(ReferenceStoreTest, NullStoreFallsBack) {
    auto profile = exercise::loadReferenceOrFallback(nullptr, "arm_raise",
                                                     exercise::getArmRaiseProfile().phaseBands);
    EXPECT_TRUE(profile.fallback);
    EXPECT_FLOAT_EQ(profile.findPhase("up")->at("avg_arm"), 90.0f);
    EXPECT_FLOAT_EQ(profile.findPhase("down")->at("avg_arm"), 10.0f);
}

TEST_F(ReferenceStoreTest, PartialProfileCompletedFromFallback) {
    writeFile("squat.json", R"({"top": {"angles": {"avg_knee": 170}}})");
    FileReferenceStore store(dir.string());

    auto profile = exercise::loadReferenceOrFallback(&store, "squat", exercise::getSquatProfile().phaseBands);
    EXPECT_TRUE(profile.fallback);
    EXPECT_FLOAT_EQ(profile.findPhase("top")->at("avg_knee"), 170.0f);
    EXPECT_FLOAT_EQ(profile.findPhase("mid")->at("avg_knee"), 111.0f);
    EXPECT_FLOAT_EQ(profile.findPhase("bottom")->at("avg_knee"), 56.0f);
}

TEST_F(ReferenceStoreTest, PhaseAliases) {
    ReferenceProfile profile = exercise::getFallbackReference("arm_raise");
    EXPECT_NE(profile.findPhase("top"), nullptr);
    EXPECT_NE(profile.findPhase("bottom"), nullptr);
    EXPECT_EQ(profile.findPhase("mid"), nullptr);
    EXPECT_TRUE(exercise::getFallbackReference("unknown").phases.empty());
}
