/**
 * Unit tests for EngineConfig loading
 */

#include <gtest/gtest.h>
#include "core/EngineConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using core::EngineConfig;
using exercise::ExerciseKind;

class ConfigTest : public ::testing::Test {
protected:
    static EngineConfig parse(const std::string& text) {
        return core::parseConfig(YAML::Load(text));
    }
};

TEST_F(ConfigTest, DefaultsMatchEngineConstants) {
    const EngineConfig config = core::defaultConfig();

    EXPECT_FLOAT_EQ(config.filter.alpha, core::SMOOTH_ALPHA);
    EXPECT_EQ(config.filter.minVisibleKeypoints, core::MIN_VISIBLE_KEYPOINTS);
    EXPECT_FLOAT_EQ(config.feedback.cooldownSeconds, core::FEEDBACK_COOLDOWN_S);
    EXPECT_TRUE(config.comparator.enabled);
    EXPECT_FALSE(config.osc.enabled);
    EXPECT_EQ(config.voice.backend, "log");
    EXPECT_EQ(config.log.level, core::LogLevel::INFO);

    ASSERT_EQ(config.profiles.size(), 3u);
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::Squat).lowThreshold, 80.0f);
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::Squat).highThreshold, 150.0f);
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::ArmCircle).rotationThreshold, 300.0f);
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::ArmRaise).highThreshold, 80.0f);
}

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
    const EngineConfig config = core::parseConfig(YAML::Node());
    EXPECT_FLOAT_EQ(config.filter.alpha, core::SMOOTH_ALPHA);
    EXPECT_EQ(config.profiles.size(), 3u);
}

TEST_F(ConfigTest, OverridesSections) {
    const EngineConfig config = parse(R"(
filter:
  alpha: 0.5
  min_visible_keypoints: 10
feedback:
  cooldown_s: 3.5
voice:
  backend: command
  command: say
  args: ["-r", "180"]
  queue_size: 2
osc:
  enabled: true
  port: "9100"
driver:
  fps: 0
log:
  level: debug
)");

    EXPECT_FLOAT_EQ(config.filter.alpha, 0.5f);
    EXPECT_EQ(config.filter.minVisibleKeypoints, 10);
    EXPECT_FLOAT_EQ(config.filter.visibilityThreshold, core::VISIBILITY_THRESHOLD);
    EXPECT_FLOAT_EQ(config.feedback.cooldownSeconds, 3.5f);
    EXPECT_EQ(config.voice.backend, "command");
    EXPECT_EQ(config.voice.command, "say");
    EXPECT_EQ(config.voice.args, (std::vector<std::string>{"-r", "180"}));
    EXPECT_EQ(config.voice.queueSize, 2u);
    EXPECT_TRUE(config.osc.enabled);
    EXPECT_EQ(config.osc.port, "9100");
    EXPECT_EQ(config.osc.host, "127.0.0.1");
    EXPECT_FLOAT_EQ(config.driver.fps, 0.0f);
    EXPECT_EQ(config.log.level, core::LogLevel::DEBUG);
}

TEST_F(ConfigTest, WrongTypeIsIgnored) {
    const EngineConfig config = parse(R"(
filter:
  alpha: smooth
  min_visible_keypoints: 9
)");
    EXPECT_FLOAT_EQ(config.filter.alpha, core::SMOOTH_ALPHA);
    EXPECT_EQ(config.filter.minVisibleKeypoints, 9);
}

TEST_F(ConfigTest, ProfilePresetAndOverride) {
    const EngineConfig config = parse(R"(
profiles:
  squat:
    preset: squat_strict
    confirm_frames: 5
)");
    const auto& squat = config.profile(ExerciseKind::Squat);
    EXPECT_EQ(squat.name, "squat_strict");
    EXPECT_FLOAT_EQ(squat.lowThreshold, 100.0f);
    EXPECT_FLOAT_EQ(squat.highThreshold, 160.0f);
    EXPECT_EQ(squat.confirmFrames, 5);
}

TEST_F(ConfigTest, PresetOfOtherKindIsIgnored) {
    const EngineConfig config = parse(R"(
profiles:
  squat:
    preset: arm_raise
    low_threshold: 70
)");
    const auto& squat = config.profile(ExerciseKind::Squat);
    EXPECT_EQ(squat.kind, ExerciseKind::Squat);
    EXPECT_FLOAT_EQ(squat.lowThreshold, 70.0f);
    EXPECT_FLOAT_EQ(squat.highThreshold, 150.0f);
}

TEST_F(ConfigTest, InvalidProfileIsRejected) {
    const EngineConfig config = parse(R"(
profiles:
  squat:
    low_threshold: 160
    high_threshold: 120
  arm_circle:
    rotation_threshold: -5
)");
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::Squat).lowThreshold, 80.0f);
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::Squat).highThreshold, 150.0f);
    EXPECT_FLOAT_EQ(config.profile(ExerciseKind::ArmCircle).rotationThreshold, 300.0f);
}

TEST_F(ConfigTest, ProfileDirectionAngleAndBands) {
    const EngineConfig config = parse(R"(
profiles:
  arm_raise:
    direction: rise_then_fall
    tracked_angle: left_arm
    reference_label: shoulder_rehab
    phase_bands:
      - {label: high, above: 60}
      - {label: low}
  squat:
    direction: sideways
)");
    const auto& raise = config.profile(ExerciseKind::ArmRaise);
    EXPECT_EQ(raise.direction, exercise::Direction::RiseThenFall);
    EXPECT_EQ(raise.trackedAngle, math::JointAngle::LeftArm);
    EXPECT_EQ(raise.referenceLabel, "shoulder_rehab");
    ASSERT_EQ(raise.phaseBands.size(), 2u);
    EXPECT_EQ(raise.phaseBands[0].label, "high");
    EXPECT_FLOAT_EQ(raise.phaseBands[0].above, 60.0f);
    EXPECT_TRUE(std::isinf(raise.phaseBands[1].above));

    EXPECT_EQ(config.profile(ExerciseKind::Squat).direction, exercise::Direction::FallThenRise);
}

TEST_F(ConfigTest, CombinedKindUsesSquatProfile) {
    const EngineConfig config = core::defaultConfig();
    EXPECT_EQ(config.profile(ExerciseKind::SquatAndArmCircle).name, "squat");
}

TEST_F(ConfigTest, UnknownPresetName) {
    EXPECT_FALSE(core::findPreset("lunge").has_value());
    EXPECT_TRUE(core::findPreset("squat_strict").has_value());
}

TEST_F(ConfigTest, LoadConfigFromFile) {
    const fs::path path = fs::temp_directory_path() / "repcoach_config_test.yaml";
    {
        std::ofstream out(path);
        out << "comparator:\n  enabled: false\n  reference_dir: /tmp/refs\n";
    }

    const EngineConfig config = core::loadConfig(path.string());
    EXPECT_FALSE(config.comparator.enabled);
    EXPECT_EQ(config.comparator.referenceDir, "/tmp/refs");

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_F(ConfigTest, LoadConfigMissingFileThrows) {
    EXPECT_THROW(core::loadConfig("/nonexistent/repcoach.yaml"), std::runtime_error);
}
