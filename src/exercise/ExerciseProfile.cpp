#include "exercise/ExerciseProfile.hpp"
#include <limits>
#include <sstream>

namespace exercise {

namespace {
constexpr float LOWEST = -std::numeric_limits<float>::infinity();
}

const char* exerciseKindName(ExerciseKind kind) {
    switch (kind) {
        case ExerciseKind::Squat:             return "squat";
        case ExerciseKind::ArmCircle:         return "arm_circle";
        case ExerciseKind::ArmRaise:          return "arm_raise";
        case ExerciseKind::SquatAndArmCircle: return "squat_and_arm_circle";
        default: return "unknown";
    }
}

std::optional<ExerciseKind> exerciseKindFromName(const std::string& name) {
    if (name == "squat") return ExerciseKind::Squat;
    if (name == "arm_circle") return ExerciseKind::ArmCircle;
    if (name == "arm_raise") return ExerciseKind::ArmRaise;
    if (name == "squat_and_arm_circle" || name == "both") return ExerciseKind::SquatAndArmCircle;
    return std::nullopt;
}

bool ExerciseProfile::isValid(std::string* reason) const {
    std::ostringstream why;
    if (family == MachineFamily::Hysteresis) {
        if (!(lowThreshold < highThreshold)) {
            why << "low threshold " << lowThreshold << " must be below high threshold " << highThreshold;
        } else if (confirmFrames < 1) {
            why << "confirm frames must be >= 1, got " << confirmFrames;
        }
    } else if (!(rotationThreshold > 0.0f)) {
        why << "rotation threshold must be positive, got " << rotationThreshold;
    }

    const std::string message = why.str();
    if (message.empty()) return true;
    if (reason) *reason = message;
    return false;
}

ExerciseProfile getSquatProfile() {
    ExerciseProfile profile;
    profile.name = "squat";
    profile.kind = ExerciseKind::Squat;
    profile.family = MachineFamily::Hysteresis;
    profile.direction = Direction::FallThenRise;
    profile.lowThreshold = 80.0f;
    profile.highThreshold = 150.0f;
    profile.confirmFrames = core::CONFIRM_FRAMES;
    profile.trackedAngle = math::JointAngle::AvgKnee;
    profile.restPhase = "up";
    profile.activePhase = "down";
    profile.referenceLabel = "squat";
    profile.phaseBands = {{"top", 160.0f}, {"mid", 100.0f}, {"bottom", LOWEST}};
    return profile;
}

ExerciseProfile getStrictSquatProfile() {
    ExerciseProfile profile = getSquatProfile();
    profile.name = "squat_strict";
    profile.lowThreshold = 100.0f;
    profile.highThreshold = 160.0f;
    return profile;
}

ExerciseProfile getArmCircleProfile() {
    ExerciseProfile profile;
    profile.name = "arm_circle";
    profile.kind = ExerciseKind::ArmCircle;
    profile.family = MachineFamily::Rotation;
    profile.rotationThreshold = core::ROTATION_THRESHOLD_DEG;
    // No stored reference for free rotation
    return profile;
}

ExerciseProfile getArmRaiseProfile() {
    ExerciseProfile profile;
    profile.name = "arm_raise";
    profile.kind = ExerciseKind::ArmRaise;
    profile.family = MachineFamily::Hysteresis;
    profile.direction = Direction::RiseThenFall;
    profile.lowThreshold = 20.0f;
    profile.highThreshold = 80.0f;
    profile.confirmFrames = core::CONFIRM_FRAMES;
    profile.trackedAngle = math::JointAngle::AvgArm;
    profile.restPhase = "down";
    profile.activePhase = "up";
    profile.referenceLabel = "arm_raise";
    profile.phaseBands = {{"up", 50.0f}, {"down", LOWEST}};
    return profile;
}

ExerciseProfile getDefaultProfile(ExerciseKind kind) {
    switch (kind) {
        case ExerciseKind::ArmCircle: return getArmCircleProfile();
        case ExerciseKind::ArmRaise:  return getArmRaiseProfile();
        case ExerciseKind::Squat:
        case ExerciseKind::SquatAndArmCircle:
        default:
            return getSquatProfile();
    }
}

} // namespace exercise
