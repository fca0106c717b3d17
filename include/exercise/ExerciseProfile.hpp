#pragma once

#include "core/Types.hpp"
#include "math/Kinematics.hpp"
#include <optional>
#include <string>
#include <vector>

namespace exercise {

/**
 * Exercises a session can be started for. Closed set; each selects its
 * state-machine family and feedback rule set.
 */
enum class ExerciseKind {
    Squat = 0,
    ArmCircle = 1,          // Unconstrained full-rotation arm circle
    ArmRaise = 2,           // Recovery stage 1: raise to shoulder level and back
    SquatAndArmCircle = 3   // Both tracked side by side
};

const char* exerciseKindName(ExerciseKind kind);
std::optional<ExerciseKind> exerciseKindFromName(const std::string& name);

enum class MachineFamily {
    Hysteresis,
    Rotation
};

/**
 * Which way a hysteresis machine leaves its rest phase.
 */
enum class Direction {
    FallThenRise,   // Rest is high (standing). Dip below low, rep on rise above high.
    RiseThenFall    // Rest is low (arms down). Rise above high, rep on fall below low.
};

/**
 * Comparator phase band: the primary angle selects the first band whose
 * lower bound it exceeds; the last band should use a lower bound of -inf.
 */
struct PhaseBand {
    std::string label;
    float above = 0.0f;
};

/**
 * Everything that parameterises one exercise. Loaded from config, with the
 * presets below as defaults.
 */
struct ExerciseProfile {
    std::string name;
    ExerciseKind kind = ExerciseKind::Squat;
    MachineFamily family = MachineFamily::Hysteresis;

    // Hysteresis parameters
    Direction direction = Direction::FallThenRise;
    float lowThreshold = 80.0f;
    float highThreshold = 150.0f;
    int confirmFrames = core::CONFIRM_FRAMES;
    math::JointAngle trackedAngle = math::JointAngle::AvgKnee;
    std::string restPhase = "up";     // Phase A name
    std::string activePhase = "down"; // Phase B name

    // Rotation parameters
    float rotationThreshold = core::ROTATION_THRESHOLD_DEG;

    // Form comparison (empty label = no reference comparison)
    std::string referenceLabel;
    std::vector<PhaseBand> phaseBands;

    /**
     * Check the parameters are usable (dead band non-empty, confirm >= 1, ...)
     * @param reason set to a human-readable explanation on failure
     */
    [[nodiscard]] bool isValid(std::string* reason = nullptr) const;
};

/**
 * Squat counted at a reachable depth: down < 80, up > 150
 */
ExerciseProfile getSquatProfile();

/**
 * Stricter squat band: down < 100 is counted but up must exceed 160
 */
ExerciseProfile getStrictSquatProfile();

/**
 * Full-rotation arm circle: one rep per 300 degrees of accumulated heading change
 */
ExerciseProfile getArmCircleProfile();

/**
 * Recovery arm raise: rest below 20, up above 80, rep on return to rest
 */
ExerciseProfile getArmRaiseProfile();

/**
 * Default preset for a kind. SquatAndArmCircle has no single profile and
 * returns the squat preset.
 */
ExerciseProfile getDefaultProfile(ExerciseKind kind);

} // namespace exercise
