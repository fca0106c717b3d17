#pragma once

#include "core/Types.hpp"
#include <array>
#include <optional>
#include <string>

namespace math {

/**
 * Closed set of measurable angles. Every key has a stable name used in
 * reference data ("left_knee", "avg_hip", "torso_lean", ...).
 */
enum class JointAngle {
    LeftKnee = 0,   // hip - knee - ankle
    RightKnee,
    AvgKnee,
    LeftHip,        // shoulder - hip - knee
    RightHip,
    AvgHip,
    Torso,          // mean of the two shoulder - hip - knee angles
    TorsoLean,      // hip-mid -> shoulder-mid against image "up"
    LeftElbow,      // shoulder - elbow - wrist
    RightElbow,
    AvgElbow,
    LeftArm,        // hip - shoulder - wrist (arm elevation)
    RightArm,
    AvgArm,
    Count
};

constexpr size_t JOINT_ANGLE_COUNT = static_cast<size_t>(JointAngle::Count);

const char* jointAngleName(JointAngle angle);
std::optional<JointAngle> jointAngleFromName(const std::string& name);

/**
 * "left_knee" -> "Left Knee"
 */
std::string jointAngleDisplayName(JointAngle angle);

/**
 * Angles measured in one frame. A missing key means "cannot measure right now";
 * it is never stood in for by zero or by the previous value.
 */
class AngleSet {
public:
    void set(JointAngle angle, float degrees) { values_[index(angle)] = degrees; }
    void erase(JointAngle angle) { values_[index(angle)].reset(); }

    [[nodiscard]] std::optional<float> get(JointAngle angle) const { return values_[index(angle)]; }
    [[nodiscard]] bool has(JointAngle angle) const { return values_[index(angle)].has_value(); }

    [[nodiscard]] size_t size() const {
        size_t n = 0;
        for (const auto& v : values_) {
            if (v) ++n;
        }
        return n;
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    template<typename Fn>
    void forEach(Fn&& fn) const {
        for (size_t i = 0; i < JOINT_ANGLE_COUNT; ++i) {
            if (values_[i]) fn(static_cast<JointAngle>(i), *values_[i]);
        }
    }

private:
    static size_t index(JointAngle angle) { return static_cast<size_t>(angle); }

    std::array<std::optional<float>, JOINT_ANGLE_COUNT> values_{};
};

/**
 * Interior angle at b for the triplet a-b-c, in [0, 180].
 * The denominator carries ANGLE_EPSILON so coincident points give a finite value.
 */
float computeAngle(const core::Point2D& a, const core::Point2D& b, const core::Point2D& c);

/**
 * Wrap degrees into (-180, 180] via ((a + 180) mod 360) - 180
 */
float wrapAngle(float degrees);

/**
 * Signed heading of the vector from -> to, atan2(dy, dx) in degrees
 */
float headingDeg(const core::Point2D& from, const core::Point2D& to);

/**
 * Angle between hip -> shoulder and the image "up" direction (0, -1).
 * 0 = upright, 90 = horizontal.
 */
float verticalLean(const core::Point2D& hip, const core::Point2D& shoulder);

/**
 * Everything derived from one smoothed frame.
 */
struct KinematicSnapshot {
    AngleSet angles;

    // Midpoints used by rotation tracking; absent unless both joints are visible
    std::optional<core::Point2D> shoulderMid;
    std::optional<core::Point2D> wristMid;
    std::optional<core::Point2D> hipMid;

    // Position/scale normalisation
    core::Point2D center;   // Mean of visible joints
    float scale = 1.0f;     // Calibrated or current shoulder width in pixels
    bool calibratedScale = false;

    [[nodiscard]] core::Point2D normalize(const core::Point2D& p) const {
        return {(p.x - center.x) / scale, (p.y - center.y) / scale};
    }
};

/**
 * Turns a smoothed KeypointFrame into named angles and derived vectors.
 * Any angle whose joints are below the visibility threshold is omitted.
 */
class KinematicExtractor {
public:
    explicit KinematicExtractor(float visibilityThreshold = core::VISIBILITY_THRESHOLD);

    [[nodiscard]] KinematicSnapshot extract(const core::KeypointFrame& frame,
                                            std::optional<float> calibratedScale = std::nullopt) const;

    [[nodiscard]] std::optional<core::Point2D> joint(const core::KeypointFrame& frame, int index) const;

    [[nodiscard]] std::optional<float> angleAt(const core::KeypointFrame& frame, int a, int b, int c) const;

    [[nodiscard]] std::optional<core::Point2D> midpoint(const core::KeypointFrame& frame, int a, int b) const;

    /**
     * Pixel distance between the shoulders, used as body scale
     */
    [[nodiscard]] std::optional<float> shoulderWidth(const core::KeypointFrame& frame) const;

    [[nodiscard]] float visibilityThreshold() const { return threshold_; }

private:
    float threshold_;

    static void setAverage(AngleSet& angles, JointAngle left, JointAngle right, JointAngle avg);
};

} // namespace math
