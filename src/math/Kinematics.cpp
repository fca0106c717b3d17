#include "math/Kinematics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace math {

namespace {

constexpr double RAD_TO_DEG = 180.0 / M_PI;

constexpr std::array<const char*, JOINT_ANGLE_COUNT> ANGLE_NAMES = {
    "left_knee", "right_knee", "avg_knee",
    "left_hip", "right_hip", "avg_hip",
    "torso", "torso_lean",
    "left_elbow", "right_elbow", "avg_elbow",
    "left_arm", "right_arm", "avg_arm"
};

double angleBetween(double ux, double uy, double vx, double vy) {
    const double denom = std::hypot(ux, uy) * std::hypot(vx, vy) + core::ANGLE_EPSILON;
    const double cosang = std::clamp((ux * vx + uy * vy) / denom, -1.0, 1.0);
    return std::acos(cosang) * RAD_TO_DEG;
}

} // namespace

const char* jointAngleName(JointAngle angle) {
    const auto i = static_cast<size_t>(angle);
    if (i >= JOINT_ANGLE_COUNT) return "unknown";
    return ANGLE_NAMES[i];
}

std::optional<JointAngle> jointAngleFromName(const std::string& name) {
    for (size_t i = 0; i < JOINT_ANGLE_COUNT; ++i) {
        if (name == ANGLE_NAMES[i]) return static_cast<JointAngle>(i);
    }
    return std::nullopt;
}

std::string jointAngleDisplayName(JointAngle angle) {
    std::string name = jointAngleName(angle);
    bool startOfWord = true;
    for (auto& c : name) {
        if (c == '_') {
            c = ' ';
            startOfWord = true;
        } else if (startOfWord) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            startOfWord = false;
        }
    }
    return name;
}

float computeAngle(const core::Point2D& a, const core::Point2D& b, const core::Point2D& c) {
    return static_cast<float>(angleBetween(a.x - b.x, a.y - b.y, c.x - b.x, c.y - b.y));
}

float wrapAngle(float degrees) {
    double wrapped = std::fmod(static_cast<double>(degrees) + 180.0, 360.0);
    if (wrapped < 0.0) wrapped += 360.0;
    wrapped -= 180.0;
    // Keep the half-open interval (-180, 180]
    if (wrapped <= -180.0) wrapped = 180.0;
    return static_cast<float>(wrapped);
}

float headingDeg(const core::Point2D& from, const core::Point2D& to) {
    return static_cast<float>(std::atan2(static_cast<double>(to.y) - from.y,
                                         static_cast<double>(to.x) - from.x) * RAD_TO_DEG);
}

float verticalLean(const core::Point2D& hip, const core::Point2D& shoulder) {
    // Image y grows downwards, so "up" is (0, -1)
    return static_cast<float>(angleBetween(shoulder.x - hip.x, shoulder.y - hip.y, 0.0, -1.0));
}

KinematicExtractor::KinematicExtractor(float visibilityThreshold)
    : threshold_(visibilityThreshold) {
}

std::optional<core::Point2D> KinematicExtractor::joint(const core::KeypointFrame& frame, int index) const {
    if (index < 0 || static_cast<size_t>(index) >= core::NUM_KEYPOINTS) return std::nullopt;
    const auto& kp = frame[static_cast<size_t>(index)];
    if (kp.confidence <= threshold_) return std::nullopt;
    return core::Point2D{kp.x, kp.y};
}

std::optional<float> KinematicExtractor::angleAt(const core::KeypointFrame& frame, int a, int b, int c) const {
    auto pa = joint(frame, a);
    auto pb = joint(frame, b);
    auto pc = joint(frame, c);
    if (!pa || !pb || !pc) return std::nullopt;
    return computeAngle(*pa, *pb, *pc);
}

std::optional<core::Point2D> KinematicExtractor::midpoint(const core::KeypointFrame& frame, int a, int b) const {
    auto pa = joint(frame, a);
    auto pb = joint(frame, b);
    if (!pa || !pb) return std::nullopt;
    return core::Point2D{(pa->x + pb->x) / 2.0f, (pa->y + pb->y) / 2.0f};
}

std::optional<float> KinematicExtractor::shoulderWidth(const core::KeypointFrame& frame) const {
    using CJ = core::CocoJoint;
    auto l = joint(frame, CJ::LEFT_SHOULDER);
    auto r = joint(frame, CJ::RIGHT_SHOULDER);
    if (!l || !r) return std::nullopt;
    return static_cast<float>(std::hypot(l->x - r->x, l->y - r->y));
}

void KinematicExtractor::setAverage(AngleSet& angles, JointAngle left, JointAngle right, JointAngle avg) {
    auto l = angles.get(left);
    auto r = angles.get(right);
    if (l && r) {
        angles.set(avg, (*l + *r) / 2.0f);
    }
}

KinematicSnapshot KinematicExtractor::extract(const core::KeypointFrame& frame,
                                              std::optional<float> calibratedScale) const {
    using CJ = core::CocoJoint;
    KinematicSnapshot snap;
    AngleSet& angles = snap.angles;

    auto put = [&](JointAngle key, std::optional<float> value) {
        if (value) angles.set(key, *value);
    };

    // Legs
    put(JointAngle::LeftKnee, angleAt(frame, CJ::LEFT_HIP, CJ::LEFT_KNEE, CJ::LEFT_ANKLE));
    put(JointAngle::RightKnee, angleAt(frame, CJ::RIGHT_HIP, CJ::RIGHT_KNEE, CJ::RIGHT_ANKLE));
    put(JointAngle::LeftHip, angleAt(frame, CJ::LEFT_SHOULDER, CJ::LEFT_HIP, CJ::LEFT_KNEE));
    put(JointAngle::RightHip, angleAt(frame, CJ::RIGHT_SHOULDER, CJ::RIGHT_HIP, CJ::RIGHT_KNEE));

    // Arms
    put(JointAngle::LeftElbow, angleAt(frame, CJ::LEFT_SHOULDER, CJ::LEFT_ELBOW, CJ::LEFT_WRIST));
    put(JointAngle::RightElbow, angleAt(frame, CJ::RIGHT_SHOULDER, CJ::RIGHT_ELBOW, CJ::RIGHT_WRIST));
    put(JointAngle::LeftArm, angleAt(frame, CJ::LEFT_HIP, CJ::LEFT_SHOULDER, CJ::LEFT_WRIST));
    put(JointAngle::RightArm, angleAt(frame, CJ::RIGHT_HIP, CJ::RIGHT_SHOULDER, CJ::RIGHT_WRIST));

    setAverage(angles, JointAngle::LeftKnee, JointAngle::RightKnee, JointAngle::AvgKnee);
    setAverage(angles, JointAngle::LeftHip, JointAngle::RightHip, JointAngle::AvgHip);
    setAverage(angles, JointAngle::LeftHip, JointAngle::RightHip, JointAngle::Torso);
    setAverage(angles, JointAngle::LeftElbow, JointAngle::RightElbow, JointAngle::AvgElbow);
    setAverage(angles, JointAngle::LeftArm, JointAngle::RightArm, JointAngle::AvgArm);

    // Midpoints
    snap.shoulderMid = midpoint(frame, CJ::LEFT_SHOULDER, CJ::RIGHT_SHOULDER);
    snap.wristMid = midpoint(frame, CJ::LEFT_WRIST, CJ::RIGHT_WRIST);
    snap.hipMid = midpoint(frame, CJ::LEFT_HIP, CJ::RIGHT_HIP);

    if (snap.shoulderMid && snap.hipMid) {
        angles.set(JointAngle::TorsoLean, verticalLean(*snap.hipMid, *snap.shoulderMid));
    }

    // Center of visible joints
    float sx = 0.0f, sy = 0.0f;
    int visible = 0;
    for (const auto& kp : frame.joints) {
        if (kp.confidence > threshold_) {
            sx += kp.x;
            sy += kp.y;
            ++visible;
        }
    }
    if (visible > 0) {
        snap.center = {sx / static_cast<float>(visible), sy / static_cast<float>(visible)};
    }

    // Scale: calibration wins, then current shoulder width, then 1.0
    if (calibratedScale && *calibratedScale > core::MIN_BODY_SCALE) {
        snap.scale = *calibratedScale;
        snap.calibratedScale = true;
    } else {
        auto width = shoulderWidth(frame);
        snap.scale = (width && *width >= core::MIN_BODY_SCALE) ? *width : 1.0f;
    }

    return snap;
}

} // namespace math
