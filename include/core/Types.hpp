#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace core {

// ============================================================
// RepCoach Constants - Engine Defaults
// ============================================================

// Pose layout (COCO, as produced by YOLOv8-pose / MoveNet)
constexpr size_t NUM_KEYPOINTS = 17;

// Keypoint gating
constexpr float VISIBILITY_THRESHOLD = 0.2f;   // Joint counts as visible above this confidence
constexpr int MIN_VISIBLE_KEYPOINTS = 12;      // Frames with fewer visible joints are rejected

// EWMA smoothing (1.0 = no smoothing)
constexpr float SMOOTH_ALPHA = 0.35f;

// Nominal pose source rate. Confirm frames and rotation threshold are tuned for it.
constexpr float SOURCE_FPS = 30.0f;

// Repetition detection
constexpr int CONFIRM_FRAMES = 3;              // Consecutive qualifying frames per phase change
constexpr float ROTATION_THRESHOLD_DEG = 300.0f; // Short of 360 to tolerate imperfect circles

// Angle math
constexpr double ANGLE_EPSILON = 1e-8;         // Guards the arccos denominator
constexpr float MIN_BODY_SCALE = 1e-6f;

// Feedback
constexpr float FEEDBACK_COOLDOWN_S = 2.0f;    // Between spoken messages; screen text is never throttled

// Form comparison
constexpr float FORM_TOLERANCE_DEG = 15.0f;
constexpr float FORM_SCORE_SPAN_DEG = 30.0f;   // Mean deviation that maps to score 0
constexpr int FORM_NEUTRAL_SCORE = 50;
constexpr int FORM_ACCEPTABLE_SCORE = 70;

// Voice dispatch
constexpr size_t VOICE_QUEUE_SIZE = 4;
constexpr float VOICE_MIN_INTERVAL_S = 1.0f;
constexpr float VOICE_MAX_STALENESS_S = 3.0f;

// OSC output
constexpr size_t OSC_QUEUE_SIZE = 16;
constexpr int OSC_MAX_LATENCY_MS = 50;

// ============================================================
// Data Structures
// ============================================================

/**
 * COCO keypoint indices.
 */
struct CocoJoint {
    static constexpr int NOSE = 0;
    static constexpr int LEFT_EYE = 1;
    static constexpr int RIGHT_EYE = 2;
    static constexpr int LEFT_EAR = 3;
    static constexpr int RIGHT_EAR = 4;
    static constexpr int LEFT_SHOULDER = 5;
    static constexpr int RIGHT_SHOULDER = 6;
    static constexpr int LEFT_ELBOW = 7;
    static constexpr int RIGHT_ELBOW = 8;
    static constexpr int LEFT_WRIST = 9;
    static constexpr int RIGHT_WRIST = 10;
    static constexpr int LEFT_HIP = 11;
    static constexpr int RIGHT_HIP = 12;
    static constexpr int LEFT_KNEE = 13;
    static constexpr int RIGHT_KNEE = 14;
    static constexpr int LEFT_ANKLE = 15;
    static constexpr int RIGHT_ANKLE = 16;
};

struct Point2D {
    float x = 0.0f;
    float y = 0.0f;
};

struct Keypoint {
    float x = 0.0f;
    float y = 0.0f;
    float confidence = 0.0f; // [0, 1]
};

/**
 * One person's joints for one processed video frame.
 * Treated as immutable: filters produce a new frame instead of editing one.
 */
struct KeypointFrame {
    std::array<Keypoint, NUM_KEYPOINTS> joints{};

    const Keypoint& operator[](size_t index) const { return joints[index]; }
    Keypoint& operator[](size_t index) { return joints[index]; }

    [[nodiscard]] int countVisible(float threshold) const {
        int visible = 0;
        for (const auto& joint : joints) {
            if (joint.confidence > threshold) ++visible;
        }
        return visible;
    }
};

/**
 * Output of the external pose estimator for one image.
 * std::nullopt means no person was found; that is a normal result, not an error.
 */
using PoseDetection = std::optional<KeypointFrame>;

// Recoverable per-frame outcomes. None of these end a session.
enum class FrameError {
    None = 0,
    NoDetection = 1,
    InsufficientVisibility = 2,
    Paused = 3,
    UnknownSession = 4
};

const char* frameErrorMessage(FrameError error);

struct FeedbackEvent {
    std::string screenText;                 // Shown every frame
    std::optional<std::string> speakText;   // Only when the cooldown allows
    std::chrono::steady_clock::time_point generatedAt;
};

using SessionHandle = uint32_t;

} // namespace core
