#pragma once

#include "core/EngineConfig.hpp"
#include "core/Types.hpp"
#include "exercise/FeedbackArbiter.hpp"
#include "exercise/FormComparator.hpp"
#include "exercise/ReferenceStore.hpp"
#include "exercise/RepetitionMachine.hpp"
#include "math/KeypointFilter.hpp"
#include "math/Kinematics.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace core {

/**
 * Everything the control surface reports for one processed frame.
 */
struct FrameResult {
    bool success = false;
    FrameError error = FrameError::None;

    std::string exercise;
    int repCount = 0;                                              // All trackers combined
    std::vector<std::pair<exercise::ExerciseKind, int>> counts;    // Per tracked exercise
    bool repCompleted = false;
    std::string phase;                                             // Primary machine phase

    std::string feedback;                    // Screen text
    std::vector<std::string> speech;         // Handed to the voice dispatcher in order

    math::AngleSet angles;
    std::optional<exercise::FormReport> form;

    float scale = 1.0f;
    bool calibrated = false;

    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] const char* errorMessage() const { return frameErrorMessage(error); }
};

/**
 * One user's exercise session. Owns all of its mutable state: smoothing
 * history, repetition machines, counters, feedback cooldown and reference.
 * Not thread-safe on its own; SessionManager serialises access.
 */
class CoachSession {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param store reference source; nullptr or comparator disabled means no form scoring
     */
    CoachSession(SessionHandle id, exercise::ExerciseKind kind, const EngineConfig& config,
                 exercise::ReferenceStore* store);

    FrameResult processFrame(const PoseDetection& detection, Clock::time_point now);

    /**
     * Capture the current shoulder width as body scale.
     * @return false if either shoulder is not visible
     */
    bool calibrate(const PoseDetection& detection);

    void setPaused(bool paused) { paused_ = paused; }
    [[nodiscard]] bool paused() const { return paused_; }

    [[nodiscard]] int repCount() const;
    [[nodiscard]] int repCount(exercise::ExerciseKind kind) const;

    [[nodiscard]] SessionHandle id() const { return id_; }
    [[nodiscard]] exercise::ExerciseKind kind() const { return kind_; }
    [[nodiscard]] std::optional<float> calibratedScale() const { return calibratedScale_; }
    [[nodiscard]] bool hasComparator() const { return comparator_.has_value(); }

private:
    struct Tracker {
        exercise::ExerciseKind kind;
        exercise::ExerciseProfile profile;
        std::unique_ptr<exercise::RepetitionMachine> machine;
        exercise::RotationAccumulator* rotation = nullptr;   // Set when machine is an accumulator
        int reps = 0;
    };

    SessionHandle id_;
    exercise::ExerciseKind kind_;

    math::KeypointFilter filter_;
    math::KinematicExtractor extractor_;
    exercise::FeedbackArbiter arbiter_;
    std::optional<exercise::FormComparator> comparator_;
    std::vector<Tracker> trackers_;   // Primary tracker first

    std::optional<float> calibratedScale_;
    bool paused_ = false;
    int rejectedStreak_ = 0;

    void addTracker(exercise::ExerciseKind kind, const exercise::ExerciseProfile& profile);
    FrameResult reject(FrameError error, Clock::time_point now);
    void fillCounts(FrameResult& result) const;
};

} // namespace core
