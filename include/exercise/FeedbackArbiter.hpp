#pragma once

#include "core/Types.hpp"
#include "exercise/ExerciseProfile.hpp"
#include "math/Kinematics.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace exercise {

struct FeedbackConfig {
    float cooldownSeconds = core::FEEDBACK_COOLDOWN_S;
    float symmetryToleranceDeg = 15.0f;   // Left/right arm difference that counts as uneven
    float minElbowDeg = 160.0f;           // Arm raise: straighter than this counts as straight
};

/**
 * Turns one frame's angles into coaching text.
 *
 * Screen text is produced every frame. Spoken text is produced only when the
 * cooldown since the last spoken message has elapsed. Rep announcements bypass
 * the cooldown and restart it.
 */
class FeedbackArbiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit FeedbackArbiter(ExerciseKind kind, FeedbackConfig config = {});

    /**
     * Evaluate the rule set for this frame.
     * @param cumulativeRotation arm-circle accumulator state, used by the
     *        combined squat/arm-circle mode to tell which exercise is underway
     */
    core::FeedbackEvent evaluate(const math::AngleSet& angles, Clock::time_point now,
                                 float cumulativeRotation = 0.0f);

    /**
     * Spoken confirmation for a completed repetition of `which`
     */
    std::string announceRep(ExerciseKind which, Clock::time_point now);

    [[nodiscard]] bool cooldownElapsed(Clock::time_point now) const;
    [[nodiscard]] ExerciseKind kind() const { return kind_; }

    void reset() { lastSpoken_.reset(); }

private:
    struct Advice {
        std::vector<std::string> lines;
        std::optional<std::string> speak;
    };

    ExerciseKind kind_;
    FeedbackConfig config_;
    std::optional<Clock::time_point> lastSpoken_;

    Advice squatAdvice(const math::AngleSet& angles) const;
    Advice armCircleAdvice(const math::AngleSet& angles) const;
    Advice armRaiseAdvice(const math::AngleSet& angles) const;

    [[nodiscard]] ExerciseKind activeRuleSet(const math::AngleSet& angles, float cumulativeRotation,
                                             bool& detected) const;
};

} // namespace exercise
