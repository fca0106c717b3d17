#pragma once

#include "core/Types.hpp"
#include "exercise/ExerciseProfile.hpp"
#include "exercise/ReferenceStore.hpp"
#include "math/Kinematics.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exercise {

/**
 * Result of comparing one frame against the reference for its phase.
 */
struct FormReport {
    std::string phase;
    std::map<math::JointAngle, float> deviations;   // measured - reference, checked joints only
    std::vector<std::string> feedback;
    int score = core::FORM_NEUTRAL_SCORE;
    bool acceptable = false;

    /**
     * "Form Score: N/100 | line | line | line"
     */
    [[nodiscard]] std::string visualSummary(size_t maxLines = 3) const;
};

/**
 * Scores posture against a reference profile. Never throws; missing data
 * yields the neutral score.
 */
class FormComparator {
public:
    FormComparator(ReferenceProfile reference, std::vector<PhaseBand> bands,
                   float toleranceDeg = core::FORM_TOLERANCE_DEG);

    /**
     * First band whose lower bound the primary angle exceeds
     */
    [[nodiscard]] std::string selectPhase(float primaryAngle) const;

    [[nodiscard]] FormReport compare(const math::AngleSet& angles, const std::string& phase) const;

    /**
     * Select the phase from the primary angle, then compare.
     * An absent primary angle gives the neutral report with an empty phase.
     */
    [[nodiscard]] FormReport compare(const math::AngleSet& angles, std::optional<float> primaryAngle) const;

    /**
     * 100 - clamp(mean|dev| / span * 100, 0, 100), rounded; neutral when empty
     */
    static int scoreFromDeviations(const std::map<math::JointAngle, float>& deviations);

    [[nodiscard]] const ReferenceProfile& reference() const { return reference_; }
    [[nodiscard]] float tolerance() const { return tolerance_; }

private:
    ReferenceProfile reference_;
    std::vector<PhaseBand> bands_;
    float tolerance_;
};

} // namespace exercise
