#include "exercise/FormComparator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace exercise {

namespace {
constexpr float KNEE_BALANCE_DEG = 10.0f;
}

std::string FormReport::visualSummary(size_t maxLines) const {
    std::ostringstream out;
    out << "Form Score: " << score << "/100";
    const size_t n = std::min(maxLines, feedback.size());
    for (size_t i = 0; i < n; ++i) {
        out << " | " << feedback[i];
    }
    return out.str();
}

FormComparator::FormComparator(ReferenceProfile reference, std::vector<PhaseBand> bands, float toleranceDeg)
    : reference_(std::move(reference)),
      bands_(std::move(bands)),
      tolerance_(toleranceDeg) {
    if (!(tolerance_ >= 0.0f)) {
        core::Logger::warn("FormComparator: invalid tolerance ", tolerance_,
                           ", using ", core::FORM_TOLERANCE_DEG);
        tolerance_ = core::FORM_TOLERANCE_DEG;
    }
}

std::string FormComparator::selectPhase(float primaryAngle) const {
    for (const auto& band : bands_) {
        if (primaryAngle > band.above) return band.label;
    }
    return bands_.empty() ? std::string() : bands_.back().label;
}

int FormComparator::scoreFromDeviations(const std::map<math::JointAngle, float>& deviations) {
    if (deviations.empty()) return core::FORM_NEUTRAL_SCORE;

    double total = 0.0;
    for (const auto& [joint, deviation] : deviations) {
        total += std::fabs(deviation);
    }
    const double mean = total / static_cast<double>(deviations.size());
    const double penalty = std::clamp(mean / core::FORM_SCORE_SPAN_DEG * 100.0, 0.0, 100.0);
    return static_cast<int>(std::lround(100.0 - penalty));
}

FormReport FormComparator::compare(const math::AngleSet& angles, const std::string& phase) const {
    FormReport report;
    report.phase = phase;

    const PhaseAngles* expected = reference_.findPhase(phase);
    if (!expected) {
        report.feedback.push_back("No reference for " + phase + " phase");
        return report;
    }

    // Knee balance is advisory only
    auto lk = angles.get(math::JointAngle::LeftKnee);
    auto rk = angles.get(math::JointAngle::RightKnee);
    if (lk && rk && std::fabs(*lk - *rk) > KNEE_BALANCE_DEG) {
        std::ostringstream line;
        line << "Uneven! L" << std::lround(*lk) << "° vs R" << std::lround(*rk)
             << "° - Balance your weight";
        report.feedback.push_back(line.str());
    }

    for (const auto& [name, target] : *expected) {
        auto joint = math::jointAngleFromName(name);
        if (!joint) continue;
        auto measured = angles.get(*joint);
        if (!measured) continue;
        report.deviations[*joint] = *measured - target;
    }

    bool anyOff = false;
    for (const auto& [joint, deviation] : report.deviations) {
        if (std::fabs(deviation) <= tolerance_) continue;
        anyOff = true;
        std::ostringstream line;
        line << math::jointAngleDisplayName(joint) << (deviation > 0 ? " higher" : " lower")
             << " by " << std::lround(std::fabs(deviation)) << "°";
        report.feedback.push_back(line.str());
    }

    if (!anyOff && !report.deviations.empty()) {
        report.feedback.push_back("Good " + phase + " position!");
    }

    report.score = scoreFromDeviations(report.deviations);
    report.acceptable = !report.deviations.empty() && report.score >= core::FORM_ACCEPTABLE_SCORE;
    return report;
}

FormReport FormComparator::compare(const math::AngleSet& angles, std::optional<float> primaryAngle) const {
    if (!primaryAngle) {
        return FormReport{};
    }
    return compare(angles, selectPhase(*primaryAngle));
}

} // namespace exercise
