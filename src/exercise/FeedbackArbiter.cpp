#include "exercise/FeedbackArbiter.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <sstream>

namespace exercise {

using math::JointAngle;

namespace {

// Squat depth bands on average knee angle
constexpr float SHALLOW_ABOVE = 140.0f;
constexpr float DEEP_BELOW = 75.0f;

// Arm circle: both elbows locked out
constexpr float LOCKED_ELBOW_ABOVE = 170.0f;

// Arm raise height bands on average arm elevation
constexpr float RAISE_TOO_LOW = 70.0f;
constexpr float RAISE_PERFECT_FROM = 80.0f;
constexpr float RAISE_TOO_HIGH = 100.0f;

// Combined mode: a knee bend below this means a squat is underway
constexpr float SQUAT_DETECT_BELOW = 120.0f;

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += " | ";
        out += lines[i];
    }
    return out;
}

std::string pairLine(const char* label, float left, float right) {
    std::ostringstream line;
    line << label << ": L" << static_cast<int>(left) << "° R" << static_cast<int>(right) << "°";
    return line.str();
}

} // namespace

FeedbackArbiter::FeedbackArbiter(ExerciseKind kind, FeedbackConfig config)
    : kind_(kind), config_(config) {
    if (config_.cooldownSeconds < 0.0f) {
        core::Logger::warn("FeedbackArbiter: negative cooldown ", config_.cooldownSeconds, ", using 0");
        config_.cooldownSeconds = 0.0f;
    }
}

bool FeedbackArbiter::cooldownElapsed(Clock::time_point now) const {
    if (!lastSpoken_) return true;
    const std::chrono::duration<float> since = now - *lastSpoken_;
    return since.count() > config_.cooldownSeconds;
}

FeedbackArbiter::Advice FeedbackArbiter::squatAdvice(const math::AngleSet& angles) const {
    Advice advice;
    auto lk = angles.get(JointAngle::LeftKnee);
    auto rk = angles.get(JointAngle::RightKnee);
    if (!lk || !rk) {
        advice.lines.emplace_back("Can't measure squat - reposition");
        return advice;
    }

    advice.lines.push_back(pairLine("Knees", *lk, *rk));

    const float avgKnee = (*lk + *rk) / 2.0f;
    if (avgKnee > SHALLOW_ABOVE) {
        advice.lines.emplace_back("Try going deeper.");
        advice.speak = "Try lowering a bit more to hit full depth.";
    } else if (avgKnee < DEEP_BELOW) {
        advice.lines.emplace_back("Nice depth, control the movement.");
        advice.speak = "Good depth. Keep control on the way up.";
    } else {
        advice.lines.emplace_back("Good squat depth.");
        advice.speak = "Good squat. Keep your chest up.";
    }
    return advice;
}

FeedbackArbiter::Advice FeedbackArbiter::armCircleAdvice(const math::AngleSet& angles) const {
    Advice advice;
    auto le = angles.get(JointAngle::LeftElbow);
    auto re = angles.get(JointAngle::RightElbow);
    if (!le || !re) {
        advice.lines.emplace_back("Can't measure arms - reposition");
        return advice;
    }

    advice.lines.push_back(pairLine("Elbows", *le, *re));

    if (*le > LOCKED_ELBOW_ABOVE && *re > LOCKED_ELBOW_ABOVE) {
        advice.lines.emplace_back("Soften your elbows a little.");
        advice.speak = "Bend your elbows slightly so your shoulders aren't strained.";
    } else {
        advice.lines.emplace_back("Nice arm circle.");
        advice.speak = "Nice rotation, keep a smooth pace.";
    }
    return advice;
}

FeedbackArbiter::Advice FeedbackArbiter::armRaiseAdvice(const math::AngleSet& angles) const {
    Advice advice;
    auto le = angles.get(JointAngle::LeftElbow);
    auto re = angles.get(JointAngle::RightElbow);
    auto la = angles.get(JointAngle::LeftArm);
    auto ra = angles.get(JointAngle::RightArm);
    if (!le || !re || !la || !ra) {
        advice.lines.emplace_back("Can't measure arms - reposition");
        return advice;
    }

    const float avgElbow = (*le + *re) / 2.0f;
    const float avgArm = (*la + *ra) / 2.0f;

    advice.lines.push_back(pairLine("Arms", *la, *ra));

    const bool bent = avgElbow < config_.minElbowDeg;
    if (bent) {
        advice.lines.push_back("Keep arms straight! (Elbows: " + std::to_string(static_cast<int>(avgElbow)) + "°)");
    } else {
        advice.lines.emplace_back("Arms straight");
    }

    const bool tooLow = avgArm < RAISE_TOO_LOW;
    const bool tooHigh = avgArm > RAISE_TOO_HIGH;
    if (tooLow) {
        advice.lines.emplace_back("Raise arms higher to shoulder level");
    } else if (tooHigh) {
        advice.lines.emplace_back("Don't raise too high! Risk of injury");
    } else if (avgArm >= RAISE_PERFECT_FROM) {
        advice.lines.emplace_back("Perfect height (shoulder level)");
    } else {
        advice.lines.emplace_back("Good movement");
    }

    const bool uneven = std::fabs(*la - *ra) > config_.symmetryToleranceDeg;
    advice.lines.emplace_back(uneven ? "Uneven arms! Keep them level" : "Good balance");

    // Most serious warning wins
    if (tooHigh) {
        advice.speak = "Don't raise your arms above shoulder level.";
    } else if (bent) {
        advice.speak = "Keep your arms straight.";
    } else if (uneven) {
        advice.speak = "Keep both arms level.";
    } else if (tooLow) {
        advice.speak = "Raise your arms to shoulder level.";
    } else {
        advice.speak = "Good form, keep it steady.";
    }
    return advice;
}

ExerciseKind FeedbackArbiter::activeRuleSet(const math::AngleSet& angles, float cumulativeRotation,
                                            bool& detected) const {
    detected = true;
    if (kind_ != ExerciseKind::SquatAndArmCircle) return kind_;

    auto avgKnee = angles.get(JointAngle::AvgKnee);
    if (avgKnee && *avgKnee < SQUAT_DETECT_BELOW) return ExerciseKind::Squat;
    if (cumulativeRotation > 0.0f) return ExerciseKind::ArmCircle;

    detected = false;
    return kind_;
}

core::FeedbackEvent FeedbackArbiter::evaluate(const math::AngleSet& angles, Clock::time_point now,
                                              float cumulativeRotation) {
    core::FeedbackEvent event;
    event.generatedAt = now;

    bool detected = false;
    const ExerciseKind rules = activeRuleSet(angles, cumulativeRotation, detected);
    if (!detected) {
        event.screenText = "No exercise detected.";
        return event;
    }

    Advice advice;
    switch (rules) {
        case ExerciseKind::ArmCircle: advice = armCircleAdvice(angles); break;
        case ExerciseKind::ArmRaise:  advice = armRaiseAdvice(angles); break;
        case ExerciseKind::Squat:
        default:
            advice = squatAdvice(angles);
            break;
    }

    event.screenText = joinLines(advice.lines);
    if (advice.speak && cooldownElapsed(now)) {
        event.speakText = std::move(advice.speak);
        lastSpoken_ = now;
    }
    return event;
}

std::string FeedbackArbiter::announceRep(ExerciseKind which, Clock::time_point now) {
    lastSpoken_ = now;
    switch (which) {
        case ExerciseKind::ArmCircle: return "Nice circle. Rep counted.";
        case ExerciseKind::ArmRaise:  return "Nice raise. Rep counted.";
        case ExerciseKind::Squat:
        case ExerciseKind::SquatAndArmCircle:
        default:
            return "Nice squat. Rep counted.";
    }
}

} // namespace exercise
