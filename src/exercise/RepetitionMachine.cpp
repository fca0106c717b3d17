#include "exercise/RepetitionMachine.hpp"
#include "core/Logger.hpp"
#include "math/Kinematics.hpp"
#include <algorithm>
#include <cmath>

namespace exercise {

// ============================================================
// HysteresisMachine
// ============================================================

HysteresisMachine::HysteresisMachine(float lowThreshold, float highThreshold, int confirmFrames,
                                     Direction direction)
    : low_(lowThreshold),
      high_(highThreshold),
      confirmFrames_(std::max(1, confirmFrames)),
      direction_(direction) {
    if (!(low_ < high_)) {
        core::Logger::warn("HysteresisMachine: empty dead band (low ", low_, " >= high ", high_, ")");
    }
    reset();
}

HysteresisMachine::HysteresisMachine(const ExerciseProfile& profile)
    : HysteresisMachine(profile.lowThreshold, profile.highThreshold,
                        profile.confirmFrames, profile.direction) {
    setPhaseNames(profile.restPhase, profile.activePhase);
}

void HysteresisMachine::reset() {
    phase_ = Phase::A;
    counter_ = 0;
}

void HysteresisMachine::setPhaseNames(std::string rest, std::string active) {
    restName_ = std::move(rest);
    activeName_ = std::move(active);
}

std::string HysteresisMachine::phaseName() const {
    return phase_ == Phase::A ? restName_ : activeName_;
}

float HysteresisMachine::progress() const {
    return static_cast<float>(counter_) / static_cast<float>(confirmFrames_);
}

bool HysteresisMachine::qualifiesForExit(float value) const {
    const bool leavingRest = (phase_ == Phase::A);
    if (direction_ == Direction::FallThenRise) {
        return leavingRest ? (value < low_) : (value > high_);
    }
    return leavingRest ? (value > high_) : (value < low_);
}

bool HysteresisMachine::update(std::optional<float> value) {
    if (!value) {
        // Missing measurement never confirms anything
        counter_ = 0;
        return false;
    }

    if (!qualifiesForExit(*value)) {
        counter_ = 0;
        return false;
    }

    if (++counter_ < confirmFrames_) {
        return false;
    }

    const bool completesRep = (phase_ == Phase::B);
    transitionTo(completesRep ? Phase::A : Phase::B);
    return completesRep;
}

void HysteresisMachine::transitionTo(Phase next) {
    Phase previous = phase_;
    phase_ = next;
    counter_ = 0;

    core::Logger::debug("HysteresisMachine: ",
                        previous == Phase::A ? restName_ : activeName_, " → ",
                        next == Phase::A ? restName_ : activeName_);

    if (transitionCallback_) {
        transitionCallback_(previous, next);
    }
}

// ============================================================
// RotationAccumulator
// ============================================================

RotationAccumulator::RotationAccumulator(float thresholdDeg)
    : threshold_(thresholdDeg) {
    if (!(threshold_ > 0.0f)) {
        core::Logger::warn("RotationAccumulator: invalid threshold ", threshold_,
                           ", using ", core::ROTATION_THRESHOLD_DEG);
        threshold_ = core::ROTATION_THRESHOLD_DEG;
    }
    reset();
}

void RotationAccumulator::reset() {
    cumulative_ = 0.0f;
    previousHeading_.reset();
}

std::string RotationAccumulator::phaseName() const {
    return previousHeading_ ? "rotating" : "idle";
}

float RotationAccumulator::progress() const {
    return std::clamp(cumulative_ / threshold_, 0.0f, 1.0f);
}

bool RotationAccumulator::update(const std::optional<core::Point2D>& origin,
                                 const std::optional<core::Point2D>& tip) {
    if (!origin || !tip) {
        previousHeading_.reset();
        return false;
    }

    const float heading = math::headingDeg(*origin, *tip);

    if (!previousHeading_) {
        previousHeading_ = heading;
        return false;
    }

    const float delta = math::wrapAngle(heading - *previousHeading_);
    cumulative_ += std::fabs(delta);
    previousHeading_ = heading;

    if (cumulative_ >= threshold_) {
        cumulative_ = 0.0f;
        core::Logger::debug("RotationAccumulator: full circle");
        return true;
    }
    return false;
}

// ============================================================
// Factory
// ============================================================

std::unique_ptr<RepetitionMachine> makeRepetitionMachine(const ExerciseProfile& profile) {
    if (profile.family == MachineFamily::Rotation) {
        return std::make_unique<RotationAccumulator>(profile.rotationThreshold);
    }
    return std::make_unique<HysteresisMachine>(profile);
}

} // namespace exercise
