#pragma once

#include "core/Types.hpp"
#include "exercise/ExerciseProfile.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace exercise {

/**
 * Per-frame input to a repetition machine. Hysteresis machines read `angle`,
 * rotation machines read the `origin` -> `tip` vector. Absent fields mean the
 * measurement could not be taken this frame.
 */
struct Measurement {
    std::optional<float> angle;
    std::optional<core::Point2D> origin;
    std::optional<core::Point2D> tip;
};

/**
 * Common interface of the two machine families.
 * update() returns true exactly on the frame a repetition completes.
 * Machines are deterministic and touch nothing but their own state.
 */
class RepetitionMachine {
public:
    virtual ~RepetitionMachine() = default;

    virtual bool update(const Measurement& measurement) = 0;
    virtual void reset() = 0;

    [[nodiscard]] virtual MachineFamily family() const = 0;

    /**
     * Name of the current phase ("up", "down", or "rotating")
     */
    [[nodiscard]] virtual std::string phaseName() const = 0;

    /**
     * Progress (0-1) towards the next transition or rep
     */
    [[nodiscard]] virtual float progress() const = 0;
};

/**
 * Two-state Schmitt trigger with frame-count debounce.
 *
 * States: A (rest) and B (active); starts in A.
 * - Dead band between low and high thresholds rejects chatter near one boundary
 * - A transition needs confirmFrames consecutive qualifying readings
 * - A missing reading resets the counter and never changes phase
 * - The rep is emitted on the B -> A transition
 */
class HysteresisMachine : public RepetitionMachine {
public:
    enum class Phase { A, B };

    using TransitionCallback = std::function<void(Phase from, Phase to)>;

    HysteresisMachine(float lowThreshold, float highThreshold, int confirmFrames,
                      Direction direction = Direction::FallThenRise);

    explicit HysteresisMachine(const ExerciseProfile& profile);

    /**
     * Feed the tracked scalar for this frame (nullopt = cannot measure)
     * @return true if this reading completed a repetition
     */
    bool update(std::optional<float> value);

    bool update(const Measurement& measurement) override { return update(measurement.angle); }
    void reset() override;

    [[nodiscard]] MachineFamily family() const override { return MachineFamily::Hysteresis; }
    [[nodiscard]] std::string phaseName() const override;
    [[nodiscard]] float progress() const override;

    [[nodiscard]] Phase phase() const { return phase_; }
    [[nodiscard]] int confirmCounter() const { return counter_; }
    [[nodiscard]] Direction direction() const { return direction_; }

    void setPhaseNames(std::string rest, std::string active);
    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

private:
    float low_;
    float high_;
    int confirmFrames_;
    Direction direction_;

    Phase phase_ = Phase::A;
    int counter_ = 0;

    std::string restName_ = "A";
    std::string activeName_ = "B";

    TransitionCallback transitionCallback_;

    // Whether v qualifies for leaving the current phase
    [[nodiscard]] bool qualifiesForExit(float value) const;

    void transitionTo(Phase next);
};

/**
 * Counts full rotations of the origin -> tip vector (shoulder-mid -> wrist-mid).
 *
 * Accumulates |wrap(heading - previous)| each frame and emits a rep once the
 * total reaches the threshold, then restarts from zero. Losing either point
 * drops the previous heading so that re-acquisition never adds a spurious jump.
 */
class RotationAccumulator : public RepetitionMachine {
public:
    explicit RotationAccumulator(float thresholdDeg = core::ROTATION_THRESHOLD_DEG);

    bool update(const std::optional<core::Point2D>& origin, const std::optional<core::Point2D>& tip);

    bool update(const Measurement& measurement) override {
        return update(measurement.origin, measurement.tip);
    }
    void reset() override;

    [[nodiscard]] MachineFamily family() const override { return MachineFamily::Rotation; }
    [[nodiscard]] std::string phaseName() const override;
    [[nodiscard]] float progress() const override;

    [[nodiscard]] float cumulative() const { return cumulative_; }
    [[nodiscard]] std::optional<float> previousHeading() const { return previousHeading_; }
    [[nodiscard]] float threshold() const { return threshold_; }

private:
    float threshold_;
    float cumulative_ = 0.0f;
    std::optional<float> previousHeading_;
};

/**
 * Build the machine a profile asks for.
 */
std::unique_ptr<RepetitionMachine> makeRepetitionMachine(const ExerciseProfile& profile);

} // namespace exercise
