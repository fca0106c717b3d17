/**
 * Unit tests for the hysteresis and rotation repetition machines
 */

#include <gtest/gtest.h>
#include "exercise/RepetitionMachine.hpp"
#include <cmath>
#include <vector>

using exercise::Direction;
using exercise::HysteresisMachine;
using exercise::RotationAccumulator;

namespace {

// Index (1-based) of every update that returned true
std::vector<int> feed(HysteresisMachine& machine, const std::vector<float>& readings) {
    std::vector<int> reps;
    for (size_t i = 0; i < readings.size(); ++i) {
        if (machine.update(readings[i])) reps.push_back(static_cast<int>(i) + 1);
    }
    return reps;
}

core::Point2D unitTip(float headingDeg) {
    const double h = headingDeg * M_PI / 180.0;
    return core::Point2D{static_cast<float>(std::cos(h)), static_cast<float>(std::sin(h))};
}

const core::Point2D ORIGIN{0.0f, 0.0f};

} // namespace

// ============================================================
// HysteresisMachine
// ============================================================

TEST(HysteresisMachineTest, SquatSequenceCountsOnEleventhUpdate) {
    HysteresisMachine machine(80.0f, 150.0f, 3);
    const auto reps = feed(machine, {200, 200, 200, 70, 70, 70, 70, 70, 160, 160, 160});

    ASSERT_EQ(reps.size(), 1u);
    EXPECT_EQ(reps[0], 11);
    EXPECT_EQ(machine.phase(), HysteresisMachine::Phase::A);
}

TEST(HysteresisMachineTest, TooFewQualifyingReadingsNeverTransition) {
    HysteresisMachine machine(80.0f, 150.0f, 3);
    const auto reps = feed(machine, {70, 70, 200});

    EXPECT_TRUE(reps.empty());
    EXPECT_EQ(machine.phase(), HysteresisMachine::Phase::A);
    EXPECT_EQ(machine.confirmCounter(), 0);
}

TEST(HysteresisMachineTest, DeadBandReadingsResetCounter) {
    HysteresisMachine machine(80.0f, 150.0f, 3);
    feed(machine, {70, 70, 100, 70, 70});
    EXPECT_EQ(machine.phase(), HysteresisMachine::Phase::A);
    EXPECT_EQ(machine.confirmCounter(), 2);
}

TEST(HysteresisMachineTest, MissingReadingIsNonConfirming) {
    HysteresisMachine machine(80.0f, 150.0f, 3);
    machine.update(70.0f);
    machine.update(70.0f);
    EXPECT_FALSE(machine.update(std::nullopt));
    EXPECT_EQ(machine.confirmCounter(), 0);
    EXPECT_EQ(machine.phase(), HysteresisMachine::Phase::A);

    machine.update(70.0f);
    machine.update(70.0f);
    machine.update(70.0f);
    EXPECT_EQ(machine.phase(), HysteresisMachine::Phase::B);
}

TEST(HysteresisMachineTest, HeldPositionDoesNotDoubleCount) {
    HysteresisMachine machine(80.0f, 150.0f, 3);
    const auto reps = feed(machine, {70, 70, 70, 160, 160, 160, 160, 160, 160, 160});
    ASSERT_EQ(reps.size(), 1u);
    EXPECT_EQ(reps[0], 6);

    for (int i = 0; i < 20; ++i) {
        EXPECT_FALSE(machine.update(160.0f));
    }
}

TEST(HysteresisMachineTest, ArmRaiseCountsOnReturnToRest) {
    HysteresisMachine machine(20.0f, 80.0f, 3, Direction::RiseThenFall);
    const auto reps = feed(machine, {10, 10, 90, 90, 90, 10, 10, 10});

    ASSERT_EQ(reps.size(), 1u);
    EXPECT_EQ(reps[0], 8);
}

TEST(HysteresisMachineTest, ArmRaiseIgnoresSquatDirection) {
    HysteresisMachine machine(20.0f, 80.0f, 3, Direction::RiseThenFall);
    // Low readings from rest do not leave the rest phase
    EXPECT_TRUE(feed(machine, {10, 10, 10, 10}).empty());
    EXPECT_EQ(machine.phase(), HysteresisMachine::Phase::A);
}

TEST(HysteresisMachineTest, ProfileSetsPhaseNames) {
    HysteresisMachine machine(exercise::getSquatProfile());
    EXPECT_EQ(machine.phaseName(), "up");
    feed(machine, {70, 70, 70});
    EXPECT_EQ(machine.phaseName(), "down");

    HysteresisMachine raise(exercise::getArmRaiseProfile());
    EXPECT_EQ(raise.phaseName(), "down");
    EXPECT_EQ(raise.direction(), Direction::RiseThenFall);
}

TEST(HysteresisMachineTest, TransitionCallbackFires) {
    HysteresisMachine machine(80.0f, 150.0f, 1);
    std::vector<std::pair<HysteresisMachine::Phase, HysteresisMachine::Phase>> seen;
    machine.setTransitionCallback([&seen](HysteresisMachine::Phase from, HysteresisMachine::Phase to) {
        seen.emplace_back(from, to);
    });

    machine.update(70.0f);
    machine.update(160.0f);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, HysteresisMachine::Phase::A);
    EXPECT_EQ(seen[0].second, HysteresisMachine::Phase::B);
    EXPECT_EQ(seen[1].second, HysteresisMachine::Phase::A);
}

TEST(HysteresisMachineTest, MeasurementInterfaceReadsAngle) {
    auto machine = exercise::makeRepetitionMachine(exercise::getSquatProfile());
    EXPECT_EQ(machine->family(), exercise::MachineFamily::Hysteresis);

    int reps = 0;
    for (float v : {70.0f, 70.0f, 70.0f, 160.0f, 160.0f, 160.0f}) {
        exercise::Measurement m;
        m.angle = v;
        if (machine->update(m)) ++reps;
    }
    EXPECT_EQ(reps, 1);
}

// ============================================================
// RotationAccumulator
// ============================================================

TEST(RotationAccumulatorTest, FullCircleEmitsOneRepAndResets) {
    RotationAccumulator acc(300.0f);
    int reps = 0;
    float cumulativeOnRep = -1.0f;

    for (int step = 0; step <= 31; ++step) {   // 31 steps of 10 deg = 310 deg
        if (acc.update(ORIGIN, unitTip(10.0f * step))) {
            ++reps;
            cumulativeOnRep = acc.cumulative();
        }
    }

    EXPECT_EQ(reps, 1);
    EXPECT_FLOAT_EQ(cumulativeOnRep, 0.0f);
    EXPECT_LT(acc.cumulative(), 20.0f);
}

TEST(RotationAccumulatorTest, ShortRotationEmitsNothing) {
    RotationAccumulator acc(300.0f);
    int reps = 0;
    for (int step = 0; step <= 29; ++step) {   // 290 deg
        if (acc.update(ORIGIN, unitTip(10.0f * step))) ++reps;
    }
    EXPECT_EQ(reps, 0);
    EXPECT_NEAR(acc.cumulative(), 290.0f, 0.01f);
}

TEST(RotationAccumulatorTest, CrossingSeamCountsShortWay) {
    RotationAccumulator acc;
    acc.update(ORIGIN, unitTip(170.0f));
    acc.update(ORIGIN, unitTip(-170.0f));
    EXPECT_NEAR(acc.cumulative(), 20.0f, 0.01f);
}

TEST(RotationAccumulatorTest, BackAndForthAccumulatesMagnitude) {
    RotationAccumulator acc;
    acc.update(ORIGIN, unitTip(0.0f));
    acc.update(ORIGIN, unitTip(30.0f));
    acc.update(ORIGIN, unitTip(0.0f));
    EXPECT_NEAR(acc.cumulative(), 60.0f, 0.01f);
}

TEST(RotationAccumulatorTest, LostPointReseedsWithoutJump) {
    RotationAccumulator acc;
    acc.update(ORIGIN, unitTip(0.0f));
    acc.update(ORIGIN, unitTip(10.0f));
    EXPECT_NEAR(acc.cumulative(), 10.0f, 0.01f);

    EXPECT_FALSE(acc.update(ORIGIN, std::nullopt));
    EXPECT_FALSE(acc.previousHeading().has_value());

    // Re-acquired far away: seeds only
    acc.update(ORIGIN, unitTip(150.0f));
    EXPECT_NEAR(acc.cumulative(), 10.0f, 0.01f);

    acc.update(ORIGIN, unitTip(160.0f));
    EXPECT_NEAR(acc.cumulative(), 20.0f, 0.01f);
}

TEST(RotationAccumulatorTest, InvalidThresholdFallsBack) {
    RotationAccumulator acc(-5.0f);
    EXPECT_FLOAT_EQ(acc.threshold(), core::ROTATION_THRESHOLD_DEG);
}

TEST(RotationAccumulatorTest, FactoryBuildsAccumulatorForArmCircle) {
    auto machine = exercise::makeRepetitionMachine(exercise::getArmCircleProfile());
    EXPECT_EQ(machine->family(), exercise::MachineFamily::Rotation);
    EXPECT_EQ(machine->phaseName(), "idle");
}

// ============================================================
// Profiles
// ============================================================

TEST(ExerciseProfileTest, PresetsAreValid) {
    EXPECT_TRUE(exercise::getSquatProfile().isValid());
    EXPECT_TRUE(exercise::getStrictSquatProfile().isValid());
    EXPECT_TRUE(exercise::getArmCircleProfile().isValid());
    EXPECT_TRUE(exercise::getArmRaiseProfile().isValid());
}

TEST(ExerciseProfileTest, EmptyDeadBandIsInvalid) {
    auto profile = exercise::getSquatProfile();
    profile.lowThreshold = 160.0f;
    profile.highThreshold = 100.0f;

    std::string reason;
    EXPECT_FALSE(profile.isValid(&reason));
    EXPECT_FALSE(reason.empty());
}

TEST(ExerciseProfileTest, KindNames) {
    EXPECT_STREQ(exercise::exerciseKindName(exercise::ExerciseKind::ArmRaise), "arm_raise");
    auto both = exercise::exerciseKindFromName("both");
    ASSERT_TRUE(both.has_value());
    EXPECT_TRUE(*both == exercise::ExerciseKind::SquatAndArmCircle);
    EXPECT_FALSE(exercise::exerciseKindFromName("pushup").has_value());
}
