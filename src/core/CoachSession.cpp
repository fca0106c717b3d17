#include "core/CoachSession.hpp"
#include "core/Logger.hpp"

namespace core {

using exercise::ExerciseKind;

namespace {
// Rejected-frame streak that is worth one log line (about a second of video)
constexpr int REJECT_LOG_STREAK = static_cast<int>(SOURCE_FPS);
}

CoachSession::CoachSession(SessionHandle id, ExerciseKind kind, const EngineConfig& config,
                           exercise::ReferenceStore* store)
    : id_(id),
      kind_(kind),
      filter_(config.filter),
      extractor_(config.filter.visibilityThreshold),
      arbiter_(kind, config.feedback) {
    if (kind == ExerciseKind::SquatAndArmCircle) {
        addTracker(ExerciseKind::Squat, config.profile(ExerciseKind::Squat));
        addTracker(ExerciseKind::ArmCircle, config.profile(ExerciseKind::ArmCircle));
    } else {
        addTracker(kind, config.profile(kind));
    }

    const exercise::ExerciseProfile& primary = trackers_.front().profile;
    if (config.comparator.enabled && store && !primary.referenceLabel.empty()) {
        exercise::ReferenceProfile reference =
            exercise::loadReferenceOrFallback(store, primary.referenceLabel, primary.phaseBands);
        comparator_.emplace(std::move(reference), primary.phaseBands, config.comparator.toleranceDeg);
    }

    Logger::info("Session ", id_, " started: ", exerciseKindName(kind_),
                 comparator_ ? " (form scoring on)" : "");
}

void CoachSession::addTracker(ExerciseKind kind, const exercise::ExerciseProfile& profile) {
    Tracker tracker;
    tracker.kind = kind;
    tracker.profile = profile;
    tracker.machine = exercise::makeRepetitionMachine(profile);
    tracker.rotation = dynamic_cast<exercise::RotationAccumulator*>(tracker.machine.get());
    trackers_.push_back(std::move(tracker));
}

int CoachSession::repCount() const {
    int total = 0;
    for (const auto& tracker : trackers_) {
        total += tracker.reps;
    }
    return total;
}

int CoachSession::repCount(ExerciseKind kind) const {
    for (const auto& tracker : trackers_) {
        if (tracker.kind == kind) return tracker.reps;
    }
    return 0;
}

void CoachSession::fillCounts(FrameResult& result) const {
    result.exercise = exerciseKindName(kind_);
    result.repCount = repCount();
    result.counts.clear();
    for (const auto& tracker : trackers_) {
        result.counts.emplace_back(tracker.kind, tracker.reps);
    }
    result.phase = trackers_.front().machine->phaseName();
    result.calibrated = calibratedScale_.has_value();
}

FrameResult CoachSession::reject(FrameError error, Clock::time_point now) {
    FrameResult result;
    result.success = false;
    result.error = error;
    result.timestamp = now;
    result.feedback = frameErrorMessage(error);
    fillCounts(result);

    if (error != FrameError::Paused && ++rejectedStreak_ == REJECT_LOG_STREAK) {
        Logger::info("Session ", id_, ": ", frameErrorMessage(error), " (", rejectedStreak_, " frames)");
    }
    return result;
}

bool CoachSession::calibrate(const PoseDetection& detection) {
    if (!detection) return false;

    auto width = extractor_.shoulderWidth(*detection);
    if (!width || *width < MIN_BODY_SCALE) {
        Logger::warn("Session ", id_, ": calibration needs both shoulders in view");
        return false;
    }

    calibratedScale_ = *width;
    Logger::info("Session ", id_, ": calibrated shoulder width ", *width, " px");
    return true;
}

FrameResult CoachSession::processFrame(const PoseDetection& detection, Clock::time_point now) {
    if (paused_) {
        return reject(FrameError::Paused, now);
    }
    if (!detection) {
        return reject(FrameError::NoDetection, now);
    }
    if (filter_.update(*detection) == math::FilterStatus::InsufficientVisibility) {
        return reject(FrameError::InsufficientVisibility, now);
    }

    if (rejectedStreak_ >= REJECT_LOG_STREAK) {
        Logger::info("Session ", id_, ": tracking resumed");
    }
    rejectedStreak_ = 0;

    const math::KinematicSnapshot snapshot = extractor_.extract(*filter_.smoothed(), calibratedScale_);

    FrameResult result;
    result.success = true;
    result.timestamp = now;
    result.angles = snapshot.angles;
    result.scale = snapshot.scale;

    std::vector<ExerciseKind> completed;
    float cumulativeRotation = 0.0f;

    for (auto& tracker : trackers_) {
        exercise::Measurement measurement;
        if (tracker.rotation) {
            measurement.origin = snapshot.shoulderMid;
            measurement.tip = snapshot.wristMid;
        } else {
            measurement.angle = snapshot.angles.get(tracker.profile.trackedAngle);
        }

        if (tracker.machine->update(measurement)) {
            tracker.reps++;
            completed.push_back(tracker.kind);
            Logger::info("Session ", id_, ": ", exerciseKindName(tracker.kind), " rep ", tracker.reps);
        }

        if (tracker.rotation) {
            cumulativeRotation = tracker.rotation->cumulative();
        }
    }

    core::FeedbackEvent event = arbiter_.evaluate(snapshot.angles, now, cumulativeRotation);
    result.feedback = std::move(event.screenText);

    if (completed.empty()) {
        if (event.speakText) result.speech.push_back(std::move(*event.speakText));
    } else {
        // Every finished rep is announced; they replace this frame's advice
        result.repCompleted = true;
        for (ExerciseKind kind : completed) {
            result.speech.push_back(arbiter_.announceRep(kind, now));
        }
    }

    if (comparator_) {
        const auto& primary = trackers_.front().profile;
        result.form = comparator_->compare(snapshot.angles, snapshot.angles.get(primary.trackedAngle));
    }

    fillCounts(result);
    return result;
}

} // namespace core
