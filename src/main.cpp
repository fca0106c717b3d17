#include "core/EngineConfig.hpp"
#include "core/KeypointSource.hpp"
#include "core/Logger.hpp"
#include "core/SessionManager.hpp"
#include "core/Types.hpp"
#include "exercise/ExerciseProfile.hpp"
#include "net/OscPublisher.hpp"
#include "voice/VoiceDispatcher.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    core::Logger::info("Interrupt signal (", signum, ") received. Shutting down...");
    g_running = false;
}

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <recording.yaml> [exercise] [config.yaml]\n"
              << "  exercise: squat | arm_circle | arm_raise | squat_and_arm_circle (default squat)\n";
}

} // namespace

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string recordingPath = argv[1];
    const std::string exerciseName = argc > 2 ? argv[2] : "squat";

    auto kind = exercise::exerciseKindFromName(exerciseName);
    if (!kind) {
        std::cerr << "Unknown exercise '" << exerciseName << "'\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        // 1. Configuration
        core::EngineConfig config = argc > 3 ? core::loadConfig(argv[3]) : core::defaultConfig();
        core::Logger::setLevel(config.log.level);

        core::Logger::info("Starting RepCoach: ", exercise::exerciseKindName(*kind));

        // 2. Input
        core::RecordingSource source(recordingPath);

        // 3. Voice worker
        std::unique_ptr<voice::VoiceDispatcher> voice;
        if (config.voice.enabled) {
            voice = std::make_unique<voice::VoiceDispatcher>(voice::makeSpeechBackend(config.voice), config.voice);
            voice->start();
        }

        // 4. OSC output
        std::unique_ptr<net::OscPublisher> osc;
        if (config.osc.enabled) {
            osc = std::make_unique<net::OscPublisher>(config.osc);
            if (!osc->start()) {
                core::Logger::warn("OSC output disabled");
                osc.reset();
            }
        }

        // 5. Session
        core::SessionManager manager(config, nullptr, voice.get());
        const core::SessionHandle session = manager.start(*kind);

        const auto frameInterval = config.driver.fps > 0.0f
            ? std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                  std::chrono::duration<float>(1.0f / config.driver.fps))
            : std::chrono::steady_clock::duration::zero();
        auto nextFrame = std::chrono::steady_clock::now();

        bool calibrated = false;
        core::PoseDetection detection;
        std::string lastFeedback;

        // Driver loop
        while (g_running && source.next(detection)) {
            if (!calibrated && detection) {
                calibrated = manager.calibrate(session, detection);
            }

            core::FrameResult result = manager.processFrame(session, detection);

            if (osc) {
                osc->publish(result);
            }

            if (result.repCompleted) {
                std::cout << "Reps: " << result.repCount << std::endl;
            }
            if (result.feedback != lastFeedback) {
                core::Logger::debug("Frame ", source.position(), ": ", result.feedback);
                lastFeedback = result.feedback;
            }
            if (result.form && !result.form->feedback.empty()) {
                core::Logger::debug(result.form->visualSummary());
            }

            if (frameInterval.count() > 0) {
                nextFrame += frameInterval;
                std::this_thread::sleep_until(nextFrame);
            }
        }

        // Shutdown: Stop explicitly to ensure clean cleanup order
        std::optional<int> finalReps = manager.end(session);
        if (osc) osc->stop();
        if (voice) voice->stop();

        std::cout << "Final reps: " << finalReps.value_or(0) << std::endl;

    } catch (const std::exception& e) {
        core::Logger::error("Fatal error: ", e.what());
        return 1;
    }

    core::Logger::info("RepCoach stopped cleanly.");
    return 0;
}
