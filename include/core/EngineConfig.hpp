#pragma once

#include "core/Logger.hpp"
#include "core/Types.hpp"
#include "exercise/ExerciseProfile.hpp"
#include "exercise/FeedbackArbiter.hpp"
#include "math/KeypointFilter.hpp"
#include "voice/VoiceDispatcher.hpp"
#include <map>
#include <string>

namespace YAML {
class Node;
}

namespace core {

struct ComparatorConfig {
    bool enabled = true;
    float toleranceDeg = FORM_TOLERANCE_DEG;
    std::string referenceDir = "data/reference";
};

struct OscConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    std::string port = "9000";
    size_t queueSize = OSC_QUEUE_SIZE;
    int maxLatencyMs = OSC_MAX_LATENCY_MS;
};

struct LogConfig {
    LogLevel level = LogLevel::INFO;
};

struct DriverConfig {
    float fps = SOURCE_FPS;   // Recording playback rate, 0 = as fast as possible
};

/**
 * Complete engine configuration. Every member defaults to the constants in
 * Types.hpp; a config file only needs the keys it changes.
 */
struct EngineConfig {
    math::FilterConfig filter;
    exercise::FeedbackConfig feedback;
    ComparatorConfig comparator;
    voice::VoiceConfig voice;
    OscConfig osc;
    LogConfig log;
    DriverConfig driver;

    // Profiles for the single-machine kinds (squat, arm_circle, arm_raise)
    std::map<exercise::ExerciseKind, exercise::ExerciseProfile> profiles;

    /**
     * Profile for a kind. SquatAndArmCircle resolves to the squat profile.
     */
    [[nodiscard]] const exercise::ExerciseProfile& profile(exercise::ExerciseKind kind) const;
};

/**
 * Built-in defaults with all presets registered
 */
EngineConfig defaultConfig();

/**
 * Read a YAML config file on top of the defaults.
 * @throws std::runtime_error if the file cannot be read or parsed
 */
EngineConfig loadConfig(const std::string& path);

/**
 * Apply an already parsed document on top of the defaults. Keys with the
 * wrong type are logged and ignored.
 */
EngineConfig parseConfig(const YAML::Node& root);

/**
 * Look up a built-in preset by name ("squat", "squat_strict", "arm_circle", "arm_raise")
 */
std::optional<exercise::ExerciseProfile> findPreset(const std::string& name);

} // namespace core
