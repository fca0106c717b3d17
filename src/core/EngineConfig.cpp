#include "core/EngineConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <limits>
#include <stdexcept>

namespace core {

using exercise::ExerciseKind;
using exercise::ExerciseProfile;

namespace {

/**
 * Overwrite `out` with node[key] if present and convertible.
 * Returns true if the value was applied.
 */
template<typename T>
bool readValue(const YAML::Node& node, const char* key, T& out, const std::string& section) {
    const YAML::Node value = node[key];
    if (!value) return false;
    try {
        out = value.as<T>();
        return true;
    } catch (const YAML::Exception& e) {
        Logger::warn("Config: ignoring ", section, ".", key, " (", e.what(), ")");
        return false;
    }
}

void applyFilter(const YAML::Node& node, math::FilterConfig& filter) {
    readValue(node, "alpha", filter.alpha, "filter");
    readValue(node, "visibility_threshold", filter.visibilityThreshold, "filter");
    readValue(node, "min_visible_keypoints", filter.minVisibleKeypoints, "filter");
}

void applyFeedback(const YAML::Node& node, exercise::FeedbackConfig& feedback) {
    readValue(node, "cooldown_s", feedback.cooldownSeconds, "feedback");
    readValue(node, "symmetry_tolerance_deg", feedback.symmetryToleranceDeg, "feedback");
    readValue(node, "min_elbow_deg", feedback.minElbowDeg, "feedback");
}

void applyComparator(const YAML::Node& node, ComparatorConfig& comparator) {
    readValue(node, "enabled", comparator.enabled, "comparator");
    readValue(node, "tolerance_deg", comparator.toleranceDeg, "comparator");
    readValue(node, "reference_dir", comparator.referenceDir, "comparator");
}

void applyVoice(const YAML::Node& node, voice::VoiceConfig& voice) {
    readValue(node, "enabled", voice.enabled, "voice");
    readValue(node, "backend", voice.backend, "voice");
    readValue(node, "command", voice.command, "voice");
    readValue(node, "args", voice.args, "voice");
    readValue(node, "queue_size", voice.queueSize, "voice");
    readValue(node, "min_interval_s", voice.minIntervalSeconds, "voice");
    readValue(node, "max_staleness_s", voice.maxStalenessSeconds, "voice");
}

void applyOsc(const YAML::Node& node, OscConfig& osc) {
    readValue(node, "enabled", osc.enabled, "osc");
    readValue(node, "host", osc.host, "osc");
    readValue(node, "port", osc.port, "osc");
    readValue(node, "queue_size", osc.queueSize, "osc");
    readValue(node, "max_latency_ms", osc.maxLatencyMs, "osc");
}

std::optional<exercise::Direction> directionFromName(const std::string& name) {
    if (name == "fall_then_rise") return exercise::Direction::FallThenRise;
    if (name == "rise_then_fall") return exercise::Direction::RiseThenFall;
    return std::nullopt;
}

void applyPhaseBands(const YAML::Node& node, ExerciseProfile& profile) {
    if (!node.IsSequence()) {
        Logger::warn("Config: ", profile.name, ".phase_bands must be a list");
        return;
    }

    std::vector<exercise::PhaseBand> bands;
    for (const auto& entry : node) {
        exercise::PhaseBand band;
        band.above = -std::numeric_limits<float>::infinity();
        if (!readValue(entry, "label", band.label, profile.name + ".phase_bands")) continue;
        readValue(entry, "above", band.above, profile.name + ".phase_bands");
        bands.push_back(band);
    }
    profile.phaseBands = std::move(bands);
}

ExerciseProfile applyProfile(const YAML::Node& node, ExerciseProfile profile) {
    std::string preset;
    if (readValue(node, "preset", preset, profile.name)) {
        if (auto base = findPreset(preset)) {
            if (base->kind == profile.kind) {
                profile = *base;
            } else {
                Logger::warn("Config: preset '", preset, "' is not a ", exerciseKindName(profile.kind), " preset");
            }
        } else {
            Logger::warn("Config: unknown preset '", preset, "'");
        }
    }

    const std::string section = "profiles." + std::string(exerciseKindName(profile.kind));

    readValue(node, "low_threshold", profile.lowThreshold, section);
    readValue(node, "high_threshold", profile.highThreshold, section);
    readValue(node, "confirm_frames", profile.confirmFrames, section);
    readValue(node, "rotation_threshold", profile.rotationThreshold, section);
    readValue(node, "rest_phase", profile.restPhase, section);
    readValue(node, "active_phase", profile.activePhase, section);
    readValue(node, "reference_label", profile.referenceLabel, section);

    std::string name;
    if (readValue(node, "direction", name, section)) {
        if (auto direction = directionFromName(name)) {
            profile.direction = *direction;
        } else {
            Logger::warn("Config: ", section, ".direction '", name, "' is not fall_then_rise or rise_then_fall");
        }
    }

    if (readValue(node, "tracked_angle", name, section)) {
        if (auto angle = math::jointAngleFromName(name)) {
            profile.trackedAngle = *angle;
        } else {
            Logger::warn("Config: ", section, ".tracked_angle '", name, "' is not a known angle");
        }
    }

    if (node["phase_bands"]) {
        applyPhaseBands(node["phase_bands"], profile);
    }
    return profile;
}

void applyProfiles(const YAML::Node& node, EngineConfig& config) {
    if (!node.IsMap()) {
        Logger::warn("Config: 'profiles' must be a map");
        return;
    }

    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        auto kind = exercise::exerciseKindFromName(key);
        if (!kind || *kind == ExerciseKind::SquatAndArmCircle) {
            Logger::warn("Config: no profile slot named '", key, "'");
            continue;
        }

        ExerciseProfile candidate = applyProfile(entry.second, config.profiles.at(*kind));

        std::string reason;
        if (!candidate.isValid(&reason)) {
            Logger::warn("Config: profile '", key, "' rejected: ", reason);
            continue;
        }
        config.profiles[*kind] = candidate;
    }
}

} // namespace

const ExerciseProfile& EngineConfig::profile(ExerciseKind kind) const {
    if (kind == ExerciseKind::SquatAndArmCircle) {
        kind = ExerciseKind::Squat;
    }
    return profiles.at(kind);
}

std::optional<ExerciseProfile> findPreset(const std::string& name) {
    if (name == "squat") return exercise::getSquatProfile();
    if (name == "squat_strict") return exercise::getStrictSquatProfile();
    if (name == "arm_circle") return exercise::getArmCircleProfile();
    if (name == "arm_raise") return exercise::getArmRaiseProfile();
    return std::nullopt;
}

EngineConfig defaultConfig() {
    EngineConfig config;
    config.profiles[ExerciseKind::Squat] = exercise::getSquatProfile();
    config.profiles[ExerciseKind::ArmCircle] = exercise::getArmCircleProfile();
    config.profiles[ExerciseKind::ArmRaise] = exercise::getArmRaiseProfile();
    return config;
}

EngineConfig parseConfig(const YAML::Node& root) {
    EngineConfig config = defaultConfig();
    if (!root || root.IsNull()) return config;

    if (!root.IsMap()) {
        Logger::warn("Config: top level must be a map, using defaults");
        return config;
    }

    if (root["filter"]) applyFilter(root["filter"], config.filter);
    if (root["feedback"]) applyFeedback(root["feedback"], config.feedback);
    if (root["comparator"]) applyComparator(root["comparator"], config.comparator);
    if (root["voice"]) applyVoice(root["voice"], config.voice);
    if (root["osc"]) applyOsc(root["osc"], config.osc);
    if (root["driver"]) readValue(root["driver"], "fps", config.driver.fps, "driver");
    if (root["profiles"]) applyProfiles(root["profiles"], config);

    std::string level;
    if (root["log"] && readValue(root["log"], "level", level, "log")) {
        config.log.level = Logger::parseLevel(level);
    }

    return config;
}

EngineConfig loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load config '" + path + "': " + e.what());
    }

    EngineConfig config = parseConfig(root);
    Logger::info("Config loaded from ", path);
    return config;
}

} // namespace core
