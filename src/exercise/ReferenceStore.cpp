#include "exercise/ReferenceStore.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace exercise {

namespace {

// Recording bucket limits on average knee angle
constexpr float TOP_ABOVE = 160.0f;
constexpr float MID_ABOVE = 100.0f;

const char* phaseAlias(const std::string& phase) {
    if (phase == "top") return "up";
    if (phase == "up") return "top";
    if (phase == "bottom") return "down";
    if (phase == "down") return "bottom";
    return nullptr;
}

/**
 * Read a {joint: degrees} map, skipping entries that are not numbers
 */
PhaseAngles readAngles(const YAML::Node& node, const std::string& context) {
    PhaseAngles angles;
    if (!node.IsMap()) return angles;

    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        try {
            angles[key] = entry.second.as<float>();
        } catch (const YAML::Exception& e) {
            core::Logger::warn("ReferenceStore: ", context, ": ignoring non-numeric '", key, "'");
        }
    }
    return angles;
}

std::optional<ReferenceProfile> parseRecording(const YAML::Node& root, const std::string& label) {
    struct Accumulator {
        std::map<std::string, double> sum;
        std::map<std::string, int> count;
    };
    std::map<std::string, Accumulator> buckets;

    for (const auto& entry : root) {
        if (!entry.IsMap() || !entry["angles"]) continue;
        PhaseAngles angles = readAngles(entry["angles"], label);

        auto lk = angles.find("left_knee");
        auto rk = angles.find("right_knee");
        if (lk == angles.end() || rk == angles.end()) continue;

        const float avgKnee = (lk->second + rk->second) / 2.0f;
        const char* phase = avgKnee > TOP_ABOVE ? "top" : (avgKnee > MID_ABOVE ? "mid" : "bottom");

        auto& bucket = buckets[phase];
        for (const auto& [joint, value] : angles) {
            bucket.sum[joint] += value;
            bucket.count[joint] += 1;
        }
        bucket.sum["avg_knee"] += avgKnee;
        bucket.count["avg_knee"] += 1;
    }

    if (buckets.empty()) return std::nullopt;

    ReferenceProfile profile;
    profile.label = label;
    for (const auto& [phase, bucket] : buckets) {
        PhaseAngles& means = profile.phases[phase];
        for (const auto& [joint, sum] : bucket.sum) {
            means[joint] = static_cast<float>(sum / bucket.count.at(joint));
        }
    }
    return profile;
}

std::optional<ReferenceProfile> parsePhaseMap(const YAML::Node& root, const std::string& label) {
    ReferenceProfile profile;
    profile.label = label;

    for (const auto& entry : root) {
        const auto phase = entry.first.as<std::string>();
        const YAML::Node& body = entry.second;
        if (!body.IsMap()) continue;

        PhaseAngles angles = body["angles"] ? readAngles(body["angles"], label + "/" + phase)
                                            : readAngles(body, label + "/" + phase);
        if (!angles.empty()) {
            profile.phases[phase] = std::move(angles);
        }
    }

    if (profile.phases.empty()) return std::nullopt;
    return profile;
}

} // namespace

// ============================================================
// ReferenceProfile
// ============================================================

const PhaseAngles* ReferenceProfile::findPhase(const std::string& phase) const {
    auto it = phases.find(phase);
    if (it != phases.end()) return &it->second;

    if (const char* alias = phaseAlias(phase)) {
        it = phases.find(alias);
        if (it != phases.end()) return &it->second;
    }
    return nullptr;
}

// ============================================================
// FileReferenceStore
// ============================================================

FileReferenceStore::FileReferenceStore(std::string directory)
    : directory_(std::move(directory)) {
}

std::optional<ReferenceProfile> FileReferenceStore::parse(const YAML::Node& root, const std::string& label) {
    if (root.IsSequence()) return parseRecording(root, label);
    if (root.IsMap()) return parsePhaseMap(root, label);
    return std::nullopt;
}

std::optional<ReferenceProfile> FileReferenceStore::load(const std::string& label) {
    namespace fs = std::filesystem;
    const fs::path path = fs::path(directory_) / (label + ".json");

    std::error_code ec;
    if (fs::exists(path, ec)) {
        try {
            auto profile = parse(YAML::LoadFile(path.string()), label);
            if (profile) {
                core::Logger::info("ReferenceStore: loaded '", label, "' (", profile->phases.size(),
                                   " phases) from ", path.string());
                return profile;
            }
            core::Logger::warn("ReferenceStore: ", path.string(), " has no usable angles");
        } catch (const YAML::Exception& e) {
            core::Logger::warn("ReferenceStore: cannot parse ", path.string(), ": ", e.what());
        }
    }

    return loadPerPositionFiles(label);
}

std::optional<ReferenceProfile> FileReferenceStore::loadPerPositionFiles(const std::string& label) const {
    namespace fs = std::filesystem;
    static const char* const POSITIONS[] = {"up", "down", "top", "mid", "bottom"};

    ReferenceProfile profile;
    profile.label = label;

    for (const char* position : POSITIONS) {
        const fs::path path = fs::path(directory_) / (label + "_" + position + ".json");
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;

        try {
            YAML::Node root = YAML::LoadFile(path.string());
            if (!root.IsMap() || !root["angles"]) {
                core::Logger::warn("ReferenceStore: ", path.string(), " has no 'angles' map");
                continue;
            }
            PhaseAngles angles = readAngles(root["angles"], path.filename().string());
            if (!angles.empty()) {
                profile.phases[position] = std::move(angles);
            }
        } catch (const YAML::Exception& e) {
            core::Logger::warn("ReferenceStore: cannot parse ", path.string(), ": ", e.what());
        }
    }

    if (profile.phases.empty()) return std::nullopt;

    core::Logger::info("ReferenceStore: loaded '", label, "' from ", profile.phases.size(),
                       " position files in ", directory_);
    return profile;
}

// ============================================================
// Fallback
// ============================================================

ReferenceProfile getFallbackReference(const std::string& label) {
    ReferenceProfile profile;
    profile.label = label;
    profile.fallback = true;

    if (label == "squat") {
        PhaseAngles up = {{"avg_knee", 166.0f}, {"avg_hip", 175.0f}, {"torso_lean", 3.0f}};
        PhaseAngles mid = {{"avg_knee", 111.0f}, {"avg_hip", 113.5f}, {"torso_lean", 16.0f}};
        PhaseAngles down = {{"avg_knee", 56.0f}, {"avg_hip", 52.0f}, {"torso_lean", 29.0f}};
        profile.phases["top"] = up;
        profile.phases["up"] = up;
        profile.phases["mid"] = mid;
        profile.phases["bottom"] = down;
        profile.phases["down"] = down;
    } else if (label == "arm_raise") {
        profile.phases["up"] = {{"avg_arm", 90.0f}, {"avg_elbow", 175.0f}};
        profile.phases["down"] = {{"avg_arm", 10.0f}, {"avg_elbow", 175.0f}};
    }
    return profile;
}

ReferenceProfile loadReferenceOrFallback(ReferenceStore* store, const std::string& label,
                                         const std::vector<PhaseBand>& bands) {
    std::optional<ReferenceProfile> loaded;
    if (store) {
        loaded = store->load(label);
    }

    if (!loaded) {
        core::Logger::warn("ReferenceStore: no reference for '", label, "', using built-in defaults");
        return getFallbackReference(label);
    }

    // Fill in phases the comparator needs but the store lacked
    const ReferenceProfile fallback = getFallbackReference(label);
    for (const auto& band : bands) {
        if (loaded->findPhase(band.label)) continue;
        if (const PhaseAngles* defaults = fallback.findPhase(band.label)) {
            core::Logger::warn("ReferenceStore: '", label, "' missing phase '", band.label,
                               "', using built-in defaults");
            loaded->phases[band.label] = *defaults;
            loaded->fallback = true;
        }
    }
    return *loaded;
}

} // namespace exercise
