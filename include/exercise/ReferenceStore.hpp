#pragma once

#include "exercise/ExerciseProfile.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace exercise {

using PhaseAngles = std::map<std::string, float>;   // joint name -> mean reference angle

/**
 * Ideal-form angles per movement phase ("top"/"mid"/"bottom", "up"/"down").
 * Immutable once a session has loaded it.
 */
struct ReferenceProfile {
    std::string label;
    std::map<std::string, PhaseAngles> phases;
    bool fallback = false;   // true if any phase came from the built-in table

    /**
     * Look up a phase, accepting the up/top and down/bottom aliases
     */
    [[nodiscard]] const PhaseAngles* findPhase(const std::string& phase) const;
};

/**
 * Read-only reference source. Returns nullopt for missing or unusable data;
 * it must never throw.
 */
class ReferenceStore {
public:
    virtual ~ReferenceStore() = default;
    virtual std::optional<ReferenceProfile> load(const std::string& label) = 0;
};

/**
 * Reference JSON files in one directory, parsed with yaml-cpp.
 *
 * Lookup order for label L:
 *  1. <dir>/L.json as a recording (sequence of {angles: {...}} frames, bucketed
 *     into top/mid/bottom by average knee angle) or as a phase map
 *     ({phase: {angles: {...}}} or {phase: {joint: deg}})
 *  2. per-position files <dir>/L_<phase>.json with an "angles" map
 */
class FileReferenceStore : public ReferenceStore {
public:
    explicit FileReferenceStore(std::string directory);

    std::optional<ReferenceProfile> load(const std::string& label) override;

    /**
     * Parse an already loaded document (exposed for tests)
     */
    static std::optional<ReferenceProfile> parse(const YAML::Node& root, const std::string& label);

    [[nodiscard]] const std::string& directory() const { return directory_; }

private:
    std::string directory_;

    std::optional<ReferenceProfile> loadPerPositionFiles(const std::string& label) const;
};

/**
 * Built-in reference used when the store has nothing (squat and arm_raise;
 * other labels yield an empty profile).
 */
ReferenceProfile getFallbackReference(const std::string& label);

/**
 * Load a reference and complete any phase the bands need from the fallback table.
 * A null store or a failed load yields the fallback profile.
 */
ReferenceProfile loadReferenceOrFallback(ReferenceStore* store, const std::string& label,
                                         const std::vector<PhaseBand>& bands);

} // namespace exercise
