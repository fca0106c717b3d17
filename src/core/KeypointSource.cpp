#include "core/KeypointSource.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace core {

namespace {

/**
 * Parse a list of [x, y, conf] triples. Returns nullopt for an empty list
 * (no detection). Malformed entries throw YAML::Exception.
 */
PoseDetection parseKeypoints(const YAML::Node& list, size_t frameIndex) {
    if (!list || list.IsNull() || list.size() == 0) {
        return std::nullopt;
    }
    if (!list.IsSequence() || list.size() != NUM_KEYPOINTS) {
        Logger::warn("RecordingSource: frame ", frameIndex, " has ", list.size(),
                     " keypoints, expected ", NUM_KEYPOINTS, "; treating as no detection");
        return std::nullopt;
    }

    KeypointFrame frame;
    for (size_t j = 0; j < NUM_KEYPOINTS; ++j) {
        const YAML::Node& triple = list[j];
        frame[j].x = triple[0].as<float>();
        frame[j].y = triple[1].as<float>();
        frame[j].confidence = triple.size() > 2 ? triple[2].as<float>() : 1.0f;
    }
    return frame;
}

} // namespace

RecordingSource::RecordingSource(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load recording '" + path + "': " + e.what());
    }
    parse(root);
    Logger::info("RecordingSource: ", frames_.size(), " frames from ", path);
}

RecordingSource::RecordingSource(const YAML::Node& root) {
    parse(root);
}

void RecordingSource::parse(const YAML::Node& root) {
    if (!root.IsSequence()) {
        throw std::runtime_error("Recording must be a list of frames");
    }

    frames_.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        const YAML::Node& entry = root[i];
        try {
            frames_.push_back(parseKeypoints(entry.IsMap() ? entry["keypoints"] : entry, i));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Recording frame " + std::to_string(i) + " is malformed: " + e.what());
        }
    }
}

bool RecordingSource::next(PoseDetection& out) {
    if (position_ >= frames_.size()) return false;
    out = frames_[position_++];
    return true;
}

} // namespace core
