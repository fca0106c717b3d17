#pragma once

#include "core/Types.hpp"
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace core {

/**
 * Boundary to the pose estimator: yields one detection per captured image.
 */
class KeypointSource {
public:
    virtual ~KeypointSource() = default;

    /**
     * Fetch the next detection.
     * @param out set to the detected person, or std::nullopt if nobody was found
     * @return false at end of stream
     */
    virtual bool next(PoseDetection& out) = 0;
};

/**
 * Replays a recorded keypoint stream from a YAML/JSON file:
 *
 *   - keypoints: [[x, y, conf], ... 17 entries]
 *   - keypoints: []            # no person detected
 *
 * A bare list of 17 triples per frame is accepted as well.
 */
class RecordingSource : public KeypointSource {
public:
    /**
     * @throws std::runtime_error if the file cannot be read or a frame is malformed
     */
    explicit RecordingSource(const std::string& path);

    /**
     * Build from an already parsed document (same errors as above)
     */
    explicit RecordingSource(const YAML::Node& root);

    bool next(PoseDetection& out) override;

    [[nodiscard]] size_t size() const { return frames_.size(); }
    [[nodiscard]] size_t position() const { return position_; }
    void rewind() { position_ = 0; }

private:
    std::vector<PoseDetection> frames_;
    size_t position_ = 0;

    void parse(const YAML::Node& root);
};

} // namespace core
