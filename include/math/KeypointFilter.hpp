#pragma once

#include "core/Types.hpp"
#include <optional>

namespace math {

struct FilterConfig {
    float alpha = core::SMOOTH_ALPHA;                  // Weight of the newest sample, (0, 1]
    float visibilityThreshold = core::VISIBILITY_THRESHOLD;
    int minVisibleKeypoints = core::MIN_VISIBLE_KEYPOINTS;
};

enum class FilterStatus {
    Accepted,
    InsufficientVisibility
};

/**
 * Per-session EWMA keypoint smoother with visibility gating.
 *
 * smoothed[j] = alpha * new[j] + (1 - alpha) * smoothed_prev[j]   (x, y only)
 *
 * - Confidence is copied from the newest frame, so a momentary occlusion shows
 *   up immediately instead of being averaged away.
 * - A frame with too few visible joints is rejected and leaves the smoothed state
 *   untouched; only the very first accepted frame is adopted raw.
 */
class KeypointFilter {
public:
    explicit KeypointFilter(FilterConfig config = {});

    /**
     * Feed one raw frame.
     * @return InsufficientVisibility if the frame was gated out (state unchanged)
     */
    FilterStatus update(const core::KeypointFrame& raw);

    /**
     * Most recent filtered frame, or nullopt before the first accepted frame
     */
    [[nodiscard]] const std::optional<core::KeypointFrame>& smoothed() const { return smoothed_; }

    [[nodiscard]] bool hasState() const { return smoothed_.has_value(); }
    [[nodiscard]] const FilterConfig& config() const { return config_; }

    /**
     * Whether the frame carries enough confident joints to be processed
     */
    [[nodiscard]] bool isFrameUsable(const core::KeypointFrame& raw) const;

    void reset();

private:
    FilterConfig config_;
    std::optional<core::KeypointFrame> smoothed_;
};

} // namespace math
