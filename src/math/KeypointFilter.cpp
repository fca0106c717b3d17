#include "math/KeypointFilter.hpp"
#include "core/Logger.hpp"

namespace math {

KeypointFilter::KeypointFilter(FilterConfig config)
    : config_(config) {
    if (!(config_.alpha > 0.0f && config_.alpha <= 1.0f)) {
        core::Logger::warn("KeypointFilter: alpha ", config_.alpha,
                           " outside (0, 1], using ", core::SMOOTH_ALPHA);
        config_.alpha = core::SMOOTH_ALPHA;
    }
    reset();
}

void KeypointFilter::reset() {
    smoothed_.reset();
}

bool KeypointFilter::isFrameUsable(const core::KeypointFrame& raw) const {
    return raw.countVisible(config_.visibilityThreshold) >= config_.minVisibleKeypoints;
}

FilterStatus KeypointFilter::update(const core::KeypointFrame& raw) {
    if (!isFrameUsable(raw)) {
        return FilterStatus::InsufficientVisibility;
    }

    if (!smoothed_) {
        // First accepted frame: nothing to blend against
        smoothed_ = raw;
        return FilterStatus::Accepted;
    }

    const float a = config_.alpha;
    const core::KeypointFrame& prev = *smoothed_;
    core::KeypointFrame next;

    for (size_t j = 0; j < core::NUM_KEYPOINTS; ++j) {
        next[j].x = a * raw[j].x + (1.0f - a) * prev[j].x;
        next[j].y = a * raw[j].y + (1.0f - a) * prev[j].y;
        next[j].confidence = raw[j].confidence;
    }

    smoothed_ = next;
    return FilterStatus::Accepted;
}

} // namespace math
