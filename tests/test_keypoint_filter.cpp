/**
 * Unit tests for KeypointFilter
 */

#include <gtest/gtest.h>
#include "math/KeypointFilter.hpp"

using math::FilterConfig;
using math::FilterStatus;
using math::KeypointFilter;

class KeypointFilterTest : public ::testing::Test {
protected:
    // All joints at (x, y); the first `visible` joints get confidence 0.9, the rest 0.1
    static core::KeypointFrame uniformFrame(float x, float y, size_t visible = core::NUM_KEYPOINTS) {
        core::KeypointFrame frame;
        for (size_t j = 0; j < core::NUM_KEYPOINTS; ++j) {
            frame[j] = core::Keypoint{x, y, j < visible ? 0.9f : 0.1f};
        }
        return frame;
    }
};

TEST_F(KeypointFilterTest, FirstFrameIsAdoptedRaw) {
    KeypointFilter filter;
    EXPECT_FALSE(filter.hasState());

    ASSERT_EQ(filter.update(uniformFrame(10.0f, 20.0f)), FilterStatus::Accepted);
    ASSERT_TRUE(filter.smoothed().has_value());
    EXPECT_FLOAT_EQ((*filter.smoothed())[0].x, 10.0f);
    EXPECT_FLOAT_EQ((*filter.smoothed())[0].y, 20.0f);
}

TEST_F(KeypointFilterTest, LaterFramesFollowEwma) {
    KeypointFilter filter;  // alpha 0.35
    filter.update(uniformFrame(0.0f, 0.0f));
    filter.update(uniformFrame(10.0f, 100.0f));

    const auto& s = *filter.smoothed();
    EXPECT_NEAR(s[5].x, 3.5f, 1e-5f);
    EXPECT_NEAR(s[5].y, 35.0f, 1e-4f);

    filter.update(uniformFrame(10.0f, 100.0f));
    // 0.35 * 10 + 0.65 * 3.5
    EXPECT_NEAR((*filter.smoothed())[5].x, 5.775f, 1e-4f);
}

TEST_F(KeypointFilterTest, ConfidenceComesFromNewestFrame) {
    KeypointFilter filter;
    filter.update(uniformFrame(0.0f, 0.0f));

    core::KeypointFrame next = uniformFrame(1.0f, 1.0f);
    next[3].confidence = 0.15f;   // Momentarily occluded, still 16 visible
    ASSERT_EQ(filter.update(next), FilterStatus::Accepted);

    EXPECT_FLOAT_EQ((*filter.smoothed())[3].confidence, 0.15f);
    EXPECT_FLOAT_EQ((*filter.smoothed())[4].confidence, 0.9f);
}

TEST_F(KeypointFilterTest, RejectsFrameWithTooFewVisibleJoints) {
    KeypointFilter filter;
    EXPECT_EQ(filter.update(uniformFrame(5.0f, 5.0f, 11)), FilterStatus::InsufficientVisibility);
    EXPECT_FALSE(filter.hasState());

    EXPECT_EQ(filter.update(uniformFrame(5.0f, 5.0f, 12)), FilterStatus::Accepted);
    EXPECT_TRUE(filter.hasState());
}

TEST_F(KeypointFilterTest, RejectedFrameKeepsHistory) {
    KeypointFilter filter;
    filter.update(uniformFrame(0.0f, 0.0f));
    filter.update(uniformFrame(10.0f, 10.0f));
    const core::KeypointFrame before = *filter.smoothed();

    EXPECT_EQ(filter.update(uniformFrame(500.0f, 500.0f, 3)), FilterStatus::InsufficientVisibility);

    for (size_t j = 0; j < core::NUM_KEYPOINTS; ++j) {
        EXPECT_FLOAT_EQ((*filter.smoothed())[j].x, before[j].x);
        EXPECT_FLOAT_EQ((*filter.smoothed())[j].y, before[j].y);
        EXPECT_FLOAT_EQ((*filter.smoothed())[j].confidence, before[j].confidence);
    }
}

TEST_F(KeypointFilterTest, AlphaOneReproducesInput) {
    FilterConfig config;
    config.alpha = 1.0f;
    KeypointFilter filter(config);

    filter.update(uniformFrame(0.0f, 0.0f));
    filter.update(uniformFrame(42.0f, -7.0f));
    EXPECT_FLOAT_EQ((*filter.smoothed())[0].x, 42.0f);
    EXPECT_FLOAT_EQ((*filter.smoothed())[0].y, -7.0f);
}

TEST_F(KeypointFilterTest, InvalidAlphaFallsBackToDefault) {
    FilterConfig config;
    config.alpha = 0.0f;
    KeypointFilter filter(config);
    EXPECT_FLOAT_EQ(filter.config().alpha, core::SMOOTH_ALPHA);

    config.alpha = 1.5f;
    KeypointFilter other(config);
    EXPECT_FLOAT_EQ(other.config().alpha, core::SMOOTH_ALPHA);
}

TEST_F(KeypointFilterTest, ResetForgetsHistory) {
    KeypointFilter filter;
    filter.update(uniformFrame(0.0f, 0.0f));
    filter.reset();
    EXPECT_FALSE(filter.hasState());

    filter.update(uniformFrame(8.0f, 8.0f));
    EXPECT_FLOAT_EQ((*filter.smoothed())[0].x, 8.0f);
}
