/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation/interpolation.hpp"
#include "animation/value_parsing.hpp"

#include <gtest/gtest.h>

using namespace vecanim::animation;

// ============================================================================
// Keyframe selection
// ============================================================================

class KeyframeSelectionTest : public ::testing::Test {};

TEST_F(KeyframeSelectionTest, IndexMapping) {
    const auto mid = keyframePair(3, 0.75);
    EXPECT_EQ(mid.index, 1u);
    EXPECT_EQ(mid.next, 2u);
    EXPECT_NEAR(mid.local, 0.5, 1e-12);

    // Progress 1 stays inside the last pair
    const auto end = keyframePair(3, 1.0);
    EXPECT_EQ(end.index, 1u);
    EXPECT_DOUBLE_EQ(end.local, 1.0);
}

TEST_F(KeyframeSelectionTest, DiscreteIndex) {
    EXPECT_EQ(discreteIndex(3, 0.0), 0u);
    EXPECT_EQ(discreteIndex(3, 0.5), 1u);
    EXPECT_EQ(discreteIndex(3, 1.0), 2u);
    EXPECT_EQ(discreteIndex(3, 0.5, {0.0, 0.2, 0.9}), 1u);
    EXPECT_EQ(discreteIndex(3, 0.95, {0.0, 0.2, 0.9}), 2u);
}

TEST_F(KeyframeSelectionTest, HardSwitchAtHalf) {
    const std::vector<std::string> frames = {"a", "b"};
    EXPECT_EQ(selectKeyframe(frames, 0.49), "a");
    EXPECT_EQ(selectKeyframe(frames, 0.5), "b");
    EXPECT_TRUE(selectKeyframe({}, 0.5).empty());
}

// ============================================================================
// Numeric tuples
// ============================================================================

class TupleInterpolationTest : public ::testing::Test {};

TEST_F(TupleInterpolationTest, EndpointsAreExact) {
    const std::vector<ValueTuple> frames = {{0.3, -2.0}, {0.7, 8.0}};
    EXPECT_EQ(interpolateTuples(frames, 0.0, CalcMode::Linear), frames[0]);
    EXPECT_EQ(interpolateTuples(frames, 1.0, CalcMode::Linear), frames[1]);

    const auto mid = interpolateTuples(frames, 0.5, CalcMode::Linear);
    ASSERT_EQ(mid.size(), 2u);
    EXPECT_NEAR(mid[0], 0.5, 1e-12);
    EXPECT_NEAR(mid[1], 3.0, 1e-12);
}

TEST_F(TupleInterpolationTest, DiscreteSelectsWholeFrames) {
    const std::vector<ValueTuple> frames = {{0.0}, {10.0}, {20.0}};
    EXPECT_EQ(interpolateTuples(frames, 0.4, CalcMode::Discrete), ValueTuple{10.0});
}

TEST_F(TupleInterpolationTest, PacedFollowsDistance) {
    const std::vector<ValueTuple> frames = {{0.0}, {10.0}, {30.0}};
    EXPECT_NEAR(pacedProgress(frames, 0.5), 0.625, 1e-12);

    const auto value = interpolateTuples(frames, 0.5, CalcMode::Paced);
    ASSERT_EQ(value.size(), 1u);
    EXPECT_NEAR(value[0], 15.0, 1e-9);
}

TEST_F(TupleInterpolationTest, PacedWithoutMovementKeepsProgress) {
    const std::vector<ValueTuple> frames = {{5.0}, {5.0}};
    EXPECT_DOUBLE_EQ(pacedProgress(frames, 0.3), 0.3);
}

// ============================================================================
// Colors
// ============================================================================

class ColorInterpolationTest : public ::testing::Test {};

TEST_F(ColorInterpolationTest, EndpointsAndMidpoint) {
    EXPECT_EQ(interpolateColor("#000000", "#ffffff", 0.0), "rgb(0, 0, 0)");
    EXPECT_EQ(interpolateColor("#000000", "#ffffff", 1.0), "rgb(255, 255, 255)");
    EXPECT_EQ(interpolateColor("#000000", "#ffffff", 0.5), "rgb(128, 128, 128)");
}

TEST_F(ColorInterpolationTest, ShorthandAndMissingHash) {
    const auto red = parseHexColor("#f00");
    ASSERT_TRUE(red.has_value());
    EXPECT_EQ(*red, (Rgb{255, 0, 0}));

    const auto teal = parseHexColor("4ecdc4");
    ASSERT_TRUE(teal.has_value());
    EXPECT_EQ(*teal, (Rgb{0x4e, 0xcd, 0xc4}));
}

TEST_F(ColorInterpolationTest, MalformedColorSwitchesAtHalf) {
    EXPECT_FALSE(parseHexColor("red").has_value());
    EXPECT_FALSE(parseHexColor("#12345").has_value());
    EXPECT_EQ(interpolateColor("red", "#ffffff", 0.4), "red");
    EXPECT_EQ(interpolateColor("red", "#ffffff", 0.6), "#ffffff");
}

TEST_F(ColorInterpolationTest, ColorAttributes) {
    EXPECT_TRUE(isColorAttribute("fill"));
    EXPECT_TRUE(isColorAttribute("stroke"));
    EXPECT_TRUE(isColorAttribute("stop-color"));
    EXPECT_FALSE(isColorAttribute("opacity"));
}

// ============================================================================
// Parsing helpers and motion placeholder
// ============================================================================

class ValueParsingTest : public ::testing::Test {};

TEST_F(ValueParsingTest, LeadingNumber) {
    EXPECT_DOUBLE_EQ(*parseNumber("2.5s"), 2.5);
    EXPECT_DOUBLE_EQ(*parseNumber(" -3e2 "), -300.0);
    EXPECT_FALSE(parseNumber("abc").has_value());
    EXPECT_TRUE(isNumericToken("12.5"));
    EXPECT_FALSE(isNumericToken("10px"));
}

TEST_F(ValueParsingTest, Lists) {
    const auto entries = splitList(" a ; b;c; ");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1], "b");
    EXPECT_TRUE(splitList("   ").empty());

    const auto numbers = parseNumberList("10, 20 x 30");
    EXPECT_EQ(numbers, (std::vector<double>{10.0, 20.0, 30.0}));
}

TEST_F(ValueParsingTest, MotionPathIsPlaceholder) {
    MotionAnimate motion;
    motion.path = "M0 0 L100 100";
    const auto state = evaluateMotionPath(motion, 0.5);
    EXPECT_DOUBLE_EQ(state.position.x, 0.0);
    EXPECT_DOUBLE_EQ(state.position.y, 0.0);
    EXPECT_DOUBLE_EQ(state.angle, 0.0);
}
