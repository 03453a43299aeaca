/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"
#include "element_state.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vecanim::animation {

    using ValueTuple = std::vector<double>;

    struct Rgb {
        int r = 0;
        int g = 0;
        int b = 0;

        bool operator==(const Rgb&) const = default;
    };

    // Keyframe pair selected by the index-mapping rule: s = p * (N - 1), i = min(floor(s), N - 2)
    struct KeyframePair {
        size_t index = 0;
        size_t next = 0;
        double local = 0.0; // Progress inside the pair, [0, 1]
    };

    [[nodiscard]] inline double lerp(const double from, const double to, const double t) {
        return from + (to - from) * t;
    }

    [[nodiscard]] KeyframePair keyframePair(size_t count, double progress);

    // calcMode="discrete": index floor(p * N), or the last keyTime <= p when keyTimes match the value count
    [[nodiscard]] size_t discreteIndex(size_t count, double progress, const std::vector<double>& key_times = {});

    // Hard switch inside the selected pair: keyframe i below local progress 0.5, otherwise i + 1
    [[nodiscard]] const std::string& selectKeyframe(const std::vector<std::string>& frames, double progress);

    // calcMode="paced": re-parameterises progress by cumulative distance between consecutive keyframes
    [[nodiscard]] double pacedProgress(const std::vector<ValueTuple>& frames, double progress);

    // Component-wise interpolation across a keyframe list honouring linear/discrete/paced selection
    [[nodiscard]] ValueTuple interpolateTuples(const std::vector<ValueTuple>& frames,
                                               double progress,
                                               CalcMode mode,
                                               const std::vector<double>& key_times = {});

    // "#rrggbb", "#rgb", with or without '#'
    [[nodiscard]] std::optional<Rgb> parseHexColor(std::string_view text);

    [[nodiscard]] std::string formatRgb(const Rgb& color);

    // Per-channel interpolation rounded half-up; malformed input switches at 0.5
    [[nodiscard]] std::string interpolateColor(std::string_view from, std::string_view to, double t);

    [[nodiscard]] bool isColorAttribute(std::string_view attribute_name);

    // Placeholder: true path-length placement is not implemented. Always yields position (0, 0) and angle 0.
    [[nodiscard]] MotionPathState evaluateMotionPath(const MotionAnimate& motion, double progress);

} // namespace vecanim::animation
