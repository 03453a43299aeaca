/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace vecanim::animation {

    inline constexpr double BEZIER_TOLERANCE = 0.001;
    inline constexpr int BEZIER_MAX_ITERATIONS = 10;

    // Control points of a cubic timing curve running from (0,0) to (1,1)
    struct KeySpline {
        double x1 = 0.0;
        double y1 = 0.0;
        double x2 = 1.0;
        double y2 = 1.0;
    };

    // Returns an empty list if any entry is not a number
    [[nodiscard]] std::vector<double> parseKeyTimes(std::string_view text);

    // One entry per ';' group. Groups without four numbers are nullopt and evaluate linearly.
    [[nodiscard]] std::vector<std::optional<KeySpline>> parseKeySplines(std::string_view text);

    // Solves x(s) = t by bisection and returns y(s)
    [[nodiscard]] double cubicBezier(double t, const KeySpline& spline);

    // Maps raw iteration progress to eased progress according to calcMode, keyTimes and keySplines.
    // With keyTimes the result is expressed in evenly spaced value space: segment i covers [i/(K-1), (i+1)/(K-1)].
    [[nodiscard]] double applyEasing(const AnimationRecord& record, double progress);

} // namespace vecanim::animation
