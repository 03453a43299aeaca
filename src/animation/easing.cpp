/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "easing.hpp"
#include "core/logger.hpp"
#include "value_parsing.hpp"

#include <algorithm>
#include <cmath>

namespace vecanim::animation {

    namespace {

        double evaluateSegment(const double local, const std::optional<KeySpline>& spline) {
            return spline ? cubicBezier(local, *spline) : local;
        }

        // Locates the keyTimes segment containing progress and maps it back to value space
        double remapKeyTimes(const double progress,
                             const std::vector<double>& key_times,
                             const std::vector<std::optional<KeySpline>>& splines) {
            const size_t segments = key_times.size() - 1;
            for (size_t i = 0; i < segments; ++i) {
                if (progress <= key_times[i + 1]) {
                    const double start = key_times[i];
                    const double span = key_times[i + 1] - start;
                    const double local = span > 0.0 ? std::clamp((progress - start) / span, 0.0, 1.0) : 1.0;
                    const double eased = i < splines.size() ? evaluateSegment(local, splines[i]) : local;
                    return (static_cast<double>(i) + eased) / static_cast<double>(segments);
                }
            }
            return 1.0;
        }

    } // namespace

    std::vector<double> parseKeyTimes(std::string_view text) {
        std::vector<double> key_times;
        for (const auto& entry : splitList(text)) {
            const auto value = parseNumber(entry);
            if (!value) {
                LOG_DEBUG("Ignoring keyTimes '{}': '{}' is not a number", text, entry);
                return {};
            }
            key_times.push_back(*value);
        }
        return key_times;
    }

    std::vector<std::optional<KeySpline>> parseKeySplines(std::string_view text) {
        std::vector<std::optional<KeySpline>> splines;
        for (const auto& entry : splitList(text)) {
            const auto numbers = parseNumberList(entry);
            if (numbers.size() != 4) {
                LOG_DEBUG("Malformed keySpline '{}', evaluating linearly", entry);
                splines.emplace_back(std::nullopt);
                continue;
            }
            splines.emplace_back(KeySpline{numbers[0], numbers[1], numbers[2], numbers[3]});
        }
        return splines;
    }

    double cubicBezier(const double t, const KeySpline& spline) {
        const double cx = 3.0 * spline.x1;
        const double bx = 3.0 * (spline.x2 - spline.x1) - cx;
        const double ax = 1.0 - cx - bx;

        const double cy = 3.0 * spline.y1;
        const double by = 3.0 * (spline.y2 - spline.y1) - cy;
        const double ay = 1.0 - cy - by;

        const auto sample_x = [&](const double s) { return ((ax * s + bx) * s + cx) * s; };
        const auto sample_y = [&](const double s) { return ((ay * s + by) * s + cy) * s; };

        double low = 0.0;
        double high = 1.0;
        double mid = t;

        for (int i = 0; i < BEZIER_MAX_ITERATIONS; ++i) {
            const double x = sample_x(mid);
            if (std::abs(x - t) < BEZIER_TOLERANCE) {
                break;
            }
            if (x < t) {
                low = mid;
            } else {
                high = mid;
            }
            mid = (low + high) / 2.0;
        }

        return sample_y(mid);
    }

    double applyEasing(const AnimationRecord& record, const double progress) {
        switch (record.calc_mode) {
            case CalcMode::Discrete:
            case CalcMode::Paced:
                // Discrete selection and pacing depend on the values, not on the timing curve
                return progress;

            case CalcMode::Linear:
            case CalcMode::Spline:
                break;
        }

        const auto key_times = record.key_times ? parseKeyTimes(*record.key_times) : std::vector<double>{};

        std::vector<std::optional<KeySpline>> splines;
        if (record.calc_mode == CalcMode::Spline && record.key_splines) {
            splines = parseKeySplines(*record.key_splines);
        }

        if (key_times.size() >= 2) {
            return std::clamp(remapKeyTimes(progress, key_times, splines), 0.0, 1.0);
        }

        // Without keyTimes a single spline governs the whole iteration
        if (!splines.empty()) {
            return std::clamp(evaluateSegment(progress, splines.front()), 0.0, 1.0);
        }

        return progress;
    }

} // namespace vecanim::animation
