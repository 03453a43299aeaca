/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolation.hpp"
#include "value_parsing.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace vecanim::animation {

    namespace {

        constexpr std::array<std::string_view, 5> COLOR_ATTRIBUTES = {
            "fill", "stroke", "stop-color", "flood-color", "lighting-color"};

        int hexDigit(const char c) {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        double distance(const ValueTuple& a, const ValueTuple& b) {
            const size_t n = std::min(a.size(), b.size());
            double sum = 0.0;
            for (size_t i = 0; i < n; ++i) {
                const double d = b[i] - a[i];
                sum += d * d;
            }
            return std::sqrt(sum);
        }

        int roundChannel(const double value) {
            return static_cast<int>(std::floor(value + 0.5));
        }

    } // namespace

    KeyframePair keyframePair(const size_t count, const double progress) {
        if (count < 2) {
            return {0, 0, 0.0};
        }

        const double clamped = std::clamp(progress, 0.0, 1.0);
        const double scaled = clamped * static_cast<double>(count - 1);
        const size_t index = std::min(static_cast<size_t>(std::floor(scaled)), count - 2);
        return {index, index + 1, std::clamp(scaled - static_cast<double>(index), 0.0, 1.0)};
    }

    size_t discreteIndex(const size_t count, const double progress, const std::vector<double>& key_times) {
        if (count == 0) {
            return 0;
        }

        if (key_times.size() == count) {
            size_t index = 0;
            for (size_t i = 0; i < count; ++i) {
                if (key_times[i] <= progress) {
                    index = i;
                }
            }
            return index;
        }

        const double clamped = std::clamp(progress, 0.0, 1.0);
        return std::min(static_cast<size_t>(std::floor(clamped * static_cast<double>(count))), count - 1);
    }

    const std::string& selectKeyframe(const std::vector<std::string>& frames, const double progress) {
        static const std::string empty;
        if (frames.empty()) {
            return empty;
        }
        const auto pair = keyframePair(frames.size(), progress);
        return pair.local < 0.5 ? frames[pair.index] : frames[pair.next];
    }

    double pacedProgress(const std::vector<ValueTuple>& frames, const double progress) {
        if (frames.size() < 2) {
            return progress;
        }

        std::vector<double> segment_lengths;
        segment_lengths.reserve(frames.size() - 1);
        double total = 0.0;
        for (size_t i = 0; i + 1 < frames.size(); ++i) {
            segment_lengths.push_back(distance(frames[i], frames[i + 1]));
            total += segment_lengths.back();
        }

        if (total <= 0.0) {
            return progress;
        }

        const double target = std::clamp(progress, 0.0, 1.0) * total;
        const double segments = static_cast<double>(segment_lengths.size());
        double walked = 0.0;
        for (size_t i = 0; i < segment_lengths.size(); ++i) {
            const double length = segment_lengths[i];
            if (target <= walked + length) {
                const double local = length > 0.0 ? (target - walked) / length : 0.0;
                return (static_cast<double>(i) + local) / segments;
            }
            walked += length;
        }
        return 1.0;
    }

    ValueTuple interpolateTuples(const std::vector<ValueTuple>& frames,
                                 double progress,
                                 const CalcMode mode,
                                 const std::vector<double>& key_times) {
        if (frames.empty()) {
            return {};
        }
        if (frames.size() == 1) {
            return frames.front();
        }

        if (mode == CalcMode::Discrete) {
            return frames[discreteIndex(frames.size(), progress, key_times)];
        }
        if (mode == CalcMode::Paced) {
            progress = pacedProgress(frames, progress);
        }

        const auto pair = keyframePair(frames.size(), progress);
        const ValueTuple& a = frames[pair.index];
        const ValueTuple& b = frames[pair.next];

        ValueTuple result(std::min(a.size(), b.size()));
        for (size_t i = 0; i < result.size(); ++i) {
            result[i] = lerp(a[i], b[i], pair.local);
        }
        return result;
    }

    std::optional<Rgb> parseHexColor(std::string_view text) {
        text = trim(text);
        if (!text.empty() && text.front() == '#') {
            text.remove_prefix(1);
        }

        if (text.size() == 3) {
            std::array<int, 3> nibbles{};
            for (size_t i = 0; i < 3; ++i) {
                nibbles[i] = hexDigit(text[i]);
                if (nibbles[i] < 0) {
                    return std::nullopt;
                }
            }
            return Rgb{nibbles[0] * 17, nibbles[1] * 17, nibbles[2] * 17};
        }

        if (text.size() == 6) {
            std::array<int, 3> channels{};
            for (size_t i = 0; i < 3; ++i) {
                const int hi = hexDigit(text[i * 2]);
                const int lo = hexDigit(text[i * 2 + 1]);
                if (hi < 0 || lo < 0) {
                    return std::nullopt;
                }
                channels[i] = hi * 16 + lo;
            }
            return Rgb{channels[0], channels[1], channels[2]};
        }

        return std::nullopt;
    }

    std::string formatRgb(const Rgb& color) {
        return fmt::format("rgb({}, {}, {})", color.r, color.g, color.b);
    }

    std::string interpolateColor(std::string_view from, std::string_view to, const double t) {
        const auto from_rgb = parseHexColor(from);
        const auto to_rgb = parseHexColor(to);

        if (!from_rgb || !to_rgb) {
            return std::string(t < 0.5 ? from : to);
        }

        return formatRgb({roundChannel(lerp(from_rgb->r, to_rgb->r, t)),
                          roundChannel(lerp(from_rgb->g, to_rgb->g, t)),
                          roundChannel(lerp(from_rgb->b, to_rgb->b, t))});
    }

    bool isColorAttribute(std::string_view attribute_name) {
        return std::find(COLOR_ATTRIBUTES.begin(), COLOR_ATTRIBUTES.end(), attribute_name) != COLOR_ATTRIBUTES.end();
    }

    MotionPathState evaluateMotionPath(const MotionAnimate& /*motion*/, const double /*progress*/) {
        // TODO: resolve position and tangent angle along the path (honouring keyPoints and rotate) once
        // path-length parameterisation of arbitrary path commands is available.
        return MotionPathState{};
    }

} // namespace vecanim::animation
