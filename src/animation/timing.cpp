/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "timing.hpp"
#include "easing.hpp"
#include "value_parsing.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace vecanim::animation {

    namespace {
        constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();
        constexpr const char* DEFAULT_BEGIN = "0s";
        constexpr const char* DEFAULT_DUR = "0s";

        // Saturates at the int64_t range; very long indefinite runs would otherwise overflow the cast
        int64_t toIteration(const double count) {
            constexpr auto MAX_ITERATION = std::numeric_limits<int64_t>::max();
            if (!(count > 0.0)) {
                return 0;
            }
            if (count >= static_cast<double>(MAX_ITERATION)) {
                return MAX_ITERATION;
            }
            return static_cast<int64_t>(count);
        }

        TimingResult finishedResult(const ResolvedTiming& timing) {
            if (!timing.freeze) {
                return {0.0, TimingPhase::Removed, 0};
            }

            int64_t iteration = 0;
            if (timing.duration > 0.0 && std::isfinite(timing.active_duration)) {
                iteration = std::max<int64_t>(0, toIteration(std::ceil(timing.active_duration / timing.duration)) - 1);
            }
            return {1.0, TimingPhase::Frozen, iteration};
        }
    } // namespace

    ResolvedTiming resolveTimingFields(const AnimationRecord& record) {
        ResolvedTiming timing;
        timing.begin = parseTime(record.begin.value_or(DEFAULT_BEGIN));
        timing.duration = parseTime(record.dur.value_or(DEFAULT_DUR));
        timing.freeze = record.fill == FillMode::Freeze;

        const RepeatCount repeat = record.repeat_count.value_or(RepeatCount{});
        if (repeat.indefinite) {
            timing.repeat_count = UNBOUNDED;
        } else {
            timing.repeat_count = repeat.count > 0.0 ? repeat.count : 1.0;
        }

        const double repeat_dur = record.repeat_dur ? parseTime(*record.repeat_dur) : 0.0;
        if (repeat_dur > 0.0) {
            timing.active_duration = repeat_dur;
        } else if (repeat.indefinite) {
            timing.active_duration = UNBOUNDED;
        } else {
            timing.active_duration = std::max(0.0, timing.duration) * timing.repeat_count;
        }

        // 'end' is a hard stop relative to the document timeline; unparsable values are ignored
        if (record.end) {
            if (const auto end = parseTimeStrict(*record.end)) {
                timing.active_duration = std::min(timing.active_duration, std::max(0.0, *end - timing.begin));
            }
        }
        return timing;
    }

    TimingResult resolveTiming(const AnimationRecord& record, const double time) {
        const ResolvedTiming timing = resolveTimingFields(record);

        const double local_time = time - timing.begin;
        if (local_time < 0.0) {
            return {0.0, TimingPhase::NotStarted, 0};
        }

        // Zero duration: the animation completes the instant it begins
        if (timing.duration <= 0.0) {
            return finishedResult(timing);
        }

        if (std::isfinite(timing.active_duration) && local_time >= timing.active_duration) {
            return finishedResult(timing);
        }

        const double iteration_time = std::fmod(local_time, timing.duration);
        const double progress = std::clamp(iteration_time / timing.duration, 0.0, 1.0);
        const int64_t iteration = toIteration(std::floor(local_time / timing.duration));
        return {progress, TimingPhase::Active, iteration};
    }

    double resolveProgress(const AnimationRecord& record, const double time) {
        return applyEasing(record, resolveTiming(record, time).progress);
    }

    double totalDuration(const AnimationRecord& record) {
        return resolveTimingFields(record).active_duration;
    }

    bool isSetActive(const AnimationRecord& record, const double time) {
        const double begin = parseTime(record.begin.value_or(DEFAULT_BEGIN));
        double until = record.dur ? begin + parseTime(*record.dur) : UNBOUNDED;
        if (record.end) {
            if (const auto end = parseTimeStrict(*record.end)) {
                until = std::min(until, *end);
            }
        }
        return time >= begin && time < until;
    }

} // namespace vecanim::animation
