/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"

#include <cstdint>
#include <optional>

namespace vecanim::animation {

    enum class TimingPhase : uint8_t {
        NotStarted, // Query time precedes 'begin'
        Active,     // Inside the active duration
        Frozen,     // Finished with fill="freeze"
        Removed     // Finished with fill="remove"
    };

    struct TimingResult {
        double progress = 0.0; // Linear progress within the current iteration, [0, 1]
        TimingPhase phase = TimingPhase::NotStarted;
        int64_t iteration = 0; // Zero-based repeat iteration the progress belongs to
    };

    // Timing attributes of a record in seconds. Unbounded values are +infinity.
    struct ResolvedTiming {
        double begin = 0.0;
        double duration = 0.0;
        double repeat_count = 1.0;
        double active_duration = 0.0;
        bool freeze = false;
    };

    [[nodiscard]] ResolvedTiming resolveTimingFields(const AnimationRecord& record);

    // Classifies the query time and yields raw (uneased) progress
    [[nodiscard]] TimingResult resolveTiming(const AnimationRecord& record, double time);

    // resolveTiming followed by applyEasing
    [[nodiscard]] double resolveProgress(const AnimationRecord& record, double time);

    // Total active duration in seconds, +infinity for indefinite repeats
    [[nodiscard]] double totalDuration(const AnimationRecord& record);

    // <set> is applied while begin <= t < begin + dur (dur absent: indefinitely), capped by 'end'
    [[nodiscard]] bool isSetActive(const AnimationRecord& record, double time);

} // namespace vecanim::animation
