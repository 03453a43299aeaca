/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "chain.hpp"
#include "timing.hpp"
#include "value_parsing.hpp"

#include <algorithm>
#include <cmath>

namespace vecanim::animation {

    const char* toString(const ChainTrigger trigger) {
        switch (trigger) {
            case ChainTrigger::Start:
                return "start";
            case ChainTrigger::End:
                return "end";
            case ChainTrigger::Repeat:
                return "repeat";
        }
        return "start";
    }

    std::optional<ChainTrigger> parseChainTrigger(std::string_view text) {
        text = trim(text);
        if (text == "start")
            return ChainTrigger::Start;
        if (text == "end")
            return ChainTrigger::End;
        if (text == "repeat")
            return ChainTrigger::Repeat;
        return std::nullopt;
    }

    std::unordered_map<std::string, double> calculateChainDelays(std::span<const AnimationChain> chains,
                                                                 std::span<const AnimationRecord> records) {
        std::unordered_map<std::string, const AnimationRecord*> by_id;
        by_id.reserve(records.size());
        for (const auto& record : records) {
            by_id.try_emplace(record.id, &record);
        }

        std::unordered_map<std::string, double> delays;
        for (const auto& chain : chains) {
            double cursor_ms = 0.0;
            for (const auto& entry : chain.entries) {
                double duration_ms = 0.0;
                if (const auto it = by_id.find(entry.animation_id); it != by_id.end()) {
                    const double seconds = totalDuration(*it->second);
                    if (std::isfinite(seconds)) {
                        duration_ms = seconds * 1000.0;
                    }
                }

                const double entry_delay_ms = std::max(0.0, entry.delay) * 1000.0;
                const double start_ms = entry.trigger == ChainTrigger::End ? cursor_ms + entry_delay_ms : entry_delay_ms;
                delays[entry.animation_id] = start_ms;

                if (entry.trigger == ChainTrigger::End) {
                    cursor_ms = start_ms + duration_ms;
                } else {
                    cursor_ms = std::max(cursor_ms, start_ms);
                }
            }
        }
        return delays;
    }

} // namespace vecanim::animation
