/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vecanim::animation {

    enum class ChainTrigger : uint8_t { Start,
                                        End,
                                        Repeat };

    struct ChainEntry {
        std::string animation_id;
        double delay = 0.0; // Seconds, negative values are treated as 0
        ChainTrigger trigger = ChainTrigger::Start;
    };

    // Ordered group of animations whose start offsets depend on each other
    struct AnimationChain {
        std::string id;
        std::string name;
        std::vector<ChainEntry> entries;
    };

    [[nodiscard]] const char* toString(ChainTrigger trigger);
    [[nodiscard]] std::optional<ChainTrigger> parseChainTrigger(std::string_view text);

    // Start delay in milliseconds for every chained animation id.
    // "end" entries start after the running cursor plus their delay and move the cursor past their total duration.
    // Other entries start at their own delay and move the cursor to at least that point.
    // Unknown ids and unbounded animations count as zero-length.
    [[nodiscard]] std::unordered_map<std::string, double> calculateChainDelays(std::span<const AnimationChain> chains,
                                                                               std::span<const AnimationRecord> records);

} // namespace vecanim::animation
