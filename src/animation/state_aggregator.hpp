/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"
#include "canvas_element.hpp"
#include "element_state.hpp"

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace vecanim::animation {

    // Records grouped by target element, groups and members in definition order
    using TargetGroups = std::vector<std::pair<std::string, std::vector<const AnimationRecord*>>>;

    [[nodiscard]] TargetGroups groupByTarget(std::span<const AnimationRecord> records);

    // Folds one record's contribution at the given time into state. Unsupported kinds contribute nothing.
    void applyAnimation(ElementAnimationState& state, const AnimationRecord& record, double time);

    // State of one element from the records that target it, applied in list order
    [[nodiscard]] ElementAnimationState calculateElementState(const std::string& element_id,
                                                              std::span<const AnimationRecord> records,
                                                              double time);

    // States of every known element that has at least one animation. Targets missing from elements are skipped.
    [[nodiscard]] ElementStateMap calculateAllStates(std::span<const AnimationRecord> records,
                                                     const ElementIndex& elements,
                                                     double time);

} // namespace vecanim::animation
