/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vecanim::animation {

    // Store defaults for fields left unset: fill="freeze", repeatCount=1, dur="2s"
    [[nodiscard]] AnimationRecord withDefaults(AnimationRecord record);

    // Builds ready-to-use records for the common editor actions. Ids are "<prefix>-<n>", unique per factory.
    class PresetFactory {
    public:
        explicit PresetFactory(std::string id_prefix = "anim");

        [[nodiscard]] std::string nextId();

        // Opacity fade
        [[nodiscard]] AnimationRecord makeFadeAnimation(const std::string& target_id, const std::string& dur = "2s",
                                                        double from = 1.0, double to = 0.0);

        // Additive rotation from 0 to degrees
        [[nodiscard]] AnimationRecord makeRotateAnimation(const std::string& target_id, const std::string& dur = "2s",
                                                          double degrees = 360.0);

        // Additive translation
        [[nodiscard]] AnimationRecord makeMoveAnimation(const std::string& target_id, const std::string& dur = "2s",
                                                        double from_x = 0.0, double from_y = 0.0,
                                                        double to_x = 50.0, double to_y = 0.0);

        // Uniform scale, replacing earlier scale
        [[nodiscard]] AnimationRecord makeScaleAnimation(const std::string& target_id, const std::string& dur = "2s",
                                                         double from_scale = 1.0, double to_scale = 1.2);

        // stroke-dashoffset 1 -> 0 on a normalised dash pattern
        [[nodiscard]] AnimationRecord makePathDrawAnimation(const std::string& target_id, const std::string& dur = "2s");

        [[nodiscard]] AnimationRecord makeSetAnimation(const std::string& target_id, const std::string& attribute_name,
                                                       const std::string& to, const std::string& begin = "0s",
                                                       const std::optional<std::string>& end = std::nullopt);

        [[nodiscard]] AnimationRecord makeAttributeAnimation(const std::string& target_id,
                                                             const std::string& attribute_name,
                                                             const std::string& dur = "2s",
                                                             const std::string& from = "0",
                                                             const std::string& to = "1",
                                                             RepeatCount repeat = RepeatCount::times(1.0));

        // Looping fill colour cycle
        [[nodiscard]] AnimationRecord makeFillColorAnimation(const std::string& target_id, const std::string& dur = "2s");

        // Looping stroke colour cycle
        [[nodiscard]] AnimationRecord makeStrokeColorAnimation(const std::string& target_id, const std::string& dur = "2s");

        [[nodiscard]] AnimationRecord makeStrokeWidthAnimation(const std::string& target_id, const std::string& dur = "2s",
                                                               double from_width = 1.0, double to_width = 4.0);

        [[nodiscard]] AnimationRecord makePathDataAnimation(const std::string& target_id, const std::string& dur = "2s",
                                                            const std::string& from_d = "M0 0 L100 0",
                                                            const std::string& to_d = "M0 0 L100 100");

        // Motion along a referenced path element
        [[nodiscard]] AnimationRecord makeMotionAnimation(const std::string& target_id, const std::string& path_id,
                                                          const std::string& dur = "2s",
                                                          MotionRotate rotate = MotionRotate{});

    private:
        [[nodiscard]] AnimationRecord base(const std::string& target_id, AnimationKind kind);

        std::string id_prefix_;
        uint64_t next_id_ = 1;
    };

} // namespace vecanim::animation
