/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace vecanim::animation {

    struct TransformState {
        double translate_x = 0.0;
        double translate_y = 0.0;
        double rotate = 0.0; // Degrees
        std::optional<glm::dvec2> rotate_center;
        double scale_x = 1.0;
        double scale_y = 1.0;
        double skew_x = 0.0;
        double skew_y = 0.0;

        bool operator==(const TransformState&) const = default;
    };

    struct StyleState {
        std::optional<double> opacity;
        std::optional<std::string> fill_color;
        std::optional<std::string> stroke_color;
        std::optional<double> stroke_width;
        std::optional<double> stroke_dashoffset;

        bool operator==(const StyleState&) const = default;
    };

    struct MotionPathState {
        glm::dvec2 position{0.0, 0.0};
        double angle = 0.0;

        bool operator==(const MotionPathState&) const = default;
    };

    using AttributeValue = std::variant<std::string, double>;

    // Animated overrides for one element at one point in time. Absent members are unanimated.
    struct ElementAnimationState {
        std::string element_id;
        double time = 0.0;

        std::optional<TransformState> transform;
        std::optional<StyleState> style;
        std::map<std::string, AttributeValue> attributes;
        std::optional<std::string> path_data;
        std::optional<MotionPathState> motion_path;
    };

    using ElementStateMap = std::unordered_map<std::string, ElementAnimationState>;

} // namespace vecanim::animation
