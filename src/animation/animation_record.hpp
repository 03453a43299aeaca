/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vecanim::animation {

    enum class TransformType : uint8_t { Translate,
                                         Scale,
                                         Rotate,
                                         SkewX,
                                         SkewY };

    enum class FillMode : uint8_t { Freeze,
                                    Remove };

    enum class CalcMode : uint8_t { Linear,
                                    Discrete,
                                    Paced,
                                    Spline };

    enum class Additive : uint8_t { Replace,
                                    Sum };

    enum class Accumulate : uint8_t { None,
                                      Sum };

    enum class RotateMode : uint8_t { None,
                                      Auto,
                                      AutoReverse,
                                      Fixed };

    // rotate="none" | "auto" | "auto-reverse" | <angle>. None keeps the element's own orientation.
    struct MotionRotate {
        RotateMode mode = RotateMode::Auto;
        double angle = 0.0;

        bool operator==(const MotionRotate&) const = default;
    };

    struct RepeatCount {
        double count = 1.0;
        bool indefinite = false;

        [[nodiscard]] static RepeatCount times(double n) { return {n, false}; }
        [[nodiscard]] static RepeatCount forever() { return {0.0, true}; }

        bool operator==(const RepeatCount&) const = default;
    };

    // <animate>
    struct AttributeAnimate {
        std::string attribute_name;
    };

    // <animateTransform>
    struct TransformAnimate {
        std::optional<TransformType> transform_type;
    };

    // <animateMotion>; mpath takes precedence over an inline path
    struct MotionAnimate {
        std::optional<std::string> path;
        std::optional<std::string> mpath;
        std::optional<MotionRotate> rotate;
        std::optional<std::string> key_points;
    };

    // <set>
    struct SetAnimate {
        std::string attribute_name;
    };

    // Any type the core does not understand. Kept so that evaluation can skip it and export can report it.
    struct CustomAnimate {
        std::string type_name;
    };

    using AnimationKind = std::variant<AttributeAnimate, TransformAnimate, MotionAnimate, SetAnimate, CustomAnimate>;

    struct AnimationRecord {
        std::string id;
        std::string target_element_id;
        AnimationKind kind = AttributeAnimate{};

        // Value source. 'values' wins over from/to when both are present.
        std::optional<std::string> from;
        std::optional<std::string> to;
        std::optional<std::string> values;

        // Timing
        std::optional<std::string> begin;
        std::optional<std::string> dur;
        std::optional<std::string> end;
        std::optional<RepeatCount> repeat_count;
        std::optional<std::string> repeat_dur;
        std::optional<FillMode> fill;

        // Easing
        CalcMode calc_mode = CalcMode::Linear;
        std::optional<std::string> key_times;
        std::optional<std::string> key_splines;

        // Composition
        Additive additive = Additive::Replace;
        Accumulate accumulate = Accumulate::None;
    };

    template <typename... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    // SMIL element name of the kind ("animate", "animateTransform", ...); custom kinds report their own name
    [[nodiscard]] std::string kindName(const AnimationKind& kind);

    // Attribute targeted by <animate>/<set>; nullptr for other kinds
    [[nodiscard]] const std::string* attributeName(const AnimationRecord& record);

    [[nodiscard]] const char* toString(TransformType type);
    [[nodiscard]] const char* toString(FillMode fill);
    [[nodiscard]] const char* toString(CalcMode mode);
    [[nodiscard]] const char* toString(Additive additive);
    [[nodiscard]] const char* toString(Accumulate accumulate);
    [[nodiscard]] std::string toString(const MotionRotate& rotate);
    [[nodiscard]] std::string toString(const RepeatCount& repeat);

    [[nodiscard]] std::optional<TransformType> parseTransformType(std::string_view text);
    [[nodiscard]] std::optional<FillMode> parseFillMode(std::string_view text);
    [[nodiscard]] std::optional<CalcMode> parseCalcMode(std::string_view text);
    [[nodiscard]] std::optional<Additive> parseAdditive(std::string_view text);
    [[nodiscard]] std::optional<Accumulate> parseAccumulate(std::string_view text);
    [[nodiscard]] std::optional<MotionRotate> parseMotionRotate(std::string_view text);
    [[nodiscard]] std::optional<RepeatCount> parseRepeatCount(std::string_view text);

    // Builds the kind for a wire type name, e.g. "animate" or "attribute-animate". Unknown names become CustomAnimate.
    [[nodiscard]] AnimationKind makeKind(std::string_view type_name);

} // namespace vecanim::animation
