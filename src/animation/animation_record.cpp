/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation_record.hpp"
#include "value_parsing.hpp"

#include <spdlog/fmt/fmt.h>

namespace vecanim::animation {

    std::string kindName(const AnimationKind& kind) {
        return std::visit(
            overloaded{
                [](const AttributeAnimate&) -> std::string { return "animate"; },
                [](const TransformAnimate&) -> std::string { return "animateTransform"; },
                [](const MotionAnimate&) -> std::string { return "animateMotion"; },
                [](const SetAnimate&) -> std::string { return "set"; },
                [](const CustomAnimate& custom) -> std::string { return custom.type_name; },
            },
            kind);
    }

    const std::string* attributeName(const AnimationRecord& record) {
        if (const auto* attribute = std::get_if<AttributeAnimate>(&record.kind)) {
            return &attribute->attribute_name;
        }
        if (const auto* set = std::get_if<SetAnimate>(&record.kind)) {
            return &set->attribute_name;
        }
        return nullptr;
    }

    const char* toString(const TransformType type) {
        switch (type) {
            case TransformType::Translate:
                return "translate";
            case TransformType::Scale:
                return "scale";
            case TransformType::Rotate:
                return "rotate";
            case TransformType::SkewX:
                return "skewX";
            case TransformType::SkewY:
                return "skewY";
        }
        return "translate";
    }

    const char* toString(const FillMode fill) {
        switch (fill) {
            case FillMode::Freeze:
                return "freeze";
            case FillMode::Remove:
                return "remove";
        }
        return "remove";
    }

    const char* toString(const CalcMode mode) {
        switch (mode) {
            case CalcMode::Linear:
                return "linear";
            case CalcMode::Discrete:
                return "discrete";
            case CalcMode::Paced:
                return "paced";
            case CalcMode::Spline:
                return "spline";
        }
        return "linear";
    }

    const char* toString(const Additive additive) {
        return additive == Additive::Sum ? "sum" : "replace";
    }

    const char* toString(const Accumulate accumulate) {
        return accumulate == Accumulate::Sum ? "sum" : "none";
    }

    std::string toString(const MotionRotate& rotate) {
        switch (rotate.mode) {
            case RotateMode::None:
                return "none";
            case RotateMode::Auto:
                return "auto";
            case RotateMode::AutoReverse:
                return "auto-reverse";
            case RotateMode::Fixed:
                return fmt::format("{}", rotate.angle);
        }
        return "auto";
    }

    std::string toString(const RepeatCount& repeat) {
        if (repeat.indefinite) {
            return "indefinite";
        }
        return fmt::format("{}", repeat.count);
    }

    std::optional<TransformType> parseTransformType(std::string_view text) {
        text = trim(text);
        if (text == "translate")
            return TransformType::Translate;
        if (text == "scale")
            return TransformType::Scale;
        if (text == "rotate")
            return TransformType::Rotate;
        if (text == "skewX")
            return TransformType::SkewX;
        if (text == "skewY")
            return TransformType::SkewY;
        return std::nullopt;
    }

    std::optional<FillMode> parseFillMode(std::string_view text) {
        text = trim(text);
        if (text == "freeze")
            return FillMode::Freeze;
        if (text == "remove")
            return FillMode::Remove;
        return std::nullopt;
    }

    std::optional<CalcMode> parseCalcMode(std::string_view text) {
        text = trim(text);
        if (text == "linear")
            return CalcMode::Linear;
        if (text == "discrete")
            return CalcMode::Discrete;
        if (text == "paced")
            return CalcMode::Paced;
        if (text == "spline")
            return CalcMode::Spline;
        return std::nullopt;
    }

    std::optional<Additive> parseAdditive(std::string_view text) {
        text = trim(text);
        if (text == "replace")
            return Additive::Replace;
        if (text == "sum")
            return Additive::Sum;
        return std::nullopt;
    }

    std::optional<Accumulate> parseAccumulate(std::string_view text) {
        text = trim(text);
        if (text == "none")
            return Accumulate::None;
        if (text == "sum")
            return Accumulate::Sum;
        return std::nullopt;
    }

    std::optional<MotionRotate> parseMotionRotate(std::string_view text) {
        text = trim(text);
        if (text == "none")
            return MotionRotate{RotateMode::None, 0.0};
        if (text == "auto")
            return MotionRotate{RotateMode::Auto, 0.0};
        if (text == "auto-reverse")
            return MotionRotate{RotateMode::AutoReverse, 0.0};
        if (isNumericToken(text)) {
            return MotionRotate{RotateMode::Fixed, *parseNumber(text)};
        }
        return std::nullopt;
    }

    std::optional<RepeatCount> parseRepeatCount(std::string_view text) {
        text = trim(text);
        if (text == "indefinite") {
            return RepeatCount::forever();
        }
        const auto count = parseNumber(text);
        if (!count || *count <= 0.0) {
            return std::nullopt;
        }
        return RepeatCount::times(*count);
    }

    AnimationKind makeKind(std::string_view type_name) {
        type_name = trim(type_name);
        if (type_name == "animate" || type_name == "attribute-animate")
            return AttributeAnimate{};
        if (type_name == "animateTransform" || type_name == "transform-animate")
            return TransformAnimate{};
        if (type_name == "animateMotion" || type_name == "motion-animate")
            return MotionAnimate{};
        if (type_name == "set")
            return SetAnimate{};
        return CustomAnimate{std::string(type_name)};
    }

} // namespace vecanim::animation
