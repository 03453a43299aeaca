/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "presets.hpp"

#include <spdlog/fmt/fmt.h>

namespace vecanim::animation {

    namespace {
        std::string number(const double value) {
            return fmt::format("{}", value);
        }

        std::string pair(const double x, const double y) {
            return fmt::format("{} {}", x, y);
        }
    } // namespace

    AnimationRecord withDefaults(AnimationRecord record) {
        if (!record.fill) {
            record.fill = FillMode::Freeze;
        }
        if (!record.repeat_count) {
            record.repeat_count = RepeatCount::times(1.0);
        }
        if (!record.dur) {
            record.dur = "2s";
        }
        return record;
    }

    PresetFactory::PresetFactory(std::string id_prefix) : id_prefix_(std::move(id_prefix)) {}

    std::string PresetFactory::nextId() {
        return fmt::format("{}-{}", id_prefix_, next_id_++);
    }

    AnimationRecord PresetFactory::base(const std::string& target_id, AnimationKind kind) {
        AnimationRecord record;
        record.id = nextId();
        record.target_element_id = target_id;
        record.kind = std::move(kind);
        return record;
    }

    AnimationRecord PresetFactory::makeFadeAnimation(const std::string& target_id, const std::string& dur,
                                                     const double from, const double to) {
        auto record = base(target_id, AttributeAnimate{"opacity"});
        record.dur = dur;
        record.from = number(from);
        record.to = number(to);
        record.repeat_count = RepeatCount::times(1.0);
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeRotateAnimation(const std::string& target_id, const std::string& dur,
                                                       const double degrees) {
        auto record = base(target_id, TransformAnimate{TransformType::Rotate});
        record.dur = dur;
        record.from = "0";
        record.to = number(degrees);
        record.repeat_count = RepeatCount::times(1.0);
        record.additive = Additive::Sum;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeMoveAnimation(const std::string& target_id, const std::string& dur,
                                                     const double from_x, const double from_y,
                                                     const double to_x, const double to_y) {
        auto record = base(target_id, TransformAnimate{TransformType::Translate});
        record.dur = dur;
        record.from = pair(from_x, from_y);
        record.to = pair(to_x, to_y);
        record.repeat_count = RepeatCount::times(1.0);
        record.additive = Additive::Sum;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeScaleAnimation(const std::string& target_id, const std::string& dur,
                                                      const double from_scale, const double to_scale) {
        auto record = base(target_id, TransformAnimate{TransformType::Scale});
        record.dur = dur;
        record.from = pair(from_scale, from_scale);
        record.to = pair(to_scale, to_scale);
        record.repeat_count = RepeatCount::times(1.0);
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makePathDrawAnimation(const std::string& target_id, const std::string& dur) {
        auto record = base(target_id, AttributeAnimate{"stroke-dashoffset"});
        record.dur = dur;
        record.from = "1";
        record.to = "0";
        record.repeat_count = RepeatCount::times(1.0);
        record.fill = FillMode::Freeze;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeSetAnimation(const std::string& target_id, const std::string& attribute_name,
                                                    const std::string& to, const std::string& begin,
                                                    const std::optional<std::string>& end) {
        auto record = base(target_id, SetAnimate{attribute_name});
        record.to = to;
        record.begin = begin;
        record.end = end;
        record.fill = FillMode::Freeze;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeAttributeAnimation(const std::string& target_id,
                                                          const std::string& attribute_name,
                                                          const std::string& dur,
                                                          const std::string& from,
                                                          const std::string& to,
                                                          const RepeatCount repeat) {
        auto record = base(target_id, AttributeAnimate{attribute_name});
        record.dur = dur;
        record.from = from;
        record.to = to;
        record.repeat_count = repeat;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeFillColorAnimation(const std::string& target_id, const std::string& dur) {
        auto record = base(target_id, AttributeAnimate{"fill"});
        record.dur = dur;
        record.values = "#ff6b6b;#4ecdc4;#ff6b6b";
        record.repeat_count = RepeatCount::forever();
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeStrokeColorAnimation(const std::string& target_id, const std::string& dur) {
        auto record = base(target_id, AttributeAnimate{"stroke"});
        record.dur = dur;
        record.values = "#111111;#ff9900;#111111";
        record.repeat_count = RepeatCount::forever();
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeStrokeWidthAnimation(const std::string& target_id, const std::string& dur,
                                                            const double from_width, const double to_width) {
        auto record = base(target_id, AttributeAnimate{"stroke-width"});
        record.dur = dur;
        record.from = number(from_width);
        record.to = number(to_width);
        record.repeat_count = RepeatCount::times(1.0);
        record.fill = FillMode::Freeze;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makePathDataAnimation(const std::string& target_id, const std::string& dur,
                                                         const std::string& from_d, const std::string& to_d) {
        auto record = base(target_id, AttributeAnimate{"d"});
        record.dur = dur;
        record.from = from_d;
        record.to = to_d;
        record.repeat_count = RepeatCount::times(1.0);
        record.fill = FillMode::Freeze;
        return withDefaults(std::move(record));
    }

    AnimationRecord PresetFactory::makeMotionAnimation(const std::string& target_id, const std::string& path_id,
                                                       const std::string& dur, const MotionRotate rotate) {
        MotionAnimate motion;
        motion.mpath = path_id;
        motion.rotate = rotate;

        auto record = base(target_id, std::move(motion));
        record.dur = dur;
        record.fill = FillMode::Freeze;
        return withDefaults(std::move(record));
    }

} // namespace vecanim::animation
