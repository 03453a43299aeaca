/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "state_aggregator.hpp"
#include "core/logger.hpp"
#include "easing.hpp"
#include "interpolation.hpp"
#include "timing.hpp"
#include "value_parsing.hpp"

#include <unordered_map>

namespace vecanim::animation {

    namespace {

        struct NumericDefaults {
            const char* from;
            const char* to;
        };

        NumericDefaults numericDefaults(const std::string& attribute) {
            if (attribute == "opacity")
                return {"1", "0"};
            if (attribute == "stroke-width")
                return {"1", "1"};
            return {"0", "0"};
        }

        // Style slot backing a numeric attribute, nullptr when it lives in the generic attribute bag
        std::optional<double>* numericStyleSlot(ElementAnimationState& state, const std::string& attribute) {
            if (attribute != "opacity" && attribute != "stroke-width" && attribute != "stroke-dashoffset") {
                return nullptr;
            }
            if (!state.style) {
                state.style = StyleState{};
            }
            if (attribute == "opacity")
                return &state.style->opacity;
            if (attribute == "stroke-width")
                return &state.style->stroke_width;
            return &state.style->stroke_dashoffset;
        }

        // 'values' when present and non-empty, otherwise the from/to pair
        std::vector<std::string> keyframeStrings(const AnimationRecord& record,
                                                 const std::string& default_from,
                                                 const std::string& default_to) {
            if (record.values) {
                auto frames = splitList(*record.values);
                if (!frames.empty()) {
                    return frames;
                }
            }
            return {record.from.value_or(default_from), record.to.value_or(default_to)};
        }

        std::vector<double> discreteKeyTimes(const AnimationRecord& record) {
            if (record.calc_mode != CalcMode::Discrete || !record.key_times) {
                return {};
            }
            return parseKeyTimes(*record.key_times);
        }

        void accumulateIterations(ValueTuple& value, const AnimationRecord& record,
                                  const std::vector<ValueTuple>& frames, const TimingResult& timing) {
            if (record.accumulate != Accumulate::Sum || timing.iteration <= 0 || frames.empty()) {
                return;
            }
            const ValueTuple& last = frames.back();
            const auto iterations = static_cast<double>(timing.iteration);
            for (size_t i = 0; i < value.size() && i < last.size(); ++i) {
                value[i] += iterations * last[i];
            }
        }

        void writeDiscrete(ElementAnimationState& state, const AnimationRecord& record,
                           const std::string& attribute, const std::vector<std::string>& frames, const double progress) {
            const std::string& selected = record.calc_mode == CalcMode::Discrete
                                              ? frames[discreteIndex(frames.size(), progress, discreteKeyTimes(record))]
                                              : selectKeyframe(frames, progress);
            if (!selected.empty()) {
                state.attributes[attribute] = selected;
            }
        }

        void applyPathData(ElementAnimationState& state, const AnimationRecord& record, const double progress) {
            const auto frames = keyframeStrings(record, "", "");
            const std::string& selected = frames.size() == 1 ? frames.front() : selectKeyframe(frames, progress);
            if (!selected.empty()) {
                state.path_data = selected;
            }
        }

        void applyColor(ElementAnimationState& state, const AnimationRecord& record,
                        const std::string& attribute, const double progress) {
            const auto frames = keyframeStrings(record, "#000000", "#000000");

            std::string color;
            if (record.calc_mode == CalcMode::Discrete) {
                const auto& frame = frames[discreteIndex(frames.size(), progress, discreteKeyTimes(record))];
                const auto rgb = parseHexColor(frame);
                color = rgb ? formatRgb(*rgb) : frame;
            } else if (frames.size() == 1) {
                color = interpolateColor(frames.front(), frames.front(), progress);
            } else {
                double paced = progress;
                if (record.calc_mode == CalcMode::Paced) {
                    std::vector<ValueTuple> tuples;
                    tuples.reserve(frames.size());
                    for (const auto& frame : frames) {
                        const auto rgb = parseHexColor(frame);
                        if (!rgb) {
                            tuples.clear();
                            break;
                        }
                        tuples.push_back({static_cast<double>(rgb->r), static_cast<double>(rgb->g),
                                          static_cast<double>(rgb->b)});
                    }
                    if (!tuples.empty()) {
                        paced = pacedProgress(tuples, progress);
                    }
                }
                const auto pair = keyframePair(frames.size(), paced);
                color = interpolateColor(frames[pair.index], frames[pair.next], pair.local);
            }

            if (attribute == "fill" || attribute == "stroke") {
                if (!state.style) {
                    state.style = StyleState{};
                }
                (attribute == "fill" ? state.style->fill_color : state.style->stroke_color) = color;
            } else {
                state.attributes[attribute] = color;
            }
        }

        void applyNumeric(ElementAnimationState& state, const AnimationRecord& record, const std::string& attribute,
                          const TimingResult& timing, const double progress) {
            const auto defaults = numericDefaults(attribute);
            const auto frames = keyframeStrings(record, defaults.from, defaults.to);

            std::vector<ValueTuple> tuples;
            tuples.reserve(frames.size());
            for (const auto& frame : frames) {
                const auto number = parseNumber(frame);
                if (!number) {
                    // Not numeric: fall back to a hard switch between the raw strings
                    writeDiscrete(state, record, attribute, frames, progress);
                    return;
                }
                tuples.push_back({*number});
            }

            ValueTuple value = interpolateTuples(tuples, progress, record.calc_mode, discreteKeyTimes(record));
            accumulateIterations(value, record, tuples, timing);
            double result = value.empty() ? 0.0 : value.front();

            std::optional<double>* slot = numericStyleSlot(state, attribute);
            if (record.additive == Additive::Sum) {
                if (slot && slot->has_value()) {
                    result += **slot;
                } else if (!slot) {
                    const auto it = state.attributes.find(attribute);
                    if (it != state.attributes.end()) {
                        if (const auto* previous = std::get_if<double>(&it->second)) {
                            result += *previous;
                        }
                    }
                }
            }

            if (slot) {
                *slot = result;
            } else {
                state.attributes[attribute] = result;
            }
        }

        void applyAttribute(ElementAnimationState& state, const AnimationRecord& record, const AttributeAnimate& animate,
                            const TimingResult& timing, const double progress) {
            const std::string& attribute = animate.attribute_name;
            if (attribute.empty()) {
                return;
            }

            if (attribute == "d") {
                applyPathData(state, record, progress);
            } else if (isColorAttribute(attribute)) {
                applyColor(state, record, attribute, progress);
            } else {
                applyNumeric(state, record, attribute, timing, progress);
            }
        }

        ValueTuple normalizeTransform(const TransformType type, const ValueTuple& raw) {
            switch (type) {
                case TransformType::Translate:
                    return {raw.size() > 0 ? raw[0] : 0.0, raw.size() > 1 ? raw[1] : 0.0};
                case TransformType::Scale: {
                    const double x = raw.size() > 0 ? raw[0] : 1.0;
                    return {x, raw.size() > 1 ? raw[1] : x};
                }
                case TransformType::Rotate:
                case TransformType::SkewX:
                case TransformType::SkewY:
                    return {raw.size() > 0 ? raw[0] : 0.0};
            }
            return {};
        }

        void applyTransform(ElementAnimationState& state, const AnimationRecord& record, const TransformAnimate& animate,
                            const TimingResult& timing, const double progress) {
            if (!animate.transform_type) {
                return;
            }
            const TransformType type = *animate.transform_type;

            if (!state.transform) {
                state.transform = TransformState{};
            }
            TransformState& transform = *state.transform;

            const auto frames = keyframeStrings(record, "", "");
            std::vector<ValueTuple> tuples;
            tuples.reserve(frames.size());
            for (const auto& frame : frames) {
                tuples.push_back(normalizeTransform(type, parseNumberList(frame)));
            }

            ValueTuple value = interpolateTuples(tuples, progress, record.calc_mode, discreteKeyTimes(record));
            accumulateIterations(value, record, tuples, timing);

            const bool sum = record.additive == Additive::Sum;
            const auto combine = [sum](double& field, const double v) { field = sum ? field + v : v; };

            switch (type) {
                case TransformType::Translate:
                    combine(transform.translate_x, value[0]);
                    combine(transform.translate_y, value[1]);
                    break;
                case TransformType::Scale:
                    transform.scale_x = sum ? transform.scale_x * value[0] : value[0];
                    transform.scale_y = sum ? transform.scale_y * value[1] : value[1];
                    break;
                case TransformType::Rotate: {
                    combine(transform.rotate, value[0]);
                    // The rotation centre is static, taken from the first keyframe when it names both cx and cy
                    const ValueTuple first = parseNumberList(frames.front());
                    if (first.size() >= 3) {
                        transform.rotate_center = glm::dvec2(first[1], first[2]);
                    }
                    break;
                }
                case TransformType::SkewX:
                    combine(transform.skew_x, value[0]);
                    break;
                case TransformType::SkewY:
                    combine(transform.skew_y, value[0]);
                    break;
            }
        }

        void applySet(ElementAnimationState& state, const AnimationRecord& record, const SetAnimate& set,
                      const double time) {
            if (set.attribute_name.empty() || !record.to) {
                return;
            }
            if (isSetActive(record, time)) {
                state.attributes[set.attribute_name] = *record.to;
            }
        }

    } // namespace

    TargetGroups groupByTarget(std::span<const AnimationRecord> records) {
        TargetGroups groups;
        std::unordered_map<std::string, size_t> slots;
        for (const auto& record : records) {
            const auto [it, inserted] = slots.try_emplace(record.target_element_id, groups.size());
            if (inserted) {
                groups.emplace_back(record.target_element_id, std::vector<const AnimationRecord*>{});
            }
            groups[it->second].second.push_back(&record);
        }
        return groups;
    }

    void applyAnimation(ElementAnimationState& state, const AnimationRecord& record, const double time) {
        std::visit(
            overloaded{
                [&](const AttributeAnimate& animate) {
                    const auto timing = resolveTiming(record, time);
                    applyAttribute(state, record, animate, timing, applyEasing(record, timing.progress));
                },
                [&](const TransformAnimate& animate) {
                    const auto timing = resolveTiming(record, time);
                    applyTransform(state, record, animate, timing, applyEasing(record, timing.progress));
                },
                [&](const MotionAnimate& motion) {
                    if (!motion.path && !motion.mpath) {
                        return;
                    }
                    state.motion_path = evaluateMotionPath(motion, resolveProgress(record, time));
                },
                [&](const SetAnimate& set) { applySet(state, record, set, time); },
                [&](const CustomAnimate& custom) {
                    LOG_TRACE("Skipping animation '{}' of unsupported type '{}'", record.id, custom.type_name);
                },
            },
            record.kind);
    }

    ElementAnimationState calculateElementState(const std::string& element_id,
                                                std::span<const AnimationRecord> records,
                                                const double time) {
        ElementAnimationState state;
        state.element_id = element_id;
        state.time = time;

        for (const auto& record : records) {
            if (record.target_element_id == element_id) {
                applyAnimation(state, record, time);
            }
        }
        return state;
    }

    ElementStateMap calculateAllStates(std::span<const AnimationRecord> records,
                                       const ElementIndex& elements,
                                       const double time) {
        ElementStateMap states;
        for (const auto& [element_id, group] : groupByTarget(records)) {
            if (!elements.contains(element_id)) {
                continue;
            }

            ElementAnimationState state;
            state.element_id = element_id;
            state.time = time;
            for (const AnimationRecord* record : group) {
                applyAnimation(state, *record, time);
            }
            states.emplace(element_id, std::move(state));
        }
        return states;
    }

} // namespace vecanim::animation
