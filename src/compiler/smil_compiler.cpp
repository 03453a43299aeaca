/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "smil_compiler.hpp"
#include "animation/state_aggregator.hpp"
#include "animation/value_parsing.hpp"
#include "core/logger.hpp"
#include "value_format.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace vecanim::compiler {

    namespace {

        using animation::AnimationRecord;

        // Attributes in insertion order
        class AttributeList {
        public:
            void add(std::string name, std::string value) {
                entries_.emplace_back(std::move(name), std::move(value));
            }

            void addOptional(std::string name, const std::optional<std::string>& value) {
                if (value) {
                    add(std::move(name), *value);
                }
            }

            [[nodiscard]] std::string build(const std::string_view tag, const std::string& children = {}) const {
                std::string out = fmt::format("<{}", tag);
                for (const auto& [name, value] : entries_) {
                    if (value.empty()) {
                        continue;
                    }
                    out += fmt::format(" {}=\"{}\"", name, escapeXml(value));
                }
                if (children.empty()) {
                    out += "/>";
                } else {
                    out += fmt::format(">{}</{}>", children, tag);
                }
                return out;
            }

        private:
            std::vector<std::pair<std::string, std::string>> entries_;
        };

        void addValueSource(AttributeList& attrs, const AnimationRecord& record, const CompileOptions& opts) {
            if (record.values && !record.values->empty()) {
                attrs.add("values", formatValues(*record.values, opts.precision));
                return;
            }
            if (record.from) {
                attrs.add("from", formatValue(*record.from, opts.precision));
            }
            if (record.to) {
                attrs.add("to", formatValue(*record.to, opts.precision));
            }
        }

        void addTimingAttributes(AttributeList& attrs, const AnimationRecord& record) {
            attrs.addOptional("dur", record.dur);
            attrs.addOptional("begin", record.begin);
            attrs.addOptional("end", record.end);
            if (record.fill) {
                attrs.add("fill", animation::toString(*record.fill));
            }
            if (record.repeat_count) {
                attrs.add("repeatCount", animation::toString(*record.repeat_count));
            }
            attrs.addOptional("repeatDur", record.repeat_dur);
            if (record.calc_mode != animation::CalcMode::Linear) {
                attrs.add("calcMode", animation::toString(record.calc_mode));
            }
            attrs.addOptional("keyTimes", record.key_times);
            attrs.addOptional("keySplines", record.key_splines);
        }

        void addCompositionAttributes(AttributeList& attrs, const AnimationRecord& record) {
            if (record.additive == animation::Additive::Sum) {
                attrs.add("additive", "sum");
            }
            if (record.accumulate == animation::Accumulate::Sum) {
                attrs.add("accumulate", "sum");
            }
        }

        std::string compileAnimate(const AnimationRecord& record, const animation::AttributeAnimate& animate,
                                   const CompileOptions& opts) {
            if (animate.attribute_name.empty()) {
                throw CompileError("animate requires attributeName");
            }

            AttributeList attrs;
            attrs.add("attributeName", animate.attribute_name);
            addValueSource(attrs, record, opts);
            addTimingAttributes(attrs, record);
            addCompositionAttributes(attrs, record);
            return attrs.build("animate");
        }

        std::string compileAnimateTransform(const AnimationRecord& record, const animation::TransformAnimate& animate,
                                            const CompileOptions& opts) {
            if (!animate.transform_type) {
                throw CompileError("animateTransform requires transformType");
            }

            AttributeList attrs;
            attrs.add("attributeName", "transform");
            attrs.add("type", animation::toString(*animate.transform_type));
            addValueSource(attrs, record, opts);
            addTimingAttributes(attrs, record);
            addCompositionAttributes(attrs, record);
            return attrs.build("animateTransform");
        }

        std::string compileAnimateMotion(const AnimationRecord& record, const animation::MotionAnimate& motion,
                                         const CompileOptions& opts) {
            const bool has_mpath = motion.mpath && !motion.mpath->empty();
            const bool has_path = motion.path && !motion.path->empty();
            if (!has_mpath && !has_path) {
                throw CompileError("animateMotion requires path or mpath");
            }

            AttributeList attrs;
            // A referenced path wins over inline path data
            if (has_path && !has_mpath) {
                attrs.add("path", opts.optimize ? optimizePath(*motion.path, opts.precision) : *motion.path);
            }
            // SMIL has no rotate="none"; leaving the attribute out has the same effect
            if (motion.rotate && motion.rotate->mode != animation::RotateMode::None) {
                attrs.add("rotate", animation::toString(*motion.rotate));
            }
            if (motion.key_points) {
                attrs.add("keyPoints", formatKeyPoints(*motion.key_points, opts.precision));
            }
            addTimingAttributes(attrs, record);

            if (has_mpath) {
                return attrs.build("animateMotion", fmt::format("<mpath href=\"#{}\"/>", escapeXml(*motion.mpath)));
            }
            return attrs.build("animateMotion");
        }

        std::string compileSet(const AnimationRecord& record, const animation::SetAnimate& set,
                               const CompileOptions& opts) {
            if (set.attribute_name.empty()) {
                throw CompileError("set requires attributeName");
            }
            if (!record.to) {
                throw CompileError("set requires a to value");
            }

            AttributeList attrs;
            attrs.add("attributeName", set.attribute_name);
            attrs.add("to", formatValue(*record.to, opts.precision));
            attrs.addOptional("begin", record.begin);
            attrs.addOptional("dur", record.dur);
            attrs.addOptional("end", record.end);
            if (record.fill) {
                attrs.add("fill", animation::toString(*record.fill));
            }
            return attrs.build("set");
        }

        // Entry count of a ';' list, or of the from/to pair
        size_t keyframeCount(const AnimationRecord& record) {
            if (record.values) {
                const auto frames = animation::splitList(*record.values);
                if (!frames.empty()) {
                    return frames.size();
                }
            }
            return 2;
        }

        void validateEasing(const AnimationRecord& record, std::vector<std::string>& errors) {
            const size_t frames = keyframeCount(record);

            if (record.key_times) {
                const auto key_times = animation::splitList(*record.key_times);
                if (record.values && key_times.size() != frames) {
                    errors.push_back(fmt::format("keyTimes has {} entries but values has {}", key_times.size(), frames));
                }
            }

            if (record.calc_mode == animation::CalcMode::Spline) {
                const size_t splines = record.key_splines ? animation::splitList(*record.key_splines).size() : 0;
                const size_t segments = frames > 1 ? frames - 1 : 1;
                if (splines == 0) {
                    errors.emplace_back("keySplines is required when calcMode is spline");
                } else if (splines != segments) {
                    errors.push_back(fmt::format("keySplines has {} entries but {} are required", splines, segments));
                }
            }
        }

    } // namespace

    void SmilCompiler::setDefaultOptions(const CompileOverrides& overrides) {
        defaults_ = resolve(overrides);
    }

    CompileOptions SmilCompiler::resolve(const CompileOverrides& overrides) const {
        CompileOptions opts = defaults_;
        if (overrides.optimize) {
            opts.optimize = *overrides.optimize;
        }
        if (overrides.precision) {
            opts.precision = std::clamp(*overrides.precision, 0, core::param::MAX_COMPILE_PRECISION);
        }
        return opts;
    }

    std::string SmilCompiler::compile(const AnimationRecord& record, const CompileOverrides& overrides) const {
        const CompileOptions opts = resolve(overrides);

        return std::visit(
            animation::overloaded{
                [&](const animation::AttributeAnimate& animate) { return compileAnimate(record, animate, opts); },
                [&](const animation::TransformAnimate& animate) { return compileAnimateTransform(record, animate, opts); },
                [&](const animation::MotionAnimate& motion) { return compileAnimateMotion(record, motion, opts); },
                [&](const animation::SetAnimate& set) { return compileSet(record, set, opts); },
                [](const animation::CustomAnimate& custom) -> std::string {
                    throw CompileError(fmt::format("Unknown animation type: {}", custom.type_name));
                },
            },
            record.kind);
    }

    CompileResult SmilCompiler::compileAll(std::span<const AnimationRecord> records,
                                           const CompileOverrides& overrides) const {
        LOG_TIMER("SmilCompiler::compileAll");

        CompileResult result;
        for (const auto& [target, group] : animation::groupByTarget(records)) {
            for (const AnimationRecord* record : group) {
                try {
                    result.elements.push_back(compile(*record, overrides));
                } catch (const CompileError& e) {
                    result.warnings.push_back(fmt::format("Failed to compile animation {}: {}", record->id, e.what()));
                    LOG_WARN("{}", result.warnings.back());
                }
            }
        }

        LOG_DEBUG("Compiled {} of {} animations ({} warnings)", result.elements.size(), records.size(),
                  result.warnings.size());
        return result;
    }

    ValidationResult SmilCompiler::validate(const AnimationRecord& record) const {
        ValidationResult result;
        auto& errors = result.errors;

        const std::string type = animation::kindName(record.kind);
        if (type.empty()) {
            errors.emplace_back("Animation type is required");
        }
        if (record.target_element_id.empty()) {
            errors.emplace_back("Target element ID is required");
        }

        std::visit(
            animation::overloaded{
                [&](const animation::AttributeAnimate& animate) {
                    if (animate.attribute_name.empty()) {
                        errors.emplace_back("attributeName is required for animate");
                    }
                    if (!record.from && !record.to && (!record.values || record.values->empty())) {
                        errors.emplace_back("Either from/to or values must be specified");
                    }
                    validateEasing(record, errors);
                },
                [&](const animation::TransformAnimate& animate) {
                    if (!animate.transform_type) {
                        errors.emplace_back("transformType is required for animateTransform");
                    }
                    validateEasing(record, errors);
                },
                [&](const animation::MotionAnimate& motion) {
                    const bool has_path = motion.path && !motion.path->empty();
                    const bool has_mpath = motion.mpath && !motion.mpath->empty();
                    if (!has_path && !has_mpath) {
                        errors.emplace_back("Either path or mpath is required for animateMotion");
                    }
                },
                [&](const animation::SetAnimate& set) {
                    if (set.attribute_name.empty()) {
                        errors.emplace_back("attributeName is required for set");
                    }
                    if (!record.to) {
                        errors.emplace_back("to value is required for set");
                    }
                },
                [&](const animation::CustomAnimate& custom) {
                    if (!custom.type_name.empty()) {
                        errors.push_back(fmt::format("Unsupported animation type: {}", custom.type_name));
                    }
                },
            },
            record.kind);

        result.valid = errors.empty();
        return result;
    }

} // namespace vecanim::compiler
