/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "record_json.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace vecanim::animation {

    namespace {

        // Strings pass through, numbers are formatted the shortest way ("1", "0.5")
        std::optional<std::string> optionalText(const nlohmann::json& j, const char* key) {
            const auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return std::nullopt;
            }
            if (it->is_string()) {
                return it->get<std::string>();
            }
            if (it->is_number()) {
                return fmt::format("{}", it->get<double>());
            }
            LOG_DEBUG("Ignoring non-scalar '{}' field", key);
            return std::nullopt;
        }

        template <typename T, typename Parser>
        std::optional<T> optionalEnum(const nlohmann::json& j, const char* key, Parser parse) {
            const auto text = optionalText(j, key);
            if (!text) {
                return std::nullopt;
            }
            auto parsed = parse(*text);
            if (!parsed) {
                LOG_DEBUG("Unrecognised {} '{}', using default", key, *text);
            }
            return parsed;
        }

        void putText(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
            if (value) {
                j[key] = *value;
            }
        }

    } // namespace

    std::expected<AnimationRecord, std::string> recordFromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::unexpected("Animation record must be a JSON object");
        }

        const auto id = j.find("id");
        if (id == j.end() || !id->is_string()) {
            return std::unexpected("Animation record is missing a string 'id'");
        }
        const auto target = j.find("targetElementId");
        if (target == j.end() || !target->is_string()) {
            return std::unexpected(fmt::format("Animation {} is missing a string 'targetElementId'",
                                               id->get<std::string>()));
        }

        AnimationRecord record;
        record.id = id->get<std::string>();
        record.target_element_id = target->get<std::string>();
        record.kind = makeKind(optionalText(j, "type").value_or(""));

        std::visit(
            overloaded{
                [&](AttributeAnimate& animate) {
                    animate.attribute_name = optionalText(j, "attributeName").value_or("");
                },
                [&](TransformAnimate& animate) {
                    animate.transform_type = optionalEnum<TransformType>(j, "transformType", parseTransformType);
                },
                [&](MotionAnimate& motion) {
                    motion.path = optionalText(j, "path");
                    motion.mpath = optionalText(j, "mpath");
                    motion.rotate = optionalEnum<MotionRotate>(j, "rotate", parseMotionRotate);
                    motion.key_points = optionalText(j, "keyPoints");
                },
                [&](SetAnimate& set) {
                    set.attribute_name = optionalText(j, "attributeName").value_or("");
                },
                [](CustomAnimate&) {},
            },
            record.kind);

        record.from = optionalText(j, "from");
        record.to = optionalText(j, "to");
        record.values = optionalText(j, "values");

        record.begin = optionalText(j, "begin");
        record.dur = optionalText(j, "dur");
        record.end = optionalText(j, "end");
        record.repeat_count = optionalEnum<RepeatCount>(j, "repeatCount", parseRepeatCount);
        record.repeat_dur = optionalText(j, "repeatDur");
        record.fill = optionalEnum<FillMode>(j, "fill", parseFillMode);

        record.calc_mode = optionalEnum<CalcMode>(j, "calcMode", parseCalcMode).value_or(CalcMode::Linear);
        record.key_times = optionalText(j, "keyTimes");
        record.key_splines = optionalText(j, "keySplines");

        record.additive = optionalEnum<Additive>(j, "additive", parseAdditive).value_or(Additive::Replace);
        record.accumulate = optionalEnum<Accumulate>(j, "accumulate", parseAccumulate).value_or(Accumulate::None);

        return record;
    }

    std::vector<AnimationRecord> recordsFromJson(const nlohmann::json& j) {
        std::vector<AnimationRecord> records;
        if (!j.is_array()) {
            LOG_WARN("Expected an array of animation records");
            return records;
        }

        records.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i) {
            auto record = recordFromJson(j[i]);
            if (!record) {
                LOG_WARN("Skipping animation record {}: {}", i, record.error());
                continue;
            }
            records.push_back(std::move(*record));
        }
        return records;
    }

    nlohmann::json recordToJson(const AnimationRecord& record) {
        nlohmann::json j;
        j["id"] = record.id;
        j["type"] = kindName(record.kind);
        j["targetElementId"] = record.target_element_id;

        std::visit(
            overloaded{
                [&](const AttributeAnimate& animate) { j["attributeName"] = animate.attribute_name; },
                [&](const TransformAnimate& animate) {
                    if (animate.transform_type) {
                        j["transformType"] = toString(*animate.transform_type);
                    }
                },
                [&](const MotionAnimate& motion) {
                    putText(j, "path", motion.path);
                    putText(j, "mpath", motion.mpath);
                    if (motion.rotate) {
                        if (motion.rotate->mode == RotateMode::Fixed) {
                            j["rotate"] = motion.rotate->angle;
                        } else {
                            j["rotate"] = toString(*motion.rotate);
                        }
                    }
                    putText(j, "keyPoints", motion.key_points);
                },
                [&](const SetAnimate& set) { j["attributeName"] = set.attribute_name; },
                [](const CustomAnimate&) {},
            },
            record.kind);

        putText(j, "from", record.from);
        putText(j, "to", record.to);
        putText(j, "values", record.values);

        putText(j, "begin", record.begin);
        putText(j, "dur", record.dur);
        putText(j, "end", record.end);
        if (record.repeat_count) {
            if (record.repeat_count->indefinite) {
                j["repeatCount"] = "indefinite";
            } else {
                j["repeatCount"] = record.repeat_count->count;
            }
        }
        putText(j, "repeatDur", record.repeat_dur);
        if (record.fill) {
            j["fill"] = toString(*record.fill);
        }

        j["calcMode"] = toString(record.calc_mode);
        putText(j, "keyTimes", record.key_times);
        putText(j, "keySplines", record.key_splines);
        j["additive"] = toString(record.additive);
        j["accumulate"] = toString(record.accumulate);
        return j;
    }

} // namespace vecanim::animation
