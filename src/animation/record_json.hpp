/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation_record.hpp"

#include <expected>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace vecanim::animation {

    // Wire object (camelCase keys) -> record. Fails only on a non-object or a missing/non-string id or target.
    // Unrecognised enum values fall back to their defaults.
    [[nodiscard]] std::expected<AnimationRecord, std::string> recordFromJson(const nlohmann::json& j);

    // Array of wire objects. Malformed entries are logged and skipped.
    [[nodiscard]] std::vector<AnimationRecord> recordsFromJson(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json recordToJson(const AnimationRecord& record);

} // namespace vecanim::animation
