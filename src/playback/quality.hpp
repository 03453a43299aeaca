/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace vecanim::playback {

    enum class QualityMode : uint8_t { Editing,
                                       Preview,
                                       Export };

    enum class FilterQuality : uint8_t { Low,
                                         Medium,
                                         High };

    struct QualitySettings {
        QualityMode mode = QualityMode::Editing;
        FilterQuality filter_quality = FilterQuality::Low;
        int update_rate = 30; // Broadcasts per second while playing
        bool disable_filters = true;

        bool operator==(const QualitySettings&) const = default;
    };

    [[nodiscard]] const QualitySettings& qualityPreset(QualityMode mode);

    [[nodiscard]] const char* toString(QualityMode mode);
    [[nodiscard]] const char* toString(FilterQuality quality);
    [[nodiscard]] std::optional<QualityMode> qualityModeFromString(std::string_view name);

} // namespace vecanim::playback
