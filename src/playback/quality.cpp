/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "quality.hpp"

#include <array>

namespace vecanim::playback {

    namespace {
        constexpr std::array<QualitySettings, 3> QUALITY_PRESETS = {{
            {QualityMode::Editing, FilterQuality::Low, 30, true},
            {QualityMode::Preview, FilterQuality::Medium, 60, false},
            {QualityMode::Export, FilterQuality::High, 60, false},
        }};
    } // namespace

    const QualitySettings& qualityPreset(const QualityMode mode) {
        return QUALITY_PRESETS[static_cast<size_t>(mode)];
    }

    const char* toString(const QualityMode mode) {
        switch (mode) {
            case QualityMode::Editing:
                return "editing";
            case QualityMode::Preview:
                return "preview";
            case QualityMode::Export:
                return "export";
        }
        return "editing";
    }

    const char* toString(const FilterQuality quality) {
        switch (quality) {
            case FilterQuality::Low:
                return "low";
            case FilterQuality::Medium:
                return "medium";
            case FilterQuality::High:
                return "high";
        }
        return "low";
    }

    std::optional<QualityMode> qualityModeFromString(const std::string_view name) {
        if (name == "editing")
            return QualityMode::Editing;
        if (name == "preview")
            return QualityMode::Preview;
        if (name == "export")
            return QualityMode::Export;
        return std::nullopt;
    }

} // namespace vecanim::playback
