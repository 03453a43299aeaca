/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace vecanim::core::param {

    inline constexpr int DEFAULT_COMPILE_PRECISION = 4;
    inline constexpr int MAX_COMPILE_PRECISION = 12;

    struct PlaybackParameters {
        // One of "editing", "preview", "export"
        std::string quality = "editing";

        [[nodiscard]] nlohmann::json to_json() const;
        static PlaybackParameters from_json(const nlohmann::json& j);
    };

    struct CompilerParameters {
        bool optimize = true;
        int precision = DEFAULT_COMPILE_PRECISION;

        [[nodiscard]] nlohmann::json to_json() const;
        static CompilerParameters from_json(const nlohmann::json& j);
    };

    struct LoggingParameters {
        std::string level = "info";
        std::string file;

        [[nodiscard]] nlohmann::json to_json() const;
        static LoggingParameters from_json(const nlohmann::json& j);
    };

    struct EngineParameters {
        PlaybackParameters playback;
        CompilerParameters compiler;
        LoggingParameters logging;

        [[nodiscard]] nlohmann::json to_json() const;
        static EngineParameters from_json(const nlohmann::json& j);
    };

    std::expected<EngineParameters, std::string> load_engine_parameters(const std::filesystem::path& path);

    std::expected<void, std::string> save_engine_parameters(const EngineParameters& params,
                                                            const std::filesystem::path& path);

    // Applies the logging section to the global logger
    void apply_logging_parameters(const LoggingParameters& params);

} // namespace vecanim::core::param
