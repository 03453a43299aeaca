/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace vecanim::core::param {

    namespace {

        bool is_known_quality(const std::string& mode) {
            return mode == "editing" || mode == "preview" || mode == "export";
        }

    } // namespace

    nlohmann::json PlaybackParameters::to_json() const {
        return nlohmann::json{{"quality", quality}};
    }

    PlaybackParameters PlaybackParameters::from_json(const nlohmann::json& j) {
        PlaybackParameters params;
        if (!j.is_object()) {
            return params;
        }

        const std::string quality = j.value("quality", params.quality);
        if (is_known_quality(quality)) {
            params.quality = quality;
        } else {
            LOG_WARN("Unknown playback quality '{}', using '{}'", quality, params.quality);
        }
        return params;
    }

    nlohmann::json CompilerParameters::to_json() const {
        return nlohmann::json{{"optimize", optimize}, {"precision", precision}};
    }

    CompilerParameters CompilerParameters::from_json(const nlohmann::json& j) {
        CompilerParameters params;
        if (!j.is_object()) {
            return params;
        }

        params.optimize = j.value("optimize", params.optimize);

        const int precision = j.value("precision", params.precision);
        if (precision < 0 || precision > MAX_COMPILE_PRECISION) {
            LOG_WARN("Compiler precision {} out of range [0, {}], clamping", precision, MAX_COMPILE_PRECISION);
        }
        params.precision = std::clamp(precision, 0, MAX_COMPILE_PRECISION);
        return params;
    }

    nlohmann::json LoggingParameters::to_json() const {
        return nlohmann::json{{"level", level}, {"file", file}};
    }

    LoggingParameters LoggingParameters::from_json(const nlohmann::json& j) {
        LoggingParameters params;
        if (!j.is_object()) {
            return params;
        }
        params.level = j.value("level", params.level);
        params.file = j.value("file", params.file);
        return params;
    }

    nlohmann::json EngineParameters::to_json() const {
        nlohmann::json j;
        j["playback"] = playback.to_json();
        j["compiler"] = compiler.to_json();
        j["logging"] = logging.to_json();
        return j;
    }

    EngineParameters EngineParameters::from_json(const nlohmann::json& j) {
        EngineParameters params;
        if (j.contains("playback")) {
            params.playback = PlaybackParameters::from_json(j["playback"]);
        }
        if (j.contains("compiler")) {
            params.compiler = CompilerParameters::from_json(j["compiler"]);
        }
        if (j.contains("logging")) {
            params.logging = LoggingParameters::from_json(j["logging"]);
        }
        return params;
    }

    std::expected<EngineParameters, std::string> load_engine_parameters(const std::filesystem::path& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                return std::unexpected("Failed to open: " + path.string());
            }

            const auto j = nlohmann::json::parse(file);
            if (!j.is_object()) {
                return std::unexpected("Invalid configuration: top level must be an object");
            }

            auto params = EngineParameters::from_json(j);
            LOG_DEBUG("Engine parameters loaded from {}", path.string());
            return params;

        } catch (const std::exception& e) {
            return std::unexpected(std::string("Load parameters failed: ") + e.what());
        }
    }

    std::expected<void, std::string> save_engine_parameters(const EngineParameters& params,
                                                            const std::filesystem::path& path) {
        try {
            std::ofstream file(path);
            if (!file.is_open()) {
                return std::unexpected("Failed to open for writing: " + path.string());
            }
            file << params.to_json().dump(4);
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Save parameters failed: ") + e.what());
        }
    }

    void apply_logging_parameters(const LoggingParameters& params) {
        Logger::get().init(logLevelFromString(params.level), params.file);
    }

} // namespace vecanim::core::param
