/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "core/parameters.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace vecanim::core;
using namespace vecanim::core::param;

namespace fs = std::filesystem;

class EngineParametersTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("vecanim_params_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& content) const {
        const fs::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

// ============================================================================
// JSON mapping
// ============================================================================

TEST_F(EngineParametersTest, Defaults) {
    const EngineParameters params;
    EXPECT_EQ(params.playback.quality, "editing");
    EXPECT_TRUE(params.compiler.optimize);
    EXPECT_EQ(params.compiler.precision, DEFAULT_COMPILE_PRECISION);
    EXPECT_EQ(params.logging.level, "info");
    EXPECT_TRUE(params.logging.file.empty());
}

TEST_F(EngineParametersTest, PartialSectionsKeepDefaults) {
    const auto j = nlohmann::json::parse(R"({"compiler": {"precision": 2}, "playback": {"quality": "export"}})");
    const auto params = EngineParameters::from_json(j);

    EXPECT_EQ(params.playback.quality, "export");
    EXPECT_TRUE(params.compiler.optimize);
    EXPECT_EQ(params.compiler.precision, 2);
    EXPECT_EQ(params.logging.level, "info");
}

TEST_F(EngineParametersTest, UnknownQualityFallsBack) {
    const auto params = PlaybackParameters::from_json(nlohmann::json{{"quality", "cinematic"}});
    EXPECT_EQ(params.quality, "editing");
}

TEST_F(EngineParametersTest, PrecisionIsClamped) {
    EXPECT_EQ(CompilerParameters::from_json(nlohmann::json{{"precision", 40}}).precision, MAX_COMPILE_PRECISION);
    EXPECT_EQ(CompilerParameters::from_json(nlohmann::json{{"precision", -3}}).precision, 0);
}

TEST_F(EngineParametersTest, ToJsonWritesAllSections) {
    EngineParameters params;
    params.compiler.optimize = false;
    params.logging.file = "engine.log";

    const auto j = params.to_json();
    EXPECT_EQ(j["playback"]["quality"], "editing");
    EXPECT_EQ(j["compiler"]["optimize"], false);
    EXPECT_EQ(j["compiler"]["precision"], DEFAULT_COMPILE_PRECISION);
    EXPECT_EQ(j["logging"]["file"], "engine.log");
}

// ============================================================================
// File I/O
// ============================================================================

TEST_F(EngineParametersTest, LoadFromFile) {
    const auto path = writeFile("engine.json", R"({
        "playback": {"quality": "preview"},
        "compiler": {"optimize": false, "precision": 6},
        "logging": {"level": "debug"}
    })");

    const auto result = load_engine_parameters(path);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->playback.quality, "preview");
    EXPECT_FALSE(result->compiler.optimize);
    EXPECT_EQ(result->compiler.precision, 6);
    EXPECT_EQ(result->logging.level, "debug");
}

TEST_F(EngineParametersTest, MissingFileIsAnError) {
    const auto result = load_engine_parameters(dir_ / "absent.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Failed to open"), std::string::npos);
}

TEST_F(EngineParametersTest, MalformedJsonIsAnError) {
    const auto result = load_engine_parameters(writeFile("broken.json", "{ \"playback\": "));
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Load parameters failed"), std::string::npos);
}

TEST_F(EngineParametersTest, TopLevelMustBeObject) {
    const auto result = load_engine_parameters(writeFile("array.json", "[1, 2, 3]"));
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("top level must be an object"), std::string::npos);
}

TEST_F(EngineParametersTest, SaveThenLoad) {
    EngineParameters params;
    params.playback.quality = "export";
    params.compiler.precision = 3;
    params.logging.level = "warn";

    const fs::path path = dir_ / "saved.json";
    const auto saved = save_engine_parameters(params, path);
    ASSERT_TRUE(saved.has_value()) << saved.error();

    const auto loaded = load_engine_parameters(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->playback.quality, "export");
    EXPECT_EQ(loaded->compiler.precision, 3);
    EXPECT_EQ(loaded->logging.level, "warn");
}

// ============================================================================
// Logging levels
// ============================================================================

TEST_F(EngineParametersTest, LogLevelNames) {
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(logLevelFromString("chatty"), LogLevel::Info);
    EXPECT_EQ(logLevelFromString("chatty", LogLevel::Error), LogLevel::Error);
}

TEST_F(EngineParametersTest, ApplyLoggingSetsLevel) {
    apply_logging_parameters(LoggingParameters{"error", ""});
    EXPECT_EQ(Logger::get().level(), LogLevel::Error);
    apply_logging_parameters(LoggingParameters{});
    EXPECT_EQ(Logger::get().level(), LogLevel::Info);
}
