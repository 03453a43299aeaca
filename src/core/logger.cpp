/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace vecanim::core {

    namespace {
        constexpr const char* LOGGER_NAME = "vecanim";
        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
    } // namespace

    LogLevel logLevelFromString(const std::string& name, const LogLevel fallback) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace")
            return LogLevel::Trace;
        if (lower == "debug")
            return LogLevel::Debug;
        if (lower == "info")
            return LogLevel::Info;
        if (lower == "warn" || lower == "warning")
            return LogLevel::Warn;
        if (lower == "error")
            return LogLevel::Error;
        if (lower == "critical")
            return LogLevel::Critical;
        if (lower == "off")
            return LogLevel::Off;
        return fallback;
    }

    const char* logLevelToString(const LogLevel level) {
        switch (level) {
            case LogLevel::Trace:
                return "trace";
            case LogLevel::Debug:
                return "debug";
            case LogLevel::Info:
                return "info";
            case LogLevel::Warn:
                return "warn";
            case LogLevel::Error:
                return "error";
            case LogLevel::Critical:
                return "critical";
            case LogLevel::Off:
                return "off";
        }
        return "info";
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel level, const std::string& log_file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (!log_file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
            } catch (const spdlog::spdlog_ex& e) {
                // Keep console logging alive; report the file failure through it
                logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
                logger_->warn("Could not open log file '{}': {}", log_file, e.what());
            }
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger_->set_pattern(LOG_PATTERN);
        set_level(level);
    }

    void Logger::set_level(const LogLevel level) {
        level_ = level;
        logger()->set_level(toSpdlog(level));
    }

    void Logger::flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    spdlog::logger* Logger::logger() {
        if (!logger_) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
            logger_->set_pattern(LOG_PATTERN);
            logger_->set_level(toSpdlog(level_));
        }
        return logger_.get();
    }

    spdlog::level::level_enum Logger::toSpdlog(const LogLevel level) {
        switch (level) {
            case LogLevel::Trace:
                return spdlog::level::trace;
            case LogLevel::Debug:
                return spdlog::level::debug;
            case LogLevel::Info:
                return spdlog::level::info;
            case LogLevel::Warn:
                return spdlog::level::warn;
            case LogLevel::Error:
                return spdlog::level::err;
            case LogLevel::Critical:
                return spdlog::level::critical;
            case LogLevel::Off:
                return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    ScopedTimer::~ScopedTimer() {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_);
        LOG_DEBUG("{} took {:.3f} ms", name_, elapsed.count());
    }

} // namespace vecanim::core
