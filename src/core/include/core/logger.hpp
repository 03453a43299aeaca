/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace vecanim::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    [[nodiscard]] LogLevel logLevelFromString(const std::string& name, LogLevel fallback = LogLevel::Info);
    [[nodiscard]] const char* logLevelToString(LogLevel level);

    class Logger {
    public:
        static Logger& get();

        // Console sink is always present; a non-empty path adds a file sink
        void init(LogLevel level = LogLevel::Info, const std::string& log_file = "");

        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const { return level_; }

        [[nodiscard]] bool should_log(LogLevel level) const { return level >= level_ && level_ != LogLevel::Off; }

        template <typename... Args>
        void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
            if (!should_log(level)) {
                return;
            }
            logger()->log(toSpdlog(level), fmt, std::forward<Args>(args)...);
        }

        void flush();

    private:
        Logger() = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        spdlog::logger* logger();
        static spdlog::level::level_enum toSpdlog(LogLevel level);

        std::shared_ptr<spdlog::logger> logger_;
        LogLevel level_ = LogLevel::Info;
    };

    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name)
            : name_(std::move(name)),
              start_(std::chrono::steady_clock::now()) {}

        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace vecanim::core

#define VECANIM_LOG_CONCAT_INNER(a, b) a##b
#define VECANIM_LOG_CONCAT(a, b)       VECANIM_LOG_CONCAT_INNER(a, b)

#define LOG_TRACE(...)    ::vecanim::core::Logger::get().log(::vecanim::core::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    ::vecanim::core::Logger::get().log(::vecanim::core::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)     ::vecanim::core::Logger::get().log(::vecanim::core::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)     ::vecanim::core::Logger::get().log(::vecanim::core::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...)    ::vecanim::core::Logger::get().log(::vecanim::core::LogLevel::Error, __VA_ARGS__)
#define LOG_CRITICAL(...) ::vecanim::core::Logger::get().log(::vecanim::core::LogLevel::Critical, __VA_ARGS__)
#define LOG_TIMER(name)   ::vecanim::core::ScopedTimer VECANIM_LOG_CONCAT(vecanim_timer_, __LINE__)(name)
