/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace vxa::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    [[nodiscard]] VXA_CORE_API std::optional<LogLevel> parse_log_level(std::string_view name);
    [[nodiscard]] VXA_CORE_API const char* to_string(LogLevel level);

    class VXA_CORE_API Logger {
    public:
        static Logger& get();

        void init(LogLevel level = LogLevel::Info);
        void setLevel(LogLevel level);
        [[nodiscard]] LogLevel level() const { return level_; }

        [[nodiscard]] spdlog::logger& sink() { return *logger_; }

    private:
        Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        std::shared_ptr<spdlog::logger> logger_;
        LogLevel level_ = LogLevel::Info;
    };

    // Logs the lifetime of the enclosing scope on destruction
    class VXA_CORE_API ScopedTimer {
    public:
        ScopedTimer(std::string name, LogLevel level);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string name_;
        LogLevel level_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace vxa::core

#define LOG_TRACE(...) ::vxa::core::Logger::get().sink().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::vxa::core::Logger::get().sink().debug(__VA_ARGS__)
#define LOG_INFO(...)  ::vxa::core::Logger::get().sink().info(__VA_ARGS__)
#define LOG_WARN(...)  ::vxa::core::Logger::get().sink().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::vxa::core::Logger::get().sink().error(__VA_ARGS__)

#define VXA_LOG_CONCAT_INNER(a, b) a##b
#define VXA_LOG_CONCAT(a, b)       VXA_LOG_CONCAT_INNER(a, b)
#define LOG_TIMER(name) \
    ::vxa::core::ScopedTimer VXA_LOG_CONCAT(vxa_timer_, __LINE__)(name, ::vxa::core::LogLevel::Debug)
