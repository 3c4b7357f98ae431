/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <array>
#include <utility>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vxa::core {

    namespace {

        struct LevelInfo {
            const char* name;
            spdlog::level::level_enum spd;
        };

        constexpr std::array<LevelInfo, 6> LEVELS = {{
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"off", spdlog::level::off},
        }};

        spdlog::level::level_enum to_spdlog(LogLevel level) {
            return LEVELS[static_cast<size_t>(level)].spd;
        }

    } // namespace

    std::optional<LogLevel> parse_log_level(std::string_view name) {
        for (size_t i = 0; i < LEVELS.size(); ++i) {
            if (name == LEVELS[i].name) {
                return static_cast<LogLevel>(i);
            }
        }
        if (name == "warning") {
            return LogLevel::Warn;
        }
        return std::nullopt;
    }

    const char* to_string(LogLevel level) {
        return LEVELS[static_cast<size_t>(level)].name;
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() {
        logger_ = spdlog::get("vxa");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("vxa");
        }
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        logger_->set_level(to_spdlog(level_));
    }

    void Logger::init(LogLevel level) {
        setLevel(level);
        LOG_DEBUG("Logger initialized at level '{}'", to_string(level));
    }

    void Logger::setLevel(LogLevel level) {
        level_ = level;
        logger_->set_level(to_spdlog(level));
    }

    ScopedTimer::ScopedTimer(std::string name, LogLevel level)
        : name_(std::move(name)),
          level_(level),
          start_(std::chrono::steady_clock::now()) {}

    ScopedTimer::~ScopedTimer() {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_);
        Logger::get().sink().log(to_spdlog(level_), "{} took {:.3f} ms", name_, elapsed.count());
    }

} // namespace vxa::core
