/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>

using namespace vxa::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Logger::get().level();
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        sink_->set_pattern("%l %v");
        Logger::get().sink().sinks().push_back(sink_);
    }

    void TearDown() override {
        auto& sinks = Logger::get().sink().sinks();
        std::erase(sinks, sink_);
        Logger::get().setLevel(previous_);
    }

    std::string captured() {
        Logger::get().sink().flush();
        return out_.str();
    }

    std::ostringstream out_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    LogLevel previous_ = LogLevel::Info;
};

TEST(LogLevelTest, ParsesConfigurationNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_STREQ(to_string(LogLevel::Warn), "warn");
}

TEST_F(LoggerTest, InitSelectsLevel) {
    Logger::get().init(LogLevel::Error);
    EXPECT_EQ(Logger::get().level(), LogLevel::Error);

    LOG_WARN("dropped message");
    LOG_ERROR("kept message");
    const std::string text = captured();
    EXPECT_EQ(text.find("dropped message"), std::string::npos);
    EXPECT_NE(text.find("kept message"), std::string::npos);
}

TEST_F(LoggerTest, TimerReportsOnScopeExit) {
    Logger::get().init(LogLevel::Debug);
    {
        LOG_TIMER("projection");
        EXPECT_EQ(captured().find("projection took"), std::string::npos);
    }
    EXPECT_NE(captured().find("projection took"), std::string::npos);
}

TEST_F(LoggerTest, TimerSilentAboveItsLevel) {
    Logger::get().init(LogLevel::Info);
    {
        LOG_TIMER("quiet");
    }
    EXPECT_EQ(captured().find("quiet took"), std::string::npos);
}
