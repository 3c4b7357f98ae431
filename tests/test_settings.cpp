/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "core/settings.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using namespace vxa::core;
using json = nlohmann::json;

namespace fs = std::filesystem;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("vxa_settings_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(SettingsTest, DefaultsFromEmptyObject) {
    const auto settings = settings_from_json(json::object());
    ASSERT_TRUE(settings.has_value());
    EXPECT_FLOAT_EQ(settings->epsilon, DEFAULT_EPSILON);
    EXPECT_EQ(settings->log_level, "info");
    EXPECT_FLOAT_EQ(settings->guide.line_width, 1.0f);
    EXPECT_FLOAT_EQ(settings->guide.extension, 0.1f);
    EXPECT_EQ(settings->guide.color, glm::vec3(1.0f));
}

TEST_F(SettingsTest, ParsesAllFields) {
    const json j = {
        {"epsilon", 0.001},
        {"log_level", "debug"},
        {"axis_guide", {{"color", {0.2, 0.4, 0.6}}, {"line_width", 2.5}, {"extension", 1.5}}},
    };
    const auto settings = settings_from_json(j);
    ASSERT_TRUE(settings.has_value());
    EXPECT_FLOAT_EQ(settings->epsilon, 0.001f);
    EXPECT_EQ(settings->log_level, "debug");
    EXPECT_FLOAT_EQ(settings->guide.color.g, 0.4f);
    EXPECT_FLOAT_EQ(settings->guide.line_width, 2.5f);
    EXPECT_FLOAT_EQ(settings->guide.extension, 1.5f);
}

TEST_F(SettingsTest, ClampsGuideMinimums) {
    const json j = {{"axis_guide", {{"line_width", 0.0}, {"extension", -3.0}}}};
    const auto settings = settings_from_json(j);
    ASSERT_TRUE(settings.has_value());
    EXPECT_FLOAT_EQ(settings->guide.line_width, MIN_GUIDE_LINE_WIDTH);
    EXPECT_FLOAT_EQ(settings->guide.extension, MIN_GUIDE_EXTENSION);
}

TEST_F(SettingsTest, RejectsNonPositiveEpsilon) {
    EXPECT_FALSE(settings_from_json(json{{"epsilon", 0.0}}).has_value());
    EXPECT_FALSE(settings_from_json(json{{"epsilon", -1.0}}).has_value());
}

TEST_F(SettingsTest, RejectsUnknownLogLevel) {
    const auto settings = settings_from_json(json{{"log_level", "loud"}});
    ASSERT_FALSE(settings.has_value());
    EXPECT_NE(settings.error().find("loud"), std::string::npos);
}

TEST_F(SettingsTest, RejectsWrongTypes) {
    EXPECT_FALSE(settings_from_json(json{{"epsilon", "small"}}).has_value());
    EXPECT_FALSE(settings_from_json(json{{"axis_guide", {{"color", {1.0, 2.0}}}}}).has_value());
    EXPECT_FALSE(settings_from_json(json::array()).has_value());
}

TEST_F(SettingsTest, RejectsNonObjectGuide) {
    for (const json& guide : {json(5), json("red"), json::array({1, 2, 3})}) {
        const auto settings = settings_from_json({{"axis_guide", guide}});
        ASSERT_FALSE(settings.has_value()) << guide.dump();
        EXPECT_NE(settings.error().find("axis_guide"), std::string::npos);
    }
}

TEST_F(SettingsTest, SaveThenLoad) {
    ToolSettings original;
    original.epsilon = 1e-4f;
    original.log_level = "warn";
    original.guide.color = {0.0f, 1.0f, 0.0f};
    original.guide.line_width = 3.0f;

    const auto path = dir_ / "vertex_aligner.json";
    ASSERT_TRUE(save_settings(path, original).has_value());

    const auto loaded = load_settings(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_FLOAT_EQ(loaded->epsilon, original.epsilon);
    EXPECT_EQ(loaded->log_level, original.log_level);
    EXPECT_EQ(loaded->guide.color, original.guide.color);
    EXPECT_FLOAT_EQ(loaded->guide.line_width, original.guide.line_width);
}

TEST_F(SettingsTest, LoadMissingFileFails) {
    const auto loaded = load_settings(dir_ / "missing.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("missing.json"), std::string::npos);
}

TEST_F(SettingsTest, LoadMalformedFileFails) {
    const auto path = dir_ / "broken.json";
    {
        std::ofstream out(path);
        out << "{ \"epsilon\": ";
    }
    const auto loaded = load_settings(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("parse"), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
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
