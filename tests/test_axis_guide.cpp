/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/axis_guide.hpp"

#include <gtest/gtest.h>

#include <array>

using namespace vxa::core;

namespace {

    AxisReference make_axis() {
        const std::array<glm::vec3, 2> pts = {glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f)};
        return *define_axis(pts);
    }

} // anonymous namespace

TEST(AxisGuideTest, EmptyWhenUndefined) {
    EXPECT_TRUE(build_axis_guide(AxisReference{}, AxisGuideStyle{}).empty());
}

TEST(AxisGuideTest, ThreeSegmentsWithTails) {
    AxisGuideStyle style;
    style.extension = 0.5f;
    const auto guide = build_axis_guide(make_axis(), style);

    ASSERT_EQ(guide.vertices.size(), 6u);
    EXPECT_FLOAT_EQ(guide.vertices[0].position.x, -0.5f);
    EXPECT_FLOAT_EQ(guide.vertices[1].position.x, 0.0f);
    EXPECT_FLOAT_EQ(guide.vertices[2].position.x, 0.0f);
    EXPECT_FLOAT_EQ(guide.vertices[3].position.x, 2.0f);
    EXPECT_FLOAT_EQ(guide.vertices[4].position.x, 2.0f);
    EXPECT_FLOAT_EQ(guide.vertices[5].position.x, 2.5f);
}

TEST(AxisGuideTest, TailsFadeOut) {
    AxisGuideStyle style;
    style.color = {1.0f, 0.5f, 0.0f};
    const auto guide = build_axis_guide(make_axis(), style);

    ASSERT_EQ(guide.vertices.size(), 6u);
    EXPECT_FLOAT_EQ(guide.vertices.front().color.a, 0.0f);
    EXPECT_FLOAT_EQ(guide.vertices.back().color.a, 0.0f);
    for (size_t i = 1; i < 5; ++i) {
        EXPECT_FLOAT_EQ(guide.vertices[i].color.a, 1.0f);
        EXPECT_FLOAT_EQ(guide.vertices[i].color.g, 0.5f);
    }
}

TEST(AxisGuideTest, ExtensionClampedToMinimum) {
    AxisGuideStyle style;
    style.extension = 0.0f;
    const auto guide = build_axis_guide(make_axis(), style);

    ASSERT_EQ(guide.vertices.size(), 6u);
    EXPECT_NEAR(guide.vertices[0].position.x, -MIN_GUIDE_EXTENSION, 1e-6f);
}

TEST(AxisGuideTest, CarriesClampedLineWidth) {
    AxisGuideStyle style;
    style.line_width = 3.0f;
    EXPECT_FLOAT_EQ(build_axis_guide(make_axis(), style).line_width, 3.0f);

    style.line_width = 0.0f;
    EXPECT_FLOAT_EQ(build_axis_guide(make_axis(), style).line_width, MIN_GUIDE_LINE_WIDTH);

    const auto hidden = build_axis_guide(AxisReference{}, style);
    EXPECT_TRUE(hidden.empty());
    EXPECT_FLOAT_EQ(hidden.line_width, 0.0f);
}
