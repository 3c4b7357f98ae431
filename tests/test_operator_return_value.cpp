/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "editor/operator/operator_result.hpp"

#include <string>

namespace vxa::edit::op {

    class OperatorReturnValueTest : public ::testing::Test {};

    TEST_F(OperatorReturnValueTest, DefaultConstructor) {
        OperatorReturnValue rv;
        EXPECT_EQ(rv.status, OperatorResult::CANCELLED);
        EXPECT_FALSE(rv.error.has_value());
        EXPECT_TRUE(rv.data.empty());
    }

    TEST_F(OperatorReturnValueTest, FinishedFactory) {
        auto rv = OperatorReturnValue::finished();
        EXPECT_EQ(rv.status, OperatorResult::FINISHED);
        EXPECT_TRUE(rv.is_finished());
        EXPECT_FALSE(rv.is_cancelled());
        EXPECT_FALSE(rv.error.has_value());
    }

    TEST_F(OperatorReturnValueTest, CancelledFactory) {
        auto rv = OperatorReturnValue::cancelled();
        EXPECT_TRUE(rv.is_cancelled());
        EXPECT_FALSE(rv.is_finished());
        EXPECT_FALSE(rv.error.has_value());
    }

    TEST_F(OperatorReturnValueTest, FailedCarriesError) {
        auto rv = OperatorReturnValue::failed(core::ReferenceError::DegenerateAxis);
        EXPECT_TRUE(rv.is_cancelled());
        ASSERT_TRUE(rv.error.has_value());
        EXPECT_EQ(*rv.error, core::ReferenceError::DegenerateAxis);
    }

    TEST_F(OperatorReturnValueTest, FinishedWithData) {
        std::unordered_map<std::string, std::any> data;
        data["count"] = size_t{42};
        data["axis"] = glm::vec3(1.0f, 0.0f, 0.0f);

        auto rv = OperatorReturnValue::finished_with(std::move(data));

        EXPECT_TRUE(rv.is_finished());
        EXPECT_EQ(rv.data.size(), 2u);
        EXPECT_EQ(rv.get<size_t>("count"), size_t{42});
        EXPECT_EQ(rv.get<glm::vec3>("axis"), glm::vec3(1.0f, 0.0f, 0.0f));
    }

    TEST_F(OperatorReturnValueTest, GetWithWrongTypeOrKey) {
        auto rv = OperatorReturnValue::finished_with({{"visible", true}});

        EXPECT_EQ(rv.get<bool>("visible"), true);
        EXPECT_FALSE(rv.get<int>("visible").has_value());
        EXPECT_FALSE(rv.get<bool>("missing").has_value());
    }

} // namespace vxa::edit::op
