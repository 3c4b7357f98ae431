/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include "editor/edit_session.hpp"

#include <gtest/gtest.h>

#include <initializer_list>

namespace vxa::test {

    inline void expect_vec3_near(const glm::vec3& a, const glm::vec3& b, float tol = 1e-5f) {
        EXPECT_NEAR(a.x, b.x, tol);
        EXPECT_NEAR(a.y, b.y, tol);
        EXPECT_NEAR(a.z, b.z, tol);
    }

    class SessionTest : public ::testing::Test {
    protected:
        void SetUp() override {
            core::Logger::get().setLevel(core::LogLevel::Warn);
        }

        core::VertexIndex add(const glm::vec3& p) { return session_.mesh().addVertex(p); }

        void select(std::initializer_list<core::VertexIndex> indices) {
            session_.mesh().clearSelection();
            for (const auto idx : indices) {
                session_.mesh().select(idx);
            }
        }

        edit::op::OperatorReturnValue run(edit::op::BuiltinOp op, edit::op::OperatorProperties* props = nullptr) {
            return session_.operators().invoke(op, props);
        }

        [[nodiscard]] const glm::vec3& pos(core::VertexIndex idx) const { return session_.mesh().position(idx); }

        edit::EditSession session_;
    };

} // namespace vxa::test
