/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/edit_mesh.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace vxa::core;

class EditMeshTest : public ::testing::Test {
protected:
    void SetUp() override {
        mesh_ = EditMesh({
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f},
            {0.0f, 0.0f, 1.0f},
        });
    }

    EditMesh mesh_;
};

TEST_F(EditMeshTest, StartsWithEmptySelection) {
    EXPECT_EQ(mesh_.vertexCount(), 4u);
    EXPECT_EQ(mesh_.selectedCount(), 0u);
    EXPECT_TRUE(mesh_.selectedPositions().empty());
}

TEST_F(EditMeshTest, SelectionKeepsOrder) {
    EXPECT_TRUE(mesh_.select(2));
    EXPECT_TRUE(mesh_.select(0));
    EXPECT_TRUE(mesh_.select(3));

    const std::vector<VertexIndex> expected = {2, 0, 3};
    EXPECT_EQ(mesh_.selection(), expected);

    const auto positions = mesh_.selectedPositions();
    ASSERT_EQ(positions.size(), 3u);
    EXPECT_EQ(positions[0], glm::vec3(0.0f, 1.0f, 0.0f));
    EXPECT_EQ(positions[1], glm::vec3(0.0f, 0.0f, 0.0f));
    EXPECT_EQ(positions[2], glm::vec3(0.0f, 0.0f, 1.0f));
}

TEST_F(EditMeshTest, ReselectMovesToEnd) {
    mesh_.select(0);
    mesh_.select(1);
    mesh_.select(0);

    const std::vector<VertexIndex> expected = {1, 0};
    EXPECT_EQ(mesh_.selection(), expected);
    EXPECT_EQ(mesh_.selectedCount(), 2u);
}

TEST_F(EditMeshTest, DeselectRemovesFromHistory) {
    mesh_.select(0);
    mesh_.select(1);
    mesh_.select(2);
    EXPECT_TRUE(mesh_.deselect(1));
    EXPECT_FALSE(mesh_.deselect(1));
    EXPECT_FALSE(mesh_.isSelected(1));

    const std::vector<VertexIndex> expected = {0, 2};
    EXPECT_EQ(mesh_.selection(), expected);
}

TEST_F(EditMeshTest, OutOfRangeIsRejected) {
    EXPECT_FALSE(mesh_.select(42));
    EXPECT_FALSE(mesh_.setPosition(42, glm::vec3(1.0f)));
    EXPECT_FALSE(mesh_.isSelected(42));
    EXPECT_THROW((void)mesh_.position(42), std::out_of_range);
}

TEST_F(EditMeshTest, SelectAllAppendsUnselected) {
    mesh_.select(3);
    mesh_.selectAll();

    const std::vector<VertexIndex> expected = {3, 0, 1, 2};
    EXPECT_EQ(mesh_.selection(), expected);

    mesh_.clearSelection();
    EXPECT_EQ(mesh_.selectedCount(), 0u);
    EXPECT_FALSE(mesh_.isSelected(3));
}

TEST_F(EditMeshTest, WriteSelectedFollowsSelectionOrder) {
    mesh_.select(3);
    mesh_.select(1);

    const std::vector<glm::vec3> updated = {glm::vec3(9.0f), glm::vec3(7.0f)};
    const auto written = mesh_.writeSelected(updated);
    ASSERT_TRUE(written.has_value());

    EXPECT_EQ(mesh_.position(3), glm::vec3(9.0f));
    EXPECT_EQ(mesh_.position(1), glm::vec3(7.0f));
    EXPECT_EQ(mesh_.position(0), glm::vec3(0.0f));
}

TEST_F(EditMeshTest, WriteSelectedRejectsSizeMismatch) {
    mesh_.select(0);
    mesh_.select(1);

    const std::vector<glm::vec3> updated = {glm::vec3(5.0f)};
    const auto written = mesh_.writeSelected(updated);
    ASSERT_FALSE(written.has_value());
    EXPECT_FALSE(written.error().empty());
    EXPECT_EQ(mesh_.position(0), glm::vec3(0.0f));
}

TEST_F(EditMeshTest, AddVertexReturnsIndex) {
    const auto idx = mesh_.addVertex({3.0f, 3.0f, 3.0f});
    EXPECT_EQ(idx, 4u);
    EXPECT_EQ(mesh_.vertexCount(), 5u);
    EXPECT_TRUE(mesh_.select(idx));
}
