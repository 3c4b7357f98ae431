/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <cstdint>
#include <expected>
#include <glm/glm.hpp>
#include <span>
#include <string>
#include <vector>

namespace vxa::core {

    using VertexIndex = uint32_t;

    /**
     * @brief Vertex positions plus an ordered selection history.
     *
     * The selection history records vertices in the order they were
     * selected; re-selecting a vertex moves it to the end. All reference
     * definitions consume positions in this order.
     */
    class VXA_CORE_API EditMesh {
    public:
        EditMesh() = default;
        explicit EditMesh(std::vector<glm::vec3> positions);

        VertexIndex addVertex(const glm::vec3& position);
        [[nodiscard]] size_t vertexCount() const { return positions_.size(); }
        [[nodiscard]] const glm::vec3& position(VertexIndex index) const;
        bool setPosition(VertexIndex index, const glm::vec3& position);
        [[nodiscard]] const std::vector<glm::vec3>& positions() const { return positions_; }

        bool select(VertexIndex index);
        bool deselect(VertexIndex index);
        void clearSelection();
        void selectAll();
        [[nodiscard]] bool isSelected(VertexIndex index) const;
        [[nodiscard]] size_t selectedCount() const { return selection_.size(); }
        [[nodiscard]] const std::vector<VertexIndex>& selection() const { return selection_; }

        [[nodiscard]] std::vector<glm::vec3> selectedPositions() const;

        // Writes one position per selected vertex, in selection order.
        // Nothing is written when the sizes differ.
        std::expected<void, std::string> writeSelected(std::span<const glm::vec3> positions);

    private:
        [[nodiscard]] bool valid(VertexIndex index) const { return index < positions_.size(); }

        std::vector<glm::vec3> positions_;
        std::vector<bool> selected_mask_;
        std::vector<VertexIndex> selection_;
    };

} // namespace vxa::core
