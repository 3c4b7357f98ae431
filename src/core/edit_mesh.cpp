/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/edit_mesh.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace vxa::core {

    EditMesh::EditMesh(std::vector<glm::vec3> positions)
        : positions_(std::move(positions)),
          selected_mask_(positions_.size(), false) {}

    VertexIndex EditMesh::addVertex(const glm::vec3& position) {
        positions_.push_back(position);
        selected_mask_.push_back(false);
        return static_cast<VertexIndex>(positions_.size() - 1);
    }

    const glm::vec3& EditMesh::position(const VertexIndex index) const {
        if (!valid(index)) {
            throw std::out_of_range(std::format("vertex index {} out of range ({})", index, positions_.size()));
        }
        return positions_[index];
    }

    bool EditMesh::setPosition(const VertexIndex index, const glm::vec3& position) {
        if (!valid(index)) {
            LOG_WARN("setPosition: vertex index {} out of range", index);
            return false;
        }
        positions_[index] = position;
        return true;
    }

    bool EditMesh::select(const VertexIndex index) {
        if (!valid(index)) {
            LOG_WARN("select: vertex index {} out of range", index);
            return false;
        }
        if (selected_mask_[index]) {
            std::erase(selection_, index);
        }
        selected_mask_[index] = true;
        selection_.push_back(index);
        return true;
    }

    bool EditMesh::deselect(const VertexIndex index) {
        if (!valid(index) || !selected_mask_[index]) {
            return false;
        }
        selected_mask_[index] = false;
        std::erase(selection_, index);
        return true;
    }

    void EditMesh::clearSelection() {
        selection_.clear();
        std::fill(selected_mask_.begin(), selected_mask_.end(), false);
    }

    void EditMesh::selectAll() {
        for (VertexIndex i = 0; i < positions_.size(); ++i) {
            if (!selected_mask_[i]) {
                selected_mask_[i] = true;
                selection_.push_back(i);
            }
        }
    }

    bool EditMesh::isSelected(const VertexIndex index) const {
        return valid(index) && selected_mask_[index];
    }

    std::vector<glm::vec3> EditMesh::selectedPositions() const {
        std::vector<glm::vec3> result;
        result.reserve(selection_.size());
        for (const auto idx : selection_) {
            result.push_back(positions_[idx]);
        }
        return result;
    }

    std::expected<void, std::string> EditMesh::writeSelected(std::span<const glm::vec3> positions) {
        if (positions.size() != selection_.size()) {
            return std::unexpected(std::format("expected {} positions for the selection, got {}",
                                               selection_.size(), positions.size()));
        }
        for (size_t i = 0; i < selection_.size(); ++i) {
            positions_[selection_[i]] = positions[i];
        }
        return {};
    }

} // namespace vxa::core
