/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "operator_context.hpp"
#include "edit_session.hpp"

#include <utility>

namespace vxa::edit::op {

    OperatorContext::OperatorContext(EditSession& session) : session_(session) {}

    core::EditMesh& OperatorContext::mesh() {
        return session_.mesh();
    }

    const core::EditMesh& OperatorContext::mesh() const {
        return session_.mesh();
    }

    bool OperatorContext::isEditMode() const {
        return session_.mode() == EditMode::EDIT_MESH;
    }

    bool OperatorContext::hasSelection() const {
        return session_.mesh().selectedCount() > 0;
    }

    std::vector<glm::vec3> OperatorContext::selectedPositions() const {
        return session_.mesh().selectedPositions();
    }

    void OperatorContext::report(const ReportLevel level, std::string message) {
        session_.report(level, std::move(message));
    }

} // namespace vxa::edit::op
