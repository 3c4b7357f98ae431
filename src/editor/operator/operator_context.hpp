/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "report.hpp"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace vxa::core {
    class EditMesh;
}

namespace vxa::edit {
    class EditSession;
}

namespace vxa::edit::op {

    class OperatorContext {
    public:
        explicit OperatorContext(EditSession& session);

        [[nodiscard]] EditSession& session() { return session_; }
        [[nodiscard]] const EditSession& session() const { return session_; }
        [[nodiscard]] core::EditMesh& mesh();
        [[nodiscard]] const core::EditMesh& mesh() const;

        [[nodiscard]] bool isEditMode() const;
        [[nodiscard]] bool hasSelection() const;
        [[nodiscard]] std::vector<glm::vec3> selectedPositions() const;

        void report(ReportLevel level, std::string message);

    private:
        EditSession& session_;
    };

} // namespace vxa::edit::op
