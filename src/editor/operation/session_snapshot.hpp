/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/edit_mesh.hpp"
#include "core/geometry.hpp"
#include "undo_entry.hpp"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace vxa::edit {
    class EditSession;
}

namespace vxa::edit::op {

    // Before/after state of the selected vertices and both reference records
    class SessionSnapshot : public UndoEntry {
    public:
        SessionSnapshot(EditSession& session, std::string name);

        void captureBefore();
        void captureAfter();
        [[nodiscard]] bool hasChanges() const;

        [[nodiscard]] std::string name() const override { return name_; }
        void undo() override;
        void redo() override;

    private:
        struct State {
            std::vector<glm::vec3> positions;
            core::AxisReference axis;
            core::PlaneReference plane;
            bool guide_visible = false;
        };

        State capture() const;
        void restore(const State& state);

        EditSession& session_;
        std::string name_;
        std::vector<core::VertexIndex> vertices_;
        State before_;
        State after_;
    };

} // namespace vxa::edit::op
