/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/axis_guide.hpp"
#include "core/edit_mesh.hpp"
#include "core/export.hpp"
#include "core/geometry.hpp"
#include "core/settings.hpp"
#include "operation/undo_history.hpp"
#include "operator/operator_registry.hpp"
#include "report.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vxa::edit {

    enum class EditMode : uint8_t {
        OBJECT,
        EDIT_MESH,
    };

    /**
     * @brief State owned by one editing session.
     *
     * Holds the mesh being edited, both reference records, the axis guide
     * toggle, settings, undo history, operator table and report log. A
     * session is single-threaded: callers must not mutate it concurrently
     * with a read.
     */
    class VXA_EDIT_API EditSession {
    public:
        explicit EditSession(core::ToolSettings settings = {});
        EditSession(const EditSession&) = delete;
        EditSession& operator=(const EditSession&) = delete;

        [[nodiscard]] core::EditMesh& mesh() { return mesh_; }
        [[nodiscard]] const core::EditMesh& mesh() const { return mesh_; }
        void setMesh(core::EditMesh mesh);

        [[nodiscard]] EditMode mode() const { return mode_; }
        void setMode(EditMode mode) { mode_ = mode; }

        [[nodiscard]] const core::AxisReference& axis() const { return axis_; }
        void setAxis(const core::AxisReference& axis) { axis_ = axis; }
        [[nodiscard]] const core::PlaneReference& plane() const { return plane_; }
        void setPlane(const core::PlaneReference& plane) { plane_ = plane; }

        [[nodiscard]] bool axisGuideVisible() const { return axis_guide_visible_; }
        void setAxisGuideVisible(bool visible) { axis_guide_visible_ = visible; }
        // Overlay vertices for the axis, empty when hidden or undefined
        [[nodiscard]] core::AxisGuide axisGuide() const;

        [[nodiscard]] const core::ToolSettings& settings() const { return settings_; }
        void setSettings(core::ToolSettings settings);

        [[nodiscard]] op::UndoHistory& undoHistory() { return undo_history_; }
        [[nodiscard]] const op::UndoHistory& undoHistory() const { return undo_history_; }
        [[nodiscard]] op::OperatorRegistry& operators() { return operators_; }
        [[nodiscard]] const op::OperatorRegistry& operators() const { return operators_; }

        void report(ReportLevel level, std::string message);
        [[nodiscard]] const std::vector<Report>& reports() const { return reports_; }
        [[nodiscard]] const Report* lastReport() const { return reports_.empty() ? nullptr : &reports_.back(); }
        void clearReports() { reports_.clear(); }

    private:
        core::EditMesh mesh_;
        EditMode mode_ = EditMode::EDIT_MESH;
        core::AxisReference axis_;
        core::PlaneReference plane_;
        bool axis_guide_visible_ = false;
        core::ToolSettings settings_;
        op::UndoHistory undo_history_;
        op::OperatorRegistry operators_{*this};
        std::vector<Report> reports_;
    };

} // namespace vxa::edit
