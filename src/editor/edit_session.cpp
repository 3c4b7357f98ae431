/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "edit_session.hpp"
#include "core/logger.hpp"
#include "operator/ops/axis_ops.hpp"
#include "operator/ops/edit_ops.hpp"
#include "operator/ops/plane_ops.hpp"

#include <utility>

namespace vxa::edit {

    EditSession::EditSession(core::ToolSettings settings) {
        setSettings(std::move(settings));
        op::registerAxisOperators(operators_);
        op::registerPlaneOperators(operators_);
        op::registerEditOperators(operators_);
    }

    void EditSession::setMesh(core::EditMesh mesh) {
        mesh_ = std::move(mesh);
        undo_history_.clear();
    }

    core::AxisGuide EditSession::axisGuide() const {
        if (!axis_guide_visible_) {
            return {};
        }
        return core::build_axis_guide(axis_, settings_.guide);
    }

    void EditSession::setSettings(core::ToolSettings settings) {
        settings_ = std::move(settings);
        if (const auto level = core::parse_log_level(settings_.log_level)) {
            core::Logger::get().init(*level);
        }
    }

    void EditSession::report(const ReportLevel level, std::string message) {
        switch (level) {
        case ReportLevel::Info:
            LOG_INFO("{}", message);
            break;
        case ReportLevel::Warning:
            LOG_WARN("{}", message);
            break;
        case ReportLevel::Error:
            LOG_ERROR("{}", message);
            break;
        }
        reports_.push_back({level, std::move(message)});
    }

} // namespace vxa::edit
