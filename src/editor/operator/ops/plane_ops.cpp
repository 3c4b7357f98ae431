/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "plane_ops.hpp"
#include "core/geometry.hpp"
#include "core/logger.hpp"
#include "edit_session.hpp"
#include "format_utils.hpp"
#include "operator/operator_registry.hpp"

#include <format>

namespace vxa::edit::op {

    const OperatorDescriptor DefinePlaneOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::DefinePlane,
        .class_id = {},
        .label = "Set Plane",
        .description = "Define Plane using Selected 3 Vertices",
        .icon = "axis_top",
        .flags = OperatorFlags::REGISTER | OperatorFlags::UNDO,
        .source = OperatorSource::CPP,
    };

    bool DefinePlaneOperator::poll(const OperatorContext& ctx) const {
        return ctx.isEditMode();
    }

    OperatorReturnValue DefinePlaneOperator::invoke(OperatorContext& ctx, OperatorProperties& /*props*/) {
        const auto points = ctx.selectedPositions();
        auto plane = core::define_plane(points, ctx.session().settings().epsilon);
        if (!plane) {
            LOG_WARN("define_plane refused: {} ({} selected)", core::to_string(plane.error()), points.size());
            if (plane.error() == core::ReferenceError::InsufficientSelection) {
                ctx.report(ReportLevel::Error, "You must define a plane first by selecting 3 vertices.");
            } else {
                ctx.report(ReportLevel::Error, core::describe(plane.error()));
            }
            return OperatorReturnValue::failed(plane.error());
        }

        ctx.session().setPlane(*plane);
        ctx.report(ReportLevel::Info, "Plane Defined Successfully : " + format_vec3(plane->normal));
        return OperatorReturnValue::finished_with({{"normal", plane->normal}});
    }

    const OperatorDescriptor PlanarizeOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::Planarize,
        .class_id = {},
        .label = "Planarize",
        .description = "Planarize Selected Vertices to the Defined Plane",
        .icon = "snap_face_center",
        .flags = OperatorFlags::REGISTER | OperatorFlags::UNDO,
        .source = OperatorSource::CPP,
    };

    bool PlanarizeOperator::poll(const OperatorContext& ctx) const {
        return ctx.isEditMode() && ctx.session().plane().defined;
    }

    OperatorReturnValue PlanarizeOperator::invoke(OperatorContext& ctx, OperatorProperties& /*props*/) {
        LOG_TIMER("planarize");
        const auto points = ctx.selectedPositions();
        auto projected = core::planarize(ctx.session().plane(), points);
        if (!projected) {
            LOG_WARN("planarize refused: {}", core::to_string(projected.error()));
            ctx.report(ReportLevel::Error, core::describe(projected.error()));
            return OperatorReturnValue::failed(projected.error());
        }

        if (auto written = ctx.mesh().writeSelected(*projected); !written) {
            LOG_ERROR("Failed to write planarized vertices: {}", written.error());
            return OperatorReturnValue::cancelled();
        }

        ctx.report(ReportLevel::Info,
                   std::format("Applied planarize (flattening) to {} selected vertices.", projected->size()));
        return OperatorReturnValue::finished_with({{"count", projected->size()}});
    }

    void registerPlaneOperators(OperatorRegistry& registry) {
        registry.registerOperator(BuiltinOp::DefinePlane, DefinePlaneOperator::DESCRIPTOR,
                                  [] { return std::make_unique<DefinePlaneOperator>(); });
        registry.registerOperator(BuiltinOp::Planarize, PlanarizeOperator::DESCRIPTOR,
                                  [] { return std::make_unique<PlanarizeOperator>(); });
    }

    void unregisterPlaneOperators(OperatorRegistry& registry) {
        registry.unregisterOperator(BuiltinOp::DefinePlane);
        registry.unregisterOperator(BuiltinOp::Planarize);
    }

} // namespace vxa::edit::op
