/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "axis_ops.hpp"
#include "core/geometry.hpp"
#include "core/logger.hpp"
#include "edit_session.hpp"
#include "format_utils.hpp"
#include "operator/operator_registry.hpp"

namespace vxa::edit::op {

    namespace {

        OperatorReturnValue refuse(OperatorContext& ctx, const core::ReferenceError error, const char* fallback) {
            const char* message = error == core::ReferenceError::InsufficientSelection ? fallback
                                                                                       : core::describe(error);
            ctx.report(ReportLevel::Error, message);
            return OperatorReturnValue::failed(error);
        }

    } // namespace

    const OperatorDescriptor DefineAxisOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::DefineAxis,
        .class_id = {},
        .label = "Set Axis",
        .description = "Define Axis using Selected 2 Vertices",
        .icon = "empty_axis",
        .flags = OperatorFlags::REGISTER | OperatorFlags::UNDO,
        .source = OperatorSource::CPP,
    };

    bool DefineAxisOperator::poll(const OperatorContext& ctx) const {
        return ctx.isEditMode();
    }

    OperatorReturnValue DefineAxisOperator::invoke(OperatorContext& ctx, OperatorProperties& /*props*/) {
        const auto points = ctx.selectedPositions();
        auto axis = core::define_axis(points, ctx.session().settings().epsilon);
        if (!axis) {
            LOG_WARN("define_axis refused: {}", core::to_string(axis.error()));
            return refuse(ctx, axis.error(), "Select exactly two vertices to define the axis.");
        }

        ctx.session().setAxis(*axis);
        ctx.session().setAxisGuideVisible(true);
        ctx.report(ReportLevel::Info, "Axis Defined Successfully : " + format_vec3(axis->axis));
        return OperatorReturnValue::finished_with({{"axis", axis->axis}});
    }

    const OperatorDescriptor AlignToAxisOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::AlignToAxis,
        .class_id = {},
        .label = "Align",
        .description = "Align Selected Vertices to the Defined Axis",
        .icon = "snap_midpoint",
        .flags = OperatorFlags::REGISTER | OperatorFlags::UNDO,
        .source = OperatorSource::CPP,
    };

    bool AlignToAxisOperator::poll(const OperatorContext& ctx) const {
        return ctx.isEditMode() && ctx.session().axis().defined;
    }

    OperatorReturnValue AlignToAxisOperator::invoke(OperatorContext& ctx, OperatorProperties& /*props*/) {
        LOG_TIMER("align_to_axis");
        const auto points = ctx.selectedPositions();
        auto projected = core::align_to_axis(ctx.session().axis(), points);
        if (!projected) {
            LOG_WARN("align_to_axis refused: {}", core::to_string(projected.error()));
            return refuse(ctx, projected.error(), "Select at least one vertex to align.");
        }

        if (auto written = ctx.mesh().writeSelected(*projected); !written) {
            LOG_ERROR("Failed to write aligned vertices: {}", written.error());
            return OperatorReturnValue::cancelled();
        }

        LOG_DEBUG("Aligned {} vertices", projected->size());
        ctx.report(ReportLevel::Info, "Vertices Aligned Successfully.");
        return OperatorReturnValue::finished_with({{"count", projected->size()}});
    }

    const OperatorDescriptor DisplayAxisOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::DisplayAxis,
        .class_id = {},
        .label = "Toggle Axis Guide",
        .description = "Show or hide the overlay line of the defined axis",
        .icon = "hide_off",
        .flags = OperatorFlags::REGISTER,
        .source = OperatorSource::CPP,
    };

    bool DisplayAxisOperator::poll(const OperatorContext& ctx) const {
        return ctx.isEditMode() && ctx.session().axis().defined;
    }

    OperatorReturnValue DisplayAxisOperator::invoke(OperatorContext& ctx, OperatorProperties& props) {
        auto& session = ctx.session();
        const bool visible = props.get_or<bool>("visible", !session.axisGuideVisible());
        session.setAxisGuideVisible(visible);
        LOG_DEBUG("Axis guide {}", visible ? "shown" : "hidden");
        return OperatorReturnValue::finished_with({{"visible", visible}});
    }

    void registerAxisOperators(OperatorRegistry& registry) {
        registry.registerOperator(BuiltinOp::DefineAxis, DefineAxisOperator::DESCRIPTOR,
                                  [] { return std::make_unique<DefineAxisOperator>(); });
        registry.registerOperator(BuiltinOp::AlignToAxis, AlignToAxisOperator::DESCRIPTOR,
                                  [] { return std::make_unique<AlignToAxisOperator>(); });
        registry.registerOperator(BuiltinOp::DisplayAxis, DisplayAxisOperator::DESCRIPTOR,
                                  [] { return std::make_unique<DisplayAxisOperator>(); });
    }

    void unregisterAxisOperators(OperatorRegistry& registry) {
        registry.unregisterOperator(BuiltinOp::DefineAxis);
        registry.unregisterOperator(BuiltinOp::AlignToAxis);
        registry.unregisterOperator(BuiltinOp::DisplayAxis);
    }

} // namespace vxa::edit::op
