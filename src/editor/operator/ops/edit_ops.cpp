/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "edit_ops.hpp"
#include "edit_session.hpp"
#include "operation/undo_history.hpp"
#include "operator/operator_registry.hpp"

namespace vxa::edit::op {

    const OperatorDescriptor UndoOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::Undo,
        .class_id = {},
        .label = "Undo",
        .description = "Undo the last action",
        .icon = "undo",
        .flags = OperatorFlags::REGISTER,
        .source = OperatorSource::CPP,
    };

    bool UndoOperator::poll(const OperatorContext& ctx) const {
        return ctx.session().undoHistory().canUndo();
    }

    OperatorReturnValue UndoOperator::invoke(OperatorContext& ctx, OperatorProperties& /*props*/) {
        if (!ctx.session().undoHistory().undo()) {
            return OperatorReturnValue::cancelled();
        }
        return OperatorReturnValue::finished();
    }

    const OperatorDescriptor RedoOperator::DESCRIPTOR = {
        .builtin_id = BuiltinOp::Redo,
        .class_id = {},
        .label = "Redo",
        .description = "Redo the last undone action",
        .icon = "redo",
        .flags = OperatorFlags::REGISTER,
        .source = OperatorSource::CPP,
    };

    bool RedoOperator::poll(const OperatorContext& ctx) const {
        return ctx.session().undoHistory().canRedo();
    }

    OperatorReturnValue RedoOperator::invoke(OperatorContext& ctx, OperatorProperties& /*props*/) {
        if (!ctx.session().undoHistory().redo()) {
            return OperatorReturnValue::cancelled();
        }
        return OperatorReturnValue::finished();
    }

    void registerEditOperators(OperatorRegistry& registry) {
        registry.registerOperator(BuiltinOp::Undo, UndoOperator::DESCRIPTOR,
                                  [] { return std::make_unique<UndoOperator>(); });
        registry.registerOperator(BuiltinOp::Redo, RedoOperator::DESCRIPTOR,
                                  [] { return std::make_unique<RedoOperator>(); });
    }

    void unregisterEditOperators(OperatorRegistry& registry) {
        registry.unregisterOperator(BuiltinOp::Undo);
        registry.unregisterOperator(BuiltinOp::Redo);
    }

} // namespace vxa::edit::op
