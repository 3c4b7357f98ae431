/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "operator_id.hpp"
#include <array>
#include <cassert>

namespace vxa::edit::op {

    namespace {

        struct OpInfo {
            const char* id_string;
            const char* label;
        };

        constexpr std::array<OpInfo, static_cast<size_t>(BuiltinOp::_Count)> OP_INFO = {{
            {"mesh.define_axis", "Set Axis"},
            {"mesh.align_vertices", "Align"},
            {"mesh.display_axis", "Toggle Axis Guide"},
            {"mesh.define_plane", "Set Plane"},
            {"mesh.planarize", "Planarize"},
            {"ed.undo", "Undo"},
            {"ed.redo", "Redo"},
        }};

    } // namespace

    const char* to_string(BuiltinOp op) {
        const auto idx = static_cast<size_t>(op);
        assert(idx < OP_INFO.size());
        return OP_INFO[idx].id_string;
    }

    std::optional<BuiltinOp> builtin_op_from_string(std::string_view s) {
        for (size_t i = 0; i < OP_INFO.size(); ++i) {
            if (s == OP_INFO[i].id_string) {
                return static_cast<BuiltinOp>(i);
            }
        }
        return std::nullopt;
    }

    const char* builtin_op_label(BuiltinOp op) {
        const auto idx = static_cast<size_t>(op);
        assert(idx < OP_INFO.size());
        return OP_INFO[idx].label;
    }

} // namespace vxa::edit::op
