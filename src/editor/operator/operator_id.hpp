/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace vxa::edit::op {

    enum class BuiltinOp : uint16_t {
        DefineAxis,
        AlignToAxis,
        DisplayAxis,

        DefinePlane,
        Planarize,

        Undo,
        Redo,

        _Count
    };

    const char* to_string(BuiltinOp op);
    std::optional<BuiltinOp> builtin_op_from_string(std::string_view s);
    const char* builtin_op_label(BuiltinOp op);

} // namespace vxa::edit::op
