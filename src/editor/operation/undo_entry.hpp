/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <memory>
#include <string>

namespace vxa::edit::op {

    class UndoEntry {
    public:
        virtual ~UndoEntry() = default;

        [[nodiscard]] virtual std::string name() const = 0;
        virtual void undo() = 0;
        virtual void redo() = 0;
    };

    using UndoEntryPtr = std::unique_ptr<UndoEntry>;

} // namespace vxa::edit::op
