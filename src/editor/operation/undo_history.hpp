/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include "undo_entry.hpp"
#include <deque>
#include <string>

namespace vxa::edit::op {

    class VXA_EDIT_API UndoHistory {
    public:
        static constexpr size_t MAX_ENTRIES = 100;

        UndoHistory() = default;
        UndoHistory(const UndoHistory&) = delete;
        UndoHistory& operator=(const UndoHistory&) = delete;

        void push(UndoEntryPtr entry);
        // False when there was nothing to step
        bool undo();
        bool redo();
        void clear();

        [[nodiscard]] bool canUndo() const { return !undo_stack_.empty(); }
        [[nodiscard]] bool canRedo() const { return !redo_stack_.empty(); }
        [[nodiscard]] std::string undoName() const;
        [[nodiscard]] std::string redoName() const;
        [[nodiscard]] size_t undoCount() const { return undo_stack_.size(); }
        [[nodiscard]] size_t redoCount() const { return redo_stack_.size(); }

    private:
        static bool step(std::deque<UndoEntryPtr>& from, std::deque<UndoEntryPtr>& to, bool forward);

        std::deque<UndoEntryPtr> undo_stack_;
        std::deque<UndoEntryPtr> redo_stack_;
    };

} // namespace vxa::edit::op
