/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "undo_history.hpp"
#include "core/logger.hpp"

#include <utility>

namespace vxa::edit::op {

    namespace {

        std::string topName(const std::deque<UndoEntryPtr>& stack) {
            return stack.empty() ? std::string{} : stack.back()->name();
        }

    } // namespace

    void UndoHistory::push(UndoEntryPtr entry) {
        if (!entry) {
            LOG_WARN("Ignoring empty undo entry");
            return;
        }

        LOG_DEBUG("Recorded '{}' ({} undoable)", entry->name(), undo_stack_.size() + 1);
        undo_stack_.push_back(std::move(entry));
        redo_stack_.clear();

        if (undo_stack_.size() > MAX_ENTRIES) {
            LOG_DEBUG("Undo history full, dropping '{}'", undo_stack_.front()->name());
            undo_stack_.pop_front();
        }
    }

    bool UndoHistory::undo() {
        return step(undo_stack_, redo_stack_, false);
    }

    bool UndoHistory::redo() {
        return step(redo_stack_, undo_stack_, true);
    }

    // Pops the newest entry of `from`, applies it and parks it on `to`
    bool UndoHistory::step(std::deque<UndoEntryPtr>& from, std::deque<UndoEntryPtr>& to, const bool forward) {
        if (from.empty()) {
            return false;
        }

        UndoEntryPtr entry = std::move(from.back());
        from.pop_back();

        LOG_DEBUG("{} '{}'", forward ? "Redo" : "Undo", entry->name());
        if (forward) {
            entry->redo();
        } else {
            entry->undo();
        }
        to.push_back(std::move(entry));
        return true;
    }

    void UndoHistory::clear() {
        undo_stack_.clear();
        redo_stack_.clear();
    }

    std::string UndoHistory::undoName() const { return topName(undo_stack_); }
    std::string UndoHistory::redoName() const { return topName(redo_stack_); }

} // namespace vxa::edit::op
