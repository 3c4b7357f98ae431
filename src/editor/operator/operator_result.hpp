/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/geometry.hpp"

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace vxa::edit::op {

    enum class OperatorResult : uint8_t {
        FINISHED,  // Success - push undo if UNDO flag set
        CANCELLED, // Poll failed or the operation was refused - no undo push
    };

    struct OperatorReturnValue {
        OperatorResult status = OperatorResult::CANCELLED;
        std::optional<core::ReferenceError> error;
        std::unordered_map<std::string, std::any> data;

        static OperatorReturnValue finished() { return {OperatorResult::FINISHED, std::nullopt, {}}; }
        static OperatorReturnValue cancelled() { return {OperatorResult::CANCELLED, std::nullopt, {}}; }
        static OperatorReturnValue failed(core::ReferenceError e) { return {OperatorResult::CANCELLED, e, {}}; }

        static OperatorReturnValue finished_with(std::unordered_map<std::string, std::any> d) {
            return {OperatorResult::FINISHED, std::nullopt, std::move(d)};
        }

        [[nodiscard]] bool is_finished() const { return status == OperatorResult::FINISHED; }
        [[nodiscard]] bool is_cancelled() const { return status == OperatorResult::CANCELLED; }

        template <typename T>
        [[nodiscard]] std::optional<T> get(const std::string& key) const {
            const auto it = data.find(key);
            if (it == data.end()) {
                return std::nullopt;
            }
            if (const auto* v = std::any_cast<T>(&it->second)) {
                return *v;
            }
            return std::nullopt;
        }
    };

} // namespace vxa::edit::op
