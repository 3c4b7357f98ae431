/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include "operator.hpp"
#include "operator_id.hpp"
#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace vxa::edit::op {

    // Host-defined operator expressed as callbacks instead of an Operator subclass
    struct CallbackOperator {
        std::function<bool(const OperatorContext&)> poll;
        std::function<OperatorReturnValue(OperatorContext&, OperatorProperties&)> invoke;
    };

    /**
     * @brief Per-session table of operators.
     *
     * Invocation runs poll first and cancels without side effects when it
     * fails. Operators flagged UNDO get a SessionSnapshot pushed onto the
     * session's undo history when they finish and changed something.
     */
    class VXA_EDIT_API OperatorRegistry {
    public:
        explicit OperatorRegistry(EditSession& session);
        OperatorRegistry(const OperatorRegistry&) = delete;
        OperatorRegistry& operator=(const OperatorRegistry&) = delete;

        void registerOperator(BuiltinOp op, OperatorDescriptor desc, OperatorFactory factory);
        void registerCallbackOperator(OperatorDescriptor desc, CallbackOperator callbacks);
        void unregisterOperator(BuiltinOp op);
        void unregisterOperator(const std::string& class_id);

        [[nodiscard]] std::vector<const OperatorDescriptor*> getAllOperators() const;
        [[nodiscard]] const OperatorDescriptor* getDescriptor(BuiltinOp op) const;
        [[nodiscard]] const OperatorDescriptor* getDescriptor(const std::string& class_id) const;
        [[nodiscard]] bool poll(BuiltinOp op) const;
        [[nodiscard]] bool poll(const std::string& class_id) const;

        OperatorReturnValue invoke(BuiltinOp op, OperatorProperties* props = nullptr);
        OperatorReturnValue invoke(const std::string& class_id, OperatorProperties* props = nullptr);

        void clear();

    private:
        struct RegisteredOperator {
            OperatorDescriptor descriptor;
            OperatorFactory factory;

            std::function<bool(const OperatorContext&)> poll_fn;
            std::function<OperatorReturnValue(OperatorContext&, OperatorProperties&)> invoke_fn;

            bool is_registered = false;
        };

        [[nodiscard]] bool pollImpl(const RegisteredOperator& reg) const;
        OperatorReturnValue invokeImpl(RegisteredOperator& reg, const std::string& id,
                                       OperatorProperties* props);

        EditSession& session_;
        std::array<RegisteredOperator, static_cast<size_t>(BuiltinOp::_Count)> builtins_{};
        std::unordered_map<std::string, RegisteredOperator> host_operators_;
    };

} // namespace vxa::edit::op
