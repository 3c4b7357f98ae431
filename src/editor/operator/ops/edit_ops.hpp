/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "operator/operator.hpp"

namespace vxa::edit::op {

    class OperatorRegistry;

    class UndoOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    class RedoOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    void registerEditOperators(OperatorRegistry& registry);
    void unregisterEditOperators(OperatorRegistry& registry);

} // namespace vxa::edit::op
