/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "operator/operator.hpp"

namespace vxa::edit::op {

    class OperatorRegistry;

    // Captures the first two selected vertices as the reference axis
    class DefineAxisOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    // Projects the selected vertices onto the reference axis
    class AlignToAxisOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    // Shows or hides the axis guide; optional bool property "visible"
    class DisplayAxisOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    void registerAxisOperators(OperatorRegistry& registry);
    void unregisterAxisOperators(OperatorRegistry& registry);

} // namespace vxa::edit::op
