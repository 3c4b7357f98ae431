/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "operator/operator.hpp"

namespace vxa::edit::op {

    class OperatorRegistry;

    class DefinePlaneOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    class PlanarizeOperator : public Operator {
    public:
        static const OperatorDescriptor DESCRIPTOR;

        [[nodiscard]] const OperatorDescriptor& descriptor() const override { return DESCRIPTOR; }
        [[nodiscard]] bool poll(const OperatorContext& ctx) const override;
        OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) override;
    };

    void registerPlaneOperators(OperatorRegistry& registry);
    void unregisterPlaneOperators(OperatorRegistry& registry);

} // namespace vxa::edit::op
