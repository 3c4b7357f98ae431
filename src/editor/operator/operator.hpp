/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "operator_context.hpp"
#include "operator_flags.hpp"
#include "operator_id.hpp"
#include "operator_properties.hpp"
#include "operator_result.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vxa::edit::op {

    enum class OperatorSource : uint8_t { CPP,
                                          HOST };

    struct OperatorDescriptor {
        std::optional<BuiltinOp> builtin_id;
        std::string class_id;
        std::string label;
        std::string description;
        std::string icon;
        OperatorFlags flags = OperatorFlags::NONE;
        OperatorSource source = OperatorSource::CPP;

        [[nodiscard]] std::string id() const {
            if (builtin_id.has_value()) {
                return to_string(*builtin_id);
            }
            return class_id;
        }
    };

    class Operator {
    public:
        virtual ~Operator() = default;

        [[nodiscard]] virtual const OperatorDescriptor& descriptor() const = 0;
        [[nodiscard]] virtual bool poll(const OperatorContext& /*ctx*/) const { return true; }
        virtual OperatorReturnValue invoke(OperatorContext& ctx, OperatorProperties& props) = 0;
    };

    using OperatorPtr = std::unique_ptr<Operator>;
    using OperatorFactory = std::function<OperatorPtr()>;

} // namespace vxa::edit::op
