/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "operator_registry.hpp"
#include "core/logger.hpp"
#include "edit_session.hpp"
#include "operation/session_snapshot.hpp"
#include <cassert>
#include <utility>

namespace vxa::edit::op {

OperatorRegistry::OperatorRegistry(EditSession& session) : session_(session) {}

void OperatorRegistry::registerOperator(BuiltinOp op, OperatorDescriptor desc, OperatorFactory factory) {
    const auto idx = static_cast<size_t>(op);
    assert(idx < builtins_.size());

    desc.builtin_id = op;
    desc.source = OperatorSource::CPP;

    RegisteredOperator reg;
    reg.descriptor = std::move(desc);
    reg.factory = std::move(factory);
    reg.is_registered = true;
    LOG_DEBUG("Registered operator {} [{}]", to_string(op), describeFlags(reg.descriptor.flags));
    builtins_[idx] = std::move(reg);
}

void OperatorRegistry::registerCallbackOperator(OperatorDescriptor desc, CallbackOperator callbacks) {
    const std::string class_id = desc.class_id;
    if (class_id.empty() || builtin_op_from_string(class_id).has_value()) {
        LOG_ERROR("Cannot register host operator with id '{}'", class_id);
        return;
    }

    desc.builtin_id.reset();
    desc.source = OperatorSource::HOST;

    RegisteredOperator reg;
    reg.descriptor = std::move(desc);
    reg.poll_fn = std::move(callbacks.poll);
    reg.invoke_fn = std::move(callbacks.invoke);
    reg.is_registered = true;
    LOG_DEBUG("Registered host operator {} [{}]", class_id, describeFlags(reg.descriptor.flags));
    host_operators_[class_id] = std::move(reg);
}

void OperatorRegistry::unregisterOperator(BuiltinOp op) {
    const auto idx = static_cast<size_t>(op);
    assert(idx < builtins_.size());
    builtins_[idx] = RegisteredOperator{};
}

void OperatorRegistry::unregisterOperator(const std::string& class_id) {
    if (auto builtin = builtin_op_from_string(class_id)) {
        unregisterOperator(*builtin);
        return;
    }
    host_operators_.erase(class_id);
}

std::vector<const OperatorDescriptor*> OperatorRegistry::getAllOperators() const {
    std::vector<const OperatorDescriptor*> result;

    for (const auto& reg : builtins_) {
        if (reg.is_registered && isListed(reg.descriptor.flags)) {
            result.push_back(&reg.descriptor);
        }
    }

    for (const auto& [id, reg] : host_operators_) {
        if (reg.is_registered && isListed(reg.descriptor.flags)) {
            result.push_back(&reg.descriptor);
        }
    }

    return result;
}

const OperatorDescriptor* OperatorRegistry::getDescriptor(BuiltinOp op) const {
    const auto idx = static_cast<size_t>(op);
    assert(idx < builtins_.size());
    return builtins_[idx].is_registered ? &builtins_[idx].descriptor : nullptr;
}

const OperatorDescriptor* OperatorRegistry::getDescriptor(const std::string& class_id) const {
    auto builtin = builtin_op_from_string(class_id);
    if (builtin.has_value()) {
        return getDescriptor(*builtin);
    }

    const auto it = host_operators_.find(class_id);
    return it != host_operators_.end() ? &it->second.descriptor : nullptr;
}

bool OperatorRegistry::pollImpl(const RegisteredOperator& reg) const {
    const OperatorContext ctx(session_);

    if (reg.poll_fn) {
        return reg.poll_fn(ctx);
    }
    if (reg.invoke_fn) {
        return true;
    }
    if (reg.factory) {
        auto op = reg.factory();
        return op && op->poll(ctx);
    }
    return false;
}

bool OperatorRegistry::poll(BuiltinOp op) const {
    const auto idx = static_cast<size_t>(op);
    assert(idx < builtins_.size());

    if (!builtins_[idx].is_registered) {
        return false;
    }
    return pollImpl(builtins_[idx]);
}

bool OperatorRegistry::poll(const std::string& class_id) const {
    auto builtin = builtin_op_from_string(class_id);
    if (builtin.has_value()) {
        return poll(*builtin);
    }

    const auto it = host_operators_.find(class_id);
    if (it == host_operators_.end()) {
        return false;
    }
    return pollImpl(it->second);
}

OperatorReturnValue OperatorRegistry::invokeImpl(RegisteredOperator& reg, const std::string& id,
                                                 OperatorProperties* props) {
    OperatorProperties local_props;
    OperatorProperties& props_ref = props ? *props : local_props;

    OperatorContext ctx(session_);

    // Local copies: a host callback may unregister its own entry while running
    const auto poll_fn = reg.poll_fn;
    const auto invoke_fn = reg.invoke_fn;
    const bool undoable = hasFlag(reg.descriptor.flags, OperatorFlags::UNDO);

    OperatorPtr op;
    if (!invoke_fn) {
        if (!reg.factory) {
            LOG_ERROR("Operator has no factory or invoke callback: {}", id);
            return OperatorReturnValue::cancelled();
        }
        op = reg.factory();
        if (!op) {
            LOG_ERROR("Failed to create operator: {}", id);
            return OperatorReturnValue::cancelled();
        }
    }

    const bool polled = poll_fn ? poll_fn(ctx) : (!op || op->poll(ctx));
    if (!polled) {
        LOG_DEBUG("Operator '{}' poll failed", id);
        return OperatorReturnValue::cancelled();
    }

    std::unique_ptr<SessionSnapshot> snapshot;
    if (undoable) {
        snapshot = std::make_unique<SessionSnapshot>(session_, id);
        snapshot->captureBefore();
    }

    OperatorReturnValue result = op ? op->invoke(ctx, props_ref) : invoke_fn(ctx, props_ref);

    if (snapshot && result.is_finished()) {
        snapshot->captureAfter();
        if (snapshot->hasChanges()) {
            session_.undoHistory().push(std::move(snapshot));
        }
    }

    return result;
}

OperatorReturnValue OperatorRegistry::invoke(BuiltinOp op, OperatorProperties* props) {
    const auto idx = static_cast<size_t>(op);
    assert(idx < builtins_.size());

    if (!builtins_[idx].is_registered) {
        LOG_WARN("Builtin operator not registered: {}", to_string(op));
        return OperatorReturnValue::cancelled();
    }

    return invokeImpl(builtins_[idx], to_string(op), props);
}

OperatorReturnValue OperatorRegistry::invoke(const std::string& class_id, OperatorProperties* props) {
    auto builtin = builtin_op_from_string(class_id);
    if (builtin.has_value()) {
        return invoke(*builtin, props);
    }

    const auto it = host_operators_.find(class_id);
    if (it == host_operators_.end()) {
        LOG_WARN("Operator not found: {}", class_id);
        return OperatorReturnValue::cancelled();
    }

    return invokeImpl(it->second, class_id, props);
}

void OperatorRegistry::clear() {
    for (auto& reg : builtins_) {
        reg = RegisteredOperator{};
    }
    host_operators_.clear();
}

} // namespace vxa::edit::op
