/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace vxa::edit::op {

    /// Named arguments passed to an operator invocation (e.g. "visible" for
    /// mesh.display_axis). A value read back with the wrong type is logged
    /// and treated as absent.
    class OperatorProperties {
    public:
        OperatorProperties() = default;

        template <typename T>
        OperatorProperties& set(const std::string& name, T value) {
            entries_.insert_or_assign(name, std::any(std::move(value)));
            return *this;
        }

        template <typename T>
        [[nodiscard]] std::optional<T> get(const std::string& name) const {
            const auto found = entries_.find(name);
            if (found == entries_.end()) {
                return std::nullopt;
            }
            const T* typed = std::any_cast<T>(&found->second);
            if (!typed) {
                LOG_WARN("Property '{}' holds {}, requested {}", name, found->second.type().name(),
                         typeid(T).name());
                return std::nullopt;
            }
            return *typed;
        }

        template <typename T>
        [[nodiscard]] T get_or(const std::string& name, T fallback) const {
            auto value = get<T>(name);
            return value ? std::move(*value) : std::move(fallback);
        }

        bool erase(const std::string& name) { return entries_.erase(name) > 0; }
        [[nodiscard]] bool has(const std::string& name) const { return entries_.contains(name); }
        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] bool empty() const { return entries_.empty(); }
        void clear() { entries_.clear(); }

    private:
        std::unordered_map<std::string, std::any> entries_;
    };

} // namespace vxa::edit::op
