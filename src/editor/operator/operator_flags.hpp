/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>

namespace vxa::edit::op {

    // REGISTER: listed for hosts. UNDO: snapshot pushed on a finished change.
    // INTERNAL: callable by id only, never listed.
    enum class OperatorFlags : uint8_t {
        NONE = 0,
        REGISTER = 0x1,
        UNDO = 0x2,
        INTERNAL = 0x4,
    };

    constexpr OperatorFlags operator|(const OperatorFlags a, const OperatorFlags b) {
        return OperatorFlags(uint8_t(a) | uint8_t(b));
    }

    constexpr bool hasFlag(const OperatorFlags flags, const OperatorFlags flag) {
        return (uint8_t(flags) & uint8_t(flag)) == uint8_t(flag);
    }

    constexpr bool isListed(const OperatorFlags flags) {
        return hasFlag(flags, OperatorFlags::REGISTER) && !hasFlag(flags, OperatorFlags::INTERNAL);
    }

    inline std::string describeFlags(const OperatorFlags flags) {
        std::string out;
        const auto append = [&](const OperatorFlags f, const char* name) {
            if (hasFlag(flags, f)) {
                out += out.empty() ? name : std::string("|") + name;
            }
        };
        append(OperatorFlags::REGISTER, "REGISTER");
        append(OperatorFlags::UNDO, "UNDO");
        append(OperatorFlags::INTERNAL, "INTERNAL");
        return out.empty() ? "NONE" : out;
    }

} // namespace vxa::edit::op
