/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <format>
#include <glm/glm.hpp>
#include <string>

namespace vxa::edit::op {

    inline std::string format_vec3(const glm::vec3& v) {
        return std::format("({:.4f}, {:.4f}, {:.4f})", v.x, v.y, v.z);
    }

} // namespace vxa::edit::op
