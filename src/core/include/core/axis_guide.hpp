/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/geometry.hpp"

#include <glm/glm.hpp>
#include <vector>

namespace vxa::core {

    constexpr float MIN_GUIDE_LINE_WIDTH = 0.1f;
    constexpr float MIN_GUIDE_EXTENSION = 0.1f;

    struct AxisGuideStyle {
        glm::vec3 color{1.0f};
        float line_width = 1.0f;
        float extension = 0.1f; // Tail length past each reference point
    };

    struct GuideVertex {
        glm::vec3 position{0.0f};
        glm::vec4 color{0.0f};
    };

    // Line list for the axis overlay: a tail, the p1-p2 span and a tail
    struct AxisGuide {
        std::vector<GuideVertex> vertices;
        float line_width = 0.0f; // Clamped to MIN_GUIDE_LINE_WIDTH, 0 when empty

        [[nodiscard]] bool empty() const { return vertices.empty(); }
    };

    // Empty when the axis is not defined
    [[nodiscard]] VXA_CORE_API AxisGuide build_axis_guide(const AxisReference& axis, const AxisGuideStyle& style);

} // namespace vxa::core
