/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/axis_guide.hpp"

#include <algorithm>

namespace vxa::core {

    AxisGuide build_axis_guide(const AxisReference& axis, const AxisGuideStyle& style) {
        if (!axis.defined) {
            return {};
        }

        const float ext = std::max(style.extension, MIN_GUIDE_EXTENSION);
        const glm::vec4 faded(style.color, 0.0f);
        const glm::vec4 solid(style.color, 1.0f);

        AxisGuide guide;
        guide.line_width = std::max(style.line_width, MIN_GUIDE_LINE_WIDTH);
        guide.vertices = {
            {axis.p1 - axis.axis * ext, faded},
            {axis.p1, solid},
            {axis.p1, solid},
            {axis.p2, solid},
            {axis.p2, solid},
            {axis.p2 + axis.axis * ext, faded},
        };
        return guide;
    }

} // namespace vxa::core
