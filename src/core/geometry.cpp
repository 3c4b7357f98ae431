/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/geometry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>

namespace vxa::core {

    namespace {

        struct ErrorInfo {
            const char* id;
            const char* message;
        };

        constexpr std::array<ErrorInfo, 4> ERROR_INFO = {{
            {"insufficient_selection", "Select the required number of vertices."},
            {"degenerate_axis", "The two vertices coincide; select two distinct vertices to define the axis."},
            {"degenerate_normal", "The three vertices are collinear; select three vertices spanning a plane."},
            {"reference_not_defined", "Define the reference first."},
        }};

    } // namespace

    const char* to_string(const ReferenceError error) {
        return ERROR_INFO[static_cast<size_t>(error)].id;
    }

    const char* describe(const ReferenceError error) {
        return ERROR_INFO[static_cast<size_t>(error)].message;
    }

    glm::vec3 project_onto_line(const glm::vec3& v, const glm::vec3& origin, const glm::vec3& direction) {
        return origin + glm::dot(v - origin, direction) * direction;
    }

    glm::vec3 project_onto_plane(const glm::vec3& v, const glm::vec3& origin, const glm::vec3& normal) {
        return v - glm::dot(v - origin, normal) * normal;
    }

    GeometryResult<AxisReference> define_axis(std::span<const glm::vec3> selected, const float epsilon) {
        if (selected.size() < 2) {
            return std::unexpected(ReferenceError::InsufficientSelection);
        }

        const glm::vec3 delta = selected[1] - selected[0];
        const float len = glm::length(delta);
        if (!std::isfinite(len) || len <= epsilon) {
            return std::unexpected(ReferenceError::DegenerateAxis);
        }

        AxisReference ref;
        ref.p1 = selected[0];
        ref.p2 = selected[1];
        ref.axis = delta / len;
        ref.defined = true;
        return ref;
    }

    GeometryResult<std::vector<glm::vec3>> align_to_axis(const AxisReference& reference,
                                                         std::span<const glm::vec3> selected) {
        if (!reference.defined) {
            return std::unexpected(ReferenceError::ReferenceNotDefined);
        }
        if (selected.empty()) {
            return std::unexpected(ReferenceError::InsufficientSelection);
        }

        std::vector<glm::vec3> result;
        result.reserve(selected.size());
        std::ranges::transform(selected, std::back_inserter(result), [&](const glm::vec3& v) {
            return project_onto_line(v, reference.p1, reference.axis);
        });
        return result;
    }

    GeometryResult<PlaneReference> define_plane(std::span<const glm::vec3> selected, const float epsilon) {
        if (selected.size() != 3) {
            return std::unexpected(ReferenceError::InsufficientSelection);
        }

        const glm::vec3 e1 = selected[1] - selected[0];
        const glm::vec3 e2 = selected[2] - selected[0];
        const glm::vec3 n = glm::cross(e1, e2);
        const float len = glm::length(n);
        // |e1 x e2| = |e1| |e2| sin(theta): the threshold bounds the sine, so
        // triangle size does not matter
        const float span = glm::length(e1) * glm::length(e2);
        if (!std::isfinite(len) || !std::isfinite(span) || span == 0.0f || len <= epsilon * span) {
            return std::unexpected(ReferenceError::DegenerateNormal);
        }

        PlaneReference ref;
        ref.p1 = selected[0];
        ref.p2 = selected[1];
        ref.p3 = selected[2];
        ref.normal = n / len;
        ref.defined = true;
        return ref;
    }

    GeometryResult<std::vector<glm::vec3>> planarize(const PlaneReference& reference,
                                                     std::span<const glm::vec3> selected) {
        if (!reference.defined) {
            return std::unexpected(ReferenceError::ReferenceNotDefined);
        }

        std::vector<glm::vec3> result;
        result.reserve(selected.size());
        for (const auto& v : selected) {
            result.push_back(project_onto_plane(v, reference.p1, reference.normal));
        }
        return result;
    }

} // namespace vxa::core
