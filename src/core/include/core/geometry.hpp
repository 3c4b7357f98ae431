/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <cstdint>
#include <expected>
#include <glm/glm.hpp>
#include <span>
#include <vector>

namespace vxa::core {

    constexpr float DEFAULT_EPSILON = 1e-6f;

    enum class ReferenceError : uint8_t {
        InsufficientSelection,
        DegenerateAxis,
        DegenerateNormal,
        ReferenceNotDefined,
    };

    // Stable identifier, e.g. "insufficient_selection"
    [[nodiscard]] VXA_CORE_API const char* to_string(ReferenceError error);
    // Message suitable for the user-facing report channel
    [[nodiscard]] VXA_CORE_API const char* describe(ReferenceError error);

    /**
     * @brief Line through p1 and p2, captured from the vertex selection.
     *
     * axis is unit length whenever defined is true, zero otherwise.
     */
    struct AxisReference {
        bool defined = false;
        glm::vec3 p1{0.0f};
        glm::vec3 p2{0.0f};
        glm::vec3 axis{0.0f};
    };

    /**
     * @brief Plane through p1, p2 and p3, captured from the vertex selection.
     *
     * normal is unit length whenever defined is true, zero otherwise.
     */
    struct PlaneReference {
        bool defined = false;
        glm::vec3 p1{0.0f};
        glm::vec3 p2{0.0f};
        glm::vec3 p3{0.0f};
        glm::vec3 normal{0.0f};
    };

    template <typename T>
    using GeometryResult = std::expected<T, ReferenceError>;

    /**
     * @brief Build an axis from the first two selected points.
     *
     * Extra points beyond the second are ignored.
     *
     * @param selected Points in selection order
     * @param epsilon Minimum distance between the two points
     * @return The defined reference, or InsufficientSelection / DegenerateAxis
     */
    [[nodiscard]] VXA_CORE_API GeometryResult<AxisReference>
    define_axis(std::span<const glm::vec3> selected, float epsilon = DEFAULT_EPSILON);

    /**
     * @brief Project each point onto the reference axis line.
     *
     * @return Projections in input order, or ReferenceNotDefined / InsufficientSelection
     */
    [[nodiscard]] VXA_CORE_API GeometryResult<std::vector<glm::vec3>>
    align_to_axis(const AxisReference& reference, std::span<const glm::vec3> selected);

    /**
     * @brief Build a plane from exactly three selected points.
     *
     * @param selected Points in selection order, must hold exactly three
     * @param epsilon Minimum sine of the angle between p2 - p1 and p3 - p1
     * @return The defined reference, or InsufficientSelection / DegenerateNormal
     */
    [[nodiscard]] VXA_CORE_API GeometryResult<PlaneReference>
    define_plane(std::span<const glm::vec3> selected, float epsilon = DEFAULT_EPSILON);

    /**
     * @brief Project each point onto the reference plane.
     *
     * An empty selection is valid and yields an empty result.
     */
    [[nodiscard]] VXA_CORE_API GeometryResult<std::vector<glm::vec3>>
    planarize(const PlaneReference& reference, std::span<const glm::vec3> selected);

    [[nodiscard]] VXA_CORE_API glm::vec3 project_onto_line(const glm::vec3& v, const glm::vec3& origin,
                                                           const glm::vec3& direction);
    [[nodiscard]] VXA_CORE_API glm::vec3 project_onto_plane(const glm::vec3& v, const glm::vec3& origin,
                                                            const glm::vec3& normal);

} // namespace vxa::core
