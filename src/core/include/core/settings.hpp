/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/axis_guide.hpp"
#include "core/export.hpp"
#include "core/geometry.hpp"

#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace vxa::core {

    /**
     * @brief Tool configuration (vertex_aligner.json)
     *
     * {
     *   "epsilon": 1e-6,
     *   "log_level": "info",
     *   "axis_guide": { "color": [1, 1, 1], "line_width": 1.0, "extension": 0.1 }
     * }
     *
     * Missing keys keep their defaults.
     */
    struct ToolSettings {
        float epsilon = DEFAULT_EPSILON;
        std::string log_level = "info";
        AxisGuideStyle guide;
    };

    [[nodiscard]] VXA_CORE_API std::expected<ToolSettings, std::string> settings_from_json(const nlohmann::json& j);
    [[nodiscard]] VXA_CORE_API nlohmann::json settings_to_json(const ToolSettings& settings);

    [[nodiscard]] VXA_CORE_API std::expected<ToolSettings, std::string> load_settings(const std::filesystem::path& path);
    VXA_CORE_API std::expected<void, std::string> save_settings(const std::filesystem::path& path,
                                                                const ToolSettings& settings);

} // namespace vxa::core
