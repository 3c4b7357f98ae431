/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/settings.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace vxa::core {

    using json = nlohmann::json;

    namespace {

        json vec3_to_json(const glm::vec3& v) {
            return json::array({v.x, v.y, v.z});
        }

        std::expected<glm::vec3, std::string> json_to_vec3(const json& j, const char* key) {
            if (!j.is_array() || j.size() != 3) {
                return std::unexpected(std::format("'{}' must be an array of 3 numbers", key));
            }
            return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
        }

    } // namespace

    std::expected<ToolSettings, std::string> settings_from_json(const json& j) {
        if (!j.is_object()) {
            return std::unexpected("settings root must be an object");
        }

        ToolSettings settings;
        try {
            if (j.contains("epsilon")) {
                const float eps = j["epsilon"].get<float>();
                if (!std::isfinite(eps) || eps <= 0.0f) {
                    return std::unexpected(std::format("'epsilon' must be positive, got {}", eps));
                }
                settings.epsilon = eps;
            }

            if (j.contains("log_level")) {
                settings.log_level = j["log_level"].get<std::string>();
                if (!parse_log_level(settings.log_level)) {
                    return std::unexpected(std::format("unknown log level '{}'", settings.log_level));
                }
            }

            if (j.contains("axis_guide")) {
                const auto& g = j["axis_guide"];
                if (!g.is_object()) {
                    return std::unexpected(std::string("'axis_guide' must be an object"));
                }
                if (g.contains("color")) {
                    auto color = json_to_vec3(g["color"], "axis_guide.color");
                    if (!color) {
                        return std::unexpected(color.error());
                    }
                    settings.guide.color = glm::clamp(*color, 0.0f, 1.0f);
                }
                if (g.contains("line_width")) {
                    settings.guide.line_width = std::max(g["line_width"].get<float>(), MIN_GUIDE_LINE_WIDTH);
                }
                if (g.contains("extension")) {
                    settings.guide.extension = std::max(g["extension"].get<float>(), MIN_GUIDE_EXTENSION);
                }
            }
        } catch (const json::exception& e) {
            return std::unexpected(std::format("invalid settings: {}", e.what()));
        }

        return settings;
    }

    json settings_to_json(const ToolSettings& settings) {
        json j;
        j["epsilon"] = settings.epsilon;
        j["log_level"] = settings.log_level;
        j["axis_guide"]["color"] = vec3_to_json(settings.guide.color);
        j["axis_guide"]["line_width"] = settings.guide.line_width;
        j["axis_guide"]["extension"] = settings.guide.extension;
        return j;
    }

    std::expected<ToolSettings, std::string> load_settings(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(std::format("cannot open settings file '{}'", path.string()));
        }

        json j;
        try {
            file >> j;
        } catch (const json::parse_error& e) {
            return std::unexpected(std::format("failed to parse '{}': {}", path.string(), e.what()));
        }

        auto settings = settings_from_json(j);
        if (settings) {
            LOG_DEBUG("Loaded settings from {}", path.string());
        }
        return settings;
    }

    std::expected<void, std::string> save_settings(const std::filesystem::path& path,
                                                   const ToolSettings& settings) {
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return std::unexpected(std::format("cannot write settings file '{}'", path.string()));
        }
        file << settings_to_json(settings).dump(2) << '\n';
        if (!file) {
            return std::unexpected(std::format("failed to write '{}'", path.string()));
        }
        return {};
    }

} // namespace vxa::core
