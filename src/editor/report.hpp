/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>

namespace vxa::edit {

    // Mixed case: ERROR is a macro under <windows.h>
    enum class ReportLevel : uint8_t {
        Info,
        Warning,
        Error,
    };

    struct Report {
        ReportLevel level = ReportLevel::Info;
        std::string message;
    };

} // namespace vxa::edit
