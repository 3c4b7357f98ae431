/* SPDX-FileCopyrightText: 2025 Vertex Aligner Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#ifdef _WIN32
#ifdef VXA_CORE_EXPORTS
#define VXA_CORE_API __declspec(dllexport)
#else
#define VXA_CORE_API
#endif
#ifdef VXA_EDIT_EXPORTS
#define VXA_EDIT_API __declspec(dllexport)
#else
#define VXA_EDIT_API
#endif
#else
#define VXA_CORE_API __attribute__((visibility("default")))
#define VXA_EDIT_API __attribute__((visibility("default")))
#endif
