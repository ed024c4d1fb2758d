//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

// Lightweight wrapper for easy_profiler's EASY_BLOCK
// - With BUILD_WITH_EASY_PROFILER defined by the build, easy_profiler is used
// - Otherwise EASY_BLOCK becomes a no-op
//
// Usage:
//   #include "utils/profiler/profiler.hpp"
//   EASY_BLOCK("My block");

#ifndef EXODUS_UTILS_PROFILER_WRAPPER_HPP
#define EXODUS_UTILS_PROFILER_WRAPPER_HPP

#if !defined(EASY_BLOCK)
#ifdef BUILD_WITH_EASY_PROFILER
#include <easy/profiler.h>
#endif

#if !defined(EASY_BLOCK)
#define EASY_BLOCK(...)
#endif

#endif  // !defined(EASY_BLOCK)

#endif  // EXODUS_UTILS_PROFILER_WRAPPER_HPP
