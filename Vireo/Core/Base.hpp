//------------------------------------------------------------------------------
// Base.hpp
//
// Common includes and definitions for the Vireo runtime
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

// Platform detection - verify CMake defined the platform
#if !defined(VIREO_PLATFORM_WINDOWS) && !defined(VIREO_PLATFORM_LINUX) && !defined(VIREO_PLATFORM_MACOS)
#error "No platform defined! Check CMakeLists.txt"
#endif

// Standard includes
#include <cstdint>
#include <cstddef>

// Runtime version
#define VIREO_VERSION_MAJOR 0
#define VIREO_VERSION_MINOR 2
#define VIREO_VERSION_PATCH 0
