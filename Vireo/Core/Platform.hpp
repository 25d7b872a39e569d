// Platform detection and configuration
//------------------------------------------------------------------------------
#pragma once

// Platform detection
#ifdef _WIN32
#ifdef _WIN64
#ifndef VIREO_PLATFORM_WINDOWS
#define VIREO_PLATFORM_WINDOWS
#endif
#else
#error "x86 builds are not supported!"
#endif
#elif defined(__APPLE__) || defined(__MACH__)
#include <TargetConditionals.h>
#if TARGET_OS_MAC == 1 && TARGET_OS_IPHONE == 0
#ifndef VIREO_PLATFORM_MACOS
#define VIREO_PLATFORM_MACOS
#endif
#else
#error "Only macOS is supported on Apple platforms!"
#endif
#elif defined(__ANDROID__)
#error "Android is not supported!"
#elif defined(__linux__)
#ifndef VIREO_PLATFORM_LINUX
#define VIREO_PLATFORM_LINUX
#endif
#else
#error "Unknown platform!"
#endif

namespace Vireo
{
	inline const char* GetPlatformName()
	{
#ifdef VIREO_PLATFORM_WINDOWS
		return "Windows";
#elif defined(VIREO_PLATFORM_LINUX)
		return "Linux";
#elif defined(VIREO_PLATFORM_MACOS)
		return "MacOS";
#else
		return "Unknown Platform";
#endif
	}
}
