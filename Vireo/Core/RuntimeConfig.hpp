//------------------------------------------------------------------------------
// RuntimeConfig.hpp
//
// Runtime settings and command-line parsing
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Core/Logger/Logger.hpp"
#include "Vireo/Renderer/FramePacing.hpp"
#include "Vireo/Window/WindowDesc.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace Vireo
{
	struct RuntimeConfig
	{
		WindowDesc window;

		// Presentation
		bool vsync = true;                      // FIFO when true, MAILBOX preferred otherwise
		FramePacing pacing = FramePacing::Synchronous;
		std::array<float, 4> clearColor = { 1.0f, 0.0f, 0.0f, 0.0f };

		// Validation layers
#ifdef NDEBUG
		bool enableValidation = false;
		LogLevel logLevel = LogLevel::Info;
#else
		bool enableValidation = true;
		LogLevel logLevel = LogLevel::Trace;
#endif
		bool verboseValidation = false;

		// Logging
		std::string logFile = "vireo.log";      // empty disables the file sink
		bool consoleColors = true;

		// Resources
		std::string shaderDirectory = DefaultShaderDirectory();
		uint64_t arenaBlockSize = 256 * 1024;

		bool showHelp = false;

		static std::string DefaultShaderDirectory();
	};

	// Parses --key=value flags into config. Returns false and fills error on unknown keys or bad values.
	bool ParseRuntimeConfig(int argc, const char* const* argv, RuntimeConfig& config, std::string& error);

	// Checks cross-field constraints (positive window size, sane block size)
	bool ValidateRuntimeConfig(const RuntimeConfig& config, std::string& error);

	std::string GetRuntimeConfigUsage(const char* programName);

	void LogRuntimeConfig(const RuntimeConfig& config);
}
