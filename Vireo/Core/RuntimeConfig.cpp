//------------------------------------------------------------------------------
// RuntimeConfig.cpp
//
// Command-line parsing for RuntimeConfig
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#include "Vireo/Core/RuntimeConfig.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace Vireo
{
	namespace
	{
		template<typename T>
		bool ParseNumber(std::string_view text, T& out)
		{
			if (text.empty())
				return false;

			auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
			return ec == std::errc() && ptr == text.data() + text.size();
		}

		bool ParseBool(std::string_view text, bool& out)
		{
			if (text == "true" || text == "on" || text == "1" || text == "yes")
			{
				out = true;
				return true;
			}
			if (text == "false" || text == "off" || text == "0" || text == "no")
			{
				out = false;
				return true;
			}
			return false;
		}

		bool ParseFloat(std::string_view text, float& out)
		{
			// from_chars for floats isn't available everywhere yet
			std::string copy(text);
			std::istringstream stream(copy);
			stream >> out;
			return !stream.fail() && stream.eof();
		}

		bool ParseClearColor(std::string_view text, std::array<float, 4>& out)
		{
			std::array<float, 4> color{};
			size_t component = 0;

			while (!text.empty())
			{
				if (component == color.size())
					return false;

				size_t comma = text.find(',');
				std::string_view part = text.substr(0, comma);
				if (!ParseFloat(part, color[component]) || color[component] < 0.0f || color[component] > 1.0f)
					return false;

				++component;
				if (comma == std::string_view::npos)
					break;
				text.remove_prefix(comma + 1);
			}

			if (component != color.size())
				return false;

			out = color;
			return true;
		}
	}

	std::string RuntimeConfig::DefaultShaderDirectory()
	{
#ifdef VIREO_DEFAULT_SHADER_DIR
		return VIREO_DEFAULT_SHADER_DIR;
#else
		return "Shaders";
#endif
	}

	bool ParseRuntimeConfig(int argc, const char* const* argv, RuntimeConfig& config, std::string& error)
	{
		for (int i = 1; i < argc; ++i)
		{
			std::string_view arg = argv[i];

			if (arg == "--help" || arg == "-h")
			{
				config.showHelp = true;
				continue;
			}

			if (arg.substr(0, 2) != "--")
			{
				error = std::format("Unexpected argument '{}'", arg);
				return false;
			}

			arg.remove_prefix(2);
			size_t equals = arg.find('=');
			std::string_view key = arg.substr(0, equals);
			std::string_view value = equals == std::string_view::npos ? std::string_view{} : arg.substr(equals + 1);
			bool hasValue = equals != std::string_view::npos;

			auto invalid = [&]() {
				error = std::format("Invalid value '{}' for --{}", value, key);
				return false;
			};

			if (key == "width" || key == "height")
			{
				int parsed = 0;
				if (!ParseNumber(value, parsed) || parsed <= 0)
					return invalid();
				(key == "width" ? config.window.width : config.window.height) = parsed;
			}
			else if (key == "title")
			{
				if (!hasValue)
					return invalid();
				config.window.title = std::string(value);
			}
			else if (key == "vsync" || key == "validation" || key == "verbose-validation" || key == "resizable" || key == "console-colors")
			{
				// a bare flag means "on"
				bool parsed = true;
				if (hasValue && !ParseBool(value, parsed))
					return invalid();

				if (key == "vsync") config.vsync = parsed;
				else if (key == "validation") config.enableValidation = parsed;
				else if (key == "verbose-validation") config.verboseValidation = parsed;
				else if (key == "resizable") config.window.resizable = parsed;
				else config.consoleColors = parsed;
			}
			else if (key == "pacing")
			{
				auto pacing = FramePacingFromString(value);
				if (!pacing)
					return invalid();
				config.pacing = *pacing;
			}
			else if (key == "log-level")
			{
				auto level = LogLevelFromString(value);
				if (!level)
					return invalid();
				config.logLevel = *level;
			}
			else if (key == "log-file")
			{
				if (!hasValue)
					return invalid();
				config.logFile = std::string(value);
			}
			else if (key == "shader-dir")
			{
				if (value.empty())
					return invalid();
				config.shaderDirectory = std::string(value);
			}
			else if (key == "clear-color")
			{
				if (!ParseClearColor(value, config.clearColor))
					return invalid();
			}
			else if (key == "arena-block-size")
			{
				uint64_t parsed = 0;
				if (!ParseNumber(value, parsed) || parsed == 0)
					return invalid();
				config.arenaBlockSize = parsed;
			}
			else
			{
				error = std::format("Unknown option --{}", key);
				return false;
			}
		}

		return ValidateRuntimeConfig(config, error);
	}

	bool ValidateRuntimeConfig(const RuntimeConfig& config, std::string& error)
	{
		if (config.window.width <= 0 || config.window.height <= 0)
		{
			error = std::format("Window size must be positive (got {}x{})", config.window.width, config.window.height);
			return false;
		}

		// Anything smaller can't hold the demo mesh plus alignment padding
		if (config.arenaBlockSize < 1024)
		{
			error = std::format("Arena block size must be at least 1024 bytes (got {})", config.arenaBlockSize);
			return false;
		}

		if (config.shaderDirectory.empty())
		{
			error = "Shader directory must not be empty";
			return false;
		}

		return true;
	}

	std::string GetRuntimeConfigUsage(const char* programName)
	{
		return std::format(
			"Usage: {} [options]\n"
			"  --width=<px>                 initial window width (800)\n"
			"  --height=<px>                initial window height (600)\n"
			"  --title=<text>               window title\n"
			"  --resizable[=bool]           allow resizing (true)\n"
			"  --vsync[=bool]               FIFO presentation (true)\n"
			"  --pacing=<mode>              synchronous | pipelined (synchronous)\n"
			"  --validation[=bool]          enable Vulkan validation layers\n"
			"  --verbose-validation[=bool]  forward info/verbose validation messages\n"
			"  --log-level=<level>          trace | debug | info | warn | error | none\n"
			"  --log-file=<path>            log file, empty to disable (vireo.log)\n"
			"  --console-colors[=bool]      colored console output (true)\n"
			"  --shader-dir=<path>          directory holding compiled SPIR-V\n"
			"  --clear-color=r,g,b,a        clear color in [0,1] (1,0,0,0)\n"
			"  --arena-block-size=<bytes>   initial per-frame arena block size (262144)\n"
			"  --help                       show this message\n",
			programName ? programName : "vireo");
	}

	void LogRuntimeConfig(const RuntimeConfig& config)
	{
		LOG_INFO("Runtime configuration:");
		LOG_INFO("  Window: '{}' {}x{} (resizable: {})",
			config.window.title, config.window.width, config.window.height, config.window.resizable);
		LOG_INFO("  VSync: {}, pacing: {}", config.vsync, FramePacingToString(config.pacing));
		LOG_INFO("  Validation: {} (verbose: {})", config.enableValidation, config.verboseValidation);
		LOG_INFO("  Shader directory: {}", config.shaderDirectory);
		LOG_DEBUG("  Clear color: ({}, {}, {}, {})",
			config.clearColor[0], config.clearColor[1], config.clearColor[2], config.clearColor[3]);
		LOG_DEBUG("  Arena block size: {} bytes", config.arenaBlockSize);
	}
}
