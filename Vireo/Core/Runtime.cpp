//------------------------------------------------------------------------------
// Runtime.cpp
//
// Process-wide runtime setup
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#include "Vireo/Core/Runtime.hpp"
#include "Vireo/Core/Base.hpp"
#include "Vireo/Core/Platform.hpp"
#include "Vireo/Core/RuntimeConfig.hpp"
#include "Vireo/Core/Logger/Logger.hpp"
#include "Vireo/Core/Logger/ConsoleLogger.hpp"
#include "Vireo/Core/Logger/FileLogger.hpp"

#include <stdexcept>

namespace Vireo
{
	void RuntimeInit(const RuntimeConfig& config)
	{
		Logger& logger = Logger::Get();
		logger.ClearSinks();

		// add console output sink with colors
		logger.AddSink(std::make_shared<ConsoleLogger>(config.consoleColors));

		logger.SetLogLevel(config.logLevel);

		// add file output sink, a log file we can't open is not fatal
		if (!config.logFile.empty())
		{
			try
			{
				logger.AddSink(std::make_shared<FileLogger>(config.logFile));
			}
			catch (const std::runtime_error& e)
			{
				LOG_WARN("{} (continuing with console logging only)", e.what());
			}
		}

		LOG_INFO("Vireo runtime initialized");
		LOG_INFO("Version {}.{}.{}",
			VIREO_VERSION_MAJOR,
			VIREO_VERSION_MINOR,
			VIREO_VERSION_PATCH);
		LOG_INFO("Running on platform: {}", GetPlatformName());
		LOG_DEBUG("Log level: {}", LogLevelToString(config.logLevel));
	}

	void RuntimeShutdown()
	{
		LOG_INFO("Shutting down Vireo runtime...");
		Logger::Get().ClearSinks();
	}
}
