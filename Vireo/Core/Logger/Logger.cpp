//------------------------------------------------------------------------------
// Logger.cpp
//
// Core logging system implementation
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#include "Vireo/Core/Logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Vireo
{
	std::optional<LogLevel> LogLevelFromString(std::string_view name)
	{
		std::string lowered(name);
		std::transform(lowered.begin(), lowered.end(), lowered.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		if (lowered == "trace") return LogLevel::Trace;
		if (lowered == "debug") return LogLevel::Debug;
		if (lowered == "info") return LogLevel::Info;
		if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
		if (lowered == "error") return LogLevel::Error;
		if (lowered == "none" || lowered == "off") return LogLevel::None;

		return std::nullopt;
	}

	const char* LogLevelToString(LogLevel level)
	{
		switch (level)
		{
		case LogLevel::Trace: return "TRACE";
		case LogLevel::Debug: return "DEBUG";
		case LogLevel::Info: return "INFO";
		case LogLevel::Warn: return "WARN";
		case LogLevel::Error: return "ERROR";
		case LogLevel::None: return "NONE";
		default: return "UNKNOWN";
		}
	}

	Logger& Logger::Get()
	{
		static Logger instance;
		return instance;
	}

	Logger::Logger()
	{
		// Application must add sinks themselves
	}

	void Logger::SetLogLevel(LogLevel level)
	{
		m_MinLogLevel.store(level);
	}

	void Logger::AddSink(std::shared_ptr<ILogSink> sink)
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_Sinks.push_back(std::move(sink));
	}

	void Logger::ClearSinks()
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_Sinks.clear();
	}

	void Logger::Log(LogLevel level, const std::string& message)
	{
		if (level < m_MinLogLevel.load() || level == LogLevel::None)
			return;

		// Get timestamp
		auto now = std::chrono::system_clock::now();
		std::time_t time = std::chrono::system_clock::to_time_t(now);

		std::tm localTime{};
#ifdef _WIN32
		localtime_s(&localTime, &time);
#else
		localtime_r(&time, &localTime);
#endif

		std::stringstream ss;
		ss << std::put_time(&localTime, "%H:%M:%S");

		std::string fullMessage = std::format("[{}] [{}] {}", ss.str(), LogLevelToString(level), message);

		// Send to all sinks
		std::lock_guard<std::mutex> lock(m_Mutex);
		for (const auto& sink : m_Sinks)
		{
			sink->Write(level, fullMessage);
		}
	}
}
