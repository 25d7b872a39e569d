//------------------------------------------------------------------------------
// Logger.hpp
//
// Core logging system for the Vireo runtime
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <vector>
#include <mutex>
#include <atomic>
#include <format>

namespace Vireo
{
	enum class LogLevel
	{
		Trace,
		Debug,
		Info,
		Warn,
		Error,
		None
	};

	// "trace", "debug", "info", "warn"/"warning", "error", "none" (case-insensitive)
	std::optional<LogLevel> LogLevelFromString(std::string_view name);
	const char* LogLevelToString(LogLevel level);

	class ILogSink;

	// a singleton logger class that will handle logging messages
	class Logger
	{
	public:

		// singleton instance access
		static Logger& Get();

		// config
		void SetLogLevel(LogLevel level);
		LogLevel GetLogLevel() const { return m_MinLogLevel.load(); }
		void AddSink(std::shared_ptr<ILogSink> sink);
		void ClearSinks();

		// Core Logging Function
		void Log(LogLevel level, const std::string& message);

		//Formatted logging
		template<typename... Args>
		void LogFormatted(LogLevel level, std::string_view format, const Args&... args)
		{
			if (level < m_MinLogLevel.load())
				return;

			std::string message = std::vformat(format, std::make_format_args(args...));
			Log(level, message);
		}

	private:
		Logger();
		~Logger() = default;
		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

		std::atomic<LogLevel> m_MinLogLevel = LogLevel::Trace;
		std::vector<std::shared_ptr<ILogSink>> m_Sinks;
		std::mutex m_Mutex;
	};

	// sink interface for logging
	class ILogSink
	{
	public:
		virtual ~ILogSink() = default;
		virtual void Write(LogLevel level, const std::string& message) = 0;
	};
}

// Convenience macros for logging
#define LOG_TRACE(...) ::Vireo::Logger::Get().LogFormatted(::Vireo::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::Vireo::Logger::Get().LogFormatted(::Vireo::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::Vireo::Logger::Get().LogFormatted(::Vireo::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  ::Vireo::Logger::Get().LogFormatted(::Vireo::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::Vireo::Logger::Get().LogFormatted(::Vireo::LogLevel::Error, __VA_ARGS__)
