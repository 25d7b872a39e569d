//------------------------------------------------------------------------------
// ConsoleLogger.cpp
//
// Console output implementation with ANSI color support
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#include "ConsoleLogger.hpp"
#include <iostream>

namespace Vireo
{
	ConsoleLogger::ConsoleLogger(bool useColors)
		: m_UseColors(useColors)
	{
	}

	void ConsoleLogger::Write(LogLevel level, const std::string& message)
	{
		std::ostream& out = StreamFor(level);

		if (m_UseColors)
			out << ColorCode(level) << message << "\033[0m" << '\n';
		else
			out << message << '\n';

		out.flush();
	}

	std::ostream& ConsoleLogger::StreamFor(LogLevel level)
	{
		return level >= LogLevel::Warn ? std::cerr : std::cout;
	}

	const char* ConsoleLogger::ColorCode(LogLevel level)
	{
		switch (level)
		{
		case LogLevel::Trace: return "\033[90m"; // Gray
		case LogLevel::Debug: return "\033[36m"; // Cyan
		case LogLevel::Info:  return "\033[37m"; // White
		case LogLevel::Warn:  return "\033[33m"; // Yellow
		case LogLevel::Error: return "\033[91m"; // Red
		default: return "";
		}
	}
}
