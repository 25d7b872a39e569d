//------------------------------------------------------------------------------
// ConsoleLogger.hpp
//
// Console output sink for logging system
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "Logger.hpp"

namespace Vireo
{
	class ConsoleLogger : public ILogSink
	{
	public:
		explicit ConsoleLogger(bool useColors = true);
		virtual ~ConsoleLogger() = default;

		// ILogSink interface implementation
		virtual void Write(LogLevel level, const std::string& message) override;

	private:
		bool m_UseColors;

		// Warnings and errors go to stderr, everything else to stdout
		static std::ostream& StreamFor(LogLevel level);
		static const char* ColorCode(LogLevel level);
	};
}
