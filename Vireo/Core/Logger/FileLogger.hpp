//------------------------------------------------------------------------------
// FileLogger.hpp
//
// File output sink for logging system
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "Logger.hpp"
#include <fstream>

namespace Vireo
{
	class FileLogger : public ILogSink
	{
	public:
		// Opens in append mode, throws std::runtime_error if the file can't be opened
		explicit FileLogger(const std::string& filename);
		virtual ~FileLogger();

		// ILogSink interface implementation
		virtual void Write(LogLevel level, const std::string& message) override;

		bool IsOpen() const { return m_File.is_open(); }
		const std::string& GetFilename() const { return m_Filename; }

	private:
		std::string m_Filename;
		std::ofstream m_File;
		std::mutex m_FileMutex;
	};
}
