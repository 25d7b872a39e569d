//------------------------------------------------------------------------------
// FileUtils.hpp
//
// Binary file helpers used for loading precompiled shaders
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Vireo
{
	class FileUtils
	{
	public:
		static constexpr uint32_t SpirvMagicNumber = 0x07230203;

		// Reads the entire file into a vector of bytes. Throws std::runtime_error if it can't be opened.
		static std::vector<uint8_t> ReadFileAsBytes(const std::string& filePath);

		// Reads a SPIR-V module as 32-bit words.
		// Throws std::runtime_error when the size isn't a multiple of 4 or the magic number is missing.
		static std::vector<uint32_t> ReadSpirvWords(const std::string& filePath);

		static bool FileExists(const std::string& filePath);

		// Joins a directory and file name with a single separator
		static std::string JoinPath(const std::string& directory, const std::string& fileName);
	};
}
