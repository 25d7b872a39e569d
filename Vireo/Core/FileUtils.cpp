//------------------------------------------------------------------------------
// FileUtils.cpp
//------------------------------------------------------------------------------

#include "Vireo/Core/FileUtils.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace Vireo
{
	std::vector<uint8_t> FileUtils::ReadFileAsBytes(const std::string& filePath)
	{
		std::ifstream file(filePath, std::ios::ate | std::ios::binary);

		if (!file.is_open())
		{
			throw std::runtime_error("Failed to open file: " + filePath);
		}

		size_t fileSize = static_cast<size_t>(file.tellg());
		std::vector<uint8_t> buffer(fileSize);
		file.seekg(0);
		file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fileSize));

		if (!file)
		{
			throw std::runtime_error("Failed to read file: " + filePath);
		}

		LOG_TRACE("Read {} bytes from {}", fileSize, filePath);
		return buffer;
	}

	std::vector<uint32_t> FileUtils::ReadSpirvWords(const std::string& filePath)
	{
		std::vector<uint8_t> bytes = ReadFileAsBytes(filePath);

		if (bytes.empty() || bytes.size() % sizeof(uint32_t) != 0)
		{
			throw std::runtime_error(std::format(
				"Invalid SPIR-V binary {}: size {} is not a multiple of 4", filePath, bytes.size()));
		}

		std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
		std::memcpy(words.data(), bytes.data(), bytes.size());

		if (words[0] != SpirvMagicNumber)
		{
			throw std::runtime_error(std::format(
				"Invalid SPIR-V binary {}: bad magic number 0x{:08X}", filePath, words[0]));
		}

		return words;
	}

	bool FileUtils::FileExists(const std::string& filePath)
	{
		std::error_code ec;
		return std::filesystem::is_regular_file(filePath, ec);
	}

	std::string FileUtils::JoinPath(const std::string& directory, const std::string& fileName)
	{
		if (directory.empty())
			return fileName;

		return (std::filesystem::path(directory) / fileName).string();
	}
}
