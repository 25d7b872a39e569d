//------------------------------------------------------------------------------
// FileUtilsTests.cpp
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Vireo/Core/FileUtils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace Vireo
{
	class FileUtilsTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			m_Directory = std::filesystem::temp_directory_path() / "vireo_file_utils_test";
			std::filesystem::create_directories(m_Directory);
		}

		void TearDown() override
		{
			std::error_code ec;
			std::filesystem::remove_all(m_Directory, ec);
		}

		std::string WriteFile(const std::string& name, const std::vector<uint32_t>& words, size_t extraBytes = 0)
		{
			auto path = m_Directory / name;
			std::ofstream file(path, std::ios::binary);
			file.write(reinterpret_cast<const char*>(words.data()), static_cast<std::streamsize>(words.size() * sizeof(uint32_t)));
			for (size_t i = 0; i < extraBytes; ++i)
				file.put('\0');
			return path.string();
		}

		std::filesystem::path m_Directory;
	};

	TEST_F(FileUtilsTest, ReadsSpirvWords)
	{
		std::string path = WriteFile("valid.spv", { FileUtils::SpirvMagicNumber, 0x00010000, 42 });

		auto words = FileUtils::ReadSpirvWords(path);

		ASSERT_EQ(words.size(), 3u);
		EXPECT_EQ(words[0], FileUtils::SpirvMagicNumber);
		EXPECT_EQ(words[2], 42u);
		EXPECT_TRUE(FileUtils::FileExists(path));
	}

	TEST_F(FileUtilsTest, RejectsBadMagic)
	{
		std::string path = WriteFile("bad_magic.spv", { 0xDEADBEEF, 0 });
		EXPECT_THROW(FileUtils::ReadSpirvWords(path), std::runtime_error);
	}

	TEST_F(FileUtilsTest, RejectsTruncatedWord)
	{
		std::string path = WriteFile("truncated.spv", { FileUtils::SpirvMagicNumber }, 2);
		EXPECT_THROW(FileUtils::ReadSpirvWords(path), std::runtime_error);
	}

	TEST_F(FileUtilsTest, MissingFileThrows)
	{
		std::string path = (m_Directory / "missing.spv").string();

		EXPECT_FALSE(FileUtils::FileExists(path));
		EXPECT_THROW(FileUtils::ReadFileAsBytes(path), std::runtime_error);
	}

	TEST(FileUtilsPathTest, JoinPath)
	{
		EXPECT_EQ(FileUtils::JoinPath("", "colored.vert.spv"), "colored.vert.spv");
		EXPECT_EQ(FileUtils::JoinPath("Shaders", "colored.vert.spv"),
			(std::filesystem::path("Shaders") / "colored.vert.spv").string());
	}
}
