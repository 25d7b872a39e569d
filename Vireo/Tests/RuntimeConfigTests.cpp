//------------------------------------------------------------------------------
// RuntimeConfigTests.cpp
//
// Command-line parsing and validation
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Vireo/Core/RuntimeConfig.hpp"

#include <string>
#include <vector>

namespace Vireo
{
	namespace
	{
		bool Parse(std::vector<const char*> args, RuntimeConfig& config, std::string& error)
		{
			args.insert(args.begin(), "vireo");
			return ParseRuntimeConfig(static_cast<int>(args.size()), args.data(), config, error);
		}
	}

	TEST(RuntimeConfigTest, DefaultsMatchDocumentation)
	{
		RuntimeConfig config;

		EXPECT_EQ(config.window.title, "Vireo");
		EXPECT_EQ(config.window.width, 800);
		EXPECT_EQ(config.window.height, 600);
		EXPECT_TRUE(config.window.resizable);
		EXPECT_TRUE(config.vsync);
		EXPECT_EQ(config.pacing, FramePacing::Synchronous);
		EXPECT_EQ(config.clearColor[0], 1.0f);
		EXPECT_EQ(config.clearColor[3], 0.0f);
		EXPECT_EQ(config.arenaBlockSize, 256u * 1024u);
		EXPECT_EQ(config.logFile, "vireo.log");
		EXPECT_FALSE(config.shaderDirectory.empty());

		std::string error;
		EXPECT_TRUE(ValidateRuntimeConfig(config, error)) << error;
	}

	TEST(RuntimeConfigTest, ParsesEveryOption)
	{
		RuntimeConfig config;
		std::string error;

		ASSERT_TRUE(Parse({
			"--width=1280", "--height=720", "--title=Demo", "--vsync=false", "--pacing=pipelined",
			"--validation=off", "--verbose-validation", "--log-level=warn", "--log-file=",
			"--shader-dir=/tmp/shaders", "--clear-color=0,0.5,1,1", "--arena-block-size=4096",
			"--resizable=no", "--console-colors=0" }, config, error)) << error;

		EXPECT_EQ(config.window.width, 1280);
		EXPECT_EQ(config.window.height, 720);
		EXPECT_EQ(config.window.title, "Demo");
		EXPECT_FALSE(config.window.resizable);
		EXPECT_FALSE(config.vsync);
		EXPECT_EQ(config.pacing, FramePacing::Pipelined);
		EXPECT_FALSE(config.enableValidation);
		EXPECT_TRUE(config.verboseValidation);
		EXPECT_EQ(config.logLevel, LogLevel::Warn);
		EXPECT_TRUE(config.logFile.empty());
		EXPECT_EQ(config.shaderDirectory, "/tmp/shaders");
		EXPECT_FLOAT_EQ(config.clearColor[1], 0.5f);
		EXPECT_FLOAT_EQ(config.clearColor[2], 1.0f);
		EXPECT_EQ(config.arenaBlockSize, 4096u);
		EXPECT_FALSE(config.consoleColors);
		EXPECT_FALSE(config.showHelp);
	}

	TEST(RuntimeConfigTest, HelpFlag)
	{
		RuntimeConfig config;
		std::string error;

		ASSERT_TRUE(Parse({ "--help" }, config, error));
		EXPECT_TRUE(config.showHelp);
		EXPECT_NE(GetRuntimeConfigUsage("vireo").find("--pacing"), std::string::npos);
	}

	TEST(RuntimeConfigTest, RejectsUnknownOption)
	{
		RuntimeConfig config;
		std::string error;

		EXPECT_FALSE(Parse({ "--fullscreen" }, config, error));
		EXPECT_NE(error.find("fullscreen"), std::string::npos);
	}

	TEST(RuntimeConfigTest, RejectsMalformedValues)
	{
		std::string error;
		const std::vector<std::vector<const char*>> badArgs = {
			{ "--width=0" },
			{ "--height=-5" },
			{ "--width=wide" },
			{ "--pacing=triple" },
			{ "--vsync=maybe" },
			{ "--log-level=loud" },
			{ "--clear-color=1,0,0" },
			{ "--clear-color=2,0,0,0" },
			{ "--arena-block-size=0" },
			{ "--shader-dir=" },
			{ "positional" }
		};

		for (const auto& args : badArgs)
		{
			RuntimeConfig config;
			EXPECT_FALSE(Parse(args, config, error)) << args[0];
		}
	}

	TEST(RuntimeConfigTest, ValidationCatchesTinyArena)
	{
		RuntimeConfig config;
		config.arenaBlockSize = 16;

		std::string error;
		EXPECT_FALSE(ValidateRuntimeConfig(config, error));
		EXPECT_FALSE(error.empty());
	}
}
