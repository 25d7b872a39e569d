//------------------------------------------------------------------------------
// main.cpp
//
// Entry point for the Sandbox application
//------------------------------------------------------------------------------

#include "Vireo/Core/Application.hpp"
#include "Vireo/Core/RuntimeConfig.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv)
{
	Vireo::RuntimeConfig config;
	std::string error;

	if (!Vireo::ParseRuntimeConfig(argc, argv, config, error))
	{
		std::cerr << error << "\n\n" << Vireo::GetRuntimeConfigUsage(argv[0]);
		return 1;
	}

	if (config.showHelp)
	{
		std::cout << Vireo::GetRuntimeConfigUsage(argv[0]);
		return 0;
	}

	if (!Vireo::ValidateRuntimeConfig(config, error))
	{
		std::cerr << error << '\n';
		return 1;
	}

	try
	{
		std::unique_ptr<Vireo::Application> app(Vireo::CreateApplication(config));
		app->Run();
	}
	catch (const std::exception& e)
	{
		// The logger may already be torn down, so report on stderr as well
		LOG_ERROR("Fatal error: {}", e.what());
		std::cerr << "Fatal error: " << e.what() << '\n';
		return 1;
	}

	return 0;
}
