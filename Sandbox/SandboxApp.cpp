//------------------------------------------------------------------------------
// SandboxApp.cpp
//
// Draws a single colored quad over the clear color
//------------------------------------------------------------------------------

#include "Vireo/Core/Application.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

namespace
{
	class SandboxApp : public Vireo::Application
	{
	public:
		explicit SandboxApp(const Vireo::RuntimeConfig& config)
			: Vireo::Application(config)
		{
		}

		void OnStartup() override
		{
			LOG_INFO("Sandbox starting ({}x{})", GetConfig().window.width, GetConfig().window.height);
		}

		void OnShutdown() override
		{
			LOG_INFO("Sandbox finished");
		}

		Vireo::FrameGeometry CreateGeometry() override
		{
			Vireo::FrameGeometry geometry;

			// Quad vertices (position, color)
			geometry.vertices = {
				{ { -0.5f, -0.5f, 0.0f }, { 1.0f, 0.0f, 0.0f } },
				{ {  0.5f, -0.5f, 0.0f }, { 0.0f, 1.0f, 0.0f } },
				{ {  0.5f,  0.5f, 0.0f }, { 0.0f, 0.0f, 1.0f } },
				{ { -0.5f,  0.5f, 0.0f }, { 1.0f, 1.0f, 1.0f } }
			};

			geometry.indices = { 0, 1, 2, 2, 3, 0 };

			return geometry;
		}
	};
}

Vireo::Application* Vireo::CreateApplication(const RuntimeConfig& config)
{
	return new SandboxApp(config);
}
