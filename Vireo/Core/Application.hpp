//------------------------------------------------------------------------------
// Application.hpp
//
// Parent class for applications built on the Vireo runtime
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "Vireo/Core/RuntimeConfig.hpp"
#include "Vireo/Renderer/FrameDriver.hpp"
#include "Vireo/Renderer/RenderLoop.hpp"
#include "Vireo/Window/Window.hpp"

#include <memory>

namespace Vireo
{
	class Application
	{
	public:
		// Initializes logging and opens a platform window unless one is supplied.
		// Throws std::runtime_error on failure.
		explicit Application(const RuntimeConfig& config, std::unique_ptr<Window> window = nullptr);
		virtual ~Application();

		// Called by main(). Throws std::runtime_error if the renderer can't start,
		// RenderError if a frame fails. OnShutdown runs either way.
		void Run();

		// Override these methods in the client
		virtual void OnStartup() {}
		virtual void OnShutdown() {}

		// The mesh drawn every frame
		virtual FrameGeometry CreateGeometry() = 0;

		//Accessors for runtime systems
		Window* GetWindow() const { return m_Window.get(); }
		RenderLoop* GetRenderLoop() const { return m_RenderLoop.get(); }
		const RuntimeConfig& GetConfig() const { return m_Config; }

	protected:
		// Loads shaders and brings up the Vulkan device for the window
		virtual std::unique_ptr<RenderContext> CreateRenderContext();

	private:
		RuntimeConfig m_Config;
		std::unique_ptr<Window> m_Window;
		std::unique_ptr<RenderLoop> m_RenderLoop;
	};

	//To be defined by the client
	Application* CreateApplication(const RuntimeConfig& config);
}
