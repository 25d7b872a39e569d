//------------------------------------------------------------------------------
// Application.cpp
//
// Parent class for applications built on the Vireo runtime
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------

#include "Vireo/Core/Application.hpp"
#include "Vireo/Core/Runtime.hpp"
#include "Vireo/Core/FileUtils.hpp"
#include "Vireo/Core/Logger/Logger.hpp"
#include "Vireo/Renderer/Vulkan/VulkanDevice.hpp"
#include "Vireo/Renderer/Vulkan/VulkanMemoryManager.hpp"

#include <stdexcept>

namespace Vireo
{
	Application::Application(const RuntimeConfig& config, std::unique_ptr<Window> window)
		: m_Config(config)
		, m_Window(std::move(window))
	{
		//Runtime handles logging setup
		RuntimeInit(m_Config);
		LogRuntimeConfig(m_Config);

		try
		{
			if (!m_Window)
				m_Window = Window::Create(m_Config.window);
			if (!m_Window)
				throw std::runtime_error("Window creation failed");

			m_RenderLoop = std::make_unique<RenderLoop>([this]() { return CreateRenderContext(); });
		}
		catch (...)
		{
			// The destructor won't run for a half-built application
			m_Window.reset();
			RuntimeShutdown();
			throw;
		}

		m_RenderLoop->SetRedrawCallback([this]() { m_Window->RequestRedraw(); });

		// Set up window callbacks
		m_Window->SetCloseCallback([this]() {
			LOG_INFO("Window close requested");
			m_RenderLoop->OnCloseRequested();
		});

		m_Window->SetResizeCallback([this](uint32_t width, uint32_t height) {
			m_RenderLoop->OnResize(width, height);
		});
	}

	Application::~Application()
	{
		LOG_INFO("Application shutting down");

		// The surface has to go before the window it was created from
		m_RenderLoop.reset();
		m_Window.reset();

		RuntimeShutdown();
	}

	void Application::Run()
	{
		OnStartup();

		try
		{
			LOG_INFO("Initializing renderer...");
			if (!m_RenderLoop->Start())
			{
				throw std::runtime_error("Renderer initialization failed");
			}
			LOG_INFO("Renderer initialized successfully");

			while (!m_RenderLoop->IsShutDown())
			{
				m_Window->PollEvents();

				// Resize work can throw, so it runs here and not inside the platform callback
				m_Window->DispatchPendingResize();

				if (m_RenderLoop->IsShutDown())
					break;

				if (m_Window->ConsumeRedrawRequest())
				{
					m_RenderLoop->OnRedrawRequested();
				}
				else
				{
					// Nothing to draw (minimized or idle), sleep until the next event
					m_Window->WaitEvents();
				}
			}
		}
		catch (...)
		{
			OnShutdown();
			throw;
		}

		OnShutdown();
	}

	std::unique_ptr<RenderContext> Application::CreateRenderContext()
	{
		ShaderBinaries shaders;
		try
		{
			shaders.vertex = FileUtils::ReadSpirvWords(FileUtils::JoinPath(m_Config.shaderDirectory, "colored.vert.spv"));
			shaders.fragment = FileUtils::ReadSpirvWords(FileUtils::JoinPath(m_Config.shaderDirectory, "colored.frag.spv"));
		}
		catch (const std::runtime_error& e)
		{
			LOG_ERROR("Failed to load shaders: {}", e.what());
			return nullptr;
		}

		VulkanDeviceDesc deviceDesc;
		deviceDesc.applicationName = m_Config.window.title;
		deviceDesc.enableValidation = m_Config.enableValidation;
		deviceDesc.verboseValidation = m_Config.verboseValidation;

		auto device = std::make_unique<VulkanDevice>();
		if (!device->Initialize(deviceDesc, m_Window.get()))
		{
			LOG_ERROR("Failed to initialize Vulkan device");
			return nullptr;
		}

		auto memory = std::make_unique<VulkanMemoryManager>(device.get());
		if (!memory->Initialize())
		{
			LOG_ERROR("Failed to initialize memory manager");
			return nullptr;
		}

		VkSurfaceKHR surface = device->GetSurface();
		VkExtent2D drawableExtent = { m_Window->GetFramebufferWidth(), m_Window->GetFramebufferHeight() };

		RenderContextConfig contextConfig(m_Config.pacing, m_Config.vsync,
			static_cast<VkDeviceSize>(m_Config.arenaBlockSize), m_Config.clearColor);

		auto context = RenderContext::Create(std::move(device), std::move(memory),
			surface, drawableExtent, std::move(shaders), contextConfig);
		if (!context)
			return nullptr;

		context->GetFrameDriver().SetGeometry(CreateGeometry());
		return context;
	}
}
