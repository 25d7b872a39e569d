//------------------------------------------------------------------------------
// RenderContext.cpp
//------------------------------------------------------------------------------

#include "Vireo/Renderer/RenderContext.hpp"
#include "Vireo/Renderer/Components/SwapchainManager.hpp"
#include "Vireo/Renderer/Components/FrameAllocator.hpp"
#include "Vireo/Renderer/Components/CommandRecorder.hpp"
#include "Vireo/Renderer/Vertex.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <stdexcept>

namespace Vireo
{
	std::unique_ptr<RenderContext> RenderContext::Create(std::unique_ptr<RenderDevice> device,
		std::unique_ptr<IArenaBlockSource> blockSource,
		VkSurfaceKHR surface, VkExtent2D drawableExtent,
		ShaderBinaries shaders, const RenderContextConfig& config)
	{
		if (!device || !blockSource)
		{
			LOG_ERROR("RenderContext requires a device and an arena block source");
			return nullptr;
		}

		LOG_INFO("=== Creating render context ===");

		std::unique_ptr<RenderContext> context(new RenderContext());
		context->m_Device = std::move(device);
		context->m_BlockSource = std::move(blockSource);

		SwapchainConfig swapchainConfig(
			config.preferredFormat,
			config.preferredColorSpace,
			config.vsync ? VK_PRESENT_MODE_FIFO_KHR : VK_PRESENT_MODE_MAILBOX_KHR,
			VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
			FramesInFlightFor(config.pacing));

		context->m_Swapchain = std::make_unique<SwapchainManager>(context->m_Device.get(), swapchainConfig);
		if (!context->m_Swapchain->Initialize(surface, drawableExtent))
		{
			LOG_ERROR("Failed to initialize swapchain");
			context->Teardown();
			return nullptr;
		}

		// The pipeline only depends on the color format, which survives recreation
		PipelineDesc pipelineDesc;
		pipelineDesc.colorFormat = context->m_Swapchain->GetImageFormat();
		pipelineDesc.vertexShaderCode = std::move(shaders.vertex);
		pipelineDesc.fragmentShaderCode = std::move(shaders.fragment);
		pipelineDesc.vertexBinding = ColoredVertex::GetBindingDescription();
		auto attributes = ColoredVertex::GetAttributeDescriptions();
		pipelineDesc.vertexAttributes.assign(attributes.begin(), attributes.end());

		if (!context->m_Device->CreateGraphicsPipeline(pipelineDesc, context->m_Pipeline))
		{
			LOG_ERROR("Failed to create graphics pipeline");
			context->Teardown();
			return nullptr;
		}

		try
		{
			FrameAllocatorConfig allocatorConfig(swapchainConfig.framesInFlight, config.arenaBlockSize, config.arenaAlignment);
			context->m_Allocator = std::make_unique<FrameAllocator>(
				context->m_Device.get(), context->m_BlockSource.get(), allocatorConfig);
		}
		catch (const std::invalid_argument& e)
		{
			LOG_ERROR("Failed to create frame allocator: {}", e.what());
			context->Teardown();
			return nullptr;
		}

		context->m_Recorder = std::make_unique<CommandRecorder>(context->m_Device.get(),
			context->m_Device->GetGraphicsQueueFamily(), config.clearColor);

		context->m_Driver = std::make_unique<FrameDriver>(context->m_Swapchain.get(),
			context->m_Allocator.get(), context->m_Recorder.get(), &context->m_Pipeline, config.pacing);

		LOG_INFO("=== Render context ready ===");
		return context;
	}

	RenderContext::~RenderContext()
	{
		Teardown();
	}

	void RenderContext::Teardown()
	{
		if (m_TornDown)
			return;
		m_TornDown = true;

		LOG_INFO("=== Tearing down render context ===");

		if (m_Device)
		{
			m_Device->WaitForIdle();
		}

		m_Driver.reset();
		m_Recorder.reset();

		if (m_Device && m_Pipeline.IsValid())
		{
			m_Device->DestroyGraphicsPipeline(m_Pipeline);
		}
		m_Pipeline = GraphicsPipeline{};

		if (m_Allocator)
		{
			m_Allocator->Shutdown();
			m_Allocator.reset();
		}
		m_BlockSource.reset();

		if (m_Swapchain)
		{
			m_Swapchain->Shutdown();
			m_Swapchain.reset();
		}

		if (m_Device)
		{
			m_Device->Shutdown();
			m_Device.reset();
		}

		LOG_INFO("=== Render context torn down ===");
	}
}
