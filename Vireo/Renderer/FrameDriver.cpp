//------------------------------------------------------------------------------
// FrameDriver.cpp
//------------------------------------------------------------------------------

#include "Vireo/Renderer/FrameDriver.hpp"
#include "Vireo/Renderer/Components/SwapchainManager.hpp"
#include "Vireo/Renderer/Components/FrameAllocator.hpp"
#include "Vireo/Renderer/Components/CommandRecorder.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <stdexcept>

namespace Vireo
{
	namespace
	{
		constexpr uint64_t StatsLogInterval = 600;
	}

	FrameDriver::FrameDriver(SwapchainManager* swapchain, FrameAllocator* allocator, CommandRecorder* recorder,
		const GraphicsPipeline* pipeline, FramePacing pacing)
		: m_Swapchain(swapchain)
		, m_Allocator(allocator)
		, m_Recorder(recorder)
		, m_Pipeline(pipeline)
		, m_Pacing(pacing)
	{
		if (!m_Swapchain || !m_Allocator || !m_Recorder || !m_Pipeline)
			throw std::invalid_argument("FrameDriver requires a swapchain, allocator, recorder and pipeline");

		m_Minimized = m_Swapchain->GetState() == SwapchainState::Minimized;

		LOG_INFO("Frame driver using {} pacing ({} frame(s) in flight)",
			FramePacingToString(m_Pacing), m_Swapchain->GetFramesInFlight());
	}

	FrameResult FrameDriver::DrawFrame()
	{
		if (m_Minimized)
			return FrameResult::Skipped;

		// Pipelined: the slot's previous frame may still be executing
		if (m_Pacing == FramePacing::Pipelined)
		{
			m_Swapchain->WaitForFrameSlot();
		}

		m_Allocator->BeginFrame(m_Swapchain->GetCurrentFrameSlot());

		auto token = m_Swapchain->AcquireNextImage();
		if (!token)
		{
			// One recreation, one retry
			if (m_Swapchain->RecreateSwapchain())
			{
				token = m_Swapchain->AcquireNextImage();
			}

			if (!token)
			{
				LOG_WARN("No swapchain image available (state: {}), suspending rendering",
					SwapchainStateToString(m_Swapchain->GetState()));
				m_Minimized = true;
				return FrameResult::Skipped;
			}
		}

		uint32_t imageIndex = token->GetImageIndex();

		TransientBuffer vertexBuffer = m_Allocator->AllocateVertexBuffer(m_Geometry.vertices);
		TransientBuffer indexBuffer = m_Allocator->AllocateIndexBuffer(m_Geometry.indices);

		VkCommandBuffer commandBuffer = m_Recorder->Record(*m_Allocator,
			m_Swapchain->GetRenderTarget(imageIndex), *m_Pipeline,
			vertexBuffer, indexBuffer, indexBuffer.count);

		ExecutionFuture execution = m_Swapchain->ExecuteCommandBuffer(std::move(*token), commandBuffer);
		PresentFuture present = m_Swapchain->PresentImage(std::move(execution), imageIndex);

		if (m_Pacing == FramePacing::Synchronous)
		{
			present.Wait();
		}

		++m_FrameCount;
		if (m_FrameCount % StatsLogInterval == 0)
		{
			LOG_DEBUG("Presented {} frames", m_FrameCount);
			m_Allocator->LogStats();
		}

		RequestRedraw();
		return FrameResult::Presented;
	}

	void FrameDriver::OnResize(uint32_t width, uint32_t height)
	{
		m_Swapchain->SetDrawableExtent(width, height);
		m_Swapchain->MarkOutOfDate();

		bool wasMinimized = m_Minimized;

		// Suspended until the swapchain is rebuilt. If recreation throws, no frame
		// touches the retired swapchain.
		m_Minimized = true;
		bool recreated = m_Swapchain->RecreateSwapchain();

		if (width == 0 || height == 0)
		{
			if (!wasMinimized)
				LOG_INFO("Window minimized, rendering suspended");
			return;
		}

		m_Minimized = !recreated;
		if (wasMinimized && !m_Minimized)
		{
			LOG_INFO("Window restored to {}x{}, rendering resumed", width, height);
		}

		RequestRedraw();
	}

	void FrameDriver::RequestRedraw()
	{
		if (m_RequestRedraw)
			m_RequestRedraw();
	}
}
