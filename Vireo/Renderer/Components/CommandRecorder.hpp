//------------------------------------------------------------------------------
// CommandRecorder.hpp
//
// Records the frame's command buffer: one render pass over a swapchain image,
// one pipeline, one indexed draw
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/RenderDevice.hpp"
#include "Vireo/Renderer/Components/FrameAllocator.hpp"

#include <array>
#include <cstdint>

namespace Vireo
{
	class CommandRecorder
	{
	public:
		CommandRecorder(RenderDevice* device, uint32_t graphicsQueueFamily,
			const std::array<float, 4>& clearColor = { 1.0f, 0.0f, 0.0f, 0.0f });
		~CommandRecorder() = default;

		// Returns a command buffer in the executable state, ready for submission.
		// Throws RenderError on any failure; a half-recorded buffer is reclaimed with its slot.
		VkCommandBuffer Record(FrameAllocator& allocator, const RenderTarget& target,
			const GraphicsPipeline& pipeline,
			const TransientBuffer& vertexBuffer,
			const TransientBuffer& indexBuffer,
			uint32_t indexCount);

		void SetClearColor(const std::array<float, 4>& clearColor) { m_ClearColor = clearColor; }
		const std::array<float, 4>& GetClearColor() const { return m_ClearColor; }

	private:
		VkFramebuffer CreateFramebuffer(FrameAllocator& allocator, const RenderTarget& target, VkRenderPass renderPass);

		RenderDevice* m_Device = nullptr;
		uint32_t m_GraphicsQueueFamily = 0;
		std::array<float, 4> m_ClearColor;

		// Prevent copying
		CommandRecorder(const CommandRecorder&) = delete;
		CommandRecorder& operator=(const CommandRecorder&) = delete;
	};
}
