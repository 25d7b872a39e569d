//------------------------------------------------------------------------------
// CommandRecorder.cpp
//
// Implementation of per-frame command recording
//------------------------------------------------------------------------------

#include "Vireo/Renderer/Components/CommandRecorder.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <format>
#include <stdexcept>

namespace Vireo
{
	CommandRecorder::CommandRecorder(RenderDevice* device, uint32_t graphicsQueueFamily, const std::array<float, 4>& clearColor)
		: m_Device(device)
		, m_GraphicsQueueFamily(graphicsQueueFamily)
		, m_ClearColor(clearColor)
	{
		if (!m_Device)
			throw std::invalid_argument("CommandRecorder requires a device");
	}

	VkCommandBuffer CommandRecorder::Record(FrameAllocator& allocator, const RenderTarget& target,
		const GraphicsPipeline& pipeline,
		const TransientBuffer& vertexBuffer,
		const TransientBuffer& indexBuffer,
		uint32_t indexCount)
	{
		// Structural checks before anything is allocated
		if (!pipeline.IsValid())
			throw RenderError("Cannot record with an incomplete graphics pipeline");
		if (target.view == VK_NULL_HANDLE || target.extent.width == 0 || target.extent.height == 0)
			throw RenderError("Cannot record into an empty render target");
		if (vertexBuffer.IsEmpty())
			throw RenderError("Cannot record a draw without vertices");
		if (indexBuffer.IsEmpty() || indexCount == 0)
			throw RenderError("Cannot record a draw without indices");
		if (indexCount > indexBuffer.count)
		{
			throw RenderError(std::format("Index count {} exceeds bound index buffer ({} indices)",
				indexCount, indexBuffer.count));
		}

		VkFramebuffer framebuffer = CreateFramebuffer(allocator, target, pipeline.renderPass);

		CommandContext context = allocator.AllocateCommandContext(m_GraphicsQueueFamily, CommandUsage::SingleSubmit);
		VkCommandBuffer cmd = context.commandBuffer;

		VkClearValue clearValue{};
		clearValue.color = { { m_ClearColor[0], m_ClearColor[1], m_ClearColor[2], m_ClearColor[3] } };

		VkRenderPassBeginInfo renderPassInfo{};
		renderPassInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
		renderPassInfo.renderPass = pipeline.renderPass;
		renderPassInfo.framebuffer = framebuffer;
		renderPassInfo.renderArea.offset = { 0, 0 };
		renderPassInfo.renderArea.extent = target.extent;
		renderPassInfo.clearValueCount = 1;
		renderPassInfo.pClearValues = &clearValue;

		m_Device->CmdBeginRenderPass(cmd, renderPassInfo);

		m_Device->CmdBindPipeline(cmd, pipeline.pipeline);

		// Viewport and scissor are dynamic so the pipeline survives resizes
		VkViewport viewport{};
		viewport.x = 0.0f;
		viewport.y = 0.0f;
		viewport.width = static_cast<float>(target.extent.width);
		viewport.height = static_cast<float>(target.extent.height);
		viewport.minDepth = 0.0f;
		viewport.maxDepth = 1.0f;
		m_Device->CmdSetViewport(cmd, viewport);

		VkRect2D scissor{};
		scissor.offset = { 0, 0 };
		scissor.extent = target.extent;
		m_Device->CmdSetScissor(cmd, scissor);

		m_Device->CmdBindVertexBuffer(cmd, 0, vertexBuffer.buffer, vertexBuffer.offset);
		m_Device->CmdBindIndexBuffer(cmd, indexBuffer.buffer, indexBuffer.offset, VK_INDEX_TYPE_UINT32);

		m_Device->CmdDrawIndexed(cmd, indexCount, 1, 0, 0, 0);

		m_Device->CmdEndRenderPass(cmd);

		VkResult result = m_Device->EndCommandBuffer(cmd);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to record command buffer", result);
		}

		return cmd;
	}

	VkFramebuffer CommandRecorder::CreateFramebuffer(FrameAllocator& allocator, const RenderTarget& target, VkRenderPass renderPass)
	{
		VkImageView attachments[] = { target.view };

		VkFramebufferCreateInfo framebufferInfo{};
		framebufferInfo.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
		framebufferInfo.renderPass = renderPass;
		framebufferInfo.attachmentCount = 1;
		framebufferInfo.pAttachments = attachments;
		framebufferInfo.width = target.extent.width;
		framebufferInfo.height = target.extent.height;
		framebufferInfo.layers = target.layers;

		VkFramebuffer framebuffer = VK_NULL_HANDLE;
		VkResult result = m_Device->CreateFramebuffer(framebufferInfo, framebuffer);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to create framebuffer", result);
		}

		// Lives until this frame slot is recycled
		RenderDevice* device = m_Device;
		allocator.DeferRelease([device, framebuffer]() { device->DestroyFramebuffer(framebuffer); });

		return framebuffer;
	}
}
