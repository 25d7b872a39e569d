//------------------------------------------------------------------------------
// RenderDevice.hpp
//
// Abstract device context shared by the frame lifecycle components
// VulkanDevice implements it against the real API, the tests against a recorder
//------------------------------------------------------------------------------

#pragma once

#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"

#include <cstdint>
#include <vector>

namespace Vireo
{
	// Snapshot of what a surface supports on the selected physical device
	struct SurfaceSupport
	{
		VkSurfaceCapabilitiesKHR capabilities{};
		std::vector<VkSurfaceFormatKHR> formats;
		std::vector<VkPresentModeKHR> presentModes;
	};

	// One graphics-queue submission. A null command buffer submits only the semaphore/fence operations.
	struct QueueSubmitDesc
	{
		VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
		VkSemaphore waitSemaphore = VK_NULL_HANDLE;
		VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		VkSemaphore signalSemaphore = VK_NULL_HANDLE;
		VkFence fence = VK_NULL_HANDLE;
	};

	// Everything needed to build the single colored-mesh pipeline
	struct PipelineDesc
	{
		VkFormat colorFormat = VK_FORMAT_UNDEFINED;
		std::vector<uint32_t> vertexShaderCode;
		std::vector<uint32_t> fragmentShaderCode;

		VkVertexInputBindingDescription vertexBinding{};
		std::vector<VkVertexInputAttributeDescription> vertexAttributes;

		VkPrimitiveTopology topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
		VkCullModeFlags cullMode = VK_CULL_MODE_NONE;
		VkFrontFace frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
	};

	// (layout, render pass, pipeline) triple. Built once, survives swapchain recreation.
	struct GraphicsPipeline
	{
		VkPipelineLayout layout = VK_NULL_HANDLE;
		VkRenderPass renderPass = VK_NULL_HANDLE;
		VkPipeline pipeline = VK_NULL_HANDLE;

		bool IsValid() const
		{
			return layout != VK_NULL_HANDLE && renderPass != VK_NULL_HANDLE && pipeline != VK_NULL_HANDLE;
		}
	};

	// A swapchain image view plus the extent and layer count to render into it
	struct RenderTarget
	{
		VkImageView view = VK_NULL_HANDLE;
		VkExtent2D extent = { 0, 0 };
		uint32_t layers = 1;
	};

	class RenderDevice
	{
	public:
		virtual ~RenderDevice() = default;

		virtual void Shutdown() = 0;

		// Queue families
		virtual uint32_t GetGraphicsQueueFamily() const = 0;
		virtual uint32_t GetPresentQueueFamily() const = 0;

		// Surface and swapchain
		virtual VkResult QuerySurfaceSupport(VkSurfaceKHR surface, SurfaceSupport& outSupport) = 0;
		virtual VkResult CreateSwapchain(const VkSwapchainCreateInfoKHR& createInfo, VkSwapchainKHR& outSwapchain) = 0;
		virtual VkResult GetSwapchainImages(VkSwapchainKHR swapchain, std::vector<VkImage>& outImages) = 0;
		virtual void DestroySwapchain(VkSwapchainKHR swapchain) = 0;
		virtual void DestroySurface(VkSurfaceKHR surface) = 0;

		virtual VkResult CreateImageView(const VkImageViewCreateInfo& createInfo, VkImageView& outView) = 0;
		virtual void DestroyImageView(VkImageView view) = 0;
		virtual VkResult CreateFramebuffer(const VkFramebufferCreateInfo& createInfo, VkFramebuffer& outFramebuffer) = 0;
		virtual void DestroyFramebuffer(VkFramebuffer framebuffer) = 0;

		// Synchronization objects
		virtual VkResult CreateBinarySemaphore(VkSemaphore& outSemaphore) = 0;
		virtual void DestroySemaphore(VkSemaphore semaphore) = 0;
		virtual VkResult CreateFence(bool signaled, VkFence& outFence) = 0;
		virtual void DestroyFence(VkFence fence) = 0;
		virtual VkResult WaitForFence(VkFence fence, uint64_t timeout = VulkanUtils::NoTimeout) = 0;
		virtual VkResult ResetFence(VkFence fence) = 0;

		// Queue operations
		virtual VkResult AcquireNextImage(VkSwapchainKHR swapchain, VkSemaphore signalSemaphore, uint32_t& outImageIndex) = 0;
		virtual VkResult SubmitGraphics(const QueueSubmitDesc& submit) = 0;
		virtual VkResult Present(VkSwapchainKHR swapchain, uint32_t imageIndex, VkSemaphore waitSemaphore) = 0;
		virtual VkResult WaitPresentQueueIdle() = 0;
		virtual void WaitForIdle() = 0;

		// Command pools and buffers
		virtual VkResult CreateCommandPool(uint32_t queueFamily, VkCommandPoolCreateFlags flags, VkCommandPool& outPool) = 0;
		virtual VkResult ResetCommandPool(VkCommandPool pool) = 0;
		virtual void DestroyCommandPool(VkCommandPool pool) = 0;
		virtual VkResult AllocateCommandBuffer(VkCommandPool pool, VkCommandBuffer& outCommandBuffer) = 0;
		virtual VkResult BeginCommandBuffer(VkCommandBuffer commandBuffer, VkCommandBufferUsageFlags usage) = 0;
		virtual VkResult EndCommandBuffer(VkCommandBuffer commandBuffer) = 0;

		// Recording
		virtual void CmdBeginRenderPass(VkCommandBuffer commandBuffer, const VkRenderPassBeginInfo& beginInfo) = 0;
		virtual void CmdEndRenderPass(VkCommandBuffer commandBuffer) = 0;
		virtual void CmdBindPipeline(VkCommandBuffer commandBuffer, VkPipeline pipeline) = 0;
		virtual void CmdSetViewport(VkCommandBuffer commandBuffer, const VkViewport& viewport) = 0;
		virtual void CmdSetScissor(VkCommandBuffer commandBuffer, const VkRect2D& scissor) = 0;
		virtual void CmdBindVertexBuffer(VkCommandBuffer commandBuffer, uint32_t binding, VkBuffer buffer, VkDeviceSize offset) = 0;
		virtual void CmdBindIndexBuffer(VkCommandBuffer commandBuffer, VkBuffer buffer, VkDeviceSize offset, VkIndexType indexType) = 0;
		virtual void CmdDrawIndexed(VkCommandBuffer commandBuffer, uint32_t indexCount, uint32_t instanceCount,
			uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance) = 0;

		// Pipelines
		virtual bool CreateGraphicsPipeline(const PipelineDesc& desc, GraphicsPipeline& outPipeline) = 0;
		virtual void DestroyGraphicsPipeline(GraphicsPipeline& pipeline) = 0;
	};
}
