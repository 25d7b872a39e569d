//------------------------------------------------------------------------------
// VulkanDevice.hpp
//
// Vulkan device management - handles instance, surface, physical and logical
// devices, and implements the RenderDevice operations with the real API
//------------------------------------------------------------------------------

#pragma once

#include "Vireo/Renderer/RenderDevice.hpp"
#include "VulkanCommon.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Vireo
{
	class Window;

	struct VulkanDeviceDesc
	{
		std::string applicationName = "Vireo";
		bool enableValidation = false;
		bool verboseValidation = false;   // also route INFO/VERBOSE validation messages
	};

	class VulkanDevice : public RenderDevice
	{
	public:
		VulkanDevice();
		~VulkanDevice() override;

		// Main initialization. Creates the window surface as part of device selection.
		bool Initialize(const VulkanDeviceDesc& desc, const Window* window);
		void Shutdown() override;

		// Queue families
		uint32_t GetGraphicsQueueFamily() const override { return m_QueueFamilies.graphicsFamily.value_or(0); }
		uint32_t GetPresentQueueFamily() const override { return m_QueueFamilies.presentFamily.value_or(0); }

		// Surface and swapchain
		VkResult QuerySurfaceSupport(VkSurfaceKHR surface, SurfaceSupport& outSupport) override;
		VkResult CreateSwapchain(const VkSwapchainCreateInfoKHR& createInfo, VkSwapchainKHR& outSwapchain) override;
		VkResult GetSwapchainImages(VkSwapchainKHR swapchain, std::vector<VkImage>& outImages) override;
		void DestroySwapchain(VkSwapchainKHR swapchain) override;
		void DestroySurface(VkSurfaceKHR surface) override;

		VkResult CreateImageView(const VkImageViewCreateInfo& createInfo, VkImageView& outView) override;
		void DestroyImageView(VkImageView view) override;
		VkResult CreateFramebuffer(const VkFramebufferCreateInfo& createInfo, VkFramebuffer& outFramebuffer) override;
		void DestroyFramebuffer(VkFramebuffer framebuffer) override;

		// Synchronization objects
		VkResult CreateBinarySemaphore(VkSemaphore& outSemaphore) override;
		void DestroySemaphore(VkSemaphore semaphore) override;
		VkResult CreateFence(bool signaled, VkFence& outFence) override;
		void DestroyFence(VkFence fence) override;
		VkResult WaitForFence(VkFence fence, uint64_t timeout = VulkanUtils::NoTimeout) override;
		VkResult ResetFence(VkFence fence) override;

		// Queue operations
		VkResult AcquireNextImage(VkSwapchainKHR swapchain, VkSemaphore signalSemaphore, uint32_t& outImageIndex) override;
		VkResult SubmitGraphics(const QueueSubmitDesc& submit) override;
		VkResult Present(VkSwapchainKHR swapchain, uint32_t imageIndex, VkSemaphore waitSemaphore) override;
		VkResult WaitPresentQueueIdle() override;
		void WaitForIdle() override;

		// Command pools and buffers
		VkResult CreateCommandPool(uint32_t queueFamily, VkCommandPoolCreateFlags flags, VkCommandPool& outPool) override;
		VkResult ResetCommandPool(VkCommandPool pool) override;
		void DestroyCommandPool(VkCommandPool pool) override;
		VkResult AllocateCommandBuffer(VkCommandPool pool, VkCommandBuffer& outCommandBuffer) override;
		VkResult BeginCommandBuffer(VkCommandBuffer commandBuffer, VkCommandBufferUsageFlags usage) override;
		VkResult EndCommandBuffer(VkCommandBuffer commandBuffer) override;

		// Recording
		void CmdBeginRenderPass(VkCommandBuffer commandBuffer, const VkRenderPassBeginInfo& beginInfo) override;
		void CmdEndRenderPass(VkCommandBuffer commandBuffer) override;
		void CmdBindPipeline(VkCommandBuffer commandBuffer, VkPipeline pipeline) override;
		void CmdSetViewport(VkCommandBuffer commandBuffer, const VkViewport& viewport) override;
		void CmdSetScissor(VkCommandBuffer commandBuffer, const VkRect2D& scissor) override;
		void CmdBindVertexBuffer(VkCommandBuffer commandBuffer, uint32_t binding, VkBuffer buffer, VkDeviceSize offset) override;
		void CmdBindIndexBuffer(VkCommandBuffer commandBuffer, VkBuffer buffer, VkDeviceSize offset, VkIndexType indexType) override;
		void CmdDrawIndexed(VkCommandBuffer commandBuffer, uint32_t indexCount, uint32_t instanceCount,
			uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance) override;

		// Pipelines
		bool CreateGraphicsPipeline(const PipelineDesc& desc, GraphicsPipeline& outPipeline) override;
		void DestroyGraphicsPipeline(GraphicsPipeline& pipeline) override;

		// Getters for Vulkan-specific properties
		VkInstance GetInstance() const { return m_Instance; }
		VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
		VkDevice GetDevice() const { return m_Device; }
		VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
		VkQueue GetPresentQueue() const { return m_PresentQueue; }

		// The window surface created during Initialize. The swapchain manager releases it through
		// DestroySurface; whatever is left is released by Shutdown.
		VkSurfaceKHR GetSurface() const { return m_Surface; }

		// Queue family indices, needed by swapchain and other components
		struct QueueFamilyIndices
		{
			std::optional<uint32_t> graphicsFamily;
			std::optional<uint32_t> presentFamily;

			bool IsComplete() const
			{
				return graphicsFamily.has_value() && presentFamily.has_value();
			}
		};

		QueueFamilyIndices GetQueueFamilyIndices() const { return m_QueueFamilies; }

	private:
		// Step 1: Create Vulkan instance
		bool CreateInstance(const Window* window);

		// Step 2: Setup debug messenger (validation only)
		bool SetupDebugMessenger();

		// Step 3: Create the window surface
		bool CreateSurface(const Window* window);

		// Step 4: Select physical device
		bool PickPhysicalDevice();

		// Step 5: Create logical device and queues
		bool CreateLogicalDevice();

		// Helper functions
		bool CheckValidationLayerSupport() const;
		bool IsDeviceSuitable(VkPhysicalDevice device) const;
		int RateDevice(VkPhysicalDevice device) const;
		QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device) const;
		bool CheckDeviceExtensionSupport(VkPhysicalDevice device) const;

		// Debug messenger callback
		static VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
			VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
			VkDebugUtilsMessageTypeFlagsEXT messageType,
			const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
			void* pUserData);

		void PopulateDebugMessengerCreateInfo(VkDebugUtilsMessengerCreateInfoEXT& createInfo) const;

	private:
		// Core Vulkan objects
		VkInstance m_Instance = VK_NULL_HANDLE;
		VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;
		VkSurfaceKHR m_Surface = VK_NULL_HANDLE;
		VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
		VkDevice m_Device = VK_NULL_HANDLE;

		// Queues
		VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
		VkQueue m_PresentQueue = VK_NULL_HANDLE;
		QueueFamilyIndices m_QueueFamilies;

		// Configuration
		const std::vector<const char*> m_ValidationLayers = {
			"VK_LAYER_KHRONOS_validation"
		};

		const std::vector<const char*> m_DeviceExtensions = {
			VK_KHR_SWAPCHAIN_EXTENSION_NAME
		};

		VulkanDeviceDesc m_Desc;
		bool m_EnableValidationLayers = false;

		VulkanDevice(const VulkanDevice&) = delete;
		VulkanDevice& operator=(const VulkanDevice&) = delete;
	};
}
