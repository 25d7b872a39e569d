//------------------------------------------------------------------------------
// SwapchainManager.hpp
//
// Owns the presentation surface, the swapchain and its image views, and
// enforces the surface-validity state machine:
//
//   Uninitialized -> Valid | Minimized
//   Valid         -> OutOfDate      (suboptimal/out-of-date result, resize)
//   OutOfDate     -> Valid          (recreated with nonzero extent)
//   OutOfDate     -> Minimized      (recreation attempted at zero extent)
//   Minimized     -> Valid          (recreated with nonzero extent)
//   any           -> Destroyed      (Shutdown)
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/RenderDevice.hpp"
#include "Vireo/Renderer/FrameFuture.hpp"
#include "Vireo/Renderer/Components/FrameSyncManager.hpp"

#include <optional>
#include <vector>

namespace Vireo
{
	enum class SwapchainState
	{
		Uninitialized,
		Valid,
		OutOfDate,
		Minimized,
		Destroyed
	};

	const char* SwapchainStateToString(SwapchainState state);

	// Creation preferences. Every field is required.
	struct SwapchainConfig
	{
		SwapchainConfig(VkFormat preferredFormat, VkColorSpaceKHR preferredColorSpace,
			VkPresentModeKHR preferredPresentMode, VkImageUsageFlags imageUsage, uint32_t framesInFlight)
			: preferredFormat(preferredFormat)
			, preferredColorSpace(preferredColorSpace)
			, preferredPresentMode(preferredPresentMode)
			, imageUsage(imageUsage)
			, framesInFlight(framesInFlight)
		{
		}

		VkFormat preferredFormat;
		VkColorSpaceKHR preferredColorSpace;
		VkPresentModeKHR preferredPresentMode;
		VkImageUsageFlags imageUsage;
		uint32_t framesInFlight;
	};

	// Negotiation rules, free functions so they can be checked without a device
	namespace SwapchainNegotiation
	{
		// Preferred format+color space if offered, else the first one. Empty list -> nullopt.
		std::optional<VkSurfaceFormatKHR> ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& availableFormats,
			VkFormat preferredFormat, VkColorSpaceKHR preferredColorSpace);

		// Preferred mode if offered, else FIFO (always supported)
		VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& availableModes, VkPresentModeKHR preferredMode);

		// max(maxImageCount, minImageCount + 1) clamped to the bounds; maxImageCount == 0 means unbounded
		uint32_t ChooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities);

		// Zero when either drawable dimension is zero. Otherwise currentExtent when the surface
		// defines it, or the drawable extent clamped to the limits.
		VkExtent2D ChooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D drawableExtent);
	}

	class SwapchainManager
	{
	public:
		SwapchainManager(RenderDevice* device, const SwapchainConfig& config);
		~SwapchainManager();

		// Takes ownership of the surface. Returns false on unrecoverable setup failure.
		bool Initialize(VkSurfaceKHR surface, VkExtent2D drawableExtent);
		void Shutdown();

		// Frame operations
		std::optional<FrameToken> AcquireNextImage();
		bool RecreateSwapchain();
		ExecutionFuture ExecuteCommandBuffer(FrameToken&& waitOn, VkCommandBuffer commandBuffer);
		PresentFuture PresentImage(ExecutionFuture&& waitOn, uint32_t imageIndex);

		// Window notifications
		void MarkOutOfDate();
		void SetDrawableExtent(uint32_t width, uint32_t height);

		// Blocks on the fence of the frame slot about to be reused
		void WaitForFrameSlot();

		// Getters
		SwapchainState GetState() const { return m_State; }
		VkSwapchainKHR GetSwapchain() const { return m_Swapchain; }
		VkSurfaceKHR GetSurface() const { return m_Surface; }
		VkFormat GetImageFormat() const { return m_SurfaceFormat.format; }
		VkColorSpaceKHR GetColorSpace() const { return m_SurfaceFormat.colorSpace; }
		VkPresentModeKHR GetPresentMode() const { return m_PresentMode; }
		VkExtent2D GetExtent() const { return m_Extent; }
		VkExtent2D GetDrawableExtent() const { return m_DrawableExtent; }
		uint32_t GetImageCount() const { return static_cast<uint32_t>(m_Images.size()); }
		uint64_t GetGeneration() const { return m_Generation; }
		uint32_t GetCurrentFrameSlot() const { return m_FrameSync.GetCurrentFrame(); }
		uint32_t GetFramesInFlight() const { return m_Config.framesInFlight; }
		const std::vector<VkImageView>& GetImageViews() const { return m_ImageViews; }

		RenderTarget GetRenderTarget(uint32_t imageIndex) const;

	private:
		// Creation steps
		void CreateSwapchain(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D extent);
		void CreateImageViews();
		void DestroyImageViews();

		// Empty submission that waits on a signaled-but-unused acquire semaphore
		void DrainAcquireSemaphore(VkSemaphore semaphore, uint32_t slot);

		void SetState(SwapchainState state);

	private:
		RenderDevice* m_Device = nullptr;
		SwapchainConfig m_Config;
		SwapchainState m_State = SwapchainState::Uninitialized;

		// surface
		VkSurfaceKHR m_Surface = VK_NULL_HANDLE;
		VkExtent2D m_DrawableExtent = { 0, 0 };

		// negotiated once, preserved across recreation
		VkSurfaceFormatKHR m_SurfaceFormat = { VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR };
		VkPresentModeKHR m_PresentMode = VK_PRESENT_MODE_FIFO_KHR;
		uint32_t m_MinImageCount = 0;
		uint32_t m_QueueFamilyIndices[2] = { 0, 0 };

		// swapchain
		VkSwapchainKHR m_Swapchain = VK_NULL_HANDLE;
		std::vector<VkImage> m_Images;
		std::vector<VkImageView> m_ImageViews;
		VkExtent2D m_Extent = { 0, 0 };
		uint64_t m_Generation = 0;

		FrameSyncManager m_FrameSync;

		SwapchainManager(const SwapchainManager&) = delete;
		SwapchainManager& operator=(const SwapchainManager&) = delete;
	};
}
