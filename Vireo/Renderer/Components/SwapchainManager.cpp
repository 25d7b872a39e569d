//------------------------------------------------------------------------------
// SwapchainManager.cpp
//
// Swapchain state machine and acquire/execute/present chain
//------------------------------------------------------------------------------

#include "Vireo/Renderer/Components/SwapchainManager.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace Vireo
{
	const char* SwapchainStateToString(SwapchainState state)
	{
		switch (state)
		{
		case SwapchainState::Uninitialized: return "Uninitialized";
		case SwapchainState::Valid: return "Valid";
		case SwapchainState::OutOfDate: return "OutOfDate";
		case SwapchainState::Minimized: return "Minimized";
		case SwapchainState::Destroyed: return "Destroyed";
		default: return "Unknown";
		}
	}

	namespace SwapchainNegotiation
	{
		std::optional<VkSurfaceFormatKHR> ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& availableFormats,
			VkFormat preferredFormat, VkColorSpaceKHR preferredColorSpace)
		{
			if (availableFormats.empty())
				return std::nullopt;

			for (const auto& availableFormat : availableFormats)
			{
				if (availableFormat.format == preferredFormat &&
					availableFormat.colorSpace == preferredColorSpace)
					return availableFormat;
			}

			// otherwise, return the first available format
			return availableFormats[0];
		}

		VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& availableModes, VkPresentModeKHR preferredMode)
		{
			if (std::find(availableModes.begin(), availableModes.end(), preferredMode) != availableModes.end())
				return preferredMode;

			return VK_PRESENT_MODE_FIFO_KHR;
		}

		uint32_t ChooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities)
		{
			// 0 means no limit
			if (capabilities.maxImageCount == 0)
				return capabilities.minImageCount + 1;

			uint32_t imageCount = (std::max)(capabilities.maxImageCount, capabilities.minImageCount + 1);
			return std::clamp(imageCount, capabilities.minImageCount, capabilities.maxImageCount);
		}

		VkExtent2D ChooseExtent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D drawableExtent)
		{
			// A minimized window stays minimized even if the surface still reports its old size
			if (drawableExtent.width == 0 || drawableExtent.height == 0)
				return { 0, 0 };

			// If vulkan tells us the extent, use it
			if (capabilities.currentExtent.width != (std::numeric_limits<uint32_t>::max)())
				return capabilities.currentExtent;

			// Otherwise use the window size, clamped to min/max values
			VkExtent2D actualExtent = drawableExtent;
			actualExtent.width = std::clamp(
				actualExtent.width,
				capabilities.minImageExtent.width,
				capabilities.maxImageExtent.width);
			actualExtent.height = std::clamp(
				actualExtent.height,
				capabilities.minImageExtent.height,
				capabilities.maxImageExtent.height);

			return actualExtent;
		}
	}

	SwapchainManager::SwapchainManager(RenderDevice* device, const SwapchainConfig& config)
		: m_Device(device)
		, m_Config(config)
	{
	}

	SwapchainManager::~SwapchainManager()
	{
		Shutdown();
	}

	bool SwapchainManager::Initialize(VkSurfaceKHR surface, VkExtent2D drawableExtent)
	{
		if (m_State != SwapchainState::Uninitialized)
		{
			LOG_ERROR("SwapchainManager initialized twice (state: {})", SwapchainStateToString(m_State));
			return false;
		}

		if (!m_Device || surface == VK_NULL_HANDLE)
		{
			LOG_ERROR("Invalid parameters for SwapchainManager initialization");
			return false;
		}

		LOG_INFO("Initializing swapchain for drawable extent {}x{}", drawableExtent.width, drawableExtent.height);

		m_Surface = surface;
		m_DrawableExtent = drawableExtent;

		SurfaceSupport support;
		VkResult result = m_Device->QuerySurfaceSupport(m_Surface, support);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to query surface support: {}", VulkanUtils::VkResultToString(result));
			return false;
		}

		// Negotiate the parameters that stay fixed for the lifetime of the surface
		auto surfaceFormat = SwapchainNegotiation::ChooseSurfaceFormat(
			support.formats, m_Config.preferredFormat, m_Config.preferredColorSpace);
		if (!surfaceFormat)
		{
			LOG_ERROR("Surface reports no supported formats");
			return false;
		}

		m_SurfaceFormat = *surfaceFormat;
		m_PresentMode = SwapchainNegotiation::ChoosePresentMode(support.presentModes, m_Config.preferredPresentMode);
		m_MinImageCount = SwapchainNegotiation::ChooseImageCount(support.capabilities);
		m_QueueFamilyIndices[0] = m_Device->GetGraphicsQueueFamily();
		m_QueueFamilyIndices[1] = m_Device->GetPresentQueueFamily();

		if (m_SurfaceFormat.format != m_Config.preferredFormat)
		{
			LOG_WARN("Preferred surface format unavailable, using format {}", static_cast<int>(m_SurfaceFormat.format));
		}
		if (m_PresentMode != m_Config.preferredPresentMode)
		{
			LOG_WARN("{} present mode unavailable, falling back to {}",
				VulkanUtils::PresentModeToString(m_Config.preferredPresentMode),
				VulkanUtils::PresentModeToString(m_PresentMode));
		}

		if (!m_FrameSync.Initialize(m_Device, m_Config.framesInFlight))
		{
			LOG_ERROR("Failed to initialize frame synchronization");
			return false;
		}

		VkExtent2D extent = SwapchainNegotiation::ChooseExtent(support.capabilities, m_DrawableExtent);
		if (extent.width == 0 || extent.height == 0)
		{
			LOG_INFO("Drawable extent is zero, deferring swapchain creation");
			SetState(SwapchainState::Minimized);
			return true;
		}

		try
		{
			CreateSwapchain(support.capabilities, extent);
		}
		catch (const RenderError& e)
		{
			LOG_ERROR("Failed to create swapchain: {}", e.what());
			return false;
		}

		SetState(SwapchainState::Valid);
		LOG_INFO("SwapchainManager initialized successfully");
		return true;
	}

	void SwapchainManager::Shutdown()
	{
		if (m_State == SwapchainState::Destroyed)
			return;

		if (m_Device == nullptr || (m_State == SwapchainState::Uninitialized && m_Surface == VK_NULL_HANDLE))
		{
			m_State = SwapchainState::Destroyed;
			return;
		}

		LOG_INFO("Shutting down SwapchainManager");

		// wait for device to be idle before destroying resources
		m_Device->WaitForIdle();

		DestroyImageViews();

		if (m_Swapchain != VK_NULL_HANDLE)
		{
			m_Device->DestroySwapchain(m_Swapchain);
			m_Swapchain = VK_NULL_HANDLE;
			LOG_INFO("Destroyed swapchain");
		}
		m_Images.clear();

		m_FrameSync.Cleanup();

		if (m_Surface != VK_NULL_HANDLE)
		{
			m_Device->DestroySurface(m_Surface);
			m_Surface = VK_NULL_HANDLE;
			LOG_INFO("Vulkan surface destroyed");
		}

		SetState(SwapchainState::Destroyed);
	}

	std::optional<FrameToken> SwapchainManager::AcquireNextImage()
	{
		switch (m_State)
		{
		case SwapchainState::Valid:
			break;
		case SwapchainState::OutOfDate:
		case SwapchainState::Minimized:
			// surface temporarily unusable, caller decides whether to recreate
			return std::nullopt;
		default:
			throw RenderError(std::format("AcquireNextImage called in state {}", SwapchainStateToString(m_State)),
				VK_ERROR_INITIALIZATION_FAILED);
		}

		uint32_t slot = m_FrameSync.GetCurrentFrame();
		VkSemaphore imageAvailable = m_FrameSync.GetImageAvailableSemaphore(slot);

		uint32_t imageIndex = 0;
		VkResult result = m_Device->AcquireNextImage(m_Swapchain, imageAvailable, imageIndex);

		switch (result)
		{
		case VK_SUCCESS:
			m_FrameSync.MarkImageAcquired(imageIndex, slot);
			return FrameToken(imageIndex, imageAvailable, slot, m_Generation);

		case VK_SUBOPTIMAL_KHR:
			// An image was acquired and its semaphore will fire. Consume the signal so the
			// semaphore can be reused, then report the surface as needing recreation.
			LOG_DEBUG("Swapchain suboptimal on acquire (image {})", imageIndex);
			DrainAcquireSemaphore(imageAvailable, slot);
			SetState(SwapchainState::OutOfDate);
			return std::nullopt;

		case VK_ERROR_OUT_OF_DATE_KHR:
			LOG_DEBUG("Swapchain out of date on acquire");
			SetState(SwapchainState::OutOfDate);
			return std::nullopt;

		default:
			throw RenderError("Failed to acquire swapchain image", result);
		}
	}

	bool SwapchainManager::RecreateSwapchain()
	{
		if (m_State == SwapchainState::Uninitialized || m_State == SwapchainState::Destroyed)
		{
			throw RenderError(std::format("RecreateSwapchain called in state {}", SwapchainStateToString(m_State)),
				VK_ERROR_INITIALIZATION_FAILED);
		}

		auto suspend = [this]()
		{
			if (m_State != SwapchainState::Minimized)
			{
				LOG_INFO("Drawable extent is zero, swapchain suspended until the window is restored");
			}
			SetState(SwapchainState::Minimized);
			return false;
		};

		// Nothing to query while the window has no drawable area
		if (m_DrawableExtent.width == 0 || m_DrawableExtent.height == 0)
			return suspend();

		SurfaceSupport support;
		VkResult result = m_Device->QuerySurfaceSupport(m_Surface, support);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to query surface capabilities", result);
		}

		VkExtent2D extent = SwapchainNegotiation::ChooseExtent(support.capabilities, m_DrawableExtent);
		if (extent.width == 0 || extent.height == 0)
			return suspend();

		LOG_INFO("Recreating swapchain with width: {}, height: {}", extent.width, extent.height);

		// Wait for device to be idle before replacing the swapchain
		m_Device->WaitForIdle();

		CreateSwapchain(support.capabilities, extent);

		SetState(SwapchainState::Valid);
		return true;
	}

	ExecutionFuture SwapchainManager::ExecuteCommandBuffer(FrameToken&& waitOn, VkCommandBuffer commandBuffer)
	{
		FrameToken token = std::move(waitOn);

		if (!token.IsValid())
		{
			throw RenderError("ExecuteCommandBuffer called with a consumed frame token");
		}
		if (token.GetGeneration() != m_Generation)
		{
			throw RenderError("Frame token was acquired from a retired swapchain", VK_ERROR_OUT_OF_DATE_KHR);
		}
		if (commandBuffer == VK_NULL_HANDLE)
		{
			throw RenderError("ExecuteCommandBuffer called without a command buffer");
		}

		uint32_t imageIndex = token.GetImageIndex();
		uint32_t slot = token.GetFrameSlot();
		VkFence fence = m_FrameSync.GetInFlightFence(slot);
		VkSemaphore renderFinished = m_FrameSync.GetRenderFinishedSemaphore(imageIndex);

		// Reset the fence before submission
		ThrowIfFailed(m_Device->ResetFence(fence), "Failed to reset in-flight fence");

		QueueSubmitDesc submit;
		submit.commandBuffer = commandBuffer;
		submit.waitSemaphore = token.GetAcquireSemaphore();
		submit.waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		submit.signalSemaphore = renderFinished;
		submit.fence = fence;

		VkResult result = m_Device->SubmitGraphics(submit);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to submit draw command buffer", result);
		}

		token.Retire();
		return ExecutionFuture(imageIndex, renderFinished, fence, slot, token.GetGeneration());
	}

	PresentFuture SwapchainManager::PresentImage(ExecutionFuture&& waitOn, uint32_t imageIndex)
	{
		ExecutionFuture execution = std::move(waitOn);

		if (!execution.IsValid())
		{
			throw RenderError("PresentImage called with a consumed execution future");
		}
		if (execution.GetImageIndex() != imageIndex)
		{
			throw RenderError(std::format("PresentImage index {} does not match executed image {}",
				imageIndex, execution.GetImageIndex()));
		}
		if (execution.GetGeneration() != m_Generation)
		{
			throw RenderError("Execution future belongs to a retired swapchain", VK_ERROR_OUT_OF_DATE_KHR);
		}

		VkResult result = m_Device->Present(m_Swapchain, imageIndex, execution.GetRenderFinishedSemaphore());

		// The image is handed back to the engine either way
		m_FrameSync.MarkImagePresented(imageIndex);
		m_FrameSync.NextFrame();
		execution.Retire();

		if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
		{
			LOG_DEBUG("Swapchain {} on present", VulkanUtils::VkResultToString(result));
			MarkOutOfDate();
		}
		else if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to present swapchain image", result);
		}

		return PresentFuture(m_Device, execution.GetFence(), imageIndex, result);
	}

	void SwapchainManager::MarkOutOfDate()
	{
		if (m_State == SwapchainState::Valid)
			SetState(SwapchainState::OutOfDate);
	}

	void SwapchainManager::SetDrawableExtent(uint32_t width, uint32_t height)
	{
		m_DrawableExtent = { width, height };
	}

	void SwapchainManager::WaitForFrameSlot()
	{
		if (!m_FrameSync.IsInitialized())
			return;

		m_FrameSync.WaitForSlot(m_FrameSync.GetCurrentFrame());
	}

	RenderTarget SwapchainManager::GetRenderTarget(uint32_t imageIndex) const
	{
		if (imageIndex >= m_ImageViews.size())
		{
			throw RenderError(std::format("Swapchain image index {} out of range ({} images)", imageIndex, m_ImageViews.size()));
		}

		RenderTarget target;
		target.view = m_ImageViews[imageIndex];
		target.extent = m_Extent;
		target.layers = 1;
		return target;
	}

	void SwapchainManager::CreateSwapchain(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D extent)
	{
		VkSwapchainCreateInfoKHR createInfo{};
		createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
		createInfo.surface = m_Surface;
		createInfo.minImageCount = m_MinImageCount;
		createInfo.imageFormat = m_SurfaceFormat.format;
		createInfo.imageColorSpace = m_SurfaceFormat.colorSpace;
		createInfo.imageExtent = extent;
		createInfo.imageArrayLayers = 1; // Single-layer images
		createInfo.imageUsage = m_Config.imageUsage;

		if (m_QueueFamilyIndices[0] != m_QueueFamilyIndices[1])
		{
			// Images shared between queues
			createInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
			createInfo.queueFamilyIndexCount = 2;
			createInfo.pQueueFamilyIndices = m_QueueFamilyIndices;
		}
		else
		{
			createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
		}

		createInfo.preTransform = capabilities.currentTransform;
		createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
		createInfo.presentMode = m_PresentMode;
		createInfo.clipped = VK_TRUE;
		createInfo.oldSwapchain = m_Swapchain;

		VkSwapchainKHR newSwapchain = VK_NULL_HANDLE;
		VkResult result = m_Device->CreateSwapchain(createInfo, newSwapchain);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to create swapchain", result);
		}

		// Old views and the retired swapchain go now that the replacement exists
		DestroyImageViews();
		if (m_Swapchain != VK_NULL_HANDLE)
		{
			m_Device->DestroySwapchain(m_Swapchain);
		}
		m_Swapchain = newSwapchain;
		m_Extent = extent;

		result = m_Device->GetSwapchainImages(m_Swapchain, m_Images);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to get swapchain images", result);
		}

		CreateImageViews();

		if (!m_FrameSync.ResizeImageResources(static_cast<uint32_t>(m_Images.size())))
		{
			throw RenderError("Failed to create per-image synchronization objects", VK_ERROR_INITIALIZATION_FAILED);
		}

		++m_Generation;

		LOG_INFO("Swapchain configuration:");
		LOG_INFO("  Extent: {}x{}", extent.width, extent.height);
		LOG_INFO("  Image Count: {}", m_Images.size());
		LOG_INFO("  Present Mode: {}", VulkanUtils::PresentModeToString(m_PresentMode));
		LOG_DEBUG("  Format: {}, Color Space: {}, Generation: {}",
			static_cast<int>(m_SurfaceFormat.format), static_cast<int>(m_SurfaceFormat.colorSpace), m_Generation);
	}

	void SwapchainManager::CreateImageViews()
	{
		m_ImageViews.assign(m_Images.size(), VK_NULL_HANDLE);

		for (size_t i = 0; i < m_Images.size(); ++i)
		{
			VkImageViewCreateInfo createInfo{};
			createInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
			createInfo.image = m_Images[i];
			createInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
			createInfo.format = m_SurfaceFormat.format;

			createInfo.components.r = VK_COMPONENT_SWIZZLE_IDENTITY;
			createInfo.components.g = VK_COMPONENT_SWIZZLE_IDENTITY;
			createInfo.components.b = VK_COMPONENT_SWIZZLE_IDENTITY;
			createInfo.components.a = VK_COMPONENT_SWIZZLE_IDENTITY;

			createInfo.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
			createInfo.subresourceRange.baseMipLevel = 0;
			createInfo.subresourceRange.levelCount = 1;
			createInfo.subresourceRange.baseArrayLayer = 0;
			createInfo.subresourceRange.layerCount = 1;

			VkResult result = m_Device->CreateImageView(createInfo, m_ImageViews[i]);
			if (result != VK_SUCCESS)
			{
				throw RenderError(std::format("Failed to create image view for swapchain image {}", i), result);
			}
		}

		LOG_DEBUG("Created {} swapchain image views", m_ImageViews.size());
	}

	void SwapchainManager::DestroyImageViews()
	{
		for (auto imageView : m_ImageViews)
		{
			if (imageView != VK_NULL_HANDLE)
			{
				m_Device->DestroyImageView(imageView);
			}
		}
		m_ImageViews.clear();
	}

	void SwapchainManager::DrainAcquireSemaphore(VkSemaphore semaphore, uint32_t slot)
	{
		VkFence fence = m_FrameSync.GetInFlightFence(slot);

		ThrowIfFailed(m_Device->ResetFence(fence), "Failed to reset fence for semaphore drain");

		QueueSubmitDesc submit;
		submit.waitSemaphore = semaphore;
		submit.waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		submit.fence = fence;

		VkResult result = m_Device->SubmitGraphics(submit);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to submit semaphore drain", result);
		}

		ThrowIfFailed(m_Device->WaitForFence(fence), "Failed to wait for semaphore drain");
	}

	void SwapchainManager::SetState(SwapchainState state)
	{
		if (m_State == state)
			return;

		LOG_DEBUG("Swapchain state: {} -> {}", SwapchainStateToString(m_State), SwapchainStateToString(state));
		m_State = state;
	}
}
