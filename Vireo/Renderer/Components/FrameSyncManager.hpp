//------------------------------------------------------------------------------
// FrameSyncManager.hpp
//
// Manages frame synchronization primitives (semaphores, fences)
// Per frame slot: acquire semaphore + in-flight fence
// Per swapchain image: render-finished semaphore, last fence, acquired flag
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"

#include <cstdint>
#include <vector>

namespace Vireo
{
	class RenderDevice;

	class FrameSyncManager
	{
	public:
		FrameSyncManager() = default;
		~FrameSyncManager() = default;

		// Lifecycle
		bool Initialize(RenderDevice* device, uint32_t framesInFlight);
		void Cleanup();

		// Rebuilds the per-image objects for a new swapchain. Device must be idle.
		bool ResizeImageResources(uint32_t swapchainImageCount);

		// Frame slot management
		void WaitForSlot(uint32_t slot);
		void NextFrame() { m_CurrentFrame = (m_CurrentFrame + 1) % m_FramesInFlight; }

		// Image bookkeeping. MarkImageAcquired throws RenderError when the image
		// was acquired and never presented, and waits for the fence of the
		// last frame that rendered into it.
		void MarkImageAcquired(uint32_t imageIndex, uint32_t slot);
		void MarkImagePresented(uint32_t imageIndex);
		bool IsImageAcquired(uint32_t imageIndex) const;

		// Getters
		bool IsInitialized() const { return m_Device != nullptr; }
		uint32_t GetFramesInFlight() const { return m_FramesInFlight; }
		uint32_t GetCurrentFrame() const { return m_CurrentFrame; }
		uint32_t GetImageCount() const { return static_cast<uint32_t>(m_RenderFinishedSemaphores.size()); }
		VkSemaphore GetImageAvailableSemaphore(uint32_t slot) const { return m_ImageAvailableSemaphores[slot]; }
		VkSemaphore GetRenderFinishedSemaphore(uint32_t imageIndex) const { return m_RenderFinishedSemaphores[imageIndex]; }
		VkFence GetInFlightFence(uint32_t slot) const { return m_InFlightFences[slot]; }

	private:
		void DestroyImageResources();

		RenderDevice* m_Device = nullptr;
		uint32_t m_FramesInFlight = 0;
		uint32_t m_CurrentFrame = 0;

		// Synchronization objects (per frame in flight)
		std::vector<VkSemaphore> m_ImageAvailableSemaphores;
		std::vector<VkFence> m_InFlightFences;

		// Per Swapchain Image
		std::vector<VkSemaphore> m_RenderFinishedSemaphores;
		std::vector<VkFence> m_ImagesInFlight;
		std::vector<bool> m_ImagesAcquired;

		// prevent copying
		FrameSyncManager(const FrameSyncManager&) = delete;
		FrameSyncManager& operator=(const FrameSyncManager&) = delete;
	};
}
