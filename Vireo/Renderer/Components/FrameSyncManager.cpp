//------------------------------------------------------------------------------
// FrameSyncManager.cpp
//
// Implementation of frame synchronization management
//------------------------------------------------------------------------------

#include "Vireo/Renderer/Components/FrameSyncManager.hpp"
#include "Vireo/Renderer/RenderDevice.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

namespace Vireo
{
	bool FrameSyncManager::Initialize(RenderDevice* device, uint32_t framesInFlight)
	{
		if (!device || framesInFlight == 0)
		{
			LOG_ERROR("Invalid parameters for frame synchronization ({} frames in flight)", framesInFlight);
			return false;
		}

		m_Device = device;
		m_FramesInFlight = framesInFlight;
		m_CurrentFrame = 0;

		m_ImageAvailableSemaphores.resize(framesInFlight, VK_NULL_HANDLE);
		m_InFlightFences.resize(framesInFlight, VK_NULL_HANDLE);

		// Create synchronization objects for each frame in flight.
		// Fences start signaled so the first wait on each slot returns immediately.
		for (uint32_t i = 0; i < framesInFlight; i++)
		{
			if (m_Device->CreateBinarySemaphore(m_ImageAvailableSemaphores[i]) != VK_SUCCESS ||
				m_Device->CreateFence(true, m_InFlightFences[i]) != VK_SUCCESS)
			{
				LOG_ERROR("Failed to create synchronization objects for frame {}", i);
				Cleanup();
				return false;
			}
		}

		LOG_INFO("Frame synchronization initialized ({} frames in flight)", framesInFlight);
		return true;
	}

	bool FrameSyncManager::ResizeImageResources(uint32_t swapchainImageCount)
	{
		DestroyImageResources();

		m_RenderFinishedSemaphores.resize(swapchainImageCount, VK_NULL_HANDLE);
		m_ImagesInFlight.assign(swapchainImageCount, VK_NULL_HANDLE);
		m_ImagesAcquired.assign(swapchainImageCount, false);

		// Create render finished semaphores for each swapchain image
		for (uint32_t i = 0; i < swapchainImageCount; i++)
		{
			if (m_Device->CreateBinarySemaphore(m_RenderFinishedSemaphores[i]) != VK_SUCCESS)
			{
				LOG_ERROR("Failed to create render finished semaphore for image {}", i);
				DestroyImageResources();
				return false;
			}
		}

		LOG_DEBUG("Frame synchronization sized for {} swapchain images", swapchainImageCount);
		return true;
	}

	void FrameSyncManager::Cleanup()
	{
		if (!m_Device)
			return;

		DestroyImageResources();

		for (auto& semaphore : m_ImageAvailableSemaphores)
		{
			if (semaphore != VK_NULL_HANDLE)
			{
				m_Device->DestroySemaphore(semaphore);
				semaphore = VK_NULL_HANDLE;
			}
		}

		for (auto& fence : m_InFlightFences)
		{
			if (fence != VK_NULL_HANDLE)
			{
				m_Device->DestroyFence(fence);
				fence = VK_NULL_HANDLE;
			}
		}

		m_ImageAvailableSemaphores.clear();
		m_InFlightFences.clear();
		m_Device = nullptr;
		m_FramesInFlight = 0;
		m_CurrentFrame = 0;

		LOG_INFO("Frame synchronization cleaned up");
	}

	void FrameSyncManager::DestroyImageResources()
	{
		for (auto& semaphore : m_RenderFinishedSemaphores)
		{
			if (semaphore != VK_NULL_HANDLE)
			{
				m_Device->DestroySemaphore(semaphore);
				semaphore = VK_NULL_HANDLE;
			}
		}

		m_RenderFinishedSemaphores.clear();
		m_ImagesInFlight.clear();
		m_ImagesAcquired.clear();
	}

	void FrameSyncManager::WaitForSlot(uint32_t slot)
	{
		// Wait for the fence from framesInFlight submissions ago
		VkResult result = m_Device->WaitForFence(m_InFlightFences[slot]);
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to wait for in-flight fence", result);
		}
	}

	void FrameSyncManager::MarkImageAcquired(uint32_t imageIndex, uint32_t slot)
	{
		if (imageIndex >= m_ImagesAcquired.size())
		{
			throw RenderError("Acquired swapchain image index out of range");
		}

		if (m_ImagesAcquired[imageIndex])
		{
			throw RenderError("Swapchain image acquired again before its previous presentation was queued");
		}

		// Check if a previous frame is still rendering into this image
		if (m_ImagesInFlight[imageIndex] != VK_NULL_HANDLE)
		{
			VkResult result = m_Device->WaitForFence(m_ImagesInFlight[imageIndex]);
			if (result != VK_SUCCESS)
			{
				throw RenderError("Failed to wait for image in-flight fence", result);
			}
		}

		// Mark the image as now being in use by this frame
		m_ImagesInFlight[imageIndex] = m_InFlightFences[slot];
		m_ImagesAcquired[imageIndex] = true;
	}

	void FrameSyncManager::MarkImagePresented(uint32_t imageIndex)
	{
		if (imageIndex < m_ImagesAcquired.size())
			m_ImagesAcquired[imageIndex] = false;
	}

	bool FrameSyncManager::IsImageAcquired(uint32_t imageIndex) const
	{
		return imageIndex < m_ImagesAcquired.size() && m_ImagesAcquired[imageIndex];
	}
}
