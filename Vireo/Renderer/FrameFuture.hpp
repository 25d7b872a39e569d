//------------------------------------------------------------------------------
// FrameFuture.hpp
//
// Typed GPU dependency chain for one frame:
//   FrameToken (image acquired) -> ExecutionFuture (commands submitted)
//   -> PresentFuture (presentation queued)
// Each link is move-only and consumed by the operation that produces the next.
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"

#include <cstdint>

namespace Vireo
{
	class RenderDevice;

	// Result of a successful acquire. Valid for exactly one frame.
	class FrameToken
	{
	public:
		FrameToken(uint32_t imageIndex, VkSemaphore acquireSemaphore, uint32_t frameSlot, uint64_t generation)
			: m_ImageIndex(imageIndex)
			, m_AcquireSemaphore(acquireSemaphore)
			, m_FrameSlot(frameSlot)
			, m_Generation(generation)
			, m_Valid(true)
		{
		}

		FrameToken(FrameToken&& other) noexcept;
		FrameToken& operator=(FrameToken&& other) noexcept;
		FrameToken(const FrameToken&) = delete;
		FrameToken& operator=(const FrameToken&) = delete;

		uint32_t GetImageIndex() const { return m_ImageIndex; }
		VkSemaphore GetAcquireSemaphore() const { return m_AcquireSemaphore; }
		uint32_t GetFrameSlot() const { return m_FrameSlot; }
		uint64_t GetGeneration() const { return m_Generation; }

		// False once moved from or consumed
		bool IsValid() const { return m_Valid; }
		void Retire() { m_Valid = false; }

	private:
		uint32_t m_ImageIndex = 0;
		VkSemaphore m_AcquireSemaphore = VK_NULL_HANDLE;
		uint32_t m_FrameSlot = 0;
		uint64_t m_Generation = 0;
		bool m_Valid = false;
	};

	// Command buffer submitted; signals renderFinished and the frame slot's fence
	class ExecutionFuture
	{
	public:
		ExecutionFuture(uint32_t imageIndex, VkSemaphore renderFinished, VkFence fence, uint32_t frameSlot, uint64_t generation)
			: m_ImageIndex(imageIndex)
			, m_RenderFinished(renderFinished)
			, m_Fence(fence)
			, m_FrameSlot(frameSlot)
			, m_Generation(generation)
			, m_Valid(true)
		{
		}

		ExecutionFuture(ExecutionFuture&& other) noexcept;
		ExecutionFuture& operator=(ExecutionFuture&& other) noexcept;
		ExecutionFuture(const ExecutionFuture&) = delete;
		ExecutionFuture& operator=(const ExecutionFuture&) = delete;

		uint32_t GetImageIndex() const { return m_ImageIndex; }
		VkSemaphore GetRenderFinishedSemaphore() const { return m_RenderFinished; }
		VkFence GetFence() const { return m_Fence; }
		uint32_t GetFrameSlot() const { return m_FrameSlot; }
		uint64_t GetGeneration() const { return m_Generation; }

		bool IsValid() const { return m_Valid; }
		void Retire() { m_Valid = false; }

	private:
		uint32_t m_ImageIndex = 0;
		VkSemaphore m_RenderFinished = VK_NULL_HANDLE;
		VkFence m_Fence = VK_NULL_HANDLE;
		uint32_t m_FrameSlot = 0;
		uint64_t m_Generation = 0;
		bool m_Valid = false;
	};

	// Presentation queued. Wait() is the only blocking call in the chain.
	class PresentFuture
	{
	public:
		PresentFuture(RenderDevice* device, VkFence fence, uint32_t imageIndex, VkResult presentResult)
			: m_Device(device)
			, m_Fence(fence)
			, m_ImageIndex(imageIndex)
			, m_PresentResult(presentResult)
		{
		}

		PresentFuture(PresentFuture&& other) noexcept;
		PresentFuture& operator=(PresentFuture&& other) noexcept;
		PresentFuture(const PresentFuture&) = delete;
		PresentFuture& operator=(const PresentFuture&) = delete;

		// Blocks until the frame's commands finished and the present queue drained.
		// Throws RenderError if either wait fails. Waiting twice is a no-op.
		void Wait();

		bool IsComplete() const { return m_Waited; }
		uint32_t GetImageIndex() const { return m_ImageIndex; }

		// VK_SUCCESS, VK_SUBOPTIMAL_KHR or VK_ERROR_OUT_OF_DATE_KHR
		VkResult GetPresentResult() const { return m_PresentResult; }

	private:
		RenderDevice* m_Device = nullptr;
		VkFence m_Fence = VK_NULL_HANDLE;
		uint32_t m_ImageIndex = 0;
		VkResult m_PresentResult = VK_SUCCESS;
		bool m_Waited = false;
	};
}
