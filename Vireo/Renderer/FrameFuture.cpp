//------------------------------------------------------------------------------
// FrameFuture.cpp
//------------------------------------------------------------------------------

#include "Vireo/Renderer/FrameFuture.hpp"
#include "Vireo/Renderer/RenderDevice.hpp"
#include "Vireo/Renderer/RenderError.hpp"

#include <utility>

namespace Vireo
{
	FrameToken::FrameToken(FrameToken&& other) noexcept
		: m_ImageIndex(other.m_ImageIndex)
		, m_AcquireSemaphore(other.m_AcquireSemaphore)
		, m_FrameSlot(other.m_FrameSlot)
		, m_Generation(other.m_Generation)
		, m_Valid(std::exchange(other.m_Valid, false))
	{
	}

	FrameToken& FrameToken::operator=(FrameToken&& other) noexcept
	{
		if (this != &other)
		{
			m_ImageIndex = other.m_ImageIndex;
			m_AcquireSemaphore = other.m_AcquireSemaphore;
			m_FrameSlot = other.m_FrameSlot;
			m_Generation = other.m_Generation;
			m_Valid = std::exchange(other.m_Valid, false);
		}
		return *this;
	}

	ExecutionFuture::ExecutionFuture(ExecutionFuture&& other) noexcept
		: m_ImageIndex(other.m_ImageIndex)
		, m_RenderFinished(other.m_RenderFinished)
		, m_Fence(other.m_Fence)
		, m_FrameSlot(other.m_FrameSlot)
		, m_Generation(other.m_Generation)
		, m_Valid(std::exchange(other.m_Valid, false))
	{
	}

	ExecutionFuture& ExecutionFuture::operator=(ExecutionFuture&& other) noexcept
	{
		if (this != &other)
		{
			m_ImageIndex = other.m_ImageIndex;
			m_RenderFinished = other.m_RenderFinished;
			m_Fence = other.m_Fence;
			m_FrameSlot = other.m_FrameSlot;
			m_Generation = other.m_Generation;
			m_Valid = std::exchange(other.m_Valid, false);
		}
		return *this;
	}

	PresentFuture::PresentFuture(PresentFuture&& other) noexcept
		: m_Device(std::exchange(other.m_Device, nullptr))
		, m_Fence(std::exchange(other.m_Fence, VK_NULL_HANDLE))
		, m_ImageIndex(other.m_ImageIndex)
		, m_PresentResult(other.m_PresentResult)
		, m_Waited(std::exchange(other.m_Waited, true))
	{
	}

	PresentFuture& PresentFuture::operator=(PresentFuture&& other) noexcept
	{
		if (this != &other)
		{
			m_Device = std::exchange(other.m_Device, nullptr);
			m_Fence = std::exchange(other.m_Fence, VK_NULL_HANDLE);
			m_ImageIndex = other.m_ImageIndex;
			m_PresentResult = other.m_PresentResult;
			m_Waited = std::exchange(other.m_Waited, true);
		}
		return *this;
	}

	void PresentFuture::Wait()
	{
		if (m_Waited || !m_Device)
			return;

		if (m_Fence != VK_NULL_HANDLE)
		{
			ThrowIfFailed(m_Device->WaitForFence(m_Fence), "Failed to wait for frame fence");
		}

		ThrowIfFailed(m_Device->WaitPresentQueueIdle(), "Failed to wait for present queue");
		m_Waited = true;
	}
}
