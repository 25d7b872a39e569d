//------------------------------------------------------------------------------
// Window.hpp
//
// Abstract window interface
//------------------------------------------------------------------------------
#pragma once

#include "WindowDesc.hpp"
#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace Vireo
{
	using WindowCloseCallback = std::function<void()>;
	using WindowResizeCallback = std::function<void(uint32_t width, uint32_t height)>;

	class Window
	{
	public:
		// Factory method to create a window instance. Returns nullptr on failure.
		static std::unique_ptr<Window> Create(const WindowDesc& desc);

		virtual ~Window() = default;

		//Core functionality
		virtual bool IsOpen() const = 0;
		virtual void PollEvents() = 0;
		virtual void WaitEvents() = 0;

		// Drawable size in pixels, zero while minimized
		virtual uint32_t GetFramebufferWidth() const = 0;
		virtual uint32_t GetFramebufferHeight() const = 0;

		// Vulkan presentation
		virtual std::vector<const char*> GetRequiredInstanceExtensions() const = 0;
		virtual VkResult CreateVulkanSurface(VkInstance instance, VkSurfaceKHR* outSurface) const = 0;

		// Redraw requests are coalesced until consumed by the event loop
		void RequestRedraw() { m_RedrawRequested = true; }
		bool ConsumeRedrawRequest()
		{
			bool requested = m_RedrawRequested;
			m_RedrawRequested = false;
			return requested;
		}

		//Event callbacks
		void SetCloseCallback(WindowCloseCallback callback) { m_CloseCallback = std::move(callback); }
		void SetResizeCallback(WindowResizeCallback callback) { m_ResizeCallback = std::move(callback); }

		// Resizes queued during event processing collapse into one, delivered here with
		// the latest extent. Called by the event loop after PollEvents/WaitEvents return,
		// so the resize callback never runs inside a platform callback.
		bool DispatchPendingResize();

		bool IsIconified() const { return m_Iconified; }

	protected:
		// Derived classes report drawable size changes here. Reported as zero while iconified.
		void QueueResize(uint32_t width, uint32_t height);

		// Iconify reports a zero extent, restore reports the given framebuffer size
		void SetIconified(bool iconified, uint32_t width, uint32_t height);

		WindowCloseCallback m_CloseCallback;
		WindowResizeCallback m_ResizeCallback;

		bool m_RedrawRequested = false;

	private:
		bool m_ResizePending = false;
		bool m_Iconified = false;
		uint32_t m_PendingWidth = 0;
		uint32_t m_PendingHeight = 0;
	};
}
