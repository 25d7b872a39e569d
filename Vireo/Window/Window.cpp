//------------------------------------------------------------------------------
// Window.cpp
//
// Window factory implementation
//------------------------------------------------------------------------------

#include "Vireo/Window/Window.hpp"
#include "Vireo/Window/Platform/GLFW/GlfwWindow.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <stdexcept>

namespace Vireo
{
	std::unique_ptr<Window> Window::Create(const WindowDesc& desc)
	{
		LOG_INFO("Creating GLFW window: {} ({}x{})", desc.title, desc.width, desc.height);

		try
		{
			auto window = std::make_unique<GlfwWindow>(desc);
			LOG_INFO("GlfwWindow created successfully");
			return window;
		}
		catch (const std::runtime_error& e)
		{
			LOG_ERROR("Exception creating window: {}", e.what());
			return nullptr;
		}
	}

	bool Window::DispatchPendingResize()
	{
		if (!m_ResizePending)
			return false;

		m_ResizePending = false;
		if (m_ResizeCallback)
			m_ResizeCallback(m_PendingWidth, m_PendingHeight);
		return true;
	}

	void Window::QueueResize(uint32_t width, uint32_t height)
	{
		m_PendingWidth = m_Iconified ? 0 : width;
		m_PendingHeight = m_Iconified ? 0 : height;
		m_ResizePending = true;
	}

	void Window::SetIconified(bool iconified, uint32_t width, uint32_t height)
	{
		m_Iconified = iconified;
		QueueResize(width, height);

		if (!iconified)
			RequestRedraw();
	}
}
