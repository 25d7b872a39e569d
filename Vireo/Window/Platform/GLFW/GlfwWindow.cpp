//------------------------------------------------------------------------------
// GlfwWindow.cpp
//------------------------------------------------------------------------------

#include "Vireo/Window/Platform/GLFW/GlfwWindow.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <stdexcept>

namespace Vireo
{
	GlfwWindow::GlfwWindow(const WindowDesc& desc)
		: m_Title(desc.title)
	{
		glfwSetErrorCallback(ErrorCallback);

		if (glfwInit() != GLFW_TRUE)
		{
			throw std::runtime_error("Failed to initialize GLFW");
		}

		if (glfwVulkanSupported() != GLFW_TRUE)
		{
			glfwTerminate();
			throw std::runtime_error("GLFW reports no Vulkan loader");
		}

		// Vulkan owns presentation
		glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
		glfwWindowHint(GLFW_RESIZABLE, desc.resizable ? GLFW_TRUE : GLFW_FALSE);
		glfwWindowHint(GLFW_VISIBLE, desc.visible ? GLFW_TRUE : GLFW_FALSE);

		m_Window = glfwCreateWindow(desc.width, desc.height, m_Title.c_str(), nullptr, nullptr);
		if (!m_Window)
		{
			glfwTerminate();
			throw std::runtime_error("Failed to create GLFW window");
		}

		glfwSetWindowUserPointer(m_Window, this);
		glfwSetFramebufferSizeCallback(m_Window, FramebufferSizeCallback);
		glfwSetWindowIconifyCallback(m_Window, IconifyCallback);
		glfwSetWindowRefreshCallback(m_Window, RefreshCallback);

		int width = 0, height = 0;
		glfwGetFramebufferSize(m_Window, &width, &height);
		m_FramebufferWidth = static_cast<uint32_t>(width);
		m_FramebufferHeight = static_cast<uint32_t>(height);

		LOG_INFO("Framebuffer size: {}x{}", m_FramebufferWidth, m_FramebufferHeight);

		// First frame
		RequestRedraw();
	}

	GlfwWindow::~GlfwWindow()
	{
		if (m_Window)
		{
			glfwDestroyWindow(m_Window);
			m_Window = nullptr;
		}
		glfwTerminate();
		LOG_INFO("GLFW window destroyed");
	}

	void GlfwWindow::PollEvents()
	{
		glfwPollEvents();
		DispatchCloseIfRequested();
	}

	void GlfwWindow::WaitEvents()
	{
		glfwWaitEvents();
		DispatchCloseIfRequested();
	}

	std::vector<const char*> GlfwWindow::GetRequiredInstanceExtensions() const
	{
		uint32_t count = 0;
		const char** names = glfwGetRequiredInstanceExtensions(&count);
		if (!names)
			return {};

		return std::vector<const char*>(names, names + count);
	}

	VkResult GlfwWindow::CreateVulkanSurface(VkInstance instance, VkSurfaceKHR* outSurface) const
	{
		return glfwCreateWindowSurface(instance, m_Window, nullptr, outSurface);
	}

	void GlfwWindow::DispatchCloseIfRequested()
	{
		// Runs after glfwPollEvents/glfwWaitEvents return, never from a GLFW callback
		if (!m_CloseDispatched && m_Window && glfwWindowShouldClose(m_Window))
		{
			m_CloseDispatched = true;
			if (m_CloseCallback)
				m_CloseCallback();
		}
	}

	void GlfwWindow::FramebufferSizeCallback(GLFWwindow* window, int width, int height)
	{
		auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
		if (!self)
			return;

		self->m_FramebufferWidth = static_cast<uint32_t>(width);
		self->m_FramebufferHeight = static_cast<uint32_t>(height);
		self->QueueResize(self->m_FramebufferWidth, self->m_FramebufferHeight);
	}

	void GlfwWindow::IconifyCallback(GLFWwindow* window, int iconified)
	{
		auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
		if (!self)
			return;

		// X11 and Wayland keep the framebuffer size while iconified
		int width = 0, height = 0;
		glfwGetFramebufferSize(window, &width, &height);
		self->m_FramebufferWidth = static_cast<uint32_t>(width);
		self->m_FramebufferHeight = static_cast<uint32_t>(height);

		LOG_DEBUG("Window {}", iconified == GLFW_TRUE ? "iconified" : "restored");
		self->SetIconified(iconified == GLFW_TRUE, self->m_FramebufferWidth, self->m_FramebufferHeight);
	}

	void GlfwWindow::RefreshCallback(GLFWwindow* window)
	{
		auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
		if (self)
			self->RequestRedraw();
	}

	void GlfwWindow::ErrorCallback(int error, const char* description)
	{
		LOG_ERROR("GLFW error {}: {}", error, description);
	}
}
