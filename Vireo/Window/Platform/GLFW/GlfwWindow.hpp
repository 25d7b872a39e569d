//------------------------------------------------------------------------------
// GlfwWindow.hpp
//
// GLFW window with no client API, used for Vulkan presentation on every platform
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Window/Window.hpp"

#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

#include <string>

namespace Vireo
{
	class GlfwWindow : public Window
	{
	public:
		// Throws std::runtime_error when GLFW or the window can't be created
		explicit GlfwWindow(const WindowDesc& desc);
		~GlfwWindow() override;

		// Window interface implementation
		bool IsOpen() const override { return m_Window != nullptr && !glfwWindowShouldClose(m_Window); }
		void PollEvents() override;
		void WaitEvents() override;

		uint32_t GetFramebufferWidth() const override { return IsIconified() ? 0 : m_FramebufferWidth; }
		uint32_t GetFramebufferHeight() const override { return IsIconified() ? 0 : m_FramebufferHeight; }

		std::vector<const char*> GetRequiredInstanceExtensions() const override;
		VkResult CreateVulkanSurface(VkInstance instance, VkSurfaceKHR* outSurface) const override;

		GLFWwindow* GetNativeHandle() const { return m_Window; }

	private:
		static void FramebufferSizeCallback(GLFWwindow* window, int width, int height);
		static void IconifyCallback(GLFWwindow* window, int iconified);
		static void RefreshCallback(GLFWwindow* window);
		static void ErrorCallback(int error, const char* description);

		void DispatchCloseIfRequested();

	private:
		GLFWwindow* m_Window = nullptr;
		std::string m_Title;
		uint32_t m_FramebufferWidth = 0;
		uint32_t m_FramebufferHeight = 0;
		bool m_CloseDispatched = false;

		GlfwWindow(const GlfwWindow&) = delete;
		GlfwWindow& operator=(const GlfwWindow&) = delete;
	};
}
