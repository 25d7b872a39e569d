//------------------------------------------------------------------------------
// FakeWindow.hpp
//
// Window driven by a script instead of a platform event queue. Each
// PollEvents/WaitEvents runs the script once, bracketed in the shared call log.
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Window/Window.hpp"
#include "MockRenderDevice.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace Vireo::Testing
{
	class FakeWindow : public Window
	{
	public:
		using EventScript = std::function<void(FakeWindow& window, uint32_t pumpIndex)>;

		explicit FakeWindow(std::shared_ptr<CallLog> log = std::make_shared<CallLog>(), uint32_t width = 800, uint32_t height = 600)
			: m_Log(std::move(log))
			, m_Width(width)
			, m_Height(height)
		{
		}

		// Runs on every pump, with a 1-based pump index
		EventScript script;

		// Pumps after which the window closes by itself so a broken loop still ends
		uint32_t pumpLimit = 64;

		uint32_t pollCount = 0;
		uint32_t waitCount = 0;

		bool IsOpen() const override { return !m_Closed; }
		void PollEvents() override { ++pollCount; Pump(); }
		void WaitEvents() override { ++waitCount; Pump(); }

		uint32_t GetFramebufferWidth() const override { return IsIconified() ? 0 : m_Width; }
		uint32_t GetFramebufferHeight() const override { return IsIconified() ? 0 : m_Height; }

		std::vector<const char*> GetRequiredInstanceExtensions() const override { return {}; }
		VkResult CreateVulkanSurface(VkInstance, VkSurfaceKHR*) const override { return VK_ERROR_INITIALIZATION_FAILED; }

		// Platform events
		void FramebufferResized(uint32_t width, uint32_t height)
		{
			m_Width = width;
			m_Height = height;
			QueueResize(width, height);
		}

		void Iconify(bool iconified) { SetIconified(iconified, m_Width, m_Height); }

		void Close()
		{
			if (m_Closed)
				return;

			m_Closed = true;
			if (m_CloseCallback)
				m_CloseCallback();
		}

	private:
		void Pump()
		{
			uint32_t pumpIndex = pollCount + waitCount;

			m_Log->push_back("PumpBegin");
			if (script)
				script(*this, pumpIndex);
			m_Log->push_back("PumpEnd");

			if (pumpIndex >= pumpLimit)
				Close();
		}

		std::shared_ptr<CallLog> m_Log;
		uint32_t m_Width;
		uint32_t m_Height;
		bool m_Closed = false;
	};
}
