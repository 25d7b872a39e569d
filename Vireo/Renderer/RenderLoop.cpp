//------------------------------------------------------------------------------
// RenderLoop.cpp
//------------------------------------------------------------------------------

#include "Vireo/Renderer/RenderLoop.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <type_traits>
#include <utility>

namespace Vireo
{
	RenderLoop::RenderLoop(ContextFactory factory)
		: m_Factory(std::move(factory))
		, m_State(NotStarted{})
	{
	}

	RenderLoop::~RenderLoop()
	{
		OnCloseRequested();
	}

	bool RenderLoop::Start()
	{
		if (!std::holds_alternative<NotStarted>(m_State))
		{
			LOG_WARN("RenderLoop already started");
			return IsRunning();
		}

		std::unique_ptr<RenderContext> context = m_Factory ? m_Factory() : nullptr;
		if (!context)
		{
			LOG_ERROR("Failed to create render context");
			m_State = ShuttingDown{};
			return false;
		}

		if (m_RedrawCallback)
		{
			context->GetFrameDriver().SetRedrawCallback(m_RedrawCallback);
		}

		m_State = Running{ std::move(context) };
		LOG_INFO("Render loop running");
		return true;
	}

	void RenderLoop::OnResize(uint32_t width, uint32_t height)
	{
		std::visit([width, height](auto& state)
			{
				using T = std::decay_t<decltype(state)>;
				if constexpr (std::is_same_v<T, Running>)
				{
					LOG_DEBUG("Resize event {}x{}", width, height);
					state.context->GetFrameDriver().OnResize(width, height);
				}
			}, m_State);
	}

	void RenderLoop::OnCloseRequested()
	{
		std::visit([](auto& state)
			{
				using T = std::decay_t<decltype(state)>;
				if constexpr (std::is_same_v<T, Running>)
				{
					LOG_INFO("Close requested, shutting down");
					state.context->Teardown();
				}
			}, m_State);

		m_State = ShuttingDown{};
	}

	FrameResult RenderLoop::OnRedrawRequested()
	{
		return std::visit([](auto& state) -> FrameResult
			{
				using T = std::decay_t<decltype(state)>;
				if constexpr (std::is_same_v<T, Running>)
					return state.context->GetFrameDriver().DrawFrame();
				else
					return FrameResult::Skipped;
			}, m_State);
	}

	void RenderLoop::SetRedrawCallback(std::function<void()> callback)
	{
		m_RedrawCallback = std::move(callback);

		if (auto* running = std::get_if<Running>(&m_State))
		{
			running->context->GetFrameDriver().SetRedrawCallback(m_RedrawCallback);
		}
	}

	RenderContext* RenderLoop::GetContext()
	{
		if (auto* running = std::get_if<Running>(&m_State))
			return running->context.get();
		return nullptr;
	}
}
