//------------------------------------------------------------------------------
// RenderLoop.hpp
//
// Event-facing state machine around the render context:
//   NotStarted -> Running -> ShuttingDown
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/RenderContext.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <variant>

namespace Vireo
{
	class RenderLoop
	{
	public:
		struct NotStarted {};
		struct Running
		{
			std::unique_ptr<RenderContext> context;
		};
		struct ShuttingDown {};

		using State = std::variant<NotStarted, Running, ShuttingDown>;

		// Builds the context on Start(). Returning nullptr aborts startup.
		using ContextFactory = std::function<std::unique_ptr<RenderContext>()>;

		explicit RenderLoop(ContextFactory factory);
		~RenderLoop();

		bool Start();

		// Window events
		void OnResize(uint32_t width, uint32_t height);
		void OnCloseRequested();
		FrameResult OnRedrawRequested();

		void SetRedrawCallback(std::function<void()> callback);

		bool IsRunning() const { return std::holds_alternative<Running>(m_State); }
		bool IsShutDown() const { return std::holds_alternative<ShuttingDown>(m_State); }
		const State& GetState() const { return m_State; }

		// nullptr unless running
		RenderContext* GetContext();

	private:
		ContextFactory m_Factory;
		std::function<void()> m_RedrawCallback;
		State m_State;

		RenderLoop(const RenderLoop&) = delete;
		RenderLoop& operator=(const RenderLoop&) = delete;
	};
}
