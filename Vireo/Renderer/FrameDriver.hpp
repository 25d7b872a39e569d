//------------------------------------------------------------------------------
// FrameDriver.hpp
//
// Runs one frame per redraw: acquire -> allocate -> record -> execute -> present
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/FramePacing.hpp"
#include "Vireo/Renderer/Vertex.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace Vireo
{
	class SwapchainManager;
	class FrameAllocator;
	class CommandRecorder;
	struct GraphicsPipeline;

	enum class FrameResult
	{
		Presented,
		Skipped
	};

	// The mesh submitted every frame
	struct FrameGeometry
	{
		std::vector<ColoredVertex> vertices;
		std::vector<uint32_t> indices;
	};

	class FrameDriver
	{
	public:
		FrameDriver(SwapchainManager* swapchain, FrameAllocator* allocator, CommandRecorder* recorder,
			const GraphicsPipeline* pipeline, FramePacing pacing);
		~FrameDriver() = default;

		void SetGeometry(FrameGeometry geometry) { m_Geometry = std::move(geometry); }
		const FrameGeometry& GetGeometry() const { return m_Geometry; }

		// Invoked after every presented frame to ask the event source for the next redraw
		void SetRedrawCallback(std::function<void()> callback) { m_RequestRedraw = std::move(callback); }

		// Throws RenderError on unrecoverable failures
		FrameResult DrawFrame();

		// Window resize. A zero dimension suspends rendering until a nonzero resize.
		// If the swapchain can't be rebuilt the RenderError propagates and rendering stays suspended.
		void OnResize(uint32_t width, uint32_t height);

		bool IsMinimized() const { return m_Minimized; }
		FramePacing GetPacing() const { return m_Pacing; }
		uint64_t GetFrameCount() const { return m_FrameCount; }

	private:
		void RequestRedraw();

		SwapchainManager* m_Swapchain = nullptr;
		FrameAllocator* m_Allocator = nullptr;
		CommandRecorder* m_Recorder = nullptr;
		const GraphicsPipeline* m_Pipeline = nullptr;
		FramePacing m_Pacing = FramePacing::Synchronous;

		FrameGeometry m_Geometry;
		std::function<void()> m_RequestRedraw;

		bool m_Minimized = false;
		uint64_t m_FrameCount = 0;

		FrameDriver(const FrameDriver&) = delete;
		FrameDriver& operator=(const FrameDriver&) = delete;
	};
}
