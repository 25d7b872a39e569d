//------------------------------------------------------------------------------
// RenderContext.hpp
//
// Owns everything a running renderer needs and tears it down in dependency
// order: pipeline -> frame allocator and its memory -> swapchain/surface -> device
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/RenderDevice.hpp"
#include "Vireo/Renderer/FramePacing.hpp"
#include "Vireo/Renderer/FrameDriver.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace Vireo
{
	class SwapchainManager;
	class FrameAllocator;
	class CommandRecorder;
	class IArenaBlockSource;

	struct ShaderBinaries
	{
		std::vector<uint32_t> vertex;
		std::vector<uint32_t> fragment;
	};

	struct RenderContextConfig
	{
		RenderContextConfig(FramePacing pacing, bool vsync, VkDeviceSize arenaBlockSize,
			const std::array<float, 4>& clearColor)
			: pacing(pacing)
			, vsync(vsync)
			, arenaBlockSize(arenaBlockSize)
			, clearColor(clearColor)
		{
		}

		FramePacing pacing;
		bool vsync;                          // FIFO when true, mailbox (if offered) otherwise
		VkDeviceSize arenaBlockSize;
		std::array<float, 4> clearColor;
		VkFormat preferredFormat = VK_FORMAT_B8G8R8A8_SRGB;
		VkColorSpaceKHR preferredColorSpace = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
		VkDeviceSize arenaAlignment = 16;
	};

	class RenderContext
	{
	public:
		// Takes ownership of the device, the block source and the surface.
		// Returns nullptr (after logging) if any part fails to come up.
		static std::unique_ptr<RenderContext> Create(std::unique_ptr<RenderDevice> device,
			std::unique_ptr<IArenaBlockSource> blockSource,
			VkSurfaceKHR surface, VkExtent2D drawableExtent,
			ShaderBinaries shaders, const RenderContextConfig& config);

		~RenderContext();

		// Idempotent
		void Teardown();

		FrameDriver& GetFrameDriver() { return *m_Driver; }
		SwapchainManager& GetSwapchain() { return *m_Swapchain; }
		FrameAllocator& GetAllocator() { return *m_Allocator; }
		RenderDevice& GetDevice() { return *m_Device; }
		const GraphicsPipeline& GetPipeline() const { return m_Pipeline; }
		bool IsTornDown() const { return m_TornDown; }

	private:
		RenderContext() = default;

		std::unique_ptr<RenderDevice> m_Device;
		std::unique_ptr<IArenaBlockSource> m_BlockSource;
		std::unique_ptr<SwapchainManager> m_Swapchain;
		GraphicsPipeline m_Pipeline;
		std::unique_ptr<FrameAllocator> m_Allocator;
		std::unique_ptr<CommandRecorder> m_Recorder;
		std::unique_ptr<FrameDriver> m_Driver;
		bool m_TornDown = false;

		RenderContext(const RenderContext&) = delete;
		RenderContext& operator=(const RenderContext&) = delete;
	};
}
