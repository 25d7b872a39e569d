//------------------------------------------------------------------------------
// FrameAllocator.hpp
//
// Per-frame transient allocations: vertex/index data, command buffers, and
// deferred releases. Each frame slot owns a growable arena of mapped blocks
// that is recycled wholesale by BeginFrame once the slot's previous frame
// has completed on the GPU.
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"

#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <type_traits>
#include <vector>

namespace Vireo
{
	class RenderDevice;

	// A persistently mapped buffer the arena sub-allocates from
	struct ArenaBlock
	{
		VkBuffer buffer = VK_NULL_HANDLE;
		void* mappedData = nullptr;
		VkDeviceSize size = 0;
		void* allocation = nullptr;   // backend allocation handle (VmaAllocation for VMA)
	};

	// Where arena blocks come from. VulkanMemoryManager backs it with VMA.
	class IArenaBlockSource
	{
	public:
		virtual ~IArenaBlockSource() = default;

		virtual VkResult CreateBlock(VkDeviceSize size, VkBufferUsageFlags usage, ArenaBlock& outBlock) = 0;
		virtual void FlushBlock(const ArenaBlock& block, VkDeviceSize offset, VkDeviceSize size) = 0;
		virtual void DestroyBlock(ArenaBlock& block) = 0;
	};

	// Region of an arena block holding `count` elements of `stride` bytes
	struct TransientBuffer
	{
		VkBuffer buffer = VK_NULL_HANDLE;
		VkDeviceSize offset = 0;
		uint32_t count = 0;
		uint32_t stride = 0;

		VkDeviceSize SizeInBytes() const { return static_cast<VkDeviceSize>(count) * stride; }
		bool IsEmpty() const { return buffer == VK_NULL_HANDLE || count == 0; }
	};

	enum class CommandUsage
	{
		SingleSubmit,
		MultipleSubmit,
		SimultaneousUse
	};

	VkCommandBufferUsageFlags ToVkCommandBufferUsage(CommandUsage usage);

	// A primary command buffer already in the recording state
	struct CommandContext
	{
		VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
		uint32_t queueFamily = 0;
		uint32_t frameSlot = 0;
	};

	struct FrameAllocatorConfig
	{
		FrameAllocatorConfig(uint32_t slotCount, VkDeviceSize initialBlockSize, VkDeviceSize minAlignment)
			: slotCount(slotCount)
			, initialBlockSize(initialBlockSize)
			, minAlignment(minAlignment)
		{
		}

		uint32_t slotCount;
		VkDeviceSize initialBlockSize;
		VkDeviceSize minAlignment;     // power of two
	};

	struct FrameAllocatorStats
	{
		uint32_t blockCount = 0;
		VkDeviceSize reservedBytes = 0;
		VkDeviceSize usedBytesThisFrame = 0;
		uint32_t allocationsThisFrame = 0;
		uint64_t totalAllocations = 0;
	};

	class FrameAllocator
	{
	public:
		// Throws std::invalid_argument for a bad config
		FrameAllocator(RenderDevice* device, IArenaBlockSource* blockSource, const FrameAllocatorConfig& config);
		~FrameAllocator();

		// Recycles the slot: runs its deferred releases, resets its command pools and rewinds its arena.
		// Only call once the GPU is done with the slot's previous frame.
		void BeginFrame(uint32_t slot);

		template<typename T>
		TransientBuffer AllocateVertexBuffer(const std::vector<T>& vertices)
		{
			static_assert(std::is_trivially_copyable_v<T>, "Vertex type must be trivially copyable");
			return Allocate(vertices.data(), static_cast<uint32_t>(vertices.size()), static_cast<uint32_t>(sizeof(T)));
		}

		TransientBuffer AllocateIndexBuffer(const std::vector<uint32_t>& indices);

		// Throws RenderError when the pool or buffer can't be created or begun
		CommandContext AllocateCommandContext(uint32_t queueFamily, CommandUsage usage);

		// Runs when the current slot is next recycled, or at Shutdown
		void DeferRelease(std::function<void()> release);

		void Shutdown();

		uint32_t GetCurrentSlot() const { return m_CurrentSlot; }
		uint32_t GetSlotCount() const { return m_Config.slotCount; }
		FrameAllocatorStats GetStats() const;
		void LogStats() const;

	private:
		// Buffers are kept across resets and handed out again from the start
		struct CommandPoolState
		{
			VkCommandPool pool = VK_NULL_HANDLE;
			std::vector<VkCommandBuffer> buffers;
			size_t nextFree = 0;
		};

		struct SlotArena
		{
			std::vector<ArenaBlock> blocks;
			size_t activeBlock = 0;
			VkDeviceSize offset = 0;
			VkDeviceSize usedBytes = 0;
			uint32_t allocationCount = 0;

			std::map<uint32_t, CommandPoolState> commandPools; // by queue family
			std::vector<std::function<void()>> deferredReleases;
		};

		TransientBuffer Allocate(const void* data, uint32_t count, uint32_t stride);
		ArenaBlock& AddBlock(SlotArena& arena, VkDeviceSize minimumSize);
		void RunDeferredReleases(SlotArena& arena);

		static VkDeviceSize AlignUp(VkDeviceSize value, VkDeviceSize alignment)
		{
			return (value + alignment - 1) & ~(alignment - 1);
		}

	private:
		RenderDevice* m_Device = nullptr;
		IArenaBlockSource* m_BlockSource = nullptr;
		FrameAllocatorConfig m_Config;

		std::vector<SlotArena> m_Slots;
		uint32_t m_CurrentSlot = 0;
		uint64_t m_TotalAllocations = 0;
		bool m_Shutdown = false;

		FrameAllocator(const FrameAllocator&) = delete;
		FrameAllocator& operator=(const FrameAllocator&) = delete;
	};
}
