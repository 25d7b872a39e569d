//------------------------------------------------------------------------------
// FrameAllocator.cpp
//
// Ring of per-slot arenas and transient command pools
//------------------------------------------------------------------------------

#include "Vireo/Renderer/Components/FrameAllocator.hpp"
#include "Vireo/Renderer/RenderDevice.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace Vireo
{
	VkCommandBufferUsageFlags ToVkCommandBufferUsage(CommandUsage usage)
	{
		switch (usage)
		{
		case CommandUsage::SingleSubmit: return VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
		case CommandUsage::SimultaneousUse: return VK_COMMAND_BUFFER_USAGE_SIMULTANEOUS_USE_BIT;
		case CommandUsage::MultipleSubmit:
		default:
			return 0;
		}
	}

	FrameAllocator::FrameAllocator(RenderDevice* device, IArenaBlockSource* blockSource, const FrameAllocatorConfig& config)
		: m_Device(device)
		, m_BlockSource(blockSource)
		, m_Config(config)
	{
		if (!m_Device || !m_BlockSource)
			throw std::invalid_argument("FrameAllocator requires a device and a block source");
		if (m_Config.slotCount == 0)
			throw std::invalid_argument("FrameAllocator requires at least one frame slot");
		if (m_Config.initialBlockSize == 0)
			throw std::invalid_argument("FrameAllocator block size must be nonzero");
		if (m_Config.minAlignment == 0 || (m_Config.minAlignment & (m_Config.minAlignment - 1)) != 0)
			throw std::invalid_argument("FrameAllocator alignment must be a power of two");

		m_Slots.resize(m_Config.slotCount);

		LOG_INFO("Frame allocator created ({} slots, {} byte blocks, {} byte alignment)",
			m_Config.slotCount, m_Config.initialBlockSize, m_Config.minAlignment);
	}

	FrameAllocator::~FrameAllocator()
	{
		Shutdown();
	}

	void FrameAllocator::BeginFrame(uint32_t slot)
	{
		if (m_Shutdown)
			throw RenderError("FrameAllocator used after shutdown");
		if (slot >= m_Slots.size())
			throw std::out_of_range(std::format("Frame slot {} out of range ({} slots)", slot, m_Slots.size()));

		SlotArena& arena = m_Slots[slot];

		// Whatever the previous frame in this slot handed us is no longer in use
		RunDeferredReleases(arena);

		for (auto& [queueFamily, poolState] : arena.commandPools)
		{
			VkResult result = m_Device->ResetCommandPool(poolState.pool);
			if (result != VK_SUCCESS)
			{
				throw RenderError(std::format("Failed to reset command pool for queue family {}", queueFamily), result);
			}
			poolState.nextFree = 0;
		}

		arena.activeBlock = 0;
		arena.offset = 0;
		arena.usedBytes = 0;
		arena.allocationCount = 0;

		m_CurrentSlot = slot;
	}

	TransientBuffer FrameAllocator::AllocateIndexBuffer(const std::vector<uint32_t>& indices)
	{
		return Allocate(indices.data(), static_cast<uint32_t>(indices.size()), static_cast<uint32_t>(sizeof(uint32_t)));
	}

	TransientBuffer FrameAllocator::Allocate(const void* data, uint32_t count, uint32_t stride)
	{
		if (m_Shutdown)
			throw RenderError("FrameAllocator used after shutdown");

		TransientBuffer result;
		result.stride = stride;

		if (count == 0)
			return result;

		SlotArena& arena = m_Slots[m_CurrentSlot];
		const VkDeviceSize size = static_cast<VkDeviceSize>(count) * stride;
		const VkDeviceSize alignment = m_Config.minAlignment;

		// Find room in the current block or a later one kept from earlier frames
		VkDeviceSize alignedOffset = 0;
		ArenaBlock* target = nullptr;
		while (arena.activeBlock < arena.blocks.size())
		{
			ArenaBlock& block = arena.blocks[arena.activeBlock];
			alignedOffset = AlignUp(arena.offset, alignment);
			if (alignedOffset + size <= block.size)
			{
				target = &block;
				break;
			}

			++arena.activeBlock;
			arena.offset = 0;
		}

		if (!target)
		{
			target = &AddBlock(arena, size);
			arena.activeBlock = arena.blocks.size() - 1;
			alignedOffset = 0;
		}

		if (!target->mappedData)
		{
			throw RenderError("Frame arena block is not host visible", VK_ERROR_MEMORY_MAP_FAILED);
		}

		std::memcpy(static_cast<uint8_t*>(target->mappedData) + alignedOffset, data, static_cast<size_t>(size));
		m_BlockSource->FlushBlock(*target, alignedOffset, size);

		arena.offset = alignedOffset + size;
		arena.usedBytes += size;
		arena.allocationCount++;
		m_TotalAllocations++;

		result.buffer = target->buffer;
		result.offset = alignedOffset;
		result.count = count;
		return result;
	}

	ArenaBlock& FrameAllocator::AddBlock(SlotArena& arena, VkDeviceSize minimumSize)
	{
		// Each new block at least doubles the previous one
		VkDeviceSize blockSize = arena.blocks.empty() ? m_Config.initialBlockSize : arena.blocks.back().size * 2;
		blockSize = (std::max)(blockSize, AlignUp(minimumSize, m_Config.minAlignment));

		ArenaBlock block;
		VkResult result = m_BlockSource->CreateBlock(blockSize,
			VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_INDEX_BUFFER_BIT, block);
		if (result != VK_SUCCESS)
		{
			throw RenderError(std::format("Failed to grow frame arena by {} bytes", blockSize), result);
		}

		LOG_DEBUG("Frame arena slot {} grew to {} blocks (+{} bytes)", m_CurrentSlot, arena.blocks.size() + 1, blockSize);

		arena.blocks.push_back(block);
		return arena.blocks.back();
	}

	CommandContext FrameAllocator::AllocateCommandContext(uint32_t queueFamily, CommandUsage usage)
	{
		if (m_Shutdown)
			throw RenderError("FrameAllocator used after shutdown");

		SlotArena& arena = m_Slots[m_CurrentSlot];

		auto it = arena.commandPools.find(queueFamily);
		if (it == arena.commandPools.end())
		{
			CommandPoolState poolState;
			VkResult result = m_Device->CreateCommandPool(queueFamily, VK_COMMAND_POOL_CREATE_TRANSIENT_BIT, poolState.pool);
			if (result != VK_SUCCESS)
			{
				throw RenderError(std::format("Failed to create command pool for queue family {}", queueFamily), result);
			}

			LOG_DEBUG("Created transient command pool (slot {}, queue family {})", m_CurrentSlot, queueFamily);
			it = arena.commandPools.emplace(queueFamily, std::move(poolState)).first;
		}

		CommandPoolState& poolState = it->second;
		if (poolState.nextFree == poolState.buffers.size())
		{
			VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
			VkResult result = m_Device->AllocateCommandBuffer(poolState.pool, commandBuffer);
			if (result != VK_SUCCESS)
			{
				throw RenderError("Failed to allocate command buffer", result);
			}
			poolState.buffers.push_back(commandBuffer);
		}

		VkCommandBuffer commandBuffer = poolState.buffers[poolState.nextFree++];

		VkResult result = m_Device->BeginCommandBuffer(commandBuffer, ToVkCommandBufferUsage(usage));
		if (result != VK_SUCCESS)
		{
			throw RenderError("Failed to begin recording command buffer", result);
		}

		CommandContext context;
		context.commandBuffer = commandBuffer;
		context.queueFamily = queueFamily;
		context.frameSlot = m_CurrentSlot;
		return context;
	}

	void FrameAllocator::DeferRelease(std::function<void()> release)
	{
		if (!release)
			return;

		if (m_Shutdown)
		{
			release();
			return;
		}

		m_Slots[m_CurrentSlot].deferredReleases.push_back(std::move(release));
	}

	void FrameAllocator::RunDeferredReleases(SlotArena& arena)
	{
		std::vector<std::function<void()>> releases = std::move(arena.deferredReleases);
		arena.deferredReleases.clear();

		for (auto& release : releases)
		{
			release();
		}
	}

	void FrameAllocator::Shutdown()
	{
		if (m_Shutdown)
			return;

		LOG_INFO("Shutting down frame allocator");
		LogStats();

		for (auto& arena : m_Slots)
		{
			RunDeferredReleases(arena);

			// Destroying a pool frees its command buffers
			for (auto& [queueFamily, poolState] : arena.commandPools)
			{
				m_Device->DestroyCommandPool(poolState.pool);
			}
			arena.commandPools.clear();

			for (auto& block : arena.blocks)
			{
				m_BlockSource->DestroyBlock(block);
			}
			arena.blocks.clear();
			arena.activeBlock = 0;
			arena.offset = 0;
		}

		m_Shutdown = true;
	}

	FrameAllocatorStats FrameAllocator::GetStats() const
	{
		FrameAllocatorStats stats;

		for (const auto& arena : m_Slots)
		{
			stats.blockCount += static_cast<uint32_t>(arena.blocks.size());
			for (const auto& block : arena.blocks)
			{
				stats.reservedBytes += block.size;
			}
		}

		if (m_CurrentSlot < m_Slots.size())
		{
			stats.usedBytesThisFrame = m_Slots[m_CurrentSlot].usedBytes;
			stats.allocationsThisFrame = m_Slots[m_CurrentSlot].allocationCount;
		}
		stats.totalAllocations = m_TotalAllocations;

		return stats;
	}

	void FrameAllocator::LogStats() const
	{
		auto stats = GetStats();

		LOG_DEBUG("=== Frame Allocator Statistics ===");
		LOG_DEBUG("  Arena blocks: {} ({:.2f} KB reserved)", stats.blockCount, stats.reservedBytes / 1024.0);
		LOG_DEBUG("  This frame: {} allocations, {} bytes", stats.allocationsThisFrame, stats.usedBytesThisFrame);
		LOG_DEBUG("  Total allocations: {}", stats.totalAllocations);
	}
}
