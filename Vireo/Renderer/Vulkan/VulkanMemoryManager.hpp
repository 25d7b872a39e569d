//------------------------------------------------------------------------------
// VulkanMemoryManager.hpp
//
// Manages memory allocation using Vulkan Memory Allocator (VMA) and supplies
// the persistently mapped blocks behind the frame allocator
//------------------------------------------------------------------------------

#pragma once

#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"
#include "Vireo/Renderer/Components/FrameAllocator.hpp"

// VMA Configuration
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1

#include <vk_mem_alloc.h>

#include <cstddef>

namespace Vireo
{
	class VulkanDevice;

	// Centralizes all GPU memory management through VMA
	class VulkanMemoryManager : public IArenaBlockSource
	{
	public:
		explicit VulkanMemoryManager(VulkanDevice* device);
		~VulkanMemoryManager() override;

		// Initialize VMA
		bool Initialize();
		void Shutdown();

		// IArenaBlockSource: host-sequential-write, persistently mapped buffers
		VkResult CreateBlock(VkDeviceSize size, VkBufferUsageFlags usage, ArenaBlock& outBlock) override;
		void FlushBlock(const ArenaBlock& block, VkDeviceSize offset, VkDeviceSize size) override;
		void DestroyBlock(ArenaBlock& block) override;

		// Statistics and debugging
		struct MemoryStats
		{
			size_t totalAllocatedBytes = 0;
			size_t totalUsedBytes = 0;
			size_t allocationCount = 0;
			size_t totalDeviceMemory = 0;
			size_t usedDeviceMemory = 0;
		};

		MemoryStats GetMemoryStats() const;
		void LogMemoryStats() const;

		// Get the allocator for advanced usage
		VmaAllocator GetAllocator() const { return m_Allocator; }
		size_t GetLiveBlockCount() const { return m_LiveBlocks; }

	private:
		VulkanDevice* m_Device = nullptr;
		VmaAllocator m_Allocator = VK_NULL_HANDLE;
		size_t m_LiveBlocks = 0;

		VulkanMemoryManager(const VulkanMemoryManager&) = delete;
		VulkanMemoryManager& operator=(const VulkanMemoryManager&) = delete;
	};
}
