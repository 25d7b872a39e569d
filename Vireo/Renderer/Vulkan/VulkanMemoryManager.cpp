//------------------------------------------------------------------------------
// VulkanMemoryManager.cpp
//
// VMA implementation for efficient GPU memory management
//------------------------------------------------------------------------------

#define VMA_IMPLEMENTATION

#include "Vireo/Renderer/Vulkan/VulkanMemoryManager.hpp"
#include "Vireo/Renderer/Vulkan/VulkanDevice.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

namespace Vireo
{
	VulkanMemoryManager::VulkanMemoryManager(VulkanDevice* device)
		: m_Device(device)
	{
		LOG_INFO("VulkanMemoryManager created");
	}

	VulkanMemoryManager::~VulkanMemoryManager()
	{
		Shutdown();
		LOG_INFO("VulkanMemoryManager destroyed");
	}

	bool VulkanMemoryManager::Initialize()
	{
		LOG_INFO("Initializing Vulkan Memory Allocator");

		if (!m_Device || m_Device->GetDevice() == VK_NULL_HANDLE)
		{
			LOG_ERROR("VMA requires an initialized device");
			return false;
		}

		// Setup VMA creation info
		VmaVulkanFunctions vulkanFunctions = {};
		vulkanFunctions.vkGetInstanceProcAddr = &vkGetInstanceProcAddr;
		vulkanFunctions.vkGetDeviceProcAddr = &vkGetDeviceProcAddr;

		VmaAllocatorCreateInfo allocatorInfo = {};
		allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_2;
		allocatorInfo.physicalDevice = m_Device->GetPhysicalDevice();
		allocatorInfo.device = m_Device->GetDevice();
		allocatorInfo.instance = m_Device->GetInstance();
		allocatorInfo.pVulkanFunctions = &vulkanFunctions;

		VkResult result = vmaCreateAllocator(&allocatorInfo, &m_Allocator);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create VMA allocator: {}", VulkanUtils::VkResultToString(result));
			m_Allocator = VK_NULL_HANDLE;
			return false;
		}

		LOG_INFO("VMA initialized successfully");
		LogMemoryStats();

		return true;
	}

	void VulkanMemoryManager::Shutdown()
	{
		if (m_Allocator == VK_NULL_HANDLE)
			return;

		LOG_INFO("Shutting down VMA");

		// Log final memory stats before cleanup
		LogMemoryStats();

		if (m_LiveBlocks > 0)
		{
			LOG_WARN("{} arena blocks still alive at VMA shutdown", m_LiveBlocks);
		}

		vmaDestroyAllocator(m_Allocator);
		m_Allocator = VK_NULL_HANDLE;

		LOG_INFO("VMA shutdown complete");
	}

	VkResult VulkanMemoryManager::CreateBlock(VkDeviceSize size, VkBufferUsageFlags usage, ArenaBlock& outBlock)
	{
		if (m_Allocator == VK_NULL_HANDLE)
			return VK_ERROR_INITIALIZATION_FAILED;

		VkBufferCreateInfo bufferInfo{};
		bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
		bufferInfo.size = size;
		bufferInfo.usage = usage;
		bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

		// Written once by the CPU, read by the GPU, kept mapped for the block's lifetime
		VmaAllocationCreateInfo allocInfo{};
		allocInfo.usage = VMA_MEMORY_USAGE_AUTO;
		allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
			VMA_ALLOCATION_CREATE_MAPPED_BIT;

		VkBuffer buffer = VK_NULL_HANDLE;
		VmaAllocation allocation = VK_NULL_HANDLE;
		VmaAllocationInfo allocationInfo{};

		VkResult result = vmaCreateBuffer(m_Allocator, &bufferInfo, &allocInfo, &buffer, &allocation, &allocationInfo);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create arena block of {} bytes: {}", size, VulkanUtils::VkResultToString(result));
			return result;
		}

		outBlock.buffer = buffer;
		outBlock.mappedData = allocationInfo.pMappedData;
		outBlock.size = size;
		outBlock.allocation = allocation;

		++m_LiveBlocks;
		LOG_DEBUG("Created arena block: {} bytes", size);
		return VK_SUCCESS;
	}

	void VulkanMemoryManager::FlushBlock(const ArenaBlock& block, VkDeviceSize offset, VkDeviceSize size)
	{
		// No-op for coherent memory
		VkResult result = vmaFlushAllocation(m_Allocator, static_cast<VmaAllocation>(block.allocation), offset, size);
		if (result != VK_SUCCESS)
		{
			LOG_WARN("vmaFlushAllocation failed: {}", VulkanUtils::VkResultToString(result));
		}
	}

	void VulkanMemoryManager::DestroyBlock(ArenaBlock& block)
	{
		if (block.buffer == VK_NULL_HANDLE || m_Allocator == VK_NULL_HANDLE)
			return;

		vmaDestroyBuffer(m_Allocator, block.buffer, static_cast<VmaAllocation>(block.allocation));
		block = ArenaBlock{};
		--m_LiveBlocks;
	}

	VulkanMemoryManager::MemoryStats VulkanMemoryManager::GetMemoryStats() const
	{
		MemoryStats stats = {};
		if (m_Allocator == VK_NULL_HANDLE)
			return stats;

		// Get detailed stats from VMA
		VmaTotalStatistics vmaStats = {};
		vmaCalculateStatistics(m_Allocator, &vmaStats);

		stats.totalAllocatedBytes = vmaStats.total.statistics.blockBytes;
		stats.totalUsedBytes = vmaStats.total.statistics.allocationBytes;
		stats.allocationCount = vmaStats.total.statistics.allocationCount;

		// Budget info for the heaps that actually exist
		const VkPhysicalDeviceMemoryProperties* memoryProperties = nullptr;
		vmaGetMemoryProperties(m_Allocator, &memoryProperties);

		VmaBudget budgets[VK_MAX_MEMORY_HEAPS] = {};
		vmaGetHeapBudgets(m_Allocator, budgets);

		for (uint32_t i = 0; i < memoryProperties->memoryHeapCount; ++i)
		{
			stats.totalDeviceMemory += budgets[i].budget;
			stats.usedDeviceMemory += budgets[i].usage;
		}

		return stats;
	}

	void VulkanMemoryManager::LogMemoryStats() const
	{
		auto stats = GetMemoryStats();

		LOG_INFO("=== VMA Memory Statistics ===");
		LOG_INFO("  Allocations: {}", stats.allocationCount);
		LOG_INFO("  Used Memory: {:.2f} MB / {:.2f} MB",
			stats.totalUsedBytes / (1024.0 * 1024.0),
			stats.totalAllocatedBytes / (1024.0 * 1024.0));
		LOG_INFO("  Device Memory: {:.2f} MB / {:.2f} MB",
			stats.usedDeviceMemory / (1024.0 * 1024.0),
			stats.totalDeviceMemory / (1024.0 * 1024.0));
		LOG_INFO("  Arena Blocks: {}", m_LiveBlocks);
	}
}
