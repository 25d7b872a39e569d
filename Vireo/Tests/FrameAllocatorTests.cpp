//------------------------------------------------------------------------------
// FrameAllocatorTests.cpp
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Vireo/Renderer/Components/FrameAllocator.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Vireo/Renderer/Vertex.hpp"
#include "Mocks/MockRenderDevice.hpp"
#include "Mocks/HostArenaBlockSource.hpp"

#include <cstring>
#include <stdexcept>

namespace Vireo
{
	using Testing::CountCalls;
	using Testing::HostArenaBlockSource;
	using Testing::IndexOfCall;
	using Testing::MockRenderDevice;

	class FrameAllocatorTest : public ::testing::Test
	{
	protected:
		std::unique_ptr<FrameAllocator> MakeAllocator(uint32_t slots = 2, VkDeviceSize blockSize = 1024)
		{
			return std::make_unique<FrameAllocator>(&m_Device, &m_Blocks, FrameAllocatorConfig(slots, blockSize, 16));
		}

		MockRenderDevice m_Device;
		HostArenaBlockSource m_Blocks{ m_Device.GetSharedLog() };
	};

	TEST_F(FrameAllocatorTest, RejectsBadConfig)
	{
		EXPECT_THROW(FrameAllocator(nullptr, &m_Blocks, FrameAllocatorConfig(2, 1024, 16)), std::invalid_argument);
		EXPECT_THROW(FrameAllocator(&m_Device, &m_Blocks, FrameAllocatorConfig(0, 1024, 16)), std::invalid_argument);
		EXPECT_THROW(FrameAllocator(&m_Device, &m_Blocks, FrameAllocatorConfig(2, 0, 16)), std::invalid_argument);
		EXPECT_THROW(FrameAllocator(&m_Device, &m_Blocks, FrameAllocatorConfig(2, 1024, 12)), std::invalid_argument);
	}

	TEST_F(FrameAllocatorTest, CopiesVertexAndIndexData)
	{
		auto allocator = MakeAllocator();
		allocator->BeginFrame(0);

		std::vector<ColoredVertex> vertices = {
			{ { -0.5f, -0.5f, 0.0f }, { 1.0f, 0.0f, 0.0f } },
			{ {  0.5f, -0.5f, 0.0f }, { 0.0f, 1.0f, 0.0f } },
			{ {  0.5f,  0.5f, 0.0f }, { 0.0f, 0.0f, 1.0f } },
			{ { -0.5f,  0.5f, 0.0f }, { 1.0f, 1.0f, 1.0f } }
		};
		std::vector<uint32_t> indices = { 0, 1, 2, 2, 3, 0 };

		TransientBuffer vb = allocator->AllocateVertexBuffer(vertices);
		TransientBuffer ib = allocator->AllocateIndexBuffer(indices);

		EXPECT_EQ(vb.count, 4u);
		EXPECT_EQ(vb.stride, sizeof(ColoredVertex));
		EXPECT_EQ(ib.count, 6u);
		EXPECT_EQ(ib.stride, sizeof(uint32_t));
		EXPECT_EQ(ib.offset % 16, 0u);
		EXPECT_GE(ib.offset, vb.offset + vb.SizeInBytes());

		const uint8_t* block = m_Blocks.GetBlockData(vb.buffer);
		ASSERT_NE(block, nullptr);
		EXPECT_EQ(std::memcmp(block + vb.offset, vertices.data(), vb.SizeInBytes()), 0);
		EXPECT_EQ(std::memcmp(m_Blocks.GetBlockData(ib.buffer) + ib.offset, indices.data(), ib.SizeInBytes()), 0);
		EXPECT_EQ(m_Blocks.flushCount, 2u);

		auto stats = allocator->GetStats();
		EXPECT_EQ(stats.allocationsThisFrame, 2u);
		EXPECT_EQ(stats.blockCount, 1u);
	}

	TEST_F(FrameAllocatorTest, EmptyInputYieldsEmptyBuffer)
	{
		auto allocator = MakeAllocator();
		allocator->BeginFrame(0);

		TransientBuffer ib = allocator->AllocateIndexBuffer({});
		EXPECT_TRUE(ib.IsEmpty());
		EXPECT_EQ(m_Blocks.createdSizes.size(), 0u);
	}

	TEST_F(FrameAllocatorTest, ArenaGrowsByDoubling)
	{
		auto allocator = MakeAllocator(1, 256);
		allocator->BeginFrame(0);

		std::vector<uint32_t> data(48, 7); // 192 bytes
		allocator->AllocateIndexBuffer(data);
		allocator->AllocateIndexBuffer(data); // doesn't fit in the first 256 bytes
		allocator->AllocateIndexBuffer(data);
		allocator->AllocateIndexBuffer(data); // third block

		ASSERT_EQ(m_Blocks.createdSizes.size(), 3u);
		EXPECT_EQ(m_Blocks.createdSizes[0], 256u);
		EXPECT_EQ(m_Blocks.createdSizes[1], 512u);
		EXPECT_EQ(m_Blocks.createdSizes[2], 1024u);
	}

	TEST_F(FrameAllocatorTest, OversizedRequestGetsItsOwnBlock)
	{
		auto allocator = MakeAllocator(1, 256);
		allocator->BeginFrame(0);

		std::vector<uint32_t> large(1000, 1); // 4000 bytes
		TransientBuffer ib = allocator->AllocateIndexBuffer(large);

		ASSERT_EQ(m_Blocks.createdSizes.size(), 1u);
		EXPECT_GE(m_Blocks.createdSizes[0], 4000u);
		EXPECT_EQ(ib.offset, 0u);
	}

	TEST_F(FrameAllocatorTest, RecyclingASlotReusesItsBlocks)
	{
		auto allocator = MakeAllocator(2, 1024);
		std::vector<uint32_t> indices = { 0, 1, 2 };

		for (int frame = 0; frame < 6; ++frame)
		{
			allocator->BeginFrame(static_cast<uint32_t>(frame % 2));
			allocator->AllocateIndexBuffer(indices);
		}

		// One block per slot, never more
		EXPECT_EQ(m_Blocks.createdSizes.size(), 2u);
		EXPECT_EQ(allocator->GetStats().totalAllocations, 6u);
		EXPECT_EQ(allocator->GetStats().allocationsThisFrame, 1u);
	}

	TEST_F(FrameAllocatorTest, BlockCreationFailureIsFatal)
	{
		auto allocator = MakeAllocator();
		allocator->BeginFrame(0);
		m_Blocks.createResult = VK_ERROR_OUT_OF_DEVICE_MEMORY;

		try
		{
			allocator->AllocateIndexBuffer({ 0, 1, 2 });
			FAIL() << "expected RenderError";
		}
		catch (const RenderError& e)
		{
			EXPECT_EQ(e.GetResult(), VK_ERROR_OUT_OF_DEVICE_MEMORY);
		}
	}

	TEST_F(FrameAllocatorTest, UnmappedBlockIsRejected)
	{
		m_Blocks.hostVisible = false;
		auto allocator = MakeAllocator();
		allocator->BeginFrame(0);

		EXPECT_THROW(allocator->AllocateIndexBuffer({ 0, 1, 2 }), RenderError);
	}

	TEST_F(FrameAllocatorTest, SlotOutOfRangeThrows)
	{
		auto allocator = MakeAllocator(2);
		EXPECT_THROW(allocator->BeginFrame(2), std::out_of_range);
	}

	TEST_F(FrameAllocatorTest, CommandContextsAreRecycledPerSlot)
	{
		auto allocator = MakeAllocator(2);

		allocator->BeginFrame(0);
		CommandContext first = allocator->AllocateCommandContext(0, CommandUsage::SingleSubmit);
		EXPECT_NE(first.commandBuffer, VK_NULL_HANDLE);
		EXPECT_EQ(first.frameSlot, 0u);
		EXPECT_EQ(first.queueFamily, 0u);
		ASSERT_FALSE(m_Device.beginUsages.empty());
		EXPECT_EQ(m_Device.beginUsages.back(), static_cast<VkCommandBufferUsageFlags>(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT));

		allocator->BeginFrame(1);
		CommandContext second = allocator->AllocateCommandContext(0, CommandUsage::SingleSubmit);
		EXPECT_NE(second.commandBuffer, first.commandBuffer);

		// Back to slot 0: its pool is reset and its buffer handed out again
		m_Device.ClearLog();
		allocator->BeginFrame(0);
		CommandContext again = allocator->AllocateCommandContext(0, CommandUsage::SingleSubmit);

		EXPECT_EQ(again.commandBuffer, first.commandBuffer);
		EXPECT_EQ(CountCalls(m_Device.GetLog(), "ResetCommandPool"), 1u);
		EXPECT_EQ(CountCalls(m_Device.GetLog(), "AllocateCommandBuffer"), 0u);
		EXPECT_EQ(CountCalls(m_Device.GetLog(), "CreateCommandPool"), 0u);
		EXPECT_EQ(m_Device.liveCommandPools, 2u);
	}

	TEST_F(FrameAllocatorTest, SeparatePoolPerQueueFamily)
	{
		auto allocator = MakeAllocator(1);
		allocator->BeginFrame(0);

		allocator->AllocateCommandContext(0, CommandUsage::SingleSubmit);
		allocator->AllocateCommandContext(1, CommandUsage::MultipleSubmit);
		allocator->AllocateCommandContext(0, CommandUsage::SimultaneousUse);

		EXPECT_EQ(m_Device.liveCommandPools, 2u);
		EXPECT_EQ(m_Device.allocatedCommandBuffers.size(), 3u);
	}

	TEST_F(FrameAllocatorTest, CommandPoolFailureThrows)
	{
		auto allocator = MakeAllocator(1);
		allocator->BeginFrame(0);
		m_Device.createCommandPoolResult = VK_ERROR_OUT_OF_HOST_MEMORY;

		EXPECT_THROW(allocator->AllocateCommandContext(0, CommandUsage::SingleSubmit), RenderError);
	}

	TEST_F(FrameAllocatorTest, DeferredReleasesRunWhenSlotIsRecycled)
	{
		auto allocator = MakeAllocator(2);
		int released = 0;

		allocator->BeginFrame(0);
		allocator->DeferRelease([&released]() { ++released; });

		allocator->BeginFrame(1);
		EXPECT_EQ(released, 0);

		allocator->BeginFrame(0);
		EXPECT_EQ(released, 1);

		allocator->BeginFrame(1);
		allocator->BeginFrame(0);
		EXPECT_EQ(released, 1);
	}

	TEST_F(FrameAllocatorTest, ShutdownReleasesEverything)
	{
		auto allocator = MakeAllocator(2);
		int released = 0;

		allocator->BeginFrame(0);
		allocator->AllocateIndexBuffer({ 0, 1, 2 });
		allocator->AllocateCommandContext(0, CommandUsage::SingleSubmit);
		allocator->DeferRelease([&released]() { ++released; });
		allocator->BeginFrame(1);
		allocator->AllocateIndexBuffer({ 0, 1, 2 });

		allocator->Shutdown();

		EXPECT_EQ(released, 1);
		EXPECT_EQ(m_Blocks.GetLiveBlockCount(), 0u);
		EXPECT_EQ(m_Device.liveCommandPools, 0u);

		// Releases arriving after shutdown run immediately
		allocator->DeferRelease([&released]() { ++released; });
		EXPECT_EQ(released, 2);

		EXPECT_THROW(allocator->BeginFrame(0), RenderError);

		size_t destroyed = m_Blocks.destroyedBlocks;
		allocator->Shutdown();
		EXPECT_EQ(m_Blocks.destroyedBlocks, destroyed);
	}
}
