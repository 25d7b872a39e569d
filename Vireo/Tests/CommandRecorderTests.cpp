//------------------------------------------------------------------------------
// CommandRecorderTests.cpp
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Vireo/Renderer/Components/CommandRecorder.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Mocks/MockRenderDevice.hpp"
#include "Mocks/HostArenaBlockSource.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace Vireo
{
	using Testing::CountCalls;
	using Testing::HostArenaBlockSource;
	using Testing::IndexOfCall;
	using Testing::MakeFakeHandle;
	using Testing::MockRenderDevice;

	class CommandRecorderTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			m_Allocator = std::make_unique<FrameAllocator>(&m_Device, &m_Blocks, FrameAllocatorConfig(2, 1024, 16));
			m_Allocator->BeginFrame(0);

			m_Pipeline.layout = MakeFakeHandle<VkPipelineLayout>(0x10);
			m_Pipeline.renderPass = MakeFakeHandle<VkRenderPass>(0x11);
			m_Pipeline.pipeline = MakeFakeHandle<VkPipeline>(0x12);

			m_Target.view = MakeFakeHandle<VkImageView>(0x20);
			m_Target.extent = { 800, 600 };

			m_Vertices = m_Allocator->AllocateVertexBuffer(std::vector<ColoredVertex>(4));
			m_Indices = m_Allocator->AllocateIndexBuffer({ 0, 1, 2, 2, 3, 0 });

			m_Device.ClearLog();
		}

		MockRenderDevice m_Device;
		HostArenaBlockSource m_Blocks;
		std::unique_ptr<FrameAllocator> m_Allocator;
		GraphicsPipeline m_Pipeline;
		RenderTarget m_Target;
		TransientBuffer m_Vertices;
		TransientBuffer m_Indices;
	};

	TEST_F(CommandRecorderTest, RecordsOnePassWithOneDraw)
	{
		CommandRecorder recorder(&m_Device, 0);

		VkCommandBuffer cmd = recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 6);
		EXPECT_NE(cmd, VK_NULL_HANDLE);

		const std::vector<std::string> expected = {
			"CreateFramebuffer",
			"CreateCommandPool",
			"AllocateCommandBuffer",
			"BeginCommandBuffer",
			"CmdBeginRenderPass",
			"CmdBindPipeline",
			"CmdSetViewport",
			"CmdSetScissor",
			"CmdBindVertexBuffer",
			"CmdBindIndexBuffer",
			"CmdDrawIndexed",
			"CmdEndRenderPass",
			"EndCommandBuffer"
		};
		EXPECT_EQ(m_Device.GetLog(), expected);

		ASSERT_EQ(m_Device.draws.size(), 1u);
		EXPECT_EQ(m_Device.draws[0].commandBuffer, cmd);
		EXPECT_EQ(m_Device.draws[0].indexCount, 6u);
		EXPECT_EQ(m_Device.draws[0].instanceCount, 1u);
		EXPECT_EQ(m_Device.draws[0].firstIndex, 0u);
		EXPECT_EQ(m_Device.draws[0].vertexOffset, 0);
		EXPECT_EQ(m_Device.draws[0].firstInstance, 0u);

		ASSERT_EQ(m_Device.boundVertexBuffers.size(), 1u);
		EXPECT_EQ(m_Device.boundVertexBuffers[0], m_Vertices.buffer);
		EXPECT_EQ(m_Device.boundIndexBuffers[0], m_Indices.buffer);
	}

	TEST_F(CommandRecorderTest, ViewportAndRenderAreaCoverTheTarget)
	{
		CommandRecorder recorder(&m_Device, 0);
		recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 6);

		ASSERT_EQ(m_Device.viewports.size(), 1u);
		EXPECT_FLOAT_EQ(m_Device.viewports[0].width, 800.0f);
		EXPECT_FLOAT_EQ(m_Device.viewports[0].height, 600.0f);
		EXPECT_FLOAT_EQ(m_Device.viewports[0].maxDepth, 1.0f);

		ASSERT_EQ(m_Device.scissors.size(), 1u);
		EXPECT_EQ(m_Device.scissors[0].extent.width, 800u);

		ASSERT_EQ(m_Device.renderPassBegins.size(), 1u);
		EXPECT_EQ(m_Device.renderPassBegins[0].renderPass, m_Pipeline.renderPass);
		EXPECT_EQ(m_Device.renderPassBegins[0].renderArea.extent.height, 600u);

		ASSERT_EQ(m_Device.framebufferCreations.size(), 1u);
		EXPECT_EQ(m_Device.framebufferCreations[0].width, 800u);
		EXPECT_EQ(m_Device.framebufferCreations[0].layers, 1u);
		EXPECT_EQ(m_Device.framebufferCreations[0].attachmentCount, 1u);
	}

	TEST_F(CommandRecorderTest, UsesConfiguredClearColor)
	{
		CommandRecorder recorder(&m_Device, 0, { 0.0f, 0.25f, 0.5f, 1.0f });
		recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 6);

		ASSERT_EQ(m_Device.clearColors.size(), 1u);
		EXPECT_FLOAT_EQ(m_Device.clearColors[0].float32[1], 0.25f);
		EXPECT_FLOAT_EQ(m_Device.clearColors[0].float32[3], 1.0f);

		recorder.SetClearColor({ 1.0f, 0.0f, 0.0f, 0.0f });
		EXPECT_FLOAT_EQ(recorder.GetClearColor()[0], 1.0f);
	}

	TEST_F(CommandRecorderTest, FramebufferLivesUntilSlotIsRecycled)
	{
		CommandRecorder recorder(&m_Device, 0);
		recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 6);
		EXPECT_EQ(m_Device.liveFramebuffers, 1u);

		m_Allocator->BeginFrame(1);
		EXPECT_EQ(m_Device.liveFramebuffers, 1u);

		m_Allocator->BeginFrame(0);
		EXPECT_EQ(m_Device.liveFramebuffers, 0u);
	}

	TEST_F(CommandRecorderTest, RejectsStructuralMismatches)
	{
		CommandRecorder recorder(&m_Device, 0);

		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, GraphicsPipeline{}, m_Vertices, m_Indices, 6), RenderError);
		EXPECT_THROW(recorder.Record(*m_Allocator, RenderTarget{}, m_Pipeline, m_Vertices, m_Indices, 6), RenderError);
		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, m_Pipeline, TransientBuffer{}, m_Indices, 6), RenderError);
		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, TransientBuffer{}, 6), RenderError);
		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 0), RenderError);
		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 7), RenderError);

		// Nothing reached the device
		EXPECT_TRUE(m_Device.GetLog().empty());
	}

	TEST_F(CommandRecorderTest, FramebufferFailureIsFatal)
	{
		CommandRecorder recorder(&m_Device, 0);
		m_Device.createFramebufferResult = VK_ERROR_OUT_OF_DEVICE_MEMORY;

		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 6), RenderError);
		EXPECT_TRUE(m_Device.draws.empty());
	}

	TEST_F(CommandRecorderTest, EndFailureIsFatal)
	{
		CommandRecorder recorder(&m_Device, 0);
		m_Device.endCommandBufferResult = VK_ERROR_OUT_OF_HOST_MEMORY;

		EXPECT_THROW(recorder.Record(*m_Allocator, m_Target, m_Pipeline, m_Vertices, m_Indices, 6), RenderError);
	}

	TEST(CommandRecorderConstructionTest, RequiresDevice)
	{
		EXPECT_THROW(CommandRecorder recorder(nullptr, 0), std::invalid_argument);
	}
}
