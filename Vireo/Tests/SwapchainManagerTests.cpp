//------------------------------------------------------------------------------
// SwapchainManagerTests.cpp
//
// Negotiation rules, the surface state machine and the acquire/execute/present
// chain, all against the recording mock device
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Vireo/Renderer/Components/SwapchainManager.hpp"
#include "Vireo/Renderer/RenderError.hpp"
#include "Mocks/MockRenderDevice.hpp"

#include <limits>

namespace Vireo
{
	using Testing::CountCalls;
	using Testing::IndexOfCall;
	using Testing::MakeFakeHandle;
	using Testing::MockRenderDevice;

	//--------------------------------------------------------------------------
	// Negotiation
	//--------------------------------------------------------------------------

	TEST(SwapchainNegotiationTest, PrefersRequestedFormat)
	{
		std::vector<VkSurfaceFormatKHR> formats = {
			{ VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR },
			{ VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR }
		};

		auto chosen = SwapchainNegotiation::ChooseSurfaceFormat(formats, VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
		ASSERT_TRUE(chosen.has_value());
		EXPECT_EQ(chosen->format, VK_FORMAT_B8G8R8A8_SRGB);
	}

	TEST(SwapchainNegotiationTest, FallsBackToFirstFormat)
	{
		std::vector<VkSurfaceFormatKHR> formats = {
			{ VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR },
			{ VK_FORMAT_R16G16B16A16_SFLOAT, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR }
		};

		auto chosen = SwapchainNegotiation::ChooseSurfaceFormat(formats, VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
		ASSERT_TRUE(chosen.has_value());
		EXPECT_EQ(chosen->format, VK_FORMAT_R8G8B8A8_UNORM);

		EXPECT_FALSE(SwapchainNegotiation::ChooseSurfaceFormat({}, VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR).has_value());
	}

	TEST(SwapchainNegotiationTest, PresentModeFallsBackToFifo)
	{
		std::vector<VkPresentModeKHR> modes = { VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR };

		EXPECT_EQ(SwapchainNegotiation::ChoosePresentMode(modes, VK_PRESENT_MODE_IMMEDIATE_KHR), VK_PRESENT_MODE_IMMEDIATE_KHR);
		EXPECT_EQ(SwapchainNegotiation::ChoosePresentMode(modes, VK_PRESENT_MODE_MAILBOX_KHR), VK_PRESENT_MODE_FIFO_KHR);
	}

	TEST(SwapchainNegotiationTest, ImageCountStaysWithinBounds)
	{
		VkSurfaceCapabilitiesKHR caps{};

		caps.minImageCount = 2;
		caps.maxImageCount = 3;
		EXPECT_EQ(SwapchainNegotiation::ChooseImageCount(caps), 3u);

		caps.minImageCount = 2;
		caps.maxImageCount = 8;
		EXPECT_EQ(SwapchainNegotiation::ChooseImageCount(caps), 8u);

		caps.minImageCount = 3;
		caps.maxImageCount = 3;
		EXPECT_EQ(SwapchainNegotiation::ChooseImageCount(caps), 3u);

		// unbounded
		caps.minImageCount = 2;
		caps.maxImageCount = 0;
		EXPECT_EQ(SwapchainNegotiation::ChooseImageCount(caps), 3u);
	}

	TEST(SwapchainNegotiationTest, ExtentFollowsSurfaceOrDrawable)
	{
		VkSurfaceCapabilitiesKHR caps{};
		caps.minImageExtent = { 64, 64 };
		caps.maxImageExtent = { 1920, 1080 };

		caps.currentExtent = { 1024, 768 };
		VkExtent2D fixed = SwapchainNegotiation::ChooseExtent(caps, { 800, 600 });
		EXPECT_EQ(fixed.width, 1024u);
		EXPECT_EQ(fixed.height, 768u);

		// Minimized windows can keep reporting their last size
		VkExtent2D minimized = SwapchainNegotiation::ChooseExtent(caps, { 0, 0 });
		EXPECT_EQ(minimized.width, 0u);
		EXPECT_EQ(minimized.height, 0u);

		caps.currentExtent = { (std::numeric_limits<uint32_t>::max)(), (std::numeric_limits<uint32_t>::max)() };
		VkExtent2D clamped = SwapchainNegotiation::ChooseExtent(caps, { 4000, 10 });
		EXPECT_EQ(clamped.width, 1920u);
		EXPECT_EQ(clamped.height, 64u);

		VkExtent2D zero = SwapchainNegotiation::ChooseExtent(caps, { 0, 600 });
		EXPECT_EQ(zero.width, 0u);
		EXPECT_EQ(zero.height, 0u);
	}

	//--------------------------------------------------------------------------
	// State machine
	//--------------------------------------------------------------------------

	class SwapchainManagerTest : public ::testing::Test
	{
	protected:
		SwapchainConfig MakeConfig(uint32_t framesInFlight = 1)
		{
			return SwapchainConfig(VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR,
				VK_PRESENT_MODE_FIFO_KHR, VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT, framesInFlight);
		}

		std::unique_ptr<SwapchainManager> MakeSwapchain(VkExtent2D extent = { 800, 600 }, uint32_t framesInFlight = 1)
		{
			auto swapchain = std::make_unique<SwapchainManager>(&m_Device, MakeConfig(framesInFlight));
			EXPECT_TRUE(swapchain->Initialize(m_Surface, extent));
			return swapchain;
		}

		MockRenderDevice m_Device;
		VkSurfaceKHR m_Surface = MakeFakeHandle<VkSurfaceKHR>(0x77);
		VkCommandBuffer m_CommandBuffer = MakeFakeHandle<VkCommandBuffer>(0x42);
	};

	TEST_F(SwapchainManagerTest, InitializeCreatesValidSwapchain)
	{
		auto swapchain = MakeSwapchain();

		EXPECT_EQ(swapchain->GetState(), SwapchainState::Valid);
		EXPECT_EQ(swapchain->GetExtent().width, 800u);
		EXPECT_EQ(swapchain->GetExtent().height, 600u);
		EXPECT_EQ(swapchain->GetImageFormat(), VK_FORMAT_B8G8R8A8_SRGB);
		EXPECT_EQ(swapchain->GetPresentMode(), VK_PRESENT_MODE_FIFO_KHR);
		EXPECT_EQ(swapchain->GetImageCount(), 3u);
		EXPECT_EQ(swapchain->GetImageViews().size(), 3u);
		EXPECT_EQ(swapchain->GetGeneration(), 1u);

		ASSERT_EQ(m_Device.swapchainCreations.size(), 1u);
		EXPECT_EQ(m_Device.swapchainCreations[0].minImageCount, 3u);
		EXPECT_EQ(m_Device.swapchainCreations[0].sharingMode, VK_SHARING_MODE_EXCLUSIVE);
		EXPECT_EQ(m_Device.liveImageViews, 3u);
	}

	TEST_F(SwapchainManagerTest, InitializeTwiceFails)
	{
		auto swapchain = MakeSwapchain();
		EXPECT_FALSE(swapchain->Initialize(m_Surface, { 800, 600 }));
	}

	TEST_F(SwapchainManagerTest, InitializeWithZeroExtentStartsMinimized)
	{
		auto swapchain = MakeSwapchain({ 0, 0 });

		EXPECT_EQ(swapchain->GetState(), SwapchainState::Minimized);
		EXPECT_EQ(CountCalls(m_Device.GetLog(), "CreateSwapchain"), 0u);

		m_Device.ClearLog();
		EXPECT_FALSE(swapchain->AcquireNextImage().has_value());
		EXPECT_TRUE(m_Device.GetLog().empty());
	}

	TEST_F(SwapchainManagerTest, InitializeFailsWithoutFormats)
	{
		m_Device.support.formats.clear();

		SwapchainManager swapchain(&m_Device, MakeConfig());
		EXPECT_FALSE(swapchain.Initialize(m_Surface, { 800, 600 }));
	}

	TEST_F(SwapchainManagerTest, DifferentQueueFamiliesShareImagesConcurrently)
	{
		m_Device.presentFamily = 1;
		auto swapchain = MakeSwapchain();

		ASSERT_EQ(m_Device.swapchainCreations.size(), 1u);
		EXPECT_EQ(m_Device.swapchainCreations[0].sharingMode, VK_SHARING_MODE_CONCURRENT);
	}

	TEST_F(SwapchainManagerTest, AcquireReturnsTokenForCurrentGeneration)
	{
		auto swapchain = MakeSwapchain();

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		EXPECT_TRUE(token->IsValid());
		EXPECT_EQ(token->GetImageIndex(), 0u);
		EXPECT_EQ(token->GetFrameSlot(), 0u);
		EXPECT_EQ(token->GetGeneration(), swapchain->GetGeneration());
		EXPECT_NE(token->GetAcquireSemaphore(), VK_NULL_HANDLE);
	}

	TEST_F(SwapchainManagerTest, SuboptimalAcquireDrainsSemaphoreAndMarksOutOfDate)
	{
		auto swapchain = MakeSwapchain();
		m_Device.acquireResults = { VK_SUBOPTIMAL_KHR };
		m_Device.submits.clear();

		EXPECT_FALSE(swapchain->AcquireNextImage().has_value());
		EXPECT_EQ(swapchain->GetState(), SwapchainState::OutOfDate);

		// The signaled acquire semaphore is consumed by an empty submission
		ASSERT_EQ(m_Device.submits.size(), 1u);
		EXPECT_EQ(m_Device.submits[0].commandBuffer, VK_NULL_HANDLE);
		EXPECT_NE(m_Device.submits[0].waitSemaphore, VK_NULL_HANDLE);
	}

	TEST_F(SwapchainManagerTest, OutOfDateAcquireMarksOutOfDate)
	{
		auto swapchain = MakeSwapchain();
		m_Device.acquireResults = { VK_ERROR_OUT_OF_DATE_KHR };

		EXPECT_FALSE(swapchain->AcquireNextImage().has_value());
		EXPECT_EQ(swapchain->GetState(), SwapchainState::OutOfDate);

		// Further acquires wait for recreation
		m_Device.ClearLog();
		EXPECT_FALSE(swapchain->AcquireNextImage().has_value());
		EXPECT_EQ(CountCalls(m_Device.GetLog(), "AcquireNextImage"), 0u);
	}

	TEST_F(SwapchainManagerTest, FatalAcquireThrows)
	{
		auto swapchain = MakeSwapchain();
		m_Device.acquireResults = { VK_ERROR_DEVICE_LOST };

		try
		{
			swapchain->AcquireNextImage();
			FAIL() << "expected RenderError";
		}
		catch (const RenderError& e)
		{
			EXPECT_EQ(e.GetResult(), VK_ERROR_DEVICE_LOST);
		}
	}

	TEST_F(SwapchainManagerTest, AcquireBeforeInitializeThrows)
	{
		SwapchainManager swapchain(&m_Device, MakeConfig());
		EXPECT_THROW(swapchain.AcquireNextImage(), RenderError);
	}

	TEST_F(SwapchainManagerTest, RecreateAtZeroExtentIsIdempotent)
	{
		auto swapchain = MakeSwapchain();
		VkSwapchainKHR original = swapchain->GetSwapchain();

		swapchain->SetDrawableExtent(0, 0);
		swapchain->MarkOutOfDate();

		m_Device.ClearLog();
		for (int i = 0; i < 3; ++i)
		{
			EXPECT_FALSE(swapchain->RecreateSwapchain());
			EXPECT_EQ(swapchain->GetState(), SwapchainState::Minimized);
		}
		EXPECT_TRUE(m_Device.GetLog().empty());

		// Nothing torn down or rebuilt
		EXPECT_EQ(m_Device.swapchainCreations.size(), 1u);
		EXPECT_EQ(swapchain->GetSwapchain(), original);
		EXPECT_EQ(swapchain->GetImageViews().size(), 3u);
		EXPECT_EQ(m_Device.liveSwapchains, 1u);
	}

	TEST_F(SwapchainManagerTest, RecreateWithSameExtentKeepsParameters)
	{
		auto swapchain = MakeSwapchain();
		VkSwapchainKHR original = swapchain->GetSwapchain();
		uint32_t imageCount = swapchain->GetImageCount();
		VkFormat format = swapchain->GetImageFormat();

		swapchain->MarkOutOfDate();
		EXPECT_EQ(swapchain->GetState(), SwapchainState::OutOfDate);
		EXPECT_TRUE(swapchain->RecreateSwapchain());

		EXPECT_EQ(swapchain->GetState(), SwapchainState::Valid);
		EXPECT_EQ(swapchain->GetImageCount(), imageCount);
		EXPECT_EQ(swapchain->GetImageFormat(), format);
		EXPECT_EQ(swapchain->GetGeneration(), 2u);
		EXPECT_NE(swapchain->GetSwapchain(), original);

		// Replaced, not mutated: the old one is handed over and destroyed
		ASSERT_EQ(m_Device.swapchainCreations.size(), 2u);
		EXPECT_EQ(m_Device.swapchainCreations[1].oldSwapchain, original);
		EXPECT_EQ(m_Device.liveSwapchains, 1u);
		EXPECT_EQ(m_Device.liveImageViews, 3u);
	}

	TEST_F(SwapchainManagerTest, RecreateUsesLastDrawableExtent)
	{
		auto swapchain = MakeSwapchain();

		swapchain->SetDrawableExtent(0, 0);
		swapchain->MarkOutOfDate();
		EXPECT_FALSE(swapchain->RecreateSwapchain());

		swapchain->SetDrawableExtent(1280, 720);
		EXPECT_TRUE(swapchain->RecreateSwapchain());

		EXPECT_EQ(swapchain->GetState(), SwapchainState::Valid);
		EXPECT_EQ(swapchain->GetExtent().width, 1280u);
		EXPECT_EQ(swapchain->GetExtent().height, 720u);
		EXPECT_EQ(swapchain->GetRenderTarget(0).extent.width, 1280u);
	}

	TEST_F(SwapchainManagerTest, SurfaceDefinedExtentWins)
	{
		m_Device.support.capabilities.currentExtent = { 1024, 768 };
		auto swapchain = MakeSwapchain({ 800, 600 });

		EXPECT_EQ(swapchain->GetExtent().width, 1024u);
		EXPECT_EQ(swapchain->GetExtent().height, 768u);
	}

	//--------------------------------------------------------------------------
	// Future chain
	//--------------------------------------------------------------------------

	TEST_F(SwapchainManagerTest, ChainOrdersAcquireExecutePresent)
	{
		auto swapchain = MakeSwapchain();
		m_Device.ClearLog();
		m_Device.submits.clear();

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		VkSemaphore acquireSemaphore = token->GetAcquireSemaphore();
		uint32_t imageIndex = token->GetImageIndex();

		ExecutionFuture execution = swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer);
		EXPECT_FALSE(token->IsValid());
		EXPECT_TRUE(execution.IsValid());

		VkSemaphore renderFinished = execution.GetRenderFinishedSemaphore();
		PresentFuture present = swapchain->PresentImage(std::move(execution), imageIndex);
		EXPECT_FALSE(execution.IsValid());

		const auto& log = m_Device.GetLog();
		size_t acquireAt = IndexOfCall(log, "AcquireNextImage");
		size_t submitAt = IndexOfCall(log, "SubmitGraphics");
		size_t presentAt = IndexOfCall(log, "Present");
		EXPECT_LT(acquireAt, submitAt);
		EXPECT_LT(submitAt, presentAt);
		EXPECT_LT(presentAt, log.size());

		// Execution waits on the acquire signal, presentation on the execution signal
		ASSERT_EQ(m_Device.submits.size(), 1u);
		EXPECT_EQ(m_Device.submits[0].commandBuffer, m_CommandBuffer);
		EXPECT_EQ(m_Device.submits[0].waitSemaphore, acquireSemaphore);
		EXPECT_EQ(m_Device.submits[0].signalSemaphore, renderFinished);
		EXPECT_NE(m_Device.submits[0].fence, VK_NULL_HANDLE);
		ASSERT_EQ(m_Device.presents.size(), 1u);
		EXPECT_EQ(m_Device.presents[0].waitSemaphore, renderFinished);
		EXPECT_EQ(m_Device.presents[0].imageIndex, imageIndex);

		EXPECT_EQ(present.GetPresentResult(), VK_SUCCESS);
		EXPECT_FALSE(present.IsComplete());
	}

	TEST_F(SwapchainManagerTest, PresentFutureWaitIsTheBlockingPoint)
	{
		auto swapchain = MakeSwapchain();

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		uint32_t imageIndex = token->GetImageIndex();
		PresentFuture present = swapchain->PresentImage(
			swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer), imageIndex);

		m_Device.ClearLog();
		present.Wait();

		const auto& log = m_Device.GetLog();
		ASSERT_EQ(log.size(), 2u);
		EXPECT_EQ(log[0], "WaitForFence");
		EXPECT_EQ(log[1], "WaitPresentQueueIdle");
		EXPECT_TRUE(present.IsComplete());

		present.Wait();
		EXPECT_EQ(log.size(), 2u);
	}

	TEST_F(SwapchainManagerTest, PresentFutureWaitFailureThrows)
	{
		auto swapchain = MakeSwapchain();

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		uint32_t imageIndex = token->GetImageIndex();
		PresentFuture present = swapchain->PresentImage(
			swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer), imageIndex);

		m_Device.waitForFenceResult = VK_ERROR_DEVICE_LOST;
		EXPECT_THROW(present.Wait(), RenderError);
	}

	TEST_F(SwapchainManagerTest, StaleTokenIsRejectedAfterRecreation)
	{
		auto swapchain = MakeSwapchain();

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());

		swapchain->MarkOutOfDate();
		ASSERT_TRUE(swapchain->RecreateSwapchain());

		EXPECT_THROW(swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer), RenderError);
	}

	TEST_F(SwapchainManagerTest, MismatchedPresentIndexThrows)
	{
		auto swapchain = MakeSwapchain();

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		uint32_t imageIndex = token->GetImageIndex();

		ExecutionFuture execution = swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer);
		EXPECT_THROW(swapchain->PresentImage(std::move(execution), imageIndex + 1), RenderError);
	}

	TEST_F(SwapchainManagerTest, OutOfDatePresentIsNotFatal)
	{
		auto swapchain = MakeSwapchain();
		m_Device.presentResults = { VK_ERROR_OUT_OF_DATE_KHR };

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		uint32_t imageIndex = token->GetImageIndex();

		PresentFuture present = swapchain->PresentImage(
			swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer), imageIndex);

		EXPECT_EQ(present.GetPresentResult(), VK_ERROR_OUT_OF_DATE_KHR);
		EXPECT_EQ(swapchain->GetState(), SwapchainState::OutOfDate);
	}

	TEST_F(SwapchainManagerTest, FailedSubmitThrows)
	{
		auto swapchain = MakeSwapchain();
		m_Device.submitResults = { VK_ERROR_DEVICE_LOST };

		auto token = swapchain->AcquireNextImage();
		ASSERT_TRUE(token.has_value());
		EXPECT_THROW(swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer), RenderError);
	}

	TEST_F(SwapchainManagerTest, ImageIsNotHandedOutTwiceBeforePresentation)
	{
		m_Device.swapchainImageCount = 1;
		auto swapchain = MakeSwapchain();

		auto first = swapchain->AcquireNextImage();
		ASSERT_TRUE(first.has_value());

		// The only image is still owned by the unpresented frame
		EXPECT_THROW(swapchain->AcquireNextImage(), RenderError);
	}

	TEST_F(SwapchainManagerTest, ConsecutiveFramesRotateImages)
	{
		auto swapchain = MakeSwapchain({ 800, 600 }, 2);

		std::vector<uint32_t> presented;
		for (int frame = 0; frame < 4; ++frame)
		{
			swapchain->WaitForFrameSlot();
			auto token = swapchain->AcquireNextImage();
			ASSERT_TRUE(token.has_value());
			uint32_t imageIndex = token->GetImageIndex();
			swapchain->PresentImage(swapchain->ExecuteCommandBuffer(std::move(*token), m_CommandBuffer), imageIndex);
			presented.push_back(imageIndex);
		}

		for (size_t i = 1; i < presented.size(); ++i)
		{
			EXPECT_NE(presented[i], presented[i - 1]);
		}
		EXPECT_EQ(swapchain->GetCurrentFrameSlot(), 0u);
	}

	TEST_F(SwapchainManagerTest, ShutdownReleasesEverythingInOrder)
	{
		auto swapchain = MakeSwapchain();
		m_Device.ClearLog();

		swapchain->Shutdown();

		const auto& log = m_Device.GetLog();
		size_t viewAt = IndexOfCall(log, "DestroyImageView");
		size_t swapchainAt = IndexOfCall(log, "DestroySwapchain");
		size_t surfaceAt = IndexOfCall(log, "DestroySurface");
		EXPECT_LT(viewAt, swapchainAt);
		EXPECT_LT(swapchainAt, surfaceAt);
		EXPECT_LT(surfaceAt, log.size());

		EXPECT_EQ(swapchain->GetState(), SwapchainState::Destroyed);
		EXPECT_EQ(m_Device.liveSwapchains, 0u);
		EXPECT_EQ(m_Device.liveImageViews, 0u);
		EXPECT_EQ(m_Device.liveSemaphores, 0u);
		EXPECT_EQ(m_Device.liveFences, 0u);
		EXPECT_TRUE(m_Device.surfaceDestroyed);

		// Idempotent
		m_Device.ClearLog();
		swapchain->Shutdown();
		EXPECT_TRUE(m_Device.GetLog().empty());
		EXPECT_THROW(swapchain->RecreateSwapchain(), RenderError);
	}
}
