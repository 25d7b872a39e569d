//------------------------------------------------------------------------------
// VulkanDevice.cpp
//
// Vulkan device management implementation
//------------------------------------------------------------------------------

#include "Vireo/Core/Platform.hpp"
#include "Vireo/Core/Base.hpp"
#include "Vireo/Renderer/Vulkan/VulkanDevice.hpp"
#include "Vireo/Renderer/Vulkan/VulkanPipelineBuilder.hpp"
#include "Vireo/Window/Window.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <cstring>
#include <set>

namespace Vireo
{
	VulkanDevice::VulkanDevice()
	{
		LOG_INFO("VulkanDevice created");
	}

	VulkanDevice::~VulkanDevice()
	{
		Shutdown();
		LOG_INFO("VulkanDevice destroyed");
	}

	bool VulkanDevice::Initialize(const VulkanDeviceDesc& desc, const Window* window)
	{
		LOG_INFO("=== Initializing Vulkan Device ===");

		if (!window)
		{
			LOG_ERROR("VulkanDevice requires a window for presentation");
			return false;
		}

		m_Desc = desc;
		m_EnableValidationLayers = desc.enableValidation;

		// STEP 1: Create Vulkan instance
		// The instance is the connection between the application and the Vulkan library.
		if (!CreateInstance(window))
		{
			LOG_ERROR("Failed to create Vulkan instance");
			return false;
		}
		LOG_INFO("Vulkan instance created");

		// STEP 2: Setup Debug Messenger
		// This lets Vulkan send us detailed error messages
		if (m_EnableValidationLayers && !SetupDebugMessenger())
		{
			LOG_ERROR("Failed to setup debug messenger");
			return false;
		}
		if (m_EnableValidationLayers)
		{
			LOG_INFO("Debug messenger setup");
		}

		// STEP 3: Surface, needed to check which queue family can present
		if (!CreateSurface(window))
		{
			LOG_ERROR("Failed to create window surface");
			return false;
		}

		// STEP 4: Pick Physical Device (GPU)
		if (!PickPhysicalDevice())
		{
			LOG_ERROR("Failed to pick physical device");
			return false;
		}

		// STEP 5: Logical device and queues
		if (!CreateLogicalDevice())
		{
			LOG_ERROR("Failed to create logical device");
			return false;
		}

		LOG_INFO("=== Vulkan Device Initialized Successfully ===");
		return true;
	}

	void VulkanDevice::Shutdown()
	{
		if (m_Instance == VK_NULL_HANDLE)
			return;

		LOG_INFO("Shutting down Vulkan device... ");

		// Destroy in reverse order of creation
		if (m_Device != VK_NULL_HANDLE)
		{
			vkDeviceWaitIdle(m_Device);
			vkDestroyDevice(m_Device, nullptr);
			m_Device = VK_NULL_HANDLE;
		}

		if (m_Surface != VK_NULL_HANDLE)
		{
			vkDestroySurfaceKHR(m_Instance, m_Surface, nullptr);
			m_Surface = VK_NULL_HANDLE;
		}

		// Need to load the function to destroy debugger
		if (m_DebugMessenger != VK_NULL_HANDLE)
		{
			auto func = (PFN_vkDestroyDebugUtilsMessengerEXT)
				vkGetInstanceProcAddr(m_Instance, "vkDestroyDebugUtilsMessengerEXT");
			if (func != nullptr)
			{
				func(m_Instance, m_DebugMessenger, nullptr);
			}
			m_DebugMessenger = VK_NULL_HANDLE;
		}

		vkDestroyInstance(m_Instance, nullptr);
		m_Instance = VK_NULL_HANDLE;
		m_PhysicalDevice = VK_NULL_HANDLE;
		m_GraphicsQueue = VK_NULL_HANDLE;
		m_PresentQueue = VK_NULL_HANDLE;

		LOG_INFO("Vulkan device shutdown complete");
	}

	bool VulkanDevice::CreateInstance(const Window* window)
	{
		// Missing layers only cost us diagnostics
		if (m_EnableValidationLayers && !CheckValidationLayerSupport())
		{
			LOG_WARN("Validation layers requested but not available, continuing without them");
			m_EnableValidationLayers = false;
		}

		VkApplicationInfo appInfo{};
		appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
		appInfo.pApplicationName = m_Desc.applicationName.c_str();
		appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
		appInfo.pEngineName = "Vireo";
		appInfo.engineVersion = VK_MAKE_VERSION(VIREO_VERSION_MAJOR, VIREO_VERSION_MINOR, VIREO_VERSION_PATCH);
		appInfo.apiVersion = VK_API_VERSION_1_2;

		VkInstanceCreateInfo createInfo{};
		createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
		createInfo.pApplicationInfo = &appInfo;

		// Window system integration extensions, plus debug utils with validation
		std::vector<const char*> extensions = window->GetRequiredInstanceExtensions();
		if (extensions.empty())
		{
			LOG_ERROR("Window system reports no Vulkan surface extensions");
			return false;
		}
		if (m_EnableValidationLayers)
		{
			extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
		}

		for (const char* extension : extensions)
		{
			LOG_DEBUG("Instance extension: {}", extension);
		}

		createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
		createInfo.ppEnabledExtensionNames = extensions.data();

		VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo{};
		if (m_EnableValidationLayers)
		{
			createInfo.enabledLayerCount = static_cast<uint32_t>(m_ValidationLayers.size());
			createInfo.ppEnabledLayerNames = m_ValidationLayers.data();

			// This lets us catch errors during vkCreateInstance/vkDestroyInstance
			PopulateDebugMessengerCreateInfo(debugCreateInfo);
			createInfo.pNext = &debugCreateInfo;
		}
		else
		{
			createInfo.enabledLayerCount = 0;
			createInfo.pNext = nullptr;
		}

		VkResult result = vkCreateInstance(&createInfo, nullptr, &m_Instance);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("vkCreateInstance failed with result: {}", VulkanUtils::VkResultToString(result));
			return false;
		}

		return true;
	}

	bool VulkanDevice::SetupDebugMessenger()
	{
		VkDebugUtilsMessengerCreateInfoEXT createInfo{};
		PopulateDebugMessengerCreateInfo(createInfo);

		// We need to load this function manually
		auto func = (PFN_vkCreateDebugUtilsMessengerEXT)
			vkGetInstanceProcAddr(m_Instance, "vkCreateDebugUtilsMessengerEXT");

		if (func == nullptr)
		{
			LOG_ERROR("Failed to load vkCreateDebugUtilsMessengerEXT");
			return false;
		}

		VkResult result = func(m_Instance, &createInfo, nullptr, &m_DebugMessenger);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create debug messenger: {}", VulkanUtils::VkResultToString(result));
			return false;
		}

		return true;
	}

	bool VulkanDevice::CreateSurface(const Window* window)
	{
		VkResult result = window->CreateVulkanSurface(m_Instance, &m_Surface);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create window surface: {}", VulkanUtils::VkResultToString(result));
			m_Surface = VK_NULL_HANDLE;
			return false;
		}

		LOG_INFO("Window surface created");
		return true;
	}

	bool VulkanDevice::PickPhysicalDevice()
	{
		uint32_t deviceCount = 0;
		vkEnumeratePhysicalDevices(m_Instance, &deviceCount, nullptr);

		if (deviceCount == 0)
		{
			LOG_ERROR("No GPUs with Vulkan support found!");
			return false;
		}

		std::vector<VkPhysicalDevice> devices(deviceCount);
		vkEnumeratePhysicalDevices(m_Instance, &deviceCount, devices.data());

		LOG_INFO("Found {} Vulkan-compatible device(s)", deviceCount);

		// Highest score among suitable devices, discrete GPUs first
		int bestScore = -1;
		for (const auto& device : devices)
		{
			if (!IsDeviceSuitable(device))
				continue;

			int score = RateDevice(device);
			if (score > bestScore)
			{
				bestScore = score;
				m_PhysicalDevice = device;
			}
		}

		if (m_PhysicalDevice == VK_NULL_HANDLE)
		{
			LOG_ERROR("Failed to find a suitable GPU!");
			return false;
		}

		// Log selected GPU info
		VkPhysicalDeviceProperties deviceProperties;
		vkGetPhysicalDeviceProperties(m_PhysicalDevice, &deviceProperties);

		LOG_INFO("Selected GPU: {}", deviceProperties.deviceName);

		std::string deviceType;
		switch (deviceProperties.deviceType)
		{
		case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: deviceType = "Integrated GPU"; break;
		case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: deviceType = "Discrete GPU"; break;
		case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: deviceType = "Virtual GPU"; break;
		case VK_PHYSICAL_DEVICE_TYPE_CPU: deviceType = "CPU"; break;
		case VK_PHYSICAL_DEVICE_TYPE_OTHER: deviceType = "Other GPU Type"; break;
		default: deviceType = "Unknown GPU Type"; break;
		}

		LOG_INFO("GPU Type: {}", deviceType);

		LOG_INFO("Vulkan API Version: {}.{}.{}",
			VK_VERSION_MAJOR(deviceProperties.apiVersion),
			VK_VERSION_MINOR(deviceProperties.apiVersion),
			VK_VERSION_PATCH(deviceProperties.apiVersion));

		return true;
	}

	bool VulkanDevice::CreateLogicalDevice()
	{
		m_QueueFamilies = FindQueueFamilies(m_PhysicalDevice);

		if (!m_QueueFamilies.IsComplete())
		{
			LOG_ERROR("Required queue families not found!");
			return false;
		}

		// One queue per unique family
		std::vector<VkDeviceQueueCreateInfo> queueCreateInfos;
		std::set<uint32_t> uniqueQueueFamilies = {
			m_QueueFamilies.graphicsFamily.value(),
			m_QueueFamilies.presentFamily.value()
		};

		float queuePriority = 1.0f;
		for (uint32_t queueFamily : uniqueQueueFamilies)
		{
			VkDeviceQueueCreateInfo queueCreateInfo{};
			queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
			queueCreateInfo.queueFamilyIndex = queueFamily;
			queueCreateInfo.queueCount = 1;
			queueCreateInfo.pQueuePriorities = &queuePriority;

			queueCreateInfos.push_back(queueCreateInfo);
		}

		// No special features needed
		VkPhysicalDeviceFeatures deviceFeatures{};

		VkDeviceCreateInfo createInfo{};
		createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
		createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size());
		createInfo.pQueueCreateInfos = queueCreateInfos.data();
		createInfo.pEnabledFeatures = &deviceFeatures;

		createInfo.enabledExtensionCount = static_cast<uint32_t>(m_DeviceExtensions.size());
		createInfo.ppEnabledExtensionNames = m_DeviceExtensions.data();

		// Device layers are ignored by current loaders, set for older implementations
		if (m_EnableValidationLayers)
		{
			createInfo.enabledLayerCount = static_cast<uint32_t>(m_ValidationLayers.size());
			createInfo.ppEnabledLayerNames = m_ValidationLayers.data();
		}
		else
		{
			createInfo.enabledLayerCount = 0;
		}

		VkResult result = vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create logical device: {}", VulkanUtils::VkResultToString(result));
			return false;
		}

		vkGetDeviceQueue(m_Device, m_QueueFamilies.graphicsFamily.value(), 0, &m_GraphicsQueue);
		vkGetDeviceQueue(m_Device, m_QueueFamilies.presentFamily.value(), 0, &m_PresentQueue);

		LOG_INFO("Logical device created successfully");
		LOG_INFO("Graphics queue family index: {}", m_QueueFamilies.graphicsFamily.value());
		LOG_INFO("Present queue family index: {}", m_QueueFamilies.presentFamily.value());

		return true;
	}

	bool VulkanDevice::CheckValidationLayerSupport() const
	{
		uint32_t layerCount = 0;
		vkEnumerateInstanceLayerProperties(&layerCount, nullptr);

		std::vector<VkLayerProperties> availableLayers(layerCount);
		vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

		for (const char* layerName : m_ValidationLayers)
		{
			bool layerFound = false;

			for (const auto& layerProperties : availableLayers)
			{
				if (std::strcmp(layerName, layerProperties.layerName) == 0)
				{
					layerFound = true;
					break;
				}
			}

			if (!layerFound)
			{
				LOG_WARN("Validation layer '{}' not available", layerName);
				return false;
			}
		}

		return true;
	}

	bool VulkanDevice::IsDeviceSuitable(VkPhysicalDevice device) const
	{
		QueueFamilyIndices indices = FindQueueFamilies(device);
		if (!indices.IsComplete())
			return false;

		if (!CheckDeviceExtensionSupport(device))
			return false;

		// The surface must offer at least one format and one present mode
		uint32_t formatCount = 0;
		vkGetPhysicalDeviceSurfaceFormatsKHR(device, m_Surface, &formatCount, nullptr);
		uint32_t presentModeCount = 0;
		vkGetPhysicalDeviceSurfacePresentModesKHR(device, m_Surface, &presentModeCount, nullptr);

		return formatCount > 0 && presentModeCount > 0;
	}

	int VulkanDevice::RateDevice(VkPhysicalDevice device) const
	{
		VkPhysicalDeviceProperties properties;
		vkGetPhysicalDeviceProperties(device, &properties);

		int score = 0;
		switch (properties.deviceType)
		{
		case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: score += 1000; break;
		case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: score += 100; break;
		case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: score += 50; break;
		default: break;
		}

		// Prefer a single family that does both
		QueueFamilyIndices indices = FindQueueFamilies(device);
		if (indices.IsComplete() && indices.graphicsFamily == indices.presentFamily)
			score += 10;

		return score;
	}

	VulkanDevice::QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device) const
	{
		QueueFamilyIndices indices;

		uint32_t queueFamilyCount = 0;
		vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

		std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
		vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

		for (uint32_t i = 0; i < queueFamilyCount; ++i)
		{
			bool graphics = (queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;

			VkBool32 presentSupport = VK_FALSE;
			vkGetPhysicalDeviceSurfaceSupportKHR(device, i, m_Surface, &presentSupport);

			// A family that does both wins outright
			if (graphics && presentSupport)
			{
				indices.graphicsFamily = i;
				indices.presentFamily = i;
				break;
			}

			if (graphics && !indices.graphicsFamily.has_value())
				indices.graphicsFamily = i;
			if (presentSupport && !indices.presentFamily.has_value())
				indices.presentFamily = i;
		}

		return indices;
	}

	bool VulkanDevice::CheckDeviceExtensionSupport(VkPhysicalDevice device) const
	{
		uint32_t extensionCount = 0;
		vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, nullptr);

		std::vector<VkExtensionProperties> availableExtensions(extensionCount);
		vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, availableExtensions.data());

		std::set<std::string> requiredExtensions(m_DeviceExtensions.begin(), m_DeviceExtensions.end());

		for (const auto& extension : availableExtensions)
		{
			requiredExtensions.erase(extension.extensionName);
		}

		return requiredExtensions.empty();
	}

	void VulkanDevice::PopulateDebugMessengerCreateInfo(VkDebugUtilsMessengerCreateInfoEXT& createInfo) const
	{
		createInfo = {};
		createInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
		createInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
			VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
		if (m_Desc.verboseValidation)
		{
			createInfo.messageSeverity |= VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT |
				VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT;
		}
		createInfo.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
			VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
			VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
		createInfo.pfnUserCallback = DebugCallback;
		createInfo.pUserData = nullptr;
	}

	VKAPI_ATTR VkBool32 VKAPI_CALL VulkanDevice::DebugCallback(
		VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
		VkDebugUtilsMessageTypeFlagsEXT /*messageType*/,
		const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
		void* /*pUserData*/)
	{
		// Map Vulkan severity to our logging levels
		if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
		{
			LOG_ERROR("Vulkan: {}", pCallbackData->pMessage);
		}
		else if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
		{
			LOG_WARN("Vulkan: {}", pCallbackData->pMessage);
		}
		else if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT)
		{
			LOG_INFO("Vulkan: {}", pCallbackData->pMessage);
		}
		else
		{
			LOG_TRACE("Vulkan: {}", pCallbackData->pMessage);
		}

		return VK_FALSE; // Don't abort
	}

	//------------------------------------------------------------------------------
	// Surface and swapchain
	//------------------------------------------------------------------------------

	VkResult VulkanDevice::QuerySurfaceSupport(VkSurfaceKHR surface, SurfaceSupport& outSupport)
	{
		VkResult result = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_PhysicalDevice, surface, &outSupport.capabilities);
		if (result != VK_SUCCESS)
			return result;

		uint32_t formatCount = 0;
		result = vkGetPhysicalDeviceSurfaceFormatsKHR(m_PhysicalDevice, surface, &formatCount, nullptr);
		if (result != VK_SUCCESS)
			return result;

		outSupport.formats.resize(formatCount);
		if (formatCount != 0)
		{
			result = vkGetPhysicalDeviceSurfaceFormatsKHR(m_PhysicalDevice, surface, &formatCount, outSupport.formats.data());
			if (result != VK_SUCCESS && result != VK_INCOMPLETE)
				return result;
			outSupport.formats.resize(formatCount);
		}

		uint32_t presentModeCount = 0;
		result = vkGetPhysicalDeviceSurfacePresentModesKHR(m_PhysicalDevice, surface, &presentModeCount, nullptr);
		if (result != VK_SUCCESS)
			return result;

		outSupport.presentModes.resize(presentModeCount);
		if (presentModeCount != 0)
		{
			result = vkGetPhysicalDeviceSurfacePresentModesKHR(m_PhysicalDevice, surface, &presentModeCount, outSupport.presentModes.data());
			if (result != VK_SUCCESS && result != VK_INCOMPLETE)
				return result;
			outSupport.presentModes.resize(presentModeCount);
		}

		return VK_SUCCESS;
	}

	VkResult VulkanDevice::CreateSwapchain(const VkSwapchainCreateInfoKHR& createInfo, VkSwapchainKHR& outSwapchain)
	{
		return vkCreateSwapchainKHR(m_Device, &createInfo, nullptr, &outSwapchain);
	}

	VkResult VulkanDevice::GetSwapchainImages(VkSwapchainKHR swapchain, std::vector<VkImage>& outImages)
	{
		uint32_t imageCount = 0;
		VkResult result = vkGetSwapchainImagesKHR(m_Device, swapchain, &imageCount, nullptr);
		if (result != VK_SUCCESS)
			return result;

		outImages.resize(imageCount);
		result = vkGetSwapchainImagesKHR(m_Device, swapchain, &imageCount, outImages.data());
		outImages.resize(imageCount);
		return result == VK_INCOMPLETE ? VK_SUCCESS : result;
	}

	void VulkanDevice::DestroySwapchain(VkSwapchainKHR swapchain)
	{
		if (swapchain != VK_NULL_HANDLE)
			vkDestroySwapchainKHR(m_Device, swapchain, nullptr);
	}

	void VulkanDevice::DestroySurface(VkSurfaceKHR surface)
	{
		if (surface == VK_NULL_HANDLE || m_Instance == VK_NULL_HANDLE)
			return;

		vkDestroySurfaceKHR(m_Instance, surface, nullptr);
		if (surface == m_Surface)
			m_Surface = VK_NULL_HANDLE;
	}

	VkResult VulkanDevice::CreateImageView(const VkImageViewCreateInfo& createInfo, VkImageView& outView)
	{
		return vkCreateImageView(m_Device, &createInfo, nullptr, &outView);
	}

	void VulkanDevice::DestroyImageView(VkImageView view)
	{
		if (view != VK_NULL_HANDLE)
			vkDestroyImageView(m_Device, view, nullptr);
	}

	VkResult VulkanDevice::CreateFramebuffer(const VkFramebufferCreateInfo& createInfo, VkFramebuffer& outFramebuffer)
	{
		return vkCreateFramebuffer(m_Device, &createInfo, nullptr, &outFramebuffer);
	}

	void VulkanDevice::DestroyFramebuffer(VkFramebuffer framebuffer)
	{
		if (framebuffer != VK_NULL_HANDLE)
			vkDestroyFramebuffer(m_Device, framebuffer, nullptr);
	}

	//------------------------------------------------------------------------------
	// Synchronization objects
	//------------------------------------------------------------------------------

	VkResult VulkanDevice::CreateBinarySemaphore(VkSemaphore& outSemaphore)
	{
		VkSemaphoreCreateInfo semaphoreInfo{};
		semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
		return vkCreateSemaphore(m_Device, &semaphoreInfo, nullptr, &outSemaphore);
	}

	void VulkanDevice::DestroySemaphore(VkSemaphore semaphore)
	{
		if (semaphore != VK_NULL_HANDLE)
			vkDestroySemaphore(m_Device, semaphore, nullptr);
	}

	VkResult VulkanDevice::CreateFence(bool signaled, VkFence& outFence)
	{
		VkFenceCreateInfo fenceInfo{};
		fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
		fenceInfo.flags = signaled ? VK_FENCE_CREATE_SIGNALED_BIT : 0;
		return vkCreateFence(m_Device, &fenceInfo, nullptr, &outFence);
	}

	void VulkanDevice::DestroyFence(VkFence fence)
	{
		if (fence != VK_NULL_HANDLE)
			vkDestroyFence(m_Device, fence, nullptr);
	}

	VkResult VulkanDevice::WaitForFence(VkFence fence, uint64_t timeout)
	{
		return vkWaitForFences(m_Device, 1, &fence, VK_TRUE, timeout);
	}

	VkResult VulkanDevice::ResetFence(VkFence fence)
	{
		return vkResetFences(m_Device, 1, &fence);
	}

	//------------------------------------------------------------------------------
	// Queue operations
	//------------------------------------------------------------------------------

	VkResult VulkanDevice::AcquireNextImage(VkSwapchainKHR swapchain, VkSemaphore signalSemaphore, uint32_t& outImageIndex)
	{
		return vkAcquireNextImageKHR(m_Device, swapchain, VulkanUtils::NoTimeout,
			signalSemaphore, VK_NULL_HANDLE, &outImageIndex);
	}

	VkResult VulkanDevice::SubmitGraphics(const QueueSubmitDesc& submit)
	{
		VkSubmitInfo submitInfo{};
		submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;

		VkPipelineStageFlags waitStage = submit.waitStage;
		if (submit.waitSemaphore != VK_NULL_HANDLE)
		{
			submitInfo.waitSemaphoreCount = 1;
			submitInfo.pWaitSemaphores = &submit.waitSemaphore;
			submitInfo.pWaitDstStageMask = &waitStage;
		}

		if (submit.commandBuffer != VK_NULL_HANDLE)
		{
			submitInfo.commandBufferCount = 1;
			submitInfo.pCommandBuffers = &submit.commandBuffer;
		}

		if (submit.signalSemaphore != VK_NULL_HANDLE)
		{
			submitInfo.signalSemaphoreCount = 1;
			submitInfo.pSignalSemaphores = &submit.signalSemaphore;
		}

		return vkQueueSubmit(m_GraphicsQueue, 1, &submitInfo, submit.fence);
	}

	VkResult VulkanDevice::Present(VkSwapchainKHR swapchain, uint32_t imageIndex, VkSemaphore waitSemaphore)
	{
		VkPresentInfoKHR presentInfo{};
		presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
		presentInfo.waitSemaphoreCount = 1;
		presentInfo.pWaitSemaphores = &waitSemaphore;
		presentInfo.swapchainCount = 1;
		presentInfo.pSwapchains = &swapchain;
		presentInfo.pImageIndices = &imageIndex;
		presentInfo.pResults = nullptr;

		return vkQueuePresentKHR(m_PresentQueue, &presentInfo);
	}

	VkResult VulkanDevice::WaitPresentQueueIdle()
	{
		return vkQueueWaitIdle(m_PresentQueue);
	}

	void VulkanDevice::WaitForIdle()
	{
		if (m_Device != VK_NULL_HANDLE)
		{
			VkResult result = vkDeviceWaitIdle(m_Device);
			if (result != VK_SUCCESS)
			{
				LOG_ERROR("vkDeviceWaitIdle failed: {}", VulkanUtils::VkResultToString(result));
			}
		}
	}

	//------------------------------------------------------------------------------
	// Command pools and buffers
	//------------------------------------------------------------------------------

	VkResult VulkanDevice::CreateCommandPool(uint32_t queueFamily, VkCommandPoolCreateFlags flags, VkCommandPool& outPool)
	{
		VkCommandPoolCreateInfo poolInfo{};
		poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
		poolInfo.flags = flags;
		poolInfo.queueFamilyIndex = queueFamily;
		return vkCreateCommandPool(m_Device, &poolInfo, nullptr, &outPool);
	}

	VkResult VulkanDevice::ResetCommandPool(VkCommandPool pool)
	{
		return vkResetCommandPool(m_Device, pool, 0);
	}

	void VulkanDevice::DestroyCommandPool(VkCommandPool pool)
	{
		if (pool != VK_NULL_HANDLE)
			vkDestroyCommandPool(m_Device, pool, nullptr);
	}

	VkResult VulkanDevice::AllocateCommandBuffer(VkCommandPool pool, VkCommandBuffer& outCommandBuffer)
	{
		VkCommandBufferAllocateInfo allocInfo{};
		allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
		allocInfo.commandPool = pool;
		allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
		allocInfo.commandBufferCount = 1;
		return vkAllocateCommandBuffers(m_Device, &allocInfo, &outCommandBuffer);
	}

	VkResult VulkanDevice::BeginCommandBuffer(VkCommandBuffer commandBuffer, VkCommandBufferUsageFlags usage)
	{
		VkCommandBufferBeginInfo beginInfo{};
		beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
		beginInfo.flags = usage;
		beginInfo.pInheritanceInfo = nullptr;  // Only for secondary command buffers
		return vkBeginCommandBuffer(commandBuffer, &beginInfo);
	}

	VkResult VulkanDevice::EndCommandBuffer(VkCommandBuffer commandBuffer)
	{
		return vkEndCommandBuffer(commandBuffer);
	}

	//------------------------------------------------------------------------------
	// Recording
	//------------------------------------------------------------------------------

	void VulkanDevice::CmdBeginRenderPass(VkCommandBuffer commandBuffer, const VkRenderPassBeginInfo& beginInfo)
	{
		vkCmdBeginRenderPass(commandBuffer, &beginInfo, VK_SUBPASS_CONTENTS_INLINE);
	}

	void VulkanDevice::CmdEndRenderPass(VkCommandBuffer commandBuffer)
	{
		vkCmdEndRenderPass(commandBuffer);
	}

	void VulkanDevice::CmdBindPipeline(VkCommandBuffer commandBuffer, VkPipeline pipeline)
	{
		vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline);
	}

	void VulkanDevice::CmdSetViewport(VkCommandBuffer commandBuffer, const VkViewport& viewport)
	{
		vkCmdSetViewport(commandBuffer, 0, 1, &viewport);
	}

	void VulkanDevice::CmdSetScissor(VkCommandBuffer commandBuffer, const VkRect2D& scissor)
	{
		vkCmdSetScissor(commandBuffer, 0, 1, &scissor);
	}

	void VulkanDevice::CmdBindVertexBuffer(VkCommandBuffer commandBuffer, uint32_t binding, VkBuffer buffer, VkDeviceSize offset)
	{
		vkCmdBindVertexBuffers(commandBuffer, binding, 1, &buffer, &offset);
	}

	void VulkanDevice::CmdBindIndexBuffer(VkCommandBuffer commandBuffer, VkBuffer buffer, VkDeviceSize offset, VkIndexType indexType)
	{
		vkCmdBindIndexBuffer(commandBuffer, buffer, offset, indexType);
	}

	void VulkanDevice::CmdDrawIndexed(VkCommandBuffer commandBuffer, uint32_t indexCount, uint32_t instanceCount,
		uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance)
	{
		vkCmdDrawIndexed(commandBuffer, indexCount, instanceCount, firstIndex, vertexOffset, firstInstance);
	}

	//------------------------------------------------------------------------------
	// Pipelines
	//------------------------------------------------------------------------------

	bool VulkanDevice::CreateGraphicsPipeline(const PipelineDesc& desc, GraphicsPipeline& outPipeline)
	{
		VulkanPipelineBuilder builder(m_Device);
		return builder.Build(desc, outPipeline);
	}

	void VulkanDevice::DestroyGraphicsPipeline(GraphicsPipeline& pipeline)
	{
		VulkanPipelineBuilder::Destroy(m_Device, pipeline);
	}
}
