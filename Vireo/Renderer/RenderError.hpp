//------------------------------------------------------------------------------
// RenderError.hpp
//
// Exception type for unrecoverable per-frame GPU failures
//------------------------------------------------------------------------------
#pragma once

#include "Vireo/Renderer/Vulkan/VulkanCommon.hpp"

#include <format>
#include <stdexcept>
#include <string>

namespace Vireo
{
	// Thrown when recording, submission, presentation or a resource allocation fails
	// in a way the frame loop can't recover from. Carries the VkResult that caused it.
	class RenderError : public std::runtime_error
	{
	public:
		explicit RenderError(const std::string& message, VkResult result = VK_ERROR_UNKNOWN)
			: std::runtime_error(std::format("{} ({})", message, VulkanUtils::VkResultToString(result)))
			, m_Result(result)
		{
		}

		VkResult GetResult() const { return m_Result; }

	private:
		VkResult m_Result;
	};

	// Throws RenderError unless result is VK_SUCCESS
	inline void ThrowIfFailed(VkResult result, const char* operation)
	{
		if (result != VK_SUCCESS)
			throw RenderError(operation, result);
	}
}
