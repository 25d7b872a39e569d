//------------------------------------------------------------------------------
// VulkanPipelineBuilder.hpp
//
// Builds the (layout, render pass, pipeline) triple for a color format.
// Viewport and scissor are dynamic state, so the triple survives resizes.
//------------------------------------------------------------------------------

#pragma once

#include "Vireo/Renderer/RenderDevice.hpp"
#include "VulkanCommon.hpp"

#include <vector>

namespace Vireo
{
	class VulkanPipelineBuilder
	{
	public:
		explicit VulkanPipelineBuilder(VkDevice device) : m_Device(device) {}

		// On failure nothing is left allocated and outPipeline is untouched
		bool Build(const PipelineDesc& desc, GraphicsPipeline& outPipeline);

		static void Destroy(VkDevice device, GraphicsPipeline& pipeline);

	private:
		bool CreateRenderPass(VkFormat colorFormat, VkRenderPass& outRenderPass);
		bool CreateShaderModule(const std::vector<uint32_t>& code, VkShaderModule& outModule);

		VkDevice m_Device = VK_NULL_HANDLE;
	};
}
