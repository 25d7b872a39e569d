//------------------------------------------------------------------------------
// VulkanPipelineBuilder.cpp
//------------------------------------------------------------------------------

#include "Vireo/Renderer/Vulkan/VulkanPipelineBuilder.hpp"
#include "Vireo/Core/Logger/Logger.hpp"

#include <array>

namespace Vireo
{
	bool VulkanPipelineBuilder::Build(const PipelineDesc& desc, GraphicsPipeline& outPipeline)
	{
		if (desc.colorFormat == VK_FORMAT_UNDEFINED)
		{
			LOG_ERROR("Pipeline requires a color format");
			return false;
		}

		GraphicsPipeline pipeline;

		if (!CreateRenderPass(desc.colorFormat, pipeline.renderPass))
		{
			return false;
		}

		VkShaderModule vertShaderModule = VK_NULL_HANDLE;
		VkShaderModule fragShaderModule = VK_NULL_HANDLE;
		if (!CreateShaderModule(desc.vertexShaderCode, vertShaderModule) ||
			!CreateShaderModule(desc.fragmentShaderCode, fragShaderModule))
		{
			LOG_ERROR("Failed to create shader modules");
			if (vertShaderModule != VK_NULL_HANDLE)
				vkDestroyShaderModule(m_Device, vertShaderModule, nullptr);
			Destroy(m_Device, pipeline);
			return false;
		}

		// Shader stages
		std::array<VkPipelineShaderStageCreateInfo, 2> shaderStages{};
		shaderStages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		shaderStages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
		shaderStages[0].module = vertShaderModule;
		shaderStages[0].pName = "main";

		shaderStages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		shaderStages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
		shaderStages[1].module = fragShaderModule;
		shaderStages[1].pName = "main";

		// Vertex input
		VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
		vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
		vertexInputInfo.vertexBindingDescriptionCount = 1;
		vertexInputInfo.pVertexBindingDescriptions = &desc.vertexBinding;
		vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(desc.vertexAttributes.size());
		vertexInputInfo.pVertexAttributeDescriptions = desc.vertexAttributes.data();

		VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
		inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
		inputAssembly.topology = desc.topology;
		inputAssembly.primitiveRestartEnable = VK_FALSE;

		// Counts only, the values are recorded every frame
		VkPipelineViewportStateCreateInfo viewportState{};
		viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
		viewportState.viewportCount = 1;
		viewportState.scissorCount = 1;

		std::array<VkDynamicState, 2> dynamicStates = {
			VK_DYNAMIC_STATE_VIEWPORT,
			VK_DYNAMIC_STATE_SCISSOR
		};

		VkPipelineDynamicStateCreateInfo dynamicState{};
		dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
		dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
		dynamicState.pDynamicStates = dynamicStates.data();

		// Rasterizer
		VkPipelineRasterizationStateCreateInfo rasterizer{};
		rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
		rasterizer.depthClampEnable = VK_FALSE;
		rasterizer.rasterizerDiscardEnable = VK_FALSE;
		rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
		rasterizer.lineWidth = 1.0f;
		rasterizer.cullMode = desc.cullMode;
		rasterizer.frontFace = desc.frontFace;
		rasterizer.depthBiasEnable = VK_FALSE;

		// Multisampling
		VkPipelineMultisampleStateCreateInfo multisampling{};
		multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
		multisampling.sampleShadingEnable = VK_FALSE;
		multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

		// Color blending, opaque
		VkPipelineColorBlendAttachmentState colorBlendAttachment{};
		colorBlendAttachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
			VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
		colorBlendAttachment.blendEnable = VK_FALSE;

		VkPipelineColorBlendStateCreateInfo colorBlending{};
		colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
		colorBlending.logicOpEnable = VK_FALSE;
		colorBlending.attachmentCount = 1;
		colorBlending.pAttachments = &colorBlendAttachment;

		// Pipeline layout, no descriptors or push constants
		VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
		pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
		pipelineLayoutInfo.setLayoutCount = 0;
		pipelineLayoutInfo.pushConstantRangeCount = 0;

		VkResult result = vkCreatePipelineLayout(m_Device, &pipelineLayoutInfo, nullptr, &pipeline.layout);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create pipeline layout: {}", VulkanUtils::VkResultToString(result));
			vkDestroyShaderModule(m_Device, vertShaderModule, nullptr);
			vkDestroyShaderModule(m_Device, fragShaderModule, nullptr);
			Destroy(m_Device, pipeline);
			return false;
		}

		VkGraphicsPipelineCreateInfo pipelineInfo{};
		pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
		pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages.size());
		pipelineInfo.pStages = shaderStages.data();
		pipelineInfo.pVertexInputState = &vertexInputInfo;
		pipelineInfo.pInputAssemblyState = &inputAssembly;
		pipelineInfo.pViewportState = &viewportState;
		pipelineInfo.pRasterizationState = &rasterizer;
		pipelineInfo.pMultisampleState = &multisampling;
		pipelineInfo.pDepthStencilState = nullptr;
		pipelineInfo.pColorBlendState = &colorBlending;
		pipelineInfo.pDynamicState = &dynamicState;
		pipelineInfo.layout = pipeline.layout;
		pipelineInfo.renderPass = pipeline.renderPass;
		pipelineInfo.subpass = 0;

		result = vkCreateGraphicsPipelines(m_Device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline.pipeline);

		// Modules are only needed during creation
		vkDestroyShaderModule(m_Device, vertShaderModule, nullptr);
		vkDestroyShaderModule(m_Device, fragShaderModule, nullptr);

		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create graphics pipeline: {}", VulkanUtils::VkResultToString(result));
			pipeline.pipeline = VK_NULL_HANDLE;
			Destroy(m_Device, pipeline);
			return false;
		}

		LOG_INFO("Graphics pipeline created (color format {})", static_cast<int>(desc.colorFormat));
		outPipeline = pipeline;
		return true;
	}

	void VulkanPipelineBuilder::Destroy(VkDevice device, GraphicsPipeline& pipeline)
	{
		if (device == VK_NULL_HANDLE)
			return;

		if (pipeline.pipeline != VK_NULL_HANDLE)
		{
			vkDestroyPipeline(device, pipeline.pipeline, nullptr);
			pipeline.pipeline = VK_NULL_HANDLE;
		}
		if (pipeline.layout != VK_NULL_HANDLE)
		{
			vkDestroyPipelineLayout(device, pipeline.layout, nullptr);
			pipeline.layout = VK_NULL_HANDLE;
		}
		if (pipeline.renderPass != VK_NULL_HANDLE)
		{
			vkDestroyRenderPass(device, pipeline.renderPass, nullptr);
			pipeline.renderPass = VK_NULL_HANDLE;
		}
	}

	bool VulkanPipelineBuilder::CreateRenderPass(VkFormat colorFormat, VkRenderPass& outRenderPass)
	{
		// Color attachment description
		VkAttachmentDescription colorAttachment{};
		colorAttachment.format = colorFormat;
		colorAttachment.samples = VK_SAMPLE_COUNT_1_BIT;
		colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
		colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
		colorAttachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
		colorAttachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
		colorAttachment.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
		colorAttachment.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

		VkAttachmentReference colorAttachmentRef{};
		colorAttachmentRef.attachment = 0;
		colorAttachmentRef.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

		VkSubpassDescription subpass{};
		subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
		subpass.colorAttachmentCount = 1;
		subpass.pColorAttachments = &colorAttachmentRef;

		// Wait for the acquire semaphore's stage before writing the attachment
		VkSubpassDependency dependency{};
		dependency.srcSubpass = VK_SUBPASS_EXTERNAL;
		dependency.dstSubpass = 0;
		dependency.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		dependency.srcAccessMask = 0;
		dependency.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

		VkRenderPassCreateInfo renderPassInfo{};
		renderPassInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
		renderPassInfo.attachmentCount = 1;
		renderPassInfo.pAttachments = &colorAttachment;
		renderPassInfo.subpassCount = 1;
		renderPassInfo.pSubpasses = &subpass;
		renderPassInfo.dependencyCount = 1;
		renderPassInfo.pDependencies = &dependency;

		VkResult result = vkCreateRenderPass(m_Device, &renderPassInfo, nullptr, &outRenderPass);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create render pass: {}", VulkanUtils::VkResultToString(result));
			outRenderPass = VK_NULL_HANDLE;
			return false;
		}

		return true;
	}

	bool VulkanPipelineBuilder::CreateShaderModule(const std::vector<uint32_t>& code, VkShaderModule& outModule)
	{
		if (code.empty())
		{
			LOG_ERROR("Empty SPIR-V module");
			return false;
		}

		VkShaderModuleCreateInfo createInfo{};
		createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
		createInfo.codeSize = code.size() * sizeof(uint32_t);
		createInfo.pCode = code.data();

		VkResult result = vkCreateShaderModule(m_Device, &createInfo, nullptr, &outModule);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create shader module: {}", VulkanUtils::VkResultToString(result));
			outModule = VK_NULL_HANDLE;
			return false;
		}

		return true;
	}
}
