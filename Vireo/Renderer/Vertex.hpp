// Vertex.hpp
#pragma once

#include <vulkan/vulkan.h>
#include <glm/glm.hpp>
#include <array>
#include <cstddef>

namespace Vireo
{
	struct ColoredVertex
	{
		glm::vec3 position;
		glm::vec3 color;

		// Tell Vulkan how to read this vertex data from a buffer
		static VkVertexInputBindingDescription GetBindingDescription()
		{
			VkVertexInputBindingDescription bindingDesc{};
			bindingDesc.binding = 0;
			bindingDesc.stride = sizeof(ColoredVertex);
			bindingDesc.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

			return bindingDesc;
		}

		static std::array<VkVertexInputAttributeDescription, 2> GetAttributeDescriptions()
		{
			std::array<VkVertexInputAttributeDescription, 2> attributeDesc{};

			// Position attribute
			attributeDesc[0].binding = 0;
			attributeDesc[0].location = 0;  // layout(location = 0)
			attributeDesc[0].format = VK_FORMAT_R32G32B32_SFLOAT;  // vec3
			attributeDesc[0].offset = offsetof(ColoredVertex, position);

			// Color attribute
			attributeDesc[1].binding = 0;
			attributeDesc[1].location = 1;  // layout(location = 1)
			attributeDesc[1].format = VK_FORMAT_R32G32B32_SFLOAT;  // vec3
			attributeDesc[1].offset = offsetof(ColoredVertex, color);

			return attributeDesc;
		}
	};

	static_assert(sizeof(ColoredVertex) == 6 * sizeof(float), "ColoredVertex must be tightly packed");
}
