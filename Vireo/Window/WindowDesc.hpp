//------------------------------------------------------------------------------
// WindowDesc.hpp
//
// Window creation parameters
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

#include <string>

namespace Vireo
{
	struct WindowDesc
	{
		std::string title = "Vireo";
		int width = 800;
		int height = 600;
		bool resizable = true;
		bool visible = true;
	};
}
