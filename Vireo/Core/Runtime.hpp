//------------------------------------------------------------------------------
// Runtime.hpp
//
// Process-wide runtime setup (logging sinks, version banner)
// Copyright (c) 2024 The Vireo Authors. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

namespace Vireo
{
	struct RuntimeConfig;

	// Initialize runtime systems
	void RuntimeInit(const RuntimeConfig& config);

	// Shutdown runtime systems
	void RuntimeShutdown();
}
