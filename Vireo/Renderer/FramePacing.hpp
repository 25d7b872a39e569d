//------------------------------------------------------------------------------
// FramePacing.hpp
//
// How the frame driver throttles the CPU against the GPU
//------------------------------------------------------------------------------
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Vireo
{
	enum class FramePacing
	{
		// One frame slot. Every frame blocks until its presentation future completes.
		Synchronous,

		// Two frame slots. A frame only waits for the fence of the slot it is about to reuse.
		Pipelined
	};

	inline uint32_t FramesInFlightFor(FramePacing pacing)
	{
		return pacing == FramePacing::Pipelined ? 2u : 1u;
	}

	inline const char* FramePacingToString(FramePacing pacing)
	{
		return pacing == FramePacing::Pipelined ? "pipelined" : "synchronous";
	}

	inline std::optional<FramePacing> FramePacingFromString(std::string_view name)
	{
		if (name == "synchronous" || name == "sync")
			return FramePacing::Synchronous;
		if (name == "pipelined")
			return FramePacing::Pipelined;
		return std::nullopt;
	}
}
