#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace dag
{
struct tarjan_options {
	static constexpr size_t default_max_depth = 4096;

	tarjan_options(bool shuffle = false,
		       size_t max_depth = default_max_depth)
	    : shuffle(shuffle), max_depth(max_depth)
	{
	}

	/* Randomize the root order and the successor order of each vertex */
	bool shuffle;

	/*
	 * Maximum number of simultaneously open frames in the depth-first
	 * walk. 0 means unbounded.
	 */
	size_t max_depth;

	/* Reseed the thread local generator before shuffling */
	std::optional<uint64_t> seed;
};
} // namespace dag
