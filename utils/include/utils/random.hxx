#pragma once

#include "utils/random.hh"
#include <iterator>
#include <utility>

namespace utils
{
extern thread_local xorshift_state state;

template <typename T> T rand(T low, T high)
{
	if (low >= high)
		return low;

	uint64_t x = state.a;
	x ^= x << 13;
	x ^= x >> 7;
	x ^= x << 17;
	state.a = x;

	uint64_t dist = high - low;
	return (x % dist) + low;
}

template <typename It> void shuffle(It beg, It end)
{
	auto dist = std::distance(beg, end);
	if (dist < 2)
		return;

	for (size_t i = dist - 1; i > 0; i--) {
		auto j = rand<size_t>(0, i + 1);
		if (j != i)
			std::iter_swap(std::next(beg, i), std::next(beg, j));
	}
}
} // namespace utils
