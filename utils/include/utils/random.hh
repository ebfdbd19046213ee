#pragma once

#include <cstdint>

namespace utils
{
struct xorshift_state {
	uint64_t a;
};

/*
 * Returns a value in [low, high[, or low if the range is empty.
 * The generator state is thread local.
 */
template <typename T> T rand(T low, T high);

/* Fisher-Yates shuffle of [beg, end[ */
template <typename It> void shuffle(It beg, It end);

void seed(uint64_t seed);
} // namespace utils

#include "utils/random.hxx"
