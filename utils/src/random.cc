#include "utils/random.hh"
#include <random>

namespace utils
{
/* xorshift never leaves the all-zero state */
static constexpr uint64_t zero_seed_replacement = 0x9e3779b97f4a7c15ull;

static uint64_t device_seed()
{
	std::random_device rd;
	uint64_t s = (static_cast<uint64_t>(rd()) << 32) | rd();
	return s ? s : zero_seed_replacement;
}

thread_local xorshift_state state{device_seed()};

void seed(uint64_t seed) { state.a = seed ? seed : zero_seed_replacement; }
} // namespace utils
