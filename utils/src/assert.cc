#include "utils/assert.hh"
#include <cstdio>
#include <cstdlib>

namespace utils
{
void assertion_failed(const std::string &file, size_t line,
		      const std::string &fun, const std::string &cond,
		      const std::string &msg)
{
	fmt::print(stderr, "{}:{}:{} - `{}` failed: {}\n", file, line, fun,
		   cond, msg);
	std::fflush(stderr);
	std::abort();
}
} // namespace utils
