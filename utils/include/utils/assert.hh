#pragma once

#include <string>
#include "fmt/format.h"

#define ASSERT(cond, ...)                                                      \
	do {                                                                   \
		if (!(cond))                                                   \
			utils::assertion_failed(__FILE__, __LINE__, __func__,  \
						#cond,                         \
						fmt::format(__VA_ARGS__));     \
	} while (0)

namespace utils
{
/*
 * Internal invariant violations are bugs in the library, not usage errors:
 * they are reported on stderr and the process is aborted.
 */
[[noreturn]] void assertion_failed(const std::string &file, size_t line,
				   const std::string &fun,
				   const std::string &cond,
				   const std::string &msg);
} // namespace utils
