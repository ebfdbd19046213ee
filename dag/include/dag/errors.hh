#pragma once

#include <stdexcept>
#include <string>
#include "fmt/format.h"

/*
 * Usage errors raised by the dag library. They are thrown at the point of
 * violation, before anything is mutated, and are never caught internally.
 */

namespace dag
{
class error : public std::runtime_error
{
      public:
	explicit error(const std::string &msg) : std::runtime_error(msg) {}
};

class duplicate_key_error : public error
{
      public:
	explicit duplicate_key_error(const std::string &key);
};

class unknown_key_error : public error
{
      public:
	explicit unknown_key_error(const std::string &key);
};

class duplicate_element_error : public error
{
      public:
	explicit duplicate_element_error(const std::string &elm);
};

class empty_stack_error : public error
{
      public:
	explicit empty_stack_error(const std::string &op);
};

/* The depth-first walk went deeper than tarjan_options::max_depth. */
class stack_overflow_error : public error
{
      public:
	explicit stack_overflow_error(size_t max_depth);

	size_t max_depth() const { return max_depth_; }

      private:
	size_t max_depth_;
};

/* Printable form of a key for error messages. */
template <typename K> std::string describe(const K &key)
{
	if constexpr (fmt::is_formattable<K>::value)
		return fmt::format("'{}'", key);
	else
		return "<unprintable key>";
}
} // namespace dag
