#pragma once

#include <initializer_list>
#include <unordered_set>
#include <vector>

namespace utils
{
template <typename T> class uset : public std::unordered_set<T>
{
      public:
	uset() = default;
	uset(const std::vector<T> &elms);
	uset(std::initializer_list<T> elms);

	uset<T> &operator+=(const uset &rhs);

	uset<T> &operator+=(const T &value);
	uset<T> &operator-=(const T &value);

	std::vector<T> collect() const;
};
} // namespace utils

#include "utils/uset.hxx"
