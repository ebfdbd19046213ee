#pragma once

#include <vector>
#include "utils/uset.hh"

/*
 * A stack whose elements are all distinct.
 * The elements are kept in a vector for the ordering, and mirrored in a
 * set so that membership tests are O(1).
 */

namespace dag
{
template <typename T> class unique_stack
{
      public:
	using const_iterator = typename std::vector<T>::const_iterator;

	unique_stack() = default;

	/* Throws duplicate_element_error if elms contains repeats */
	unique_stack(const std::vector<T> &elms);

	void push(const T &elm);
	T pop();
	const T &peek() const;

	bool contains(const T &elm) const { return members_.count(elm); }
	size_t size() const { return stack_.size(); }
	bool empty() const { return stack_.empty(); }

	/* Bottom to top */
	const_iterator begin() const { return stack_.begin(); }
	const_iterator end() const { return stack_.end(); }

      private:
	std::vector<T> stack_;
	utils::uset<T> members_;
};
} // namespace dag

#include "dag/unique-stack.hxx"
