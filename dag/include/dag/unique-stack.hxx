#pragma once

#include "dag/unique-stack.hh"
#include "dag/errors.hh"
#include "utils/assert.hh"
#include <utility>

namespace dag
{
template <typename T> unique_stack<T>::unique_stack(const std::vector<T> &elms)
{
	utils::uset<T> members;
	for (const auto &e : elms) {
		if (members.count(e))
			throw duplicate_element_error(describe(e));
		members += e;
	}

	stack_ = elms;
	members_ = std::move(members);
}

template <typename T> void unique_stack<T>::push(const T &elm)
{
	if (members_.count(elm))
		throw duplicate_element_error(describe(elm));

	stack_.push_back(elm);
	members_ += elm;
}

template <typename T> T unique_stack<T>::pop()
{
	if (stack_.empty())
		throw empty_stack_error("pop");

	T ret = std::move(stack_.back());
	stack_.pop_back();
	members_ -= ret;

	ASSERT(members_.size() == stack_.size(),
	       "membership set out of sync ({} members, {} elements)",
	       members_.size(), stack_.size());

	return ret;
}

template <typename T> const T &unique_stack<T>::peek() const
{
	if (stack_.empty())
		throw empty_stack_error("peek");
	return stack_.back();
}
} // namespace dag
