#pragma once
#include "utils/uset.hh"

namespace utils
{
template <typename T>
uset<T>::uset(const std::vector<T> &elms)
    : std::unordered_set<T>(elms.begin(), elms.end())
{
}

template <typename T>
uset<T>::uset(std::initializer_list<T> elms) : std::unordered_set<T>(elms)
{
}

template <typename T> uset<T> &uset<T>::operator+=(const uset &rhs)
{
	this->insert(rhs.begin(), rhs.end());
	return *this;
}

template <typename T> uset<T> &uset<T>::operator+=(const T &value)
{
	this->insert(value);
	return *this;
}

template <typename T> uset<T> &uset<T>::operator-=(const T &value)
{
	this->erase(value);
	return *this;
}

template <typename T> std::vector<T> uset<T>::collect() const
{
	return std::vector<T>(this->begin(), this->end());
}
} // namespace utils
