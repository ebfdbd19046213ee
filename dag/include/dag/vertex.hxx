#pragma once

#include "dag/vertex.hh"
#include <utility>

namespace dag
{
template <typename K, typename V>
vertex<K, V>::vertex(const K &key, std::optional<V> value)
    : key_(key), value_(std::move(value))
{
}

template <typename K, typename V> void vertex<K, V>::add_edge_to(vertex &other)
{
	succ_ += other.key_;
	other.pred_ += key_;
}
} // namespace dag
