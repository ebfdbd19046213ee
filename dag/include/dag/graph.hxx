#pragma once

#include "dag/graph.hh"
#include "dag/errors.hh"
#include "utils/assert.hh"
#include "utils/uset.hh"
#include <tuple>
#include <utility>

namespace dag
{
template <typename K, typename V>
const vertex<K, V> &graph<K, V>::node(const K &key) const
{
	auto it = vertices_.find(key);
	if (it == vertices_.end())
		throw unknown_key_error(describe(key));
	return it->second;
}

template <typename K, typename V>
const std::optional<V> &graph<K, V>::value(const K &key) const
{
	return node(key).value();
}

template <typename K, typename V>
void graph<K, V>::add_vertex(const K &key, std::optional<V> value)
{
	if (vertices_.count(key))
		throw duplicate_key_error(describe(key));

	vertices_.emplace(std::piecewise_construct, std::forward_as_tuple(key),
			  std::forward_as_tuple(key, std::move(value)));
	keys_.push_back(key);
}

template <typename K, typename V>
void graph<K, V>::add_edge(const K &dst, const K &src)
{
	auto s = vertices_.find(src);
	if (s == vertices_.end())
		throw unknown_key_error(describe(src));

	auto d = vertices_.find(dst);
	if (d == vertices_.end())
		throw unknown_key_error(describe(dst));

	if (src == dst)
		direct_cyclic_ = true;

	s->second.add_edge_to(d->second);
}

template <typename K, typename V>
template <typename... Srcs>
void graph<K, V>::add_edges(const K &dst, const Srcs &...srcs)
{
	(add_edges_from(dst, srcs), ...);
}

template <typename K, typename V>
void graph<K, V>::add_edges(const K &dst, std::initializer_list<K> srcs)
{
	for (const auto &src : srcs)
		add_edge(dst, src);
}

template <typename K, typename V>
void graph<K, V>::add_edges_from(const K &dst, const std::vector<K> &srcs)
{
	for (const auto &src : srcs)
		add_edge(dst, src);
}

template <typename K, typename V>
std::vector<K> graph<K, V>::get_direct_successors(const K &key) const
{
	return node(key).succs().collect();
}

template <typename K, typename V>
std::vector<K> graph<K, V>::get_direct_predecessors(const K &key) const
{
	return node(key).preds().collect();
}

template <typename K, typename V>
std::vector<K> graph<K, V>::get_all_successors(const K &key) const
{
	return reachable(key, walk::succs);
}

template <typename K, typename V>
std::vector<K> graph<K, V>::get_all_predecessors(const K &key) const
{
	return reachable(key, walk::preds);
}

template <typename K, typename V>
std::vector<K> graph<K, V>::reachable(const K &key, walk direction) const
{
	auto next = [&](const vertex_type &v) -> const utils::uset<K> & {
		return direction == walk::succs ? v.succs() : v.preds();
	};

	std::vector<K> worklist = next(node(key)).collect();
	utils::uset<K> seen;

	while (!worklist.empty()) {
		K k = std::move(worklist.back());
		worklist.pop_back();
		if (seen.count(k))
			continue;
		seen += k;

		auto it = vertices_.find(k);
		ASSERT(it != vertices_.end(),
		       "adjacency refers to a vertex that is not in the graph");

		for (const auto &n : next(it->second)) {
			if (!seen.count(n))
				worklist.push_back(n);
		}
	}

	/* The start is only reachable from itself through a cycle */
	seen -= key;
	return seen.collect();
}
} // namespace dag
