#pragma once

#include <optional>
#include "utils/uset.hh"

namespace dag
{
/*
 * A vertex of a graph<K, V>: its key, an optional payload, and the keys of
 * its direct successors and predecessors. The key is the identity of the
 * vertex and never changes.
 */
template <typename K, typename V> class vertex
{
      public:
	vertex(const K &key, std::optional<V> value);

	const K &key() const { return key_; }

	const std::optional<V> &value() const { return value_; }

	const utils::uset<K> &succs() const { return succ_; }
	const utils::uset<K> &preds() const { return pred_; }

	/* Adds the edge this -> other, keeping both adjacency sets in sync */
	void add_edge_to(vertex &other);

      private:
	const K key_;
	std::optional<V> value_;

	utils::uset<K> succ_;
	utils::uset<K> pred_;
};
} // namespace dag

#include "dag/vertex.hxx"
