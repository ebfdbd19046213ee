#pragma once

#include <any>
#include <initializer_list>
#include <optional>
#include <unordered_map>
#include <vector>
#include "dag/options.hh"
#include "dag/vertex.hh"

/*
 * A directed graph keyed by vertex identity.
 *
 * Vertices are added one at a time and never removed. Edges are added
 * between existing vertices only, with the convention that
 * add_edge(dst, src) creates src -> dst: dst becomes a successor of src and
 * src a predecessor of dst.
 *
 * The keys are also kept in insertion order, which is the default order in
 * which the cycle detector picks its roots.
 *
 * Nothing is cached: the traversal queries and the cycle detection are
 * recomputed on every call. The graph is not safe for concurrent use.
 */

namespace dag
{
template <typename K, typename V = std::any> class graph
{
      public:
	using key_type = K;
	using value_type = V;
	using vertex_type = vertex<K, V>;

	graph() = default;

	size_t size() const { return keys_.size(); }
	bool contains(const K &key) const { return vertices_.count(key); }

	/* All keys, in insertion order */
	const std::vector<K> &keys() const { return keys_; }

	const vertex_type &node(const K &key) const;
	const std::optional<V> &value(const K &key) const;

	/* Throws duplicate_key_error if the key is already in the graph */
	void add_vertex(const K &key, std::optional<V> value = std::nullopt);

	/*
	 * Adds src -> dst. Throws unknown_key_error if either end is missing,
	 * in which case the graph is left untouched.
	 */
	void add_edge(const K &dst, const K &src);

	/*
	 * Adds one edge src -> dst per source. Each argument is either a key
	 * or a std::vector of keys, and both can be mixed:
	 *   g.add_edges("a", "b", "c");
	 *   g.add_edges("a", std::vector<std::string>{"b", "c"}, "d");
	 * Edges are added in order; the first missing key throws and the
	 * edges added before it stay.
	 */
	template <typename... Srcs> void add_edges(const K &dst, const Srcs &...srcs);
	void add_edges(const K &dst, std::initializer_list<K> srcs);

	std::vector<K> get_direct_successors(const K &key) const;
	std::vector<K> get_direct_predecessors(const K &key) const;

	/*
	 * Transitive closures: every vertex reachable by following one or
	 * more edges, excluding the starting vertex itself.
	 */
	std::vector<K> get_all_successors(const K &key) const;
	std::vector<K> get_all_predecessors(const K &key) const;

	/* True once a self-loop has been added */
	bool direct_cyclic() const { return direct_cyclic_; }

	/*
	 * Defined in dag/tarjan.hxx.
	 * A self-loop is reported without running the SCC computation.
	 */
	bool is_cyclic(bool use_rng = false) const;
	bool is_cyclic(const tarjan_options &opts) const;
	std::vector<std::vector<K>>
	strongly_connected_components(const tarjan_options &opts = {}) const;

      private:
	enum class walk { succs, preds };

	std::vector<K> reachable(const K &key, walk direction) const;

	void add_edges_from(const K &dst, const K &src) { add_edge(dst, src); }
	void add_edges_from(const K &dst, const std::vector<K> &srcs);

	std::unordered_map<K, vertex_type> vertices_;
	std::vector<K> keys_;
	bool direct_cyclic_ = false;
};
} // namespace dag

#include "dag/graph.hxx"
#include "dag/tarjan.hh"
