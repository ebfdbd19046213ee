#pragma once

#include <unordered_map>
#include <vector>
#include "dag/graph.hh"
#include "dag/options.hh"
#include "dag/unique-stack.hh"

/*
 * Tarjan's strongly connected components algorithm.
 *
 * The depth-first walk is driven by an explicit stack of frames instead of
 * recursion, so its depth is limited by tarjan_options::max_depth rather
 * than by the call stack. Exceeding the limit throws stack_overflow_error.
 *
 * A tarjan object holds the state of a single run and only reads the graph.
 */

namespace dag
{
template <typename K, typename V> class tarjan
{
      public:
	using component = std::vector<K>;

	tarjan(const graph<K, V> &g, const tarjan_options &opts = {});

	/* Can only be called once per object */
	std::vector<component> run();

      private:
	struct link {
		size_t index;
		size_t lowlink;
	};

	struct frame {
		K key;
		std::vector<K> succs;
		size_t next;
	};

	void strongconnect(const K &root);
	void open(const K &key, std::vector<frame> &frames);
	void close(const K &key);

	const graph<K, V> &graph_;
	tarjan_options opts_;
	bool done_ = false;

	size_t idx_ = 0;
	std::unordered_map<K, link> links_;
	unique_stack<K> stack_;
	std::vector<component> sccs_;
};

template <typename K, typename V>
std::vector<std::vector<K>>
strongly_connected_components(const graph<K, V> &g,
			      const tarjan_options &opts = {});
} // namespace dag

#include "dag/tarjan.hxx"
