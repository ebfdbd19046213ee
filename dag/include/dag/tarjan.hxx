#pragma once

#include "dag/tarjan.hh"
#include "dag/errors.hh"
#include "utils/assert.hh"
#include "utils/random.hh"
#include <algorithm>
#include <utility>

#ifndef DAG_LOG_TARJAN
#define DAG_LOG_TARJAN 0
#endif

#if DAG_LOG_TARJAN
#define TARJAN_LOG(...) fmt::print(__VA_ARGS__)
#else
#define TARJAN_LOG(...)
#endif

namespace dag
{
template <typename K, typename V>
tarjan<K, V>::tarjan(const graph<K, V> &g, const tarjan_options &opts)
    : graph_(g), opts_(opts)
{
}

template <typename K, typename V>
std::vector<typename tarjan<K, V>::component> tarjan<K, V>::run()
{
	ASSERT(!done_, "tarjan::run() called twice");
	done_ = true;

	std::vector<K> roots = graph_.keys();
	if (opts_.shuffle) {
		if (opts_.seed)
			utils::seed(*opts_.seed);
		utils::shuffle(roots.begin(), roots.end());
	}

	TARJAN_LOG("tarjan: {} vertices, shuffle {}, max depth {}\n",
		   roots.size(), opts_.shuffle, opts_.max_depth);

	for (const auto &r : roots) {
		if (!links_.count(r))
			strongconnect(r);
	}

	TARJAN_LOG("tarjan: {} components\n", sccs_.size());

	return std::move(sccs_);
}

template <typename K, typename V>
void tarjan<K, V>::open(const K &key, std::vector<frame> &frames)
{
	if (opts_.max_depth && frames.size() >= opts_.max_depth) {
		TARJAN_LOG("tarjan: depth limit {} reached\n", opts_.max_depth);
		throw stack_overflow_error(opts_.max_depth);
	}

	links_.emplace(key, link{idx_, idx_});
	idx_++;
	stack_.push(key);

	std::vector<K> succs = graph_.node(key).succs().collect();
	if (opts_.shuffle)
		utils::shuffle(succs.begin(), succs.end());

	frames.push_back(frame{key, std::move(succs), 0});
}

/*
 * All the successors of key have been explored. If key is the root of its
 * component, everything above it on the stack belongs to the component.
 */
template <typename K, typename V> void tarjan<K, V>::close(const K &key)
{
	const link &l = links_.at(key);
	if (l.lowlink != l.index)
		return;

	component scc;
	for (;;) {
		ASSERT(!stack_.empty(), "component root is not on the stack");
		K w = stack_.pop();
		bool root = w == key;
		scc.push_back(std::move(w));
		if (root)
			break;
	}

	TARJAN_LOG("tarjan: component of size {}\n", scc.size());
	sccs_.push_back(std::move(scc));
}

template <typename K, typename V>
void tarjan<K, V>::strongconnect(const K &root)
{
	TARJAN_LOG("tarjan: new root, index {}\n", idx_);

	std::vector<frame> frames;
	open(root, frames);

	while (!frames.empty()) {
		frame &f = frames.back();

		if (f.next < f.succs.size()) {
			const K &w = f.succs[f.next++];
			auto it = links_.find(w);
			if (it == links_.end()) {
				/* f is invalidated by the push */
				K next = w;
				open(next, frames);
			} else if (stack_.contains(w)) {
				link &v = links_.at(f.key);
				v.lowlink = std::min(v.lowlink, it->second.index);
			}
			continue;
		}

		K v = std::move(f.key);
		frames.pop_back();
		close(v);

		if (!frames.empty()) {
			link &parent = links_.at(frames.back().key);
			parent.lowlink =
				std::min(parent.lowlink, links_.at(v).lowlink);
		}
	}
}

template <typename K, typename V>
std::vector<std::vector<K>>
strongly_connected_components(const graph<K, V> &g, const tarjan_options &opts)
{
	return tarjan<K, V>(g, opts).run();
}

template <typename K, typename V>
std::vector<std::vector<K>>
graph<K, V>::strongly_connected_components(const tarjan_options &opts) const
{
	return dag::strongly_connected_components(*this, opts);
}

template <typename K, typename V>
bool graph<K, V>::is_cyclic(const tarjan_options &opts) const
{
	if (direct_cyclic_)
		return true;

	return strongly_connected_components(opts).size() < size();
}

template <typename K, typename V> bool graph<K, V>::is_cyclic(bool use_rng) const
{
	return is_cyclic(tarjan_options(use_rng));
}
} // namespace dag
