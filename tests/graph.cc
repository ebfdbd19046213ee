#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "dag/graph.hh"
#include "dag/errors.hh"
#include "utils/uset.hh"

using strset = utils::uset<std::string>;

namespace
{
/*
 * A small C build: objects depend on their sources and headers, the binary
 * depends on the objects.
 */
dag::graph<std::string> c_sources()
{
	dag::graph<std::string> g;
	for (const char *k :
	     {"source1.c", "source2.c", "source3.c", "header1.h", "header2.h",
	      "header3.h", "common1.h", "common2.h", "source1.o", "source2.o",
	      "source3.o", "binary"})
		g.add_vertex(k);

	g.add_edge("source1.o", "source1.c");
	g.add_edge("source2.o", "source2.c");
	g.add_edge("source3.o", "source3.c");

	g.add_edge("source1.o", "header1.h");
	g.add_edge("source2.o", "header2.h");
	g.add_edge("source3.o", "header3.h");

	g.add_edge("source1.o", "common1.h");
	g.add_edge("source2.o", "common1.h");

	g.add_edge("source2.o", "common2.h");
	g.add_edge("source3.o", "common2.h");

	g.add_edge("binary", "source1.o");
	g.add_edge("binary", "source2.o");
	g.add_edge("binary", "source3.o");

	return g;
}
} // namespace

TEST(graph, size_and_membership)
{
	dag::graph<std::string> g;
	EXPECT_EQ(g.size(), 0);

	g.add_vertex("a");
	EXPECT_EQ(g.size(), 1);
	EXPECT_TRUE(g.contains("a"));
	EXPECT_FALSE(g.contains("b"));
}

TEST(graph, duplicate_vertex_throws)
{
	dag::graph<std::string> g;
	g.add_vertex("a");

	EXPECT_THROW(g.add_vertex("a"), dag::duplicate_key_error);
	EXPECT_EQ(g.size(), 1);
	EXPECT_EQ(g.keys(), std::vector<std::string>{"a"});
}

TEST(graph, edge_to_unknown_vertex_throws)
{
	dag::graph<std::string> g;
	g.add_vertex("a");

	EXPECT_THROW(g.add_edge("d", "a"), dag::unknown_key_error);
	EXPECT_THROW(g.add_edge("a", "d"), dag::unknown_key_error);

	/* Nothing was added by the failed calls */
	EXPECT_TRUE(g.get_direct_successors("a").empty());
	EXPECT_TRUE(g.get_direct_predecessors("a").empty());
	EXPECT_FALSE(g.direct_cyclic());
}

TEST(graph, queries_on_unknown_vertex_throw)
{
	dag::graph<std::string> g;
	EXPECT_THROW(g.get_direct_successors("x"), dag::unknown_key_error);
	EXPECT_THROW(g.get_direct_predecessors("x"), dag::unknown_key_error);
	EXPECT_THROW(g.get_all_successors("x"), dag::unknown_key_error);
	EXPECT_THROW(g.get_all_predecessors("x"), dag::unknown_key_error);
	EXPECT_THROW(g.value("x"), dag::unknown_key_error);
}

TEST(graph, edge_direction)
{
	dag::graph<std::string> g;
	g.add_vertex("obj");
	g.add_vertex("src");

	/* src -> obj */
	g.add_edge("obj", "src");

	EXPECT_EQ(g.get_direct_successors("src"),
		  std::vector<std::string>{"obj"});
	EXPECT_EQ(g.get_direct_predecessors("obj"),
		  std::vector<std::string>{"src"});
	EXPECT_TRUE(g.get_direct_successors("obj").empty());
	EXPECT_TRUE(g.get_direct_predecessors("src").empty());
}

TEST(graph, repeated_edge_is_a_no_op)
{
	dag::graph<std::string> g;
	g.add_vertex("a");
	g.add_vertex("b");

	g.add_edge("a", "b");
	g.add_edge("a", "b");

	EXPECT_EQ(g.get_direct_successors("b").size(), 1);
	EXPECT_EQ(g.get_direct_predecessors("a").size(), 1);
}

TEST(graph, values)
{
	dag::graph<std::string, int> g;
	g.add_vertex("answer", 42);
	g.add_vertex("none");

	ASSERT_TRUE(g.value("answer").has_value());
	EXPECT_EQ(*g.value("answer"), 42);
	EXPECT_FALSE(g.value("none").has_value());

	/* Writing through an existing key is not an update */
	EXPECT_THROW(g.add_vertex("answer", 0), dag::duplicate_key_error);
	EXPECT_EQ(*g.value("answer"), 42);
}

TEST(graph, opaque_values)
{
	dag::graph<int> g;
	g.add_vertex(0, std::string("payload"));
	g.add_vertex(1);

	EXPECT_EQ(std::any_cast<std::string>(*g.value(0)), "payload");
	EXPECT_FALSE(g.value(1).has_value());
}

TEST(graph, keys_keep_insertion_order)
{
	dag::graph<std::string> g;
	g.add_vertex("z");
	g.add_vertex("a");
	g.add_vertex("m");

	EXPECT_EQ(g.keys(), (std::vector<std::string>{"z", "a", "m"}));
}

TEST(graph, c_source_dependencies)
{
	auto g = c_sources();

	EXPECT_EQ(strset(g.get_direct_predecessors("binary")),
		  (strset{"source1.o", "source2.o", "source3.o"}));

	EXPECT_EQ(strset(g.get_direct_successors("common1.h")),
		  (strset{"source1.o", "source2.o"}));

	auto deps = g.get_all_predecessors("source2.o");
	EXPECT_EQ(deps.size(), 4);
	EXPECT_EQ(strset(deps),
		  (strset{"source2.c", "header2.h", "common1.h", "common2.h"}));

	deps = g.get_all_successors("common1.h");
	EXPECT_EQ(deps.size(), 3);
	EXPECT_EQ(strset(deps), (strset{"source1.o", "source2.o", "binary"}));

	EXPECT_EQ(strset(g.get_all_predecessors("binary")).size(), 11);
	EXPECT_TRUE(g.get_all_successors("binary").empty());
	EXPECT_TRUE(g.get_all_predecessors("source1.c").empty());
}

/* The closure is the fixpoint of the direct queries */
TEST(graph, closure_matches_direct_queries)
{
	auto g = c_sources();

	for (const auto &k : g.keys()) {
		strset expected;
		std::vector<std::string> work = g.get_direct_successors(k);
		while (!work.empty()) {
			auto n = work.back();
			work.pop_back();
			if (expected.count(n))
				continue;
			expected += n;
			for (auto &s : g.get_direct_successors(n))
				work.push_back(s);
		}
		expected -= k;

		EXPECT_EQ(strset(g.get_all_successors(k)), expected) << k;
	}
}

TEST(graph, closure_terminates_on_cycles_and_excludes_start)
{
	dag::graph<std::string> g;
	g.add_vertex("a");
	g.add_vertex("b");
	g.add_vertex("c");

	g.add_edge("b", "a");
	g.add_edge("c", "b");
	g.add_edge("a", "c");

	EXPECT_EQ(strset(g.get_all_successors("a")), (strset{"b", "c"}));
	EXPECT_EQ(strset(g.get_all_predecessors("a")), (strset{"b", "c"}));
}

TEST(graph, add_edges_variadic)
{
	dag::graph<std::string> g;
	for (const char *k : {"a", "b", "c", "d", "e", "f", "g"})
		g.add_vertex(k);

	g.add_edges("a", "b", "c", "d", "e", "f");

	EXPECT_EQ(strset(g.get_direct_predecessors("a")),
		  (strset{"b", "c", "d", "e", "f"}));
	EXPECT_TRUE(g.get_direct_predecessors("g").empty());
}

TEST(graph, add_edges_list)
{
	dag::graph<std::string> g;
	for (const char *k : {"a", "b", "c", "d", "e", "f", "g"})
		g.add_vertex(k);

	g.add_edges("a", std::vector<std::string>{"b", "c", "d"}, "e");
	g.add_edges("g", {"f"});

	EXPECT_EQ(strset(g.get_direct_predecessors("a")),
		  (strset{"b", "c", "d", "e"}));
	EXPECT_EQ(g.get_direct_predecessors("g"),
		  std::vector<std::string>{"f"});
}

TEST(graph, add_edges_stops_at_first_unknown_key)
{
	dag::graph<std::string> g;
	for (const char *k : {"a", "b", "c"})
		g.add_vertex(k);

	EXPECT_THROW(g.add_edges("a", std::vector<std::string>{"b", "x", "c"}),
		     dag::unknown_key_error);

	EXPECT_EQ(g.get_direct_predecessors("a"),
		  std::vector<std::string>{"b"});
}

TEST(graph, integer_keys)
{
	dag::graph<int> g;
	for (int i = 0; i < 4; i++)
		g.add_vertex(i);
	g.add_edges(0, 1, 2);
	g.add_edge(1, 3);

	std::vector<int> all = g.get_all_predecessors(0);
	std::sort(all.begin(), all.end());
	EXPECT_EQ(all, (std::vector<int>{1, 2, 3}));

	try {
		g.add_edge(0, 9);
		FAIL() << "expected unknown_key_error";
	} catch (const dag::unknown_key_error &e) {
		EXPECT_NE(std::string(e.what()).find("'9'"), std::string::npos);
	}
}
