#include <catch2/catch.hpp>
#include <stacy/graph.hpp>

using namespace stacy;

// ===== Graph =====

TEST_CASE("graph nodes and edges", "[graph]") {
    Graph<std::string> g;
    auto main = g.add_node("main.do");
    auto clean = g.add_node("clean.do");
    auto fig = g.add_node("fig.do");
    g.add_edge(main, clean);
    g.add_edge(main, fig);

    REQUIRE(g.node_count() == 3);
    REQUIRE(g.node(clean) == "clean.do");
    REQUIRE(g.successors(main).size() == 2);
    REQUIRE(g.successors(main)[0].to == clean);
    REQUIRE(g.successors(main)[1].to == fig);
    REQUIRE(g.successors(clean).empty());
}

TEST_CASE("find cycle returns a closed path", "[graph]") {
    Graph<std::string> g;
    auto a = g.add_node("a");
    auto b = g.add_node("b");
    auto c = g.add_node("c");
    auto d = g.add_node("d");
    g.add_edge(a, b);
    g.add_edge(b, c);
    g.add_edge(c, b);
    g.add_edge(a, d);

    auto cycle = g.find_cycle(a);
    REQUIRE(cycle == std::vector<size_t>{b, c, b});

    REQUIRE(g.find_cycle(d).empty());
}

TEST_CASE("self loop is a cycle", "[graph]") {
    Graph<std::string> g;
    auto a = g.add_node("a");
    g.add_edge(a, a);
    REQUIRE(g.find_cycle(a) == std::vector<size_t>{a, a});
}

TEST_CASE("tree display", "[graph]") {
    Graph<std::string, bool> g;
    auto main = g.add_node("main.do");
    auto clean = g.add_node("clean.do");
    auto load = g.add_node("load.do");
    auto fig = g.add_node("fig.do");
    g.add_edge(main, clean, true);
    g.add_edge(clean, load, true);
    g.add_edge(main, fig, false);

    auto text = g.tree_display(
        main,
        [&](size_t id, const Graph<std::string, bool>::Edge* via) {
            std::string s = g.node(id);
            if (via && !via->data) s += " (missing)";
            return s;
        },
        [](const Graph<std::string, bool>::Edge& e) { return e.data; });

    REQUIRE(text ==
            "main.do\n"
            "├── clean.do\n"
            "│   └── load.do\n"
            "└── fig.do (missing)\n");
}

// ===== GraphMap =====

TEST_CASE("graphmap interns names", "[graph]") {
    GraphMap<> g;
    auto a = g.add_node("clean.do");
    REQUIRE(g.add_node("clean.do") == a);
    g.add_edge("main.do", "clean.do");

    REQUIRE(g.node_count() == 2);
    REQUIRE(g.has_node("main.do"));
    REQUIRE_FALSE(g.has_node("fig.do"));
    const auto& out = g.inner().successors(g.node_id("main.do"));
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].to == a);
}

TEST_CASE("graphmap names the cycle", "[graph]") {
    GraphMap<> g;
    g.add_edge("all", "build");
    g.add_edge("build", "check");
    g.add_edge("check", "all");

    auto cycle = g.find_cycle("all");
    REQUIRE(cycle == std::vector<std::string>{"all", "build", "check", "all"});
    REQUIRE(g.find_cycle("unknown").empty());
}
