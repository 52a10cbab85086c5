#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "layout/layout_engine.hpp"
#include "layout/quad_tree.hpp"
#include "test_fixtures.hpp"

#include <algorithm>
#include <cmath>
#include <random>

using namespace netmap;
using namespace netmap::testing;

namespace {

struct Box {
    double min_x = 1e300, min_y = 1e300, max_x = -1e300, max_y = -1e300;

    void add(const Point& p) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }

    bool overlaps(const Box& o) const {
        return min_x <= o.max_x && o.min_x <= max_x && min_y <= o.max_y && o.min_y <= max_y;
    }
};

Box box_of(const LayoutResult& layout, const std::string& prefix) {
    Box b;
    for (size_t i = 0; i < layout.ids.size(); ++i) {
        if (layout.ids[i].rfind(prefix, 0) == 0) b.add(layout.positions[i]);
    }
    return b;
}

bool finite(const LayoutResult& layout) {
    return std::all_of(layout.positions.begin(), layout.positions.end(),
                       [](const Point& p) { return std::isfinite(p.x) && std::isfinite(p.y); });
}

} // namespace

// ==========================================
// Sizing function
// ==========================================

TEST(PlanLayout, IterationsShrinkWithSize) {
    LayoutConfig config;
    config.base_iterations = 100;
    config.approximation_threshold = 250;

    EXPECT_EQ(plan_layout(0, config).iterations, 0);
    EXPECT_EQ(plan_layout(1, config).iterations, 0);
    EXPECT_EQ(plan_layout(10, config).iterations, 100);
    EXPECT_EQ(plan_layout(1000, config).iterations, 100);
    EXPECT_EQ(plan_layout(1001, config).iterations, 50);
    EXPECT_EQ(plan_layout(2000, config).iterations, 50);
    EXPECT_EQ(plan_layout(2001, config).iterations, 30);
}

TEST(PlanLayout, ApproximationAboveThreshold) {
    LayoutConfig config;
    config.approximation_threshold = 250;
    EXPECT_FALSE(plan_layout(250, config).use_approximation);
    EXPECT_TRUE(plan_layout(251, config).use_approximation);
}

TEST(LayoutStrategyFactory, KnownAndUnknownNames) {
    EXPECT_EQ(make_layout_strategy("force")->name(), "force");
    EXPECT_EQ(make_layout_strategy("circular")->name(), "circular");
    EXPECT_EQ(make_layout_strategy("shell")->name(), "shell");
    EXPECT_THROW(make_layout_strategy("spiral"), InvalidArgument);
}

// ==========================================
// Engine
// ==========================================

TEST(LayoutEngineTest, TrivialGraphs) {
    LayoutEngine engine;

    GraphSnapshot empty("s", {}, {}, TimePoint{});
    auto r0 = engine.compute(empty);
    EXPECT_EQ(r0.size(), 0);
    EXPECT_EQ(r0.iterations, 0);

    auto single = make_snapshot({"only"}, {});
    auto r1 = engine.compute(*single);
    ASSERT_EQ(r1.size(), 1);
    EXPECT_EQ(r1.iterations, 0);
    EXPECT_DOUBLE_EQ(r1.positions[0].x, 0.0);
    EXPECT_DOUBLE_EQ(r1.positions[0].y, 0.0);
}

TEST(LayoutEngineTest, SameSeedSameCoordinates) {
    auto graph = make_clique_chain(4, 6);
    LayoutEngine engine;

    auto a = engine.compute(*graph, "force", 0, 7);
    auto b = engine.compute(*graph, "force", 0, 7);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a.positions[i].x, b.positions[i].x);
        EXPECT_DOUBLE_EQ(a.positions[i].y, b.positions[i].y);
    }
    EXPECT_TRUE(finite(a));
    EXPECT_EQ(a.seed, 7u);
    EXPECT_EQ(a.algorithm, "force");
    EXPECT_GT(a.iterations, 0);
}

TEST(LayoutEngineTest, DifferentSeedsDiffer) {
    auto graph = make_clique_chain(3, 5);
    LayoutEngine engine;
    auto a = engine.compute(*graph, "force", 0, 1);
    auto b = engine.compute(*graph, "force", 0, 2);

    bool any_diff = false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a.positions[i].x != b.positions[i].x || a.positions[i].y != b.positions[i].y) any_diff = true;
    }
    EXPECT_TRUE(any_diff);
}

TEST(LayoutEngineTest, DisconnectedComponentsDoNotOverlap) {
    std::vector<std::string> ids;
    std::vector<std::pair<std::string, std::string>> edges;
    for (int i = 0; i < 8; ++i) {
        ids.push_back("a" + std::to_string(i));
        if (i > 0) edges.emplace_back("a0", "a" + std::to_string(i));
    }
    for (int i = 0; i < 5; ++i) {
        ids.push_back("b" + std::to_string(i));
        if (i > 0) edges.emplace_back("b" + std::to_string(i - 1), "b" + std::to_string(i));
    }
    auto graph = make_snapshot(ids, edges);
    ASSERT_EQ(graph->num_components(), 2);

    LayoutEngine engine;
    for (const char* algorithm : {"force", "circular", "shell"}) {
        auto layout = engine.compute(*graph, algorithm, 0, 42);
        EXPECT_TRUE(finite(layout)) << algorithm;
        EXPECT_FALSE(box_of(layout, "a").overlaps(box_of(layout, "b"))) << algorithm;
    }
}

TEST(LayoutEngineTest, ScaledToViewport) {
    auto graph = make_clique_chain(2, 4);
    LayoutConfig config;
    config.scale = 100.0;
    LayoutEngine engine(config);
    auto layout = engine.compute(*graph);

    double expected = 100.0 + 3.0 * 8;
    double max_abs = 0.0;
    for (const auto& p : layout.positions) {
        max_abs = std::max({max_abs, std::abs(p.x), std::abs(p.y)});
    }
    EXPECT_NEAR(max_abs, expected, 1e-6);
    EXPECT_DOUBLE_EQ(layout.scale, expected);
}

TEST(LayoutEngineTest, PositionLookupById) {
    auto graph = make_snapshot({"x", "y", "z"}, {{"x", "y"}, {"y", "z"}});
    LayoutEngine engine;
    auto layout = engine.compute(*graph, "circular", 0, 1);
    ASSERT_TRUE(layout.position_of("y").has_value());
    EXPECT_DOUBLE_EQ(layout.position_of("y")->x, layout.positions[1].x);
    EXPECT_FALSE(layout.position_of("w").has_value());

    auto j = layout.to_json();
    EXPECT_TRUE(j["positions"].contains("z"));
}

TEST(LayoutEngineTest, ApproximationUsedForLargeComponents) {
    auto graph = make_clique_chain(30, 4);  // 120 nodes, one component
    LayoutConfig config;
    config.approximation_threshold = 60;
    config.base_iterations = 10;
    LayoutEngine engine(config);

    auto layout = engine.compute(*graph);
    EXPECT_TRUE(layout.approximated);
    EXPECT_TRUE(finite(layout));
}

TEST(LayoutEngineTest, ExpiredBudgetIsBestEffort) {
    auto graph = make_clique_chain(5, 5);
    LayoutEngine engine;
    auto layout = engine.compute(*graph, "force", 200, 3, Budget::from_now(Duration(0)));
    EXPECT_TRUE(layout.best_effort);
    EXPECT_LT(layout.iterations, 200);
    EXPECT_TRUE(finite(layout));
}

// ==========================================
// Barnes-Hut quadtree
// ==========================================

TEST(QuadTreeTest, ZeroThetaMatchesExactSum) {
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> coord(-50.0, 50.0);
    std::vector<Point> points(40);
    std::vector<double> masses(40);
    for (size_t i = 0; i < points.size(); ++i) {
        points[i] = {coord(rng), coord(rng)};
        masses[i] = 1.0 + static_cast<double>(i % 3);
    }

    QuadTree tree;
    tree.build(points, masses);

    for (size_t i = 0; i < points.size(); ++i) {
        Point exact;
        for (size_t j = 0; j < points.size(); ++j) {
            if (j == i) continue;
            double dx = points[i].x - points[j].x;
            double dy = points[i].y - points[j].y;
            double d2 = dx * dx + dy * dy;
            double f = 2.0 * masses[i] * masses[j] / d2;  // coeff * m_a * m_b / d, along unit vector
            exact.x += dx * f;
            exact.y += dy * f;
        }
        Point approx = tree.repulsion(i, 2.0, 0.0);
        EXPECT_NEAR(approx.x, exact.x, 1e-6 * (1.0 + std::abs(exact.x)));
        EXPECT_NEAR(approx.y, exact.y, 1e-6 * (1.0 + std::abs(exact.y)));
    }
}

TEST(QuadTreeTest, ApproximationStaysClose) {
    std::mt19937 rng(5);
    std::uniform_real_distribution<double> coord(0.0, 100.0);
    std::vector<Point> points(200);
    std::vector<double> masses(200, 1.0);
    for (auto& p : points) p = {coord(rng), coord(rng)};

    QuadTree tree;
    tree.build(points, masses);

    Point exact = tree.repulsion(0, 1.0, 0.0);
    Point approx = tree.repulsion(0, 1.0, 0.5);
    double mag = std::hypot(exact.x, exact.y);
    EXPECT_LT(std::hypot(exact.x - approx.x, exact.y - approx.y), 0.2 * mag + 1e-9);
}
