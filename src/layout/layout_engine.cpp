#include "layout/layout_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <unordered_map>

namespace netmap {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kEpsilon = 1e-9;
constexpr double kRingSpacing = 10.0;

struct Bounds {
    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();

    void add(const Point& p) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    Point center() const { return {(min_x + max_x) * 0.5, (min_y + max_y) * 0.5}; }
};

std::unordered_map<size_t, size_t> local_index(const std::vector<size_t>& nodes) {
    std::unordered_map<size_t, size_t> local;
    local.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        local[nodes[i]] = i;
    }
    return local;
}

} // namespace

// ==========================================
// LayoutResult
// ==========================================

std::optional<Point> LayoutResult::position_of(const EntityId& id) const {
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if (it == ids.end() || *it != id) return std::nullopt;
    return positions[static_cast<size_t>(it - ids.begin())];
}

nlohmann::json LayoutResult::to_json() const {
    nlohmann::json j;
    j["algorithm"] = algorithm;
    j["seed"] = seed;
    j["iterations"] = iterations;
    j["approximated"] = approximated;
    j["best_effort"] = best_effort;
    j["scale"] = scale;

    nlohmann::json pos = nlohmann::json::object();
    for (size_t i = 0; i < ids.size(); ++i) {
        pos[ids[i]] = {{"x", positions[i].x}, {"y", positions[i].y}};
    }
    j["positions"] = pos;
    return j;
}

// ==========================================
// Sizing
// ==========================================

LayoutPlan plan_layout(size_t node_count, const LayoutConfig& config) {
    LayoutPlan plan;
    if (node_count <= 1) {
        plan.iterations = 0;
        return plan;
    }

    if (node_count > 2000) {
        plan.iterations = std::max(1, config.base_iterations * 3 / 10);
    } else if (node_count > 1000) {
        plan.iterations = std::max(1, config.base_iterations / 2);
    } else {
        plan.iterations = config.base_iterations;
    }
    plan.use_approximation = node_count > config.approximation_threshold;
    return plan;
}

// ==========================================
// ForceLayout
// ==========================================

std::vector<Point> ForceLayout::layout_component(const GraphSnapshot& graph,
                                                 const std::vector<size_t>& nodes,
                                                 const LayoutParams& params,
                                                 std::mt19937& rng,
                                                 LayoutStats& stats) const {
    const size_t m = nodes.size();
    if (m == 0) return {};
    if (m == 1) return {Point{}};

    auto local = local_index(nodes);

    // Random start in a square that grows with the component
    double radius = 10.0 * std::sqrt(static_cast<double>(m));
    std::uniform_real_distribution<double> dist(-radius, radius);
    std::vector<Point> pos(m);
    for (auto& p : pos) {
        p.x = dist(rng);
        p.y = dist(rng);
    }

    std::vector<double> mass(m);
    for (size_t i = 0; i < m; ++i) {
        mass[i] = static_cast<double>(graph.degree(nodes[i])) + 1.0;
    }

    const bool use_tree = params.use_approximation && m > kExactRepulsionLimit;
    const double initial_step = radius * 0.1;
    QuadTree tree;
    std::vector<Point> force(m);

    int run = 0;
    for (int it = 0; it < params.iterations; ++it) {
        if (params.budget.expired()) {
            stats.best_effort = true;
            break;
        }

        std::fill(force.begin(), force.end(), Point{});

        // Repulsion
        if (use_tree) {
            tree.build(pos, mass);
            for (size_t i = 0; i < m; ++i) {
                Point f = tree.repulsion(i, params.scaling_ratio, params.theta);
                force[i].x += f.x;
                force[i].y += f.y;
            }
        } else {
            for (size_t i = 0; i < m; ++i) {
                for (size_t j = i + 1; j < m; ++j) {
                    double dx = pos[i].x - pos[j].x;
                    double dy = pos[i].y - pos[j].y;
                    double d2 = dx * dx + dy * dy;
                    if (d2 < kEpsilon) continue;
                    double f = params.scaling_ratio * mass[i] * mass[j] / d2;
                    force[i].x += dx * f;
                    force[i].y += dy * f;
                    force[j].x -= dx * f;
                    force[j].y -= dy * f;
                }
            }
        }

        // Attraction along edges, each pair once
        for (size_t i = 0; i < m; ++i) {
            for (const auto& nb : graph.neighbors(nodes[i])) {
                size_t j = local.at(nb.index);
                if (j <= i) continue;
                double dx = pos[j].x - pos[i].x;
                double dy = pos[j].y - pos[i].y;
                double d = std::sqrt(dx * dx + dy * dy);
                if (d < kEpsilon) continue;
                double magnitude = nb.weight * (params.lin_log ? std::log1p(d) : d);
                double fx = dx / d * magnitude;
                double fy = dy / d * magnitude;
                force[i].x += fx;
                force[i].y += fy;
                force[j].x -= fx;
                force[j].y -= fy;
            }
        }

        // Gravity toward the component center
        for (size_t i = 0; i < m; ++i) {
            double d = std::sqrt(pos[i].x * pos[i].x + pos[i].y * pos[i].y);
            if (d < kEpsilon) continue;
            double g = params.gravity * mass[i];
            force[i].x -= pos[i].x / d * g;
            force[i].y -= pos[i].y / d * g;
        }

        // Cooling step: displacement capped by a linearly falling temperature
        double cooling = 1.0 - static_cast<double>(it) / static_cast<double>(params.iterations);
        double temperature = initial_step * (0.01 + 0.99 * cooling);
        for (size_t i = 0; i < m; ++i) {
            double len = std::sqrt(force[i].x * force[i].x + force[i].y * force[i].y);
            if (len < kEpsilon || !std::isfinite(len)) continue;
            double move = std::min(len, temperature);
            pos[i].x += force[i].x / len * move;
            pos[i].y += force[i].y / len * move;
        }
        run++;
    }

    stats.iterations = std::max(stats.iterations, run);
    return pos;
}

// ==========================================
// CircularLayout
// ==========================================

std::vector<Point> CircularLayout::layout_component(const GraphSnapshot&,
                                                    const std::vector<size_t>& nodes,
                                                    const LayoutParams&,
                                                    std::mt19937&,
                                                    LayoutStats&) const {
    const size_t m = nodes.size();
    if (m == 0) return {};
    if (m == 1) return {Point{}};

    double radius = std::max(1.0, static_cast<double>(m) / (2.0 * kPi)) * kRingSpacing;
    std::vector<Point> pos(m);
    for (size_t i = 0; i < m; ++i) {
        double angle = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(m);
        pos[i] = {radius * std::cos(angle), radius * std::sin(angle)};
    }
    return pos;
}

// ==========================================
// ShellLayout
// ==========================================

std::vector<Point> ShellLayout::layout_component(const GraphSnapshot& graph,
                                                 const std::vector<size_t>& nodes,
                                                 const LayoutParams&,
                                                 std::mt19937&,
                                                 LayoutStats&) const {
    const size_t m = nodes.size();
    if (m == 0) return {};
    if (m == 1) return {Point{}};

    // Degree band = floor(log2(degree + 1)); highest band innermost
    std::map<int, std::vector<size_t>, std::greater<int>> bands;
    for (size_t i = 0; i < m; ++i) {
        double degree = static_cast<double>(graph.degree(nodes[i]));
        int band = static_cast<int>(std::floor(std::log2(degree + 1.0)));
        bands[band].push_back(i);
    }

    std::vector<Point> pos(m);
    bool center_singleton = bands.begin()->second.size() == 1;
    size_t ring = 0;
    for (const auto& [band, members] : bands) {
        double radius = static_cast<double>(center_singleton ? ring : ring + 1) * kRingSpacing;
        // Keep rings from crowding when a band is large
        radius = std::max(radius, static_cast<double>(members.size()) * kRingSpacing / (2.0 * kPi));
        if (ring == 0 && center_singleton) radius = 0.0;

        for (size_t k = 0; k < members.size(); ++k) {
            double angle = 2.0 * kPi * static_cast<double>(k) / static_cast<double>(members.size());
            pos[members[k]] = {radius * std::cos(angle), radius * std::sin(angle)};
        }
        ring++;
    }
    return pos;
}

std::unique_ptr<LayoutStrategy> make_layout_strategy(const std::string& algorithm) {
    if (algorithm == "force" || algorithm.empty()) {
        return std::make_unique<ForceLayout>();
    }
    if (algorithm == "circular") {
        return std::make_unique<CircularLayout>();
    }
    if (algorithm == "shell") {
        return std::make_unique<ShellLayout>();
    }
    throw InvalidArgument("Unknown layout algorithm: " + algorithm);
}

// ==========================================
// LayoutEngine
// ==========================================

LayoutEngine::LayoutEngine(LayoutConfig config) : config_(std::move(config)) {}

LayoutResult LayoutEngine::compute(const GraphSnapshot& graph, const Budget& budget) const {
    return compute(graph, config_.algorithm, 0, config_.seed, budget);
}

LayoutResult LayoutEngine::compute(const GraphSnapshot& graph,
                                   const std::string& algorithm,
                                   int iterations,
                                   unsigned int seed,
                                   const Budget& budget) const {
    auto strategy = make_layout_strategy(algorithm);

    const size_t n = graph.num_nodes();
    LayoutResult result;
    result.algorithm = strategy->name();
    result.seed = seed;
    result.scale = config_.scale + 3.0 * static_cast<double>(n);
    result.ids.reserve(n);
    for (const auto& e : graph.entities()) {
        result.ids.push_back(e.id);
    }
    result.positions.assign(n, Point{});

    if (n <= 1) {
        return result;
    }

    LayoutPlan plan = plan_layout(n, config_);
    LayoutParams params;
    params.iterations = iterations > 0 ? iterations : plan.iterations;
    params.use_approximation = plan.use_approximation;
    params.theta = config_.theta;
    params.lin_log = config_.lin_log;
    params.gravity = config_.gravity;
    params.scaling_ratio = config_.scaling_ratio;
    params.budget = budget;

    std::mt19937 rng(seed);
    LayoutStats stats;

    // Lay out each component around its own origin
    const auto& components = graph.components();
    std::vector<std::vector<Point>> local(components.size());
    std::vector<double> extent(components.size(), 0.0);
    double largest_extent = 0.0;

    for (size_t c = 0; c < components.size(); ++c) {
        local[c] = strategy->layout_component(graph, components[c], params, rng, stats);

        Bounds b;
        for (const auto& p : local[c]) b.add(p);
        Point mid = b.center();
        for (auto& p : local[c]) {
            p.x -= mid.x;
            p.y -= mid.y;
        }
        extent[c] = std::max(b.width(), b.height());
        largest_extent = std::max(largest_extent, extent[c]);
    }

    // Pack components into rows of non-overlapping square cells
    double margin = std::max(1.0, 0.1 * largest_extent);
    double area = 0.0;
    for (double e : extent) {
        area += (e + margin) * (e + margin);
    }
    double row_limit = std::max(largest_extent + margin, std::sqrt(area));

    double cursor_x = 0.0, cursor_y = 0.0, row_height = 0.0;
    for (size_t c = 0; c < components.size(); ++c) {
        double cell = extent[c] + margin;
        if (cursor_x > 0.0 && cursor_x + cell > row_limit) {
            cursor_y += row_height;
            cursor_x = 0.0;
            row_height = 0.0;
        }
        double cx = cursor_x + cell * 0.5;
        double cy = cursor_y + cell * 0.5;

        const auto& members = components[c];
        for (size_t k = 0; k < members.size(); ++k) {
            result.positions[members[k]] = {local[c][k].x + cx, local[c][k].y + cy};
        }
        cursor_x += cell;
        row_height = std::max(row_height, cell);
    }

    // Center on the origin and scale to the viewport
    Bounds all;
    for (const auto& p : result.positions) all.add(p);
    Point mid = all.center();
    double max_abs = 0.0;
    for (auto& p : result.positions) {
        p.x -= mid.x;
        p.y -= mid.y;
        max_abs = std::max({max_abs, std::abs(p.x), std::abs(p.y)});
    }
    if (max_abs > kEpsilon) {
        double factor = result.scale / max_abs;
        for (auto& p : result.positions) {
            p.x *= factor;
            p.y *= factor;
        }
    }

    result.iterations = stats.iterations;
    result.best_effort = stats.best_effort;
    result.approximated = params.use_approximation &&
                          !components.empty() &&
                          components.front().size() > ForceLayout::kExactRepulsionLimit &&
                          result.algorithm == "force";

    if (result.best_effort) {
        NETMAP_LOG_WARN("layout budget expired", {
            log::StringField("scope", graph.scope()),
            log::IntField("nodes", static_cast<std::int64_t>(n)),
            log::IntField("iterations", result.iterations)});
    }
    return result;
}

} // namespace netmap
