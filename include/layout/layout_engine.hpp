#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "graph/graph_snapshot.hpp"
#include "layout/quad_tree.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace netmap {

/**
 * @brief Node positions for one snapshot
 *
 * `positions[i]` belongs to the snapshot node with index i (id order).
 */
struct LayoutResult {
    std::string algorithm;
    unsigned int seed = 0;
    int iterations = 0;                 ///< Iterations actually run
    bool approximated = false;          ///< Barnes-Hut repulsion was used
    bool best_effort = false;           ///< Budget expired before completion
    double scale = 0.0;
    std::vector<EntityId> ids;
    std::vector<Point> positions;

    size_t size() const { return positions.size(); }

    std::optional<Point> position_of(const EntityId& id) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Result of the pure sizing function
 */
struct LayoutPlan {
    int iterations = 0;
    bool use_approximation = false;
};

/**
 * @brief Pick iteration count and repulsion mode for a graph of the given size
 *
 * Iterations fall as the graph grows: the configured base up to 1000 nodes,
 * half of it up to 2000, 30% beyond. Barnes-Hut is used above
 * `approximation_threshold` nodes.
 */
LayoutPlan plan_layout(size_t node_count, const LayoutConfig& config);

/**
 * @brief Tunables handed to a strategy for one component
 */
struct LayoutParams {
    int iterations = 100;
    bool use_approximation = false;
    double theta = 1.2;
    bool lin_log = true;
    double gravity = 1.0;
    double scaling_ratio = 2.0;
    Budget budget;
};

struct LayoutStats {
    int iterations = 0;
    bool best_effort = false;
};

/**
 * @brief Positions the nodes of a single connected component
 *
 * Output coordinates are in arbitrary units around the origin; the engine
 * packs and scales components afterwards.
 */
class LayoutStrategy {
public:
    virtual ~LayoutStrategy() = default;

    virtual std::string name() const = 0;

    virtual std::vector<Point> layout_component(const GraphSnapshot& graph,
                                                const std::vector<size_t>& nodes,
                                                const LayoutParams& params,
                                                std::mt19937& rng,
                                                LayoutStats& stats) const = 0;
};

/**
 * @brief ForceAtlas-style simulation
 *
 * Degree-weighted repulsion, edge-weighted attraction (logarithmic in
 * lin-log mode), gravity toward the origin and a linearly cooling step.
 */
class ForceLayout : public LayoutStrategy {
public:
    std::string name() const override { return "force"; }

    std::vector<Point> layout_component(const GraphSnapshot& graph,
                                        const std::vector<size_t>& nodes,
                                        const LayoutParams& params,
                                        std::mt19937& rng,
                                        LayoutStats& stats) const override;

    /// Components this small always use exact repulsion
    static constexpr size_t kExactRepulsionLimit = 50;
};

class CircularLayout : public LayoutStrategy {
public:
    std::string name() const override { return "circular"; }

    std::vector<Point> layout_component(const GraphSnapshot& graph,
                                        const std::vector<size_t>& nodes,
                                        const LayoutParams& params,
                                        std::mt19937& rng,
                                        LayoutStats& stats) const override;
};

/**
 * @brief Concentric rings by degree band, highest degrees innermost
 */
class ShellLayout : public LayoutStrategy {
public:
    std::string name() const override { return "shell"; }

    std::vector<Point> layout_component(const GraphSnapshot& graph,
                                        const std::vector<size_t>& nodes,
                                        const LayoutParams& params,
                                        std::mt19937& rng,
                                        LayoutStats& stats) const override;
};

/**
 * @brief Strategy for an algorithm name; throws InvalidArgument if unknown
 */
std::unique_ptr<LayoutStrategy> make_layout_strategy(const std::string& algorithm);

/**
 * @brief Computes 2-D coordinates for every node of a snapshot
 *
 * Components are laid out independently, largest first, then packed onto a
 * grid of non-overlapping cells sized by each component's extent. The whole
 * drawing is centered and scaled so the largest coordinate magnitude equals
 * `scale + 3 * node_count`. Identical (snapshot, algorithm, seed) give
 * identical coordinates.
 */
class LayoutEngine {
public:
    explicit LayoutEngine(LayoutConfig config = {});

    /**
     * @param iterations Iteration count; 0 or less uses plan_layout()
     */
    LayoutResult compute(const GraphSnapshot& graph,
                         const std::string& algorithm,
                         int iterations,
                         unsigned int seed,
                         const Budget& budget = Budget()) const;

    /**
     * @brief compute() with the configured algorithm, seed and planned iterations
     */
    LayoutResult compute(const GraphSnapshot& graph, const Budget& budget = Budget()) const;

    const LayoutConfig& config() const { return config_; }

private:
    LayoutConfig config_;
};

} // namespace netmap
