#pragma once

#include "core/config.hpp"
#include "graph/graph_snapshot.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <vector>

namespace netmap {

/**
 * @brief A simple path through the undirected graph
 *
 * `relationships[k]` is the strongest relationship (highest confidence)
 * joining nodes[k] and nodes[k + 1], in either direction.
 */
struct PathResult {
    std::vector<EntityId> nodes;
    std::vector<Relationship> relationships;

    size_t hops() const { return nodes.empty() ? 0 : nodes.size() - 1; }

    nlohmann::json to_json() const;
};

/**
 * @brief Lazy enumeration of simple paths between two nodes
 *
 * Depth-first with an explicit stack; yields one path per next() call in
 * neighbor (id) order, at most `max_paths` in total. The snapshot must
 * outlive the enumerator.
 */
class PathEnumerator {
public:
    PathEnumerator(const GraphSnapshot& graph, size_t source, size_t target,
                   int max_depth, size_t max_paths);

    /**
     * @brief Next path, or nullopt once exhausted or capped
     */
    std::optional<PathResult> next();

    /**
     * @brief Restart enumeration from the first path
     */
    void reset();

    /**
     * @brief Drain the remaining paths
     */
    std::vector<PathResult> collect();

    size_t emitted() const { return emitted_; }

private:
    struct Frame {
        size_t node;
        size_t next_neighbor;
    };

    const GraphSnapshot* graph_;
    size_t source_;
    size_t target_;
    size_t max_depth_;
    size_t max_paths_;

    std::vector<Frame> stack_;
    std::vector<bool> on_path_;
    size_t emitted_ = 0;
    bool trivial_done_ = false;
};

/**
 * @brief Entities within a hop radius of a center entity
 */
struct Neighborhood {
    EntityId center;
    int depth = 1;
    std::vector<EntityId> nodes;                 ///< id order, center included
    std::map<EntityId, int> distance;            ///< hops from center
    std::vector<Relationship> relationships;     ///< Induced on `nodes`

    nlohmann::json to_json(const GraphSnapshot& graph) const;
};

/**
 * @brief Path queries over a snapshot
 *
 * Unknown endpoint ids throw EntityNotFound. A negative max_depth uses the
 * configured default; depths above `max_depth_limit` are clamped.
 */
class PathFinder {
public:
    explicit PathFinder(PathConfig config = {});

    /**
     * @brief Shortest path by hop count within max_depth hops
     */
    std::optional<PathResult> shortest_path(const GraphSnapshot& graph,
                                            const EntityId& source,
                                            const EntityId& target,
                                            int max_depth = -1) const;

    /**
     * @param max_paths 0 uses the configured cap
     */
    PathEnumerator all_paths(const GraphSnapshot& graph,
                             const EntityId& source,
                             const EntityId& target,
                             int max_depth = -1,
                             size_t max_paths = 0) const;

    /**
     * @brief Nodes within `depth` hops (clamped to 1..3) plus induced edges
     */
    Neighborhood neighborhood(const GraphSnapshot& graph,
                              const EntityId& entity,
                              int depth = 1) const;

    const PathConfig& config() const { return config_; }

private:
    PathConfig config_;

    int effective_depth(int max_depth) const;
};

/**
 * @brief Build a PathResult for a node index sequence
 */
PathResult make_path(const GraphSnapshot& graph, const std::vector<size_t>& nodes);

} // namespace netmap
