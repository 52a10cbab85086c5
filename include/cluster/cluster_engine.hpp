#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "graph/graph_snapshot.hpp"
#include "layout/layout_engine.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netmap {

/**
 * @brief Community assignment for every node of a snapshot
 */
struct Partition {
    std::vector<size_t> community;      ///< community[i] for node index i
    double modularity = 0.0;
    int levels = 0;
    bool best_effort = false;
};

/**
 * @brief Modularity of a partition on the snapshot's undirected adjacency
 */
double compute_modularity(const GraphSnapshot& graph,
                          const std::vector<size_t>& community,
                          double resolution = 1.0);

class ClusterStrategy {
public:
    virtual ~ClusterStrategy() = default;

    virtual std::string name() const = 0;

    virtual Partition partition(const GraphSnapshot& graph,
                                const ClusterConfig& config,
                                const Budget& budget) const = 0;
};

/**
 * @brief Multi-level Louvain: local moving followed by aggregation
 *
 * Nodes are visited in a seeded shuffled order; ties between candidate
 * communities go to the smaller community id. Stops when a level makes no
 * move, after max_levels, or when the budget expires.
 */
class LouvainStrategy : public ClusterStrategy {
public:
    std::string name() const override { return "louvain"; }

    Partition partition(const GraphSnapshot& graph,
                        const ClusterConfig& config,
                        const Budget& budget) const override;
};

/**
 * @brief Asynchronous label propagation, near-linear per round
 *
 * Each node adopts the label carrying the most edge weight among its
 * neighbors, smallest label on ties.
 */
class LabelPropagationStrategy : public ClusterStrategy {
public:
    std::string name() const override { return "label_propagation"; }

    Partition partition(const GraphSnapshot& graph,
                        const ClusterConfig& config,
                        const Budget& budget) const override;
};

enum class ClusterStrategyKind {
    LOUVAIN,
    LABEL_PROPAGATION
};

/**
 * @brief Louvain at or below `threshold` nodes, label propagation above
 */
ClusterStrategyKind select_cluster_strategy(size_t node_count, size_t threshold);

std::unique_ptr<ClusterStrategy> make_cluster_strategy(ClusterStrategyKind kind);

struct Cluster {
    std::string id;                     ///< cluster_<n>, only stable within one result
    std::vector<EntityId> members;      ///< id order
    EntityId representative;
    std::string label;
    EntityType dominant_type = EntityType::OTHER;
    Point centroid;
    bool has_centroid = false;

    size_t size() const { return members.size(); }

    nlohmann::json to_json() const;
};

struct ClusterResult {
    std::string strategy;
    size_t min_size = 0;
    size_t total_nodes = 0;
    double modularity = 0.0;
    bool best_effort = false;
    std::vector<Cluster> clusters;      ///< Largest first
    std::vector<EntityId> unclustered;  ///< Members of clusters below min_size
    std::map<EntityId, std::string> assignment;

    size_t clustered_count() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Groups a snapshot into communities and summarizes each one
 */
class ClusterEngine {
public:
    explicit ClusterEngine(ClusterConfig config = {});

    /**
     * @param layout Optional layout of the same snapshot, used for centroids
     */
    ClusterResult detect(const GraphSnapshot& graph,
                         size_t min_size,
                         const LayoutResult* layout = nullptr,
                         const Budget& budget = Budget()) const;

    const ClusterConfig& config() const { return config_; }

private:
    ClusterConfig config_;
};

} // namespace netmap
