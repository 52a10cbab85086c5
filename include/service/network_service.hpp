#pragma once

#include "analytics/centrality_engine.hpp"
#include "analytics/path_finder.hpp"
#include "cache/cache_layer.hpp"
#include "cluster/cluster_engine.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "discovery/relationship_discovery.hpp"
#include "graph/graph_builder.hpp"
#include "layout/layout_engine.hpp"
#include "store/graph_store.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netmap {

/**
 * @brief Parameters of a node-link graph request
 *
 * Empty algorithm, zero min_cluster_size and an unset seed fall back to the
 * configured values.
 */
struct GraphQuery {
    bool include_positions = true;
    bool include_clusters = true;
    size_t min_cluster_size = 0;
    std::string layout_algorithm;
    std::optional<unsigned int> seed;
};

struct ViewNode {
    EntityId id;
    std::string label;
    EntityType type = EntityType::OTHER;
    std::optional<Point> position;
    std::string cluster_id;             ///< Empty when unclustered or clusters not requested
};

struct ViewEdge {
    EntityId source;
    EntityId target;
    std::string type;
    double weight = 1.0;
    double confidence = 0.5;
};

/**
 * @brief Node-link view of one scope, ready for the visualization client
 */
struct GraphView {
    Scope scope;
    std::vector<ViewNode> nodes;
    std::vector<ViewEdge> edges;
    LayoutPtr layout;                   ///< Null when skipped or not requested
    ClusterPtr clusters;                ///< Null when not requested
    bool layout_skipped = false;
    std::string layout_skip_reason;
    std::map<CacheTier, CacheOutcome> cache_outcomes;
    std::map<std::string, double> timings_ms;

    nlohmann::json to_json() const;
};

/**
 * @brief Paging and filtering over a scope's entities
 */
struct SubsetQuery {
    size_t limit = 50;
    size_t offset = 0;
    std::string sort_by = "degree";     ///< degree, centrality, recent
    std::vector<EntityType> types;      ///< Empty keeps every type
    std::string name_prefix;            ///< Case-insensitive
};

struct SubsetEntry {
    EntityId id;
    std::string name;
    EntityType type = EntityType::OTHER;
    double score = 0.0;
};

struct SubsetResult {
    size_t total_matching = 0;
    std::vector<SubsetEntry> entities;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of a multi-write mutation
 */
struct MutationReport {
    size_t committed = 0;
    size_t failed = 0;
    bool complete = true;
    std::string error;

    nlohmann::json to_json() const;
};

/**
 * @brief Request facade over the store, the cache and the engines
 *
 * Build one per process and share it between request handlers. Queries go
 * through the cache; every mutation writes through the store and, once at
 * least one write has committed, invalidates the affected scope before
 * returning.
 */
class NetworkService {
public:
    NetworkService(EngineConfig config,
                   std::shared_ptr<GraphStore> store,
                   std::shared_ptr<Clock> clock);

    NetworkService(const NetworkService&) = delete;
    NetworkService& operator=(const NetworkService&) = delete;

    // ---- queries ----

    SnapshotPtr snapshot(const Scope& scope, CacheOutcome* outcome = nullptr);

    /**
     * @brief Node-link view; rebuilt when the scope is invalidated while it is composed
     */
    GraphView graph(const Scope& scope, const GraphQuery& query = {});

    CentralityResult centrality(const Scope& scope, CentralityMetric metric, size_t limit = 0);

    std::optional<PathResult> shortest_path(const Scope& scope,
                                            const EntityId& source,
                                            const EntityId& target,
                                            int max_depth = -1);

    std::vector<PathResult> all_paths(const Scope& scope,
                                      const EntityId& source,
                                      const EntityId& target,
                                      int max_depth = -1,
                                      size_t max_paths = 0);

    nlohmann::json neighborhood(const Scope& scope, const EntityId& entity, int depth = 1);

    /**
     * @brief Relationships touching an entity, oldest first-observation first
     */
    std::vector<Relationship> timeline(const Scope& scope, const EntityId& entity);

    GraphStatistics stats(const Scope& scope);

    SubsetResult subset(const Scope& scope, const SubsetQuery& query);

    RelationshipStats relationship_stats(const Scope& scope);

    CacheStatus cache_status(const Scope& scope) const;

    // ---- mutations ----

    /**
     * @brief Record an observation of a relationship
     *
     * An existing relationship with the same key absorbs it (see
     * Relationship::observe). Throws EntityNotFound for unknown endpoints.
     */
    StoreResult add_relationship(const Scope& scope, const Relationship& rel);

    StoreResult upsert_entity(const Scope& scope, const Entity& entity);

    StoreResult delete_entity(const Scope& scope, const EntityId& id);

    /**
     * @brief Fold `remove` into `keep`
     *
     * Relationships of `remove` are re-pointed at `keep` (merged with any
     * relationship already carrying the new key, dropped if they would become
     * self-loops), names and aliases are unioned and `remove` is deleted.
     */
    MutationReport merge_entities(const Scope& scope, const EntityId& keep, const EntityId& remove);

    /**
     * @brief Bulk load; stops at the first failed write
     */
    MutationReport import_records(const Scope& scope,
                                  const std::vector<Entity>& entities,
                                  const std::vector<Relationship>& relationships,
                                  const std::vector<ContentItem>& items);

    DiscoveryReport run_discovery(const Scope& scope);

    DiscoveryReport run_discovery(const Scope& scope,
                                  const std::vector<ContentItem>& items,
                                  int min_co_occurrences,
                                  Duration time_window);

    void invalidate(const Scope& scope);

    /**
     * @brief Drop cached results of every scope
     */
    void invalidate_all();

    const EngineConfig& config() const { return config_; }
    CacheLayer& cache() { return cache_; }

private:
    EngineConfig config_;
    std::shared_ptr<GraphStore> store_;
    std::shared_ptr<Clock> clock_;

    CacheLayer cache_;
    GraphBuilder builder_;
    LayoutEngine layout_engine_;
    ClusterEngine cluster_engine_;
    CentralityEngine centrality_engine_;
    PathFinder path_finder_;
    RelationshipDiscovery discovery_;

    Budget request_budget() const;

    GraphView compose_view(const Scope& scope, const GraphQuery& query);
};

} // namespace netmap
