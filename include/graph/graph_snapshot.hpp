#pragma once

#include "graph/entity.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netmap {

/**
 * @brief Adjacent node with the accumulated weight of all relationships
 *        between the pair (both directions, all types)
 */
struct Neighbor {
    size_t index;
    double weight;
};

/**
 * @brief Summary statistics about a snapshot
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_components = 0;
    size_t num_isolated = 0;
    size_t num_dangling_edges = 0;
    double density = 0.0;
    double avg_degree = 0.0;
    size_t max_degree = 0;
    std::vector<std::string> relationship_types;

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable point-in-time materialization of one scope's graph
 *
 * Entities are held in id order and addressed by dense indices; all engines
 * work on indices and translate back to ids on output. Adjacency is
 * undirected: a relationship A->B makes A and B neighbors of each other.
 * Self-loops are kept in relationships() but excluded from adjacency.
 *
 * Never mutated after construction. Share it as SnapshotPtr.
 */
class GraphSnapshot {
public:
    GraphSnapshot(Scope scope,
                  std::vector<Entity> entities,
                  std::vector<Relationship> relationships,
                  TimePoint loaded_at);

    GraphSnapshot(const GraphSnapshot&) = delete;
    GraphSnapshot& operator=(const GraphSnapshot&) = delete;

    const Scope& scope() const { return scope_; }
    TimePoint loaded_at() const { return loaded_at_; }

    size_t num_nodes() const { return entities_.size(); }
    size_t num_edges() const { return relationships_.size(); }
    bool empty() const { return entities_.empty(); }

    const std::vector<Entity>& entities() const { return entities_; }
    const std::vector<Relationship>& relationships() const { return relationships_; }

    const Entity& entity(size_t index) const { return entities_[index]; }
    const EntityId& id_of(size_t index) const { return entities_[index].id; }

    /**
     * @brief Dense index of an entity id, if present
     */
    std::optional<size_t> index_of(const EntityId& id) const;

    /**
     * @brief Index of an entity id; throws EntityNotFound
     */
    size_t require_index(const EntityId& id) const;

    /**
     * @brief Distinct neighbors of a node, ordered by index
     */
    const std::vector<Neighbor>& neighbors(size_t index) const { return adjacency_[index]; }

    /**
     * @brief Number of relationships incident to a node (self-loops count twice)
     */
    size_t degree(size_t index) const { return degree_[index]; }

    /**
     * @brief Sum of neighbor weights
     */
    double weighted_degree(size_t index) const { return weighted_degree_[index]; }

    /**
     * @brief Indices into relationships() touching a node
     */
    const std::vector<size_t>& incident_relationships(size_t index) const { return incident_[index]; }

    size_t component_of(size_t index) const { return component_[index]; }
    size_t num_components() const { return components_.size(); }

    /**
     * @brief Connected components, largest first, members in index order
     */
    const std::vector<std::vector<size_t>>& components() const { return components_; }

    size_t dangling_edges() const { return dangling_edges_; }

    GraphStatistics compute_statistics() const;

    nlohmann::json to_json() const;

private:
    Scope scope_;
    TimePoint loaded_at_;
    std::vector<Entity> entities_;
    std::vector<Relationship> relationships_;
    std::unordered_map<EntityId, size_t> index_;

    std::vector<std::vector<Neighbor>> adjacency_;
    std::vector<std::vector<size_t>> incident_;
    std::vector<size_t> degree_;
    std::vector<double> weighted_degree_;
    std::vector<size_t> component_;
    std::vector<std::vector<size_t>> components_;
    size_t dangling_edges_ = 0;

    void build_adjacency();
    void build_components();
};

using SnapshotPtr = std::shared_ptr<const GraphSnapshot>;

} // namespace netmap
