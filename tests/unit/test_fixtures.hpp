#pragma once

#include "graph/entity.hpp"
#include "graph/graph_snapshot.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace netmap {
namespace testing {

inline Entity make_entity(const std::string& id, EntityType type = EntityType::PERSON,
                          const std::string& name = "") {
    Entity e;
    e.id = id;
    e.name = name.empty() ? id : name;
    e.type = type;
    return e;
}

inline Relationship make_rel(const std::string& source, const std::string& target,
                             const std::string& type = kAssociatedWith,
                             double confidence = 0.7, double weight = 1.0) {
    Relationship r;
    r.source = source;
    r.target = target;
    r.type = type;
    r.confidence = confidence;
    r.weight = weight;
    return r;
}

/**
 * @brief Snapshot from node ids and (source, target) pairs
 */
inline SnapshotPtr make_snapshot(const std::vector<std::string>& ids,
                                 const std::vector<std::pair<std::string, std::string>>& edges,
                                 const Scope& scope = "test") {
    std::vector<Entity> entities;
    for (const auto& id : ids) entities.push_back(make_entity(id));
    std::vector<Relationship> rels;
    for (const auto& [a, b] : edges) rels.push_back(make_rel(a, b));
    return std::make_shared<const GraphSnapshot>(scope, std::move(entities), std::move(rels),
                                                 TimePoint(Duration(0)));
}

/**
 * @brief `groups` cliques of `size` nodes, consecutive cliques joined by one edge
 */
inline SnapshotPtr make_clique_chain(size_t groups, size_t size, const std::string& prefix = "n") {
    std::vector<std::string> ids;
    std::vector<std::pair<std::string, std::string>> edges;
    auto id = [&prefix](size_t g, size_t k) {
        return prefix + std::to_string(g) + "_" + std::to_string(k);
    };
    for (size_t g = 0; g < groups; ++g) {
        for (size_t k = 0; k < size; ++k) {
            ids.push_back(id(g, k));
            for (size_t m = k + 1; m < size; ++m) {
                edges.emplace_back(id(g, k), id(g, m));
            }
        }
        if (g > 0) {
            edges.emplace_back(id(g - 1, 0), id(g, 0));
        }
    }
    return make_snapshot(ids, edges);
}

} // namespace testing
} // namespace netmap
