#include "graph/graph_snapshot.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <set>

namespace netmap {

// ==========================================
// GraphStatistics
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["nodes"] = num_nodes;
    j["edges"] = num_edges;
    j["components"] = num_components;
    j["isolated"] = num_isolated;
    j["dangling_edges"] = num_dangling_edges;
    j["density"] = density;
    j["avg_degree"] = avg_degree;
    j["max_degree"] = max_degree;
    j["relationship_types"] = relationship_types;
    return j;
}

// ==========================================
// GraphSnapshot
// ==========================================

GraphSnapshot::GraphSnapshot(Scope scope,
                             std::vector<Entity> entities,
                             std::vector<Relationship> relationships,
                             TimePoint loaded_at)
    : scope_(std::move(scope)), loaded_at_(loaded_at), entities_(std::move(entities)) {

    std::sort(entities_.begin(), entities_.end(),
              [](const Entity& a, const Entity& b) { return a.id < b.id; });
    entities_.erase(std::unique(entities_.begin(), entities_.end(),
                                [](const Entity& a, const Entity& b) { return a.id == b.id; }),
                    entities_.end());

    index_.reserve(entities_.size());
    for (size_t i = 0; i < entities_.size(); ++i) {
        index_[entities_[i].id] = i;
    }

    // Keep only relationships whose endpoints are both present
    relationships_.reserve(relationships.size());
    for (auto& rel : relationships) {
        if (index_.count(rel.source) == 0 || index_.count(rel.target) == 0) {
            dangling_edges_++;
            continue;
        }
        relationships_.push_back(std::move(rel));
    }
    std::sort(relationships_.begin(), relationships_.end(),
              [](const Relationship& a, const Relationship& b) { return a.key() < b.key(); });

    build_adjacency();
    build_components();
}

std::optional<size_t> GraphSnapshot::index_of(const EntityId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

size_t GraphSnapshot::require_index(const EntityId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw EntityNotFound(id);
    }
    return it->second;
}

void GraphSnapshot::build_adjacency() {
    size_t n = entities_.size();
    adjacency_.assign(n, {});
    incident_.assign(n, {});
    degree_.assign(n, 0);
    weighted_degree_.assign(n, 0.0);

    std::vector<std::map<size_t, double>> merged(n);
    for (size_t r = 0; r < relationships_.size(); ++r) {
        const auto& rel = relationships_[r];
        size_t a = index_.at(rel.source);
        size_t b = index_.at(rel.target);

        incident_[a].push_back(r);
        degree_[a]++;
        if (a == b) {
            degree_[a]++;
            continue;
        }
        incident_[b].push_back(r);
        degree_[b]++;

        double w = rel.weight > 0.0 ? rel.weight : 1.0;
        merged[a][b] += w;
        merged[b][a] += w;
    }

    for (size_t i = 0; i < n; ++i) {
        adjacency_[i].reserve(merged[i].size());
        for (const auto& [j, w] : merged[i]) {
            adjacency_[i].push_back({j, w});
            weighted_degree_[i] += w;
        }
    }
}

void GraphSnapshot::build_components() {
    size_t n = entities_.size();
    const size_t unassigned = static_cast<size_t>(-1);
    component_.assign(n, unassigned);
    components_.clear();

    for (size_t start = 0; start < n; ++start) {
        if (component_[start] != unassigned) continue;

        std::vector<size_t> members;
        std::queue<size_t> queue;
        queue.push(start);
        component_[start] = components_.size();

        while (!queue.empty()) {
            size_t current = queue.front();
            queue.pop();
            members.push_back(current);
            for (const auto& nb : adjacency_[current]) {
                if (component_[nb.index] == unassigned) {
                    component_[nb.index] = components_.size();
                    queue.push(nb.index);
                }
            }
        }

        std::sort(members.begin(), members.end());
        components_.push_back(std::move(members));
    }

    // Largest first; ties keep discovery order (smallest member index)
    std::vector<size_t> order(components_.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        return components_[a].size() > components_[b].size();
    });

    std::vector<std::vector<size_t>> sorted;
    sorted.reserve(components_.size());
    std::vector<size_t> remap(components_.size());
    for (size_t i = 0; i < order.size(); ++i) {
        remap[order[i]] = i;
        sorted.push_back(std::move(components_[order[i]]));
    }
    components_ = std::move(sorted);
    for (auto& c : component_) {
        c = remap[c];
    }
}

GraphStatistics GraphSnapshot::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = entities_.size();
    stats.num_edges = relationships_.size();
    stats.num_components = components_.size();
    stats.num_dangling_edges = dangling_edges_;

    if (entities_.empty()) {
        return stats;
    }

    size_t total_degree = 0;
    for (size_t i = 0; i < entities_.size(); ++i) {
        total_degree += degree_[i];
        stats.max_degree = std::max(stats.max_degree, degree_[i]);
        if (adjacency_[i].empty()) stats.num_isolated++;
    }
    stats.avg_degree = static_cast<double>(total_degree) / static_cast<double>(entities_.size());

    // Directed density, matching how relationships are stored
    double n = static_cast<double>(entities_.size());
    stats.density = n > 1 ? static_cast<double>(relationships_.size()) / (n * (n - 1.0)) : 0.0;

    std::set<std::string> types;
    for (const auto& rel : relationships_) {
        types.insert(rel.type);
    }
    stats.relationship_types.assign(types.begin(), types.end());
    return stats;
}

nlohmann::json GraphSnapshot::to_json() const {
    nlohmann::json j;
    j["scope"] = scope_;
    j["loaded_at"] = to_epoch_seconds(loaded_at_);

    nlohmann::json entities_json = nlohmann::json::array();
    for (const auto& entity : entities_) {
        entities_json.push_back(entity.to_json());
    }
    j["entities"] = entities_json;

    nlohmann::json rels_json = nlohmann::json::array();
    for (const auto& rel : relationships_) {
        rels_json.push_back(rel.to_json());
    }
    j["relationships"] = rels_json;
    return j;
}

} // namespace netmap
