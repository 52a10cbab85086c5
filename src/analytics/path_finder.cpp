#include "analytics/path_finder.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <queue>
#include <set>

namespace netmap {

namespace {

// Strongest relationship joining a and b in either direction
const Relationship* strongest_between(const GraphSnapshot& graph, size_t a, size_t b) {
    const Relationship* best = nullptr;
    const EntityId& other = graph.id_of(b);
    for (size_t r : graph.incident_relationships(a)) {
        const auto& rel = graph.relationships()[r];
        if (rel.source != other && rel.target != other) continue;
        if (!best || rel.confidence > best->confidence) {
            best = &rel;
        }
    }
    return best;
}

} // namespace

PathResult make_path(const GraphSnapshot& graph, const std::vector<size_t>& nodes) {
    PathResult path;
    path.nodes.reserve(nodes.size());
    for (size_t k = 0; k < nodes.size(); ++k) {
        path.nodes.push_back(graph.id_of(nodes[k]));
        if (k + 1 < nodes.size()) {
            const Relationship* rel = strongest_between(graph, nodes[k], nodes[k + 1]);
            if (rel) path.relationships.push_back(*rel);
        }
    }
    return path;
}

nlohmann::json PathResult::to_json() const {
    nlohmann::json j;
    j["nodes"] = nodes;
    j["hops"] = hops();
    nlohmann::json rels = nlohmann::json::array();
    for (const auto& r : relationships) {
        rels.push_back(r.to_json());
    }
    j["relationships"] = rels;
    return j;
}

// ==========================================
// PathEnumerator
// ==========================================

PathEnumerator::PathEnumerator(const GraphSnapshot& graph, size_t source, size_t target,
                               int max_depth, size_t max_paths)
    : graph_(&graph), source_(source), target_(target),
      max_depth_(static_cast<size_t>(std::max(0, max_depth))), max_paths_(max_paths) {
    reset();
}

void PathEnumerator::reset() {
    stack_.clear();
    on_path_.assign(graph_->num_nodes(), false);
    emitted_ = 0;
    trivial_done_ = false;

    stack_.push_back({source_, 0});
    on_path_[source_] = true;
}

std::optional<PathResult> PathEnumerator::next() {
    if (emitted_ >= max_paths_) return std::nullopt;

    if (source_ == target_) {
        if (trivial_done_) return std::nullopt;
        trivial_done_ = true;
        emitted_++;
        return make_path(*graph_, {source_});
    }

    while (!stack_.empty()) {
        Frame& top = stack_.back();
        const auto& neighbors = graph_->neighbors(top.node);

        // stack_.size() nodes on the path; extending adds one more hop
        if (top.next_neighbor >= neighbors.size() || stack_.size() > max_depth_) {
            on_path_[top.node] = false;
            stack_.pop_back();
            continue;
        }

        size_t nb = neighbors[top.next_neighbor++].index;
        if (on_path_[nb]) continue;

        if (nb == target_) {
            std::vector<size_t> nodes;
            nodes.reserve(stack_.size() + 1);
            for (const auto& frame : stack_) nodes.push_back(frame.node);
            nodes.push_back(nb);
            emitted_++;
            return make_path(*graph_, nodes);
        }

        stack_.push_back({nb, 0});
        on_path_[nb] = true;
    }
    return std::nullopt;
}

std::vector<PathResult> PathEnumerator::collect() {
    std::vector<PathResult> out;
    while (auto path = next()) {
        out.push_back(std::move(*path));
    }
    return out;
}

// ==========================================
// Neighborhood
// ==========================================

nlohmann::json Neighborhood::to_json(const GraphSnapshot& graph) const {
    nlohmann::json j;
    j["center"] = center;
    j["depth"] = depth;

    nlohmann::json node_list = nlohmann::json::array();
    for (const auto& id : nodes) {
        auto idx = graph.index_of(id);
        if (!idx) continue;
        const Entity& e = graph.entity(*idx);
        node_list.push_back({{"id", e.id},
                             {"label", e.name},
                             {"type", entity_type_to_string(e.type)},
                             {"distance", distance.at(id)}});
    }
    j["nodes"] = node_list;

    nlohmann::json rels = nlohmann::json::array();
    for (const auto& r : relationships) {
        rels.push_back(r.to_json());
    }
    j["relationships"] = rels;
    return j;
}

// ==========================================
// PathFinder
// ==========================================

PathFinder::PathFinder(PathConfig config) : config_(std::move(config)) {}

int PathFinder::effective_depth(int max_depth) const {
    if (max_depth < 0) return config_.default_max_depth;
    return std::min(max_depth, config_.max_depth_limit);
}

std::optional<PathResult> PathFinder::shortest_path(const GraphSnapshot& graph,
                                                    const EntityId& source,
                                                    const EntityId& target,
                                                    int max_depth) const {
    size_t s = graph.require_index(source);
    size_t t = graph.require_index(target);
    int depth_limit = effective_depth(max_depth);

    if (s == t) {
        return make_path(graph, {s});
    }

    const size_t none = static_cast<size_t>(-1);
    std::vector<size_t> parent(graph.num_nodes(), none);
    std::vector<int> depth(graph.num_nodes(), -1);
    std::queue<size_t> queue;
    queue.push(s);
    depth[s] = 0;

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop();
        if (depth[current] >= depth_limit) continue;

        for (const auto& nb : graph.neighbors(current)) {
            if (depth[nb.index] != -1) continue;
            depth[nb.index] = depth[current] + 1;
            parent[nb.index] = current;

            if (nb.index == t) {
                std::vector<size_t> nodes;
                for (size_t v = t; v != none; v = parent[v]) {
                    nodes.push_back(v);
                }
                std::reverse(nodes.begin(), nodes.end());
                return make_path(graph, nodes);
            }
            queue.push(nb.index);
        }
    }
    return std::nullopt;
}

PathEnumerator PathFinder::all_paths(const GraphSnapshot& graph,
                                     const EntityId& source,
                                     const EntityId& target,
                                     int max_depth,
                                     size_t max_paths) const {
    size_t s = graph.require_index(source);
    size_t t = graph.require_index(target);
    int depth_limit = max_depth < 0 ? config_.all_paths_max_depth : effective_depth(max_depth);
    return PathEnumerator(graph, s, t, depth_limit, max_paths == 0 ? config_.max_paths : max_paths);
}

Neighborhood PathFinder::neighborhood(const GraphSnapshot& graph,
                                      const EntityId& entity,
                                      int depth) const {
    size_t center = graph.require_index(entity);
    int radius = std::clamp(depth, 1, 3);

    Neighborhood result;
    result.center = entity;
    result.depth = radius;

    std::vector<int> dist(graph.num_nodes(), -1);
    std::queue<size_t> queue;
    queue.push(center);
    dist[center] = 0;

    std::set<size_t> members;
    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop();
        members.insert(current);
        if (dist[current] >= radius) continue;

        for (const auto& nb : graph.neighbors(current)) {
            if (dist[nb.index] != -1) continue;
            dist[nb.index] = dist[current] + 1;
            queue.push(nb.index);
        }
    }

    for (size_t idx : members) {
        result.nodes.push_back(graph.id_of(idx));
        result.distance[graph.id_of(idx)] = dist[idx];
    }

    // Relationships are sorted by key; each is visited once
    for (const auto& rel : graph.relationships()) {
        auto a = graph.index_of(rel.source);
        auto b = graph.index_of(rel.target);
        if (a && b && members.count(*a) && members.count(*b)) {
            result.relationships.push_back(rel);
        }
    }
    return result;
}

} // namespace netmap
