#include "cluster/cluster_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <unordered_map>

namespace netmap {

namespace {

// Renumber labels densely in order of first appearance by node index
void renumber(std::vector<size_t>& labels) {
    std::unordered_map<size_t, size_t> remap;
    for (auto& label : labels) {
        auto it = remap.find(label);
        if (it == remap.end()) {
            it = remap.emplace(label, remap.size()).first;
        }
        label = it->second;
    }
}

} // namespace

double compute_modularity(const GraphSnapshot& graph,
                          const std::vector<size_t>& community,
                          double resolution) {
    double m2 = 0.0;
    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        m2 += graph.weighted_degree(i);
    }
    if (m2 <= 0.0) return 0.0;

    std::unordered_map<size_t, double> internal;
    std::unordered_map<size_t, double> tot;
    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        size_t ci = community[i];
        tot[ci] += graph.weighted_degree(i);
        for (const auto& nb : graph.neighbors(i)) {
            if (community[nb.index] == ci) {
                internal[ci] += nb.weight;
            }
        }
    }

    double q = 0.0;
    for (const auto& [c, t] : tot) {
        double in = internal.count(c) ? internal[c] : 0.0;
        q += in / m2 - resolution * (t / m2) * (t / m2);
    }
    return q;
}

// ==========================================
// LouvainStrategy
// ==========================================

Partition LouvainStrategy::partition(const GraphSnapshot& graph,
                                     const ClusterConfig& config,
                                     const Budget& budget) const {
    const size_t n = graph.num_nodes();
    Partition result;
    result.community.resize(n);
    std::iota(result.community.begin(), result.community.end(), 0);
    if (n == 0) return result;

    // Level graph; self-loops carry the internal weight of aggregated nodes
    std::vector<std::map<size_t, double>> adj(n);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& nb : graph.neighbors(i)) {
            adj[i][nb.index] += nb.weight;
        }
    }

    std::vector<size_t> node_to_comm(n);
    std::iota(node_to_comm.begin(), node_to_comm.end(), 0);
    std::mt19937 rng(config.seed);

    for (int level = 0; level < config.max_levels; ++level) {
        const size_t ln = adj.size();

        std::vector<double> k(ln, 0.0);
        double m2 = 0.0;
        for (size_t i = 0; i < ln; ++i) {
            double sum = 0.0;
            for (const auto& [_, w] : adj[i]) sum += w;
            k[i] = sum;
            m2 += sum;
        }
        if (m2 == 0.0) break;

        std::vector<size_t> community(ln);
        std::iota(community.begin(), community.end(), 0);
        std::vector<double> tot = k;

        auto modularity_gain = [&](size_t i, double ki_in, double totc) {
            return ki_in - config.resolution * k[i] * totc / m2;
        };

        std::vector<size_t> order(ln);
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        bool moved_any = false;
        bool improved = true;
        int passes = 0;
        while (improved && passes < config.max_passes) {
            if (budget.expired()) {
                result.best_effort = true;
                break;
            }
            improved = false;
            passes++;

            for (size_t i : order) {
                size_t ci = community[i];
                std::map<size_t, double> neigh;
                for (const auto& [j, w] : adj[i]) {
                    if (j == i) continue;
                    neigh[community[j]] += w;
                }
                tot[ci] -= k[i];

                size_t best_c = ci;
                auto own = neigh.find(ci);
                double best_gain = modularity_gain(i, own == neigh.end() ? 0.0 : own->second, tot[ci]);
                for (const auto& [c, ki_in] : neigh) {
                    double gain = modularity_gain(i, ki_in, tot[c]);
                    if (gain > best_gain + 1e-12) {
                        best_gain = gain;
                        best_c = c;
                    }
                }

                community[i] = best_c;
                tot[best_c] += k[i];
                if (best_c != ci) {
                    improved = true;
                    moved_any = true;
                }
            }
        }

        renumber(community);
        size_t num_communities = 0;
        for (size_t c : community) num_communities = std::max(num_communities, c + 1);

        for (auto& c : node_to_comm) {
            c = community[c];
        }
        result.levels++;

        if (!moved_any || num_communities == ln || result.best_effort) break;

        // Aggregate communities into the next level's nodes
        std::vector<std::map<size_t, double>> next(num_communities);
        for (size_t i = 0; i < ln; ++i) {
            for (const auto& [j, w] : adj[i]) {
                next[community[i]][community[j]] += w;
            }
        }
        adj.swap(next);
    }

    renumber(node_to_comm);
    result.community = std::move(node_to_comm);
    result.modularity = compute_modularity(graph, result.community, config.resolution);
    return result;
}

// ==========================================
// LabelPropagationStrategy
// ==========================================

Partition LabelPropagationStrategy::partition(const GraphSnapshot& graph,
                                              const ClusterConfig& config,
                                              const Budget& budget) const {
    const size_t n = graph.num_nodes();
    Partition result;
    result.community.resize(n);
    std::iota(result.community.begin(), result.community.end(), 0);
    if (n == 0) return result;

    auto& labels = result.community;
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(config.seed);

    for (int round = 0; round < config.propagation_rounds; ++round) {
        if (budget.expired()) {
            result.best_effort = true;
            break;
        }
        std::shuffle(order.begin(), order.end(), rng);

        bool changed = false;
        for (size_t i : order) {
            const auto& neighbors = graph.neighbors(i);
            if (neighbors.empty()) continue;

            std::map<size_t, double> weight;
            for (const auto& nb : neighbors) {
                weight[labels[nb.index]] += nb.weight;
            }

            // Ascending map order: the first maximum is the smallest label
            size_t best_label = labels[i];
            double best_weight = -1.0;
            for (const auto& [label, w] : weight) {
                if (w > best_weight + 1e-12) {
                    best_weight = w;
                    best_label = label;
                }
            }
            if (best_label != labels[i]) {
                labels[i] = best_label;
                changed = true;
            }
        }
        result.levels++;
        if (!changed) break;
    }

    renumber(labels);
    result.modularity = compute_modularity(graph, labels, config.resolution);
    return result;
}

ClusterStrategyKind select_cluster_strategy(size_t node_count, size_t threshold) {
    return node_count <= threshold ? ClusterStrategyKind::LOUVAIN
                                   : ClusterStrategyKind::LABEL_PROPAGATION;
}

std::unique_ptr<ClusterStrategy> make_cluster_strategy(ClusterStrategyKind kind) {
    switch (kind) {
        case ClusterStrategyKind::LABEL_PROPAGATION:
            return std::make_unique<LabelPropagationStrategy>();
        case ClusterStrategyKind::LOUVAIN:
        default:
            return std::make_unique<LouvainStrategy>();
    }
}

// ==========================================
// Cluster / ClusterResult
// ==========================================

nlohmann::json Cluster::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["size"] = members.size();
    j["members"] = members;
    j["representative"] = representative;
    j["dominant_type"] = entity_type_to_string(dominant_type);
    if (has_centroid) {
        j["centroid"] = {{"x", centroid.x}, {"y", centroid.y}};
    } else {
        j["centroid"] = nullptr;
    }
    return j;
}

size_t ClusterResult::clustered_count() const {
    size_t total = 0;
    for (const auto& c : clusters) total += c.size();
    return total;
}

nlohmann::json ClusterResult::to_json() const {
    nlohmann::json j;
    j["strategy"] = strategy;
    j["min_size"] = min_size;
    j["total_nodes"] = total_nodes;
    j["modularity"] = modularity;
    j["best_effort"] = best_effort;

    nlohmann::json list = nlohmann::json::array();
    for (const auto& c : clusters) {
        list.push_back(c.to_json());
    }
    j["clusters"] = list;
    j["unclustered"] = unclustered;
    return j;
}

// ==========================================
// ClusterEngine
// ==========================================

ClusterEngine::ClusterEngine(ClusterConfig config) : config_(std::move(config)) {}

ClusterResult ClusterEngine::detect(const GraphSnapshot& graph,
                                    size_t min_size,
                                    const LayoutResult* layout,
                                    const Budget& budget) const {
    const size_t n = graph.num_nodes();
    auto strategy = make_cluster_strategy(select_cluster_strategy(n, config_.strategy_threshold));

    ClusterResult result;
    result.strategy = strategy->name();
    result.min_size = std::max<size_t>(1, min_size);
    result.total_nodes = n;
    if (n == 0) return result;

    Partition partition = strategy->partition(graph, config_, budget);
    result.modularity = partition.modularity;
    result.best_effort = partition.best_effort;

    std::map<size_t, std::vector<size_t>> groups;
    for (size_t i = 0; i < n; ++i) {
        groups[partition.community[i]].push_back(i);
    }

    std::vector<std::vector<size_t>> kept;
    for (auto& [_, members] : groups) {
        if (members.size() < result.min_size) {
            for (size_t idx : members) {
                result.unclustered.push_back(graph.id_of(idx));
            }
            continue;
        }
        kept.push_back(std::move(members));
    }
    std::sort(result.unclustered.begin(), result.unclustered.end());

    // Largest first; equal sizes by smallest member id
    std::sort(kept.begin(), kept.end(), [](const auto& a, const auto& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a.front() < b.front();
    });

    bool use_layout = layout != nullptr && layout->size() == n;

    for (size_t c = 0; c < kept.size(); ++c) {
        const auto& members = kept[c];
        Cluster cluster;
        cluster.id = "cluster_" + std::to_string(c);

        const size_t community = partition.community[members.front()];

        size_t best_idx = members.front();
        size_t best_degree = 0;
        std::map<EntityType, size_t> type_votes;
        double sx = 0.0, sy = 0.0;

        for (size_t idx : members) {
            cluster.members.push_back(graph.id_of(idx));
            result.assignment[graph.id_of(idx)] = cluster.id;
            type_votes[graph.entity(idx).type]++;

            size_t internal_degree = 0;
            for (const auto& nb : graph.neighbors(idx)) {
                if (partition.community[nb.index] == community) internal_degree++;
            }
            // members are in index (id) order, so strict > keeps the smaller id
            if (internal_degree > best_degree) {
                best_degree = internal_degree;
                best_idx = idx;
            }

            if (use_layout) {
                sx += layout->positions[idx].x;
                sy += layout->positions[idx].y;
            }
        }

        const Entity& rep = graph.entity(best_idx);
        cluster.representative = rep.id;
        cluster.label = (rep.name.empty() ? rep.id : rep.name) + " +" + std::to_string(members.size() - 1);

        size_t best_votes = 0;
        for (const auto& [type, votes] : type_votes) {
            if (votes > best_votes ||
                (votes == best_votes && entity_type_priority(type) < entity_type_priority(cluster.dominant_type))) {
                best_votes = votes;
                cluster.dominant_type = type;
            }
        }

        if (use_layout) {
            double count = static_cast<double>(members.size());
            cluster.centroid = {sx / count, sy / count};
            cluster.has_centroid = true;
        }
        result.clusters.push_back(std::move(cluster));
    }

    NETMAP_LOG_DEBUG("clusters detected", {
        log::StringField("scope", graph.scope()),
        log::StringField("strategy", result.strategy),
        log::IntField("clusters", static_cast<std::int64_t>(result.clusters.size())),
        log::IntField("unclustered", static_cast<std::int64_t>(result.unclustered.size())),
        log::DoubleField("modularity", result.modularity)});
    return result;
}

} // namespace netmap
