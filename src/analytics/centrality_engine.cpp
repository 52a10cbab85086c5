#include "analytics/centrality_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace netmap {

namespace {

std::vector<CentralityScore> rank(const GraphSnapshot& graph,
                                  const std::vector<double>& score,
                                  const std::vector<double>& raw,
                                  size_t limit) {
    std::vector<size_t> order(graph.num_nodes());
    std::iota(order.begin(), order.end(), 0);

    // Node indices follow id order, so the index tie-break orders by id
    auto by_score = [&](size_t a, size_t b) {
        if (score[a] != score[b]) return score[a] > score[b];
        return a < b;
    };

    size_t count = limit == 0 ? order.size() : std::min(limit, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(count), order.end(), by_score);

    std::vector<CentralityScore> out;
    out.reserve(count);
    for (size_t k = 0; k < count; ++k) {
        size_t i = order[k];
        const Entity& e = graph.entity(i);
        out.push_back({e.id, e.name, score[i], raw[i]});
    }
    return out;
}

} // namespace

std::string centrality_metric_to_string(CentralityMetric metric) {
    switch (metric) {
        case CentralityMetric::DEGREE: return "degree";
        case CentralityMetric::BETWEENNESS: return "betweenness";
        case CentralityMetric::IMPORTANCE: return "importance";
        default: return "unknown";
    }
}

CentralityMetric string_to_centrality_metric(const std::string& s) {
    if (s == "degree") return CentralityMetric::DEGREE;
    if (s == "betweenness") return CentralityMetric::BETWEENNESS;
    if (s == "importance" || s == "pagerank") return CentralityMetric::IMPORTANCE;
    throw InvalidArgument("Unknown centrality metric: " + s);
}

nlohmann::json CentralityScore::to_json() const {
    return {{"id", id}, {"name", name}, {"score", score}, {"raw", raw}};
}

nlohmann::json CentralityResult::to_json() const {
    nlohmann::json j;
    j["metric"] = centrality_metric_to_string(metric);
    j["best_effort"] = best_effort;
    if (metric == CentralityMetric::BETWEENNESS) j["sources"] = sources;
    if (metric == CentralityMetric::IMPORTANCE) j["iterations"] = iterations;

    nlohmann::json list = nlohmann::json::array();
    for (const auto& s : scores) {
        list.push_back(s.to_json());
    }
    j["scores"] = list;
    return j;
}

CentralityEngine::CentralityEngine(CentralityConfig config) : config_(std::move(config)) {}

CentralityResult CentralityEngine::compute(CentralityMetric metric, const GraphSnapshot& graph,
                                           size_t limit, const Budget& budget) const {
    switch (metric) {
        case CentralityMetric::BETWEENNESS: return betweenness(graph, limit, budget);
        case CentralityMetric::IMPORTANCE: return importance(graph, limit, budget);
        case CentralityMetric::DEGREE:
        default: return degree(graph, limit);
    }
}

// ============== DEGREE ==============
CentralityResult CentralityEngine::degree(const GraphSnapshot& graph, size_t limit) const {
    CentralityResult result;
    result.metric = CentralityMetric::DEGREE;

    const size_t n = graph.num_nodes();
    std::vector<double> raw(n), score(n);
    double denom = n > 1 ? static_cast<double>(n - 1) : 1.0;
    for (size_t i = 0; i < n; ++i) {
        raw[i] = static_cast<double>(graph.degree(i));
        score[i] = raw[i] / denom;
    }

    result.scores = rank(graph, score, raw, limit);
    return result;
}

// ============== BETWEENNESS (BRANDES) ==============
CentralityResult CentralityEngine::betweenness(const GraphSnapshot& graph, size_t limit,
                                               const Budget& budget) const {
    CentralityResult result;
    result.metric = CentralityMetric::BETWEENNESS;

    const size_t n = graph.num_nodes();
    if (n > config_.betweenness_hard_limit) {
        throw GraphTooLarge("betweenness", n, config_.betweenness_hard_limit);
    }

    std::vector<double> raw(n, 0.0);

    std::vector<size_t> sources(n);
    std::iota(sources.begin(), sources.end(), 0);
    if (n > config_.betweenness_exact_limit) {
        std::mt19937 rng(config_.seed);
        std::shuffle(sources.begin(), sources.end(), rng);
        sources.resize(std::min(config_.betweenness_samples, n));
        std::sort(sources.begin(), sources.end());
        result.best_effort = true;
    }

    std::vector<long long> dist(n);
    std::vector<double> sigma(n), delta(n);
    std::vector<size_t> queue(n), stack(n);

    size_t processed = 0;
    for (size_t s : sources) {
        if (budget.expired()) {
            result.best_effort = true;
            break;
        }

        std::fill(dist.begin(), dist.end(), -1);
        std::fill(sigma.begin(), sigma.end(), 0.0);
        std::fill(delta.begin(), delta.end(), 0.0);
        dist[s] = 0;
        sigma[s] = 1.0;

        size_t head = 0, tail = 0, top = 0;
        queue[tail++] = s;

        // BFS
        while (head < tail) {
            size_t u = queue[head++];
            stack[top++] = u;
            for (const auto& nb : graph.neighbors(u)) {
                size_t v = nb.index;
                if (dist[v] == -1) {
                    dist[v] = dist[u] + 1;
                    queue[tail++] = v;
                }
                if (dist[v] == dist[u] + 1) {
                    sigma[v] += sigma[u];
                }
            }
        }

        // Back-propagation
        while (top > 0) {
            size_t w = stack[--top];
            for (const auto& nb : graph.neighbors(w)) {
                size_t v = nb.index;
                if (dist[v] == dist[w] - 1) {
                    delta[v] += (sigma[v] / sigma[w]) * (1.0 + delta[w]);
                }
            }
            if (w != s) {
                raw[w] += delta[w];
            }
        }
        processed++;
    }
    result.sources = processed;

    // Extrapolate sampled or partial runs to the full source set
    double extrapolate = processed > 0 && processed < n
                             ? static_cast<double>(n) / static_cast<double>(processed)
                             : 1.0;
    // Undirected: each pair is counted from both ends
    double normalize = n > 2 ? 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2)) : 0.0;

    std::vector<double> score(n);
    for (size_t i = 0; i < n; ++i) {
        raw[i] *= extrapolate;
        score[i] = raw[i] * normalize;
    }

    if (result.best_effort) {
        NETMAP_LOG_INFO("betweenness is approximate", {
            log::StringField("scope", graph.scope()),
            log::IntField("nodes", static_cast<std::int64_t>(n)),
            log::IntField("sources", static_cast<std::int64_t>(processed))});
    }

    result.scores = rank(graph, score, raw, limit);
    return result;
}

// ============== IMPORTANCE (PAGERANK) ==============
CentralityResult CentralityEngine::importance(const GraphSnapshot& graph, size_t limit,
                                              const Budget& budget) const {
    CentralityResult result;
    result.metric = CentralityMetric::IMPORTANCE;

    const size_t n = graph.num_nodes();
    if (n == 0) return result;

    const double total = static_cast<double>(n);
    const double damping = config_.damping;
    std::vector<double> pr(n, 1.0 / total);

    for (int iter = 0; iter < config_.max_iterations; ++iter) {
        if (budget.expired()) {
            result.best_effort = true;
            break;
        }

        std::vector<double> next(n, (1.0 - damping) / total);
        double dangling = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (graph.weighted_degree(i) <= 0.0) dangling += pr[i];
        }
        double dangling_contrib = damping * dangling / total;

        for (size_t i = 0; i < n; ++i) {
            double out = graph.weighted_degree(i);
            if (out <= 0.0) continue;
            double share = damping * pr[i] / out;
            for (const auto& nb : graph.neighbors(i)) {
                next[nb.index] += share * nb.weight;
            }
        }

        double change = 0.0;
        for (size_t i = 0; i < n; ++i) {
            next[i] += dangling_contrib;
            change += std::abs(next[i] - pr[i]);
        }

        pr.swap(next);
        result.iterations = iter + 1;
        if (change < config_.tolerance) break;
    }

    double max_score = *std::max_element(pr.begin(), pr.end());
    std::vector<double> score(n);
    for (size_t i = 0; i < n; ++i) {
        score[i] = max_score > 0.0 ? pr[i] / max_score : pr[i];
    }

    result.scores = rank(graph, score, pr, limit);
    return result;
}

} // namespace netmap
