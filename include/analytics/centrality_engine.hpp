#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "graph/graph_snapshot.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace netmap {

enum class CentralityMetric {
    DEGREE,
    BETWEENNESS,
    IMPORTANCE          // PageRank-style
};

std::string centrality_metric_to_string(CentralityMetric metric);

/**
 * @brief Parse "degree", "betweenness", "importance" (or "pagerank");
 *        throws InvalidArgument otherwise
 */
CentralityMetric string_to_centrality_metric(const std::string& s);

struct CentralityScore {
    EntityId id;
    std::string name;
    double score = 0.0;     ///< Normalized score
    double raw = 0.0;       ///< Degree count, raw pair-dependency sum, or rank mass

    nlohmann::json to_json() const;
};

struct CentralityResult {
    CentralityMetric metric = CentralityMetric::DEGREE;
    std::vector<CentralityScore> scores;   ///< Descending score, ties by id
    bool best_effort = false;
    size_t sources = 0;                    ///< Betweenness: BFS sources processed
    int iterations = 0;                    ///< Importance: power iterations run

    nlohmann::json to_json() const;
};

/**
 * @brief Node ranking by degree, betweenness and importance
 *
 * Every metric treats the snapshot as undirected, tolerates disconnected
 * graphs and returns all nodes when limit is 0.
 */
class CentralityEngine {
public:
    explicit CentralityEngine(CentralityConfig config = {});

    /**
     * @brief Raw connection count; score is degree / (n - 1)
     */
    CentralityResult degree(const GraphSnapshot& graph, size_t limit = 0) const;

    /**
     * @brief Brandes betweenness over hop distance, normalized
     *
     * Above `betweenness_exact_limit` nodes a seeded sample of sources is
     * used and the result is flagged best_effort. Above
     * `betweenness_hard_limit` throws GraphTooLarge. Budget expiry returns
     * the extrapolated partial accumulation, flagged best_effort.
     */
    CentralityResult betweenness(const GraphSnapshot& graph, size_t limit = 0,
                                 const Budget& budget = Budget()) const;

    /**
     * @brief Edge-weighted PageRank with dangling mass redistributed
     */
    CentralityResult importance(const GraphSnapshot& graph, size_t limit = 0,
                                const Budget& budget = Budget()) const;

    CentralityResult compute(CentralityMetric metric, const GraphSnapshot& graph,
                             size_t limit = 0, const Budget& budget = Budget()) const;

    const CentralityConfig& config() const { return config_; }

private:
    CentralityConfig config_;
};

} // namespace netmap
