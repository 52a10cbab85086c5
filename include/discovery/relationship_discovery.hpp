#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "graph/entity.hpp"
#include "store/graph_store.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netmap {

/**
 * @brief Evidence gathered for one canonical entity pair
 */
struct DiscoveryCandidate {
    RelationshipKey key;                 ///< source < target
    int co_occurrences = 0;
    double keyword_strength = 0.0;       ///< [0, 1]
    double confidence = 0.0;
    TimePoint first_seen{};
    TimePoint last_seen{};
};

/**
 * @brief Outcome of one discovery run
 *
 * `committed` lists exactly the relationships that were written. When a
 * store write fails the run stops and `complete` is false.
 */
struct DiscoveryReport {
    size_t candidates = 0;
    size_t created = 0;
    size_t updated = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<RelationshipKey> committed;
    bool complete = true;
    std::string error;

    nlohmann::json to_json() const;
};

struct RelationshipStats {
    size_t total = 0;
    std::map<std::string, size_t> by_type;
    size_t observed_last_7_days = 0;
    double average_confidence = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Infers relationships from entity co-occurrence in content items
 *
 * Two entities co-occur when both appear in one item, or when they appear
 * separately in two items whose timestamps lie within the time window.
 * Pairs seen at least `min_co_occurrences` times become (or strengthen) a
 * relationship typed by keyword categories over the supporting texts.
 *
 * Evidence is recomputed from the whole lookback window and merged into
 * stored edges with max(), so repeated runs on unchanged input change
 * nothing.
 */
class RelationshipDiscovery {
public:
    RelationshipDiscovery(std::shared_ptr<GraphStore> store,
                          DiscoveryConfig config,
                          std::shared_ptr<Clock> clock);

    /**
     * @brief Pure co-occurrence analysis; items outside the lookback window
     *        are ignored. Result is sorted by key.
     */
    std::vector<DiscoveryCandidate> find_candidates(const std::vector<ContentItem>& items,
                                                    int min_co_occurrences,
                                                    Duration time_window) const;

    /**
     * @brief Analyze `items` and write the resulting relationships to `scope`
     */
    DiscoveryReport discover(const Scope& scope,
                             const std::vector<ContentItem>& items,
                             int min_co_occurrences,
                             Duration time_window);

    /**
     * @brief Load the scope's recent content items and discover with the
     *        configured thresholds
     */
    DiscoveryReport discover(const Scope& scope);

    RelationshipStats relationship_stats(const Scope& scope) const;

    /**
     * @brief Confidence for a pair; monotone in both arguments
     */
    double score(int co_occurrences, double keyword_strength) const;

    const DiscoveryConfig& config() const { return config_; }

private:
    std::shared_ptr<GraphStore> store_;
    DiscoveryConfig config_;
    std::shared_ptr<Clock> clock_;

    std::pair<std::string, double> classify(const std::vector<const std::string*>& texts) const;
};

} // namespace netmap
