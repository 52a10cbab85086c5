#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace netmap {

struct StoreConfig {
    std::string db_path = "netmap.db";   ///< SQLite database file
    int read_timeout_ms = 5000;          ///< Store read deadline before StoreUnavailable
};

struct CacheConfig {
    int snapshot_ttl_seconds = 300;
    int layout_ttl_seconds = 300;
    int cluster_ttl_seconds = 600;
    int budget_ms = 10000;               ///< Recomputation budget per request
};

struct LayoutConfig {
    std::string algorithm = "force";     ///< force, circular, shell
    int base_iterations = 100;           ///< Iterations for small graphs
    size_t approximation_threshold = 250; ///< Barnes-Hut above this many nodes
    double theta = 1.2;                  ///< Barnes-Hut opening angle
    bool lin_log = true;                 ///< Logarithmic attraction
    double gravity = 1.0;
    double scaling_ratio = 2.0;          ///< Repulsion strength
    double scale = 1000.0;               ///< Output viewport scale
    size_t skip_threshold = 500;         ///< Service skips layout above this many nodes
    unsigned int seed = 42;
};

struct ClusterConfig {
    size_t strategy_threshold = 1000;    ///< Label propagation above this many nodes
    size_t min_size = 3;
    int max_passes = 15;
    int max_levels = 8;
    double resolution = 1.0;
    int propagation_rounds = 50;
    unsigned int seed = 42;
};

struct CentralityConfig {
    double damping = 0.85;
    int max_iterations = 100;
    double tolerance = 1e-6;
    size_t betweenness_exact_limit = 2000;  ///< Sample pivots above this many nodes
    size_t betweenness_samples = 256;
    size_t betweenness_hard_limit = 50000;  ///< GraphTooLarge above this
    unsigned int seed = 42;
};

struct PathConfig {
    int default_max_depth = 6;
    int max_depth_limit = 10;
    int all_paths_max_depth = 4;         ///< Default depth for path enumeration
    size_t max_paths = 10;
};

struct DiscoveryConfig {
    int min_co_occurrences = 2;
    int time_window_hours = 24;          ///< Cross-item co-occurrence window
    int lookback_days = 30;              ///< Ignore items older than this
    double base_confidence = 0.5;
    double max_confidence = 0.95;
    std::map<std::string, std::vector<std::string>> keyword_categories;

    /**
     * @brief Keyword categories used when the config does not override them
     */
    static std::map<std::string, std::vector<std::string>> default_keyword_categories();
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern;
};

/**
 * @brief Complete engine configuration
 *
 * Config file format (every key optional):
 * {
 *   "store":      { "db_path": "netmap.db", "read_timeout_ms": 5000 },
 *   "cache":      { "snapshot_ttl_seconds": 300, "layout_ttl_seconds": 300,
 *                   "cluster_ttl_seconds": 600, "budget_ms": 10000 },
 *   "layout":     { "algorithm": "force", "approximation_threshold": 250, ... },
 *   "cluster":    { "strategy_threshold": 1000, "min_size": 3, ... },
 *   "centrality": { "damping": 0.85, ... },
 *   "paths":      { "default_max_depth": 6, "max_paths": 10 },
 *   "discovery":  { "min_co_occurrences": 2, "keyword_categories": {...} },
 *   "logging":    { "level": "info" }
 * }
 */
struct EngineConfig {
    StoreConfig store;
    CacheConfig cache;
    LayoutConfig layout;
    ClusterConfig cluster;
    CentralityConfig centrality;
    PathConfig paths;
    DiscoveryConfig discovery;
    LoggingConfig logging;

    EngineConfig();

    /**
     * @brief Check ranges; throws ConfigError on the first violation
     */
    void validate() const;

    nlohmann::json to_json() const;
    static EngineConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Load configuration from a JSON file
 *
 * Tries, in order: the provided path, netmap.json, ../netmap.json,
 * ../../netmap.json. Falls back to defaults when none exists. An explicit
 * path that cannot be opened, or a file that fails to parse, raises
 * ConfigError. Environment overrides are applied last.
 */
EngineConfig load_config(const std::string& config_path = "");

/**
 * @brief Apply NETMAP_* environment overrides in place
 */
void apply_env_overrides(EngineConfig& config);

} // namespace netmap
