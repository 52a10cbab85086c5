#include "core/config.hpp"
#include "core/errors.hpp"

#include <cstdlib>
#include <fstream>

namespace netmap {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

int env_int(const char* name, int fallback) {
    std::string value = env_or_empty(name);
    if (value.empty()) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string("Environment variable ") + name + " is not an integer: " + value);
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError("Invalid configuration: " + message);
    }
}

} // namespace

std::map<std::string, std::vector<std::string>> DiscoveryConfig::default_keyword_categories() {
    return {
        {"supports", {"supports", "endorses", "backs", "advocates for", "champions"}},
        {"opposes", {"opposes", "criticizes", "attacks", "condemns", "rejects"}},
        {"collaborates_with", {"works with", "partners with", "collaborates", "together with", "alongside"}},
        {"leads", {"leads", "heads", "directs", "manages", "runs"}},
        {"funds", {"funds", "finances", "invests in", "sponsors", "pays"}},
        {"part_of", {"member of", "part of", "belongs to", "works for", "employed by"}},
        {"impacts", {"affects", "impacts", "influences", "changes"}},
    };
}

EngineConfig::EngineConfig() {
    discovery.keyword_categories = DiscoveryConfig::default_keyword_categories();
}

void EngineConfig::validate() const {
    require(!store.db_path.empty(), "store.db_path must not be empty");
    require(store.read_timeout_ms > 0, "store.read_timeout_ms must be positive");
    require(cache.snapshot_ttl_seconds >= 0, "cache.snapshot_ttl_seconds must be >= 0");
    require(cache.layout_ttl_seconds >= 0, "cache.layout_ttl_seconds must be >= 0");
    require(cache.cluster_ttl_seconds >= 0, "cache.cluster_ttl_seconds must be >= 0");
    require(cache.budget_ms > 0, "cache.budget_ms must be positive");
    require(layout.algorithm == "force" || layout.algorithm == "circular" || layout.algorithm == "shell",
            "layout.algorithm must be force, circular or shell");
    require(layout.base_iterations > 0, "layout.base_iterations must be positive");
    require(layout.theta > 0.0, "layout.theta must be positive");
    require(layout.scale > 0.0, "layout.scale must be positive");
    require(cluster.min_size >= 1, "cluster.min_size must be >= 1");
    require(cluster.max_passes > 0, "cluster.max_passes must be positive");
    require(cluster.resolution > 0.0, "cluster.resolution must be positive");
    require(centrality.damping > 0.0 && centrality.damping < 1.0, "centrality.damping must be in (0, 1)");
    require(centrality.max_iterations > 0, "centrality.max_iterations must be positive");
    require(centrality.betweenness_samples > 0, "centrality.betweenness_samples must be positive");
    require(paths.default_max_depth >= 1, "paths.default_max_depth must be >= 1");
    require(paths.max_depth_limit >= paths.default_max_depth, "paths.max_depth_limit must be >= default_max_depth");
    require(paths.max_paths >= 1, "paths.max_paths must be >= 1");
    require(paths.all_paths_max_depth >= 1 && paths.all_paths_max_depth <= paths.max_depth_limit,
            "paths.all_paths_max_depth must be in [1, max_depth_limit]");
    require(discovery.min_co_occurrences >= 1, "discovery.min_co_occurrences must be >= 1");
    require(discovery.time_window_hours >= 0, "discovery.time_window_hours must be >= 0");
    require(discovery.lookback_days >= 1, "discovery.lookback_days must be >= 1");
    require(discovery.base_confidence >= 0.0 && discovery.max_confidence <= 1.0 &&
            discovery.base_confidence <= discovery.max_confidence,
            "discovery confidence bounds must satisfy 0 <= base <= max <= 1");
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["store"] = {{"db_path", store.db_path}, {"read_timeout_ms", store.read_timeout_ms}};
    j["cache"] = {
        {"snapshot_ttl_seconds", cache.snapshot_ttl_seconds},
        {"layout_ttl_seconds", cache.layout_ttl_seconds},
        {"cluster_ttl_seconds", cache.cluster_ttl_seconds},
        {"budget_ms", cache.budget_ms}
    };
    j["layout"] = {
        {"algorithm", layout.algorithm},
        {"base_iterations", layout.base_iterations},
        {"approximation_threshold", layout.approximation_threshold},
        {"theta", layout.theta},
        {"lin_log", layout.lin_log},
        {"gravity", layout.gravity},
        {"scaling_ratio", layout.scaling_ratio},
        {"scale", layout.scale},
        {"skip_threshold", layout.skip_threshold},
        {"seed", layout.seed}
    };
    j["cluster"] = {
        {"strategy_threshold", cluster.strategy_threshold},
        {"min_size", cluster.min_size},
        {"max_passes", cluster.max_passes},
        {"max_levels", cluster.max_levels},
        {"resolution", cluster.resolution},
        {"propagation_rounds", cluster.propagation_rounds},
        {"seed", cluster.seed}
    };
    j["centrality"] = {
        {"damping", centrality.damping},
        {"max_iterations", centrality.max_iterations},
        {"tolerance", centrality.tolerance},
        {"betweenness_exact_limit", centrality.betweenness_exact_limit},
        {"betweenness_samples", centrality.betweenness_samples},
        {"betweenness_hard_limit", centrality.betweenness_hard_limit},
        {"seed", centrality.seed}
    };
    j["paths"] = {
        {"default_max_depth", paths.default_max_depth},
        {"max_depth_limit", paths.max_depth_limit},
        {"all_paths_max_depth", paths.all_paths_max_depth},
        {"max_paths", paths.max_paths}
    };
    j["discovery"] = {
        {"min_co_occurrences", discovery.min_co_occurrences},
        {"time_window_hours", discovery.time_window_hours},
        {"lookback_days", discovery.lookback_days},
        {"base_confidence", discovery.base_confidence},
        {"max_confidence", discovery.max_confidence},
        {"keyword_categories", discovery.keyword_categories}
    };
    j["logging"] = {{"level", logging.level}, {"pattern", logging.pattern}};
    return j;
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    EngineConfig config;
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    try {
        if (j.contains("store")) {
            const auto& s = j["store"];
            config.store.db_path = s.value("db_path", config.store.db_path);
            config.store.read_timeout_ms = s.value("read_timeout_ms", config.store.read_timeout_ms);
        }
        if (j.contains("cache")) {
            const auto& c = j["cache"];
            config.cache.snapshot_ttl_seconds = c.value("snapshot_ttl_seconds", config.cache.snapshot_ttl_seconds);
            config.cache.layout_ttl_seconds = c.value("layout_ttl_seconds", config.cache.layout_ttl_seconds);
            config.cache.cluster_ttl_seconds = c.value("cluster_ttl_seconds", config.cache.cluster_ttl_seconds);
            config.cache.budget_ms = c.value("budget_ms", config.cache.budget_ms);
        }
        if (j.contains("layout")) {
            const auto& l = j["layout"];
            config.layout.algorithm = l.value("algorithm", config.layout.algorithm);
            config.layout.base_iterations = l.value("base_iterations", config.layout.base_iterations);
            config.layout.approximation_threshold = l.value("approximation_threshold", config.layout.approximation_threshold);
            config.layout.theta = l.value("theta", config.layout.theta);
            config.layout.lin_log = l.value("lin_log", config.layout.lin_log);
            config.layout.gravity = l.value("gravity", config.layout.gravity);
            config.layout.scaling_ratio = l.value("scaling_ratio", config.layout.scaling_ratio);
            config.layout.scale = l.value("scale", config.layout.scale);
            config.layout.skip_threshold = l.value("skip_threshold", config.layout.skip_threshold);
            config.layout.seed = l.value("seed", config.layout.seed);
        }
        if (j.contains("cluster")) {
            const auto& c = j["cluster"];
            config.cluster.strategy_threshold = c.value("strategy_threshold", config.cluster.strategy_threshold);
            config.cluster.min_size = c.value("min_size", config.cluster.min_size);
            config.cluster.max_passes = c.value("max_passes", config.cluster.max_passes);
            config.cluster.max_levels = c.value("max_levels", config.cluster.max_levels);
            config.cluster.resolution = c.value("resolution", config.cluster.resolution);
            config.cluster.propagation_rounds = c.value("propagation_rounds", config.cluster.propagation_rounds);
            config.cluster.seed = c.value("seed", config.cluster.seed);
        }
        if (j.contains("centrality")) {
            const auto& c = j["centrality"];
            config.centrality.damping = c.value("damping", config.centrality.damping);
            config.centrality.max_iterations = c.value("max_iterations", config.centrality.max_iterations);
            config.centrality.tolerance = c.value("tolerance", config.centrality.tolerance);
            config.centrality.betweenness_exact_limit = c.value("betweenness_exact_limit", config.centrality.betweenness_exact_limit);
            config.centrality.betweenness_samples = c.value("betweenness_samples", config.centrality.betweenness_samples);
            config.centrality.betweenness_hard_limit = c.value("betweenness_hard_limit", config.centrality.betweenness_hard_limit);
            config.centrality.seed = c.value("seed", config.centrality.seed);
        }
        if (j.contains("paths")) {
            const auto& p = j["paths"];
            config.paths.default_max_depth = p.value("default_max_depth", config.paths.default_max_depth);
            config.paths.max_depth_limit = p.value("max_depth_limit", config.paths.max_depth_limit);
            config.paths.all_paths_max_depth = p.value("all_paths_max_depth", config.paths.all_paths_max_depth);
            config.paths.max_paths = p.value("max_paths", config.paths.max_paths);
        }
        if (j.contains("discovery")) {
            const auto& d = j["discovery"];
            config.discovery.min_co_occurrences = d.value("min_co_occurrences", config.discovery.min_co_occurrences);
            config.discovery.time_window_hours = d.value("time_window_hours", config.discovery.time_window_hours);
            config.discovery.lookback_days = d.value("lookback_days", config.discovery.lookback_days);
            config.discovery.base_confidence = d.value("base_confidence", config.discovery.base_confidence);
            config.discovery.max_confidence = d.value("max_confidence", config.discovery.max_confidence);
            if (d.contains("keyword_categories")) {
                config.discovery.keyword_categories =
                    d["keyword_categories"].get<std::map<std::string, std::vector<std::string>>>();
            }
        }
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            config.logging.level = l.value("level", config.logging.level);
            config.logging.pattern = l.value("pattern", config.logging.pattern);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }

    config.validate();
    return config;
}

void apply_env_overrides(EngineConfig& config) {
    std::string db_path = env_or_empty("NETMAP_DB_PATH");
    if (!db_path.empty()) config.store.db_path = db_path;

    std::string level = env_or_empty("NETMAP_LOG_LEVEL");
    if (!level.empty()) config.logging.level = level;

    config.cache.snapshot_ttl_seconds = env_int("NETMAP_SNAPSHOT_TTL", config.cache.snapshot_ttl_seconds);
    config.cache.layout_ttl_seconds = env_int("NETMAP_LAYOUT_TTL", config.cache.layout_ttl_seconds);
    config.cache.cluster_ttl_seconds = env_int("NETMAP_CLUSTER_TTL", config.cache.cluster_ttl_seconds);
}

EngineConfig load_config(const std::string& config_path) {
    std::vector<std::string> paths_to_try;
    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }
    paths_to_try.push_back("netmap.json");
    paths_to_try.push_back("../netmap.json");
    paths_to_try.push_back("../../netmap.json");

    std::ifstream file;
    std::string found_path;
    for (const auto& path : paths_to_try) {
        file.open(path);
        if (file.is_open()) {
            found_path = path;
            break;
        }
        file.clear();
    }

    if (!config_path.empty() && found_path != config_path) {
        throw ConfigError("Cannot open config file: " + config_path);
    }

    EngineConfig config;
    if (file.is_open()) {
        nlohmann::json config_json;
        try {
            file >> config_json;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("Failed to parse " + found_path + ": " + e.what());
        }
        config = EngineConfig::from_json(config_json);
    }

    apply_env_overrides(config);
    config.validate();
    return config;
}

} // namespace netmap
