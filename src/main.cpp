#include "cli/cli.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "service/network_service.hpp"
#include "store/sqlite_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace netmap;

// ============== Helper Functions ==============

namespace {

struct Session {
    EngineConfig config;
    std::shared_ptr<GraphStore> store;
    std::unique_ptr<NetworkService> service;
    Scope scope;
};

// Config file, then --db, then logging; the store is opened last
Session open_session(const Args& args, const std::function<void(EngineConfig&)>& adjust = {}) {
    Session session;
    session.config = load_config(args.get("config").value);
    if (args.has("db")) {
        session.config.store.db_path = args.get("db").value;
    }
    if (args.has("verbose")) {
        session.config.logging.level = "debug";
    }
    if (adjust) {
        adjust(session.config);
    }
    session.config.validate();
    log::init_logging(session.config.logging);

    session.store = std::make_shared<SqliteGraphStore>(session.config.store.db_path);
    session.service = std::make_unique<NetworkService>(session.config, session.store, default_clock());
    session.scope = args.get("scope", "default").value;
    return session;
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Write to --output if given, else stdout
void emit_json(const Args& args, const nlohmann::json& j) {
    std::string output = args.get("output").value;
    if (output.empty()) {
        std::cout << j.dump(2) << "\n";
        return;
    }
    fs::path out_path(output);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    std::ofstream file(output);
    if (!file) {
        throw std::runtime_error("Cannot write " + output);
    }
    file << j.dump(2);
    std::cout << "Wrote " << output << "\n";
}

void print_path(const PathResult& path) {
    for (size_t i = 0; i < path.nodes.size(); ++i) {
        if (i > 0) {
            const std::string& type = i - 1 < path.relationships.size()
                ? path.relationships[i - 1].type : std::string("?");
            std::cout << " -[" << type << "]- ";
        }
        std::cout << path.nodes[i];
    }
    std::cout << "  (" << path.hops() << " hops)\n";
}

} // namespace

// ============== netmap import ==============
int cmd_import(const Args& args) {
    std::string input_path = args.require("file");
    std::ifstream file(input_path);
    if (!file) {
        throw std::runtime_error("Cannot open " + input_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgument("Invalid JSON in " + input_path + ": " + e.what());
    }

    std::vector<Entity> entities;
    for (const auto& e : j.value("entities", nlohmann::json::array())) {
        entities.push_back(Entity::from_json(e));
    }
    std::vector<Relationship> relationships;
    for (const auto& r : j.value("relationships", nlohmann::json::array())) {
        relationships.push_back(Relationship::from_json(r));
    }
    std::vector<ContentItem> items;
    for (const auto& c : j.value("content_items", nlohmann::json::array())) {
        items.push_back(ContentItem::from_json(c));
    }

    Session session = open_session(args);
    std::cout << "Importing into scope '" << session.scope << "': "
              << entities.size() << " entities, " << relationships.size() << " relationships, "
              << items.size() << " content items\n";

    auto start = std::chrono::steady_clock::now();
    MutationReport report = session.service->import_records(session.scope, entities, relationships, items);
    std::cout << "Committed " << report.committed << " records in "
              << format_duration(std::chrono::steady_clock::now() - start) << "\n";

    if (!report.complete) {
        std::cerr << "Import stopped: " << report.error << "\n";
        return 1;
    }
    return 0;
}

// ============== netmap graph ==============
int cmd_graph(const Args& args) {
    Session session = open_session(args);

    if (args.has("snapshot")) {
        emit_json(args, session.service->snapshot(session.scope)->to_json());
        return 0;
    }

    GraphQuery query;
    query.include_positions = !args.has("no-positions");
    query.include_clusters = !args.has("no-clusters");
    query.min_cluster_size = args.get("min-cluster-size").as_size(0);
    query.layout_algorithm = args.get("algorithm").value;
    if (args.has("seed")) {
        query.seed = static_cast<unsigned int>(args.get("seed").as_size());
    }

    GraphView view = session.service->graph(session.scope, query);
    emit_json(args, view.to_json());
    return 0;
}

// ============== netmap stats ==============
int cmd_stats(const Args& args) {
    Session session = open_session(args);

    GraphStatistics stats = session.service->stats(session.scope);
    RelationshipStats rel_stats = session.service->relationship_stats(session.scope);

    std::cout << "\nScope: " << session.scope << " (" << session.store->backend_name() << ")\n";
    std::cout << "==========================================\n";
    std::cout << "Nodes:              " << stats.num_nodes << "\n";
    std::cout << "Edges:              " << stats.num_edges << "\n";
    std::cout << "Components:         " << stats.num_components << "\n";
    std::cout << "Isolated nodes:     " << stats.num_isolated << "\n";
    std::cout << "Dangling edges:     " << stats.num_dangling_edges << "\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Density:            " << stats.density << "\n";
    std::cout << "Average degree:     " << stats.avg_degree << "\n";
    std::cout << "Max degree:         " << stats.max_degree << "\n";
    std::cout << "Avg confidence:     " << rel_stats.average_confidence << "\n";
    std::cout << "Observed last 7d:   " << rel_stats.observed_last_7_days << "\n";

    if (!rel_stats.by_type.empty()) {
        std::cout << "\nRelationship types:\n";
        for (const auto& [type, count] : rel_stats.by_type) {
            std::cout << "  " << std::left << std::setw(20) << type << count << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

// ============== netmap centrality ==============
int cmd_centrality(const Args& args) {
    Session session = open_session(args);
    CentralityMetric metric = string_to_centrality_metric(args.get("metric", "degree").value);
    size_t limit = args.get("limit", "10").as_size(10);

    CentralityResult result = session.service->centrality(session.scope, metric, limit);
    if (args.has("json")) {
        emit_json(args, result.to_json());
        return 0;
    }

    std::cout << "\nTop " << result.scores.size() << " by " << centrality_metric_to_string(metric);
    if (result.best_effort) std::cout << " (best effort)";
    std::cout << "\n\n";
    size_t rank = 1;
    for (const auto& s : result.scores) {
        std::cout << std::right << std::setw(4) << rank++ << ". "
                  << std::left << std::setw(32) << (s.name.empty() ? s.id : s.name)
                  << std::fixed << std::setprecision(4) << s.score << "\n";
    }
    return 0;
}

// ============== netmap path ==============
int cmd_path(const Args& args) {
    Session session = open_session(args);
    std::string from = args.require("from");
    std::string to = args.require("to");

    auto path = session.service->shortest_path(session.scope, from, to, args.get("max-depth").as_int(-1));
    if (!path) {
        std::cout << "No path between " << from << " and " << to << "\n";
        return 0;
    }
    if (args.has("json")) {
        emit_json(args, path->to_json());
    } else {
        print_path(*path);
    }
    return 0;
}

// ============== netmap paths ==============
int cmd_paths(const Args& args) {
    Session session = open_session(args);
    std::string from = args.require("from");
    std::string to = args.require("to");

    auto paths = session.service->all_paths(session.scope, from, to,
                                            args.get("max-depth").as_int(-1),
                                            args.get("max-paths").as_size(0));
    if (args.has("json")) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& p : paths) list.push_back(p.to_json());
        emit_json(args, list);
        return 0;
    }

    std::cout << paths.size() << " path(s) between " << from << " and " << to << "\n";
    for (const auto& p : paths) {
        print_path(p);
    }
    return 0;
}

// ============== netmap neighborhood ==============
int cmd_neighborhood(const Args& args) {
    Session session = open_session(args);
    emit_json(args, session.service->neighborhood(session.scope, args.require("entity"),
                                                  args.get("depth", "1").as_int(1)));
    return 0;
}

// ============== netmap timeline ==============
int cmd_timeline(const Args& args) {
    Session session = open_session(args);
    nlohmann::json list = nlohmann::json::array();
    for (const auto& rel : session.service->timeline(session.scope, args.require("entity"))) {
        list.push_back(rel.to_json());
    }
    emit_json(args, list);
    return 0;
}

// ============== netmap subset ==============
int cmd_subset(const Args& args) {
    Session session = open_session(args);

    SubsetQuery query;
    query.limit = args.get("limit", "50").as_size(50);
    query.offset = args.get("offset").as_size(0);
    query.sort_by = args.get("sort", "degree").value;
    query.name_prefix = args.get("prefix").value;
    for (const auto& t : args.get("types").as_list()) {
        query.types.push_back(string_to_entity_type(t));
    }

    emit_json(args, session.service->subset(session.scope, query).to_json());
    return 0;
}

// ============== netmap merge ==============
int cmd_merge(const Args& args) {
    Session session = open_session(args);
    MutationReport report = session.service->merge_entities(session.scope, args.require("keep"),
                                                            args.require("remove"));
    std::cout << report.to_json().dump(2) << "\n";
    return report.complete ? 0 : 1;
}

// ============== netmap delete ==============
int cmd_delete(const Args& args) {
    Session session = open_session(args);
    std::string id = args.require("entity");
    StoreResult result = session.service->delete_entity(session.scope, id);
    if (result.code == StoreErrorCode::NotFound) {
        throw EntityNotFound(id);
    }
    if (!result) {
        std::cerr << "Delete failed: " << store_error_code_to_string(result.code)
                  << " " << result.message << "\n";
        return 1;
    }
    std::cout << "Deleted " << id << "\n";
    return 0;
}

// ============== netmap discover ==============
int cmd_discover(const Args& args) {
    Session session = open_session(args, [&args](EngineConfig& config) {
        if (args.has("min")) config.discovery.min_co_occurrences = args.get("min").as_int();
        if (args.has("window-hours")) config.discovery.time_window_hours = args.get("window-hours").as_int();
        if (args.has("lookback-days")) config.discovery.lookback_days = args.get("lookback-days").as_int();
    });

    auto start = std::chrono::steady_clock::now();
    DiscoveryReport report = session.service->run_discovery(session.scope);

    std::cout << "\nDiscovery Summary (" << format_duration(std::chrono::steady_clock::now() - start) << "):\n";
    std::cout << "  candidates: " << report.candidates << "\n";
    std::cout << "  created:    " << report.created << "\n";
    std::cout << "  updated:    " << report.updated << "\n";
    std::cout << "  skipped:    " << report.skipped << "\n";
    if (!report.complete) {
        std::cerr << "Discovery stopped: " << report.error << "\n";
        return 1;
    }
    return 0;
}

// ============== netmap cache-status ==============
int cmd_cache_status(const Args& args) {
    Session session = open_session(args);
    if (args.has("warm")) {
        // Twice, so the second pass reports hits
        session.service->graph(session.scope);
        session.service->graph(session.scope);
    }
    if (args.has("reset")) {
        session.service->invalidate_all();
    }
    emit_json(args, session.service->cache_status(session.scope).to_json());
    return 0;
}

int report_error(const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    if (dynamic_cast<const EntityNotFound*>(&e)) return 2;
    if (dynamic_cast<const StoreUnavailable*>(&e)) return 3;
    if (dynamic_cast<const ConfigError*>(&e) || dynamic_cast<const InvalidArgument*>(&e) ||
        dynamic_cast<const UsageError*>(&e)) return 4;
    return 1;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("netmap", "1.0.0");
    cli.set_error_handler(report_error);

    cli.add_global_arg({"config", "c", "Path to netmap.json", "", false, false});
    cli.add_global_arg({"db", "", "SQLite database file (overrides config)", "", false, false});
    cli.add_global_arg({"scope", "", "Scope (tenant or analysis context)", "default", false, false});
    cli.add_global_arg({"verbose", "", "Debug logging", "", false, true});

    cli.register_command({
        "import",
        "Load entities, relationships and content items from a JSON file",
        {
            {"file", "f", "JSON file with entities, relationships, content_items arrays", "", true, false}
        },
        cmd_import
    });

    cli.register_command({
        "graph",
        "Export the node-link view with positions and clusters",
        {
            {"output", "o", "Output JSON path (stdout if omitted)", "", false, false},
            {"algorithm", "a", "Layout algorithm: force, circular, shell", "", false, false},
            {"seed", "s", "Layout seed", "", false, false},
            {"min-cluster-size", "m", "Smallest reported cluster", "", false, false},
            {"no-positions", "", "Skip layout", "", false, true},
            {"no-clusters", "", "Skip clustering", "", false, true},
            {"snapshot", "", "Export the raw entities and relationships instead", "", false, true}
        },
        cmd_graph
    });

    cli.register_command({
        "stats",
        "Print statistics about a scope",
        {},
        cmd_stats
    });

    cli.register_command({
        "centrality",
        "Rank entities by degree, betweenness or importance",
        {
            {"metric", "m", "degree, betweenness, importance", "degree", false, false},
            {"limit", "n", "Number of entities to list (0 = all)", "10", false, false},
            {"json", "j", "Print JSON", "", false, true},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_centrality
    });

    cli.register_command({
        "path",
        "Shortest path between two entities",
        {
            {"from", "f", "Source entity id", "", true, false},
            {"to", "t", "Target entity id", "", true, false},
            {"max-depth", "d", "Maximum hops", "", false, false},
            {"json", "j", "Print JSON", "", false, true},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_path
    });

    cli.register_command({
        "paths",
        "Enumerate simple paths between two entities",
        {
            {"from", "f", "Source entity id", "", true, false},
            {"to", "t", "Target entity id", "", true, false},
            {"max-depth", "d", "Maximum hops", "", false, false},
            {"max-paths", "n", "Maximum number of paths", "", false, false},
            {"json", "j", "Print JSON", "", false, true},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_paths
    });

    cli.register_command({
        "neighborhood",
        "Entities within a few hops of an entity",
        {
            {"entity", "e", "Center entity id", "", true, false},
            {"depth", "d", "Hop radius (1-3)", "1", false, false},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_neighborhood
    });

    cli.register_command({
        "timeline",
        "Relationships of an entity ordered by first observation",
        {
            {"entity", "e", "Entity id", "", true, false},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_timeline
    });

    cli.register_command({
        "subset",
        "Page through entities sorted by degree, centrality or recency",
        {
            {"sort", "s", "degree, centrality, recent", "degree", false, false},
            {"limit", "n", "Page size (0 = all)", "50", false, false},
            {"offset", "", "Entries to skip", "", false, false},
            {"types", "t", "Comma-separated entity types", "", false, false},
            {"prefix", "p", "Name prefix", "", false, false},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_subset
    });

    cli.register_command({
        "merge",
        "Merge one entity into another",
        {
            {"keep", "k", "Entity id to keep", "", true, false},
            {"remove", "r", "Entity id to fold in and delete", "", true, false}
        },
        cmd_merge
    });

    cli.register_command({
        "delete",
        "Delete an entity and its relationships",
        {
            {"entity", "e", "Entity id", "", true, false}
        },
        cmd_delete
    });

    cli.register_command({
        "discover",
        "Infer relationships from co-occurrence in recent content items",
        {
            {"min", "m", "Minimum co-occurrences", "", false, false},
            {"window-hours", "w", "Cross-item time window in hours", "", false, false},
            {"lookback-days", "l", "Ignore items older than this", "", false, false}
        },
        cmd_discover
    });

    cli.register_command({
        "cache-status",
        "Show cache tiers for a scope",
        {
            {"warm", "w", "Run a graph query first", "", false, true},
            {"reset", "r", "Drop every cached result before reporting", "", false, true},
            {"output", "o", "Output JSON path", "", false, false}
        },
        cmd_cache_status
    });

    int rc = cli.run(argc, argv);
    log::shutdown_logging();
    return rc;
}
