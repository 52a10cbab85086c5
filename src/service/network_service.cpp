#include "service/network_service.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <set>

namespace netmap {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Rebuilds of a graph view when the scope is invalidated mid-request
constexpr int kMaxViewAttempts = 3;

double elapsed_ms(SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with_ci(const std::string& text, const std::string& prefix) {
    if (prefix.size() > text.size()) return false;
    return lower(text.substr(0, prefix.size())) == lower(prefix);
}

} // namespace

// ==========================================
// JSON exports
// ==========================================

nlohmann::json GraphView::to_json() const {
    nlohmann::json j;
    j["scope"] = scope;

    nlohmann::json node_list = nlohmann::json::array();
    for (const auto& n : nodes) {
        nlohmann::json node;
        node["id"] = n.id;
        node["label"] = n.label;
        node["type"] = entity_type_to_string(n.type);
        if (n.position) {
            node["x"] = n.position->x;
            node["y"] = n.position->y;
        }
        if (!n.cluster_id.empty()) {
            node["cluster_id"] = n.cluster_id;
        }
        node_list.push_back(node);
    }
    j["nodes"] = node_list;

    nlohmann::json edge_list = nlohmann::json::array();
    for (const auto& e : edges) {
        edge_list.push_back({{"source", e.source},
                             {"target", e.target},
                             {"type", e.type},
                             {"weight", e.weight},
                             {"confidence", e.confidence}});
    }
    j["edges"] = edge_list;

    if (layout) {
        j["layout"] = {{"algorithm", layout->algorithm},
                       {"seed", layout->seed},
                       {"iterations", layout->iterations},
                       {"approximated", layout->approximated},
                       {"best_effort", layout->best_effort},
                       {"scale", layout->scale}};
    }
    j["layout_skipped"] = layout_skipped;
    if (layout_skipped) {
        j["layout_skip_reason"] = layout_skip_reason;
    }

    if (clusters) {
        j["clusters"] = clusters->to_json();
    }

    nlohmann::json cache;
    for (const auto& [tier, outcome] : cache_outcomes) {
        cache[cache_tier_to_string(tier)] = cache_outcome_to_string(outcome);
    }
    j["cache"] = cache;
    j["timings_ms"] = timings_ms;
    return j;
}

nlohmann::json SubsetResult::to_json() const {
    nlohmann::json j;
    j["total_matching"] = total_matching;
    nlohmann::json list = nlohmann::json::array();
    for (const auto& e : entities) {
        list.push_back({{"id", e.id},
                        {"name", e.name},
                        {"type", entity_type_to_string(e.type)},
                        {"score", e.score}});
    }
    j["entities"] = list;
    return j;
}

nlohmann::json MutationReport::to_json() const {
    nlohmann::json j;
    j["committed"] = committed;
    j["failed"] = failed;
    j["complete"] = complete;
    if (!error.empty()) j["error"] = error;
    return j;
}

// ==========================================
// NetworkService
// ==========================================

NetworkService::NetworkService(EngineConfig config,
                               std::shared_ptr<GraphStore> store,
                               std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      clock_(clock ? std::move(clock) : default_clock()),
      cache_(config_.cache, clock_),
      builder_(store_, clock_, Duration(config_.store.read_timeout_ms)),
      layout_engine_(config_.layout),
      cluster_engine_(config_.cluster),
      centrality_engine_(config_.centrality),
      path_finder_(config_.paths),
      discovery_(store_, config_.discovery, clock_) {
    if (!store_) {
        throw InvalidArgument("NetworkService requires a store");
    }
    NETMAP_LOG_INFO("network service ready", {
        log::StringField("backend", store_->backend_name()),
        log::IntField("snapshot_ttl_s", config_.cache.snapshot_ttl_seconds),
        log::IntField("layout_ttl_s", config_.cache.layout_ttl_seconds),
        log::IntField("cluster_ttl_s", config_.cache.cluster_ttl_seconds)});
}

Budget NetworkService::request_budget() const {
    return Budget::from_millis(config_.cache.budget_ms);
}

SnapshotPtr NetworkService::snapshot(const Scope& scope, CacheOutcome* outcome) {
    return cache_.get_snapshot(scope, [this, &scope](const Budget&) {
        return builder_.load(scope);
    }, outcome);
}

GraphView NetworkService::graph(const Scope& scope, const GraphQuery& query) {
    GraphView view;
    for (int attempt = 1;; ++attempt) {
        const std::uint64_t generation = cache_.generation(scope, CacheTier::SNAPSHOT);
        view = compose_view(scope, query);
        if (cache_.generation(scope, CacheTier::SNAPSHOT) == generation || attempt >= kMaxViewAttempts) {
            return view;
        }
        NETMAP_LOG_DEBUG("scope changed while composing graph view; retrying", {
            log::StringField("scope", scope),
            log::IntField("attempt", attempt)});
    }
}

GraphView NetworkService::compose_view(const Scope& scope, const GraphQuery& query) {
    GraphView view;
    view.scope = scope;

    auto start = SteadyClock::now();
    CacheOutcome snapshot_outcome = CacheOutcome::MISS;
    SnapshotPtr snap = snapshot(scope, &snapshot_outcome);
    view.cache_outcomes[CacheTier::SNAPSHOT] = snapshot_outcome;
    view.timings_ms["snapshot"] = elapsed_ms(start);

    const std::string algorithm = query.layout_algorithm.empty() ? config_.layout.algorithm
                                                                 : query.layout_algorithm;
    const unsigned int seed = query.seed.value_or(config_.layout.seed);
    std::string layout_key;

    // Layout and cluster computes load their own snapshot, never `snap`
    if (query.include_positions) {
        if (snap->num_nodes() > config_.layout.skip_threshold) {
            view.layout_skipped = true;
            view.layout_skip_reason = GraphTooLarge("layout", snap->num_nodes(),
                                                    config_.layout.skip_threshold).what();
            NETMAP_LOG_INFO("layout skipped", {
                log::StringField("scope", scope),
                log::IntField("nodes", static_cast<std::int64_t>(snap->num_nodes()))});
        } else {
            start = SteadyClock::now();
            layout_key = CacheLayer::layout_variant(algorithm, seed);
            CacheOutcome layout_outcome = CacheOutcome::MISS;
            try {
                view.layout = cache_.get_layout(scope, layout_key, [this, &scope, &algorithm, seed](const Budget& budget) {
                    SnapshotPtr current = snapshot(scope);
                    if (current->num_nodes() > config_.layout.skip_threshold) {
                        throw GraphTooLarge("layout", current->num_nodes(), config_.layout.skip_threshold);
                    }
                    return std::make_shared<const LayoutResult>(
                        layout_engine_.compute(*current, algorithm, 0, seed, budget));
                }, &layout_outcome);
                view.cache_outcomes[CacheTier::LAYOUT] = layout_outcome;
            } catch (const GraphTooLarge& e) {
                view.layout_skipped = true;
                view.layout_skip_reason = e.what();
                layout_key.clear();
                NETMAP_LOG_WARN("layout omitted", {
                    log::StringField("scope", scope),
                    log::StringField("reason", e.what())});
            }
            view.timings_ms["layout"] = elapsed_ms(start);
        }
    }

    if (query.include_clusters) {
        start = SteadyClock::now();
        size_t min_size = query.min_cluster_size > 0 ? query.min_cluster_size : config_.cluster.min_size;
        LayoutPtr layout = view.layout;
        CacheOutcome cluster_outcome = CacheOutcome::MISS;
        view.clusters = cache_.get_clusters(scope, CacheLayer::cluster_variant(min_size, layout_key),
            [this, &scope, layout, min_size](const Budget& budget) {
                SnapshotPtr current = snapshot(scope);
                return std::make_shared<const ClusterResult>(
                    cluster_engine_.detect(*current, min_size, layout.get(), budget));
            }, &cluster_outcome);
        view.cache_outcomes[CacheTier::CLUSTER] = cluster_outcome;
        view.timings_ms["clusters"] = elapsed_ms(start);
    }

    view.nodes.reserve(snap->num_nodes());
    for (const auto& entity : snap->entities()) {
        ViewNode node;
        node.id = entity.id;
        node.label = entity.name.empty() ? entity.id : entity.name;
        node.type = entity.type;
        if (view.layout) {
            node.position = view.layout->position_of(entity.id);
        }
        if (view.clusters) {
            auto it = view.clusters->assignment.find(entity.id);
            if (it != view.clusters->assignment.end()) node.cluster_id = it->second;
        }
        view.nodes.push_back(std::move(node));
    }

    view.edges.reserve(snap->num_edges());
    for (const auto& rel : snap->relationships()) {
        view.edges.push_back({rel.source, rel.target, rel.type, rel.weight, rel.confidence});
    }
    return view;
}

CentralityResult NetworkService::centrality(const Scope& scope, CentralityMetric metric, size_t limit) {
    SnapshotPtr snap = snapshot(scope);
    return centrality_engine_.compute(metric, *snap, limit, request_budget());
}

std::optional<PathResult> NetworkService::shortest_path(const Scope& scope,
                                                        const EntityId& source,
                                                        const EntityId& target,
                                                        int max_depth) {
    SnapshotPtr snap = snapshot(scope);
    return path_finder_.shortest_path(*snap, source, target, max_depth);
}

std::vector<PathResult> NetworkService::all_paths(const Scope& scope,
                                                  const EntityId& source,
                                                  const EntityId& target,
                                                  int max_depth,
                                                  size_t max_paths) {
    SnapshotPtr snap = snapshot(scope);
    PathEnumerator paths = path_finder_.all_paths(*snap, source, target, max_depth, max_paths);
    return paths.collect();
}

nlohmann::json NetworkService::neighborhood(const Scope& scope, const EntityId& entity, int depth) {
    SnapshotPtr snap = snapshot(scope);
    return path_finder_.neighborhood(*snap, entity, depth).to_json(*snap);
}

std::vector<Relationship> NetworkService::timeline(const Scope& scope, const EntityId& entity) {
    SnapshotPtr snap = snapshot(scope);
    size_t index = snap->require_index(entity);

    std::vector<Relationship> out;
    for (size_t r : snap->incident_relationships(index)) {
        out.push_back(snap->relationships()[r]);
    }
    std::sort(out.begin(), out.end(), [](const Relationship& a, const Relationship& b) {
        if (a.first_observed != b.first_observed) return a.first_observed < b.first_observed;
        return a.key() < b.key();
    });
    return out;
}

GraphStatistics NetworkService::stats(const Scope& scope) {
    return snapshot(scope)->compute_statistics();
}

SubsetResult NetworkService::subset(const Scope& scope, const SubsetQuery& query) {
    if (query.sort_by != "degree" && query.sort_by != "centrality" && query.sort_by != "recent") {
        throw InvalidArgument("Unknown sort order: " + query.sort_by);
    }

    SnapshotPtr snap = snapshot(scope);
    std::set<EntityType> types(query.types.begin(), query.types.end());

    std::vector<double> importance;
    if (query.sort_by == "centrality") {
        importance.assign(snap->num_nodes(), 0.0);
        for (const auto& s : centrality_engine_.importance(*snap, 0, request_budget()).scores) {
            importance[snap->require_index(s.id)] = s.score;
        }
    }

    std::vector<SubsetEntry> matches;
    for (size_t i = 0; i < snap->num_nodes(); ++i) {
        const Entity& e = snap->entity(i);
        if (!types.empty() && !types.count(e.type)) continue;
        if (!query.name_prefix.empty() && !starts_with_ci(e.name, query.name_prefix)) continue;

        SubsetEntry entry{e.id, e.name, e.type, 0.0};
        if (query.sort_by == "degree") {
            entry.score = static_cast<double>(snap->degree(i));
        } else if (query.sort_by == "centrality") {
            entry.score = importance[i];
        } else {
            entry.score = static_cast<double>(to_epoch_seconds(e.last_seen));
        }
        matches.push_back(std::move(entry));
    }

    // Entities are already in id order; stable sort keeps it for ties
    std::stable_sort(matches.begin(), matches.end(), [](const SubsetEntry& a, const SubsetEntry& b) {
        return a.score > b.score;
    });

    SubsetResult result;
    result.total_matching = matches.size();
    if (query.offset < matches.size()) {
        auto first = matches.begin() + static_cast<std::ptrdiff_t>(query.offset);
        size_t remaining = matches.size() - query.offset;
        size_t take = query.limit == 0 ? remaining : std::min(query.limit, remaining);
        result.entities.assign(first, first + static_cast<std::ptrdiff_t>(take));
    }
    return result;
}

RelationshipStats NetworkService::relationship_stats(const Scope& scope) {
    return discovery_.relationship_stats(scope);
}

CacheStatus NetworkService::cache_status(const Scope& scope) const {
    return cache_.status(scope);
}

// ---- mutations ----

StoreResult NetworkService::add_relationship(const Scope& scope, const Relationship& rel) {
    if (!store_->get_entity(scope, rel.source)) throw EntityNotFound(rel.source);
    if (!store_->get_entity(scope, rel.target)) throw EntityNotFound(rel.target);

    Relationship record = rel;
    if (auto existing = store_->get_relationship(scope, rel.key())) {
        record = *existing;
        record.observe(rel);
    }

    StoreResult result = store_->put_relationship(scope, record);
    if (result) {
        invalidate(scope);
    } else {
        NETMAP_LOG_ERROR("relationship write failed", {
            log::StringField("scope", scope),
            log::StringField("key", rel.key().to_string()),
            log::StringField("code", store_error_code_to_string(result.code))});
    }
    return result;
}

StoreResult NetworkService::upsert_entity(const Scope& scope, const Entity& entity) {
    StoreResult result = store_->upsert_entity(scope, entity);
    if (result) {
        invalidate(scope);
    }
    return result;
}

StoreResult NetworkService::delete_entity(const Scope& scope, const EntityId& id) {
    StoreResult result = store_->delete_entity(scope, id);
    if (result) {
        invalidate(scope);
    }
    return result;
}

MutationReport NetworkService::merge_entities(const Scope& scope, const EntityId& keep, const EntityId& remove) {
    if (keep == remove) {
        throw InvalidArgument("Cannot merge an entity into itself: " + keep);
    }
    auto kept = store_->get_entity(scope, keep);
    if (!kept) throw EntityNotFound(keep);
    auto removed = store_->get_entity(scope, remove);
    if (!removed) throw EntityNotFound(remove);

    MutationReport report;
    auto fail = [&report](const StoreResult& r) {
        report.failed++;
        report.complete = false;
        report.error = store_error_code_to_string(r.code) + ": " + r.message;
    };

    for (const auto& rel : store_->load_relationships(scope)) {
        if (rel.source != remove && rel.target != remove) continue;

        Relationship moved = rel;
        if (moved.source == remove) moved.source = keep;
        if (moved.target == remove) moved.target = keep;
        if (moved.source == moved.target && rel.source != rel.target) {
            continue;   // edge between the two merged entities
        }

        Relationship record = moved;
        if (auto existing = store_->get_relationship(scope, moved.key())) {
            record = *existing;
            record.observe(moved);
        }
        StoreResult r = store_->put_relationship(scope, record);
        if (!r) {
            fail(r);
            break;
        }
        report.committed++;
    }

    if (report.complete) {
        Entity merged = *kept;
        EntityMetadata metadata = removed->metadata;
        metadata.merge_from(kept->metadata);
        merged.metadata = metadata;

        std::set<std::string> aliases(merged.aliases.begin(), merged.aliases.end());
        for (const auto& name : removed->aliases) aliases.insert(name);
        if (!removed->name.empty() && removed->name != merged.name) aliases.insert(removed->name);
        aliases.erase(merged.name);
        merged.aliases.assign(aliases.begin(), aliases.end());

        if (merged.first_seen == TimePoint{} ||
            (removed->first_seen != TimePoint{} && removed->first_seen < merged.first_seen)) {
            merged.first_seen = removed->first_seen;
        }
        merged.last_seen = std::max(merged.last_seen, removed->last_seen);

        StoreResult r = store_->upsert_entity(scope, merged);
        if (r) {
            report.committed++;
            r = store_->delete_entity(scope, remove);
            if (r) {
                report.committed++;
            } else {
                fail(r);
            }
        } else {
            fail(r);
        }
    }

    if (report.committed > 0) {
        invalidate(scope);
    }

    if (report.complete) {
        NETMAP_LOG_INFO("entities merged", {
            log::StringField("scope", scope),
            log::StringField("keep", keep),
            log::StringField("removed", remove)});
    } else {
        NETMAP_LOG_ERROR("entity merge stopped on store failure", {
            log::StringField("scope", scope),
            log::IntField("committed", static_cast<std::int64_t>(report.committed)),
            log::StringField("error", report.error)});
    }
    return report;
}

MutationReport NetworkService::import_records(const Scope& scope,
                                              const std::vector<Entity>& entities,
                                              const std::vector<Relationship>& relationships,
                                              const std::vector<ContentItem>& items) {
    MutationReport report;
    auto apply = [&report](const StoreResult& r) {
        if (r) {
            report.committed++;
            return true;
        }
        report.failed++;
        report.complete = false;
        report.error = store_error_code_to_string(r.code) + ": " + r.message;
        return false;
    };

    bool ok = true;
    for (const auto& e : entities) {
        if (!(ok = apply(store_->upsert_entity(scope, e)))) break;
    }
    if (ok) {
        for (const auto& rel : relationships) {
            Relationship record = rel;
            if (auto existing = store_->get_relationship(scope, rel.key())) {
                record = *existing;
                record.observe(rel);
            }
            if (!(ok = apply(store_->put_relationship(scope, record)))) break;
        }
    }
    if (ok) {
        for (const auto& item : items) {
            if (!(ok = apply(store_->add_content_item(scope, item)))) break;
        }
    }

    if (report.committed > 0) {
        invalidate(scope);
    }
    NETMAP_LOG_INFO("import finished", {
        log::StringField("scope", scope),
        log::IntField("committed", static_cast<std::int64_t>(report.committed)),
        log::BoolField("complete", report.complete)});
    return report;
}

DiscoveryReport NetworkService::run_discovery(const Scope& scope) {
    DiscoveryReport report = discovery_.discover(scope);
    if (!report.committed.empty()) {
        invalidate(scope);
    }
    return report;
}

DiscoveryReport NetworkService::run_discovery(const Scope& scope,
                                              const std::vector<ContentItem>& items,
                                              int min_co_occurrences,
                                              Duration time_window) {
    DiscoveryReport report = discovery_.discover(scope, items, min_co_occurrences, time_window);
    if (!report.committed.empty()) {
        invalidate(scope);
    }
    return report;
}

void NetworkService::invalidate(const Scope& scope) {
    cache_.invalidate(scope);
}

void NetworkService::invalidate_all() {
    cache_.invalidate_all();
    NETMAP_LOG_INFO("cache reset");
}

} // namespace netmap
