#include "cache/cache_layer.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <exception>

namespace netmap {

namespace {

// Bound on recompute rounds when invalidations keep racing a computation
constexpr int kMaxAttempts = 3;

} // namespace

std::string cache_tier_to_string(CacheTier tier) {
    switch (tier) {
        case CacheTier::SNAPSHOT: return "snapshot";
        case CacheTier::LAYOUT: return "layout";
        case CacheTier::CLUSTER: return "cluster";
        default: return "unknown";
    }
}

std::string cache_outcome_to_string(CacheOutcome outcome) {
    switch (outcome) {
        case CacheOutcome::HIT: return "hit";
        case CacheOutcome::MISS: return "miss";
        case CacheOutcome::STALE: return "stale";
        case CacheOutcome::COALESCED: return "coalesced";
        default: return "unknown";
    }
}

nlohmann::json TierStatus::to_json() const {
    nlohmann::json j;
    j["tier"] = cache_tier_to_string(tier);
    j["entries"] = entries;
    j["newest_age_seconds"] = newest_age_seconds ? nlohmann::json(*newest_age_seconds) : nlohmann::json(nullptr);
    j["ttl_seconds"] = ttl_seconds;
    j["hits"] = hits;
    j["misses"] = misses;
    j["stale"] = stale;
    j["coalesced"] = coalesced;
    j["last_outcome"] = last_outcome ? nlohmann::json(cache_outcome_to_string(*last_outcome)) : nlohmann::json(nullptr);
    j["in_flight"] = in_flight;
    j["generation"] = generation;
    return j;
}

const TierStatus& CacheStatus::tier(CacheTier t) const {
    for (const auto& s : tiers) {
        if (s.tier == t) return s;
    }
    throw InvalidArgument("No status for tier " + cache_tier_to_string(t));
}

nlohmann::json CacheStatus::to_json() const {
    nlohmann::json j;
    j["scope"] = scope;
    nlohmann::json list = nlohmann::json::object();
    for (const auto& t : tiers) {
        list[cache_tier_to_string(t.tier)] = t.to_json();
    }
    j["tiers"] = list;
    return j;
}

// ==========================================
// CacheLayer
// ==========================================

CacheLayer::CacheLayer(CacheConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = default_clock();
    }
}

std::string CacheLayer::layout_variant(const std::string& algorithm, unsigned int seed) {
    return algorithm + ":seed=" + std::to_string(seed);
}

std::string CacheLayer::cluster_variant(size_t min_size, const std::string& layout_variant) {
    return "min=" + std::to_string(min_size) + "|" + (layout_variant.empty() ? "nolayout" : layout_variant);
}

Duration CacheLayer::ttl_of(CacheTier tier) const {
    switch (tier) {
        case CacheTier::LAYOUT: return std::chrono::seconds(config_.layout_ttl_seconds);
        case CacheTier::CLUSTER: return std::chrono::seconds(config_.cluster_ttl_seconds);
        case CacheTier::SNAPSHOT:
        default: return std::chrono::seconds(config_.snapshot_ttl_seconds);
    }
}

std::uint64_t& CacheLayer::generation_locked(const Scope& scope, CacheTier tier) {
    return generations_[scope][tier];
}

std::uint64_t CacheLayer::generation(const Scope& scope, CacheTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(scope);
    if (it == generations_.end()) return 0;
    auto g = it->second.find(tier);
    return g == it->second.end() ? 0 : g->second;
}

template <typename V>
std::shared_ptr<const V> CacheLayer::get_or_compute(Tier<V>& tier, const Key& key,
                                                    const Compute<V>& compute,
                                                    CacheOutcome* outcome) {
    using Ptr = std::shared_ptr<const V>;
    const Duration ttl = ttl_of(tier.kind);
    Ptr last_value;

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        std::promise<Ptr> promise;
        std::shared_future<Ptr> waiting;
        std::uint64_t generation = 0;
        bool owner = false;

        // Phase 1: lookup and claim under lock
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation = generation_locked(key.scope, tier.kind);
            auto& counters = tier.counters[key.scope];
            const TimePoint now = clock_->now();

            bool had_entry = false;
            auto it = tier.entries.find(key);
            if (it != tier.entries.end()) {
                if (it->second.generation == generation && now - it->second.loaded_at <= ttl) {
                    counters.hits++;
                    counters.last_outcome = CacheOutcome::HIT;
                    if (outcome) *outcome = CacheOutcome::HIT;
                    return it->second.value;
                }
                had_entry = true;
                tier.entries.erase(it);
            }

            auto fl = tier.in_flight.find(key);
            if (fl != tier.in_flight.end() && fl->second.generation == generation) {
                waiting = fl->second.future;
                counters.coalesced++;
                counters.last_outcome = CacheOutcome::COALESCED;
                if (outcome) *outcome = CacheOutcome::COALESCED;
            } else {
                owner = true;
                waiting = promise.get_future().share();
                tier.in_flight[key] = InFlight<V>{waiting, generation};
                CacheOutcome result = had_entry ? CacheOutcome::STALE : CacheOutcome::MISS;
                if (had_entry) {
                    counters.stale++;
                } else {
                    counters.misses++;
                }
                counters.last_outcome = result;
                if (outcome) *outcome = result;
            }
        }

        if (!owner) {
            // Rethrows the owner's exception
            last_value = waiting.get();
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_locked(key.scope, tier.kind) == generation) {
                return last_value;
            }
            continue;
        }

        // Phase 2: compute without the lock
        try {
            last_value = compute(Budget::from_millis(config_.budget_ms));
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto fl = tier.in_flight.find(key);
                if (fl != tier.in_flight.end() && fl->second.generation == generation) {
                    tier.in_flight.erase(fl);
                }
            }
            promise.set_exception(std::current_exception());
            throw;
        }

        // Phase 3: store only if nothing was invalidated meanwhile
        bool stored = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto fl = tier.in_flight.find(key);
            if (fl != tier.in_flight.end() && fl->second.generation == generation) {
                tier.in_flight.erase(fl);
            }
            if (generation_locked(key.scope, tier.kind) == generation) {
                tier.entries[key] = Entry<V>{last_value, clock_->now(), generation};
                stored = true;
            }
        }
        promise.set_value(last_value);

        if (stored) {
            return last_value;
        }
        NETMAP_LOG_DEBUG("discarded result computed before invalidation", {
            log::StringField("scope", key.scope),
            log::StringField("tier", cache_tier_to_string(tier.kind)),
            log::StringField("variant", key.variant)});
    }

    NETMAP_LOG_WARN("cache recompute raced invalidation repeatedly; serving latest result", {
        log::StringField("scope", key.scope),
        log::StringField("tier", cache_tier_to_string(tier.kind))});
    return last_value;
}

SnapshotPtr CacheLayer::get_snapshot(const Scope& scope,
                                     const Compute<GraphSnapshot>& load,
                                     CacheOutcome* outcome) {
    return get_or_compute(snapshots_, Key{scope, ""}, load, outcome);
}

LayoutPtr CacheLayer::get_layout(const Scope& scope,
                                 const std::string& variant,
                                 const Compute<LayoutResult>& compute,
                                 CacheOutcome* outcome) {
    return get_or_compute(layouts_, Key{scope, variant}, compute, outcome);
}

ClusterPtr CacheLayer::get_clusters(const Scope& scope,
                                    const std::string& variant,
                                    const Compute<ClusterResult>& compute,
                                    CacheOutcome* outcome) {
    return get_or_compute(clusters_, Key{scope, variant}, compute, outcome);
}

template <typename V>
void CacheLayer::drop_scope_locked(Tier<V>& tier, const Scope& scope) {
    for (auto it = tier.entries.begin(); it != tier.entries.end();) {
        if (it->first.scope == scope) {
            it = tier.entries.erase(it);
        } else {
            ++it;
        }
    }
}

void CacheLayer::invalidate(const Scope& scope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (CacheTier t : {CacheTier::SNAPSHOT, CacheTier::LAYOUT, CacheTier::CLUSTER}) {
            generation_locked(scope, t)++;
        }
        drop_scope_locked(snapshots_, scope);
        drop_scope_locked(layouts_, scope);
        drop_scope_locked(clusters_, scope);
    }
    NETMAP_LOG_DEBUG("cache invalidated", {log::StringField("scope", scope)});
}

void CacheLayer::invalidate(const Scope& scope, CacheTier tier) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_locked(scope, tier)++;
        switch (tier) {
            case CacheTier::SNAPSHOT: drop_scope_locked(snapshots_, scope); break;
            case CacheTier::LAYOUT: drop_scope_locked(layouts_, scope); break;
            case CacheTier::CLUSTER: drop_scope_locked(clusters_, scope); break;
        }
    }
    NETMAP_LOG_DEBUG("cache tier invalidated", {
        log::StringField("scope", scope),
        log::StringField("tier", cache_tier_to_string(tier))});
}

void CacheLayer::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [scope, tiers] : generations_) {
        for (CacheTier t : {CacheTier::SNAPSHOT, CacheTier::LAYOUT, CacheTier::CLUSTER}) {
            tiers[t]++;
        }
    }
    snapshots_.entries.clear();
    layouts_.entries.clear();
    clusters_.entries.clear();
}

template <typename V>
TierStatus CacheLayer::status_locked(const Tier<V>& tier, const Scope& scope) const {
    TierStatus s;
    s.tier = tier.kind;
    s.ttl_seconds = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(ttl_of(tier.kind)).count());

    auto gens = generations_.find(scope);
    if (gens != generations_.end()) {
        auto g = gens->second.find(tier.kind);
        if (g != gens->second.end()) s.generation = g->second;
    }

    const TimePoint now = clock_->now();
    for (const auto& [key, entry] : tier.entries) {
        if (key.scope != scope || entry.generation != s.generation) continue;
        s.entries++;
        double age = std::chrono::duration<double>(now - entry.loaded_at).count();
        if (!s.newest_age_seconds || age < *s.newest_age_seconds) {
            s.newest_age_seconds = age;
        }
    }
    for (const auto& [key, flight] : tier.in_flight) {
        if (key.scope == scope) s.in_flight = true;
    }

    auto c = tier.counters.find(scope);
    if (c != tier.counters.end()) {
        s.hits = c->second.hits;
        s.misses = c->second.misses;
        s.stale = c->second.stale;
        s.coalesced = c->second.coalesced;
        s.last_outcome = c->second.last_outcome;
    }
    return s;
}

CacheStatus CacheLayer::status(const Scope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStatus status;
    status.scope = scope;
    status.tiers.push_back(status_locked(snapshots_, scope));
    status.tiers.push_back(status_locked(layouts_, scope));
    status.tiers.push_back(status_locked(clusters_, scope));
    return status;
}

} // namespace netmap
