#pragma once

#include "cluster/cluster_engine.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "graph/graph_snapshot.hpp"
#include "layout/layout_engine.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace netmap {

enum class CacheTier {
    SNAPSHOT,
    LAYOUT,
    CLUSTER
};

std::string cache_tier_to_string(CacheTier tier);

enum class CacheOutcome {
    HIT,
    MISS,           ///< No entry; computed
    STALE,          ///< Entry expired or invalidated; recomputed
    COALESCED       ///< Waited on another caller's computation
};

std::string cache_outcome_to_string(CacheOutcome outcome);

using LayoutPtr = std::shared_ptr<const LayoutResult>;
using ClusterPtr = std::shared_ptr<const ClusterResult>;

struct TierStatus {
    CacheTier tier = CacheTier::SNAPSHOT;
    size_t entries = 0;
    std::optional<double> newest_age_seconds;
    int ttl_seconds = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t stale = 0;
    size_t coalesced = 0;
    std::optional<CacheOutcome> last_outcome;
    bool in_flight = false;
    std::uint64_t generation = 0;

    nlohmann::json to_json() const;
};

struct CacheStatus {
    Scope scope;
    std::vector<TierStatus> tiers;

    const TierStatus& tier(CacheTier t) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Time-bounded memo of derived graph artifacts, keyed by scope
 *
 * Three tiers (snapshot, layout, cluster) with independent TTLs. A cached
 * value is served only while `now - loaded_at <= ttl` and while its
 * generation equals the current generation of (scope, tier). Invalidation
 * bumps the generation, so a computation that started before it is never
 * stored; callers that were waiting on it retry.
 *
 * Concurrent misses on one key are coalesced: one caller computes outside
 * the lock, the others wait on its shared_future and receive its value or
 * exception. A failed computation leaves the slot empty.
 *
 * Construct one per process and pass it to request handlers.
 */
class CacheLayer {
public:
    template <typename V>
    using Compute = std::function<std::shared_ptr<const V>(const Budget&)>;

    CacheLayer(CacheConfig config, std::shared_ptr<Clock> clock);

    CacheLayer(const CacheLayer&) = delete;
    CacheLayer& operator=(const CacheLayer&) = delete;

    SnapshotPtr get_snapshot(const Scope& scope,
                             const Compute<GraphSnapshot>& load,
                             CacheOutcome* outcome = nullptr);

    /**
     * @param variant Encodes the parameters (algorithm, seed, ...)
     */
    LayoutPtr get_layout(const Scope& scope,
                         const std::string& variant,
                         const Compute<LayoutResult>& compute,
                         CacheOutcome* outcome = nullptr);

    ClusterPtr get_clusters(const Scope& scope,
                            const std::string& variant,
                            const Compute<ClusterResult>& compute,
                            CacheOutcome* outcome = nullptr);

    /**
     * @brief Invalidate every tier of a scope; synchronous
     */
    void invalidate(const Scope& scope);

    /**
     * @brief Invalidate one tier of a scope
     */
    void invalidate(const Scope& scope, CacheTier tier);

    void invalidate_all();

    CacheStatus status(const Scope& scope) const;

    std::uint64_t generation(const Scope& scope, CacheTier tier) const;

    const CacheConfig& config() const { return config_; }

    static std::string layout_variant(const std::string& algorithm, unsigned int seed);
    static std::string cluster_variant(size_t min_size, const std::string& layout_variant);

private:
    struct Key {
        Scope scope;
        std::string variant;

        bool operator<(const Key& other) const {
            return std::tie(scope, variant) < std::tie(other.scope, other.variant);
        }
    };

    struct Counters {
        size_t hits = 0;
        size_t misses = 0;
        size_t stale = 0;
        size_t coalesced = 0;
        std::optional<CacheOutcome> last_outcome;
    };

    template <typename V>
    struct Entry {
        std::shared_ptr<const V> value;
        TimePoint loaded_at;
        std::uint64_t generation;
    };

    template <typename V>
    struct InFlight {
        std::shared_future<std::shared_ptr<const V>> future;
        std::uint64_t generation;
    };

    template <typename V>
    struct Tier {
        CacheTier kind;
        std::map<Key, Entry<V>> entries;
        std::map<Key, InFlight<V>> in_flight;
        std::map<Scope, Counters> counters;

        explicit Tier(CacheTier k) : kind(k) {}
    };

    CacheConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<Scope, std::map<CacheTier, std::uint64_t>> generations_;
    Tier<GraphSnapshot> snapshots_{CacheTier::SNAPSHOT};
    Tier<LayoutResult> layouts_{CacheTier::LAYOUT};
    Tier<ClusterResult> clusters_{CacheTier::CLUSTER};

    Duration ttl_of(CacheTier tier) const;

    // Callers hold mutex_
    std::uint64_t& generation_locked(const Scope& scope, CacheTier tier);

    template <typename V>
    std::shared_ptr<const V> get_or_compute(Tier<V>& tier, const Key& key,
                                            const Compute<V>& compute,
                                            CacheOutcome* outcome);

    template <typename V>
    void drop_scope_locked(Tier<V>& tier, const Scope& scope);

    template <typename V>
    TierStatus status_locked(const Tier<V>& tier, const Scope& scope) const;
};

} // namespace netmap
