#include <gtest/gtest.h>
#include "cache/cache_layer.hpp"
#include "core/errors.hpp"
#include "test_fixtures.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace netmap;
using namespace netmap::testing;

class CacheLayerTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    CacheConfig config;
    std::atomic<int> loads{0};

    void SetUp() override {
        config.snapshot_ttl_seconds = 60;
        config.layout_ttl_seconds = 60;
        config.cluster_ttl_seconds = 120;
    }

    CacheLayer::Compute<GraphSnapshot> counting_load() {
        return [this](const Budget&) {
            loads++;
            return make_snapshot({"a", "b"}, {{"a", "b"}});
        };
    }
};

// ==========================================
// TTL
// ==========================================

TEST_F(CacheLayerTest, HitWithinTtlStaleAfter) {
    CacheLayer cache(config, clock);
    CacheOutcome outcome;

    auto first = cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::MISS);
    EXPECT_EQ(loads.load(), 1);

    clock->advance(std::chrono::seconds(30));
    auto second = cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::HIT);
    EXPECT_EQ(loads.load(), 1);
    EXPECT_EQ(first.get(), second.get());

    clock->advance(std::chrono::seconds(31));
    auto third = cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::STALE);
    EXPECT_EQ(loads.load(), 2);
    EXPECT_NE(first.get(), third.get());
}

TEST_F(CacheLayerTest, ExactTtlStillServed) {
    CacheLayer cache(config, clock);
    cache.get_snapshot("s", counting_load());
    clock->advance(std::chrono::seconds(60));
    CacheOutcome outcome;
    cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::HIT);
}

TEST_F(CacheLayerTest, ZeroTtlAlwaysRecomputesAfterTimeMoves) {
    config.snapshot_ttl_seconds = 0;
    CacheLayer cache(config, clock);
    cache.get_snapshot("s", counting_load());
    clock->advance(Duration(1));
    cache.get_snapshot("s", counting_load());
    EXPECT_EQ(loads.load(), 2);
}

TEST_F(CacheLayerTest, VariantsAndScopesAreSeparate) {
    CacheLayer cache(config, clock);
    std::atomic<int> layouts{0};
    auto compute = [&layouts](const Budget&) {
        layouts++;
        return std::make_shared<const LayoutResult>();
    };

    cache.get_layout("s", CacheLayer::layout_variant("force", 1), compute);
    cache.get_layout("s", CacheLayer::layout_variant("force", 2), compute);
    cache.get_layout("t", CacheLayer::layout_variant("force", 1), compute);
    cache.get_layout("s", CacheLayer::layout_variant("force", 1), compute);
    EXPECT_EQ(layouts.load(), 3);
    EXPECT_EQ(cache.status("s").tier(CacheTier::LAYOUT).entries, 2);
}

TEST(CacheVariantNames, EncodeParameters) {
    EXPECT_EQ(CacheLayer::layout_variant("circular", 9), "circular:seed=9");
    EXPECT_EQ(CacheLayer::cluster_variant(3, ""), "min=3|nolayout");
    EXPECT_EQ(CacheLayer::cluster_variant(2, "force:seed=1"), "min=2|force:seed=1");
}

// ==========================================
// Invalidation
// ==========================================

TEST_F(CacheLayerTest, InvalidateForcesRecompute) {
    CacheLayer cache(config, clock);
    cache.get_snapshot("s", counting_load());
    cache.get_snapshot("other", counting_load());
    auto before = cache.generation("s", CacheTier::SNAPSHOT);

    cache.invalidate("s");
    EXPECT_GT(cache.generation("s", CacheTier::SNAPSHOT), before);
    EXPECT_EQ(cache.status("s").tier(CacheTier::SNAPSHOT).entries, 0);

    CacheOutcome outcome;
    cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_NE(outcome, CacheOutcome::HIT);
    cache.get_snapshot("other", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::HIT);
    EXPECT_EQ(loads.load(), 3);
}

TEST_F(CacheLayerTest, InvalidateSingleTier) {
    CacheLayer cache(config, clock);
    std::atomic<int> layouts{0};
    auto compute = [&layouts](const Budget&) {
        layouts++;
        return std::make_shared<const LayoutResult>();
    };
    cache.get_snapshot("s", counting_load());
    cache.get_layout("s", "v", compute);

    cache.invalidate("s", CacheTier::LAYOUT);
    CacheOutcome outcome;
    cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::HIT);
    cache.get_layout("s", "v", compute, &outcome);
    EXPECT_EQ(layouts.load(), 2);
}

TEST_F(CacheLayerTest, InvalidateAllBumpsEveryScope) {
    CacheLayer cache(config, clock);
    cache.get_snapshot("s", counting_load());
    cache.get_snapshot("other", counting_load());
    cache.get_layout("s", "v", [](const Budget&) { return std::make_shared<const LayoutResult>(); });
    auto s_before = cache.generation("s", CacheTier::SNAPSHOT);
    auto other_before = cache.generation("other", CacheTier::SNAPSHOT);
    auto layout_before = cache.generation("s", CacheTier::LAYOUT);

    cache.invalidate_all();
    EXPECT_GT(cache.generation("s", CacheTier::SNAPSHOT), s_before);
    EXPECT_GT(cache.generation("other", CacheTier::SNAPSHOT), other_before);
    EXPECT_GT(cache.generation("s", CacheTier::LAYOUT), layout_before);
    EXPECT_EQ(cache.status("s").tier(CacheTier::LAYOUT).entries, 0);

    CacheOutcome outcome;
    cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::MISS);
    cache.get_snapshot("other", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::MISS);
    EXPECT_EQ(loads.load(), 4);
}

TEST_F(CacheLayerTest, InvalidateAllDuringComputeIsNotStored) {
    CacheLayer cache(config, clock);
    int calls = 0;
    auto racing = [&](const Budget&) {
        if (calls == 0) cache.invalidate_all();
        return calls++ == 0 ? make_snapshot({"x"}, {}) : make_snapshot({"x", "y"}, {});
    };

    auto snap = cache.get_snapshot("s", racing);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(snap->num_nodes(), 2);
    EXPECT_EQ(cache.status("s").tier(CacheTier::SNAPSHOT).entries, 1);
    EXPECT_EQ(cache.get_snapshot("s", counting_load())->num_nodes(), 2);
    EXPECT_EQ(loads.load(), 0);
}

TEST_F(CacheLayerTest, InvalidationDuringComputeIsNotStored) {
    CacheLayer cache(config, clock);
    int calls = 0;
    auto racing = [&](const Budget&) {
        if (calls++ == 0) cache.invalidate("s");
        return make_snapshot({"x"}, {});
    };

    auto snap = cache.get_snapshot("s", racing);
    ASSERT_TRUE(snap);
    // First result was discarded and recomputed under the new generation
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(cache.status("s").tier(CacheTier::SNAPSHOT).entries, 1);
}

TEST_F(CacheLayerTest, PersistentRaceStillAnswers) {
    CacheLayer cache(config, clock);
    int calls = 0;
    auto always_racing = [&](const Budget&) {
        calls++;
        cache.invalidate("s");
        return make_snapshot({"x"}, {});
    };

    auto snap = cache.get_snapshot("s", always_racing);
    ASSERT_TRUE(snap);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(cache.status("s").tier(CacheTier::SNAPSHOT).entries, 0);
}

// ==========================================
// Failures and concurrency
// ==========================================

TEST_F(CacheLayerTest, NonPositiveBudgetNeverExpires) {
    config.budget_ms = 0;
    CacheLayer unbounded(config, clock);
    bool limited = true;
    unbounded.get_snapshot("s", [&](const Budget& budget) {
        limited = budget.limited();
        EXPECT_FALSE(budget.expired());
        return make_snapshot({"a"}, {});
    });
    EXPECT_FALSE(limited);

    config.budget_ms = 5000;
    CacheLayer bounded(config, clock);
    bounded.get_snapshot("s", [&](const Budget& budget) {
        limited = budget.limited();
        return make_snapshot({"a"}, {});
    });
    EXPECT_TRUE(limited);
}

TEST_F(CacheLayerTest, FailedComputeLeavesSlotEmpty) {
    CacheLayer cache(config, clock);
    auto failing = [](const Budget&) -> SnapshotPtr {
        throw StoreUnavailable("down");
    };
    EXPECT_THROW(cache.get_snapshot("s", failing), StoreUnavailable);

    auto status = cache.status("s").tier(CacheTier::SNAPSHOT);
    EXPECT_EQ(status.entries, 0);
    EXPECT_FALSE(status.in_flight);

    CacheOutcome outcome;
    cache.get_snapshot("s", counting_load(), &outcome);
    EXPECT_EQ(outcome, CacheOutcome::MISS);
    EXPECT_EQ(loads.load(), 1);
}

TEST_F(CacheLayerTest, ConcurrentMissesComputeOnce) {
    CacheLayer cache(config, clock);
    auto slow = [this](const Budget&) {
        loads++;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return make_snapshot({"a"}, {});
    };

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<SnapshotPtr> results(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] { results[i] = cache.get_snapshot("s", slow); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(loads.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r.get(), results[0].get());
    }
    auto status = cache.status("s").tier(CacheTier::SNAPSHOT);
    EXPECT_EQ(status.misses, 1);
    EXPECT_EQ(status.coalesced + status.hits, static_cast<size_t>(kThreads - 1));
}

TEST_F(CacheLayerTest, WaitersReceiveOwnersException) {
    CacheLayer cache(config, clock);
    auto slow_failure = [this](const Budget&) -> SnapshotPtr {
        loads++;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        throw std::runtime_error("load failed");
    };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            try {
                cache.get_snapshot("s", slow_failure);
            } catch (const std::runtime_error&) {
                failures++;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(failures.load(), 4);
    EXPECT_GE(loads.load(), 1);
}

// ==========================================
// Status
// ==========================================

TEST_F(CacheLayerTest, StatusReportsCountersAndAge) {
    CacheLayer cache(config, clock);
    cache.get_snapshot("s", counting_load());
    clock->advance(std::chrono::seconds(10));
    cache.get_snapshot("s", counting_load());

    auto status = cache.status("s");
    ASSERT_EQ(status.tiers.size(), 3);
    const auto& snap = status.tier(CacheTier::SNAPSHOT);
    EXPECT_EQ(snap.entries, 1);
    EXPECT_EQ(snap.hits, 1);
    EXPECT_EQ(snap.misses, 1);
    EXPECT_EQ(snap.ttl_seconds, 60);
    ASSERT_TRUE(snap.newest_age_seconds.has_value());
    EXPECT_DOUBLE_EQ(*snap.newest_age_seconds, 10.0);
    EXPECT_EQ(snap.last_outcome, std::optional<CacheOutcome>(CacheOutcome::HIT));

    EXPECT_EQ(status.tier(CacheTier::CLUSTER).ttl_seconds, 120);
    EXPECT_EQ(status.tier(CacheTier::LAYOUT).entries, 0);

    auto j = status.to_json();
    EXPECT_EQ(j["scope"], "s");
    EXPECT_EQ(j["tiers"]["snapshot"]["hits"], 1);
}
