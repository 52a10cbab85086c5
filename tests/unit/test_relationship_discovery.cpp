#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "discovery/relationship_discovery.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"
#include "test_fixtures.hpp"

#include <filesystem>
#include <unistd.h>

using namespace netmap;
using namespace netmap::testing;

class RelationshipDiscoveryTest : public ::testing::Test {
protected:
    const TimePoint now = from_epoch_seconds(1700000000);
    std::shared_ptr<MemoryGraphStore> store = std::make_shared<MemoryGraphStore>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(now);
    DiscoveryConfig config;

    void SetUp() override {
        for (const char* id : {"alice", "bob", "carol", "dave"}) {
            ASSERT_TRUE(store->upsert_entity("s", make_entity(id)));
        }
    }

    RelationshipDiscovery make_discovery() {
        return RelationshipDiscovery(store, config, clock);
    }

    ContentItem item(const std::string& id, std::vector<EntityId> entities,
                     std::chrono::hours ago, const std::string& text = "") {
        return ContentItem{id, std::move(entities), text.empty() ? "news about " + id : text, now - ago};
    }
};

// ==========================================
// Scoring
// ==========================================

TEST_F(RelationshipDiscoveryTest, ScoreIsMonotoneAndCapped) {
    auto discovery = make_discovery();
    EXPECT_DOUBLE_EQ(discovery.score(2, 0.0), 0.6);
    EXPECT_GT(discovery.score(3, 0.0), discovery.score(2, 0.0));
    EXPECT_GT(discovery.score(2, 0.5), discovery.score(2, 0.0));
    EXPECT_DOUBLE_EQ(discovery.score(100, 1.0), 0.95);
}

// ==========================================
// Co-occurrence
// ==========================================

TEST_F(RelationshipDiscoveryTest, SingleItemBelowThreshold) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "bob"}, std::chrono::hours(1))};
    auto report = discovery.discover("s", items, 2, std::chrono::hours(24));
    EXPECT_EQ(report.candidates, 0);
    EXPECT_TRUE(report.committed.empty());
    EXPECT_TRUE(store->load_relationships("s").empty());
}

TEST_F(RelationshipDiscoveryTest, TwoItemsCreateOneEdge) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "bob"}, std::chrono::hours(1)),
                                      item("c2", {"bob", "alice"}, std::chrono::hours(2))};
    auto report = discovery.discover("s", items, 2, std::chrono::hours(24));

    EXPECT_TRUE(report.complete);
    EXPECT_EQ(report.created, 1);
    ASSERT_EQ(report.committed.size(), 1);

    auto rels = store->load_relationships("s");
    ASSERT_EQ(rels.size(), 1);
    EXPECT_EQ(rels[0].source, "alice");
    EXPECT_EQ(rels[0].target, "bob");
    EXPECT_EQ(rels[0].type, kAssociatedWith);
    EXPECT_EQ(rels[0].observation_count, 2);
    EXPECT_DOUBLE_EQ(rels[0].confidence, 0.6);
    EXPECT_EQ(rels[0].first_observed, now - std::chrono::hours(2));
    EXPECT_EQ(rels[0].last_observed, now - std::chrono::hours(1));
}

TEST_F(RelationshipDiscoveryTest, SecondRunChangesNothing) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "bob"}, std::chrono::hours(1)),
                                      item("c2", {"alice", "bob"}, std::chrono::hours(3))};
    auto first = discovery.discover("s", items, 2, std::chrono::hours(24));
    ASSERT_EQ(first.created, 1);
    auto before = store->load_relationships("s");

    auto second = discovery.discover("s", items, 2, std::chrono::hours(24));
    EXPECT_EQ(second.created, 0);
    EXPECT_EQ(second.updated, 0);
    EXPECT_EQ(second.skipped, 1);
    EXPECT_TRUE(second.committed.empty());

    auto after = store->load_relationships("s");
    ASSERT_EQ(after.size(), before.size());
    EXPECT_EQ(after[0].observation_count, before[0].observation_count);
    EXPECT_DOUBLE_EQ(after[0].confidence, before[0].confidence);
}

TEST(RelationshipDiscoverySqlite, RerunWithSubSecondTimesChangesNothing) {
    namespace fs = std::filesystem;
    std::string path = (fs::temp_directory_path() /
                        ("netmap_discovery_" + std::to_string(::getpid()) + ".db")).string();
    const TimePoint now = from_epoch_seconds(1700000000);
    {
        auto store = std::make_shared<SqliteGraphStore>(path);
        ASSERT_TRUE(store->upsert_entity("s", make_entity("alice")));
        ASSERT_TRUE(store->upsert_entity("s", make_entity("bob")));
        RelationshipDiscovery discovery(store, DiscoveryConfig{}, std::make_shared<ManualClock>(now));

        std::vector<ContentItem> items = {
            ContentItem{"c1", {"alice", "bob"}, "news", now - Duration(3500)},
            ContentItem{"c2", {"alice", "bob"}, "news", now - Duration(1500)}};

        auto first = discovery.discover("s", items, 2, std::chrono::hours(24));
        EXPECT_EQ(first.created, 1);

        for (int run = 0; run < 2; ++run) {
            auto again = discovery.discover("s", items, 2, std::chrono::hours(24));
            EXPECT_EQ(again.updated, 0) << "run " << run;
            EXPECT_EQ(again.skipped, 1) << "run " << run;
            EXPECT_TRUE(again.committed.empty()) << "run " << run;
        }

        auto rel = store->get_relationship("s", {"alice", "bob", kAssociatedWith});
        ASSERT_TRUE(rel.has_value());
        EXPECT_EQ(rel->first_observed, now - Duration(3500));
        EXPECT_EQ(rel->last_observed, now - Duration(1500));
    }
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(path + "-wal", ec);
    fs::remove(path + "-shm", ec);
}

TEST_F(RelationshipDiscoveryTest, NewEvidenceStrengthensEdge) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "bob"}, std::chrono::hours(5)),
                                      item("c2", {"alice", "bob"}, std::chrono::hours(4))};
    ASSERT_EQ(discovery.discover("s", items, 2, std::chrono::hours(1)).created, 1);

    items.push_back(item("c3", {"alice", "bob"}, std::chrono::hours(1)));
    auto report = discovery.discover("s", items, 2, std::chrono::hours(1));
    EXPECT_EQ(report.updated, 1);

    auto rel = store->get_relationship("s", {"alice", "bob", kAssociatedWith});
    ASSERT_TRUE(rel.has_value());
    EXPECT_EQ(rel->observation_count, 3);
    EXPECT_NEAR(rel->confidence, 0.65, 1e-12);
    EXPECT_EQ(rel->last_observed, now - std::chrono::hours(1));
}

TEST_F(RelationshipDiscoveryTest, CrossItemWithinWindow) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice"}, std::chrono::hours(3)),
                                      item("c2", {"bob"}, std::chrono::hours(2)),
                                      item("c3", {"alice"}, std::chrono::hours(1))};

    auto near = discovery.find_candidates(items, 2, std::chrono::hours(6));
    ASSERT_EQ(near.size(), 1);
    EXPECT_EQ(near[0].key.source, "alice");
    EXPECT_EQ(near[0].key.target, "bob");
    EXPECT_EQ(near[0].co_occurrences, 2);

    EXPECT_TRUE(discovery.find_candidates(items, 2, Duration(0)).empty());
    // c1 and c3 are too far from c2 for a 30 minute window
    EXPECT_TRUE(discovery.find_candidates(items, 1, std::chrono::minutes(30)).empty());
}

TEST_F(RelationshipDiscoveryTest, OldItemsIgnored) {
    config.lookback_days = 7;
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "bob"}, std::chrono::hours(24 * 10)),
                                      item("c2", {"alice", "bob"}, std::chrono::hours(1))};
    EXPECT_TRUE(discovery.find_candidates(items, 2, Duration(0)).empty());
    EXPECT_EQ(discovery.find_candidates(items, 1, Duration(0)).size(), 1);
}

TEST_F(RelationshipDiscoveryTest, KeywordsChooseType) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {
        item("c1", {"alice", "carol"}, std::chrono::hours(2), "Alice funds Carol's new lab."),
        item("c2", {"carol", "alice"}, std::chrono::hours(1), "Carol said Alice funds the project again.")};
    auto candidates = discovery.find_candidates(items, 2, std::chrono::hours(24));
    ASSERT_EQ(candidates.size(), 1);
    EXPECT_EQ(candidates[0].key.type, "funds");
    EXPECT_DOUBLE_EQ(candidates[0].keyword_strength, 1.0);
    EXPECT_DOUBLE_EQ(candidates[0].confidence, 0.7);
}

TEST_F(RelationshipDiscoveryTest, UnknownEntitiesSkipped) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "ghost"}, std::chrono::hours(1)),
                                      item("c2", {"alice", "ghost"}, std::chrono::hours(2))};
    auto report = discovery.discover("s", items, 2, std::chrono::hours(24));
    EXPECT_EQ(report.candidates, 1);
    EXPECT_EQ(report.skipped, 1);
    EXPECT_TRUE(report.complete);
    EXPECT_TRUE(store->load_relationships("s").empty());
}

// ==========================================
// Failure handling
// ==========================================

TEST_F(RelationshipDiscoveryTest, WriteFailureStopsRun) {
    auto discovery = make_discovery();
    std::vector<ContentItem> items = {item("c1", {"alice", "bob", "carol"}, std::chrono::hours(1)),
                                      item("c2", {"alice", "bob", "carol"}, std::chrono::hours(2))};
    store->fail_writes_after(1);
    auto report = discovery.discover("s", items, 2, std::chrono::hours(24));

    EXPECT_EQ(report.candidates, 3);
    EXPECT_FALSE(report.complete);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.created, 1);
    ASSERT_EQ(report.committed.size(), 1);
    EXPECT_FALSE(report.error.empty());

    store->fail_writes_after(-1);
    auto rels = store->load_relationships("s");
    ASSERT_EQ(rels.size(), 1);
    EXPECT_EQ(rels[0].key(), report.committed[0]);
}

TEST_F(RelationshipDiscoveryTest, UnavailableStoreThrowsFromScopedRun) {
    auto discovery = make_discovery();
    store->set_unavailable(true);
    EXPECT_THROW(discovery.discover("s"), StoreUnavailable);
}

TEST_F(RelationshipDiscoveryTest, ScopedRunReadsStoredItems) {
    ASSERT_TRUE(store->add_content_item("s", item("c1", {"bob", "dave"}, std::chrono::hours(1))));
    ASSERT_TRUE(store->add_content_item("s", item("c2", {"bob", "dave"}, std::chrono::hours(2))));
    auto discovery = make_discovery();
    auto report = discovery.discover("s");
    EXPECT_EQ(report.created, 1);
    EXPECT_TRUE(store->get_relationship("s", {"bob", "dave", kAssociatedWith}).has_value());
}

// ==========================================
// Stats
// ==========================================

TEST_F(RelationshipDiscoveryTest, RelationshipStats) {
    auto recent = make_rel("alice", "bob", "funds", 0.8);
    recent.last_observed = now - std::chrono::hours(24);
    auto stale = make_rel("carol", "dave", "leads", 0.4);
    stale.last_observed = now - std::chrono::hours(24 * 20);
    ASSERT_TRUE(store->put_relationship("s", recent));
    ASSERT_TRUE(store->put_relationship("s", stale));

    auto stats = make_discovery().relationship_stats("s");
    EXPECT_EQ(stats.total, 2);
    EXPECT_EQ(stats.by_type.at("funds"), 1);
    EXPECT_EQ(stats.observed_last_7_days, 1);
    EXPECT_NEAR(stats.average_confidence, 0.6, 1e-12);
}
