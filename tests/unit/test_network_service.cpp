#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "service/network_service.hpp"
#include "store/memory_store.hpp"
#include "test_fixtures.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

using namespace netmap;
using namespace netmap::testing;

class NetworkServiceTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryGraphStore> store = std::make_shared<MemoryGraphStore>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(from_epoch_seconds(1700000000));
    EngineConfig config;
    std::unique_ptr<NetworkService> service;

    void SetUp() override {
        config.store.read_timeout_ms = 2000;
        config.cluster.min_size = 3;
    }

    NetworkService& make_service() {
        service = std::make_unique<NetworkService>(config, store, clock);
        return *service;
    }

    // Two four-cliques joined by a0-b0
    void seed_two_groups() {
        std::vector<Entity> entities;
        std::vector<Relationship> rels;
        for (const char* group : {"a", "b"}) {
            for (int k = 0; k < 4; ++k) {
                entities.push_back(make_entity(std::string(group) + std::to_string(k)));
            }
            for (int i = 0; i < 4; ++i) {
                for (int j = i + 1; j < 4; ++j) {
                    rels.push_back(make_rel(std::string(group) + std::to_string(i),
                                            std::string(group) + std::to_string(j)));
                }
            }
        }
        rels.push_back(make_rel("a0", "b0"));
        for (const auto& e : entities) ASSERT_TRUE(store->upsert_entity("s", e));
        for (const auto& r : rels) ASSERT_TRUE(store->put_relationship("s", r));
    }
};

// ==========================================
// Graph view
// ==========================================

TEST_F(NetworkServiceTest, GraphViewHasPositionsAndClusters) {
    seed_two_groups();
    auto& svc = make_service();
    auto view = svc.graph("s");

    ASSERT_EQ(view.nodes.size(), 8);
    EXPECT_EQ(view.edges.size(), 13);
    ASSERT_TRUE(view.layout);
    ASSERT_TRUE(view.clusters);
    EXPECT_FALSE(view.layout_skipped);
    for (const auto& node : view.nodes) {
        EXPECT_TRUE(node.position.has_value()) << node.id;
        EXPECT_FALSE(node.cluster_id.empty()) << node.id;
    }
    EXPECT_EQ(view.cache_outcomes.at(CacheTier::SNAPSHOT), CacheOutcome::MISS);
    EXPECT_EQ(view.cache_outcomes.at(CacheTier::LAYOUT), CacheOutcome::MISS);

    auto again = svc.graph("s");
    EXPECT_EQ(again.cache_outcomes.at(CacheTier::SNAPSHOT), CacheOutcome::HIT);
    EXPECT_EQ(again.cache_outcomes.at(CacheTier::LAYOUT), CacheOutcome::HIT);
    EXPECT_EQ(again.cache_outcomes.at(CacheTier::CLUSTER), CacheOutcome::HIT);
    EXPECT_EQ(again.layout.get(), view.layout.get());

    auto j = again.to_json();
    EXPECT_EQ(j["nodes"].size(), 8);
    EXPECT_TRUE(j["nodes"][0].contains("x"));
    EXPECT_EQ(j["cache"]["snapshot"], "hit");
}

TEST_F(NetworkServiceTest, LayoutSkippedAboveThreshold) {
    seed_two_groups();
    config.layout.skip_threshold = 5;
    auto& svc = make_service();
    auto view = svc.graph("s");

    EXPECT_TRUE(view.layout_skipped);
    EXPECT_FALSE(view.layout_skip_reason.empty());
    EXPECT_FALSE(view.layout);
    ASSERT_TRUE(view.clusters);
    for (const auto& node : view.nodes) {
        EXPECT_FALSE(node.position.has_value());
    }
    EXPECT_EQ(view.cache_outcomes.count(CacheTier::LAYOUT), 0);
}

TEST_F(NetworkServiceTest, OptionalSectionsCanBeOmitted) {
    seed_two_groups();
    auto& svc = make_service();
    GraphQuery query;
    query.include_positions = false;
    query.include_clusters = false;
    auto view = svc.graph("s", query);
    EXPECT_FALSE(view.layout);
    EXPECT_FALSE(view.clusters);
    EXPECT_FALSE(view.layout_skipped);
    EXPECT_EQ(view.nodes.size(), 8);
}

TEST_F(NetworkServiceTest, UnavailableStorePropagates) {
    seed_two_groups();
    auto& svc = make_service();
    store->set_unavailable(true);
    EXPECT_THROW(svc.graph("s"), StoreUnavailable);
    EXPECT_FALSE(svc.cache_status("s").tier(CacheTier::SNAPSHOT).in_flight);
}

// ==========================================
// Queries
// ==========================================

TEST_F(NetworkServiceTest, QueriesShareOneSnapshot) {
    seed_two_groups();
    auto& svc = make_service();

    auto path = svc.shortest_path("s", "a3", "b3");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<EntityId>{"a3", "a0", "b0", "b3"}));

    auto top = svc.centrality("s", CentralityMetric::BETWEENNESS, 2);
    ASSERT_EQ(top.scores.size(), 2);
    EXPECT_EQ(top.scores[0].id, "a0");
    EXPECT_EQ(top.scores[1].id, "b0");

    EXPECT_EQ(svc.stats("s").num_nodes, 8);
    EXPECT_EQ(svc.all_paths("s", "a1", "a2", 2, 0).size(), 3);
    EXPECT_EQ(svc.neighborhood("s", "b0", 1)["nodes"].size(), 5);

    auto snap = svc.cache_status("s").tier(CacheTier::SNAPSHOT);
    EXPECT_EQ(snap.misses, 1);
    EXPECT_GE(snap.hits, 4);
}

TEST_F(NetworkServiceTest, SubsetFiltersSortsAndPages) {
    ASSERT_TRUE(store->upsert_entity("s", make_entity("p1", EntityType::PERSON, "Maria Silva")));
    ASSERT_TRUE(store->upsert_entity("s", make_entity("p2", EntityType::PERSON, "Mario Costa")));
    ASSERT_TRUE(store->upsert_entity("s", make_entity("o1", EntityType::ORGANIZATION, "Mar Holdings")));
    ASSERT_TRUE(store->upsert_entity("s", make_entity("l1", EntityType::LOCATION, "Lisbon")));
    ASSERT_TRUE(store->put_relationship("s", make_rel("p2", "p1")));
    ASSERT_TRUE(store->put_relationship("s", make_rel("p2", "o1")));
    ASSERT_TRUE(store->put_relationship("s", make_rel("p2", "l1")));
    auto& svc = make_service();

    SubsetQuery query;
    auto all = svc.subset("s", query);
    EXPECT_EQ(all.total_matching, 4);
    EXPECT_EQ(all.entities.front().id, "p2");
    // Degree ties keep id order
    EXPECT_EQ(all.entities[1].id, "l1");

    query.name_prefix = "mar";
    EXPECT_EQ(svc.subset("s", query).total_matching, 3);

    query.types = {EntityType::PERSON};
    auto persons = svc.subset("s", query);
    EXPECT_EQ(persons.total_matching, 2);

    query.limit = 1;
    query.offset = 1;
    auto page = svc.subset("s", query);
    EXPECT_EQ(page.total_matching, 2);
    ASSERT_EQ(page.entities.size(), 1);
    EXPECT_EQ(page.entities[0].id, "p1");

    query.offset = 10;
    EXPECT_TRUE(svc.subset("s", query).entities.empty());

    query.sort_by = "alphabet";
    EXPECT_THROW(svc.subset("s", query), InvalidArgument);
}

TEST_F(NetworkServiceTest, TimelineOrdersByFirstObserved) {
    ASSERT_TRUE(store->upsert_entity("s", make_entity("x")));
    ASSERT_TRUE(store->upsert_entity("s", make_entity("y")));
    ASSERT_TRUE(store->upsert_entity("s", make_entity("z")));
    auto late = make_rel("x", "y", "funds");
    late.first_observed = from_epoch_seconds(300);
    auto early = make_rel("z", "x", "leads");
    early.first_observed = from_epoch_seconds(100);
    auto other = make_rel("y", "z");
    ASSERT_TRUE(store->put_relationship("s", late));
    ASSERT_TRUE(store->put_relationship("s", early));
    ASSERT_TRUE(store->put_relationship("s", other));
    auto& svc = make_service();

    auto events = svc.timeline("s", "x");
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, "leads");
    EXPECT_EQ(events[1].type, "funds");
    EXPECT_THROW(svc.timeline("s", "nobody"), EntityNotFound);
}

// ==========================================
// Mutations
// ==========================================

TEST_F(NetworkServiceTest, MutationInvalidatesCache) {
    seed_two_groups();
    auto& svc = make_service();
    ASSERT_EQ(svc.graph("s").edges.size(), 13);

    ASSERT_TRUE(svc.add_relationship("s", make_rel("a3", "b3", "funds", 0.9)));

    CacheOutcome outcome;
    auto snap = svc.snapshot("s", &outcome);
    EXPECT_NE(outcome, CacheOutcome::HIT);
    EXPECT_EQ(snap->num_edges(), 14);

    auto view = svc.graph("s");
    EXPECT_NE(view.cache_outcomes.at(CacheTier::LAYOUT), CacheOutcome::HIT);
}

TEST_F(NetworkServiceTest, MutationDuringLayoutReachesNextView) {
    // A chain long enough that the layout is still computing when the write lands
    auto node = [](int i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "n%03d", i);
        return std::string(buf);
    };
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(store->upsert_entity("s", make_entity(node(i))));
        if (i > 0) ASSERT_TRUE(store->put_relationship("s", make_rel(node(i - 1), node(i))));
    }
    config.layout.base_iterations = 2000;
    config.cache.budget_ms = 120000;
    auto& svc = make_service();

    GraphView during;
    std::thread reader([&svc, &during] { during = svc.graph("s"); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!svc.cache_status("s").tier(CacheTier::LAYOUT).in_flight &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_TRUE(svc.upsert_entity("s", make_entity("zz_new")));
    reader.join();

    // The in-flight request answers with one coherent scope state
    ASSERT_TRUE(during.layout);
    EXPECT_EQ(during.layout->size(), during.nodes.size());

    auto view = svc.graph("s");
    ASSERT_EQ(view.nodes.size(), 201);
    ASSERT_TRUE(view.layout);
    EXPECT_EQ(view.layout->size(), 201);
    EXPECT_TRUE(view.layout->position_of("zz_new").has_value());
    for (const auto& n : view.nodes) {
        EXPECT_TRUE(n.position.has_value()) << n.id;
    }
    ASSERT_TRUE(view.clusters);
    EXPECT_EQ(view.clusters->total_nodes, 201);
}

TEST_F(NetworkServiceTest, InvalidateAllResetsEveryScope) {
    seed_two_groups();
    ASSERT_TRUE(store->upsert_entity("t", make_entity("x")));
    auto& svc = make_service();
    svc.graph("s");
    svc.graph("t");

    svc.invalidate_all();

    auto s_view = svc.graph("s");
    auto t_view = svc.graph("t");
    EXPECT_NE(s_view.cache_outcomes.at(CacheTier::SNAPSHOT), CacheOutcome::HIT);
    EXPECT_NE(s_view.cache_outcomes.at(CacheTier::LAYOUT), CacheOutcome::HIT);
    EXPECT_NE(t_view.cache_outcomes.at(CacheTier::SNAPSHOT), CacheOutcome::HIT);
    EXPECT_EQ(svc.cache_status("s").tier(CacheTier::SNAPSHOT).entries, 1);
}

TEST_F(NetworkServiceTest, AddRelationshipMergesAndValidates) {
    seed_two_groups();
    auto& svc = make_service();
    EXPECT_THROW(svc.add_relationship("s", make_rel("a0", "ghost")), EntityNotFound);

    ASSERT_TRUE(svc.add_relationship("s", make_rel("a0", "a1", kAssociatedWith, 0.95, 2.0)));
    auto rel = store->get_relationship("s", {"a0", "a1", kAssociatedWith});
    ASSERT_TRUE(rel.has_value());
    EXPECT_DOUBLE_EQ(rel->confidence, 0.95);
    EXPECT_EQ(rel->observation_count, 2);
    EXPECT_DOUBLE_EQ(rel->weight, 3.0);
}

TEST_F(NetworkServiceTest, FailedWriteLeavesCacheAlone) {
    seed_two_groups();
    auto& svc = make_service();
    svc.snapshot("s");
    auto generation = svc.cache().generation("s", CacheTier::SNAPSHOT);

    store->fail_writes_after(0);
    EXPECT_FALSE(svc.upsert_entity("s", make_entity("new")));
    EXPECT_EQ(svc.cache().generation("s", CacheTier::SNAPSHOT), generation);
}

TEST_F(NetworkServiceTest, MergeEntitiesRepointsRelationships) {
    Entity ana = make_entity("ana", EntityType::PERSON, "Ana");
    ana.first_seen = from_epoch_seconds(500);
    Entity dup = make_entity("ana2", EntityType::PERSON, "Ana M.");
    dup.first_seen = from_epoch_seconds(200);
    dup.metadata.set(MetadataKey::COUNTRY, "PT");
    ASSERT_TRUE(store->upsert_entity("s", ana));
    ASSERT_TRUE(store->upsert_entity("s", dup));
    ASSERT_TRUE(store->upsert_entity("s", make_entity("bank", EntityType::ORGANIZATION)));
    ASSERT_TRUE(store->put_relationship("s", make_rel("ana", "bank")));
    ASSERT_TRUE(store->put_relationship("s", make_rel("ana2", "bank")));
    ASSERT_TRUE(store->put_relationship("s", make_rel("ana", "ana2")));
    auto& svc = make_service();
    svc.snapshot("s");

    auto report = svc.merge_entities("s", "ana", "ana2");
    EXPECT_TRUE(report.complete);
    EXPECT_EQ(report.committed, 3);

    EXPECT_FALSE(store->get_entity("s", "ana2").has_value());
    auto merged = store->get_entity("s", "ana");
    ASSERT_TRUE(merged.has_value());
    EXPECT_NE(std::find(merged->aliases.begin(), merged->aliases.end(), "Ana M."), merged->aliases.end());
    EXPECT_EQ(merged->first_seen, from_epoch_seconds(200));
    EXPECT_EQ(merged->metadata.get(MetadataKey::COUNTRY), std::optional<std::string>("PT"));

    auto rels = store->load_relationships("s");
    ASSERT_EQ(rels.size(), 1);
    EXPECT_EQ(rels[0].source, "ana");
    EXPECT_EQ(rels[0].target, "bank");
    EXPECT_EQ(rels[0].observation_count, 2);

    EXPECT_EQ(svc.snapshot("s")->num_nodes(), 2);
}

TEST_F(NetworkServiceTest, MergeRejectsBadArguments) {
    seed_two_groups();
    auto& svc = make_service();
    EXPECT_THROW(svc.merge_entities("s", "a0", "a0"), InvalidArgument);
    EXPECT_THROW(svc.merge_entities("s", "a0", "ghost"), EntityNotFound);
    EXPECT_THROW(svc.merge_entities("s", "ghost", "a0"), EntityNotFound);
}

TEST_F(NetworkServiceTest, ImportStopsAtFirstFailure) {
    auto& svc = make_service();
    svc.snapshot("s");
    store->fail_writes_after(2);

    std::vector<Entity> entities = {make_entity("e1"), make_entity("e2"), make_entity("e3")};
    auto report = svc.import_records("s", entities, {make_rel("e1", "e2")}, {});
    EXPECT_FALSE(report.complete);
    EXPECT_EQ(report.committed, 2);
    EXPECT_EQ(report.failed, 1);

    store->fail_writes_after(-1);
    CacheOutcome outcome;
    EXPECT_EQ(svc.snapshot("s", &outcome)->num_nodes(), 2);
    EXPECT_NE(outcome, CacheOutcome::HIT);
}

TEST_F(NetworkServiceTest, DiscoveryInvalidatesOnlyWhenSomethingCommitted) {
    seed_two_groups();
    auto& svc = make_service();
    svc.snapshot("s");
    auto generation = svc.cache().generation("s", CacheTier::SNAPSHOT);

    TimePoint now = clock->now();
    std::vector<ContentItem> lone = {ContentItem{"c1", {"a1", "b2"}, "x", now}};
    auto nothing = svc.run_discovery("s", lone, 2, std::chrono::hours(1));
    EXPECT_TRUE(nothing.committed.empty());
    EXPECT_EQ(svc.cache().generation("s", CacheTier::SNAPSHOT), generation);

    std::vector<ContentItem> pair = {ContentItem{"c1", {"a1", "b2"}, "x", now},
                                     ContentItem{"c2", {"a1", "b2"}, "y", now - std::chrono::minutes(5)}};
    auto found = svc.run_discovery("s", pair, 2, std::chrono::hours(1));
    EXPECT_EQ(found.created, 1);
    EXPECT_GT(svc.cache().generation("s", CacheTier::SNAPSHOT), generation);
    EXPECT_EQ(svc.snapshot("s")->num_edges(), 14);
}
