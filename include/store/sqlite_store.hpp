#pragma once

#include "store/graph_store.hpp"
#include "store/sqlite_db.hpp"

#include <memory>
#include <mutex>

namespace netmap {

/**
 * @brief GraphStore backed by a single SQLite database file
 *
 * Every scope lives in the same tables, keyed by a scope column. The schema
 * is created or migrated when the store is opened. Times are stored as
 * epoch milliseconds. Operations on the shared
 * connection are serialized.
 */
class SqliteGraphStore : public GraphStore {
public:
    explicit SqliteGraphStore(const std::string& path);

    std::vector<Entity> load_entities(const Scope& scope) override;
    std::vector<Relationship> load_relationships(const Scope& scope) override;
    std::vector<ContentItem> load_content_items(const Scope& scope, TimePoint since) override;
    std::optional<Entity> get_entity(const Scope& scope, const EntityId& id) override;
    std::optional<Relationship> get_relationship(const Scope& scope, const RelationshipKey& key) override;

    StoreResult upsert_entity(const Scope& scope, const Entity& entity) override;
    StoreResult delete_entity(const Scope& scope, const EntityId& id) override;
    StoreResult put_relationship(const Scope& scope, const Relationship& rel) override;
    StoreResult delete_relationship(const Scope& scope, const RelationshipKey& key) override;
    StoreResult add_content_item(const Scope& scope, const ContentItem& item) override;

    std::string backend_name() const override { return "sqlite"; }

    // Lock waits end at the connection's busy timeout
    bool bounds_own_reads() const override { return true; }

    static constexpr int kSchemaVersion = 2;

private:
    std::unique_ptr<SqliteDB> db_;
    std::mutex mutex_;

    void migrate();
    StoreResult translate(int rc) const;
};

} // namespace netmap
