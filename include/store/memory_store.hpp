#pragma once

#include "store/graph_store.hpp"

#include <atomic>
#include <map>
#include <shared_mutex>

namespace netmap {

/**
 * @brief In-process store used by tests and the CLI's scratch mode
 *
 * Supports fault injection: marking the store unavailable, delaying reads
 * and failing writes after a number of successful ones.
 */
class MemoryGraphStore : public GraphStore {
public:
    MemoryGraphStore() = default;

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

    std::string backend_name() const override { return "memory"; }

    // ---- fault injection ----
    void set_unavailable(bool unavailable) { unavailable_ = unavailable; }
    void set_read_delay(Duration delay) { read_delay_ms_ = delay.count(); }

    /**
     * @brief Allow `n` more successful writes, then fail every write with
     *        IOError. Negative disables the limit.
     */
    void fail_writes_after(int n) { writes_remaining_ = n; }

    size_t read_count() const { return reads_.load(); }

private:
    struct ScopeData {
        std::map<EntityId, Entity> entities;
        std::map<RelationshipKey, Relationship> relationships;
        std::map<std::string, ContentItem> content;
    };

    mutable std::shared_mutex mutex_;
    std::map<Scope, ScopeData> scopes_;

    std::atomic<bool> unavailable_{false};
    std::atomic<long long> read_delay_ms_{0};
    std::atomic<int> writes_remaining_{-1};
    std::atomic<size_t> reads_{0};

    void before_read();
    StoreResult before_write();
};

} // namespace netmap
