#pragma once

#include "graph/entity.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netmap {

/*
  Portable store result codes.

  Adapters translate backend errors into these; nothing above the store
  depends on sqlite error types.
*/
enum class StoreErrorCode {
    OK = 0,
    NotFound,
    ConstraintViolation,
    Busy,
    IOError,
    Unavailable,
    InternalError
};

std::string store_error_code_to_string(StoreErrorCode code);

struct StoreResult {
    StoreErrorCode code = StoreErrorCode::OK;
    std::string message;

    static StoreResult Ok() { return {}; }

    static StoreResult Err(StoreErrorCode c, std::string msg = {}) {
        return {c, std::move(msg)};
    }

    explicit operator bool() const { return code == StoreErrorCode::OK; }
};

/**
 * @brief Persistent store of entities, relationships and content items
 *
 * Reads throw StoreUnavailable when the backend cannot be reached. Writes
 * report their outcome as a StoreResult so mutation paths can account for
 * partial success. Implementations are internally synchronized.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // ---- reads ----
    virtual std::vector<Entity> load_entities(const Scope& scope) = 0;
    virtual std::vector<Relationship> load_relationships(const Scope& scope) = 0;

    /**
     * @brief Content items with timestamp >= since
     */
    virtual std::vector<ContentItem> load_content_items(const Scope& scope, TimePoint since) = 0;

    virtual std::optional<Entity> get_entity(const Scope& scope, const EntityId& id) = 0;
    virtual std::optional<Relationship> get_relationship(const Scope& scope, const RelationshipKey& key) = 0;

    // ---- writes ----

    /**
     * @brief Insert an entity or replace its mutable fields
     */
    virtual StoreResult upsert_entity(const Scope& scope, const Entity& entity) = 0;

    /**
     * @brief Delete an entity and every relationship touching it
     */
    virtual StoreResult delete_entity(const Scope& scope, const EntityId& id) = 0;

    /**
     * @brief Insert or overwrite the relationship with the same key
     *
     * Fails with ConstraintViolation if either endpoint does not exist in
     * the scope.
     */
    virtual StoreResult put_relationship(const Scope& scope, const Relationship& rel) = 0;

    virtual StoreResult delete_relationship(const Scope& scope, const RelationshipKey& key) = 0;

    virtual StoreResult add_content_item(const Scope& scope, const ContentItem& item) = 0;

    virtual std::string backend_name() const = 0;

    /**
     * @brief True when every read gives up on its own after a bounded wait
     *
     * GraphBuilder reads such stores inline instead of on a timed worker.
     */
    virtual bool bounds_own_reads() const { return false; }
};

} // namespace netmap
