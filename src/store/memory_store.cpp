#include "store/memory_store.hpp"
#include "core/errors.hpp"

#include <mutex>
#include <thread>

namespace netmap {

void MemoryGraphStore::before_read() {
    reads_++;
    long long delay = read_delay_ms_.load();
    if (delay > 0) {
        std::this_thread::sleep_for(Duration(delay));
    }
    if (unavailable_) {
        throw StoreUnavailable("memory store marked unavailable");
    }
}

StoreResult MemoryGraphStore::before_write() {
    if (unavailable_) {
        return StoreResult::Err(StoreErrorCode::Unavailable, "memory store marked unavailable");
    }
    int remaining = writes_remaining_.load();
    while (remaining >= 0) {
        if (remaining == 0) {
            return StoreResult::Err(StoreErrorCode::IOError, "injected write failure");
        }
        if (writes_remaining_.compare_exchange_weak(remaining, remaining - 1)) {
            break;
        }
    }
    return StoreResult::Ok();
}

// ---- reads ----

std::vector<Entity> MemoryGraphStore::load_entities(const Scope& scope) {
    before_read();
    std::shared_lock lock(mutex_);
    std::vector<Entity> out;
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) return out;

    out.reserve(it->second.entities.size());
    for (const auto& [id, entity] : it->second.entities) {
        out.push_back(entity);
    }
    return out;
}

std::vector<Relationship> MemoryGraphStore::load_relationships(const Scope& scope) {
    before_read();
    std::shared_lock lock(mutex_);
    std::vector<Relationship> out;
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) return out;

    out.reserve(it->second.relationships.size());
    for (const auto& [key, rel] : it->second.relationships) {
        out.push_back(rel);
    }
    return out;
}

std::vector<ContentItem> MemoryGraphStore::load_content_items(const Scope& scope, TimePoint since) {
    before_read();
    std::shared_lock lock(mutex_);
    std::vector<ContentItem> out;
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) return out;

    for (const auto& [id, item] : it->second.content) {
        if (item.timestamp >= since) {
            out.push_back(item);
        }
    }
    return out;
}

std::optional<Entity> MemoryGraphStore::get_entity(const Scope& scope, const EntityId& id) {
    before_read();
    std::shared_lock lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) return std::nullopt;
    auto e = it->second.entities.find(id);
    if (e == it->second.entities.end()) return std::nullopt;
    return e->second;
}

std::optional<Relationship> MemoryGraphStore::get_relationship(const Scope& scope, const RelationshipKey& key) {
    before_read();
    std::shared_lock lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) return std::nullopt;
    auto r = it->second.relationships.find(key);
    if (r == it->second.relationships.end()) return std::nullopt;
    return r->second;
}

// ---- writes ----

StoreResult MemoryGraphStore::upsert_entity(const Scope& scope, const Entity& entity) {
    if (entity.id.empty()) {
        return StoreResult::Err(StoreErrorCode::ConstraintViolation, "entity id must not be empty");
    }
    auto check = before_write();
    if (!check) return check;

    std::unique_lock lock(mutex_);
    scopes_[scope].entities[entity.id] = entity;
    return StoreResult::Ok();
}

StoreResult MemoryGraphStore::delete_entity(const Scope& scope, const EntityId& id) {
    auto check = before_write();
    if (!check) return check;

    std::unique_lock lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end() || it->second.entities.erase(id) == 0) {
        return StoreResult::Err(StoreErrorCode::NotFound, "entity not found: " + id);
    }

    auto& rels = it->second.relationships;
    for (auto r = rels.begin(); r != rels.end();) {
        if (r->first.source == id || r->first.target == id) {
            r = rels.erase(r);
        } else {
            ++r;
        }
    }
    return StoreResult::Ok();
}

StoreResult MemoryGraphStore::put_relationship(const Scope& scope, const Relationship& rel) {
    auto check = before_write();
    if (!check) return check;

    std::unique_lock lock(mutex_);
    auto& data = scopes_[scope];
    if (data.entities.count(rel.source) == 0 || data.entities.count(rel.target) == 0) {
        return StoreResult::Err(StoreErrorCode::ConstraintViolation,
                                "relationship endpoint missing: " + rel.key().to_string());
    }
    data.relationships[rel.key()] = rel;
    return StoreResult::Ok();
}

StoreResult MemoryGraphStore::delete_relationship(const Scope& scope, const RelationshipKey& key) {
    auto check = before_write();
    if (!check) return check;

    std::unique_lock lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end() || it->second.relationships.erase(key) == 0) {
        return StoreResult::Err(StoreErrorCode::NotFound, "relationship not found: " + key.to_string());
    }
    return StoreResult::Ok();
}

StoreResult MemoryGraphStore::add_content_item(const Scope& scope, const ContentItem& item) {
    if (item.id.empty()) {
        return StoreResult::Err(StoreErrorCode::ConstraintViolation, "content id must not be empty");
    }
    auto check = before_write();
    if (!check) return check;

    std::unique_lock lock(mutex_);
    scopes_[scope].content[item.id] = item;
    return StoreResult::Ok();
}

} // namespace netmap
