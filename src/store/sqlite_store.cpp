#include "store/sqlite_store.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>

namespace netmap {

namespace {

const char* kSchemaV1 = R"SQL(
CREATE TABLE IF NOT EXISTS entities (
    scope       TEXT NOT NULL,
    id          TEXT NOT NULL,
    name        TEXT NOT NULL,
    type        TEXT NOT NULL,
    metadata    TEXT NOT NULL DEFAULT '{}',
    aliases     TEXT NOT NULL DEFAULT '[]',
    first_seen  INTEGER NOT NULL DEFAULT 0,
    last_seen   INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (scope, id)
);

CREATE TABLE IF NOT EXISTS relationships (
    scope             TEXT NOT NULL,
    source            TEXT NOT NULL,
    target            TEXT NOT NULL,
    type              TEXT NOT NULL,
    confidence        REAL NOT NULL DEFAULT 0.5,
    weight            REAL NOT NULL DEFAULT 1.0,
    first_observed    INTEGER NOT NULL DEFAULT 0,
    last_observed     INTEGER NOT NULL DEFAULT 0,
    observation_count INTEGER NOT NULL DEFAULT 1,
    PRIMARY KEY (scope, source, target, type),
    FOREIGN KEY (scope, source) REFERENCES entities(scope, id) ON DELETE CASCADE,
    FOREIGN KEY (scope, target) REFERENCES entities(scope, id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_relationships_target ON relationships(scope, target);

CREATE TABLE IF NOT EXISTS content_items (
    scope       TEXT NOT NULL,
    id          TEXT NOT NULL,
    entity_ids  TEXT NOT NULL DEFAULT '[]',
    text        TEXT NOT NULL DEFAULT '',
    timestamp   INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (scope, id)
);

CREATE INDEX IF NOT EXISTS idx_content_time ON content_items(scope, timestamp);
)SQL";

// Version 1 stored whole seconds; times are epoch milliseconds from version 2 on
const char* kMigrateV1ToV2 = R"SQL(
UPDATE entities SET first_seen = first_seen * 1000, last_seen = last_seen * 1000;
UPDATE relationships SET first_observed = first_observed * 1000, last_observed = last_observed * 1000;
UPDATE content_items SET timestamp = timestamp * 1000;
)SQL";

void bind_text(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_time(sqlite3_stmt* st, int idx, TimePoint t) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(to_epoch_millis(t)));
}

std::string col_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

TimePoint col_time(sqlite3_stmt* st, int col) {
    return from_epoch_millis(static_cast<long long>(sqlite3_column_int64(st, col)));
}

nlohmann::json col_json(sqlite3_stmt* st, int col) {
    return nlohmann::json::parse(col_text(st, col), nullptr, false);
}

Entity read_entity(sqlite3_stmt* st) {
    Entity e;
    e.id = col_text(st, 0);
    e.name = col_text(st, 1);
    e.type = string_to_entity_type(col_text(st, 2));
    e.metadata = EntityMetadata::from_json(col_json(st, 3));
    auto aliases = col_json(st, 4);
    if (aliases.is_array()) {
        for (const auto& a : aliases) {
            if (a.is_string()) e.aliases.push_back(a.get<std::string>());
        }
    }
    e.first_seen = col_time(st, 5);
    e.last_seen = col_time(st, 6);
    return e;
}

Relationship read_relationship(sqlite3_stmt* st) {
    Relationship r;
    r.source = col_text(st, 0);
    r.target = col_text(st, 1);
    r.type = col_text(st, 2);
    r.confidence = sqlite3_column_double(st, 3);
    r.weight = sqlite3_column_double(st, 4);
    r.first_observed = col_time(st, 5);
    r.last_observed = col_time(st, 6);
    r.observation_count = sqlite3_column_int(st, 7);
    return r;
}

const char* kEntityColumns = "id,name,type,metadata,aliases,first_seen,last_seen";
const char* kRelationshipColumns =
    "source,target,type,confidence,weight,first_observed,last_observed,observation_count";

} // namespace

SqliteGraphStore::SqliteGraphStore(const std::string& path)
    : db_(std::make_unique<SqliteDB>(path)) {
    migrate();
    NETMAP_LOG_INFO("sqlite store opened", {log::StringField("path", path),
                                            log::IntField("schema_version", kSchemaVersion)});
}

void SqliteGraphStore::migrate() {
    int version = db_->user_version();
    if (version > kSchemaVersion) {
        throw StoreUnavailable("database schema version " + std::to_string(version) +
                               " is newer than supported version " + std::to_string(kSchemaVersion));
    }
    if (version == kSchemaVersion) return;

    SqliteTransaction tx(*db_);
    if (version == 0) {
        db_->exec(kSchemaV1);
    } else if (version == 1) {
        db_->exec(kMigrateV1ToV2);
        NETMAP_LOG_INFO("sqlite store migrated", {log::IntField("from_version", version),
                                                  log::IntField("to_version", kSchemaVersion)});
    }
    db_->set_user_version(kSchemaVersion);
    tx.commit();
}

StoreResult SqliteGraphStore::translate(int rc) const {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return StoreResult::Ok();
    }

    std::string msg = sqlite3_errmsg(db_->handle());
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return StoreResult::Err(StoreErrorCode::Busy, msg);
        case SQLITE_CONSTRAINT:
            return StoreResult::Err(StoreErrorCode::ConstraintViolation, msg);
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return StoreResult::Err(StoreErrorCode::IOError, msg);
        case SQLITE_CANTOPEN:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return StoreResult::Err(StoreErrorCode::Unavailable, msg);
        default:
            return StoreResult::Err(StoreErrorCode::InternalError, msg);
    }
}

// ---- reads ----

std::vector<Entity> SqliteGraphStore::load_entities(const Scope& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kEntityColumns + " FROM entities WHERE scope=? ORDER BY id;";
    Statement st = prepare(db_->handle(), sql.c_str());
    if (!st) throw StoreUnavailable(std::string("load_entities: ") + sqlite3_errmsg(db_->handle()));

    bind_text(st.get(), 1, scope);
    std::vector<Entity> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(read_entity(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable(std::string("load_entities: ") + sqlite3_errmsg(db_->handle()));
    }
    return out;
}

std::vector<Relationship> SqliteGraphStore::load_relationships(const Scope& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kRelationshipColumns +
                      " FROM relationships WHERE scope=? ORDER BY source,target,type;";
    Statement st = prepare(db_->handle(), sql.c_str());
    if (!st) throw StoreUnavailable(std::string("load_relationships: ") + sqlite3_errmsg(db_->handle()));

    bind_text(st.get(), 1, scope);
    std::vector<Relationship> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(read_relationship(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable(std::string("load_relationships: ") + sqlite3_errmsg(db_->handle()));
    }
    return out;
}

std::vector<ContentItem> SqliteGraphStore::load_content_items(const Scope& scope, TimePoint since) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st = prepare(db_->handle(),
        "SELECT id,entity_ids,text,timestamp FROM content_items "
        "WHERE scope=? AND timestamp>=? ORDER BY timestamp,id;");
    if (!st) throw StoreUnavailable(std::string("load_content_items: ") + sqlite3_errmsg(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_time(st.get(), 2, since);

    std::vector<ContentItem> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        ContentItem item;
        item.id = col_text(st.get(), 0);
        auto ids = col_json(st.get(), 1);
        if (ids.is_array()) {
            for (const auto& id : ids) {
                if (id.is_string()) item.entity_ids.push_back(id.get<std::string>());
            }
        }
        item.text = col_text(st.get(), 2);
        item.timestamp = col_time(st.get(), 3);
        out.push_back(std::move(item));
    }
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable(std::string("load_content_items: ") + sqlite3_errmsg(db_->handle()));
    }
    return out;
}

std::optional<Entity> SqliteGraphStore::get_entity(const Scope& scope, const EntityId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kEntityColumns + " FROM entities WHERE scope=? AND id=?;";
    Statement st = prepare(db_->handle(), sql.c_str());
    if (!st) throw StoreUnavailable(std::string("get_entity: ") + sqlite3_errmsg(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, id);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) return read_entity(st.get());
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable(std::string("get_entity: ") + sqlite3_errmsg(db_->handle()));
    }
    return std::nullopt;
}

std::optional<Relationship> SqliteGraphStore::get_relationship(const Scope& scope, const RelationshipKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kRelationshipColumns +
                      " FROM relationships WHERE scope=? AND source=? AND target=? AND type=?;";
    Statement st = prepare(db_->handle(), sql.c_str());
    if (!st) throw StoreUnavailable(std::string("get_relationship: ") + sqlite3_errmsg(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, key.source);
    bind_text(st.get(), 3, key.target);
    bind_text(st.get(), 4, key.type);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) return read_relationship(st.get());
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable(std::string("get_relationship: ") + sqlite3_errmsg(db_->handle()));
    }
    return std::nullopt;
}

// ---- writes ----

StoreResult SqliteGraphStore::upsert_entity(const Scope& scope, const Entity& entity) {
    if (entity.id.empty()) {
        return StoreResult::Err(StoreErrorCode::ConstraintViolation, "entity id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement st = prepare(db_->handle(),
        "INSERT INTO entities(scope,id,name,type,metadata,aliases,first_seen,last_seen) "
        "VALUES(?,?,?,?,?,?,?,?) "
        "ON CONFLICT(scope,id) DO UPDATE SET name=excluded.name, type=excluded.type, "
        "metadata=excluded.metadata, aliases=excluded.aliases, "
        "first_seen=excluded.first_seen, last_seen=excluded.last_seen;");
    if (!st) return translate(sqlite3_errcode(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, entity.id);
    bind_text(st.get(), 3, entity.name);
    bind_text(st.get(), 4, entity_type_to_string(entity.type));
    bind_text(st.get(), 5, entity.metadata.to_json().dump());
    bind_text(st.get(), 6, nlohmann::json(entity.aliases).dump());
    bind_time(st.get(), 7, entity.first_seen);
    bind_time(st.get(), 8, entity.last_seen);

    return translate(sqlite3_step(st.get()));
}

StoreResult SqliteGraphStore::delete_entity(const Scope& scope, const EntityId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st = prepare(db_->handle(), "DELETE FROM entities WHERE scope=? AND id=?;");
    if (!st) return translate(sqlite3_errcode(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, id);
    auto result = translate(sqlite3_step(st.get()));
    if (result && sqlite3_changes(db_->handle()) == 0) {
        return StoreResult::Err(StoreErrorCode::NotFound, "entity not found: " + id);
    }
    return result;
}

StoreResult SqliteGraphStore::put_relationship(const Scope& scope, const Relationship& rel) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st = prepare(db_->handle(),
        "INSERT INTO relationships(scope,source,target,type,confidence,weight,"
        "first_observed,last_observed,observation_count) VALUES(?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(scope,source,target,type) DO UPDATE SET confidence=excluded.confidence, "
        "weight=excluded.weight, first_observed=excluded.first_observed, "
        "last_observed=excluded.last_observed, observation_count=excluded.observation_count;");
    if (!st) return translate(sqlite3_errcode(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, rel.source);
    bind_text(st.get(), 3, rel.target);
    bind_text(st.get(), 4, rel.type);
    sqlite3_bind_double(st.get(), 5, rel.confidence);
    sqlite3_bind_double(st.get(), 6, rel.weight);
    bind_time(st.get(), 7, rel.first_observed);
    bind_time(st.get(), 8, rel.last_observed);
    sqlite3_bind_int(st.get(), 9, rel.observation_count);

    return translate(sqlite3_step(st.get()));
}

StoreResult SqliteGraphStore::delete_relationship(const Scope& scope, const RelationshipKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st = prepare(db_->handle(),
        "DELETE FROM relationships WHERE scope=? AND source=? AND target=? AND type=?;");
    if (!st) return translate(sqlite3_errcode(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, key.source);
    bind_text(st.get(), 3, key.target);
    bind_text(st.get(), 4, key.type);
    auto result = translate(sqlite3_step(st.get()));
    if (result && sqlite3_changes(db_->handle()) == 0) {
        return StoreResult::Err(StoreErrorCode::NotFound, "relationship not found: " + key.to_string());
    }
    return result;
}

StoreResult SqliteGraphStore::add_content_item(const Scope& scope, const ContentItem& item) {
    if (item.id.empty()) {
        return StoreResult::Err(StoreErrorCode::ConstraintViolation, "content id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement st = prepare(db_->handle(),
        "INSERT OR REPLACE INTO content_items(scope,id,entity_ids,text,timestamp) VALUES(?,?,?,?,?);");
    if (!st) return translate(sqlite3_errcode(db_->handle()));

    bind_text(st.get(), 1, scope);
    bind_text(st.get(), 2, item.id);
    bind_text(st.get(), 3, nlohmann::json(item.entity_ids).dump());
    bind_text(st.get(), 4, item.text);
    bind_time(st.get(), 5, item.timestamp);

    return translate(sqlite3_step(st.get()));
}

} // namespace netmap
