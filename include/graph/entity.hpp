#pragma once

#include "core/clock.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <tuple>
#include <string>
#include <vector>

namespace netmap {

using Scope = std::string;
using EntityId = std::string;

enum class EntityType {
    PERSON,
    ORGANIZATION,
    LOCATION,
    EVENT,
    OTHER
};

std::string entity_type_to_string(EntityType type);
EntityType string_to_entity_type(const std::string& s);

/**
 * @brief Fixed tie-break rank for dominant-type votes (lower wins)
 */
int entity_type_priority(EntityType type);

/**
 * @brief Closed set of well-known metadata keys
 */
enum class MetadataKey {
    EXTERNAL_ID,    // Disambiguation identifier in an external knowledge base
    DESCRIPTION,
    SOURCE,
    COUNTRY
};

std::string metadata_key_to_string(MetadataKey key);
std::optional<MetadataKey> string_to_metadata_key(const std::string& s);

/**
 * @brief Typed entity metadata
 *
 * Known keys are stored in `known`; anything else read from the store is
 * kept verbatim in `extra` so a round trip never loses data.
 */
struct EntityMetadata {
    std::map<MetadataKey, std::string> known;
    std::map<std::string, std::string> extra;

    std::optional<std::string> get(MetadataKey key) const;
    void set(MetadataKey key, const std::string& value);

    /**
     * @brief Overlay another metadata map; set values in `other` win
     */
    void merge_from(const EntityMetadata& other);

    bool empty() const { return known.empty() && extra.empty(); }

    nlohmann::json to_json() const;
    static EntityMetadata from_json(const nlohmann::json& j);
};

/**
 * @brief A tracked entity (person, organization, location, ...)
 */
struct Entity {
    EntityId id;
    std::string name;
    EntityType type = EntityType::OTHER;
    EntityMetadata metadata;
    std::vector<std::string> aliases;
    TimePoint first_seen{};
    TimePoint last_seen{};

    nlohmann::json to_json() const;
    static Entity from_json(const nlohmann::json& j);
};

/**
 * @brief Known relationship type tags
 */
const std::vector<std::string>& relationship_types();

inline constexpr const char* kAssociatedWith = "associated_with";

/**
 * @brief Unique key of a relationship within a scope
 */
struct RelationshipKey {
    EntityId source;
    EntityId target;
    std::string type;

    bool operator<(const RelationshipKey& other) const {
        return std::tie(source, target, type) < std::tie(other.source, other.target, other.type);
    }
    bool operator==(const RelationshipKey& other) const {
        return source == other.source && target == other.target && type == other.type;
    }

    std::string to_string() const { return source + "|" + type + "|" + target; }
};

/**
 * @brief A typed, directed relationship between two entities
 *
 * (source, target, type) is unique per scope. Re-observation updates the
 * existing record in place (see observe()).
 */
struct Relationship {
    EntityId source;
    EntityId target;
    std::string type = kAssociatedWith;
    double confidence = 0.5;               // [0, 1]
    double weight = 1.0;
    TimePoint first_observed{};
    TimePoint last_observed{};
    int observation_count = 1;

    RelationshipKey key() const { return {source, target, type}; }

    /**
     * @brief Fold a re-observation into this record
     *
     * Confidence keeps the maximum, observation count and weight accumulate,
     * last-observed moves forward.
     */
    void observe(const Relationship& other);

    nlohmann::json to_json() const;
    static Relationship from_json(const nlohmann::json& j);
};

/**
 * @brief A content item (news item, document) mentioning entities
 */
struct ContentItem {
    std::string id;
    std::vector<EntityId> entity_ids;
    std::string text;
    TimePoint timestamp{};

    nlohmann::json to_json() const;
    static ContentItem from_json(const nlohmann::json& j);
};

} // namespace netmap
