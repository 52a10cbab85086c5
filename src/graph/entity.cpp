#include "graph/entity.hpp"

#include <algorithm>
#include <cctype>

namespace netmap {

namespace {

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

long long json_time(const TimePoint& t) {
    return to_epoch_seconds(t);
}

TimePoint time_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return TimePoint{};
    return from_epoch_seconds(j[key].get<long long>());
}

} // namespace

// ==========================================
// EntityType
// ==========================================

std::string entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::PERSON: return "person";
        case EntityType::ORGANIZATION: return "organization";
        case EntityType::LOCATION: return "location";
        case EntityType::EVENT: return "event";
        case EntityType::OTHER: return "other";
        default: return "other";
    }
}

EntityType string_to_entity_type(const std::string& s) {
    std::string lower = to_lower_copy(s);
    if (lower == "person") return EntityType::PERSON;
    if (lower == "organization" || lower == "org") return EntityType::ORGANIZATION;
    if (lower == "location") return EntityType::LOCATION;
    if (lower == "event") return EntityType::EVENT;
    return EntityType::OTHER;
}

int entity_type_priority(EntityType type) {
    switch (type) {
        case EntityType::PERSON: return 0;
        case EntityType::ORGANIZATION: return 1;
        case EntityType::LOCATION: return 2;
        case EntityType::EVENT: return 3;
        case EntityType::OTHER: return 4;
        default: return 4;
    }
}

// ==========================================
// EntityMetadata
// ==========================================

std::string metadata_key_to_string(MetadataKey key) {
    switch (key) {
        case MetadataKey::EXTERNAL_ID: return "external_id";
        case MetadataKey::DESCRIPTION: return "description";
        case MetadataKey::SOURCE: return "source";
        case MetadataKey::COUNTRY: return "country";
        default: return "unknown";
    }
}

std::optional<MetadataKey> string_to_metadata_key(const std::string& s) {
    if (s == "external_id" || s == "wikidata_id") return MetadataKey::EXTERNAL_ID;
    if (s == "description") return MetadataKey::DESCRIPTION;
    if (s == "source") return MetadataKey::SOURCE;
    if (s == "country") return MetadataKey::COUNTRY;
    return std::nullopt;
}

std::optional<std::string> EntityMetadata::get(MetadataKey key) const {
    auto it = known.find(key);
    if (it == known.end()) return std::nullopt;
    return it->second;
}

void EntityMetadata::set(MetadataKey key, const std::string& value) {
    known[key] = value;
}

void EntityMetadata::merge_from(const EntityMetadata& other) {
    for (const auto& [key, value] : other.known) {
        known[key] = value;
    }
    for (const auto& [key, value] : other.extra) {
        extra[key] = value;
    }
}

nlohmann::json EntityMetadata::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : extra) {
        j[key] = value;
    }
    for (const auto& [key, value] : known) {
        j[metadata_key_to_string(key)] = value;
    }
    return j;
}

EntityMetadata EntityMetadata::from_json(const nlohmann::json& j) {
    EntityMetadata meta;
    if (!j.is_object()) return meta;

    for (auto& [key, value] : j.items()) {
        std::string text = value.is_string() ? value.get<std::string>() : value.dump();
        auto known_key = string_to_metadata_key(key);
        if (known_key) {
            meta.known[*known_key] = text;
        } else {
            meta.extra[key] = text;
        }
    }
    return meta;
}

// ==========================================
// Entity
// ==========================================

nlohmann::json Entity::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["type"] = entity_type_to_string(type);
    j["metadata"] = metadata.to_json();
    if (!aliases.empty()) {
        j["aliases"] = aliases;
    }
    j["first_seen"] = json_time(first_seen);
    j["last_seen"] = json_time(last_seen);
    return j;
}

Entity Entity::from_json(const nlohmann::json& j) {
    Entity entity;
    entity.id = j.at("id").get<std::string>();
    entity.name = j.value("name", entity.id);
    entity.type = string_to_entity_type(j.value("type", "other"));

    if (j.contains("metadata")) {
        entity.metadata = EntityMetadata::from_json(j["metadata"]);
    }
    if (j.contains("aliases")) {
        entity.aliases = j["aliases"].get<std::vector<std::string>>();
    }
    entity.first_seen = time_from_json(j, "first_seen");
    entity.last_seen = time_from_json(j, "last_seen");
    if (entity.last_seen < entity.first_seen) {
        entity.last_seen = entity.first_seen;
    }
    return entity;
}

// ==========================================
// Relationship
// ==========================================

const std::vector<std::string>& relationship_types() {
    static const std::vector<std::string> types = {
        "supports", "opposes", "collaborates_with", "implements", "impacts",
        "responds_to", "part_of", "leads", "funds", "regulates", kAssociatedWith
    };
    return types;
}

void Relationship::observe(const Relationship& other) {
    confidence = std::max(confidence, other.confidence);
    observation_count += std::max(1, other.observation_count);
    weight += other.weight;
    if (other.last_observed > last_observed) {
        last_observed = other.last_observed;
    }
    if (first_observed == TimePoint{} ||
        (other.first_observed != TimePoint{} && other.first_observed < first_observed)) {
        first_observed = other.first_observed;
    }
}

nlohmann::json Relationship::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    j["type"] = type;
    j["confidence"] = confidence;
    j["weight"] = weight;
    j["first_observed"] = json_time(first_observed);
    j["last_observed"] = json_time(last_observed);
    j["observation_count"] = observation_count;
    return j;
}

Relationship Relationship::from_json(const nlohmann::json& j) {
    Relationship rel;
    rel.source = j.at("source").get<std::string>();
    rel.target = j.at("target").get<std::string>();
    rel.type = j.value("type", std::string(kAssociatedWith));
    rel.confidence = std::clamp(j.value("confidence", 0.5), 0.0, 1.0);
    rel.weight = j.value("weight", 1.0);
    rel.first_observed = time_from_json(j, "first_observed");
    rel.last_observed = time_from_json(j, "last_observed");
    rel.observation_count = j.value("observation_count", 1);
    return rel;
}

// ==========================================
// ContentItem
// ==========================================

nlohmann::json ContentItem::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["entity_ids"] = entity_ids;
    j["text"] = text;
    j["timestamp"] = json_time(timestamp);
    return j;
}

ContentItem ContentItem::from_json(const nlohmann::json& j) {
    ContentItem item;
    item.id = j.at("id").get<std::string>();
    item.entity_ids = j.value("entity_ids", std::vector<std::string>{});
    item.text = j.value("text", "");
    item.timestamp = time_from_json(j, "timestamp");
    return item;
}

} // namespace netmap
