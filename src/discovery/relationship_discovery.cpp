#include "discovery/relationship_discovery.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace netmap {

namespace {

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Whole-word (or whole-phrase) match on lowercased text
bool contains_phrase(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) return false;
    size_t pos = text.find(phrase);
    while (pos != std::string::npos) {
        bool start_ok = pos == 0 || !is_word_char(text[pos - 1]);
        size_t end = pos + phrase.size();
        bool end_ok = end >= text.size() || !is_word_char(text[end]);
        if (start_ok && end_ok) return true;
        pos = text.find(phrase, pos + 1);
    }
    return false;
}

struct Evidence {
    int count = 0;
    std::set<size_t> items;
    TimePoint first{};
    TimePoint last{};

    void touch(size_t item, TimePoint t) {
        if (items.empty()) {
            first = t;
            last = t;
        }
        items.insert(item);
        first = std::min(first, t);
        last = std::max(last, t);
    }
};

constexpr Duration kDay = std::chrono::hours(24);

} // namespace

nlohmann::json DiscoveryReport::to_json() const {
    nlohmann::json j;
    j["candidates"] = candidates;
    j["created"] = created;
    j["updated"] = updated;
    j["skipped"] = skipped;
    j["failed"] = failed;
    j["complete"] = complete;
    if (!error.empty()) j["error"] = error;

    nlohmann::json keys = nlohmann::json::array();
    for (const auto& k : committed) {
        keys.push_back({{"source", k.source}, {"target", k.target}, {"type", k.type}});
    }
    j["committed"] = keys;
    return j;
}

nlohmann::json RelationshipStats::to_json() const {
    nlohmann::json j;
    j["total"] = total;
    j["by_type"] = by_type;
    j["observed_last_7_days"] = observed_last_7_days;
    j["average_confidence"] = average_confidence;
    return j;
}

RelationshipDiscovery::RelationshipDiscovery(std::shared_ptr<GraphStore> store,
                                             DiscoveryConfig config,
                                             std::shared_ptr<Clock> clock)
    : store_(std::move(store)), config_(std::move(config)), clock_(std::move(clock)) {
    if (!store_) {
        throw InvalidArgument("RelationshipDiscovery requires a store");
    }
    if (!clock_) {
        clock_ = default_clock();
    }
    if (config_.keyword_categories.empty()) {
        config_.keyword_categories = DiscoveryConfig::default_keyword_categories();
    }
}

double RelationshipDiscovery::score(int co_occurrences, double keyword_strength) const {
    double strength = std::clamp(keyword_strength, 0.0, 1.0);
    double raw = config_.base_confidence + 0.05 * static_cast<double>(co_occurrences) + 0.1 * strength;
    return std::min(config_.max_confidence, raw);
}

std::pair<std::string, double> RelationshipDiscovery::classify(
    const std::vector<const std::string*>& texts) const {
    if (texts.empty()) return {kAssociatedWith, 0.0};

    std::vector<std::string> lowered;
    lowered.reserve(texts.size());
    for (const auto* t : texts) {
        lowered.push_back(to_lower_copy(*t));
    }

    std::string best_type = kAssociatedWith;
    size_t best_hits = 0;
    // Map order: equal hit counts resolve to the alphabetically first category
    for (const auto& [type, keywords] : config_.keyword_categories) {
        size_t hits = 0;
        for (const auto& text : lowered) {
            for (const auto& keyword : keywords) {
                if (contains_phrase(text, to_lower_copy(keyword))) {
                    hits++;
                }
            }
        }
        if (hits > best_hits) {
            best_hits = hits;
            best_type = type;
        }
    }

    double strength = std::min(1.0, static_cast<double>(best_hits) / static_cast<double>(texts.size()));
    return {best_type, strength};
}

std::vector<DiscoveryCandidate> RelationshipDiscovery::find_candidates(
    const std::vector<ContentItem>& items,
    int min_co_occurrences,
    Duration time_window) const {

    const TimePoint cutoff = clock_->now() - kDay * config_.lookback_days;

    std::vector<const ContentItem*> recent;
    for (const auto& item : items) {
        if (item.timestamp >= cutoff) {
            recent.push_back(&item);
        }
    }
    std::sort(recent.begin(), recent.end(), [](const ContentItem* a, const ContentItem* b) {
        if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
        return a->id < b->id;
    });

    std::vector<std::set<EntityId>> mentions(recent.size());
    for (size_t i = 0; i < recent.size(); ++i) {
        for (const auto& id : recent[i]->entity_ids) {
            if (!id.empty()) mentions[i].insert(id);
        }
    }

    std::map<std::pair<EntityId, EntityId>, Evidence> pairs;

    // Same item
    for (size_t i = 0; i < recent.size(); ++i) {
        for (auto a = mentions[i].begin(); a != mentions[i].end(); ++a) {
            for (auto b = std::next(a); b != mentions[i].end(); ++b) {
                auto& ev = pairs[{*a, *b}];
                ev.count++;
                ev.touch(i, recent[i]->timestamp);
            }
        }
    }

    // Separate items close in time: one mentions a only, the other b only
    if (time_window.count() > 0) {
        for (size_t i = 0; i < recent.size(); ++i) {
            for (size_t j = i + 1; j < recent.size(); ++j) {
                if (recent[j]->timestamp - recent[i]->timestamp > time_window) break;

                for (const auto& a : mentions[i]) {
                    if (mentions[j].count(a)) continue;
                    for (const auto& b : mentions[j]) {
                        if (mentions[i].count(b)) continue;
                        auto key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
                        auto& ev = pairs[key];
                        ev.count++;
                        ev.touch(i, recent[i]->timestamp);
                        ev.touch(j, recent[j]->timestamp);
                    }
                }
            }
        }
    }

    std::vector<DiscoveryCandidate> out;
    for (const auto& [pair, ev] : pairs) {
        if (ev.count < min_co_occurrences) continue;

        std::vector<const std::string*> texts;
        for (size_t idx : ev.items) {
            texts.push_back(&recent[idx]->text);
        }
        auto [type, strength] = classify(texts);

        DiscoveryCandidate c;
        c.key = {pair.first, pair.second, type};
        c.co_occurrences = ev.count;
        c.keyword_strength = strength;
        c.confidence = score(ev.count, strength);
        c.first_seen = ev.first;
        c.last_seen = ev.last;
        out.push_back(std::move(c));
    }

    std::sort(out.begin(), out.end(), [](const DiscoveryCandidate& a, const DiscoveryCandidate& b) {
        return a.key < b.key;
    });
    return out;
}

DiscoveryReport RelationshipDiscovery::discover(const Scope& scope) {
    TimePoint since = clock_->now() - kDay * config_.lookback_days;
    auto items = store_->load_content_items(scope, since);
    return discover(scope, items, config_.min_co_occurrences,
                    std::chrono::hours(config_.time_window_hours));
}

DiscoveryReport RelationshipDiscovery::discover(const Scope& scope,
                                                const std::vector<ContentItem>& items,
                                                int min_co_occurrences,
                                                Duration time_window) {
    DiscoveryReport report;
    auto candidates = find_candidates(items, min_co_occurrences, time_window);
    report.candidates = candidates.size();

    std::set<EntityId> known;
    for (const auto& e : store_->load_entities(scope)) {
        known.insert(e.id);
    }

    for (const auto& cand : candidates) {
        if (!known.count(cand.key.source) || !known.count(cand.key.target)) {
            NETMAP_LOG_DEBUG("discovery pair references unknown entity", {
                log::StringField("scope", scope),
                log::StringField("pair", cand.key.to_string())});
            report.skipped++;
            continue;
        }

        std::optional<Relationship> existing;
        try {
            existing = store_->get_relationship(scope, cand.key);
        } catch (const StoreUnavailable& e) {
            report.failed++;
            report.complete = false;
            report.error = e.what();
            break;
        }

        Relationship rel;
        if (existing) {
            rel = *existing;
            bool changed = false;
            if (cand.confidence > rel.confidence + 1e-12) {
                rel.confidence = cand.confidence;
                changed = true;
            }
            if (cand.co_occurrences > rel.observation_count) {
                rel.observation_count = cand.co_occurrences;
                changed = true;
            }
            if (static_cast<double>(cand.co_occurrences) > rel.weight) {
                rel.weight = static_cast<double>(cand.co_occurrences);
                changed = true;
            }
            if (cand.last_seen > rel.last_observed) {
                rel.last_observed = cand.last_seen;
                changed = true;
            }
            if (rel.first_observed == TimePoint{} || cand.first_seen < rel.first_observed) {
                rel.first_observed = cand.first_seen;
                changed = true;
            }
            if (!changed) {
                report.skipped++;
                continue;
            }
        } else {
            rel.source = cand.key.source;
            rel.target = cand.key.target;
            rel.type = cand.key.type;
            rel.confidence = cand.confidence;
            rel.weight = static_cast<double>(cand.co_occurrences);
            rel.observation_count = cand.co_occurrences;
            rel.first_observed = cand.first_seen;
            rel.last_observed = cand.last_seen;
        }

        StoreResult result = store_->put_relationship(scope, rel);
        if (!result) {
            report.failed++;
            report.complete = false;
            report.error = store_error_code_to_string(result.code) + ": " + result.message;
            break;
        }

        if (existing) {
            report.updated++;
        } else {
            report.created++;
        }
        report.committed.push_back(cand.key);
    }

    if (report.complete) {
        NETMAP_LOG_INFO("relationship discovery finished", {
            log::StringField("scope", scope),
            log::IntField("candidates", static_cast<std::int64_t>(report.candidates)),
            log::IntField("created", static_cast<std::int64_t>(report.created)),
            log::IntField("updated", static_cast<std::int64_t>(report.updated)),
            log::IntField("skipped", static_cast<std::int64_t>(report.skipped))});
    } else {
        NETMAP_LOG_ERROR("relationship discovery stopped on store failure", {
            log::StringField("scope", scope),
            log::IntField("committed", static_cast<std::int64_t>(report.committed.size())),
            log::StringField("error", report.error)});
    }
    return report;
}

RelationshipStats RelationshipDiscovery::relationship_stats(const Scope& scope) const {
    RelationshipStats stats;
    auto rels = store_->load_relationships(scope);
    TimePoint recent_cutoff = clock_->now() - kDay * 7;

    double confidence_sum = 0.0;
    for (const auto& rel : rels) {
        stats.total++;
        stats.by_type[rel.type]++;
        confidence_sum += rel.confidence;
        if (rel.last_observed >= recent_cutoff) {
            stats.observed_last_7_days++;
        }
    }
    if (stats.total > 0) {
        stats.average_confidence = confidence_sum / static_cast<double>(stats.total);
    }
    return stats;
}

} // namespace netmap
