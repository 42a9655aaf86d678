#include "entity_resolver.h"
#include "logger.h"
#include "normalizer.h"
#include "text_match.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <sstream>
#include <unordered_set>

namespace domo_nlu {

void AliasIndex::add(const std::string& surface, size_t entry) {
    if (surface.empty()) {
        return;
    }

    auto found = by_text.find(surface);
    size_t alias_index;
    if (found == by_text.end()) {
        alias_index = aliases.size();
        Alias alias;
        alias.text = surface;
        std::vector<std::string> tokens = utils::split_words(surface);
        alias.token_count = tokens.size();
        aliases.push_back(alias);
        by_text.emplace(surface, alias_index);

        if (tokens.size() >= 2) {
            for (const auto& token : tokens) {
                if (Normalizer::is_stopword(token)) continue;
                auto& list = by_token[token];
                if (std::find(list.begin(), list.end(), alias_index) == list.end()) {
                    list.push_back(alias_index);
                }
            }
        }
    } else {
        alias_index = found->second;
    }

    auto& entries = aliases[alias_index].entries;
    if (std::find(entries.begin(), entries.end(), entry) != entries.end()) {
        return;
    }
    entries.push_back(entry);

    std::vector<std::string> content;
    for (const auto& token : utils::split_words(surface)) {
        if (!Normalizer::is_stopword(token)) content.push_back(token);
    }
    if (content.size() >= 2 && content.size() <= 3) {
        auto& list = by_content[utils::join_words(content)];
        if (std::find(list.begin(), list.end(), entry) == list.end()) {
            list.push_back(entry);
        }
    }
}

namespace {

struct Hit {
    size_t entry;
    MatchStrategy strategy;
    std::string alias;
};

/// Candidates from all strategies in cascade order, each entry reported once at its best strategy
std::vector<Hit> cascade(const AliasIndex& index, const std::string& text,
                         const std::vector<std::string>& tokens, size_t min_partial_length,
                         bool first_strategy_only) {
    std::vector<Hit> hits;
    std::unordered_set<size_t> seen;
    auto push = [&](size_t entry, MatchStrategy strategy, const std::string& alias) {
        if (seen.insert(entry).second) {
            hits.push_back({entry, strategy, alias});
        }
    };

    // 1. Exact alias: longest alias first, then leftmost, then registration order
    struct ExactHit {
        size_t alias;
        size_t position;
    };
    std::vector<ExactHit> exact;
    for (size_t i = 0; i < index.aliases.size(); ++i) {
        size_t pos = find_phrase(text, index.aliases[i].text);
        if (pos != std::string::npos) {
            exact.push_back({i, pos});
        }
    }
    std::sort(exact.begin(), exact.end(), [&](const ExactHit& a, const ExactHit& b) {
        size_t la = index.aliases[a.alias].text.size();
        size_t lb = index.aliases[b.alias].text.size();
        if (la != lb) return la > lb;
        if (a.position != b.position) return a.position < b.position;
        return a.alias < b.alias;
    });
    for (const auto& hit : exact) {
        const auto& alias = index.aliases[hit.alias];
        for (size_t entry : alias.entries) {
            push(entry, MatchStrategy::ExactAlias, alias.text);
        }
    }
    if (first_strategy_only && !hits.empty()) return hits;

    // 2. N-grams (3 then 2 tokens) over stopword-stripped text
    std::vector<std::string> content;
    for (const auto& token : tokens) {
        if (!Normalizer::is_stopword(token)) content.push_back(token);
    }
    for (size_t n = 3; n >= 2; --n) {
        if (content.size() < n) continue;
        for (size_t i = 0; i + n <= content.size(); ++i) {
            std::string window = utils::join_words(content, i, i + n);
            auto it = index.by_content.find(window);
            if (it == index.by_content.end()) continue;
            for (size_t entry : it->second) {
                push(entry, MatchStrategy::NGram, window);
            }
        }
    }
    if (first_strategy_only && !hits.empty()) return hits;

    // 3. Partial: one content token inside a multi-word alias
    for (const auto& token : tokens) {
        if (token.size() < min_partial_length || Normalizer::is_stopword(token)) continue;
        auto it = index.by_token.find(token);
        if (it == index.by_token.end()) continue;
        for (size_t alias_index : it->second) {
            const auto& alias = index.aliases[alias_index];
            for (size_t entry : alias.entries) {
                push(entry, MatchStrategy::Partial, alias.text);
            }
        }
    }
    return hits;
}

} // namespace

class EntityResolver::Impl {
public:
    Impl(const ResolverConfig& config, const NormalizerConfig& normalizer_config)
        : config_(config), normalizer_(normalizer_config), next_version_(1) {
        auto initial = build_table({}, 0);
        table_ = initial.value();
    }

    std::shared_ptr<const AliasTable> snapshot() const {
        return std::atomic_load(&table_);
    }

    DeviceMatch match(const std::string& text, const AliasTable& table) const {
        DeviceMatch result;
        std::string normalized = normalizer_.normalize(text);
        if (normalized.empty()) {
            return result;
        }
        std::vector<std::string> tokens = utils::split_words(normalized);

        result.detected_room = room_in(normalized, tokens, table);

        std::vector<Hit> hits = cascade(table.device_index, normalized, tokens,
                                        static_cast<size_t>(config_.min_partial_token_length), false);
        if (hits.empty()) {
            LOG_ENTITY("no device in \"" + normalized + "\"");
            return result;
        }

        // Override only among devices that share the winning alias
        size_t chosen = 0;
        if (result.detected_room) {
            const Hit& top = hits[0];
            DeviceCategory top_category = table.devices[top.entry].category;
            for (size_t i = 0; i < hits.size(); ++i) {
                if (hits[i].strategy != top.strategy || hits[i].alias != top.alias) {
                    continue;
                }
                const auto& device = table.devices[hits[i].entry];
                if (device.category == top_category && device.room == *result.detected_room) {
                    chosen = i;
                    break;
                }
            }
        }

        const Hit& hit = hits[chosen];
        const DeviceRecord& device = table.devices[hit.entry];
        result.device_key = device.device_key;
        result.strategy = hit.strategy;
        result.confidence = clamp_confidence(strategy_confidence(hit.strategy));
        result.matched_alias = hit.alias;
        result.category = device.category;
        if (!device.room.empty()) {
            result.device_room = device.room;
        }
        result.room_override = chosen != 0;

        std::ostringstream oss;
        oss << device.device_key << " via " << to_string(hit.strategy) << " \"" << hit.alias
            << "\" conf=" << result.confidence;
        if (result.detected_room) oss << " room=" << *result.detected_room;
        if (result.room_override) oss << " (room override)";
        LOG_ENTITY(oss.str());
        return result;
    }

    std::optional<std::string> match_room(const std::string& text, const AliasTable& table) const {
        std::string normalized = normalizer_.normalize(text);
        return room_in(normalized, utils::split_words(normalized), table);
    }

    Result<void> reload(const std::vector<DeviceRecord>& snapshot) {
        uint64_t version = next_version_.fetch_add(1);
        auto built = build_table(snapshot, version);
        if (built.is_error()) {
            LOG_VOCAB("reload rejected, keeping previous vocabulary: " + built.error().message);
            return built.error();
        }
        std::atomic_store(&table_, built.value());
        LOG_VOCAB("loaded " + std::to_string(snapshot.size()) + " device(s), version " + std::to_string(version));
        return Result<void>();
    }

private:
    ResolverConfig config_;
    Normalizer normalizer_;
    std::atomic<uint64_t> next_version_;
    std::shared_ptr<const AliasTable> table_;  // accessed only through std::atomic_load/atomic_store

    float strategy_confidence(MatchStrategy strategy) const {
        switch (strategy) {
            case MatchStrategy::ExactAlias: return config_.exact_confidence;
            case MatchStrategy::NGram:      return config_.ngram_confidence;
            case MatchStrategy::Partial:    return config_.partial_confidence;
            case MatchStrategy::None:       return 0.0f;
        }
        return 0.0f;
    }

    std::optional<std::string> room_in(const std::string& normalized, const std::vector<std::string>& tokens,
                                       const AliasTable& table) const {
        if (normalized.empty()) {
            return std::nullopt;
        }
        std::vector<Hit> hits = cascade(table.room_index, normalized, tokens,
                                        static_cast<size_t>(config_.min_partial_token_length), true);
        if (hits.empty()) {
            return std::nullopt;
        }
        return table.rooms[hits.front().entry];
    }

    Result<std::shared_ptr<const AliasTable>> build_table(const std::vector<DeviceRecord>& snapshot,
                                                          uint64_t version) const {
        auto table = std::make_shared<AliasTable>();
        table->version = version;

        // Canonical room names are registered before any alias
        const auto& rooms = builtin_rooms();
        for (const auto& room : rooms) {
            table->room_index.add(normalizer_.normalize(room.canonical), table->rooms.size());
            table->rooms.push_back(room.canonical);
        }
        for (size_t i = 0; i < rooms.size(); ++i) {
            for (const auto& alias : rooms[i].aliases) {
                table->room_index.add(normalizer_.normalize(alias), i);
            }
        }

        std::unordered_set<std::string> keys;
        for (size_t position = 0; position < snapshot.size(); ++position) {
            DeviceRecord device = snapshot[position];
            device.device_key = utils::trim_copy(device.device_key);
            if (device.device_key.empty()) {
                return make_vocabulary_error("device at position " + std::to_string(position) + " has an empty key");
            }
            if (!keys.insert(device.device_key).second) {
                return make_vocabulary_error("duplicate device key: " + device.device_key);
            }

            std::string room = normalizer_.normalize(device.room);
            if (!room.empty()) {
                auto found = table->room_index.by_text.find(room);
                if (found != table->room_index.by_text.end()) {
                    room = table->rooms[table->room_index.aliases[found->second].entries.front()];
                } else {
                    table->room_index.add(room, table->rooms.size());
                    table->rooms.push_back(room);
                }
            }
            device.room = room;

            std::vector<std::string> surfaces;
            surfaces.push_back(normalizer_.normalize(device.device_key));
            surfaces.push_back(normalizer_.normalize(device.name));
            for (const auto& alias : device.aliases) {
                surfaces.push_back(normalizer_.normalize(alias));
            }
            size_t entry = table->devices.size();
            bool any_surface = false;
            for (const auto& surface : surfaces) {
                if (surface.empty()) continue;
                table->device_index.add(surface, entry);
                any_surface = true;
            }
            if (!any_surface) {
                return make_vocabulary_error("device " + device.device_key + " has no usable name or alias");
            }
            table->devices.push_back(device);
        }

        return std::shared_ptr<const AliasTable>(table);
    }
};

EntityResolver::EntityResolver(const ResolverConfig& config, const NormalizerConfig& normalizer_config)
    : pimpl_(std::make_unique<Impl>(config, normalizer_config)) {}

EntityResolver::~EntityResolver() = default;

DeviceMatch EntityResolver::match(const std::string& text) const {
    auto table = pimpl_->snapshot();
    return pimpl_->match(text, *table);
}

DeviceMatch EntityResolver::match(const std::string& text, const AliasTable& table) const {
    return pimpl_->match(text, table);
}

std::optional<std::string> EntityResolver::match_room(const std::string& text) const {
    auto table = pimpl_->snapshot();
    return pimpl_->match_room(text, *table);
}

std::optional<std::string> EntityResolver::match_room(const std::string& text, const AliasTable& table) const {
    return pimpl_->match_room(text, table);
}

Result<void> EntityResolver::reload(const std::vector<DeviceRecord>& snapshot) {
    return pimpl_->reload(snapshot);
}

std::shared_ptr<const AliasTable> EntityResolver::snapshot() const {
    return pimpl_->snapshot();
}

} // namespace domo_nlu
