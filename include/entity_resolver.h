#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <unordered_map>
#include <cstdint>

namespace domo_nlu {

/**
 * @brief Result of resolving a device reference
 */
struct DeviceMatch {
    std::optional<std::string> device_key;
    float confidence = 0.0f;                   ///< 0 whenever device_key is empty
    MatchStrategy strategy = MatchStrategy::None;
    std::string matched_alias;
    DeviceCategory category = DeviceCategory::Other;
    std::optional<std::string> device_room;    ///< Canonical room declared for the device
    std::optional<std::string> detected_room;  ///< Canonical room found in the text
    bool room_override = false;                ///< Detected room displaced the top candidate
};

/**
 * @brief Built-in room with its surface forms
 */
struct RoomDefinition {
    std::string canonical;
    std::vector<std::string> aliases;
};

/// Spanish/English room vocabulary shipped with the resolver
const std::vector<RoomDefinition>& builtin_rooms();

/**
 * @brief Inverted alias index over one vocabulary (devices or rooms)
 *
 * Each (surface form, entry) pair is stored once. Entries keep registration order.
 */
struct AliasIndex {
    struct Alias {
        std::string text;            ///< Normalized surface form
        std::vector<size_t> entries; ///< Owning entries, registration order
        size_t token_count = 0;
    };

    std::vector<Alias> aliases;
    std::unordered_map<std::string, size_t> by_text;                  ///< surface form -> aliases[]
    std::unordered_map<std::string, std::vector<size_t>> by_content;  ///< stopword-stripped form -> entries
    std::unordered_map<std::string, std::vector<size_t>> by_token;    ///< content token -> multi-word aliases[]

    void add(const std::string& surface, size_t entry);
};

/**
 * @brief Immutable vocabulary snapshot; published whole, never edited in place
 */
struct AliasTable {
    std::vector<DeviceRecord> devices;  ///< Snapshot order; room rewritten to its canonical name
    AliasIndex device_index;
    std::vector<std::string> rooms;     ///< Canonical room names: built-ins, then snapshot-declared
    AliasIndex room_index;
    uint64_t version = 0;
};

/**
 * @brief Resolves device and room references with a three-strategy cascade
 *
 * Strategies run in order and the first one with a hit wins:
 * exact alias (token-bounded substring), 2-3 token n-grams over
 * stopword-stripped text, then partial token match inside multi-word aliases.
 * A room found in the text picks among the devices that share the winning
 * alias (same strategy, same category as the top candidate); it never swaps
 * in a device that matched through a different alias.
 *
 * Lookups read one atomically loaded snapshot; reload() builds a complete
 * replacement and publishes it with a single atomic store.
 */
class EntityResolver {
public:
    explicit EntityResolver(const ResolverConfig& config = ResolverConfig(),
                            const NormalizerConfig& normalizer_config = NormalizerConfig());
    ~EntityResolver();

    EntityResolver(const EntityResolver&) = delete;
    EntityResolver& operator=(const EntityResolver&) = delete;

    /**
     * @brief Resolve a device against the current snapshot
     */
    DeviceMatch match(const std::string& text) const;

    /**
     * @brief Resolve a device against a snapshot the caller already holds
     */
    DeviceMatch match(const std::string& text, const AliasTable& table) const;

    /**
     * @brief Canonical room mentioned in the text, if any
     */
    std::optional<std::string> match_room(const std::string& text) const;
    std::optional<std::string> match_room(const std::string& text, const AliasTable& table) const;

    /**
     * @brief Validate and publish a new device snapshot
     * @return VocabularyError when the snapshot is rejected; the previous table keeps serving
     */
    Result<void> reload(const std::vector<DeviceRecord>& snapshot);

    /**
     * @brief Current snapshot (shared, read-only)
     */
    std::shared_ptr<const AliasTable> snapshot() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace domo_nlu
