/**
 * Entity resolver tests: exact / n-gram / partial cascade, room detection
 * and override, snapshot validation, and reload semantics.
 *
 * Run from build dir: ./test_entity_resolver
 */

#include "entity_resolver.h"
#include <iostream>
#include <string>
#include <vector>

using namespace domo_nlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static DeviceRecord device(const std::string& key, const std::string& name, DeviceCategory category,
                           const std::string& room, const std::vector<std::string>& aliases) {
    DeviceRecord record;
    record.device_key = key;
    record.name = name;
    record.category = category;
    record.room = room;
    record.aliases = aliases;
    return record;
}

int main() {
    // --- Empty vocabulary ---
    EntityResolver empty;
    ASSERT(empty.snapshot() != nullptr);
    ASSERT(empty.snapshot()->devices.empty());
    DeviceMatch nothing = empty.match("enciende la luz");
    ASSERT(!nothing.device_key);
    ASSERT(nothing.confidence == 0.0f);
    ASSERT(nothing.strategy == MatchStrategy::None);
    // Built-in rooms are available before any snapshot
    ASSERT(empty.match_room("enciende la luz de la cocina") == std::optional<std::string>("cocina"));

    EntityResolver resolver;
    auto loaded = resolver.reload({
        device("luz_comedor", "Luz del comedor", DeviceCategory::Light, "comedor", {"luz comedor"}),
        device("ventilador_sala", "Ventilador de la sala", DeviceCategory::Fan, "sala", {"ventilador de la sala"}),
        device("lamp_1", "Lampara de pie", DeviceCategory::Light, "Living", {}),
        device("puerta_garaje", "Puerta del garaje", DeviceCategory::Door, "garaje", {"porton"}),
    });
    ASSERT(loaded.is_ok());
    ASSERT(resolver.snapshot()->devices.size() == 4);

    // --- Exact alias ---
    DeviceMatch exact = resolver.match("enciende la luz del comedor");
    ASSERT(exact.device_key == std::optional<std::string>("luz_comedor"));
    ASSERT(exact.strategy == MatchStrategy::ExactAlias);
    ASSERT(exact.confidence == 0.95f);
    ASSERT(exact.matched_alias == "luz del comedor");
    ASSERT(exact.category == DeviceCategory::Light);
    ASSERT(exact.detected_room == std::optional<std::string>("comedor"));
    ASSERT(!exact.room_override);

    // Aliases go through the normalizer too
    DeviceMatch accented = resolver.match("Abre el PORTÓN");
    ASSERT(accented.device_key == std::optional<std::string>("puerta_garaje"));
    ASSERT(accented.strategy == MatchStrategy::ExactAlias);

    // --- N-gram over stopword-stripped text ---
    DeviceMatch ngram = resolver.match("prende lampara del pie");
    ASSERT(ngram.device_key == std::optional<std::string>("lamp_1"));
    ASSERT(ngram.strategy == MatchStrategy::NGram);
    ASSERT(ngram.confidence == 0.85f);

    // --- Partial token ---
    DeviceMatch partial = resolver.match("apaga el ventilador");
    ASSERT(partial.device_key == std::optional<std::string>("ventilador_sala"));
    ASSERT(partial.strategy == MatchStrategy::Partial);
    ASSERT(partial.confidence == 0.70f);
    ASSERT(partial.device_room == std::optional<std::string>("sala"));

    // Short or stopword tokens never produce a partial hit
    ASSERT(!resolver.match("apaga el pie").device_key);
    ASSERT(!resolver.match("abre la del").device_key);
    ASSERT(!resolver.match("hola mundo").device_key);

    // --- Device rooms are canonicalized through the room vocabulary ---
    auto table = resolver.snapshot();
    bool found_lamp = false;
    bool found_garage = false;
    for (const auto& d : table->devices) {
        if (d.device_key == "lamp_1") {
            found_lamp = true;
            ASSERT(d.room == "sala");
        }
        if (d.device_key == "puerta_garaje") {
            found_garage = true;
            ASSERT(d.room == "garage");
        }
    }
    ASSERT(found_lamp);
    ASSERT(found_garage);

    // --- Rooms ---
    ASSERT(resolver.match_room("apaga todo en el living") == std::optional<std::string>("sala"));
    ASSERT(resolver.match_room("prende la luz del cuarto principal") == std::optional<std::string>("dormitorio_principal"));
    ASSERT(resolver.match_room("luz del baño") == std::optional<std::string>("bano"));
    ASSERT(!resolver.match_room("enciende la luz"));

    // --- Room override: same alias in two rooms ---
    EntityResolver shared;
    ASSERT(shared.reload({
        device("luz_sala", "Lampara sala", DeviceCategory::Light, "sala", {"luz"}),
        device("luz_comedor", "Lampara comedor", DeviceCategory::Light, "comedor", {"luz"}),
        device("ventilador_comedor", "Ventilador comedor", DeviceCategory::Fan, "comedor", {}),
    }).is_ok());

    DeviceMatch first = shared.match("enciende la luz");
    ASSERT(first.device_key == std::optional<std::string>("luz_sala"));
    ASSERT(!first.room_override);

    DeviceMatch by_room = shared.match("enciende la luz del comedor");
    ASSERT(by_room.device_key == std::optional<std::string>("luz_comedor"));
    ASSERT(by_room.detected_room == std::optional<std::string>("comedor"));
    ASSERT(by_room.room_override);
    ASSERT(by_room.category == DeviceCategory::Light);

    // A room never drags in a device of another category
    DeviceMatch sala_light = shared.match("enciende la luz de la sala");
    ASSERT(sala_light.device_key == std::optional<std::string>("luz_sala"));

    // A room only picks among devices sharing the winning alias; a weaker
    // partial hit on another device never displaces an exact alias
    EntityResolver doors;
    ASSERT(doors.reload({
        device("puerta_principal", "Puerta principal", DeviceCategory::Door, "entrada", {"front door"}),
        device("puerta_patio", "Puerta del patio", DeviceCategory::Door, "patio", {"patio door"}),
        device("puerta_dormitorio_principal", "Puerta del dormitorio principal", DeviceCategory::Door,
               "dormitorio principal", {}),
    }).is_ok());

    DeviceMatch front = doors.match("open the front door");
    ASSERT(front.device_key == std::optional<std::string>("puerta_principal"));
    ASSERT(front.strategy == MatchStrategy::ExactAlias);
    ASSERT(front.confidence == 0.95f);
    ASSERT(!front.room_override);

    DeviceMatch principal = doors.match("abre la puerta principal");
    ASSERT(principal.device_key == std::optional<std::string>("puerta_principal"));
    ASSERT(principal.strategy == MatchStrategy::ExactAlias);
    ASSERT(principal.confidence == 0.95f);
    ASSERT(!principal.room_override);

    ASSERT(doors.match("abre la puerta del patio").device_key == std::optional<std::string>("puerta_patio"));

    // --- Validation: rejected snapshots keep the previous table ---
    uint64_t version = resolver.snapshot()->version;

    auto duplicate = resolver.reload({
        device("luz_cocina", "Luz cocina", DeviceCategory::Light, "cocina", {}),
        device("luz_cocina", "Otra luz", DeviceCategory::Light, "cocina", {}),
    });
    ASSERT(duplicate.is_error());
    ASSERT(duplicate.error().type == ErrorType::VocabularyError);
    ASSERT(resolver.snapshot()->version == version);
    ASSERT(resolver.match("enciende la luz del comedor").device_key == std::optional<std::string>("luz_comedor"));

    auto blank_key = resolver.reload({device("  ", "Algo", DeviceCategory::Other, "", {})});
    ASSERT(blank_key.is_error());
    ASSERT(blank_key.error().type == ErrorType::VocabularyError);

    auto unnamed = resolver.reload({device("!!!", "", DeviceCategory::Other, "", {"?"})});
    ASSERT(unnamed.is_error());
    ASSERT(resolver.snapshot()->version == version);

    // --- Successful reload replaces the whole table ---
    auto replaced = resolver.reload({
        device("luz_cocina", "Luz de la cocina", DeviceCategory::Light, "cocina", {"kitchen light"}),
    });
    ASSERT(replaced.is_ok());
    ASSERT(resolver.snapshot()->version > version);
    ASSERT(!resolver.match("enciende la luz del comedor").device_key);
    ASSERT(resolver.match("turn on the kitchen light").device_key == std::optional<std::string>("luz_cocina"));

    // A snapshot held by a caller is unaffected by later reloads
    auto held = resolver.snapshot();
    ASSERT(resolver.reload({}).is_ok());
    ASSERT(resolver.match("turn on the kitchen light", *held).device_key == std::optional<std::string>("luz_cocina"));
    ASSERT(!resolver.match("turn on the kitchen light").device_key);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All entity resolver tests passed.\n";
    return 0;
}
