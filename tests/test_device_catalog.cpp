/**
 * Device catalog tests: both snapshot JSON forms, category aliases,
 * malformed input, and file loading.
 *
 * Run from build dir: ./test_device_catalog
 */

#include "device_catalog.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace domo_nlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- Object form (keys come back sorted) ---
    auto object_form = parse_device_snapshot(R"({
        "devices": {
            "ventilador_sala": {"name": "Ventilador de la sala", "type": "fan", "room": "sala",
                                "aliases": ["ventilador sala"]},
            "aire_dormitorio": {"name": "Aire", "type": "thermostat", "room": "dormitorio"},
            "luz_sala": {"name": "Luz de la sala", "type": "light", "room": "sala",
                         "aliases": ["luz sala", "living room light"]}
        }
    })");
    ASSERT(object_form.is_ok());
    if (object_form.is_ok()) {
        const auto& devices = object_form.value();
        ASSERT(devices.size() == 3);
        if (devices.size() == 3) {
            ASSERT(devices[0].device_key == "aire_dormitorio");
            ASSERT(devices[0].category == DeviceCategory::Climate);
            ASSERT(devices[0].aliases.empty());
            ASSERT(devices[1].device_key == "luz_sala");
            ASSERT(devices[1].category == DeviceCategory::Light);
            ASSERT(devices[1].aliases.size() == 2);
            ASSERT(devices[2].device_key == "ventilador_sala");
            ASSERT(devices[2].room == "sala");
        }
    }

    // --- Array form keeps file order; "category" wins over "type" ---
    auto array_form = parse_device_snapshot(R"({
        "devices": [
            {"device_key": "puerta_principal", "name": "Puerta", "category": "door", "type": "light"},
            {"device_key": "camara_patio", "category": "camera", "room": null, "aliases": null},
            {"device_key": "enchufe", "category": "switch"},
            {"device_key": "cosa", "category": "teleporter"}
        ]
    })");
    ASSERT(array_form.is_ok());
    if (array_form.is_ok()) {
        const auto& devices = array_form.value();
        ASSERT(devices.size() == 4);
        if (devices.size() == 4) {
            ASSERT(devices[0].device_key == "puerta_principal");
            ASSERT(devices[0].category == DeviceCategory::Door);
            ASSERT(devices[1].category == DeviceCategory::Sensor);
            ASSERT(devices[1].room.empty());
            ASSERT(devices[2].category == DeviceCategory::Other);
            ASSERT(devices[3].category == DeviceCategory::Other);
        }
    }

    // --- Malformed snapshots fail as a whole ---
    auto not_json = parse_device_snapshot("{devices: ");
    ASSERT(not_json.is_error());
    ASSERT(not_json.error().type == ErrorType::ParseError);

    ASSERT(parse_device_snapshot("[]").is_error());
    ASSERT(parse_device_snapshot(R"({"items": {}})").is_error());
    ASSERT(parse_device_snapshot(R"({"devices": 3})").is_error());
    ASSERT(parse_device_snapshot(R"({"devices": {"luz": {"aliases": "luz"}}})").is_error());
    ASSERT(parse_device_snapshot(R"({"devices": {"luz": {"aliases": ["ok", 3]}}})").is_error());
    ASSERT(parse_device_snapshot(R"({"devices": {"luz": {"name": 7}}})").is_error());
    ASSERT(parse_device_snapshot(R"({"devices": {"luz": "light"}})").is_error());
    ASSERT(parse_device_snapshot(R"({"devices": [{"name": "sin clave"}]})").is_error());

    auto empty = parse_device_snapshot(R"({"devices": {}})");
    ASSERT(empty.is_ok());
    if (empty.is_ok()) {
        ASSERT(empty.value().empty());
    }

    // --- Serialization is accepted back in array form ---
    DeviceRecord lamp;
    lamp.device_key = "lampara";
    lamp.name = "Lampara de pie";
    lamp.category = DeviceCategory::Light;
    lamp.room = "sala";
    lamp.aliases = {"lampara grande"};
    auto reparsed = parse_device_snapshot(device_snapshot_to_json({lamp}));
    ASSERT(reparsed.is_ok());
    if (reparsed.is_ok() && reparsed.value().size() == 1) {
        const auto& d = reparsed.value()[0];
        ASSERT(d.device_key == "lampara");
        ASSERT(d.category == DeviceCategory::Light);
        ASSERT(d.aliases.size() == 1);
    }

    // --- Files ---
    auto missing = load_device_snapshot("/nonexistent/domo_nlu/devices.json");
    ASSERT(missing.is_error());
    ASSERT(missing.error().type == ErrorType::IOError);

    const std::string path = "/tmp/domo_nlu_test_devices.json";
    {
        std::ofstream out(path);
        out << R"({"devices": {"luz_cocina": {"name": "Luz de la cocina", "type": "light", "room": "cocina"}}})";
    }
    auto from_file = load_device_snapshot(path);
    ASSERT(from_file.is_ok());
    if (from_file.is_ok()) {
        ASSERT(from_file.value().size() == 1);
    }

    {
        std::ofstream out(path);
        out << "not json";
    }
    auto broken_file = load_device_snapshot(path);
    ASSERT(broken_file.is_error());
    ASSERT(broken_file.error().type == ErrorType::ParseError);
    std::remove(path.c_str());

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All device catalog tests passed.\n";
    return 0;
}
