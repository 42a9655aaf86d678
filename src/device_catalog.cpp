#include "device_catalog.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace domo_nlu {

namespace {

Result<DeviceRecord> parse_device(const std::string& key, const json& d, const std::string& where) {
    if (!d.is_object()) {
        return make_parse_error(where + ": device entry must be an object");
    }

    DeviceRecord record;
    record.device_key = key;

    if (d.contains("name")) {
        if (!d["name"].is_string()) return make_parse_error(where + ": \"name\" must be a string");
        record.name = d["name"].get<std::string>();
    }

    // "category" preferred; "type" is the older field name
    const char* category_field = d.contains("category") ? "category" : (d.contains("type") ? "type" : nullptr);
    if (category_field) {
        if (!d[category_field].is_string()) {
            return make_parse_error(where + ": \"" + category_field + "\" must be a string");
        }
        record.category = parse_category(d[category_field].get<std::string>());
    }

    if (d.contains("room") && !d["room"].is_null()) {
        if (!d["room"].is_string()) return make_parse_error(where + ": \"room\" must be a string");
        record.room = d["room"].get<std::string>();
    }

    if (d.contains("aliases") && !d["aliases"].is_null()) {
        if (!d["aliases"].is_array()) return make_parse_error(where + ": \"aliases\" must be an array");
        for (const auto& alias : d["aliases"]) {
            if (!alias.is_string()) return make_parse_error(where + ": aliases must be strings");
            record.aliases.push_back(alias.get<std::string>());
        }
    }

    return record;
}

} // namespace

Result<std::vector<DeviceRecord>> parse_device_snapshot(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return make_parse_error("device snapshot is not valid JSON: " + std::string(e.what()));
    }

    if (!j.is_object() || !j.contains("devices")) {
        return make_parse_error("device snapshot must be an object with a \"devices\" field");
    }

    std::vector<DeviceRecord> devices;
    const auto& list = j["devices"];

    if (list.is_object()) {
        for (auto it = list.begin(); it != list.end(); ++it) {
            auto parsed = parse_device(it.key(), it.value(), "device \"" + it.key() + "\"");
            if (parsed.is_error()) return parsed.error();
            devices.push_back(parsed.value());
        }
    } else if (list.is_array()) {
        for (size_t i = 0; i < list.size(); ++i) {
            const auto& d = list[i];
            std::string where = "devices[" + std::to_string(i) + "]";
            if (!d.is_object() || !d.contains("device_key") || !d["device_key"].is_string()) {
                return make_parse_error(where + ": missing string \"device_key\"");
            }
            auto parsed = parse_device(d["device_key"].get<std::string>(), d, where);
            if (parsed.is_error()) return parsed.error();
            devices.push_back(parsed.value());
        }
    } else {
        return make_parse_error("\"devices\" must be an object or an array");
    }

    return devices;
}

Result<std::vector<DeviceRecord>> load_device_snapshot(const std::string& path) {
    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        return make_io_error("could not open device file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parse_device_snapshot(buffer.str());
    if (parsed.is_error()) {
        return make_parse_error(path + ": " + parsed.error().message);
    }
    LOG_VOCAB("read " + std::to_string(parsed.value().size()) + " device(s) from " + path);
    return parsed;
}

std::string device_snapshot_to_json(const std::vector<DeviceRecord>& devices) {
    json list = json::array();
    for (const auto& device : devices) {
        json d;
        d["device_key"] = device.device_key;
        d["name"] = device.name;
        d["category"] = to_string(device.category);
        d["room"] = device.room;
        d["aliases"] = device.aliases;
        list.push_back(d);
    }
    json j;
    j["devices"] = list;
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace domo_nlu
