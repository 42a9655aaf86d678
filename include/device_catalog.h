#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>

namespace domo_nlu {

/**
 * @brief Parse a device vocabulary snapshot from JSON text
 *
 * Accepts either form:
 *   {"devices": {"luz_sala": {"name": ..., "type": ..., "room": ..., "aliases": [...]}}}
 *   {"devices": [{"device_key": ..., "name": ..., "category": ..., "room": ..., "aliases": [...]}]}
 * The object form yields keys in sorted order; the array form keeps file order.
 * Nothing is returned partially: any malformed entry fails the whole snapshot.
 */
Result<std::vector<DeviceRecord>> parse_device_snapshot(const std::string& json_text);

/**
 * @brief Read and parse a snapshot file
 */
Result<std::vector<DeviceRecord>> load_device_snapshot(const std::string& path);

/**
 * @brief Serialize records in the array form accepted by parse_device_snapshot()
 */
std::string device_snapshot_to_json(const std::vector<DeviceRecord>& devices);

} // namespace domo_nlu
