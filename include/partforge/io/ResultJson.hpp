#pragma once

#include <nlohmann/json.hpp>
#include "../cad/BuildEngine.hpp"

namespace partforge::cad {

// ADL hooks for nlohmann::json

void to_json(nlohmann::json& j, const BoundingBox& box);
void to_json(nlohmann::json& j, const OperationLogEntry& entry);
void to_json(nlohmann::json& j, const EngineSwitchEvent& event);
void to_json(nlohmann::json& j, const BuildMetadata& metadata);

/**
 * Keys: success, files, error, error_code, engine, operations_count,
 * failed_operation_index, operations_log, engine_switches, metadata.
 * Optional fields are omitted when unset; metadata is {} on failure.
 */
void to_json(nlohmann::json& j, const BuildResult& result);

} // namespace partforge::cad
