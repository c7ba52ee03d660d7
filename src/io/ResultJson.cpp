/**
 * ResultJson.cpp - BuildResult serialization
 */

#include "partforge/io/ResultJson.hpp"

namespace partforge::cad {

using nlohmann::json;

namespace {

json vec3(const Vector3& v) {
    return json::array({v.x, v.y, v.z});
}

} // anonymous namespace

void to_json(json& j, const BoundingBox& box) {
    j = {
        {"min", vec3(box.min)},
        {"max", vec3(box.max)},
        {"size", vec3(box.size())}
    };
}

void to_json(json& j, const OperationLogEntry& entry) {
    j = {
        {"index", entry.index},
        {"type", operationKindName(entry.kind)},
        {"status", entry.status == OperationStatus::Success ? "success" : "failed"},
        {"engine", entry.engine},
        {"duration_ms", entry.durationMs}
    };
    if (entry.status == OperationStatus::Failed) {
        j["error"] = entry.error;
        j["error_code"] = entry.errorCode;
    }
}

void to_json(json& j, const EngineSwitchEvent& event) {
    j = {
        {"operation_index", event.operationIndex},
        {"from", event.from},
        {"to", event.to},
        {"reason", event.reason}
    };
}

void to_json(json& j, const BuildMetadata& metadata) {
    j = {
        {"build_id", metadata.buildId},
        {"product_type", metadata.productType},
        {"build_path", metadata.buildPath},
        {"engine", metadata.engine},
        {"kernel_version", metadata.kernelVersion},
        {"units", metadata.units},
        {"bounding_box", metadata.bounds},
        {"volume", metadata.volume},
        {"surface_area", metadata.surfaceArea},
        {"vertex_count", metadata.vertexCount},
        {"triangle_count", metadata.triangleCount},
        {"watertight", metadata.watertight},
        {"estimated_memory_bytes", metadata.estimatedMemoryBytes},
        {"operations_count", metadata.operationsCount}
    };
    if (!metadata.shapeType.empty()) {
        j["shape_type"] = metadata.shapeType;
    }
}

void to_json(json& j, const BuildResult& result) {
    j = {
        {"success", result.success},
        {"files", result.files},
        {"engine", result.engine},
        {"operations_log", result.operationsLog},
        {"engine_switches", result.engineSwitches},
        {"duration_ms", result.durationMs}
    };

    if (!result.success) {
        j["error"] = result.error;
        j["error_code"] = result.errorCode;
    }
    if (result.operationsCount.has_value()) {
        j["operations_count"] = *result.operationsCount;
    }
    if (result.failedOperationIndex.has_value()) {
        j["failed_operation_index"] = *result.failedOperationIndex;
    }
    j["metadata"] = result.metadata.has_value() ? json(*result.metadata) : json::object();
}

} // namespace partforge::cad
