#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Operation.hpp"

namespace partforge::cad {

/**
 * @brief Declared job hints used for provider selection
 */
struct BuildHints {
    bool isAssembly = false;
    bool batchMode = false;
    bool optimizationRequired = false;
};

/**
 * @brief Single-shot primitive for requests without an operation list
 */
struct StandardShapeParams {
    std::string shapeType = "box";
    double length = 100;
    double width = 100;
    double height = 100;
    double diameter = 50;
};

struct FrameParams {
    double riderHeight = 180;   // Request units (bicycle requests default to cm)
    std::string material = "aluminum";
};

/**
 * @brief Which generator a request is routed to
 */
enum class BuildPath {
    OperationPipeline,
    SpecializedFrame,
    StandardShape
};

const char* buildPathName(BuildPath path);

/**
 * @brief Fully validated build request
 */
struct DesignRequest {
    std::string productType;
    Units units = Units::Millimeters;
    BuildPath path = BuildPath::StandardShape;
    BuildHints hints;
    std::optional<EngineKind> engine;   // Explicit choice overrides hints

    std::vector<Operation> operations;
    StandardShapeParams standard;
    FrameParams frame;
};

} // namespace partforge::cad
