#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "Types.hpp"

namespace partforge::cad {

// ===========================================================================
// Operation Kinds
// ===========================================================================

enum class OperationKind {
    SketchRectangle,
    SketchCircle,
    SketchPolygon,
    Extrude,
    Revolve,
    Cut,
    Fuse,
    Common,
    Fillet,
    Chamfer,
    Shell,
    AddLegs,
    AddHoles,
    AddSupports,
    LinearPattern,
    CircularPattern
};

inline constexpr int kOperationKindCount = 16;

/// Wire name used in request documents ("sketch_rectangle", "extrude", ...)
const char* operationKindName(OperationKind kind);
std::optional<OperationKind> parseOperationKind(const std::string& name);

bool isSketchKind(OperationKind kind);

// ===========================================================================
// Per-kind Parameters
//
// Lengths are in request units until the adapter normalizes them.
// ===========================================================================

/// Upper bound on every instance count (legs, supports, pattern copies).
inline constexpr int kMaxFeatureCount = 1000;

struct SketchRectangleParams {
    double width = 100;
    double height = 100;
    bool centered = true;
};

struct SketchCircleParams {
    double radius = 50;
};

struct SketchPolygonParams {
    std::vector<Vector3> points;
    bool closed = true;
};

struct ExtrudeParams {
    double height = 10;
    Vector3 direction{0, 0, 1};
};

struct RevolveParams {
    double angleDegrees = 360;
    Vector3 axis{0, 0, 1};
};

/**
 * @brief Tool solid for Cut, Fuse and Common
 *
 * toolType is kept as text; anything other than "box" or "cylinder" is
 * rejected when the operation executes.
 */
struct BooleanToolParams {
    std::string toolType = "box";
    double length = 10;
    double width = 10;
    double height = 10;
    double radius = 5;
    Vector3 position{0, 0, 0};
};

struct EdgeModifierParams {
    double size = 1;                         // Fillet radius or chamfer distance
    std::optional<std::vector<int>> edges;   // nullopt selects every edge
};

struct ShellParams {
    double thickness = 2;
    std::vector<int> facesToRemove{0};
};

struct AddLegsParams {
    int count = 4;
    double height = 700;
    double radius = 25;
    double inset = 50;
};

struct AddHolesParams {
    std::vector<Vector3> positions;
    double diameter = 3;
    double depth = 10;
};

struct AddSupportsParams {
    int count = 2;
    double thickness = 5;
    double height = 50;
};

struct LinearPatternParams {
    Vector3 direction{1, 0, 0};
    double spacing = 10;
    int count = 3;
};

struct CircularPatternParams {
    Vector3 axis{0, 0, 1};
    int count = 6;
};

using OperationParams = std::variant<
    SketchRectangleParams,
    SketchCircleParams,
    SketchPolygonParams,
    ExtrudeParams,
    RevolveParams,
    BooleanToolParams,
    EdgeModifierParams,
    ShellParams,
    AddLegsParams,
    AddHolesParams,
    AddSupportsParams,
    LinearPatternParams,
    CircularPatternParams>;

/**
 * @brief One step of a design: a kind plus its parameter bag
 */
struct Operation {
    OperationKind kind = OperationKind::SketchRectangle;
    OperationParams params;

    /// Operation of the given kind with every parameter at its default.
    static Operation withDefaults(OperationKind kind);
};

// ===========================================================================
// Execution Records
// ===========================================================================

enum class OperationStatus {
    Success,
    Failed
};

/**
 * @brief Append-only audit record for one executed operation
 */
struct OperationLogEntry {
    size_t index = 0;         // 1-based position in the operation list
    OperationKind kind = OperationKind::SketchRectangle;
    OperationStatus status = OperationStatus::Success;
    std::string errorCode;
    std::string error;
    std::string engine;
    double durationMs = 0;
};

/**
 * @brief Router decision to move the rest of a build to another provider
 */
struct EngineSwitchEvent {
    size_t operationIndex = 0;   // 1-based, the operation that triggered it
    std::string from;
    std::string to;
    std::string reason;
};

} // namespace partforge::cad
