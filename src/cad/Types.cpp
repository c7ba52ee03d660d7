/**
 * Types.cpp - Names and lookups for the closed enums
 */

#include "partforge/cad/Types.hpp"
#include "partforge/cad/Operation.hpp"
#include "partforge/cad/DesignRequest.hpp"

#include <array>
#include <utility>

namespace partforge::cad {

const char* shapeTypeName(ShapeType type) {
    switch (type) {
        case ShapeType::Solid: return "solid";
        case ShapeType::Compound: return "compound";
        case ShapeType::Shell: return "shell";
        case ShapeType::Face: return "face";
        case ShapeType::Wire: return "wire";
        default: return "unknown";
    }
}

// =============================================================================
// Units & Engines
// =============================================================================

double unitScale(Units units) {
    switch (units) {
        case Units::Centimeters: return 10.0;
        case Units::Inches: return 25.4;
        case Units::Millimeters:
        default: return 1.0;
    }
}

const char* unitsName(Units units) {
    switch (units) {
        case Units::Centimeters: return "cm";
        case Units::Inches: return "inches";
        case Units::Millimeters:
        default: return "mm";
    }
}

std::optional<Units> parseUnits(const std::string& name) {
    if (name == "mm") return Units::Millimeters;
    if (name == "cm") return Units::Centimeters;
    if (name == "inches") return Units::Inches;
    return std::nullopt;
}

const char* engineName(EngineKind engine) {
    switch (engine) {
        case EngineKind::Workplane: return "workplane";
        case EngineKind::Mesh: return "mesh";
        case EngineKind::Brep:
        default: return "brep";
    }
}

std::optional<EngineKind> parseEngine(const std::string& name) {
    if (name == "brep") return EngineKind::Brep;
    if (name == "workplane") return EngineKind::Workplane;
    if (name == "mesh") return EngineKind::Mesh;
    return std::nullopt;
}

const char* exportExtension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Stl: return "stl";
        case ExportFormat::Obj: return "obj";
        case ExportFormat::Step:
        default: return "step";
    }
}

// =============================================================================
// Operations
// =============================================================================

namespace {

// Indexed by OperationKind
const std::array<const char*, kOperationKindCount> kOperationNames = {
    "sketch_rectangle",
    "sketch_circle",
    "sketch_polygon",
    "extrude",
    "revolve",
    "cut",
    "fuse",
    "common",
    "fillet",
    "chamfer",
    "shell",
    "add_legs",
    "add_holes",
    "add_supports",
    "linear_pattern",
    "circular_pattern"
};

} // anonymous namespace

const char* operationKindName(OperationKind kind) {
    return kOperationNames[static_cast<size_t>(kind)];
}

std::optional<OperationKind> parseOperationKind(const std::string& name) {
    for (size_t i = 0; i < kOperationNames.size(); ++i) {
        if (name == kOperationNames[i]) {
            return static_cast<OperationKind>(i);
        }
    }
    return std::nullopt;
}

bool isSketchKind(OperationKind kind) {
    return kind == OperationKind::SketchRectangle ||
           kind == OperationKind::SketchCircle ||
           kind == OperationKind::SketchPolygon;
}

Operation Operation::withDefaults(OperationKind kind) {
    Operation op;
    op.kind = kind;
    switch (kind) {
        case OperationKind::SketchRectangle: op.params = SketchRectangleParams{}; break;
        case OperationKind::SketchCircle: op.params = SketchCircleParams{}; break;
        case OperationKind::SketchPolygon: op.params = SketchPolygonParams{}; break;
        case OperationKind::Extrude: op.params = ExtrudeParams{}; break;
        case OperationKind::Revolve: op.params = RevolveParams{}; break;
        case OperationKind::Cut:
        case OperationKind::Fuse:
        case OperationKind::Common: op.params = BooleanToolParams{}; break;
        case OperationKind::Fillet:
        case OperationKind::Chamfer: op.params = EdgeModifierParams{}; break;
        case OperationKind::Shell: op.params = ShellParams{}; break;
        case OperationKind::AddLegs: op.params = AddLegsParams{}; break;
        case OperationKind::AddHoles: op.params = AddHolesParams{}; break;
        case OperationKind::AddSupports: op.params = AddSupportsParams{}; break;
        case OperationKind::LinearPattern: op.params = LinearPatternParams{}; break;
        case OperationKind::CircularPattern: op.params = CircularPatternParams{}; break;
    }
    return op;
}

const char* buildPathName(BuildPath path) {
    switch (path) {
        case BuildPath::OperationPipeline: return "operation_pipeline";
        case BuildPath::SpecializedFrame: return "specialized_frame";
        case BuildPath::StandardShape:
        default: return "standard_shape";
    }
}

} // namespace partforge::cad
