#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include "../Vector3.hpp"

namespace partforge::cad {

// ===========================================================================
// Error Codes
// ===========================================================================

/**
 * @brief Error taxonomy carried in Result<T>::errorCode
 *
 * Validation errors are raised before any kernel session exists.
 * Precondition, configuration and kernel execution errors abort the
 * remaining operation sequence. Unsupported operations are recovered by
 * the router and only escalate when the fallback also cannot comply.
 */
namespace errc {
inline constexpr const char* Precondition = "PRECONDITION_ERROR";
inline constexpr const char* Configuration = "CONFIGURATION_ERROR";
inline constexpr const char* Validation = "VALIDATION_ERROR";
inline constexpr const char* KernelUnsupported = "KERNEL_UNSUPPORTED_OPERATION";
inline constexpr const char* KernelExecution = "KERNEL_EXECUTION_ERROR";
inline constexpr const char* Io = "IO_ERROR";
} // namespace errc

// ===========================================================================
// Core Types
// ===========================================================================

/**
 * @brief Shape type classification
 */
enum class ShapeType {
    Solid,
    Compound,
    Shell,
    Face,
    Wire,
    Unknown
};

const char* shapeTypeName(ShapeType type);

/**
 * @brief Axis-aligned bounding box
 */
struct BoundingBox {
    Vector3 min{0, 0, 0};
    Vector3 max{0, 0, 0};

    Vector3 center() const {
        return Vector3(
            (min.x + max.x) / 2.0,
            (min.y + max.y) / 2.0,
            (min.z + max.z) / 2.0
        );
    }

    Vector3 size() const {
        return Vector3(
            max.x - min.x,
            max.y - min.y,
            max.z - min.z
        );
    }

    double volume() const {
        auto s = size();
        return s.x * s.y * s.z;
    }
};

/**
 * @brief Indexed triangle mesh produced by tessellation
 *
 * Positions are packed [x,y,z, x,y,z, ...]; indices reference vertices
 * three per triangle with counter-clockwise outward winding.
 */
struct MeshData {
    std::vector<float> positions;
    std::vector<uint32_t> indices;

    size_t vertexCount() const { return positions.size() / 3; }
    size_t triangleCount() const { return indices.size() / 3; }
};

/**
 * @brief Tessellation options
 */
struct TessellateOptions {
    double linearDeflection = 0.1;   // Max distance from true surface (mm)
    double angularDeflection = 0.5;  // Max angle between facets (radians)
    bool relative = false;           // Deflection relative to bbox
};

/**
 * @brief Operation result with error handling
 */
template<typename T>
struct Result {
    bool success = false;
    T value{};
    std::string errorCode;
    std::string errorMessage;

    double durationMs = 0;

    static Result<T> ok(T val) {
        Result<T> r;
        r.success = true;
        r.value = std::move(val);
        return r;
    }

    static Result<T> error(const std::string& code, const std::string& msg) {
        Result<T> r;
        r.success = false;
        r.errorCode = code;
        r.errorMessage = msg;
        return r;
    }

    // Re-type a failed result of another value type
    template<typename U>
    static Result<T> errorFrom(const Result<U>& other) {
        return error(other.errorCode, other.errorMessage);
    }
};

// ===========================================================================
// Units & Engines
// ===========================================================================

enum class Units {
    Millimeters,
    Centimeters,
    Inches
};

/// Millimetres per one unit.
double unitScale(Units units);
const char* unitsName(Units units);
std::optional<Units> parseUnits(const std::string& name);

/**
 * @brief Fixed set of selectable capability providers
 */
enum class EngineKind {
    Brep,       // general-purpose default
    Workplane,  // sketch-centric, preferred for assemblies
    Mesh        // lowest overhead, preferred for batch/optimization
};

const char* engineName(EngineKind engine);
std::optional<EngineKind> parseEngine(const std::string& name);

enum class ExportFormat {
    Step,
    Stl,
    Obj
};

const char* exportExtension(ExportFormat format);

// ===========================================================================
// Kernel Primitive Parameters (millimetres, radians)
// ===========================================================================

struct BoxParams {
    Vector3 size{10, 10, 10};
    Vector3 corner{0, 0, 0};   // Minimum corner
};

struct CylinderParams {
    double radius = 5;
    double height = 10;
    Vector3 base{0, 0, 0};     // Centre of the base disc
    Vector3 axis{0, 0, 1};
};

struct SphereParams {
    double radius = 25;
    Vector3 center{0, 0, 0};
};

struct RectangleProfileParams {
    double width = 100;
    double height = 100;
    bool centered = true;
};

struct CircleProfileParams {
    double radius = 50;
    Vector3 center{0, 0, 0};
};

struct PolygonProfileParams {
    std::vector<Vector3> points;
    bool closed = true;
};

} // namespace partforge::cad
