#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Types.hpp"

namespace partforge::cad {

/**
 * @brief Kernel-specific shape storage
 *
 * Each kernel wraps its own native representation. A shape is only ever
 * passed back to the kernel that created it; crossing kernels requires an
 * explicit transfer through Kernel::exportTransfer / importTransfer.
 */
class InternalShape {
public:
    virtual ~InternalShape() = default;

    virtual ShapeType getType() const = 0;
    virtual BoundingBox getBoundingBox() const = 0;
    virtual double getVolume() const = 0;
    virtual double getSurfaceArea() const = 0;

    /// Number of distinct edges, in the order fillet/chamfer indices use.
    virtual size_t edgeCount() const = 0;
    /// Number of distinct faces, in the order shell indices use.
    virtual size_t faceCount() const = 0;

    virtual size_t getEstimatedMemoryBytes() const = 0;
    virtual std::unique_ptr<InternalShape> clone() const = 0;

    /// Name of the kernel that owns this representation.
    virtual const char* kernelName() const = 0;
};

using ShapePtr = std::unique_ptr<InternalShape>;

/**
 * @brief Portable snapshot of a shape used when a build changes provider
 */
struct ShapeTransfer {
    enum class Format {
        BRepText,   // Exact boundary representation, kernel text format
        Mesh,       // Triangulated surface
        Profile     // Planar XY contours, counter-clockwise outer, clockwise holes
    };

    Format format = Format::Mesh;
    ShapeType type = ShapeType::Solid;
    std::string brep;
    MeshData mesh;
    std::vector<std::vector<Vector3>> contours;
};

/**
 * @brief Capability provider: the geometry kernel behind an adapter
 *
 * All lengths are millimetres and all angles radians. Kernel failures are
 * returned as KERNEL_EXECUTION_ERROR; operations a kernel cannot express at
 * all are returned as KERNEL_UNSUPPORTED_OPERATION.
 */
class Kernel {
public:
    virtual ~Kernel() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;

    // -------------------------------------------------------------------------
    // Profiles (XY plane)
    // -------------------------------------------------------------------------

    virtual Result<ShapePtr> makeRectangle(const RectangleProfileParams& params) = 0;
    virtual Result<ShapePtr> makeCircle(const CircleProfileParams& params) = 0;
    virtual Result<ShapePtr> makePolygon(const PolygonProfileParams& params) = 0;

    // -------------------------------------------------------------------------
    // Primitive solids
    // -------------------------------------------------------------------------

    virtual Result<ShapePtr> makeBox(const BoxParams& params) = 0;
    virtual Result<ShapePtr> makeCylinder(const CylinderParams& params) = 0;
    virtual Result<ShapePtr> makeSphere(const SphereParams& params) = 0;

    // -------------------------------------------------------------------------
    // Profile to solid
    // -------------------------------------------------------------------------

    virtual Result<ShapePtr> extrude(const InternalShape& profile, const Vector3& vector) = 0;
    virtual Result<ShapePtr> revolve(const InternalShape& profile, const Vector3& axis,
                                     double angleRadians) = 0;

    // -------------------------------------------------------------------------
    // Booleans
    // -------------------------------------------------------------------------

    virtual Result<ShapePtr> booleanUnion(const InternalShape& a, const InternalShape& b) = 0;
    virtual Result<ShapePtr> booleanSubtract(const InternalShape& base, const InternalShape& tool) = 0;
    virtual Result<ShapePtr> booleanIntersect(const InternalShape& a, const InternalShape& b) = 0;

    // -------------------------------------------------------------------------
    // Modifiers (indices are 0-based and already range-checked)
    // -------------------------------------------------------------------------

    virtual Result<ShapePtr> fillet(const InternalShape& shape, double radius,
                                    const std::vector<int>& edges) = 0;
    virtual Result<ShapePtr> chamfer(const InternalShape& shape, double distance,
                                     const std::vector<int>& edges) = 0;
    virtual Result<ShapePtr> shell(const InternalShape& shape, double thickness,
                                   const std::vector<int>& facesToRemove, double tolerance) = 0;

    // -------------------------------------------------------------------------
    // Placement
    // -------------------------------------------------------------------------

    virtual Result<ShapePtr> translate(const InternalShape& shape, const Vector3& offset) = 0;
    virtual Result<ShapePtr> rotate(const InternalShape& shape, const Vector3& axisOrigin,
                                    const Vector3& axisDirection, double angleRadians) = 0;
    virtual Result<ShapePtr> compound(std::vector<ShapePtr> parts) = 0;

    // -------------------------------------------------------------------------
    // Exchange
    // -------------------------------------------------------------------------

    virtual Result<MeshData> tessellate(const InternalShape& shape,
                                        const TessellateOptions& options) = 0;
    virtual Result<bool> exportStep(const InternalShape& shape, const std::string& path) = 0;

    virtual Result<ShapeTransfer> exportTransfer(const InternalShape& shape) = 0;
    virtual Result<ShapePtr> importTransfer(const ShapeTransfer& transfer) = 0;
};

} // namespace partforge::cad
