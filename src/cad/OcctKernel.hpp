#pragma once

/**
 * OcctKernel - OpenCASCADE capability provider
 *
 * Methods are split by concern the same way across Primitives.cpp,
 * BooleanOps.cpp, Features.cpp, Transforms.cpp and Exchange.cpp.
 * Every OCCT call is wrapped so Standard_Failure never escapes.
 */

#include "partforge/cad/Kernel.hpp"

namespace partforge::cad {

class OcctKernel : public Kernel {
public:
    OcctKernel() = default;
    ~OcctKernel() override = default;

    std::string name() const override;
    std::string version() const override;

    // Primitives.cpp
    Result<ShapePtr> makeRectangle(const RectangleProfileParams& params) override;
    Result<ShapePtr> makeCircle(const CircleProfileParams& params) override;
    Result<ShapePtr> makePolygon(const PolygonProfileParams& params) override;
    Result<ShapePtr> makeBox(const BoxParams& params) override;
    Result<ShapePtr> makeCylinder(const CylinderParams& params) override;
    Result<ShapePtr> makeSphere(const SphereParams& params) override;

    // Features.cpp
    Result<ShapePtr> extrude(const InternalShape& profile, const Vector3& vector) override;
    Result<ShapePtr> revolve(const InternalShape& profile, const Vector3& axis,
                             double angleRadians) override;
    Result<ShapePtr> fillet(const InternalShape& shape, double radius,
                            const std::vector<int>& edges) override;
    Result<ShapePtr> chamfer(const InternalShape& shape, double distance,
                             const std::vector<int>& edges) override;
    Result<ShapePtr> shell(const InternalShape& shape, double thickness,
                           const std::vector<int>& facesToRemove, double tolerance) override;

    // BooleanOps.cpp
    Result<ShapePtr> booleanUnion(const InternalShape& a, const InternalShape& b) override;
    Result<ShapePtr> booleanSubtract(const InternalShape& base, const InternalShape& tool) override;
    Result<ShapePtr> booleanIntersect(const InternalShape& a, const InternalShape& b) override;

    // Transforms.cpp
    Result<ShapePtr> translate(const InternalShape& shape, const Vector3& offset) override;
    Result<ShapePtr> rotate(const InternalShape& shape, const Vector3& axisOrigin,
                            const Vector3& axisDirection, double angleRadians) override;
    Result<ShapePtr> compound(std::vector<ShapePtr> parts) override;

    // Exchange.cpp
    Result<MeshData> tessellate(const InternalShape& shape,
                                const TessellateOptions& options) override;
    Result<bool> exportStep(const InternalShape& shape, const std::string& path) override;
    Result<ShapeTransfer> exportTransfer(const InternalShape& shape) override;
    Result<ShapePtr> importTransfer(const ShapeTransfer& transfer) override;
};

} // namespace partforge::cad
