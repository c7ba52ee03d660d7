/**
 * Primitives.cpp - Profiles and primitive solids for the OCCT kernel
 */

#include "OcctKernel.hpp"
#include "OCCTShape.hpp"

#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <BRepPrimAPI_MakeSphere.hxx>
#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <Standard_Version.hxx>
#include <gp_Ax2.hxx>
#include <gp_Circ.hxx>

#include <sstream>

namespace partforge::cad {

std::string OcctKernel::name() const {
    return kOcctKernelName;
}

std::string OcctKernel::version() const {
    std::stringstream ss;
    ss << "OCCT " << OCC_VERSION_COMPLETE;
    return ss.str();
}

// =============================================================================
// Profiles
// =============================================================================

namespace {

Result<ShapePtr> faceFromWire(const TopoDS_Wire& wire, const char* operation) {
    BRepBuilderAPI_MakeFace face(wire, Standard_True);
    if (!face.IsDone()) {
        return Result<ShapePtr>::error(errc::KernelExecution,
            std::string(operation) + ": wire is not a planar closed profile");
    }
    return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(face.Face(), ShapeType::Face));
}

} // anonymous namespace

Result<ShapePtr> OcctKernel::makeRectangle(const RectangleProfileParams& params) {
    try {
        double x0 = params.centered ? -params.width / 2.0 : 0.0;
        double y0 = params.centered ? -params.height / 2.0 : 0.0;
        double x1 = x0 + params.width;
        double y1 = y0 + params.height;

        BRepBuilderAPI_MakePolygon polygon(
            gp_Pnt(x0, y0, 0), gp_Pnt(x1, y0, 0),
            gp_Pnt(x1, y1, 0), gp_Pnt(x0, y1, 0),
            Standard_True);
        if (!polygon.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Rectangle wire construction failed");
        }
        return faceFromWire(polygon.Wire(), "Rectangle");
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Rectangle", e);
    }
}

Result<ShapePtr> OcctKernel::makeCircle(const CircleProfileParams& params) {
    try {
        gp_Ax2 axes(toGpPnt(params.center), gp_Dir(0, 0, 1));
        gp_Circ circle(axes, params.radius);

        BRepBuilderAPI_MakeEdge edge(circle);
        BRepBuilderAPI_MakeWire wire(edge.Edge());
        if (!wire.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Circle wire construction failed");
        }
        return faceFromWire(wire.Wire(), "Circle");
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Circle", e);
    }
}

Result<ShapePtr> OcctKernel::makePolygon(const PolygonProfileParams& params) {
    if (params.points.size() < 2) {
        return Result<ShapePtr>::error(errc::Configuration, "Polygon requires at least 2 points");
    }

    try {
        BRepBuilderAPI_MakePolygon polygon;
        for (const auto& p : params.points) {
            polygon.Add(toGpPnt(p));
        }

        // Closing edge only when the caller did not already repeat the start point
        bool repeatsStart = params.points.front() == params.points.back();
        if (params.closed && !repeatsStart) {
            polygon.Close();
        }

        if (!polygon.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Polygon wire construction failed");
        }

        if (!params.closed) {
            return Result<ShapePtr>::ok(
                std::make_unique<OCCTShape>(polygon.Wire(), ShapeType::Wire));
        }
        return faceFromWire(polygon.Wire(), "Polygon");
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Polygon", e);
    }
}

// =============================================================================
// Primitive Solids
// =============================================================================

Result<ShapePtr> OcctKernel::makeBox(const BoxParams& params) {
    try {
        BRepPrimAPI_MakeBox box(toGpPnt(params.corner), params.size.x, params.size.y, params.size.z);
        box.Build();
        if (!box.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Box construction failed");
        }
        return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(box.Shape(), ShapeType::Solid));
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Box", e);
    }
}

Result<ShapePtr> OcctKernel::makeCylinder(const CylinderParams& params) {
    try {
        gp_Ax2 axes(toGpPnt(params.base), toGpDir(params.axis));
        BRepPrimAPI_MakeCylinder cylinder(axes, params.radius, params.height);
        cylinder.Build();
        if (!cylinder.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Cylinder construction failed");
        }
        return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(cylinder.Shape(), ShapeType::Solid));
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Cylinder", e);
    }
}

Result<ShapePtr> OcctKernel::makeSphere(const SphereParams& params) {
    try {
        BRepPrimAPI_MakeSphere sphere(toGpPnt(params.center), params.radius);
        sphere.Build();
        if (!sphere.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Sphere construction failed");
        }
        return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(sphere.Shape(), ShapeType::Solid));
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Sphere", e);
    }
}

} // namespace partforge::cad
