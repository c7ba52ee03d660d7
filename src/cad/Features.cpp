/**
 * Features.cpp - Profile sweeps and edge/face modifiers for the OCCT kernel
 *
 * Implements extrude, revolve, fillet, chamfer and shell.
 */

#include "OcctKernel.hpp"
#include "OCCTShape.hpp"

#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepPrimAPI_MakeRevol.hxx>
#include <BRepFilletAPI_MakeFillet.hxx>
#include <BRepFilletAPI_MakeChamfer.hxx>
#include <BRepOffsetAPI_MakeThickSolid.hxx>
#include <TopTools_ListOfShape.hxx>
#include <gp_Ax1.hxx>

namespace partforge::cad {

// =============================================================================
// Extrude
// =============================================================================

Result<ShapePtr> OcctKernel::extrude(const InternalShape& profile, const Vector3& vector) {
    const OCCTShape* source = asOCCT(profile);
    if (!source) return foreignShape<ShapePtr>(profile);

    try {
        BRepPrimAPI_MakePrism prism(source->shape(), toGpVec(vector));
        prism.Build();

        if (!prism.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Extrude operation failed");
        }
        return wrapShape(prism.Shape());
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Extrude", e);
    }
}

// =============================================================================
// Revolve
// =============================================================================

Result<ShapePtr> OcctKernel::revolve(const InternalShape& profile, const Vector3& axis,
                                     double angleRadians) {
    const OCCTShape* source = asOCCT(profile);
    if (!source) return foreignShape<ShapePtr>(profile);

    try {
        gp_Ax1 revolveAxis(gp_Pnt(0, 0, 0), toGpDir(axis));

        BRepPrimAPI_MakeRevol revol(source->shape(), revolveAxis, angleRadians);
        revol.Build();

        if (!revol.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Revolve operation failed");
        }
        return wrapShape(revol.Shape());
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Revolve", e);
    }
}

// =============================================================================
// Fillet
// =============================================================================

Result<ShapePtr> OcctKernel::fillet(const InternalShape& shape, double radius,
                                    const std::vector<int>& edges) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<ShapePtr>(shape);

    try {
        TopTools_IndexedMapOfShape edgeMap = source->edges();
        BRepFilletAPI_MakeFillet fillet(source->shape());

        for (int index : edges) {
            fillet.Add(radius, TopoDS::Edge(edgeMap.FindKey(index + 1)));
        }

        fillet.Build();
        if (!fillet.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution,
                "Fillet operation failed (radius too large for the selected edges?)");
        }
        return wrapShape(fillet.Shape());
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Fillet", e);
    }
}

// =============================================================================
// Chamfer
// =============================================================================

Result<ShapePtr> OcctKernel::chamfer(const InternalShape& shape, double distance,
                                     const std::vector<int>& edges) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<ShapePtr>(shape);

    try {
        TopTools_IndexedMapOfShape edgeMap = source->edges();
        BRepFilletAPI_MakeChamfer chamfer(source->shape());

        for (int index : edges) {
            chamfer.Add(distance, TopoDS::Edge(edgeMap.FindKey(index + 1)));
        }

        chamfer.Build();
        if (!chamfer.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Chamfer operation failed");
        }
        return wrapShape(chamfer.Shape());
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Chamfer", e);
    }
}

// =============================================================================
// Shell
// =============================================================================

Result<ShapePtr> OcctKernel::shell(const InternalShape& shape, double thickness,
                                   const std::vector<int>& facesToRemove, double tolerance) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<ShapePtr>(shape);

    try {
        TopTools_IndexedMapOfShape faceMap = source->faces();
        TopTools_ListOfShape removed;
        for (int index : facesToRemove) {
            removed.Append(faceMap.FindKey(index + 1));
        }

        // Negative offset thickens inward
        BRepOffsetAPI_MakeThickSolid shell;
        shell.MakeThickSolidByJoin(source->shape(), removed, -thickness, tolerance);
        shell.Build();

        if (!shell.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Shell operation failed");
        }
        return wrapShape(shell.Shape());
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Shell", e);
    }
}

} // namespace partforge::cad
