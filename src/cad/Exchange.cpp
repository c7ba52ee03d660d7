/**
 * Exchange.cpp - Tessellation, STEP export and cross-kernel transfer for
 * the OCCT kernel
 */

#include "OcctKernel.hpp"
#include "OCCTShape.hpp"

#include <STEPControl_Writer.hxx>
#include <IFSelect_ReturnStatus.hxx>
#include <BRepTools.hxx>
#include <BRep_Builder.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_Sewing.hxx>
#include <BRepBuilderAPI_MakeSolid.hxx>
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <TopoDS_Shell.hxx>

#include <sstream>

namespace partforge::cad {

Result<MeshData> OcctKernel::tessellate(const InternalShape& shape,
                                        const TessellateOptions& options) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<MeshData>(shape);

    try {
        return Result<MeshData>::ok(source->tessellate(options));
    } catch (const Standard_Failure& e) {
        return occtFailure<MeshData>("Tessellate", e);
    }
}

Result<bool> OcctKernel::exportStep(const InternalShape& shape, const std::string& path) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<bool>(shape);

    try {
        STEPControl_Writer writer;
        if (writer.Transfer(source->shape(), STEPControl_AsIs) != IFSelect_RetDone) {
            return Result<bool>::error(errc::KernelExecution, "STEP transfer failed");
        }
        if (writer.Write(path.c_str()) != IFSelect_RetDone) {
            return Result<bool>::error(errc::Io, "Could not write STEP file: " + path);
        }
        return Result<bool>::ok(true);
    } catch (const Standard_Failure& e) {
        return occtFailure<bool>("STEP export", e);
    }
}

// =============================================================================
// Transfer
// =============================================================================

Result<ShapeTransfer> OcctKernel::exportTransfer(const InternalShape& shape) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<ShapeTransfer>(shape);

    try {
        std::ostringstream out;
        BRepTools::Write(source->shape(), out);

        ShapeTransfer transfer;
        transfer.format = ShapeTransfer::Format::BRepText;
        transfer.type = source->getType();
        transfer.brep = out.str();
        return Result<ShapeTransfer>::ok(std::move(transfer));
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapeTransfer>("BRep export", e);
    }
}

namespace {

// Rebuild a solid from triangles: one planar face per triangle, sewn shut.
Result<ShapePtr> solidFromMesh(const MeshData& mesh) {
    if (mesh.triangleCount() == 0) {
        return Result<ShapePtr>::error(errc::KernelExecution, "Cannot import an empty mesh");
    }

    auto vertex = [&mesh](uint32_t index) {
        return gp_Pnt(mesh.positions[index * 3],
                      mesh.positions[index * 3 + 1],
                      mesh.positions[index * 3 + 2]);
    };

    BRepBuilderAPI_Sewing sewing(1.0e-6);
    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        gp_Pnt a = vertex(mesh.indices[t * 3]);
        gp_Pnt b = vertex(mesh.indices[t * 3 + 1]);
        gp_Pnt c = vertex(mesh.indices[t * 3 + 2]);

        BRepBuilderAPI_MakePolygon polygon(a, b, c, Standard_True);
        if (!polygon.IsDone()) {
            continue;  // degenerate triangle
        }
        BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);
        if (face.IsDone()) {
            sewing.Add(face.Face());
        }
    }
    sewing.Perform();

    TopoDS_Shape sewed = sewing.SewedShape();
    if (sewed.IsNull()) {
        return Result<ShapePtr>::error(errc::KernelExecution, "Mesh sewing produced no shape");
    }

    if (sewed.ShapeType() == TopAbs_SHELL) {
        BRepBuilderAPI_MakeSolid solid(TopoDS::Shell(sewed));
        if (solid.IsDone()) {
            return Result<ShapePtr>::ok(
                std::make_unique<OCCTShape>(solid.Solid(), ShapeType::Solid));
        }
    }
    return wrapShape(sewed);
}

double signedArea(const std::vector<Vector3>& contour) {
    double area = 0.0;
    for (size_t i = 0; i < contour.size(); ++i) {
        const Vector3& a = contour[i];
        const Vector3& b = contour[(i + 1) % contour.size()];
        area += a.x * b.y - b.x * a.y;
    }
    return area / 2.0;
}

// Outer contours are fused, holes are cut from the result.
Result<ShapePtr> faceFromContours(const std::vector<std::vector<Vector3>>& contours) {
    TopoDS_Shape result;
    std::vector<TopoDS_Shape> holes;

    for (const auto& contour : contours) {
        if (contour.size() < 3) continue;

        BRepBuilderAPI_MakePolygon polygon;
        for (const auto& p : contour) {
            polygon.Add(toGpPnt(p));
        }
        polygon.Close();
        BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);
        if (!face.IsDone()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "Profile contour is not planar");
        }

        if (signedArea(contour) < 0) {
            holes.push_back(face.Face());
        } else if (result.IsNull()) {
            result = face.Face();
        } else {
            result = BRepAlgoAPI_Fuse(result, face.Face()).Shape();
        }
    }

    if (result.IsNull()) {
        return Result<ShapePtr>::error(errc::KernelExecution, "Profile has no outer contour");
    }
    for (const auto& hole : holes) {
        result = BRepAlgoAPI_Cut(result, hole).Shape();
    }
    if (result.ShapeType() == TopAbs_FACE) {
        return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(result, ShapeType::Face));
    }
    return wrapShape(result);
}

} // anonymous namespace

Result<ShapePtr> OcctKernel::importTransfer(const ShapeTransfer& transfer) {
    try {
        if (transfer.format == ShapeTransfer::Format::Mesh) {
            return solidFromMesh(transfer.mesh);
        }
        if (transfer.format == ShapeTransfer::Format::Profile) {
            return faceFromContours(transfer.contours);
        }

        std::istringstream in(transfer.brep);
        TopoDS_Shape shape;
        BRep_Builder builder;
        BRepTools::Read(shape, in, builder);

        if (shape.IsNull()) {
            return Result<ShapePtr>::error(errc::KernelExecution, "BRep import produced no shape");
        }
        return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(shape, transfer.type));
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Shape import", e);
    }
}

} // namespace partforge::cad
