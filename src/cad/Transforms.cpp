/**
 * Transforms.cpp - Rigid placement and grouping for the OCCT kernel
 *
 * These are fast operations that copy the geometry under a gp_Trsf.
 */

#include "OcctKernel.hpp"
#include "OCCTShape.hpp"

#include <BRepBuilderAPI_Transform.hxx>
#include <BRep_Builder.hxx>
#include <TopoDS_Compound.hxx>
#include <gp_Trsf.hxx>
#include <gp_Ax1.hxx>

namespace partforge::cad {

namespace {

Result<ShapePtr> applyTrsf(const OCCTShape& source, const gp_Trsf& trsf, const char* name) {
    BRepBuilderAPI_Transform transform(source.shape(), trsf, Standard_True);
    if (!transform.IsDone()) {
        return Result<ShapePtr>::error(errc::KernelExecution,
            std::string(name) + " operation failed");
    }
    return Result<ShapePtr>::ok(
        std::make_unique<OCCTShape>(transform.Shape(), source.getType()));
}

} // anonymous namespace

// =============================================================================
// Translate
// =============================================================================

Result<ShapePtr> OcctKernel::translate(const InternalShape& shape, const Vector3& offset) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<ShapePtr>(shape);

    try {
        gp_Trsf trsf;
        trsf.SetTranslation(toGpVec(offset));
        return applyTrsf(*source, trsf, "Translate");
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Translate", e);
    }
}

// =============================================================================
// Rotate
// =============================================================================

Result<ShapePtr> OcctKernel::rotate(const InternalShape& shape, const Vector3& axisOrigin,
                                    const Vector3& axisDirection, double angleRadians) {
    const OCCTShape* source = asOCCT(shape);
    if (!source) return foreignShape<ShapePtr>(shape);

    try {
        gp_Trsf trsf;
        trsf.SetRotation(gp_Ax1(toGpPnt(axisOrigin), toGpDir(axisDirection)), angleRadians);
        return applyTrsf(*source, trsf, "Rotate");
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Rotate", e);
    }
}

// =============================================================================
// Compound
// =============================================================================

Result<ShapePtr> OcctKernel::compound(std::vector<ShapePtr> parts) {
    try {
        BRep_Builder builder;
        TopoDS_Compound result;
        builder.MakeCompound(result);

        for (const auto& part : parts) {
            const OCCTShape* source = asOCCT(*part);
            if (!source) return foreignShape<ShapePtr>(*part);
            builder.Add(result, source->shape());
        }

        return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(result, ShapeType::Compound));
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>("Compound", e);
    }
}

} // namespace partforge::cad
