/**
 * BooleanOps.cpp - Boolean combination for the OCCT kernel
 *
 * Union, subtraction and intersection of two shapes. Each call runs the
 * algorithm in parallel mode and reports kernel errors as results.
 */

#include "OcctKernel.hpp"
#include "OCCTShape.hpp"

#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Common.hxx>

namespace partforge::cad {

namespace {

template<typename Algo>
Result<ShapePtr> runBoolean(const char* name, const InternalShape& a, const InternalShape& b) {
    const OCCTShape* lhs = asOCCT(a);
    if (!lhs) return foreignShape<ShapePtr>(a);
    const OCCTShape* rhs = asOCCT(b);
    if (!rhs) return foreignShape<ShapePtr>(b);

    try {
        Algo op(lhs->shape(), rhs->shape());
        op.SetRunParallel(Standard_True);
        op.Build();

        if (!op.IsDone() || op.HasErrors()) {
            return Result<ShapePtr>::error(errc::KernelExecution,
                std::string(name) + " failed in the boolean algorithm");
        }
        return wrapShape(op.Shape());
    } catch (const Standard_Failure& e) {
        return occtFailure<ShapePtr>(name, e);
    }
}

} // anonymous namespace

// =============================================================================
// Boolean Union
// =============================================================================

Result<ShapePtr> OcctKernel::booleanUnion(const InternalShape& a, const InternalShape& b) {
    return runBoolean<BRepAlgoAPI_Fuse>("Union", a, b);
}

// =============================================================================
// Boolean Subtract
// =============================================================================

Result<ShapePtr> OcctKernel::booleanSubtract(const InternalShape& base, const InternalShape& tool) {
    return runBoolean<BRepAlgoAPI_Cut>("Subtract", base, tool);
}

// =============================================================================
// Boolean Intersect
// =============================================================================

Result<ShapePtr> OcctKernel::booleanIntersect(const InternalShape& a, const InternalShape& b) {
    return runBoolean<BRepAlgoAPI_Common>("Intersect", a, b);
}

} // namespace partforge::cad
