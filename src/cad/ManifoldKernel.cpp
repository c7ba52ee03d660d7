/**
 * ManifoldKernel.cpp - Mesh-boolean capability provider
 *
 * Profiles are CrossSections in the XY plane; solids are Manifolds.
 * Every result is checked with Status() before it is handed back.
 */

#include "ManifoldKernel.hpp"
#include "ManifoldShape.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

namespace partforge::cad {

namespace {

const char* statusText(manifold::Manifold::Error status) {
    using Error = manifold::Manifold::Error;
    switch (status) {
        case Error::NoError: return "no error";
        case Error::NonFiniteVertex: return "non-finite vertex";
        case Error::NotManifold: return "mesh is not manifold";
        case Error::VertexOutOfBounds: return "vertex index out of bounds";
        case Error::PropertiesWrongLength: return "properties have wrong length";
        case Error::MissingPositionProperties: return "missing position properties";
        case Error::MergeVectorsDifferentLengths: return "merge vectors differ in length";
        case Error::MergeIndexOutOfBounds: return "merge index out of bounds";
        case Error::TransformWrongLength: return "transform has wrong length";
        case Error::RunIndexWrongLength: return "run index has wrong length";
        case Error::FaceIDWrongLength: return "face id has wrong length";
        case Error::InvalidConstruction: return "invalid construction";
        case Error::ResultTooLarge: return "result too large";
        default: return "unknown error";
    }
}

Result<ShapePtr> wrapSolid(manifold::Manifold solid, const char* operation) {
    if (solid.Status() != manifold::Manifold::Error::NoError) {
        return Result<ShapePtr>::error(errc::KernelExecution,
            std::string(operation) + " failed: " + statusText(solid.Status()));
    }
    return Result<ShapePtr>::ok(std::make_unique<ManifoldShape>(std::move(solid)));
}

Result<ShapePtr> wrapProfile(manifold::CrossSection profile, const char* operation) {
    if (profile.IsEmpty()) {
        return Result<ShapePtr>::error(errc::KernelExecution,
            std::string(operation) + " produced an empty profile");
    }
    return Result<ShapePtr>::ok(std::make_unique<ManifoldShape>(std::move(profile)));
}

template<typename T>
Result<T> foreign(const InternalShape& shape) {
    return Result<T>::error(errc::KernelExecution,
        std::string("Shape belongs to kernel '") + shape.kernelName() + "', not manifold");
}

template<typename T>
Result<T> unsupported(const char* operation) {
    return Result<T>::error(errc::KernelUnsupported,
        std::string(operation) + " is not available on the mesh kernel");
}

template<typename T>
Result<T> thrown(const char* operation, const std::exception& e) {
    return Result<T>::error(errc::KernelExecution,
        std::string(operation) + " failed: " + e.what());
}

// Solid operand, or an error naming why it cannot be used.
Result<const manifold::Manifold*> solidOf(const InternalShape& shape) {
    const ManifoldShape* source = asManifold(shape);
    if (!source) return foreign<const manifold::Manifold*>(shape);
    if (source->isProfile()) {
        return Result<const manifold::Manifold*>::error(errc::KernelExecution,
            "Operation needs a solid, got a profile");
    }
    return Result<const manifold::Manifold*>::ok(&source->solid());
}

// Rigid rotation about an arbitrary axis as a point warp.
manifold::Manifold rotated(const manifold::Manifold& solid, const Vector3& origin,
                           const Vector3& axis, double angleRadians) {
    Matrix3 rotation = Matrix3::rotation(axis, angleRadians);
    return solid.Warp([rotation, origin](manifold::vec3& v) {
        Vector3 p = rotation * (Vector3(v.x, v.y, v.z) - origin) + origin;
        v = manifold::vec3(p.x, p.y, p.z);
    });
}

} // anonymous namespace

ManifoldKernel::ManifoldKernel(int circularSegments)
    : circularSegments_(circularSegments) {}

std::string ManifoldKernel::name() const {
    return kManifoldKernelName;
}

std::string ManifoldKernel::version() const {
    return "Manifold 3";
}

// =============================================================================
// Profiles
// =============================================================================

Result<ShapePtr> ManifoldKernel::makeRectangle(const RectangleProfileParams& params) {
    try {
        return wrapProfile(manifold::CrossSection::Square(
            manifold::vec2(params.width, params.height), params.centered), "Rectangle");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Rectangle", e);
    }
}

Result<ShapePtr> ManifoldKernel::makeCircle(const CircleProfileParams& params) {
    try {
        auto circle = manifold::CrossSection::Circle(params.radius, circularSegments_)
            .Translate(manifold::vec2(params.center.x, params.center.y));
        return wrapProfile(std::move(circle), "Circle");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Circle", e);
    }
}

Result<ShapePtr> ManifoldKernel::makePolygon(const PolygonProfileParams& params) {
    if (!params.closed) {
        return unsupported<ShapePtr>("Open polygon profile");
    }

    manifold::SimplePolygon contour;
    for (const auto& p : params.points) {
        contour.push_back(manifold::vec2(p.x, p.y));
    }
    if (contour.size() > 1 && params.points.front() == params.points.back()) {
        contour.pop_back();
    }

    try {
        // NonZero accepts either winding
        manifold::CrossSection polygon(manifold::Polygons{contour},
                                       manifold::CrossSection::FillRule::NonZero);
        return wrapProfile(std::move(polygon), "Polygon");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Polygon", e);
    }
}

// =============================================================================
// Primitive Solids
// =============================================================================

Result<ShapePtr> ManifoldKernel::makeBox(const BoxParams& params) {
    try {
        auto box = manifold::Manifold::Cube(
            manifold::vec3(params.size.x, params.size.y, params.size.z), false)
            .Translate(manifold::vec3(params.corner.x, params.corner.y, params.corner.z));
        return wrapSolid(std::move(box), "Box");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Box", e);
    }
}

Result<ShapePtr> ManifoldKernel::makeCylinder(const CylinderParams& params) {
    try {
        // Built along +Z at the origin, then aligned with the requested axis
        auto cylinder = manifold::Manifold::Cylinder(
            params.height, params.radius, -1.0, circularSegments_, false);

        Vector3 z(0, 0, 1);
        Vector3 axis = params.axis.normalized();
        Vector3 pivot = z % axis;
        if (!pivot.isZero()) {
            cylinder = rotated(cylinder, Vector3(), pivot, std::acos(std::clamp(z * axis, -1.0, 1.0)));
        } else if (axis.z < 0) {
            cylinder = rotated(cylinder, Vector3(), Vector3(1, 0, 0), kPi);
        }

        cylinder = cylinder.Translate(manifold::vec3(params.base.x, params.base.y, params.base.z));
        return wrapSolid(std::move(cylinder), "Cylinder");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Cylinder", e);
    }
}

Result<ShapePtr> ManifoldKernel::makeSphere(const SphereParams& params) {
    try {
        auto sphere = manifold::Manifold::Sphere(params.radius, circularSegments_)
            .Translate(manifold::vec3(params.center.x, params.center.y, params.center.z));
        return wrapSolid(std::move(sphere), "Sphere");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Sphere", e);
    }
}

// =============================================================================
// Profile to Solid
// =============================================================================

Result<ShapePtr> ManifoldKernel::extrude(const InternalShape& profile, const Vector3& vector) {
    const ManifoldShape* source = asManifold(profile);
    if (!source) return foreign<ShapePtr>(profile);
    if (!source->isProfile()) {
        return Result<ShapePtr>::error(errc::KernelExecution, "Extrude needs a profile");
    }
    if (std::abs(vector.z) < 1e-9) {
        return Result<ShapePtr>::error(errc::KernelExecution,
            "Extrude direction lies in the sketch plane");
    }

    try {
        const double h = std::abs(vector.z);
        auto prism = manifold::Manifold::Extrude(source->profile().ToPolygons(), h);
        if (vector.z < 0) {
            prism = prism.Translate(manifold::vec3(0, 0, -h));
        }

        // Shear so the far cap lands on profile + vector
        const double sx = vector.x / vector.z;
        const double sy = vector.y / vector.z;
        if (std::abs(sx) > 1e-12 || std::abs(sy) > 1e-12) {
            prism = prism.Warp([sx, sy](manifold::vec3& v) {
                v.x += sx * v.z;
                v.y += sy * v.z;
            });
        }
        return wrapSolid(std::move(prism), "Extrude");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Extrude", e);
    }
}

Result<ShapePtr> ManifoldKernel::revolve(const InternalShape&, const Vector3&, double) {
    return unsupported<ShapePtr>("Revolve");
}

// =============================================================================
// Booleans
// =============================================================================

Result<ShapePtr> ManifoldKernel::booleanUnion(const InternalShape& a, const InternalShape& b) {
    auto lhs = solidOf(a);
    if (!lhs.success) return Result<ShapePtr>::errorFrom(lhs);
    auto rhs = solidOf(b);
    if (!rhs.success) return Result<ShapePtr>::errorFrom(rhs);

    try {
        return wrapSolid(*lhs.value + *rhs.value, "Union");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Union", e);
    }
}

Result<ShapePtr> ManifoldKernel::booleanSubtract(const InternalShape& base, const InternalShape& tool) {
    auto lhs = solidOf(base);
    if (!lhs.success) return Result<ShapePtr>::errorFrom(lhs);
    auto rhs = solidOf(tool);
    if (!rhs.success) return Result<ShapePtr>::errorFrom(rhs);

    try {
        return wrapSolid(*lhs.value - *rhs.value, "Subtract");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Subtract", e);
    }
}

Result<ShapePtr> ManifoldKernel::booleanIntersect(const InternalShape& a, const InternalShape& b) {
    auto lhs = solidOf(a);
    if (!lhs.success) return Result<ShapePtr>::errorFrom(lhs);
    auto rhs = solidOf(b);
    if (!rhs.success) return Result<ShapePtr>::errorFrom(rhs);

    try {
        return wrapSolid(*lhs.value ^ *rhs.value, "Intersect");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Intersect", e);
    }
}

// =============================================================================
// Modifiers
// =============================================================================

Result<ShapePtr> ManifoldKernel::fillet(const InternalShape&, double, const std::vector<int>&) {
    return unsupported<ShapePtr>("Fillet");
}

Result<ShapePtr> ManifoldKernel::chamfer(const InternalShape&, double, const std::vector<int>&) {
    return unsupported<ShapePtr>("Chamfer");
}

Result<ShapePtr> ManifoldKernel::shell(const InternalShape&, double, const std::vector<int>&, double) {
    return unsupported<ShapePtr>("Shell");
}

// =============================================================================
// Placement
// =============================================================================

Result<ShapePtr> ManifoldKernel::translate(const InternalShape& shape, const Vector3& offset) {
    const ManifoldShape* source = asManifold(shape);
    if (!source) return foreign<ShapePtr>(shape);

    try {
        if (source->isProfile()) {
            return wrapProfile(source->profile().Translate(manifold::vec2(offset.x, offset.y)),
                               "Translate");
        }
        return wrapSolid(source->solid().Translate(manifold::vec3(offset.x, offset.y, offset.z)),
                         "Translate");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Translate", e);
    }
}

Result<ShapePtr> ManifoldKernel::rotate(const InternalShape& shape, const Vector3& axisOrigin,
                                        const Vector3& axisDirection, double angleRadians) {
    auto solid = solidOf(shape);
    if (!solid.success) return Result<ShapePtr>::errorFrom(solid);

    try {
        return wrapSolid(rotated(*solid.value, axisOrigin, axisDirection, angleRadians), "Rotate");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Rotate", e);
    }
}

Result<ShapePtr> ManifoldKernel::compound(std::vector<ShapePtr> parts) {
    std::vector<manifold::Manifold> solids;
    solids.reserve(parts.size());
    for (const auto& part : parts) {
        auto solid = solidOf(*part);
        if (!solid.success) return Result<ShapePtr>::errorFrom(solid);
        solids.push_back(*solid.value);
    }

    try {
        return wrapSolid(manifold::Manifold::Compose(solids), "Compound");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Compound", e);
    }
}

// =============================================================================
// Exchange
// =============================================================================

Result<MeshData> ManifoldKernel::tessellate(const InternalShape& shape, const TessellateOptions&) {
    auto solid = solidOf(shape);
    if (!solid.success) return Result<MeshData>::errorFrom(solid);

    manifold::MeshGL gl = solid.value->GetMeshGL();

    MeshData mesh;
    const size_t vertexCount = gl.NumVert();
    mesh.positions.reserve(vertexCount * 3);
    for (size_t v = 0; v < vertexCount; ++v) {
        const size_t base = v * gl.numProp;
        mesh.positions.push_back(gl.vertProperties[base]);
        mesh.positions.push_back(gl.vertProperties[base + 1]);
        mesh.positions.push_back(gl.vertProperties[base + 2]);
    }
    mesh.indices.assign(gl.triVerts.begin(), gl.triVerts.end());

    return Result<MeshData>::ok(std::move(mesh));
}

Result<bool> ManifoldKernel::exportStep(const InternalShape&, const std::string&) {
    return unsupported<bool>("STEP export");
}

Result<ShapeTransfer> ManifoldKernel::exportTransfer(const InternalShape& shape) {
    const ManifoldShape* source = asManifold(shape);
    if (!source) return foreign<ShapeTransfer>(shape);

    ShapeTransfer transfer;
    transfer.type = source->getType();

    if (source->isProfile()) {
        transfer.format = ShapeTransfer::Format::Profile;
        for (const auto& polygon : source->profile().ToPolygons()) {
            std::vector<Vector3> contour;
            contour.reserve(polygon.size());
            for (const auto& p : polygon) {
                contour.emplace_back(p.x, p.y, 0.0);
            }
            transfer.contours.push_back(std::move(contour));
        }
        return Result<ShapeTransfer>::ok(std::move(transfer));
    }

    auto mesh = tessellate(shape, TessellateOptions{});
    if (!mesh.success) return Result<ShapeTransfer>::errorFrom(mesh);

    transfer.format = ShapeTransfer::Format::Mesh;
    transfer.mesh = std::move(mesh.value);
    return Result<ShapeTransfer>::ok(std::move(transfer));
}

Result<ShapePtr> ManifoldKernel::importTransfer(const ShapeTransfer& transfer) {
    if (transfer.format != ShapeTransfer::Format::Mesh) {
        return unsupported<ShapePtr>("Importing a non-mesh shape");
    }

    try {
        manifold::MeshGL gl;
        gl.numProp = 3;
        gl.vertProperties = transfer.mesh.positions;
        gl.triVerts = transfer.mesh.indices;
        gl.Merge();
        return wrapSolid(manifold::Manifold(gl), "Mesh import");
    } catch (const std::exception& e) {
        return thrown<ShapePtr>("Mesh import", e);
    }
}

} // namespace partforge::cad
