/**
 * KernelAdapter.cpp - Uniform operation contract over one capability provider
 *
 * Converts request units to millimetres once, resolves defaults and
 * index selectors against the current shape, and expands composite
 * operations (legs, holes, supports, patterns) into primitive kernel calls.
 */

#include "partforge/cad/KernelAdapter.hpp"
#include "partforge/cad/FeatureGenerators.hpp"
#include "partforge/io/MeshWriter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace partforge::cad {

// =============================================================================
// Capability Tables
// =============================================================================

bool KernelCapability::exports(ExportFormat format) const {
    return std::find(exportFormats.begin(), exportFormats.end(), format) != exportFormats.end();
}

KernelCapability KernelCapability::all() {
    KernelCapability capability;
    capability.operations.fill(true);
    capability.exportFormats = {ExportFormat::Step, ExportFormat::Stl, ExportFormat::Obj};
    return capability;
}

KernelCapability builtinCapability(EngineKind engine) {
    switch (engine) {
        case EngineKind::Workplane:
            return KernelCapability::all()
                .without(OperationKind::AddLegs)
                .without(OperationKind::AddHoles)
                .without(OperationKind::AddSupports)
                .without(OperationKind::LinearPattern)
                .without(OperationKind::CircularPattern);
        case EngineKind::Mesh:
            return KernelCapability::all()
                .without(OperationKind::Revolve)
                .without(OperationKind::Fillet)
                .without(OperationKind::Chamfer)
                .without(OperationKind::Shell)
                .withExports({ExportFormat::Stl, ExportFormat::Obj});
        case EngineKind::Brep:
        default:
            return KernelCapability::all();
    }
}

// =============================================================================
// Unit Normalization
// =============================================================================

namespace {

void scaleLengths(SketchRectangleParams& p, double s) { p.width *= s; p.height *= s; }
void scaleLengths(SketchCircleParams& p, double s) { p.radius *= s; }
void scaleLengths(SketchPolygonParams& p, double s) {
    for (auto& point : p.points) point = point * s;
}
void scaleLengths(ExtrudeParams& p, double s) { p.height *= s; }
void scaleLengths(RevolveParams&, double) {}
void scaleLengths(BooleanToolParams& p, double s) {
    p.length *= s;
    p.width *= s;
    p.height *= s;
    p.radius *= s;
    p.position = p.position * s;
}
void scaleLengths(EdgeModifierParams& p, double s) { p.size *= s; }
void scaleLengths(ShellParams& p, double s) { p.thickness *= s; }
void scaleLengths(AddLegsParams& p, double s) { p.height *= s; p.radius *= s; p.inset *= s; }
void scaleLengths(AddHolesParams& p, double s) {
    for (auto& position : p.positions) position = position * s;
    p.diameter *= s;
    p.depth *= s;
}
void scaleLengths(AddSupportsParams& p, double s) { p.thickness *= s; p.height *= s; }
void scaleLengths(LinearPatternParams& p, double s) { p.spacing *= s; }
void scaleLengths(CircularPatternParams&, double) {}

template<typename P>
const P* paramsAs(const Operation& op) {
    return std::get_if<P>(&op.params);
}

// Requests built in code skip the parser, so counts are bounded here too
Result<ShapePtr> checkCount(const char* operation, int count) {
    if (count < 1 || count > kMaxFeatureCount) {
        return Result<ShapePtr>::error(errc::Configuration,
            std::string(operation) + ": count " + std::to_string(count) +
            " is outside [1, " + std::to_string(kMaxFeatureCount) + "]");
    }
    return Result<ShapePtr>::ok(nullptr);
}

Result<ShapePtr> mismatchedParams(const Operation& op) {
    return Result<ShapePtr>::error(errc::Configuration,
        std::string("Parameters do not match operation '") + operationKindName(op.kind) + "'");
}

Result<ShapePtr> needsShape(OperationKind kind) {
    return Result<ShapePtr>::error(errc::Precondition,
        std::string(operationKindName(kind)) + ": no working shape");
}

// Replace result with result (op) tool, keeping the original on failure.
template<typename Combine>
Result<bool> combineInto(ShapePtr& result, Combine&& combine) {
    auto next = combine(*result);
    if (!next.success) return Result<bool>::errorFrom(next);
    result = std::move(next.value);
    return Result<bool>::ok(true);
}

} // anonymous namespace

KernelAdapter::KernelAdapter(EngineKind engine, std::unique_ptr<Kernel> kernel,
                             KernelCapability capability)
    : engine_(engine), kernel_(std::move(kernel)), capability_(std::move(capability)) {}

Operation KernelAdapter::normalize(const Operation& op) const {
    Operation out = op;
    const double scale = unitScale(units_);
    if (scale != 1.0) {
        std::visit([scale](auto& params) { scaleLengths(params, scale); }, out.params);
    }
    return out;
}

// =============================================================================
// Apply
// =============================================================================

Result<ShapePtr> KernelAdapter::apply(const Operation& op, const InternalShape* current) {
    return applyNormalized(normalize(op), current);
}

Result<ShapePtr> KernelAdapter::applyNormalized(const Operation& op, const InternalShape* current) {
    if (!isSketchKind(op.kind) && current == nullptr) {
        return needsShape(op.kind);
    }

    switch (op.kind) {
        case OperationKind::SketchRectangle: {
            const auto* p = paramsAs<SketchRectangleParams>(op);
            if (!p) return mismatchedParams(op);
            return kernel_->makeRectangle(RectangleProfileParams{p->width, p->height, p->centered});
        }
        case OperationKind::SketchCircle: {
            const auto* p = paramsAs<SketchCircleParams>(op);
            if (!p) return mismatchedParams(op);
            CircleProfileParams circle;
            circle.radius = p->radius;
            return kernel_->makeCircle(circle);
        }
        case OperationKind::SketchPolygon: {
            const auto* p = paramsAs<SketchPolygonParams>(op);
            if (!p) return mismatchedParams(op);
            return kernel_->makePolygon(PolygonProfileParams{p->points, p->closed});
        }
        case OperationKind::Extrude: {
            const auto* p = paramsAs<ExtrudeParams>(op);
            if (!p) return mismatchedParams(op);
            return kernel_->extrude(*current, p->direction * p->height);
        }
        case OperationKind::Revolve: {
            const auto* p = paramsAs<RevolveParams>(op);
            if (!p) return mismatchedParams(op);
            return kernel_->revolve(*current, p->axis, degreesToRadians(p->angleDegrees));
        }
        case OperationKind::Cut:
        case OperationKind::Fuse:
        case OperationKind::Common: {
            const auto* p = paramsAs<BooleanToolParams>(op);
            if (!p) return mismatchedParams(op);

            auto tool = makeTool(*p);
            if (!tool.success) return tool;

            if (op.kind == OperationKind::Cut) return kernel_->booleanSubtract(*current, *tool.value);
            if (op.kind == OperationKind::Fuse) return kernel_->booleanUnion(*current, *tool.value);
            return kernel_->booleanIntersect(*current, *tool.value);
        }
        case OperationKind::Fillet:
        case OperationKind::Chamfer: {
            const auto* p = paramsAs<EdgeModifierParams>(op);
            if (!p) return mismatchedParams(op);
            return modifyEdges(op.kind, *p, *current);
        }
        case OperationKind::Shell: {
            const auto* p = paramsAs<ShellParams>(op);
            if (!p) return mismatchedParams(op);
            return shell(*p, *current);
        }
        case OperationKind::AddLegs: {
            const auto* p = paramsAs<AddLegsParams>(op);
            if (!p) return mismatchedParams(op);
            return addLegs(*p, *current);
        }
        case OperationKind::AddHoles: {
            const auto* p = paramsAs<AddHolesParams>(op);
            if (!p) return mismatchedParams(op);
            return addHoles(*p, *current);
        }
        case OperationKind::AddSupports: {
            const auto* p = paramsAs<AddSupportsParams>(op);
            if (!p) return mismatchedParams(op);
            if (auto bounded = checkCount("add_supports", p->count); !bounded.success) return bounded;
            return addSupports(*p, *current);
        }
        case OperationKind::LinearPattern: {
            const auto* p = paramsAs<LinearPatternParams>(op);
            if (!p) return mismatchedParams(op);
            if (auto bounded = checkCount("linear_pattern", p->count); !bounded.success) return bounded;
            return linearPattern(*p, *current);
        }
        case OperationKind::CircularPattern: {
            const auto* p = paramsAs<CircularPatternParams>(op);
            if (!p) return mismatchedParams(op);
            if (auto bounded = checkCount("circular_pattern", p->count); !bounded.success) return bounded;
            return circularPattern(*p, *current);
        }
    }
    return mismatchedParams(op);
}

Result<ShapePtr> KernelAdapter::makeTool(const BooleanToolParams& params) {
    if (params.toolType == "box") {
        BoxParams box;
        box.size = Vector3(params.length, params.width, params.height);
        box.corner = params.position;
        return kernel_->makeBox(box);
    }
    if (params.toolType == "cylinder") {
        CylinderParams cylinder;
        cylinder.radius = params.radius;
        cylinder.height = params.height;
        cylinder.base = params.position;
        return kernel_->makeCylinder(cylinder);
    }
    return Result<ShapePtr>::error(errc::Configuration,
        "Unknown tool type '" + params.toolType + "' (expected box or cylinder)");
}

Result<ShapePtr> KernelAdapter::modifyEdges(OperationKind kind, const EdgeModifierParams& params,
                                            const InternalShape& current) {
    const size_t available = current.edgeCount();

    std::vector<int> edges;
    if (params.edges.has_value()) {
        for (int index : params.edges.value()) {
            if (index < 0 || static_cast<size_t>(index) >= available) {
                std::ostringstream msg;
                msg << operationKindName(kind) << ": edge index " << index
                    << " out of range (shape has " << available << " edges)";
                return Result<ShapePtr>::error(errc::Configuration, msg.str());
            }
            edges.push_back(index);
        }
    } else {
        edges.reserve(available);
        for (size_t i = 0; i < available; ++i) {
            edges.push_back(static_cast<int>(i));
        }
    }

    if (kind == OperationKind::Fillet) {
        return kernel_->fillet(current, params.size, edges);
    }
    return kernel_->chamfer(current, params.size, edges);
}

Result<ShapePtr> KernelAdapter::shell(const ShellParams& params, const InternalShape& current) {
    constexpr double kShellTolerance = 0.01;

    const size_t available = current.faceCount();
    for (int index : params.facesToRemove) {
        if (index < 0 || static_cast<size_t>(index) >= available) {
            std::ostringstream msg;
            msg << "shell: face index " << index
                << " out of range (shape has " << available << " faces)";
            return Result<ShapePtr>::error(errc::Configuration, msg.str());
        }
    }
    return kernel_->shell(current, params.thickness, params.facesToRemove, kShellTolerance);
}

// =============================================================================
// Composite Features
// =============================================================================

Result<ShapePtr> KernelAdapter::addLegs(const AddLegsParams& params, const InternalShape& current) {
    auto legs = legCylinders(current.getBoundingBox(), params);
    if (legs.empty()) {
        std::cerr << "[adapter] add_legs: only 4 legs are supported, got "
                  << params.count << "; no legs added" << std::endl;
    }

    ShapePtr result = current.clone();
    for (const auto& leg : legs) {
        auto status = combineInto(result, [&](const InternalShape& body) -> Result<ShapePtr> {
            auto cylinder = kernel_->makeCylinder(leg);
            if (!cylinder.success) return cylinder;
            return kernel_->booleanUnion(body, *cylinder.value);
        });
        if (!status.success) return Result<ShapePtr>::errorFrom(status);
    }
    return Result<ShapePtr>::ok(std::move(result));
}

Result<ShapePtr> KernelAdapter::addHoles(const AddHolesParams& params, const InternalShape& current) {
    ShapePtr result = current.clone();
    for (const auto& position : params.positions) {
        auto status = combineInto(result, [&](const InternalShape& body) -> Result<ShapePtr> {
            auto drill = kernel_->makeCylinder(holeCylinder(position, params));
            if (!drill.success) return drill;
            return kernel_->booleanSubtract(body, *drill.value);
        });
        if (!status.success) return Result<ShapePtr>::errorFrom(status);
    }
    return Result<ShapePtr>::ok(std::move(result));
}

Result<ShapePtr> KernelAdapter::addSupports(const AddSupportsParams& params,
                                            const InternalShape& current) {
    ShapePtr result = current.clone();
    for (const auto& support : supportBoxes(current.getBoundingBox(), params)) {
        auto status = combineInto(result, [&](const InternalShape& body) -> Result<ShapePtr> {
            auto web = kernel_->makeBox(support);
            if (!web.success) return web;
            return kernel_->booleanUnion(body, *web.value);
        });
        if (!status.success) return Result<ShapePtr>::errorFrom(status);
    }
    return Result<ShapePtr>::ok(std::move(result));
}

Result<ShapePtr> KernelAdapter::linearPattern(const LinearPatternParams& params,
                                              const InternalShape& current) {
    ShapePtr result = current.clone();
    for (const auto& offset : linearPatternOffsets(params)) {
        auto status = combineInto(result, [&](const InternalShape& body) -> Result<ShapePtr> {
            auto copy = kernel_->translate(current, offset);
            if (!copy.success) return copy;
            return kernel_->booleanUnion(body, *copy.value);
        });
        if (!status.success) return Result<ShapePtr>::errorFrom(status);
    }
    return Result<ShapePtr>::ok(std::move(result));
}

Result<ShapePtr> KernelAdapter::circularPattern(const CircularPatternParams& params,
                                                const InternalShape& current) {
    ShapePtr result = current.clone();
    for (double angle : circularPatternAngles(params)) {
        auto status = combineInto(result, [&](const InternalShape& body) -> Result<ShapePtr> {
            auto copy = kernel_->rotate(current, Vector3(0, 0, 0), params.axis, angle);
            if (!copy.success) return copy;
            return kernel_->booleanUnion(body, *copy.value);
        });
        if (!status.success) return Result<ShapePtr>::errorFrom(status);
    }
    return Result<ShapePtr>::ok(std::move(result));
}

// =============================================================================
// Single-shot Generators
// =============================================================================

Result<ShapePtr> KernelAdapter::makeStandardShape(const StandardShapeParams& params) {
    if (params.shapeType == "box") {
        BoxParams box;
        box.size = Vector3(toMillimeters(params.length), toMillimeters(params.width),
                           toMillimeters(params.height));
        return kernel_->makeBox(box);
    }
    if (params.shapeType == "cylinder") {
        CylinderParams cylinder;
        cylinder.radius = toMillimeters(params.diameter) / 2.0;
        cylinder.height = toMillimeters(params.height);
        return kernel_->makeCylinder(cylinder);
    }
    if (params.shapeType == "sphere") {
        SphereParams sphere;
        sphere.radius = toMillimeters(params.diameter) / 2.0;
        return kernel_->makeSphere(sphere);
    }
    return Result<ShapePtr>::error(errc::Configuration,
        "Unknown shape type '" + params.shapeType + "' (expected box, cylinder or sphere)");
}

Result<ShapePtr> KernelAdapter::placeTube(const FrameTube& tube) {
    CylinderParams params;
    params.radius = tube.diameter / 2.0;
    params.height = tube.length();

    auto cylinder = kernel_->makeCylinder(params);
    if (!cylinder.success) return cylinder;
    ShapePtr shape = std::move(cylinder.value);

    // Rotate the +Z cylinder onto the tube direction
    const Vector3 z(0, 0, 1);
    const Vector3 dir = tube.direction();
    const Vector3 pivot = z % dir;
    if (!pivot.isZero()) {
        double angle = std::acos(std::clamp(z * dir, -1.0, 1.0));
        auto turned = kernel_->rotate(*shape, Vector3(), pivot, angle);
        if (!turned.success) return turned;
        shape = std::move(turned.value);
    } else if (dir.z < 0) {
        auto turned = kernel_->rotate(*shape, Vector3(), Vector3(1, 0, 0), kPi);
        if (!turned.success) return turned;
        shape = std::move(turned.value);
    }

    return kernel_->translate(*shape, tube.start);
}

Result<ShapePtr> KernelAdapter::makeFrame(const FrameLayout& layout) {
    std::vector<ShapePtr> parts;
    parts.reserve(layout.tubes.size());

    for (const auto& tube : layout.tubes) {
        auto placed = placeTube(tube);
        if (!placed.success) {
            return Result<ShapePtr>::error(placed.errorCode,
                tube.name + ": " + placed.errorMessage);
        }
        parts.push_back(std::move(placed.value));
    }
    return kernel_->compound(std::move(parts));
}

// =============================================================================
// Export & Transfer
// =============================================================================

Result<MeshData> KernelAdapter::tessellate(const InternalShape& shape,
                                           const TessellateOptions& options) {
    return kernel_->tessellate(shape, options);
}

Result<bool> KernelAdapter::exportShape(const InternalShape& shape, ExportFormat format,
                                        const std::string& path,
                                        const TessellateOptions& options) {
    if (!capability_.exports(format)) {
        return Result<bool>::error(errc::Configuration,
            std::string("Engine '") + name() + "' cannot export " + exportExtension(format));
    }

    if (format == ExportFormat::Step) {
        return kernel_->exportStep(shape, path);
    }

    auto mesh = kernel_->tessellate(shape, options);
    if (!mesh.success) return Result<bool>::errorFrom(mesh);

    if (format == ExportFormat::Stl) {
        return io::writeBinaryStl(mesh.value, path);
    }
    return io::writeObj(mesh.value, path, std::string("partforge OBJ export (") + name() + ")");
}

Result<ShapeTransfer> KernelAdapter::snapshot(const InternalShape& shape) {
    return kernel_->exportTransfer(shape);
}

Result<ShapePtr> KernelAdapter::adopt(const ShapeTransfer& transfer) {
    return kernel_->importTransfer(transfer);
}

} // namespace partforge::cad
