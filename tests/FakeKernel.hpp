#pragma once

#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "partforge/cad/Kernel.hpp"
#include "partforge/cad/KernelAdapter.hpp"
#include "partforge/cad/KernelRouter.hpp"

namespace partforge::test {

using namespace partforge::cad;

/**
 * Box-approximated shape: tracks type, bounds, volume, area and topology
 * counts well enough to check what the adapter asked the kernel to do.
 */
class FakeShape : public InternalShape {
public:
    ShapeType type = ShapeType::Solid;
    BoundingBox bounds;
    double volume = 0;
    double area = 0;
    size_t edges = 0;
    size_t faces = 0;
    std::string origin;

    ShapeType getType() const override { return type; }
    BoundingBox getBoundingBox() const override { return bounds; }
    double getVolume() const override { return volume; }
    double getSurfaceArea() const override { return area; }
    size_t edgeCount() const override { return edges; }
    size_t faceCount() const override { return faces; }
    size_t getEstimatedMemoryBytes() const override { return sizeof(FakeShape); }
    std::unique_ptr<InternalShape> clone() const override { return std::make_unique<FakeShape>(*this); }
    const char* kernelName() const override { return origin.c_str(); }
};

/// Everything the fake saw, shared so tests can inspect it after the
/// adapter takes ownership of the kernel.
struct FakeKernelLog {
    std::vector<std::string> calls;
    std::vector<BoxParams> boxes;
    std::vector<CylinderParams> cylinders;
    std::vector<RectangleProfileParams> rectangles;
    std::vector<Vector3> extrusions;
    std::vector<Vector3> translations;
    std::vector<double> rotations;
    std::vector<std::vector<int>> edgeSelections;
    std::vector<std::vector<int>> faceSelections;
    std::vector<double> modifierSizes;
    std::vector<std::string> exportedPaths;
    size_t imports = 0;

    size_t count(const std::string& call) const {
        size_t n = 0;
        for (const auto& c : calls) n += (c == call) ? 1 : 0;
        return n;
    }
};

struct FakeKernelConfig {
    std::string name = "fake";
    std::set<std::string> unsupported;   // calls answered with KERNEL_UNSUPPORTED_OPERATION
    std::set<std::string> failing;       // calls answered with KERNEL_EXECUTION_ERROR
    bool openPolygonUnsupported = false;
};

class FakeKernel : public Kernel {
public:
    FakeKernel(FakeKernelConfig config, std::shared_ptr<FakeKernelLog> log)
        : config_(std::move(config)), log_(std::move(log)) {}

    std::string name() const override { return config_.name; }
    std::string version() const override { return "test"; }

    Result<ShapePtr> makeRectangle(const RectangleProfileParams& p) override {
        if (auto r = gate("makeRectangle")) return std::move(*r);
        log_->rectangles.push_back(p);
        Vector3 min = p.centered ? Vector3(-p.width / 2, -p.height / 2, 0) : Vector3();
        return profile(min, min + Vector3(p.width, p.height, 0), p.width * p.height, 4);
    }

    Result<ShapePtr> makeCircle(const CircleProfileParams& p) override {
        if (auto r = gate("makeCircle")) return std::move(*r);
        Vector3 r(p.radius, p.radius, 0);
        return profile(p.center - r, p.center + r, kPi * p.radius * p.radius, 1);
    }

    Result<ShapePtr> makePolygon(const PolygonProfileParams& p) override {
        if (auto r = gate("makePolygon")) return std::move(*r);
        if (!p.closed && config_.openPolygonUnsupported) {
            return Result<ShapePtr>::error(errc::KernelUnsupported, "open profiles are not supported");
        }
        BoundingBox box = boundsOf(p.points);
        double twiceArea = 0;
        for (size_t i = 0; i < p.points.size(); ++i) {
            const Vector3& a = p.points[i];
            const Vector3& b = p.points[(i + 1) % p.points.size()];
            twiceArea += a.x * b.y - b.x * a.y;
        }
        auto shape = profile(box.min, box.max, std::abs(twiceArea) / 2, p.points.size());
        if (!p.closed) {
            static_cast<FakeShape&>(*shape.value).type = ShapeType::Wire;
        }
        return shape;
    }

    Result<ShapePtr> makeBox(const BoxParams& p) override {
        if (auto r = gate("makeBox")) return std::move(*r);
        log_->boxes.push_back(p);
        return solid(p.corner, p.corner + p.size, p.size.x * p.size.y * p.size.z, 12, 6);
    }

    Result<ShapePtr> makeCylinder(const CylinderParams& p) override {
        if (auto r = gate("makeCylinder")) return std::move(*r);
        log_->cylinders.push_back(p);
        Vector3 top = p.base + p.axis.normalized() * p.height;
        Vector3 r(p.radius, p.radius, 0);
        BoundingBox box = boundsOf({p.base - r, p.base + r, top - r, top + r});
        return solid(box.min, box.max, kPi * p.radius * p.radius * p.height, 3, 3);
    }

    Result<ShapePtr> makeSphere(const SphereParams& p) override {
        if (auto r = gate("makeSphere")) return std::move(*r);
        Vector3 r(p.radius, p.radius, p.radius);
        return solid(p.center - r, p.center + r, 4.0 / 3.0 * kPi * std::pow(p.radius, 3), 1, 1);
    }

    Result<ShapePtr> extrude(const InternalShape& profileShape, const Vector3& vector) override {
        if (auto r = gate("extrude")) return std::move(*r);
        log_->extrusions.push_back(vector);
        BoundingBox b = profileShape.getBoundingBox();
        BoundingBox box = boundsOf({b.min, b.max, b.min + vector, b.max + vector});
        size_t n = profileShape.edgeCount();
        return solid(box.min, box.max, profileShape.getSurfaceArea() * vector.length(), n * 3, n + 2);
    }

    Result<ShapePtr> revolve(const InternalShape& profileShape, const Vector3&, double angle) override {
        if (auto r = gate("revolve")) return std::move(*r);
        log_->rotations.push_back(angle);
        BoundingBox b = profileShape.getBoundingBox();
        double reach = std::max(std::abs(b.min.x), std::abs(b.max.x));
        return solid(Vector3(-reach, -reach, b.min.z), Vector3(reach, reach, b.max.z),
                     profileShape.getSurfaceArea() * angle * reach / 2, 3, 3);
    }

    Result<ShapePtr> booleanUnion(const InternalShape& a, const InternalShape& b) override {
        if (auto r = gate("booleanUnion")) return std::move(*r);
        BoundingBox ba = a.getBoundingBox(), bb = b.getBoundingBox();
        return solid(minOf(ba.min, bb.min), maxOf(ba.max, bb.max), a.getVolume() + b.getVolume(),
                     a.edgeCount() + b.edgeCount(), a.faceCount() + b.faceCount());
    }

    Result<ShapePtr> booleanSubtract(const InternalShape& base, const InternalShape& tool) override {
        if (auto r = gate("booleanSubtract")) return std::move(*r);
        BoundingBox b = base.getBoundingBox();
        return solid(b.min, b.max, std::max(0.0, base.getVolume() - tool.getVolume()),
                     base.edgeCount() + tool.edgeCount(), base.faceCount() + 1);
    }

    Result<ShapePtr> booleanIntersect(const InternalShape& a, const InternalShape& b) override {
        if (auto r = gate("booleanIntersect")) return std::move(*r);
        BoundingBox ba = a.getBoundingBox(), bb = b.getBoundingBox();
        return solid(maxOf(ba.min, bb.min), minOf(ba.max, bb.max),
                     std::min(a.getVolume(), b.getVolume()), a.edgeCount(), a.faceCount());
    }

    Result<ShapePtr> fillet(const InternalShape& shape, double radius,
                            const std::vector<int>& edges) override {
        if (auto r = gate("fillet")) return std::move(*r);
        return modified(shape, radius, edges);
    }

    Result<ShapePtr> chamfer(const InternalShape& shape, double distance,
                             const std::vector<int>& edges) override {
        if (auto r = gate("chamfer")) return std::move(*r);
        return modified(shape, distance, edges);
    }

    Result<ShapePtr> shell(const InternalShape& shape, double thickness,
                           const std::vector<int>& faces, double) override {
        if (auto r = gate("shell")) return std::move(*r);
        log_->faceSelections.push_back(faces);
        log_->modifierSizes.push_back(thickness);
        BoundingBox b = shape.getBoundingBox();
        return solid(b.min, b.max, shape.getVolume() / 2, shape.edgeCount() * 2, shape.faceCount() * 2);
    }

    Result<ShapePtr> translate(const InternalShape& shape, const Vector3& offset) override {
        if (auto r = gate("translate")) return std::move(*r);
        log_->translations.push_back(offset);
        auto moved = std::make_unique<FakeShape>(static_cast<const FakeShape&>(shape));
        moved->bounds.min = moved->bounds.min + offset;
        moved->bounds.max = moved->bounds.max + offset;
        return Result<ShapePtr>::ok(std::move(moved));
    }

    Result<ShapePtr> rotate(const InternalShape& shape, const Vector3& origin,
                            const Vector3& axis, double angle) override {
        if (auto r = gate("rotate")) return std::move(*r);
        log_->rotations.push_back(angle);
        Matrix3 m = Matrix3::rotation(axis, angle);
        BoundingBox b = shape.getBoundingBox();
        std::vector<Vector3> corners;
        for (int i = 0; i < 8; ++i) {
            Vector3 c((i & 1) ? b.max.x : b.min.x, (i & 2) ? b.max.y : b.min.y,
                      (i & 4) ? b.max.z : b.min.z);
            corners.push_back(origin + m * (c - origin));
        }
        auto turned = std::make_unique<FakeShape>(static_cast<const FakeShape&>(shape));
        turned->bounds = boundsOf(corners);
        return Result<ShapePtr>::ok(std::move(turned));
    }

    Result<ShapePtr> compound(std::vector<ShapePtr> parts) override {
        if (auto r = gate("compound")) return std::move(*r);
        std::vector<Vector3> corners;
        double volume = 0;
        for (const auto& part : parts) {
            corners.push_back(part->getBoundingBox().min);
            corners.push_back(part->getBoundingBox().max);
            volume += part->getVolume();
        }
        BoundingBox box = boundsOf(corners);
        auto result = solid(box.min, box.max, volume, parts.size() * 3, parts.size() * 3);
        static_cast<FakeShape&>(*result.value).type = ShapeType::Compound;
        return result;
    }

    /// Closed 12-triangle box over the bounds.
    Result<MeshData> tessellate(const InternalShape& shape, const TessellateOptions&) override {
        if (auto r = gate("tessellate")) return Result<MeshData>::errorFrom(*r);
        BoundingBox b = shape.getBoundingBox();
        MeshData mesh;
        for (int i = 0; i < 8; ++i) {
            mesh.positions.push_back(static_cast<float>((i & 1) ? b.max.x : b.min.x));
            mesh.positions.push_back(static_cast<float>((i & 2) ? b.max.y : b.min.y));
            mesh.positions.push_back(static_cast<float>((i & 4) ? b.max.z : b.min.z));
        }
        mesh.indices = {0, 2, 1, 1, 2, 3,   4, 5, 6, 5, 7, 6,
                        0, 1, 4, 1, 5, 4,   2, 6, 3, 3, 6, 7,
                        0, 4, 2, 2, 4, 6,   1, 3, 5, 3, 7, 5};
        return Result<MeshData>::ok(std::move(mesh));
    }

    Result<bool> exportStep(const InternalShape&, const std::string& path) override {
        if (auto r = gate("exportStep")) return Result<bool>::errorFrom(*r);
        std::ofstream file(path);
        file << "ISO-10303-21;\nEND-ISO-10303-21;\n";
        log_->exportedPaths.push_back(path);
        return Result<bool>::ok(true);
    }

    Result<ShapeTransfer> exportTransfer(const InternalShape& shape) override {
        if (auto r = gate("exportTransfer")) return Result<ShapeTransfer>::errorFrom(*r);
        const auto& s = static_cast<const FakeShape&>(shape);
        std::ostringstream out;
        out << static_cast<int>(s.type) << ' ' << s.bounds.min.x << ' ' << s.bounds.min.y << ' '
            << s.bounds.min.z << ' ' << s.bounds.max.x << ' ' << s.bounds.max.y << ' '
            << s.bounds.max.z << ' ' << s.volume << ' ' << s.area << ' ' << s.edges << ' '
            << s.faces;
        ShapeTransfer transfer;
        transfer.format = ShapeTransfer::Format::BRepText;
        transfer.type = s.type;
        transfer.brep = out.str();
        return Result<ShapeTransfer>::ok(std::move(transfer));
    }

    Result<ShapePtr> importTransfer(const ShapeTransfer& transfer) override {
        if (auto r = gate("importTransfer")) return std::move(*r);
        log_->imports++;
        auto s = std::make_unique<FakeShape>();
        std::istringstream in(transfer.brep);
        int type = 0;
        in >> type >> s->bounds.min.x >> s->bounds.min.y >> s->bounds.min.z >> s->bounds.max.x
           >> s->bounds.max.y >> s->bounds.max.z >> s->volume >> s->area >> s->edges >> s->faces;
        s->type = static_cast<ShapeType>(type);
        s->origin = config_.name;
        return Result<ShapePtr>::ok(std::move(s));
    }

private:
    std::optional<Result<ShapePtr>> gate(const std::string& call) {
        log_->calls.push_back(call);
        if (config_.unsupported.count(call)) {
            return Result<ShapePtr>::error(errc::KernelUnsupported, call + " unsupported by " + config_.name);
        }
        if (config_.failing.count(call)) {
            return Result<ShapePtr>::error(errc::KernelExecution, call + " failed");
        }
        return std::nullopt;
    }

    Result<ShapePtr> solid(const Vector3& min, const Vector3& max, double volume,
                           size_t edges, size_t faces) {
        auto s = std::make_unique<FakeShape>();
        s->bounds.min = min;
        s->bounds.max = max;
        s->volume = volume;
        s->edges = edges;
        s->faces = faces;
        s->origin = config_.name;
        return Result<ShapePtr>::ok(std::move(s));
    }

    Result<ShapePtr> profile(const Vector3& min, const Vector3& max, double area, size_t edges) {
        auto shape = solid(min, max, 0, edges, 1);
        auto& s = static_cast<FakeShape&>(*shape.value);
        s.type = ShapeType::Face;
        s.area = area;
        return shape;
    }

    Result<ShapePtr> modified(const InternalShape& shape, double size, const std::vector<int>& edges) {
        log_->edgeSelections.push_back(edges);
        log_->modifierSizes.push_back(size);
        BoundingBox b = shape.getBoundingBox();
        return solid(b.min, b.max, shape.getVolume() * 0.99, shape.edgeCount() * 2,
                     shape.faceCount() + edges.size());
    }

    static Vector3 minOf(const Vector3& a, const Vector3& b) {
        return Vector3(std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z));
    }
    static Vector3 maxOf(const Vector3& a, const Vector3& b) {
        return Vector3(std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z));
    }
    static BoundingBox boundsOf(const std::vector<Vector3>& points) {
        BoundingBox box;
        if (points.empty()) return box;
        box.min = box.max = points.front();
        for (const auto& p : points) {
            box.min = minOf(box.min, p);
            box.max = maxOf(box.max, p);
        }
        return box;
    }

    FakeKernelConfig config_;
    std::shared_ptr<FakeKernelLog> log_;
};

/**
 * Adapter factory over fakes. Each engine keeps its real capability table;
 * the mesh fake also rejects open polygons at apply time. Engines listed in
 * unavailable fail to construct.
 */
inline KernelRouter::AdapterFactory fakeAdapterFactory(std::shared_ptr<FakeKernelLog> log,
                                                       std::set<EngineKind> unavailable = {}) {
    return [log, unavailable](EngineKind engine) -> Result<std::unique_ptr<KernelAdapter>> {
        if (unavailable.count(engine)) {
            return Result<std::unique_ptr<KernelAdapter>>::error(errc::Configuration,
                std::string(engineName(engine)) + " unavailable");
        }
        FakeKernelConfig config;
        config.name = std::string("fake-") + engineName(engine);
        if (engine == EngineKind::Mesh) {
            config.openPolygonUnsupported = true;
            config.unsupported = {"revolve", "fillet", "chamfer", "shell", "exportStep"};
        }
        return Result<std::unique_ptr<KernelAdapter>>::ok(std::make_unique<KernelAdapter>(
            engine, std::make_unique<FakeKernel>(config, log), builtinCapability(engine)));
    };
}

/// Adapter around a single fake kernel, for adapter-level tests.
inline std::unique_ptr<KernelAdapter> makeFakeAdapter(std::shared_ptr<FakeKernelLog> log,
                                                      EngineKind engine = EngineKind::Brep,
                                                      FakeKernelConfig config = {}) {
    return std::make_unique<KernelAdapter>(engine, std::make_unique<FakeKernel>(config, log),
                                           builtinCapability(engine));
}

inline Operation op(OperationKind kind) {
    return Operation::withDefaults(kind);
}

template<typename P>
Operation op(OperationKind kind, P params) {
    Operation o;
    o.kind = kind;
    o.params = std::move(params);
    return o;
}

} // namespace partforge::test
