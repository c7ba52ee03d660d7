#pragma once

/**
 * ManifoldShape - InternalShape backed by the Manifold mesh kernel
 *
 * Holds either a closed solid (manifold::Manifold) or a planar profile
 * (manifold::CrossSection in the XY plane).
 */

#include "partforge/cad/Kernel.hpp"

#ifdef PF_USE_MANIFOLD

#include "manifold/manifold.h"
#include "manifold/cross_section.h"

#include <variant>

namespace partforge::cad {

inline constexpr const char* kManifoldKernelName = "manifold";

class ManifoldShape : public InternalShape {
public:
    explicit ManifoldShape(manifold::Manifold solid)
        : body_(std::move(solid)) {}

    explicit ManifoldShape(manifold::CrossSection profile)
        : body_(std::move(profile)) {}

    ShapeType getType() const override {
        return isProfile() ? ShapeType::Face : ShapeType::Solid;
    }

    BoundingBox getBoundingBox() const override {
        BoundingBox bbox;
        if (const auto* solid = std::get_if<manifold::Manifold>(&body_)) {
            if (solid->IsEmpty()) return bbox;
            manifold::Box box = solid->BoundingBox();
            bbox.min = Vector3(box.min.x, box.min.y, box.min.z);
            bbox.max = Vector3(box.max.x, box.max.y, box.max.z);
        } else {
            const auto& profile = std::get<manifold::CrossSection>(body_);
            if (profile.IsEmpty()) return bbox;
            manifold::Rect rect = profile.Bounds();
            bbox.min = Vector3(rect.min.x, rect.min.y, 0);
            bbox.max = Vector3(rect.max.x, rect.max.y, 0);
        }
        return bbox;
    }

    double getVolume() const override {
        if (const auto* solid = std::get_if<manifold::Manifold>(&body_)) {
            return solid->Volume();
        }
        return 0.0;
    }

    double getSurfaceArea() const override {
        if (const auto* solid = std::get_if<manifold::Manifold>(&body_)) {
            return solid->SurfaceArea();
        }
        return std::get<manifold::CrossSection>(body_).Area();
    }

    size_t edgeCount() const override {
        if (const auto* solid = std::get_if<manifold::Manifold>(&body_)) {
            return solid->NumEdge();
        }
        return 0;
    }

    size_t faceCount() const override {
        if (const auto* solid = std::get_if<manifold::Manifold>(&body_)) {
            return solid->NumTri();
        }
        return 1;
    }

    size_t getEstimatedMemoryBytes() const override {
        if (const auto* solid = std::get_if<manifold::Manifold>(&body_)) {
            return 256 + solid->NumVert() * 3 * sizeof(double) + solid->NumTri() * 3 * sizeof(int);
        }
        return 256 + std::get<manifold::CrossSection>(body_).NumVert() * 2 * sizeof(double);
    }

    std::unique_ptr<InternalShape> clone() const override {
        return std::make_unique<ManifoldShape>(*this);
    }

    const char* kernelName() const override { return kManifoldKernelName; }

    bool isProfile() const {
        return std::holds_alternative<manifold::CrossSection>(body_);
    }

    const manifold::Manifold& solid() const { return std::get<manifold::Manifold>(body_); }
    const manifold::CrossSection& profile() const { return std::get<manifold::CrossSection>(body_); }

private:
    std::variant<manifold::Manifold, manifold::CrossSection> body_;
};

inline const ManifoldShape* asManifold(const InternalShape& shape) {
    return dynamic_cast<const ManifoldShape*>(&shape);
}

} // namespace partforge::cad

#endif // PF_USE_MANIFOLD
