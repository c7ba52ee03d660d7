#pragma once

/**
 * OCCTShape - InternalShape backed by an OpenCASCADE TopoDS_Shape
 */

#include "partforge/cad/Kernel.hpp"

#ifdef PF_USE_OCCT

#include <TopoDS_Shape.hxx>
#include <TopoDS.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <Bnd_Box.hxx>
#include <BRepBndLib.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRepBuilderAPI_Copy.hxx>
#include <BRep_Tool.hxx>
#include <Poly_Triangulation.hxx>
#include <TopLoc_Location.hxx>
#include <Standard_Failure.hxx>
#include <gp_Pnt.hxx>
#include <gp_Dir.hxx>
#include <gp_Vec.hxx>

#include <optional>
#include <string>

namespace partforge::cad {

inline constexpr const char* kOcctKernelName = "occt";

class OCCTShape : public InternalShape {
public:
    explicit OCCTShape(const TopoDS_Shape& shape, ShapeType type = ShapeType::Solid)
        : shape_(shape), type_(type) {
        computeCachedProperties();
    }

    ~OCCTShape() override = default;

    ShapeType getType() const override { return type_; }

    BoundingBox getBoundingBox() const override {
        return cachedBBox_;
    }

    double getVolume() const override {
        if (!cachedVolume_.has_value()) {
            GProp_GProps props;
            BRepGProp::VolumeProperties(shape_, props);
            cachedVolume_ = props.Mass();
        }
        return cachedVolume_.value();
    }

    double getSurfaceArea() const override {
        if (!cachedSurfaceArea_.has_value()) {
            GProp_GProps props;
            BRepGProp::SurfaceProperties(shape_, props);
            cachedSurfaceArea_ = props.Mass();
        }
        return cachedSurfaceArea_.value();
    }

    size_t edgeCount() const override {
        return static_cast<size_t>(edges().Extent());
    }

    size_t faceCount() const override {
        return static_cast<size_t>(faces().Extent());
    }

    size_t getEstimatedMemoryBytes() const override {
        // Each face ~1KB, each edge ~100B
        return 1024 + faceCount() * 1024 + edgeCount() * 100;
    }

    std::unique_ptr<InternalShape> clone() const override {
        BRepBuilderAPI_Copy copier(shape_);
        return std::make_unique<OCCTShape>(copier.Shape(), type_);
    }

    const char* kernelName() const override { return kOcctKernelName; }

    /// Distinct edges in stable exploration order (1-based map).
    TopTools_IndexedMapOfShape edges() const {
        TopTools_IndexedMapOfShape map;
        TopExp::MapShapes(shape_, TopAbs_EDGE, map);
        return map;
    }

    TopTools_IndexedMapOfShape faces() const {
        TopTools_IndexedMapOfShape map;
        TopExp::MapShapes(shape_, TopAbs_FACE, map);
        return map;
    }

    /**
     * @brief Triangulate every face, flipping reversed faces so the
     * winding stays outward.
     */
    MeshData tessellate(const TessellateOptions& options) const {
        MeshData mesh;

        BRepMesh_IncrementalMesh mesher(
            shape_,
            options.linearDeflection,
            options.relative,
            options.angularDeflection
        );
        mesher.Perform();

        uint32_t indexOffset = 0;

        for (TopExp_Explorer exp(shape_, TopAbs_FACE); exp.More(); exp.Next()) {
            TopoDS_Face face = TopoDS::Face(exp.Current());
            TopLoc_Location loc;
            Handle(Poly_Triangulation) tri = BRep_Tool::Triangulation(face, loc);

            if (tri.IsNull()) continue;

            const gp_Trsf& transform = loc.Transformation();
            const bool reversed = (face.Orientation() == TopAbs_REVERSED);

            for (int i = 1; i <= tri->NbNodes(); ++i) {
                gp_Pnt p = tri->Node(i).Transformed(transform);
                mesh.positions.push_back(static_cast<float>(p.X()));
                mesh.positions.push_back(static_cast<float>(p.Y()));
                mesh.positions.push_back(static_cast<float>(p.Z()));
            }

            for (int i = 1; i <= tri->NbTriangles(); ++i) {
                int n1, n2, n3;
                tri->Triangle(i).Get(n1, n2, n3);

                // 1-based to 0-based
                n1 -= 1;
                n2 -= 1;
                n3 -= 1;

                mesh.indices.push_back(indexOffset + n1);
                if (reversed) {
                    mesh.indices.push_back(indexOffset + n3);
                    mesh.indices.push_back(indexOffset + n2);
                } else {
                    mesh.indices.push_back(indexOffset + n2);
                    mesh.indices.push_back(indexOffset + n3);
                }
            }

            indexOffset += tri->NbNodes();
        }

        return mesh;
    }

    const TopoDS_Shape& shape() const { return shape_; }

private:
    void computeCachedProperties() {
        Bnd_Box box;
        BRepBndLib::Add(shape_, box);

        if (!box.IsVoid()) {
            double xmin, ymin, zmin, xmax, ymax, zmax;
            box.Get(xmin, ymin, zmin, xmax, ymax, zmax);
            cachedBBox_.min = Vector3(xmin, ymin, zmin);
            cachedBBox_.max = Vector3(xmax, ymax, zmax);
        }
    }

    TopoDS_Shape shape_;
    ShapeType type_;

    BoundingBox cachedBBox_;
    mutable std::optional<double> cachedVolume_;
    mutable std::optional<double> cachedSurfaceArea_;
};

/// Native shape of an OCCT-owned InternalShape, or nullptr for a foreign one.
inline const OCCTShape* asOCCT(const InternalShape& shape) {
    return dynamic_cast<const OCCTShape*>(&shape);
}

/// Classify a kernel result by its top-level topology.
inline ShapeType classify(const TopoDS_Shape& shape) {
    switch (shape.ShapeType()) {
        case TopAbs_COMPOUND:
        case TopAbs_COMPSOLID:
            return ShapeType::Compound;
        case TopAbs_SOLID:
            return ShapeType::Solid;
        case TopAbs_SHELL:
            return ShapeType::Shell;
        case TopAbs_FACE:
            return ShapeType::Face;
        case TopAbs_WIRE:
        case TopAbs_EDGE:
            return ShapeType::Wire;
        default:
            return ShapeType::Unknown;
    }
}

inline gp_Pnt toGpPnt(const Vector3& v) {
    return gp_Pnt(v.x, v.y, v.z);
}

inline gp_Dir toGpDir(const Vector3& v) {
    return gp_Dir(v.x, v.y, v.z);
}

inline gp_Vec toGpVec(const Vector3& v) {
    return gp_Vec(v.x, v.y, v.z);
}

inline Result<ShapePtr> wrapShape(const TopoDS_Shape& shape) {
    if (shape.IsNull()) {
        return Result<ShapePtr>::error(errc::KernelExecution, "Kernel returned an empty shape");
    }
    return Result<ShapePtr>::ok(std::make_unique<OCCTShape>(shape, classify(shape)));
}

inline std::string failureMessage(const Standard_Failure& e) {
    const char* msg = e.GetMessageString();
    if (msg != nullptr && *msg != '\0') {
        return msg;
    }
    return e.DynamicType()->Name();
}

template<typename T>
Result<T> occtFailure(const char* operation, const Standard_Failure& e) {
    return Result<T>::error(errc::KernelExecution,
        std::string(operation) + " failed: " + failureMessage(e));
}

template<typename T>
Result<T> foreignShape(const InternalShape& shape) {
    return Result<T>::error(errc::KernelExecution,
        std::string("Shape belongs to kernel '") + shape.kernelName() + "', not occt");
}

} // namespace partforge::cad

#endif // PF_USE_OCCT
