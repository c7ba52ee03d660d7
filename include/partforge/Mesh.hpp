#pragma once
#include "Vector3.hpp"
#include "cad/Types.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace partforge {

/**
 * @brief Triangle face defined by 3 vertex indices
 */
struct Triangle {
    uint32_t v0 = 0, v1 = 0, v2 = 0;

    Triangle() = default;
    Triangle(uint32_t a, uint32_t b, uint32_t c) : v0(a), v1(b), v2(c) {}
};

/**
 * @brief Indexed triangle mesh with welded vertices
 *
 * Used to inspect what a build actually exported: triangle count and
 * closedness of the tessellation.
 */
class Mesh {
public:
    Mesh() = default;

    /**
     * @brief Build from kernel tessellation output
     *
     * Coincident vertices are welded, since tessellators emit one vertex
     * set per face and the faces would otherwise never share an edge.
     */
    static Mesh fromMeshData(const cad::MeshData& data);

    /**
     * @brief Every edge shared by exactly two triangles
     */
    bool isWatertight() const;

    size_t getVertexCount() const { return vertices_.size(); }
    size_t getTriangleCount() const { return faces_.size(); }

private:
    /// Index of v, appending it if no identical vertex exists yet.
    uint32_t weld(const Vector3& v);

    std::vector<Vector3> vertices_;
    std::vector<Triangle> faces_;
    std::map<Vector3, uint32_t> lookup_;
};

} // namespace partforge
