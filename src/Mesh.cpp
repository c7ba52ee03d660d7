#include "partforge/Mesh.hpp"
#include <algorithm>

namespace partforge {

Mesh Mesh::fromMeshData(const cad::MeshData& data) {
    Mesh mesh;
    mesh.faces_.reserve(data.triangleCount());

    auto at = [&data](uint32_t i) {
        return Vector3(data.positions[i * 3], data.positions[i * 3 + 1], data.positions[i * 3 + 2]);
    };

    for (size_t t = 0; t < data.triangleCount(); ++t) {
        uint32_t a = mesh.weld(at(data.indices[t * 3]));
        uint32_t b = mesh.weld(at(data.indices[t * 3 + 1]));
        uint32_t c = mesh.weld(at(data.indices[t * 3 + 2]));
        mesh.faces_.emplace_back(a, b, c);
    }
    return mesh;
}

uint32_t Mesh::weld(const Vector3& v) {
    auto it = lookup_.find(v);
    if (it != lookup_.end()) {
        return it->second;
    }
    uint32_t index = static_cast<uint32_t>(vertices_.size());
    lookup_.emplace(v, index);
    vertices_.push_back(v);
    return index;
}

bool Mesh::isWatertight() const {
    if (faces_.empty()) {
        return false;
    }

    // Undirected edge (low, high) -> number of incident triangles
    std::map<std::pair<uint32_t, uint32_t>, int> edgeCount;
    for (const auto& face : faces_) {
        const uint32_t edges[3][2] = {
            {face.v0, face.v1},
            {face.v1, face.v2},
            {face.v2, face.v0}
        };
        for (const auto& edge : edges) {
            edgeCount[std::minmax(edge[0], edge[1])]++;
        }
    }

    return std::all_of(edgeCount.begin(), edgeCount.end(),
                       [](const auto& entry) { return entry.second == 2; });
}

} // namespace partforge
