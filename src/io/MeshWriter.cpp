/**
 * MeshWriter.cpp - STL and OBJ writers for tessellated shapes
 */

#include "partforge/io/MeshWriter.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>

namespace partforge::io {

using cad::MeshData;
using cad::Result;

namespace {

void appendFloat(std::string& out, float value) {
    char bytes[4];
    std::memcpy(bytes, &value, 4);
    out.append(bytes, 4);
}

Vector3 vertexAt(const MeshData& mesh, uint32_t index) {
    return Vector3(mesh.positions[index * 3],
                   mesh.positions[index * 3 + 1],
                   mesh.positions[index * 3 + 2]);
}

} // anonymous namespace

Result<bool> writeBinaryStl(const MeshData& mesh, const std::string& path,
                            const std::string& header) {
    std::string buffer;
    buffer.reserve(84 + mesh.triangleCount() * 50);

    // 80-byte header, zero padded
    std::string head = header.substr(0, 80);
    head.resize(80, '\0');
    buffer += head;

    uint32_t triangleCount = static_cast<uint32_t>(mesh.triangleCount());
    char countBytes[4];
    std::memcpy(countBytes, &triangleCount, 4);
    buffer.append(countBytes, 4);

    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        Vector3 a = vertexAt(mesh, mesh.indices[t * 3]);
        Vector3 b = vertexAt(mesh, mesh.indices[t * 3 + 1]);
        Vector3 c = vertexAt(mesh, mesh.indices[t * 3 + 2]);
        Vector3 n = ((b - a) % (c - a)).normalized();

        for (const Vector3& v : {n, a, b, c}) {
            appendFloat(buffer, static_cast<float>(v.x));
            appendFloat(buffer, static_cast<float>(v.y));
            appendFloat(buffer, static_cast<float>(v.z));
        }
        buffer.append(2, '\0');
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<bool>::error(cad::errc::Io, "Could not open STL file for writing: " + path);
    }
    file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (!file) {
        return Result<bool>::error(cad::errc::Io, "Failed to write STL file: " + path);
    }
    return Result<bool>::ok(true);
}

std::string formatObj(const MeshData& mesh, const std::string& comment) {
    std::ostringstream out;
    out << "# " << comment << "\n";

    for (size_t v = 0; v < mesh.vertexCount(); ++v) {
        out << "v " << mesh.positions[v * 3] << " "
            << mesh.positions[v * 3 + 1] << " "
            << mesh.positions[v * 3 + 2] << "\n";
    }

    // OBJ indices are 1-based
    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        out << "f " << mesh.indices[t * 3] + 1 << " "
            << mesh.indices[t * 3 + 1] + 1 << " "
            << mesh.indices[t * 3 + 2] + 1 << "\n";
    }
    return out.str();
}

Result<bool> writeObj(const MeshData& mesh, const std::string& path, const std::string& comment) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return Result<bool>::error(cad::errc::Io, "Could not open OBJ file for writing: " + path);
    }
    file << formatObj(mesh, comment);
    if (!file) {
        return Result<bool>::error(cad::errc::Io, "Failed to write OBJ file: " + path);
    }
    return Result<bool>::ok(true);
}

} // namespace partforge::io
