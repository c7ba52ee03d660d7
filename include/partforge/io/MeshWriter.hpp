#pragma once

#include <string>
#include "../cad/Types.hpp"

namespace partforge::io {

/**
 * @brief Write a binary STL file
 *
 * 80-byte header, little-endian triangle count, then per triangle a facet
 * normal computed from the winding, three vertices and a zero attribute.
 */
cad::Result<bool> writeBinaryStl(const cad::MeshData& mesh, const std::string& path,
                                 const std::string& header = "partforge");

/// Plain-text OBJ body: comment line, "v x y z" lines, 1-based "f a b c" lines.
std::string formatObj(const cad::MeshData& mesh, const std::string& comment);

cad::Result<bool> writeObj(const cad::MeshData& mesh, const std::string& path,
                           const std::string& comment);

} // namespace partforge::io
