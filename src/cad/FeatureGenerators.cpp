/**
 * FeatureGenerators.cpp - Placement math for legs, supports, holes and patterns
 */

#include "partforge/cad/FeatureGenerators.hpp"

namespace partforge::cad {

std::vector<CylinderParams> legCylinders(const BoundingBox& bbox, const AddLegsParams& params) {
    std::vector<CylinderParams> legs;
    if (params.count != 4) {
        return legs;
    }

    const double x0 = bbox.min.x + params.inset;
    const double x1 = bbox.max.x - params.inset;
    const double y0 = bbox.min.y + params.inset;
    const double y1 = bbox.max.y - params.inset;
    const double z = bbox.min.z - params.height;

    const Vector3 corners[4] = {
        Vector3(x0, y0, z),
        Vector3(x1, y0, z),
        Vector3(x1, y1, z),
        Vector3(x0, y1, z)
    };

    legs.reserve(4);
    for (const auto& corner : corners) {
        CylinderParams leg;
        leg.radius = params.radius;
        leg.height = params.height;
        leg.base = corner;
        leg.axis = Vector3(0, 0, 1);
        legs.push_back(leg);
    }
    return legs;
}

std::vector<BoxParams> supportBoxes(const BoundingBox& bbox, const AddSupportsParams& params) {
    std::vector<BoxParams> supports;
    if (params.count < 1) {
        return supports;
    }

    const Vector3 extent = bbox.size();
    const double spacing = extent.y / (params.count + 1);

    supports.reserve(params.count);
    for (int i = 1; i <= params.count; ++i) {
        const double y = bbox.min.y + i * spacing;

        BoxParams box;
        box.size = Vector3(extent.x, params.thickness, params.height);
        box.corner = Vector3(bbox.min.x, y - params.thickness / 2.0, bbox.min.z);
        supports.push_back(box);
    }
    return supports;
}

CylinderParams holeCylinder(const Vector3& position, const AddHolesParams& params) {
    CylinderParams hole;
    hole.radius = params.diameter / 2.0;
    hole.height = params.depth;
    hole.base = position;
    hole.axis = Vector3(0, 0, 1);
    return hole;
}

std::vector<Vector3> linearPatternOffsets(const LinearPatternParams& params) {
    std::vector<Vector3> offsets;
    for (int i = 1; i < params.count; ++i) {
        offsets.push_back(params.direction * (params.spacing * i));
    }
    return offsets;
}

std::vector<double> circularPatternAngles(const CircularPatternParams& params) {
    std::vector<double> angles;
    if (params.count < 1) {
        return angles;
    }

    const double step = 2.0 * kPi / params.count;
    for (int i = 1; i < params.count; ++i) {
        angles.push_back(step * i);
    }
    return angles;
}

} // namespace partforge::cad
