#pragma once

#include <vector>
#include "Operation.hpp"

namespace partforge::cad {

// ===========================================================================
// Parametric Feature Placement
//
// Pure placement math for the composite operations. Inputs and outputs are
// in the same length unit; nothing here touches a kernel.
// ===========================================================================

/**
 * @brief Leg cylinders for AddLegs
 *
 * Four corners of the bounding box inset by params.inset in X and Y,
 * ordered (min,min), (max,min), (max,max), (min,max). Each cylinder runs
 * from zMin - height up to zMin. Counts other than 4 yield no legs.
 */
std::vector<CylinderParams> legCylinders(const BoundingBox& bbox, const AddLegsParams& params);

/**
 * @brief Support webs for AddSupports
 *
 * count boxes spaced (yMax - yMin) / (count + 1) apart along Y, each
 * spanning the full X width and centred on its Y station.
 */
std::vector<BoxParams> supportBoxes(const BoundingBox& bbox, const AddSupportsParams& params);

/// Drill cylinder for one AddHoles position, rising along +Z.
CylinderParams holeCylinder(const Vector3& position, const AddHolesParams& params);

/// Offsets of pattern copies 1..count-1 (the original is copy 0).
std::vector<Vector3> linearPatternOffsets(const LinearPatternParams& params);

/// Rotation angles in radians of pattern copies 1..count-1.
std::vector<double> circularPatternAngles(const CircularPatternParams& params);

} // namespace partforge::cad
