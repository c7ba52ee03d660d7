#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

namespace partforge::cad {

// ===========================================================================
// Bicycle Frame Layout
//
// Closed-form frame geometry driven by one scalar, the rider height. Lengths
// are millimetres, angles degrees. The layout is pure data; the adapter
// turns each tube into a kernel cylinder.
// ===========================================================================

enum class FrameMaterial {
    Aluminum,
    Steel,
    Carbon
};

/// Unknown names fall back to aluminum.
FrameMaterial parseFrameMaterial(const std::string& name);
const char* frameMaterialName(FrameMaterial material);

/**
 * @brief Empirical frame ratios applied to rider height
 */
struct FrameRatios {
    static constexpr double stack = 0.32;
    static constexpr double reach = 0.24;
    static constexpr double seatTube = 0.50;
    static constexpr double topTube = 0.30;
    static constexpr double headTube = 0.065;
    static constexpr double chainstay = 0.25;
    static constexpr double seatstayOfChainstay = 0.9;
    static constexpr double bbDropMm = 70.0;
    static constexpr double headAngleDeg = 72.0;
    static constexpr double seatAngleDeg = 73.5;
    static constexpr double stayOffsetMm = 40.0;          // Half the rear spacing in Y
    static constexpr double seatstayAttachFraction = 0.7; // Up the seat tube
};

struct FrameGeometry {
    double riderHeight = 0;
    double stack = 0;
    double reach = 0;
    double seatTube = 0;
    double topTube = 0;
    double headTube = 0;
    double chainstay = 0;
    double seatstay = 0;
    double bbDrop = FrameRatios::bbDropMm;
    double headAngle = FrameRatios::headAngleDeg;
    double seatAngle = FrameRatios::seatAngleDeg;
};

struct TubeDiameters {
    double downTube;
    double topTube;
    double seatTube;
    double headTube;
    double chainstay;
    double seatstay;
};

struct FrameTube {
    std::string name;
    Vector3 start;
    Vector3 end;
    double diameter = 0;

    double length() const { return (end - start).length(); }
    Vector3 direction() const { return (end - start).normalized(); }
};

struct FrameLayout {
    FrameGeometry geometry;
    FrameMaterial material = FrameMaterial::Aluminum;
    TubeDiameters diameters{};
    std::vector<FrameTube> tubes;

    const FrameTube* tube(const std::string& name) const;
};

FrameGeometry frameGeometry(double riderHeightMm);
TubeDiameters tubeDiameters(FrameMaterial material);

/**
 * @brief Lay out all eight tubes by chaining from the bottom bracket
 *
 * Bottom bracket at the origin, X forward, Z up. Seat tube, top tube,
 * head tube and down tube form the main triangle back to the bottom
 * bracket; chainstays run to the rear dropouts and seatstays climb from
 * there to the seat tube, both pairs offset +/- stayOffsetMm in Y.
 */
FrameLayout layoutFrame(double riderHeightMm, FrameMaterial material);

} // namespace partforge::cad
