/**
 * BicycleFrame.cpp - Rider-height driven frame layout
 */

#include "partforge/cad/BicycleFrame.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace partforge::cad {

FrameMaterial parseFrameMaterial(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "steel") return FrameMaterial::Steel;
    if (lower == "carbon") return FrameMaterial::Carbon;
    return FrameMaterial::Aluminum;
}

const char* frameMaterialName(FrameMaterial material) {
    switch (material) {
        case FrameMaterial::Steel: return "steel";
        case FrameMaterial::Carbon: return "carbon";
        case FrameMaterial::Aluminum:
        default: return "aluminum";
    }
}

const FrameTube* FrameLayout::tube(const std::string& name) const {
    for (const auto& t : tubes) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

FrameGeometry frameGeometry(double riderHeightMm) {
    FrameGeometry g;
    g.riderHeight = riderHeightMm;
    g.stack = riderHeightMm * FrameRatios::stack;
    g.reach = riderHeightMm * FrameRatios::reach;
    g.seatTube = riderHeightMm * FrameRatios::seatTube;
    g.topTube = riderHeightMm * FrameRatios::topTube;
    g.headTube = riderHeightMm * FrameRatios::headTube;
    g.chainstay = riderHeightMm * FrameRatios::chainstay;
    g.seatstay = g.chainstay * FrameRatios::seatstayOfChainstay;
    return g;
}

TubeDiameters tubeDiameters(FrameMaterial material) {
    switch (material) {
        case FrameMaterial::Steel:
            return TubeDiameters{32, 28, 28, 40, 16, 14};
        case FrameMaterial::Carbon:
            return TubeDiameters{40, 34, 34, 46, 20, 18};
        case FrameMaterial::Aluminum:
        default:
            return TubeDiameters{38, 32, 32, 44, 18, 16};
    }
}

FrameLayout layoutFrame(double riderHeightMm, FrameMaterial material) {
    FrameLayout layout;
    layout.geometry = frameGeometry(riderHeightMm);
    layout.material = material;
    layout.diameters = tubeDiameters(material);

    const FrameGeometry& g = layout.geometry;
    const TubeDiameters& d = layout.diameters;

    const double seatAngle = degreesToRadians(g.seatAngle);
    const double headAngle = degreesToRadians(g.headAngle);

    // Main triangle
    const Vector3 bottomBracket(0, 0, 0);
    const Vector3 seatDir(-std::cos(seatAngle), 0, std::sin(seatAngle));
    const Vector3 seatTop = bottomBracket + seatDir * g.seatTube;
    const Vector3 headTop = seatTop + Vector3(g.topTube, 0, 0);
    const Vector3 headBottom = headTop + Vector3(std::cos(headAngle), 0, -std::sin(headAngle)) * g.headTube;

    layout.tubes.push_back({"seat_tube", bottomBracket, seatTop, d.seatTube});
    layout.tubes.push_back({"top_tube", seatTop, headTop, d.topTube});
    layout.tubes.push_back({"head_tube", headTop, headBottom, d.headTube});
    layout.tubes.push_back({"down_tube", headBottom, bottomBracket, d.downTube});

    // Rear triangle, one stay pair per side
    const double rearReach = std::sqrt(std::max(g.chainstay * g.chainstay - g.bbDrop * g.bbDrop, 0.0));
    const Vector3 seatCluster = bottomBracket + seatDir * (g.seatTube * FrameRatios::seatstayAttachFraction);

    const struct { const char* suffix; double y; } sides[2] = {
        {"left", FrameRatios::stayOffsetMm},
        {"right", -FrameRatios::stayOffsetMm}
    };

    for (const auto& side : sides) {
        const Vector3 dropout(-rearReach, side.y, g.bbDrop);
        const Vector3 stayTop = seatCluster + Vector3(0, side.y, 0);

        layout.tubes.push_back({std::string("chainstay_") + side.suffix,
                                bottomBracket, dropout, d.chainstay});
        layout.tubes.push_back({std::string("seatstay_") + side.suffix,
                                dropout, stayTop, d.seatstay});
    }

    return layout;
}

} // namespace partforge::cad
