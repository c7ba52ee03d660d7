/**
 * DesignParser.cpp - JSON request documents to validated DesignRequest
 */

#include "partforge/io/DesignParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>

namespace partforge::io {

using nlohmann::json;
using namespace partforge::cad;

namespace {

/**
 * Typed reads from one JSON object. The first violation is kept and every
 * later read returns its fallback, so a parse function can read all its
 * fields and check ok() once.
 */
class Fields {
public:
    Fields(const json& obj, std::string where) : obj_(obj), where_(std::move(where)) {}

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

    bool has(const char* key) const {
        return obj_.contains(key) && !obj_.at(key).is_null();
    }

    double number(const char* key, double fallback) {
        if (!ok() || !has(key)) return fallback;
        const json& v = obj_.at(key);
        if (!v.is_number() || !std::isfinite(v.get<double>())) {
            fail(key, "must be a number");
            return fallback;
        }
        return v.get<double>();
    }

    double positive(const char* key, double fallback) {
        double value = number(key, fallback);
        if (ok() && has(key) && value <= 0) {
            fail(key, "must be positive");
            return fallback;
        }
        return value;
    }

    int count(const char* key, int fallback) {
        if (!ok() || !has(key)) return fallback;
        const json& v = obj_.at(key);
        if (!v.is_number_integer()) {
            fail(key, "must be an integer");
            return fallback;
        }
        int value = 0;
        if (!boundedInt(v, 1, kMaxFeatureCount, value)) {
            fail(key, "must be between 1 and " + std::to_string(kMaxFeatureCount));
            return fallback;
        }
        return value;
    }

    bool flag(const char* key, bool fallback) {
        if (!ok() || !has(key)) return fallback;
        const json& v = obj_.at(key);
        if (!v.is_boolean()) {
            fail(key, "must be true or false");
            return fallback;
        }
        return v.get<bool>();
    }

    std::string text(const char* key, const std::string& fallback) {
        if (!ok() || !has(key)) return fallback;
        const json& v = obj_.at(key);
        if (!v.is_string()) {
            fail(key, "must be a string");
            return fallback;
        }
        return v.get<std::string>();
    }

    Vector3 vector(const char* key, const Vector3& fallback, bool nonZero = false) {
        if (!ok() || !has(key)) return fallback;
        Vector3 out;
        if (!toVector(obj_.at(key), out, false)) {
            fail(key, "must be [x, y, z]");
            return fallback;
        }
        if (nonZero && out.isZero()) {
            fail(key, "must not be the zero vector");
            return fallback;
        }
        return out;
    }

    std::vector<Vector3> points(const char* key) {
        std::vector<Vector3> out;
        if (!ok() || !has(key)) return out;
        const json& v = obj_.at(key);
        if (!v.is_array()) {
            fail(key, "must be a list of points");
            return out;
        }
        for (const auto& item : v) {
            Vector3 p;
            if (!toVector(item, p, true)) {
                fail(key, "points must be [x, y] or [x, y, z]");
                return {};
            }
            out.push_back(p);
        }
        return out;
    }

    std::optional<std::vector<int>> indices(const char* key) {
        if (!ok() || !has(key)) return std::nullopt;
        const json& v = obj_.at(key);
        if (!v.is_array()) {
            fail(key, "must be a list of indices");
            return std::nullopt;
        }
        std::vector<int> out;
        for (const auto& item : v) {
            int index = 0;
            if (!item.is_number_integer() ||
                !boundedInt(item, 0, std::numeric_limits<int>::max(), index)) {
                fail(key, "indices must be non-negative integers that fit in an int");
                return std::nullopt;
            }
            out.push_back(index);
        }
        return out;
    }

    void fail(const std::string& key, const std::string& message) {
        if (ok()) error_ = where_ + key + " " + message;
    }

private:
    // Range check on the full-width value, before any narrowing to int
    static bool boundedInt(const json& v, int lo, int hi, int& out) {
        if (v.is_number_unsigned()) {
            auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(hi)) return false;
            out = static_cast<int>(u);
            return out >= lo;
        }
        auto i = v.get<std::int64_t>();
        if (i < lo || i > hi) return false;
        out = static_cast<int>(i);
        return true;
    }

    static bool toVector(const json& v, Vector3& out, bool allowPlanar) {
        if (!v.is_array()) return false;
        if (v.size() != 3 && !(allowPlanar && v.size() == 2)) return false;
        for (const auto& c : v) {
            if (!c.is_number()) return false;
        }
        out = Vector3(v[0].get<double>(), v[1].get<double>(),
                      v.size() == 3 ? v[2].get<double>() : 0.0);
        return true;
    }

    const json& obj_;
    std::string where_;
    std::string error_;
};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBicycle(const std::string& productType) {
    return productType.find("bicycle") != std::string::npos ||
           productType.find("bike") != std::string::npos;
}

OperationParams readParams(OperationKind kind, Fields& f) {
    switch (kind) {
        case OperationKind::SketchRectangle: {
            SketchRectangleParams p;
            p.width = f.positive("width", p.width);
            p.height = f.positive("height", p.height);
            p.centered = f.flag("centered", p.centered);
            return p;
        }
        case OperationKind::SketchCircle: {
            SketchCircleParams p;
            if (f.has("radius")) {
                p.radius = f.positive("radius", p.radius);
            } else if (f.has("diameter")) {
                p.radius = f.positive("diameter", p.radius * 2) / 2.0;
            }
            return p;
        }
        case OperationKind::SketchPolygon: {
            SketchPolygonParams p;
            p.points = f.points("points");
            p.closed = f.flag("closed", p.closed);
            if (f.ok() && p.points.size() < 3) {
                f.fail("points", "needs at least 3 points");
            }
            return p;
        }
        case OperationKind::Extrude: {
            ExtrudeParams p;
            p.height = f.positive("height", p.height);
            p.direction = f.vector("direction", p.direction, true);
            return p;
        }
        case OperationKind::Revolve: {
            RevolveParams p;
            p.angleDegrees = f.number("angle", p.angleDegrees);
            p.axis = f.vector("axis", p.axis, true);
            return p;
        }
        case OperationKind::Cut:
        case OperationKind::Fuse:
        case OperationKind::Common: {
            BooleanToolParams p;
            p.toolType = f.text("tool_type", p.toolType);
            p.length = f.positive("length", p.length);
            p.width = f.positive("width", p.width);
            p.height = f.positive("height", p.height);
            p.radius = f.positive("radius", p.radius);
            p.position = f.vector("position", p.position);
            return p;
        }
        case OperationKind::Fillet:
        case OperationKind::Chamfer: {
            EdgeModifierParams p;
            p.size = f.positive(kind == OperationKind::Fillet ? "radius" : "distance", p.size);
            p.edges = f.indices("edges");
            return p;
        }
        case OperationKind::Shell: {
            ShellParams p;
            p.thickness = f.positive("thickness", p.thickness);
            if (auto faces = f.indices("faces_to_remove")) {
                p.facesToRemove = *faces;
            }
            return p;
        }
        case OperationKind::AddLegs: {
            AddLegsParams p;
            p.count = f.count("count", p.count);
            p.height = f.positive("height", p.height);
            p.radius = f.positive("radius", p.radius);
            p.inset = f.number("inset", p.inset);
            return p;
        }
        case OperationKind::AddHoles: {
            AddHolesParams p;
            p.positions = f.points("positions");
            p.diameter = f.positive("diameter", p.diameter);
            p.depth = f.positive("depth", p.depth);
            return p;
        }
        case OperationKind::AddSupports: {
            AddSupportsParams p;
            p.count = f.count("count", p.count);
            p.thickness = f.positive("thickness", p.thickness);
            p.height = f.positive("height", p.height);
            return p;
        }
        case OperationKind::LinearPattern: {
            LinearPatternParams p;
            p.direction = f.vector("direction", p.direction, true);
            p.spacing = f.positive("spacing", p.spacing);
            p.count = f.count("count", p.count);
            return p;
        }
        case OperationKind::CircularPattern: {
            CircularPatternParams p;
            p.axis = f.vector("axis", p.axis, true);
            p.count = f.count("count", p.count);
            return p;
        }
    }
    return Operation::withDefaults(kind).params;
}

} // anonymous namespace

// =============================================================================
// Operations
// =============================================================================

Result<Operation> parseOperation(const json& entry) {
    if (!entry.is_object()) {
        return Result<Operation>::error(errc::Validation, "Operation must be an object");
    }
    if (!entry.contains("type") || !entry.at("type").is_string()) {
        return Result<Operation>::error(errc::Validation, "Operation is missing its type");
    }

    const std::string type = entry.at("type").get<std::string>();
    auto kind = parseOperationKind(type);
    if (!kind.has_value()) {
        return Result<Operation>::error(errc::Validation, "Unknown operation type '" + type + "'");
    }

    Fields fields(entry, type + ": ");
    Operation op;
    op.kind = *kind;
    op.params = readParams(*kind, fields);
    if (!fields.ok()) {
        return Result<Operation>::error(errc::Validation, fields.error());
    }
    return Result<Operation>::ok(std::move(op));
}

// =============================================================================
// Requests
// =============================================================================

Result<DesignRequest> parseDesignRequest(const json& doc) {
    if (!doc.is_object()) {
        return Result<DesignRequest>::error(errc::Validation, "Request must be a JSON object");
    }

    DesignRequest request;
    Fields top(doc, "");

    request.productType = lowercase(top.text("product_type", ""));
    const bool bicycle = isBicycle(request.productType);

    std::string units = top.text("units", bicycle ? "cm" : "mm");
    std::string engine = top.text("engine", "");

    request.hints.isAssembly = top.flag("is_assembly", false);
    request.hints.batchMode = top.flag("batch_mode", false);
    request.hints.optimizationRequired = top.flag("optimization_required", false);
    const bool designLanguage = top.flag("use_design_language", false);

    request.standard.shapeType = lowercase(top.text("shape_type", request.standard.shapeType));
    request.standard.length = top.positive("length", request.standard.length);
    request.standard.width = top.positive("width", request.standard.width);
    request.standard.height = top.positive("height", request.standard.height);
    request.standard.diameter = top.positive("diameter", request.standard.diameter);

    request.frame.riderHeight = top.positive("rider_height", request.frame.riderHeight);
    request.frame.material = lowercase(top.text("material", request.frame.material));

    if (!top.ok()) {
        return Result<DesignRequest>::error(errc::Validation, top.error());
    }

    auto parsedUnits = parseUnits(units);
    if (!parsedUnits.has_value()) {
        return Result<DesignRequest>::error(errc::Validation,
            "units must be mm, cm or inches (got '" + units + "')");
    }
    request.units = *parsedUnits;

    if (!engine.empty()) {
        auto parsedEngine = parseEngine(engine);
        if (!parsedEngine.has_value()) {
            return Result<DesignRequest>::error(errc::Validation,
                "engine must be brep, workplane or mesh (got '" + engine + "')");
        }
        request.engine = parsedEngine;
    }

    if (doc.contains("operations") && !doc.at("operations").is_null()) {
        const json& ops = doc.at("operations");
        if (!ops.is_array()) {
            return Result<DesignRequest>::error(errc::Validation, "operations must be a list");
        }
        for (size_t i = 0; i < ops.size(); ++i) {
            auto op = parseOperation(ops[i]);
            if (!op.success) {
                return Result<DesignRequest>::error(op.errorCode,
                    "operations[" + std::to_string(i) + "] " + op.errorMessage);
            }
            request.operations.push_back(std::move(op.value));
        }
    }

    if (bicycle) {
        request.path = BuildPath::SpecializedFrame;
    } else if (designLanguage || !request.operations.empty()) {
        request.path = BuildPath::OperationPipeline;
    } else {
        request.path = BuildPath::StandardShape;
    }

    return Result<DesignRequest>::ok(std::move(request));
}

Result<DesignRequest> parseDesignRequest(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return Result<DesignRequest>::error(errc::Validation, "Request is not valid JSON");
    }
    return parseDesignRequest(doc);
}

} // namespace partforge::io
