#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>
#include "Kernel.hpp"
#include "Operation.hpp"
#include "DesignRequest.hpp"
#include "BicycleFrame.hpp"

namespace partforge::cad {

/**
 * @brief Static table of what one provider can do
 *
 * Consulted by the router before every operation. Never changes during a
 * build.
 */
struct KernelCapability {
    std::array<bool, kOperationKindCount> operations{};
    std::vector<ExportFormat> exportFormats;

    bool supports(OperationKind kind) const {
        return operations[static_cast<size_t>(kind)];
    }

    bool exports(ExportFormat format) const;

    /// Every operation kind and every export format.
    static KernelCapability all();

    KernelCapability& without(OperationKind kind) {
        operations[static_cast<size_t>(kind)] = false;
        return *this;
    }

    KernelCapability& withExports(std::vector<ExportFormat> formats) {
        exportFormats = std::move(formats);
        return *this;
    }
};

/// Capability table of each built-in provider.
KernelCapability builtinCapability(EngineKind engine);

/**
 * @brief Uniform operation contract over one capability provider
 *
 * Owns the provider's kernel session for the lifetime of a build and is
 * the only place request units are converted to millimetres.
 */
class KernelAdapter {
public:
    KernelAdapter(EngineKind engine, std::unique_ptr<Kernel> kernel, KernelCapability capability);

    EngineKind engine() const { return engine_; }
    const char* name() const { return engineName(engine_); }
    const KernelCapability& capability() const { return capability_; }
    Kernel& kernel() { return *kernel_; }

    bool supports(OperationKind kind) const { return capability_.supports(kind); }

    // -------------------------------------------------------------------------
    // Units
    // -------------------------------------------------------------------------

    void setUnits(Units units) { units_ = units; }
    Units units() const { return units_; }
    double toMillimeters(double value) const { return value * unitScale(units_); }

    /// Copy of op with every length parameter converted to millimetres.
    Operation normalize(const Operation& op) const;

    // -------------------------------------------------------------------------
    // Operations
    // -------------------------------------------------------------------------

    /**
     * @brief Apply one operation (in request units) to the current shape
     * @param current Working shape, or nullptr before the first sketch
     * @return The replacement working shape
     *
     * Edge and face indices are checked against the current topology;
     * out-of-range indices are a CONFIGURATION_ERROR.
     */
    Result<ShapePtr> apply(const Operation& op, const InternalShape* current);

    /// Box, cylinder or sphere from a request without operations.
    Result<ShapePtr> makeStandardShape(const StandardShapeParams& params);

    /// One cylinder per tube, grouped into a compound. Layout is in mm.
    Result<ShapePtr> makeFrame(const FrameLayout& layout);

    // -------------------------------------------------------------------------
    // Export & transfer
    // -------------------------------------------------------------------------

    Result<MeshData> tessellate(const InternalShape& shape, const TessellateOptions& options);

    /// Write shape to path. Formats outside the capability table are a
    /// CONFIGURATION_ERROR.
    Result<bool> exportShape(const InternalShape& shape, ExportFormat format,
                             const std::string& path, const TessellateOptions& options);

    Result<ShapeTransfer> snapshot(const InternalShape& shape);
    Result<ShapePtr> adopt(const ShapeTransfer& transfer);

private:
    Result<ShapePtr> applyNormalized(const Operation& op, const InternalShape* current);

    Result<ShapePtr> makeTool(const BooleanToolParams& params);
    Result<ShapePtr> modifyEdges(OperationKind kind, const EdgeModifierParams& params,
                                 const InternalShape& current);
    Result<ShapePtr> shell(const ShellParams& params, const InternalShape& current);
    Result<ShapePtr> addLegs(const AddLegsParams& params, const InternalShape& current);
    Result<ShapePtr> addHoles(const AddHolesParams& params, const InternalShape& current);
    Result<ShapePtr> addSupports(const AddSupportsParams& params, const InternalShape& current);
    Result<ShapePtr> linearPattern(const LinearPatternParams& params, const InternalShape& current);
    Result<ShapePtr> circularPattern(const CircularPatternParams& params, const InternalShape& current);
    Result<ShapePtr> placeTube(const FrameTube& tube);

    EngineKind engine_;
    std::unique_ptr<Kernel> kernel_;
    KernelCapability capability_;
    Units units_ = Units::Millimeters;
};

/**
 * @brief Fresh adapter with its own kernel session
 *
 * CONFIGURATION_ERROR when the provider's kernel library was not compiled
 * in.
 */
Result<std::unique_ptr<KernelAdapter>> createAdapter(EngineKind engine);

} // namespace partforge::cad
