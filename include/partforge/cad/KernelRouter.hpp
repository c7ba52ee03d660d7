#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "KernelAdapter.hpp"

namespace partforge::cad {

/**
 * @brief Chooses the capability provider and falls back when it cannot cope
 *
 * One router per build. The active adapter is consulted before every
 * operation; an unsupported kind (by table or at apply time) moves the rest
 * of the build to the default provider, transferring the working shape
 * once. The build never switches back.
 */
class KernelRouter {
public:
    using AdapterFactory = std::function<Result<std::unique_ptr<KernelAdapter>>(EngineKind)>;

    static constexpr EngineKind kDefaultEngine = EngineKind::Brep;

    /**
     * @brief Provider for a new build
     *
     * Explicit engine wins. Otherwise assemblies go to workplane, batch or
     * optimization jobs to mesh, everything else to brep.
     */
    static EngineKind selectEngine(const std::string& productType, const BuildHints& hints,
                                   std::optional<EngineKind> explicitEngine = std::nullopt);

    explicit KernelRouter(AdapterFactory factory = createAdapter, bool verbose = false);

    /// Create the initial adapter. Must succeed before dispatch().
    Result<bool> start(EngineKind engine, Units units);

    /**
     * @brief Run one operation on the active provider, falling back once
     * @param index 1-based operation position, used for switch events
     * @param current Working shape owned by the caller, or nullptr
     */
    Result<ShapePtr> dispatch(const Operation& op, size_t index, const InternalShape* current);

    bool started() const { return active_ != nullptr; }
    KernelAdapter& active() { return *active_; }
    const KernelAdapter& active() const { return *active_; }

    const std::vector<EngineSwitchEvent>& switches() const { return switches_; }

private:
    /// Replace the active adapter with the default provider. On success
    /// adopted holds current re-expressed in the new kernel (or nullptr).
    Result<bool> fallBack(const Operation& op, size_t index, const InternalShape* current,
                          const std::string& reason, ShapePtr& adopted);

    AdapterFactory factory_;
    bool verbose_;
    Units units_ = Units::Millimeters;
    std::unique_ptr<KernelAdapter> active_;
    std::vector<EngineSwitchEvent> switches_;
};

} // namespace partforge::cad
