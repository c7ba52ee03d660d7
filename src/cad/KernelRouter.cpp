/**
 * KernelRouter.cpp - Provider selection and one-way fallback
 */

#include "partforge/cad/KernelRouter.hpp"

#include <iostream>

namespace partforge::cad {

EngineKind KernelRouter::selectEngine(const std::string& productType, const BuildHints& hints,
                                      std::optional<EngineKind> explicitEngine) {
    if (explicitEngine.has_value()) {
        return *explicitEngine;
    }
    if (hints.isAssembly || productType.find("assembly") != std::string::npos) {
        return EngineKind::Workplane;
    }
    if (hints.batchMode || hints.optimizationRequired) {
        return EngineKind::Mesh;
    }
    return kDefaultEngine;
}

KernelRouter::KernelRouter(AdapterFactory factory, bool verbose)
    : factory_(std::move(factory)), verbose_(verbose) {}

Result<bool> KernelRouter::start(EngineKind engine, Units units) {
    units_ = units;
    auto adapter = factory_(engine);
    if (!adapter.success) {
        return Result<bool>::errorFrom(adapter);
    }
    active_ = std::move(adapter.value);
    active_->setUnits(units_);

    if (verbose_) {
        std::cerr << "[router] Engine '" << active_->name() << "' selected" << std::endl;
    }
    return Result<bool>::ok(true);
}

Result<ShapePtr> KernelRouter::dispatch(const Operation& op, size_t index,
                                        const InternalShape* current) {
    if (!active_) {
        return Result<ShapePtr>::error(errc::Precondition, "Router has no active engine");
    }

    if (active_->supports(op.kind)) {
        auto result = active_->apply(op, current);
        if (result.success || result.errorCode != errc::KernelUnsupported) {
            return result;
        }
        if (active_->engine() == kDefaultEngine) {
            return result;
        }

        ShapePtr adopted;
        auto switched = fallBack(op, index, current, result.errorMessage, adopted);
        if (!switched.success) return Result<ShapePtr>::errorFrom(switched);
        return active_->apply(op, adopted ? adopted.get() : nullptr);
    }

    if (active_->engine() == kDefaultEngine) {
        return Result<ShapePtr>::error(errc::KernelUnsupported,
            std::string("Engine '") + active_->name() + "' does not support " +
            operationKindName(op.kind));
    }

    ShapePtr adopted;
    auto switched = fallBack(op, index, current,
        std::string(operationKindName(op.kind)) + " not supported by " + active_->name(),
        adopted);
    if (!switched.success) return Result<ShapePtr>::errorFrom(switched);
    return active_->apply(op, adopted ? adopted.get() : nullptr);
}

Result<bool> KernelRouter::fallBack(const Operation& op, size_t index,
                                    const InternalShape* current,
                                    const std::string& reason, ShapePtr& adopted) {
    auto created = factory_(kDefaultEngine);
    if (!created.success) {
        return Result<bool>::error(errc::KernelUnsupported,
            reason + "; fallback engine unavailable: " + created.errorMessage);
    }
    std::unique_ptr<KernelAdapter> next = std::move(created.value);
    next->setUnits(units_);

    // Sketches start a new profile, so the prior shape is not carried over
    if (current != nullptr && !isSketchKind(op.kind)) {
        auto transfer = active_->snapshot(*current);
        if (!transfer.success) return Result<bool>::errorFrom(transfer);

        auto imported = next->adopt(transfer.value);
        if (!imported.success) return Result<bool>::errorFrom(imported);
        adopted = std::move(imported.value);
    }

    EngineSwitchEvent event;
    event.operationIndex = index;
    event.from = active_->name();
    event.to = next->name();
    event.reason = reason;
    switches_.push_back(event);

    if (verbose_) {
        std::cerr << "[router] Operation " << index << " (" << operationKindName(op.kind)
                  << "): switching " << event.from << " -> " << event.to
                  << " (" << reason << ")" << std::endl;
    }

    active_ = std::move(next);
    return Result<bool>::ok(true);
}

} // namespace partforge::cad
