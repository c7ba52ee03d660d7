/**
 * KernelFactory.cpp - Provider construction for the compiled-in kernels
 */

#include "partforge/cad/KernelAdapter.hpp"

#ifdef PF_USE_OCCT
#include "OcctKernel.hpp"
#endif

#ifdef PF_USE_MANIFOLD
#include "ManifoldKernel.hpp"
#endif

namespace partforge::cad {

namespace {

using AdapterResult = Result<std::unique_ptr<KernelAdapter>>;

AdapterResult notCompiled(EngineKind engine, const char* library) {
    return AdapterResult::error(errc::Configuration,
        std::string("Engine '") + engineName(engine) + "' requires " + library +
        ", which this build was configured without");
}

} // anonymous namespace

Result<std::unique_ptr<KernelAdapter>> createAdapter(EngineKind engine) {
    switch (engine) {
        case EngineKind::Brep:
        case EngineKind::Workplane:
#ifdef PF_USE_OCCT
            return AdapterResult::ok(std::make_unique<KernelAdapter>(
                engine, std::make_unique<OcctKernel>(), builtinCapability(engine)));
#else
            return notCompiled(engine, "OpenCASCADE");
#endif
        case EngineKind::Mesh:
#ifdef PF_USE_MANIFOLD
            return AdapterResult::ok(std::make_unique<KernelAdapter>(
                engine, std::make_unique<ManifoldKernel>(), builtinCapability(engine)));
#else
            return notCompiled(engine, "Manifold");
#endif
    }
    return AdapterResult::error(errc::Configuration, "Unknown engine");
}

} // namespace partforge::cad
