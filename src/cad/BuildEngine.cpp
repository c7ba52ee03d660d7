/**
 * BuildEngine.cpp - Request routing, generation, export and reporting
 */

#include "partforge/cad/BuildEngine.hpp"
#include "partforge/cad/BicycleFrame.hpp"
#include "partforge/cad/OperationExecutor.hpp"
#include "partforge/io/DesignParser.hpp"
#include "partforge/Mesh.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace partforge::cad {

namespace {

constexpr ExportFormat kExportOrder[] = {ExportFormat::Step, ExportFormat::Stl, ExportFormat::Obj};

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

BuildResult failure(BuildResult result, const std::string& code, const std::string& message) {
    result.success = false;
    result.errorCode = code;
    result.error = message;
    return result;
}

// Build ids name the output files, so they must stay inside outputDir
bool isSafeBuildId(const std::string& buildId) {
    if (buildId.empty() || buildId.find("..") != std::string::npos) return false;
    return buildId.find_first_of("/\\") == std::string::npos;
}

} // anonymous namespace

BuildEngine::BuildEngine(BuildOptions options) : options_(std::move(options)) {}

std::string BuildEngine::getVersion() {
    std::stringstream ss;
    ss << "partforge v0.1.0";

#ifdef PF_USE_OCCT
    ss << " (OCCT)";
#endif
#ifdef PF_USE_MANIFOLD
    ss << " (Manifold)";
#endif

    return ss.str();
}

// =============================================================================
// Builds
// =============================================================================

BuildResult BuildEngine::build(const DesignRequest& request, const std::string& buildId) {
    auto start = std::chrono::high_resolution_clock::now();
    BuildResult result;

    if (!isSafeBuildId(buildId)) {
        return finish(failure(std::move(result), errc::Validation,
            "Invalid build id '" + buildId + "': must be non-empty without path separators or '..'"));
    }

    EngineKind engine = options_.engineOverride.has_value()
        ? *options_.engineOverride
        : KernelRouter::selectEngine(request.productType, request.hints, request.engine);

    if (options_.verbose) {
        std::cerr << "[build] " << buildId << ": " << buildPathName(request.path)
                  << " on " << engineName(engine) << " (" << unitsName(request.units) << ")"
                  << std::endl;
    }

    KernelRouter router(options_.adapterFactory, options_.verbose);
    auto started = router.start(engine, request.units);
    if (!started.success) {
        result.engine = engineName(engine);
        result.durationMs = elapsedMs(start);
        return finish(failure(std::move(result), started.errorCode, started.errorMessage));
    }

    auto shape = generate(request, router, result);
    result.engine = router.active().name();
    result.engineSwitches = router.switches();

    if (!shape.success) {
        result.durationMs = elapsedMs(start);
        return finish(failure(std::move(result), shape.errorCode, shape.errorMessage));
    }

    BuildMetadata metadata;
    metadata.buildId = buildId;
    metadata.productType = request.productType;
    metadata.buildPath = buildPathName(request.path);
    metadata.units = unitsName(request.units);
    if (request.path == BuildPath::StandardShape) {
        metadata.shapeType = request.standard.shapeType;
    }
    metadata.operationsCount = request.operations.size();

    auto exported = exportAll(*shape.value, router.active(), buildId, result, metadata);
    if (!exported.success) {
        result.durationMs = elapsedMs(start);
        return finish(failure(std::move(result), exported.errorCode, exported.errorMessage));
    }

    result.success = true;
    result.metadata = metadata;
    result.durationMs = elapsedMs(start);
    return finish(std::move(result));
}

std::future<BuildResult> BuildEngine::buildAsync(DesignRequest request, std::string buildId) {
    return std::async(std::launch::async,
        [this, request = std::move(request), buildId = std::move(buildId)]() {
            return build(request, buildId);
        });
}

BuildResult BuildEngine::buildFromJson(const std::string& requestJson, const std::string& buildId) {
    auto request = io::parseDesignRequest(requestJson);
    if (!request.success) {
        if (options_.verbose) {
            std::cerr << "[build] " << buildId << ": rejected: " << request.errorMessage << std::endl;
        }
        return finish(failure(BuildResult{}, request.errorCode, request.errorMessage));
    }
    return build(request.value, buildId);
}

BuildResult BuildEngine::finish(BuildResult result) {
    if (result.success) {
        succeeded_++;
    } else {
        failed_++;
    }

    if (options_.verbose) {
        if (result.success) {
            std::cerr << "[build] Done in " << result.durationMs << " ms, "
                      << result.files.size() << " file(s)" << std::endl;
        } else {
            std::cerr << "[build] Failed: " << result.errorCode << ": " << result.error << std::endl;
        }
    }
    return result;
}

// =============================================================================
// Generation
// =============================================================================

Result<ShapePtr> BuildEngine::generate(const DesignRequest& request, KernelRouter& router,
                                       BuildResult& result) {
    switch (request.path) {
        case BuildPath::OperationPipeline: {
            OperationExecutor executor(router, options_.verbose);
            executor.onOperationTimed([this](const std::string& op, double durationMs) {
                notifySlowOperation(op, durationMs);
            });

            auto ran = executor.run(request.operations);
            result.operationsCount = request.operations.size();
            result.operationsLog = executor.log();
            result.failedOperationIndex = executor.failedIndex();

            if (!ran.success) return Result<ShapePtr>::errorFrom(ran);
            if (executor.shape() == nullptr) {
                return Result<ShapePtr>::error(errc::Precondition, "Operation list produced no shape");
            }
            return Result<ShapePtr>::ok(executor.releaseShape());
        }
        case BuildPath::SpecializedFrame: {
            auto frame = generateFrame(request, router.active());
            if (frame.success) return frame;

            // A frame that cannot be built still yields a part
            if (options_.verbose) {
                std::cerr << "[build] Frame generation failed (" << frame.errorMessage
                          << "); falling back to standard shape" << std::endl;
            }
            return router.active().makeStandardShape(request.standard);
        }
        case BuildPath::StandardShape:
        default:
            return router.active().makeStandardShape(request.standard);
    }
}

Result<ShapePtr> BuildEngine::generateFrame(const DesignRequest& request, KernelAdapter& adapter) {
    FrameMaterial material = parseFrameMaterial(request.frame.material);
    FrameLayout layout = layoutFrame(adapter.toMillimeters(request.frame.riderHeight), material);

    if (options_.verbose) {
        std::cerr << "[build] Frame for rider " << adapter.toMillimeters(request.frame.riderHeight)
                  << " mm, " << frameMaterialName(material) << ", seat tube "
                  << layout.geometry.seatTube << " mm" << std::endl;
    }

    auto start = std::chrono::high_resolution_clock::now();
    auto frame = adapter.makeFrame(layout);
    notifySlowOperation("bicycle_frame", elapsedMs(start));
    return frame;
}

// =============================================================================
// Export
// =============================================================================

Result<bool> BuildEngine::exportAll(const InternalShape& shape, KernelAdapter& adapter,
                                    const std::string& buildId, BuildResult& result,
                                    BuildMetadata& metadata) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(options_.outputDir, ec);
    if (ec) {
        return Result<bool>::error(errc::Io,
            "Could not create output directory " + options_.outputDir + ": " + ec.message());
    }

    for (ExportFormat format : kExportOrder) {
        if (!adapter.capability().exports(format)) continue;

        std::string path =
            (fs::path(options_.outputDir) / (buildId + "." + exportExtension(format))).string();

        auto start = std::chrono::high_resolution_clock::now();
        auto written = adapter.exportShape(shape, format, path, options_.tessellation);
        notifySlowOperation(std::string("export_") + exportExtension(format), elapsedMs(start));

        if (!written.success) {
            // No partial output: drop whatever this build already wrote
            for (const auto& file : result.files) {
                fs::remove(file, ec);
            }
            fs::remove(path, ec);
            result.files.clear();
            return written;
        }
        result.files.push_back(path);
    }

    auto mesh = adapter.tessellate(shape, options_.tessellation);
    if (!mesh.success) return Result<bool>::errorFrom(mesh);

    Mesh welded = Mesh::fromMeshData(mesh.value);
    metadata.engine = adapter.name();
    metadata.kernelVersion = adapter.kernel().name() + " " + adapter.kernel().version();
    metadata.estimatedMemoryBytes = shape.getEstimatedMemoryBytes();
    metadata.bounds = shape.getBoundingBox();
    metadata.volume = shape.getVolume();
    metadata.surfaceArea = shape.getSurfaceArea();
    metadata.vertexCount = welded.getVertexCount();
    metadata.triangleCount = welded.getTriangleCount();
    metadata.watertight = welded.isWatertight();

    return Result<bool>::ok(true);
}

// =============================================================================
// Health & Metrics
// =============================================================================

BuildEngine::HealthStatus BuildEngine::healthCheck() const {
    HealthStatus status;
#ifdef PF_USE_OCCT
    status.occtAvailable = true;
#else
    status.occtAvailable = false;
#endif
#ifdef PF_USE_MANIFOLD
    status.manifoldAvailable = true;
#else
    status.manifoldAvailable = false;
#endif
    // The default engine needs OCCT
    status.healthy = status.occtAvailable;
    status.version = getVersion();
    status.buildsSucceeded = succeeded_.load();
    status.buildsFailed = failed_.load();
    return status;
}

void BuildEngine::onSlowOperation(SlowOperationCallback callback, double thresholdMs) {
    slowOpCallbacks_.push_back({std::move(callback), thresholdMs});
}

void BuildEngine::notifySlowOperation(const std::string& op, double durationMs) const {
    for (const auto& [callback, threshold] : slowOpCallbacks_) {
        if (durationMs >= threshold) {
            callback(op, durationMs);
        }
    }
}

} // namespace partforge::cad
