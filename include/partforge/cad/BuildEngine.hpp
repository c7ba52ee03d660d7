#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "DesignRequest.hpp"
#include "KernelRouter.hpp"

namespace partforge::cad {

/**
 * @brief Per-engine settings, fixed for the engine's lifetime
 */
struct BuildOptions {
    std::string outputDir = ".";
    TessellateOptions tessellation;
    bool verbose = true;

    /// Wins over the request's engine and the selection hints.
    std::optional<EngineKind> engineOverride;

    /// Adapter source; tests substitute fakes here.
    KernelRouter::AdapterFactory adapterFactory = createAdapter;
};

/**
 * @brief Facts about the exported part
 */
struct BuildMetadata {
    std::string buildId;
    std::string productType;
    std::string buildPath;
    std::string engine;
    std::string kernelVersion;
    std::string units;
    std::string shapeType;
    BoundingBox bounds;
    double volume = 0;
    double surfaceArea = 0;
    size_t vertexCount = 0;     // After welding
    size_t triangleCount = 0;
    bool watertight = false;
    size_t estimatedMemoryBytes = 0;   // Kernel-side estimate for the final shape
    size_t operationsCount = 0;
};

/**
 * @brief Outcome of one build, immutable once returned
 */
struct BuildResult {
    bool success = false;
    std::vector<std::string> files;
    std::string error;
    std::string errorCode;
    std::string engine;

    std::optional<size_t> operationsCount;       // Pipeline builds only
    std::optional<size_t> failedOperationIndex;  // 1-based

    std::vector<OperationLogEntry> operationsLog;
    std::vector<EngineSwitchEvent> engineSwitches;
    std::optional<BuildMetadata> metadata;

    double durationMs = 0;
};

/**
 * @brief Entry point: request in, exported files and a structured result out
 *
 * Every build gets its own router, adapters and kernel sessions; the
 * engine itself holds only options, callbacks and counters, so concurrent
 * builds through buildAsync() share nothing mutable.
 */
class BuildEngine {
public:
    explicit BuildEngine(BuildOptions options = {});

    static std::string getVersion();

    // ===========================================================================
    // Builds
    // ===========================================================================

    /**
     * @brief Generate, export and describe one part
     *
     * Never throws; every failure is reported in the returned result.
     */
    BuildResult build(const DesignRequest& request, const std::string& buildId);

    /// Same as build(), on a dedicated worker thread.
    std::future<BuildResult> buildAsync(DesignRequest request, std::string buildId);

    /// Parse and validate a JSON request document, then build it.
    BuildResult buildFromJson(const std::string& requestJson, const std::string& buildId);

    const BuildOptions& options() const { return options_; }

    // ===========================================================================
    // Health & Metrics
    // ===========================================================================

    struct HealthStatus {
        bool healthy;
        bool occtAvailable;
        bool manifoldAvailable;
        std::string version;
        size_t buildsSucceeded;
        size_t buildsFailed;
    };

    HealthStatus healthCheck() const;

    // Slow operation callback (per operation and per export)
    using SlowOperationCallback = std::function<void(const std::string& operation, double durationMs)>;
    void onSlowOperation(SlowOperationCallback callback, double thresholdMs = 100);

private:
    Result<ShapePtr> generate(const DesignRequest& request, KernelRouter& router,
                              BuildResult& result);
    Result<ShapePtr> generateFrame(const DesignRequest& request, KernelAdapter& adapter);
    Result<bool> exportAll(const InternalShape& shape, KernelAdapter& adapter,
                           const std::string& buildId, BuildResult& result,
                           BuildMetadata& metadata);

    void notifySlowOperation(const std::string& op, double durationMs) const;
    BuildResult finish(BuildResult result);

    BuildOptions options_;
    std::vector<std::pair<SlowOperationCallback, double>> slowOpCallbacks_;
    std::atomic<size_t> succeeded_{0};
    std::atomic<size_t> failed_{0};
};

} // namespace partforge::cad
