#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "FakeKernel.hpp"
#include "partforge/cad/BuildEngine.hpp"
#include "partforge/io/ResultJson.hpp"

using namespace partforge;
using namespace partforge::cad;
using namespace partforge::test;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

class BuildEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log = std::make_shared<FakeKernelLog>();
        outputDir = (fs::path(::testing::TempDir()) / "partforge_build_test").string();
        fs::remove_all(outputDir);
    }

    void TearDown() override {
        fs::remove_all(outputDir);
    }

    BuildOptions options(std::set<EngineKind> unavailable = {}) {
        BuildOptions o;
        o.outputDir = outputDir;
        o.verbose = false;
        o.adapterFactory = fakeAdapterFactory(log, unavailable);
        return o;
    }

    std::shared_ptr<FakeKernelLog> log;
    std::string outputDir;
};

} // namespace

TEST_F(BuildEngineTest, StandardBoxExportsAllBrepFormats) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({"length": 20, "width": 10, "height": 5})", "box1");
    ASSERT_TRUE(result.success) << result.errorCode << ": " << result.error;

    EXPECT_EQ(result.engine, "brep");
    ASSERT_EQ(result.files.size(), 3u);
    EXPECT_EQ(fs::path(result.files[0]).filename().string(), "box1.step");
    EXPECT_EQ(fs::path(result.files[1]).filename().string(), "box1.stl");
    EXPECT_EQ(fs::path(result.files[2]).filename().string(), "box1.obj");
    for (const auto& file : result.files) {
        EXPECT_TRUE(fs::exists(file)) << file;
    }

    ASSERT_TRUE(result.metadata.has_value());
    EXPECT_EQ(result.metadata->shapeType, "box");
    EXPECT_DOUBLE_EQ(result.metadata->volume, 1000);
    EXPECT_EQ(result.metadata->triangleCount, 12u);
    EXPECT_EQ(result.metadata->vertexCount, 8u);
    EXPECT_TRUE(result.metadata->watertight);
    EXPECT_EQ(result.metadata->kernelVersion, "fake-brep test");
    EXPECT_GT(result.metadata->estimatedMemoryBytes, 0u);
    EXPECT_FALSE(result.operationsCount.has_value());
}

TEST_F(BuildEngineTest, MeshEngineSkipsStep) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({"batch_mode": true})", "batch");
    ASSERT_TRUE(result.success) << result.error;

    EXPECT_EQ(result.engine, "mesh");
    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_EQ(fs::path(result.files[0]).extension().string(), ".stl");
    EXPECT_EQ(fs::path(result.files[1]).extension().string(), ".obj");
}

TEST_F(BuildEngineTest, PipelineReportsLogAndCount) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({
        "operations": [
            {"type": "sketch_rectangle", "width": 40, "height": 20},
            {"type": "extrude", "height": 10},
            {"type": "chamfer", "distance": 1}
        ]
    })", "pipe");
    ASSERT_TRUE(result.success) << result.error;

    EXPECT_EQ(result.operationsCount, 3u);
    ASSERT_EQ(result.operationsLog.size(), 3u);
    EXPECT_EQ(result.operationsLog[2].kind, OperationKind::Chamfer);
    EXPECT_FALSE(result.failedOperationIndex.has_value());
    EXPECT_EQ(result.metadata->buildPath, "operation_pipeline");
}

TEST_F(BuildEngineTest, FailedOperationStopsTheBuild) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({
        "operations": [
            {"type": "sketch_rectangle"},
            {"type": "extrude"},
            {"type": "fillet", "edges": [99]},
            {"type": "shell"}
        ]
    })", "bad");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::Configuration);
    EXPECT_EQ(result.failedOperationIndex, 3u);
    EXPECT_EQ(result.operationsCount, 4u);
    ASSERT_EQ(result.operationsLog.size(), 3u);
    EXPECT_EQ(result.operationsLog[2].status, OperationStatus::Failed);
    EXPECT_TRUE(result.files.empty());
    EXPECT_FALSE(result.metadata.has_value());
}

TEST_F(BuildEngineTest, ExtrudeWithoutSketchIsPrecondition) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({"operations": [{"type": "extrude"}]})", "pre");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::Precondition);
    EXPECT_EQ(result.failedOperationIndex, 1u);
}

TEST_F(BuildEngineTest, FallbackIsRecordedInResult) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({
        "optimization_required": true,
        "operations": [
            {"type": "sketch_circle", "radius": 10},
            {"type": "extrude", "height": 5},
            {"type": "fillet", "radius": 1}
        ]
    })", "switch");
    ASSERT_TRUE(result.success) << result.error;

    EXPECT_EQ(result.engine, "brep");
    ASSERT_EQ(result.engineSwitches.size(), 1u);
    EXPECT_EQ(result.engineSwitches[0].from, "mesh");
    EXPECT_EQ(result.engineSwitches[0].operationIndex, 3u);
    EXPECT_EQ(result.files.size(), 3u);
}

TEST_F(BuildEngineTest, BicycleFrameIsACompound) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(
        R"({"product_type": "bicycle", "rider_height": 180, "material": "steel"})", "bike");
    ASSERT_TRUE(result.success) << result.error;

    EXPECT_EQ(result.metadata->buildPath, "specialized_frame");
    EXPECT_EQ(result.metadata->units, "cm");
    ASSERT_GE(log->cylinders.size(), 8u);
    EXPECT_NEAR(log->cylinders[0].height, 900, 1e-9);   // seat tube, 1800 mm rider
    EXPECT_DOUBLE_EQ(log->cylinders[0].radius, 14);     // steel seat tube, 28 mm
}

TEST_F(BuildEngineTest, ValidationFailsBeforeAnyKernel) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({"units": "parsecs"})", "nope");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::Validation);
    EXPECT_TRUE(log->calls.empty());
    EXPECT_FALSE(fs::exists(outputDir));
}

TEST_F(BuildEngineTest, EngineOverrideWins) {
    BuildOptions o = options();
    o.engineOverride = EngineKind::Workplane;
    BuildEngine engine(o);

    BuildResult result = engine.buildFromJson(R"({"batch_mode": true, "engine": "mesh"})", "ovr");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.engine, "workplane");
}

TEST_F(BuildEngineTest, MissingEngineIsConfigurationError) {
    BuildEngine engine(options({EngineKind::Brep}));
    BuildResult result = engine.buildFromJson("{}", "missing");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::Configuration);
}

TEST_F(BuildEngineTest, SlowOperationCallbackFires) {
    BuildEngine engine(options());
    std::vector<std::string> seen;
    engine.onSlowOperation([&seen](const std::string& op, double) { seen.push_back(op); }, 0);

    BuildResult result = engine.buildFromJson(
        R"({"operations": [{"type": "sketch_rectangle"}, {"type": "extrude"}]})", "slow");
    ASSERT_TRUE(result.success);

    EXPECT_NE(std::find(seen.begin(), seen.end(), "extrude"), seen.end());
    EXPECT_NE(std::find(seen.begin(), seen.end(), "export_stl"), seen.end());
}

TEST_F(BuildEngineTest, AsyncBuildsAreIndependent) {
    // One log per engine, the two builds run concurrently
    auto brepLog = std::make_shared<FakeKernelLog>();
    auto meshLog = std::make_shared<FakeKernelLog>();
    BuildOptions o = options();
    o.adapterFactory = [brepLog, meshLog](EngineKind kind) {
        return fakeAdapterFactory(kind == EngineKind::Mesh ? meshLog : brepLog)(kind);
    };
    BuildEngine engine(o);

    DesignRequest a;
    a.standard.shapeType = "sphere";
    DesignRequest b;
    b.hints.batchMode = true;

    auto first = engine.buildAsync(a, "async_a");
    auto second = engine.buildAsync(b, "async_b");
    BuildResult ra = first.get();
    BuildResult rb = second.get();

    EXPECT_TRUE(ra.success);
    EXPECT_TRUE(rb.success);
    EXPECT_EQ(ra.engine, "brep");
    EXPECT_EQ(rb.engine, "mesh");
    EXPECT_EQ(engine.healthCheck().buildsSucceeded, 2u);
}

TEST_F(BuildEngineTest, ResultJsonShape) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson(R"({
        "operations": [{"type": "sketch_rectangle"}, {"type": "revolve"}, {"type": "extrude"}]
    })", "json");
    ASSERT_FALSE(result.success);

    json j = result;
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_code"], errc::Precondition);
    EXPECT_FALSE(j.contains("errorCode"));
    EXPECT_EQ(j["failed_operation_index"], 3);
    EXPECT_EQ(j["operations_count"], 3);
    ASSERT_EQ(j["operations_log"].size(), 3u);
    EXPECT_EQ(j["operations_log"][0]["type"], "sketch_rectangle");
    EXPECT_EQ(j["operations_log"][2]["status"], "failed");
    EXPECT_TRUE(j["engine_switches"].is_array());
    EXPECT_TRUE(j["metadata"].is_object());
    EXPECT_TRUE(j["files"].empty());
}

TEST_F(BuildEngineTest, MetadataJsonCarriesKernelFigures) {
    BuildEngine engine(options());
    BuildResult result = engine.buildFromJson("{}", "meta");
    ASSERT_TRUE(result.success);

    json metadata = json(result)["metadata"];
    EXPECT_EQ(metadata["kernel_version"], "fake-brep test");
    EXPECT_EQ(metadata["vertex_count"], 8);
    EXPECT_TRUE(metadata.contains("surface_area"));
    EXPECT_GT(metadata["estimated_memory_bytes"].get<size_t>(), 0u);
}

TEST_F(BuildEngineTest, BuildIdMayNotLeaveOutputDir) {
    BuildEngine engine(options());
    for (const char* id : {"../escape", "/tmp/escape", "nested/part", "a\\b", "..", ""}) {
        BuildResult result = engine.buildFromJson("{}", id);
        EXPECT_FALSE(result.success) << id;
        EXPECT_EQ(result.errorCode, errc::Validation) << id;
        EXPECT_TRUE(result.files.empty()) << id;
    }
    EXPECT_TRUE(log->calls.empty());
    EXPECT_FALSE(fs::exists(fs::path(outputDir).parent_path() / "escape.step"));

    EXPECT_TRUE(engine.buildFromJson("{}", "part-01.v2").success);
}

TEST_F(BuildEngineTest, FailedExportLeavesNoFiles) {
    BuildOptions o = options();
    o.adapterFactory = [this](EngineKind kind) -> Result<std::unique_ptr<KernelAdapter>> {
        FakeKernelConfig config;
        config.name = "fake-brep";
        config.failing = {"tessellate"};   // STEP succeeds, STL does not
        return Result<std::unique_ptr<KernelAdapter>>::ok(makeFakeAdapter(log, kind, config));
    };
    BuildEngine engine(o);

    BuildResult result = engine.buildFromJson("{}", "partial");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::KernelExecution);
    EXPECT_TRUE(result.files.empty());
    EXPECT_EQ(log->count("exportStep"), 1u);
    EXPECT_FALSE(fs::exists(fs::path(outputDir) / "partial.step"));
    EXPECT_FALSE(fs::exists(fs::path(outputDir) / "partial.stl"));
}
