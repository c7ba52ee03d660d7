#include <gtest/gtest.h>

#include "FakeKernel.hpp"

using namespace partforge;
using namespace partforge::cad;
using namespace partforge::test;

TEST(EngineSelection, HintsPickTheProvider) {
    BuildHints none;
    EXPECT_EQ(KernelRouter::selectEngine("widget", none), EngineKind::Brep);

    BuildHints assembly;
    assembly.isAssembly = true;
    EXPECT_EQ(KernelRouter::selectEngine("widget", assembly), EngineKind::Workplane);
    EXPECT_EQ(KernelRouter::selectEngine("gearbox assembly", none), EngineKind::Workplane);

    BuildHints batch;
    batch.batchMode = true;
    EXPECT_EQ(KernelRouter::selectEngine("widget", batch), EngineKind::Mesh);

    BuildHints optimize;
    optimize.optimizationRequired = true;
    EXPECT_EQ(KernelRouter::selectEngine("widget", optimize), EngineKind::Mesh);
}

TEST(EngineSelection, AssemblyBeatsBatch) {
    BuildHints both;
    both.isAssembly = true;
    both.batchMode = true;
    EXPECT_EQ(KernelRouter::selectEngine("", both), EngineKind::Workplane);
}

TEST(EngineSelection, ExplicitEngineOverridesHints) {
    BuildHints batch;
    batch.batchMode = true;
    EXPECT_EQ(KernelRouter::selectEngine("", batch, EngineKind::Workplane), EngineKind::Workplane);
}

namespace {

class KernelRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        log = std::make_shared<FakeKernelLog>();
    }

    KernelRouter makeRouter(EngineKind engine, std::set<EngineKind> unavailable = {}) {
        KernelRouter router(fakeAdapterFactory(log, unavailable));
        auto started = router.start(engine, Units::Millimeters);
        EXPECT_TRUE(started.success) << started.errorMessage;
        return router;
    }

    /// Extruded default rectangle on the router's active engine.
    ShapePtr solidOn(KernelRouter& router) {
        auto sketch = router.dispatch(op(OperationKind::SketchRectangle), 1, nullptr);
        EXPECT_TRUE(sketch.success);
        auto body = router.dispatch(op(OperationKind::Extrude), 2, sketch.value.get());
        EXPECT_TRUE(body.success);
        return std::move(body.value);
    }

    std::shared_ptr<FakeKernelLog> log;
};

} // namespace

TEST_F(KernelRouterTest, SupportedOperationStaysOnActiveEngine) {
    KernelRouter router = makeRouter(EngineKind::Mesh);
    auto body = solidOn(router);

    EXPECT_EQ(router.active().engine(), EngineKind::Mesh);
    EXPECT_TRUE(router.switches().empty());
    EXPECT_STREQ(body->kernelName(), "fake-mesh");
}

TEST_F(KernelRouterTest, UnsupportedKindFallsBackToBrep) {
    KernelRouter router = makeRouter(EngineKind::Mesh);
    auto body = solidOn(router);

    auto filleted = router.dispatch(op(OperationKind::Fillet), 3, body.get());
    ASSERT_TRUE(filleted.success) << filleted.errorMessage;

    EXPECT_EQ(router.active().engine(), EngineKind::Brep);
    EXPECT_STREQ(filleted.value->kernelName(), "fake-brep");
    EXPECT_EQ(log->imports, 1u);

    ASSERT_EQ(router.switches().size(), 1u);
    const EngineSwitchEvent& event = router.switches()[0];
    EXPECT_EQ(event.operationIndex, 3u);
    EXPECT_EQ(event.from, "mesh");
    EXPECT_EQ(event.to, "brep");
    EXPECT_FALSE(event.reason.empty());
}

TEST_F(KernelRouterTest, WorkplaneFallsBackForLegs) {
    KernelRouter router = makeRouter(EngineKind::Workplane);
    auto body = solidOn(router);

    auto legged = router.dispatch(op(OperationKind::AddLegs), 3, body.get());
    ASSERT_TRUE(legged.success);
    EXPECT_EQ(router.active().engine(), EngineKind::Brep);
    EXPECT_EQ(router.switches().size(), 1u);
}

TEST_F(KernelRouterTest, RuntimeUnsupportedAlsoFallsBack) {
    KernelRouter router = makeRouter(EngineKind::Mesh);

    SketchPolygonParams open;
    open.points = {Vector3(0, 0, 0), Vector3(10, 0, 0), Vector3(10, 10, 0)};
    open.closed = false;

    auto sketch = router.dispatch(op(OperationKind::SketchPolygon, open), 1, nullptr);
    ASSERT_TRUE(sketch.success) << sketch.errorMessage;
    EXPECT_EQ(sketch.value->getType(), ShapeType::Wire);
    EXPECT_EQ(router.active().engine(), EngineKind::Brep);
    ASSERT_EQ(router.switches().size(), 1u);
    EXPECT_EQ(router.switches()[0].operationIndex, 1u);

    // Sketches start over, nothing to carry across
    EXPECT_EQ(log->imports, 0u);
}

TEST_F(KernelRouterTest, NeverSwitchesBack) {
    KernelRouter router = makeRouter(EngineKind::Mesh);
    auto body = solidOn(router);

    auto filleted = router.dispatch(op(OperationKind::Fillet), 3, body.get());
    ASSERT_TRUE(filleted.success);

    // Cut is a mesh operation, but the build stays on brep
    auto cut = router.dispatch(op(OperationKind::Cut), 4, filleted.value.get());
    ASSERT_TRUE(cut.success);
    EXPECT_EQ(router.active().engine(), EngineKind::Brep);
    EXPECT_EQ(router.switches().size(), 1u);
}

TEST_F(KernelRouterTest, DefaultEngineFailureEscalates) {
    auto factory = [this](EngineKind engine) -> Result<std::unique_ptr<KernelAdapter>> {
        FakeKernelConfig config;
        config.name = engineName(engine);
        config.unsupported = {"fillet"};
        return Result<std::unique_ptr<KernelAdapter>>::ok(std::make_unique<KernelAdapter>(
            engine, std::make_unique<FakeKernel>(config, log), builtinCapability(engine)));
    };
    KernelRouter router(factory);
    ASSERT_TRUE(router.start(EngineKind::Brep, Units::Millimeters).success);
    auto body = solidOn(router);

    auto result = router.dispatch(op(OperationKind::Fillet), 3, body.get());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::KernelUnsupported);
    EXPECT_TRUE(router.switches().empty());
}

TEST_F(KernelRouterTest, UnavailableFallbackEscalatesAsUnsupported) {
    KernelRouter router = makeRouter(EngineKind::Mesh, {EngineKind::Brep});
    auto body = solidOn(router);

    auto result = router.dispatch(op(OperationKind::Shell), 3, body.get());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::KernelUnsupported);
    EXPECT_EQ(router.active().engine(), EngineKind::Mesh);
    EXPECT_TRUE(router.switches().empty());
}

TEST_F(KernelRouterTest, ExecutionErrorsDoNotTriggerFallback) {
    auto factory = [this](EngineKind engine) -> Result<std::unique_ptr<KernelAdapter>> {
        FakeKernelConfig config;
        config.name = engineName(engine);
        config.failing = {"booleanSubtract"};
        return Result<std::unique_ptr<KernelAdapter>>::ok(std::make_unique<KernelAdapter>(
            engine, std::make_unique<FakeKernel>(config, log), builtinCapability(engine)));
    };
    KernelRouter router(factory);
    ASSERT_TRUE(router.start(EngineKind::Mesh, Units::Millimeters).success);
    auto body = solidOn(router);

    auto result = router.dispatch(op(OperationKind::Cut), 3, body.get());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errc::KernelExecution);
    EXPECT_EQ(router.active().engine(), EngineKind::Mesh);
}

TEST_F(KernelRouterTest, FallbackKeepsRequestUnits) {
    KernelRouter router(fakeAdapterFactory(log));
    ASSERT_TRUE(router.start(EngineKind::Mesh, Units::Centimeters).success);
    auto body = solidOn(router);

    auto filleted = router.dispatch(op(OperationKind::Fillet), 3, body.get());
    ASSERT_TRUE(filleted.success);
    EXPECT_EQ(router.active().units(), Units::Centimeters);
    EXPECT_DOUBLE_EQ(log->modifierSizes.back(), 10);
}

TEST_F(KernelRouterTest, StartFailsWhenEngineUnavailable) {
    KernelRouter router(fakeAdapterFactory(log, {EngineKind::Workplane}));
    auto started = router.start(EngineKind::Workplane, Units::Millimeters);
    EXPECT_FALSE(started.success);
    EXPECT_EQ(started.errorCode, errc::Configuration);
    EXPECT_FALSE(router.started());
}
