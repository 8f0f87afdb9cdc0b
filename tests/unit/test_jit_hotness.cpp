// File: tests/unit/test_jit_hotness.cpp
// Purpose: Verify the execution-path hooks: threshold promotion, failed
//          speculation handling and the no-automatic-retry policy.
// Key invariants: A unit is promoted at most once per hot period; failed
//                 compilations are not retried by the hooks.
// Ownership/Lifetime: Synchronous managers keep every test single-threaded.
// Links: src/jit/CompilationManager.cpp

#include <gtest/gtest.h>

#include "JitTestBackend.hpp"
#include "kiln/jit/CompilationManager.hpp"

using namespace kiln::jit;
using namespace kiln::jit::test;

namespace
{

JitConfig hotnessConfig(uint64_t calls, uint64_t loops)
{
    JitConfig cfg;
    cfg.mode = CompileMode::Synchronous;
    cfg.callThreshold = calls;
    cfg.loopThreshold = loops;
    cfg.trace.failures = false;
    return cfg;
}

} // namespace

TEST(JitHotness, CallThresholdPromotesOnce)
{
    ScriptedBackend backend;
    CompilationManager manager(backend, hotnessConfig(3, 1000));
    UnitPtr unit = manager.createUnit("callee");

    EXPECT_FALSE(manager.onCall(unit));
    EXPECT_FALSE(manager.onCall(unit));
    EXPECT_EQ(manager.status(*unit), CompilationStatus::NotCompiled);
    EXPECT_TRUE(manager.onCall(unit));
    EXPECT_EQ(manager.status(*unit), CompilationStatus::Installed);

    // Already installed: further calls do not resubmit.
    EXPECT_FALSE(manager.onCall(unit));
    EXPECT_EQ(backend.calls(), 1);
}

TEST(JitHotness, LoopBackEdgesAccumulate)
{
    ScriptedBackend backend;
    CompilationManager manager(backend, hotnessConfig(1000, 100));
    UnitPtr unit = manager.createUnit("loop");

    EXPECT_FALSE(manager.onLoopBackEdges(unit, 60));
    EXPECT_EQ(unit->loopCount(), 60u);
    EXPECT_TRUE(manager.onLoopBackEdges(unit, 40));
    EXPECT_NE(manager.installedCode(*unit), nullptr);
}

TEST(JitHotness, FailedUnitIsNotRetried)
{
    ScriptedBackend backend;
    Behaviour failing;
    failing.fail = true;
    backend.setDefault(failing);
    CompilationManager manager(backend, hotnessConfig(1, 1000));
    UnitPtr unit = manager.createUnit("broken");

    EXPECT_TRUE(manager.onCall(unit));
    EXPECT_EQ(manager.status(*unit), CompilationStatus::Failed);
    for (int i = 0; i < 10; ++i)
        EXPECT_FALSE(manager.onCall(unit));
    EXPECT_EQ(backend.calls(), 1);

    // An explicit submit still retries.
    backend.setDefault(Behaviour{});
    ASSERT_TRUE(manager.submit(unit).hasValue());
    EXPECT_EQ(manager.status(*unit), CompilationStatus::Installed);
}

TEST(JitHotness, HooksDoNothingAfterShutdown)
{
    ScriptedBackend backend;
    CompilationManager manager(backend, hotnessConfig(1, 1));
    manager.shutdown();
    UnitPtr unit = manager.createUnit("late");

    EXPECT_FALSE(manager.onCall(unit));
    EXPECT_FALSE(manager.onLoopBackEdges(unit, 5));
    EXPECT_EQ(manager.statistics().rejected, 0u);
    EXPECT_EQ(backend.calls(), 0);
}

TEST(JitHotness, SpeculationFailureEvictsAndResetsCounters)
{
    ScriptedBackend backend;
    Behaviour speculating;
    speculating.speculations = {42};
    backend.setDefault(speculating);
    CompilationManager manager(backend, hotnessConfig(2, 1000));
    UnitPtr unit = manager.createUnit("guarded");

    manager.onCall(unit);
    ASSERT_TRUE(manager.onCall(unit));
    InstalledCodePtr code = manager.installedCode(*unit);
    ASSERT_NE(code, nullptr);
    EXPECT_TRUE(code->speculations().maySpeculate(42));

    EXPECT_TRUE(manager.onSpeculationFailed(*unit, code->id(), 42));
    EXPECT_EQ(manager.installedCode(*unit), nullptr);
    EXPECT_FALSE(code->isValid());
    EXPECT_EQ(unit->callCount(), 0u);
    EXPECT_EQ(unit->speculationLog().failureCount(42), 1u);
    EXPECT_FALSE(unit->speculationLog().maySpeculate(42));

    // A second report against the same stale code only bumps the log.
    EXPECT_FALSE(manager.onSpeculationFailed(*unit, code->id(), 42));
    EXPECT_EQ(unit->speculationLog().failureCount(42), 2u);
    EXPECT_EQ(manager.statistics().invalidated, 1u);

    // Hot again: recompiled against the updated log.
    EXPECT_FALSE(manager.onCall(unit));
    EXPECT_TRUE(manager.onCall(unit));
    InstalledCodePtr recompiled = manager.installedCode(*unit);
    ASSERT_NE(recompiled, nullptr);
    EXPECT_FALSE(recompiled->speculations().maySpeculate(42));
    EXPECT_EQ(backend.lastSnapshotVersion(), 2u);
}

TEST(JitHotness, UnitsTakeFailureLimitFromConfig)
{
    ScriptedBackend backend;
    JitConfig cfg = hotnessConfig(10, 10);
    cfg.maxSpeculationFailures = 3;
    CompilationManager manager(backend, cfg);
    UnitPtr unit = manager.createUnit("tolerant");

    unit->speculationLog().recordFailure(1);
    unit->speculationLog().recordFailure(1);
    EXPECT_TRUE(unit->speculationLog().maySpeculate(1));
    unit->speculationLog().recordFailure(1);
    EXPECT_FALSE(unit->speculationLog().maySpeculate(1));
}
