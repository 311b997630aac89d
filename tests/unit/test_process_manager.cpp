#include <gtest/gtest.h>

#include "daemon/process_manager.hpp"

#include <chrono>
#include <thread>

using namespace loom::daemon;
using namespace loom::ipc;

namespace
{

std::vector<ExitEvent> reap_within(ProcessManager& pm, size_t expected, std::chrono::milliseconds timeout)
{
    std::vector<ExitEvent> all;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (all.size() < expected && std::chrono::steady_clock::now() < deadline)
    {
        for (const auto& ev : pm.reap_finished())
            all.push_back(ev);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return all;
}

}   // anonymous namespace

TEST(ProcessManager, DefaultState)
{
    ProcessManager pm;
    EXPECT_EQ(pm.process_count(), 0u);
    EXPECT_TRUE(pm.all_processes().empty());
    EXPECT_TRUE(pm.surface_path().empty());
}

TEST(ProcessManager, SetSurfacePath)
{
    ProcessManager pm;
    pm.set_surface_path("/usr/bin/loom-surface");
    EXPECT_EQ(pm.surface_path(), "/usr/bin/loom-surface");
}

TEST(ProcessManager, LaunchFailsWithoutPath)
{
    ProcessManager pm;
    auto           result = pm.launch(1, SurfaceRole::primary());
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(pm.process_count(), 0u);
}

TEST(ProcessManager, LaunchFailsWithBadPath)
{
    ProcessManager pm;
    pm.set_surface_path("/nonexistent/loom-surface-fake");
    auto result = pm.launch(1, SurfaceRole::secondary(RoleKind::Debug));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.channel, nullptr);
    EXPECT_EQ(pm.process_count(), 0u);
}

TEST(ProcessManager, PidForSurfaceNotFound)
{
    ProcessManager pm;
    EXPECT_EQ(pm.pid_for_surface(999), 0);
}

TEST(ProcessManager, TerminateUnknownPid)
{
    ProcessManager pm;
    pm.terminate(12345);
    EXPECT_EQ(pm.process_count(), 0u);
}

TEST(ProcessManager, ReapFinishedEmpty)
{
    ProcessManager pm;
    EXPECT_TRUE(pm.reap_finished().empty());
}

TEST(ProcessManager, ResolveFallsBackToPath)
{
    EXPECT_EQ(resolve_surface_path("/nonexistent-dir/loom-supervisor"), "loom-surface");
    EXPECT_EQ(resolve_surface_path(nullptr), "loom-surface");
}

#ifdef __linux__

TEST(ProcessManager, LaunchRealProcess)
{
    // /bin/true ignores its arguments and exits 0
    ProcessManager pm;
    pm.set_surface_path("/bin/true");

    auto result = pm.launch(7, SurfaceRole::secondary(RoleKind::Terminal));
    ASSERT_TRUE(result.ok());
    EXPECT_GT(result.pid, 0);
    EXPECT_EQ(pm.process_count(), 1u);
    EXPECT_EQ(pm.pid_for_surface(7), result.pid);

    auto procs = pm.all_processes();
    ASSERT_EQ(procs.size(), 1u);
    EXPECT_EQ(procs[0].role, RoleKind::Terminal);

    // The child exits, so the channel sees EOF
    EXPECT_EQ(result.channel->recv().status, RecvStatus::Closed);

    auto reaped = reap_within(pm, 1, std::chrono::milliseconds(2000));
    ASSERT_EQ(reaped.size(), 1u);
    EXPECT_EQ(reaped[0].pid, result.pid);
    EXPECT_EQ(reaped[0].exit_code, 0);
    EXPECT_FALSE(reaped[0].abnormal());
    EXPECT_EQ(pm.process_count(), 0u);
}

TEST(ProcessManager, NonZeroExitIsAbnormal)
{
    ProcessManager pm;
    pm.set_surface_path("/bin/false");

    auto result = pm.launch(1, SurfaceRole::secondary(RoleKind::Debug));
    ASSERT_TRUE(result.ok());

    auto reaped = reap_within(pm, 1, std::chrono::milliseconds(2000));
    ASSERT_EQ(reaped.size(), 1u);
    EXPECT_NE(reaped[0].exit_code, 0);
    EXPECT_TRUE(reaped[0].abnormal());
}

TEST(ProcessManager, TerminateIsIdempotent)
{
    // sh rejects the surface flags; it exits non-zero unless SIGTERM gets there first
    ProcessManager pm;
    pm.set_surface_path("/bin/sh");

    auto result = pm.launch(3, SurfaceRole::secondary(RoleKind::GraphView));
    ASSERT_TRUE(result.ok());
    pm.terminate(result.pid);
    pm.terminate(result.pid);

    auto reaped = reap_within(pm, 1, std::chrono::milliseconds(3000));
    ASSERT_EQ(reaped.size(), 1u);
    EXPECT_EQ(reaped[0].pid, result.pid);
    EXPECT_TRUE(reaped[0].abnormal());
    EXPECT_EQ(pm.process_count(), 0u);
}

TEST(ProcessManager, MultipleLaunches)
{
    ProcessManager pm;
    pm.set_surface_path("/bin/true");

    auto a = pm.launch(1, SurfaceRole::primary());
    auto b = pm.launch(2, SurfaceRole::secondary(RoleKind::Floating));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.pid, b.pid);

    auto reaped = reap_within(pm, 2, std::chrono::milliseconds(2000));
    EXPECT_EQ(reaped.size(), 2u);
    EXPECT_EQ(pm.process_count(), 0u);
}

#endif
