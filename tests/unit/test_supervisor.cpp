#include <gtest/gtest.h>

#include "daemon/supervisor.hpp"
#include "ipc/codec.hpp"
#include "util/fake_surface.hpp"

#include <loom/logger.hpp>

#include <algorithm>

#include <poll.h>
#include <unistd.h>

using namespace loom;
using namespace loom::daemon;
using namespace loom::ipc;
using namespace std::chrono_literals;

namespace
{

SupervisorConfig test_config()
{
    SupervisorConfig config;
    config.handshake_timeout  = 2000ms;
    config.spawn_retry_budget = 3;
    config.spawn_retry_delay  = 10ms;
    config.drain_timeout      = 200ms;
    config.exit_grace         = 100ms;
    config.reap_interval      = 5ms;
    config.heartbeat_timeout  = 0ms;   // fakes do not heartbeat
    config.flush_interval     = 16ms;
    return config;
}

class SupervisorTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::null_sink());
    }

    void TearDown() override
    {
        sup.reset();
        Logger::instance().clear_sinks();
    }

    void make()
    {
        sup = std::make_unique<Supervisor>(config, launcher);
        sup->set_state_observer([this](const StateChange& c) { changes.push_back(c); });
        sup->set_fault_observer([this](SurfaceId id, RoleKind role, SurfaceFault fault)
                                { faults.push_back({id, role, fault}); });
    }

    bool is_ready(SurfaceId id) const { return sup->state_of(id) == SurfaceState::Ready; }

    SurfaceId start_primary()
    {
        make();
        auto id = sup->start();
        EXPECT_NE(id, INVALID_SURFACE);
        EXPECT_TRUE(test::pump_until(*sup, [&] { return is_ready(id); }));
        return id;
    }

    SurfaceId open(RoleKind role)
    {
        auto id = sup->request_surface(SurfaceRole::secondary(role));
        EXPECT_NE(id, INVALID_SURFACE);
        if (launcher.silent_roles.count(role) == 0)
            EXPECT_TRUE(test::pump_until(*sup, [&] { return is_ready(id); }));
        return id;
    }

    std::shared_ptr<test::FakeSurface> fake(SurfaceId id) const { return launcher.surface(id); }

    // Pump until the fake surface has received `n` messages of `type`.
    bool pump_until_received(SurfaceId id, std::string_view type, size_t n)
    {
        auto surface = fake(id);
        return surface && test::pump_until(*sup, [&] { return surface->count(type) >= n; });
    }

    struct Fault
    {
        SurfaceId    id;
        RoleKind     role;
        SurfaceFault fault;
    };

    SupervisorConfig            config = test_config();
    test::FakeLauncher          launcher;
    std::unique_ptr<Supervisor> sup;
    std::vector<StateChange>    changes;
    std::vector<Fault>          faults;
};

std::vector<uint8_t> payload_of(const Message& m)
{
    return m.payload;
}

}   // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SupervisorTest, PrimaryGoesThroughStartingToReady)
{
    auto primary = start_primary();

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].id, primary);
    EXPECT_EQ(changes[0].from, SurfaceState::Requested);
    EXPECT_EQ(changes[0].to, SurfaceState::Starting);
    EXPECT_EQ(changes[1].to, SurfaceState::Ready);

    ASSERT_TRUE(pump_until_received(primary, types::WELCOME, 1));
    auto welcome = decode_welcome(fake(primary)->received(types::WELCOME)[0].payload);
    ASSERT_TRUE(welcome.has_value());
    EXPECT_EQ(welcome->surface_id, primary);
    EXPECT_TRUE(sup->coordination().is_active(primary));
}

TEST_F(SupervisorTest, RequestIsIdempotentExceptFloating)
{
    start_primary();
    auto debug = sup->request_surface(SurfaceRole::secondary(RoleKind::Debug));
    EXPECT_EQ(sup->request_surface(SurfaceRole::secondary(RoleKind::Debug)), debug);
    EXPECT_EQ(launcher.launches(RoleKind::Debug), 1);

    auto a = sup->request_surface(SurfaceRole::secondary(RoleKind::Floating));
    auto b = sup->request_surface(SurfaceRole::secondary(RoleKind::Floating));
    EXPECT_NE(a, b);
    EXPECT_EQ(launcher.launches(RoleKind::Floating), 2);
}

TEST_F(SupervisorTest, ClosingSecondaryKeepsPrimaryRunning)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);
    auto pid     = sup->record(debug)->pid;

    ASSERT_TRUE(sup->close_surface(debug));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->state_of(debug) == SurfaceState::Closed; }));

    EXPECT_TRUE(is_ready(primary));
    EXPECT_FALSE(sup->stopped());
    EXPECT_FALSE(sup->shutting_down());
    EXPECT_FALSE(sup->coordination().is_active(debug));

    ASSERT_TRUE(test::wait_for([&] { return fake(debug)->count(types::CLOSE) == 1; }));
    auto closes = fake(debug)->received(types::CLOSE);
    ASSERT_EQ(closes.size(), 1u);
    EXPECT_EQ(decode_close(closes[0].payload)->reason, "requested");

    auto terminated = launcher.terminated();
    EXPECT_NE(std::find(terminated.begin(), terminated.end(), pid), terminated.end());

    // Closed records are purged but keep answering state_of
    test::pump_for(*sup, 20ms);
    EXPECT_EQ(sup->record(debug), nullptr);
    EXPECT_EQ(sup->state_of(debug), SurfaceState::Closed);
    EXPECT_FALSE(sup->close_surface(debug));
}

TEST_F(SupervisorTest, ShutdownClosesSecondariesBeforePrimary)
{
    auto primary  = start_primary();
    auto debug    = open(RoleKind::Debug);
    auto terminal = open(RoleKind::Terminal);
    changes.clear();

    sup->request_shutdown(0);
    EXPECT_EQ(sup->request_surface(SurfaceRole::secondary(RoleKind::GraphView)), INVALID_SURFACE);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->stopped(); }));
    EXPECT_EQ(sup->exit_code(), 0);

    auto closed_at = [&](SurfaceId id)
    {
        for (size_t i = 0; i < changes.size(); ++i)
        {
            if (changes[i].id == id && changes[i].to == SurfaceState::Closed)
                return static_cast<int>(i);
        }
        return -1;
    };
    ASSERT_GE(closed_at(debug), 0);
    ASSERT_GE(closed_at(terminal), 0);
    ASSERT_GE(closed_at(primary), 0);
    EXPECT_LT(closed_at(debug), closed_at(primary));
    EXPECT_LT(closed_at(terminal), closed_at(primary));

    ASSERT_TRUE(test::wait_for([&] { return fake(primary)->count(types::CLOSE) == 1; }));
    ASSERT_TRUE(test::wait_for([&] { return fake(debug)->count(types::CLOSE) == 1; }));
    EXPECT_EQ(decode_close(fake(debug)->received(types::CLOSE)[0].payload)->reason, "shutdown");
}

TEST_F(SupervisorTest, ClosingPrimaryShutsDown)
{
    auto primary = start_primary();
    open(RoleKind::GraphView);
    EXPECT_TRUE(sup->close_surface(primary));
    EXPECT_TRUE(sup->shutting_down());
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->stopped(); }));
    EXPECT_EQ(sup->exit_code(), 0);
}

TEST_F(SupervisorTest, RunReturnsExitCode)
{
    start_primary();
    sup->post([this] { sup->request_shutdown(0); });
    EXPECT_EQ(sup->run(), 0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SupervisorTest, HandshakeTimeoutUsesRetryBudget)
{
    config.handshake_timeout = 150ms;
    auto primary             = start_primary();

    launcher.silent_roles.insert(RoleKind::Debug);
    auto debug = open(RoleKind::Debug);

    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->state_of(debug) == SurfaceState::Closed; }));
    EXPECT_EQ(launcher.launches(RoleKind::Debug), 3);

    ASSERT_EQ(faults.size(), 3u);
    for (const auto& f : faults)
    {
        EXPECT_EQ(f.id, debug);
        EXPECT_EQ(f.fault, SurfaceFault::HandshakeTimeout);
    }

    // Nobody asked for it, so Primary hears about it
    ASSERT_TRUE(pump_until_received(primary, types::NOTICE, 1));
    auto notice = decode_notice(fake(primary)->received(types::NOTICE)[0].payload);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->severity, NoticePayload::Severity::Error);
    EXPECT_EQ(notice->role, RoleKind::Debug);
    EXPECT_NE(notice->text.find("HandshakeTimeout"), std::string::npos);
    EXPECT_FALSE(sup->stopped());
}

TEST_F(SupervisorTest, LaunchFailureNotifiesRequester)
{
    auto primary = start_primary();
    launcher.fail_roles.insert(RoleKind::Terminal);

    fake(primary)->send(make_message(std::string(types::OPEN_REQUEST),
                                     encode_open_request({RoleKind::Terminal})));

    ASSERT_TRUE(pump_until_received(primary, types::NOTICE, 1));
    EXPECT_EQ(launcher.launches(RoleKind::Terminal), 3);
    ASSERT_FALSE(faults.empty());
    EXPECT_EQ(faults.back().fault, SurfaceFault::SpawnError);

    auto notice = decode_notice(fake(primary)->received(types::NOTICE)[0].payload);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->role, RoleKind::Terminal);
    EXPECT_FALSE(sup->live_surface(RoleKind::Terminal).has_value());
}

TEST_F(SupervisorTest, PrimaryThatNeverStartsExitsWithError)
{
    config.spawn_retry_budget = 2;
    launcher.fail_roles.insert(RoleKind::Primary);
    make();

    auto primary = sup->start();
    EXPECT_NE(primary, INVALID_SURFACE);   // first attempt failed, retry pending
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->stopped(); }));
    EXPECT_EQ(sup->exit_code(), 1);
    EXPECT_EQ(launcher.launches(RoleKind::Primary), 2);
}

TEST_F(SupervisorTest, PrimaryCrashExitsWithError)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);

    launcher.crash(sup->record(primary)->pid);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->stopped(); }));
    EXPECT_EQ(sup->exit_code(), 1);
    EXPECT_EQ(sup->recovery_count(), 0u);
    EXPECT_TRUE(test::wait_for([&] { return fake(debug)->count(types::CLOSE) == 1; }));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Recovery
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SupervisorTest, CrashedDebugSurfaceIsRecoveredWithBreakpoints)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);

    fake(primary)->send(make_message(std::string(types::BREAKPOINT_ADDED),
                                     encode_breakpoint({"main.cpp", 42})));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->coordination().breakpoints().size() == 1; }));
    ASSERT_TRUE(pump_until_received(debug, types::BREAKPOINT_ADDED, 1));

    launcher.crash(sup->record(debug)->pid);

    SurfaceId fresh = INVALID_SURFACE;
    ASSERT_TRUE(test::pump_until(*sup,
                                 [&]
                                 {
                                     auto id = sup->live_surface(RoleKind::Debug);
                                     if (id && *id != debug && is_ready(*id))
                                         fresh = *id;
                                     return fresh != INVALID_SURFACE;
                                 }));

    ASSERT_FALSE(faults.empty());
    EXPECT_EQ(faults[0].id, debug);
    EXPECT_EQ(faults[0].fault, SurfaceFault::UnexpectedTermination);
    EXPECT_EQ(sup->recovery_count(), 1u);
    EXPECT_EQ(sup->state_of(debug), SurfaceState::Terminated);
    EXPECT_TRUE(is_ready(primary));

    ASSERT_TRUE(pump_until_received(fresh, types::BREAKPOINTS_SET, 1));
    auto msgs = fake(fresh)->received();
    ASSERT_GE(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].type, types::WELCOME);
    EXPECT_EQ(msgs[1].type, types::BREAKPOINTS_SET);
    auto set = decode_breakpoint_set(msgs[1].payload);
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->breakpoints, (std::vector<Breakpoint>{{"main.cpp", 42}}));
}

TEST_F(SupervisorTest, MessagesDuringRecoveryAreDeferred)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);

    launcher.silent_roles.insert(RoleKind::Debug);
    launcher.crash(sup->record(debug)->pid);

    SurfaceId fresh = INVALID_SURFACE;
    ASSERT_TRUE(test::pump_until(*sup,
                                 [&]
                                 {
                                     auto id = sup->live_surface(RoleKind::Debug);
                                     if (id && *id != debug)
                                         fresh = *id;
                                     return fresh != INVALID_SURFACE;
                                 }));
    EXPECT_EQ(sup->state_of(fresh), SurfaceState::Starting);
    // The old record stays until its replacement is Ready
    EXPECT_NE(sup->record(debug), nullptr);

    for (uint8_t i = 0; i < 3; ++i)
        fake(primary)->send(make_message(std::string(types::DEBUG_COMMAND), {i}));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->record(fresh)->deferred.size() == 3; }));

    fake(fresh)->send_ready();
    ASSERT_TRUE(pump_until_received(fresh, types::DEBUG_COMMAND, 3));

    auto msgs = fake(fresh)->received();
    ASSERT_EQ(msgs.size(), 5u);
    EXPECT_EQ(msgs[0].type, types::WELCOME);
    EXPECT_EQ(msgs[1].type, types::BREAKPOINTS_SET);
    for (uint8_t i = 0; i < 3; ++i)
        EXPECT_EQ(payload_of(msgs[2 + i]), (std::vector<uint8_t>{i}));

    EXPECT_EQ(sup->record(debug), nullptr);
    EXPECT_EQ(sup->state_of(debug), SurfaceState::Terminated);
}

TEST_F(SupervisorTest, MessageToTerminatedIdIsDiagnosed)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);
    launcher.crash(sup->record(debug)->pid);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->recovery_count() == 1; }));

    auto before = sup->diagnostic_count();
    EXPECT_EQ(sup->send_to_surface(debug, make_message(std::string(types::DEBUG_COMMAND))),
              DeliveryOutcome::Skipped);
    EXPECT_EQ(sup->diagnostic_count(), before + 1);

    CloseRequestPayload req;
    req.surface_id = debug;
    fake(primary)->send(make_message(std::string(types::CLOSE_REQUEST), encode_close_request(req)));
    ASSERT_TRUE(pump_until_received(primary, types::DIAGNOSTIC, 1));
    EXPECT_EQ(sup->diagnostic_count(), before + 2);
}

TEST_F(SupervisorTest, CleanExitIsNotRecovered)
{
    start_primary();
    auto debug = open(RoleKind::Debug);

    launcher.crash(sup->record(debug)->pid, 0);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->state_of(debug) == SurfaceState::Closed; }));
    EXPECT_EQ(sup->recovery_count(), 0u);
    EXPECT_TRUE(faults.empty());
    EXPECT_FALSE(sup->live_surface(RoleKind::Debug).has_value());
}

TEST_F(SupervisorTest, LostChannelWithoutExitStatusIsATermination)
{
    start_primary();
    auto terminal = open(RoleKind::Terminal);

    fake(terminal)->disconnect();
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->recovery_count() == 1; }));
    ASSERT_FALSE(faults.empty());
    EXPECT_EQ(faults[0].fault, SurfaceFault::UnexpectedTermination);
}

TEST_F(SupervisorTest, NonRecoverableRoleNotifiesPrimary)
{
    auto primary = start_primary();
    auto floating = open(RoleKind::Floating);

    launcher.crash(sup->record(floating)->pid);
    ASSERT_TRUE(pump_until_received(primary, types::NOTICE, 1));
    EXPECT_EQ(sup->recovery_count(), 0u);
    EXPECT_EQ(sup->state_of(floating), SurfaceState::Terminated);

    auto notice = decode_notice(fake(primary)->received(types::NOTICE)[0].payload);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->severity, NoticePayload::Severity::Warning);
    EXPECT_EQ(notice->role, RoleKind::Floating);
}

TEST_F(SupervisorTest, SilentPrimaryIsTreatedAsHung)
{
    config.heartbeat_timeout = 60ms;
    start_primary();
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->stopped(); }));
    EXPECT_EQ(sup->exit_code(), 1);
    ASSERT_FALSE(faults.empty());
    EXPECT_EQ(faults[0].fault, SurfaceFault::UnexpectedTermination);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SupervisorTest, PerSourceOrderIsPreserved)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);

    for (uint8_t i = 0; i < 50; ++i)
        fake(primary)->send(make_message(std::string(types::DEBUG_COMMAND), {i}));

    ASSERT_TRUE(pump_until_received(debug, types::DEBUG_COMMAND, 50));
    auto cmds = fake(debug)->received(types::DEBUG_COMMAND);
    for (uint8_t i = 0; i < 50; ++i)
        EXPECT_EQ(cmds[i].payload, (std::vector<uint8_t>{i}));

    // Outbound sequence numbers are consecutive per surface
    auto all = fake(debug)->received();
    for (size_t i = 1; i < all.size(); ++i)
        EXPECT_EQ(all[i].seq, all[i - 1].seq + 1);
}

TEST_F(SupervisorTest, ThemeReachesReadyNowAndPendingOnReady)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);
    auto graph   = open(RoleKind::GraphView);
    launcher.silent_roles.insert(RoleKind::Terminal);
    auto terminal = open(RoleKind::Terminal);
    ASSERT_EQ(sup->state_of(terminal), SurfaceState::Starting);

    fake(primary)->send(make_message(std::string(types::THEME_CHANGED), encode_theme({"dark"})));

    ASSERT_TRUE(pump_until_received(debug, types::THEME_CHANGED, 1));
    ASSERT_TRUE(pump_until_received(graph, types::THEME_CHANGED, 1));
    EXPECT_EQ(sup->coordination().theme(), "dark");
    EXPECT_EQ(fake(terminal)->count(types::THEME_CHANGED), 0u);

    fake(terminal)->send_ready();
    ASSERT_TRUE(pump_until_received(terminal, types::THEME_CHANGED, 1));

    test::pump_for(*sup, 60ms);
    EXPECT_EQ(fake(debug)->count(types::THEME_CHANGED), 1u);
    EXPECT_EQ(fake(graph)->count(types::THEME_CHANGED), 1u);
    EXPECT_EQ(fake(terminal)->count(types::THEME_CHANGED), 1u);
    EXPECT_EQ(fake(primary)->count(types::THEME_CHANGED), 0u);

    auto theme = decode_theme(fake(terminal)->received(types::THEME_CHANGED)[0].payload);
    ASSERT_TRUE(theme.has_value());
    EXPECT_EQ(theme->name, "dark");
}

TEST_F(SupervisorTest, UnroutableMessageGetsOneDiagnostic)
{
    start_primary();
    auto debug = open(RoleKind::Debug);
    auto graph = open(RoleKind::GraphView);

    fake(graph)->send(make_message(std::string(types::BREAKPOINTS_SET), encode_breakpoint_set({})));
    ASSERT_TRUE(pump_until_received(graph, types::DIAGNOSTIC, 1));
    test::pump_for(*sup, 30ms);

    EXPECT_EQ(sup->diagnostic_count(), 1u);
    EXPECT_EQ(fake(graph)->count(types::DIAGNOSTIC), 1u);
    // Only the resync copy reached the debug surface
    EXPECT_EQ(fake(debug)->count(types::BREAKPOINTS_SET), 1u);
}

TEST_F(SupervisorTest, HighFrequencyUpdatesArriveBatchedInOrder)
{
    auto primary = start_primary();
    auto graph   = open(RoleKind::GraphView);

    for (uint8_t i = 0; i < 20; ++i)
        fake(primary)->send(make_message(std::string(types::EDIT), {i}));

    std::vector<std::vector<uint8_t>> items;
    auto                              collect = [&]
    {
        items.clear();
        for (const auto& m : fake(graph)->received(types::EDIT_BATCH))
        {
            auto batch = decode_batch(m.payload);
            if (batch)
                items.insert(items.end(), batch->items.begin(), batch->items.end());
        }
        return items.size() >= 20;
    };
    ASSERT_TRUE(test::pump_until(*sup, collect));

    ASSERT_EQ(items.size(), 20u);
    for (uint8_t i = 0; i < 20; ++i)
        EXPECT_EQ(items[i], (std::vector<uint8_t>{i}));
    EXPECT_EQ(fake(graph)->count(types::EDIT), 0u);
}

TEST_F(SupervisorTest, ReplaceableUpdatesEndOnLatestValue)
{
    auto primary = start_primary();
    auto graph   = open(RoleKind::GraphView);

    for (uint8_t i = 1; i <= 5; ++i)
        fake(primary)->send(make_message(std::string(types::CURSOR), {i}));

    ASSERT_TRUE(test::pump_until(*sup,
                                 [&]
                                 {
                                     auto cursors = fake(graph)->received(types::CURSOR);
                                     return !cursors.empty()
                                            && cursors.back().payload == std::vector<uint8_t>{5};
                                 }));
    EXPECT_LE(fake(graph)->count(types::CURSOR), 5u);

    // Same value again is suppressed
    auto count = fake(graph)->count(types::CURSOR);
    fake(primary)->send(make_message(std::string(types::CURSOR), {5}));
    test::pump_for(*sup, 60ms);
    EXPECT_EQ(fake(graph)->count(types::CURSOR), count);
}

TEST_F(SupervisorTest, OpenAndCloseRequestsFromPrimary)
{
    auto primary = start_primary();

    fake(primary)->send(make_message(std::string(types::OPEN_REQUEST),
                                     encode_open_request({RoleKind::GraphView})));
    ASSERT_TRUE(test::pump_until(*sup,
                                 [&]
                                 {
                                     auto id = sup->live_surface(RoleKind::GraphView);
                                     return id && is_ready(*id);
                                 }));

    CloseRequestPayload by_role;
    by_role.role = RoleKind::GraphView;
    fake(primary)->send(make_message(std::string(types::CLOSE_REQUEST), encode_close_request(by_role)));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return !sup->live_surface(RoleKind::GraphView); }));
    EXPECT_FALSE(sup->stopped());

    CloseRequestPayload quit;
    quit.role = RoleKind::Primary;
    fake(primary)->send(make_message(std::string(types::CLOSE_REQUEST), encode_close_request(quit)));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->stopped(); }));
    EXPECT_EQ(sup->exit_code(), 0);
}

TEST_F(SupervisorTest, GeometryFeedsLayout)
{
    start_primary();
    auto debug = open(RoleKind::Debug);

    GeometryPayload g{true, 5, 6, 700, 500};
    fake(debug)->send(make_message(std::string(types::GEOMETRY), encode_geometry(g)));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->coordination().geometry(debug).has_value(); }));

    auto layout = sup->layout();
    EXPECT_EQ(layout.get(RoleKind::Debug), g);
    ASSERT_TRUE(layout.get(RoleKind::Primary).has_value());
    EXPECT_TRUE(layout.get(RoleKind::Primary)->visible);

    sup->close_surface(debug);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->state_of(debug) == SurfaceState::Closed; }));
    auto after = sup->layout().get(RoleKind::Debug);
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after->visible);
    EXPECT_EQ(after->width, 700);
}

TEST_F(SupervisorTest, SeededLayoutPlacesSurfacesWhenReady)
{
    GeometryPayload main_g{true, 0, 0, 1200, 900};
    GeometryPayload debug_g{true, 10, 20, 640, 480};
    LayoutStore     saved;
    saved.set(RoleKind::Primary, main_g);
    saved.set(RoleKind::Debug, debug_g);
    LayoutStore loaded;
    ASSERT_TRUE(loaded.deserialize(saved.serialize()));

    make();
    sup->seed_layout(loaded);
    auto primary = sup->start();
    ASSERT_TRUE(test::pump_until(*sup, [&] { return is_ready(primary); }));
    auto debug    = open(RoleKind::Debug);
    auto terminal = open(RoleKind::Terminal);

    ASSERT_TRUE(pump_until_received(primary, types::GEOMETRY, 1));
    EXPECT_EQ(decode_geometry(fake(primary)->received(types::GEOMETRY)[0].payload), main_g);
    ASSERT_TRUE(pump_until_received(debug, types::GEOMETRY, 1));
    EXPECT_EQ(decode_geometry(fake(debug)->received(types::GEOMETRY)[0].payload), debug_g);

    // No known geometry, nothing to place
    ASSERT_TRUE(pump_until_received(terminal, types::WELCOME, 1));
    EXPECT_EQ(fake(terminal)->count(types::GEOMETRY), 0u);

    // Surfaces that never report back keep the seeded placement on save
    LayoutStore saved_again;
    ASSERT_TRUE(saved_again.deserialize(sup->layout().serialize()));
    EXPECT_EQ(saved_again.get(RoleKind::Primary), main_g);
    EXPECT_EQ(saved_again.get(RoleKind::Debug), debug_g);
}

TEST_F(SupervisorTest, StagedUpdateIsNotOvertakenByLaterMessage)
{
    auto primary = start_primary();
    auto debug   = open(RoleKind::Debug);

    fake(debug)->send(make_message(std::string(types::DIAGNOSTICS), {1}));
    fake(debug)->send(make_message(std::string(types::DEBUG_STOPPED), {2}));
    ASSERT_TRUE(pump_until_received(primary, types::DEBUG_STOPPED, 1));

    auto msgs = fake(primary)->received();
    auto diag = std::find_if(msgs.begin(), msgs.end(),
                             [](const Message& m) { return m.type == types::DIAGNOSTICS; });
    auto stop = std::find_if(msgs.begin(), msgs.end(),
                             [](const Message& m) { return m.type == types::DEBUG_STOPPED; });
    ASSERT_NE(diag, msgs.end());
    EXPECT_LT(diag, stop);
    EXPECT_EQ(diag->payload, (std::vector<uint8_t>{1}));
}

TEST_F(SupervisorTest, RetiredSurfacesAreBounded)
{
    config.retired_history = 3;
    start_primary();

    std::vector<SurfaceId> closed;
    for (int32_t i = 0; i < 6; ++i)
    {
        auto id = open(RoleKind::Floating);
        fake(id)->send(make_message(std::string(types::GEOMETRY),
                                    encode_geometry({true, i, i, 300, 200})));
        ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->coordination().geometry(id).has_value(); }));
        ASSERT_TRUE(sup->close_surface(id));
        ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->state_of(id) == SurfaceState::Closed; }));
        closed.push_back(id);
    }
    test::pump_for(*sup, 20ms);

    EXPECT_EQ(sup->retired_count(), 3u);
    EXPECT_FALSE(sup->state_of(closed.front()).has_value());
    EXPECT_EQ(sup->state_of(closed.back()), SurfaceState::Closed);
    EXPECT_EQ(sup->coordination().geometry_count(), 0u);
}

TEST_F(SupervisorTest, TerminatedSurfaceWithoutReplacementIsPurged)
{
    start_primary();
    auto floating = open(RoleKind::Floating);
    fake(floating)->send(make_message(std::string(types::GEOMETRY), encode_geometry({})));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->coordination().geometry(floating).has_value(); }));

    launcher.crash(sup->record(floating)->pid);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->record(floating) == nullptr; }));
    EXPECT_EQ(sup->state_of(floating), SurfaceState::Terminated);
    EXPECT_FALSE(sup->coordination().geometry(floating).has_value());
    EXPECT_EQ(sup->send_to_surface(floating, make_message(std::string(types::NOTICE))),
              DeliveryOutcome::Skipped);
}

TEST_F(SupervisorTest, ProducerMessagesAreRouted)
{
    start_primary();
    auto graph = open(RoleKind::GraphView);

    Server server;
    auto   path = "/tmp/loom-test-sup-" + std::to_string(::getpid()) + ".sock";
    ASSERT_TRUE(server.listen(path));
    sup->set_producer_server(&server);

    auto client = Client::connect(path);
    ASSERT_NE(client, nullptr);
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->producer_count() == 1; }));

    Message render = make_message(std::string(types::GRAPH_RENDER), {1, 2, 3});
    render.seq     = 1;
    ASSERT_TRUE(client->send(render));
    ASSERT_TRUE(pump_until_received(graph, types::GRAPH_RENDER, 1));
    EXPECT_EQ(fake(graph)->received(types::GRAPH_RENDER)[0].payload, (std::vector<uint8_t>{1, 2, 3}));

    // Producers are sources only
    EXPECT_EQ(sup->surfaces().size(), 2u);

    Message stray = make_message(std::string(types::EDIT_BATCH));
    stray.seq     = 2;
    ASSERT_TRUE(client->send(stray));
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->diagnostic_count() == 1; }));
    pollfd pfd{client->fd(), POLLIN, 0};
    ASSERT_EQ(::poll(&pfd, 1, 2000), 1);
    auto reply = client->recv();
    ASSERT_EQ(reply.status, RecvStatus::Ok);
    EXPECT_EQ(reply.message.type, types::DIAGNOSTIC);

    client->close();
    ASSERT_TRUE(test::pump_until(*sup, [&] { return sup->producer_count() == 0; }));
    sup->set_producer_server(nullptr);
}
