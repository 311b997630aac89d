// loom-supervisor: owns the surface processes of one application.
//
// Starts the Primary surface, restores the persisted layout, accepts content
// producers on a Unix socket and runs the control loop until Primary closes.

#include "layout_store.hpp"
#include "process_manager.hpp"
#include "supervisor.hpp"
#include "supervisor_config.hpp"

#include "../ipc/transport.hpp"

#include <loom/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

void setup_logging(const loom::daemon::SupervisorConfig& config)
{
    auto& logger = loom::Logger::instance();

    loom::LogLevel level = loom::LogLevel::Info;
    loom::Logger::parse_level(config.log_level, level);
    logger.set_level(level);

    logger.clear_sinks();
    logger.add_sink(loom::sinks::console_sink());
    if (!config.log_file.empty())
        logger.add_sink(loom::sinks::file_sink(config.log_file));
}

}   // anonymous namespace

int main(int argc, char* argv[])
{
    using namespace loom;

    Logger::instance().add_sink(sinks::console_sink());

    daemon::SupervisorConfig config;
    switch (daemon::parse_args(argc, argv, config))
    {
        case daemon::ParseStatus::Ok:
            break;
        case daemon::ParseStatus::Help:
            return 0;
        case daemon::ParseStatus::Error:
            return 2;
    }

    setup_logging(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ─── Surface launcher ────────────────────────────────────────────────
    daemon::ProcessManager proc_mgr;
    proc_mgr.set_surface_path(config.surface_binary.empty()
                                  ? daemon::resolve_surface_path(argv[0])
                                  : config.surface_binary);
    proc_mgr.set_kill_grace(config.kill_grace);
    proc_mgr.set_extra_args({"--log-level", config.log_level});
    LOOM_LOG_INFO("supervisor", "Surface binary: {}", proc_mgr.surface_path());

    // ─── Producer socket ─────────────────────────────────────────────────
    std::string socket_path =
        config.socket_path.empty() ? ipc::default_socket_path() : config.socket_path;
    ipc::Server server;
    if (server.listen(socket_path))
        LOOM_LOG_INFO("supervisor", "Accepting producers on {}", socket_path);
    else
        LOOM_LOG_ERROR("supervisor", "Failed to listen on {}, producers disabled", socket_path);

    // ─── Control loop ────────────────────────────────────────────────────
    daemon::Supervisor supervisor(config, proc_mgr);
    if (server.is_listening())
        supervisor.set_producer_server(&server);

    // The layout seeds role geometry before Primary starts, so every surface
    // is placed where it was when it becomes Ready
    daemon::LayoutStore layout;
    bool                have_layout = !config.layout_path.empty() && layout.load(config.layout_path);
    if (have_layout)
        supervisor.seed_layout(layout);
    else if (!config.layout_path.empty())
        LOOM_LOG_INFO("layout", "No usable layout at {}", config.layout_path);

    if (supervisor.start() != ipc::INVALID_SURFACE && have_layout)
    {
        auto restored = layout.restore(
            [&](ipc::RoleKind kind)
            {
                return supervisor.request_surface(ipc::SurfaceRole::secondary(kind))
                       != ipc::INVALID_SURFACE;
            });
        LOOM_LOG_INFO("layout", "Restored {} surfaces from {}", restored, config.layout_path);
    }

    while (!supervisor.stopped())
    {
        supervisor.poll(std::chrono::milliseconds(100));
        if (!g_running.load(std::memory_order_relaxed) && !supervisor.shutting_down())
        {
            LOOM_LOG_INFO("supervisor", "Signal received, shutting down");
            supervisor.request_shutdown(0);
        }
    }

    if (!config.layout_path.empty() && !supervisor.layout().save(config.layout_path))
        LOOM_LOG_WARN("layout", "Layout not persisted");

    server.close();
    LOOM_LOG_INFO("supervisor", "Stopped with exit code {}", supervisor.exit_code());
    return supervisor.exit_code();
}
