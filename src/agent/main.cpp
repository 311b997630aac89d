// loom-surface: minimal headless surface process.
//
// Launched by loom-supervisor with one end of a socketpair on --fd. Performs
// the surface.ready handshake, sends heartbeats at the interval announced in
// surface.welcome, takes the geometry it is placed at and reports it back,
// and exits on surface.close.

#include <loom/logger.hpp>

#include "../ipc/codec.hpp"
#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

struct AgentOptions
{
    int                  fd         = -1;
    loom::ipc::SurfaceId surface_id = loom::ipc::INVALID_SURFACE;
    loom::ipc::RoleKind  role       = loom::ipc::RoleKind::Primary;
    int                  crash_after_ms = -1;
    bool                 send_ready     = true;
    std::string          log_level      = "info";
};

bool parse_number(const char* text, long long& out)
{
    char* end = nullptr;
    out       = std::strtoll(text, &end, 10);
    return end != text && *end == '\0';
}

bool parse_options(int argc, char* argv[], AgentOptions& opts)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg  = argv[i];
        bool        last = (i + 1 >= argc);
        long long   n    = 0;

        if (arg == "--no-ready")
        {
            opts.send_ready = false;
        }
        else if (last)
        {
            LOOM_LOG_ERROR("agent", "Missing value for {}", arg);
            return false;
        }
        else if (arg == "--fd" && parse_number(argv[i + 1], n))
        {
            opts.fd = static_cast<int>(n);
            ++i;
        }
        else if (arg == "--surface-id" && parse_number(argv[i + 1], n) && n > 0)
        {
            opts.surface_id = static_cast<loom::ipc::SurfaceId>(n);
            ++i;
        }
        else if (arg == "--role")
        {
            auto kind = loom::ipc::role_kind_from_name(argv[++i]);
            if (!kind)
            {
                LOOM_LOG_ERROR("agent", "Unknown role '{}'", argv[i]);
                return false;
            }
            opts.role = *kind;
        }
        else if (arg == "--crash-after-ms" && parse_number(argv[i + 1], n) && n >= 0)
        {
            opts.crash_after_ms = static_cast<int>(n);
            ++i;
        }
        else if (arg == "--log-level")
        {
            opts.log_level = argv[++i];
        }
        else
        {
            LOOM_LOG_ERROR("agent", "Invalid argument {} {}", arg, argv[i + 1]);
            return false;
        }
    }

    if (opts.fd < 0 || opts.surface_id == loom::ipc::INVALID_SURFACE)
    {
        LOOM_LOG_ERROR("agent", "--fd and --surface-id are required");
        return false;
    }
    return true;
}

bool send_ipc(loom::ipc::Connection& conn, std::string_view type, std::vector<uint8_t> payload = {})
{
    static loom::ipc::Sequence seq = 0;
    auto msg = loom::ipc::make_message(std::string(type), std::move(payload));
    msg.seq  = ++seq;
    return conn.send(msg);
}

}   // anonymous namespace

int main(int argc, char* argv[])
{
    using namespace loom;
    using Clock = std::chrono::steady_clock;

    // ═══════════════════════════════════════════════════════════════════════
    // Phase 1: Arguments and logging
    // ═══════════════════════════════════════════════════════════════════════

    auto& logger = Logger::instance();
    logger.add_sink(sinks::console_sink());

    AgentOptions opts;
    if (!parse_options(argc, argv, opts))
        return 2;

    LogLevel level = LogLevel::Info;
    Logger::parse_level(opts.log_level, level);
    logger.set_level(level);

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    const std::string name = std::string(ipc::role_kind_name(opts.role)) + "#"
                             + std::to_string(opts.surface_id);

    // ═══════════════════════════════════════════════════════════════════════
    // Phase 2: Handshake
    // ═══════════════════════════════════════════════════════════════════════

    auto conn = std::make_unique<ipc::Connection>(opts.fd);

    if (opts.send_ready)
    {
        ipc::ReadyPayload ready;
        ready.surface_id = opts.surface_id;
        ready.role       = opts.role;
        ready.process_id = static_cast<ipc::ProcessId>(::getpid());
        ready.build      = "loom-surface/1";
        if (!send_ipc(*conn, ipc::types::READY, ipc::encode_ready(ready)))
        {
            LOOM_LOG_ERROR("agent", "{}: failed to send ready", name);
            return 1;
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Phase 3: Event loop
    // ═══════════════════════════════════════════════════════════════════════

    const auto start              = Clock::now();
    auto       last_heartbeat     = start;
    auto       heartbeat_interval = std::chrono::milliseconds(0);   // set by welcome
    int        exit_code          = 0;

    while (g_running.load(std::memory_order_relaxed))
    {
        auto now = Clock::now();

        if (opts.crash_after_ms >= 0
            && now - start >= std::chrono::milliseconds(opts.crash_after_ms))
        {
            LOOM_LOG_WARN("agent", "{}: crashing on request", name);
            std::_Exit(1);
        }

        // ── Send heartbeat ───────────────────────────────────────────────
        if (heartbeat_interval.count() > 0 && now - last_heartbeat >= heartbeat_interval)
        {
            if (!send_ipc(*conn, ipc::types::HEARTBEAT))
            {
                LOOM_LOG_ERROR("agent", "{}: lost connection to supervisor", name);
                exit_code = 1;
                break;
            }
            last_heartbeat = now;
        }

        pollfd pfd{};
        pfd.fd     = conn->fd();
        pfd.events = POLLIN;
        int ready  = ::poll(&pfd, 1, 50);
        if (ready <= 0)
            continue;

        auto result = conn->recv();
        if (result.status == ipc::RecvStatus::CodecError)
        {
            LOOM_LOG_WARN("agent", "{}: dropped frame ({})", name, ipc::codec_error_name(result.error));
            continue;
        }
        if (result.status != ipc::RecvStatus::Ok)
        {
            LOOM_LOG_ERROR("agent", "{}: channel closed by supervisor", name);
            exit_code = 1;
            break;
        }

        const auto& msg = result.message;
        LOOM_LOG_DEBUG("agent", "{}: received {} (seq {}, {} bytes)", name, msg.type, msg.seq,
                       msg.payload.size());

        if (msg.type == ipc::types::WELCOME)
        {
            auto welcome = ipc::decode_welcome(msg.payload);
            if (welcome)
                heartbeat_interval = std::chrono::milliseconds(welcome->heartbeat_ms);
            last_heartbeat = Clock::now();
            LOOM_LOG_INFO("agent", "{}: ready, heartbeat every {} ms", name,
                          static_cast<long long>(heartbeat_interval.count()));
        }
        else if (msg.type == ipc::types::GEOMETRY)
        {
            auto geometry = ipc::decode_geometry(msg.payload);
            if (!geometry)
            {
                LOOM_LOG_WARN("agent", "{}: malformed placement", name);
                continue;
            }
            LOOM_LOG_INFO("agent", "{}: placed at {},{} {}x{}", name, geometry->x, geometry->y,
                          geometry->width, geometry->height);
            if (!send_ipc(*conn, ipc::types::GEOMETRY, ipc::encode_geometry(*geometry)))
                LOOM_LOG_WARN("agent", "{}: failed to report geometry", name);
        }
        else if (msg.type == ipc::types::CLOSE)
        {
            auto close = ipc::decode_close(msg.payload);
            LOOM_LOG_INFO("agent", "{}: closing ({})", name,
                          close ? close->reason : std::string("unknown"));
            break;
        }
        else if (msg.type == ipc::types::NOTICE || msg.type == ipc::types::DIAGNOSTIC)
        {
            auto notice = ipc::decode_notice(msg.payload);
            if (notice)
                LOOM_LOG_INFO("agent", "{}: {}", name, notice->text);
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Phase 4: Clean shutdown
    // ═══════════════════════════════════════════════════════════════════════

    conn->close();
    LOOM_LOG_INFO("agent", "{}: exiting with code {}", name, exit_code);
    return exit_code;
}
