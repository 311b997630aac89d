#pragma once

#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom::daemon
{

// Result of starting one surface process.
struct LaunchResult
{
    ipc::ProcessId                   pid = 0;
    std::unique_ptr<ipc::Connection> channel;   // supervisor's end of the surface channel
    std::string                      error;

    bool ok() const { return pid > 0 && channel != nullptr; }
};

// A surface process that has exited and been reaped.
struct ExitEvent
{
    ipc::ProcessId pid       = 0;
    int            exit_code = 0;
    int            signal    = 0;   // non-zero if killed by a signal

    bool abnormal() const { return signal != 0 || exit_code != 0; }
};

// Starts, stops and reaps surface processes. The supervisor only talks to
// this interface; tests substitute an in-process implementation.
class SurfaceLauncher
{
   public:
    virtual ~SurfaceLauncher() = default;

    // Start a surface for `role` and hand back its channel. Must not block
    // beyond the spawn itself.
    virtual LaunchResult launch(ipc::SurfaceId id, ipc::SurfaceRole role) = 0;

    // Ask the process to exit. Escalation is the launcher's business.
    virtual void terminate(ipc::ProcessId pid) = 0;

    // Non-blocking: collect processes that exited since the last call.
    virtual std::vector<ExitEvent> reap_finished() = 0;
};

// Tracks a spawned surface process.
struct ProcessEntry
{
    ipc::ProcessId   pid        = 0;
    ipc::SurfaceId   surface_id = ipc::INVALID_SURFACE;
    ipc::RoleKind    role       = ipc::RoleKind::Primary;
    bool             terminating = false;
    std::chrono::steady_clock::time_point terminate_sent;
};

// Spawns `loom-surface` processes with posix_spawn and a socketpair channel
// on a fixed fd. Thread-safe: all public methods lock the internal mutex.
class ProcessManager : public SurfaceLauncher
{
   public:
    // fd number the surface end of the channel is placed on in the child.
    static constexpr int CHANNEL_FD = 3;

    ProcessManager() = default;
    ~ProcessManager() override;

    ProcessManager(const ProcessManager&)            = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    // Set the path to the surface binary.
    void set_surface_path(const std::string& path) { surface_path_ = path; }
    const std::string& surface_path() const { return surface_path_; }

    // Extra arguments appended to every launch (e.g. --log-level debug).
    void set_extra_args(std::vector<std::string> args) { extra_args_ = std::move(args); }

    // After terminate(), SIGKILL follows if the process is still around after this long.
    void set_kill_grace(std::chrono::milliseconds grace) { kill_grace_ = grace; }

    // The surface is launched with:
    //   loom-surface --fd 3 --surface-id <id> --role <kind> [extra args]
    LaunchResult launch(ipc::SurfaceId id, ipc::SurfaceRole role) override;

    // SIGTERM now, SIGKILL from reap_finished() once the grace period is over.
    void terminate(ipc::ProcessId pid) override;

    // Reap any finished child processes (waitpid WNOHANG).
    std::vector<ExitEvent> reap_finished() override;

    // Get the number of tracked processes.
    size_t process_count() const;

    // Get all tracked process entries.
    std::vector<ProcessEntry> all_processes() const;

    // Find PID by surface ID. Returns 0 if not found.
    ipc::ProcessId pid_for_surface(ipc::SurfaceId id) const;

   private:
    mutable std::mutex                                  mu_;
    std::string                                         surface_path_;
    std::vector<std::string>                            extra_args_;
    std::chrono::milliseconds                           kill_grace_{2000};
    std::unordered_map<ipc::ProcessId, ProcessEntry>    processes_;
};

// Resolve the path to the loom-surface binary.
// Looks next to `argv0` first, then falls back to PATH.
std::string resolve_surface_path(const char* argv0);

}   // namespace loom::daemon
