#include "process_manager.hpp"

#include <loom/logger.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace loom::daemon
{

ProcessManager::~ProcessManager()
{
    // Never leave children behind: a supervisor that goes away takes its
    // surfaces with it.
    std::lock_guard lock(mu_);
    for (auto& [pid, entry] : processes_)
    {
        ::kill(static_cast<pid_t>(pid), SIGKILL);
        int status = 0;
        ::waitpid(static_cast<pid_t>(pid), &status, 0);
    }
    processes_.clear();
}

LaunchResult ProcessManager::launch(ipc::SurfaceId id, ipc::SurfaceRole role)
{
    std::lock_guard lock(mu_);
    LaunchResult    result;

    if (surface_path_.empty())
    {
        result.error = "surface binary path not set";
        return result;
    }

    auto [parent_end, child_end] = ipc::Connection::pair();
    if (!parent_end || !child_end)
    {
        result.error = std::string("socketpair failed: ") + std::strerror(errno);
        return result;
    }

    // dup2 onto the same fd is a no-op and would keep FD_CLOEXEC set
    int source_fd = child_end->fd();
    if (source_fd == CHANNEL_FD)
    {
        int moved = ::fcntl(source_fd, F_DUPFD_CLOEXEC, CHANNEL_FD + 1);
        if (moved < 0)
        {
            result.error = std::string("fcntl failed: ") + std::strerror(errno);
            return result;
        }
        child_end = std::make_unique<ipc::Connection>(moved);
        source_fd = moved;
    }

    std::string id_arg   = std::to_string(id);
    std::string fd_arg   = std::to_string(CHANNEL_FD);
    std::string role_arg = std::string(ipc::role_kind_name(role.kind));

    std::vector<const char*> argv = {surface_path_.c_str(),
                                     "--fd",
                                     fd_arg.c_str(),
                                     "--surface-id",
                                     id_arg.c_str(),
                                     "--role",
                                     role_arg.c_str()};
    for (const auto& extra : extra_args_)
        argv.push_back(extra.c_str());
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, source_fd, CHANNEL_FD);

    pid_t pid = 0;
    int   ret = posix_spawnp(&pid,
                          surface_path_.c_str(),
                          &actions,
                          nullptr,
                          const_cast<char* const*>(argv.data()),
                          environ);
    posix_spawn_file_actions_destroy(&actions);

    // The child holds its own copy now
    child_end->close();

    if (ret != 0)
    {
        result.error = std::string("posix_spawn failed: ") + std::strerror(ret);
        LOOM_LOG_ERROR("process", "Spawn of {} for surface {} failed: {}",
                       surface_path_, id, std::strerror(ret));
        return result;
    }

    ProcessEntry entry;
    entry.pid        = pid;
    entry.surface_id = id;
    entry.role       = role.kind;
    processes_[pid]  = entry;

    LOOM_LOG_INFO("process", "Spawned surface {} ({}) pid={}", id, role_arg, pid);

    result.pid     = pid;
    result.channel = std::move(parent_end);
    return result;
}

void ProcessManager::terminate(ipc::ProcessId pid)
{
    std::lock_guard lock(mu_);
    auto            it = processes_.find(pid);
    if (it == processes_.end() || it->second.terminating)
        return;

    ::kill(static_cast<pid_t>(pid), SIGTERM);
    it->second.terminating    = true;
    it->second.terminate_sent = std::chrono::steady_clock::now();
    LOOM_LOG_DEBUG("process", "Sent SIGTERM to pid={}", pid);
}

std::vector<ExitEvent> ProcessManager::reap_finished()
{
    std::lock_guard        lock(mu_);
    std::vector<ExitEvent> reaped;
    auto                   now = std::chrono::steady_clock::now();

    for (auto it = processes_.begin(); it != processes_.end();)
    {
        int   status = 0;
        pid_t result = ::waitpid(static_cast<pid_t>(it->first), &status, WNOHANG);
        if (result > 0 || (result < 0 && errno == ECHILD))
        {
            ExitEvent ev;
            ev.pid = it->first;
            if (result > 0 && WIFEXITED(status))
                ev.exit_code = WEXITSTATUS(status);
            else if (result > 0 && WIFSIGNALED(status))
                ev.signal = WTERMSIG(status);
            else
                ev.exit_code = -1;   // reaped elsewhere, status unknown

            LOOM_LOG_DEBUG("process", "Reaped pid={} exit_code={} signal={}",
                           ev.pid, ev.exit_code, ev.signal);
            reaped.push_back(ev);
            it = processes_.erase(it);
            continue;
        }

        if (it->second.terminating && now - it->second.terminate_sent > kill_grace_)
        {
            LOOM_LOG_WARN("process", "pid={} ignored SIGTERM, sending SIGKILL", it->first);
            ::kill(static_cast<pid_t>(it->first), SIGKILL);
            it->second.terminate_sent = now;
        }
        ++it;
    }
    return reaped;
}

size_t ProcessManager::process_count() const
{
    std::lock_guard lock(mu_);
    return processes_.size();
}

std::vector<ProcessEntry> ProcessManager::all_processes() const
{
    std::lock_guard           lock(mu_);
    std::vector<ProcessEntry> result;
    result.reserve(processes_.size());
    for (auto& [_, entry] : processes_)
        result.push_back(entry);
    return result;
}

ipc::ProcessId ProcessManager::pid_for_surface(ipc::SurfaceId id) const
{
    std::lock_guard lock(mu_);
    for (auto& [pid, entry] : processes_)
    {
        if (entry.surface_id == id)
            return pid;
    }
    return 0;
}

std::string resolve_surface_path(const char* argv0)
{
    // Try sibling path: same directory as this binary
    std::string self(argv0 ? argv0 : "");
    auto        slash = self.rfind('/');
    if (slash != std::string::npos)
    {
        std::string candidate = self.substr(0, slash + 1) + "loom-surface";
        if (::access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    // Fallback: assume it's on PATH
    return "loom-surface";
}

}   // namespace loom::daemon
