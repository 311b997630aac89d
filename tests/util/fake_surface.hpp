#pragma once

// In-process stand-ins for surface processes. FakeLauncher hands the
// supervisor one end of a real socketpair per launch and keeps the other end
// in a FakeSurface that records everything the supervisor sends.

#include "daemon/process_manager.hpp"
#include "daemon/supervisor.hpp"
#include "ipc/codec.hpp"
#include "ipc/message.hpp"
#include "ipc/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace loom::test
{

class FakeSurface
{
   public:
    FakeSurface(ipc::SurfaceId id, ipc::RoleKind role, ipc::ProcessId pid,
                std::unique_ptr<ipc::Connection> conn)
        : id_(id), role_(role), pid_(pid), conn_(std::move(conn))
    {
        reader_ = std::thread([this] { read_loop(); });
    }

    ~FakeSurface() { disconnect(); }

    FakeSurface(const FakeSurface&)            = delete;
    FakeSurface& operator=(const FakeSurface&) = delete;

    ipc::SurfaceId id() const { return id_; }
    ipc::RoleKind  role() const { return role_; }
    ipc::ProcessId pid() const { return pid_; }

    bool send(ipc::Message msg)
    {
        std::lock_guard lock(send_mu_);
        if (!conn_ || !conn_->is_open() || disconnected_)
            return false;
        msg.seq = ++seq_;
        return conn_->send(msg);
    }

    bool send_ready()
    {
        ipc::ReadyPayload ready;
        ready.surface_id = id_;
        ready.role       = role_;
        ready.process_id = pid_;
        ready.build      = "fake";
        return send(ipc::make_message(std::string(ipc::types::READY), ipc::encode_ready(ready)));
    }

    // Closes the surface's end; the supervisor sees EOF.
    void disconnect()
    {
        {
            std::lock_guard lock(send_mu_);
            if (disconnected_)
                return;
            disconnected_ = true;
        }
        if (conn_)
            conn_->shutdown();
        if (reader_.joinable())
            reader_.join();
        if (conn_)
            conn_->close();
    }

    std::vector<ipc::Message> received() const
    {
        std::lock_guard lock(mu_);
        return received_;
    }

    std::vector<ipc::Message> received(std::string_view type) const
    {
        std::lock_guard           lock(mu_);
        std::vector<ipc::Message> out;
        for (const auto& m : received_)
        {
            if (m.type == type)
                out.push_back(m);
        }
        return out;
    }

    size_t count(std::string_view type) const { return received(type).size(); }

    bool channel_closed() const
    {
        std::lock_guard lock(mu_);
        return eof_;
    }

   private:
    void read_loop()
    {
        for (;;)
        {
            auto result = conn_->recv();
            if (result.status == ipc::RecvStatus::CodecError)
                continue;
            std::lock_guard lock(mu_);
            if (result.status != ipc::RecvStatus::Ok)
            {
                eof_ = true;
                return;
            }
            received_.push_back(std::move(result.message));
        }
    }

    const ipc::SurfaceId             id_;
    const ipc::RoleKind              role_;
    const ipc::ProcessId             pid_;
    std::unique_ptr<ipc::Connection> conn_;

    std::mutex    send_mu_;
    ipc::Sequence seq_          = 0;
    bool          disconnected_ = false;

    mutable std::mutex        mu_;
    std::vector<ipc::Message> received_;
    bool                      eof_ = false;

    std::thread reader_;
};

// SurfaceLauncher that never spawns anything. Exit statuses are produced by
// terminate() and crash() and come back through reap_finished().
class FakeLauncher : public daemon::SurfaceLauncher
{
   public:
    // Launches of these roles fail outright.
    std::set<ipc::RoleKind> fail_roles;
    // Surfaces of these roles never send surface.ready.
    std::set<ipc::RoleKind> silent_roles;

    daemon::LaunchResult launch(ipc::SurfaceId id, ipc::SurfaceRole role) override
    {
        std::lock_guard lock(mu_);
        ++launches_[role.kind];

        daemon::LaunchResult result;
        if (fail_roles.count(role.kind) > 0)
        {
            result.error = "launch refused";
            return result;
        }

        auto [sup_end, surface_end] = ipc::Connection::pair();
        if (!sup_end)
        {
            result.error = "socketpair failed";
            return result;
        }

        ipc::ProcessId pid = next_pid_++;
        auto surface = std::make_shared<FakeSurface>(id, role.kind, pid, std::move(surface_end));
        if (silent_roles.count(role.kind) == 0)
            surface->send_ready();

        by_pid_[pid] = surface;
        latest_[id]  = surface;

        result.pid     = pid;
        result.channel = std::move(sup_end);
        return result;
    }

    void terminate(ipc::ProcessId pid) override
    {
        std::lock_guard lock(mu_);
        auto it = by_pid_.find(pid);
        if (it == by_pid_.end() || exited_.count(pid) > 0)
            return;
        terminated_.push_back(pid);
        exited_.insert(pid);
        events_.push_back({pid, 0, SIGTERM});
    }

    std::vector<daemon::ExitEvent> reap_finished() override
    {
        std::lock_guard lock(mu_);
        std::vector<daemon::ExitEvent> out;
        out.swap(events_);
        return out;
    }

    // The surface dies: its channel closes and an abnormal exit is queued.
    void crash(ipc::ProcessId pid, int exit_code = 1)
    {
        std::shared_ptr<FakeSurface> surface;
        {
            std::lock_guard lock(mu_);
            auto it = by_pid_.find(pid);
            if (it == by_pid_.end() || exited_.count(pid) > 0)
                return;
            surface = it->second;
            exited_.insert(pid);
            events_.push_back({pid, exit_code, 0});
        }
        surface->disconnect();
    }

    std::shared_ptr<FakeSurface> surface(ipc::SurfaceId id) const
    {
        std::lock_guard lock(mu_);
        auto it = latest_.find(id);
        return it == latest_.end() ? nullptr : it->second;
    }

    int launches(ipc::RoleKind role) const
    {
        std::lock_guard lock(mu_);
        auto it = launches_.find(role);
        return it == launches_.end() ? 0 : it->second;
    }

    std::vector<ipc::ProcessId> terminated() const
    {
        std::lock_guard lock(mu_);
        return terminated_;
    }

   private:
    mutable std::mutex                                       mu_;
    ipc::ProcessId                                           next_pid_ = 1000;
    std::map<ipc::RoleKind, int>                             launches_;
    std::map<ipc::ProcessId, std::shared_ptr<FakeSurface>>   by_pid_;
    std::map<ipc::SurfaceId, std::shared_ptr<FakeSurface>>   latest_;
    std::set<ipc::ProcessId>                                 exited_;
    std::vector<ipc::ProcessId>                              terminated_;
    std::vector<daemon::ExitEvent>                           events_;
};

// Poll the supervisor until `done` holds or `timeout` passes.
inline bool pump_until(daemon::Supervisor&          sup,
                       const std::function<bool()>& done,
                       std::chrono::milliseconds    timeout = std::chrono::milliseconds(3000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        sup.poll(std::chrono::milliseconds(5));
    }
    return true;
}

// Poll for a fixed time, for messages that travel through a socket.
inline void pump_for(daemon::Supervisor& sup, std::chrono::milliseconds duration)
{
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline)
        sup.poll(std::chrono::milliseconds(5));
}

inline bool wait_for(const std::function<bool()>& done,
                     std::chrono::milliseconds    timeout = std::chrono::milliseconds(3000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

}   // namespace loom::test
