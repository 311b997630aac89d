#include "supervisor.hpp"

#include "../ipc/codec.hpp"

#include <loom/logger.hpp>

#include <algorithm>

namespace loom::daemon
{

using namespace std::chrono_literals;

std::string_view surface_fault_name(SurfaceFault fault)
{
    switch (fault)
    {
        case SurfaceFault::SpawnError:
            return "SpawnError";
        case SurfaceFault::HandshakeTimeout:
            return "HandshakeTimeout";
        case SurfaceFault::UnexpectedTermination:
            return "UnexpectedTermination";
    }
    return "Unknown";
}

static std::string role_label(const ipc::SurfaceRole& role)
{
    return std::string(ipc::role_kind_name(role.kind));
}

Supervisor::Supervisor(SupervisorConfig config, SurfaceLauncher& launcher)
    : config_(std::move(config)),
      launcher_(launcher),
      scheduler_(state_, UpdateTiming{config_.flush_interval, config_.batch_max_items}),
      router_(*this),
      bus_(*this)
{
    router_.set_diagnostic_sink([this](const RoutingDiagnostic& d)
                                { send_diagnostic(d.source, "unroutable " + d.type + ": " + d.reason); });
    register_handlers();
}

Supervisor::~Supervisor()
{
    // Stop every reader/writer thread before the inbox they post to goes away
    for (auto& [id, producer] : producers_)
    {
        if (producer->handle)
            producer->handle->finish_close();
    }
    for (auto& [id, rec] : records_)
    {
        if (rec->handle)
            rec->handle->finish_close();
    }
    producers_.clear();
    records_.clear();
}

// ─── Handlers ────────────────────────────────────────────────────────────────

void Supervisor::register_handlers()
{
    router_.on(ipc::types::READY,
               [this](ipc::SurfaceId src, const ipc::Message& m)
               {
                   auto* rec = find(src);
                   if (!rec || rec->state != SurfaceState::Starting)
                   {
                       LOOM_LOG_WARN("supervisor", "Unexpected surface.ready from {}", src);
                       return HandlerResult::Consumed;
                   }
                   auto ready = ipc::decode_ready(m.payload);
                   if (!ready)
                   {
                       LOOM_LOG_WARN("supervisor", "Malformed surface.ready from {}", src);
                       return HandlerResult::Consumed;
                   }
                   if (ready->surface_id != rec->id || ready->role != rec->role.kind)
                   {
                       LOOM_LOG_WARN("supervisor",
                                     "surface.ready from {} claims id={} role={}",
                                     src,
                                     ready->surface_id,
                                     ipc::role_kind_name(ready->role));
                   }
                   become_ready(*rec, *ready);
                   return HandlerResult::Consumed;
               });

    // Liveness is refreshed by any inbound frame; nothing else to do
    router_.on(ipc::types::HEARTBEAT,
               [](ipc::SurfaceId, const ipc::Message&) { return HandlerResult::Consumed; });

    router_.on(ipc::types::GEOMETRY,
               [this](ipc::SurfaceId src, const ipc::Message& m)
               {
                   auto* rec = find(src);
                   auto  g   = ipc::decode_geometry(m.payload);
                   if (rec && g)
                       state_.set_geometry(src, rec->role.kind, *g);
                   else
                       LOOM_LOG_WARN("supervisor", "Ignoring surface.geometry from {}", src);
                   return HandlerResult::Consumed;
               });

    router_.on(ipc::types::OPEN_REQUEST,
               [this](ipc::SurfaceId src, const ipc::Message& m)
               {
                   auto req = ipc::decode_open_request(m.payload);
                   if (!req)
                   {
                       LOOM_LOG_WARN("supervisor", "Malformed open request from {}", src);
                       return HandlerResult::Consumed;
                   }
                   LOOM_LOG_INFO("supervisor",
                                 "Surface {} requests a {} surface",
                                 src,
                                 ipc::role_kind_name(req->role));
                   request_surface(ipc::SurfaceRole::secondary(req->role), src);
                   return HandlerResult::Consumed;
               });

    router_.on(ipc::types::CLOSE_REQUEST,
               [this](ipc::SurfaceId src, const ipc::Message& m)
               {
                   auto req = ipc::decode_close_request(m.payload);
                   if (!req)
                   {
                       LOOM_LOG_WARN("supervisor", "Malformed close request from {}", src);
                       return HandlerResult::Consumed;
                   }

                   if (req->surface_id != ipc::INVALID_SURFACE)
                   {
                       auto state = state_of(req->surface_id);
                       if (state == SurfaceState::Terminated)
                       {
                           ++addressed_diagnostics_;
                           LOOM_LOG_WARN("supervisor",
                                         "Close request for terminated surface {}",
                                         req->surface_id);
                           send_diagnostic(src,
                                           "surface " + std::to_string(req->surface_id)
                                               + " is terminated");
                       }
                       else if (!close_surface(req->surface_id))
                       {
                           send_diagnostic(src,
                                           "no surface " + std::to_string(req->surface_id));
                       }
                       return HandlerResult::Consumed;
                   }

                   if (req->role)
                   {
                       if (*req->role == ipc::RoleKind::Primary)
                       {
                           request_shutdown(0);
                           return HandlerResult::Consumed;
                       }
                       std::vector<ipc::SurfaceId> ids;
                       for (const auto& e : surfaces())
                       {
                           if (e.role == *req->role && is_live(e.state))
                               ids.push_back(e.id);
                       }
                       for (auto id : ids)
                           close_surface(id);
                   }
                   return HandlerResult::Consumed;
               });

    router_.on(ipc::types::BREAKPOINT_ADDED,
               [this](ipc::SurfaceId, const ipc::Message& m)
               {
                   if (auto bp = ipc::decode_breakpoint(m.payload))
                       state_.add_breakpoint(*bp);
                   return HandlerResult::Continue;
               });

    router_.on(ipc::types::BREAKPOINT_REMOVED,
               [this](ipc::SurfaceId, const ipc::Message& m)
               {
                   if (auto bp = ipc::decode_breakpoint(m.payload))
                       state_.remove_breakpoint(*bp);
                   return HandlerResult::Continue;
               });

    router_.on(ipc::types::SESSION_STARTED,
               [this](ipc::SurfaceId, const ipc::Message& m)
               {
                   if (auto session = ipc::decode_debug_session(m.payload))
                       state_.set_debug_session(*session);
                   return HandlerResult::Continue;
               });

    router_.on(ipc::types::SESSION_ENDED,
               [this](ipc::SurfaceId, const ipc::Message&)
               {
                   state_.set_debug_session(std::nullopt);
                   return HandlerResult::Continue;
               });

    router_.on(ipc::types::THEME_CHANGED,
               [this](ipc::SurfaceId src, const ipc::Message& m)
               {
                   auto theme = ipc::decode_theme(m.payload);
                   if (!theme)
                   {
                       LOOM_LOG_WARN("supervisor", "Malformed theme change from {}", src);
                       return HandlerResult::Consumed;
                   }
                   state_.set_theme(theme->name);
                   bus_.broadcast(m, BroadcastBus::all_except(src));
                   return HandlerResult::Consumed;
               });
}

// ─── Records ─────────────────────────────────────────────────────────────────

SurfaceRecord* Supervisor::find(ipc::SurfaceId id)
{
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second.get();
}

const SurfaceRecord* Supervisor::record(ipc::SurfaceId id) const
{
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second.get();
}

SurfaceRecord* Supervisor::find_by_pid(ipc::ProcessId pid)
{
    if (pid <= 0)
        return nullptr;
    for (auto& [id, rec] : records_)
    {
        if (rec->pid == pid)
            return rec.get();
    }
    return nullptr;
}

SurfaceHandle* Supervisor::handle(ipc::SurfaceId id)
{
    auto* rec = find(id);
    return rec ? rec->handle.get() : nullptr;
}

std::optional<SurfaceState> Supervisor::state_of(ipc::SurfaceId id) const
{
    if (auto* rec = record(id))
        return rec->state;
    auto it = retired_.find(id);
    if (it != retired_.end())
        return it->second;
    return std::nullopt;
}

std::optional<ipc::SurfaceId> Supervisor::live_surface(ipc::RoleKind role) const
{
    std::optional<ipc::SurfaceId> pending;
    for (const auto& [id, rec] : records_)
    {
        if (rec->role.kind != role)
            continue;
        if (rec->state == SurfaceState::Ready)
            return id;
        if (is_pending(rec->state) && !pending)
            pending = id;
    }
    return pending;
}

void Supervisor::set_state(SurfaceRecord& rec, SurfaceState to)
{
    StateChange change{rec.id, rec.role.kind, rec.state, to};
    if (change.from == to)
        return;
    rec.state = to;
    LOOM_LOG_DEBUG("supervisor",
                   "{} surface {}: {} -> {}",
                   role_label(rec.role),
                   rec.id,
                   surface_state_name(change.from),
                   surface_state_name(to));
    if (state_observer_)
        state_observer_(change);
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

ipc::SurfaceId Supervisor::start()
{
    LOOM_LOG_INFO("supervisor", "Starting primary surface");
    return request_surface(ipc::SurfaceRole::primary());
}

ipc::SurfaceId Supervisor::request_surface(ipc::SurfaceRole role, ipc::SurfaceId requester)
{
    if (shutting_down_)
    {
        LOOM_LOG_WARN("supervisor", "Ignoring {} request during shutdown", role_label(role));
        return ipc::INVALID_SURFACE;
    }

    if (!role.allows_multiple())
    {
        for (const auto& [id, rec] : records_)
        {
            if (rec->role == role && is_live(rec->state))
                return id;
        }
    }

    auto& rec = create_record(role, requester);
    attempt_launch(rec);
    return rec.state == SurfaceState::Closed ? ipc::INVALID_SURFACE : rec.id;
}

SurfaceRecord& Supervisor::create_record(ipc::SurfaceRole role, ipc::SurfaceId requester)
{
    auto rec        = std::make_unique<SurfaceRecord>();
    rec->id         = next_id_++;
    rec->role       = role;
    rec->requester  = requester;
    rec->created_at = Clock::now();

    auto& ref        = *rec;
    records_[ref.id] = std::move(rec);
    LOOM_LOG_DEBUG("supervisor", "{} surface {} requested", role_label(role), ref.id);
    return ref;
}

ChannelCallbacks Supervisor::callbacks_for(ipc::ProcessId pid)
{
    // Reader-thread side: hand everything to the control thread. The pid
    // tells a stale event from an earlier launch attempt apart.
    ChannelCallbacks cb;
    cb.on_message = [this, pid](ipc::SurfaceId id, ipc::Message msg)
    {
        inbox_.post([this, id, pid, msg = std::move(msg)]() mutable
                    { on_inbound(id, pid, std::move(msg)); });
    };
    cb.on_channel_closed = [this, pid](ipc::SurfaceId id, bool framing_error)
    { inbox_.post([this, id, pid, framing_error] { on_channel_closed(id, pid, framing_error); }); };
    return cb;
}

void Supervisor::attempt_launch(SurfaceRecord& rec)
{
    ++rec.attempts;
    auto result = launcher_.launch(rec.id, rec.role);
    if (!result.ok())
    {
        launch_failed(rec,
                      SurfaceFault::SpawnError,
                      result.error.empty() ? std::string("launch failed") : result.error);
        return;
    }

    rec.pid              = result.pid;
    rec.channel_lost     = false;
    rec.last_inbound_seq = 0;
    rec.handle           = std::make_unique<SurfaceHandle>(rec.id,
                                                 rec.role,
                                                 rec.pid,
                                                 std::move(result.channel),
                                                 config_.queue_capacity,
                                                 &launcher_);
    rec.handle->start(callbacks_for(rec.pid));
    rec.deadline = Clock::now() + config_.handshake_timeout;
    set_state(rec, SurfaceState::Starting);
}

void Supervisor::launch_failed(SurfaceRecord& rec, SurfaceFault fault, const std::string& why)
{
    LOOM_LOG_WARN("supervisor",
                  "{} surface {} attempt {}/{}: {} ({})",
                  role_label(rec.role),
                  rec.id,
                  rec.attempts,
                  config_.spawn_retry_budget,
                  surface_fault_name(fault),
                  why);
    if (fault_observer_)
        fault_observer_(rec.id, rec.role.kind, fault);

    release(rec);

    if (!shutting_down_ && rec.attempts < config_.spawn_retry_budget)
    {
        rec.deadline = Clock::now() + config_.spawn_retry_delay;
        set_state(rec, SurfaceState::Requested);
        return;
    }

    LOOM_LOG_ERROR("supervisor",
                   "Giving up on {} surface {} after {} attempts",
                   role_label(rec.role),
                   rec.id,
                   rec.attempts);
    if (!rec.deferred.empty())
    {
        LOOM_LOG_WARN("supervisor", "Dropping {} deferred messages", rec.deferred.size());
        rec.deferred.clear();
    }

    retire_replaced(rec);
    set_state(rec, SurfaceState::Closed);

    if (rec.role.is_primary())
    {
        LOOM_LOG_CRITICAL("supervisor", "Primary surface could not be started");
        request_shutdown(1);
        return;
    }
    if (!shutting_down_)
    {
        notify(rec.requester,
               ipc::NoticePayload::Severity::Error,
               rec.role.kind,
               "could not start " + role_label(rec.role) + " surface: "
                   + std::string(surface_fault_name(fault)));
    }
}

void Supervisor::become_ready(SurfaceRecord& rec, const ipc::ReadyPayload& ready)
{
    rec.last_inbound = Clock::now();
    rec.channel_lost = false;
    set_state(rec, SurfaceState::Ready);
    state_.add_active(rec.role.kind, rec.id);

    ipc::WelcomePayload welcome;
    welcome.surface_id   = rec.id;
    welcome.heartbeat_ms = static_cast<uint32_t>(config_.heartbeat_interval.count());
    send_now(rec, ipc::make_message(std::string(ipc::types::WELCOME), ipc::encode_welcome(welcome)));

    auto resync = state_.resync_set(rec.role.kind);
    for (const auto& msg : resync)
    {
        if (send_now(rec, msg) != SendError::None)
            LOOM_LOG_WARN("supervisor", "Resync of {} to surface {} failed", msg.type, rec.id);
    }

    auto deferred = std::move(rec.deferred);
    rec.deferred.clear();
    for (const auto& msg : deferred)
        deliver(rec.id, msg);

    LOOM_LOG_INFO("supervisor",
                  "{} surface {} ready (pid={}, build '{}', {} resync, {} deferred)",
                  role_label(rec.role),
                  rec.id,
                  rec.pid,
                  ready.build,
                  resync.size(),
                  deferred.size());

    retire_replaced(rec);
}

void Supervisor::retire_replaced(SurfaceRecord& rec)
{
    if (rec.replaces == ipc::INVALID_SURFACE)
        return;
    auto it = records_.find(rec.replaces);
    if (it != records_.end() && it->second->state == SurfaceState::Terminated)
    {
        LOOM_LOG_DEBUG("supervisor", "Retiring terminated surface {}", rec.replaces);
        records_.erase(it);
        retire(rec.replaces, SurfaceState::Terminated);
    }
    rec.replaces = ipc::INVALID_SURFACE;
}

void Supervisor::retire(ipc::SurfaceId id, SurfaceState final_state)
{
    state_.forget_geometry(id);
    retired_[id] = final_state;
    // Ids only grow, so the front of the map is the oldest
    while (retired_.size() > config_.retired_history)
        retired_.erase(retired_.begin());
}

bool Supervisor::is_being_replaced(ipc::SurfaceId id) const
{
    for (const auto& [other, rec] : records_)
    {
        if (rec->replaces == id)
            return true;
    }
    return false;
}

void Supervisor::unexpected_termination(SurfaceRecord& rec, const std::string& why)
{
    LOOM_LOG_ERROR("supervisor",
                   "UnexpectedTermination: {} surface {} (pid={}): {}",
                   role_label(rec.role),
                   rec.id,
                   rec.pid,
                   why);
    if (fault_observer_)
        fault_observer_(rec.id, rec.role.kind, SurfaceFault::UnexpectedTermination);

    state_.remove_active(rec.id);
    release(rec);
    set_state(rec, SurfaceState::Terminated);

    if (rec.role.is_primary())
    {
        LOOM_LOG_CRITICAL("supervisor", "Primary surface lost, shutting down");
        request_shutdown(1);
        return;
    }
    if (shutting_down_)
        return;

    if (config_.is_recoverable(rec.role.kind))
    {
        ++recovery_count_;
        auto  old_id = rec.id;
        auto& fresh  = create_record(rec.role, rec.requester);
        fresh.replaces = old_id;
        LOOM_LOG_INFO("supervisor",
                      "Recovering {} surface {} as {}",
                      role_label(fresh.role),
                      old_id,
                      fresh.id);
        attempt_launch(fresh);
        return;
    }

    notify(ipc::INVALID_SURFACE,
           ipc::NoticePayload::Severity::Warning,
           rec.role.kind,
           role_label(rec.role) + " surface terminated unexpectedly");
}

bool Supervisor::close_surface(ipc::SurfaceId id, const std::string& reason)
{
    auto* rec = find(id);
    if (!rec || rec->state == SurfaceState::Terminated)
        return false;
    if (rec->state == SurfaceState::Closing || rec->state == SurfaceState::Closed)
        return true;

    if (rec->role.is_primary() && !shutting_down_)
    {
        LOOM_LOG_INFO("supervisor", "Primary surface close requested, shutting down");
        request_shutdown(0);
        return true;
    }

    begin_closing(*rec, reason);
    return true;
}

void Supervisor::begin_closing(SurfaceRecord& rec, const std::string& reason)
{
    switch (rec.state)
    {
        case SurfaceState::Requested:
        case SurfaceState::Starting:
            release(rec);
            rec.deferred.clear();
            retire_replaced(rec);
            set_state(rec, SurfaceState::Closed);
            return;

        case SurfaceState::Ready:
        {
            // Staged updates go out ahead of the close so they drain with it
            for (auto& due : scheduler_.collect_for(rec.id))
                send_now(rec, due.message);

            state_.remove_active(rec.id);
            ipc::ClosePayload payload{reason};
            send_now(rec, ipc::make_message(std::string(ipc::types::CLOSE), ipc::encode_close(payload)));
            rec.handle->begin_close();
            rec.deadline = Clock::now() + config_.drain_timeout;
            set_state(rec, SurfaceState::Closing);
            LOOM_LOG_INFO("supervisor", "Closing {} surface {} ({})", role_label(rec.role), rec.id, reason);
            return;
        }

        case SurfaceState::Terminated:
        case SurfaceState::Closing:
        case SurfaceState::Closed:
            return;
    }
}

void Supervisor::finish_closing(SurfaceRecord& rec)
{
    release(rec);
    set_state(rec, SurfaceState::Closed);
    LOOM_LOG_INFO("supervisor", "{} surface {} closed", role_label(rec.role), rec.id);
}

void Supervisor::release(SurfaceRecord& rec)
{
    if (rec.handle)
    {
        rec.handle->finish_close();
        rec.handle.reset();
    }
    state_.drop_pending(rec.id);
}

void Supervisor::request_shutdown(int exit_code)
{
    if (exit_code != 0 && exit_code_ == 0)
        exit_code_ = exit_code;
    if (shutting_down_)
        return;

    final_layout_  = layout();
    shutting_down_ = true;
    LOOM_LOG_INFO("supervisor", "Shutting down (exit code {})", exit_code_);

    std::vector<ipc::SurfaceId> ids;
    for (const auto& [id, rec] : records_)
    {
        if (!rec->role.is_primary() && is_live(rec->state))
            ids.push_back(id);
    }
    for (auto id : ids)
    {
        if (auto* rec = find(id))
            begin_closing(*rec, "shutdown");
    }
}

// ─── Control loop ────────────────────────────────────────────────────────────

void Supervisor::poll(std::chrono::milliseconds max_wait)
{
    inbox_.wait_and_drain(next_wait(Clock::now(), max_wait));
    tick(Clock::now());
}

int Supervisor::run()
{
    while (!stopped_)
        poll(100ms);
    return exit_code_;
}

std::chrono::milliseconds Supervisor::next_wait(Clock::time_point          now,
                                                std::chrono::milliseconds max_wait) const
{
    auto wait     = std::min(max_wait, config_.reap_interval);
    auto consider = [&](Clock::time_point t)
    {
        auto d = std::chrono::duration_cast<std::chrono::milliseconds>(t - now);
        if (d < wait)
            wait = std::max(d, std::chrono::milliseconds(0));
    };

    for (const auto& [id, rec] : records_)
    {
        switch (rec->state)
        {
            case SurfaceState::Requested:
            case SurfaceState::Starting:
            case SurfaceState::Closing:
                consider(rec->deadline);
                break;
            case SurfaceState::Ready:
                if (rec->channel_lost)
                    consider(rec->channel_lost_at + config_.exit_grace);
                else if (config_.heartbeat_timeout.count() > 0)
                    consider(rec->last_inbound + config_.heartbeat_timeout);
                break;
            default:
                break;
        }
    }
    if (auto t = scheduler_.next_deadline())
        consider(*t);
    return wait;
}

void Supervisor::tick(Clock::time_point now)
{
    // Closed records go one tick after they closed, so inbound messages
    // posted before the close are still dispatched with their record.
    // Terminated secondaries with no replacement on the way go too; their
    // retired state keeps diagnosing messages addressed to them.
    for (auto it = records_.begin(); it != records_.end();)
    {
        const auto& rec   = *it->second;
        bool        purge = rec.state == SurfaceState::Closed
                     || (rec.state == SurfaceState::Terminated && !rec.role.is_primary()
                         && !is_being_replaced(rec.id));
        if (!purge)
        {
            ++it;
            continue;
        }
        auto id          = it->first;
        auto final_state = rec.state;
        it               = records_.erase(it);
        retire(id, final_state);
    }

    for (const auto& ev : launcher_.reap_finished())
        on_process_exit(ev);

    std::vector<ipc::SurfaceId> ids;
    ids.reserve(records_.size());
    for (const auto& [id, rec] : records_)
        ids.push_back(id);

    for (auto id : ids)
    {
        auto* rec = find(id);
        if (!rec)
            continue;

        switch (rec->state)
        {
            case SurfaceState::Requested:
                if (now >= rec->deadline)
                    attempt_launch(*rec);
                break;

            case SurfaceState::Starting:
                if (now >= rec->deadline)
                    launch_failed(*rec,
                                  SurfaceFault::HandshakeTimeout,
                                  "no surface.ready within "
                                      + std::to_string(config_.handshake_timeout.count()) + " ms");
                break;

            case SurfaceState::Ready:
                if (rec->channel_lost)
                {
                    if (now - rec->channel_lost_at >= config_.exit_grace)
                        unexpected_termination(*rec, "channel lost without exit status");
                }
                else if (config_.heartbeat_timeout.count() > 0
                         && now - rec->last_inbound > config_.heartbeat_timeout)
                {
                    unexpected_termination(*rec,
                                           "hung: silent for more than "
                                               + std::to_string(config_.heartbeat_timeout.count())
                                               + " ms");
                }
                break;

            case SurfaceState::Closing:
                if (!rec->handle || rec->handle->drained() || now >= rec->deadline)
                    finish_closing(*rec);
                break;

            case SurfaceState::Terminated:
            case SurfaceState::Closed:
                break;
        }
    }

    flush_updates(now);
    accept_producers();

    if (shutting_down_ && !stopped_)
        advance_shutdown();
}

void Supervisor::advance_shutdown()
{
    SurfaceRecord* primary = nullptr;
    for (auto& [id, rec] : records_)
    {
        if (rec->role.is_primary())
        {
            if (rec->state != SurfaceState::Closed && rec->state != SurfaceState::Terminated)
                primary = rec.get();
            continue;
        }
        if (is_live(rec->state) || rec->state == SurfaceState::Closing)
            return;   // secondaries first
    }

    if (primary)
    {
        if (primary->state != SurfaceState::Closing)
            begin_closing(*primary, "shutdown");
        if (primary->state == SurfaceState::Closing)
            return;
    }

    stopped_ = true;
    LOOM_LOG_INFO("supervisor", "All surfaces closed, exit code {}", exit_code_);
}

void Supervisor::flush_updates(Clock::time_point now)
{
    for (auto& due : scheduler_.collect_due(now))
    {
        auto* rec = find(due.surface);
        if (!rec || rec->state != SurfaceState::Ready)
            continue;
        auto err = send_now(*rec, due.message);
        if (err != SendError::None)
            LOOM_LOG_WARN("supervisor",
                          "Flush of {} to surface {} failed: {}",
                          due.message.type,
                          due.surface,
                          send_error_name(err));
    }
}

void Supervisor::accept_producers()
{
    if (!server_)
        return;
    while (auto conn = server_->try_accept())
        attach_producer(std::move(conn));
}

// ─── Events ──────────────────────────────────────────────────────────────────

void Supervisor::check_sequence(ipc::Sequence& last, ipc::SurfaceId id, ipc::Sequence seq)
{
    if (last != 0 && seq != last + 1)
    {
        LOOM_LOG_WARN("supervisor",
                      "Surface {}: sequence {} after {} ({})",
                      id,
                      seq,
                      last,
                      seq <= last ? "reordered" : "gap");
    }
    if (seq > last)
        last = seq;
}

void Supervisor::on_inbound(ipc::SurfaceId id, ipc::ProcessId pid, ipc::Message msg)
{
    if (auto pit = producers_.find(id); pit != producers_.end())
    {
        check_sequence(pit->second->last_inbound_seq, id, msg.seq);
        router_.dispatch(id, msg);
        return;
    }

    auto* rec = find(id);
    if (!rec || rec->pid != pid)
    {
        LOOM_LOG_DEBUG("supervisor", "Dropping {} from stale channel of surface {}", msg.type, id);
        return;
    }

    rec->last_inbound = Clock::now();
    check_sequence(rec->last_inbound_seq, id, msg.seq);
    router_.dispatch(id, msg);
}

void Supervisor::on_channel_closed(ipc::SurfaceId id, ipc::ProcessId pid, bool framing_error)
{
    auto* rec = find(id);
    if (!rec || rec->pid != pid)
        return;

    switch (rec->state)
    {
        case SurfaceState::Starting:
            launch_failed(*rec, SurfaceFault::SpawnError, "channel closed before surface.ready");
            break;

        case SurfaceState::Ready:
            if (framing_error)
            {
                unexpected_termination(*rec, "framing error on channel");
                break;
            }
            // Wait for the exit status to tell a crash from a clean exit
            rec->channel_lost    = true;
            rec->channel_lost_at = Clock::now();
            if (rec->handle)
                rec->handle->set_alive(false);
            break;

        case SurfaceState::Closing:
            finish_closing(*rec);
            break;

        default:
            break;
    }
}

void Supervisor::on_process_exit(const ExitEvent& ev)
{
    auto* rec = find_by_pid(ev.pid);
    if (!rec)
    {
        LOOM_LOG_DEBUG("supervisor", "Reaped untracked pid={}", ev.pid);
        return;
    }

    std::string status = ev.signal != 0 ? "signal " + std::to_string(ev.signal)
                                        : "exit code " + std::to_string(ev.exit_code);
    if (rec->handle)
        rec->handle->set_alive(false);

    switch (rec->state)
    {
        case SurfaceState::Starting:
            launch_failed(*rec, SurfaceFault::SpawnError, "exited before surface.ready (" + status + ")");
            break;

        case SurfaceState::Ready:
            if (ev.abnormal())
            {
                unexpected_termination(*rec, status);
                break;
            }
            LOOM_LOG_INFO("supervisor", "{} surface {} exited cleanly", role_label(rec->role), rec->id);
            state_.remove_active(rec->id);
            release(*rec);
            set_state(*rec, SurfaceState::Closed);
            if (rec->role.is_primary())
                request_shutdown(0);
            break;

        case SurfaceState::Closing:
            finish_closing(*rec);
            break;

        default:
            break;
    }
}

// ─── Producers ───────────────────────────────────────────────────────────────

ipc::SurfaceId Supervisor::attach_producer(std::unique_ptr<ipc::Connection> channel)
{
    auto producer = std::make_unique<ProducerRecord>();
    producer->id  = next_id_++;
    auto id       = producer->id;

    producer->handle = std::make_unique<SurfaceHandle>(id,
                                                       ipc::SurfaceRole{},
                                                       0,
                                                       std::move(channel),
                                                       config_.queue_capacity);
    ChannelCallbacks cb;
    cb.on_message = [this](ipc::SurfaceId src, ipc::Message msg)
    {
        inbox_.post([this, src, msg = std::move(msg)]() mutable { on_inbound(src, 0, std::move(msg)); });
    };
    cb.on_channel_closed = [this](ipc::SurfaceId src, bool)
    { inbox_.post([this, src] { on_producer_closed(src); }); };
    producer->handle->start(std::move(cb));

    producers_[id] = std::move(producer);
    LOOM_LOG_INFO("supervisor", "Producer {} connected", id);
    return id;
}

void Supervisor::on_producer_closed(ipc::SurfaceId id)
{
    auto it = producers_.find(id);
    if (it == producers_.end())
        return;
    it->second->handle->finish_close();
    producers_.erase(it);
    LOOM_LOG_INFO("supervisor", "Producer {} disconnected", id);
}

// ─── Delivery ────────────────────────────────────────────────────────────────

std::vector<SurfaceEntry> Supervisor::surfaces() const
{
    std::vector<SurfaceEntry> out;
    out.reserve(records_.size());
    for (const auto& [id, rec] : records_)
        out.push_back({id, rec->role.kind, rec->state});
    return out;
}

DeliveryOutcome Supervisor::deliver(ipc::SurfaceId id, const ipc::Message& msg)
{
    auto* rec = find(id);
    if (!rec || !is_live(rec->state))
        return DeliveryOutcome::Skipped;

    if (is_pending(rec->state))
    {
        if (rec->deferred.size() >= config_.deferred_capacity)
        {
            LOOM_LOG_WARN("supervisor", "Deferred queue of surface {} full, refusing {}", id, msg.type);
            return DeliveryOutcome::Backpressure;
        }
        rec->deferred.push_back(msg);
        return DeliveryOutcome::Deferred;
    }

    switch (scheduler_.submit(id, rec->role.kind, msg, Clock::now()))
    {
        case Disposition::Coalesced:
        case Disposition::Batched:
            return DeliveryOutcome::Staged;
        case Disposition::Suppressed:
            return DeliveryOutcome::Suppressed;
        case Disposition::SendNow:
            break;
    }

    // Anything staged earlier for this surface goes first, keeping FIFO
    for (auto& due : scheduler_.collect_for(id))
    {
        auto err = send_now(*rec, due.message);
        if (err != SendError::None)
            LOOM_LOG_WARN("supervisor",
                          "Flush of {} to surface {} failed: {}",
                          due.message.type,
                          id,
                          send_error_name(err));
    }

    switch (send_now(*rec, msg))
    {
        case SendError::None:
            return DeliveryOutcome::Queued;
        case SendError::Backpressure:
            return DeliveryOutcome::Backpressure;
        case SendError::Unencodable:
            LOOM_LOG_ERROR("supervisor", "Cannot encode {} for surface {}", msg.type, id);
            return DeliveryOutcome::Skipped;
        case SendError::Closed:
            return DeliveryOutcome::Skipped;
    }
    return DeliveryOutcome::Skipped;
}

DeliveryOutcome Supervisor::send_to_surface(ipc::SurfaceId id, const ipc::Message& msg)
{
    if (state_of(id) == SurfaceState::Terminated)
    {
        ++addressed_diagnostics_;
        LOOM_LOG_WARN("supervisor", "{} addressed to terminated surface {}", msg.type, id);
        return DeliveryOutcome::Skipped;
    }
    return deliver(id, msg);
}

DispatchResult Supervisor::submit(ipc::SurfaceId source, const ipc::Message& msg)
{
    return router_.dispatch(source, msg);
}

SendError Supervisor::send_now(SurfaceRecord& rec, const ipc::Message& msg)
{
    if (!rec.handle)
        return SendError::Closed;
    auto err = rec.handle->send(msg);
    if (err == SendError::None)
        state_.record_sent(rec.role.kind, msg);
    return err;
}

void Supervisor::notify(ipc::SurfaceId                target,
                        ipc::NoticePayload::Severity  severity,
                        ipc::RoleKind                 role,
                        const std::string&            text)
{
    if (target == ipc::INVALID_SURFACE)
    {
        auto primary = live_surface(ipc::RoleKind::Primary);
        if (!primary)
        {
            LOOM_LOG_WARN("supervisor", "Notice dropped, no primary surface: {}", text);
            return;
        }
        target = *primary;
    }

    ipc::NoticePayload notice;
    notice.severity = severity;
    notice.role     = role;
    notice.text     = text;
    auto msg        = ipc::make_message(std::string(ipc::types::NOTICE), ipc::encode_notice(notice));

    if (auto pit = producers_.find(target); pit != producers_.end())
    {
        auto err = pit->second->handle->send(msg);
        if (err != SendError::None)
            LOOM_LOG_WARN("supervisor", "Notice to producer {} failed: {}", target, send_error_name(err));
        return;
    }

    auto outcome = deliver(target, msg);
    if (!accepted(outcome))
        LOOM_LOG_WARN("supervisor",
                      "Notice to surface {} not delivered ({}): {}",
                      target,
                      delivery_outcome_name(outcome),
                      text);
}

void Supervisor::send_diagnostic(ipc::SurfaceId target, const std::string& text)
{
    if (target == ipc::INVALID_SURFACE)
        return;

    ipc::NoticePayload notice;
    notice.severity = ipc::NoticePayload::Severity::Warning;
    notice.text     = text;
    if (auto* rec = find(target))
        notice.role = rec->role.kind;
    auto msg = ipc::make_message(std::string(ipc::types::DIAGNOSTIC), ipc::encode_notice(notice));

    if (auto pit = producers_.find(target); pit != producers_.end())
    {
        if (pit->second->handle->send(msg) != SendError::None)
            LOOM_LOG_DEBUG("supervisor", "Diagnostic to producer {} dropped", target);
        return;
    }
    if (!accepted(deliver(target, msg)))
        LOOM_LOG_DEBUG("supervisor", "Diagnostic to surface {} dropped", target);
}

// ─── Layout ──────────────────────────────────────────────────────────────────

void Supervisor::seed_layout(const LayoutStore& layout)
{
    for (const auto& entry : layout.entries())
    {
        if (entry.role == ipc::RoleKind::Floating)
            continue;
        state_.set_role_geometry(entry.role, entry.geometry);
    }
}

LayoutStore Supervisor::layout() const
{
    if (final_layout_)
        return *final_layout_;

    LayoutStore store;
    for (const auto& [role, geometry] : state_.role_geometry())
    {
        if (role == ipc::RoleKind::Floating)
            continue;
        auto g    = geometry;
        g.visible = g.visible && live_surface(role).has_value();
        store.set(role, g);
    }
    // Live surfaces that never reported geometry still reopen next time
    for (const auto& [id, rec] : records_)
    {
        if (rec->role.kind == ipc::RoleKind::Floating || !is_live(rec->state))
            continue;
        if (!store.get(rec->role.kind))
            store.set(rec->role.kind, ipc::GeometryPayload{});
    }
    return store;
}

}   // namespace loom::daemon
