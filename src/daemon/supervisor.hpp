#pragma once

#include "broadcast_bus.hpp"
#include "control_inbox.hpp"
#include "coordination_state.hpp"
#include "layout_store.hpp"
#include "message_router.hpp"
#include "process_manager.hpp"
#include "supervisor_config.hpp"
#include "surface_directory.hpp"
#include "surface_handle.hpp"
#include "update_policy.hpp"

#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom::daemon
{

enum class SurfaceFault : uint8_t
{
    SpawnError,              // launch failed or the process died before surface.ready
    HandshakeTimeout,        // no surface.ready within the handshake timeout
    UnexpectedTermination,   // died, hung or lost its channel while Ready
};

std::string_view surface_fault_name(SurfaceFault fault);

// Supervisor-side record of one surface. Owned by the Supervisor.
struct SurfaceRecord
{
    ipc::SurfaceId   id = ipc::INVALID_SURFACE;
    ipc::SurfaceRole role;
    SurfaceState     state = SurfaceState::Requested;

    std::unique_ptr<SurfaceHandle> handle;
    ipc::ProcessId                 pid = 0;

    Clock::time_point created_at;
    Clock::time_point deadline;   // retry, handshake or drain deadline, by state
    Clock::time_point last_inbound;
    uint32_t          attempts = 0;

    ipc::SurfaceId requester = ipc::INVALID_SURFACE;   // receives creation failures
    ipc::SurfaceId replaces  = ipc::INVALID_SURFACE;   // Terminated record being recovered

    // Messages for a surface that is not Ready yet, delivered after resync.
    std::deque<ipc::Message> deferred;

    ipc::Sequence last_inbound_seq = 0;

    bool              channel_lost = false;
    Clock::time_point channel_lost_at;
};

struct StateChange
{
    ipc::SurfaceId id   = ipc::INVALID_SURFACE;
    ipc::RoleKind  role = ipc::RoleKind::Primary;
    SurfaceState   from = SurfaceState::Requested;
    SurfaceState   to   = SurfaceState::Requested;
};

// The control loop. Owns every surface record, the coordination state, the
// router and the broadcast bus. All of its methods except post() must be
// called from the control thread (the one running run()/poll()).
class Supervisor : public SurfaceDirectory
{
   public:
    using StateObserver = std::function<void(const StateChange&)>;
    using FaultObserver = std::function<void(ipc::SurfaceId, ipc::RoleKind, SurfaceFault)>;

    Supervisor(SupervisorConfig config, SurfaceLauncher& launcher);
    ~Supervisor() override;

    Supervisor(const Supervisor&)            = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Create the Primary surface. Returns its id, or INVALID_SURFACE if the
    // first launch already failed for good (the supervisor is then stopping).
    ipc::SurfaceId start();

    // Idempotent for every role except floating: returns the id of an
    // existing Requested/Starting/Ready instance. INVALID_SURFACE while
    // shutting down or if creation failed immediately.
    ipc::SurfaceId request_surface(ipc::SurfaceRole role,
                                   ipc::SurfaceId   requester = ipc::INVALID_SURFACE);

    // Close one surface. Closing Primary shuts the application down.
    // Returns false for unknown or Terminated ids.
    bool close_surface(ipc::SurfaceId id, const std::string& reason = "requested");

    // Secondaries first, then Primary; run() returns once Primary is Closed.
    void request_shutdown(int exit_code = 0);

    // Take the geometry of a persisted layout as the known geometry of each
    // role. Surfaces of those roles are sent it when they become Ready.
    void seed_layout(const LayoutStore& layout);

    // Run queued tasks (waiting up to `max_wait` or the nearest deadline),
    // then advance timers, process exits and flushes.
    void poll(std::chrono::milliseconds max_wait);

    // poll() until stopped. Returns the application exit code.
    int run();

    bool stopped() const { return stopped_; }
    bool shutting_down() const { return shutting_down_; }
    int  exit_code() const { return exit_code_; }

    // Thread-safe: run `task` on the control thread.
    void post(ControlInbox::Task task) { inbox_.post(std::move(task)); }

    // Dispatch a message as if `source` had sent it.
    DispatchResult submit(ipc::SurfaceId source, const ipc::Message& msg);

    // Deliver to one surface by id. Ids of Terminated surfaces produce a
    // diagnostic instead of a delivery.
    DeliveryOutcome send_to_surface(ipc::SurfaceId id, const ipc::Message& msg);

    // ── Content producers ────────────────────────────────────────────────
    // Producers are message sources with their own channel; they are never
    // routed to and are not part of surfaces().
    ipc::SurfaceId attach_producer(std::unique_ptr<ipc::Connection> channel);
    void           set_producer_server(ipc::Server* server) { server_ = server; }
    size_t         producer_count() const { return producers_.size(); }

    // ── SurfaceDirectory ─────────────────────────────────────────────────
    std::vector<SurfaceEntry> surfaces() const override;
    DeliveryOutcome           deliver(ipc::SurfaceId id, const ipc::Message& msg) override;

    // ── Inspection ───────────────────────────────────────────────────────
    std::optional<SurfaceState>   state_of(ipc::SurfaceId id) const;
    std::optional<ipc::SurfaceId> live_surface(ipc::RoleKind role) const;
    const SurfaceRecord*          record(ipc::SurfaceId id) const;
    SurfaceHandle*                handle(ipc::SurfaceId id);

    const CoordinationState& coordination() const { return state_; }
    MessageRouter&           router() { return router_; }
    BroadcastBus&            bus() { return bus_; }
    const SupervisorConfig&  config() const { return config_; }

    size_t recovery_count() const { return recovery_count_; }
    size_t retired_count() const { return retired_.size(); }
    size_t diagnostic_count() const { return router_.diagnostic_count() + addressed_diagnostics_; }

    // Layout of the surfaces as they are now, or as they were when shutdown
    // began once it has.
    LayoutStore layout() const;

    void set_state_observer(StateObserver obs) { state_observer_ = std::move(obs); }
    void set_fault_observer(FaultObserver obs) { fault_observer_ = std::move(obs); }

   private:
    struct ProducerRecord
    {
        ipc::SurfaceId                 id = ipc::INVALID_SURFACE;
        std::unique_ptr<SurfaceHandle> handle;
        ipc::Sequence                  last_inbound_seq = 0;
    };

    void register_handlers();

    SurfaceRecord* find(ipc::SurfaceId id);
    SurfaceRecord* find_by_pid(ipc::ProcessId pid);
    void           set_state(SurfaceRecord& rec, SurfaceState to);

    // Lifecycle
    SurfaceRecord& create_record(ipc::SurfaceRole role, ipc::SurfaceId requester);
    void           attempt_launch(SurfaceRecord& rec);
    void           launch_failed(SurfaceRecord& rec, SurfaceFault fault, const std::string& why);
    void           become_ready(SurfaceRecord& rec, const ipc::ReadyPayload& ready);
    void           unexpected_termination(SurfaceRecord& rec, const std::string& why);
    void           begin_closing(SurfaceRecord& rec, const std::string& reason);
    void           finish_closing(SurfaceRecord& rec);
    void           release(SurfaceRecord& rec);
    void           retire_replaced(SurfaceRecord& rec);
    void           retire(ipc::SurfaceId id, SurfaceState final_state);
    bool           is_being_replaced(ipc::SurfaceId id) const;

    // Events
    void on_inbound(ipc::SurfaceId id, ipc::ProcessId pid, ipc::Message msg);
    void on_channel_closed(ipc::SurfaceId id, ipc::ProcessId pid, bool framing_error);
    void on_process_exit(const ExitEvent& ev);
    void on_producer_closed(ipc::SurfaceId id);
    void check_sequence(ipc::Sequence& last, ipc::SurfaceId id, ipc::Sequence seq);

    // Timers
    void                      tick(Clock::time_point now);
    void                      advance_shutdown();
    void                      flush_updates(Clock::time_point now);
    void                      accept_producers();
    std::chrono::milliseconds next_wait(Clock::time_point now, std::chrono::milliseconds max_wait) const;

    // Outbound
    SendError send_now(SurfaceRecord& rec, const ipc::Message& msg);
    void      notify(ipc::SurfaceId target, ipc::NoticePayload::Severity severity,
                     ipc::RoleKind role, const std::string& text);
    void      send_diagnostic(ipc::SurfaceId target, const std::string& text);

    ChannelCallbacks callbacks_for(ipc::ProcessId pid);

    SupervisorConfig  config_;
    SurfaceLauncher&  launcher_;
    ControlInbox      inbox_;
    CoordinationState state_;
    UpdateScheduler   scheduler_;
    MessageRouter     router_;
    BroadcastBus      bus_;

    std::map<ipc::SurfaceId, std::unique_ptr<SurfaceRecord>>  records_;
    std::map<ipc::SurfaceId, std::unique_ptr<ProducerRecord>> producers_;
    std::map<ipc::SurfaceId, SurfaceState>                    retired_;   // final state of purged records, bounded
    ipc::Server*                                              server_ = nullptr;

    ipc::SurfaceId next_id_ = 1;

    bool                       shutting_down_ = false;
    bool                       stopped_       = false;
    int                        exit_code_     = 0;
    std::optional<LayoutStore> final_layout_;

    size_t recovery_count_        = 0;
    size_t addressed_diagnostics_ = 0;

    StateObserver state_observer_;
    FaultObserver fault_observer_;
};

}   // namespace loom::daemon
