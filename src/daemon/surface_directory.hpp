#pragma once

#include "../ipc/message.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace loom::daemon
{

// Lifecycle of one surface record:
//   Requested → Starting → Ready → (Terminated | Closing → Closed)
enum class SurfaceState : uint8_t
{
    Requested,    // launch pending (first attempt or retry)
    Starting,     // process spawned, waiting for surface.ready
    Ready,        // handshake done, routing active
    Terminated,   // died while Ready; kept until the replacement is Ready
    Closing,      // draining before terminate
    Closed,
};

std::string_view surface_state_name(SurfaceState state);

// Requested and Starting surfaces accept deferred deliveries.
inline bool is_pending(SurfaceState s)
{
    return s == SurfaceState::Requested || s == SurfaceState::Starting;
}

inline bool is_live(SurfaceState s)
{
    return is_pending(s) || s == SurfaceState::Ready;
}

struct SurfaceEntry
{
    ipc::SurfaceId id    = ipc::INVALID_SURFACE;
    ipc::RoleKind  role  = ipc::RoleKind::Primary;
    SurfaceState   state = SurfaceState::Requested;
};

enum class DeliveryOutcome : uint8_t
{
    Queued,         // on the surface's outbound queue
    Staged,         // held by the update policy (coalesced or batched)
    Suppressed,     // identical to the last value sent to the role
    Deferred,       // surface not Ready yet; delivered after resync
    Backpressure,   // outbound or deferred queue full
    Skipped,        // surface not live
};

std::string_view delivery_outcome_name(DeliveryOutcome outcome);

// True if the message was accepted for delivery in some form.
inline bool accepted(DeliveryOutcome o)
{
    return o != DeliveryOutcome::Backpressure && o != DeliveryOutcome::Skipped;
}

// The router and bus see surfaces only through this interface.
class SurfaceDirectory
{
   public:
    virtual ~SurfaceDirectory() = default;

    // Every surface record the supervisor currently holds, producers excluded.
    virtual std::vector<SurfaceEntry> surfaces() const = 0;

    // Enqueue `msg` for surface `id`. Never blocks.
    virtual DeliveryOutcome deliver(ipc::SurfaceId id, const ipc::Message& msg) = 0;
};

}   // namespace loom::daemon
