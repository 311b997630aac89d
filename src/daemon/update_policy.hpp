#pragma once

#include "coordination_state.hpp"

#include "../ipc/message.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

namespace loom::daemon
{

enum class Disposition : uint8_t
{
    SendNow,      // Normal type; enqueue immediately
    Coalesced,    // Replaceable; staged, replaces any unsent value
    Batched,      // HighFrequency; appended to the pending batch
    Suppressed,   // Replaceable and identical to the last value sent
};

std::string_view disposition_name(Disposition d);

// A staged update whose flush time has come.
struct DueUpdate
{
    ipc::SurfaceId surface = ipc::INVALID_SURFACE;
    ipc::Message   message;
};

// A batch is flushed when `flush_interval` has passed since its first item,
// or as soon as it holds `batch_max_items` items or its encoded payload would
// grow past `batch_max_bytes`.
struct UpdateTiming
{
    std::chrono::milliseconds flush_interval{16};
    size_t                    batch_max_items = 256;
    size_t                    batch_max_bytes = ipc::MAX_PAYLOAD_SIZE;
};

// Applies the registry's update policy to outbound deliveries. Pending slots
// and batches live in CoordinationState; this class only decides and flushes.
class UpdateScheduler
{
   public:
    explicit UpdateScheduler(CoordinationState& state, UpdateTiming timing = {});

    void                set_timing(UpdateTiming timing) { timing_ = timing; }
    const UpdateTiming& timing() const { return timing_; }

    // SendNow is also returned for a high-frequency item too large to share
    // a batch; pending items of its type are sealed first so they flush ahead.
    Disposition submit(ipc::SurfaceId    surface,
                       ipc::RoleKind     role,
                       const ipc::Message& msg,
                       Clock::time_point now);

    // Staged updates that are due at `now` (all of them when `force`).
    // Sealed batches come out first, then open batches, then replaceable
    // slots for the same surface.
    std::vector<DueUpdate> collect_due(Clock::time_point now, bool force = false);

    // Everything staged for one surface, regardless of timing.
    std::vector<DueUpdate> collect_for(ipc::SurfaceId surface);

    // Earliest flush deadline among staged updates.
    std::optional<Clock::time_point> next_deadline() const;

    bool has_pending() const;

   private:
    bool batch_due(const PendingBatch& b, Clock::time_point now) const;
    bool slot_due(const PendingSlot& s, Clock::time_point now) const;

    void seal(ipc::SurfaceId surface, const std::string& type, PendingBatch&& batch,
              Clock::time_point now);

    static ipc::Message make_batch(const std::string& item_type, PendingBatch&& batch);

    CoordinationState& state_;
    UpdateTiming       timing_;
};

}   // namespace loom::daemon
