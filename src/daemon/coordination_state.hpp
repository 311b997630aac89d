#pragma once

#include "../ipc/message.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace loom::daemon
{

using Clock = std::chrono::steady_clock;

// Replaceable update waiting for the next flush. A newer value overwrites
// `message` but keeps `staged_at`.
struct PendingSlot
{
    ipc::Message      message;
    Clock::time_point staged_at;
};

// High-frequency items accumulated in arrival order. `bytes` is the encoded
// size of the items as they will appear in the batch payload.
struct PendingBatch
{
    std::vector<std::vector<uint8_t>> items;
    size_t                            bytes = 0;
    Clock::time_point                 first_at;
};

// A batch that hit its size limit. Due at the next flush regardless of time.
struct SealedBatch
{
    ipc::Message      message;
    Clock::time_point sealed_at;
};

struct GeometryRecord
{
    ipc::RoleKind        role = ipc::RoleKind::Primary;
    ipc::GeometryPayload geometry;
};

// Authoritative coordination record. Owned by the supervisor and touched only
// from its control thread, so it carries no lock.
class CoordinationState
{
   public:
    // ─── Active surfaces ─────────────────────────────────────────────────
    void                        add_active(ipc::RoleKind role, ipc::SurfaceId id);
    void                        remove_active(ipc::SurfaceId id);
    std::vector<ipc::SurfaceId> active(ipc::RoleKind role) const;
    bool                        is_active(ipc::SurfaceId id) const;
    size_t                      active_count() const;

    // ─── Last-sent values (Replaceable types only) ───────────────────────
    void record_sent(ipc::RoleKind role, const ipc::Message& msg);
    bool matches_last_sent(ipc::RoleKind role, const ipc::Message& msg) const;
    const std::vector<uint8_t>* last_sent(ipc::RoleKind role, const std::string& type) const;

    // ─── Pending updates per surface ─────────────────────────────────────
    std::map<std::string, PendingSlot>&  slots(ipc::SurfaceId id) { return slots_[id]; }
    std::map<std::string, PendingBatch>& batches(ipc::SurfaceId id) { return batches_[id]; }

    std::map<ipc::SurfaceId, std::map<std::string, PendingSlot>>&  all_slots() { return slots_; }
    std::map<ipc::SurfaceId, std::map<std::string, PendingBatch>>& all_batches() { return batches_; }

    // Sealed batches per surface, in the order they were sealed.
    std::vector<SealedBatch>&                           sealed(ipc::SurfaceId id) { return sealed_[id]; }
    std::map<ipc::SurfaceId, std::vector<SealedBatch>>& all_sealed() { return sealed_; }

    // Forget everything staged for a surface that is going away.
    void drop_pending(ipc::SurfaceId id);

    // ─── Debugging ───────────────────────────────────────────────────────
    // Both return false when the set is unchanged.
    bool add_breakpoint(const ipc::Breakpoint& bp);
    bool remove_breakpoint(const ipc::Breakpoint& bp);

    const std::set<ipc::Breakpoint>& breakpoints() const { return breakpoints_; }

    void set_debug_session(std::optional<ipc::DebugSessionPayload> session)
    {
        debug_session_ = std::move(session);
    }
    const std::optional<ipc::DebugSessionPayload>& debug_session() const { return debug_session_; }

    // ─── Theme ───────────────────────────────────────────────────────────
    void                              set_theme(std::string name) { theme_ = std::move(name); }
    const std::optional<std::string>& theme() const { return theme_; }

    // ─── Geometry ────────────────────────────────────────────────────────
    void set_geometry(ipc::SurfaceId id, ipc::RoleKind role, const ipc::GeometryPayload& g);
    std::optional<ipc::GeometryPayload> geometry(ipc::SurfaceId id) const;

    // Most recent geometry reported by any instance of `role`, kept after
    // the surface closes so the layout can be saved at shutdown.
    std::optional<ipc::GeometryPayload> geometry_for_role(ipc::RoleKind role) const;

    const std::map<ipc::RoleKind, ipc::GeometryPayload>& role_geometry() const
    {
        return role_geometry_;
    }

    // Seed the geometry of a role that has no surface yet (persisted layout).
    void set_role_geometry(ipc::RoleKind role, const ipc::GeometryPayload& g) { role_geometry_[role] = g; }

    void forget_geometry(ipc::SurfaceId id) { geometry_.erase(id); }
    size_t geometry_count() const { return geometry_.size(); }

    // ─── Resync ──────────────────────────────────────────────────────────
    // Messages that bring a fresh instance of `role` up to date, built from
    // this record alone. Deterministic: theme first, then the role's known
    // geometry (never for floating), then role-specific state, then last-sent
    // values for the role in registry tag order.
    std::vector<ipc::Message> resync_set(ipc::RoleKind role) const;

   private:
    std::map<ipc::RoleKind, std::vector<ipc::SurfaceId>>                active_;
    std::map<std::pair<ipc::RoleKind, std::string>, std::vector<uint8_t>> last_sent_;

    std::map<ipc::SurfaceId, std::map<std::string, PendingSlot>>  slots_;
    std::map<ipc::SurfaceId, std::map<std::string, PendingBatch>> batches_;
    std::map<ipc::SurfaceId, std::vector<SealedBatch>>            sealed_;

    std::set<ipc::Breakpoint>               breakpoints_;
    std::optional<ipc::DebugSessionPayload> debug_session_;
    std::optional<std::string>              theme_;

    std::map<ipc::SurfaceId, GeometryRecord>      geometry_;
    std::map<ipc::RoleKind, ipc::GeometryPayload> role_geometry_;
};

}   // namespace loom::daemon
