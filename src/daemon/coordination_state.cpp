#include "coordination_state.hpp"

#include "../ipc/codec.hpp"

#include <algorithm>

namespace loom::daemon
{

// ─── Active surfaces ─────────────────────────────────────────────────────────

void CoordinationState::add_active(ipc::RoleKind role, ipc::SurfaceId id)
{
    auto& ids = active_[role];
    if (std::find(ids.begin(), ids.end(), id) == ids.end())
        ids.push_back(id);
}

void CoordinationState::remove_active(ipc::SurfaceId id)
{
    for (auto it = active_.begin(); it != active_.end();)
    {
        auto& ids = it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty())
            it = active_.erase(it);
        else
            ++it;
    }
}

std::vector<ipc::SurfaceId> CoordinationState::active(ipc::RoleKind role) const
{
    auto it = active_.find(role);
    if (it == active_.end())
        return {};
    return it->second;
}

bool CoordinationState::is_active(ipc::SurfaceId id) const
{
    for (const auto& [role, ids] : active_)
    {
        if (std::find(ids.begin(), ids.end(), id) != ids.end())
            return true;
    }
    return false;
}

size_t CoordinationState::active_count() const
{
    size_t n = 0;
    for (const auto& [role, ids] : active_)
        n += ids.size();
    return n;
}

// ─── Last-sent values ────────────────────────────────────────────────────────

void CoordinationState::record_sent(ipc::RoleKind role, const ipc::Message& msg)
{
    auto* info = ipc::find_type(msg.type);
    if (!info || info->policy != ipc::UpdatePolicy::Replaceable)
        return;
    last_sent_[{role, msg.type}] = msg.payload;
}

bool CoordinationState::matches_last_sent(ipc::RoleKind role, const ipc::Message& msg) const
{
    auto* prev = last_sent(role, msg.type);
    return prev && *prev == msg.payload;
}

const std::vector<uint8_t>* CoordinationState::last_sent(ipc::RoleKind      role,
                                                         const std::string& type) const
{
    auto it = last_sent_.find({role, type});
    return it == last_sent_.end() ? nullptr : &it->second;
}

void CoordinationState::drop_pending(ipc::SurfaceId id)
{
    slots_.erase(id);
    batches_.erase(id);
    sealed_.erase(id);
}

// ─── Debugging ───────────────────────────────────────────────────────────────

bool CoordinationState::add_breakpoint(const ipc::Breakpoint& bp)
{
    return breakpoints_.insert(bp).second;
}

bool CoordinationState::remove_breakpoint(const ipc::Breakpoint& bp)
{
    return breakpoints_.erase(bp) > 0;
}

// ─── Geometry ────────────────────────────────────────────────────────────────

void CoordinationState::set_geometry(ipc::SurfaceId              id,
                                     ipc::RoleKind               role,
                                     const ipc::GeometryPayload& g)
{
    geometry_[id]        = GeometryRecord{role, g};
    role_geometry_[role] = g;
}

std::optional<ipc::GeometryPayload> CoordinationState::geometry(ipc::SurfaceId id) const
{
    auto it = geometry_.find(id);
    if (it == geometry_.end())
        return std::nullopt;
    return it->second.geometry;
}

std::optional<ipc::GeometryPayload> CoordinationState::geometry_for_role(ipc::RoleKind role) const
{
    auto it = role_geometry_.find(role);
    if (it == role_geometry_.end())
        return std::nullopt;
    return it->second;
}

// ─── Resync ──────────────────────────────────────────────────────────────────

std::vector<ipc::Message> CoordinationState::resync_set(ipc::RoleKind role) const
{
    std::vector<ipc::Message> out;

    if (theme_)
        out.push_back(ipc::make_message(std::string(ipc::types::THEME_CHANGED),
                                        ipc::encode_theme({*theme_})));

    if (role != ipc::RoleKind::Floating)
    {
        if (auto g = geometry_for_role(role))
            out.push_back(ipc::make_message(std::string(ipc::types::GEOMETRY),
                                            ipc::encode_geometry(*g)));
    }

    if (role == ipc::RoleKind::Debug)
    {
        ipc::BreakpointSetPayload set;
        set.breakpoints.assign(breakpoints_.begin(), breakpoints_.end());
        out.push_back(ipc::make_message(std::string(ipc::types::BREAKPOINTS_SET),
                                        ipc::encode_breakpoint_set(set)));

        if (debug_session_)
            out.push_back(ipc::make_message(std::string(ipc::types::SESSION_STARTED),
                                            ipc::encode_debug_session(*debug_session_)));
    }

    std::vector<std::pair<uint16_t, ipc::Message>> replay;
    for (const auto& [key, payload] : last_sent_)
    {
        if (key.first != role || key.second == ipc::types::THEME_CHANGED)
            continue;
        auto* info = ipc::find_type(key.second);
        if (!info)
            continue;
        replay.emplace_back(info->tag, ipc::make_message(key.second, payload));
    }
    std::sort(replay.begin(),
              replay.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    for (auto& [tag, msg] : replay)
        out.push_back(std::move(msg));

    return out;
}

}   // namespace loom::daemon
