#include "update_policy.hpp"

#include "../ipc/codec.hpp"

#include <loom/logger.hpp>

#include <iterator>

namespace loom::daemon
{

std::string_view disposition_name(Disposition d)
{
    switch (d)
    {
        case Disposition::SendNow:
            return "send-now";
        case Disposition::Coalesced:
            return "coalesced";
        case Disposition::Batched:
            return "batched";
        case Disposition::Suppressed:
            return "suppressed";
    }
    return "unknown";
}

UpdateScheduler::UpdateScheduler(CoordinationState& state, UpdateTiming timing)
    : state_(state), timing_(timing)
{
}

Disposition UpdateScheduler::submit(ipc::SurfaceId      surface,
                                    ipc::RoleKind       role,
                                    const ipc::Message& msg,
                                    Clock::time_point   now)
{
    auto* info = ipc::find_type(msg.type);
    if (!info)
        return Disposition::SendNow;

    switch (info->policy)
    {
        case ipc::UpdatePolicy::Normal:
            return Disposition::SendNow;

        case ipc::UpdatePolicy::Replaceable:
        {
            auto& all = state_.all_slots();
            if (state_.matches_last_sent(role, msg))
            {
                // The surface already shows this value; drop any unsent newer one
                auto sit = all.find(surface);
                if (sit != all.end())
                {
                    sit->second.erase(msg.type);
                    if (sit->second.empty())
                        all.erase(sit);
                }
                LOOM_LOG_TRACE("router", "Suppressed {} for surface {}", msg.type, surface);
                return Disposition::Suppressed;
            }
            auto& slots = all[surface];
            auto  it    = slots.find(msg.type);
            if (it != slots.end())
            {
                it->second.message = msg;
            }
            else
            {
                slots.emplace(msg.type, PendingSlot{msg, now});
            }
            return Disposition::Coalesced;
        }

        case ipc::UpdatePolicy::HighFrequency:
        {
            auto&  per_type   = state_.batches(surface);
            size_t item_bytes = ipc::BATCH_ITEM_FIELD_SIZE + msg.payload.size();

            if (ipc::BATCH_COUNT_FIELD_SIZE + item_bytes > timing_.batch_max_bytes)
            {
                if (auto it = per_type.find(msg.type); it != per_type.end())
                {
                    seal(surface, it->first, std::move(it->second), now);
                    per_type.erase(it);
                }
                if (per_type.empty())
                    state_.all_batches().erase(surface);
                LOOM_LOG_DEBUG("router",
                               "{} of {} bytes for surface {} goes unbatched",
                               msg.type,
                               msg.payload.size(),
                               surface);
                return Disposition::SendNow;
            }

            auto& batch = per_type[msg.type];
            if (!batch.items.empty()
                && ipc::BATCH_COUNT_FIELD_SIZE + batch.bytes + item_bytes > timing_.batch_max_bytes)
            {
                seal(surface, msg.type, std::move(batch), now);
                batch = PendingBatch{};
            }
            if (batch.items.empty())
                batch.first_at = now;
            batch.items.push_back(msg.payload);
            batch.bytes += item_bytes;

            if (batch.items.size() >= timing_.batch_max_items)
            {
                seal(surface, msg.type, std::move(batch), now);
                per_type.erase(msg.type);
                if (per_type.empty())
                    state_.all_batches().erase(surface);
            }
            return Disposition::Batched;
        }
    }
    return Disposition::SendNow;
}

bool UpdateScheduler::batch_due(const PendingBatch& b, Clock::time_point now) const
{
    return now - b.first_at >= timing_.flush_interval;
}

bool UpdateScheduler::slot_due(const PendingSlot& s, Clock::time_point now) const
{
    return now - s.staged_at >= timing_.flush_interval;
}

void UpdateScheduler::seal(ipc::SurfaceId      surface,
                           const std::string&  type,
                           PendingBatch&&      batch,
                           Clock::time_point   now)
{
    if (batch.items.empty())
        return;
    state_.sealed(surface).push_back({make_batch(type, std::move(batch)), now});
}

ipc::Message UpdateScheduler::make_batch(const std::string& item_type, PendingBatch&& batch)
{
    auto*             info = ipc::find_type(item_type);
    ipc::BatchPayload payload;
    payload.items = std::move(batch.items);
    return ipc::make_message(std::string(info ? info->batch_type : std::string_view{}),
                             ipc::encode_batch(payload));
}

std::vector<DueUpdate> UpdateScheduler::collect_due(Clock::time_point now, bool force)
{
    std::vector<DueUpdate> due;

    for (auto& [id, sealed] : state_.all_sealed())
    {
        for (auto& s : sealed)
            due.push_back({id, std::move(s.message)});
    }
    state_.all_sealed().clear();

    for (auto sit = state_.all_batches().begin(); sit != state_.all_batches().end();)
    {
        auto& per_type = sit->second;
        for (auto it = per_type.begin(); it != per_type.end();)
        {
            if (!force && !batch_due(it->second, now))
            {
                ++it;
                continue;
            }
            if (!it->second.items.empty())
                due.push_back({sit->first, make_batch(it->first, std::move(it->second))});
            it = per_type.erase(it);
        }
        sit = per_type.empty() ? state_.all_batches().erase(sit) : std::next(sit);
    }

    for (auto sit = state_.all_slots().begin(); sit != state_.all_slots().end();)
    {
        auto& per_type = sit->second;
        for (auto it = per_type.begin(); it != per_type.end();)
        {
            if (!force && !slot_due(it->second, now))
            {
                ++it;
                continue;
            }
            due.push_back({sit->first, std::move(it->second.message)});
            it = per_type.erase(it);
        }
        sit = per_type.empty() ? state_.all_slots().erase(sit) : std::next(sit);
    }

    return due;
}

std::vector<DueUpdate> UpdateScheduler::collect_for(ipc::SurfaceId surface)
{
    std::vector<DueUpdate> due;

    if (auto sit = state_.all_sealed().find(surface); sit != state_.all_sealed().end())
    {
        for (auto& s : sit->second)
            due.push_back({surface, std::move(s.message)});
        state_.all_sealed().erase(sit);
    }

    auto bit = state_.all_batches().find(surface);
    if (bit != state_.all_batches().end())
    {
        for (auto& [type, batch] : bit->second)
        {
            if (!batch.items.empty())
                due.push_back({surface, make_batch(type, std::move(batch))});
        }
        state_.all_batches().erase(bit);
    }

    auto sit = state_.all_slots().find(surface);
    if (sit != state_.all_slots().end())
    {
        for (auto& [type, slot] : sit->second)
            due.push_back({surface, std::move(slot.message)});
        state_.all_slots().erase(sit);
    }

    return due;
}

std::optional<Clock::time_point> UpdateScheduler::next_deadline() const
{
    std::optional<Clock::time_point> earliest;
    auto consider = [&](Clock::time_point t)
    {
        if (!earliest || t < *earliest)
            earliest = t;
    };

    for (const auto& [id, sealed] : state_.all_sealed())
    {
        for (const auto& s : sealed)
            consider(s.sealed_at);
    }
    for (const auto& [id, per_type] : state_.all_batches())
    {
        for (const auto& [type, batch] : per_type)
            consider(batch.first_at + timing_.flush_interval);
    }
    for (const auto& [id, per_type] : state_.all_slots())
    {
        for (const auto& [type, slot] : per_type)
            consider(slot.staged_at + timing_.flush_interval);
    }
    return earliest;
}

bool UpdateScheduler::has_pending() const
{
    return !state_.all_sealed().empty() || !state_.all_batches().empty()
           || !state_.all_slots().empty();
}

}   // namespace loom::daemon
