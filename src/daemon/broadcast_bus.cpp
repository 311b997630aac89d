#include "broadcast_bus.hpp"

#include <loom/logger.hpp>

namespace loom::daemon
{

BroadcastReport BroadcastBus::broadcast(const ipc::Message& msg, const SurfacePredicate& predicate)
{
    BroadcastReport report;

    for (const auto& entry : directory_.surfaces())
    {
        if (!is_live(entry.state) || (predicate && !predicate(entry)))
        {
            ++report.skipped;
            continue;
        }

        switch (directory_.deliver(entry.id, msg))
        {
            case DeliveryOutcome::Queued:
            case DeliveryOutcome::Staged:
            case DeliveryOutcome::Suppressed:
                ++report.delivered;
                report.recipients.push_back(entry.id);
                break;
            case DeliveryOutcome::Deferred:
                ++report.deferred;
                report.recipients.push_back(entry.id);
                break;
            case DeliveryOutcome::Backpressure:
                ++report.backpressure;
                LOOM_LOG_WARN("bus", "{} to surface {}: backpressure", msg.type, entry.id);
                break;
            case DeliveryOutcome::Skipped:
                ++report.skipped;
                break;
        }
    }

    LOOM_LOG_DEBUG("bus",
                   "Broadcast {}: delivered={} deferred={} skipped={}",
                   msg.type,
                   report.delivered,
                   report.deferred,
                   report.skipped);
    return report;
}

SurfacePredicate BroadcastBus::all_except(ipc::SurfaceId id)
{
    return [id](const SurfaceEntry& e) { return e.id != id; };
}

SurfacePredicate BroadcastBus::only_role(ipc::RoleKind role)
{
    return [role](const SurfaceEntry& e) { return e.role == role; };
}

}   // namespace loom::daemon
