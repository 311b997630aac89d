#pragma once

#include "surface_directory.hpp"

#include "../ipc/message.hpp"

#include <functional>
#include <vector>

namespace loom::daemon
{

struct BroadcastReport
{
    size_t delivered    = 0;   // queued, staged or suppressed on a Ready surface
    size_t deferred     = 0;   // held for a surface that is not Ready yet
    size_t skipped      = 0;   // not live, or filtered out by the predicate
    size_t backpressure = 0;

    std::vector<ipc::SurfaceId> recipients;
};

using SurfacePredicate = std::function<bool(const SurfaceEntry&)>;

// One copy of a message to every live surface matching a predicate.
// Ready surfaces get it on their queue, pending ones on Ready.
class BroadcastBus
{
   public:
    explicit BroadcastBus(SurfaceDirectory& directory) : directory_(directory) {}

    BroadcastReport broadcast(const ipc::Message& msg, const SurfacePredicate& predicate = {});

    // Common predicates
    static SurfacePredicate all_except(ipc::SurfaceId id);
    static SurfacePredicate only_role(ipc::RoleKind role);

   private:
    SurfaceDirectory& directory_;
};

}   // namespace loom::daemon
