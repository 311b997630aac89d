#include "surface_directory.hpp"

namespace loom::daemon
{

std::string_view surface_state_name(SurfaceState state)
{
    switch (state)
    {
        case SurfaceState::Requested:
            return "Requested";
        case SurfaceState::Starting:
            return "Starting";
        case SurfaceState::Ready:
            return "Ready";
        case SurfaceState::Terminated:
            return "Terminated";
        case SurfaceState::Closing:
            return "Closing";
        case SurfaceState::Closed:
            return "Closed";
    }
    return "Unknown";
}

std::string_view delivery_outcome_name(DeliveryOutcome outcome)
{
    switch (outcome)
    {
        case DeliveryOutcome::Queued:
            return "queued";
        case DeliveryOutcome::Staged:
            return "staged";
        case DeliveryOutcome::Suppressed:
            return "suppressed";
        case DeliveryOutcome::Deferred:
            return "deferred";
        case DeliveryOutcome::Backpressure:
            return "backpressure";
        case DeliveryOutcome::Skipped:
            return "skipped";
    }
    return "unknown";
}

}   // namespace loom::daemon
