#include "message_router.hpp"

#include <loom/logger.hpp>

#include <array>
#include <utility>

namespace loom::daemon
{

namespace
{

struct Route
{
    std::string_view type;
    ipc::RoleKind    role;
};

// Static routing table: type → destination role.
constexpr std::array<Route, 14> ROUTES = {{
    {ipc::types::BREAKPOINT_ADDED, ipc::RoleKind::Debug},
    {ipc::types::BREAKPOINT_REMOVED, ipc::RoleKind::Debug},
    {ipc::types::SESSION_STARTED, ipc::RoleKind::Debug},
    {ipc::types::SESSION_ENDED, ipc::RoleKind::Debug},
    {ipc::types::DEBUG_COMMAND, ipc::RoleKind::Debug},

    {ipc::types::DEBUG_STOPPED, ipc::RoleKind::Primary},
    {ipc::types::DIAGNOSTICS, ipc::RoleKind::Primary},
    {ipc::types::GRAPH_NODE_SELECTED, ipc::RoleKind::Primary},
    {ipc::types::TERMINAL_INPUT, ipc::RoleKind::Primary},
    {ipc::types::NOTICE, ipc::RoleKind::Primary},

    {ipc::types::EDIT, ipc::RoleKind::GraphView},
    {ipc::types::CURSOR, ipc::RoleKind::GraphView},
    {ipc::types::GRAPH_RENDER, ipc::RoleKind::GraphView},

    {ipc::types::TERMINAL_OUTPUT, ipc::RoleKind::Terminal},
}};

}   // anonymous namespace

MessageRouter::MessageRouter(SurfaceDirectory& directory) : directory_(directory) {}

void MessageRouter::on(std::string_view type, MessageHandler handler)
{
    handlers_[std::string(type)] = std::move(handler);
}

void MessageRouter::remove_handler(std::string_view type)
{
    auto it = handlers_.find(type);
    if (it != handlers_.end())
        handlers_.erase(it);
}

bool MessageRouter::has_handler(std::string_view type) const
{
    return handlers_.find(type) != handlers_.end();
}

std::vector<ipc::RoleKind> MessageRouter::destinations(std::string_view type)
{
    std::vector<ipc::RoleKind> roles;
    for (const auto& route : ROUTES)
    {
        if (route.type == type)
            roles.push_back(route.role);
    }
    return roles;
}

DispatchResult MessageRouter::dispatch(ipc::SurfaceId source, const ipc::Message& msg)
{
    DispatchResult result;
    ++dispatch_count_;

    auto hit = handlers_.find(msg.type);
    if (hit != handlers_.end() && hit->second)
    {
        result.handled = true;
        if (hit->second(source, msg) == HandlerResult::Consumed)
            return result;
    }

    if (msg.target)
    {
        auto targeted    = deliver_to_role(msg.target->kind, msg, source);
        targeted.handled = result.handled;
        return targeted;
    }

    auto roles = destinations(msg.type);
    if (roles.empty())
    {
        if (!result.handled)
        {
            emit_diagnostic(source, msg, "no handler, target or route");
            result.diagnostic = true;
        }
        return result;
    }

    for (auto role : roles)
    {
        auto part = deliver_to_role(role, msg, source);
        result.deliveries += part.deliveries;
        result.backpressure += part.backpressure;
        result.recipients.insert(result.recipients.end(),
                                 part.recipients.begin(),
                                 part.recipients.end());
    }

    if (result.deliveries == 0)
        LOOM_LOG_TRACE("router", "{} from {}: no live destination", msg.type, source);
    return result;
}

DispatchResult MessageRouter::deliver_to_role(ipc::RoleKind       role,
                                              const ipc::Message& msg,
                                              ipc::SurfaceId      exclude)
{
    DispatchResult result;
    for (const auto& entry : directory_.surfaces())
    {
        if (entry.role != role || entry.id == exclude || !is_live(entry.state))
            continue;

        auto outcome = directory_.deliver(entry.id, msg);
        if (outcome == DeliveryOutcome::Backpressure)
        {
            ++result.backpressure;
            LOOM_LOG_WARN("router", "{} to surface {}: backpressure", msg.type, entry.id);
        }
        else if (accepted(outcome))
        {
            ++result.deliveries;
            result.recipients.push_back(entry.id);
        }
    }
    return result;
}

void MessageRouter::emit_diagnostic(ipc::SurfaceId      source,
                                    const ipc::Message& msg,
                                    std::string         reason)
{
    ++diagnostic_count_;
    LOOM_LOG_WARN("router", "Unroutable {} from surface {}: {}", msg.type, source, reason);
    if (diagnostic_sink_)
        diagnostic_sink_(RoutingDiagnostic{source, msg.type, std::move(reason)});
}

}   // namespace loom::daemon
