#include "message.hpp"

#include <algorithm>

namespace loom::ipc
{

// ─── Roles ───────────────────────────────────────────────────────────────────

std::string_view role_kind_name(RoleKind kind)
{
    switch (kind)
    {
        case RoleKind::Primary:   return "primary";
        case RoleKind::Debug:     return "debug";
        case RoleKind::GraphView: return "graph-view";
        case RoleKind::Terminal:  return "terminal";
        case RoleKind::Floating:  return "floating";
    }
    return "unknown";
}

std::optional<RoleKind> role_kind_from_name(std::string_view name)
{
    if (name == "primary")
        return RoleKind::Primary;
    if (name == "debug")
        return RoleKind::Debug;
    if (name == "graph-view")
        return RoleKind::GraphView;
    if (name == "terminal")
        return RoleKind::Terminal;
    if (name == "floating")
        return RoleKind::Floating;
    return std::nullopt;
}

std::optional<RoleKind> role_kind_from_wire(uint8_t value)
{
    if (value >= ROLE_KIND_COUNT)
        return std::nullopt;
    return static_cast<RoleKind>(value);
}

// ─── Construction helpers ────────────────────────────────────────────────────

Message make_message(std::string type, std::vector<uint8_t> payload)
{
    Message msg;
    msg.type    = std::move(type);
    msg.payload = std::move(payload);
    return msg;
}

Message make_targeted(std::string type, SurfaceRole role, std::vector<uint8_t> payload)
{
    Message msg = make_message(std::move(type), std::move(payload));
    msg.target  = role;
    return msg;
}

// ─── Registry ────────────────────────────────────────────────────────────────
// Tags are part of the wire format: never renumber, only append.

namespace
{

const std::vector<MessageTypeInfo>& registry()
{
    static const std::vector<MessageTypeInfo> table = {
        // Lifecycle
        {0x0001, types::READY, UpdatePolicy::Normal, {}},
        {0x0002, types::WELCOME, UpdatePolicy::Normal, {}},
        {0x0003, types::CLOSE, UpdatePolicy::Normal, {}},
        {0x0004, types::HEARTBEAT, UpdatePolicy::Normal, {}},
        {0x0005, types::GEOMETRY, UpdatePolicy::Normal, {}},
        {0x0010, types::OPEN_REQUEST, UpdatePolicy::Normal, {}},
        {0x0011, types::CLOSE_REQUEST, UpdatePolicy::Normal, {}},

        // Supervisor
        {0x0020, types::NOTICE, UpdatePolicy::Normal, {}},
        {0x0021, types::DIAGNOSTIC, UpdatePolicy::Normal, {}},

        // Debugging
        {0x0100, types::BREAKPOINT_ADDED, UpdatePolicy::Normal, {}},
        {0x0101, types::BREAKPOINT_REMOVED, UpdatePolicy::Normal, {}},
        {0x0102, types::BREAKPOINTS_SET, UpdatePolicy::Normal, {}},
        {0x0103, types::SESSION_STARTED, UpdatePolicy::Normal, {}},
        {0x0104, types::SESSION_ENDED, UpdatePolicy::Normal, {}},
        {0x0105, types::DEBUG_COMMAND, UpdatePolicy::Normal, {}},
        {0x0106, types::DEBUG_STOPPED, UpdatePolicy::Normal, {}},

        // Editor / language
        {0x0200, types::EDIT, UpdatePolicy::HighFrequency, types::EDIT_BATCH},
        {0x0201, types::EDIT_BATCH, UpdatePolicy::Normal, {}},
        {0x0202, types::CURSOR, UpdatePolicy::Replaceable, {}},
        {0x0300, types::DIAGNOSTICS, UpdatePolicy::Replaceable, {}},

        // Graph view
        {0x0400, types::GRAPH_RENDER, UpdatePolicy::Replaceable, {}},
        {0x0401, types::GRAPH_NODE_SELECTED, UpdatePolicy::Normal, {}},

        // Terminal
        {0x0500, types::TERMINAL_OUTPUT, UpdatePolicy::HighFrequency, types::TERMINAL_OUTPUT_BATCH},
        {0x0501, types::TERMINAL_OUTPUT_BATCH, UpdatePolicy::Normal, {}},
        {0x0502, types::TERMINAL_INPUT, UpdatePolicy::Normal, {}},

        // Global UI
        {0x0600, types::THEME_CHANGED, UpdatePolicy::Replaceable, {}},
    };
    return table;
}

}   // namespace

const std::vector<MessageTypeInfo>& registered_types()
{
    return registry();
}

const MessageTypeInfo* find_type(std::string_view name)
{
    const auto& table = registry();
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const MessageTypeInfo& info) { return info.name == name; });
    return it == table.end() ? nullptr : &*it;
}

const MessageTypeInfo* find_type(uint16_t tag)
{
    const auto& table = registry();
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const MessageTypeInfo& info) { return info.tag == tag; });
    return it == table.end() ? nullptr : &*it;
}

}   // namespace loom::ipc
