#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using SurfaceId = uint64_t;
using ProcessId = int64_t;
using Sequence  = uint64_t;

static constexpr SurfaceId INVALID_SURFACE = 0;

// ─── Surface roles ───────────────────────────────────────────────────────────
// Primary | Secondary(kind). The numeric values are part of the wire format.
enum class RoleKind : uint8_t
{
    Primary   = 0,
    Debug     = 1,
    GraphView = 2,
    Terminal  = 3,
    Floating  = 4,
};

static constexpr size_t ROLE_KIND_COUNT = 5;

struct SurfaceRole
{
    RoleKind kind = RoleKind::Primary;

    static constexpr SurfaceRole primary() { return {RoleKind::Primary}; }
    static constexpr SurfaceRole secondary(RoleKind k) { return {k}; }

    bool is_primary() const { return kind == RoleKind::Primary; }

    // Only floating surfaces may have several live instances at once.
    bool allows_multiple() const { return kind == RoleKind::Floating; }

    bool operator==(const SurfaceRole&) const = default;
};

// "primary", "debug", "graph-view", "terminal", "floating"
std::string_view role_kind_name(RoleKind kind);
std::optional<RoleKind> role_kind_from_name(std::string_view name);
std::optional<RoleKind> role_kind_from_wire(uint8_t value);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 20 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x4C, 0x4D = "LM")
//   byte  2:     format version
//   byte  3:     flags (bit 0 = target role present)
//   bytes 4-5:   message type tag (uint16_t LE)
//   byte  6:     target role kind
//   byte  7:     reserved (0)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-19: payload length (uint32_t LE)
//
// Magic, version and payload length keep these offsets in every version so a
// reader can always skip a frame it cannot decode.

static constexpr uint8_t MAGIC_0          = 0x4C;   // 'L'
static constexpr uint8_t MAGIC_1          = 0x4D;   // 'M'
static constexpr uint8_t WIRE_VERSION     = 1;
static constexpr size_t  HEADER_SIZE      = 20;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;   // 16 MiB

static constexpr uint8_t FLAG_HAS_TARGET = 0x01;

struct Message
{
    std::string                type;
    std::optional<SurfaceRole> target;
    std::vector<uint8_t>       payload;
    Sequence                   seq = 0;

    bool operator==(const Message&) const = default;
};

// Builds a message with no explicit target (routed by the static table).
Message make_message(std::string type, std::vector<uint8_t> payload = {});

// Builds a message addressed to every live surface of `role`.
Message make_targeted(std::string type, SurfaceRole role, std::vector<uint8_t> payload = {});

// ─── Message type registry ───────────────────────────────────────────────────

enum class UpdatePolicy : uint8_t
{
    Normal,          // delivered as-is
    Replaceable,     // coalesced per (surface, type); latest value wins
    HighFrequency,   // accumulated and flushed as one batch message
};

struct MessageTypeInfo
{
    uint16_t         tag;
    std::string_view name;
    UpdatePolicy     policy;
    std::string_view batch_type;   // set for HighFrequency types only
};

namespace types
{
// Lifecycle (surface ↔ supervisor)
inline constexpr std::string_view READY         = "surface.ready";
inline constexpr std::string_view WELCOME       = "surface.welcome";
inline constexpr std::string_view CLOSE         = "surface.close";
inline constexpr std::string_view HEARTBEAT     = "surface.heartbeat";
inline constexpr std::string_view GEOMETRY      = "surface.geometry";
inline constexpr std::string_view OPEN_REQUEST  = "surface.open_request";
inline constexpr std::string_view CLOSE_REQUEST = "surface.close_request";

// Supervisor → surface
inline constexpr std::string_view NOTICE     = "supervisor.notice";
inline constexpr std::string_view DIAGNOSTIC = "supervisor.diagnostic";

// Debugging
inline constexpr std::string_view BREAKPOINT_ADDED   = "debug.breakpoint_added";
inline constexpr std::string_view BREAKPOINT_REMOVED = "debug.breakpoint_removed";
inline constexpr std::string_view BREAKPOINTS_SET    = "debug.breakpoints_set";
inline constexpr std::string_view SESSION_STARTED    = "debug.session_started";
inline constexpr std::string_view SESSION_ENDED      = "debug.session_ended";
inline constexpr std::string_view DEBUG_COMMAND      = "debug.command";
inline constexpr std::string_view DEBUG_STOPPED      = "debug.stopped";

// Content
inline constexpr std::string_view EDIT                  = "editor.edit";
inline constexpr std::string_view EDIT_BATCH            = "editor.edit_batch";
inline constexpr std::string_view CURSOR                = "editor.cursor";
inline constexpr std::string_view DIAGNOSTICS           = "lang.diagnostics";
inline constexpr std::string_view GRAPH_RENDER          = "graph.render";
inline constexpr std::string_view GRAPH_NODE_SELECTED   = "graph.node_selected";
inline constexpr std::string_view TERMINAL_OUTPUT       = "terminal.output";
inline constexpr std::string_view TERMINAL_OUTPUT_BATCH = "terminal.output_batch";
inline constexpr std::string_view TERMINAL_INPUT        = "terminal.input";
inline constexpr std::string_view THEME_CHANGED         = "ui.theme_changed";
}   // namespace types

// Returns nullptr if the type name / tag is not registered.
const MessageTypeInfo* find_type(std::string_view name);
const MessageTypeInfo* find_type(uint16_t tag);

const std::vector<MessageTypeInfo>& registered_types();

// ─── Payloads ────────────────────────────────────────────────────────────────

// Surface → Supervisor: first message on a fresh channel.
struct ReadyPayload
{
    SurfaceId   surface_id = INVALID_SURFACE;
    RoleKind    role       = RoleKind::Primary;
    ProcessId   process_id = 0;
    std::string build;
};

// Supervisor → Surface: handshake accepted.
struct WelcomePayload
{
    SurfaceId surface_id   = INVALID_SURFACE;
    uint32_t  heartbeat_ms = 5000;
};

// Supervisor → Surface: shut down.
struct ClosePayload
{
    std::string reason;   // "requested", "shutdown", "hung", ...
};

struct GeometryPayload
{
    bool    visible = true;
    int32_t x       = 0;
    int32_t y       = 0;
    int32_t width   = 800;
    int32_t height  = 600;

    bool operator==(const GeometryPayload&) const = default;
};

struct OpenRequestPayload
{
    RoleKind role = RoleKind::Floating;
};

// Either `surface_id` or `role` selects the surface; id wins when set.
struct CloseRequestPayload
{
    SurfaceId               surface_id = INVALID_SURFACE;
    std::optional<RoleKind> role;
};

struct NoticePayload
{
    enum class Severity : uint8_t
    {
        Info    = 0,
        Warning = 1,
        Error   = 2,
    };

    Severity    severity = Severity::Info;
    RoleKind    role     = RoleKind::Primary;
    std::string text;
};

struct Breakpoint
{
    std::string file;
    uint32_t    line = 0;

    auto operator<=>(const Breakpoint&) const = default;
};

struct BreakpointSetPayload
{
    std::vector<Breakpoint> breakpoints;
};

struct DebugSessionPayload
{
    uint64_t    session_id = 0;
    std::string name;
};

// Ordered list of item payloads flushed in one message.
struct BatchPayload
{
    std::vector<std::vector<uint8_t>> items;
};

struct ThemePayload
{
    std::string name;
};

}   // namespace loom::ipc
