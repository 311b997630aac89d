#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace loom::ipc
{

// ─── Errors ──────────────────────────────────────────────────────────────────
// All codec errors are per-message: the frame is dropped, the channel stays up.
// BadMagic and Oversized mean the frame boundary itself cannot be trusted.
enum class CodecError : uint8_t
{
    None = 0,
    Truncated,         // fewer bytes than the header or the declared payload length
    UnknownType,       // type tag not in the registry
    VersionMismatch,   // unsupported format version
    BadMagic,
    Oversized,         // declared payload exceeds MAX_PAYLOAD_SIZE
};

std::string_view codec_error_name(CodecError err);

// ─── Header serialization ────────────────────────────────────────────────────

struct FrameHeader
{
    uint8_t  version     = WIRE_VERSION;
    uint8_t  flags       = 0;
    uint16_t type_tag    = 0;
    uint8_t  target_role = 0;
    Sequence seq         = 0;
    uint32_t payload_len = 0;
};

// Appends exactly HEADER_SIZE bytes to `out`.
void encode_header(const FrameHeader& hdr, std::vector<uint8_t>& out);

// Reads the version-independent part of a header (magic + payload length).
// Returns the full frame length, or an error. Only BadMagic, Oversized and
// Truncated can be reported here.
CodecError peek_frame_length(std::span<const uint8_t> data, size_t& frame_len);

// ─── Full message serialization ──────────────────────────────────────────────

// Encode a complete message (header + payload). Returns an empty buffer if
// the message type is not registered.
std::vector<uint8_t> encode_message(const Message& msg);

struct DecodeResult
{
    CodecError error    = CodecError::None;
    Message    message;
    size_t     consumed = 0;   // bytes covered by the frame, also set for skippable errors

    bool ok() const { return error == CodecError::None; }
};

// Decode one message from the front of `data`.
DecodeResult decode_message(std::span<const uint8_t> data);

// ─── Payload serialization (simple TLV-style binary) ─────────────────────────
// Format for each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]

class PayloadEncoder
{
   public:
    void put_u8(uint8_t tag, uint8_t val);
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_i32(uint8_t tag, int32_t val);
    void put_i64(uint8_t tag, int64_t val);
    void put_bool(uint8_t tag, bool val);
    void put_string(uint8_t tag, std::string_view val);
    void put_blob(uint8_t tag, std::span<const uint8_t> blob);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields, or when
    // the next field is cut short (see truncated()).
    bool next();

    // True if decoding stopped because a field overran the buffer.
    bool truncated() const { return truncated_; }

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    // Read the current field's value (caller must check tag first).
    uint8_t              as_u8() const;
    uint16_t             as_u16() const;
    uint32_t             as_u32() const;
    uint64_t             as_u64() const;
    int32_t              as_i32() const;
    int64_t              as_i64() const;
    bool                 as_bool() const;
    std::string          as_string() const;
    std::vector<uint8_t> as_blob() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
    bool                     truncated_  = false;
};

// ─── Field tags ──────────────────────────────────────────────────────────────

static constexpr uint8_t TAG_SURFACE_ID   = 0x10;
static constexpr uint8_t TAG_ROLE         = 0x11;
static constexpr uint8_t TAG_PROCESS_ID   = 0x12;
static constexpr uint8_t TAG_BUILD        = 0x13;
static constexpr uint8_t TAG_HEARTBEAT_MS = 0x14;
static constexpr uint8_t TAG_REASON       = 0x15;

static constexpr uint8_t TAG_VISIBLE = 0x20;
static constexpr uint8_t TAG_X       = 0x21;
static constexpr uint8_t TAG_Y       = 0x22;
static constexpr uint8_t TAG_WIDTH   = 0x23;
static constexpr uint8_t TAG_HEIGHT  = 0x24;

static constexpr uint8_t TAG_SEVERITY = 0x30;
static constexpr uint8_t TAG_TEXT     = 0x31;

static constexpr uint8_t TAG_FILE             = 0x40;
static constexpr uint8_t TAG_LINE             = 0x41;
static constexpr uint8_t TAG_BREAKPOINT_BLOB  = 0x42;   // nested TLV for one breakpoint
static constexpr uint8_t TAG_BREAKPOINT_COUNT = 0x43;
static constexpr uint8_t TAG_SESSION_ID       = 0x44;
static constexpr uint8_t TAG_SESSION_NAME     = 0x45;

static constexpr uint8_t TAG_ITEM_COUNT = 0x50;
static constexpr uint8_t TAG_ITEM       = 0x51;   // repeated, in order

// Encoded size of a batch payload: the item-count field, then one blob field
// per item (tag + length + bytes).
static constexpr size_t BATCH_COUNT_FIELD_SIZE = 1 + 4 + 4;
static constexpr size_t BATCH_ITEM_FIELD_SIZE  = 1 + 4;

static constexpr uint8_t TAG_THEME_NAME = 0x60;

// ─── Payload encode/decode ───────────────────────────────────────────────────
// Decoders skip unknown tags (forward compat) and return std::nullopt only
// when the TLV stream itself is malformed.

std::vector<uint8_t>        encode_ready(const ReadyPayload& p);
std::optional<ReadyPayload> decode_ready(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_welcome(const WelcomePayload& p);
std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data);

std::vector<uint8_t>        encode_close(const ClosePayload& p);
std::optional<ClosePayload> decode_close(std::span<const uint8_t> data);

std::vector<uint8_t>           encode_geometry(const GeometryPayload& p);
std::optional<GeometryPayload> decode_geometry(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_open_request(const OpenRequestPayload& p);
std::optional<OpenRequestPayload> decode_open_request(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_close_request(const CloseRequestPayload& p);
std::optional<CloseRequestPayload> decode_close_request(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_notice(const NoticePayload& p);
std::optional<NoticePayload> decode_notice(std::span<const uint8_t> data);

std::vector<uint8_t>      encode_breakpoint(const Breakpoint& p);
std::optional<Breakpoint> decode_breakpoint(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_breakpoint_set(const BreakpointSetPayload& p);
std::optional<BreakpointSetPayload> decode_breakpoint_set(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_debug_session(const DebugSessionPayload& p);
std::optional<DebugSessionPayload> decode_debug_session(std::span<const uint8_t> data);

std::vector<uint8_t>        encode_batch(const BatchPayload& p);
std::optional<BatchPayload> decode_batch(std::span<const uint8_t> data);

std::vector<uint8_t>        encode_theme(const ThemePayload& p);
std::optional<ThemePayload> decode_theme(std::span<const uint8_t> data);

}   // namespace loom::ipc
