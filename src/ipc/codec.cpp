#include "codec.hpp"

#include <algorithm>

namespace loom::ipc
{

// ─── Little-endian helpers ───────────────────────────────────────────────────

static void write_u16_le(std::vector<uint8_t>& buf, uint16_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void write_u32_le(std::vector<uint8_t>& buf, uint32_t v)
{
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static void write_u64_le(std::vector<uint8_t>& buf, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
}

static uint16_t read_u16_le(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0]) | static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

static uint32_t read_u32_le(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

std::string_view codec_error_name(CodecError err)
{
    switch (err)
    {
        case CodecError::None:            return "none";
        case CodecError::Truncated:       return "truncated";
        case CodecError::UnknownType:     return "unknown_type";
        case CodecError::VersionMismatch: return "version_mismatch";
        case CodecError::BadMagic:        return "bad_magic";
        case CodecError::Oversized:       return "oversized";
    }
    return "invalid";
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const FrameHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    out.push_back(hdr.version);
    out.push_back(hdr.flags);
    write_u16_le(out, hdr.type_tag);
    out.push_back(hdr.target_role);
    out.push_back(0);
    write_u64_le(out, hdr.seq);
    write_u32_le(out, hdr.payload_len);
}

CodecError peek_frame_length(std::span<const uint8_t> data, size_t& frame_len)
{
    if (data.size() >= 2 && (data[0] != MAGIC_0 || data[1] != MAGIC_1))
        return CodecError::BadMagic;
    if (data.size() < HEADER_SIZE)
        return CodecError::Truncated;

    uint32_t payload_len = read_u32_le(&data[16]);
    if (payload_len > MAX_PAYLOAD_SIZE)
        return CodecError::Oversized;

    frame_len = HEADER_SIZE + payload_len;
    return CodecError::None;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    const MessageTypeInfo* info = find_type(msg.type);
    if (!info || msg.payload.size() > MAX_PAYLOAD_SIZE)
        return {};

    FrameHeader hdr;
    hdr.type_tag    = info->tag;
    hdr.seq         = msg.seq;
    hdr.payload_len = static_cast<uint32_t>(msg.payload.size());
    if (msg.target)
    {
        hdr.flags |= FLAG_HAS_TARGET;
        hdr.target_role = static_cast<uint8_t>(msg.target->kind);
    }

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

DecodeResult decode_message(std::span<const uint8_t> data)
{
    DecodeResult result;

    size_t frame_len = 0;
    result.error     = peek_frame_length(data, frame_len);
    if (result.error != CodecError::None)
        return result;
    if (data.size() < frame_len)
    {
        result.error = CodecError::Truncated;
        return result;
    }

    // From here on the frame boundary is known: any error is skippable.
    result.consumed = frame_len;

    if (data[2] != WIRE_VERSION)
    {
        result.error = CodecError::VersionMismatch;
        return result;
    }

    const MessageTypeInfo* info = find_type(read_u16_le(&data[4]));
    if (!info)
    {
        result.error = CodecError::UnknownType;
        return result;
    }

    uint8_t flags = data[3];
    if (flags & FLAG_HAS_TARGET)
    {
        auto role = role_kind_from_wire(data[6]);
        if (!role)
        {
            result.error = CodecError::UnknownType;
            return result;
        }
        result.message.target = SurfaceRole{*role};
    }

    result.message.type = std::string(info->name);
    result.message.seq  = read_u64_le(&data[8]);
    result.message.payload.assign(data.begin() + HEADER_SIZE, data.begin() + frame_len);
    return result;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

void PayloadEncoder::put_u8(uint8_t tag, uint8_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 1);
    buf_.push_back(val);
}

void PayloadEncoder::put_u16(uint8_t tag, uint16_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 2);
    write_u16_le(buf_, val);
}

void PayloadEncoder::put_u32(uint8_t tag, uint32_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 4);
    write_u32_le(buf_, val);
}

void PayloadEncoder::put_u64(uint8_t tag, uint64_t val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 8);
    write_u64_le(buf_, val);
}

void PayloadEncoder::put_i32(uint8_t tag, int32_t val)
{
    put_u32(tag, static_cast<uint32_t>(val));
}

void PayloadEncoder::put_i64(uint8_t tag, int64_t val)
{
    put_u64(tag, static_cast<uint64_t>(val));
}

void PayloadEncoder::put_bool(uint8_t tag, bool val)
{
    put_u8(tag, val ? 1 : 0);
}

void PayloadEncoder::put_string(uint8_t tag, std::string_view val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_blob(uint8_t tag, std::span<const uint8_t> blob)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(blob.size()));
    buf_.insert(buf_.end(), blob.begin(), blob.end());
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data)
    : data_(data)
{
}

bool PayloadDecoder::next()
{
    if (pos_ == data_.size())
        return false;

    // Need at least 1 (tag) + 4 (len) bytes
    if (pos_ + 5 > data_.size())
    {
        truncated_ = true;
        return false;
    }

    tag_        = data_[pos_];
    len_        = read_u32_le(&data_[pos_ + 1]);
    val_offset_ = pos_ + 5;

    if (val_offset_ + len_ > data_.size())
    {
        truncated_ = true;
        return false;
    }

    pos_ = val_offset_ + len_;
    return true;
}

uint8_t PayloadDecoder::as_u8() const
{
    if (len_ < 1) return 0;
    return data_[val_offset_];
}

uint16_t PayloadDecoder::as_u16() const
{
    if (len_ < 2) return 0;
    return read_u16_le(&data_[val_offset_]);
}

uint32_t PayloadDecoder::as_u32() const
{
    if (len_ < 4) return 0;
    return read_u32_le(&data_[val_offset_]);
}

uint64_t PayloadDecoder::as_u64() const
{
    if (len_ < 8) return 0;
    return read_u64_le(&data_[val_offset_]);
}

int32_t PayloadDecoder::as_i32() const
{
    return static_cast<int32_t>(as_u32());
}

int64_t PayloadDecoder::as_i64() const
{
    return static_cast<int64_t>(as_u64());
}

bool PayloadDecoder::as_bool() const
{
    return as_u8() != 0;
}

std::string PayloadDecoder::as_string() const
{
    if (len_ == 0) return {};
    return std::string(reinterpret_cast<const char*>(&data_[val_offset_]), len_);
}

std::vector<uint8_t> PayloadDecoder::as_blob() const
{
    if (len_ == 0) return {};
    return std::vector<uint8_t>(data_.begin() + static_cast<std::ptrdiff_t>(val_offset_),
                                data_.begin() + static_cast<std::ptrdiff_t>(val_offset_ + len_));
}

// ─── Lifecycle payloads ──────────────────────────────────────────────────────

std::vector<uint8_t> encode_ready(const ReadyPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SURFACE_ID, p.surface_id);
    enc.put_u8(TAG_ROLE, static_cast<uint8_t>(p.role));
    enc.put_i64(TAG_PROCESS_ID, p.process_id);
    enc.put_string(TAG_BUILD, p.build);
    return enc.take();
}

std::optional<ReadyPayload> decode_ready(std::span<const uint8_t> data)
{
    ReadyPayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SURFACE_ID: p.surface_id = dec.as_u64(); break;
            case TAG_ROLE:
            {
                auto role = role_kind_from_wire(dec.as_u8());
                if (!role)
                    return std::nullopt;
                p.role = *role;
                break;
            }
            case TAG_PROCESS_ID: p.process_id = dec.as_i64(); break;
            case TAG_BUILD:      p.build      = dec.as_string(); break;
            default: break;   // skip unknown tags (forward compat)
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_welcome(const WelcomePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SURFACE_ID, p.surface_id);
    enc.put_u32(TAG_HEARTBEAT_MS, p.heartbeat_ms);
    return enc.take();
}

std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data)
{
    WelcomePayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SURFACE_ID:   p.surface_id   = dec.as_u64(); break;
            case TAG_HEARTBEAT_MS: p.heartbeat_ms = dec.as_u32(); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_close(const ClosePayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_REASON, p.reason);
    return enc.take();
}

std::optional<ClosePayload> decode_close(std::span<const uint8_t> data)
{
    ClosePayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_REASON)
            p.reason = dec.as_string();
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_geometry(const GeometryPayload& p)
{
    PayloadEncoder enc;
    enc.put_bool(TAG_VISIBLE, p.visible);
    enc.put_i32(TAG_X, p.x);
    enc.put_i32(TAG_Y, p.y);
    enc.put_i32(TAG_WIDTH, p.width);
    enc.put_i32(TAG_HEIGHT, p.height);
    return enc.take();
}

std::optional<GeometryPayload> decode_geometry(std::span<const uint8_t> data)
{
    GeometryPayload p;
    PayloadDecoder  dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_VISIBLE: p.visible = dec.as_bool(); break;
            case TAG_X:       p.x       = dec.as_i32(); break;
            case TAG_Y:       p.y       = dec.as_i32(); break;
            case TAG_WIDTH:   p.width   = dec.as_i32(); break;
            case TAG_HEIGHT:  p.height  = dec.as_i32(); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_open_request(const OpenRequestPayload& p)
{
    PayloadEncoder enc;
    enc.put_u8(TAG_ROLE, static_cast<uint8_t>(p.role));
    return enc.take();
}

std::optional<OpenRequestPayload> decode_open_request(std::span<const uint8_t> data)
{
    OpenRequestPayload p;
    PayloadDecoder     dec(data);
    bool               has_role = false;
    while (dec.next())
    {
        if (dec.tag() == TAG_ROLE)
        {
            auto role = role_kind_from_wire(dec.as_u8());
            if (!role)
                return std::nullopt;
            p.role   = *role;
            has_role = true;
        }
    }
    if (dec.truncated() || !has_role)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_close_request(const CloseRequestPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SURFACE_ID, p.surface_id);
    if (p.role)
        enc.put_u8(TAG_ROLE, static_cast<uint8_t>(*p.role));
    return enc.take();
}

std::optional<CloseRequestPayload> decode_close_request(std::span<const uint8_t> data)
{
    CloseRequestPayload p;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SURFACE_ID: p.surface_id = dec.as_u64(); break;
            case TAG_ROLE:
            {
                auto role = role_kind_from_wire(dec.as_u8());
                if (!role)
                    return std::nullopt;
                p.role = *role;
                break;
            }
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_notice(const NoticePayload& p)
{
    PayloadEncoder enc;
    enc.put_u8(TAG_SEVERITY, static_cast<uint8_t>(p.severity));
    enc.put_u8(TAG_ROLE, static_cast<uint8_t>(p.role));
    enc.put_string(TAG_TEXT, p.text);
    return enc.take();
}

std::optional<NoticePayload> decode_notice(std::span<const uint8_t> data)
{
    NoticePayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SEVERITY:
            {
                uint8_t sev = dec.as_u8();
                if (sev > static_cast<uint8_t>(NoticePayload::Severity::Error))
                    return std::nullopt;
                p.severity = static_cast<NoticePayload::Severity>(sev);
                break;
            }
            case TAG_ROLE:
            {
                auto role = role_kind_from_wire(dec.as_u8());
                if (!role)
                    return std::nullopt;
                p.role = *role;
                break;
            }
            case TAG_TEXT: p.text = dec.as_string(); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

// ─── Debug payloads ──────────────────────────────────────────────────────────

std::vector<uint8_t> encode_breakpoint(const Breakpoint& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_FILE, p.file);
    enc.put_u32(TAG_LINE, p.line);
    return enc.take();
}

std::optional<Breakpoint> decode_breakpoint(std::span<const uint8_t> data)
{
    Breakpoint     p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_FILE: p.file = dec.as_string(); break;
            case TAG_LINE: p.line = dec.as_u32(); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_breakpoint_set(const BreakpointSetPayload& p)
{
    PayloadEncoder enc;
    enc.put_u32(TAG_BREAKPOINT_COUNT, static_cast<uint32_t>(p.breakpoints.size()));
    for (const auto& bp : p.breakpoints)
        enc.put_blob(TAG_BREAKPOINT_BLOB, encode_breakpoint(bp));
    return enc.take();
}

std::optional<BreakpointSetPayload> decode_breakpoint_set(std::span<const uint8_t> data)
{
    BreakpointSetPayload p;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_BREAKPOINT_COUNT:
                // Only a hint; the blobs that follow are authoritative
                p.breakpoints.reserve(std::min<size_t>(dec.as_u32(), 4096));
                break;
            case TAG_BREAKPOINT_BLOB:
            {
                auto blob = dec.as_blob();
                auto bp   = decode_breakpoint(blob);
                if (!bp)
                    return std::nullopt;
                p.breakpoints.push_back(std::move(*bp));
                break;
            }
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_debug_session(const DebugSessionPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SESSION_ID, p.session_id);
    enc.put_string(TAG_SESSION_NAME, p.name);
    return enc.take();
}

std::optional<DebugSessionPayload> decode_debug_session(std::span<const uint8_t> data)
{
    DebugSessionPayload p;
    PayloadDecoder      dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_SESSION_ID:   p.session_id = dec.as_u64(); break;
            case TAG_SESSION_NAME: p.name       = dec.as_string(); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

// ─── Batch / UI payloads ─────────────────────────────────────────────────────

std::vector<uint8_t> encode_batch(const BatchPayload& p)
{
    PayloadEncoder enc;
    enc.put_u32(TAG_ITEM_COUNT, static_cast<uint32_t>(p.items.size()));
    for (const auto& item : p.items)
        enc.put_blob(TAG_ITEM, item);
    return enc.take();
}

std::optional<BatchPayload> decode_batch(std::span<const uint8_t> data)
{
    BatchPayload   p;
    PayloadDecoder dec(data);
    uint32_t       declared = 0;
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_ITEM_COUNT: declared = dec.as_u32(); break;
            case TAG_ITEM:       p.items.push_back(dec.as_blob()); break;
            default: break;
        }
    }
    if (dec.truncated() || declared != p.items.size())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_theme(const ThemePayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_THEME_NAME, p.name);
    return enc.take();
}

std::optional<ThemePayload> decode_theme(std::span<const uint8_t> data)
{
    ThemePayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_THEME_NAME)
            p.name = dec.as_string();
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

}   // namespace loom::ipc
