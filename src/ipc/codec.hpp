#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace casement::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────
// Encodes/decodes the fixed 40-byte message header.

// Encode header into exactly HEADER_SIZE bytes (appended to `out`).
void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out);

// Decode header from exactly HEADER_SIZE bytes.
// Returns std::nullopt if magic bytes are wrong or buffer too small.
std::optional<MessageHeader> decode_header(std::span<const uint8_t> data);

// ─── Full message serialization ──────────────────────────────────────────────

// Encode a complete message (header + payload) into a byte buffer.
std::vector<uint8_t> encode_message(const Message& msg);

// Decode a complete message from a byte buffer.
// Returns std::nullopt on any framing/size error.
std::optional<Message> decode_message(std::span<const uint8_t> data);

// ─── Payload serialization (simple TLV-style binary) ─────────────────────────
// Format for each field: [tag: uint8_t] [len: uint32_t LE] [data: len bytes]

// Payload encoder: builds a TLV byte buffer.
class PayloadEncoder
{
   public:
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_string(uint8_t tag, const std::string& val);
    void put_bytes(uint8_t tag, const std::vector<uint8_t>& val);
    void put_empty(uint8_t tag);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

// Payload decoder: reads TLV fields from a byte buffer.
class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields.
    bool next();

    // True once every byte has been consumed by whole fields; false after
    // next() stopped on a truncated field.
    bool at_end() const { return pos_ == data_.size(); }

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    // Read the current field's value (caller must check tag first).
    uint16_t                 as_u16() const;
    uint32_t                 as_u32() const;
    uint64_t                 as_u64() const;
    std::string              as_string() const;
    std::span<const uint8_t> as_bytes() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
};

void   payload_put_double(PayloadEncoder& enc, uint8_t tag, double val);
void   payload_put_bool(PayloadEncoder& enc, uint8_t tag, bool val);
void   payload_put_i32(PayloadEncoder& enc, uint8_t tag, int32_t val);
double payload_as_double(const PayloadDecoder& dec);
bool   payload_as_bool(const PayloadDecoder& dec);
int32_t payload_as_i32(const PayloadDecoder& dec);

// ─── Value map (Payload) ─────────────────────────────────────────────────────
// Each entry is a TAG_ENTRY_KEY field followed by exactly one value field.

static constexpr uint8_t TAG_ENTRY_KEY = 0x01;
static constexpr uint8_t TAG_VAL_NULL   = 0x02;
static constexpr uint8_t TAG_VAL_BOOL   = 0x03;
static constexpr uint8_t TAG_VAL_INT    = 0x04;
static constexpr uint8_t TAG_VAL_DOUBLE = 0x05;
static constexpr uint8_t TAG_VAL_STRING = 0x06;

std::vector<uint8_t> encode_value_map(const Payload& map);

// std::nullopt on truncation, a value without a key, a key without a value,
// or an unknown value tag.
std::optional<Payload> decode_value_map(std::span<const uint8_t> data);

// ─── Field tags ──────────────────────────────────────────────────────────────

// HelloPayload
static constexpr uint8_t TAG_PROTOCOL_MAJOR = 0x10;
static constexpr uint8_t TAG_PROTOCOL_MINOR = 0x11;
static constexpr uint8_t TAG_ROLE           = 0x12;
static constexpr uint8_t TAG_RENDERER_BUILD = 0x13;

// WelcomePayload
static constexpr uint8_t TAG_SESSION_ID  = 0x20;
static constexpr uint8_t TAG_WINDOW_ID   = 0x21;
static constexpr uint8_t TAG_URL         = 0x22;
static constexpr uint8_t TAG_ZOOM_FACTOR = 0x23;

// Responses
static constexpr uint8_t TAG_REQUEST_ID    = 0x30;
static constexpr uint8_t TAG_ERROR_CODE    = 0x31;
static constexpr uint8_t TAG_ERROR_MESSAGE = 0x32;
static constexpr uint8_t TAG_RESULT        = 0x33;   // nested value map

// Channels
static constexpr uint8_t TAG_CHANNEL = 0x40;
static constexpr uint8_t TAG_ARGS    = 0x41;         // nested value map

// Surface reports
static constexpr uint8_t TAG_IN_PAGE     = 0x50;
static constexpr uint8_t TAG_LOAD_ERROR  = 0x51;
static constexpr uint8_t TAG_DESCRIPTION = 0x52;
static constexpr uint8_t TAG_KEY         = 0x53;
static constexpr uint8_t TAG_ACTION      = 0x54;
static constexpr uint8_t TAG_MODS        = 0x55;

// ─── Convenience: encode/decode message payloads ─────────────────────────────

std::vector<uint8_t>        encode_hello(const HelloPayload& p);
std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_welcome(const WelcomePayload& p);
std::optional<WelcomePayload> decode_welcome(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_resp_ok(const RespOkPayload& p);
std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_resp_err(const RespErrPayload& p);
std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data);

// REQ_SEND, REQ_INVOKE, EVT_BROADCAST. Decoding fails without a channel.
std::vector<uint8_t>          encode_channel(const ChannelPayload& p);
std::optional<ChannelPayload> decode_channel(std::span<const uint8_t> data);

std::vector<uint8_t>             encode_cmd_load_url(const CmdLoadUrlPayload& p);
std::optional<CmdLoadUrlPayload> decode_cmd_load_url(std::span<const uint8_t> data);

std::vector<uint8_t>             encode_cmd_set_zoom(const CmdSetZoomPayload& p);
std::optional<CmdSetZoomPayload> decode_cmd_set_zoom(std::span<const uint8_t> data);

std::vector<uint8_t>                encode_evt_navigation(const EvtNavigationPayload& p);
std::optional<EvtNavigationPayload> decode_evt_navigation(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_evt_key(const EvtKeyPayload& p);
std::optional<EvtKeyPayload> decode_evt_key(std::span<const uint8_t> data);

}   // namespace casement::ipc
