#include "codec.hpp"

#include <cstring>

namespace casement::ipc
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
    return static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8);
}

static uint32_t read_u32_le(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
           | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64_le(const uint8_t* p)
{
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

const char* message_type_name(MessageType type)
{
    switch (type)
    {
        case MessageType::HELLO:             return "HELLO";
        case MessageType::WELCOME:           return "WELCOME";
        case MessageType::RESP_OK:           return "RESP_OK";
        case MessageType::RESP_ERR:          return "RESP_ERR";
        case MessageType::REQ_SEND:          return "REQ_SEND";
        case MessageType::REQ_INVOKE:        return "REQ_INVOKE";
        case MessageType::EVT_BROADCAST:     return "EVT_BROADCAST";
        case MessageType::CMD_LOAD_URL:      return "CMD_LOAD_URL";
        case MessageType::CMD_SET_ZOOM:      return "CMD_SET_ZOOM";
        case MessageType::EVT_WILL_NAVIGATE: return "EVT_WILL_NAVIGATE";
        case MessageType::EVT_POPUP:         return "EVT_POPUP";
        case MessageType::EVT_DID_NAVIGATE:  return "EVT_DID_NAVIGATE";
        case MessageType::EVT_LOAD_FAILED:   return "EVT_LOAD_FAILED";
        case MessageType::EVT_CERT_ERROR:    return "EVT_CERT_ERROR";
        case MessageType::EVT_KEY:           return "EVT_KEY";
        case MessageType::EVT_BLUR:          return "EVT_BLUR";
    }
    return "UNKNOWN";
}

// ─── Header encode/decode ────────────────────────────────────────────────────

void encode_header(const MessageHeader& hdr, std::vector<uint8_t>& out)
{
    out.reserve(out.size() + HEADER_SIZE);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    write_u16_le(out, static_cast<uint16_t>(hdr.type));
    write_u32_le(out, hdr.payload_len);
    write_u64_le(out, hdr.seq);
    write_u64_le(out, hdr.request_id);
    write_u64_le(out, hdr.session_id);
    write_u64_le(out, hdr.window_id);
}

std::optional<MessageHeader> decode_header(std::span<const uint8_t> data)
{
    if (data.size() < HEADER_SIZE)
        return std::nullopt;
    if (data[0] != MAGIC_0 || data[1] != MAGIC_1)
        return std::nullopt;

    MessageHeader hdr;
    hdr.type        = static_cast<MessageType>(read_u16_le(&data[2]));
    hdr.payload_len = read_u32_le(&data[4]);
    hdr.seq         = read_u64_le(&data[8]);
    hdr.request_id  = read_u64_le(&data[16]);
    hdr.session_id  = read_u64_le(&data[24]);
    hdr.window_id   = read_u64_le(&data[32]);
    return hdr;
}

// ─── Full message encode/decode ──────────────────────────────────────────────

std::vector<uint8_t> encode_message(const Message& msg)
{
    std::vector<uint8_t> out;
    MessageHeader        hdr = msg.header;
    hdr.payload_len          = static_cast<uint32_t>(msg.payload.size());
    encode_header(hdr, out);
    out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    return out;
}

std::optional<Message> decode_message(std::span<const uint8_t> data)
{
    auto hdr_opt = decode_header(data);
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;
    if (data.size() < HEADER_SIZE + hdr.payload_len)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.assign(data.begin() + HEADER_SIZE, data.begin() + HEADER_SIZE + hdr.payload_len);
    return msg;
}

// ─── PayloadEncoder ──────────────────────────────────────────────────────────

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

void PayloadEncoder::put_string(uint8_t tag, const std::string& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_bytes(uint8_t tag, const std::vector<uint8_t>& val)
{
    buf_.push_back(tag);
    write_u32_le(buf_, static_cast<uint32_t>(val.size()));
    buf_.insert(buf_.end(), val.begin(), val.end());
}

void PayloadEncoder::put_empty(uint8_t tag)
{
    buf_.push_back(tag);
    write_u32_le(buf_, 0);
}

// ─── PayloadDecoder ──────────────────────────────────────────────────────────

PayloadDecoder::PayloadDecoder(std::span<const uint8_t> data) : data_(data) {}

bool PayloadDecoder::next()
{
    // Need at least 1 (tag) + 4 (len) bytes
    if (pos_ + 5 > data_.size())
        return false;

    tag_        = data_[pos_];
    len_        = read_u32_le(&data_[pos_ + 1]);
    val_offset_ = pos_ + 5;

    if (val_offset_ + len_ > data_.size())
        return false;

    pos_ = val_offset_ + len_;
    return true;
}

uint16_t PayloadDecoder::as_u16() const
{
    if (len_ < 2)
        return 0;
    return read_u16_le(&data_[val_offset_]);
}

uint32_t PayloadDecoder::as_u32() const
{
    if (len_ < 4)
        return 0;
    return read_u32_le(&data_[val_offset_]);
}

uint64_t PayloadDecoder::as_u64() const
{
    if (len_ < 8)
        return 0;
    return read_u64_le(&data_[val_offset_]);
}

std::string PayloadDecoder::as_string() const
{
    if (len_ == 0)
        return {};
    return std::string(reinterpret_cast<const char*>(&data_[val_offset_]), len_);
}

std::span<const uint8_t> PayloadDecoder::as_bytes() const
{
    return data_.subspan(val_offset_, len_);
}

void payload_put_double(PayloadEncoder& enc, uint8_t tag, double val)
{
    uint64_t bits;
    std::memcpy(&bits, &val, 8);
    enc.put_u64(tag, bits);
}

void payload_put_bool(PayloadEncoder& enc, uint8_t tag, bool val)
{
    enc.put_u16(tag, val ? 1 : 0);
}

void payload_put_i32(PayloadEncoder& enc, uint8_t tag, int32_t val)
{
    enc.put_u32(tag, static_cast<uint32_t>(val));
}

double payload_as_double(const PayloadDecoder& dec)
{
    uint64_t bits = dec.as_u64();
    double   val;
    std::memcpy(&val, &bits, 8);
    return val;
}

bool payload_as_bool(const PayloadDecoder& dec)
{
    return dec.as_u16() != 0;
}

int32_t payload_as_i32(const PayloadDecoder& dec)
{
    return static_cast<int32_t>(dec.as_u32());
}

// ─── Value map ───────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_value_map(const Payload& map)
{
    PayloadEncoder enc;
    for (const auto& [key, value] : map)
    {
        enc.put_string(TAG_ENTRY_KEY, key);
        if (std::holds_alternative<std::monostate>(value))
            enc.put_empty(TAG_VAL_NULL);
        else if (auto* b = std::get_if<bool>(&value))
            payload_put_bool(enc, TAG_VAL_BOOL, *b);
        else if (auto* i = std::get_if<int64_t>(&value))
            enc.put_u64(TAG_VAL_INT, static_cast<uint64_t>(*i));
        else if (auto* d = std::get_if<double>(&value))
            payload_put_double(enc, TAG_VAL_DOUBLE, *d);
        else if (auto* s = std::get_if<std::string>(&value))
            enc.put_string(TAG_VAL_STRING, *s);
    }
    return enc.take();
}

std::optional<Payload> decode_value_map(std::span<const uint8_t> data)
{
    Payload                    map;
    std::optional<std::string> key;
    PayloadDecoder             dec(data);

    while (dec.next())
    {
        if (dec.tag() == TAG_ENTRY_KEY)
        {
            if (key)
                return std::nullopt;   // key without value
            key = dec.as_string();
            continue;
        }
        if (!key)
            return std::nullopt;   // value without key

        Value value;
        switch (dec.tag())
        {
            case TAG_VAL_NULL:
                break;
            case TAG_VAL_BOOL:
                if (dec.field_len() != 2)
                    return std::nullopt;
                value = payload_as_bool(dec);
                break;
            case TAG_VAL_INT:
                if (dec.field_len() != 8)
                    return std::nullopt;
                value = static_cast<int64_t>(dec.as_u64());
                break;
            case TAG_VAL_DOUBLE:
                if (dec.field_len() != 8)
                    return std::nullopt;
                value = payload_as_double(dec);
                break;
            case TAG_VAL_STRING:
                value = dec.as_string();
                break;
            default:
                return std::nullopt;
        }
        map[*key] = std::move(value);
        key.reset();
    }

    if (key || !dec.at_end())
        return std::nullopt;
    return map;
}

// ─── Handshake payload encode/decode ─────────────────────────────────────────

std::vector<uint8_t> encode_hello(const HelloPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROTOCOL_MAJOR, p.protocol_major);
    enc.put_u16(TAG_PROTOCOL_MINOR, p.protocol_minor);
    enc.put_string(TAG_ROLE, p.role);
    enc.put_string(TAG_RENDERER_BUILD, p.renderer_build);
    return enc.take();
}

std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data)
{
    HelloPayload   p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_PROTOCOL_MAJOR: p.protocol_major = dec.as_u16(); break;
            case TAG_PROTOCOL_MINOR: p.protocol_minor = dec.as_u16(); break;
            case TAG_ROLE:           p.role           = dec.as_string(); break;
            case TAG_RENDERER_BUILD: p.renderer_build = dec.as_string(); break;
            default: break;   // skip unknown tags (forward compat)
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_welcome(const WelcomePayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_SESSION_ID, p.session_id);
    enc.put_u64(TAG_WINDOW_ID, p.window_id);
    enc.put_string(TAG_URL, p.url);
    payload_put_double(enc, TAG_ZOOM_FACTOR, p.zoom_factor);
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
            case TAG_SESSION_ID:  p.session_id  = dec.as_u64(); break;
            case TAG_WINDOW_ID:   p.window_id   = dec.as_u64(); break;
            case TAG_URL:         p.url         = dec.as_string(); break;
            case TAG_ZOOM_FACTOR: p.zoom_factor = payload_as_double(dec); break;
            default: break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

// ─── Response payload encode/decode ──────────────────────────────────────────

std::vector<uint8_t> encode_resp_ok(const RespOkPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    if (!p.result.empty())
        enc.put_bytes(TAG_RESULT, encode_value_map(p.result));
    return enc.take();
}

std::optional<RespOkPayload> decode_resp_ok(std::span<const uint8_t> data)
{
    RespOkPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID:
                p.request_id = dec.as_u64();
                break;
            case TAG_RESULT:
            {
                auto result = decode_value_map(dec.as_bytes());
                if (!result)
                    return std::nullopt;
                p.result = std::move(*result);
                break;
            }
            default:
                break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_resp_err(const RespErrPayload& p)
{
    PayloadEncoder enc;
    enc.put_u64(TAG_REQUEST_ID, p.request_id);
    enc.put_u32(TAG_ERROR_CODE, p.code);
    enc.put_string(TAG_ERROR_MESSAGE, p.message);
    return enc.take();
}

std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data)
{
    RespErrPayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_REQUEST_ID:    p.request_id = dec.as_u64(); break;
            case TAG_ERROR_CODE:    p.code       = dec.as_u32(); break;
            case TAG_ERROR_MESSAGE: p.message    = dec.as_string(); break;
            default: break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

// ─── Channel payload encode/decode ───────────────────────────────────────────

std::vector<uint8_t> encode_channel(const ChannelPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_CHANNEL, p.channel);
    if (!p.args.empty())
        enc.put_bytes(TAG_ARGS, encode_value_map(p.args));
    return enc.take();
}

std::optional<ChannelPayload> decode_channel(std::span<const uint8_t> data)
{
    ChannelPayload p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_CHANNEL:
                p.channel = dec.as_string();
                break;
            case TAG_ARGS:
            {
                auto args = decode_value_map(dec.as_bytes());
                if (!args)
                    return std::nullopt;
                p.args = std::move(*args);
                break;
            }
            default:
                break;
        }
    }
    if (!dec.at_end() || p.channel.empty())
        return std::nullopt;
    return p;
}

// ─── Command payload encode/decode ───────────────────────────────────────────

std::vector<uint8_t> encode_cmd_load_url(const CmdLoadUrlPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_URL, p.url);
    return enc.take();
}

std::optional<CmdLoadUrlPayload> decode_cmd_load_url(std::span<const uint8_t> data)
{
    CmdLoadUrlPayload p;
    PayloadDecoder    dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_URL: p.url = dec.as_string(); break;
            default: break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_cmd_set_zoom(const CmdSetZoomPayload& p)
{
    PayloadEncoder enc;
    payload_put_double(enc, TAG_ZOOM_FACTOR, p.factor);
    return enc.take();
}

std::optional<CmdSetZoomPayload> decode_cmd_set_zoom(std::span<const uint8_t> data)
{
    CmdSetZoomPayload p;
    PayloadDecoder    dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_ZOOM_FACTOR: p.factor = payload_as_double(dec); break;
            default: break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

// ─── Surface report encode/decode ────────────────────────────────────────────

std::vector<uint8_t> encode_evt_navigation(const EvtNavigationPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_URL, p.url);
    payload_put_bool(enc, TAG_IN_PAGE, p.in_page);
    payload_put_i32(enc, TAG_LOAD_ERROR, p.error_code);
    enc.put_string(TAG_DESCRIPTION, p.description);
    return enc.take();
}

std::optional<EvtNavigationPayload> decode_evt_navigation(std::span<const uint8_t> data)
{
    EvtNavigationPayload p;
    PayloadDecoder       dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_URL:         p.url         = dec.as_string(); break;
            case TAG_IN_PAGE:     p.in_page     = payload_as_bool(dec); break;
            case TAG_LOAD_ERROR:  p.error_code  = payload_as_i32(dec); break;
            case TAG_DESCRIPTION: p.description = dec.as_string(); break;
            default: break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_evt_key(const EvtKeyPayload& p)
{
    PayloadEncoder enc;
    payload_put_i32(enc, TAG_KEY, p.key);
    payload_put_i32(enc, TAG_ACTION, p.action);
    payload_put_i32(enc, TAG_MODS, p.mods);
    return enc.take();
}

std::optional<EvtKeyPayload> decode_evt_key(std::span<const uint8_t> data)
{
    EvtKeyPayload  p;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_KEY:    p.key    = payload_as_i32(dec); break;
            case TAG_ACTION: p.action = payload_as_i32(dec); break;
            case TAG_MODS:   p.mods   = payload_as_i32(dec); break;
            default: break;
        }
    }
    if (!dec.at_end())
        return std::nullopt;
    return p;
}

}   // namespace casement::ipc
