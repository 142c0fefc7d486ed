#pragma once

#include "payload.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace casement::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using SessionId = uint64_t;
using WindowId  = uint64_t;
using RequestId = uint64_t;

static constexpr SessionId INVALID_SESSION = 0;
static constexpr WindowId  INVALID_WINDOW  = 0;
static constexpr RequestId INVALID_REQUEST = 0;

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Handshake
    HELLO    = 0x0001,
    WELCOME  = 0x0002,

    // Request/Response
    RESP_OK  = 0x0010,
    RESP_ERR = 0x0011,

    // Requests (Renderer → Shell)
    REQ_SEND   = 0x0100,   // fire-and-forget, no reply
    REQ_INVOKE = 0x0101,   // answered with RESP_OK / RESP_ERR

    // Commands (Shell → Renderer)
    EVT_BROADCAST = 0x0200,
    CMD_LOAD_URL  = 0x0201,
    CMD_SET_ZOOM  = 0x0202,

    // Surface reports (Renderer → Shell). Those with a request_id are
    // answered with RESP_OK carrying {allow: bool}.
    EVT_WILL_NAVIGATE = 0x0300,
    EVT_POPUP         = 0x0301,
    EVT_DID_NAVIGATE  = 0x0302,
    EVT_LOAD_FAILED   = 0x0303,
    EVT_CERT_ERROR    = 0x0304,
    EVT_KEY           = 0x0305,
    EVT_BLUR          = 0x0306,
};

const char* message_type_name(MessageType type);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 40 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x43, 0x4D = "CM")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-23: request_id (uint64_t LE)
//   bytes 24-31: session_id (uint64_t LE)
//   bytes 32-39: window_id (uint64_t LE)

static constexpr uint8_t MAGIC_0          = 0x43;   // 'C'
static constexpr uint8_t MAGIC_1          = 0x4D;   // 'M'
static constexpr size_t  HEADER_SIZE      = 40;
static constexpr size_t  MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;   // 4 MiB

struct MessageHeader
{
    MessageType type        = MessageType::HELLO;
    uint32_t    payload_len = 0;
    uint64_t    seq         = 0;
    RequestId   request_id  = INVALID_REQUEST;
    SessionId   session_id  = INVALID_SESSION;
    WindowId    window_id   = INVALID_WINDOW;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Handshake payloads ──────────────────────────────────────────────────────

static constexpr uint16_t PROTOCOL_MAJOR = 1;
static constexpr uint16_t PROTOCOL_MINOR = 0;

struct HelloPayload
{
    uint16_t    protocol_major = PROTOCOL_MAJOR;
    uint16_t    protocol_minor = PROTOCOL_MINOR;
    std::string role;             // window role the renderer hosts ("main", ...)
    std::string renderer_build;
};

struct WelcomePayload
{
    SessionId session_id = INVALID_SESSION;
    WindowId  window_id  = INVALID_WINDOW;
    std::string url;              // page to load, may be empty
    double    zoom_factor = 1.0;
};

// ─── Response payloads ───────────────────────────────────────────────────────

enum class ErrorCode : uint32_t
{
    MALFORMED         = 1,
    PROTOCOL_MISMATCH = 2,
    NOT_ATTACHED      = 3,
    UNKNOWN_CHANNEL   = 4,
    HANDLER_FAILED    = 5,
    UNKNOWN_ROLE      = 6,
};

struct RespOkPayload
{
    RequestId request_id = INVALID_REQUEST;
    Payload   result;
};

struct RespErrPayload
{
    RequestId   request_id = INVALID_REQUEST;
    uint32_t    code       = 0;
    std::string message;
};

// ─── Channel payloads ────────────────────────────────────────────────────────

// REQ_SEND, REQ_INVOKE and EVT_BROADCAST.
struct ChannelPayload
{
    std::string channel;
    Payload     args;
};

// ─── Command payloads ────────────────────────────────────────────────────────

struct CmdLoadUrlPayload
{
    std::string url;
};

struct CmdSetZoomPayload
{
    double factor = 1.0;
};

// ─── Surface report payloads ─────────────────────────────────────────────────

// EVT_WILL_NAVIGATE, EVT_POPUP, EVT_DID_NAVIGATE, EVT_LOAD_FAILED, EVT_CERT_ERROR.
struct EvtNavigationPayload
{
    std::string url;
    bool        in_page    = false;   // EVT_DID_NAVIGATE
    int32_t     error_code = 0;       // EVT_LOAD_FAILED
    std::string description;          // EVT_LOAD_FAILED / EVT_CERT_ERROR
};

struct EvtKeyPayload
{
    int32_t key    = 0;   // GLFW key code
    int32_t action = 0;   // GLFW_PRESS / RELEASE / REPEAT
    int32_t mods   = 0;   // GLFW modifier bits
};

}   // namespace casement::ipc
