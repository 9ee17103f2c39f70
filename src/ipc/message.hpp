#pragma once

#include <vesper/engine.hpp>
#include <vesper/http.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vesper::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using RequestId = uint64_t;

static constexpr RequestId INVALID_REQUEST = 0;

static constexpr uint16_t PROTOCOL_MAJOR = 1;
static constexpr uint16_t PROTOCOL_MINOR = 0;

// ─── Message types ───────────────────────────────────────────────────────────
enum class MessageType : uint16_t
{
    // Handshake
    HELLO = 0x0001,   // Engine → Runtime, first message on the connection
    INIT  = 0x0002,   // Runtime → Engine, window settings
    READY = 0x0003,   // Engine → Runtime, window is up

    // Request/Response
    RESP_OK  = 0x0010,
    RESP_ERR = 0x0011,

    // Control (Runtime → Engine)
    REQ_NAVIGATE       = 0x0100,
    REQ_EXECUTE_SCRIPT = 0x0101,
    REQ_GET            = 0x0102,
    REQ_SET            = 0x0103,
    REQ_FOCUS          = 0x0104,
    REQ_START_DRAGGING = 0x0105,
    REQ_RELOAD         = 0x0106,
    REQ_EXIT           = 0x0107,

    // Events (Engine → Runtime)
    EVT_CLOSE_REQUESTED     = 0x0200,
    EVT_RESOURCE_REQUEST    = 0x0201,
    EVT_NAVIGATION_STARTING = 0x0202,

    // Event replies (Runtime → Engine), same request_id as the event
    RESP_RESOURCE   = 0x0300,
    RESP_NAVIGATION = 0x0301,
};

const char* to_string(MessageType type);

// ─── Message envelope ────────────────────────────────────────────────────────
// Wire format: [Header (fixed 24 bytes)] [payload (variable)]
//
// Header layout:
//   bytes 0-1:   magic (0x56, 0x53 = "VS")
//   bytes 2-3:   message type (uint16_t LE)
//   bytes 4-7:   payload length (uint32_t LE)
//   bytes 8-15:  sequence number (uint64_t LE)
//   bytes 16-23: request_id (uint64_t LE)

static constexpr uint8_t MAGIC_0          = 0x56;   // 'V'
static constexpr uint8_t MAGIC_1          = 0x53;   // 'S'
static constexpr size_t  HEADER_SIZE      = 24;
static constexpr size_t  MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;   // 16 MiB

struct MessageHeader
{
    MessageType type        = MessageType::HELLO;
    uint32_t    payload_len = 0;
    uint64_t    seq         = 0;
    RequestId   request_id  = INVALID_REQUEST;
};

struct Message
{
    MessageHeader        header;
    std::vector<uint8_t> payload;
};

// ─── Handshake payloads ──────────────────────────────────────────────────────

struct HelloPayload
{
    uint16_t    protocol_major = PROTOCOL_MAJOR;
    uint16_t    protocol_minor = PROTOCOL_MINOR;
    std::string engine_build;
    uint64_t    process_id = 0;
};

struct InitPayload
{
    std::string    url;
    EngineSettings settings;
};

struct RespErrPayload
{
    uint32_t    code = 0;
    std::string message;
};

// ─── Control payloads ────────────────────────────────────────────────────────

enum class Property : uint16_t
{
    Url         = 1,
    Title       = 2,
    InnerSize   = 3,
    Position    = 4,
    ScaleFactor = 5,
    Fullscreen  = 6,
    Minimized   = 7,
    Maximized   = 8,
    Visible     = 9,
    WindowLevel = 10,
};

enum class Unit : uint16_t
{
    Logical  = 0,
    Physical = 1,
};

// Value of a window property.  Which members are set depends on the
// property: `flag` for the booleans, `text` for url/title, `number` for the
// scale factor and window level, `a`/`b` (+ `unit` on set) for sizes and
// positions.
struct PropertyValue
{
    std::optional<bool>        flag;
    std::optional<std::string> text;
    std::optional<double>      number;
    std::optional<Unit>        unit;
    std::optional<double>      a;
    std::optional<double>      b;
};

struct ReqNavigatePayload
{
    std::string url;
};

struct ReqScriptPayload
{
    std::string script;
};

struct ReqGetPayload
{
    Property property = Property::Url;
};

struct ReqSetPayload
{
    Property      property = Property::Url;
    PropertyValue value;
};

// ─── Event payloads ──────────────────────────────────────────────────────────

struct EvtResourceRequestPayload
{
    HttpRequest request;
};

// `handled == false` tells the engine to serve the request itself.
struct RespResourcePayload
{
    bool         handled = false;
    HttpResponse response;
};

struct EvtNavigationStartingPayload
{
    std::string url;
};

struct RespNavigationPayload
{
    bool allow = true;
};

}   // namespace vesper::ipc
