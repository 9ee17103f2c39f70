#pragma once

#include "message.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace vesper::ipc
{

// ─── Header serialization ────────────────────────────────────────────────────
// Encodes/decodes the fixed 24-byte message header.

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
// Integers are little-endian, doubles are IEEE-754 bit patterns in a u64,
// strings and blobs are raw bytes.  A tag may repeat (header lists, scripts).

class PayloadEncoder
{
   public:
    void put_u16(uint8_t tag, uint16_t val);
    void put_u32(uint8_t tag, uint32_t val);
    void put_u64(uint8_t tag, uint64_t val);
    void put_f64(uint8_t tag, double val);
    void put_bool(uint8_t tag, bool val) { put_u16(tag, val ? 1 : 0); }
    void put_string(uint8_t tag, const std::string& val);
    void put_bytes(uint8_t tag, const std::vector<uint8_t>& val);

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t>        take() { return std::move(buf_); }

   private:
    std::vector<uint8_t> buf_;
};

// Reads TLV fields from a byte buffer.
class PayloadDecoder
{
   public:
    explicit PayloadDecoder(std::span<const uint8_t> data);

    // Advance to the next field. Returns false when no more fields.
    bool next();

    // True if decoding stopped on a truncated field rather than the end.
    bool truncated() const { return truncated_; }

    uint8_t  tag() const { return tag_; }
    uint32_t field_len() const { return len_; }

    // Read the current field's value (caller must check tag first).
    uint16_t             as_u16() const;
    uint32_t             as_u32() const;
    uint64_t             as_u64() const;
    double               as_f64() const;
    bool                 as_bool() const { return as_u16() != 0; }
    std::string          as_string() const;
    std::vector<uint8_t> as_bytes() const;

   private:
    std::span<const uint8_t> data_;
    size_t                   pos_        = 0;
    uint8_t                  tag_        = 0;
    uint32_t                 len_        = 0;
    size_t                   val_offset_ = 0;
    bool                     truncated_  = false;
};

// ─── Field tags ──────────────────────────────────────────────────────────────

// HelloPayload
static constexpr uint8_t TAG_PROTOCOL_MAJOR = 0x10;
static constexpr uint8_t TAG_PROTOCOL_MINOR = 0x11;
static constexpr uint8_t TAG_ENGINE_BUILD   = 0x12;
static constexpr uint8_t TAG_PROCESS_ID     = 0x13;

// InitPayload
static constexpr uint8_t TAG_URL           = 0x20;
static constexpr uint8_t TAG_TITLE         = 0x21;
static constexpr uint8_t TAG_POS_X         = 0x22;
static constexpr uint8_t TAG_POS_Y         = 0x23;
static constexpr uint8_t TAG_WIDTH         = 0x24;
static constexpr uint8_t TAG_HEIGHT        = 0x25;
static constexpr uint8_t TAG_WINDOW_FLAGS  = 0x26;
static constexpr uint8_t TAG_THEME         = 0x27;
static constexpr uint8_t TAG_RESOURCE_DIR  = 0x28;
static constexpr uint8_t TAG_DEVTOOLS_PORT = 0x29;
static constexpr uint8_t TAG_USER_SCRIPT   = 0x2A;   // repeated

// Bits of TAG_WINDOW_FLAGS
static constexpr uint32_t FLAG_DECORATED   = 1u << 0;
static constexpr uint32_t FLAG_TRANSPARENT = 1u << 1;
static constexpr uint32_t FLAG_FULLSCREEN  = 1u << 2;
static constexpr uint32_t FLAG_MAXIMIZED   = 1u << 3;
static constexpr uint32_t FLAG_VISIBLE     = 1u << 4;
static constexpr uint32_t FLAG_FOCUSED     = 1u << 5;

// RespErrPayload
static constexpr uint8_t TAG_ERROR_CODE    = 0x30;
static constexpr uint8_t TAG_ERROR_MESSAGE = 0x31;

// Control requests
static constexpr uint8_t TAG_SCRIPT   = 0x41;
static constexpr uint8_t TAG_PROPERTY = 0x42;

// PropertyValue
static constexpr uint8_t TAG_VALUE_FLAG   = 0x50;
static constexpr uint8_t TAG_VALUE_TEXT   = 0x51;
static constexpr uint8_t TAG_VALUE_NUMBER = 0x52;
static constexpr uint8_t TAG_VALUE_UNIT   = 0x53;
static constexpr uint8_t TAG_VALUE_A      = 0x54;
static constexpr uint8_t TAG_VALUE_B      = 0x55;

// HTTP request / response
static constexpr uint8_t TAG_HTTP_METHOD       = 0x60;
static constexpr uint8_t TAG_HTTP_URI          = 0x61;
static constexpr uint8_t TAG_HTTP_HEADER_NAME  = 0x62;   // repeated, followed by its value
static constexpr uint8_t TAG_HTTP_HEADER_VALUE = 0x63;
static constexpr uint8_t TAG_HTTP_BODY         = 0x64;
static constexpr uint8_t TAG_HTTP_STATUS       = 0x65;
static constexpr uint8_t TAG_HANDLED           = 0x66;

// Navigation
static constexpr uint8_t TAG_ALLOW = 0x71;

// ─── Convenience: encode/decode payloads ─────────────────────────────────────

std::vector<uint8_t>        encode_hello(const HelloPayload& p);
std::optional<HelloPayload> decode_hello(std::span<const uint8_t> data);

std::vector<uint8_t>       encode_init(const InitPayload& p);
std::optional<InitPayload> decode_init(std::span<const uint8_t> data);

std::vector<uint8_t>          encode_resp_err(const RespErrPayload& p);
std::optional<RespErrPayload> decode_resp_err(std::span<const uint8_t> data);

std::vector<uint8_t>              encode_req_navigate(const ReqNavigatePayload& p);
std::optional<ReqNavigatePayload> decode_req_navigate(std::span<const uint8_t> data);

std::vector<uint8_t>            encode_req_script(const ReqScriptPayload& p);
std::optional<ReqScriptPayload> decode_req_script(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_req_get(const ReqGetPayload& p);
std::optional<ReqGetPayload> decode_req_get(std::span<const uint8_t> data);

std::vector<uint8_t>         encode_req_set(const ReqSetPayload& p);
std::optional<ReqSetPayload> decode_req_set(std::span<const uint8_t> data);

// RESP_OK to a REQ_GET carries the value.
std::vector<uint8_t>         encode_property_value(const PropertyValue& v);
std::optional<PropertyValue> decode_property_value(std::span<const uint8_t> data);

std::vector<uint8_t> encode_resource_request(const EvtResourceRequestPayload& p);
std::optional<EvtResourceRequestPayload> decode_resource_request(std::span<const uint8_t> data);

std::vector<uint8_t>               encode_resource_response(const RespResourcePayload& p);
std::optional<RespResourcePayload> decode_resource_response(std::span<const uint8_t> data);

std::vector<uint8_t> encode_navigation_starting(const EvtNavigationStartingPayload& p);
std::optional<EvtNavigationStartingPayload> decode_navigation_starting(
    std::span<const uint8_t> data);

std::vector<uint8_t>                 encode_navigation_response(const RespNavigationPayload& p);
std::optional<RespNavigationPayload> decode_navigation_response(std::span<const uint8_t> data);

}   // namespace vesper::ipc
