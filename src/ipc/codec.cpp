#include "codec.hpp"

#include <bit>
#include <cstring>

namespace vesper::ipc
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

const char* to_string(MessageType type)
{
    switch (type)
    {
        case MessageType::HELLO: return "HELLO";
        case MessageType::INIT: return "INIT";
        case MessageType::READY: return "READY";
        case MessageType::RESP_OK: return "RESP_OK";
        case MessageType::RESP_ERR: return "RESP_ERR";
        case MessageType::REQ_NAVIGATE: return "REQ_NAVIGATE";
        case MessageType::REQ_EXECUTE_SCRIPT: return "REQ_EXECUTE_SCRIPT";
        case MessageType::REQ_GET: return "REQ_GET";
        case MessageType::REQ_SET: return "REQ_SET";
        case MessageType::REQ_FOCUS: return "REQ_FOCUS";
        case MessageType::REQ_START_DRAGGING: return "REQ_START_DRAGGING";
        case MessageType::REQ_RELOAD: return "REQ_RELOAD";
        case MessageType::REQ_EXIT: return "REQ_EXIT";
        case MessageType::EVT_CLOSE_REQUESTED: return "EVT_CLOSE_REQUESTED";
        case MessageType::EVT_RESOURCE_REQUEST: return "EVT_RESOURCE_REQUEST";
        case MessageType::EVT_NAVIGATION_STARTING: return "EVT_NAVIGATION_STARTING";
        case MessageType::RESP_RESOURCE: return "RESP_RESOURCE";
        case MessageType::RESP_NAVIGATION: return "RESP_NAVIGATION";
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

void PayloadEncoder::put_f64(uint8_t tag, double val)
{
    put_u64(tag, std::bit_cast<uint64_t>(val));
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

double PayloadDecoder::as_f64() const
{
    return std::bit_cast<double>(as_u64());
}

std::string PayloadDecoder::as_string() const
{
    if (len_ == 0)
        return {};
    return std::string(reinterpret_cast<const char*>(&data_[val_offset_]), len_);
}

std::vector<uint8_t> PayloadDecoder::as_bytes() const
{
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(val_offset_);
    return std::vector<uint8_t>(first, first + len_);
}

// ─── Handshake payload encode/decode ─────────────────────────────────────────

std::vector<uint8_t> encode_hello(const HelloPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROTOCOL_MAJOR, p.protocol_major);
    enc.put_u16(TAG_PROTOCOL_MINOR, p.protocol_minor);
    enc.put_string(TAG_ENGINE_BUILD, p.engine_build);
    enc.put_u64(TAG_PROCESS_ID, p.process_id);
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
            case TAG_ENGINE_BUILD: p.engine_build = dec.as_string(); break;
            case TAG_PROCESS_ID: p.process_id = dec.as_u64(); break;
            default: break;   // skip unknown tags (forward compat)
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_init(const InitPayload& p)
{
    const EngineSettings& s = p.settings;

    PayloadEncoder enc;
    enc.put_string(TAG_URL, p.url);
    if (s.title)
        enc.put_string(TAG_TITLE, *s.title);
    if (s.position)
    {
        enc.put_f64(TAG_POS_X, s.position->x);
        enc.put_f64(TAG_POS_Y, s.position->y);
    }
    if (s.inner_size)
    {
        enc.put_f64(TAG_WIDTH, s.inner_size->width);
        enc.put_f64(TAG_HEIGHT, s.inner_size->height);
    }

    uint32_t flags = 0;
    if (s.decorated)
        flags |= FLAG_DECORATED;
    if (s.transparent)
        flags |= FLAG_TRANSPARENT;
    if (s.fullscreen)
        flags |= FLAG_FULLSCREEN;
    if (s.maximized)
        flags |= FLAG_MAXIMIZED;
    if (s.visible)
        flags |= FLAG_VISIBLE;
    if (s.focused)
        flags |= FLAG_FOCUSED;
    enc.put_u32(TAG_WINDOW_FLAGS, flags);

    if (s.theme)
        enc.put_u16(TAG_THEME, *s.theme == Theme::Dark ? 1 : 0);
    if (s.resource_directory)
        enc.put_string(TAG_RESOURCE_DIR, *s.resource_directory);
    if (s.devtools_port)
        enc.put_u16(TAG_DEVTOOLS_PORT, *s.devtools_port);
    for (const auto& script : s.user_scripts)
        enc.put_string(TAG_USER_SCRIPT, script);
    return enc.take();
}

std::optional<InitPayload> decode_init(std::span<const uint8_t> data)
{
    InitPayload     p;
    EngineSettings& s = p.settings;

    std::optional<double> x, y, width, height;

    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_URL: p.url = dec.as_string(); break;
            case TAG_TITLE: s.title = dec.as_string(); break;
            case TAG_POS_X: x = dec.as_f64(); break;
            case TAG_POS_Y: y = dec.as_f64(); break;
            case TAG_WIDTH: width = dec.as_f64(); break;
            case TAG_HEIGHT: height = dec.as_f64(); break;
            case TAG_WINDOW_FLAGS:
            {
                uint32_t flags = dec.as_u32();
                s.decorated    = (flags & FLAG_DECORATED) != 0;
                s.transparent  = (flags & FLAG_TRANSPARENT) != 0;
                s.fullscreen   = (flags & FLAG_FULLSCREEN) != 0;
                s.maximized    = (flags & FLAG_MAXIMIZED) != 0;
                s.visible      = (flags & FLAG_VISIBLE) != 0;
                s.focused      = (flags & FLAG_FOCUSED) != 0;
                break;
            }
            case TAG_THEME: s.theme = dec.as_u16() == 1 ? Theme::Dark : Theme::Light; break;
            case TAG_RESOURCE_DIR: s.resource_directory = dec.as_string(); break;
            case TAG_DEVTOOLS_PORT: s.devtools_port = dec.as_u16(); break;
            case TAG_USER_SCRIPT: s.user_scripts.push_back(dec.as_string()); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;

    if (x && y)
        s.position = LogicalPosition{*x, *y};
    if (width && height)
        s.inner_size = LogicalSize{*width, *height};
    return p;
}

std::vector<uint8_t> encode_resp_err(const RespErrPayload& p)
{
    PayloadEncoder enc;
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
            case TAG_ERROR_CODE: p.code = dec.as_u32(); break;
            case TAG_ERROR_MESSAGE: p.message = dec.as_string(); break;
            default: break;
        }
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

// ─── Control payload encode/decode ───────────────────────────────────────────

std::vector<uint8_t> encode_req_navigate(const ReqNavigatePayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_URL, p.url);
    return enc.take();
}

std::optional<ReqNavigatePayload> decode_req_navigate(std::span<const uint8_t> data)
{
    ReqNavigatePayload p;
    bool               has_url = false;
    PayloadDecoder     dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_URL)
        {
            p.url   = dec.as_string();
            has_url = true;
        }
    }
    if (dec.truncated() || !has_url)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_script(const ReqScriptPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_SCRIPT, p.script);
    return enc.take();
}

std::optional<ReqScriptPayload> decode_req_script(std::span<const uint8_t> data)
{
    ReqScriptPayload p;
    PayloadDecoder   dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_SCRIPT)
            p.script = dec.as_string();
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_req_get(const ReqGetPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROPERTY, static_cast<uint16_t>(p.property));
    return enc.take();
}

std::optional<ReqGetPayload> decode_req_get(std::span<const uint8_t> data)
{
    ReqGetPayload  p;
    bool           has_property = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_PROPERTY)
        {
            p.property   = static_cast<Property>(dec.as_u16());
            has_property = true;
        }
    }
    if (dec.truncated() || !has_property)
        return std::nullopt;
    return p;
}

static void put_property_value(PayloadEncoder& enc, const PropertyValue& v)
{
    if (v.flag)
        enc.put_bool(TAG_VALUE_FLAG, *v.flag);
    if (v.text)
        enc.put_string(TAG_VALUE_TEXT, *v.text);
    if (v.number)
        enc.put_f64(TAG_VALUE_NUMBER, *v.number);
    if (v.unit)
        enc.put_u16(TAG_VALUE_UNIT, static_cast<uint16_t>(*v.unit));
    if (v.a)
        enc.put_f64(TAG_VALUE_A, *v.a);
    if (v.b)
        enc.put_f64(TAG_VALUE_B, *v.b);
}

// Returns true if the current field was a value field.
static bool read_property_value_field(const PayloadDecoder& dec, PropertyValue& v)
{
    switch (dec.tag())
    {
        case TAG_VALUE_FLAG: v.flag = dec.as_bool(); return true;
        case TAG_VALUE_TEXT: v.text = dec.as_string(); return true;
        case TAG_VALUE_NUMBER: v.number = dec.as_f64(); return true;
        case TAG_VALUE_UNIT:
            v.unit = dec.as_u16() == static_cast<uint16_t>(Unit::Physical) ? Unit::Physical
                                                                            : Unit::Logical;
            return true;
        case TAG_VALUE_A: v.a = dec.as_f64(); return true;
        case TAG_VALUE_B: v.b = dec.as_f64(); return true;
        default: return false;
    }
}

std::vector<uint8_t> encode_req_set(const ReqSetPayload& p)
{
    PayloadEncoder enc;
    enc.put_u16(TAG_PROPERTY, static_cast<uint16_t>(p.property));
    put_property_value(enc, p.value);
    return enc.take();
}

std::optional<ReqSetPayload> decode_req_set(std::span<const uint8_t> data)
{
    ReqSetPayload  p;
    bool           has_property = false;
    PayloadDecoder dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_PROPERTY)
        {
            p.property   = static_cast<Property>(dec.as_u16());
            has_property = true;
        }
        else
        {
            read_property_value_field(dec, p.value);
        }
    }
    if (dec.truncated() || !has_property)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_property_value(const PropertyValue& v)
{
    PayloadEncoder enc;
    put_property_value(enc, v);
    return enc.take();
}

std::optional<PropertyValue> decode_property_value(std::span<const uint8_t> data)
{
    PropertyValue  v;
    PayloadDecoder dec(data);
    while (dec.next())
        read_property_value_field(dec, v);
    if (dec.truncated())
        return std::nullopt;
    return v;
}

// ─── Event payload encode/decode ─────────────────────────────────────────────

static void put_headers(PayloadEncoder& enc, const HeaderMap& headers)
{
    for (const auto& [name, value] : headers.entries())
    {
        enc.put_string(TAG_HTTP_HEADER_NAME, name);
        enc.put_string(TAG_HTTP_HEADER_VALUE, value);
    }
}

std::vector<uint8_t> encode_resource_request(const EvtResourceRequestPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_HTTP_METHOD, p.request.method);
    enc.put_string(TAG_HTTP_URI, p.request.uri);
    put_headers(enc, p.request.headers);
    enc.put_bytes(TAG_HTTP_BODY, p.request.body);
    return enc.take();
}

std::optional<EvtResourceRequestPayload> decode_resource_request(std::span<const uint8_t> data)
{
    EvtResourceRequestPayload  p;
    std::optional<std::string> pending_name;

    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_HTTP_METHOD: p.request.method = dec.as_string(); break;
            case TAG_HTTP_URI: p.request.uri = dec.as_string(); break;
            case TAG_HTTP_HEADER_NAME: pending_name = dec.as_string(); break;
            case TAG_HTTP_HEADER_VALUE:
                if (!pending_name)
                    return std::nullopt;   // value without a name
                p.request.headers.append(std::move(*pending_name), dec.as_string());
                pending_name.reset();
                break;
            case TAG_HTTP_BODY: p.request.body = dec.as_bytes(); break;
            default: break;
        }
    }
    if (dec.truncated() || pending_name)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_resource_response(const RespResourcePayload& p)
{
    PayloadEncoder enc;
    enc.put_bool(TAG_HANDLED, p.handled);
    if (p.handled)
    {
        enc.put_u16(TAG_HTTP_STATUS, p.response.status);
        put_headers(enc, p.response.headers);
        enc.put_bytes(TAG_HTTP_BODY, p.response.body);
    }
    return enc.take();
}

std::optional<RespResourcePayload> decode_resource_response(std::span<const uint8_t> data)
{
    RespResourcePayload        p;
    std::optional<std::string> pending_name;

    PayloadDecoder dec(data);
    while (dec.next())
    {
        switch (dec.tag())
        {
            case TAG_HANDLED: p.handled = dec.as_bool(); break;
            case TAG_HTTP_STATUS: p.response.status = dec.as_u16(); break;
            case TAG_HTTP_HEADER_NAME: pending_name = dec.as_string(); break;
            case TAG_HTTP_HEADER_VALUE:
                if (!pending_name)
                    return std::nullopt;
                p.response.headers.append(std::move(*pending_name), dec.as_string());
                pending_name.reset();
                break;
            case TAG_HTTP_BODY: p.response.body = dec.as_bytes(); break;
            default: break;
        }
    }
    if (dec.truncated() || pending_name)
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_navigation_starting(const EvtNavigationStartingPayload& p)
{
    PayloadEncoder enc;
    enc.put_string(TAG_URL, p.url);
    return enc.take();
}

std::optional<EvtNavigationStartingPayload> decode_navigation_starting(std::span<const uint8_t> data)
{
    EvtNavigationStartingPayload p;
    PayloadDecoder               dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_URL)
            p.url = dec.as_string();
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

std::vector<uint8_t> encode_navigation_response(const RespNavigationPayload& p)
{
    PayloadEncoder enc;
    enc.put_bool(TAG_ALLOW, p.allow);
    return enc.take();
}

std::optional<RespNavigationPayload> decode_navigation_response(std::span<const uint8_t> data)
{
    RespNavigationPayload p;
    PayloadDecoder        dec(data);
    while (dec.next())
    {
        if (dec.tag() == TAG_ALLOW)
            p.allow = dec.as_bool();
    }
    if (dec.truncated())
        return std::nullopt;
    return p;
}

}   // namespace vesper::ipc
