#include <gtest/gtest.h>

#include "ipc/codec.hpp"
#include "ipc/message.hpp"
#include "ipc/transport.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

#include <unistd.h>

using namespace vesper;
using namespace vesper::ipc;

// ═══════════════════════════════════════════════════════════════════════════════
// Message Header Encode/Decode
// ═══════════════════════════════════════════════════════════════════════════════

TEST(IpcCodec, HeaderRoundTrip)
{
    MessageHeader hdr;
    hdr.type        = MessageType::EVT_RESOURCE_REQUEST;
    hdr.payload_len = 42;
    hdr.seq         = 123456789;
    hdr.request_id  = 99;

    std::vector<uint8_t> buf;
    encode_header(hdr, buf);
    ASSERT_EQ(buf.size(), HEADER_SIZE);
    EXPECT_EQ(buf[0], MAGIC_0);
    EXPECT_EQ(buf[1], MAGIC_1);

    auto decoded = decode_header(buf);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::EVT_RESOURCE_REQUEST);
    EXPECT_EQ(decoded->payload_len, 42u);
    EXPECT_EQ(decoded->seq, 123456789u);
    EXPECT_EQ(decoded->request_id, 99u);
}

TEST(IpcCodec, HeaderBadMagic)
{
    std::vector<uint8_t> buf(HEADER_SIZE, 0);
    buf[0] = 0xFF;
    buf[1] = 0xFF;
    EXPECT_FALSE(decode_header(buf).has_value());
}

TEST(IpcCodec, HeaderTooShort)
{
    std::vector<uint8_t> buf(10, 0);
    EXPECT_FALSE(decode_header(buf).has_value());
    EXPECT_FALSE(decode_header(std::vector<uint8_t>{}).has_value());
}

TEST(IpcCodec, MessageRoundTrip)
{
    Message msg;
    msg.header.type       = MessageType::REQ_NAVIGATE;
    msg.header.seq        = 5;
    msg.header.request_id = 6;
    msg.payload           = encode_req_navigate({"https://example.com/"});

    auto wire = encode_message(msg);
    ASSERT_EQ(wire.size(), HEADER_SIZE + msg.payload.size());

    auto decoded = decode_message(wire);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header.type, MessageType::REQ_NAVIGATE);
    EXPECT_EQ(decoded->header.payload_len, msg.payload.size());
    EXPECT_EQ(decoded->payload, msg.payload);
}

TEST(IpcCodec, MessageTruncatedPayload)
{
    Message msg;
    msg.header.type = MessageType::REQ_EXECUTE_SCRIPT;
    msg.payload     = encode_req_script({"console.log(1)"});

    auto wire = encode_message(msg);
    wire.resize(wire.size() - 3);
    EXPECT_FALSE(decode_message(wire).has_value());
}

TEST(IpcCodec, PayloadEncoderDecoder)
{
    PayloadEncoder enc;
    enc.put_u16(0x01, 7);
    enc.put_u32(0x02, 0xDEADBEEF);
    enc.put_u64(0x03, 0x0123456789ABCDEFull);
    enc.put_f64(0x04, -2.5);
    enc.put_bool(0x05, true);
    enc.put_string(0x06, "hello");
    enc.put_bytes(0x07, {1, 2, 3});
    auto data = enc.take();

    PayloadDecoder dec(data);
    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.tag(), 0x01);
    EXPECT_EQ(dec.as_u16(), 7u);
    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.as_u32(), 0xDEADBEEFu);
    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.as_u64(), 0x0123456789ABCDEFull);
    ASSERT_TRUE(dec.next());
    EXPECT_DOUBLE_EQ(dec.as_f64(), -2.5);
    ASSERT_TRUE(dec.next());
    EXPECT_TRUE(dec.as_bool());
    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.as_string(), "hello");
    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.as_bytes(), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_FALSE(dec.next());
    EXPECT_FALSE(dec.truncated());
}

TEST(IpcCodec, PayloadDecoderTruncated)
{
    PayloadEncoder enc;
    enc.put_string(0x01, "truncate me");
    auto data = enc.take();
    data.resize(data.size() - 4);

    PayloadDecoder dec(data);
    EXPECT_FALSE(dec.next());
    EXPECT_TRUE(dec.truncated());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════════════════════════

TEST(IpcCodec, HelloRoundTrip)
{
    HelloPayload hello;
    hello.engine_build = "versoview 0.0.7";
    hello.process_id   = 4242;

    auto decoded = decode_hello(encode_hello(hello));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->protocol_major, PROTOCOL_MAJOR);
    EXPECT_EQ(decoded->protocol_minor, PROTOCOL_MINOR);
    EXPECT_EQ(decoded->engine_build, "versoview 0.0.7");
    EXPECT_EQ(decoded->process_id, 4242u);
}

TEST(IpcCodec, InitCarriesSettings)
{
    InitPayload init;
    init.url                         = "tauri://localhost/";
    init.settings.title              = "Main";
    init.settings.position           = LogicalPosition{10.5, 20};
    init.settings.inner_size         = LogicalSize{1024, 768};
    init.settings.decorated          = false;
    init.settings.transparent        = true;
    init.settings.focused            = false;
    init.settings.theme              = Theme::Dark;
    init.settings.resource_directory = "/usr/share/app";
    init.settings.devtools_port      = 9222;
    init.settings.user_scripts       = {"a();", "b();"};

    auto decoded = decode_init(encode_init(init));
    ASSERT_TRUE(decoded.has_value());
    const auto& s = decoded->settings;
    EXPECT_EQ(decoded->url, "tauri://localhost/");
    EXPECT_EQ(s.title, std::optional<std::string>("Main"));
    EXPECT_EQ(s.position, std::optional<LogicalPosition>(LogicalPosition{10.5, 20}));
    EXPECT_EQ(s.inner_size, std::optional<LogicalSize>(LogicalSize{1024, 768}));
    EXPECT_FALSE(s.decorated);
    EXPECT_TRUE(s.transparent);
    EXPECT_FALSE(s.fullscreen);
    EXPECT_TRUE(s.visible);
    EXPECT_FALSE(s.focused);
    EXPECT_EQ(s.theme, std::optional<Theme>(Theme::Dark));
    EXPECT_EQ(s.resource_directory, std::optional<std::string>("/usr/share/app"));
    EXPECT_EQ(s.devtools_port, std::optional<uint16_t>(9222));
    EXPECT_EQ(s.user_scripts, (std::vector<std::string>{"a();", "b();"}));
}

TEST(IpcCodec, InitLeavesUnsetFieldsEmpty)
{
    InitPayload init;
    init.url = "https://example.com";

    auto decoded = decode_init(encode_init(init));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->settings.title.has_value());
    EXPECT_FALSE(decoded->settings.position.has_value());
    EXPECT_FALSE(decoded->settings.theme.has_value());
    EXPECT_TRUE(decoded->settings.user_scripts.empty());
}

TEST(IpcCodec, RespErrRoundTrip)
{
    auto decoded = decode_resp_err(encode_resp_err({404, "no such property"}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->code, 404u);
    EXPECT_EQ(decoded->message, "no such property");
}

TEST(IpcCodec, NavigateRequiresUrl)
{
    EXPECT_FALSE(decode_req_navigate(std::vector<uint8_t>{}).has_value());
    auto decoded = decode_req_navigate(encode_req_navigate({"https://example.com/a"}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->url, "https://example.com/a");
}

TEST(IpcCodec, PropertyRequests)
{
    auto get = decode_req_get(encode_req_get({Property::Fullscreen}));
    ASSERT_TRUE(get.has_value());
    EXPECT_EQ(get->property, Property::Fullscreen);

    ReqSetPayload set;
    set.property      = Property::InnerSize;
    set.value.unit    = Unit::Logical;
    set.value.a       = 640;
    set.value.b       = 480;
    auto decoded      = decode_req_set(encode_req_set(set));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->property, Property::InnerSize);
    EXPECT_EQ(decoded->value.unit, std::optional<Unit>(Unit::Logical));
    EXPECT_EQ(decoded->value.a, std::optional<double>(640));
    EXPECT_EQ(decoded->value.b, std::optional<double>(480));
    EXPECT_FALSE(decoded->value.flag.has_value());
    EXPECT_FALSE(decoded->value.text.has_value());
}

TEST(IpcCodec, PropertyValueKeepsOnlySetMembers)
{
    PropertyValue value;
    value.flag   = false;
    value.text   = "title";
    value.number = 1.25;

    auto decoded = decode_property_value(encode_property_value(value));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->flag, std::optional<bool>(false));
    EXPECT_EQ(decoded->text, std::optional<std::string>("title"));
    EXPECT_EQ(decoded->number, std::optional<double>(1.25));
    EXPECT_FALSE(decoded->a.has_value());
}

TEST(IpcCodec, ResourceRequestKeepsHeaderOrderAndDuplicates)
{
    EvtResourceRequestPayload event;
    event.request.method = "POST";
    event.request.uri    = "tauri://localhost/ipc";
    event.request.headers.append("Accept", "a");
    event.request.headers.append("X-Dup", "1");
    event.request.headers.append("X-Dup", "2");
    event.request.body = {0, 1, 2, 255};

    auto decoded = decode_resource_request(encode_resource_request(event));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->request.method, "POST");
    EXPECT_EQ(decoded->request.uri, "tauri://localhost/ipc");
    ASSERT_EQ(decoded->request.headers.size(), 3u);
    EXPECT_EQ(decoded->request.headers.entries()[1], (HeaderMap::Entry{"X-Dup", "1"}));
    EXPECT_EQ(decoded->request.headers.entries()[2], (HeaderMap::Entry{"X-Dup", "2"}));
    EXPECT_EQ(decoded->request.body, (std::vector<uint8_t>{0, 1, 2, 255}));
}

TEST(IpcCodec, ResourceResponse)
{
    RespResourcePayload handled;
    handled.handled         = true;
    handled.response.status = 404;
    handled.response.headers.append("Content-Type", "text/plain");
    handled.response.body = {'n', 'o'};

    auto decoded = decode_resource_response(encode_resource_response(handled));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->handled);
    EXPECT_EQ(decoded->response.status, 404);
    EXPECT_EQ(decoded->response.headers.get("content-type"), std::optional<std::string>("text/plain"));

    auto not_handled = decode_resource_response(encode_resource_response(RespResourcePayload{}));
    ASSERT_TRUE(not_handled.has_value());
    EXPECT_FALSE(not_handled->handled);
}

TEST(IpcCodec, Navigation)
{
    auto starting = decode_navigation_starting(encode_navigation_starting({"https://example.com/x"}));
    ASSERT_TRUE(starting.has_value());
    EXPECT_EQ(starting->url, "https://example.com/x");

    auto answer = decode_navigation_response(encode_navigation_response({false}));
    ASSERT_TRUE(answer.has_value());
    EXPECT_FALSE(answer->allow);
}

TEST(IpcMessage, MessageTypeNames)
{
    EXPECT_STREQ(to_string(MessageType::HELLO), "HELLO");
    EXPECT_STREQ(to_string(MessageType::REQ_EXIT), "REQ_EXIT");
    EXPECT_STREQ(to_string(MessageType::EVT_CLOSE_REQUESTED), "EVT_CLOSE_REQUESTED");
}

TEST(IpcMessage, HeaderSizeIs24)
{
    EXPECT_EQ(HEADER_SIZE, 24u);
    EXPECT_EQ(MAX_PAYLOAD_SIZE, 16u * 1024u * 1024u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transport: UDS Server/Client
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __linux__

static std::string test_socket_path(const char* tag)
{
    return "/tmp/vesper-test-" + std::string(tag) + "-" + std::to_string(::getpid()) + ".sock";
}

TEST(IpcTransport, EngineSocketPathsAreUnique)
{
    auto a = engine_socket_path();
    auto b = engine_socket_path();
    EXPECT_NE(a, b);
    EXPECT_NE(a.find("vesper-"), std::string::npos);
    EXPECT_NE(a.find(".sock"), std::string::npos);
}

TEST(IpcTransport, ServerListenAndClose)
{
    std::string sock_path = test_socket_path("listen");
    Server      server;
    ASSERT_TRUE(server.listen(sock_path));
    EXPECT_TRUE(server.is_listening());
    EXPECT_EQ(server.path(), sock_path);

    server.close();
    server.close();
    EXPECT_FALSE(server.is_listening());
    EXPECT_FALSE(std::filesystem::exists(sock_path));
}

TEST(IpcTransport, ClientConnectRefused)
{
    EXPECT_EQ(Client::connect(test_socket_path("nobody")), nullptr);
}

TEST(IpcTransport, AcceptForTimesOut)
{
    Server server;
    ASSERT_TRUE(server.listen(test_socket_path("timeout")));
    EXPECT_EQ(server.accept_for(std::chrono::milliseconds(20)), nullptr);
}

TEST(IpcTransport, ConnectionSendRecv)
{
    std::string sock_path = test_socket_path("sr");
    Server      server;
    ASSERT_TRUE(server.listen(sock_path));

    std::unique_ptr<Connection> client_conn;
    std::thread                 client_thread([&]() { client_conn = Client::connect(sock_path); });

    auto server_conn = server.accept_for(std::chrono::milliseconds(2000));
    client_thread.join();
    ASSERT_NE(server_conn, nullptr);
    ASSERT_NE(client_conn, nullptr);

    Message msg;
    msg.header.type = MessageType::HELLO;
    msg.header.seq  = 1;
    msg.payload     = encode_hello({});
    ASSERT_TRUE(client_conn->send(msg));

    auto received = server_conn->recv_for(std::chrono::milliseconds(2000));
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->header.type, MessageType::HELLO);
    EXPECT_TRUE(decode_hello(received->payload).has_value());

    // Nothing more to read.
    EXPECT_FALSE(server_conn->recv_for(std::chrono::milliseconds(10)).has_value());
}

TEST(IpcTransport, ShutdownWakesBlockedReader)
{
    std::string sock_path = test_socket_path("wake");
    Server      server;
    ASSERT_TRUE(server.listen(sock_path));

    auto client_conn = Client::connect(sock_path);
    auto server_conn = server.accept_for(std::chrono::milliseconds(2000));
    ASSERT_NE(client_conn, nullptr);
    ASSERT_NE(server_conn, nullptr);

    std::optional<Message> got = Message{};
    std::thread            reader([&] { got = server_conn->recv(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    server_conn->shutdown();
    reader.join();

    EXPECT_FALSE(got.has_value());
    EXPECT_TRUE(server_conn->is_open());
}

TEST(IpcTransport, PeerCloseEndsRecv)
{
    std::string sock_path = test_socket_path("eof");
    Server      server;
    ASSERT_TRUE(server.listen(sock_path));

    auto client_conn = Client::connect(sock_path);
    auto server_conn = server.accept_for(std::chrono::milliseconds(2000));
    ASSERT_NE(server_conn, nullptr);

    client_conn->close();
    EXPECT_FALSE(server_conn->recv().has_value());
}

TEST(IpcTransport, SendOnClosedConnection)
{
    Connection conn(-1);
    EXPECT_FALSE(conn.is_open());
    EXPECT_FALSE(conn.send(Message{}));
    EXPECT_FALSE(conn.recv().has_value());
}

#endif
