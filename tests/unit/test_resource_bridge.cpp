#include <gtest/gtest.h>

#include "protocol/resource_bridge.hpp"

#include <vesper/protocol.hpp>

#include "util/runtime_fixture.hpp"

#include <thread>

using namespace vesper;
using namespace vesper::test;

class ResourceBridgeTest : public ::testing::Test
{
   protected:
    void SetUp() override { channel_ = std::make_shared<CommandChannel>(); }

    std::shared_ptr<ResourceBridge> make_bridge(std::shared_ptr<const UriStrategy> strategy)
    {
        std::map<std::string, UriSchemeProtocolHandler> protocols;
        protocols["tauri"] = [this](const std::string& label, HttpRequest request, UriSchemeResponder respond)
        {
            seen_label_   = label;
            seen_request_ = std::move(request);
            HttpResponse response;
            response.status = 201;
            response.headers.append("Content-Type", "text/plain");
            response.body = {'o', 'k'};
            respond(std::move(response));
        };
        return std::make_shared<ResourceBridge>("main", std::move(strategy), CommandSender(channel_), protocols);
    }

    // Runs whatever the bridge queued, as the event loop would.
    size_t run_queued()
    {
        std::deque<Message> batch;
        channel_->take_all(batch);
        for (auto& message : batch)
            std::get<Task>(message.payload())();
        return batch.size();
    }

    static HttpRequest request(std::string uri)
    {
        HttpRequest r;
        r.uri = std::move(uri);
        return r;
    }

    std::shared_ptr<CommandChannel> channel_;
    std::string                     seen_label_;
    std::optional<HttpRequest>      seen_request_;
};

TEST_F(ResourceBridgeTest, MatchedRequestRunsHandlerOnOwningThread)
{
    auto bridge = make_bridge(std::make_shared<DirectSchemeStrategy>());

    std::optional<std::optional<HttpResponse>> answer;
    bridge->handle(request("tauri://localhost/index.html"),
                   [&](std::optional<HttpResponse> r) { answer = std::move(r); });

    // Nothing runs until the loop takes the task.
    EXPECT_FALSE(answer.has_value());
    EXPECT_EQ(run_queued(), 1u);

    ASSERT_TRUE(answer.has_value());
    ASSERT_TRUE(answer->has_value());
    EXPECT_EQ((*answer)->status, 201);
    EXPECT_EQ((*answer)->body, (std::vector<uint8_t>{'o', 'k'}));

    EXPECT_EQ(seen_label_, "main");
    ASSERT_TRUE(seen_request_.has_value());
    EXPECT_EQ(seen_request_->uri, "tauri://localhost/index.html");
}

TEST_F(ResourceBridgeTest, UnmatchedRequestIsNotHandled)
{
    auto bridge = make_bridge(std::make_shared<DirectSchemeStrategy>());

    std::optional<std::optional<HttpResponse>> answer;
    bridge->handle(request("https://example.com/app.js"),
                   [&](std::optional<HttpResponse> r) { answer = std::move(r); });

    ASSERT_TRUE(answer.has_value());
    EXPECT_FALSE(answer->has_value());
    EXPECT_EQ(run_queued(), 0u);
}

TEST_F(ResourceBridgeTest, WorkaroundRewritesUri)
{
    auto bridge = make_bridge(std::make_shared<HttpWorkaroundStrategy>(false));
    bridge->handle(request("http://tauri.localhost/assets/app.js"), [](std::optional<HttpResponse>) {});
    run_queued();

    ASSERT_TRUE(seen_request_.has_value());
    EXPECT_EQ(seen_request_->uri, "tauri://localhost/assets/app.js");
    EXPECT_EQ(seen_request_->headers.get("Origin"), std::optional<std::string>("http://tauri.localhost"));
}

TEST_F(ResourceBridgeTest, OriginInjectedOnlyWhenMissing)
{
    auto bridge = make_bridge(std::make_shared<DirectSchemeStrategy>());

    bridge->handle(request("tauri://localhost/"), [](std::optional<HttpResponse>) {});
    run_queued();
    EXPECT_EQ(seen_request_->headers.get("Origin"), std::optional<std::string>("tauri://localhost"));

    auto with_origin = request("tauri://localhost/");
    with_origin.headers.append("origin", "https://app.example");
    bridge->handle(std::move(with_origin), [](std::optional<HttpResponse>) {});
    run_queued();
    EXPECT_EQ(seen_request_->headers.get("Origin"), std::optional<std::string>("https://app.example"));
    EXPECT_EQ(seen_request_->headers.size(), 1u);
}

TEST_F(ResourceBridgeTest, InvokeBodyHeaderBecomesBody)
{
    auto bridge = make_bridge(std::make_shared<DirectSchemeStrategy>());

    auto invoke   = request("tauri://localhost/ipc/ping");
    invoke.method = "POST";
    invoke.headers.append(std::string(INVOKE_BODY_HEADER), "%7B%22value%22%3A42%7D");
    bridge->handle(std::move(invoke), [](std::optional<HttpResponse>) {});
    run_queued();

    ASSERT_TRUE(seen_request_.has_value());
    EXPECT_EQ(seen_request_->method, "POST");
    EXPECT_FALSE(seen_request_->headers.contains(INVOKE_BODY_HEADER));
    std::string body(seen_request_->body.begin(), seen_request_->body.end());
    EXPECT_EQ(body, "{\"value\":42}");
}

TEST_F(ResourceBridgeTest, MalformedInvokeBodyLeavesBodyEmpty)
{
    auto bridge = make_bridge(std::make_shared<DirectSchemeStrategy>());

    auto invoke = request("tauri://localhost/ipc/ping");
    invoke.body = {'s', 't', 'a', 'l', 'e'};
    invoke.headers.append(std::string(INVOKE_BODY_HEADER), "%FF%FE");
    bridge->handle(std::move(invoke), [](std::optional<HttpResponse>) {});
    run_queued();

    ASSERT_TRUE(seen_request_.has_value());
    EXPECT_TRUE(seen_request_->body.empty());
    EXPECT_FALSE(seen_request_->headers.contains(INVOKE_BODY_HEADER));
}

TEST_F(ResourceBridgeTest, ClosedChannelAnswersNotHandled)
{
    auto bridge = make_bridge(std::make_shared<DirectSchemeStrategy>());
    channel_->close();

    std::optional<std::optional<HttpResponse>> answer;
    bridge->handle(request("tauri://localhost/"), [&](std::optional<HttpResponse> r) { answer = std::move(r); });
    ASSERT_TRUE(answer.has_value());
    EXPECT_FALSE(answer->has_value());
    EXPECT_FALSE(seen_request_.has_value());
}

// ─── Through the runtime ────────────────────────────────────────────────────

using ResourceRequests = RuntimeFixture;

TEST_F(ResourceRequests, EngineRequestReachesRegisteredProtocol)
{
    auto pending = make_pending("main", "tauri://localhost/index.html");

    std::thread::id handler_thread;
    pending.webview->register_uri_scheme_protocol(
        "tauri",
        [&](const std::string& label, HttpRequest req, UriSchemeResponder respond)
        {
            handler_thread = std::this_thread::get_id();
            HttpResponse response;
            std::string  text = label + " " + req.uri;
            response.body.assign(text.begin(), text.end());
            respond(std::move(response));
        });
    auto window = runtime_->create_window(std::move(pending));
    auto engine = launcher_->last();

    std::optional<std::optional<HttpResponse>> answer;
    std::thread engine_thread(
        [&]
        {
            HttpRequest req;
            req.uri = "tauri://localhost/index.html";
            engine->fire_resource_request(std::move(req),
                                          [&](std::optional<HttpResponse> r) { answer = std::move(r); });
        });
    engine_thread.join();

    runtime_->run_iteration(recorder());
    EXPECT_EQ(handler_thread, std::this_thread::get_id());
    ASSERT_TRUE(answer.has_value());
    ASSERT_TRUE(answer->has_value());
    EXPECT_EQ(std::string((*answer)->body.begin(), (*answer)->body.end()),
              "main tauri://localhost/index.html");
}
