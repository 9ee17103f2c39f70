#include "process_engine.hpp"

#include "ipc/codec.hpp"

#include <vesper/error.hpp>
#include <vesper/logger.hpp>

#include <atomic>
#include <future>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace vesper::engine
{

using ReplyPromise = std::promise<std::optional<ipc::Message>>;

static constexpr std::chrono::milliseconds TERMINATE_GRACE{2000};

// State shared by a controller, its reader thread and any resource
// responders still in flight.
struct EngineSession
{
    explicit EngineSession(std::unique_ptr<ipc::Connection> conn)
        : connection(std::move(conn))
    {
    }

    bool send(ipc::MessageType type, ipc::RequestId request_id, std::vector<uint8_t> payload)
    {
        std::lock_guard lock(write_mu);
        if (!connection || !connection->is_open())
            return false;

        ipc::Message msg;
        msg.header.type       = type;
        msg.header.seq        = next_seq++;
        msg.header.request_id = request_id;
        msg.payload           = std::move(payload);
        return connection->send(msg);
    }

    // Called once the connection is gone: every waiter gets nullopt.
    void fail_pending()
    {
        std::unordered_map<ipc::RequestId, std::shared_ptr<ReplyPromise>> failed;
        {
            std::lock_guard lock(pending_mu);
            disconnected = true;
            failed.swap(pending);
        }
        for (auto& [id, promise] : failed)
            promise->set_value(std::nullopt);
    }

    void complete(ipc::Message reply)
    {
        std::shared_ptr<ReplyPromise> promise;
        {
            std::lock_guard lock(pending_mu);
            auto            it = pending.find(reply.header.request_id);
            if (it == pending.end())
            {
                VESPER_LOG_DEBUG("engine",
                                 "Dropping late reply to request {}",
                                 reply.header.request_id);
                return;
            }
            promise = std::move(it->second);
            pending.erase(it);
        }
        promise->set_value(std::move(reply));
    }

    std::mutex                       write_mu;
    std::unique_ptr<ipc::Connection> connection;
    uint64_t                         next_seq = 1;

    std::atomic<ipc::RequestId> next_request_id{1};

    std::mutex                                                        pending_mu;
    std::unordered_map<ipc::RequestId, std::shared_ptr<ReplyPromise>> pending;
    bool                                                              disconnected = false;

    std::mutex             handlers_mu;
    CloseRequestedHandler  on_close;
    ResourceRequestHandler on_resource;
    NavigationHandler      on_navigation;
};

// ─── Reader thread ───────────────────────────────────────────────────────────

static void handle_resource_request(const std::shared_ptr<EngineSession>& session,
                                    const ipc::Message&                   msg)
{
    const ipc::RequestId id = msg.header.request_id;

    auto reply = [session, id](std::optional<HttpResponse> response)
    {
        ipc::RespResourcePayload payload;
        payload.handled = response.has_value();
        if (response)
            payload.response = std::move(*response);
        if (!session->send(ipc::MessageType::RESP_RESOURCE, id, ipc::encode_resource_response(payload)))
            VESPER_LOG_WARN("engine", "Could not answer resource request {}: engine is gone", id);
    };

    auto event = ipc::decode_resource_request(msg.payload);
    if (!event)
    {
        VESPER_LOG_ERROR("ipc", "Malformed EVT_RESOURCE_REQUEST {}", id);
        reply(std::nullopt);
        return;
    }

    ResourceRequestHandler handler;
    {
        std::lock_guard lock(session->handlers_mu);
        handler = session->on_resource;
    }
    if (!handler)
    {
        reply(std::nullopt);
        return;
    }
    handler(std::move(event->request), std::move(reply));
}

static void handle_navigation_starting(const std::shared_ptr<EngineSession>& session,
                                       const ipc::Message&                   msg)
{
    ipc::RespNavigationPayload answer;

    auto event = ipc::decode_navigation_starting(msg.payload);
    if (!event)
    {
        VESPER_LOG_ERROR("ipc", "Malformed EVT_NAVIGATION_STARTING {}", msg.header.request_id);
    }
    else
    {
        NavigationHandler handler;
        {
            std::lock_guard lock(session->handlers_mu);
            handler = session->on_navigation;
        }
        if (handler)
            answer.allow = handler(event->url);
    }

    if (!session->send(ipc::MessageType::RESP_NAVIGATION,
                       msg.header.request_id,
                       ipc::encode_navigation_response(answer)))
        VESPER_LOG_WARN("engine", "Could not answer navigation {}: engine is gone", msg.header.request_id);
}

static void reader_loop(std::shared_ptr<EngineSession> session)
{
    while (auto msg = session->connection->recv())
    {
        switch (msg->header.type)
        {
            case ipc::MessageType::RESP_OK:
            case ipc::MessageType::RESP_ERR: session->complete(std::move(*msg)); break;

            case ipc::MessageType::EVT_CLOSE_REQUESTED:
            {
                CloseRequestedHandler handler;
                {
                    std::lock_guard lock(session->handlers_mu);
                    handler = session->on_close;
                }
                if (handler)
                    handler();
                break;
            }

            case ipc::MessageType::EVT_RESOURCE_REQUEST: handle_resource_request(session, *msg); break;

            case ipc::MessageType::EVT_NAVIGATION_STARTING:
                handle_navigation_starting(session, *msg);
                break;

            default:
                VESPER_LOG_DEBUG("ipc", "Ignoring unexpected {} from engine", ipc::to_string(msg->header.type));
                break;
        }
    }

    VESPER_LOG_DEBUG("engine", "Engine connection closed");
    session->fail_pending();

    std::lock_guard lock(session->write_mu);
    session->connection->close();
}

// ─── ProcessEngineController ─────────────────────────────────────────────────

ProcessEngineController::ProcessEngineController(std::unique_ptr<ipc::Connection> connection,
                                                 std::shared_ptr<ProcessManager>  processes,
                                                 pid_t                            pid,
                                                 std::chrono::milliseconds        request_timeout)
    : session_(std::make_shared<EngineSession>(std::move(connection))),
      processes_(std::move(processes)),
      pid_(pid),
      request_timeout_(request_timeout)
{
    reader_ = std::thread(reader_loop, session_);
}

ProcessEngineController::~ProcessEngineController()
{
    if (!exit())
        VESPER_LOG_WARN("engine", "Engine pid={} did not shut down cleanly", pid_);
}

bool ProcessEngineController::is_connected() const
{
    std::lock_guard lock(session_->pending_mu);
    return !session_->disconnected;
}

std::optional<ipc::Message> ProcessEngineController::request(ipc::MessageType     type,
                                                             std::vector<uint8_t> payload)
{
    if (std::this_thread::get_id() == reader_.get_id())
    {
        VESPER_LOG_ERROR("engine",
                         "{} issued from an engine callback; engine calls are not allowed there",
                         ipc::to_string(type));
        return std::nullopt;
    }

    const ipc::RequestId id      = session_->next_request_id.fetch_add(1);
    auto                 promise = std::make_shared<ReplyPromise>();
    auto                 future  = promise->get_future();
    {
        std::lock_guard lock(session_->pending_mu);
        if (session_->disconnected)
            return std::nullopt;
        session_->pending[id] = promise;
    }

    auto forget = [&]
    {
        std::lock_guard lock(session_->pending_mu);
        session_->pending.erase(id);
    };

    if (!session_->send(type, id, std::move(payload)))
    {
        forget();
        VESPER_LOG_WARN("engine", "Failed to send {} to engine pid={}", ipc::to_string(type), pid_);
        return std::nullopt;
    }

    if (future.wait_for(request_timeout_) != std::future_status::ready)
    {
        forget();
        VESPER_LOG_WARN("engine",
                        "{} to engine pid={} timed out after {} ms",
                        ipc::to_string(type),
                        pid_,
                        static_cast<long long>(request_timeout_.count()));
        return std::nullopt;
    }
    return future.get();
}

bool ProcessEngineController::request_ok(ipc::MessageType type, std::vector<uint8_t> payload)
{
    auto reply = request(type, std::move(payload));
    if (!reply)
        return false;

    if (reply->header.type == ipc::MessageType::RESP_ERR)
    {
        auto err = ipc::decode_resp_err(reply->payload);
        VESPER_LOG_WARN("engine",
                        "Engine rejected {}: {}",
                        ipc::to_string(type),
                        err ? err->message : std::string("(malformed error)"));
        return false;
    }
    return reply->header.type == ipc::MessageType::RESP_OK;
}

std::optional<ipc::PropertyValue> ProcessEngineController::get(ipc::Property property)
{
    auto reply = request(ipc::MessageType::REQ_GET, ipc::encode_req_get({property}));
    if (!reply || reply->header.type != ipc::MessageType::RESP_OK)
        return std::nullopt;
    return ipc::decode_property_value(reply->payload);
}

bool ProcessEngineController::set(ipc::Property property, ipc::PropertyValue value)
{
    return request_ok(ipc::MessageType::REQ_SET, ipc::encode_req_set({property, std::move(value)}));
}

bool ProcessEngineController::navigate(const std::string& url)
{
    return request_ok(ipc::MessageType::REQ_NAVIGATE, ipc::encode_req_navigate({url}));
}

bool ProcessEngineController::execute_script(const std::string& script)
{
    return request_ok(ipc::MessageType::REQ_EXECUTE_SCRIPT, ipc::encode_req_script({script}));
}

bool ProcessEngineController::reload()
{
    return request_ok(ipc::MessageType::REQ_RELOAD);
}

std::optional<std::string> ProcessEngineController::current_url()
{
    auto value = get(ipc::Property::Url);
    if (!value)
        return std::nullopt;
    return value->text;
}

std::optional<std::string> ProcessEngineController::title()
{
    auto value = get(ipc::Property::Title);
    if (!value)
        return std::nullopt;
    return value->text;
}

bool ProcessEngineController::set_title(const std::string& title)
{
    ipc::PropertyValue value;
    value.text = title;
    return set(ipc::Property::Title, std::move(value));
}

std::optional<PhysicalSize<uint32_t>> ProcessEngineController::inner_size()
{
    auto value = get(ipc::Property::InnerSize);
    if (!value || !value->a || !value->b)
        return std::nullopt;
    return PhysicalSize<uint32_t>{static_cast<uint32_t>(*value->a), static_cast<uint32_t>(*value->b)};
}

bool ProcessEngineController::set_size(const Size& size)
{
    ipc::PropertyValue value;
    std::visit(
        [&](const auto& s)
        {
            using T    = std::decay_t<decltype(s)>;
            value.unit = std::is_same_v<T, LogicalSize> ? ipc::Unit::Logical : ipc::Unit::Physical;
            value.a    = static_cast<double>(s.width);
            value.b    = static_cast<double>(s.height);
        },
        size);
    return set(ipc::Property::InnerSize, std::move(value));
}

std::optional<PhysicalPosition<int32_t>> ProcessEngineController::position()
{
    auto value = get(ipc::Property::Position);
    if (!value)
        return std::nullopt;
    // Engines on platforms without window positions answer without one.
    if (!value->a || !value->b)
        return PhysicalPosition<int32_t>{};
    return PhysicalPosition<int32_t>{static_cast<int32_t>(*value->a), static_cast<int32_t>(*value->b)};
}

bool ProcessEngineController::set_position(const Position& position)
{
    ipc::PropertyValue value;
    std::visit(
        [&](const auto& p)
        {
            using T    = std::decay_t<decltype(p)>;
            value.unit = std::is_same_v<T, LogicalPosition> ? ipc::Unit::Logical : ipc::Unit::Physical;
            value.a    = static_cast<double>(p.x);
            value.b    = static_cast<double>(p.y);
        },
        position);
    return set(ipc::Property::Position, std::move(value));
}

std::optional<double> ProcessEngineController::scale_factor()
{
    auto value = get(ipc::Property::ScaleFactor);
    if (!value)
        return std::nullopt;
    return value->number;
}

static std::optional<bool> flag_of(const std::optional<ipc::PropertyValue>& value)
{
    if (!value)
        return std::nullopt;
    return value->flag;
}

static ipc::PropertyValue flag_value(bool flag)
{
    ipc::PropertyValue value;
    value.flag = flag;
    return value;
}

std::optional<bool> ProcessEngineController::is_fullscreen()
{
    return flag_of(get(ipc::Property::Fullscreen));
}

bool ProcessEngineController::set_fullscreen(bool fullscreen)
{
    return set(ipc::Property::Fullscreen, flag_value(fullscreen));
}

std::optional<bool> ProcessEngineController::is_minimized()
{
    return flag_of(get(ipc::Property::Minimized));
}

bool ProcessEngineController::set_minimized(bool minimized)
{
    return set(ipc::Property::Minimized, flag_value(minimized));
}

std::optional<bool> ProcessEngineController::is_maximized()
{
    return flag_of(get(ipc::Property::Maximized));
}

bool ProcessEngineController::set_maximized(bool maximized)
{
    return set(ipc::Property::Maximized, flag_value(maximized));
}

std::optional<bool> ProcessEngineController::is_visible()
{
    return flag_of(get(ipc::Property::Visible));
}

bool ProcessEngineController::set_visible(bool visible)
{
    return set(ipc::Property::Visible, flag_value(visible));
}

bool ProcessEngineController::focus()
{
    return request_ok(ipc::MessageType::REQ_FOCUS);
}

bool ProcessEngineController::set_window_level(WindowLevel level)
{
    ipc::PropertyValue value;
    value.number = static_cast<double>(static_cast<uint32_t>(level));
    return set(ipc::Property::WindowLevel, std::move(value));
}

bool ProcessEngineController::start_dragging()
{
    return request_ok(ipc::MessageType::REQ_START_DRAGGING);
}

bool ProcessEngineController::exit()
{
    {
        std::lock_guard lock(exit_mu_);
        if (exited_)
            return true;
        exited_ = true;
    }

    bool acknowledged = request_ok(ipc::MessageType::REQ_EXIT);

    {
        std::lock_guard lock(session_->write_mu);
        session_->connection->shutdown();
    }
    if (reader_.joinable())
    {
        if (std::this_thread::get_id() == reader_.get_id())
            reader_.detach();
        else
            reader_.join();
    }

    bool terminated = false;
    if (pid_ > 0 && processes_)
        terminated = processes_->terminate(pid_, TERMINATE_GRACE);

    VESPER_LOG_INFO("engine", "Engine pid={} shut down", pid_);
    return acknowledged || terminated;
}

bool ProcessEngineController::on_close_requested(CloseRequestedHandler handler)
{
    std::lock_guard lock(session_->handlers_mu);
    session_->on_close = std::move(handler);
    return true;
}

bool ProcessEngineController::on_resource_requested(ResourceRequestHandler handler)
{
    std::lock_guard lock(session_->handlers_mu);
    session_->on_resource = std::move(handler);
    return true;
}

bool ProcessEngineController::on_navigation_starting(NavigationHandler handler)
{
    std::lock_guard lock(session_->handlers_mu);
    session_->on_navigation = std::move(handler);
    return true;
}

// ─── Handshake ───────────────────────────────────────────────────────────────

std::optional<ipc::HelloPayload> perform_handshake(ipc::Connection&          connection,
                                                   const ipc::InitPayload&   init,
                                                   std::chrono::milliseconds timeout)
{
    auto hello_msg = connection.recv_for(timeout);
    if (!hello_msg || hello_msg->header.type != ipc::MessageType::HELLO)
    {
        VESPER_LOG_ERROR("ipc", "Engine did not send HELLO");
        return std::nullopt;
    }

    auto hello = ipc::decode_hello(hello_msg->payload);
    if (!hello)
    {
        VESPER_LOG_ERROR("ipc", "Malformed HELLO from engine");
        return std::nullopt;
    }
    if (hello->protocol_major != ipc::PROTOCOL_MAJOR)
    {
        VESPER_LOG_ERROR("ipc",
                         "Engine speaks protocol {}.{}, expected {}.x",
                         hello->protocol_major,
                         hello->protocol_minor,
                         ipc::PROTOCOL_MAJOR);
        return std::nullopt;
    }

    ipc::Message init_msg;
    init_msg.header.type = ipc::MessageType::INIT;
    init_msg.payload     = ipc::encode_init(init);
    if (!connection.send(init_msg))
    {
        VESPER_LOG_ERROR("ipc", "Failed to send INIT to engine");
        return std::nullopt;
    }

    auto ready = connection.recv_for(timeout);
    if (!ready || ready->header.type != ipc::MessageType::READY)
    {
        VESPER_LOG_ERROR("ipc", "Engine did not report READY");
        return std::nullopt;
    }

    VESPER_LOG_DEBUG("ipc", "Handshake complete with engine build '{}'", hello->engine_build);
    return hello;
}

// ─── ProcessEngineLauncher ───────────────────────────────────────────────────

ProcessEngineLauncher::ProcessEngineLauncher(const RuntimeConfig& config)
    : engine_path_(config.engine_path()),
      launch_timeout_(config.launch_timeout),
      request_timeout_(config.request_timeout),
      processes_(std::make_shared<ProcessManager>())
{
}

std::vector<std::string> ProcessEngineLauncher::engine_arguments(const std::string&    socket_path,
                                                                 const std::string&    url,
                                                                 const EngineSettings& settings)
{
    std::vector<std::string> args = {"--ipc-socket", socket_path, "--url", url};
    if (settings.resource_directory)
    {
        args.push_back("--resources");
        args.push_back(*settings.resource_directory);
    }
    if (settings.devtools_port)
    {
        args.push_back("--devtools-port");
        args.push_back(std::to_string(*settings.devtools_port));
    }
    return args;
}

std::shared_ptr<EngineController> ProcessEngineLauncher::launch(const EngineSettings& settings,
                                                                const std::string&    url)
{
    if (!engine_path_)
        throw RuntimeError(ErrorCode::ConfigMissing, "engine path is not set");

    const std::string socket_path = ipc::engine_socket_path();
    ipc::Server       server;
    if (!server.listen(socket_path))
        throw RuntimeError(ErrorCode::EngineLaunch, "cannot listen on " + socket_path);

    pid_t pid = processes_->spawn(*engine_path_, engine_arguments(socket_path, url, settings));
    if (pid < 0)
        throw RuntimeError(ErrorCode::EngineLaunch, "cannot start " + *engine_path_);

    auto give_up = [&](const std::string& reason) -> RuntimeError
    {
        if (processes_->is_alive(pid) && !processes_->terminate(pid, TERMINATE_GRACE))
            VESPER_LOG_WARN("engine", "Could not terminate engine pid={}", pid);
        return RuntimeError(ErrorCode::EngineLaunch, reason);
    };

    // Poll so an engine that dies on startup is noticed before the timeout.
    const auto                       deadline = std::chrono::steady_clock::now() + launch_timeout_;
    std::unique_ptr<ipc::Connection> connection;
    while (!connection)
    {
        connection = server.accept_for(std::chrono::milliseconds(100));
        if (connection)
            break;
        if (!processes_->is_alive(pid))
            throw give_up("engine exited before connecting");
        if (std::chrono::steady_clock::now() >= deadline)
            throw give_up("engine did not connect within "
                          + std::to_string(launch_timeout_.count()) + " ms");
    }
    server.close();

    if (!perform_handshake(*connection, ipc::InitPayload{url, settings}, launch_timeout_))
        throw give_up("engine handshake failed");

    VESPER_LOG_INFO("engine", "Engine pid={} connected for {}", pid, url);
    return std::make_shared<ProcessEngineController>(std::move(connection),
                                                     processes_,
                                                     pid,
                                                     request_timeout_);
}

}   // namespace vesper::engine

namespace vesper
{

std::shared_ptr<EngineLauncher> make_process_engine_launcher(const RuntimeConfig& config)
{
    return std::make_shared<engine::ProcessEngineLauncher>(config);
}

}   // namespace vesper
