#pragma once

#include "ipc/message.hpp"
#include "ipc/transport.hpp"
#include "process_manager.hpp"

#include <vesper/config.hpp>
#include <vesper/engine.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vesper::engine
{

struct EngineSession;

// EngineController over a connection to an engine process.
//
// A reader thread owns the receiving side: it matches replies to pending
// requests by request id and runs the registered callbacks.  Requests block
// the calling thread until the reply arrives, the request times out, or the
// connection drops.  Callbacks must not make blocking engine calls: those
// fail immediately when issued from the reader thread.
class ProcessEngineController final : public EngineController
{
   public:
    // Takes over a connection that has completed the handshake.  `pid` is
    // the engine process to terminate on exit; <= 0 when there is none.
    ProcessEngineController(std::unique_ptr<ipc::Connection> connection,
                            std::shared_ptr<ProcessManager>  processes,
                            pid_t                            pid,
                            std::chrono::milliseconds        request_timeout);
    ~ProcessEngineController() override;

    ProcessEngineController(const ProcessEngineController&)            = delete;
    ProcessEngineController& operator=(const ProcessEngineController&) = delete;

    bool navigate(const std::string& url) override;
    bool execute_script(const std::string& script) override;
    bool reload() override;

    std::optional<std::string> current_url() override;
    std::optional<std::string> title() override;
    bool                       set_title(const std::string& title) override;

    std::optional<PhysicalSize<uint32_t>>    inner_size() override;
    bool                                     set_size(const Size& size) override;
    std::optional<PhysicalPosition<int32_t>> position() override;
    bool                                     set_position(const Position& position) override;
    std::optional<double>                    scale_factor() override;

    std::optional<bool> is_fullscreen() override;
    bool                set_fullscreen(bool fullscreen) override;
    std::optional<bool> is_minimized() override;
    bool                set_minimized(bool minimized) override;
    std::optional<bool> is_maximized() override;
    bool                set_maximized(bool maximized) override;
    std::optional<bool> is_visible() override;
    bool                set_visible(bool visible) override;

    bool focus() override;
    bool set_window_level(WindowLevel level) override;
    bool start_dragging() override;

    // Sends REQ_EXIT, drops the connection and terminates the process.
    bool exit() override;

    bool on_close_requested(CloseRequestedHandler handler) override;
    bool on_resource_requested(ResourceRequestHandler handler) override;
    bool on_navigation_starting(NavigationHandler handler) override;

    pid_t pid() const { return pid_; }
    bool  is_connected() const;

   private:
    // Reply to `type`, or nullopt on timeout / disconnect.
    std::optional<ipc::Message> request(ipc::MessageType type, std::vector<uint8_t> payload = {});

    // True if the engine answered RESP_OK.
    bool request_ok(ipc::MessageType type, std::vector<uint8_t> payload = {});

    std::optional<ipc::PropertyValue> get(ipc::Property property);
    bool                              set(ipc::Property property, ipc::PropertyValue value);

    std::shared_ptr<EngineSession>  session_;
    std::shared_ptr<ProcessManager> processes_;
    pid_t                           pid_;
    std::chrono::milliseconds       request_timeout_;
    std::thread                     reader_;

    std::mutex exit_mu_;
    bool       exited_ = false;
};

// Runtime side of the handshake: waits for HELLO, checks the protocol
// version, sends INIT and waits for READY.  Returns the engine's HELLO, or
// nullopt (logged) on any failure.
std::optional<ipc::HelloPayload> perform_handshake(ipc::Connection&          connection,
                                                   const ipc::InitPayload&   init,
                                                   std::chrono::milliseconds timeout);

// Spawns the engine executable and connects to it:
//   <engine> --ipc-socket <path> --url <url> [--resources <dir>] [--devtools-port <n>]
class ProcessEngineLauncher final : public EngineLauncher
{
   public:
    explicit ProcessEngineLauncher(const RuntimeConfig& config);

    std::shared_ptr<EngineController> launch(const EngineSettings& settings,
                                             const std::string&    url) override;

    // Command line for one engine, without the executable.
    static std::vector<std::string> engine_arguments(const std::string&    socket_path,
                                                     const std::string&    url,
                                                     const EngineSettings& settings);

    ProcessManager& processes() { return *processes_; }

   private:
    std::optional<std::string>      engine_path_;
    std::chrono::milliseconds       launch_timeout_;
    std::chrono::milliseconds       request_timeout_;
    std::shared_ptr<ProcessManager> processes_;
};

}   // namespace vesper::engine
