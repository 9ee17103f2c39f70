#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vesper
{

// How custom-protocol requests reach the runtime.  Some transports can only
// route http(s) and deliver `{protocol}://rest` as `http://{protocol}.rest`.
enum class ProtocolStrategy
{
    PlatformDefault,   // HttpWorkaround on Windows, DirectScheme elsewhere
    DirectScheme,
    HttpWorkaround,
};

// Process-wide settings for the runtime and the engines it launches.
// Build one, then hand it to the Runtime constructor; the runtime keeps a
// const copy, so nothing can change after the first window exists.
//
// The engine path, resource directory and devtools port are set-once: a
// second call to the same setter throws RuntimeError(ConfigAlreadySet).
class RuntimeConfig
{
   public:
    void set_engine_path(std::string path);
    void set_resource_directory(std::string path);
    void set_devtools_port(uint16_t port);

    const std::optional<std::string>& engine_path() const { return engine_path_; }
    const std::optional<std::string>& resource_directory() const { return resource_directory_; }
    std::optional<uint16_t>           devtools_port() const { return devtools_port_; }

    // Reads VESPER_ENGINE_PATH, VESPER_RESOURCE_DIR and VESPER_DEVTOOLS_PORT.
    // Unset variables leave the value empty; a malformed port is logged
    // and ignored.
    static RuntimeConfig from_environment();

    // How long to wait for a spawned engine to connect and say hello.
    std::chrono::milliseconds launch_timeout{10000};

    // How long a synchronous engine call may take before it fails.
    std::chrono::milliseconds request_timeout{5000};

    ProtocolStrategy protocol_strategy = ProtocolStrategy::PlatformDefault;

    // Default for webviews that do not choose: serve custom protocols as
    // https://{protocol}.rest instead of http:// under the work-around.
    bool use_https_scheme = false;

   private:
    std::optional<std::string> engine_path_;
    std::optional<std::string> resource_directory_;
    std::optional<uint16_t>    devtools_port_;
};

// Resolves PlatformDefault for the current build target.
ProtocolStrategy resolve_protocol_strategy(ProtocolStrategy requested);

}   // namespace vesper
