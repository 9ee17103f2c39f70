#include <vesper/config.hpp>

#include <vesper/error.hpp>
#include <vesper/logger.hpp>

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace vesper
{

void RuntimeConfig::set_engine_path(std::string path)
{
    if (engine_path_)
        throw RuntimeError(ErrorCode::ConfigAlreadySet, "engine path");
    engine_path_ = std::move(path);
}

void RuntimeConfig::set_resource_directory(std::string path)
{
    if (resource_directory_)
        throw RuntimeError(ErrorCode::ConfigAlreadySet, "resource directory");
    resource_directory_ = std::move(path);
}

void RuntimeConfig::set_devtools_port(uint16_t port)
{
    if (devtools_port_)
        throw RuntimeError(ErrorCode::ConfigAlreadySet, "devtools port");
    devtools_port_ = port;
}

RuntimeConfig RuntimeConfig::from_environment()
{
    RuntimeConfig config;

    const char* engine = std::getenv("VESPER_ENGINE_PATH");
    if (engine && engine[0] != '\0')
        config.set_engine_path(engine);

    const char* resources = std::getenv("VESPER_RESOURCE_DIR");
    if (resources && resources[0] != '\0')
        config.set_resource_directory(resources);

    const char* port = std::getenv("VESPER_DEVTOOLS_PORT");
    if (port && port[0] != '\0')
    {
        uint16_t value = 0;
        const char* end = port + std::strlen(port);
        auto [ptr, ec]  = std::from_chars(port, end, value);
        if (ec == std::errc() && ptr == end)
            config.set_devtools_port(value);
        else
            VESPER_LOG_WARN("config", "Ignoring malformed VESPER_DEVTOOLS_PORT '{}'", port);
    }

    return config;
}

ProtocolStrategy resolve_protocol_strategy(ProtocolStrategy requested)
{
    if (requested != ProtocolStrategy::PlatformDefault)
        return requested;
#ifdef _WIN32
    return ProtocolStrategy::HttpWorkaround;
#else
    return ProtocolStrategy::DirectScheme;
#endif
}

}   // namespace vesper
