#include <gtest/gtest.h>

#include <vesper/config.hpp>
#include <vesper/error.hpp>
#include <vesper/logger.hpp>

#include <cstdlib>
#include <string>

using namespace vesper;

// ─── RuntimeConfig ───────────────────────────────────────────────────────────

TEST(RuntimeConfig, Defaults)
{
    RuntimeConfig config;
    EXPECT_FALSE(config.engine_path().has_value());
    EXPECT_FALSE(config.resource_directory().has_value());
    EXPECT_FALSE(config.devtools_port().has_value());
    EXPECT_EQ(config.launch_timeout.count(), 10000);
    EXPECT_EQ(config.request_timeout.count(), 5000);
    EXPECT_EQ(config.protocol_strategy, ProtocolStrategy::PlatformDefault);
    EXPECT_FALSE(config.use_https_scheme);
}

TEST(RuntimeConfig, EnginePathIsSetOnce)
{
    RuntimeConfig config;
    config.set_engine_path("/opt/engine/versoview");
    EXPECT_EQ(config.engine_path(), std::optional<std::string>("/opt/engine/versoview"));

    try
    {
        config.set_engine_path("/elsewhere");
        FAIL() << "second set_engine_path must throw";
    }
    catch (const RuntimeError& e)
    {
        EXPECT_EQ(e.code(), ErrorCode::ConfigAlreadySet);
    }
    EXPECT_EQ(config.engine_path(), std::optional<std::string>("/opt/engine/versoview"));
}

TEST(RuntimeConfig, ResourceDirectoryAndPortAreSetOnce)
{
    RuntimeConfig config;
    config.set_resource_directory("/res");
    config.set_devtools_port(9222);
    EXPECT_THROW(config.set_resource_directory("/other"), RuntimeError);
    EXPECT_THROW(config.set_devtools_port(1), RuntimeError);
    EXPECT_EQ(config.resource_directory(), std::optional<std::string>("/res"));
    EXPECT_EQ(config.devtools_port(), std::optional<uint16_t>(9222));
}

TEST(RuntimeConfig, FromEnvironment)
{
    ::setenv("VESPER_ENGINE_PATH", "/env/engine", 1);
    ::setenv("VESPER_RESOURCE_DIR", "/env/res", 1);
    ::setenv("VESPER_DEVTOOLS_PORT", "4000", 1);

    auto config = RuntimeConfig::from_environment();
    EXPECT_EQ(config.engine_path(), std::optional<std::string>("/env/engine"));
    EXPECT_EQ(config.resource_directory(), std::optional<std::string>("/env/res"));
    EXPECT_EQ(config.devtools_port(), std::optional<uint16_t>(4000));

    ::unsetenv("VESPER_ENGINE_PATH");
    ::unsetenv("VESPER_RESOURCE_DIR");
    ::unsetenv("VESPER_DEVTOOLS_PORT");
}

TEST(RuntimeConfig, FromEnvironmentIgnoresMalformedPort)
{
    ::setenv("VESPER_DEVTOOLS_PORT", "not-a-port", 1);
    auto config = RuntimeConfig::from_environment();
    EXPECT_FALSE(config.devtools_port().has_value());

    ::setenv("VESPER_DEVTOOLS_PORT", "70000", 1);
    config = RuntimeConfig::from_environment();
    EXPECT_FALSE(config.devtools_port().has_value());
    ::unsetenv("VESPER_DEVTOOLS_PORT");
}

TEST(RuntimeConfig, ResolveProtocolStrategy)
{
    EXPECT_EQ(resolve_protocol_strategy(ProtocolStrategy::DirectScheme),
              ProtocolStrategy::DirectScheme);
    EXPECT_EQ(resolve_protocol_strategy(ProtocolStrategy::HttpWorkaround),
              ProtocolStrategy::HttpWorkaround);
#ifdef _WIN32
    EXPECT_EQ(resolve_protocol_strategy(ProtocolStrategy::PlatformDefault),
              ProtocolStrategy::HttpWorkaround);
#else
    EXPECT_EQ(resolve_protocol_strategy(ProtocolStrategy::PlatformDefault),
              ProtocolStrategy::DirectScheme);
#endif
}

// ─── RuntimeError ────────────────────────────────────────────────────────────

TEST(RuntimeError, CarriesCodeAndDetail)
{
    RuntimeError plain(ErrorCode::CreateWebview);
    EXPECT_EQ(plain.code(), ErrorCode::CreateWebview);
    EXPECT_EQ(std::string(plain.what()), "failed to create webview");

    RuntimeError detailed(ErrorCode::WrongThread, "Runtime::run");
    EXPECT_EQ(detailed.code(), ErrorCode::WrongThread);
    EXPECT_NE(std::string(detailed.what()).find("Runtime::run"), std::string::npos);
}

TEST(RuntimeError, EveryCodeHasAMessage)
{
    for (auto code : {ErrorCode::CreateWindow,
                      ErrorCode::CreateWebview,
                      ErrorCode::FailedToSendMessage,
                      ErrorCode::FailedToReceiveMessage,
                      ErrorCode::FailedToGetCursorPosition,
                      ErrorCode::WrongThread,
                      ErrorCode::ConfigAlreadySet,
                      ErrorCode::ConfigMissing,
                      ErrorCode::EngineLaunch})
    {
        EXPECT_NE(to_string(code), "unknown error");
    }
}

// ─── Logger ──────────────────────────────────────────────────────────────────

TEST(Logger, ParseLevel)
{
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("Critical"), LogLevel::Critical);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
}

TEST(Logger, SinkReceivesFormattedMessage)
{
    auto& logger   = Logger::instance();
    auto  previous = logger.get_level();

    std::vector<Logger::LogEntry> seen;
    logger.clear_sinks();
    logger.add_sink([&](const Logger::LogEntry& entry) { seen.push_back(entry); });
    logger.set_level(LogLevel::Debug);

    VESPER_LOG_INFO("window", "Created window {} ('{}')", 7u, std::string("main"));
    VESPER_LOG_TRACE("window", "filtered out");

    logger.clear_sinks();
    logger.set_level(previous);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].level, LogLevel::Info);
    EXPECT_EQ(seen[0].category, "window");
    EXPECT_EQ(seen[0].message, "Created window 7 ('main')");
}
