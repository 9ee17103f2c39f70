#include <chrono>
#include <thread>
#include <vesper/logger.hpp>
#include <vesper/vesper.hpp>

using namespace vesper;

int main()
{
    // Initialize logger with console output
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Also log to file
    Logger::instance().add_sink(sinks::file_sink("vesper_example.log"));

    VESPER_LOG_INFO("example", "Logger example starting up");

    VESPER_LOG_TRACE("example", "This is a trace message");
    VESPER_LOG_DEBUG("example", "Debug information: value = {}", 42);
    VESPER_LOG_WARN("example", "This is a warning message");
    VESPER_LOG_ERROR("example", "This is an error message");

    VESPER_LOG_DEBUG_HERE("example", "Logging with source location");

    // Runtime errors carry a code and log as text
    try
    {
        RuntimeConfig config;
        config.set_engine_path("/usr/bin/versoview");
        config.set_engine_path("/usr/local/bin/versoview");
    }
    catch (const RuntimeError& e)
    {
        VESPER_LOG_WARN("example", "Config rejected: {} (code {})", e.what(), e.code());
    }

    // Owning-thread checks report through the same logger
    Runtime runtime;
    std::thread worker(
        [&runtime]
        {
            try
            {
                runtime.available_monitors();
            }
            catch (const RuntimeError& e)
            {
                VESPER_LOG_INFO("worker", "Expected failure off the owning thread: {}", e.what());
            }
        });
    worker.join();

    // Test thread safety
    auto log_worker = [](int id)
    {
        for (int i = 0; i < 5; ++i)
        {
            VESPER_LOG_DEBUG("worker", "Worker {} iteration {}", id, i);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(log_worker, 1);
    std::thread t2(log_worker, 2);

    t1.join();
    t2.join();

    VESPER_LOG_INFO("example", "Logger example completed");

    return 0;
}
