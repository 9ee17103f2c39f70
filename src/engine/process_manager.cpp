#include "process_manager.hpp"

#include <vesper/logger.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace vesper::engine
{

static void log_exit_status(pid_t pid, int status)
{
    if (WIFEXITED(status))
        VESPER_LOG_INFO("engine", "Engine pid={} exited with code {}", pid, WEXITSTATUS(status));
    else if (WIFSIGNALED(status))
        VESPER_LOG_INFO("engine", "Engine pid={} terminated by signal {}", pid, WTERMSIG(status));
}

pid_t ProcessManager::spawn(const std::string& executable, const std::vector<std::string>& args)
{
    std::lock_guard lock(mu_);

    if (executable.empty())
        return -1;

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    pid_t pid = 0;
    int   ret = posix_spawn(&pid, executable.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (ret != 0)
    {
        VESPER_LOG_ERROR("engine", "posix_spawn of '{}' failed: {}", executable, std::strerror(ret));
        return -1;
    }

    ProcessEntry entry;
    entry.pid        = pid;
    entry.executable = executable;
    entry.alive      = true;
    processes_[pid]  = std::move(entry);

    VESPER_LOG_INFO("engine", "Spawned engine '{}' pid={}", executable, pid);
    return pid;
}

bool ProcessManager::is_alive(pid_t pid)
{
    std::lock_guard lock(mu_);

    int   status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == 0)
        return true;   // still running

    if (result == pid)
        log_exit_status(pid, status);
    processes_.erase(pid);
    return false;
}

bool ProcessManager::terminate(pid_t pid, std::chrono::milliseconds grace)
{
    {
        std::lock_guard lock(mu_);
        if (processes_.find(pid) == processes_.end())
            return false;
    }

    if (::kill(pid, SIGTERM) != 0 && errno != ESRCH)
        VESPER_LOG_WARN("engine", "SIGTERM to pid={} failed: {}", pid, std::strerror(errno));

    const auto deadline = std::chrono::steady_clock::now() + grace;
    int        status   = 0;
    pid_t      result   = 0;
    while ((result = ::waitpid(pid, &status, WNOHANG)) == 0
           && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result == 0)
    {
        VESPER_LOG_WARN("engine", "Engine pid={} ignored SIGTERM, killing it", pid);
        ::kill(pid, SIGKILL);
        result = ::waitpid(pid, &status, 0);
    }

    if (result == pid)
        log_exit_status(pid, status);

    std::lock_guard lock(mu_);
    processes_.erase(pid);
    return true;
}

std::vector<pid_t> ProcessManager::reap_finished()
{
    std::lock_guard    lock(mu_);
    std::vector<pid_t> reaped;

    for (auto it = processes_.begin(); it != processes_.end();)
    {
        int   status = 0;
        pid_t result = ::waitpid(it->first, &status, WNOHANG);
        if (result > 0)
        {
            log_exit_status(it->first, status);
            reaped.push_back(it->first);
            it = processes_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return reaped;
}

size_t ProcessManager::process_count() const
{
    std::lock_guard lock(mu_);
    return processes_.size();
}

std::vector<ProcessEntry> ProcessManager::all_processes() const
{
    std::lock_guard           lock(mu_);
    std::vector<ProcessEntry> result;
    result.reserve(processes_.size());
    for (auto& [_, entry] : processes_)
        result.push_back(entry);
    return result;
}

}   // namespace vesper::engine
