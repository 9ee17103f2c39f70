#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace vesper::engine
{

// Tracks a spawned engine process.
struct ProcessEntry
{
    pid_t       pid = 0;
    std::string executable;
    bool        alive = true;
};

// Spawns, reaps and terminates engine processes.
// Thread-safe: all public methods lock the internal mutex.
class ProcessManager
{
   public:
    ProcessManager() = default;

    ProcessManager(const ProcessManager&)            = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    // Spawn `executable` with `args` (argv[1..]).  Returns the PID on
    // success, -1 on failure.
    pid_t spawn(const std::string& executable, const std::vector<std::string>& args);

    // Check if a PID is still running (via waitpid WNOHANG).  A process
    // found to have exited is reaped and forgotten.
    bool is_alive(pid_t pid);

    // SIGTERM, then SIGKILL if the process is still running after `grace`.
    // Reaps it.  Returns false if `pid` is not a tracked process.
    bool terminate(pid_t pid, std::chrono::milliseconds grace);

    // Reap any finished child processes. Returns PIDs of reaped processes.
    std::vector<pid_t> reap_finished();

    size_t                    process_count() const;
    std::vector<ProcessEntry> all_processes() const;

   private:
    mutable std::mutex                      mu_;
    std::unordered_map<pid_t, ProcessEntry> processes_;
};

}   // namespace vesper::engine
