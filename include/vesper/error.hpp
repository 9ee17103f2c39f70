#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace vesper
{

enum class ErrorCode : int
{
    CreateWindow,               // unsupported or malformed window creation request
    CreateWebview,              // standalone webview creation is not supported
    FailedToSendMessage,        // owning-thread channel closed, or the engine refused a call
    FailedToReceiveMessage,     // owning thread went away before replying
    FailedToGetCursorPosition,
    WrongThread,                // owning-thread-only API called from another thread
    ConfigAlreadySet,
    ConfigMissing,
    EngineLaunch,
};

std::string_view to_string(ErrorCode code);

// Every failure the public API reports is a RuntimeError.  Nothing is
// retried: a channel failure means the runtime is shutting down.
class RuntimeError : public std::runtime_error
{
   public:
    explicit RuntimeError(ErrorCode code);
    RuntimeError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

   private:
    ErrorCode code_;
};

}   // namespace vesper
