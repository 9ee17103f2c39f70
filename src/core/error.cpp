#include <vesper/error.hpp>

namespace vesper
{

std::string_view to_string(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::CreateWindow:
            return "failed to create window";
        case ErrorCode::CreateWebview:
            return "failed to create webview";
        case ErrorCode::FailedToSendMessage:
            return "failed to send message";
        case ErrorCode::FailedToReceiveMessage:
            return "failed to receive message";
        case ErrorCode::FailedToGetCursorPosition:
            return "failed to get cursor position";
        case ErrorCode::WrongThread:
            return "called from a thread that does not own the event loop";
        case ErrorCode::ConfigAlreadySet:
            return "configuration value already set";
        case ErrorCode::ConfigMissing:
            return "required configuration value not set";
        case ErrorCode::EngineLaunch:
            return "failed to launch rendering engine";
    }
    return "unknown error";
}

RuntimeError::RuntimeError(ErrorCode code) : std::runtime_error(std::string(to_string(code))), code_(code)
{
}

RuntimeError::RuntimeError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code)
{
}

}   // namespace vesper
