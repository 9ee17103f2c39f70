#pragma once

#include <string_view>

namespace vesper
{

// Request header the webview uses to carry an IPC invoke payload, percent
// encoded.  The engine cannot hand request bodies over, so the runtime moves
// this header's decoded value into the body before dispatch.
inline constexpr std::string_view INVOKE_BODY_HEADER = "Tauri-VersoRuntime-Invoke-Body";

// Initialization script the host installs in every webview so its IPC layer
// sends invoke payloads through INVOKE_BODY_HEADER.  Contains the
// placeholder __INVOKE_KEY__, which the host replaces with its invoke key.
std::string_view invoke_system_script();

}   // namespace vesper
