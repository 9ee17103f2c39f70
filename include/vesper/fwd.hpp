#pragma once

#include <cstdint>

namespace vesper
{

// Window, webview and subscription identifiers.  Each kind has its own
// fetch-and-increment counter owned by the dispatch context, starting at 1.
// Identifiers are never reused within a process, up to the 32-bit ceiling:
// after 2^32 - 1 allocations a counter wraps, and nothing guards against it.
using WindowId       = uint32_t;
using WebviewId      = uint32_t;
using WindowEventId  = uint32_t;
using WebviewEventId = uint32_t;

// Sentinel value for "no window" / "no webview".
inline constexpr WindowId  INVALID_WINDOW_ID  = 0;
inline constexpr WebviewId INVALID_WEBVIEW_ID = 0;

class Runtime;
class RuntimeHandle;
class EventLoopProxy;
class EventLoopContext;

class WindowDispatcher;
class WebviewDispatcher;
class WindowBuilder;
struct WindowConfig;
struct PendingWindow;
struct PendingWebview;
struct DetachedWindow;

class EngineController;
class EngineLauncher;
struct EngineSettings;

class MonitorProvider;
struct Monitor;

class RuntimeConfig;
struct RuntimeOptions;

class RuntimeError;

class DispatchContext;

}   // namespace vesper
