#pragma once

#include <vesper/config.hpp>
#include <vesper/dpi.hpp>
#include <vesper/engine.hpp>
#include <vesper/error.hpp>
#include <vesper/event_loop_context.hpp>
#include <vesper/events.hpp>
#include <vesper/fwd.hpp>
#include <vesper/http.hpp>
#include <vesper/logger.hpp>
#include <vesper/monitor.hpp>
#include <vesper/protocol.hpp>
#include <vesper/runtime.hpp>
#include <vesper/webview.hpp>
#include <vesper/window.hpp>
#include <vesper/window_builder.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   vesper::RuntimeConfig config = vesper::RuntimeConfig::from_environment();
//   vesper::Runtime       runtime(std::move(config));
//
//   vesper::PendingWindow window;
//   window.label   = "main";
//   window.webview = vesper::PendingWebview{.url = "https://example.com"};
//   runtime.create_window(std::move(window));
//
//   return runtime.run([](const vesper::RunEvent&) {});
