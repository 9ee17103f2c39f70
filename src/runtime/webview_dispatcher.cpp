#include <vesper/engine.hpp>
#include <vesper/error.hpp>
#include <vesper/webview.hpp>

#include "dispatch_context.hpp"

namespace vesper
{

WebviewDispatcher::WebviewDispatcher(WebviewId                         id,
                                     std::shared_ptr<DispatchContext>  context,
                                     std::shared_ptr<EngineController> engine)
    : id_(id), context_(std::move(context)), engine_(std::move(engine))
{
}

void WebviewDispatcher::run_on_main_thread(std::function<void()> task) const
{
    context_->run_on_owning_thread(std::move(task));
}

WebviewEventId WebviewDispatcher::on_webview_event(WebviewEventHandler) const
{
    return context_->next_webview_event_id();
}

void WebviewDispatcher::eval_script(const std::string& script) const
{
    if (!engine_->execute_script(script))
        throw RuntimeError(ErrorCode::FailedToSendMessage, "eval_script");
}

std::string WebviewDispatcher::url() const
{
    auto url = engine_->current_url();
    if (!url)
        throw RuntimeError(ErrorCode::FailedToSendMessage, "url");
    return *url;
}

void WebviewDispatcher::navigate(const std::string& url) const
{
    if (!engine_->navigate(url))
        throw RuntimeError(ErrorCode::FailedToSendMessage, "navigate");
}

void WebviewDispatcher::reload() const
{
    if (!engine_->reload())
        throw RuntimeError(ErrorCode::FailedToSendMessage, "reload");
}

PhysicalSize<uint32_t> WebviewDispatcher::size() const
{
    auto size = engine_->inner_size();
    if (!size)
        throw RuntimeError(ErrorCode::FailedToSendMessage, "size");
    return *size;
}

Rect WebviewDispatcher::bounds() const
{
    return Rect{position(), size()};
}

}   // namespace vesper
