#include "resource_bridge.hpp"

#include "percent.hpp"

#include <vesper/logger.hpp>
#include <vesper/protocol.hpp>

namespace vesper
{

ResourceBridge::ResourceBridge(std::string                                     webview_label,
                               std::shared_ptr<const UriStrategy>              strategy,
                               CommandSender                                   sender,
                               std::map<std::string, UriSchemeProtocolHandler> protocols)
    : label_(std::move(webview_label)),
      strategy_(std::move(strategy)),
      sender_(std::move(sender)),
      protocols_(std::move(protocols))
{
}

ResourceRequestHandler ResourceBridge::make_handler(std::shared_ptr<const ResourceBridge> bridge)
{
    return [bridge = std::move(bridge)](HttpRequest request, ResourceResponder respond)
    { bridge->handle(std::move(request), std::move(respond)); };
}

void ResourceBridge::normalize(HttpRequest& request) const
{
    // The engine does not send an Origin for custom-protocol requests.
    if (!request.headers.contains("Origin"))
        request.headers.set("Origin", strategy_->origin());

    auto encoded = request.headers.remove(INVOKE_BODY_HEADER);
    if (!encoded)
        return;

    if (auto decoded = percent_decode_utf8(*encoded))
    {
        request.body.assign(decoded->begin(), decoded->end());
    }
    else
    {
        VESPER_LOG_ERROR("protocol",
                         "Invoke body header on '{}' is not percent-encoded UTF-8, sending an empty body",
                         request.uri);
        request.body.clear();
    }
}

void ResourceBridge::handle(HttpRequest request, ResourceResponder respond) const
{
    normalize(request);

    for (const auto& [protocol, handler] : protocols_)
    {
        auto rewritten = strategy_->match(request.uri, protocol);
        if (!rewritten)
            continue;

        request.uri = std::move(*rewritten);
        VESPER_LOG_TRACE("protocol", "{} {} -> '{}' handler", request.method, request.uri, protocol);

        // std::function needs a copyable closure.
        auto pending = std::make_shared<HttpRequest>(std::move(request));
        bool sent    = sender_.send(Message::task(
            [handler = handler, label = label_, pending, respond]()
            {
                handler(label,
                        std::move(*pending),
                        [respond](HttpResponse response) { respond(std::move(response)); });
            }));

        if (!sent)
        {
            VESPER_LOG_ERROR("protocol",
                             "Failed to hand '{}' request for {} to the owning thread: event loop closed",
                             protocol,
                             pending->uri);
            respond(std::nullopt);
        }
        return;
    }

    respond(std::nullopt);
}

}   // namespace vesper
