#pragma once

#include "runtime/command_channel.hpp"
#include "uri_strategy.hpp"

#include <vesper/engine.hpp>
#include <vesper/http.hpp>

#include <map>
#include <memory>
#include <string>

namespace vesper
{

// Routes the engine's resource requests to the host's custom-protocol
// handlers.
//
// handle() runs on whatever thread the engine delivers requests on.  The
// request is normalized there (Origin, invoke body, URI rewrite); the
// matching handler then runs on the owning thread through a Task envelope.
// Requests no handler claims are answered "not handled" right away.
class ResourceBridge
{
   public:
    ResourceBridge(std::string                                     webview_label,
                   std::shared_ptr<const UriStrategy>              strategy,
                   CommandSender                                   sender,
                   std::map<std::string, UriSchemeProtocolHandler> protocols);

    void handle(HttpRequest request, ResourceResponder respond) const;

    // Handler to register with EngineController::on_resource_requested.
    // Shares this bridge's state.
    static ResourceRequestHandler make_handler(std::shared_ptr<const ResourceBridge> bridge);

    // Origin injection and invoke-body extraction, applied to every request.
    void normalize(HttpRequest& request) const;

   private:
    std::string                                     label_;
    std::shared_ptr<const UriStrategy>              strategy_;
    CommandSender                                   sender_;
    std::map<std::string, UriSchemeProtocolHandler> protocols_;
};

}   // namespace vesper
