#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vesper
{

// Ordered header list with case-insensitive name lookup.  Duplicate names
// are kept (append) unless set() is used.
class HeaderMap
{
   public:
    using Entry = std::pair<std::string, std::string>;

    void append(std::string name, std::string value);

    // Replace every header named `name` with a single entry.
    void set(std::string name, std::string value);

    bool contains(std::string_view name) const;

    // First value for `name`, if any.
    std::optional<std::string> get(std::string_view name) const;

    // Remove every header named `name`; returns the first removed value.
    std::optional<std::string> remove(std::string_view name);

    size_t size() const { return entries_.size(); }
    bool   empty() const { return entries_.empty(); }

    const std::vector<Entry>& entries() const { return entries_; }

   private:
    std::vector<Entry> entries_;
};

bool header_name_equals(std::string_view a, std::string_view b);

struct HttpRequest
{
    std::string          method = "GET";
    std::string          uri;
    HeaderMap            headers;
    std::vector<uint8_t> body;
};

struct HttpResponse
{
    uint16_t             status = 200;
    HeaderMap            headers;
    std::vector<uint8_t> body;
};

// Completion callback handed to custom-protocol handlers.
using UriSchemeResponder = std::function<void(HttpResponse)>;

// Handler registered for one custom scheme.  Always invoked on the owning
// thread with the label of the webview that issued the request.
using UriSchemeProtocolHandler =
    std::function<void(const std::string& webview_label, HttpRequest request, UriSchemeResponder responder)>;

}   // namespace vesper
