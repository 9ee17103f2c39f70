#pragma once

#include <vesper/config.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vesper
{

// Decides whether a request URI addresses a registered custom protocol, and
// what the URI looks like to that protocol's handler.
class UriStrategy
{
   public:
    virtual ~UriStrategy() = default;

    // URI for the handler of `protocol`, or nullopt if `uri` is not for it.
    virtual std::optional<std::string> match(std::string_view uri,
                                             std::string_view protocol) const = 0;

    // Origin injected into requests that arrive without one.
    virtual std::string origin() const = 0;
};

// Custom schemes reach the runtime untouched: `{protocol}://rest`.
class DirectSchemeStrategy final : public UriStrategy
{
   public:
    std::optional<std::string> match(std::string_view uri,
                                     std::string_view protocol) const override;
    std::string                origin() const override { return "tauri://localhost"; }
};

// The transport only routes http(s), so `{protocol}://rest` arrives as
// `{http|https}://{protocol}.rest` and is rewritten back.
class HttpWorkaroundStrategy final : public UriStrategy
{
   public:
    explicit HttpWorkaroundStrategy(bool use_https)
        : scheme_(use_https ? "https" : "http")
    {
    }

    std::optional<std::string> match(std::string_view uri,
                                     std::string_view protocol) const override;
    std::string                origin() const override { return scheme_ + "://tauri.localhost"; }

   private:
    std::string scheme_;
};

// `{scheme}://{protocol}.`
std::string work_around_uri_prefix(std::string_view scheme, std::string_view protocol);

// Scheme part of `uri` (before the first ':'), if it is a well-formed one.
std::optional<std::string_view> uri_scheme(std::string_view uri);

// Absolute URL: a well-formed scheme followed by ':' and something more.
bool is_valid_url(std::string_view url);

std::unique_ptr<UriStrategy> make_uri_strategy(ProtocolStrategy kind, bool use_https);

}   // namespace vesper
