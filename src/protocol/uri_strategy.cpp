#include "uri_strategy.hpp"

#include <cctype>

namespace vesper
{

// Schemes are case-insensitive (RFC 3986 section 3.1).
static bool scheme_equals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::optional<std::string> DirectSchemeStrategy::match(std::string_view uri,
                                                       std::string_view protocol) const
{
    auto scheme = uri_scheme(uri);
    if (!scheme || !scheme_equals(*scheme, protocol))
        return std::nullopt;
    return std::string(uri);
}

std::optional<std::string> HttpWorkaroundStrategy::match(std::string_view uri,
                                                         std::string_view protocol) const
{
    const std::string prefix = work_around_uri_prefix(scheme_, protocol);
    if (uri.size() < prefix.size() || uri.substr(0, prefix.size()) != prefix)
        return std::nullopt;

    std::string rewritten(protocol);
    rewritten += "://";
    rewritten += uri.substr(prefix.size());
    return rewritten;
}

std::string work_around_uri_prefix(std::string_view scheme, std::string_view protocol)
{
    std::string prefix(scheme);
    prefix += "://";
    prefix += protocol;
    prefix += '.';
    return prefix;
}

std::optional<std::string_view> uri_scheme(std::string_view uri)
{
    auto colon = uri.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return std::nullopt;

    // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    if (!std::isalpha(static_cast<unsigned char>(uri[0])))
        return std::nullopt;
    for (size_t i = 1; i < colon; ++i)
    {
        auto c = static_cast<unsigned char>(uri[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return std::nullopt;
    }
    return uri.substr(0, colon);
}

bool is_valid_url(std::string_view url)
{
    auto scheme = uri_scheme(url);
    if (!scheme)
        return false;
    if (url.size() <= scheme->size() + 1)
        return false;
    for (char c : url)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

std::unique_ptr<UriStrategy> make_uri_strategy(ProtocolStrategy kind, bool use_https)
{
    if (resolve_protocol_strategy(kind) == ProtocolStrategy::HttpWorkaround)
        return std::make_unique<HttpWorkaroundStrategy>(use_https);
    return std::make_unique<DirectSchemeStrategy>();
}

}   // namespace vesper
