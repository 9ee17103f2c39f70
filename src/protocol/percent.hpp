#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vesper
{

// Decodes %XX escapes.  Fails when a '%' is not followed by two hex digits
// or when the decoded bytes are not valid UTF-8.  Every other byte is copied
// through, '+' included.
std::optional<std::string> percent_decode_utf8(std::string_view text);

// Escapes every byte outside the URI unreserved set.
std::string percent_encode(std::string_view text);

bool is_valid_utf8(std::string_view bytes);

}   // namespace vesper
