#include "percent.hpp"

#include <cstdint>

namespace vesper
{

static int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

static bool is_unreserved(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-'
           || c == '.' || c == '_' || c == '~';
}

std::optional<std::string> percent_decode_utf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c != '%')
        {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= text.size())
            return std::nullopt;
        int hi = hex_value(text[i + 1]);
        int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }

    if (!is_valid_utf8(out))
        return std::nullopt;
    return out;
}

std::string percent_encode(std::string_view text)
{
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c))
        {
            out.push_back(ch);
        }
        else
        {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

bool is_valid_utf8(std::string_view bytes)
{
    size_t i = 0;
    while (i < bytes.size())
    {
        auto c = static_cast<unsigned char>(bytes[i]);

        size_t   extra = 0;
        uint32_t cp    = 0;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp    = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp    = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp    = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + extra >= bytes.size())
            return false;

        for (size_t k = 1; k <= extra; ++k)
        {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000))
            return false;
        if (cp >= 0xD800 && cp <= 0xDFFF)
            return false;
        if (cp > 0x10FFFF)
            return false;

        i += extra + 1;
    }
    return true;
}

}   // namespace vesper
