#include <vesper/http.hpp>

#include <algorithm>
#include <cctype>

namespace vesper
{

bool header_name_equals(std::string_view a, std::string_view b)
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

void HeaderMap::append(std::string name, std::string value)
{
    entries_.emplace_back(std::move(name), std::move(value));
}

void HeaderMap::set(std::string name, std::string value)
{
    remove(name);
    entries_.emplace_back(std::move(name), std::move(value));
}

bool HeaderMap::contains(std::string_view name) const
{
    return std::any_of(entries_.begin(),
                       entries_.end(),
                       [name](const Entry& e) { return header_name_equals(e.first, name); });
}

std::optional<std::string> HeaderMap::get(std::string_view name) const
{
    for (const auto& [key, value] : entries_)
    {
        if (header_name_equals(key, name))
            return value;
    }
    return std::nullopt;
}

std::optional<std::string> HeaderMap::remove(std::string_view name)
{
    std::optional<std::string> first;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (header_name_equals(it->first, name))
        {
            if (!first)
                first = std::move(it->second);
            it = entries_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return first;
}

}   // namespace vesper
