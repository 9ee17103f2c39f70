#include "window_registry.hpp"

#include <algorithm>

namespace vesper
{

void WindowRegistry::insert(WindowId id, WindowState state)
{
    std::lock_guard lock(mutex_);
    windows_[id] = std::move(state);
}

std::optional<WindowState> WindowRegistry::remove(WindowId id)
{
    std::lock_guard lock(mutex_);
    auto            it = windows_.find(id);
    if (it == windows_.end())
        return std::nullopt;
    WindowState state = std::move(it->second);
    windows_.erase(it);
    return state;
}

std::optional<WindowRegistry::CloseTarget> WindowRegistry::close_target(WindowId id) const
{
    std::lock_guard lock(mutex_);
    auto            it = windows_.find(id);
    if (it == windows_.end())
        return std::nullopt;
    return CloseTarget{it->second.label, it->second.listeners};
}

std::optional<std::string> WindowRegistry::label(WindowId id) const
{
    std::lock_guard lock(mutex_);
    auto            it = windows_.find(id);
    if (it == windows_.end())
        return std::nullopt;
    return it->second.label;
}

bool WindowRegistry::contains(WindowId id) const
{
    std::lock_guard lock(mutex_);
    return windows_.count(id) > 0;
}

size_t WindowRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return windows_.size();
}

bool WindowRegistry::empty() const
{
    std::lock_guard lock(mutex_);
    return windows_.empty();
}

std::vector<WindowId> WindowRegistry::ids() const
{
    std::lock_guard       lock(mutex_);
    std::vector<WindowId> out;
    out.reserve(windows_.size());
    for (const auto& [id, state] : windows_)
        out.push_back(id);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::pair<WindowId, WindowState>> WindowRegistry::take_all()
{
    std::unordered_map<WindowId, WindowState> taken;
    {
        std::lock_guard lock(mutex_);
        taken.swap(windows_);
    }
    std::vector<std::pair<WindowId, WindowState>> out;
    out.reserve(taken.size());
    for (auto& [id, state] : taken)
        out.emplace_back(id, std::move(state));
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

}   // namespace vesper
