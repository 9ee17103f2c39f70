#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <variant>

namespace vesper
{

// ─── Pixel geometry ─────────────────────────────────────────────────────────
// Physical values are device pixels; logical values are scaled by the
// monitor's scale factor.

template <typename T>
struct PhysicalPosition
{
    T x{};
    T y{};

    bool operator==(const PhysicalPosition&) const = default;
};

template <typename T>
struct PhysicalSize
{
    T width{};
    T height{};

    bool operator==(const PhysicalSize&) const = default;
};

struct LogicalPosition
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const LogicalPosition&) const = default;

    PhysicalPosition<int32_t> to_physical(double scale_factor) const
    {
        return {static_cast<int32_t>(std::lround(x * scale_factor)),
                static_cast<int32_t>(std::lround(y * scale_factor))};
    }
};

struct LogicalSize
{
    double width  = 0.0;
    double height = 0.0;

    bool operator==(const LogicalSize&) const = default;

    PhysicalSize<uint32_t> to_physical(double scale_factor) const
    {
        return {static_cast<uint32_t>(std::lround(width * scale_factor)),
                static_cast<uint32_t>(std::lround(height * scale_factor))};
    }
};

// A position or size in either unit.  The engine receives them untouched
// and converts with the scale factor of the monitor it is on.
using Position = std::variant<LogicalPosition, PhysicalPosition<int32_t>>;
using Size     = std::variant<LogicalSize, PhysicalSize<uint32_t>>;

struct Rect
{
    Position position = PhysicalPosition<int32_t>{};
    Size     size     = PhysicalSize<uint32_t>{};
};

struct PhysicalRect
{
    PhysicalPosition<int32_t> position;
    PhysicalSize<uint32_t>    size;

    bool operator==(const PhysicalRect&) const = default;

    bool contains(double px, double py) const
    {
        return px >= position.x && py >= position.y
               && px < static_cast<double>(position.x) + size.width
               && py < static_cast<double>(position.y) + size.height;
    }
};

enum class Theme
{
    Light,
    Dark,
};

struct Monitor
{
    std::string               name;
    PhysicalPosition<int32_t> position;
    PhysicalSize<uint32_t>    size;
    PhysicalRect              work_area;
    double                    scale_factor = 1.0;
};

}   // namespace vesper
