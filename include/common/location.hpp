/*
 * File: include/common/location.hpp
 * Project: Battle Relay
 * Purpose: Map cell coordinates and the event raised when a cell becomes marked
 * Notes:
 *  - Parts are sanitized before construction (include/common/sanitize.hpp)
 *  - key() is the dedup cache key and the text sent to subscribers
 * Last updated: 2026-10-18
 */

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "common/sanitize.hpp"

class Location
{
    std::string bottom_right_;
    std::string top_right_;

    Location(std::string br, std::string tr) : bottom_right_(std::move(br)), top_right_(std::move(tr)) {}

public:
    // Both parts must be non-empty.
    static std::optional<Location> make(std::string bottom_right, std::string top_right)
    {
        if (bottom_right.empty() || top_right.empty())
            return std::nullopt;
        return Location{std::move(bottom_right), std::move(top_right)};
    }

    // Sanitizes raw scraped text first.
    static std::optional<Location> from_raw(std::string_view bottom_right, std::string_view top_right)
    {
        return make(sanitize(bottom_right), sanitize(top_right));
    }

    const std::string &bottom_right() const { return bottom_right_; }
    const std::string &top_right() const { return top_right_; }
    std::string key() const { return bottom_right_ + top_right_; }

    bool operator==(const Location &o) const
    {
        return bottom_right_ == o.bottom_right_ && top_right_ == o.top_right_;
    }
    bool operator!=(const Location &o) const { return !(*this == o); }
};

namespace std
{
template <>
struct hash<Location>
{
    size_t operator()(const Location &l) const noexcept
    {
        size_t h = hash<string>{}(l.bottom_right());
        return h ^ (hash<string>{}(l.top_right()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
} // namespace std

struct MarkerEvent
{
    Location location;
};

// Text frame sent to every subscriber for one event.
inline std::string format_notification(const MarkerEvent &ev)
{
    return "New " + std::string(kMarkerGlyph) + " detected at location: " + ev.location.key();
}
