#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace netwatch::common
{
    using Timestamp = std::chrono::system_clock::time_point;

    // Wall clock truncated to microseconds so that a formatted timestamp parses back to the same value.
    Timestamp Now();

    // UTC, "2024-05-01T10:15:30.250000+00:00".
    std::string FormatTimestamp(Timestamp ts);

    // Accepts an optional fraction and a "Z", "+HH:MM" or "-HH:MM" suffix; no suffix means UTC.
    std::optional<Timestamp> ParseTimestamp(const std::string& text);
}
